#include "PdfScene.h"
#include "PdfDebug.h"

namespace pdfraster
{
    PdfSceneBuilder::PdfSceneBuilder(const PdfRect& pageBox, int rotate)
        : _scene(std::make_shared<PdfScene>())
    {
        _scene->pageBox = pageBox;
        _scene->rotate = rotate;
    }

    void PdfSceneBuilder::syncClips(const std::vector<PdfClipPtr>& clips)
    {
        size_t common = 0;
        while (common < _open.size() && common < clips.size() && _open[common] == clips[common])
            ++common;

        while (_open.size() > common)
            popClip();

        for (size_t i = common; i < clips.size(); ++i)
            pushClip(clips[i]);
    }

    void PdfSceneBuilder::fillPath(const PdfPath& path, const PdfMatrix& ctm, bool evenOdd,
        const PdfPaintState& paint, const std::vector<PdfClipPtr>& clips)
    {
        if (path.empty())
            return;
        syncClips(clips);

        PdfScenePrimitive p;
        p.type = PdfPrimitiveType::FillPath;
        p.path = path;
        p.ctm = ctm;
        p.evenOdd = evenOdd;
        p.paint = paint;
        _scene->primitives.push_back(std::move(p));
    }

    void PdfSceneBuilder::strokePath(const PdfPath& path, const PdfMatrix& ctm, const PdfStrokeStyle& style,
        const PdfPaintState& paint, const std::vector<PdfClipPtr>& clips)
    {
        if (path.empty())
            return;
        syncClips(clips);

        PdfScenePrimitive p;
        p.type = PdfPrimitiveType::StrokePath;
        p.path = path;
        p.ctm = ctm;
        p.stroke = style;
        p.paint = paint;
        _scene->primitives.push_back(std::move(p));
    }

    void PdfSceneBuilder::glyphRun(std::vector<PdfGlyphInstance> glyphs, const PdfMatrix& ctm, bool stroke,
        const PdfStrokeStyle& style, const PdfPaintState& paint, const std::vector<PdfClipPtr>& clips)
    {
        if (glyphs.empty())
            return;
        syncClips(clips);

        PdfScenePrimitive p;
        p.type = PdfPrimitiveType::GlyphRun;
        p.glyphs = std::move(glyphs);
        p.ctm = ctm;
        p.strokeGlyphs = stroke;
        p.stroke = style;
        p.paint = paint;
        _scene->primitives.push_back(std::move(p));
    }

    void PdfSceneBuilder::image(const PdfImagePtr& image, const PdfMatrix& ctm, double alpha,
        const std::vector<PdfClipPtr>& clips)
    {
        if (!image)
            return;
        syncClips(clips);

        PdfScenePrimitive p;
        p.type = PdfPrimitiveType::Image;
        p.image = image;
        p.ctm = ctm;
        p.paint.alpha = alpha;
        _scene->primitives.push_back(std::move(p));
    }

    void PdfSceneBuilder::shading(const PdfPaintState& paint, const std::vector<PdfClipPtr>& clips)
    {
        if (!paint.shading)
            return;
        syncClips(clips);

        PdfScenePrimitive p;
        p.type = PdfPrimitiveType::Shading;
        p.paint = paint;
        _scene->primitives.push_back(std::move(p));
    }

    void PdfSceneBuilder::pushClip(const PdfClipPtr& clip)
    {
        PdfScenePrimitive p;
        p.type = PdfPrimitiveType::ClipPush;
        p.path = clip->path;
        p.ctm = clip->ctm;
        p.evenOdd = clip->evenOdd;
        _scene->primitives.push_back(std::move(p));
        _open.push_back(clip);
    }

    void PdfSceneBuilder::popClip()
    {
        if (_open.empty())
            return;
        PdfScenePrimitive p;
        p.type = PdfPrimitiveType::ClipPop;
        _scene->primitives.push_back(std::move(p));
        _open.pop_back();
    }

    void PdfSceneBuilder::diagnostic(PdfErrorCode code, const std::string& message)
    {
        LogDebug("[Scene] %s: %s", PdfErrorCodeName(code), message.c_str());
        _scene->diagnostics.push_back({ code, message });
    }

    PdfScenePtr PdfSceneBuilder::finish()
    {
        while (!_open.empty())
            popClip();

        LogDebug("[Scene] finished: %zu primitives, %zu diagnostics",
            _scene->primitives.size(), _scene->diagnostics.size());

        PdfScenePtr done = _scene;
        _scene = std::make_shared<PdfScene>();
        _scene->pageBox = done->pageBox;
        _scene->rotate = done->rotate;
        return done;
    }
}
