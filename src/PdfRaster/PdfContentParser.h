#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "PdfPath.h"
#include "PdfGraphicsState.h"
#include "PdfDocument.h"
#include "PdfResources.h"
#include "PdfOperator.h"
#include "PdfScene.h"

namespace pdfraster
{
    class FontCache;
    class GlyphCache;

    // Executes decoded content stream operations against a graphics
    // state stack and appends what they paint to a scene builder.
    // Recoverable problems become scene diagnostics; the only failures
    // that stop a page are a font subsystem fault and cancellation.
    class PdfContentParser
    {
    public:
        PdfContentParser(const PdfDocument& doc,
            const PdfResources& resources,
            FontCache& fonts,
            GlyphCache& glyphs,
            PdfSceneBuilder& scene,
            const std::atomic<bool>* cancel = nullptr);

        void run(const std::vector<uint8_t>& content);
        void run(const std::vector<PdfOperation>& ops);

        // RenderGlyphFault or Cancelled once the run stopped early
        const PdfError& fault() const { return _fault; }

        const PdfGraphicsState& state() const { return _gs; }
        size_t stackDepth() const { return _gsStack.size(); }

        // Page index -> scene. Fails with PageIndexOutOfRange,
        // RenderPageFault, RenderGlyphFault or Cancelled.
        static bool BuildPageScene(const PdfDocument& doc,
            int pageIndex,
            FontCache& fonts,
            GlyphCache& glyphs,
            PdfScenePtr& out,
            PdfError& err,
            const std::atomic<bool>* cancel = nullptr);

        static constexpr int MAX_FORM_DEPTH = 32;
        static constexpr size_t MAX_STATE_DEPTH = 1u << 16;

    private:
        const PdfDocument& _doc;
        PdfResources _resources;
        FontCache& _fonts;
        GlyphCache& _glyphs;
        PdfSceneBuilder& _scene;
        const std::atomic<bool>* _cancel;
        PdfError _fault;

        // graphics state
        PdfGraphicsState _gs;
        std::vector<PdfGraphicsState> _gsStack;
        size_t _stackFloor = 0;  // restores below this belong to an outer stream
        PdfMatrix _baseCtm;      // pattern space of the running stream

        // current path
        PdfPath _path;
        double _cpX = 0.0;
        double _cpY = 0.0;
        double _subpathStartX = 0.0;
        double _subpathStartY = 0.0;
        bool _hasCurrentPoint = false;

        // W / W* wait for the next painting operator
        bool _pendingClip = false;
        bool _pendingClipEvenOdd = false;

        // text object
        bool _inText = false;
        PdfMatrix _tm;
        PdfMatrix _tlm;
        PdfPath _textClip;       // page default space
        bool _textClipUsed = false;

        // BX/EX nesting; unknown operators inside are silent
        int _compatDepth = 0;

        // form recursion guard
        int _formDepth = 0;
        std::set<const PdfStream*> _activeForms;

        bool cancelled() const;
        void execute(const PdfOperation& op);
        void diagnostic(PdfErrorCode code, const std::string& message);
        void badOperands(const PdfOperation& op);

        bool numbers(const PdfOperation& op, size_t count, double* out);
        bool name(const PdfOperation& op, std::string& out);

        // graphics state
        void op_q();
        void op_Q();
        void op_cm(const double* m);
        void op_d(const PdfOperation& op);
        void op_gs(const std::string& name);
        void applyExtGState(const std::shared_ptr<PdfDictionary>& dict);

        // path construction and painting
        void op_m(double x, double y);
        void op_l(double x, double y);
        void op_c(double x1, double y1, double x2, double y2, double x3, double y3);
        void op_h();
        void op_re(double x, double y, double w, double h);
        void paintPath(bool fill, bool evenOdd, bool stroke, bool close);
        PdfPaintState paintFor(const PdfPaint& paint, double alpha) const;
        PdfStrokeStyle strokeStyle() const;

        // text
        void op_BT();
        void op_ET();
        void op_Tf(const std::string& name, double size);
        void op_Td(double tx, double ty);
        void op_Tstar();
        void op_TJ(const PdfOperation& op);
        void showText(const std::string& bytes);
        void setFont(const PdfObjectPtr& fontRef, double size, const std::string& label);

        // colour
        void setColorSpace(PdfPaint& paint, const std::string& name);
        void setColor(PdfPaint& paint, const PdfOperation& op, bool allowPattern);
        void setDeviceColor(PdfPaint& paint, PdfColorSpaceKind kind, const double* comps, size_t count);
        void setPattern(PdfPaint& paint, const std::string& name);
        PdfShadingPtr loadShading(const PdfObjectPtr& obj, const std::string& label);

        // painting operators
        void op_sh(const std::string& name);
        void op_Do(const std::string& name);
        void paintImage(const std::shared_ptr<PdfStream>& stream, const std::string& label);
        void runForm(const std::shared_ptr<PdfStream>& stream, const std::string& label);
    };
}
