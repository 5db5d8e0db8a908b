#include "PdfContentParser.h"
#include "FontCache.h"
#include "GlyphCache.h"
#include "PdfImage.h"
#include "PdfDebug.h"

#include <algorithm>
#include <cmath>

namespace pdfraster
{
    namespace
    {
        PdfMatrix translation(double tx, double ty)
        {
            return PdfMatrix(1, 0, 0, 1, tx, ty);
        }

        PdfMatrix matrixFrom(const std::vector<double>& v)
        {
            if (v.size() < 6)
                return PdfMatrix();
            return PdfMatrix(v[0], v[1], v[2], v[3], v[4], v[5]);
        }

        const PdfRGB kFallbackGrey{ 0.5, 0.5, 0.5 };
    }

    PdfContentParser::PdfContentParser(const PdfDocument& doc,
        const PdfResources& resources,
        FontCache& fonts,
        GlyphCache& glyphs,
        PdfSceneBuilder& scene,
        const std::atomic<bool>* cancel)
        : _doc(doc),
        _resources(resources),
        _fonts(fonts),
        _glyphs(glyphs),
        _scene(scene),
        _cancel(cancel)
    {
    }

    bool PdfContentParser::BuildPageScene(const PdfDocument& doc,
        int pageIndex,
        FontCache& fonts,
        GlyphCache& glyphs,
        PdfScenePtr& out,
        PdfError& err,
        const std::atomic<bool>* cancel)
    {
        PdfPage page;
        if (!doc.page(pageIndex, page, err))
            return false;

        std::vector<uint8_t> content;
        PdfError contentErr;
        if (!doc.pageContents(page, content, contentErr))
        {
            err.set(PdfErrorCode::RenderPageFault,
                "page " + std::to_string(pageIndex + 1) + " could not be rendered: " + contentErr.message);
            return false;
        }

        PdfResources resources(doc, page);
        PdfSceneBuilder builder(page.box(), page.rotate);
        PdfContentParser parser(doc, resources, fonts, glyphs, builder, cancel);
        parser.run(content);

        if (!parser.fault().ok())
        {
            err = parser.fault();
            return false;
        }

        out = builder.finish();
        return true;
    }

    bool PdfContentParser::cancelled() const
    {
        return _cancel && _cancel->load(std::memory_order_relaxed);
    }

    void PdfContentParser::run(const std::vector<uint8_t>& content)
    {
        std::vector<PdfOperation> ops;
        PdfOperationReader reader(content);
        reader.readAll(ops);
        run(ops);
    }

    void PdfContentParser::run(const std::vector<PdfOperation>& ops)
    {
        for (const auto& op : ops)
        {
            if (!_fault.ok())
                return;
            if (cancelled())
            {
                _fault.set(PdfErrorCode::Cancelled, "render cancelled");
                return;
            }
            execute(op);
        }
    }

    void PdfContentParser::diagnostic(PdfErrorCode code, const std::string& message)
    {
        _scene.diagnostic(code, message);
    }

    void PdfContentParser::badOperands(const PdfOperation& op)
    {
        diagnostic(PdfErrorCode::BadOperator,
            "'" + op.keyword + "' with " + std::to_string(op.operands.size()) + " unusable operands");
    }

    bool PdfContentParser::numbers(const PdfOperation& op, size_t count, double* out)
    {
        if (op.operands.size() != count)
        {
            badOperands(op);
            return false;
        }
        for (size_t i = 0; i < count; ++i)
        {
            if (!AsNumber(op.operands[i], out[i]))
            {
                badOperands(op);
                return false;
            }
        }
        return true;
    }

    bool PdfContentParser::name(const PdfOperation& op, std::string& out)
    {
        if (op.operands.size() != 1 || (out = NameOf(op.operands[0])).empty())
        {
            badOperands(op);
            return false;
        }
        return true;
    }

    // =========================================================
    // Dispatch
    // =========================================================

    void PdfContentParser::execute(const PdfOperation& op)
    {
        double v[6];
        std::string n;

        switch (op.op)
        {
        // ---- graphics state ----
        case PdfOp::Save:
            op_q();
            break;
        case PdfOp::Restore:
            op_Q();
            break;
        case PdfOp::Concat:
            if (numbers(op, 6, v))
                op_cm(v);
            break;
        case PdfOp::SetLineWidth:
            if (numbers(op, 1, v))
                _gs.lineWidth = std::fabs(v[0]);
            break;
        case PdfOp::SetLineCap:
            if (numbers(op, 1, v))
                _gs.lineCap = std::min(2, std::max(0, static_cast<int>(v[0])));
            break;
        case PdfOp::SetLineJoin:
            if (numbers(op, 1, v))
                _gs.lineJoin = std::min(2, std::max(0, static_cast<int>(v[0])));
            break;
        case PdfOp::SetMiterLimit:
            if (numbers(op, 1, v))
                _gs.miterLimit = std::max(1.0, v[0]);
            break;
        case PdfOp::SetDash:
            op_d(op);
            break;
        case PdfOp::SetRenderingIntent:
            name(op, n);
            break;
        case PdfOp::SetFlatness:
            numbers(op, 1, v);
            break;
        case PdfOp::SetExtGState:
            if (name(op, n))
                op_gs(n);
            break;

        // ---- path construction ----
        case PdfOp::MoveTo:
            if (numbers(op, 2, v))
                op_m(v[0], v[1]);
            break;
        case PdfOp::LineTo:
            if (numbers(op, 2, v))
                op_l(v[0], v[1]);
            break;
        case PdfOp::CurveTo:
            if (numbers(op, 6, v))
                op_c(v[0], v[1], v[2], v[3], v[4], v[5]);
            break;
        case PdfOp::CurveToV:
            if (numbers(op, 4, v))
                op_c(_cpX, _cpY, v[0], v[1], v[2], v[3]);
            break;
        case PdfOp::CurveToY:
            if (numbers(op, 4, v))
                op_c(v[0], v[1], v[2], v[3], v[2], v[3]);
            break;
        case PdfOp::ClosePath:
            op_h();
            break;
        case PdfOp::Rectangle:
            if (numbers(op, 4, v))
                op_re(v[0], v[1], v[2], v[3]);
            break;

        // ---- path painting ----
        case PdfOp::Stroke:
            paintPath(false, false, true, false);
            break;
        case PdfOp::CloseStroke:
            paintPath(false, false, true, true);
            break;
        case PdfOp::Fill:
        case PdfOp::FillObsolete:
            paintPath(true, false, false, false);
            break;
        case PdfOp::FillEvenOdd:
            paintPath(true, true, false, false);
            break;
        case PdfOp::FillStroke:
            paintPath(true, false, true, false);
            break;
        case PdfOp::FillStrokeEvenOdd:
            paintPath(true, true, true, false);
            break;
        case PdfOp::CloseFillStroke:
            paintPath(true, false, true, true);
            break;
        case PdfOp::CloseFillStrokeEvenOdd:
            paintPath(true, true, true, true);
            break;
        case PdfOp::EndPath:
            paintPath(false, false, false, false);
            break;

        // ---- clipping ----
        case PdfOp::Clip:
            _pendingClip = true;
            _pendingClipEvenOdd = false;
            break;
        case PdfOp::ClipEvenOdd:
            _pendingClip = true;
            _pendingClipEvenOdd = true;
            break;

        // ---- text ----
        case PdfOp::BeginText:
            op_BT();
            break;
        case PdfOp::EndText:
            op_ET();
            break;
        case PdfOp::SetCharSpacing:
            if (numbers(op, 1, v))
                _gs.charSpacing = v[0];
            break;
        case PdfOp::SetWordSpacing:
            if (numbers(op, 1, v))
                _gs.wordSpacing = v[0];
            break;
        case PdfOp::SetHorizScale:
            if (numbers(op, 1, v))
                _gs.horizontalScale = v[0];
            break;
        case PdfOp::SetLeading:
            if (numbers(op, 1, v))
                _gs.leading = v[0];
            break;
        case PdfOp::SetFont:
            if (op.operands.size() == 2 && !NameOf(op.operands[0]).empty() && AsNumber(op.operands[1], v[0]))
                op_Tf(NameOf(op.operands[0]), v[0]);
            else
                badOperands(op);
            break;
        case PdfOp::SetRenderMode:
            if (numbers(op, 1, v))
                _gs.renderMode = std::min(7, std::max(0, static_cast<int>(v[0])));
            break;
        case PdfOp::SetRise:
            if (numbers(op, 1, v))
                _gs.textRise = v[0];
            break;
        case PdfOp::MoveText:
            if (numbers(op, 2, v))
                op_Td(v[0], v[1]);
            break;
        case PdfOp::MoveTextSetLeading:
            if (numbers(op, 2, v))
            {
                _gs.leading = -v[1];
                op_Td(v[0], v[1]);
            }
            break;
        case PdfOp::SetTextMatrix:
            if (numbers(op, 6, v))
            {
                _tm = PdfMatrix(v[0], v[1], v[2], v[3], v[4], v[5]);
                _tlm = _tm;
            }
            break;
        case PdfOp::NextLine:
            op_Tstar();
            break;
        case PdfOp::ShowText:
        {
            auto s = op.operands.size() == 1 ? AsString(op.operands[0]) : nullptr;
            if (s)
                showText(s->value);
            else
                badOperands(op);
            break;
        }
        case PdfOp::ShowTextArray:
            op_TJ(op);
            break;
        case PdfOp::NextLineShow:
        {
            auto s = op.operands.size() == 1 ? AsString(op.operands[0]) : nullptr;
            if (!s)
            {
                badOperands(op);
                break;
            }
            op_Tstar();
            showText(s->value);
            break;
        }
        case PdfOp::NextLineSpacingShow:
        {
            auto s = op.operands.size() == 3 ? AsString(op.operands[2]) : nullptr;
            if (!s || !AsNumber(op.operands[0], v[0]) || !AsNumber(op.operands[1], v[1]))
            {
                badOperands(op);
                break;
            }
            _gs.wordSpacing = v[0];
            _gs.charSpacing = v[1];
            op_Tstar();
            showText(s->value);
            break;
        }

        // ---- Type3 metrics, only meaningful inside glyph procedures ----
        case PdfOp::SetCharWidth:
            numbers(op, 2, v);
            break;
        case PdfOp::SetCacheDevice:
            numbers(op, 6, v);
            break;

        // ---- colour ----
        case PdfOp::SetStrokeColorSpace:
            if (name(op, n))
                setColorSpace(_gs.stroke, n);
            break;
        case PdfOp::SetFillColorSpace:
            if (name(op, n))
                setColorSpace(_gs.fill, n);
            break;
        case PdfOp::SetStrokeColor:
            setColor(_gs.stroke, op, false);
            break;
        case PdfOp::SetStrokeColorN:
            setColor(_gs.stroke, op, true);
            break;
        case PdfOp::SetFillColor:
            setColor(_gs.fill, op, false);
            break;
        case PdfOp::SetFillColorN:
            setColor(_gs.fill, op, true);
            break;
        case PdfOp::SetStrokeGray:
            if (numbers(op, 1, v))
                setDeviceColor(_gs.stroke, PdfColorSpaceKind::DeviceGray, v, 1);
            break;
        case PdfOp::SetFillGray:
            if (numbers(op, 1, v))
                setDeviceColor(_gs.fill, PdfColorSpaceKind::DeviceGray, v, 1);
            break;
        case PdfOp::SetStrokeRGB:
            if (numbers(op, 3, v))
                setDeviceColor(_gs.stroke, PdfColorSpaceKind::DeviceRGB, v, 3);
            break;
        case PdfOp::SetFillRGB:
            if (numbers(op, 3, v))
                setDeviceColor(_gs.fill, PdfColorSpaceKind::DeviceRGB, v, 3);
            break;
        case PdfOp::SetStrokeCMYK:
            if (numbers(op, 4, v))
                setDeviceColor(_gs.stroke, PdfColorSpaceKind::DeviceCMYK, v, 4);
            break;
        case PdfOp::SetFillCMYK:
            if (numbers(op, 4, v))
                setDeviceColor(_gs.fill, PdfColorSpaceKind::DeviceCMYK, v, 4);
            break;

        // ---- painting ----
        case PdfOp::PaintShading:
            if (name(op, n))
                op_sh(n);
            break;
        case PdfOp::PaintXObject:
            if (name(op, n))
                op_Do(n);
            break;
        case PdfOp::InlineImage:
            if (op.inlineImage)
                paintImage(op.inlineImage, "inline image");
            break;

        // ---- marked content ----
        case PdfOp::MarkedContentPoint:
        case PdfOp::MarkedContentPointProps:
        case PdfOp::BeginMarkedContent:
        case PdfOp::BeginMarkedContentProps:
        case PdfOp::EndMarkedContent:
            break;

        // ---- compatibility ----
        case PdfOp::BeginCompat:
            ++_compatDepth;
            break;
        case PdfOp::EndCompat:
            if (_compatDepth > 0)
                --_compatDepth;
            break;

        case PdfOp::Unknown:
            if (_compatDepth == 0)
                diagnostic(PdfErrorCode::BadOperator, "unknown operator '" + op.keyword + "'");
            break;
        }
    }

    // =========================================================
    // Graphics State
    // =========================================================

    void PdfContentParser::op_q()
    {
        if (_gsStack.size() >= MAX_STATE_DEPTH)
        {
            diagnostic(PdfErrorCode::BadOperator, "graphics state nesting too deep, q ignored");
            return;
        }
        _gsStack.push_back(_gs);
    }

    void PdfContentParser::op_Q()
    {
        if (_gsStack.size() <= _stackFloor)
        {
            diagnostic(PdfErrorCode::UnbalancedRestore, "Q without matching q ignored");
            return;
        }
        _gs = std::move(_gsStack.back());
        _gsStack.pop_back();
    }

    void PdfContentParser::op_cm(const double* m)
    {
        _gs.ctm = PdfMul(PdfMatrix(m[0], m[1], m[2], m[3], m[4], m[5]), _gs.ctm);
    }

    void PdfContentParser::op_d(const PdfOperation& op)
    {
        double phase = 0;
        auto arr = op.operands.size() == 2 ? AsArray(op.operands[0]) : nullptr;
        if (!arr || !AsNumber(op.operands[1], phase))
        {
            badOperands(op);
            return;
        }

        PdfDash dash;
        dash.phase = phase;
        bool anyPositive = false;
        for (const auto& item : arr->items)
        {
            double len;
            if (!AsNumber(_doc.resolveIndirect(item), len) || len < 0)
            {
                badOperands(op);
                return;
            }
            anyPositive = anyPositive || len > 0;
            dash.array.push_back(len);
        }

        // an all-zero array is a solid line
        if (!anyPositive)
            dash.array.clear();
        _gs.dash = dash;
    }

    void PdfContentParser::op_gs(const std::string& gsName)
    {
        PdfObjectPtr obj;
        PdfError err;
        if (!_resources.resource(ResourceCategory::ExtGState, gsName, obj, err))
        {
            diagnostic(err.code, err.message);
            return;
        }
        auto dict = AsDict(_doc.resolveIndirect(obj));
        if (!dict)
        {
            diagnostic(PdfErrorCode::BadOperator, "ExtGState " + gsName + " is not a dictionary");
            return;
        }
        applyExtGState(dict);
    }

    void PdfContentParser::applyExtGState(const std::shared_ptr<PdfDictionary>& dict)
    {
        double v;
        if (_doc.getNumber(dict, "/LW", v))
            _gs.lineWidth = std::fabs(v);
        if (_doc.getNumber(dict, "/LC", v))
            _gs.lineCap = std::min(2, std::max(0, static_cast<int>(v)));
        if (_doc.getNumber(dict, "/LJ", v))
            _gs.lineJoin = std::min(2, std::max(0, static_cast<int>(v)));
        if (_doc.getNumber(dict, "/ML", v))
            _gs.miterLimit = std::max(1.0, v);
        if (_doc.getNumber(dict, "/CA", v))
            _gs.strokeAlpha = std::min(1.0, std::max(0.0, v));
        if (_doc.getNumber(dict, "/ca", v))
            _gs.fillAlpha = std::min(1.0, std::max(0.0, v));

        auto dash = _doc.getArray(dict, "/D");
        if (dash && dash->items.size() == 2)
        {
            PdfOperation op;
            op.keyword = "gs /D";
            op.operands = { _doc.resolveIndirect(dash->items[0]), _doc.resolveIndirect(dash->items[1]) };
            op_d(op);
        }

        auto bm = _doc.get(dict, "/BM");
        if (!IsNull(bm))
        {
            std::string mode = NameOf(bm);
            if (auto arr = AsArray(bm))
                mode = arr->items.empty() ? "" : NameOf(_doc.resolveIndirect(arr->items[0]));
            if (!mode.empty())
            {
                _gs.blendMode = mode;
                if (mode != "/Normal" && mode != "/Compatible")
                    diagnostic(PdfErrorCode::UnsupportedFeature,
                        "blend mode " + mode.substr(1) + " composited as Normal");
            }
        }

        auto smask = _doc.get(dict, "/SMask");
        if (!IsNull(smask) && NameOf(smask) != "/None")
            diagnostic(PdfErrorCode::UnsupportedFeature, "ExtGState soft mask ignored");

        auto font = _doc.getArray(dict, "/Font");
        if (font && font->items.size() == 2)
        {
            double size = NumberOr(_doc.resolveIndirect(font->items[1]), _gs.fontSize);
            setFont(font->items[0], size, "ExtGState font");
        }
    }

    // =========================================================
    // Path Construction & Painting
    // =========================================================

    void PdfContentParser::op_m(double x, double y)
    {
        _path.emplace_back(PdfPathSegment::MoveTo, x, y);
        _cpX = _subpathStartX = x;
        _cpY = _subpathStartY = y;
        _hasCurrentPoint = true;
    }

    void PdfContentParser::op_l(double x, double y)
    {
        if (!_hasCurrentPoint)
        {
            diagnostic(PdfErrorCode::BadOperator, "'l' without a current point");
            return;
        }
        _path.emplace_back(PdfPathSegment::LineTo, x, y);
        _cpX = x;
        _cpY = y;
    }

    void PdfContentParser::op_c(double x1, double y1, double x2, double y2, double x3, double y3)
    {
        if (!_hasCurrentPoint)
        {
            diagnostic(PdfErrorCode::BadOperator, "curve without a current point");
            return;
        }
        _path.emplace_back(x1, y1, x2, y2, x3, y3);
        _cpX = x3;
        _cpY = y3;
    }

    void PdfContentParser::op_h()
    {
        if (_path.empty() || _path.back().type == PdfPathSegment::Close)
            return;
        _path.emplace_back();
        _cpX = _subpathStartX;
        _cpY = _subpathStartY;
    }

    void PdfContentParser::op_re(double x, double y, double w, double h)
    {
        AppendRect(_path, x, y, w, h);
        _cpX = _subpathStartX = x;
        _cpY = _subpathStartY = y;
        _hasCurrentPoint = true;
    }

    PdfPaintState PdfContentParser::paintFor(const PdfPaint& paint, double alpha) const
    {
        PdfPaintState s;
        s.color = paint.rgb;
        s.alpha = alpha;
        s.shading = paint.shading;
        s.shadingMatrix = paint.shadingMatrix;
        return s;
    }

    PdfStrokeStyle PdfContentParser::strokeStyle() const
    {
        PdfStrokeStyle style;
        style.width = _gs.lineWidth;
        style.cap = _gs.lineCap;
        style.join = _gs.lineJoin;
        style.miterLimit = _gs.miterLimit;
        style.dash = _gs.dash;
        return style;
    }

    void PdfContentParser::paintPath(bool fill, bool evenOdd, bool stroke, bool close)
    {
        if (close)
            op_h();

        if (!_path.empty())
        {
            if (fill)
                _scene.fillPath(_path, _gs.ctm, evenOdd, paintFor(_gs.fill, _gs.fillAlpha), _gs.clips);
            if (stroke)
                _scene.strokePath(_path, _gs.ctm, strokeStyle(), paintFor(_gs.stroke, _gs.strokeAlpha), _gs.clips);

            // W/W* takes effect after the paint of the same operator
            if (_pendingClip)
            {
                auto clip = std::make_shared<PdfClip>();
                clip->path = _path;
                clip->ctm = _gs.ctm;
                clip->evenOdd = _pendingClipEvenOdd;
                _gs.clips.push_back(clip);
            }
        }

        _pendingClip = false;
        _path.clear();
        _hasCurrentPoint = false;
    }

    // =========================================================
    // Text
    // =========================================================

    void PdfContentParser::op_BT()
    {
        if (_inText)
            diagnostic(PdfErrorCode::BadOperator, "BT inside a text object");
        _inText = true;
        _tm = PdfMatrix();
        _tlm = PdfMatrix();
        _textClip.clear();
        _textClipUsed = false;
    }

    void PdfContentParser::op_ET()
    {
        if (!_inText)
            diagnostic(PdfErrorCode::BadOperator, "ET without BT");

        if (_textClipUsed)
        {
            // glyph outlines are already in page default space
            auto clip = std::make_shared<PdfClip>();
            clip->path = std::move(_textClip);
            clip->ctm = PdfMatrix();
            clip->evenOdd = false;
            _gs.clips.push_back(clip);
        }

        _textClip.clear();
        _textClipUsed = false;
        _inText = false;
    }

    void PdfContentParser::op_Tf(const std::string& fontName, double size)
    {
        PdfObjectPtr obj;
        PdfError err;
        _gs.fontSize = size;
        if (!_resources.resource(ResourceCategory::Font, fontName, obj, err))
        {
            diagnostic(err.code, err.message);
            _gs.font.reset();
            return;
        }
        setFont(obj, size, fontName);
    }

    void PdfContentParser::setFont(const PdfObjectPtr& fontRef, double size, const std::string& label)
    {
        _gs.fontSize = size;

        PdfFontPtr font;
        PdfError err;
        if (!_fonts.loadFont(_doc, AsDict(_doc.resolveIndirect(fontRef)), font, err))
        {
            _gs.font.reset();
            if (err.code == PdfErrorCode::RenderGlyphFault)
            {
                _fault = err;
                return;
            }
            diagnostic(err.code, "font " + label + ": " + err.message);
            return;
        }

        if (font->kind() == PdfFontKind::Type3)
            diagnostic(PdfErrorCode::UnsupportedFeature,
                "Type3 font " + label + ": glyph procedures are not executed");
        _gs.font = font;
    }

    void PdfContentParser::op_Td(double tx, double ty)
    {
        _tlm = PdfMul(translation(tx, ty), _tlm);
        _tm = _tlm;
    }

    void PdfContentParser::op_Tstar()
    {
        op_Td(0, -_gs.leading);
    }

    void PdfContentParser::op_TJ(const PdfOperation& op)
    {
        auto arr = op.operands.size() == 1 ? AsArray(op.operands[0]) : nullptr;
        if (!arr)
        {
            badOperands(op);
            return;
        }

        const double th = _gs.horizontalScale / 100.0;
        for (const auto& item : arr->items)
        {
            double adjust;
            if (auto s = AsString(item))
            {
                showText(s->value);
            }
            else if (AsNumber(item, adjust))
            {
                // thousandths of text space, positive moves left
                double tx = -adjust / 1000.0 * _gs.fontSize * th;
                _tm = PdfMul(translation(tx, 0), _tm);
            }
        }
    }

    void PdfContentParser::showText(const std::string& bytes)
    {
        if (!_gs.font)
        {
            diagnostic(PdfErrorCode::BadOperator, "text shown without a usable font");
            return;
        }

        const PdfFont& font = *_gs.font;
        std::vector<PdfCharCode> codes;
        font.decode(bytes, codes);

        const double th = _gs.horizontalScale / 100.0;
        const double tfs = _gs.fontSize;
        const int mode = _gs.renderMode;
        const bool visible = mode != 3 && mode != 7;
        const bool clip = mode >= 4;

        std::vector<PdfGlyphInstance> run;
        run.reserve(codes.size());
        bool reported = false;

        for (const auto& c : codes)
        {
            const double w0 = font.width(c);

            PdfGlyphPtr glyph;
            if (font.kind() != PdfFontKind::Type3)
            {
                PdfError glyphErr;
                if (!_glyphs.glyphForCode(font, c, glyph, glyphErr))
                {
                    if (!reported)
                    {
                        diagnostic(glyphErr.code, glyphErr.message);
                        reported = true;
                    }
                    // an undefined CID is skipped, a simple font shows a box
                    if (!font.isComposite())
                        glyph = _glyphs.boxGlyph(w0);
                }
            }

            if (glyph && (visible || clip))
            {
                // substitutes are stretched to the PDF width
                double hscale = 1.0;
                if (font.isSubstitute() && glyph->advance > 0 && w0 > 0)
                    hscale = w0 / glyph->advance;

                PdfMatrix textToUser = PdfMul(PdfMatrix(tfs * th, 0, 0, tfs, 0, _gs.textRise), _tm);
                PdfMatrix glyphMatrix = PdfMul(PdfMatrix(hscale, 0, 0, 1, 0, 0), PdfMul(textToUser, _gs.ctm));

                if (visible)
                    run.push_back({ glyph, glyphMatrix });
                if (clip)
                {
                    PdfPath outline = TransformPath(glyph->outline, glyphMatrix);
                    _textClip.insert(_textClip.end(), outline.begin(), outline.end());
                }
            }

            double wordSpace = (c.bytes == 1 && c.code == 32) ? _gs.wordSpacing : 0.0;
            double tx = (w0 / 1000.0 * tfs + _gs.charSpacing + wordSpace) * th;
            _tm = PdfMul(translation(tx, 0), _tm);
        }

        if (clip)
            _textClipUsed = true;
        if (run.empty())
            return;

        bool fill = mode == 0 || mode == 2 || mode == 4 || mode == 6;
        bool stroke = mode == 1 || mode == 2 || mode == 5 || mode == 6;
        if (fill && stroke)
        {
            _scene.glyphRun(run, _gs.ctm, false, strokeStyle(), paintFor(_gs.fill, _gs.fillAlpha), _gs.clips);
            _scene.glyphRun(std::move(run), _gs.ctm, true, strokeStyle(), paintFor(_gs.stroke, _gs.strokeAlpha), _gs.clips);
        }
        else if (fill)
        {
            _scene.glyphRun(std::move(run), _gs.ctm, false, strokeStyle(), paintFor(_gs.fill, _gs.fillAlpha), _gs.clips);
        }
        else if (stroke)
        {
            _scene.glyphRun(std::move(run), _gs.ctm, true, strokeStyle(), paintFor(_gs.stroke, _gs.strokeAlpha), _gs.clips);
        }
    }

    // =========================================================
    // Colour
    // =========================================================

    void PdfContentParser::setColorSpace(PdfPaint& paint, const std::string& csName)
    {
        std::string why;
        auto cs = PdfColorSpace::Parse(_doc, &_resources, std::make_shared<PdfName>(csName), why);
        if (!cs)
        {
            diagnostic(PdfErrorCode::UndefinedResource, "colour space " + csName + ": " + why);
            return;
        }

        paint.colorSpace = cs;
        paint.components = cs->defaultColor();
        paint.shading.reset();
        paint.rgb = cs->kind == PdfColorSpaceKind::Pattern ? PdfRGB{} : cs->toRGB(paint.components);
    }

    void PdfContentParser::setDeviceColor(PdfPaint& paint, PdfColorSpaceKind kind, const double* comps, size_t count)
    {
        paint.colorSpace = PdfColorSpace::Device(kind);
        paint.components.assign(comps, comps + count);
        paint.shading.reset();
        paint.rgb = paint.colorSpace->toRGB(paint.components);
    }

    void PdfContentParser::setColor(PdfPaint& paint, const PdfOperation& op, bool allowPattern)
    {
        if (!paint.colorSpace)
            paint.colorSpace = PdfColorSpace::Device(PdfColorSpaceKind::DeviceGray);

        std::vector<double> comps;
        std::string patternName;
        for (size_t i = 0; i < op.operands.size(); ++i)
        {
            double v;
            if (AsNumber(op.operands[i], v))
            {
                comps.push_back(v);
                continue;
            }
            if (allowPattern && i + 1 == op.operands.size() && !NameOf(op.operands[i]).empty())
            {
                patternName = NameOf(op.operands[i]);
                continue;
            }
            badOperands(op);
            return;
        }

        if (paint.colorSpace->kind == PdfColorSpaceKind::Pattern)
        {
            if (patternName.empty())
            {
                badOperands(op);
                return;
            }
            // uncoloured patterns carry their base-space colour too
            if (!comps.empty())
                paint.components = comps;
            setPattern(paint, patternName);
            return;
        }

        if (!patternName.empty() || comps.size() != static_cast<size_t>(paint.colorSpace->components()))
        {
            badOperands(op);
            return;
        }

        paint.components = comps;
        paint.shading.reset();
        paint.rgb = paint.colorSpace->toRGB(comps);
    }

    void PdfContentParser::setPattern(PdfPaint& paint, const std::string& patternName)
    {
        paint.shading.reset();
        paint.rgb = kFallbackGrey;

        PdfObjectPtr obj;
        PdfError err;
        if (!_resources.resource(ResourceCategory::Pattern, patternName, obj, err))
        {
            diagnostic(err.code, err.message);
            return;
        }

        auto dict = AsDict(_doc.resolveIndirect(obj));
        int type = static_cast<int>(_doc.getNumberOr(dict, "/PatternType", 0));
        if (type != 2)
        {
            diagnostic(PdfErrorCode::UnsupportedFeature,
                "tiling pattern " + patternName + " filled with fallback grey");
            return;
        }

        auto shading = loadShading(_doc.get(dict, "/Shading"), patternName);
        if (!shading)
            return;

        // pattern space is the default space of the stream using it
        PdfMatrix patternMatrix = matrixFrom(_doc.numbers(_doc.getArray(dict, "/Matrix")));
        paint.shading = shading;
        paint.shadingMatrix = PdfMul(patternMatrix, _baseCtm);
    }

    PdfShadingPtr PdfContentParser::loadShading(const PdfObjectPtr& obj, const std::string& label)
    {
        auto resolved = _doc.resolveIndirect(obj);
        auto dict = AsDict(resolved);
        if (!dict)
        {
            diagnostic(PdfErrorCode::BadOperator, "shading " + label + " is not a dictionary");
            return nullptr;
        }

        int type = static_cast<int>(_doc.getNumberOr(dict, "/ShadingType", 0));
        if (type >= 4 && type <= 7)
        {
            diagnostic(PdfErrorCode::UnsupportedFeature,
                "mesh shading type " + std::to_string(type) + " (" + label + ") not painted");
            return nullptr;
        }

        std::string why;
        auto shading = PdfShading::Parse(_doc, &_resources, resolved, why);
        if (!shading)
            diagnostic(PdfErrorCode::BadOperator, "shading " + label + ": " + why);
        return shading;
    }

    // =========================================================
    // Shadings, XObjects & Images
    // =========================================================

    void PdfContentParser::op_sh(const std::string& shadingName)
    {
        PdfObjectPtr obj;
        PdfError err;
        if (!_resources.resource(ResourceCategory::Shading, shadingName, obj, err))
        {
            diagnostic(err.code, err.message);
            return;
        }

        auto shading = loadShading(obj, shadingName);
        if (!shading)
            return;

        PdfPaintState paint;
        paint.alpha = _gs.fillAlpha;
        paint.shading = shading;
        paint.shadingMatrix = _gs.ctm;
        _scene.shading(paint, _gs.clips);
    }

    void PdfContentParser::op_Do(const std::string& xName)
    {
        PdfObjectPtr obj;
        PdfError err;
        if (!_resources.resource(ResourceCategory::XObject, xName, obj, err))
        {
            diagnostic(err.code, err.message);
            return;
        }

        auto stream = AsStream(_doc.resolveIndirect(obj));
        if (!stream)
        {
            diagnostic(PdfErrorCode::BadOperator, "XObject " + xName + " is not a stream");
            return;
        }

        std::string subtype = _doc.getName(stream->dict, "/Subtype");
        if (subtype == "/Image")
            paintImage(stream, xName);
        else if (subtype == "/Form")
            runForm(stream, xName);
        else
            diagnostic(PdfErrorCode::UnsupportedFeature, "XObject " + xName + " of subtype " + subtype);
    }

    void PdfContentParser::paintImage(const std::shared_ptr<PdfStream>& stream, const std::string& label)
    {
        PdfImagePtr image;
        PdfError err;
        if (!PdfImageDecoder::Decode(_doc, _resources, stream, _gs.fill.rgb, image, err))
        {
            diagnostic(err.code, label + ": " + err.message);
            return;
        }
        _scene.image(image, _gs.ctm, _gs.fillAlpha, _gs.clips);
    }

    void PdfContentParser::runForm(const std::shared_ptr<PdfStream>& stream, const std::string& label)
    {
        if (_formDepth >= MAX_FORM_DEPTH)
        {
            diagnostic(PdfErrorCode::BadOperator, "form " + label + " nested deeper than " +
                std::to_string(MAX_FORM_DEPTH));
            return;
        }
        if (_activeForms.count(stream.get()))
        {
            diagnostic(PdfErrorCode::BadOperator, "form " + label + " invokes itself");
            return;
        }
        // the form needs one save of its own
        if (_gsStack.size() >= MAX_STATE_DEPTH)
        {
            diagnostic(PdfErrorCode::BadOperator, "form " + label + " skipped, graphics state nesting too deep");
            return;
        }

        std::vector<uint8_t> content;
        if (!_doc.decodeStream(stream, content))
        {
            diagnostic(PdfErrorCode::BadOperator, "form " + label + " content could not be decoded");
            return;
        }

        std::vector<PdfOperation> ops;
        PdfOperationReader reader(content);
        reader.readAll(ops);

        // q, then the form's own stream state
        op_q();
        const size_t floor = _gsStack.size();
        const size_t savedFloor = _stackFloor;
        _stackFloor = floor;

        PdfResources savedResources = _resources;
        PdfMatrix savedBase = _baseCtm;
        PdfPath savedPath;
        savedPath.swap(_path);
        const bool savedHasPoint = _hasCurrentPoint;
        const bool savedPendingClip = _pendingClip;
        _pendingClip = false;
        _hasCurrentPoint = false;

        const auto& dict = stream->dict;
        _gs.ctm = PdfMul(matrixFrom(_doc.numbers(_doc.getArray(dict, "/Matrix"))), _gs.ctm);

        auto bbox = _doc.numbers(_doc.getArray(dict, "/BBox"));
        if (bbox.size() >= 4)
        {
            auto clip = std::make_shared<PdfClip>();
            AppendRect(clip->path, std::min(bbox[0], bbox[2]), std::min(bbox[1], bbox[3]),
                std::fabs(bbox[2] - bbox[0]), std::fabs(bbox[3] - bbox[1]));
            clip->ctm = _gs.ctm;
            _gs.clips.push_back(clip);
        }

        _resources = _resources.withLocal(_doc.getDict(dict, "/Resources"));
        _baseCtm = _gs.ctm;

        _activeForms.insert(stream.get());
        ++_formDepth;
        run(ops);
        --_formDepth;
        _activeForms.erase(stream.get());

        // drop saves the form left open, then undo the form's own q
        if (_gsStack.size() > floor)
            _gsStack.resize(floor);
        _stackFloor = savedFloor;
        _gs = std::move(_gsStack.back());
        _gsStack.pop_back();

        _resources = savedResources;
        _baseCtm = savedBase;
        _path.swap(savedPath);
        _hasCurrentPoint = savedHasPoint;
        _pendingClip = savedPendingClip;
    }
}
