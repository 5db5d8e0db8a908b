#include "PdfOperator.h"
#include "PdfParser.h"
#include "PdfImage.h"
#include "PdfDebug.h"

#include <unordered_map>

namespace pdfraster
{
    PdfOp PdfOperationReader::Lookup(const std::string& keyword)
    {
        static const std::unordered_map<std::string, PdfOp> table = {
            { "q", PdfOp::Save },
            { "Q", PdfOp::Restore },
            { "cm", PdfOp::Concat },
            { "w", PdfOp::SetLineWidth },
            { "J", PdfOp::SetLineCap },
            { "j", PdfOp::SetLineJoin },
            { "M", PdfOp::SetMiterLimit },
            { "d", PdfOp::SetDash },
            { "ri", PdfOp::SetRenderingIntent },
            { "i", PdfOp::SetFlatness },
            { "gs", PdfOp::SetExtGState },

            { "m", PdfOp::MoveTo },
            { "l", PdfOp::LineTo },
            { "c", PdfOp::CurveTo },
            { "v", PdfOp::CurveToV },
            { "y", PdfOp::CurveToY },
            { "h", PdfOp::ClosePath },
            { "re", PdfOp::Rectangle },

            { "S", PdfOp::Stroke },
            { "s", PdfOp::CloseStroke },
            { "f", PdfOp::Fill },
            { "F", PdfOp::FillObsolete },
            { "f*", PdfOp::FillEvenOdd },
            { "B", PdfOp::FillStroke },
            { "B*", PdfOp::FillStrokeEvenOdd },
            { "b", PdfOp::CloseFillStroke },
            { "b*", PdfOp::CloseFillStrokeEvenOdd },
            { "n", PdfOp::EndPath },

            { "W", PdfOp::Clip },
            { "W*", PdfOp::ClipEvenOdd },

            { "BT", PdfOp::BeginText },
            { "ET", PdfOp::EndText },
            { "Tc", PdfOp::SetCharSpacing },
            { "Tw", PdfOp::SetWordSpacing },
            { "Tz", PdfOp::SetHorizScale },
            { "TL", PdfOp::SetLeading },
            { "Tf", PdfOp::SetFont },
            { "Tr", PdfOp::SetRenderMode },
            { "Ts", PdfOp::SetRise },
            { "Td", PdfOp::MoveText },
            { "TD", PdfOp::MoveTextSetLeading },
            { "Tm", PdfOp::SetTextMatrix },
            { "T*", PdfOp::NextLine },
            { "Tj", PdfOp::ShowText },
            { "TJ", PdfOp::ShowTextArray },
            { "'", PdfOp::NextLineShow },
            { "\"", PdfOp::NextLineSpacingShow },

            { "d0", PdfOp::SetCharWidth },
            { "d1", PdfOp::SetCacheDevice },

            { "CS", PdfOp::SetStrokeColorSpace },
            { "cs", PdfOp::SetFillColorSpace },
            { "SC", PdfOp::SetStrokeColor },
            { "SCN", PdfOp::SetStrokeColorN },
            { "sc", PdfOp::SetFillColor },
            { "scn", PdfOp::SetFillColorN },
            { "G", PdfOp::SetStrokeGray },
            { "g", PdfOp::SetFillGray },
            { "RG", PdfOp::SetStrokeRGB },
            { "rg", PdfOp::SetFillRGB },
            { "K", PdfOp::SetStrokeCMYK },
            { "k", PdfOp::SetFillCMYK },

            { "sh", PdfOp::PaintShading },
            { "Do", PdfOp::PaintXObject },
            { "BI", PdfOp::InlineImage },

            { "MP", PdfOp::MarkedContentPoint },
            { "DP", PdfOp::MarkedContentPointProps },
            { "BMC", PdfOp::BeginMarkedContent },
            { "BDC", PdfOp::BeginMarkedContentProps },
            { "EMC", PdfOp::EndMarkedContent },

            { "BX", PdfOp::BeginCompat },
            { "EX", PdfOp::EndCompat },
        };

        auto it = table.find(keyword);
        return it != table.end() ? it->second : PdfOp::Unknown;
    }

    PdfOperationReader::PdfOperationReader(const std::vector<uint8_t>& data)
        : _data(data)
    {
    }

    void PdfOperationReader::readAll(std::vector<PdfOperation>& out)
    {
        PdfParser parser(_data);
        PdfLexer& lexer = parser.lexer();
        std::vector<PdfObjectPtr> operands;

        while (out.size() < MAX_OPERATIONS)
        {
            Token tok = lexer.nextToken();
            if (tok.type == TokenType::EndOfFile)
                break;

            if (tok.type == TokenType::Keyword)
            {
                if (tok.text == "true" || tok.text == "false" || tok.text == "null")
                {
                    operands.push_back(parser.parseObjectFrom(tok));
                    continue;
                }

                PdfOperation op;
                op.keyword = tok.text;
                op.op = Lookup(tok.text);

                if (op.op == PdfOp::InlineImage)
                {
                    operands.clear();
                    if (!readInlineImage(parser, op))
                    {
                        LogDebug("PdfOperationReader: inline image without ID, stream ends");
                        break;
                    }
                    out.push_back(std::move(op));
                    continue;
                }

                op.operands.swap(operands);
                operands.clear();
                out.push_back(std::move(op));
                continue;
            }

            bool value = tok.type == TokenType::Number || tok.type == TokenType::String ||
                tok.type == TokenType::HexString || tok.type == TokenType::Name ||
                (tok.type == TokenType::Delimiter && (tok.text == "<<" || tok.text == "["));
            if (!value)
                continue; // stray ] >> { }

            PdfObjectPtr obj = parser.parseObjectFrom(tok);
            if (obj && operands.size() < MAX_OPERANDS)
                operands.push_back(obj);
        }

        LogDebug("PdfOperationReader: %zu operations from %zu bytes", out.size(), _data.size());
    }

    bool PdfOperationReader::readInlineImage(PdfParser& parser, PdfOperation& op)
    {
        PdfLexer& lexer = parser.lexer();
        auto dict = std::make_shared<PdfDictionary>();

        while (true)
        {
            Token t = lexer.nextToken();
            if (t.type == TokenType::EndOfFile)
                return false;
            if (t.type == TokenType::Keyword && t.text == "ID")
                break;
            if (t.type != TokenType::Name)
                continue;

            PdfObjectPtr v = parser.parseNextObject();
            if (!v)
                return false;
            dict->entries[t.text] = v;
        }

        // one whitespace byte separates ID from the data
        size_t start = lexer.getPosition();
        if (start < _data.size() && IsPdfWhitespace(_data[start]))
            ++start;

        size_t dataEnd = start;
        size_t after = findInlineImageEnd(start, dict, dataEnd);

        std::vector<uint8_t> bytes(_data.begin() + start, _data.begin() + dataEnd);
        op.inlineImage = PdfImageDecoder::ExpandInline(dict, bytes);
        lexer.setPosition(after);
        return true;
    }

    size_t PdfOperationReader::findInlineImageEnd(size_t start,
        const std::shared_ptr<PdfDictionary>& dict, size_t& dataEnd) const
    {
        auto endsWord = [&](size_t p) {
            return p >= _data.size() || IsPdfWhitespace(_data[p]) || IsPdfDelimiter(_data[p]);
        };

        // Unfiltered data in a device space has a known length
        if (!dict->has("/F") && !dict->has("/Filter"))
        {
            auto num = [&](const char* shortKey, const char* longKey, double fallback) {
                auto v = dict->get(shortKey);
                if (!v)
                    v = dict->get(longKey);
                return NumberOr(v, fallback);
            };

            auto maskObj = dict->get("/IM");
            if (!maskObj)
                maskObj = dict->get("/ImageMask");
            auto isMask = std::dynamic_pointer_cast<PdfBoolean>(maskObj);

            auto csObj = dict->get("/CS");
            if (!csObj)
                csObj = dict->get("/ColorSpace");
            std::string cs = NameOf(csObj);

            int comps = 0;
            if (isMask && isMask->value)
                comps = 1;
            else if (cs == "/G" || cs == "/DeviceGray")
                comps = 1;
            else if (cs == "/RGB" || cs == "/DeviceRGB")
                comps = 3;
            else if (cs == "/CMYK" || cs == "/DeviceCMYK")
                comps = 4;

            double w = num("/W", "/Width", 0);
            double h = num("/H", "/Height", 0);
            double bpc = (isMask && isMask->value) ? 1 : num("/BPC", "/BitsPerComponent", 8);

            if (comps > 0 && w > 0 && h > 0 && bpc > 0)
            {
                size_t stride = (static_cast<size_t>(w) * comps * static_cast<size_t>(bpc) + 7) / 8;
                size_t end = start + stride * static_cast<size_t>(h);
                size_t p = end;
                while (p < _data.size() && IsPdfWhitespace(_data[p]))
                    ++p;
                if (p + 1 < _data.size() && _data[p] == 'E' && _data[p + 1] == 'I' && endsWord(p + 2))
                {
                    dataEnd = end;
                    return p + 2;
                }
            }
        }

        // Otherwise the first "EI" standing alone as a word
        for (size_t p = start; p + 1 < _data.size(); ++p)
        {
            if (_data[p] != 'E' || _data[p + 1] != 'I')
                continue;
            if (p > start && !IsPdfWhitespace(_data[p - 1]))
                continue;
            if (!endsWord(p + 2))
                continue;

            dataEnd = (p > start) ? p - 1 : p;
            return p + 2;
        }

        dataEnd = _data.size();
        return _data.size();
    }
}
