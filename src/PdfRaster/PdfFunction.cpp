#include "PdfFunction.h"
#include "PdfDocument.h"
#include "PdfLexer.h"
#include "PdfDebug.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>

namespace pdfraster
{
    namespace
    {
        const double kPi = 3.14159265358979323846;

        double clampTo(double v, double lo, double hi)
        {
            if (lo > hi) std::swap(lo, hi);
            return std::min(hi, std::max(lo, v));
        }

        double interpolate(double x, double xmin, double xmax, double ymin, double ymax)
        {
            if (xmax == xmin)
                return ymin;
            return ymin + (x - xmin) * (ymax - ymin) / (xmax - xmin);
        }

        // ============================================
        // Type 0: sampled
        // ============================================
        class SampledFunction : public PdfFunction
        {
        public:
            bool load(const PdfDocument& doc, const std::shared_ptr<PdfStream>& stream)
            {
                auto dict = stream->dict;
                _domain = doc.numbers(doc.getArray(dict, "/Domain"));
                _range = doc.numbers(doc.getArray(dict, "/Range"));
                auto size = doc.numbers(doc.getArray(dict, "/Size"));
                int m = inputCount();
                int n = outputCount();
                if (m < 1 || m > 8 || n < 1 || static_cast<int>(size.size()) < m)
                    return false;

                for (int i = 0; i < m; ++i)
                    _size.push_back(std::max(1, static_cast<int>(size[i])));

                _bps = static_cast<int>(doc.getNumberOr(dict, "/BitsPerSample", 8));
                if (_bps < 1 || _bps > 32)
                    return false;

                _encode = doc.numbers(doc.getArray(dict, "/Encode"));
                if (static_cast<int>(_encode.size()) < 2 * m)
                {
                    _encode.clear();
                    for (int i = 0; i < m; ++i)
                    {
                        _encode.push_back(0);
                        _encode.push_back(_size[i] - 1);
                    }
                }
                _decode = doc.numbers(doc.getArray(dict, "/Decode"));
                if (static_cast<int>(_decode.size()) < 2 * n)
                    _decode = _range;

                std::vector<uint8_t> data;
                if (!doc.decodeStream(stream, data))
                    return false;

                size_t total = static_cast<size_t>(n);
                for (int s : _size)
                    total *= static_cast<size_t>(s);
                if (total > (size_t(1) << 24))
                    return false;

                // unpack the big-endian bit stream
                _samples.assign(total, 0.0);
                double maxValue = std::ldexp(1.0, _bps) - 1.0;
                size_t bitPos = 0;
                for (size_t i = 0; i < total; ++i)
                {
                    uint64_t v = 0;
                    for (int b = 0; b < _bps; ++b, ++bitPos)
                    {
                        size_t byte = bitPos >> 3;
                        int bit = byte < data.size() ? (data[byte] >> (7 - (bitPos & 7))) & 1 : 0;
                        v = (v << 1) | static_cast<uint64_t>(bit);
                    }
                    _samples[i] = static_cast<double>(v) / maxValue;
                }
                return true;
            }

        protected:
            void evaluateRaw(const std::vector<double>& in, std::vector<double>& out) const override
            {
                const int m = inputCount();
                const int n = outputCount();

                std::vector<int> lo(m), hi(m);
                std::vector<double> frac(m);
                for (int i = 0; i < m; ++i)
                {
                    double e = interpolate(in[i], _domain[2 * i], _domain[2 * i + 1], _encode[2 * i], _encode[2 * i + 1]);
                    e = clampTo(e, 0, _size[i] - 1);
                    lo[i] = static_cast<int>(std::floor(e));
                    hi[i] = std::min(lo[i] + 1, _size[i] - 1);
                    frac[i] = e - lo[i];
                }

                out.assign(n, 0.0);
                // multilinear over the 2^m corners
                for (int corner = 0; corner < (1 << m); ++corner)
                {
                    double weight = 1.0;
                    size_t index = 0;
                    size_t stride = 1;
                    for (int i = 0; i < m; ++i)
                    {
                        bool upper = (corner >> i) & 1;
                        weight *= upper ? frac[i] : 1.0 - frac[i];
                        index += static_cast<size_t>(upper ? hi[i] : lo[i]) * stride;
                        stride *= static_cast<size_t>(_size[i]);
                    }
                    if (weight == 0.0)
                        continue;
                    for (int j = 0; j < n; ++j)
                        out[j] += weight * _samples[index * n + j];
                }

                for (int j = 0; j < n; ++j)
                    out[j] = _decode[2 * j] + out[j] * (_decode[2 * j + 1] - _decode[2 * j]);
            }

        private:
            std::vector<int> _size;
            int _bps = 8;
            std::vector<double> _encode;
            std::vector<double> _decode;
            std::vector<double> _samples;
        };

        // ============================================
        // Type 2: exponential interpolation
        // ============================================
        class ExponentialFunction : public PdfFunction
        {
        public:
            bool load(const PdfDocument& doc, const std::shared_ptr<PdfDictionary>& dict)
            {
                _domain = doc.numbers(doc.getArray(dict, "/Domain"));
                if (_domain.size() < 2)
                    _domain = { 0, 1 };
                _domain.resize(2);
                _range = doc.numbers(doc.getArray(dict, "/Range"));
                _c0 = doc.numbers(doc.getArray(dict, "/C0"));
                _c1 = doc.numbers(doc.getArray(dict, "/C1"));
                if (_c0.empty()) _c0 = { 0.0 };
                if (_c1.empty()) _c1 = { 1.0 };
                if (_c0.size() != _c1.size())
                    return false;
                _n = doc.getNumberOr(dict, "/N", 1.0);
                return true;
            }

            int outputCount() const override { return static_cast<int>(_c0.size()); }

        protected:
            void evaluateRaw(const std::vector<double>& in, std::vector<double>& out) const override
            {
                double x = in[0];
                double xn = (x <= 0 && _n < 1) ? 0 : std::pow(x, _n);
                out.resize(_c0.size());
                for (size_t j = 0; j < _c0.size(); ++j)
                    out[j] = _c0[j] + xn * (_c1[j] - _c0[j]);
            }

        private:
            std::vector<double> _c0;
            std::vector<double> _c1;
            double _n = 1.0;
        };

        // ============================================
        // Type 3: stitching
        // ============================================
        class StitchingFunction : public PdfFunction
        {
        public:
            bool load(const PdfDocument& doc, const std::shared_ptr<PdfDictionary>& dict, int depth)
            {
                _domain = doc.numbers(doc.getArray(dict, "/Domain"));
                if (_domain.size() < 2)
                    return false;
                _domain.resize(2);
                _range = doc.numbers(doc.getArray(dict, "/Range"));

                auto fns = doc.getArray(dict, "/Functions");
                if (!fns || fns->items.empty())
                    return false;
                for (const auto& f : fns->items)
                {
                    auto fn = PdfFunction::Parse(doc, doc.resolveIndirect(f), depth + 1);
                    if (!fn)
                        return false;
                    _functions.push_back(fn);
                }

                _bounds = doc.numbers(doc.getArray(dict, "/Bounds"));
                _encode = doc.numbers(doc.getArray(dict, "/Encode"));
                size_t k = _functions.size();
                if (_bounds.size() + 1 != k)
                    return false;
                if (_encode.size() < 2 * k)
                {
                    _encode.clear();
                    for (size_t i = 0; i < k; ++i)
                    {
                        _encode.push_back(0);
                        _encode.push_back(1);
                    }
                }
                return true;
            }

            int outputCount() const override
            {
                return _range.empty() ? _functions.front()->outputCount() : static_cast<int>(_range.size() / 2);
            }

        protected:
            void evaluateRaw(const std::vector<double>& in, std::vector<double>& out) const override
            {
                double x = in[0];
                size_t i = 0;
                while (i < _bounds.size() && x >= _bounds[i])
                    ++i;

                double lo = i == 0 ? _domain[0] : _bounds[i - 1];
                double hi = i == _bounds.size() ? _domain[1] : _bounds[i];
                double e = interpolate(x, lo, hi, _encode[2 * i], _encode[2 * i + 1]);
                _functions[i]->evaluate({ e }, out);
            }

        private:
            std::vector<PdfFunctionPtr> _functions;
            std::vector<double> _bounds;
            std::vector<double> _encode;
        };

        // ============================================
        // Type 4: PostScript calculator
        // ============================================
        enum class PsOp
        {
            Push, Abs, Add, Atan, Ceiling, Cos, Cvi, Cvr, Div, Exp, Floor, Idiv, Ln, Log,
            Mod, Mul, Neg, Round, Sin, Sqrt, Sub, Truncate, And, Or, Not, Xor, Bitshift,
            Eq, Ne, Gt, Ge, Lt, Le, True, False, Copy, Dup, Exch, Index, Pop, Roll,
            JumpIfFalse, Jump
        };

        struct PsInstr
        {
            PsOp op;
            double value = 0;  // Push operand
            size_t target = 0; // jump destination
        };

        class PostScriptFunction : public PdfFunction
        {
        public:
            bool load(const PdfDocument& doc, const std::shared_ptr<PdfStream>& stream)
            {
                _domain = doc.numbers(doc.getArray(stream->dict, "/Domain"));
                _range = doc.numbers(doc.getArray(stream->dict, "/Range"));
                if (_domain.size() < 2 || _range.size() < 2)
                    return false;

                std::vector<uint8_t> src;
                if (!doc.decodeStream(stream, src))
                    return false;

                PdfLexer lexer(src);
                Token t = lexer.nextToken();
                if (!(t.type == TokenType::Delimiter && t.text == "{"))
                    return false;
                return compileBlock(lexer, 0);
            }

        protected:
            void evaluateRaw(const std::vector<double>& in, std::vector<double>& out) const override
            {
                std::vector<double> st(in.begin(), in.end());
                st.reserve(100);

                auto pop = [&]() -> double {
                    if (st.empty()) return 0.0;
                    double v = st.back();
                    st.pop_back();
                    return v;
                };

                size_t pc = 0;
                size_t steps = 0;
                while (pc < _code.size() && ++steps < 100000 && st.size() < 1000)
                {
                    const PsInstr& ins = _code[pc++];
                    switch (ins.op)
                    {
                    case PsOp::Push: st.push_back(ins.value); break;
                    case PsOp::Abs: st.push_back(std::fabs(pop())); break;
                    case PsOp::Add: { double b = pop(), a = pop(); st.push_back(a + b); break; }
                    case PsOp::Sub: { double b = pop(), a = pop(); st.push_back(a - b); break; }
                    case PsOp::Mul: { double b = pop(), a = pop(); st.push_back(a * b); break; }
                    case PsOp::Div: { double b = pop(), a = pop(); st.push_back(b == 0 ? 0 : a / b); break; }
                    case PsOp::Idiv:
                    {
                        long long b = static_cast<long long>(pop()), a = static_cast<long long>(pop());
                        st.push_back(b == 0 ? 0.0 : static_cast<double>(a / b));
                        break;
                    }
                    case PsOp::Mod:
                    {
                        long long b = static_cast<long long>(pop()), a = static_cast<long long>(pop());
                        st.push_back(b == 0 ? 0.0 : static_cast<double>(a % b));
                        break;
                    }
                    case PsOp::Atan:
                    {
                        double den = pop(), num = pop();
                        double deg = std::atan2(num, den) * 180.0 / kPi;
                        st.push_back(deg < 0 ? deg + 360.0 : deg);
                        break;
                    }
                    case PsOp::Ceiling: st.push_back(std::ceil(pop())); break;
                    case PsOp::Floor: st.push_back(std::floor(pop())); break;
                    case PsOp::Round: st.push_back(std::floor(pop() + 0.5)); break;
                    case PsOp::Truncate: st.push_back(std::trunc(pop())); break;
                    case PsOp::Cvi: st.push_back(std::trunc(pop())); break;
                    case PsOp::Cvr: break;
                    case PsOp::Cos: st.push_back(std::cos(pop() * kPi / 180.0)); break;
                    case PsOp::Sin: st.push_back(std::sin(pop() * kPi / 180.0)); break;
                    case PsOp::Exp: { double e = pop(), b = pop(); st.push_back(std::pow(b, e)); break; }
                    case PsOp::Ln: { double v = pop(); st.push_back(v > 0 ? std::log(v) : 0); break; }
                    case PsOp::Log: { double v = pop(); st.push_back(v > 0 ? std::log10(v) : 0); break; }
                    case PsOp::Sqrt: { double v = pop(); st.push_back(v > 0 ? std::sqrt(v) : 0); break; }
                    case PsOp::Neg: st.push_back(-pop()); break;
                    case PsOp::And: { long long b = static_cast<long long>(pop()), a = static_cast<long long>(pop()); st.push_back(static_cast<double>(a & b)); break; }
                    case PsOp::Or: { long long b = static_cast<long long>(pop()), a = static_cast<long long>(pop()); st.push_back(static_cast<double>(a | b)); break; }
                    case PsOp::Xor: { long long b = static_cast<long long>(pop()), a = static_cast<long long>(pop()); st.push_back(static_cast<double>(a ^ b)); break; }
                    case PsOp::Not:
                    {
                        // booleans are stored as 0/1
                        double v = pop();
                        st.push_back(v == 0.0 ? 1.0 : (v == 1.0 ? 0.0 : static_cast<double>(~static_cast<long long>(v))));
                        break;
                    }
                    case PsOp::Bitshift:
                    {
                        long long s = static_cast<long long>(pop()), v = static_cast<long long>(pop());
                        st.push_back(static_cast<double>(s >= 0 ? (v << s) : (v >> -s)));
                        break;
                    }
                    case PsOp::Eq: { double b = pop(), a = pop(); st.push_back(a == b ? 1 : 0); break; }
                    case PsOp::Ne: { double b = pop(), a = pop(); st.push_back(a != b ? 1 : 0); break; }
                    case PsOp::Gt: { double b = pop(), a = pop(); st.push_back(a > b ? 1 : 0); break; }
                    case PsOp::Ge: { double b = pop(), a = pop(); st.push_back(a >= b ? 1 : 0); break; }
                    case PsOp::Lt: { double b = pop(), a = pop(); st.push_back(a < b ? 1 : 0); break; }
                    case PsOp::Le: { double b = pop(), a = pop(); st.push_back(a <= b ? 1 : 0); break; }
                    case PsOp::True: st.push_back(1); break;
                    case PsOp::False: st.push_back(0); break;
                    case PsOp::Dup: { double v = pop(); st.push_back(v); st.push_back(v); break; }
                    case PsOp::Exch: { double b = pop(), a = pop(); st.push_back(b); st.push_back(a); break; }
                    case PsOp::Pop: pop(); break;
                    case PsOp::Copy:
                    {
                        int n = static_cast<int>(pop());
                        if (n > 0 && n <= static_cast<int>(st.size()))
                        {
                            size_t start = st.size() - n;
                            for (int k = 0; k < n; ++k)
                                st.push_back(st[start + k]);
                        }
                        break;
                    }
                    case PsOp::Index:
                    {
                        int n = static_cast<int>(pop());
                        if (n >= 0 && n < static_cast<int>(st.size()))
                            st.push_back(st[st.size() - 1 - n]);
                        else
                            st.push_back(0);
                        break;
                    }
                    case PsOp::Roll:
                    {
                        int j = static_cast<int>(pop());
                        int n = static_cast<int>(pop());
                        if (n > 0 && n <= static_cast<int>(st.size()))
                        {
                            j = ((j % n) + n) % n;
                            std::rotate(st.end() - n, st.end() - j, st.end());
                        }
                        break;
                    }
                    case PsOp::JumpIfFalse:
                        if (pop() == 0.0)
                            pc = ins.target;
                        break;
                    case PsOp::Jump:
                        pc = ins.target;
                        break;
                    }
                }

                int n = outputCount();
                out.assign(n, 0.0);
                // results are the top n stack entries, in order
                for (int j = n - 1; j >= 0; --j)
                    out[j] = pop();
            }

        private:
            // A compiled "{...}" block awaiting its if/ifelse
            struct Pending
            {
                size_t start;
                size_t end;
            };

            std::vector<PsInstr> _code;

            static bool lookup(const std::string& word, PsOp& op)
            {
                static const struct { const char* name; PsOp op; } table[] = {
                    { "abs", PsOp::Abs }, { "add", PsOp::Add }, { "atan", PsOp::Atan },
                    { "ceiling", PsOp::Ceiling }, { "cos", PsOp::Cos }, { "cvi", PsOp::Cvi },
                    { "cvr", PsOp::Cvr }, { "div", PsOp::Div }, { "exp", PsOp::Exp },
                    { "floor", PsOp::Floor }, { "idiv", PsOp::Idiv }, { "ln", PsOp::Ln },
                    { "log", PsOp::Log }, { "mod", PsOp::Mod }, { "mul", PsOp::Mul },
                    { "neg", PsOp::Neg }, { "round", PsOp::Round }, { "sin", PsOp::Sin },
                    { "sqrt", PsOp::Sqrt }, { "sub", PsOp::Sub }, { "truncate", PsOp::Truncate },
                    { "and", PsOp::And }, { "or", PsOp::Or }, { "not", PsOp::Not },
                    { "xor", PsOp::Xor }, { "bitshift", PsOp::Bitshift }, { "eq", PsOp::Eq },
                    { "ne", PsOp::Ne }, { "gt", PsOp::Gt }, { "ge", PsOp::Ge },
                    { "lt", PsOp::Lt }, { "le", PsOp::Le }, { "true", PsOp::True },
                    { "false", PsOp::False }, { "copy", PsOp::Copy }, { "dup", PsOp::Dup },
                    { "exch", PsOp::Exch }, { "index", PsOp::Index }, { "pop", PsOp::Pop },
                    { "roll", PsOp::Roll },
                };
                for (const auto& e : table)
                {
                    if (word == e.name)
                    {
                        op = e.op;
                        return true;
                    }
                }
                return false;
            }

            // Compiles up to the matching '}'. Nested blocks become
            // conditional jumps once their "if"/"ifelse" is seen.
            bool compileBlock(PdfLexer& lexer, int depth)
            {
                if (depth > 32)
                    return false;

                std::vector<Pending> blocks;

                while (true)
                {
                    Token t = lexer.nextToken();
                    if (t.type == TokenType::EndOfFile)
                        return false;

                    if (t.type == TokenType::Delimiter && t.text == "}")
                        return true;

                    if (t.type == TokenType::Number)
                    {
                        _code.push_back({ PsOp::Push, std::atof(t.text.c_str()), 0 });
                        blocks.clear();
                        continue;
                    }

                    if (t.type == TokenType::Delimiter && t.text == "{")
                    {
                        // emitted inline behind a placeholder jump that
                        // "if"/"ifelse" patches afterwards
                        size_t jumpAt = _code.size();
                        _code.push_back({ PsOp::Jump, 0, 0 });
                        size_t start = _code.size();
                        if (!compileBlock(lexer, depth + 1))
                            return false;
                        _code[jumpAt].target = _code.size();
                        blocks.push_back({ start, _code.size() });
                        continue;
                    }

                    if (t.type != TokenType::Keyword)
                        return false;

                    if (t.text == "if" && !blocks.empty())
                    {
                        Pending b = blocks.back();
                        blocks.pop_back();
                        relocateIf(b);
                        continue;
                    }
                    if (t.text == "ifelse" && blocks.size() >= 2)
                    {
                        Pending elseB = blocks.back();
                        blocks.pop_back();
                        Pending thenB = blocks.back();
                        blocks.pop_back();
                        relocateIfElse(thenB, elseB);
                        continue;
                    }

                    PsOp op;
                    if (!lookup(t.text, op))
                    {
                        LogDebug("PdfFunction: unknown PostScript operator '%s'", t.text.c_str());
                        return false;
                    }
                    _code.push_back({ op, 0, 0 });
                    blocks.clear();
                }
            }

            // Rewrites "[Jump][then...]" into "[JumpIfFalse end][then...]"
            void relocateIf(const Pending& thenB)
            {
                _code[thenB.start - 1].op = PsOp::JumpIfFalse;
                _code[thenB.start - 1].target = thenB.end;
            }

            // "[Jump][then...][Jump][else...]" becomes
            // "[JumpIfFalse else][then...][Jump end][else...]"
            void relocateIfElse(const Pending& thenB, const Pending& elseB)
            {
                size_t thenJump = thenB.start - 1;
                size_t elseJump = elseB.start - 1;
                _code[thenJump].op = PsOp::JumpIfFalse;
                _code[thenJump].target = elseB.start;
                _code[elseJump].op = PsOp::Jump;
                _code[elseJump].target = elseB.end;
            }
        };

        // ============================================
        // Array of functions, outputs concatenated
        // ============================================
        class CompositeFunction : public PdfFunction
        {
        public:
            explicit CompositeFunction(std::vector<PdfFunctionPtr> parts)
                : _parts(std::move(parts))
            {
                _domain = { 0, 1 };
                if (!_parts.empty())
                {
                    int m = _parts.front()->inputCount();
                    _domain.assign(static_cast<size_t>(std::max(1, m)) * 2, 0.0);
                    for (size_t i = 1; i < _domain.size(); i += 2)
                        _domain[i] = 1.0;
                }
            }

            int outputCount() const override
            {
                int n = 0;
                for (const auto& p : _parts)
                    n += p->outputCount();
                return n;
            }

        protected:
            void evaluateRaw(const std::vector<double>& in, std::vector<double>& out) const override
            {
                out.clear();
                std::vector<double> part;
                for (const auto& p : _parts)
                {
                    p->evaluate(in, part);
                    out.insert(out.end(), part.begin(), part.end());
                }
            }

        private:
            std::vector<PdfFunctionPtr> _parts;
        };
    }

    void PdfFunction::evaluate(const std::vector<double>& in, std::vector<double>& out) const
    {
        int m = inputCount();
        std::vector<double> clipped(static_cast<size_t>(std::max(m, 1)), 0.0);
        for (int i = 0; i < m; ++i)
        {
            double v = i < static_cast<int>(in.size()) ? in[i] : 0.0;
            clipped[i] = clampTo(v, _domain[2 * i], _domain[2 * i + 1]);
        }

        evaluateRaw(clipped, out);

        for (size_t j = 0; j + 1 < _range.size() && j / 2 < out.size(); j += 2)
            out[j / 2] = clampTo(out[j / 2], _range[j], _range[j + 1]);
    }

    PdfFunctionPtr PdfFunction::Parse(const PdfDocument& doc, const PdfObjectPtr& objIn, int depth)
    {
        if (depth > MAX_NESTING)
            return nullptr;

        auto obj = doc.resolveIndirect(objIn);
        if (auto arr = AsArray(obj))
        {
            std::vector<PdfFunctionPtr> parts;
            for (const auto& item : arr->items)
            {
                auto fn = Parse(doc, item, depth + 1);
                if (!fn)
                    return nullptr;
                parts.push_back(fn);
            }
            if (parts.empty())
                return nullptr;
            if (parts.size() == 1)
                return parts.front();
            return std::make_shared<CompositeFunction>(std::move(parts));
        }

        auto dict = AsDict(obj);
        if (!dict)
            return nullptr;

        int type = static_cast<int>(doc.getNumberOr(dict, "/FunctionType", -1));
        auto stream = AsStream(obj);

        switch (type)
        {
        case 0:
        {
            auto fn = std::make_shared<SampledFunction>();
            if (stream && fn->load(doc, stream))
                return fn;
            break;
        }
        case 2:
        {
            auto fn = std::make_shared<ExponentialFunction>();
            if (fn->load(doc, dict))
                return fn;
            break;
        }
        case 3:
        {
            auto fn = std::make_shared<StitchingFunction>();
            if (fn->load(doc, dict, depth))
                return fn;
            break;
        }
        case 4:
        {
            auto fn = std::make_shared<PostScriptFunction>();
            if (stream && fn->load(doc, stream))
                return fn;
            break;
        }
        default:
            break;
        }

        LogDebug("PdfFunction: type %d could not be loaded", type);
        return nullptr;
    }
}
