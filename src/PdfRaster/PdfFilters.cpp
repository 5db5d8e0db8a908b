#include "PdfFilters.h"
#include "PdfDebug.h"
#include <zlib.h>
#include <jpeglib.h>
#include <algorithm>
#include <csetjmp>
#include <cstdlib>
#include <cstring>

// OpenJPEG for JPEG 2000 support
#ifdef PDFRASTER_HAVE_OPENJPEG
#include <openjpeg.h>
#endif

namespace pdfraster
{
    std::string PdfFilters::NormalizeFilterName(const std::string& name)
    {
        std::string f = (!name.empty() && name[0] == '/') ? name : "/" + name;

        if (f == "/Fl") return "/FlateDecode";
        if (f == "/LZW") return "/LZWDecode";
        if (f == "/A85") return "/ASCII85Decode";
        if (f == "/AHx") return "/ASCIIHexDecode";
        if (f == "/RL") return "/RunLengthDecode";
        if (f == "/DCT") return "/DCTDecode";
        if (f == "/CCF") return "/CCITTFaxDecode";
        return f;
    }

    // ---------------------------------------------------------
    // FlateDecode (zlib, with raw deflate fallback)
    // ---------------------------------------------------------
    static bool inflateWith(const std::vector<uint8_t>& input, int windowBits,
        std::vector<uint8_t>& output)
    {
        z_stream strm{};
        strm.next_in = const_cast<Bytef*>(input.data());
        strm.avail_in = static_cast<uInt>(input.size());

        if (inflateInit2(&strm, windowBits) != Z_OK)
            return false;

        output.clear();
        output.reserve(input.size() * 3);

        const size_t CHUNK = 4096;
        uint8_t buffer[CHUNK];

        int ret = Z_OK;
        while (ret != Z_STREAM_END)
        {
            strm.next_out = buffer;
            strm.avail_out = CHUNK;

            ret = inflate(&strm, Z_NO_FLUSH);

            size_t produced = CHUNK - strm.avail_out;
            output.insert(output.end(), buffer, buffer + produced);

            if (ret == Z_BUF_ERROR && strm.avail_in == 0)
                break; // truncated stream: keep what we have
            if (ret != Z_OK && ret != Z_STREAM_END)
                break;
            if (output.size() > PdfFilters::MAX_DECODED_SIZE)
            {
                ret = Z_MEM_ERROR;
                break;
            }
        }

        inflateEnd(&strm);

        if (ret == Z_STREAM_END || (ret == Z_BUF_ERROR && !output.empty()))
            return true;

        // corrupt tail: partial output is still useful to the caller
        if (!output.empty() && ret == Z_DATA_ERROR)
        {
            LogDebug("FlateDecode: data error after %zu bytes, keeping partial output", output.size());
            return true;
        }
        return false;
    }

    bool PdfFilters::FlateDecode(const std::vector<uint8_t>& input,
        std::vector<uint8_t>& output)
    {
        output.clear();
        if (input.empty())
            return true;

        if (inflateWith(input, 15, output))
            return true;

        // some producers omit the zlib header
        if (inflateWith(input, -15, output))
        {
            LogDebug("FlateDecode: zlib header missing, raw deflate used");
            return true;
        }

        LogDebug("FlateDecode: failed on %zu input bytes", input.size());
        output.clear();
        return false;
    }

    // ---------------------------------------------------------
    // ASCII85Decode
    // ---------------------------------------------------------
    bool PdfFilters::ASCII85Decode(const std::vector<uint8_t>& input,
        std::vector<uint8_t>& output)
    {
        output.clear();
        uint32_t tuple = 0;
        int count = 0;

        size_t i = 0;
        // optional "<~" prefix
        if (input.size() >= 2 && input[0] == '<' && input[1] == '~')
            i = 2;

        for (; i < input.size(); ++i)
        {
            uint8_t ch = input[i];
            if (ch == '~')
                break;

            if (ch == 'z' && count == 0)
            {
                output.insert(output.end(), { 0, 0, 0, 0 });
                continue;
            }

            if (ch < '!' || ch > 'u')
                continue;

            tuple = tuple * 85 + (ch - '!');
            if (++count == 5)
            {
                output.push_back(static_cast<uint8_t>(tuple >> 24));
                output.push_back(static_cast<uint8_t>(tuple >> 16));
                output.push_back(static_cast<uint8_t>(tuple >> 8));
                output.push_back(static_cast<uint8_t>(tuple));
                tuple = 0;
                count = 0;
            }
        }

        // partial final group is padded with 'u'
        if (count > 1)
        {
            for (int k = count; k < 5; k++)
                tuple = tuple * 85 + 84;
            for (int k = 0; k < count - 1; k++)
                output.push_back(static_cast<uint8_t>(tuple >> (24 - 8 * k)));
        }

        return true;
    }

    // ---------------------------------------------------------
    // ASCIIHexDecode
    // ---------------------------------------------------------
    bool PdfFilters::ASCIIHexDecode(const std::vector<uint8_t>& input,
        std::vector<uint8_t>& output)
    {
        output.clear();
        int pending = -1;
        for (uint8_t c : input)
        {
            if (c == '>')
                break;

            int v;
            if (c >= '0' && c <= '9') v = c - '0';
            else if (c >= 'a' && c <= 'f') v = c - 'a' + 10;
            else if (c >= 'A' && c <= 'F') v = c - 'A' + 10;
            else continue;

            if (pending < 0)
            {
                pending = v;
            }
            else
            {
                output.push_back(static_cast<uint8_t>((pending << 4) | v));
                pending = -1;
            }
        }
        if (pending >= 0)
            output.push_back(static_cast<uint8_t>(pending << 4));
        return true;
    }

    // ---------------------------------------------------------
    // RunLengthDecode
    // ---------------------------------------------------------
    bool PdfFilters::RunLengthDecode(const std::vector<uint8_t>& input,
        std::vector<uint8_t>& output)
    {
        output.clear();
        size_t i = 0;

        while (i < input.size())
        {
            uint8_t len = input[i++];
            if (len == 128)
                break;

            if (len < 128)
            {
                size_t count = len + 1u;
                if (i + count > input.size())
                    count = input.size() - i;
                output.insert(output.end(), input.begin() + i, input.begin() + i + count);
                i += count;
            }
            else
            {
                if (i >= input.size())
                    break;
                output.insert(output.end(), 257u - len, input[i++]);
            }
        }

        return true;
    }

    // ---------------------------------------------------------
    // LZWDecode
    // ---------------------------------------------------------
    class LZWDecoder
    {
    public:
        explicit LZWDecoder(int earlyChange) : _earlyChange(earlyChange ? 1 : 0) {}

        bool decode(const std::vector<uint8_t>& input, std::vector<uint8_t>& out)
        {
            out.clear();
            _data = &input;
            _bitBuf = 0;
            _bitCount = 0;
            _bytePos = 0;
            resetTable();

            int prevCode = -1;
            while (true)
            {
                int code = readCode();
                if (code < 0 || code == EOD)
                    break;
                if (code == CLEAR)
                {
                    resetTable();
                    prevCode = -1;
                    continue;
                }

                if (prevCode < 0)
                {
                    if (code > 255)
                        return false;
                    emit(code, out);
                    prevCode = code;
                    continue;
                }

                uint8_t first;
                if (code < _nextCode)
                {
                    first = emit(code, out);
                }
                else if (code == _nextCode)
                {
                    // KwKwK case
                    first = emit(prevCode, out);
                    out.push_back(first);
                }
                else
                {
                    LogDebug("LZWDecode: code %d beyond table (%d)", code, _nextCode);
                    return !out.empty();
                }

                addEntry(prevCode, first);
                prevCode = code;

                if (out.size() > PdfFilters::MAX_DECODED_SIZE)
                    return false;
            }
            return true;
        }

    private:
        static constexpr int CLEAR = 256;
        static constexpr int EOD = 257;
        static constexpr int MAX_CODES = 4096;

        void resetTable()
        {
            _prefix.assign(MAX_CODES, -1);
            _suffix.assign(MAX_CODES, 0);
            _length.assign(MAX_CODES, 1);
            for (int i = 0; i < 256; ++i)
                _suffix[i] = static_cast<uint8_t>(i);
            _nextCode = 258;
            _bits = 9;
        }

        void addEntry(int prefix, uint8_t byte)
        {
            if (_nextCode >= MAX_CODES)
                return;
            _prefix[_nextCode] = prefix;
            _suffix[_nextCode] = byte;
            _length[_nextCode] = _length[prefix] + 1;
            ++_nextCode;

            if (_nextCode + _earlyChange >= (1 << _bits) && _bits < 12)
                ++_bits;
        }

        // Writes the string for code, returns its first byte
        uint8_t emit(int code, std::vector<uint8_t>& out)
        {
            size_t len = static_cast<size_t>(_length[code]);
            size_t start = out.size();
            out.resize(start + len);
            int c = code;
            for (size_t k = len; k-- > 0;)
            {
                out[start + k] = _suffix[c];
                c = _prefix[c];
            }
            return out[start];
        }

        int readCode()
        {
            while (_bitCount < _bits)
            {
                if (_bytePos >= _data->size())
                    return -1;
                _bitBuf = (_bitBuf << 8) | (*_data)[_bytePos++];
                _bitCount += 8;
            }
            int code = static_cast<int>((_bitBuf >> (_bitCount - _bits)) & ((1u << _bits) - 1));
            _bitCount -= _bits;
            return code;
        }

        const std::vector<uint8_t>* _data = nullptr;
        uint32_t _bitBuf = 0;
        int _bitCount = 0;
        size_t _bytePos = 0;
        int _bits = 9;
        int _nextCode = 258;
        int _earlyChange = 1;
        std::vector<int> _prefix;
        std::vector<uint8_t> _suffix;
        std::vector<int> _length;
    };

    bool PdfFilters::LZWDecode(const std::vector<uint8_t>& input,
        std::vector<uint8_t>& output,
        int earlyChange)
    {
        LZWDecoder dec(earlyChange);
        return dec.decode(input, output);
    }

    // ---------------------------------------------------------
    // JPEGDecode (DCTDecode)
    // ---------------------------------------------------------
    namespace
    {
        struct JpegErrorManager
        {
            jpeg_error_mgr pub;
            jmp_buf jump;
        };

        void jpegErrorExit(j_common_ptr cinfo)
        {
            auto* mgr = reinterpret_cast<JpegErrorManager*>(cinfo->err);
            char msg[JMSG_LENGTH_MAX];
            (*cinfo->err->format_message)(cinfo, msg);
            LogDebug("JPEGDecode: %s", msg);
            longjmp(mgr->jump, 1);
        }

        void jpegSilence(j_common_ptr, int) {}
    }

    bool PdfFilters::JPEGDecode(const std::vector<uint8_t>& input,
        std::vector<uint8_t>& samples,
        int& width,
        int& height,
        int& components)
    {
        if (input.empty())
            return false;

        jpeg_decompress_struct cinfo;
        JpegErrorManager jerr;

        cinfo.err = jpeg_std_error(&jerr.pub);
        jerr.pub.error_exit = jpegErrorExit;
        jerr.pub.emit_message = jpegSilence;

        if (setjmp(jerr.jump))
        {
            jpeg_destroy_decompress(&cinfo);
            return false;
        }

        jpeg_create_decompress(&cinfo);
        jpeg_mem_src(&cinfo, const_cast<unsigned char*>(input.data()),
            static_cast<unsigned long>(input.size()));

        if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK)
        {
            jpeg_destroy_decompress(&cinfo);
            return false;
        }

        // keep CMYK/YCCK as CMYK; libjpeg converts YCbCr to RGB
        if (cinfo.jpeg_color_space == JCS_YCCK || cinfo.jpeg_color_space == JCS_CMYK)
            cinfo.out_color_space = JCS_CMYK;

        jpeg_start_decompress(&cinfo);

        width = static_cast<int>(cinfo.output_width);
        height = static_cast<int>(cinfo.output_height);
        components = cinfo.output_components;

        const size_t stride = static_cast<size_t>(width) * components;
        samples.assign(stride * height, 0);

        while (cinfo.output_scanline < cinfo.output_height)
        {
            JSAMPROW rowPtr = samples.data() + stride * cinfo.output_scanline;
            jpeg_read_scanlines(&cinfo, &rowPtr, 1);
        }

        bool invertCmyk = components == 4 && cinfo.saw_Adobe_marker;

        jpeg_finish_decompress(&cinfo);
        jpeg_destroy_decompress(&cinfo);

        if (invertCmyk)
        {
            for (uint8_t& v : samples)
                v = static_cast<uint8_t>(255 - v);
        }

        return width > 0 && height > 0;
    }

    // ---------------------------------------------------------
    // JPEG2000Decode (JPXDecode) - OpenJPEG
    // ---------------------------------------------------------

#ifdef PDFRASTER_HAVE_OPENJPEG
    namespace
    {
        struct OpjMemStream
        {
            const uint8_t* data;
            size_t size;
            size_t pos;
        };

        OPJ_SIZE_T opjMemRead(void* buffer, OPJ_SIZE_T nbBytes, void* user)
        {
            auto* s = static_cast<OpjMemStream*>(user);
            OPJ_SIZE_T remaining = s->size - s->pos;
            OPJ_SIZE_T toRead = nbBytes < remaining ? nbBytes : remaining;
            if (toRead == 0)
                return static_cast<OPJ_SIZE_T>(-1);
            std::memcpy(buffer, s->data + s->pos, toRead);
            s->pos += toRead;
            return toRead;
        }

        OPJ_OFF_T opjMemSkip(OPJ_OFF_T nbBytes, void* user)
        {
            auto* s = static_cast<OpjMemStream*>(user);
            if (nbBytes < 0)
                return -1;
            OPJ_SIZE_T remaining = s->size - s->pos;
            OPJ_SIZE_T toSkip = static_cast<OPJ_SIZE_T>(nbBytes) < remaining
                ? static_cast<OPJ_SIZE_T>(nbBytes) : remaining;
            s->pos += toSkip;
            return static_cast<OPJ_OFF_T>(toSkip);
        }

        OPJ_BOOL opjMemSeek(OPJ_OFF_T nbBytes, void* user)
        {
            auto* s = static_cast<OpjMemStream*>(user);
            if (nbBytes < 0 || static_cast<OPJ_SIZE_T>(nbBytes) > s->size)
                return OPJ_FALSE;
            s->pos = static_cast<size_t>(nbBytes);
            return OPJ_TRUE;
        }
    }
#endif

    bool PdfFilters::JPEG2000Decode(const std::vector<uint8_t>& input,
        std::vector<uint8_t>& samples,
        int& width,
        int& height,
        int& components)
    {
        if (input.empty())
            return false;

#ifdef PDFRASTER_HAVE_OPENJPEG
        // JP2 container unless the data starts with a raw codestream (FF4F)
        OPJ_CODEC_FORMAT codecFormat = OPJ_CODEC_JP2;
        if (input.size() >= 2 && input[0] == 0xFF && input[1] == 0x4F)
            codecFormat = OPJ_CODEC_J2K;

        opj_codec_t* codec = opj_create_decompress(codecFormat);
        if (!codec)
            return false;

        opj_dparameters_t params;
        opj_set_default_decoder_parameters(&params);
        if (!opj_setup_decoder(codec, &params))
        {
            opj_destroy_codec(codec);
            return false;
        }

        OpjMemStream memStream{ input.data(), input.size(), 0 };

        opj_stream_t* stream = opj_stream_create(input.size(), OPJ_TRUE);
        if (!stream)
        {
            opj_destroy_codec(codec);
            return false;
        }

        opj_stream_set_user_data(stream, &memStream, nullptr);
        opj_stream_set_user_data_length(stream, input.size());
        opj_stream_set_read_function(stream, opjMemRead);
        opj_stream_set_skip_function(stream, opjMemSkip);
        opj_stream_set_seek_function(stream, opjMemSeek);

        opj_image_t* image = nullptr;
        bool ok = opj_read_header(stream, codec, &image) && opj_decode(codec, stream, image);
        if (ok)
        {
            width = static_cast<int>(image->x1 - image->x0);
            height = static_cast<int>(image->y1 - image->y0);
            ok = width > 0 && height > 0 && image->numcomps >= 1;
        }

        if (ok)
        {
            int numComps = static_cast<int>(image->numcomps);
            bool isYCC = image->color_space == OPJ_CLRSPC_SYCC ||
                image->color_space == OPJ_CLRSPC_EYCC;

            components = numComps >= 4 ? 4 : (numComps >= 3 ? 3 : 1);
            samples.assign(static_cast<size_t>(width) * height * components, 0);

            auto getComp = [&](int comp, int x, int y) -> int {
                const opj_image_comp_t& c = image->comps[comp];
                int cx = c.dx > 1 ? x / static_cast<int>(c.dx) : x;
                int cy = c.dy > 1 ? y / static_cast<int>(c.dy) : y;
                cx = std::min(cx, static_cast<int>(c.w) - 1);
                cy = std::min(cy, static_cast<int>(c.h) - 1);
                int val = c.data[cy * static_cast<int>(c.w) + cx];
                if (c.sgnd)
                    val += 1 << (c.prec - 1);
                if (c.prec > 8) val >>= (c.prec - 8);
                else if (c.prec < 8) val <<= (8 - c.prec);
                return std::min(255, std::max(0, val));
            };

            for (int y = 0; y < height; y++)
            {
                for (int x = 0; x < width; x++)
                {
                    uint8_t* dst = &samples[(static_cast<size_t>(y) * width + x) * components];
                    if (components == 1)
                    {
                        dst[0] = static_cast<uint8_t>(getComp(0, x, y));
                        continue;
                    }
                    if (isYCC)
                    {
                        int Y = getComp(0, x, y);
                        int Cb = getComp(1, x, y) - 128;
                        int Cr = getComp(2, x, y) - 128;
                        dst[0] = static_cast<uint8_t>(std::min(255, std::max(0, static_cast<int>(Y + 1.402 * Cr + 0.5))));
                        dst[1] = static_cast<uint8_t>(std::min(255, std::max(0, static_cast<int>(Y - 0.344136 * Cb - 0.714136 * Cr + 0.5))));
                        dst[2] = static_cast<uint8_t>(std::min(255, std::max(0, static_cast<int>(Y + 1.772 * Cb + 0.5))));
                    }
                    else
                    {
                        for (int c = 0; c < std::min(components, 3); ++c)
                            dst[c] = static_cast<uint8_t>(getComp(c, x, y));
                    }
                    if (components == 4)
                        dst[3] = static_cast<uint8_t>(getComp(3, x, y));
                }
            }
        }

        if (image)
            opj_image_destroy(image);
        opj_stream_destroy(stream);
        opj_destroy_codec(codec);

        if (!ok)
            LogDebug("JPEG2000Decode: OpenJPEG failed on %zu bytes", input.size());
        return ok;
#else
        (void)samples;
        (void)width;
        (void)height;
        (void)components;
        LogDebug("JPEG2000Decode: built without OpenJPEG, %zu bytes skipped", input.size());
        return false;
#endif
    }

    // ---------------------------------------------------------
    // ApplyPredictor - TIFF / PNG
    // ---------------------------------------------------------
    bool PdfFilters::ApplyPredictor(const PdfFilterParams& params,
        std::vector<uint8_t>& data)
    {
        if (params.predictor <= 1)
            return true;

        const int colors = std::max(1, params.colors);
        const int bpc = std::max(1, params.bitsPerComponent);
        const int columns = std::max(1, params.columns);

        const int bytesPerPixel = std::max(1, (colors * bpc + 7) / 8);
        const size_t rowSize = (static_cast<size_t>(colors) * bpc * columns + 7) / 8;

        if (params.predictor == 2)
        {
            if (bpc != 8)
            {
                LogDebug("ApplyPredictor: TIFF predictor with %d bpc not supported", bpc);
                return false;
            }
            size_t numRows = data.size() / rowSize;
            for (size_t row = 0; row < numRows; row++)
            {
                uint8_t* rowPtr = &data[row * rowSize];
                for (size_t x = bytesPerPixel; x < rowSize; x++)
                    rowPtr[x] = static_cast<uint8_t>(rowPtr[x] + rowPtr[x - bytesPerPixel]);
            }
            return true;
        }

        if (params.predictor < 10)
            return true;

        std::vector<uint8_t> out;
        out.reserve(data.size());

        std::vector<uint8_t> prevRow(rowSize, 0);
        std::vector<uint8_t> decoded(rowSize, 0);

        size_t i = 0;
        while (i < data.size())
        {
            uint8_t filterType = data[i++];

            size_t avail = std::min(rowSize, data.size() - i);
            const uint8_t* row = &data[i];
            i += avail;

            std::fill(decoded.begin(), decoded.end(), 0);

            for (size_t x = 0; x < avail; x++)
            {
                int left = x >= static_cast<size_t>(bytesPerPixel) ? decoded[x - bytesPerPixel] : 0;
                int up = prevRow[x];
                int upLeft = x >= static_cast<size_t>(bytesPerPixel) ? prevRow[x - bytesPerPixel] : 0;

                int pred = 0;
                switch (filterType)
                {
                case 0: pred = 0; break;
                case 1: pred = left; break;
                case 2: pred = up; break;
                case 3: pred = (left + up) >> 1; break;
                case 4:
                {
                    int p = left + up - upLeft;
                    int pa = std::abs(p - left);
                    int pb = std::abs(p - up);
                    int pc = std::abs(p - upLeft);
                    pred = (pa <= pb && pa <= pc) ? left : (pb <= pc ? up : upLeft);
                    break;
                }
                default: pred = 0; break;
                }
                decoded[x] = static_cast<uint8_t>(row[x] + pred);
            }

            out.insert(out.end(), decoded.begin(), decoded.begin() + avail);
            prevRow = decoded;
        }

        data.swap(out);
        return true;
    }

    // ---------------------------------------------------------
    // Filter chain
    // ---------------------------------------------------------
    bool PdfFilters::Decode(
        const std::vector<uint8_t>& input,
        const std::vector<std::string>& filters,
        const std::vector<PdfFilterParams>& params,
        std::vector<uint8_t>& output,
        std::string* imageCodec)
    {
        std::vector<uint8_t> data = input;
        if (imageCodec)
            imageCodec->clear();

        for (size_t i = 0; i < filters.size(); i++)
        {
            std::string f = NormalizeFilterName(filters[i]);
            PdfFilterParams p = i < params.size() ? params[i] : PdfFilterParams{};

            std::vector<uint8_t> temp;
            bool ok = true;

            if (f == "/FlateDecode")
            {
                ok = FlateDecode(data, temp) && ApplyPredictor(p, temp);
            }
            else if (f == "/LZWDecode")
            {
                ok = LZWDecode(data, temp, p.earlyChange) && ApplyPredictor(p, temp);
            }
            else if (f == "/ASCII85Decode")
            {
                ok = ASCII85Decode(data, temp);
            }
            else if (f == "/ASCIIHexDecode")
            {
                ok = ASCIIHexDecode(data, temp);
            }
            else if (f == "/RunLengthDecode")
            {
                ok = RunLengthDecode(data, temp);
            }
            else if (f == "/DCTDecode" || f == "/JPXDecode" ||
                f == "/CCITTFaxDecode" || f == "/JBIG2Decode")
            {
                if (imageCodec)
                {
                    *imageCodec = f;
                    output.swap(data);
                    return true;
                }
                LogDebug("PdfFilters::Decode: image codec %s in a non-image stream", f.c_str());
                return false;
            }
            else if (f == "/Crypt")
            {
                // Identity crypt filter
                temp.swap(data);
            }
            else
            {
                LogDebug("PdfFilters::Decode: unknown filter %s", f.c_str());
                return false;
            }

            if (!ok)
            {
                LogDebug("PdfFilters::Decode: %s failed", f.c_str());
                return false;
            }
            data.swap(temp);
        }

        output.swap(data);
        return true;
    }
}
