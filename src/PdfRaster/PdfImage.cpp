#include "PdfImage.h"
#include "PdfDocument.h"
#include "PdfResources.h"
#include "PdfFilters.h"
#include "PdfDebug.h"

#include <algorithm>
#include <cmath>
#include <new>

namespace pdfraster
{
    namespace
    {
        // Samples of one image stream after the filter chain
        struct Raster
        {
            int width = 0;
            int height = 0;
            int bpc = 8;
            int codecComponents = 0; // set when DCT/JPX produced the samples
            std::vector<uint8_t> data;
        };

        class SampleReader
        {
        public:
            SampleReader(const std::vector<uint8_t>& data, int bpc)
                : _data(data), _bpc(bpc)
            {
            }

            void seekByte(size_t offset) { _bit = offset * 8; }

            uint32_t next()
            {
                if (_bpc == 8)
                {
                    size_t i = _bit >> 3;
                    _bit += 8;
                    return i < _data.size() ? _data[i] : 0;
                }
                if (_bpc == 16)
                {
                    size_t i = _bit >> 3;
                    _bit += 16;
                    if (i + 1 >= _data.size())
                        return 0;
                    return (static_cast<uint32_t>(_data[i]) << 8) | _data[i + 1];
                }

                uint32_t v = 0;
                for (int b = 0; b < _bpc; ++b)
                {
                    size_t i = _bit >> 3;
                    int shift = 7 - static_cast<int>(_bit & 7);
                    uint32_t bit = i < _data.size() ? (_data[i] >> shift) & 1u : 0u;
                    v = (v << 1) | bit;
                    ++_bit;
                }
                return v;
            }

        private:
            const std::vector<uint8_t>& _data;
            int _bpc;
            size_t _bit = 0;
        };

        uint8_t toByte(double v)
        {
            return static_cast<uint8_t>(std::lround(std::min(1.0, std::max(0.0, v)) * 255.0));
        }

        bool isValidBpc(int bpc)
        {
            return bpc == 1 || bpc == 2 || bpc == 4 || bpc == 8 || bpc == 16;
        }

        bool loadRaster(const PdfDocument& doc, const std::shared_ptr<PdfStream>& stream,
            bool isMask, Raster& r, PdfError& err)
        {
            const auto& dict = stream->dict;
            r.width = static_cast<int>(doc.getNumberOr(dict, "/Width", 0));
            r.height = static_cast<int>(doc.getNumberOr(dict, "/Height", 0));
            r.bpc = isMask ? 1 : static_cast<int>(doc.getNumberOr(dict, "/BitsPerComponent", 8));

            if (r.width <= 0 || r.height <= 0)
            {
                err.set(PdfErrorCode::ImageDecodeFailed, "image without /Width or /Height");
                return false;
            }
            if (static_cast<int64_t>(r.width) * r.height > PdfImageDecoder::MAX_IMAGE_PIXELS)
            {
                err.set(PdfErrorCode::ImageDecodeFailed, "image dimensions too large");
                return false;
            }

            std::string codec;
            if (!doc.decodeStream(stream, r.data, &codec))
            {
                err.set(PdfErrorCode::ImageDecodeFailed, "image stream failed to decode");
                return false;
            }

            if (codec.empty())
                return true;

            if (codec == "/CCITTFaxDecode" || codec == "/JBIG2Decode")
            {
                err.set(PdfErrorCode::UnsupportedFeature, codec.substr(1) + " images are not supported");
                return false;
            }

            std::vector<uint8_t> samples;
            int w = 0;
            int h = 0;
            int comps = 0;
            bool ok = codec == "/DCTDecode"
                ? PdfFilters::JPEGDecode(r.data, samples, w, h, comps)
                : PdfFilters::JPEG2000Decode(r.data, samples, w, h, comps);
            if (!ok)
            {
                err.set(PdfErrorCode::ImageDecodeFailed, codec.substr(1) + " data could not be decoded");
                return false;
            }

            // the codec's own header is authoritative
            r.width = w;
            r.height = h;
            r.bpc = 8;
            r.codecComponents = comps;
            r.data.swap(samples);
            return true;
        }

        // Alpha plane of an /SMask or stencil /Mask, sampled to w x h
        bool loadMaskPlane(const PdfDocument& doc, const std::shared_ptr<PdfStream>& stream,
            bool stencil, int w, int h, std::vector<uint8_t>& alpha, PdfError& err)
        {
            Raster r;
            if (!loadRaster(doc, stream, stencil, r, err))
                return false;
            if (r.codecComponents > 1)
            {
                err.set(PdfErrorCode::ImageDecodeFailed, "soft mask is not single-channel");
                return false;
            }
            if (!isValidBpc(r.bpc))
            {
                err.set(PdfErrorCode::ImageDecodeFailed, "mask has unsupported bit depth");
                return false;
            }

            auto decode = doc.numbers(doc.getArray(stream->dict, "/Decode"));
            double d0 = decode.size() >= 2 ? decode[0] : 0.0;
            double d1 = decode.size() >= 2 ? decode[1] : 1.0;
            double maxv = std::ldexp(1.0, r.bpc) - 1.0;

            size_t stride = (static_cast<size_t>(r.width) * r.bpc + 7) / 8;
            std::vector<uint8_t> plane(static_cast<size_t>(r.width) * r.height);
            SampleReader reader(r.data, r.bpc);
            for (int y = 0; y < r.height; ++y)
            {
                reader.seekByte(stride * y);
                for (int x = 0; x < r.width; ++x)
                {
                    double v = d0 + reader.next() * (d1 - d0) / maxv;
                    // stencil: 0 shows the image, 1 masks it out
                    plane[static_cast<size_t>(y) * r.width + x] = stencil
                        ? (v < 0.5 ? 255 : 0)
                        : toByte(v);
                }
            }

            alpha.resize(static_cast<size_t>(w) * h);
            for (int y = 0; y < h; ++y)
            {
                int sy = std::min(r.height - 1, static_cast<int>((y + 0.5) * r.height / h));
                for (int x = 0; x < w; ++x)
                {
                    int sx = std::min(r.width - 1, static_cast<int>((x + 0.5) * r.width / w));
                    alpha[static_cast<size_t>(y) * w + x] = plane[static_cast<size_t>(sy) * r.width + sx];
                }
            }
            return true;
        }
    }

    bool PdfImageDecoder::Decode(const PdfDocument& doc,
        const PdfResources& resources,
        const std::shared_ptr<PdfStream>& stream,
        const PdfRGB& fillColor,
        PdfImagePtr& out,
        PdfError& err)
    {
        if (!stream || !stream->dict)
        {
            err.set(PdfErrorCode::ImageDecodeFailed, "image is not a stream");
            return false;
        }
        const auto& dict = stream->dict;

        bool isMask = false;
        if (auto b = std::dynamic_pointer_cast<PdfBoolean>(doc.get(dict, "/ImageMask")))
            isMask = b->value;

        Raster raster;
        if (!loadRaster(doc, stream, isMask, raster, err))
            return false;

        PdfColorSpacePtr cs;
        if (!isMask)
        {
            auto csObj = doc.get(dict, "/ColorSpace");
            std::string why;
            if (!IsNull(csObj))
                cs = PdfColorSpace::Parse(doc, &resources, csObj, why);

            if (raster.codecComponents > 0 && (!cs || cs->components() != raster.codecComponents))
            {
                if (raster.codecComponents == 1)
                    cs = PdfColorSpace::Device(PdfColorSpaceKind::DeviceGray);
                else if (raster.codecComponents == 4)
                    cs = PdfColorSpace::Device(PdfColorSpaceKind::DeviceCMYK);
                else
                    cs = PdfColorSpace::Device(PdfColorSpaceKind::DeviceRGB);
            }

            if (!cs || cs->kind == PdfColorSpaceKind::Pattern)
            {
                err.set(PdfErrorCode::ImageDecodeFailed,
                    "image colour space unusable" + (why.empty() ? std::string() : ": " + why));
                return false;
            }
        }

        const int comps = isMask ? 1 : cs->components();
        const int bpc = raster.bpc;
        if (!isValidBpc(bpc) || comps <= 0)
        {
            err.set(PdfErrorCode::ImageDecodeFailed, "unsupported BitsPerComponent " + std::to_string(bpc));
            return false;
        }

        const int w = raster.width;
        const int h = raster.height;
        const size_t stride = (static_cast<size_t>(w) * comps * bpc + 7) / 8;
        auto image = std::make_shared<PdfImage>();
        try
        {
            if (raster.data.size() < stride * h)
            {
                LogDebug("PdfImage: %zu of %zu bytes present, padding", raster.data.size(), stride * h);
                raster.data.resize(stride * h, 0);
            }
            image->rgba.resize(static_cast<size_t>(w) * h * 4);
        }
        catch (const std::bad_alloc&)
        {
            err.set(PdfErrorCode::ImageDecodeFailed,
                "cannot allocate a " + std::to_string(w) + "x" + std::to_string(h) + " image");
            return false;
        }

        const double maxv = std::ldexp(1.0, bpc) - 1.0;

        std::vector<double> decode = doc.numbers(doc.getArray(dict, "/Decode"));
        if (decode.size() < static_cast<size_t>(comps) * 2)
            decode = isMask ? std::vector<double>{ 0.0, 1.0 } : cs->defaultDecode(bpc);

        // colour-key masking on raw sample values
        std::vector<double> colorKey;
        auto maskObj = doc.get(dict, "/Mask");
        if (auto keyArr = AsArray(maskObj))
        {
            colorKey = doc.numbers(keyArr);
            if (colorKey.size() < static_cast<size_t>(comps) * 2)
                colorKey.clear();
        }

        image->width = w;
        image->height = h;
        if (auto b = std::dynamic_pointer_cast<PdfBoolean>(doc.get(dict, "/Interpolate")))
            image->interpolate = b->value;

        SampleReader reader(raster.data, bpc);
        std::vector<uint32_t> raw(comps);
        std::vector<double> values(comps);

        // single-component images of up to 8 bits go through a table
        std::vector<PdfRGB> table;
        if (!isMask && comps == 1 && bpc <= 8)
        {
            table.resize(static_cast<size_t>(maxv) + 1);
            for (size_t v = 0; v < table.size(); ++v)
            {
                double d = decode[0] + v * (decode[1] - decode[0]) / maxv;
                cs->toRGB(&d, 1, table[v]);
            }
        }

        const uint8_t fr = toByte(fillColor.r);
        const uint8_t fg = toByte(fillColor.g);
        const uint8_t fb = toByte(fillColor.b);
        const bool maskPaintsOnes = isMask && decode[0] > decode[1];

        for (int y = 0; y < h; ++y)
        {
            reader.seekByte(stride * y);
            uint8_t* px = image->rgba.data() + static_cast<size_t>(y) * w * 4;
            for (int x = 0; x < w; ++x, px += 4)
            {
                for (int c = 0; c < comps; ++c)
                    raw[c] = reader.next();

                if (isMask)
                {
                    bool paint = (raw[0] != 0) == maskPaintsOnes;
                    px[0] = fr;
                    px[1] = fg;
                    px[2] = fb;
                    px[3] = paint ? 255 : 0;
                    continue;
                }

                PdfRGB rgb;
                if (!table.empty())
                {
                    rgb = table[raw[0]];
                }
                else
                {
                    for (int c = 0; c < comps; ++c)
                        values[c] = decode[2 * c] + raw[c] * (decode[2 * c + 1] - decode[2 * c]) / maxv;
                    cs->toRGB(values.data(), values.size(), rgb);
                }

                uint8_t alpha = 255;
                if (!colorKey.empty())
                {
                    bool inKey = true;
                    for (int c = 0; c < comps && inKey; ++c)
                        inKey = raw[c] >= colorKey[2 * c] && raw[c] <= colorKey[2 * c + 1];
                    if (inKey)
                        alpha = 0;
                }

                px[0] = toByte(rgb.r);
                px[1] = toByte(rgb.g);
                px[2] = toByte(rgb.b);
                px[3] = alpha;
            }
        }

        if (!isMask)
        {
            std::shared_ptr<PdfStream> maskStream = doc.getStream(dict, "/SMask");
            bool stencil = false;
            if (!maskStream)
            {
                maskStream = AsStream(maskObj);
                stencil = maskStream != nullptr;
            }

            if (maskStream)
            {
                std::vector<uint8_t> alpha;
                PdfError maskErr;
                if (loadMaskPlane(doc, maskStream, stencil, w, h, alpha, maskErr))
                {
                    for (size_t i = 0; i < alpha.size(); ++i)
                    {
                        uint8_t& a = image->rgba[i * 4 + 3];
                        a = static_cast<uint8_t>((a * alpha[i] + 127) / 255);
                    }
                }
                else
                {
                    // the image still paints, unmasked
                    LogDebug("PdfImage: mask ignored: %s", maskErr.message.c_str());
                }
            }
        }

        out = image;
        return true;
    }

    std::shared_ptr<PdfStream> PdfImageDecoder::ExpandInline(const std::shared_ptr<PdfDictionary>& dict,
        const std::vector<uint8_t>& data)
    {
        static const std::pair<const char*, const char*> abbreviations[] = {
            { "/W", "/Width" },
            { "/H", "/Height" },
            { "/BPC", "/BitsPerComponent" },
            { "/CS", "/ColorSpace" },
            { "/F", "/Filter" },
            { "/DP", "/DecodeParms" },
            { "/IM", "/ImageMask" },
            { "/D", "/Decode" },
            { "/I", "/Interpolate" },
        };

        auto expanded = std::make_shared<PdfDictionary>();
        if (dict)
        {
            for (const auto& kv : dict->entries)
            {
                std::string key = kv.first;
                for (const auto& ab : abbreviations)
                {
                    if (key == ab.first)
                    {
                        key = ab.second;
                        break;
                    }
                }
                expanded->entries[key] = kv.second;
            }
        }
        return std::make_shared<PdfStream>(expanded, data);
    }
}
