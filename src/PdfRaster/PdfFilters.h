#pragma once
#include <vector>
#include <string>
#include <cstdint>

namespace pdfraster
{
    // /DecodeParms entries the stream filters understand
    struct PdfFilterParams
    {
        int predictor = 1;
        int colors = 1;
        int bitsPerComponent = 8;
        int columns = 1;
        int earlyChange = 1;
    };

    class PdfFilters
    {
    public:
        static bool FlateDecode(const std::vector<uint8_t>& input,
            std::vector<uint8_t>& output);

        static bool ASCII85Decode(const std::vector<uint8_t>& input,
            std::vector<uint8_t>& output);

        static bool ASCIIHexDecode(const std::vector<uint8_t>& input,
            std::vector<uint8_t>& output);

        static bool RunLengthDecode(const std::vector<uint8_t>& input,
            std::vector<uint8_t>& output);

        static bool LZWDecode(const std::vector<uint8_t>& input,
            std::vector<uint8_t>& output,
            int earlyChange = 1);

        // Raw interleaved samples, 8 bits each. Adobe-inverted CMYK is
        // normalized so 0 means no ink.
        static bool JPEGDecode(const std::vector<uint8_t>& input,
            std::vector<uint8_t>& samples,
            int& width,
            int& height,
            int& components);

        // YCC is converted to RGB; components is 1, 3 or 4
        static bool JPEG2000Decode(const std::vector<uint8_t>& input,
            std::vector<uint8_t>& samples,
            int& width,
            int& height,
            int& components);

        // TIFF predictor 2 and PNG predictors 10-15, in place
        static bool ApplyPredictor(const PdfFilterParams& params,
            std::vector<uint8_t>& data);

        // Image codecs end a chain: their input is returned untouched
        // and the codec name stored in imageCodec ("/DCTDecode" ...).
        static bool Decode(const std::vector<uint8_t>& input,
            const std::vector<std::string>& filters,
            const std::vector<PdfFilterParams>& params,
            std::vector<uint8_t>& output,
            std::string* imageCodec = nullptr);

        // Accepts abbreviations used by inline images (/Fl, /AHx ...)
        static std::string NormalizeFilterName(const std::string& name);

        static constexpr size_t MAX_DECODED_SIZE = size_t(1) << 30;
    };
}
