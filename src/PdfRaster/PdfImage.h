#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "PdfObject.h"
#include "PdfColor.h"
#include "PdfError.h"

namespace pdfraster
{
    class PdfDocument;
    class PdfResources;

    // Decoded image, RGBA8 non-premultiplied, first row is the top of
    // the image (v = 1 of the unit square)
    struct PdfImage
    {
        int width = 0;
        int height = 0;
        std::vector<uint8_t> rgba;
        bool interpolate = false;
    };

    using PdfImagePtr = std::shared_ptr<const PdfImage>;

    class PdfImageDecoder
    {
    public:
        // Image XObject or expanded inline image. /ImageMask images are
        // painted with fillColor. Fails with ImageDecodeFailed, or with
        // UnsupportedFeature for CCITT/JBIG2 data.
        static bool Decode(const PdfDocument& doc,
            const PdfResources& resources,
            const std::shared_ptr<PdfStream>& stream,
            const PdfRGB& fillColor,
            PdfImagePtr& out,
            PdfError& err);

        // BI dictionary keys and abbreviated names expanded to their full
        // forms, packaged as a stream over the ID...EI bytes
        static std::shared_ptr<PdfStream> ExpandInline(const std::shared_ptr<PdfDictionary>& dict,
            const std::vector<uint8_t>& data);

        static constexpr int64_t MAX_IMAGE_PIXELS = int64_t(1) << 28;
    };
}
