#pragma once
#include <string>
#include <vector>

namespace pdfraster
{
    enum class PdfErrorCode
    {
        None,

        // fatal to the document
        MalformedDocument,
        CyclicPageTree,

        // request-level
        DanglingReference,
        PageIndexOutOfRange,
        UndefinedResource,
        UndefinedGlyph,

        // render service
        RenderPageFault,
        RenderGlyphFault,
        RenderBackendFault,
        Cancelled,

        // recoverable page diagnostics
        BadOperator,
        UnbalancedRestore,
        UnsupportedFeature,
        ImageDecodeFailed
    };

    inline const char* PdfErrorCodeName(PdfErrorCode code)
    {
        switch (code)
        {
        case PdfErrorCode::None: return "None";
        case PdfErrorCode::MalformedDocument: return "MalformedDocument";
        case PdfErrorCode::CyclicPageTree: return "CyclicPageTree";
        case PdfErrorCode::DanglingReference: return "DanglingReference";
        case PdfErrorCode::PageIndexOutOfRange: return "PageIndexOutOfRange";
        case PdfErrorCode::UndefinedResource: return "UndefinedResource";
        case PdfErrorCode::UndefinedGlyph: return "UndefinedGlyph";
        case PdfErrorCode::RenderPageFault: return "RenderPageFault";
        case PdfErrorCode::RenderGlyphFault: return "RenderGlyphFault";
        case PdfErrorCode::RenderBackendFault: return "RenderBackendFault";
        case PdfErrorCode::Cancelled: return "Cancelled";
        case PdfErrorCode::BadOperator: return "BadOperator";
        case PdfErrorCode::UnbalancedRestore: return "UnbalancedRestore";
        case PdfErrorCode::UnsupportedFeature: return "UnsupportedFeature";
        case PdfErrorCode::ImageDecodeFailed: return "ImageDecodeFailed";
        }
        return "Unknown";
    }

    struct PdfError
    {
        PdfErrorCode code = PdfErrorCode::None;
        std::string message;

        bool ok() const { return code == PdfErrorCode::None; }

        void set(PdfErrorCode c, const std::string& msg)
        {
            code = c;
            message = msg;
        }

        void clear()
        {
            code = PdfErrorCode::None;
            message.clear();
        }
    };

    // A recoverable problem met while building a page
    struct PdfDiagnostic
    {
        PdfErrorCode code = PdfErrorCode::None;
        std::string message;
    };

    using PdfDiagnostics = std::vector<PdfDiagnostic>;
}
