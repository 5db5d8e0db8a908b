#pragma once
#include <memory>
#include <string>
#include <vector>

#include "PdfObject.h"
#include "PdfError.h"

namespace pdfraster
{
    class PdfDocument;
    struct PdfPage;

    enum class ResourceCategory
    {
        Font,
        XObject,
        ColorSpace,
        Pattern,
        Shading,
        ExtGState,
        Properties
    };

    const char* ResourceCategoryKey(ResourceCategory category);

    // Resource dictionaries in lookup order, nearest first. For a page
    // that is its own /Resources followed by each ancestor's; a form
    // XObject or pattern puts its own dictionary in front.
    class PdfResources
    {
    public:
        PdfResources() = default;
        PdfResources(const PdfDocument& doc, const PdfPage& page);

        // Scope for a form or pattern; null keeps the enclosing chain
        PdfResources withLocal(const std::shared_ptr<PdfDictionary>& local) const;

        // The category dictionary of the nearest scope that defines one
        std::shared_ptr<PdfDictionary> categoryDict(ResourceCategory category) const;

        // Fails with UndefinedResource
        bool resource(ResourceCategory category, const std::string& name,
            PdfObjectPtr& out, PdfError& err) const;

        const PdfDocument* document() const { return _doc; }
        size_t depth() const { return _chain.size(); }

    private:
        const PdfDocument* _doc = nullptr;
        std::vector<std::shared_ptr<PdfDictionary>> _chain;
    };

    // resource(page, category, name)
    bool ResolveResource(const PdfDocument& doc, const PdfPage& page,
        ResourceCategory category, const std::string& name,
        PdfObjectPtr& out, PdfError& err);
}
