#include "PdfResources.h"
#include "PdfDocument.h"

namespace pdfraster
{
    const char* ResourceCategoryKey(ResourceCategory category)
    {
        switch (category)
        {
        case ResourceCategory::Font: return "/Font";
        case ResourceCategory::XObject: return "/XObject";
        case ResourceCategory::ColorSpace: return "/ColorSpace";
        case ResourceCategory::Pattern: return "/Pattern";
        case ResourceCategory::Shading: return "/Shading";
        case ResourceCategory::ExtGState: return "/ExtGState";
        case ResourceCategory::Properties: return "/Properties";
        }
        return "";
    }

    PdfResources::PdfResources(const PdfDocument& doc, const PdfPage& page)
        : _doc(&doc)
    {
        for (const auto& node : page.ancestors)
        {
            auto res = doc.getDict(node, "/Resources");
            if (res)
                _chain.push_back(res);
        }
    }

    PdfResources PdfResources::withLocal(const std::shared_ptr<PdfDictionary>& local) const
    {
        PdfResources scoped;
        scoped._doc = _doc;
        if (local)
            scoped._chain.push_back(local);
        scoped._chain.insert(scoped._chain.end(), _chain.begin(), _chain.end());
        return scoped;
    }

    std::shared_ptr<PdfDictionary> PdfResources::categoryDict(ResourceCategory category) const
    {
        if (!_doc)
            return nullptr;

        const char* key = ResourceCategoryKey(category);
        for (const auto& res : _chain)
        {
            auto dict = _doc->getDict(res, key);
            if (dict)
                return dict;
        }
        return nullptr;
    }

    bool PdfResources::resource(ResourceCategory category, const std::string& name,
        PdfObjectPtr& out, PdfError& err) const
    {
        std::string key = (!name.empty() && name[0] == '/') ? name : "/" + name;

        // The nearest category dictionary decides; no fall-through to
        // farther ancestors.
        auto dict = categoryDict(category);
        if (dict)
        {
            auto value = _doc->get(dict, key.c_str());
            if (!IsNull(value))
            {
                out = value;
                return true;
            }
        }

        err.set(PdfErrorCode::UndefinedResource,
            std::string(ResourceCategoryKey(category)) + " " + key + " is not defined");
        return false;
    }

    bool ResolveResource(const PdfDocument& doc, const PdfPage& page,
        ResourceCategory category, const std::string& name,
        PdfObjectPtr& out, PdfError& err)
    {
        PdfResources resources(doc, page);
        return resources.resource(category, name, out, err);
    }
}
