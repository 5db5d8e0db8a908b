#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>

namespace pdfraster
{
    // Value kinds held in the document's object table
    enum class PdfObjectType
    {
        Null,
        Boolean,
        Number,
        String,
        Name,
        Array,
        Dictionary,
        Stream,
        IndirectRef
    };

    class PdfObject
    {
    public:
        virtual ~PdfObject() = default;
        virtual PdfObjectType type() const = 0;
    };

    using PdfObjectPtr = std::shared_ptr<PdfObject>;

    class PdfNull : public PdfObject
    {
    public:
        PdfObjectType type() const override { return PdfObjectType::Null; }
    };

    class PdfBoolean : public PdfObject
    {
    public:
        bool value;
        explicit PdfBoolean(bool v) : value(v) {}
        PdfObjectType type() const override { return PdfObjectType::Boolean; }
    };

    class PdfNumber : public PdfObject
    {
    public:
        double value;
        explicit PdfNumber(double v) : value(v) {}
        PdfObjectType type() const override { return PdfObjectType::Number; }
    };

    // Literal or hex string, already unescaped to raw bytes
    class PdfString : public PdfObject
    {
    public:
        std::string value;
        bool isHex = false;
        PdfString(const std::string& v, bool hex = false) : value(v), isHex(hex) {}
        PdfObjectType type() const override { return PdfObjectType::String; }
    };

    // Names keep their leading slash: "/Type", "/Catalog"
    class PdfName : public PdfObject
    {
    public:
        std::string value;
        explicit PdfName(const std::string& v) : value(v) {}
        PdfObjectType type() const override { return PdfObjectType::Name; }
    };

    class PdfArray : public PdfObject
    {
    public:
        std::vector<PdfObjectPtr> items;
        PdfObjectType type() const override { return PdfObjectType::Array; }
    };

    class PdfDictionary : public PdfObject
    {
    public:
        std::unordered_map<std::string, PdfObjectPtr> entries;

        PdfObjectType type() const override { return PdfObjectType::Dictionary; }

        // key includes the slash
        PdfObjectPtr get(const std::string& key) const
        {
            auto it = entries.find(key);
            if (it != entries.end())
                return it->second;
            return nullptr;
        }

        bool has(const std::string& key) const
        {
            return entries.find(key) != entries.end();
        }
    };

    class PdfStream : public PdfObject
    {
    public:
        std::shared_ptr<PdfDictionary> dict;
        std::vector<uint8_t> data; // undecoded bytes between stream/endstream

        PdfStream(std::shared_ptr<PdfDictionary> d, std::vector<uint8_t> bytes)
            : dict(std::move(d)), data(std::move(bytes))
        {
        }

        PdfObjectType type() const override { return PdfObjectType::Stream; }
    };

    class PdfIndirectRef : public PdfObject
    {
    public:
        int objNum;
        int genNum;

        PdfIndirectRef(int o, int g) : objNum(o), genNum(g) {}
        PdfObjectType type() const override { return PdfObjectType::IndirectRef; }
    };

    // ============================================
    // Typed accessors (no reference resolution)
    // ============================================

    inline std::shared_ptr<PdfDictionary> AsDict(const PdfObjectPtr& o)
    {
        if (!o) return nullptr;
        if (o->type() == PdfObjectType::Dictionary)
            return std::static_pointer_cast<PdfDictionary>(o);
        // A stream stands in for its dictionary
        if (o->type() == PdfObjectType::Stream)
            return std::static_pointer_cast<PdfStream>(o)->dict;
        return nullptr;
    }

    inline std::shared_ptr<PdfArray> AsArray(const PdfObjectPtr& o)
    {
        return std::dynamic_pointer_cast<PdfArray>(o);
    }

    inline std::shared_ptr<PdfStream> AsStream(const PdfObjectPtr& o)
    {
        return std::dynamic_pointer_cast<PdfStream>(o);
    }

    inline bool AsNumber(const PdfObjectPtr& o, double& out)
    {
        auto n = std::dynamic_pointer_cast<PdfNumber>(o);
        if (!n) return false;
        out = n->value;
        return true;
    }

    inline double NumberOr(const PdfObjectPtr& o, double fallback)
    {
        double v = fallback;
        AsNumber(o, v);
        return v;
    }

    // Returns the name including the slash, or an empty string
    inline std::string NameOf(const PdfObjectPtr& o)
    {
        auto n = std::dynamic_pointer_cast<PdfName>(o);
        return n ? n->value : std::string();
    }

    inline std::shared_ptr<PdfString> AsString(const PdfObjectPtr& o)
    {
        return std::dynamic_pointer_cast<PdfString>(o);
    }

    inline bool IsNull(const PdfObjectPtr& o)
    {
        return !o || o->type() == PdfObjectType::Null;
    }
}
