#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "PdfObject.h"
#include "PdfError.h"
#include "PdfFilters.h"

namespace pdfraster
{
    struct PdfRect
    {
        double x0 = 0, y0 = 0, x1 = 0, y1 = 0;

        double width() const { return x1 - x0; }
        double height() const { return y1 - y0; }
        bool empty() const { return width() <= 0 || height() <= 0; }
    };

    struct PdfDocumentInfo
    {
        std::string title;
        std::string author;
        std::string subject;
    };

    // A page is a view into the document: its dictionary, where it sits
    // in the page tree and the inheritable attributes resolved once.
    struct PdfPage
    {
        int index = -1;
        std::shared_ptr<PdfDictionary> dict;

        // page-tree nodes from the page itself up to the root
        std::vector<std::shared_ptr<PdfDictionary>> ancestors;

        PdfRect mediaBox;
        PdfRect cropBox;
        int rotate = 0; // 0, 90, 180 or 270

        // CropBox clipped to MediaBox
        PdfRect box() const;
    };

    class PdfDocument
    {
    public:
        PdfDocument();
        ~PdfDocument();

        PdfDocument(const PdfDocument&) = delete;
        PdfDocument& operator=(const PdfDocument&) = delete;

        // Fails with MalformedDocument or CyclicPageTree
        bool loadFromBytes(const std::vector<uint8_t>& data, PdfError& err);

        const std::map<int, PdfObjectPtr>& getObjects() const { return _objects; }
        std::shared_ptr<PdfDictionary> getTrailer() const { return _trailer; }
        std::shared_ptr<PdfDictionary> getRoot() const { return _root; }

        // One indirection; DanglingReference if the target id is absent
        bool resolve(const PdfIndirectRef& ref, PdfObjectPtr& out, PdfError& err) const;

        // Follows reference chains; null for missing targets and cycles
        PdfObjectPtr resolveIndirect(const PdfObjectPtr& obj) const;

        int pageCount() const { return static_cast<int>(_pageList.size()); }

        // Fails with PageIndexOutOfRange
        bool page(int index, PdfPage& out, PdfError& err) const;

        // Rotation-aware page size in points
        bool pageSize(int index, double& wPt, double& hPt, PdfError& err) const;

        // Decoded /Contents, streams joined by newlines
        bool pageContents(const PdfPage& page, std::vector<uint8_t>& out, PdfError& err) const;

        // Runs the /Filter chain. With imageCodec set, a trailing image
        // codec is left undecoded and reported back.
        bool decodeStream(const std::shared_ptr<PdfStream>& stream,
            std::vector<uint8_t>& out,
            std::string* imageCodec = nullptr) const;

        const PdfDocumentInfo& info() const { return _info; }

        // ---- dictionary helpers that resolve references ----
        PdfObjectPtr get(const std::shared_ptr<PdfDictionary>& dict, const char* key) const;
        std::shared_ptr<PdfDictionary> getDict(const std::shared_ptr<PdfDictionary>& dict, const char* key) const;
        std::shared_ptr<PdfArray> getArray(const std::shared_ptr<PdfDictionary>& dict, const char* key) const;
        std::shared_ptr<PdfStream> getStream(const std::shared_ptr<PdfDictionary>& dict, const char* key) const;
        bool getNumber(const std::shared_ptr<PdfDictionary>& dict, const char* key, double& out) const;
        double getNumberOr(const std::shared_ptr<PdfDictionary>& dict, const char* key, double fallback) const;
        std::string getName(const std::shared_ptr<PdfDictionary>& dict, const char* key) const;

        // Numbers of an array, references resolved
        std::vector<double> numbers(const std::shared_ptr<PdfArray>& arr) const;

        // Inheritable page attribute lookup along the ancestor chain
        PdfObjectPtr inherited(const PdfPage& page, const char* key) const;

        static constexpr int MAX_REF_DEPTH = 100;
        static constexpr int MAX_TREE_DEPTH = 256;

    private:
        struct ObjStmEntry
        {
            int objStmNum;
            int indexInStream;
        };

        struct PageNode
        {
            std::shared_ptr<PdfDictionary> dict;
            std::vector<std::shared_ptr<PdfDictionary>> ancestors;
        };

        std::map<int, PdfObjectPtr> _objects;
        std::map<int, size_t> _xrefTable;
        std::map<int, ObjStmEntry> _objStmEntries;
        std::shared_ptr<PdfDictionary> _trailer;
        std::shared_ptr<PdfDictionary> _root;
        std::shared_ptr<PdfDictionary> _pages;
        std::vector<PageNode> _pageList;
        PdfDocumentInfo _info;

        // only valid during loadFromBytes
        const std::vector<uint8_t>* _data = nullptr;

        bool loadXRefTable();
        bool parseXRefTableAt(size_t offset, std::map<int, size_t>& entries);
        bool parseXRefStreamAt(size_t offset, std::map<int, size_t>& entries,
            std::shared_ptr<PdfDictionary>& trailer);
        std::shared_ptr<PdfDictionary> parseTrailerAt(size_t xrefOffset);
        PdfObjectPtr loadObjectAtOffset(size_t offset, int expectedNum);
        bool loadObjectStream(int objStmNum, std::map<int, PdfObjectPtr>& out);

        bool buildPageList(PdfError& err);
        bool walkPageTree(const std::shared_ptr<PdfDictionary>& node,
            std::vector<std::shared_ptr<PdfDictionary>>& path,
            std::set<const PdfDictionary*>& onPath,
            std::set<const PdfDictionary*>& seen,
            PdfError& err);
        bool isPageObject(const std::shared_ptr<PdfDictionary>& dict) const;
        void collectPagesByScan();

        bool extractBox(const PdfPage& page, const char* key, PdfRect& out) const;
        void loadInfo();
    };
}
