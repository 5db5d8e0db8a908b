#pragma once
#include <memory>
#include <vector>

#include "PdfObject.h"

namespace pdfraster
{
    class PdfDocument;

    class PdfFunction;
    using PdfFunctionPtr = std::shared_ptr<const PdfFunction>;

    // PDF function objects: sampled (0), exponential (2), stitching (3)
    // and PostScript calculator (4). Inputs are clipped to /Domain and
    // outputs to /Range.
    class PdfFunction
    {
    public:
        virtual ~PdfFunction() = default;

        void evaluate(const std::vector<double>& in, std::vector<double>& out) const;

        int inputCount() const { return static_cast<int>(_domain.size() / 2); }
        virtual int outputCount() const { return static_cast<int>(_range.size() / 2); }

        // Accepts a function dictionary or stream, or an array of
        // single-output functions whose results are concatenated
        static PdfFunctionPtr Parse(const PdfDocument& doc, const PdfObjectPtr& obj, int depth = 0);

        static constexpr int MAX_NESTING = 8;

    protected:
        std::vector<double> _domain;
        std::vector<double> _range;

        virtual void evaluateRaw(const std::vector<double>& in, std::vector<double>& out) const = 0;
    };
}
