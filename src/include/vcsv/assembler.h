#pragma once

#include <vcsv/cancellation.h>
#include <vcsv/decoder.h>
#include <vcsv/tokenizer.h>

#include <string>
#include <vector>

namespace vcsv {

// Turns tokenized lines into raw records. Cancellation is checked after
// every line read from the tokenizer.
class LayoutAssembler {
public:
    virtual ~LayoutAssembler() = default;

    // Fills `out` with the next raw record; false at end of input.
    virtual bool next(RawRecord& out) = 0;

    // Labels seen so far, in input order.
    virtual const std::vector<std::string>& fieldNames() const = 0;
};

// Row-major: the first non-empty line holds the labels and every following
// line is one record, paired position by position up to the shorter of the
// two. Streams one line at a time.
class RowAssembler : public LayoutAssembler {
public:
    RowAssembler(Tokenizer& tokenizer, CancellationToken token = {});

    bool next(RawRecord& out) override;
    const std::vector<std::string>& fieldNames() const override { return headers_; }

private:
    Tokenizer& tokenizer_;
    CancellationToken token_;
    std::vector<std::string> headers_;
    std::vector<std::string> line_;
    bool header_read_ = false;
};

// Transposed: each line is a label followed by that field's value for each
// record. A record is a column, so nothing can be emitted until the whole
// input has been read; the first call to next() buffers every line.
// Columns missing from a short line are absent from that record.
class ColumnAssembler : public LayoutAssembler {
public:
    ColumnAssembler(Tokenizer& tokenizer, CancellationToken token = {});

    bool next(RawRecord& out) override;
    const std::vector<std::string>& fieldNames() const override { return labels_; }

    // Number of records the buffered input describes; reads the input if
    // that has not happened yet.
    std::size_t recordCount();

private:
    void load();

    Tokenizer& tokenizer_;
    CancellationToken token_;
    std::vector<std::string> labels_;
    std::vector<std::vector<std::string>> values_;  // per line, values after the label
    std::size_t columns_ = 0;
    std::size_t column_ = 0;
    bool loaded_ = false;
};

}  // namespace vcsv
