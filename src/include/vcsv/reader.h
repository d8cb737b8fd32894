#pragma once

#include <vcsv/assembler.h>
#include <vcsv/cancellation.h>
#include <vcsv/layout.h>
#include <vcsv/record.h>
#include <vcsv/schema.h>
#include <vcsv/source.h>
#include <vcsv/tokenizer.h>

#include <cstddef>
#include <cstdint>
#include <istream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vcsv {

// Lazy sequence of the records in one input that pass the schema.
//
// Each reader owns its source, tokenizer and assembler; nothing is shared
// between readers, so separate readers may run on separate threads. A
// reader itself is not thread-safe.
//
// next() throws IoError on read failures and OperationCancelled once the
// cancellation token fires. Cancellation is observed after every line and
// after every decoded record; the record in flight is discarded.
class RecordReader {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Record;
        using difference_type = std::ptrdiff_t;
        using pointer = const Record*;
        using reference = const Record&;

        iterator() = default;
        explicit iterator(RecordReader* reader) : reader_(reader) { ++*this; }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++();
        bool operator==(const iterator& o) const { return reader_ == o.reader_; }
        bool operator!=(const iterator& o) const { return reader_ != o.reader_; }

    private:
        RecordReader* reader_ = nullptr;
        std::optional<Record> current_;
    };

    RecordReader(std::unique_ptr<Source> source, Layout layout, Schema schema, CancellationToken token = {});

    RecordReader(RecordReader&&) = default;
    RecordReader& operator=(RecordReader&&) = default;

    // Next accepted record, or std::nullopt when the input is exhausted.
    std::optional<Record> next();

    // Drains the remaining records.
    std::vector<Record> readAll();

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    Layout layout() const { return layout_; }
    const Schema& schema() const { return schema_; }
    const char* sourceKind() const { return source_->kind(); }

    // Raw labels seen so far: the header for horizontal input, every field
    // line's label for vertical input once the first record was requested.
    const std::vector<std::string>& fieldNames() const { return assembler_->fieldNames(); }

    std::size_t linesRead() const { return tokenizer_->linesRead(); }
    std::size_t recordsDecoded() const { return decoded_; }
    std::size_t recordsAccepted() const { return accepted_; }

private:
    std::unique_ptr<Source> source_;
    std::unique_ptr<Tokenizer> tokenizer_;
    std::unique_ptr<LayoutAssembler> assembler_;
    Layout layout_;
    Schema schema_;
    CancellationToken token_;
    RawRecord raw_;
    std::size_t decoded_ = 0;
    std::size_t accepted_ = 0;
    bool done_ = false;
};

// Row-major decoding. The stream must outlive the reader.
RecordReader parse_horizontal(std::istream& in, const Schema& schema, CancellationToken token = {});
RecordReader parse_horizontal_string(std::string text, const Schema& schema, CancellationToken token = {});
RecordReader parse_horizontal_file(const std::string& path,
                                   const Schema& schema,
                                   CancellationToken token = {},
                                   std::uint64_t mmap_threshold = kMappedFileThreshold);

// Transposed decoding. The stream must outlive the reader.
RecordReader parse_vertical(std::istream& in, const Schema& schema, CancellationToken token = {});
RecordReader parse_vertical_string(std::string text, const Schema& schema, CancellationToken token = {});
RecordReader parse_vertical_file(const std::string& path,
                                 const Schema& schema,
                                 CancellationToken token = {},
                                 std::uint64_t mmap_threshold = kMappedFileThreshold);

// File variant for a layout chosen at run time.
RecordReader parse_file(const std::string& path,
                        Layout layout,
                        const Schema& schema,
                        CancellationToken token = {},
                        std::uint64_t mmap_threshold = kMappedFileThreshold);

}  // namespace vcsv
