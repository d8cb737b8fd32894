#include <vcsv/reader.h>
#include <vcsv/decoder.h>

namespace vcsv {

RecordReader::iterator& RecordReader::iterator::operator++() {
    current_ = reader_->next();
    if (!current_) reader_ = nullptr;
    return *this;
}

RecordReader::RecordReader(std::unique_ptr<Source> source, Layout layout, Schema schema, CancellationToken token)
    : source_(std::move(source)),
      tokenizer_(std::make_unique<Tokenizer>(*source_)),
      layout_(layout),
      schema_(std::move(schema)),
      token_(std::move(token)) {
    if (layout_ == Layout::Vertical) {
        assembler_ = std::make_unique<ColumnAssembler>(*tokenizer_, token_);
    } else {
        assembler_ = std::make_unique<RowAssembler>(*tokenizer_, token_);
    }
}

std::optional<Record> RecordReader::next() {
    if (done_) return std::nullopt;

    while (assembler_->next(raw_)) {
        Record record = decode(raw_);
        ++decoded_;
        token_.throwIfCancellationRequested();
        if (schema_.accepts(record)) {
            ++accepted_;
            return record;
        }
    }
    done_ = true;
    return std::nullopt;
}

std::vector<Record> RecordReader::readAll() {
    std::vector<Record> out;
    while (auto r = next()) out.push_back(std::move(*r));
    return out;
}

RecordReader parse_horizontal(std::istream& in, const Schema& schema, CancellationToken token) {
    return RecordReader(std::make_unique<StreamSource>(in), Layout::Horizontal, schema, std::move(token));
}

RecordReader parse_horizontal_string(std::string text, const Schema& schema, CancellationToken token) {
    return RecordReader(std::make_unique<StringSource>(std::move(text)), Layout::Horizontal, schema,
                        std::move(token));
}

RecordReader parse_horizontal_file(const std::string& path,
                                   const Schema& schema,
                                   CancellationToken token,
                                   std::uint64_t mmap_threshold) {
    return parse_file(path, Layout::Horizontal, schema, std::move(token), mmap_threshold);
}

RecordReader parse_vertical(std::istream& in, const Schema& schema, CancellationToken token) {
    return RecordReader(std::make_unique<StreamSource>(in), Layout::Vertical, schema, std::move(token));
}

RecordReader parse_vertical_string(std::string text, const Schema& schema, CancellationToken token) {
    return RecordReader(std::make_unique<StringSource>(std::move(text)), Layout::Vertical, schema,
                        std::move(token));
}

RecordReader parse_vertical_file(const std::string& path,
                                 const Schema& schema,
                                 CancellationToken token,
                                 std::uint64_t mmap_threshold) {
    return parse_file(path, Layout::Vertical, schema, std::move(token), mmap_threshold);
}

RecordReader parse_file(const std::string& path,
                        Layout layout,
                        const Schema& schema,
                        CancellationToken token,
                        std::uint64_t mmap_threshold) {
    return RecordReader(open_file_source(path, mmap_threshold), layout, schema, std::move(token));
}

}  // namespace vcsv
