#include <vcsv/assembler.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace vcsv {

RowAssembler::RowAssembler(Tokenizer& tokenizer, CancellationToken token)
    : tokenizer_(tokenizer), token_(std::move(token)) {}

bool RowAssembler::next(RawRecord& out) {
    out.clear();
    if (!header_read_) {
        header_read_ = true;
        while (tokenizer_.nextLine(headers_)) {
            token_.throwIfCancellationRequested();
            if (!headers_.empty()) break;
        }
        if (headers_.empty()) return false;
    }
    if (headers_.empty()) return false;

    while (tokenizer_.nextLine(line_)) {
        token_.throwIfCancellationRequested();
        if (line_.empty()) continue;

        const size_t n = std::min(headers_.size(), line_.size());
        out.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            out.emplace_back(headers_[i], std::move(line_[i]));
        }
        return true;
    }
    return false;
}

ColumnAssembler::ColumnAssembler(Tokenizer& tokenizer, CancellationToken token)
    : tokenizer_(tokenizer), token_(std::move(token)) {}

void ColumnAssembler::load() {
    loaded_ = true;
    std::vector<std::string> line;
    while (tokenizer_.nextLine(line)) {
        token_.throwIfCancellationRequested();
        if (line.empty()) continue;

        labels_.push_back(line[0]);
        values_.emplace_back(std::make_move_iterator(line.begin() + 1), std::make_move_iterator(line.end()));
        columns_ = std::max(columns_, values_.back().size());
    }
    if (std::getenv("VCSV_DEBUG")) {
        std::cerr << "vcsv: transposed input buffered " << labels_.size() << " field lines, " << columns_
                  << " records\n";
    }
}

std::size_t ColumnAssembler::recordCount() {
    if (!loaded_) load();
    return columns_;
}

bool ColumnAssembler::next(RawRecord& out) {
    out.clear();
    if (!loaded_) load();
    if (column_ >= columns_) return false;

    for (size_t i = 0; i < labels_.size(); ++i) {
        if (column_ < values_[i].size()) out.emplace_back(labels_[i], values_[i][column_]);
    }
    ++column_;
    return true;
}

}  // namespace vcsv
