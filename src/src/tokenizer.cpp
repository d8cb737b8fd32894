#include <vcsv/tokenizer.h>
#include <cctype>
#include <cstring>

namespace vcsv {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

Tokenizer::Tokenizer(Source& source, std::size_t buffer_size)
    : source_(source), buf_(buffer_size < 4 ? 4 : buffer_size) {}

// Keeps the unread tail and appends one read's worth of bytes behind it.
bool Tokenizer::fill() {
    if (eof_) return false;
    if (pos_ > 0) {
        std::memmove(buf_.data(), buf_.data() + pos_, len_ - pos_);
        len_ -= pos_;
        pos_ = 0;
    }
    std::size_t got = source_.read(buf_.data() + len_, buf_.size() - len_);
    if (got == 0) {
        eof_ = true;
        return false;
    }
    len_ += got;
    return true;
}

int Tokenizer::peek() {
    if (pos_ >= len_ && !fill()) return -1;
    return static_cast<unsigned char>(buf_[pos_]);
}

int Tokenizer::get() {
    int c = peek();
    if (c != -1) ++pos_;
    return c;
}

void Tokenizer::skipByteOrderMark() {
    while (len_ - pos_ < 3 && fill()) {
    }
    if (len_ - pos_ >= 3 && static_cast<unsigned char>(buf_[pos_]) == 0xEF &&
        static_cast<unsigned char>(buf_[pos_ + 1]) == 0xBB && static_cast<unsigned char>(buf_[pos_ + 2]) == 0xBF) {
        pos_ += 3;
    }
}

bool Tokenizer::nextLine(std::vector<std::string>& fields) {
    if (!started_) {
        skipByteOrderMark();
        started_ = true;
    }
    fields.clear();

    auto finish_line = [&]() {
        bool blank = true;
        for (auto const& f : fields) {
            if (!f.empty()) {
                blank = false;
                break;
            }
        }
        if (blank) fields.clear();
    };

    std::string current;
    bool inQuotes = false;
    bool escapeNext = false;

    int c;
    while ((c = get()) != -1) {
        const char ch = static_cast<char>(c);

        if (escapeNext) {
            current += ch;
            escapeNext = false;
            continue;
        }
        if (ch == '\\' && inQuotes) {
            escapeNext = true;
            continue;
        }
        if (ch == '"') {
            if (inQuotes && peek() == '"') {
                current += '"';
                get();
                continue;
            }
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes) {
            if (ch == ',') {
                fields.push_back(trim(current));
                current.clear();
                continue;
            }
            if (ch == '\r' || ch == '\n') {
                if (ch == '\r' && peek() == '\n') get();
                fields.push_back(trim(current));
                finish_line();
                ++lines_;
                return true;
            }
        }
        current += ch;
    }

    // End of input without a terminator: emit what was collected, unless
    // it was blank, in which case there is no final line at all.
    if (!current.empty() || !fields.empty()) {
        fields.push_back(trim(current));
        finish_line();
        if (fields.empty()) return false;
        ++lines_;
        return true;
    }
    return false;
}

}  // namespace vcsv
