#pragma once

#include <vcsv/source.h>

#include <cstddef>
#include <string>
#include <vector>

namespace vcsv {

constexpr std::size_t kDefaultBufferSize = 8192;

// Splits a character stream into logical lines of trimmed fields.
//
// Dialect: comma separated; '"' toggles quoting and "" inside quotes is a
// literal quote; inside quotes a backslash makes the next character
// literal; \r, \n and \r\n end a line outside quotes. Malformed quoting is
// never an error: an unterminated quote swallows the rest of the input.
// A leading UTF-8 byte-order mark is dropped.
class Tokenizer {
public:
    explicit Tokenizer(Source& source, std::size_t buffer_size = kDefaultBufferSize);

    // Reads the next line into `fields`. Returns false once the input is
    // exhausted. A line made only of blank fields comes back as an empty
    // vector so the caller can skip it.
    bool nextLine(std::vector<std::string>& fields);

    // Number of lines returned so far, blank ones included.
    std::size_t linesRead() const { return lines_; }

private:
    // Both return -1 at end of input.
    int peek();
    int get();
    bool fill();
    void skipByteOrderMark();

    Source& source_;
    std::vector<char> buf_;
    std::size_t pos_ = 0;
    std::size_t len_ = 0;
    bool eof_ = false;
    bool started_ = false;
    std::size_t lines_ = 0;
};

// Whitespace trim on both ends.
std::string trim(const std::string& s);

// True if `s` is empty or only whitespace.
bool is_blank(const std::string& s);

}  // namespace vcsv
