#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <string>

namespace vcsv {

// Files at or above this size are read through a memory mapping.
constexpr std::uint64_t kMappedFileThreshold = 100ull * 1024 * 1024;

// A forward-only byte source feeding the tokenizer.
class Source {
public:
    virtual ~Source() = default;

    // Copies up to `n` bytes into `dst` and returns the number copied;
    // 0 means end of input. Throws IoError on read failure.
    virtual std::size_t read(char* dst, std::size_t n) = 0;

    // Short description for diagnostics ("memory-mapped", "stream", ...).
    virtual const char* kind() const = 0;
};

// Owns a copy of an in-memory text.
class StringSource : public Source {
public:
    explicit StringSource(std::string text) : text_(std::move(text)) {}

    std::size_t read(char* dst, std::size_t n) override;
    const char* kind() const override { return "string"; }

private:
    std::string text_;
    std::size_t pos_ = 0;
};

// Reads from a caller-owned stream, which must outlive the source.
class StreamSource : public Source {
public:
    explicit StreamSource(std::istream& in) : in_(in) {}

    std::size_t read(char* dst, std::size_t n) override;
    const char* kind() const override { return "stream"; }

private:
    std::istream& in_;
};

// Buffered read of a file it opens itself.
class FileStreamSource : public Source {
public:
    explicit FileStreamSource(const std::string& path);

    std::size_t read(char* dst, std::size_t n) override;
    const char* kind() const override { return "buffered file"; }

private:
    std::string path_;
    std::ifstream in_;
};

// Read-only private mapping of a whole file. Pages are faulted in as the
// tokenizer walks forward, so the file is never copied into memory at once.
class MappedFileSource : public Source {
public:
    explicit MappedFileSource(const std::string& path);
    ~MappedFileSource() override;

    MappedFileSource(const MappedFileSource&) = delete;
    MappedFileSource& operator=(const MappedFileSource&) = delete;

    std::size_t read(char* dst, std::size_t n) override;
    const char* kind() const override { return "memory-mapped"; }

    std::size_t size() const { return size_; }

private:
    const char* data_ = nullptr;
    std::size_t size_ = 0;
    std::size_t pos_ = 0;
    int fd_ = -1;
};

// Stats `path` and picks a MappedFileSource for files of at least
// `mmap_threshold` bytes, a FileStreamSource otherwise. Throws IoError if the
// file does not exist or cannot be opened.
std::unique_ptr<Source> open_file_source(const std::string& path,
                                         std::uint64_t mmap_threshold = kMappedFileThreshold);

}  // namespace vcsv
