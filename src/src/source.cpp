#include <vcsv/source.h>
#include <vcsv/errors.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <system_error>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace vcsv {

std::size_t StringSource::read(char* dst, std::size_t n) {
    std::size_t count = std::min(n, text_.size() - pos_);
    std::memcpy(dst, text_.data() + pos_, count);
    pos_ += count;
    return count;
}

std::size_t StreamSource::read(char* dst, std::size_t n) {
    in_.read(dst, static_cast<std::streamsize>(n));
    const std::streamsize got = in_.gcount();
    if (in_.bad()) throw IoError("read error on input stream");
    return static_cast<std::size_t>(got);
}

FileStreamSource::FileStreamSource(const std::string& path) : path_(path), in_(path, std::ios::binary) {
    if (!in_) throw IoError("Failed to open file: " + path + ": " + std::strerror(errno));
}

std::size_t FileStreamSource::read(char* dst, std::size_t n) {
    in_.read(dst, static_cast<std::streamsize>(n));
    const std::streamsize got = in_.gcount();
    if (in_.bad()) throw IoError("Failed to read file: " + path_);
    return static_cast<std::size_t>(got);
}

MappedFileSource::MappedFileSource(const std::string& path) {
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) throw IoError("Failed to open file: " + path + ": " + std::strerror(errno));

    struct stat st;
    if (::fstat(fd_, &st) < 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw IoError("Failed to stat file: " + path + ": " + std::strerror(err));
    }
    size_ = static_cast<std::size_t>(st.st_size);

    // mmap rejects zero-length mappings; an empty file simply reads as EOF.
    if (size_ > 0) {
        void* p = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
        if (p == MAP_FAILED) {
            int err = errno;
            ::close(fd_);
            fd_ = -1;
            throw IoError("Failed to map file: " + path + ": " + std::strerror(err));
        }
        data_ = static_cast<const char*>(p);
        ::madvise(const_cast<char*>(data_), size_, MADV_SEQUENTIAL);
    }
}

MappedFileSource::~MappedFileSource() {
    if (data_) ::munmap(const_cast<char*>(data_), size_);
    if (fd_ >= 0) ::close(fd_);
}

std::size_t MappedFileSource::read(char* dst, std::size_t n) {
    std::size_t count = std::min(n, size_ - pos_);
    if (count > 0) std::memcpy(dst, data_ + pos_, count);
    pos_ += count;
    return count;
}

std::unique_ptr<Source> open_file_source(const std::string& path, std::uint64_t mmap_threshold) {
    std::error_code ec;
    const std::uint64_t size = fs::file_size(fs::path(path), ec);
    if (ec) throw IoError("Failed to open file: " + path + ": " + ec.message());

    std::unique_ptr<Source> source;
    if (size >= mmap_threshold) {
        source = std::make_unique<MappedFileSource>(path);
    } else {
        source = std::make_unique<FileStreamSource>(path);
    }
    if (std::getenv("VCSV_DEBUG")) {
        std::cerr << "vcsv: " << path << " (" << size << " bytes) -> " << source->kind() << " source\n";
    }
    return source;
}

}  // namespace vcsv
