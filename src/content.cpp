#include "objxfer/content.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace objxfer {

std::string canonical_header_key(const std::string& key) {
    std::string result = key;
    bool upper = true;
    for (auto& c : result) {
        if (upper) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        } else {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        upper = (c == '-');
    }
    return result;
}

// ============================================================================
// FileReadStream
// ============================================================================

static bool is_standard_stream_path(const std::string& path) {
    return path == "/dev/stdin" || path == "/dev/stdout" || path == "/dev/stderr" ||
           path == "-";
}

FileReadStream::FileReadStream(int fd, std::string path, bool owned)
    : fd_(fd), path_(std::move(path)), owned_(owned), seekable_(false) {
    // Standard streams stay sequential even when the descriptor is a regular file.
    if (fd_ > STDERR_FILENO && !is_standard_stream_path(path_)) {
        struct stat st;
        seekable_ = (::fstat(fd_, &st) == 0 && S_ISREG(st.st_mode));
    }
}

FileReadStream::~FileReadStream() {
    if (owned_ && fd_ >= 0) ::close(fd_);
}

std::optional<Error> FileReadStream::open(const std::string& path,
                                          std::unique_ptr<FileReadStream>& out) {
    if (path == "-") {
        out = from_stdin();
        return std::nullopt;
    }
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return error_from_errno(errno, path);
    }
    out.reset(new FileReadStream(fd, path, true));
    return std::nullopt;
}

std::unique_ptr<FileReadStream> FileReadStream::from_stdin() {
    return std::unique_ptr<FileReadStream>(new FileReadStream(STDIN_FILENO, "/dev/stdin", false));
}

std::optional<Error> FileReadStream::read(std::span<uint8_t> buffer, size_t& n) {
    n = 0;
    if (buffer.empty()) return std::nullopt;
    for (;;) {
        ssize_t got = ::read(fd_, buffer.data(), buffer.size());
        if (got >= 0) {
            n = static_cast<size_t>(got);
            return std::nullopt;
        }
        if (errno != EINTR) {
            return error_from_errno(errno, path_);
        }
    }
}

std::optional<Error> FileReadStream::seek(uint64_t offset) {
    if (!seekable_) {
        return invalid_argument(path_ + ": stream does not support seeking");
    }
    if (::lseek(fd_, static_cast<off_t>(offset), SEEK_SET) < 0) {
        return error_from_errno(errno, path_);
    }
    return std::nullopt;
}

// ============================================================================
// MemoryReadStream
// ============================================================================

std::optional<Error> MemoryReadStream::read(std::span<uint8_t> buffer, size_t& n) {
    n = std::min(buffer.size(), data_.size() - pos_);
    if (n > 0) {
        std::memcpy(buffer.data(), data_.data() + pos_, n);
        pos_ += n;
    }
    return std::nullopt;
}

std::optional<Error> MemoryReadStream::seek(uint64_t offset) {
    if (offset > data_.size()) {
        return invalid_argument("seek offset " + std::to_string(offset) + " beyond end of object");
    }
    pos_ = static_cast<size_t>(offset);
    return std::nullopt;
}

// ============================================================================
// LimitedReadStream
// ============================================================================

std::optional<Error> LimitedReadStream::read(std::span<uint8_t> buffer, size_t& n) {
    n = 0;
    if (remaining_ == 0) return std::nullopt;
    if (buffer.size() > remaining_) {
        buffer = buffer.first(static_cast<size_t>(remaining_));
    }
    auto err = inner_.read(buffer, n);
    if (err) return err;
    remaining_ -= n;
    return std::nullopt;
}

std::optional<Error> read_full(ReadStream& stream, std::span<uint8_t> buffer, size_t& n) {
    n = 0;
    while (n < buffer.size()) {
        size_t got = 0;
        auto err = stream.read(buffer.subspan(n), got);
        if (err) return err;
        if (got == 0) break;
        n += got;
    }
    return std::nullopt;
}

}  // namespace objxfer
