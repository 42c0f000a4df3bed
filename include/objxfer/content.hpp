#pragma once

#include "objxfer/channel.hpp"
#include "objxfer/error.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace objxfer {

using Metadata = std::map<std::string, std::string>;

/// Canonical MIME header form: "x-amz-meta-foo" -> "X-Amz-Meta-Foo".
std::string canonical_header_key(const std::string& key);

/// Directory entry policy for listings.
enum class DirOpt {
    None,   // suppress directory-like entries
    First,  // emit a directory before its children
    Last    // emit a directory after its children
};

/// One object or directory entry produced by stat or list.
struct ContentDescriptor {
    std::string url;  // aliased form, e.g. "s3/bucket/key" or "/tmp/dir/file"
    std::chrono::system_clock::time_point time{};
    int64_t size = 0;
    bool is_dir = false;
    uint32_t mode = 0;
    std::string storage_class;
    Metadata metadata;       // stored system metadata (Content-Type, ...)
    Metadata user_metadata;  // user-defined, canonical keys
    std::string etag;
    std::chrono::system_clock::time_point expires{};

    // Retention and legal hold overrides
    bool retention_enabled = false;
    std::string retention_mode;
    std::string retention_duration;
    bool bypass_governance = false;
    bool legal_hold_enabled = false;
    std::string legal_hold;

    // Prefix-level entries (common prefixes, buckets without dates) carry no time.
    bool has_time() const { return time.time_since_epoch().count() != 0; }
};

/// Listing element: an entry or an in-band scan failure.
using ListItem = std::variant<ContentDescriptor, Error>;

using ContentStream = TaskStream<ListItem>;
using ErrorStream = TaskStream<Error>;
using DescriptorChannel = Channel<ContentDescriptor>;

/// Sequential byte source with optional random access.
class ReadStream {
public:
    virtual ~ReadStream() = default;

    /// Fill up to buffer.size() bytes. n == 0 on success means end of stream.
    virtual std::optional<Error> read(std::span<uint8_t> buffer, size_t& n) = 0;

    virtual bool seekable() const { return false; }
    virtual std::optional<Error> seek(uint64_t /*offset*/) {
        return invalid_argument("stream does not support seeking");
    }

    /// Set for streams backed by a networked object whose metadata is known.
    virtual const ContentDescriptor* object_info() const { return nullptr; }
};

/// Local file or standard stream.
class FileReadStream : public ReadStream {
public:
    ~FileReadStream() override;

    static std::optional<Error> open(const std::string& path, std::unique_ptr<FileReadStream>& out);
    static std::unique_ptr<FileReadStream> from_stdin();

    std::optional<Error> read(std::span<uint8_t> buffer, size_t& n) override;
    bool seekable() const override { return seekable_; }
    std::optional<Error> seek(uint64_t offset) override;

    const std::string& path() const { return path_; }

private:
    FileReadStream(int fd, std::string path, bool owned);

    int fd_;
    std::string path_;
    bool owned_;
    bool seekable_;
};

/// Buffered object body.
class MemoryReadStream : public ReadStream {
public:
    explicit MemoryReadStream(std::vector<uint8_t> data,
                              std::optional<ContentDescriptor> info = std::nullopt)
        : data_(std::move(data)), info_(std::move(info)) {}

    std::optional<Error> read(std::span<uint8_t> buffer, size_t& n) override;
    bool seekable() const override { return true; }
    std::optional<Error> seek(uint64_t offset) override;
    const ContentDescriptor* object_info() const override { return info_ ? &*info_ : nullptr; }

private:
    std::vector<uint8_t> data_;
    size_t pos_ = 0;
    std::optional<ContentDescriptor> info_;
};

/// Bounds a stream to a declared length. Never seekable.
class LimitedReadStream : public ReadStream {
public:
    LimitedReadStream(ReadStream& inner, uint64_t limit) : inner_(inner), remaining_(limit) {}

    std::optional<Error> read(std::span<uint8_t> buffer, size_t& n) override;

private:
    ReadStream& inner_;
    uint64_t remaining_;
};

/// Read until buffer is full or the stream ends.
std::optional<Error> read_full(ReadStream& stream, std::span<uint8_t> buffer, size_t& n);

/// Accumulates transferred bytes; optionally forwards each update.
class ProgressSink {
public:
    explicit ProgressSink(std::function<void(uint64_t)> on_update = {})
        : on_update_(std::move(on_update)) {}

    void add(uint64_t bytes) {
        uint64_t now = total_.fetch_add(bytes, std::memory_order_relaxed) + bytes;
        if (on_update_) on_update_(now);
    }

    uint64_t total() const { return total_.load(std::memory_order_relaxed); }

private:
    std::atomic<uint64_t> total_{0};
    std::function<void(uint64_t)> on_update_;
};

}  // namespace objxfer
