#pragma once

#include "objxfer/client.hpp"
#include "objxfer/constants.hpp"
#include "objxfer/http.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace objxfer {

namespace xml {

// Value between <tag> and </tag>, empty if absent
std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0);

// Bodies of every <tag>...</tag> in document order
std::vector<std::string> find_elements(const std::string& xml, const std::string& tag);

std::string decode_entities(const std::string& s);
std::string escape(const std::string& s);

}  // namespace xml

/// Map an unsuccessful object-store response onto the shared taxonomy.
Error s3_error(const net::HttpResponse& response, const std::string& resource);

/// Total object size from a "bytes first-last/total" Content-Range value.
std::optional<uint64_t> parse_content_range_total(const std::string& value);

/// Object body fetched one byte range at a time; at most one range is buffered.
class RangedObjectReadStream : public ReadStream {
public:
    // Fill body with bytes [first, last] of the object
    using FetchRange = std::function<std::optional<Error>(uint64_t first, uint64_t last,
                                                          std::vector<uint8_t>& body)>;

    RangedObjectReadStream(FetchRange fetch, ContentDescriptor info,
                           uint64_t range_size = constants::GET_RANGE_SIZE);

    // Seed with a range the caller already fetched
    void prime(uint64_t offset, std::vector<uint8_t> data);

    std::optional<Error> read(std::span<uint8_t> buffer, size_t& n) override;
    bool seekable() const override { return true; }
    std::optional<Error> seek(uint64_t offset) override;
    const ContentDescriptor* object_info() const override { return &info_; }

    size_t buffered() const { return buffer_.size(); }

private:
    FetchRange fetch_;
    ContentDescriptor info_;
    uint64_t size_;
    uint64_t range_size_;
    uint64_t position_ = 0;
    uint64_t buffer_start_ = 0;
    std::vector<uint8_t> buffer_;
};

/// Client for an S3-compatible object store, addressed as alias/bucket/key.
class S3Client : public Client {
public:
    explicit S3Client(Location location);

    std::string type_name() const override { return "s3"; }
    const Location& location() const override { return location_; }

    StatResult stat(const CancellationToken& cancel, bool incomplete,
                    bool preserve, const Sse& sse) override;

    std::unique_ptr<ContentStream> list(const CancellationToken& cancel,
                                        const ListOptions& options) override;

    GetResult get(const CancellationToken& cancel, const Sse& sse) override;

    PutResult put(const CancellationToken& cancel, ReadStream& stream, int64_t size,
                  const Metadata& metadata, ProgressSink* progress, const Sse& sse,
                  bool md5, bool disable_multipart) override;

    std::optional<Error> copy(const CancellationToken& cancel, const std::string& source,
                              int64_t size, ProgressSink* progress, const Sse& src_sse,
                              const Sse& tgt_sse, const Metadata& metadata,
                              bool disable_multipart) override;

    std::unique_ptr<ErrorStream> remove(const CancellationToken& cancel, bool incomplete,
                                        bool remove_bucket, bool bypass,
                                        std::shared_ptr<DescriptorChannel> contents) override;

    std::optional<Error> put_retention(const CancellationToken& cancel, const std::string& mode,
                                       std::chrono::system_clock::time_point until,
                                       bool bypass_governance) override;

    std::optional<Error> put_legal_hold(const CancellationToken& cancel,
                                        const std::string& status) override;

private:
    struct Shared;

    Location location_;
    std::string bucket_;
    std::string key_;
    std::shared_ptr<Shared> shared_;
};

}  // namespace objxfer
