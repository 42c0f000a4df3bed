#pragma once

#include "objxfer/client.hpp"

#include <string>

namespace objxfer {

/// Client for local filesystem paths.
///
/// Writes go to "<path>.part.objxfer" and are renamed into place once
/// complete; leftover part files are what --incomplete operates on.
/// Object metadata, retention and legal hold have no filesystem equivalent.
class FsClient : public Client {
public:
    explicit FsClient(Location location);

    std::string type_name() const override { return "filesystem"; }
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
    Location location_;
};

/// POSIX attributes in the preserved-attribute format
/// "atime:<s>/ctime:<s>/gid:<n>/gname:<g>/mode:<n>/mtime:<s>/uid:<n>/uname:<u>".
std::optional<Error> file_system_attrs(const std::string& path, std::string& out);

}  // namespace objxfer
