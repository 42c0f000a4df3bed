#include "objxfer/fs_client.hpp"
#include "objxfer/constants.hpp"
#include "objxfer/content_type.hpp"
#include "objxfer/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <grp.h>
#include <fcntl.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace objxfer {

namespace fs = std::filesystem;

namespace {

std::string strip_trailing_slash(const std::string& path) {
    std::string result = path;
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

bool has_suffix(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

ContentDescriptor descriptor_from_stat(const std::string& url, const struct stat& st) {
    ContentDescriptor content;
    content.url = url;
    content.time = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec)));
    content.size = static_cast<int64_t>(st.st_size);
    content.is_dir = S_ISDIR(st.st_mode);
    content.mode = static_cast<uint32_t>(st.st_mode);
    if (content.is_dir) {
        content.size = 0;
    } else {
        content.metadata["Content-Type"] = guess_content_type(url);
    }
    return content;
}

Error fs_error(int err, const std::string& path) {
    return error_from_errno(err, path).with_trace({"filesystem"});
}

// Write all of data, retrying short writes.
bool write_all(int fd, const uint8_t* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

// Remove the directories a removal left empty, walking up from path but
// never reaching root itself.
void prune_empty_parents(const std::string& root, const std::string& path) {
    const std::string prefix = root + "/";
    std::string dir = fs::path(path).parent_path().string();
    while (dir.size() > prefix.size() && dir.compare(0, prefix.size(), prefix) == 0) {
        if (::rmdir(dir.c_str()) != 0) {
            // ENOTEMPTY and EEXIST mean a sibling is still there
            if (errno != ENOTEMPTY && errno != EEXIST) {
                log_debug("keeping %s: %s", dir.c_str(), std::strerror(errno));
            }
            return;
        }
        log_debug("removed empty directory %s", dir.c_str());
        dir = fs::path(dir).parent_path().string();
    }
}

struct WalkContext {
    const ListOptions& options;
    const CancellationToken& cancel;
    Channel<ListItem>& out;
};

// Returns false once the consumer has gone away or the scan was cancelled.
bool walk(WalkContext& ctx, const std::string& dir_path, const std::string& dir_url) {
    std::error_code ec;
    fs::directory_iterator it(dir_path, ec);
    if (ec) {
        return ctx.out.send(fs_error(ec.value(), dir_path));
    }

    std::vector<std::string> names;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        if (!ctx.out.send(fs_error(ec.value(), dir_path))) return false;
    }
    std::sort(names.begin(), names.end());

    const std::string suffix = constants::PART_SUFFIX;
    for (const auto& name : names) {
        if (ctx.cancel.cancelled()) return false;

        std::string full = dir_path.back() == '/' ? dir_path + name : dir_path + "/" + name;
        std::string url = join_url(dir_url, name);

        struct stat link_st;
        if (::lstat(full.c_str(), &link_st) != 0) {
            if (!ctx.out.send(fs_error(errno, full))) return false;
            continue;
        }
        struct stat st = link_st;
        bool is_link = S_ISLNK(link_st.st_mode);
        if (is_link) {
            struct stat target;
            // Dangling links are reported as the link itself
            if (::stat(full.c_str(), &target) == 0) st = target;
        }

        if (S_ISDIR(st.st_mode)) {
            // A recursive scan never follows a linked directory; it lists the link
            if (ctx.options.recursive && is_link) {
                if (ctx.options.incomplete) continue;
                if (!ctx.out.send(descriptor_from_stat(url, link_st))) return false;
                continue;
            }
            auto dir = descriptor_from_stat(url + "/", st);
            if (!ctx.options.recursive) {
                if (ctx.options.dir_opt != DirOpt::None && !ctx.options.incomplete) {
                    if (!ctx.out.send(dir)) return false;
                }
                continue;
            }
            if (ctx.options.dir_opt == DirOpt::First && !ctx.options.incomplete) {
                if (!ctx.out.send(dir)) return false;
            }
            if (!walk(ctx, full, url)) return false;
            if (ctx.options.dir_opt == DirOpt::Last && !ctx.options.incomplete) {
                if (!ctx.out.send(dir)) return false;
            }
            continue;
        }

        bool is_part = has_suffix(name, suffix);
        if (ctx.options.incomplete != is_part) continue;
        if (is_part) {
            url = url.substr(0, url.size() - suffix.size());
        }
        if (!ctx.out.send(descriptor_from_stat(url, st))) return false;
    }
    return true;
}

}  // namespace

FsClient::FsClient(Location location) : location_(std::move(location)) {}

std::optional<Error> file_system_attrs(const std::string& path, std::string& out) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return error_from_errno(errno, path);
    }

    std::string uname = std::to_string(st.st_uid);
    std::string gname = std::to_string(st.st_gid);

    std::vector<char> buf(16384);
    struct passwd pwd;
    struct passwd* pw_result = nullptr;
    if (getpwuid_r(st.st_uid, &pwd, buf.data(), buf.size(), &pw_result) == 0 && pw_result) {
        uname = pw_result->pw_name;
    }
    struct group grp;
    struct group* gr_result = nullptr;
    if (getgrgid_r(st.st_gid, &grp, buf.data(), buf.size(), &gr_result) == 0 && gr_result) {
        gname = gr_result->gr_name;
    }

    out = "atime:" + std::to_string(st.st_atim.tv_sec) +
          "/ctime:" + std::to_string(st.st_ctim.tv_sec) +
          "/gid:" + std::to_string(st.st_gid) +
          "/gname:" + gname +
          "/mode:" + std::to_string(st.st_mode) +
          "/mtime:" + std::to_string(st.st_mtim.tv_sec) +
          "/uid:" + std::to_string(st.st_uid) +
          "/uname:" + uname;
    return std::nullopt;
}

StatResult FsClient::stat(const CancellationToken& /*cancel*/, bool incomplete,
                          bool preserve, const Sse& /*sse*/) {
    StatResult result;
    std::string path = location_.path;
    if (incomplete) {
        path = strip_trailing_slash(path) + constants::PART_SUFFIX;
    }

    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        result.error = fs_error(errno, path);
        return result;
    }

    result.content = descriptor_from_stat(location_.aliased_url, st);
    if (preserve) {
        std::string attrs;
        if (auto err = file_system_attrs(path, attrs)) {
            result.error = *err;
            return result;
        }
        result.content.user_metadata[constants::PRESERVE_ATTRS_KEY] = attrs;
    }
    result.success = true;
    return result;
}

std::unique_ptr<ContentStream> FsClient::list(const CancellationToken& cancel,
                                              const ListOptions& options) {
    Location location = location_;
    return std::make_unique<ContentStream>(
        constants::LIST_QUEUE_DEPTH,
        [location, options, cancel](Channel<ListItem>& out) {
            CancelRegistration registration(cancel, [&out]() { out.close(); });

            std::string root = strip_trailing_slash(location.path);
            struct stat st;
            if (::stat(root.c_str(), &st) != 0) {
                int err = errno;
                if (options.incomplete) {
                    std::string part = root + constants::PART_SUFFIX;
                    if (::stat(part.c_str(), &st) == 0) {
                        out.send(descriptor_from_stat(location.aliased_url, st));
                        return;
                    }
                }
                out.send(fs_error(err, root));
                return;
            }

            if (!S_ISDIR(st.st_mode)) {
                if (!options.incomplete) {
                    out.send(descriptor_from_stat(location.aliased_url, st));
                }
                return;
            }

            WalkContext ctx{options, cancel, out};
            walk(ctx, root, location.aliased_url);
        });
}

GetResult FsClient::get(const CancellationToken& /*cancel*/, const Sse& /*sse*/) {
    GetResult result;
    struct stat st;
    if (::stat(location_.path.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
        result.error = invalid_argument(location_.path + " is a directory");
        return result;
    }

    std::unique_ptr<FileReadStream> stream;
    if (auto err = FileReadStream::open(location_.path, stream)) {
        result.error = err->with_trace({"filesystem"});
        return result;
    }
    result.stream = std::move(stream);
    result.success = true;
    return result;
}

PutResult FsClient::put(const CancellationToken& cancel, ReadStream& stream, int64_t size,
                        const Metadata& /*metadata*/, ProgressSink* progress, const Sse& /*sse*/,
                        bool /*md5*/, bool /*disable_multipart*/) {
    PutResult result;
    const std::string& path = location_.path;

    std::error_code ec;
    if (!path.empty() && path.back() == '/') {
        fs::create_directories(path, ec);
        if (ec) {
            result.error = fs_error(ec.value(), path);
            return result;
        }
        result.success = true;
        return result;
    }

    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            result.error = fs_error(ec.value(), parent.string());
            return result;
        }
    }

    std::string part = path + constants::PART_SUFFIX;
    int fd = ::open(part.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666);
    if (fd < 0) {
        result.error = fs_error(errno, part);
        return result;
    }

    std::vector<uint8_t> buffer(constants::STREAM_BUFFER_SIZE);
    int64_t total = 0;
    while (size < 0 || total < size) {
        if (cancel.cancelled()) {
            ::close(fd);
            result.error = backend_failure("upload to " + path + " cancelled");
            return result;
        }

        std::span<uint8_t> window(buffer);
        if (size >= 0 && static_cast<int64_t>(window.size()) > size - total) {
            window = window.first(static_cast<size_t>(size - total));
        }

        size_t n = 0;
        if (auto err = stream.read(window, n)) {
            ::close(fd);
            result.error = *err;
            return result;
        }
        if (n == 0) break;

        if (!write_all(fd, buffer.data(), n)) {
            int err = errno;
            ::close(fd);
            result.error = fs_error(err, part);
            return result;
        }
        total += static_cast<int64_t>(n);
        if (progress) progress->add(n);
    }

    if (::close(fd) != 0) {
        result.error = fs_error(errno, part);
        return result;
    }

    if (size >= 0 && total != size) {
        result.error = backend_failure("unexpected end of input: wrote " + std::to_string(total) +
                                       " of " + std::to_string(size) + " bytes to " + path);
        return result;
    }

    if (::rename(part.c_str(), path.c_str()) != 0) {
        result.error = fs_error(errno, path);
        return result;
    }

    result.success = true;
    result.bytes = total;
    return result;
}

std::optional<Error> FsClient::copy(const CancellationToken& cancel, const std::string& source,
                                    int64_t size, ProgressSink* progress, const Sse& /*src_sse*/,
                                    const Sse& /*tgt_sse*/, const Metadata& /*metadata*/,
                                    bool /*disable_multipart*/) {
    if (cancel.cancelled()) {
        return backend_failure("copy to " + location_.path + " cancelled");
    }

    std::string target = location_.path;
    if (!target.empty() && target.back() == '/') {
        target += fs::path(source).filename().string();
    }

    std::error_code ec;
    fs::path parent = fs::path(target).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) return fs_error(ec.value(), parent.string());
    }

    std::string part = target + constants::PART_SUFFIX;
    if (fs::is_symlink(source, ec) && fs::is_directory(source, ec)) {
        // Linked directories are copied as links
        fs::remove(part, ec);
        fs::copy_symlink(source, part, ec);
    } else {
        ec.clear();
        fs::copy_file(source, part, fs::copy_options::overwrite_existing, ec);
    }
    if (ec) {
        return fs_error(ec.value(), source).with_trace({"copy to " + target});
    }
    if (::rename(part.c_str(), target.c_str()) != 0) {
        return fs_error(errno, target);
    }

    if (progress && size > 0) progress->add(static_cast<uint64_t>(size));
    return std::nullopt;
}

std::unique_ptr<ErrorStream> FsClient::remove(const CancellationToken& cancel, bool incomplete,
                                              bool remove_bucket, bool /*bypass*/,
                                              std::shared_ptr<DescriptorChannel> contents) {
    Location location = location_;
    return std::make_unique<ErrorStream>(
        Channel<Error>::UNBOUNDED,
        [location, cancel, incomplete, remove_bucket, contents](Channel<Error>& errors) {
            CancelRegistration registration(cancel, [contents]() { contents->close(); });

            const std::string root = strip_trailing_slash(location.path);
            while (auto content = contents->receive()) {
                if (cancel.cancelled()) break;

                std::string path = content->url;
                bool dir = content->is_dir || (!path.empty() && path.back() == '/');
                path = strip_trailing_slash(path);
                if (incomplete) {
                    path += constants::PART_SUFFIX;
                    dir = false;
                }

                int rc = dir ? ::rmdir(path.c_str()) : ::unlink(path.c_str());
                if (rc != 0) {
                    errors.send(fs_error(errno, path).with_trace({content->url}));
                } else {
                    log_debug("removed %s", path.c_str());
                    prune_empty_parents(root, path);
                }
            }

            if (remove_bucket && !cancel.cancelled()) {
                if (::rmdir(root.c_str()) != 0) {
                    errors.send(fs_error(errno, root));
                }
            }
        });
}

std::optional<Error> FsClient::put_retention(const CancellationToken& /*cancel*/,
                                             const std::string& /*mode*/,
                                             std::chrono::system_clock::time_point /*until*/,
                                             bool /*bypass_governance*/) {
    return invalid_argument("object retention is not supported on filesystem path " +
                            location_.path);
}

std::optional<Error> FsClient::put_legal_hold(const CancellationToken& /*cancel*/,
                                              const std::string& /*status*/) {
    return invalid_argument("legal hold is not supported on filesystem path " + location_.path);
}

}  // namespace objxfer
