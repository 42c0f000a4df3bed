// Test suite for objxfer.
//
// Tests:
//   1. Encryption key registry (parsing, decoding, longest prefix, conflicts)
//   2. Durations (ages, age filter, retention, legal hold, timestamps)
//   3. Location resolution and container detection
//   4. Channels and task streams
//   5. Bulk removal against a mock backend
//      - Age filtering
//      - Permission failures skipped, other failures abort
//      - --fake reports without removing
//      - Syntax gating (--recursive / --force / --dangerous)
//      - Single removal and --stdin targets
//   6. Copy pipeline against a mock backend
//      - In-backend copy vs. streamed copy
//      - Metadata precedence and filtering
//      - Retention and legal hold
//   7. Filesystem client end to end
//   8. Content type guessing and sniffing
//   9. CommandConfig CLI and JSON loading
//  10. TransferMetrics textfile output
//  11. Object-store response parsing

#include "objxfer/channel.hpp"
#include "objxfer/client.hpp"
#include "objxfer/command_config.hpp"
#include "objxfer/constants.hpp"
#include "objxfer/content_type.hpp"
#include "objxfer/durations.hpp"
#include "objxfer/encryption.hpp"
#include "objxfer/fs_client.hpp"
#include "objxfer/location.hpp"
#include "objxfer/metrics.hpp"
#include "objxfer/remove.hpp"
#include "objxfer/s3_client.hpp"
#include "objxfer/transfer.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace objxfer;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    ASSERT_TRUE((s).empty(), msg ": " + (s))

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    ASSERT_TRUE(!(s).empty(), msg)

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Write binary content to a file.
static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), content.size());
}

/// Read entire file into a string.
static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

static std::string kind_of(const std::optional<Error>& err) {
    if (!err) return "none";
    switch (err->kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::PreconditionNotMet: return "PreconditionNotMet";
        case ErrorKind::BackendFailure: return "BackendFailure";
        case ErrorKind::RetentionConflict: return "RetentionConflict";
    }
    return "unknown";
}

static std::string drain_stream(ReadStream& stream) {
    std::string out;
    std::vector<uint8_t> buf(4096);
    for (;;) {
        size_t n = 0;
        if (stream.read(buf, n) || n == 0) break;
        out.append(reinterpret_cast<const char*>(buf.data()), n);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Mock object store
//
// Objects are keyed by aliased URL without a trailing slash. Every client the
// factory hands out shares one backend so tests can count calls across the
// clients a pipeline creates.
// ---------------------------------------------------------------------------

struct MockBackend {
    std::mutex mutex;
    std::map<std::string, ContentDescriptor> objects;
    std::map<std::string, std::string> data;

    // When set, list() emits exactly these items
    std::optional<std::vector<ListItem>> listing;

    std::set<std::string> denied;  // remove fails with PermissionDenied
    std::set<std::string> broken;  // remove fails with BackendFailure
    std::optional<Error> copy_error;

    int stats = 0;
    int lists = 0;
    int gets = 0;
    int puts = 0;
    int copies = 0;
    int retentions = 0;
    int legal_holds = 0;
    std::vector<std::string> removed;
    Metadata last_metadata;
    std::string last_retention_mode;

    void add_object(const std::string& url, int age_days, const std::string& body = "data",
                    Metadata metadata = {{"Content-Type", "text/plain"}}) {
        ContentDescriptor c;
        c.url = url;
        c.time = std::chrono::system_clock::now() - std::chrono::hours(24 * age_days);
        c.size = static_cast<int64_t>(body.size());
        c.metadata = std::move(metadata);
        objects[url] = c;
        data[url] = body;
    }

    void add_dir(const std::string& url) {
        ContentDescriptor c;
        c.url = url + "/";
        c.is_dir = true;
        objects[url] = c;
    }

    std::vector<std::string> removed_sorted() {
        std::lock_guard lock(mutex);
        auto out = removed;
        std::sort(out.begin(), out.end());
        return out;
    }
};

static std::string strip_slash(std::string s) {
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

class MockClient : public Client {
public:
    MockClient(Location location, std::shared_ptr<MockBackend> backend)
        : location_(std::move(location)), backend_(std::move(backend)) {}

    std::string type_name() const override { return "mock"; }
    const Location& location() const override { return location_; }

    StatResult stat(const CancellationToken&, bool, bool, const Sse&) override {
        StatResult result;
        std::lock_guard lock(backend_->mutex);
        ++backend_->stats;
        auto it = backend_->objects.find(strip_slash(location_.aliased_url));
        if (it == backend_->objects.end()) {
            result.error = not_found(location_.aliased_url);
            return result;
        }
        result.content = it->second;
        result.success = true;
        return result;
    }

    std::unique_ptr<ContentStream> list(const CancellationToken&,
                                        const ListOptions& options) override {
        std::vector<ListItem> items;
        {
            std::lock_guard lock(backend_->mutex);
            ++backend_->lists;
            if (backend_->listing) {
                items = *backend_->listing;
            } else {
                std::string prefix = strip_slash(location_.aliased_url) + "/";
                for (const auto& [url, content] : backend_->objects) {
                    if (!url.starts_with(prefix)) continue;
                    if (content.is_dir && options.dir_opt == DirOpt::None) continue;
                    items.emplace_back(content);
                }
            }
        }
        return std::make_unique<ContentStream>(16, [items](Channel<ListItem>& out) {
            for (const auto& item : items) {
                if (!out.send(item)) return;
            }
        });
    }

    GetResult get(const CancellationToken&, const Sse&) override {
        GetResult result;
        std::lock_guard lock(backend_->mutex);
        ++backend_->gets;
        auto it = backend_->data.find(strip_slash(location_.aliased_url));
        if (it == backend_->data.end()) {
            result.error = not_found(location_.aliased_url);
            return result;
        }
        result.stream = std::make_unique<MemoryReadStream>(
            std::vector<uint8_t>(it->second.begin(), it->second.end()));
        result.success = true;
        return result;
    }

    PutResult put(const CancellationToken&, ReadStream& stream, int64_t, const Metadata& metadata,
                  ProgressSink*, const Sse&, bool, bool) override {
        std::string body = drain_stream(stream);
        PutResult result;
        std::lock_guard lock(backend_->mutex);
        ++backend_->puts;
        backend_->data[location_.aliased_url] = body;
        backend_->last_metadata = metadata;
        result.bytes = static_cast<int64_t>(body.size());
        result.success = true;
        return result;
    }

    std::optional<Error> copy(const CancellationToken&, const std::string& source, int64_t,
                              ProgressSink*, const Sse&, const Sse&, const Metadata& metadata,
                              bool) override {
        std::lock_guard lock(backend_->mutex);
        ++backend_->copies;
        backend_->last_metadata = metadata;
        if (backend_->copy_error) return backend_->copy_error;
        backend_->data[location_.aliased_url] = backend_->data[source];
        return std::nullopt;
    }

    std::unique_ptr<ErrorStream> remove(const CancellationToken&, bool, bool, bool,
                                        std::shared_ptr<DescriptorChannel> contents) override {
        auto backend = backend_;
        return std::make_unique<ErrorStream>(
            Channel<Error>::UNBOUNDED, [backend, contents](Channel<Error>& errors) {
                while (auto content = contents->receive()) {
                    std::string key = strip_slash(content->url);
                    std::lock_guard lock(backend->mutex);
                    if (backend->denied.count(key)) {
                        errors.send(permission_denied("Access Denied: " + key));
                    } else if (backend->broken.count(key)) {
                        errors.send(backend_failure("connection reset: " + key));
                    } else {
                        backend->removed.push_back(key);
                    }
                }
            });
    }

    std::optional<Error> put_retention(const CancellationToken&, const std::string& mode,
                                       std::chrono::system_clock::time_point, bool) override {
        std::lock_guard lock(backend_->mutex);
        ++backend_->retentions;
        backend_->last_retention_mode = mode;
        return std::nullopt;
    }

    std::optional<Error> put_legal_hold(const CancellationToken&, const std::string&) override {
        std::lock_guard lock(backend_->mutex);
        ++backend_->legal_holds;
        return std::nullopt;
    }

private:
    Location location_;
    std::shared_ptr<MockBackend> backend_;
};

class MockFactory : public ClientFactory {
public:
    explicit MockFactory(std::shared_ptr<MockBackend> backend) : backend_(std::move(backend)) {}

    ClientResult create(const Location& location) override {
        ClientResult result;
        if (location.is_filesystem()) {
            result.client = std::make_unique<FsClient>(location);
        } else {
            result.client = std::make_unique<MockClient>(location, backend_);
        }
        result.success = true;
        return result;
    }

private:
    std::shared_ptr<MockBackend> backend_;
};

/// Environment with object-store aliases "s3" and "gcs" served by backend.
static Environment make_env(std::shared_ptr<MockBackend> backend) {
    Environment env;
    AliasConfig s3;
    s3.url = "https://s3.example.com";
    env.resolver.add_alias("s3", s3);
    AliasConfig gcs;
    gcs.url = "https://storage.example.com";
    env.resolver.add_alias("gcs", gcs);
    env.factory = std::make_shared<MockFactory>(std::move(backend));
    return env;
}

static std::string key_of(char c) {
    return std::string(32, c);
}

// ---------------------------------------------------------------------------
// 1. Encryption key registry
// ---------------------------------------------------------------------------

static void test_encryption_registry() {
    std::cout << "\n=== Encryption key registry ===" << std::endl;

    {
        TEST(plain_key_for_prefix);
        EncryptionKeyRegistry registry;
        auto err = EncryptionKeyRegistry::parse("s3/logs/=" + key_of('A'), "", registry);
        ASSERT_TRUE(!err, "parse should succeed");
        auto sse = registry.resolve("s3/logs/app.log");
        ASSERT_TRUE(sse.has_value(), "key should apply below prefix");
        ASSERT_TRUE(sse->type == SseType::Customer, "should be a customer key");
        ASSERT_EQ(std::string(sse->key.begin(), sse->key.end()), key_of('A'), "key bytes");
        ASSERT_TRUE(!registry.resolve("s3/other/app.log").has_value(), "other prefix has no key");
        ASSERT_TRUE(!registry.resolve("gcs/logs/app.log").has_value(), "other alias has no key");
        PASS();
    }
    {
        TEST(base64_key_matches_plain);
        std::string b64;
        for (int i = 0; i < 10; ++i) b64 += "QUFB";
        b64 += "QUE=";
        std::array<uint8_t, 32> plain{};
        std::array<uint8_t, 32> decoded{};
        ASSERT_TRUE(!decode_encryption_key(key_of('A'), plain), "plain key decodes");
        ASSERT_TRUE(!decode_encryption_key(b64, decoded), "base64 key decodes");
        ASSERT_TRUE(plain == decoded, "both forms should yield the same key");
        PASS();
    }
    {
        TEST(invalid_key_length);
        EncryptionKeyRegistry registry;
        auto err = EncryptionKeyRegistry::parse("s3/bucket=short", "", registry);
        ASSERT_EQ(kind_of(err), "InvalidArgument", "short key");
        ASSERT_TRUE(err->to_string().find("short") == std::string::npos,
                    "error must not echo key material");
        PASS();
    }
    {
        TEST(key_bytes_keep_surrounding_spaces);
        std::string key = " " + std::string(30, 'K') + " ";
        EncryptionKeyRegistry registry;
        auto err = EncryptionKeyRegistry::parse("s3/spaced=" + key + ", s3/other=" + key_of('A'),
                                                "", registry);
        ASSERT_TRUE(!err, "32-byte key with spaces is valid");
        auto sse = registry.resolve("s3/spaced/file");
        ASSERT_TRUE(sse.has_value(), "key applies");
        ASSERT_EQ(std::string(sse->key.begin(), sse->key.end()), key, "spaces kept in key");
        ASSERT_TRUE(registry.resolve("s3/other/file").has_value(), "prefix after ', ' trimmed");
        PASS();
    }
    {
        TEST(missing_equals);
        EncryptionKeyRegistry registry;
        auto err = EncryptionKeyRegistry::parse("s3/bucket", "", registry);
        ASSERT_EQ(kind_of(err), "InvalidArgument", "no '='");
        PASS();
    }
    {
        TEST(longest_prefix_wins);
        EncryptionKeyRegistry registry;
        auto err = EncryptionKeyRegistry::parse(
            "s3/data=" + key_of('A') + ", s3/data/secret=" + key_of('B'), "", registry);
        ASSERT_TRUE(!err, "parse should succeed");
        auto deep = registry.resolve("s3/data/secret/file");
        auto shallow = registry.resolve("s3/data/public/file");
        ASSERT_TRUE(deep && shallow, "both paths have keys");
        ASSERT_EQ(static_cast<int>(deep->key[0]), static_cast<int>('B'), "deep prefix key");
        ASSERT_EQ(static_cast<int>(shallow->key[0]), static_cast<int>('A'), "shallow prefix key");
        PASS();
    }
    {
        TEST(default_sse_prefix);
        EncryptionKeyRegistry registry;
        auto err = EncryptionKeyRegistry::parse("", "s3/archive", registry);
        ASSERT_TRUE(!err, "parse should succeed");
        auto sse = registry.resolve("s3/archive/2024.tar");
        ASSERT_TRUE(sse && sse->type == SseType::S3, "backend-managed encryption");
        PASS();
    }
    {
        TEST(conflict_with_default_prefix);
        EncryptionKeyRegistry registry;
        auto err = EncryptionKeyRegistry::parse("s3/data/x=" + key_of('A'), "s3/data", registry);
        ASSERT_EQ(kind_of(err), "InvalidArgument", "overlapping prefixes");
        PASS();
    }
    {
        TEST(environment_fallback);
        setenv("OBJXFER_ENCRYPT_KEY", ("s3/env=" + key_of('C')).c_str(), 1);
        EncryptionKeyRegistry from_env;
        ASSERT_TRUE(!load_encryption_keys("", "", from_env), "env keys load");
        ASSERT_TRUE(from_env.resolve("s3/env/a").has_value(), "env key applies");

        EncryptionKeyRegistry from_flag;
        ASSERT_TRUE(!load_encryption_keys("", "s3/flag=" + key_of('D'), from_flag),
                    "flag keys load");
        ASSERT_TRUE(!from_flag.resolve("s3/env/a").has_value(), "flag replaces env");
        ASSERT_TRUE(from_flag.resolve("s3/flag/a").has_value(), "flag key applies");
        unsetenv("OBJXFER_ENCRYPT_KEY");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. Durations
// ---------------------------------------------------------------------------

static void test_durations() {
    std::cout << "\n=== Durations ===" << std::endl;

    {
        TEST(parse_compound_age);
        std::chrono::seconds age{};
        ASSERT_TRUE(!parse_age("7d10h", age), "7d10h parses");
        ASSERT_EQ(age.count(), (7LL * 24 + 10) * 3600, "7d10h seconds");
        ASSERT_TRUE(!parse_age("1d2h30m15s", age), "all units parse");
        ASSERT_EQ(age.count(), 86400LL + 7200 + 1800 + 15, "1d2h30m15s seconds");
        PASS();
    }
    {
        TEST(reject_bad_ages);
        std::chrono::seconds age{};
        ASSERT_EQ(kind_of(parse_age("", age)), "InvalidArgument", "empty");
        ASSERT_EQ(kind_of(parse_age("10", age)), "InvalidArgument", "missing unit");
        ASSERT_EQ(kind_of(parse_age("d", age)), "InvalidArgument", "missing number");
        ASSERT_EQ(kind_of(parse_age("3w", age)), "InvalidArgument", "unknown unit");
        PASS();
    }
    {
        TEST(age_filter_bounds);
        AgeFilter filter;
        ASSERT_TRUE(!AgeFilter::parse("90d", "", filter), "older-than parses");
        ASSERT_TRUE(filter.active(), "filter active");
        auto now = std::chrono::system_clock::now();
        auto days = [&](int n) { return now - std::chrono::hours(24 * n); };
        ASSERT_TRUE(filter.excludes(days(10), now), "10 days is too new");
        ASSERT_TRUE(!filter.excludes(days(95), now), "95 days qualifies");

        AgeFilter newer;
        ASSERT_TRUE(!AgeFilter::parse("", "30d", newer), "newer-than parses");
        ASSERT_TRUE(!newer.excludes(days(10), now), "10 days qualifies");
        ASSERT_TRUE(newer.excludes(days(40), now), "40 days is too old");

        AgeFilter none;
        ASSERT_TRUE(!AgeFilter::parse("", "", none), "empty filter parses");
        ASSERT_TRUE(!none.active(), "empty filter inactive");

        AgeFilter bad;
        ASSERT_EQ(kind_of(AgeFilter::parse("x", "", bad)), "InvalidArgument", "bad age");
        PASS();
    }
    {
        TEST(retention_settings);
        std::string mode;
        ASSERT_TRUE(!parse_retention_mode("governance", mode), "lower case mode");
        ASSERT_EQ(mode, "GOVERNANCE", "normalized mode");
        ASSERT_EQ(kind_of(parse_retention_mode("strict", mode)), "InvalidArgument", "bad mode");

        std::chrono::hours validity{};
        ASSERT_TRUE(!parse_retention_validity("30d", validity), "30d parses");
        ASSERT_EQ(validity.count(), 720, "30 days in hours");
        ASSERT_TRUE(!parse_retention_validity("1y", validity), "1y parses");
        ASSERT_EQ(validity.count(), 24 * 365, "1 year in hours");
        ASSERT_EQ(kind_of(parse_retention_validity("0d", validity)), "InvalidArgument", "zero");
        ASSERT_EQ(kind_of(parse_retention_validity("5m", validity)), "InvalidArgument", "unit");

        TimePoint now = std::chrono::system_clock::now();
        TimePoint until;
        ASSERT_TRUE(!retain_until_date("1d", until, now), "retain-until computes");
        ASSERT_TRUE(until - now == std::chrono::hours(24), "one day ahead");
        PASS();
    }
    {
        TEST(legal_hold_values);
        ASSERT_TRUE(!validate_legal_hold("ON"), "ON valid");
        ASSERT_TRUE(!validate_legal_hold("OFF"), "OFF valid");
        ASSERT_EQ(kind_of(validate_legal_hold("maybe")), "InvalidArgument", "maybe invalid");
        ASSERT_EQ(kind_of(validate_legal_hold("")), "InvalidArgument", "empty invalid");
        PASS();
    }
    {
        TEST(timestamp_formats);
        auto t = parse_rfc3339("2024-01-02T03:04:05Z");
        ASSERT_TRUE(t.has_value(), "rfc3339 parses");
        ASSERT_EQ(format_rfc3339(*t), "2024-01-02T03:04:05Z", "rfc3339 formats back");
        auto frac = parse_rfc3339("2024-01-02T03:04:05.123Z");
        ASSERT_TRUE(frac.has_value(), "fractional seconds parse");
        auto h = parse_http_date("Tue, 02 Jan 2024 03:04:05 GMT");
        ASSERT_TRUE(h.has_value(), "http date parses");
        ASSERT_TRUE(*h == *t, "same instant");
        ASSERT_TRUE(!parse_rfc3339("yesterday").has_value(), "garbage rejected");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. Location resolution
// ---------------------------------------------------------------------------

static void test_location() {
    std::cout << "\n=== Location resolution ===" << std::endl;

    auto backend = std::make_shared<MockBackend>();
    auto env = make_env(backend);
    auto tmpdir = make_temp_dir("objxfer-location");

    {
        TEST(resolve_aliases);
        auto loc = env.resolver.resolve("s3/bucket/dir/key");
        ASSERT_TRUE(!loc.is_filesystem(), "registered alias is an object store");
        ASSERT_EQ(loc.alias, "s3", "alias");
        ASSERT_EQ(loc.path, "bucket/dir/key", "path");
        ASSERT_EQ(loc.full_url(), "https://s3.example.com/bucket/dir/key", "full url");

        auto local = env.resolver.resolve("backup/file.txt");
        ASSERT_TRUE(local.is_filesystem(), "unregistered alias is a filesystem path");
        ASSERT_EQ(local.path, "backup/file.txt", "filesystem path");
        PASS();
    }
    {
        TEST(path_helpers);
        ASSERT_EQ(clean_path("a//b/./c/"), "a/b/c/", "clean keeps trailing slash");
        ASSERT_EQ(clean_path("/x//y"), "/x/y", "clean absolute");
        ASSERT_EQ(join_url("s3/bucket/", "/key"), "s3/bucket/key", "join with slashes");
        ASSERT_EQ(join_url("s3/bucket", "key"), "s3/bucket/key", "join without slashes");
        auto [alias, rest] = split_alias("s3/bucket/key");
        ASSERT_EQ(alias, "s3", "split alias");
        ASSERT_EQ(rest, "bucket/key", "split rest");
        PASS();
    }
    {
        TEST(container_by_shape);
        ASSERT_TRUE(looks_like_container(env.resolver.resolve("s3/bucket")), "alias/bucket");
        ASSERT_TRUE(!looks_like_container(env.resolver.resolve("s3")), "alias only");
        ASSERT_TRUE(!looks_like_container(env.resolver.resolve("s3/bucket/key")), "object key");
        ASSERT_TRUE(looks_like_container(env.resolver.resolve("s3/bucket/dir/")), "prefix");
        ASSERT_TRUE(looks_like_container(env.resolver.resolve("/tmp/dir/")), "fs slash");
        ASSERT_TRUE(!looks_like_container(env.resolver.resolve("/tmp/file")), "fs no slash");
        PASS();
    }
    {
        TEST(container_by_stat);
        backend->add_dir("s3/bucket/folder");
        backend->add_object("s3/bucket/folder/key", 1);
        ASSERT_TRUE(is_container_like(env, "s3/bucket"), "missing bucket by shape");
        ASSERT_TRUE(!is_container_like(env, "s3"), "alias alone is not a container");
        ASSERT_TRUE(is_container_like(env, "s3/bucket/folder"), "stat says folder");
        ASSERT_TRUE(!is_container_like(env, "s3/bucket/folder/key"), "stat says object");

        write_file(tmpdir / "file", "x");
        ASSERT_TRUE(!is_container_like(env, (tmpdir / "file").string()), "existing file");
        ASSERT_TRUE(is_container_like(env, tmpdir.string()), "existing dir");
        ASSERT_TRUE(is_container_like(env, (tmpdir / "missing/").string()), "missing dir/");
        PASS();
    }
    {
        TEST(bare_url_rejected);
        auto created = new_client(env, "https://s3.amazonaws.com/bucket/key");
        ASSERT_TRUE(!created.success, "bare URL should be rejected");
        ASSERT_TRUE(created.error.is(ErrorKind::InvalidArgument), "InvalidArgument");
        PASS();
    }
    {
        TEST(alias_config_validation);
        AliasConfig cfg;
        ASSERT_EQ(cfg.region, std::string(constants::DEFAULT_REGION), "default region");
        ASSERT_NOT_EMPTY(cfg.validate(), "url required");
        cfg.url = "ftp://example.com";
        ASSERT_NOT_EMPTY(cfg.validate(), "scheme checked");
        cfg.url = "https://example.com";
        ASSERT_EMPTY(cfg.validate(), "valid config");
        cfg.access_key = "AKIA";
        ASSERT_NOT_EMPTY(cfg.validate(), "secret required with access key");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 4. Channels
// ---------------------------------------------------------------------------

static void test_channels() {
    std::cout << "\n=== Channels ===" << std::endl;

    {
        TEST(buffered_items_survive_close);
        Channel<int> ch(4);
        ASSERT_TRUE(ch.send(1) && ch.send(2), "sends succeed");
        ch.close();
        ASSERT_TRUE(!ch.send(3), "send after close fails");
        ASSERT_EQ(*ch.receive(), 1, "first item");
        ASSERT_EQ(*ch.receive(), 2, "second item");
        ASSERT_TRUE(!ch.receive().has_value(), "drained");
        PASS();
    }
    {
        TEST(try_operations);
        Channel<int> ch(1);
        int v = 7;
        ASSERT_TRUE(ch.try_send(v) == TryResult::Ok, "first try_send");
        int w = 8;
        ASSERT_TRUE(ch.try_send(w) == TryResult::WouldBlock, "full channel");
        std::optional<int> out;
        ASSERT_TRUE(ch.try_receive(out) == TryResult::Ok && *out == 7, "try_receive");
        out.reset();
        ASSERT_TRUE(ch.try_receive(out) == TryResult::WouldBlock, "empty channel");
        ch.close();
        ASSERT_TRUE(ch.try_receive(out) == TryResult::Closed, "closed channel");
        PASS();
    }
    {
        TEST(select_prefers_ready_receive);
        auto selector = std::make_shared<Selector>();
        Channel<int> out(1);
        Channel<std::string> in;
        out.attach(selector);
        in.attach(selector);

        int filler = 0;
        ASSERT_TRUE(out.try_send(filler) == TryResult::Ok, "fill output");
        in.send("failure");

        int value = 1;
        std::optional<std::string> received;
        auto outcome = send_or_receive(&out, value, in, received, *selector);
        ASSERT_TRUE(outcome == SelectOutcome::Received, "should receive while output is full");
        ASSERT_EQ(*received, "failure", "received item");

        std::thread consumer([&] { out.receive(); });
        outcome = send_or_receive(&out, value, in, received, *selector);
        consumer.join();
        ASSERT_TRUE(outcome == SelectOutcome::Sent, "should send once space frees up");

        in.close();
        received.reset();
        outcome = send_or_receive<int, std::string>(nullptr, value, in, received, *selector);
        ASSERT_TRUE(outcome == SelectOutcome::ReceiveClosed, "closed input");
        PASS();
    }
    {
        TEST(task_stream_unblocks_producer);
        bool finished = false;
        {
            TaskStream<int> stream(1, [&finished](Channel<int>& ch) {
                for (int i = 0; i < 1000; ++i) {
                    if (!ch.send(i)) break;
                }
                finished = true;
            });
            ASSERT_EQ(*stream.next(), 0, "first item");
        }
        ASSERT_TRUE(finished, "producer should exit when the stream is destroyed");
        PASS();
    }
    {
        TEST(child_cancellation);
        CancellationToken parent;
        auto child = parent.child();
        child.cancel();
        ASSERT_TRUE(child.cancelled(), "child cancelled");
        ASSERT_TRUE(!parent.cancelled(), "parent untouched");

        auto other = parent.child();
        int fired = 0;
        {
            CancelRegistration reg(other, [&fired] { ++fired; });
            parent.cancel();
        }
        ASSERT_TRUE(other.cancelled(), "parent cancels children");
        ASSERT_EQ(fired, 1, "callback fired once");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. Bulk removal
// ---------------------------------------------------------------------------

static void test_remove() {
    std::cout << "\n=== Bulk removal ===" << std::endl;

    {
        TEST(older_than_filters_entries);
        auto backend = std::make_shared<MockBackend>();
        backend->add_dir("s3/bucket");
        backend->add_object("s3/bucket/new", 10);
        backend->add_object("s3/bucket/mid", 95);
        backend->add_object("s3/bucket/old", 200);
        auto env = make_env(backend);

        RemoveOptions options;
        options.recursive = true;
        options.force = true;
        options.older_than = "90d";
        auto err = remove_targets(env, {"s3/bucket"}, options, nullptr);
        ASSERT_TRUE(!err, "removal should succeed");
        auto removed = backend->removed_sorted();
        ASSERT_EQ(removed.size(), (size_t)2, "two entries are old enough");
        ASSERT_EQ(removed[0], "s3/bucket/mid", "95 day entry removed");
        ASSERT_EQ(removed[1], "s3/bucket/old", "200 day entry removed");
        PASS();
    }
    {
        TEST(newer_than_filters_entries);
        auto backend = std::make_shared<MockBackend>();
        backend->add_dir("s3/bucket");
        backend->add_object("s3/bucket/new", 10);
        backend->add_object("s3/bucket/old", 200);
        auto env = make_env(backend);

        RemoveOptions options;
        options.recursive = true;
        options.force = true;
        options.newer_than = "30d";
        ASSERT_TRUE(!remove_targets(env, {"s3/bucket"}, options, nullptr), "should succeed");
        auto removed = backend->removed_sorted();
        ASSERT_EQ(removed.size(), (size_t)1, "one recent entry");
        ASSERT_EQ(removed[0], "s3/bucket/new", "10 day entry removed");
        PASS();
    }
    {
        TEST(permission_denied_continues);
        auto backend = std::make_shared<MockBackend>();
        backend->add_dir("s3/bucket");
        auto now = std::chrono::system_clock::now();
        std::vector<ListItem> listing;
        for (const char* name : {"a", "b"}) {
            ContentDescriptor c;
            c.url = std::string("s3/bucket/") + name;
            c.time = now;
            listing.emplace_back(c);
        }
        listing.emplace_back(permission_denied("cannot list s3/bucket/private/"));
        ContentDescriptor c;
        c.url = "s3/bucket/c";
        c.time = now;
        listing.emplace_back(c);
        backend->listing = listing;
        backend->denied.insert("s3/bucket/b");
        auto env = make_env(backend);

        RemoveOptions options;
        options.recursive = true;
        options.force = true;
        int reported = 0;
        options.on_result = [&reported](const PipelineResult&) { ++reported; };
        auto err = remove_recursive(env, "s3/bucket", options, AgeFilter{});
        ASSERT_EQ(kind_of(err), "PermissionDenied", "skipped entries are reported");
        auto removed = backend->removed_sorted();
        ASSERT_EQ(removed.size(), (size_t)2, "remaining entries removed");
        ASSERT_EQ(removed[0], "s3/bucket/a", "a removed");
        ASSERT_EQ(removed[1], "s3/bucket/c", "c removed after listing failure");
        ASSERT_EQ(reported, 3, "every candidate reported");
        PASS();
    }
    {
        TEST(listing_failure_aborts);
        auto backend = std::make_shared<MockBackend>();
        backend->add_dir("s3/bucket");
        auto now = std::chrono::system_clock::now();
        std::vector<ListItem> listing;
        ContentDescriptor a;
        a.url = "s3/bucket/a";
        a.time = now;
        listing.emplace_back(a);
        listing.emplace_back(backend_failure("connection reset"));
        ContentDescriptor b;
        b.url = "s3/bucket/b";
        b.time = now;
        listing.emplace_back(b);
        backend->listing = listing;
        auto env = make_env(backend);

        RemoveOptions options;
        options.recursive = true;
        options.force = true;
        auto err = remove_recursive(env, "s3/bucket", options, AgeFilter{});
        ASSERT_EQ(kind_of(err), "BackendFailure", "listing failure is fatal");
        auto removed = backend->removed_sorted();
        ASSERT_TRUE(std::find(removed.begin(), removed.end(), "s3/bucket/b") == removed.end(),
                    "nothing after the failure is removed");
        ASSERT_TRUE(!env.cancel.cancelled(), "abort is scoped to the target");
        PASS();
    }
    {
        TEST(removal_failure_aborts);
        auto backend = std::make_shared<MockBackend>();
        backend->add_dir("s3/bucket");
        backend->add_object("s3/bucket/a", 1);
        backend->broken.insert("s3/bucket/a");
        auto env = make_env(backend);

        RemoveOptions options;
        options.recursive = true;
        options.force = true;
        auto err = remove_recursive(env, "s3/bucket", options, AgeFilter{});
        ASSERT_EQ(kind_of(err), "BackendFailure", "backend failure is fatal");
        PASS();
    }
    {
        TEST(fake_is_idempotent);
        auto backend = std::make_shared<MockBackend>();
        backend->add_dir("s3/bucket");
        backend->add_object("s3/bucket/x", 100);
        backend->add_object("s3/bucket/y", 100);
        backend->add_object("s3/bucket/z", 1);
        auto env = make_env(backend);

        RemoveOptions options;
        options.recursive = true;
        options.force = true;
        options.fake = true;
        options.older_than = "30d";
        std::vector<std::string> first;
        std::vector<std::string> second;
        options.on_result = [&first](const PipelineResult& r) {
            if (r.dry_run) first.push_back(r.key);
        };
        ASSERT_TRUE(!remove_targets(env, {"s3/bucket"}, options, nullptr), "first fake run");
        options.on_result = [&second](const PipelineResult& r) {
            if (r.dry_run) second.push_back(r.key);
        };
        ASSERT_TRUE(!remove_targets(env, {"s3/bucket"}, options, nullptr), "second fake run");
        ASSERT_TRUE(first == second, "fake runs report the same candidates");
        ASSERT_EQ(first.size(), (size_t)2, "two candidates");
        ASSERT_EQ(backend->removed.size(), (size_t)0, "fake removes nothing");

        options.fake = false;
        std::vector<std::string> real;
        options.on_result = [&real](const PipelineResult& r) { real.push_back(r.key); };
        ASSERT_TRUE(!remove_targets(env, {"s3/bucket"}, options, nullptr), "real run");
        std::sort(first.begin(), first.end());
        ASSERT_TRUE(backend->removed_sorted() == first, "real run removes the candidates");
        PASS();
    }
    {
        TEST(syntax_gating);
        auto backend = std::make_shared<MockBackend>();
        backend->add_dir("s3/bucket");
        backend->add_object("s3/bucket/a", 1);
        auto env = make_env(backend);

        RemoveOptions options;
        auto err = check_remove_syntax(env, {"s3/bucket"}, options);
        ASSERT_EQ(kind_of(err), "PreconditionNotMet", "folder needs --recursive");
        ASSERT_TRUE(err->message.find("--recursive") != std::string::npos, "recursive message");

        options.recursive = true;
        err = check_remove_syntax(env, {"s3/bucket"}, options);
        ASSERT_EQ(kind_of(err), "PreconditionNotMet", "recursive needs --force");
        ASSERT_TRUE(err->message.find("--force") != std::string::npos, "force message");

        options.force = true;
        ASSERT_TRUE(!check_remove_syntax(env, {"s3/bucket"}, options), "bucket with --force");

        err = check_remove_syntax(env, {"s3"}, options);
        ASSERT_EQ(kind_of(err), "PreconditionNotMet", "namespace needs --dangerous");
        ASSERT_TRUE(err->message.find("--dangerous") != std::string::npos, "dangerous message");
        err = check_remove_syntax(env, {"s3/"}, options);
        ASSERT_EQ(kind_of(err), "PreconditionNotMet", "trailing slash is still the namespace");

        options.dangerous = true;
        ASSERT_TRUE(!check_remove_syntax(env, {"s3"}, options), "namespace with --dangerous");

        RemoveOptions plain;
        ASSERT_TRUE(!check_remove_syntax(env, {"s3/bucket/a"}, plain), "single object");
        ASSERT_EQ(kind_of(check_remove_syntax(env, {}, plain)), "InvalidArgument", "no targets");

        RemoveOptions from_stdin;
        from_stdin.stdin_targets = true;
        ASSERT_EQ(kind_of(check_remove_syntax(env, {}, from_stdin)), "PreconditionNotMet",
                  "--stdin needs --force");
        from_stdin.force = true;
        ASSERT_TRUE(!check_remove_syntax(env, {}, from_stdin), "--stdin with --force");

        ASSERT_EQ(backend->lists, 0, "gating never lists");
        PASS();
    }
    {
        TEST(single_removal);
        auto backend = std::make_shared<MockBackend>();
        backend->add_object("s3/bucket/a", 1);
        auto env = make_env(backend);

        RemoveOptions options;
        std::vector<std::string> reported;
        options.on_result = [&reported](const PipelineResult& r) { reported.push_back(r.key); };
        ASSERT_TRUE(!remove_targets(env, {"s3/bucket/a"}, options, nullptr), "remove one");
        ASSERT_EQ(backend->removed.size(), (size_t)1, "one removal");
        ASSERT_EQ(backend->removed[0], "s3/bucket/a", "removed key");
        ASSERT_EQ(reported.size(), (size_t)1, "reported once");

        auto err = remove_targets(env, {"s3/bucket/missing"}, options, nullptr);
        ASSERT_EQ(kind_of(err), "NotFound", "missing target without --force");
        options.force = true;
        ASSERT_TRUE(!remove_targets(env, {"s3/bucket/missing"}, options, nullptr),
                    "missing target with --force");
        PASS();
    }
    {
        TEST(single_removal_permission_denied);
        auto backend = std::make_shared<MockBackend>();
        backend->add_object("s3/bucket/a", 1);
        backend->add_object("s3/bucket/b", 1);
        backend->denied.insert("s3/bucket/a");
        auto env = make_env(backend);

        RemoveOptions options;
        auto err = remove_targets(env, {"s3/bucket/a", "s3/bucket/b"}, options, nullptr);
        ASSERT_EQ(kind_of(err), "PermissionDenied", "first failure returned");
        ASSERT_EQ(backend->removed.size(), (size_t)1, "later target still attempted");
        ASSERT_EQ(backend->removed[0], "s3/bucket/b", "b removed");
        PASS();
    }
    {
        TEST(stdin_targets);
        auto backend = std::make_shared<MockBackend>();
        backend->add_object("s3/bucket/a", 1);
        backend->add_object("s3/bucket/b", 1);
        auto env = make_env(backend);

        RemoveOptions options;
        options.stdin_targets = true;
        options.force = true;
        std::istringstream input("s3/bucket/a\n\n   s3/bucket/b  \n");
        ASSERT_TRUE(!remove_targets(env, {}, options, &input), "stdin removal");
        auto removed = backend->removed_sorted();
        ASSERT_EQ(removed.size(), (size_t)2, "both lines removed");
        ASSERT_EQ(removed[1], "s3/bucket/b", "trimmed line");
        PASS();
    }
    {
        TEST(bad_age_rejected_before_work);
        auto backend = std::make_shared<MockBackend>();
        auto env = make_env(backend);
        RemoveOptions options;
        options.older_than = "soon";
        auto err = remove_targets(env, {"s3/bucket/a"}, options, nullptr);
        ASSERT_EQ(kind_of(err), "InvalidArgument", "bad age");
        ASSERT_EQ(backend->stats, 0, "nothing stat'ed");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 6. Copy pipeline
// ---------------------------------------------------------------------------

static void test_copy() {
    std::cout << "\n=== Copy pipeline ===" << std::endl;

    {
        TEST(same_alias_uses_backend_copy);
        auto backend = std::make_shared<MockBackend>();
        backend->add_object("s3/bucket/a", 1, "hello");
        auto env = make_env(backend);

        CopyOptions options;
        options.attributes = {{"owner", "ops"}};
        ASSERT_TRUE(!copy_targets(env, {"s3/bucket/a"}, "s3/bucket/b", options), "copy");
        ASSERT_EQ(backend->copies, 1, "one in-backend copy");
        ASSERT_EQ(backend->gets, 0, "no download");
        ASSERT_EQ(backend->puts, 0, "no upload");
        ASSERT_EQ(backend->data["s3/bucket/b"], "hello", "copied body");
        ASSERT_EQ(backend->last_metadata["Content-Type"], "text/plain", "source content type");
        ASSERT_EQ(backend->last_metadata["Owner"], "ops", "attribute applied");
        PASS();
    }
    {
        TEST(cross_alias_streams);
        auto backend = std::make_shared<MockBackend>();
        backend->add_object("s3/bucket/a", 1, "payload");
        auto env = make_env(backend);

        CopyOptions options;
        std::vector<PipelineResult> results;
        options.on_result = [&results](const PipelineResult& r) { results.push_back(r); };
        ASSERT_TRUE(!copy_targets(env, {"s3/bucket/a"}, "gcs/bucket/a", options), "copy");
        ASSERT_EQ(backend->copies, 0, "no in-backend copy");
        ASSERT_EQ(backend->gets, 1, "one download");
        ASSERT_EQ(backend->puts, 1, "one upload");
        ASSERT_EQ(backend->data["gcs/bucket/a"], "payload", "streamed body");
        ASSERT_EQ(results.size(), (size_t)1, "one result");
        ASSERT_EQ(results[0].target, "gcs/bucket/a", "result target");
        PASS();
    }
    {
        TEST(copy_into_container);
        auto backend = std::make_shared<MockBackend>();
        backend->add_object("s3/bucket/dir/a.txt", 1, "x");
        backend->add_dir("gcs/bucket");
        auto env = make_env(backend);

        CopyOptions options;
        ASSERT_TRUE(!copy_targets(env, {"s3/bucket/dir/a.txt"}, "gcs/bucket", options), "copy");
        ASSERT_TRUE(backend->data.count("gcs/bucket/a.txt"), "basename joined to container");
        PASS();
    }
    {
        TEST(recursive_copy);
        auto backend = std::make_shared<MockBackend>();
        backend->add_dir("s3/src");
        backend->add_object("s3/src/one", 1, "1");
        backend->add_object("s3/src/sub/two", 1, "2");
        auto env = make_env(backend);

        CopyOptions options;
        ASSERT_EQ(kind_of(copy_targets(env, {"s3/src"}, "gcs/dst/", options)),
                  "InvalidArgument", "folder needs --recursive");

        options.recursive = true;
        ASSERT_TRUE(!copy_targets(env, {"s3/src/"}, "gcs/dst", options), "contents copy");
        ASSERT_TRUE(backend->data.count("gcs/dst/one"), "contents copied under target");
        ASSERT_TRUE(backend->data.count("gcs/dst/sub/two"), "nested key kept");

        ASSERT_TRUE(!copy_targets(env, {"s3/src"}, "gcs/other", options), "folder copy");
        ASSERT_TRUE(backend->data.count("gcs/other/src/one"), "folder name kept");
        PASS();
    }
    {
        TEST(multiple_sources_need_container);
        auto backend = std::make_shared<MockBackend>();
        backend->add_object("s3/bucket/a", 1);
        backend->add_object("s3/bucket/b", 1);
        backend->add_object("s3/bucket/file", 1);
        auto env = make_env(backend);
        CopyOptions options;
        auto err = copy_targets(env, {"s3/bucket/a", "s3/bucket/b"}, "s3/bucket/file", options);
        ASSERT_EQ(kind_of(err), "InvalidArgument", "object target rejected");
        ASSERT_EQ(backend->copies, 0, "nothing copied");
        PASS();
    }
    {
        TEST(metadata_precedence);
        auto backend = std::make_shared<MockBackend>();
        backend->add_object("s3/bucket/a", 1);
        auto env = make_env(backend);

        TransferRequest request;
        request.source_alias = "s3";
        request.target_alias = "s3";
        request.source_content.url = "s3/bucket/a";
        request.source_content.metadata = {{"content-type", "application/x-source"},
                                           {"Cache-Control", "no-cache"}};
        request.source_content.user_metadata = {{"X-Amz-Meta-Tag", "source"}};
        request.target_content.url = "s3/bucket/b";
        request.target_content.metadata = {{"Content-Type", "application/x-target"}};
        request.target_content.user_metadata = {{"x-amz-meta-tag", "target"}};

        auto result = upload_source_to_target(env, request);
        ASSERT_TRUE(result.ok(), "copy should succeed");
        auto& md = backend->last_metadata;
        ASSERT_EQ(md["Content-Type"], "application/x-target", "target metadata wins");
        ASSERT_EQ(md["X-Amz-Meta-Tag"], "target", "target user metadata wins");
        ASSERT_EQ(md["Cache-Control"], "no-cache", "source metadata kept");
        PASS();
    }
    {
        TEST(metadata_filtering);
        auto backend = std::make_shared<MockBackend>();
        backend->add_object("s3/bucket/a", 1, "body",
                            {{"Content-Type", "text/plain"},
                             {"X-Amz-Server-Side-Encryption", "AES256"},
                             {"X-Amz-Server-Side-Encryption-Customer-Algorithm", "AES256"},
                             {"Bad Key", "x"},
                             {"X-Amz-Meta-Note", "line\nbreak"}});
        auto env = make_env(backend);

        CopyOptions options;
        ASSERT_TRUE(!copy_targets(env, {"s3/bucket/a"}, "gcs/bucket/a", options), "copy");
        auto& md = backend->last_metadata;
        ASSERT_EQ(md.count("X-Amz-Server-Side-Encryption"), (size_t)0, "sse stripped");
        ASSERT_EQ(md.count("X-Amz-Server-Side-Encryption-Customer-Algorithm"), (size_t)0,
                  "sse-c stripped");
        ASSERT_EQ(md.count("Bad Key"), (size_t)0, "invalid name dropped");
        ASSERT_EQ(md.count("X-Amz-Meta-Note"), (size_t)0, "control characters dropped");
        ASSERT_EQ(md["Content-Type"], "text/plain", "valid metadata kept");

        Metadata direct = filter_metadata({{"Ok-Key", "v\tw"}, {"x(y)", "v"}});
        ASSERT_EQ(direct.size(), (size_t)1, "only the token name survives");
        PASS();
    }
    {
        TEST(retention_lock_metadata);
        auto backend = std::make_shared<MockBackend>();
        backend->add_object("s3/bucket/a", 1);
        auto env = make_env(backend);

        CopyOptions options;
        options.retention_mode = "governance";
        options.retention_duration = "30d";
        options.legal_hold = "ON";
        ASSERT_TRUE(!copy_targets(env, {"s3/bucket/a"}, "s3/bucket/b", options), "copy");
        auto& md = backend->last_metadata;
        ASSERT_EQ(md[constants::AMZ_OBJECT_LOCK_MODE], "GOVERNANCE", "lock mode");
        ASSERT_NOT_EMPTY(md[constants::AMZ_OBJECT_LOCK_RETAIN_UNTIL_DATE], "retain until");
        auto until = parse_rfc3339(md[constants::AMZ_OBJECT_LOCK_RETAIN_UNTIL_DATE]);
        ASSERT_TRUE(until && *until > std::chrono::system_clock::now() + std::chrono::hours(24 * 29),
                    "retain until is 30 days out");
        ASSERT_EQ(md[constants::AMZ_OBJECT_LOCK_LEGAL_HOLD], "ON", "legal hold");
        PASS();
    }
    {
        TEST(invalid_legal_hold_rejected);
        auto backend = std::make_shared<MockBackend>();
        backend->add_object("s3/bucket/a", 1);
        auto env = make_env(backend);

        CopyOptions options;
        options.legal_hold = "maybe";
        ASSERT_EQ(kind_of(copy_targets(env, {"s3/bucket/a"}, "s3/bucket/b", options)),
                  "InvalidArgument", "options rejected");

        TransferRequest request;
        request.source_alias = "s3";
        request.target_alias = "s3";
        request.source_content.url = "s3/bucket/a";
        request.target_content.url = "s3/bucket/b";
        request.target_content.legal_hold_enabled = true;
        request.target_content.legal_hold = "maybe";
        auto result = upload_source_to_target(env, request);
        ASSERT_EQ(kind_of(result.error), "InvalidArgument", "request rejected");
        ASSERT_EQ(backend->copies, 0, "nothing copied");
        PASS();
    }
    {
        TEST(retention_only_update);
        auto backend = std::make_shared<MockBackend>();
        backend->add_object("s3/bucket/a", 1);
        auto env = make_env(backend);

        TransferRequest request;
        request.source_alias = "s3";
        request.target_alias = "s3";
        request.source_content.url = "s3/bucket/a";
        request.source_content.retention_enabled = true;
        request.source_content.metadata = {
            {constants::AMZ_OBJECT_LOCK_MODE, "COMPLIANCE"},
            {constants::AMZ_OBJECT_LOCK_RETAIN_UNTIL_DATE, "2030-01-01T00:00:00Z"}};
        request.target_content.url = "s3/bucket/a";

        auto result = upload_source_to_target(env, request);
        ASSERT_TRUE(result.ok(), "retention update should succeed");
        ASSERT_EQ(backend->retentions, 1, "retention applied");
        ASSERT_EQ(backend->last_retention_mode, "COMPLIANCE", "retention mode");
        ASSERT_EQ(backend->copies, 0, "no content copy");
        PASS();
    }
    {
        TEST(retention_conflict_falls_back);
        auto backend = std::make_shared<MockBackend>();
        backend->add_object("s3/bucket/a", 1);
        backend->copy_error = Error(ErrorKind::RetentionConflict, "copy onto itself");
        auto env = make_env(backend);

        CopyOptions options;
        options.retention_mode = "COMPLIANCE";
        options.retention_duration = "1y";
        ASSERT_TRUE(!copy_targets(env, {"s3/bucket/a"}, "s3/bucket/a", options),
                    "self copy with retention succeeds");
        ASSERT_EQ(backend->copies, 1, "copy attempted");
        ASSERT_EQ(backend->retentions, 1, "retention set instead");
        ASSERT_EQ(backend->last_retention_mode, "COMPLIANCE", "retention mode");
        PASS();
    }
    {
        TEST(copy_failure_reported);
        auto backend = std::make_shared<MockBackend>();
        backend->add_object("s3/bucket/a", 1);
        backend->copy_error = permission_denied("Access Denied");
        auto env = make_env(backend);

        CopyOptions options;
        int failures = 0;
        options.on_result = [&failures](const PipelineResult& r) { if (!r.ok()) ++failures; };
        auto err = copy_targets(env, {"s3/bucket/a", "s3/bucket/missing"}, "s3/bucket/dir/",
                                options);
        ASSERT_EQ(kind_of(err), "PermissionDenied", "first failure returned");
        ASSERT_EQ(failures, 1, "one pipeline failure, one stat failure");
        PASS();
    }
    {
        TEST(parse_attributes);
        Metadata md;
        ASSERT_TRUE(!parse_attributes("Cache-Control=max-age=60;owner=ops;", md), "parses");
        ASSERT_EQ(md["Cache-Control"], "max-age=60", "value keeps '='");
        ASSERT_EQ(md["owner"], "ops", "second pair");
        Metadata bad;
        ASSERT_EQ(kind_of(parse_attributes("novalue", bad)), "InvalidArgument", "missing '='");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 7. Filesystem client
// ---------------------------------------------------------------------------

static void test_filesystem() {
    std::cout << "\n=== Filesystem client ===" << std::endl;

    auto tmpdir = make_temp_dir("objxfer-fs");
    Environment env;
    auto src = tmpdir / "src";
    write_file(src / "a.txt", "alpha");
    write_file(src / "sub" / "b.json", "{\"b\":1}");

    {
        TEST(stat_file_and_dir);
        auto st = stat_url(env, (src / "a.txt").string());
        ASSERT_TRUE(st.success, "stat file");
        ASSERT_TRUE(!st.content.is_dir, "file is not a dir");
        ASSERT_EQ(st.content.size, 5, "file size");
        ASSERT_EQ(st.content.metadata["Content-Type"], "text/plain", "guessed type");

        auto dir = stat_url(env, src.string());
        ASSERT_TRUE(dir.success && dir.content.is_dir, "stat dir");

        auto missing = stat_url(env, (src / "nope").string());
        ASSERT_TRUE(!missing.success && missing.error.is(ErrorKind::NotFound), "missing");

        auto preserved = stat_url(env, (src / "a.txt").string(), false, true);
        ASSERT_TRUE(preserved.success, "stat with preserve");
        auto attrs = preserved.content.user_metadata[constants::PRESERVE_ATTRS_KEY];
        ASSERT_TRUE(attrs.starts_with("atime:") && attrs.find("/mode:") != std::string::npos,
                    "attribute string");
        PASS();
    }
    {
        TEST(list_recursive_sorted);
        auto created = new_client(env, src.string());
        ASSERT_TRUE(created.success, "client");
        ListOptions options;
        options.recursive = true;
        options.dir_opt = DirOpt::First;
        auto stream = created.client->list(env.cancel, options);
        std::vector<std::string> urls;
        while (auto item = stream->next()) {
            ASSERT_TRUE(std::holds_alternative<ContentDescriptor>(*item), "no errors");
            urls.push_back(std::get<ContentDescriptor>(*item).url);
        }
        ASSERT_EQ(urls.size(), (size_t)3, "file, dir, nested file");
        ASSERT_EQ(urls[0], (src / "a.txt").string(), "first entry");
        ASSERT_EQ(urls[1], (src / "sub").string() + "/", "dir entry before children");
        ASSERT_EQ(urls[2], (src / "sub" / "b.json").string(), "nested entry");
        PASS();
    }
    {
        TEST(recursive_copy_local);
        auto dst = tmpdir / "dst";
        CopyOptions options;
        options.recursive = true;
        auto err = copy_targets(env, {src.string() + "/"}, dst.string(), options);
        ASSERT_TRUE(!err, "copy should succeed");
        ASSERT_EQ(read_file(dst / "a.txt"), "alpha", "top-level file");
        ASSERT_EQ(read_file(dst / "sub" / "b.json"), "{\"b\":1}", "nested file");
        ASSERT_TRUE(!fs::exists(dst / ("a.txt" + std::string(constants::PART_SUFFIX))),
                    "no part file left");
        PASS();
    }
    {
        TEST(copy_file_into_dir);
        auto out = tmpdir / "out";
        fs::create_directories(out);
        CopyOptions options;
        ASSERT_TRUE(!copy_targets(env, {(src / "a.txt").string()}, out.string(), options),
                    "copy");
        ASSERT_EQ(read_file(out / "a.txt"), "alpha", "basename joined");
        PASS();
    }
    {
        TEST(recursive_remove_local);
        auto dst = tmpdir / "dst";
        RemoveOptions options;
        ASSERT_EQ(kind_of(remove_targets(env, {dst.string()}, options, nullptr)),
                  "PreconditionNotMet", "dir needs --recursive");

        options.recursive = true;
        options.force = true;
        int reported = 0;
        options.on_result = [&reported](const PipelineResult&) { ++reported; };
        ASSERT_TRUE(!remove_targets(env, {dst.string()}, options, nullptr), "removal");
        ASSERT_EQ(reported, 2, "two files");
        ASSERT_TRUE(!fs::exists(dst / "a.txt"), "file removed");
        ASSERT_TRUE(!fs::exists(dst / "sub" / "b.json"), "nested file removed");
        ASSERT_TRUE(!fs::exists(dst / "sub"), "emptied directory pruned");
        ASSERT_TRUE(fs::exists(dst), "removal root kept");
        PASS();
    }
    {
        TEST(recursive_remove_keeps_busy_parent);
        auto tree = tmpdir / "tree";
        write_file(tree / "x" / "old.log", "old");
        write_file(tree / "x" / "y" / "keep.log", "keep");
        fs::last_write_time(tree / "x" / "old.log",
                            fs::file_time_type::clock::now() - std::chrono::hours(24 * 30));

        RemoveOptions options;
        options.recursive = true;
        options.force = true;
        options.older_than = "7d";
        ASSERT_TRUE(!remove_targets(env, {tree.string()}, options, nullptr), "removal");
        ASSERT_TRUE(!fs::exists(tree / "x" / "old.log"), "old file removed");
        ASSERT_EQ(read_file(tree / "x" / "y" / "keep.log"), "keep", "new file kept");
        ASSERT_TRUE(fs::exists(tree / "x" / "y"), "non-empty directory kept");
        PASS();
    }
    {
        TEST(recursive_list_and_remove_linked_dir);
        auto linked = tmpdir / "linked";
        write_file(linked / "b.txt", "b");
        write_file(linked / "real" / "a.txt", "a");
        fs::create_directory_symlink(linked / "real", linked / "link");

        auto created = new_client(env, linked.string());
        ASSERT_TRUE(created.success, "client");
        ListOptions list_options;
        list_options.recursive = true;
        list_options.dir_opt = DirOpt::None;
        auto stream = created.client->list(env.cancel, list_options);
        std::vector<std::string> urls;
        while (auto item = stream->next()) {
            ASSERT_TRUE(std::holds_alternative<ContentDescriptor>(*item), "no errors");
            const auto& content = std::get<ContentDescriptor>(*item);
            if (content.url == (linked / "link").string()) {
                ASSERT_TRUE(!content.is_dir, "link listed as a leaf");
            }
            urls.push_back(content.url);
        }
        ASSERT_EQ(urls.size(), (size_t)3, "file, link, nested file");
        ASSERT_EQ(urls[1], (linked / "link").string(), "link entry");
        ASSERT_EQ(urls[2], (linked / "real" / "a.txt").string(), "target listed once");

        auto copied = tmpdir / "linked-copy";
        CopyOptions copy_options;
        copy_options.recursive = true;
        ASSERT_TRUE(!copy_targets(env, {linked.string() + "/"}, copied.string(), copy_options),
                    "copy with link");
        ASSERT_TRUE(fs::is_symlink(copied / "link"), "link copied as a link");

        RemoveOptions options;
        options.recursive = true;
        options.force = true;
        ASSERT_TRUE(!remove_targets(env, {linked.string()}, options, nullptr), "removal");
        ASSERT_TRUE(!fs::exists(fs::symlink_status(linked / "link")), "link removed");
        ASSERT_TRUE(!fs::exists(linked / "real"), "target removed through its own path");
        ASSERT_TRUE(!fs::exists(linked / "b.txt"), "file removed");
        PASS();
    }
    {
        TEST(remove_empty_dir_single);
        auto empty = tmpdir / "empty";
        fs::create_directories(empty);
        auto st = stat_url(env, empty.string());
        ASSERT_TRUE(st.success && st.content.is_dir, "stat empty dir");
        ASSERT_TRUE(!remove_single(env, empty.string(), RemoveOptions{}, AgeFilter{}),
                    "single removal of a dir");
        ASSERT_TRUE(!fs::exists(empty), "dir removed");
        PASS();
    }
    {
        TEST(remove_incomplete_upload);
        auto part = tmpdir / ("upload.bin" + std::string(constants::PART_SUFFIX));
        write_file(part, "partial");
        auto created = new_client(env, tmpdir.string());
        ListOptions list_options;
        list_options.incomplete = true;
        auto stream = created.client->list(env.cancel, list_options);
        std::vector<std::string> urls;
        while (auto item = stream->next()) {
            if (auto* c = std::get_if<ContentDescriptor>(&*item)) urls.push_back(c->url);
        }
        ASSERT_EQ(urls.size(), (size_t)1, "one incomplete upload");
        ASSERT_EQ(urls[0], (tmpdir / "upload.bin").string(), "suffix hidden");

        RemoveOptions options;
        options.incomplete = true;
        ASSERT_TRUE(!remove_targets(env, {(tmpdir / "upload.bin").string()}, options, nullptr),
                    "remove incomplete");
        ASSERT_TRUE(!fs::exists(part), "part file removed");
        PASS();
    }
    {
        TEST(put_and_sniff);
        auto target = tmpdir / "put" / "data.json";
        MemoryReadStream body(std::vector<uint8_t>{'{', '}'});
        auto put = put_target_stream_with_url(env, target.string(), body, -1, false, false);
        ASSERT_TRUE(put.success, "put should succeed");
        ASSERT_EQ(put.bytes, 2, "bytes written");
        ASSERT_EQ(read_file(target), "{}", "body written");

        std::string png = "\x89PNG\r\n\x1a\n";
        png += std::string(32, '\0');
        write_file(tmpdir / "image", png);
        auto source = get_source_stream_from_url(env, (tmpdir / "image").string(), true);
        ASSERT_TRUE(source.success, "open source");
        ASSERT_EQ(source.metadata["Content-Type"], "image/png", "sniffed type");
        ASSERT_EQ(drain_stream(*source.stream), png, "stream rewound after sniffing");
        PASS();
    }
    {
        TEST(short_input_leaves_part_file);
        auto target = tmpdir / "short.bin";
        MemoryReadStream body(std::vector<uint8_t>(3, 'x'));
        auto put = put_target_stream_with_url(env, target.string(), body, 10, false, false);
        ASSERT_TRUE(!put.success, "size mismatch fails");
        ASSERT_TRUE(put.error.is(ErrorKind::BackendFailure), "BackendFailure");
        ASSERT_TRUE(!fs::exists(target), "target not created");
        ASSERT_TRUE(fs::exists(target.string() + constants::PART_SUFFIX), "part file kept");
        PASS();
    }
    {
        TEST(retention_unsupported);
        auto created = new_client(env, (src / "a.txt").string());
        auto err = created.client->put_retention(env.cancel, "GOVERNANCE",
                                                 std::chrono::system_clock::now(), false);
        ASSERT_EQ(kind_of(err), "InvalidArgument", "filesystem has no retention");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 8. Content types
// ---------------------------------------------------------------------------

static void test_content_types() {
    std::cout << "\n=== Content types ===" << std::endl;

    {
        TEST(guess_by_extension);
        ASSERT_EQ(guess_content_type("s3/bucket/report.PDF"), "application/pdf", "pdf");
        ASSERT_EQ(guess_content_type("/tmp/page.html"), "text/html", "html");
        ASSERT_EQ(guess_content_type("/tmp/archive.tar"), "application/x-tar", "tar");
        ASSERT_EQ(guess_content_type("/tmp/noext"), constants::DEFAULT_CONTENT_TYPE, "unknown");
        PASS();
    }
    {
        TEST(sniff_by_content);
        auto sniff = [](const std::string& s) {
            return sniff_content_type(std::span<const uint8_t>(
                reinterpret_cast<const uint8_t*>(s.data()), s.size()));
        };
        ASSERT_EQ(sniff("%PDF-1.7\n"), "application/pdf", "pdf magic");
        ASSERT_EQ(sniff("  <!DOCTYPE html><html>"), "text/html; charset=utf-8", "html");
        ASSERT_EQ(sniff("just some words\n"), "text/plain; charset=utf-8", "text");
        ASSERT_EQ(sniff(std::string("\x00\x01\x02\x03\xfe", 5)), constants::DEFAULT_CONTENT_TYPE,
                  "binary");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 9. CommandConfig
// ---------------------------------------------------------------------------

static void test_command_config() {
    std::cout << "\n=== CommandConfig ===" << std::endl;

    setenv("OBJXFER_CONFIG", "/nonexistent/objxfer/config.json", 1);
    unsetenv("AWS_ACCESS_KEY_ID");
    unsetenv("AWS_SECRET_ACCESS_KEY");

    auto tmpdir = make_temp_dir("objxfer-config");
    auto json_path = tmpdir / "config.json";

    {
        TEST(rm_flags);
        const char* args[] = {
            "objxfer", "rm", "--recursive", "--force", "--dangerous",
            "--older-than", "7d10h", "--fake", "s3/bucket", "-",
        };
        auto cfg = CommandConfig::from_args(10, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->command, "rm", "command");
        ASSERT_EQ(cfg->targets.size(), (size_t)2, "targets");
        ASSERT_EQ(cfg->targets[1], "-", "dash is positional");
        ASSERT_TRUE(cfg->recursive && cfg->force && cfg->dangerous && cfg->fake, "flags");
        ASSERT_EQ(cfg->older_than, "7d10h", "older-than");
        ASSERT_EMPTY(cfg->validate(), "valid rm");
        PASS();
    }
    {
        TEST(cp_flags);
        const char* args[] = {
            "objxfer", "cp", "-r", "--attr", "owner=ops", "--legal-hold", "on",
            "--retention-mode", "GOVERNANCE", "--retention-duration", "30d",
            "--disable-multipart", "--md5", "-a", "/tmp/src/", "s3/bucket/",
        };
        auto cfg = CommandConfig::from_args(16, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->command, "cp", "command");
        ASSERT_EQ(cfg->attr, "owner=ops", "attr");
        ASSERT_EQ(cfg->legal_hold, "ON", "legal hold upper-cased");
        ASSERT_EQ(cfg->retention_duration, "30d", "retention duration");
        ASSERT_TRUE(cfg->recursive && cfg->disable_multipart && cfg->md5 && cfg->preserve,
                    "flags");
        ASSERT_EMPTY(cfg->validate(), "valid cp");
        PASS();
    }
    {
        TEST(validation_errors);
        CommandConfig cfg;
        ASSERT_NOT_EMPTY(cfg.validate(), "command required");
        cfg.command = "mv";
        ASSERT_NOT_EMPTY(cfg.validate(), "unknown command");
        cfg.command = "cp";
        cfg.targets = {"only-one"};
        ASSERT_NOT_EMPTY(cfg.validate(), "cp needs two addresses");
        cfg.targets = {"a", "b"};
        cfg.fake = true;
        ASSERT_NOT_EMPTY(cfg.validate(), "--fake is rm only");
        cfg.command = "rm";
        cfg.targets.clear();
        ASSERT_NOT_EMPTY(cfg.validate(), "rm needs a target");
        cfg.stdin_targets = true;
        ASSERT_EMPTY(cfg.validate(), "rm with --stdin");
        PASS();
    }
    {
        TEST(unknown_option_fails);
        const char* args[] = { "objxfer", "rm", "--bogus-flag", "s3/bucket/key" };
        auto cfg = CommandConfig::from_args(4, const_cast<char**>(args));
        ASSERT_TRUE(!cfg.has_value(), "should fail on unknown flag");
        PASS();
    }
    {
        TEST(missing_flag_value_fails);
        const char* args[] = { "objxfer", "rm", "--older-than" };
        auto cfg = CommandConfig::from_args(3, const_cast<char**>(args));
        ASSERT_TRUE(!cfg.has_value(), "should fail without a value");
        PASS();
    }
    {
        TEST(json_aliases);
        write_file(json_path,
            R"({
                "aliases": {
                    "s3": {
                        "url": "https://s3.example.com/",
                        "access_key": "AKIAEXAMPLE",
                        "secret_key": "secret",
                        "region": "eu-west-1",
                        "path_style": false
                    },
                    "local-minio": { "url": "http://127.0.0.1:9000" }
                }
            })");
        std::string path_str = json_path.string();
        const char* args[] = { "objxfer", "--config", path_str.c_str(), "stat", "s3/bucket" };
        auto cfg = CommandConfig::from_args(5, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->aliases.size(), (size_t)2, "two aliases");
        auto& s3 = cfg->aliases["s3"];
        ASSERT_EQ(s3.url, "https://s3.example.com", "trailing slash stripped");
        ASSERT_EQ(s3.region, "eu-west-1", "region");
        ASSERT_TRUE(!s3.path_style, "path style");
        ASSERT_EQ(cfg->aliases["local-minio"].region, "us-east-1", "default region");
        ASSERT_EMPTY(cfg->validate(), "valid config");
        PASS();
    }
    {
        TEST(env_credentials);
        setenv("AWS_ACCESS_KEY_ID", "AKIAENV", 1);
        setenv("AWS_SECRET_ACCESS_KEY", "envsecret", 1);
        CommandConfig cfg;
        ASSERT_TRUE(cfg.load_json(json_path), "load");
        cfg.apply_defaults();
        ASSERT_EQ(cfg.aliases["local-minio"].access_key, "AKIAENV", "filled from env");
        ASSERT_EQ(cfg.aliases["s3"].access_key, "AKIAEXAMPLE", "explicit keys kept");
        unsetenv("AWS_ACCESS_KEY_ID");
        unsetenv("AWS_SECRET_ACCESS_KEY");
        PASS();
    }
    {
        TEST(bad_json_fails);
        write_file(json_path, "{ not json");
        CommandConfig cfg;
        ASSERT_TRUE(!cfg.load_json(json_path), "parse error");
        ASSERT_TRUE(!cfg.load_json("/nonexistent/config.json"), "missing file");
        PASS();
    }

    unsetenv("OBJXFER_CONFIG");
    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 10. Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;

    auto tmpdir = make_temp_dir("objxfer-metrics");
    auto prom_path = tmpdir / "objxfer.prom";

    {
        TEST(textfile_contents);
        TransferMetrics metrics(prom_path, {{"host", "test"}});
        metrics.record_object("rm", "success", 3);
        metrics.record_object("rm", "failure");
        metrics.record_bytes("cp", 4096);
        {
            ScopedTimer timer(metrics.duration("cp"));
        }
        ASSERT_TRUE(metrics.objects("rm", "success") == 3, "success count");
        ASSERT_TRUE(metrics.bytes("cp") == 4096, "byte count");
        ASSERT_TRUE(metrics.write_file(), "write should succeed");

        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("objxfer_objects_total") != std::string::npos, "objects family");
        ASSERT_TRUE(content.find("objxfer_bytes_total") != std::string::npos, "bytes family");
        ASSERT_TRUE(content.find("objxfer_object_duration_seconds") != std::string::npos,
                    "duration family");
        ASSERT_TRUE(content.find("host=\"test\"") != std::string::npos, "constant label");
        ASSERT_TRUE(content.find("result=\"failure\"") != std::string::npos, "result label");

        auto tmp_path = prom_path;
        tmp_path += ".tmp";
        ASSERT_TRUE(!fs::exists(tmp_path), ".tmp file should not persist");
        PASS();
    }
    {
        TEST(pipeline_records_metrics);
        auto backend = std::make_shared<MockBackend>();
        backend->add_dir("s3/bucket");
        backend->add_object("s3/bucket/a", 100, "1234");
        backend->add_object("s3/bucket/b", 100, "56");
        auto env = make_env(backend);
        TransferMetrics metrics(tmpdir / "pipeline.prom");
        env.metrics = &metrics;

        RemoveOptions options;
        options.recursive = true;
        options.force = true;
        ASSERT_TRUE(!remove_targets(env, {"s3/bucket"}, options, nullptr), "removal");
        ASSERT_TRUE(metrics.objects("rm", "success") == 2, "two removals counted");
        ASSERT_TRUE(metrics.bytes("rm") == 6, "removed bytes counted");
        PASS();
    }
    {
        TEST(null_timer_is_safe);
        ScopedTimer timer(nullptr);
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 11. Object-store responses
// ---------------------------------------------------------------------------

static net::HttpResponse response(int status, const std::string& body) {
    net::HttpResponse r;
    r.status_code = status;
    r.body.assign(body.begin(), body.end());
    return r;
}

static void test_s3_responses() {
    std::cout << "\n=== Object-store responses ===" << std::endl;

    {
        TEST(xml_helpers);
        std::string doc = "<ListBucketResult><Contents><Key>a&amp;b</Key></Contents>"
                          "<Contents><Key>c</Key></Contents></ListBucketResult>";
        auto contents = xml::find_elements(doc, "Contents");
        ASSERT_EQ(contents.size(), (size_t)2, "two elements");
        ASSERT_EQ(xml::decode_entities(xml::get_element(contents[0], "Key")), "a&b", "decoded");
        ASSERT_EQ(xml::get_element(doc, "Missing"), "", "absent element");
        ASSERT_EQ(xml::escape("<a & 'b'>"), "&lt;a &amp; &apos;b&apos;&gt;", "escaped");
        PASS();
    }
    {
        TEST(error_classification);
        auto err = s3_error(response(404, "<Error><Code>NoSuchKey</Code>"
                                          "<Message>gone</Message></Error>"), "bucket/key");
        ASSERT_TRUE(err.is(ErrorKind::NotFound), "NoSuchKey");
        ASSERT_TRUE(err.message.find("bucket/key") != std::string::npos, "resource named");

        ASSERT_TRUE(s3_error(response(403, "<Error><Code>AccessDenied</Code></Error>"), "k")
                        .is(ErrorKind::PermissionDenied), "AccessDenied");
        ASSERT_TRUE(s3_error(response(400, "<Error><Code>InvalidRequest</Code><Message>This copy "
                                           "request is illegal because it is trying to copy an "
                                           "object to itself</Message></Error>"), "k")
                        .is(ErrorKind::RetentionConflict), "copy onto itself");
        ASSERT_TRUE(s3_error(response(400, "<Error><Code>MalformedXML</Code></Error>"), "k")
                        .is(ErrorKind::InvalidArgument), "MalformedXML");
        ASSERT_TRUE(s3_error(response(404, ""), "k").is(ErrorKind::NotFound), "bare 404");
        ASSERT_TRUE(s3_error(response(503, ""), "k").is(ErrorKind::BackendFailure), "503");

        net::HttpResponse down;
        down.is_network_error = true;
        down.error = "Could not resolve host";
        ASSERT_TRUE(s3_error(down, "k").is(ErrorKind::BackendFailure), "network error");
        PASS();
    }
    {
        TEST(object_store_client_rejects_alias_only);
        LocationResolver resolver;
        AliasConfig cfg;
        cfg.url = "http://127.0.0.1:1";
        resolver.add_alias("s3", cfg);
        S3Client client(resolver.resolve("s3"));
        auto st = client.stat(CancellationToken{}, false, false, std::nullopt);
        ASSERT_TRUE(!st.success && st.error.is(ErrorKind::InvalidArgument), "alias only");
        PASS();
    }
    {
        TEST(content_range_total);
        ASSERT_TRUE(parse_content_range_total("bytes 0-8388607/20971520") == 20971520ULL,
                    "total parsed");
        ASSERT_TRUE(!parse_content_range_total("bytes 0-9/*"), "unknown total");
        ASSERT_TRUE(!parse_content_range_total(""), "missing header");
        PASS();
    }
    {
        TEST(ranged_read_buffers_one_range);
        std::string object = "0123456789";
        std::vector<std::pair<uint64_t, uint64_t>> fetched;
        auto fetch = [&](uint64_t first, uint64_t last, std::vector<uint8_t>& body)
            -> std::optional<Error> {
            fetched.emplace_back(first, last);
            body.assign(object.begin() + static_cast<std::ptrdiff_t>(first),
                        object.begin() + static_cast<std::ptrdiff_t>(last + 1));
            return std::nullopt;
        };
        ContentDescriptor info;
        info.url = "s3/bucket/digits";
        info.size = static_cast<int64_t>(object.size());
        RangedObjectReadStream stream(fetch, info, 4);
        stream.prime(0, std::vector<uint8_t>{'0', '1', '2', '3'});

        std::string out;
        uint8_t buf[3];
        size_t largest = 0;
        while (true) {
            size_t n = 0;
            ASSERT_TRUE(!stream.read(std::span<uint8_t>(buf, sizeof(buf)), n), "read");
            if (n == 0) break;
            out.append(reinterpret_cast<const char*>(buf), n);
            largest = std::max(largest, stream.buffered());
        }
        ASSERT_EQ(out, object, "whole object");
        ASSERT_EQ(fetched.size(), (size_t)2, "primed range not refetched");
        ASSERT_TRUE(fetched[0] == std::pair<uint64_t, uint64_t>(4, 7), "second range");
        ASSERT_TRUE(fetched[1] == std::pair<uint64_t, uint64_t>(8, 9), "short last range");
        ASSERT_TRUE(largest <= 4, "one range held at a time");
        ASSERT_EQ(stream.object_info()->size, 10, "object size kept");

        ASSERT_TRUE(!stream.seek(0), "rewind");
        ASSERT_EQ(drain_stream(stream), object, "read again after rewind");
        ASSERT_EQ(kind_of(stream.seek(11)), "InvalidArgument", "seek past end");
        PASS();
    }
    {
        TEST(ranged_read_reports_fetch_failure);
        auto fetch = [](uint64_t, uint64_t, std::vector<uint8_t>&) -> std::optional<Error> {
            return s3_error(response(412, "<Error><Code>PreconditionFailed</Code></Error>"),
                            "s3/bucket/changing");
        };
        ContentDescriptor info;
        info.url = "s3/bucket/changing";
        info.size = 8;
        RangedObjectReadStream stream(fetch, info, 4);
        stream.prime(0, std::vector<uint8_t>{'a', 'b', 'c', 'd'});
        std::vector<uint8_t> buf(8);
        size_t n = 0;
        ASSERT_TRUE(!stream.read(buf, n) && n == 4, "primed bytes served");
        ASSERT_TRUE(stream.read(buf, n).has_value(), "changed object fails the read");

        auto empty = [](uint64_t, uint64_t, std::vector<uint8_t>& body) -> std::optional<Error> {
            body.clear();
            return std::nullopt;
        };
        RangedObjectReadStream truncated(empty, info, 4);
        ASSERT_EQ(kind_of(truncated.read(buf, n)), "BackendFailure", "short object");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "objxfer test suite" << std::endl;
    std::cout << "==================" << std::endl;

    test_encryption_registry();
    test_durations();
    test_location();
    test_channels();
    test_remove();
    test_copy();
    test_filesystem();
    test_content_types();
    test_command_config();
    test_metrics();
    test_s3_responses();

    std::cout << "\n==================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
