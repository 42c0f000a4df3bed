#include "objxfer/remove.hpp"
#include "objxfer/constants.hpp"
#include "objxfer/log.hpp"
#include "objxfer/metrics.hpp"

#include <string>

namespace objxfer {

namespace {

const char* const FORCE_MESSAGE =
    "Removal requires --force flag. This operation is *IRREVERSIBLE*. "
    "Please review carefully before performing this *DANGEROUS* operation.";
const char* const RECURSIVE_MESSAGE =
    "Removal requires --recursive flag. This operation is *IRREVERSIBLE*. "
    "Please review carefully before performing this *DANGEROUS* operation.";
const char* const DANGEROUS_MESSAGE =
    "This operation results in site-wide removal of objects. If you are really sure, "
    "retry this command with '--dangerous' and '--force' flags.";

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool is_namespace(const Environment& env, const std::string& url) {
    std::string cleaned = clean_path(url);
    while (cleaned.size() > 1 && cleaned.back() == '/') cleaned.pop_back();
    Location location = env.resolver.resolve(cleaned);
    return !location.is_filesystem() && location.path.empty();
}

void report(const RemoveOptions& options, const std::string& key, int64_t size) {
    if (!options.on_result) return;
    PipelineResult result;
    result.key = key;
    result.size = size;
    result.dry_run = options.fake;
    options.on_result(result);
}

}  // namespace

std::optional<Error> check_remove_syntax(const Environment& env,
                                         const std::vector<std::string>& targets,
                                         const RemoveOptions& options) {
    if (targets.empty() && !options.stdin_targets) {
        return invalid_argument("no target to remove");
    }

    bool namespace_removal = false;
    for (const auto& url : targets) {
        if (is_namespace(env, url)) {
            namespace_removal = true;
            continue;
        }
        if (!is_container_like(env, url)) continue;
        if (options.recursive && !options.force) {
            return precondition_not_met(FORCE_MESSAGE).with_trace({url});
        }
        if (!options.recursive) {
            return precondition_not_met(RECURSIVE_MESSAGE).with_trace({url});
        }
    }

    bool bulk = options.recursive || options.stdin_targets;
    if (bulk && !options.force) {
        return precondition_not_met(namespace_removal ? DANGEROUS_MESSAGE : FORCE_MESSAGE);
    }
    if (bulk && namespace_removal && !options.dangerous) {
        return precondition_not_met(DANGEROUS_MESSAGE);
    }
    return std::nullopt;
}

std::optional<Error> remove_single(const Environment& env, const std::string& url,
                                   const RemoveOptions& options, const AgeFilter& filter) {
    auto st = stat_url(env, url, options.incomplete);
    if (!st.success) {
        if (st.error.is(ErrorKind::NotFound) && options.force) {
            return std::nullopt;
        }
        Error err = st.error.with_trace({url});
        log_error("Failed to remove '%s': %s", url.c_str(), err.to_string().c_str());
        return err;
    }

    const auto& content = st.content;
    if (filter.active() && filter.excludes(content.time)) {
        log_debug("Skipping '%s': outside age filter", url.c_str());
        return std::nullopt;
    }

    report(options, url, content.size);
    if (options.fake) {
        return std::nullopt;
    }

    auto created = new_client(env, url);
    if (!created.success) {
        log_error("Invalid argument '%s': %s", url.c_str(), created.error.to_string().c_str());
        return created.error;
    }

    ContentDescriptor target;
    target.url = url;
    target.is_dir = content.is_dir;
    if (content.is_dir && url.back() != '/') target.url += "/";

    auto feed = std::make_shared<DescriptorChannel>(1);
    feed->send(std::move(target));
    feed->close();

    ScopedTimer timer(env.metrics ? env.metrics->duration("rm") : nullptr);
    auto errors = created.client->remove(env.cancel.child(), options.incomplete, false,
                                         options.bypass, feed);
    std::optional<Error> skipped;
    while (auto err = errors->next()) {
        Error traced = err->with_trace({url});
        log_error("Failed to remove '%s': %s", url.c_str(), traced.to_string().c_str());
        if (env.metrics) env.metrics->record_object("rm", "failure");
        if (traced.is(ErrorKind::PermissionDenied)) {
            skipped = traced;
            continue;
        }
        return traced;
    }
    if (skipped) return skipped;

    if (env.metrics) {
        env.metrics->record_object("rm", "success");
        env.metrics->record_bytes("rm", static_cast<uint64_t>(content.size));
    }
    return std::nullopt;
}

std::optional<Error> remove_recursive(const Environment& env, const std::string& url,
                                      const RemoveOptions& options, const AgeFilter& filter) {
    auto created = new_client(env, url);
    if (!created.success) {
        log_error("Failed to remove '%s' recursively: %s", url.c_str(),
                  created.error.to_string().c_str());
        return created.error;
    }
    Client& client = *created.client;

    // Scoped to this target: aborting here leaves later targets alone
    CancellationToken cancel = env.cancel.child();

    auto selector = std::make_shared<Selector>();
    auto feed = std::make_shared<DescriptorChannel>(constants::REMOVE_QUEUE_DEPTH);
    feed->attach(selector);

    std::unique_ptr<ErrorStream> errors;
    if (!options.fake) {
        errors = client.remove(cancel, options.incomplete, false, options.bypass, feed);
        errors->channel().attach(selector);
    }

    ListOptions list_options;
    list_options.recursive = true;
    list_options.incomplete = options.incomplete;
    list_options.dir_opt = DirOpt::None;
    auto contents = client.list(cancel, list_options);

    uint64_t sent = 0;
    uint64_t sent_bytes = 0;
    uint64_t failed = 0;
    std::optional<Error> skipped;

    // Close the feed, then wait out every failure the remover still reports.
    auto drain = [&]() -> std::optional<Error> {
        feed->close();
        std::optional<Error> fatal;
        if (errors) {
            while (auto err = errors->next()) {
                ++failed;
                log_error("Failed to remove '%s' recursively: %s", url.c_str(),
                          err->to_string().c_str());
                if (err->is(ErrorKind::PermissionDenied)) {
                    if (!skipped) skipped = *err;
                    continue;
                }
                if (!fatal) {
                    fatal = *err;
                    cancel.cancel();
                }
            }
        }
        if (env.metrics && !options.fake) {
            env.metrics->record_object("rm", "failure", static_cast<double>(failed));
            if (sent > failed) {
                env.metrics->record_object("rm", "success", static_cast<double>(sent - failed));
            }
            env.metrics->record_bytes("rm", sent_bytes);
        }
        return fatal;
    };

    auto abort = [&](const Error& err) -> std::optional<Error> {
        cancel.cancel();
        contents.reset();
        if (auto late = drain()) {
            log_debug("Dropped after abort: %s", late->to_string().c_str());
        }
        return err;
    };

    while (auto item = contents->next()) {
        if (auto* err = std::get_if<Error>(&*item)) {
            Error traced = err->with_trace({url});
            log_error("Failed to remove '%s' recursively: %s", url.c_str(),
                      traced.to_string().c_str());
            if (traced.is(ErrorKind::PermissionDenied)) {
                if (!skipped) skipped = traced;
                continue;
            }
            return abort(traced);
        }

        auto& content = std::get<ContentDescriptor>(*item);
        // Prefix-level entries carry no time
        if (!content.has_time()) continue;
        if (filter.active() && filter.excludes(content.time)) continue;

        report(options, content.url, content.size);
        if (options.fake) continue;

        int64_t size = content.size;
        std::string key = content.url;
        bool delivered = false;
        while (!delivered) {
            std::optional<Error> received;
            switch (send_or_receive(feed.get(), content, errors->channel(), received, *selector)) {
                case SelectOutcome::Sent:
                    delivered = true;
                    break;
                case SelectOutcome::Received: {
                    ++failed;
                    Error traced = received->with_trace({key});
                    log_error("Failed to remove '%s': %s", key.c_str(), traced.to_string().c_str());
                    if (traced.is(ErrorKind::PermissionDenied)) {
                        if (!skipped) skipped = traced;
                        continue;
                    }
                    return abort(traced);
                }
                case SelectOutcome::SendClosed:
                case SelectOutcome::ReceiveClosed:
                    return abort(backend_failure("removal of '" + url + "' was cancelled"));
            }
        }
        ++sent;
        sent_bytes += static_cast<uint64_t>(size > 0 ? size : 0);
    }

    if (auto fatal = drain()) {
        return fatal->with_trace({url});
    }
    if (cancel.cancelled()) {
        return backend_failure("removal of '" + url + "' was cancelled");
    }
    return skipped;
}

std::optional<Error> remove_targets(const Environment& env, const std::vector<std::string>& targets,
                                    const RemoveOptions& options, std::istream* input) {
    AgeFilter filter;
    if (auto err = AgeFilter::parse(options.older_than, options.newer_than, filter)) {
        return err;
    }
    if (auto err = check_remove_syntax(env, targets, options)) {
        return err;
    }

    std::optional<Error> first_error;
    auto run = [&](const std::string& url) {
        if (env.cancel.cancelled()) return;
        auto err = options.recursive ? remove_recursive(env, url, options, filter)
                                     : remove_single(env, url, options, filter);
        if (err && !first_error) first_error = err;
    };

    for (const auto& url : targets) {
        run(url);
    }

    if (options.stdin_targets && input) {
        std::string line;
        while (std::getline(*input, line)) {
            std::string url = trim(line);
            if (url.empty()) continue;
            run(url);
        }
    }
    return first_error;
}

}  // namespace objxfer
