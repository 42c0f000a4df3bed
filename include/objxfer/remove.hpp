#pragma once

#include "objxfer/client.hpp"
#include "objxfer/durations.hpp"
#include "objxfer/transfer.hpp"

#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace objxfer {

// Options for the rm command
struct RemoveOptions {
    bool recursive = false;
    bool force = false;
    bool dangerous = false;
    bool incomplete = false;      // remove in-progress uploads instead of objects
    bool fake = false;            // report candidates, remove nothing
    bool stdin_targets = false;   // read more targets from standard input
    bool bypass = false;          // bypass governance retention
    std::string older_than;
    std::string newer_than;

    // Called once per removal candidate before it is removed
    std::function<void(const PipelineResult&)> on_result;
};

/// Gate removal before any listing starts: folders need --recursive,
/// recursive or stdin removal needs --force, and removing a whole alias
/// namespace also needs --dangerous.
std::optional<Error> check_remove_syntax(const Environment& env,
                                         const std::vector<std::string>& targets,
                                         const RemoveOptions& options);

/// Stat then remove one address. A missing target is only an error
/// without --force.
std::optional<Error> remove_single(const Environment& env, const std::string& url,
                                   const RemoveOptions& options, const AgeFilter& filter);

/// List url recursively and feed surviving entries to the backend's bulk
/// remove. Permission failures are logged and skipped; anything else stops
/// the run. Returns the stopping error, or a PermissionDenied error when
/// entries were skipped.
std::optional<Error> remove_recursive(const Environment& env, const std::string& url,
                                      const RemoveOptions& options, const AgeFilter& filter);

/// rm entry point. Targets run one after another; the first failure is
/// returned but later targets are still attempted. With stdin_targets, lines
/// of input are processed after the explicit targets.
std::optional<Error> remove_targets(const Environment& env, const std::vector<std::string>& targets,
                                    const RemoveOptions& options, std::istream* input);

}  // namespace objxfer
