#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace objxfer {

/// Guess a MIME type from the file extension of a path or key.
/// Returns application/octet-stream when unknown.
std::string guess_content_type(const std::string& path);

/// Detect a MIME type from the leading bytes of a stream (at most 512 are
/// examined). Returns application/octet-stream when nothing matches.
std::string sniff_content_type(std::span<const uint8_t> head);

}  // namespace objxfer
