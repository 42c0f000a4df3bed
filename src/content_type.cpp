#include "objxfer/content_type.hpp"
#include "objxfer/constants.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <unordered_map>

namespace objxfer {

std::string guess_content_type(const std::string& path) {
    static const std::unordered_map<std::string, std::string> mime_types = {
        {".txt", "text/plain"},
        {".log", "text/plain"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".csv", "text/csv"},
        {".md", "text/markdown"},
        {".js", "application/javascript"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".yaml", "application/yaml"},
        {".yml", "application/yaml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tgz", "application/gzip"},
        {".bz2", "application/x-bzip2"},
        {".xz", "application/x-xz"},
        {".7z", "application/x-7z-compressed"},
        {".tar", "application/x-tar"},
        {".wasm", "application/wasm"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".webp", "image/webp"},
        {".ico", "image/x-icon"},
        {".bmp", "image/bmp"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".ogg", "audio/ogg"},
        {".mp4", "video/mp4"},
        {".webm", "video/webm"},
        {".mov", "video/quicktime"},
    };

    size_t slash = path.find_last_of('/');
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return constants::DEFAULT_CONTENT_TYPE;
    }

    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    auto it = mime_types.find(ext);
    if (it != mime_types.end()) {
        return it->second;
    }
    return constants::DEFAULT_CONTENT_TYPE;
}

namespace {

struct Signature {
    size_t offset;
    const char* magic;
    size_t length;
    const char* mime;
};

bool matches(std::span<const uint8_t> head, const Signature& sig) {
    if (head.size() < sig.offset + sig.length) return false;
    return std::memcmp(head.data() + sig.offset, sig.magic, sig.length) == 0;
}

bool looks_like_text(std::span<const uint8_t> head) {
    for (uint8_t c : head) {
        // Control bytes other than whitespace mark binary data
        if (c < 0x20 && c != '\t' && c != '\n' && c != '\r' && c != '\f' && c != 0x1b) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string sniff_content_type(std::span<const uint8_t> head) {
    static const Signature signatures[] = {
        {0, "\x89PNG\r\n\x1a\n", 8, "image/png"},
        {0, "\xff\xd8\xff", 3, "image/jpeg"},
        {0, "GIF87a", 6, "image/gif"},
        {0, "GIF89a", 6, "image/gif"},
        {0, "BM", 2, "image/bmp"},
        {0, "%PDF-", 5, "application/pdf"},
        {0, "PK\x03\x04", 4, "application/zip"},
        {0, "\x1f\x8b\x08", 3, "application/x-gzip"},
        {0, "BZh", 3, "application/x-bzip2"},
        {0, "\xfd" "7zXZ\x00", 6, "application/x-xz"},
        {0, "7z\xbc\xaf\x27\x1c", 6, "application/x-7z-compressed"},
        {257, "ustar", 5, "application/x-tar"},
        {0, "\x7f" "ELF", 4, "application/x-elf"},
        {0, "\x00asm", 4, "application/wasm"},
        {0, "OggS", 4, "application/ogg"},
        {0, "ID3", 3, "audio/mpeg"},
        {0, "\x1a\x45\xdf\xa3", 4, "video/webm"},
    };

    if (head.size() > constants::CONTENT_SNIFF_SIZE) {
        head = head.first(constants::CONTENT_SNIFF_SIZE);
    }

    for (const auto& sig : signatures) {
        if (matches(head, sig)) return sig.mime;
    }

    // RIFF containers
    if (head.size() >= 12 && std::memcmp(head.data(), "RIFF", 4) == 0) {
        if (std::memcmp(head.data() + 8, "WEBP", 4) == 0) return "image/webp";
        if (std::memcmp(head.data() + 8, "WAVE", 4) == 0) return "audio/wave";
        if (std::memcmp(head.data() + 8, "AVI ", 4) == 0) return "video/avi";
    }

    // ISO base media: "....ftyp"
    if (head.size() >= 12 && std::memcmp(head.data() + 4, "ftyp", 4) == 0) {
        return "video/mp4";
    }

    if (head.empty()) {
        return "text/plain; charset=utf-8";
    }

    // Skip leading whitespace for markup detection
    size_t i = 0;
    while (i < head.size() && std::isspace(head[i])) ++i;
    auto rest = head.subspan(i);
    auto starts_with_ci = [&](const char* prefix) {
        size_t n = std::strlen(prefix);
        if (rest.size() < n) return false;
        for (size_t k = 0; k < n; ++k) {
            if (std::tolower(rest[k]) != std::tolower(static_cast<unsigned char>(prefix[k]))) {
                return false;
            }
        }
        return true;
    };
    if (starts_with_ci("<!doctype html") || starts_with_ci("<html")) {
        return "text/html; charset=utf-8";
    }
    if (starts_with_ci("<?xml")) {
        return "text/xml; charset=utf-8";
    }

    if (looks_like_text(head)) {
        return "text/plain; charset=utf-8";
    }
    return constants::DEFAULT_CONTENT_TYPE;
}

}  // namespace objxfer
