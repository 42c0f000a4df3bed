#pragma once

#include <cstddef>
#include <cstdint>

namespace objxfer::constants {

// Transfer defaults
constexpr uint64_t DEFAULT_MULTIPART_THRESHOLD = 64ULL * 1024 * 1024;        // 64MB
constexpr uint64_t DEFAULT_MULTIPART_PART_SIZE = 5ULL * 1024 * 1024;         // 5MB (S3 minimum part size)
constexpr uint64_t MAX_SINGLE_COPY_SIZE = 5ULL * 1024 * 1024 * 1024;         // 5GB server-side copy limit
constexpr uint64_t DEFAULT_COPY_PART_SIZE = 512ULL * 1024 * 1024;            // 512MB
constexpr uint64_t GET_RANGE_SIZE = 8ULL * 1024 * 1024;                      // 8MB per ranged GET
constexpr size_t DEFAULT_UPLOAD_CONCURRENCY = 4;
constexpr size_t CONTENT_SNIFF_SIZE = 512;
constexpr size_t STREAM_BUFFER_SIZE = 1024 * 1024;                           // 1MB

// Bulk operation defaults
constexpr size_t REMOVE_QUEUE_DEPTH = 1000;
constexpr size_t LIST_QUEUE_DEPTH = 1000;
constexpr size_t MAX_DELETE_BATCH = 1000;                                    // S3 multi-object delete limit
constexpr uint32_t LIST_PAGE_SIZE = 1000;

// Encryption
constexpr size_t ENCRYPTION_KEY_SIZE = 32;
constexpr size_t ENCRYPTION_KEY_BASE64_SIZE = 44;

// HTTP request defaults
constexpr int DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS = 10;
constexpr int DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS = 300;
constexpr int DEFAULT_HTTP_MAX_RETRIES = 3;

// Filesystem
constexpr const char* PART_SUFFIX = ".part.objxfer";
constexpr const char* DEFAULT_CONTENT_TYPE = "application/octet-stream";

// Pseudo-metadata recognized by the copy pipeline and stripped before transmission
constexpr const char* AMZ_OBJECT_LOCK_MODE = "X-Amz-Object-Lock-Mode";
constexpr const char* AMZ_OBJECT_LOCK_RETAIN_UNTIL_DATE = "X-Amz-Object-Lock-Retain-Until-Date";
constexpr const char* AMZ_OBJECT_LOCK_LEGAL_HOLD = "X-Amz-Object-Lock-Legal-Hold";
constexpr const char* SERVER_ENCRYPTION_KEY_PREFIX = "X-Amz-Server-Side-Encryption";
constexpr const char* PRESERVE_ATTRS_KEY = "X-Amz-Meta-Objxfer-Attrs";

// Configuration
constexpr const char* DEFAULT_CONFIG_DIR = ".objxfer";
constexpr const char* DEFAULT_CONFIG_FILE = "config.json";
constexpr const char* DEFAULT_REGION = "us-east-1";
constexpr const char* USER_AGENT = "objxfer/1.0";

} // namespace objxfer::constants
