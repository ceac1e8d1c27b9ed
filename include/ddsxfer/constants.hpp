#pragma once

#include <cstddef>
#include <cstdint>

namespace ddsxfer::constants {

constexpr uint64_t MB_TO_BYTES = 1024 * 1024;

// Chunking defaults
constexpr uint64_t DEFAULT_UPLOAD_BYTES_PER_CHUNK = 100 * MB_TO_BYTES;
constexpr uint64_t DOWNLOAD_FILE_CHUNK_SIZE = 20 * MB_TO_BYTES;       // stream read size
constexpr uint64_t MIN_DOWNLOAD_CHUNK_SIZE = DOWNLOAD_FILE_CHUNK_SIZE;  // smallest range per worker
constexpr size_t MAX_DEFAULT_WORKERS = 8;

// Control-plane API retry settings
constexpr int CONNECTION_RETRY_TIMES = 5;
constexpr int CONNECTION_RETRY_SECONDS = 1;
constexpr int SERVICE_DOWN_RETRY_SECONDS = 60;           // 503 during maintenance windows
constexpr int RESOURCE_NOT_CONSISTENT_RETRY_SECONDS = 2;  // waits forever unless capped

// Backend store retry settings
constexpr int SEND_EXTERNAL_PUT_RETRY_TIMES = 4;
constexpr int SEND_EXTERNAL_RETRY_SECONDS = 20;
constexpr int SEND_EXTERNAL_FORBIDDEN_RETRY_TIMES = 2;
constexpr int FETCH_EXTERNAL_RETRY_TIMES = 5;
constexpr int FETCH_EXTERNAL_RETRY_SECONDS = 20;
constexpr int EXPIRED_URL_RETRY_TIMES = 5;

// Status codes the object stores use for an expired signed URL
constexpr int SWIFT_EXPIRED_STATUS_CODE = 401;
constexpr int S3_EXPIRED_STATUS_CODE = 403;

// Executor polling
constexpr int EXECUTOR_IDLE_SLEEP_MS = 1;

// Wire values
constexpr const char* DEFAULT_HASH_ALGORITHM = "md5";
constexpr const char* RESOURCE_NOT_CONSISTENT_CODE = "resource_not_consistent";
constexpr const char* USER_AGENT = "ddsxfer/1.0";

} // namespace ddsxfer::constants
