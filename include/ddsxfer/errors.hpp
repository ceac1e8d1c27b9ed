#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ddsxfer {

/// Error response from the control-plane API.
class DataServiceError : public std::runtime_error {
public:
    DataServiceError(int status_code, const std::string& url_suffix,
                     const std::string& reason, const std::string& suggestion = "");

    int status_code() const { return status_code_; }
    const std::string& url_suffix() const { return url_suffix_; }
    const std::string& reason() const { return reason_; }

private:
    int status_code_;
    std::string url_suffix_;
    std::string reason_;
};

/// The resource was just written and the backing store has not converged yet.
/// Retrying later is expected to succeed.
class ResourceNotConsistentError : public DataServiceError {
public:
    using DataServiceError::DataServiceError;
};

/// Network-level failure: no HTTP status was received.
class ConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A signed chunk URL was refused with 403; the caller must issue a new URL.
class ForbiddenSendExternalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Unexpected status from the object store behind a signed URL.
class ExternalStoreError : public std::runtime_error {
public:
    ExternalStoreError(const std::string& message, int status_code)
        : std::runtime_error(message), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

/// A ranged download returned a different number of bytes than requested.
class DownloadInconsistentError : public std::runtime_error {
public:
    DownloadInconsistentError(const std::string& what, uint64_t actual_bytes, uint64_t expected_bytes);

    uint64_t actual_bytes() const { return actual_bytes_; }
    uint64_t expected_bytes() const { return expected_bytes_; }

private:
    uint64_t actual_bytes_;
    uint64_t expected_bytes_;
};

class TooLargeChunkDownloadError : public DownloadInconsistentError {
public:
    TooLargeChunkDownloadError(uint64_t actual_bytes, uint64_t expected_bytes, const std::string& path);
};

class PartialChunkDownloadError : public DownloadInconsistentError {
public:
    PartialChunkDownloadError(uint64_t actual_bytes, uint64_t expected_bytes, const std::string& path);
};

/// File contents could not be validated against the server-reported hashes.
class HashValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A worker task raised; the text of the original error is carried to the controller.
class TaskFailedError : public std::runtime_error {
public:
    TaskFailedError(int task_id, const std::string& error_text);

    int task_id() const { return task_id_; }

private:
    int task_id_;
};

/// Work abandoned because a sibling task failed and the run is stopping.
class TaskCancelledError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace ddsxfer
