#include "ddsxfer/errors.hpp"

namespace ddsxfer {

namespace {

std::string format_service_error(int status_code, const std::string& url_suffix,
                                 const std::string& reason, const std::string& suggestion) {
    return "Error " + std::to_string(status_code) + " on " + url_suffix +
           "\nReason:" + reason + "\nSuggestion:" + suggestion;
}

}  // namespace

DataServiceError::DataServiceError(int status_code, const std::string& url_suffix,
                                   const std::string& reason, const std::string& suggestion)
    : std::runtime_error(format_service_error(status_code, url_suffix, reason, suggestion))
    , status_code_(status_code)
    , url_suffix_(url_suffix)
    , reason_(reason) {}

DownloadInconsistentError::DownloadInconsistentError(const std::string& what,
                                                     uint64_t actual_bytes,
                                                     uint64_t expected_bytes)
    : std::runtime_error(what)
    , actual_bytes_(actual_bytes)
    , expected_bytes_(expected_bytes) {}

TooLargeChunkDownloadError::TooLargeChunkDownloadError(uint64_t actual_bytes, uint64_t expected_bytes,
                                                       const std::string& path)
    : DownloadInconsistentError(
          "Received too many bytes downloading part of a file. Actual: " + std::to_string(actual_bytes) +
              " Expected: " + std::to_string(expected_bytes) + " File:" + path,
          actual_bytes, expected_bytes) {}

PartialChunkDownloadError::PartialChunkDownloadError(uint64_t actual_bytes, uint64_t expected_bytes,
                                                     const std::string& path)
    : DownloadInconsistentError(
          "Received too few bytes downloading part of a file. Actual: " + std::to_string(actual_bytes) +
              " Expected: " + std::to_string(expected_bytes) + " File:" + path,
          actual_bytes, expected_bytes) {}

TaskFailedError::TaskFailedError(int task_id, const std::string& error_text)
    : std::runtime_error(error_text), task_id_(task_id) {}

}  // namespace ddsxfer
