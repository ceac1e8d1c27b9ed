#pragma once

#include "ddsxfer/constants.hpp"
#include "ddsxfer/http.hpp"
#include "ddsxfer/metrics.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace ddsxfer {

/// Retry and backoff policy shared by the upload and download engines.
struct RetrySettings {
    // Control-plane API
    int connection_retry_times = constants::CONNECTION_RETRY_TIMES;
    int connection_retry_seconds = constants::CONNECTION_RETRY_SECONDS;
    int service_down_retry_seconds = constants::SERVICE_DOWN_RETRY_SECONDS;

    // Eventual consistency. 0 retries means wait until the service converges.
    int resource_not_consistent_retry_seconds = constants::RESOURCE_NOT_CONSISTENT_RETRY_SECONDS;
    int resource_not_consistent_max_retries = 0;

    // Signed-URL transfers
    int send_external_put_retry_times = constants::SEND_EXTERNAL_PUT_RETRY_TIMES;
    int send_external_retry_seconds = constants::SEND_EXTERNAL_RETRY_SECONDS;
    int send_external_forbidden_retry_times = constants::SEND_EXTERNAL_FORBIDDEN_RETRY_TIMES;
    int fetch_external_retry_times = constants::FETCH_EXTERNAL_RETRY_TIMES;
    int fetch_external_retry_seconds = constants::FETCH_EXTERNAL_RETRY_SECONDS;
    int expired_url_retry_times = constants::EXPIRED_URL_RETRY_TIMES;
};

/// Settings for a transfer run: service endpoint, credentials, chunking
/// and worker counts.
struct TransferConfig {
    // Control-plane endpoint, e.g. https://api.example.org/api/v1
    std::string url;
    std::string auth_token;

    uint64_t upload_bytes_per_chunk = constants::DEFAULT_UPLOAD_BYTES_PER_CHUNK;
    uint64_t download_min_chunk_size = constants::MIN_DOWNLOAD_CHUNK_SIZE;

    // 0 = pick from the CPU count in apply_defaults()
    size_t upload_workers = 0;
    size_t download_workers = 0;

    bool verbose = false;
    bool verify_ssl = true;

    // Prometheus .prom file for node_exporter textfile collector (empty = off)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    RetrySettings retry;

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Overlay DDSXFER_* environment variables.
    void load_env();

    /// Fill in worker counts left at 0.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    /// Defaults, then `path` (if given), then the environment.
    /// Throws ConfigError when the result is unusable.
    static TransferConfig load(const std::filesystem::path& path = {});

    static size_t default_upload_workers();
    static size_t default_download_workers();
};

/// Parse a byte size given as a plain number or with an "MB" suffix ("100MB").
/// Throws ConfigError on malformed input.
uint64_t parse_byte_size(const std::string& text);

/// libcurl session settings taken from `config`: TLS verification, verbose
/// tracing and the client User-Agent.
HttpClientConfig http_client_config(const TransferConfig& config);

TransportFactory curl_transport_factory(const TransferConfig& config);

/// Metrics registry writing `config.metrics_file` every
/// `config.metrics_interval_secs` once started. With no metrics_file the
/// metrics stay in memory.
std::unique_ptr<TransferMetrics> make_transfer_metrics(const TransferConfig& config);

}  // namespace ddsxfer
