#include "ddsxfer/transfer_config.hpp"
#include "ddsxfer/errors.hpp"
#include "ddsxfer/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <thread>
#include <nlohmann/json.hpp>

namespace ddsxfer {

namespace {

uint64_t json_byte_size(const nlohmann::json& value) {
    if (value.is_number_unsigned()) return value.get<uint64_t>();
    if (value.is_number_integer()) {
        auto signed_value = value.get<int64_t>();
        if (signed_value < 0) throw ConfigError("byte size must not be negative");
        return static_cast<uint64_t>(signed_value);
    }
    if (value.is_string()) return parse_byte_size(value.get<std::string>());
    throw ConfigError("byte size must be a number or a string like \"100MB\"");
}

void load_retry_json(const nlohmann::json& j, RetrySettings& retry) {
    auto read_int = [&](const char* key, int& field) {
        if (j.contains(key)) field = j[key].get<int>();
    };
    read_int("connection_retry_times", retry.connection_retry_times);
    read_int("connection_retry_seconds", retry.connection_retry_seconds);
    read_int("service_down_retry_seconds", retry.service_down_retry_seconds);
    read_int("resource_not_consistent_retry_seconds", retry.resource_not_consistent_retry_seconds);
    read_int("resource_not_consistent_max_retries", retry.resource_not_consistent_max_retries);
    read_int("send_external_put_retry_times", retry.send_external_put_retry_times);
    read_int("send_external_retry_seconds", retry.send_external_retry_seconds);
    read_int("send_external_forbidden_retry_times", retry.send_external_forbidden_retry_times);
    read_int("fetch_external_retry_times", retry.fetch_external_retry_times);
    read_int("fetch_external_retry_seconds", retry.fetch_external_retry_seconds);
    read_int("expired_url_retry_times", retry.expired_url_retry_times);
}

size_t env_count(const char* name, size_t current) {
    const char* env = std::getenv(name);
    if (!env || !*env) return current;
    try {
        return std::stoul(env);
    } catch (const std::exception&) {
        log_error("invalid %s=%s, ignoring", name, env);
        return current;
    }
}

}  // namespace

uint64_t parse_byte_size(const std::string& text) {
    std::string digits = text;
    uint64_t multiplier = 1;
    if (digits.size() > 2) {
        std::string suffix = digits.substr(digits.size() - 2);
        std::transform(suffix.begin(), suffix.end(), suffix.begin(),
                       [](unsigned char c) { return std::toupper(c); });
        if (suffix == "MB") {
            multiplier = constants::MB_TO_BYTES;
            digits.resize(digits.size() - 2);
        }
    }
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                       [](unsigned char c) { return std::isdigit(c); })) {
        throw ConfigError("invalid byte size: " + text);
    }
    try {
        return std::stoull(digits) * multiplier;
    } catch (const std::out_of_range&) {
        throw ConfigError("byte size out of range: " + text);
    }
}

size_t TransferConfig::default_upload_workers() {
    size_t cpus = std::max<size_t>(1, std::thread::hardware_concurrency());
    return std::min(cpus, constants::MAX_DEFAULT_WORKERS);
}

size_t TransferConfig::default_download_workers() {
    return (default_upload_workers() + 1) / 2;
}

bool TransferConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            log_error("cannot open config file: %s", path.c_str());
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("url")) url = j["url"].get<std::string>();
        if (j.contains("auth_token")) auth_token = j["auth_token"].get<std::string>();
        if (j.contains("upload_bytes_per_chunk"))
            upload_bytes_per_chunk = json_byte_size(j["upload_bytes_per_chunk"]);
        if (j.contains("download_min_chunk_size"))
            download_min_chunk_size = json_byte_size(j["download_min_chunk_size"]);
        if (j.contains("upload_workers")) upload_workers = j["upload_workers"].get<size_t>();
        if (j.contains("download_workers")) download_workers = j["download_workers"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("verify_ssl")) verify_ssl = j["verify_ssl"].get<bool>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("retry") && j["retry"].is_object()) {
            load_retry_json(j["retry"], retry);
        }
        return true;
    } catch (const std::exception& e) {
        log_error("parsing config %s: %s", path.c_str(), e.what());
        return false;
    }
}

void TransferConfig::load_env() {
    if (const char* v = std::getenv("DDSXFER_URL")) url = v;
    if (const char* v = std::getenv("DDSXFER_AUTH_TOKEN")) auth_token = v;
    upload_workers = env_count("DDSXFER_UPLOAD_WORKERS", upload_workers);
    download_workers = env_count("DDSXFER_DOWNLOAD_WORKERS", download_workers);
    if (const char* v = std::getenv("DDSXFER_UPLOAD_BYTES_PER_CHUNK"); v && *v) {
        upload_bytes_per_chunk = parse_byte_size(v);
    }
}

void TransferConfig::apply_defaults() {
    if (upload_workers == 0) upload_workers = default_upload_workers();
    if (download_workers == 0) download_workers = default_download_workers();
}

std::string TransferConfig::validate() const {
    if (url.empty()) return "url is required (DDSXFER_URL)";
    if (upload_bytes_per_chunk == 0) return "upload_bytes_per_chunk must be > 0";
    if (download_min_chunk_size == 0) return "download_min_chunk_size must be > 0";
    if (upload_workers < 1) return "upload_workers must be >= 1";
    if (download_workers < 1) return "download_workers must be >= 1";
    if (retry.send_external_put_retry_times < 1) return "send_external_put_retry_times must be >= 1";
    if (retry.fetch_external_retry_times < 1) return "fetch_external_retry_times must be >= 1";
    if (retry.resource_not_consistent_max_retries < 0)
        return "resource_not_consistent_max_retries must be >= 0";
    return {};
}

TransferConfig TransferConfig::load(const std::filesystem::path& path) {
    TransferConfig config;
    if (!path.empty() && !config.load_json(path)) {
        throw ConfigError("failed to load config file: " + path.string());
    }
    config.load_env();
    config.apply_defaults();
    auto err = config.validate();
    if (!err.empty()) {
        throw ConfigError(err);
    }
    set_verbose(config.verbose);
    return config;
}

HttpClientConfig http_client_config(const TransferConfig& config) {
    HttpClientConfig client_config;
    client_config.user_agent = constants::USER_AGENT;
    client_config.verify_ssl = config.verify_ssl;
    client_config.verbose = config.verbose;
    return client_config;
}

TransportFactory curl_transport_factory(const TransferConfig& config) {
    return curl_transport_factory(http_client_config(config));
}

std::unique_ptr<TransferMetrics> make_transfer_metrics(const TransferConfig& config) {
    auto interval = std::chrono::seconds(std::max<size_t>(config.metrics_interval_secs, 1));
    return std::make_unique<TransferMetrics>(config.metrics_file, interval);
}

}  // namespace ddsxfer
