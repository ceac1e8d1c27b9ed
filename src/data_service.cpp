#include "ddsxfer/data_service.hpp"
#include "ddsxfer/errors.hpp"
#include "ddsxfer/log.hpp"
#include "ddsxfer/parallel.hpp"

#include <chrono>
#include <stdexcept>

namespace ddsxfer {

namespace {

void sleep_seconds(int seconds, const std::stop_token& stop_token) {
    sleep_unless_stopped(std::chrono::seconds(seconds), stop_token);
}

nlohmann::json hash_json(const HashData& hash) {
    return {{"value", hash.value}, {"algorithm", hash.algorithm}};
}

std::string form_encode(const nlohmann::json& data) {
    std::string encoded;
    for (const auto& [key, value] : data.items()) {
        if (!encoded.empty()) encoded += '&';
        encoded += url_encode(key) + "=";
        encoded += url_encode(value.is_string() ? value.get<std::string>() : value.dump());
    }
    return encoded;
}

nlohmann::json parse_body(const HttpResponse& response) {
    if (response.body.empty()) return nlohmann::json::object();
    auto j = nlohmann::json::parse(response.body.begin(), response.body.end(), nullptr, false);
    if (j.is_discarded()) return nlohmann::json::object();
    return j;
}

HttpHeaders to_headers(const std::map<std::string, std::string>& http_headers) {
    HttpHeaders headers;
    for (const auto& [name, value] : http_headers) {
        headers.set(name, value);
    }
    return headers;
}

}  // namespace

// --- ExternalUrl ---

ExternalUrl ExternalUrl::from_json(const nlohmann::json& j) {
    ExternalUrl result;
    result.http_verb = j.at("http_verb").get<std::string>();
    result.host = j.at("host").get<std::string>();
    result.url = j.at("url").get<std::string>();
    if (j.contains("http_headers") && j["http_headers"].is_object()) {
        for (const auto& [name, value] : j["http_headers"].items()) {
            result.http_headers[name] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }
    return result;
}

nlohmann::json ExternalUrl::to_json() const {
    return {{"http_verb", http_verb}, {"host", host}, {"url", url}, {"http_headers", http_headers}};
}

// --- DataServiceConnection ---

DataServiceConnection DataServiceConnection::from_config(const TransferConfig& config) {
    DataServiceConnection connection;
    connection.url = config.url;
    connection.auth_token = config.auth_token;
    connection.user_agent = constants::USER_AGENT;
    connection.verify_ssl = config.verify_ssl;
    connection.retry = config.retry;
    return connection;
}

DataServiceConnection DataServiceConnection::from_json(const nlohmann::json& j) {
    DataServiceConnection connection;
    connection.url = j.at("url").get<std::string>();
    connection.auth_token = j.value("auth_token", "");
    connection.user_agent = j.value("user_agent", constants::USER_AGENT);
    connection.verify_ssl = j.value("verify_ssl", true);
    if (j.contains("retry")) {
        const auto& r = j["retry"];
        auto& retry = connection.retry;
        retry.connection_retry_times = r.value("connection_retry_times", retry.connection_retry_times);
        retry.connection_retry_seconds = r.value("connection_retry_seconds", retry.connection_retry_seconds);
        retry.service_down_retry_seconds = r.value("service_down_retry_seconds", retry.service_down_retry_seconds);
        retry.resource_not_consistent_retry_seconds =
            r.value("resource_not_consistent_retry_seconds", retry.resource_not_consistent_retry_seconds);
        retry.resource_not_consistent_max_retries =
            r.value("resource_not_consistent_max_retries", retry.resource_not_consistent_max_retries);
        retry.send_external_put_retry_times =
            r.value("send_external_put_retry_times", retry.send_external_put_retry_times);
        retry.send_external_retry_seconds = r.value("send_external_retry_seconds", retry.send_external_retry_seconds);
        retry.send_external_forbidden_retry_times =
            r.value("send_external_forbidden_retry_times", retry.send_external_forbidden_retry_times);
        retry.fetch_external_retry_times = r.value("fetch_external_retry_times", retry.fetch_external_retry_times);
        retry.fetch_external_retry_seconds =
            r.value("fetch_external_retry_seconds", retry.fetch_external_retry_seconds);
        retry.expired_url_retry_times = r.value("expired_url_retry_times", retry.expired_url_retry_times);
    }
    return connection;
}

nlohmann::json DataServiceConnection::to_json() const {
    return {
        {"url", url},
        {"auth_token", auth_token},
        {"user_agent", user_agent},
        {"verify_ssl", verify_ssl},
        {"retry", {
            {"connection_retry_times", retry.connection_retry_times},
            {"connection_retry_seconds", retry.connection_retry_seconds},
            {"service_down_retry_seconds", retry.service_down_retry_seconds},
            {"resource_not_consistent_retry_seconds", retry.resource_not_consistent_retry_seconds},
            {"resource_not_consistent_max_retries", retry.resource_not_consistent_max_retries},
            {"send_external_put_retry_times", retry.send_external_put_retry_times},
            {"send_external_retry_seconds", retry.send_external_retry_seconds},
            {"send_external_forbidden_retry_times", retry.send_external_forbidden_retry_times},
            {"fetch_external_retry_times", retry.fetch_external_retry_times},
            {"fetch_external_retry_seconds", retry.fetch_external_retry_seconds},
            {"expired_url_retry_times", retry.expired_url_retry_times},
        }},
    };
}

// --- DataServiceApi ---

DataServiceApi::DataServiceApi(DataServiceConnection connection, TransportFactory transport_factory)
    : connection_(std::move(connection))
    , transport_factory_(std::move(transport_factory))
    , session_(transport_factory_()) {}

void DataServiceApi::recreate_session() {
    session_ = transport_factory_();
}

void DataServiceApi::report_retry(RetryKind kind) const {
    if (retry_observer_) {
        retry_observer_(kind);
    }
}

nlohmann::json DataServiceApi::create_upload(const std::string& project_id, const std::string& name,
                                             const std::string& content_type, uint64_t size,
                                             const HashData& hash, bool chunked) {
    nlohmann::json data = {
        {"name", name},
        {"content_type", content_type},
        {"size", size},
        {"hash", hash_json(hash)},
        {"chunked", chunked},
    };
    return request(HttpMethod::POST, "/projects/" + project_id + "/uploads", data);
}

nlohmann::json DataServiceApi::create_upload_url(const std::string& upload_id, uint64_t number,
                                                 uint64_t size, const HashData& hash) {
    if (number < 1) {
        throw std::invalid_argument("Chunk number must be > 0");
    }
    nlohmann::json data = {
        {"number", number},
        {"size", size},
        {"hash", hash_json(hash)},
    };
    return request(HttpMethod::PUT, "/uploads/" + upload_id + "/chunks", data);
}

nlohmann::json DataServiceApi::complete_upload(const std::string& upload_id, const HashData& hash) {
    nlohmann::json data = {
        {"hash[value]", hash.value},
        {"hash[algorithm]", hash.algorithm},
    };
    return request(HttpMethod::PUT, "/uploads/" + upload_id + "/complete", data, BodyType::FORM);
}

nlohmann::json DataServiceApi::create_file(const ParentRef& parent, const std::string& upload_id) {
    nlohmann::json data = {
        {"parent", {{"kind", parent.kind}, {"id", parent.id}}},
        {"upload", {{"id", upload_id}}},
    };
    return request(HttpMethod::POST, "/files/", data);
}

nlohmann::json DataServiceApi::update_file(const std::string& file_id, const std::string& upload_id) {
    nlohmann::json data = {{"upload[id]", upload_id}};
    return request(HttpMethod::PUT, "/files/" + file_id, data, BodyType::FORM);
}

nlohmann::json DataServiceApi::get_file_url(const std::string& file_id) {
    return request(HttpMethod::GET, "/files/" + file_id + "/url", nlohmann::json::object());
}

nlohmann::json DataServiceApi::request(HttpMethod method, const std::string& url_suffix,
                                       const nlohmann::json& data, BodyType body_type) {
    HttpRequest req;
    req.method = method;
    req.url = connection_.url + url_suffix;
    req.headers.set_authorization(connection_.auth_token);
    req.headers.set("User-Agent", connection_.user_agent);

    if (method == HttpMethod::GET) {
        if (!data.empty()) {
            req.url += "?" + form_encode(data);
        }
    } else if (body_type == BodyType::FORM) {
        auto body = form_encode(data);
        req.body = std::vector<uint8_t>(body.begin(), body.end());
        req.headers.set_content_type("application/x-www-form-urlencoded");
    } else {
        req.set_json_body(data.dump());
    }

    auto response = execute_with_service_retry(req, url_suffix);
    check_err(response, url_suffix);
    return parse_body(response);
}

HttpResponse DataServiceApi::execute_with_service_retry(const HttpRequest& req, const std::string& url_suffix) {
    const auto& retry = connection_.retry;
    int connection_retries = 0;
    bool service_down_reported = false;
    while (true) {
        auto response = session_->execute(req);
        if (response.is_network_error) {
            ++connection_retries;
            if (connection_retries > retry.connection_retry_times) {
                throw ConnectionError("Connection failed on " + url_suffix + ": " + response.error);
            }
            log_info("Connection failed. Retrying.");
            sleep_seconds(retry.connection_retry_seconds, stop_token_);
            continue;
        }
        if (response.status_code == 503) {
            if (!service_down_reported) {
                log_info("Data service is currently unavailable; the operation will be retried "
                         "every %d seconds until it is available.", retry.service_down_retry_seconds);
                service_down_reported = true;
            }
            sleep_seconds(retry.service_down_retry_seconds, stop_token_);
            continue;
        }
        if (service_down_reported) {
            log_info("Data service is available again.");
        }
        return response;
    }
}

void DataServiceApi::check_err(const HttpResponse& response, const std::string& url_suffix) {
    if (is_success_status(response.status_code)) {
        return;
    }
    auto body = parse_body(response);
    std::string reason;
    std::string suggestion;
    if (body.is_object()) {
        if (body.contains("reason") && body["reason"].is_string()) {
            reason = body["reason"].get<std::string>();
        } else if (body.contains("error") && body["error"].is_string()) {
            reason = body["error"].get<std::string>();
        }
        if (body.contains("suggestion") && body["suggestion"].is_string()) {
            suggestion = body["suggestion"].get<std::string>();
        }
    }
    if (response.status_code == 500 && reason.empty()) {
        reason = "Internal Server Error";
        suggestion = "Contact data service support.";
    }
    if (response.status_code == 404 && body.is_object() &&
        body.value("code", "") == constants::RESOURCE_NOT_CONSISTENT_CODE) {
        throw ResourceNotConsistentError(response.status_code, url_suffix, reason, suggestion);
    }
    throw DataServiceError(response.status_code, url_suffix, reason, suggestion);
}

void DataServiceApi::send_external(const std::string& http_verb, const std::string& host,
                                   const std::string& url,
                                   const std::map<std::string, std::string>& http_headers,
                                   const std::vector<uint8_t>& data) {
    const auto& retry = connection_.retry;
    HttpResponse response;
    if (http_verb == "PUT") {
        auto req = HttpRequest::put(host + url, data);
        req.headers = to_headers(http_headers);
        int failures = 0;
        while (true) {
            response = session_->execute(req);
            if (!response.is_network_error) break;
            ++failures;
            if (failures >= retry.send_external_put_retry_times) {
                throw ConnectionError("Failed to send chunk after " + std::to_string(failures) +
                                      " attempts: " + response.error);
            }
            log_info("Connection error sending chunk (%s), retrying in %d seconds (%d/%d)",
                     response.error.c_str(), retry.send_external_retry_seconds, failures,
                     retry.send_external_put_retry_times);
            report_retry(RetryKind::CONNECTION);
            sleep_seconds(retry.send_external_retry_seconds, stop_token_);
            recreate_session();
        }
    } else if (http_verb == "POST") {
        auto req = HttpRequest::post(host + url, data);
        req.headers = to_headers(http_headers);
        response = session_->execute(req);
        if (response.is_network_error) {
            throw ConnectionError("Failed to send chunk: " + response.error);
        }
    } else {
        throw std::invalid_argument("Unsupported http_verb:" + http_verb);
    }

    if (response.status_code == 403) {
        throw ForbiddenSendExternalError("Forbidden sending chunk to external store (URL may have been used already)");
    }
    if (response.status_code != 200 && response.status_code != 201) {
        throw ExternalStoreError("Failed to send file to external store. Error:" +
                                 std::to_string(response.status_code), response.status_code);
    }
}

HttpResponse DataServiceApi::receive_external(const std::string& http_verb, const std::string& host,
                                              const std::string& url,
                                              const std::map<std::string, std::string>& http_headers,
                                              std::optional<std::pair<uint64_t, uint64_t>> byte_range,
                                              const HttpBodySink& sink) {
    if (http_verb != "GET") {
        throw std::invalid_argument("Unsupported http_verb:" + http_verb);
    }
    auto req = HttpRequest::get(host + url);
    req.headers = to_headers(http_headers);
    req.byte_range = byte_range;
    auto response = session_->stream(req, sink);
    if (response.is_network_error) {
        throw ConnectionError("Failed to download " + host + url + ": " + response.error);
    }
    return response;
}

}  // namespace ddsxfer
