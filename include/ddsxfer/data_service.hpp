#pragma once

#include "ddsxfer/hash.hpp"
#include "ddsxfer/http.hpp"
#include "ddsxfer/metrics.hpp"
#include "ddsxfer/transfer_config.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ddsxfer {

/// Where a file or folder lives: {"kind": "dds-project" | "dds-folder", "id": ...}.
struct ParentRef {
    std::string kind;
    std::string id;
};

/// A one-time signed URL issued by the control service for a direct
/// transfer against the object store.
struct ExternalUrl {
    std::string http_verb;
    std::string host;
    std::string url;
    std::map<std::string, std::string> http_headers;

    static ExternalUrl from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

/// Connection parameters a worker needs to rebuild its own API client.
/// Plain data so it can travel inside a task context.
struct DataServiceConnection {
    std::string url;
    std::string auth_token;
    std::string user_agent;
    bool verify_ssl = true;
    RetrySettings retry;

    static DataServiceConnection from_config(const TransferConfig& config);
    static DataServiceConnection from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

/// Client for the control-plane REST API plus the signed-URL transfers
/// that go straight to the object store.
///
/// Control-plane calls retry connection errors a bounded number of times and
/// wait out 503 (service maintenance) without bound. Errors surface as
/// DataServiceError / ResourceNotConsistentError / ConnectionError.
class DataServiceApi {
public:
    DataServiceApi(DataServiceConnection connection, TransportFactory transport_factory);

    DataServiceApi(const DataServiceApi&) = delete;
    DataServiceApi& operator=(const DataServiceApi&) = delete;

    // POST /projects/{project_id}/uploads -> {"id": ...}
    nlohmann::json create_upload(const std::string& project_id, const std::string& name,
                                 const std::string& content_type, uint64_t size,
                                 const HashData& hash, bool chunked = true);

    // PUT /uploads/{upload_id}/chunks -> ExternalUrl json. `number` is 1-based.
    nlohmann::json create_upload_url(const std::string& upload_id, uint64_t number,
                                     uint64_t size, const HashData& hash);

    // PUT /uploads/{upload_id}/complete
    nlohmann::json complete_upload(const std::string& upload_id, const HashData& hash);

    // POST /files/ -> {"id": ...}
    nlohmann::json create_file(const ParentRef& parent, const std::string& upload_id);

    // PUT /files/{file_id}: new version of an existing file
    nlohmann::json update_file(const std::string& file_id, const std::string& upload_id);

    // GET /files/{file_id}/url -> ExternalUrl json
    nlohmann::json get_file_url(const std::string& file_id);

    /// Send raw bytes to a signed URL. PUT is retried on connection errors
    /// with a fresh session; POST is sent once.
    /// Throws ForbiddenSendExternalError on 403, ExternalStoreError on any
    /// status other than 200/201, ConnectionError when retries run out.
    void send_external(const std::string& http_verb, const std::string& host, const std::string& url,
                       const std::map<std::string, std::string>& http_headers,
                       const std::vector<uint8_t>& data);

    /// Stream a GET from a signed URL into `sink`. Status handling is left
    /// to the caller; a network error throws ConnectionError.
    HttpResponse receive_external(const std::string& http_verb, const std::string& host,
                                  const std::string& url,
                                  const std::map<std::string, std::string>& http_headers,
                                  std::optional<std::pair<uint64_t, uint64_t>> byte_range,
                                  const HttpBodySink& sink);

    /// Drop the current HTTP session and build a new one.
    void recreate_session();

    /// Called before each signed-URL retry.
    void set_retry_observer(std::function<void(RetryKind)> observer) { retry_observer_ = std::move(observer); }
    void report_retry(RetryKind kind) const;

    /// Retry sleeps end early, throwing TaskCancelledError, once `stop_token` is triggered.
    void set_stop_token(std::stop_token stop_token) { stop_token_ = std::move(stop_token); }
    const std::stop_token& stop_token() const { return stop_token_; }

    const DataServiceConnection& connection() const { return connection_; }

private:
    enum class BodyType { JSON, FORM };

    nlohmann::json request(HttpMethod method, const std::string& url_suffix,
                           const nlohmann::json& data, BodyType body_type = BodyType::JSON);
    HttpResponse execute_with_service_retry(const HttpRequest& request, const std::string& url_suffix);
    static void check_err(const HttpResponse& response, const std::string& url_suffix);

    DataServiceConnection connection_;
    TransportFactory transport_factory_;
    std::unique_ptr<HttpTransport> session_;
    std::function<void(RetryKind)> retry_observer_;
    std::stop_token stop_token_;
};

}  // namespace ddsxfer
