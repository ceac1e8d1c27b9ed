#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ddsxfer {

enum class HttpMethod {
    GET,
    POST,
    PUT,
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);

// Percent-encode for application/x-www-form-urlencoded bodies.
std::string url_encode(const std::string& str);

// Ordered header list with case-insensitive names. set() replaces every
// value of a name, add() appends another one.
class HttpHeaders {
public:
    using HeaderPair = std::pair<std::string, std::string>;

    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const { return get(name).has_value(); }
    const std::vector<HeaderPair>& all() const { return entries_; }
    bool empty() const { return entries_.empty(); }

    void set_content_type(const std::string& content_type) { set("Content-Type", content_type); }
    void set_authorization(const std::string& value) { set("Authorization", value); }

private:
    std::vector<HeaderPair> entries_;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Inclusive byte range, sent as "Range: bytes=first-second".
    std::optional<std::pair<uint64_t, uint64_t>> byte_range;

    static HttpRequest get(const std::string& url);
    static HttpRequest post(const std::string& url, std::vector<uint8_t> body);
    static HttpRequest put(const std::string& url, std::vector<uint8_t> body);

    void set_json_body(const std::string& json);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;
    std::string error;

    // No HTTP status was received (DNS, connect, reset, timeout).
    bool is_network_error = false;
    // The streaming sink asked to stop the transfer.
    bool aborted_by_sink = false;

    bool ok() const { return !is_network_error && status_code >= 200 && status_code < 300; }
};

// Receives successive pieces of a 2xx response body. Return false to abort.
using HttpBodySink = std::function<bool(const uint8_t* data, size_t size)>;

struct HttpClientConfig {
    std::string user_agent;
    std::chrono::milliseconds connect_timeout{30000};
    // 0 disables the overall limit; chunk transfers can run for a long time.
    std::chrono::milliseconds total_timeout{0};
    // Abort a transfer that stays below 1 byte/s for this long.
    std::chrono::seconds low_speed_time{300};
    bool verify_ssl = true;
    std::string ca_bundle;
    bool verbose = false;
    // Cap on buffered (non-streamed) bodies.
    size_t max_response_size = 64 * 1024 * 1024;
};

/// One HTTP session. Implementations are not thread-safe: each worker
/// builds its own through a TransportFactory.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /// Perform the request and buffer the whole body.
    virtual HttpResponse execute(const HttpRequest& request) = 0;

    /// Perform the request handing a 2xx body to `sink` as it arrives.
    /// Non-2xx bodies are buffered in the returned response instead.
    virtual HttpResponse stream(const HttpRequest& request, const HttpBodySink& sink) = 0;
};

using TransportFactory = std::function<std::unique_ptr<HttpTransport>()>;

/// libcurl transport holding a single easy handle, so connections are
/// reused for the lifetime of the object.
class CurlHttpClient : public HttpTransport {
public:
    explicit CurlHttpClient(const HttpClientConfig& config = {});
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request) override;
    HttpResponse stream(const HttpRequest& request, const HttpBodySink& sink) override;

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

TransportFactory curl_transport_factory(const HttpClientConfig& config);

}  // namespace ddsxfer
