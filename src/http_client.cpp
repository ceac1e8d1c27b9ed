#include "ddsxfer/http.hpp"
#include "ddsxfer/log.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <mutex>
#include <stdexcept>

namespace ddsxfer {

namespace {

bool same_name(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

HttpRequest make_request(HttpMethod method, const std::string& url, std::vector<uint8_t> body) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    req.body = std::move(body);
    return req;
}

}  // namespace

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

std::string url_encode(const std::string& str) {
    static const char hex_digits[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(str.size());
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += hex_digits[c >> 4];
            encoded += hex_digits[c & 0x0F];
        }
    }
    return encoded;
}

// --- HttpHeaders ---

void HttpHeaders::set(const std::string& name, const std::string& value) {
    remove(name);
    entries_.emplace_back(name, value);
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    entries_.emplace_back(name, value);
}

void HttpHeaders::remove(const std::string& name) {
    std::erase_if(entries_, [&](const HeaderPair& entry) { return same_name(entry.first, name); });
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    for (const auto& [entry_name, value] : entries_) {
        if (same_name(entry_name, name)) return value;
    }
    return std::nullopt;
}

// --- HttpRequest ---

HttpRequest HttpRequest::get(const std::string& url) {
    return make_request(HttpMethod::GET, url, {});
}

HttpRequest HttpRequest::post(const std::string& url, std::vector<uint8_t> body) {
    return make_request(HttpMethod::POST, url, std::move(body));
}

HttpRequest HttpRequest::put(const std::string& url, std::vector<uint8_t> body) {
    return make_request(HttpMethod::PUT, url, std::move(body));
}

void HttpRequest::set_json_body(const std::string& json) {
    body.assign(json.begin(), json.end());
    headers.set_content_type("application/json");
}

// ============================================================================
// CURL callbacks
// ============================================================================

namespace {

// Shared by buffered and streamed transfers. With a sink, 2xx bodies go to
// the sink and anything else is buffered so callers can read error payloads.
struct WriteContext {
    CURL* curl;
    std::vector<uint8_t>* buffer;
    size_t max_size;
    const HttpBodySink* sink;
    bool size_exceeded = false;
    bool sink_aborted = false;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    size_t bytes = size * nmemb;

    if (ctx->sink) {
        long status = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
        if (is_success_status(static_cast<int>(status))) {
            if (!(*ctx->sink)(reinterpret_cast<const uint8_t*>(ptr), bytes)) {
                ctx->sink_aborted = true;
                return 0;
            }
            return bytes;
        }
    }

    if (ctx->max_size > 0 && ctx->buffer->size() + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;
    }
    ctx->buffer->insert(ctx->buffer->end(), ptr, ptr + bytes);
    return bytes;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // A new status line starts a new header block (redirects, 100-continue).
    if (line.starts_with("HTTP/")) {
        *headers = HttpHeaders{};
        return bytes;
    }
    if (line.empty()) {
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        size_t start = value.find_first_not_of(" \t");
        value = start == std::string::npos ? std::string() : value.substr(start);
        headers->add(name, value);
    }
    return bytes;
}

struct ReadData {
    const uint8_t* data;
    size_t size;
    size_t pos;
};

size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* rd = static_cast<ReadData*>(userdata);
    size_t to_copy = std::min(size * nitems, rd->size - rd->pos);
    if (to_copy > 0) {
        std::memcpy(buffer, rd->data + rd->pos, to_copy);
        rd->pos += to_copy;
    }
    return to_copy;
}

}  // namespace

// ============================================================================
// CurlHttpClient
// ============================================================================

class CurlHttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });

        handle_ = curl_easy_init();
        if (!handle_) {
            throw std::runtime_error("curl_easy_init failed");
        }
    }

    ~Impl() {
        if (handle_) {
            curl_easy_cleanup(handle_);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    HttpResponse perform(const HttpRequest& request, const HttpBodySink* sink) {
        HttpResponse response;
        CURL* curl = handle_;

        // Keeps the connection cache, drops options from the previous request.
        curl_easy_reset(curl);

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                break;
        }

        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        // Object stores answer 100-continue slowly; send the body right away.
        if (request.method == HttpMethod::PUT || request.method == HttpMethod::POST) {
            headers_list = curl_slist_append(headers_list, "Expect:");
        }
        if (headers_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);
        }
        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        ReadData read_data{request.body.data(), request.body.size(), 0};
        if (request.method == HttpMethod::PUT) {
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &read_data);
            // Zero-length PUTs still carry Content-Length: 0.
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        } else if (request.method == HttpMethod::POST) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        }

        std::vector<uint8_t> response_body;
        WriteContext write_ctx{curl, &response_body, config_.max_response_size, sink};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(config_.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(config_.total_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                         static_cast<long>(config_.low_speed_time.count()));
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config_.verify_ssl ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config_.verify_ssl ? 2L : 0L);
        if (!config_.ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle.c_str());
        }

        std::string range;
        if (request.byte_range) {
            range = std::to_string(request.byte_range->first) + "-" +
                    std::to_string(request.byte_range->second);
            curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        CURLcode res = curl_easy_perform(curl);

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status_code = static_cast<int>(status);

        if (res == CURLE_OK) {
            response.body = std::move(response_body);
        } else if (res == CURLE_WRITE_ERROR && write_ctx.sink_aborted) {
            response.aborted_by_sink = true;
            response.error = "Transfer aborted by receiver";
        } else if (res == CURLE_WRITE_ERROR && write_ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
            log_debug("%s %s failed: %s", http_method_to_string(request.method),
                      request.url.c_str(), response.error.c_str());
        }

        if (headers_list) {
            curl_slist_free_all(headers_list);
        }
        return response;
    }

    const HttpClientConfig& config() const { return config_; }

private:
    HttpClientConfig config_;
    CURL* handle_ = nullptr;
};

CurlHttpClient::CurlHttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

CurlHttpClient::~CurlHttpClient() = default;

HttpResponse CurlHttpClient::execute(const HttpRequest& request) {
    return impl_->perform(request, nullptr);
}

HttpResponse CurlHttpClient::stream(const HttpRequest& request, const HttpBodySink& sink) {
    return impl_->perform(request, &sink);
}

const HttpClientConfig& CurlHttpClient::config() const {
    return impl_->config();
}

TransportFactory curl_transport_factory(const HttpClientConfig& config) {
    return [config]() -> std::unique_ptr<HttpTransport> {
        return std::make_unique<CurlHttpClient>(config);
    };
}

}  // namespace ddsxfer
