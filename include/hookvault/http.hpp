#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hookvault::net {

enum class HttpMethod {
    GET,
    POST,
    DELETE,
};

/// 429 and every 5xx are worth another attempt.
bool is_retryable_status(int status);

/// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string url_encode(const std::string& str);

/// Ordered header list with case-insensitive lookup. Names keep the case they
/// were given so requests go out the way the caller wrote them.
class HttpHeaders {
public:
    using Entry = std::pair<std::string, std::string>;

    // Replaces every existing value for the name
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const { return get(name).has_value(); }

    const std::vector<Entry>& all() const { return entries_; }
    void clear() { entries_.clear(); }

private:
    std::vector<Entry> entries_;
};

/// One multipart/form-data field. Fields with a filename go out as file parts
/// carrying `data`; the rest send `value` as text.
struct FormPart {
    std::string name;
    std::string value;
    std::string filename;
    std::string content_type;
    std::vector<uint8_t> data;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;
    std::vector<FormPart> form;  // non-empty: multipart body, `body` unused

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds total_timeout{120000};

    // Polled during the transfer; setting it aborts the request
    const std::atomic<bool>* cancel = nullptr;

    static HttpRequest get(const std::string& url);
    static HttpRequest del(const std::string& url);

    void set_json_body(const std::string& json);
    void add_form_field(const std::string& name, const std::string& value);
    void add_form_file(const std::string& name, const std::string& filename,
                       const std::string& content_type, std::vector<uint8_t> data);
};

struct HttpResponse {
    int status_code = 0;  // 0 when no response arrived
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::string error;
    bool is_network_error = false;  // reset, timeout, DNS
    bool aborted = false;           // request.cancel was raised

    bool ok() const { return status_code >= 200 && status_code < 300; }
    std::string body_string() const { return std::string(body.begin(), body.end()); }
};

/// Everything the backends send goes through this. HttpClient talks to the
/// network; the tests plug in scripted transports.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

struct HttpClientOptions {
    std::string user_agent = "hookvault/1.0";
    size_t keep_handles = 16;
    size_t body_limit = 128 * 1024 * 1024;  // one part plus headroom
    bool verify_tls = true;
    std::string ca_file;
};

/// libcurl transport. Easy handles are reused across requests so connections
/// to the same host stay warm.
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(HttpClientOptions options = {});
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request) override;

private:
    struct HandleCache;

    HttpClientOptions options_;
    std::unique_ptr<HandleCache> handles_;
};

}  // namespace hookvault::net
