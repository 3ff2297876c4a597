#include "hookvault/http.hpp"
#include "hookvault/log.hpp"

#include <curl/curl.h>

#include <cctype>
#include <mutex>

namespace hookvault::net {

namespace {

bool same_name(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

struct SlistFree {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
struct MimeFree {
    void operator()(curl_mime* mime) const { curl_mime_free(mime); }
};
using SlistPtr = std::unique_ptr<curl_slist, SlistFree>;
using MimePtr = std::unique_ptr<curl_mime, MimeFree>;

// State shared with the curl callbacks for a single request
struct Transfer {
    HttpResponse* response = nullptr;
    size_t body_limit = 0;
    bool over_limit = false;
    const std::atomic<bool>* cancel = nullptr;
};

size_t on_body(char* data, size_t size, size_t count, void* user) {
    auto* t = static_cast<Transfer*>(user);
    size_t n = size * count;
    auto& body = t->response->body;
    if (t->body_limit != 0 && body.size() + n > t->body_limit) {
        t->over_limit = true;
        return 0;
    }
    body.insert(body.end(), data, data + n);
    return n;
}

size_t on_header(char* data, size_t size, size_t count, void* user) {
    auto* t = static_cast<Transfer*>(user);
    size_t n = size * count;
    std::string line(data, n);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    // Each status line (redirect hop, 100 Continue) starts a fresh header block
    if (line.rfind("HTTP/", 0) == 0) {
        t->response->headers.clear();
        return n;
    }
    auto colon = line.find(':');
    if (colon == std::string::npos) return n;

    auto value_at = line.find_first_not_of(" \t", colon + 1);
    t->response->headers.add(line.substr(0, colon),
                             value_at == std::string::npos ? "" : line.substr(value_at));
    return n;
}

int on_progress(void* user, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* t = static_cast<Transfer*>(user);
    return (t->cancel && t->cancel->load()) ? 1 : 0;
}

MimePtr build_form(CURL* curl, const std::vector<FormPart>& form) {
    MimePtr mime(curl_mime_init(curl));
    for (const auto& field : form) {
        curl_mimepart* part = curl_mime_addpart(mime.get());
        curl_mime_name(part, field.name.c_str());
        if (field.filename.empty()) {
            curl_mime_data(part, field.value.c_str(), CURL_ZERO_TERMINATED);
            continue;
        }
        curl_mime_data(part, reinterpret_cast<const char*>(field.data.data()), field.data.size());
        curl_mime_filename(part, field.filename.c_str());
        curl_mime_type(part, field.content_type.empty() ? "application/octet-stream"
                                                        : field.content_type.c_str());
    }
    return mime;
}

}  // namespace

bool is_retryable_status(int status) {
    return status == 429 || (status >= 500 && status <= 599);
}

std::string url_encode(const std::string& str) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(str.size() * 3);
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

// --- HttpHeaders ---

void HttpHeaders::set(const std::string& name, const std::string& value) {
    std::erase_if(entries_, [&](const Entry& e) { return same_name(e.first, name); });
    entries_.emplace_back(name, value);
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    entries_.emplace_back(name, value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    for (const auto& [key, value] : entries_) {
        if (same_name(key, name)) return value;
    }
    return std::nullopt;
}

// --- HttpRequest ---

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest request;
    request.url = url;
    return request;
}

HttpRequest HttpRequest::del(const std::string& url) {
    HttpRequest request;
    request.method = HttpMethod::DELETE;
    request.url = url;
    return request;
}

void HttpRequest::set_json_body(const std::string& json) {
    body.assign(json.begin(), json.end());
    headers.set("Content-Type", "application/json");
}

void HttpRequest::add_form_field(const std::string& name, const std::string& value) {
    FormPart part;
    part.name = name;
    part.value = value;
    form.push_back(std::move(part));
}

void HttpRequest::add_form_file(const std::string& name, const std::string& filename,
                                const std::string& content_type, std::vector<uint8_t> data) {
    FormPart part;
    part.name = name;
    part.filename = filename;
    part.content_type = content_type;
    part.data = std::move(data);
    form.push_back(std::move(part));
}

// --- HttpClient ---

struct HttpClient::HandleCache {
    std::mutex mutex;
    std::vector<CURL*> idle;
    size_t keep = 0;

    ~HandleCache() {
        for (CURL* h : idle) curl_easy_cleanup(h);
    }

    CURL* take() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!idle.empty()) {
                CURL* h = idle.back();
                idle.pop_back();
                return h;
            }
        }
        return curl_easy_init();
    }

    void give_back(CURL* h) {
        curl_easy_reset(h);
        std::lock_guard<std::mutex> lock(mutex);
        if (idle.size() < keep) {
            idle.push_back(h);
            return;
        }
        curl_easy_cleanup(h);
    }
};

HttpClient::HttpClient(HttpClientOptions options)
    : options_(std::move(options)), handles_(std::make_unique<HandleCache>()) {
    static std::once_flag global_init;
    std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    handles_->keep = options_.keep_handles;
    if (!options_.verify_tls) {
        log_warn("http", "TLS certificate verification is disabled");
    }
}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    HttpResponse response;
    CURL* curl = handles_->take();
    if (!curl) {
        response.error = "curl_easy_init failed";
        response.is_network_error = true;
        return response;
    }

    Transfer transfer;
    transfer.response = &response;
    transfer.body_limit = options_.body_limit;
    transfer.cancel = request.cancel;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);  // attachment CDNs redirect
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.total_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
    if (!options_.ca_file.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, options_.ca_file.c_str());
    }

    MimePtr mime;
    switch (request.method) {
        case HttpMethod::GET:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::POST:
            if (!request.form.empty()) {
                mime = build_form(curl, request.form);
                curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime.get());
            } else {
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS,
                                 request.body.empty() ? "" : reinterpret_cast<const char*>(request.body.data()));
            }
            break;
        case HttpMethod::DELETE:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
    }

    SlistPtr header_list;
    for (const auto& [name, value] : request.headers.all()) {
        std::string line = name + ": " + value;
        header_list.reset(curl_slist_append(header_list.release(), line.c_str()));
    }
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    }

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer);
    if (request.cancel) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, on_progress);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &transfer);
    }

    CURLcode rc = curl_easy_perform(curl);
    if (rc == CURLE_OK) {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status_code = static_cast<int>(status);
    } else {
        response.body.clear();
        if (rc == CURLE_WRITE_ERROR && transfer.over_limit) {
            // Not retryable: the same body would overflow again
            response.status_code = 413;
            response.error = "response larger than " + std::to_string(options_.body_limit) + " bytes";
        } else {
            response.is_network_error = true;
            response.aborted = rc == CURLE_ABORTED_BY_CALLBACK;
            response.error = response.aborted ? "transfer cancelled" : curl_easy_strerror(rc);
        }
    }

    // The mime and header list must outlive the handle's last use of them
    handles_->give_back(curl);
    return response;
}

}  // namespace hookvault::net
