#include "hookvault/backend.hpp"
#include "hookvault/error.hpp"
#include "hookvault/log.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

namespace hookvault {

namespace {

constexpr size_t kTelegramCaptionMax = 1024;

using nlohmann::json;

std::string truncated_body(const net::HttpResponse& response) {
    auto text = response.body_string();
    if (text.size() > 300) {
        text.resize(300);
        text += "...";
    }
    return text;
}

// Parse a success body as JSON; a body that is not JSON is a malformed response
json parse_body(const net::HttpResponse& response, const std::string& label) {
    auto j = json::parse(response.body.begin(), response.body.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw Error(ErrorKind::FatalBackend, label + ": response is not a JSON object",
                    response.status_code);
    }
    return j;
}

// Message/file ids arrive as strings (Discord) or numbers (Telegram)
std::string id_string(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
    return {};
}

[[noreturn]] void throw_status(const net::HttpResponse& response, const std::string& label) {
    auto kind = response.status_code == 404 ? ErrorKind::NotFound : ErrorKind::FatalBackend;
    throw Error(kind,
                label + " failed: HTTP " + std::to_string(response.status_code) + ": " +
                    truncated_body(response),
                response.status_code);
}

std::shared_ptr<net::HttpTransport> transport_or_default(const BackendOptions& options) {
    if (options.transport) return options.transport;
    return std::make_shared<net::HttpClient>();
}

// ============================================================================
// DiscordWebhookBackend - attachments posted through a channel webhook
// ============================================================================

class DiscordWebhookBackend : public BlobBackend {
public:
    DiscordWebhookBackend(const BackendConfig& config, const BackendOptions& options)
        : id_(config.id),
          options_(options),
          transport_(transport_or_default(options)) {
        auto it = config.params.find("webhook_url");
        if (it != config.params.end()) {
            webhook_url_ = it->second;
            while (!webhook_url_.empty() && webhook_url_.back() == '/') webhook_url_.pop_back();
        }
    }

    std::string type_name() const override { return "discord"; }
    const std::string& id() const override { return id_; }
    bool ready() const override { return !webhook_url_.empty(); }

    BlobRef upload(const crypto::Bytes& data, const std::string& filename,
                   const std::string& caption) override {
        require_webhook();

        net::HttpRequest request;
        request.method = net::HttpMethod::POST;
        request.url = webhook_url_ + "?wait=true";
        request.add_form_field("content", caption);
        request.add_form_file("file", filename, "application/octet-stream", data);
        apply_timeouts(request);

        auto response = execute_with_backoff(*transport_, request, options_.retry,
                                             "discord upload", "/retry_after");
        if (!response.ok()) throw_status(response, "discord upload");

        auto j = parse_body(response, "discord upload");
        std::string message_id = j.contains("id") ? id_string(j["id"]) : std::string();
        std::string url;
        if (j.contains("attachments") && j["attachments"].is_array() && !j["attachments"].empty()) {
            const auto& att = j["attachments"][0];
            if (att.is_object() && att.contains("url") && att["url"].is_string()) {
                url = att["url"].get<std::string>();
            }
        }
        if (message_id.empty() || url.empty()) {
            throw Error(ErrorKind::FatalBackend, "webhook_missing_attachment", response.status_code);
        }

        BlobRef ref;
        ref.url = url;
        ref.message_id = message_id;
        ref.webhook_id = id_;
        return ref;
    }

    crypto::Bytes fetch(const BlobRef& ref, const std::atomic<bool>* cancel) override {
        auto response = download(ref.url, cancel);
        if (response.ok()) return std::move(response.body);

        // Signed attachment URLs expire; ask the webhook for a fresh one
        int status = response.status_code;
        if ((status == 401 || status == 403 || status == 404) && !ref.message_id.empty() &&
            ready()) {
            auto fresh = refresh_url(ref.message_id, cancel);
            if (verbose_logging()) {
                log_info("discord", "refreshed attachment url for message %s",
                         ref.message_id.c_str());
            }
            response = download(fresh, cancel);
            if (response.ok()) return std::move(response.body);
        }
        throw_status(response, "discord download");
    }

    void remove(const BlobRef& ref) override {
        require_webhook();
        if (ref.message_id.empty()) {
            throw Error(ErrorKind::NotFound, "discord delete: part has no message id");
        }

        auto request = net::HttpRequest::del(webhook_url_ + "/messages/" + ref.message_id);
        apply_timeouts(request);
        auto response = execute_with_backoff(*transport_, request, options_.retry,
                                             "discord delete", "/retry_after");
        if (!response.ok()) throw_status(response, "discord delete");
    }

private:
    void require_webhook() const {
        if (webhook_url_.empty()) {
            throw Error(ErrorKind::Configuration, "discord backend " + id_ + " has no webhook url");
        }
    }

    void apply_timeouts(net::HttpRequest& request) const {
        request.connect_timeout = options_.connect_timeout;
        request.total_timeout = options_.request_timeout;
    }

    net::HttpResponse download(const std::string& url, const std::atomic<bool>* cancel) {
        auto request = net::HttpRequest::get(url);
        apply_timeouts(request);
        request.cancel = cancel;
        return execute_with_backoff(*transport_, request, options_.retry, "discord download",
                                    "/retry_after", cancel);
    }

    std::string refresh_url(const std::string& message_id, const std::atomic<bool>* cancel) {
        auto request = net::HttpRequest::get(webhook_url_ + "/messages/" + message_id);
        apply_timeouts(request);
        auto response = execute_with_backoff(*transport_, request, options_.retry,
                                             "discord fetch_message", "/retry_after", cancel);
        if (!response.ok()) throw_status(response, "discord fetch_message");

        auto j = parse_body(response, "discord fetch_message");
        if (j.contains("attachments") && j["attachments"].is_array() && !j["attachments"].empty() &&
            j["attachments"][0].contains("url") && j["attachments"][0]["url"].is_string()) {
            return j["attachments"][0]["url"].get<std::string>();
        }
        throw Error(ErrorKind::NotFound, "discord message " + message_id + " has no attachment");
    }

    std::string id_;
    std::string webhook_url_;
    BackendOptions options_;
    std::shared_ptr<net::HttpTransport> transport_;
};

// ============================================================================
// TelegramBackend - documents sent to a chat through the Bot API
// ============================================================================

class TelegramBackend : public BlobBackend {
public:
    TelegramBackend(const BackendConfig& config, const BackendOptions& options)
        : id_(config.id),
          options_(options),
          transport_(transport_or_default(options)) {
        auto it = config.params.find("bot_token");
        if (it != config.params.end()) bot_token_ = it->second;
        if ((it = config.params.find("chat_id")) != config.params.end()) chat_id_ = it->second;
        api_base_ = options.telegram_api_base;
        if ((it = config.params.find("api_base")) != config.params.end() && !it->second.empty()) {
            api_base_ = it->second;
        }
    }

    std::string type_name() const override { return "telegram"; }
    const std::string& id() const override { return id_; }
    bool ready() const override { return !bot_token_.empty() && !chat_id_.empty(); }

    BlobRef upload(const crypto::Bytes& data, const std::string& filename,
                   const std::string& caption) override {
        require_credentials();

        net::HttpRequest request;
        request.method = net::HttpMethod::POST;
        request.url = api_url("sendDocument");
        request.add_form_field("chat_id", chat_id_);
        request.add_form_field("caption", caption.substr(0, kTelegramCaptionMax));
        request.add_form_file("document", filename, "application/octet-stream", data);
        apply_timeouts(request);

        auto response = execute_with_backoff(*transport_, request, options_.retry,
                                             "telegram upload", "/parameters/retry_after");
        if (!response.ok()) throw_status(response, "telegram upload");

        auto j = parse_body(response, "telegram upload");
        std::string message_id;
        std::string file_id;
        if (j.value("ok", false) && j.contains("result") && j["result"].is_object()) {
            const auto& result = j["result"];
            if (result.contains("message_id")) message_id = id_string(result["message_id"]);
            if (result.contains("document") && result["document"].is_object() &&
                result["document"].contains("file_id")) {
                file_id = id_string(result["document"]["file_id"]);
            }
        }
        if (message_id.empty() || file_id.empty()) {
            throw Error(ErrorKind::FatalBackend,
                        "telegram_upload_bad_response: " + j.value("description", std::string("missing_fields")),
                        response.status_code);
        }

        BlobRef ref;
        ref.url = file_url(file_id, nullptr);
        ref.message_id = message_id;
        ref.webhook_id = id_;
        ref.file_id = file_id;
        return ref;
    }

    crypto::Bytes fetch(const BlobRef& ref, const std::atomic<bool>* cancel) override {
        // File links expire after an hour; resolve a fresh one when we can
        std::string url = ref.url;
        if (!ref.file_id.empty() && ready()) {
            url = file_url(ref.file_id, cancel);
        }
        if (url.empty()) {
            throw Error(ErrorKind::NotFound, "telegram part has neither url nor file id");
        }

        auto request = net::HttpRequest::get(url);
        apply_timeouts(request);
        request.cancel = cancel;
        auto response = execute_with_backoff(*transport_, request, options_.retry,
                                             "telegram download", "/parameters/retry_after", cancel);
        if (!response.ok()) throw_status(response, "telegram download");
        return std::move(response.body);
    }

    void remove(const BlobRef& ref) override {
        require_credentials();

        json payload;
        payload["chat_id"] = chat_id_;
        try {
            payload["message_id"] = std::stoll(ref.message_id);
        } catch (const std::exception&) {
            throw Error(ErrorKind::NotFound, "telegram delete: invalid message id '" + ref.message_id + "'");
        }

        net::HttpRequest request;
        request.method = net::HttpMethod::POST;
        request.url = api_url("deleteMessage");
        request.set_json_body(payload.dump());
        apply_timeouts(request);

        auto response = execute_with_backoff(*transport_, request, options_.retry,
                                             "telegram delete", "/parameters/retry_after");
        if (response.ok()) return;

        if (response.status_code == 400 &&
            response.body_string().find("message to delete not found") != std::string::npos) {
            throw Error(ErrorKind::NotFound, "telegram message " + ref.message_id + " already gone",
                        response.status_code);
        }
        throw_status(response, "telegram delete");
    }

private:
    void require_credentials() const {
        if (!ready()) {
            throw Error(ErrorKind::Configuration, "telegram backend " + id_ + " is not configured");
        }
    }

    void apply_timeouts(net::HttpRequest& request) const {
        request.connect_timeout = options_.connect_timeout;
        request.total_timeout = options_.request_timeout;
    }

    std::string api_url(const std::string& method) const {
        return api_base_ + "/bot" + bot_token_ + "/" + method;
    }

    std::string file_url(const std::string& file_id, const std::atomic<bool>* cancel) {
        auto request = net::HttpRequest::get(api_url("getFile?file_id=" + net::url_encode(file_id)));
        apply_timeouts(request);
        auto response = execute_with_backoff(*transport_, request, options_.retry,
                                             "telegram get_file", "/parameters/retry_after", cancel);
        if (!response.ok()) throw_status(response, "telegram get_file");

        auto j = parse_body(response, "telegram get_file");
        if (j.value("ok", false) && j.contains("result") && j["result"].is_object() &&
            j["result"].contains("file_path") && j["result"]["file_path"].is_string()) {
            return api_base_ + "/file/bot" + bot_token_ + "/" +
                   j["result"]["file_path"].get<std::string>();
        }
        throw Error(ErrorKind::FatalBackend,
                    "telegram_get_file_bad_response: " +
                        j.value("description", std::string("missing_file_path")),
                    response.status_code);
    }

    std::string id_;
    std::string bot_token_;
    std::string chat_id_;
    std::string api_base_;
    BackendOptions options_;
    std::shared_ptr<net::HttpTransport> transport_;
};

// ============================================================================
// LocalBlobBackend - blobs as files in a directory (development, tests)
// ============================================================================

class LocalBlobBackend : public BlobBackend {
public:
    explicit LocalBlobBackend(const BackendConfig& config)
        : id_(config.id) {
        auto it = config.params.find("path");
        if (it != config.params.end() && !it->second.empty()) {
            root_ = std::filesystem::absolute(it->second);
            std::filesystem::create_directories(root_);
        }
    }

    std::string type_name() const override { return "local"; }
    const std::string& id() const override { return id_; }
    bool ready() const override { return !root_.empty(); }

    BlobRef upload(const crypto::Bytes& data, const std::string& filename,
                   const std::string& caption) override {
        (void)caption;
        if (!ready()) {
            throw Error(ErrorKind::Configuration, "local backend " + id_ + " has no path");
        }

        auto name = crypto::random_hex(16) + "_" + filename;
        auto path = root_ / name;
        auto temp_path = path.string() + ".tmp";
        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                throw Error(ErrorKind::ResourceExhausted, "cannot create " + temp_path);
            }
            file.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
            file.close();
            if (!file.good()) {
                std::error_code ec;
                std::filesystem::remove(temp_path, ec);
                throw Error(ErrorKind::ResourceExhausted, "write failed on " + temp_path);
            }
        }
        std::filesystem::rename(temp_path, path);

        BlobRef ref;
        ref.url = "file://" + path.string();
        ref.message_id = name;
        ref.webhook_id = id_;
        return ref;
    }

    crypto::Bytes fetch(const BlobRef& ref, const std::atomic<bool>* cancel) override {
        if (cancel && cancel->load()) {
            throw Error(ErrorKind::Cancelled, "local fetch cancelled");
        }
        auto path = blob_path(ref);
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw Error(ErrorKind::NotFound, "local blob not found: " + path.string());
        }
        return crypto::Bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    void remove(const BlobRef& ref) override {
        auto path = blob_path(ref);
        std::error_code ec;
        if (!std::filesystem::remove(path, ec)) {
            if (ec) {
                throw Error(ErrorKind::FatalBackend, "cannot remove " + path.string() + ": " + ec.message());
            }
            throw Error(ErrorKind::NotFound, "local blob not found: " + path.string());
        }
    }

private:
    std::filesystem::path blob_path(const BlobRef& ref) const {
        // message ids are bare file names; never let one escape the root
        if (ref.message_id.empty() || ref.message_id.find('/') != std::string::npos ||
            ref.message_id == "." || ref.message_id == "..") {
            throw Error(ErrorKind::NotFound, "invalid local blob id '" + ref.message_id + "'");
        }
        return root_ / ref.message_id;
    }

    std::string id_;
    std::filesystem::path root_;
};

}  // namespace

std::unique_ptr<BlobBackend> BlobBackendFactory::create(const BackendConfig& config,
                                                        const BackendOptions& options) {
    if (config.type == "discord") {
        return std::make_unique<DiscordWebhookBackend>(config, options);
    }
    if (config.type == "telegram") {
        return std::make_unique<TelegramBackend>(config, options);
    }
    if (config.type == "local") {
        return std::make_unique<LocalBlobBackend>(config);
    }
    throw std::runtime_error("Unknown blob backend type: " + config.type);
}

// --- BackendPool ---

void BackendPool::add(std::unique_ptr<BlobBackend> backend) {
    backends_.push_back(std::move(backend));
}

BlobBackend& BackendPool::for_part(uint32_t index) const {
    if (backends_.empty()) {
        throw Error(ErrorKind::Configuration, "no_storage_provider_configured");
    }
    return *backends_[index % backends_.size()];
}

BlobBackend* BackendPool::find(const std::string& webhook_id) const {
    for (const auto& b : backends_) {
        if (b->id() == webhook_id) return b.get();
    }
    return nullptr;
}

}  // namespace hookvault
