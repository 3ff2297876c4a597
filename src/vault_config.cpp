#include "hookvault/vault_config.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace hookvault {

// --- BackendConfig ---

std::string BackendConfig::validate() const {
    auto has = [this](const char* key) {
        auto it = params.find(key);
        return it != params.end() && !it->second.empty();
    };

    if (type.empty()) return "backend type is required";
    if (type == "discord") {
        if (!has("webhook_url")) return "discord backend requires 'webhook_url'";
    } else if (type == "telegram") {
        if (!has("bot_token")) return "telegram backend requires 'bot_token'";
        if (!has("chat_id")) return "telegram backend requires 'chat_id'";
    } else if (type == "local") {
        if (!has("path")) return "local backend requires 'path'";
    } else {
        return "unknown backend type: " + type;
    }
    if (id.empty()) return type + " backend has no id";
    return {};
}

// --- VaultConfig ---

namespace {

BackendConfig backend_from_json(const nlohmann::json& jb) {
    BackendConfig bc;
    for (auto& [key, val] : jb.items()) {
        std::string text = val.is_string() ? val.get<std::string>() : val.dump();
        if (key == "type") {
            bc.type = text;
        } else if (key == "id") {
            bc.id = text;
        } else {
            bc.params[key] = text;
        }
    }
    return bc;
}

void print_usage() {
    std::cerr <<
        "Usage: hookvault --data-dir <path> --master-key <key> <backend flags> [options]\n"
        "\n"
        "Required:\n"
        "  --data-dir <path>                Manifest, staging and scratch directory\n"
        "  --master-key <key>               Encryption key material (or HOOKVAULT_MASTER_KEY env)\n"
        "\n"
        "Backends (at least one):\n"
        "  --discord-webhook <url>          Discord webhook URL (repeatable)\n"
        "  --telegram-bot-token <token>     Telegram bot token (or HOOKVAULT_TELEGRAM_BOT_TOKEN env)\n"
        "  --telegram-chat-id <id>          Telegram chat id (or HOOKVAULT_TELEGRAM_CHAT_ID env)\n"
        "  --local-backend <path>           Store parts in a local directory (development)\n"
        "\n"
        "Options:\n"
        "  --config <path>                  JSON config file\n"
        "  --chunk-size-mib <N>             Part size in MiB (default: 9.8)\n"
        "  --webhook-max-mib <N>            Host attachment limit in MiB (default: 9.8)\n"
        "  --bundle-max-mib <N>             Largest bundle in MiB (default: 32)\n"
        "  --encryption-version <1|2>       1 = whole archive, 2 = per part (default: 2)\n"
        "  --worker-concurrency <N>         Archive worker threads (default: 1)\n"
        "  --worker-poll-ms <N>             Queue poll interval (default: 2000)\n"
        "  --upload-parts-concurrency <N>   Parallel part uploads per archive (default: 2)\n"
        "  --upload-retry-max <N>           Retries per backend call (default: 5)\n"
        "  --upload-retry-base-ms <N>       First backoff delay (default: 1500)\n"
        "  --upload-retry-max-ms <N>        Backoff cap (default: 15000)\n"
        "  --archive-retry-max <N>          Automatic archive retries (default: 5)\n"
        "  --processing-stale-minutes <N>   Requeue stuck archives after (default: 30)\n"
        "  --restore-prefetch <N>           Parts fetched ahead on restore (default: 2)\n"
        "  --trash-retention-days <N>       Days before trash is deleted (default: 30)\n"
        "  --delete-sweep-interval <secs>   Deletion sweep interval (default: 10)\n"
        "  --keep-staging                   Keep source files after upload\n"
        "  --connect-timeout <secs>         Backend connect timeout (default: 10)\n"
        "  --request-timeout <secs>         Backend request timeout (default: 120)\n"
        "  --daemon                         Run as daemon\n"
        "  --verbose                        Verbose output\n"
        "  --pid-file <path>                PID file path\n"
        "  --log-file <path>                Log file path\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n";
}

}  // namespace

std::optional<VaultConfig> VaultConfig::from_args(int argc, char* argv[],
                                                  std::vector<std::string>* positional) {
    VaultConfig config;
    BackendConfig telegram;
    telegram.type = "telegram";

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--data-dir") {
                auto* v = next_arg(i, "--data-dir");
                if (!v) return std::nullopt;
                config.data_dir = v;
            } else if (arg == "--master-key") {
                auto* v = next_arg(i, "--master-key");
                if (!v) return std::nullopt;
                config.master_key = v;
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--discord-webhook") {
                auto* v = next_arg(i, "--discord-webhook");
                if (!v) return std::nullopt;
                BackendConfig bc;
                bc.type = "discord";
                bc.params["webhook_url"] = v;
                config.backends.push_back(std::move(bc));
            } else if (arg == "--telegram-bot-token") {
                auto* v = next_arg(i, "--telegram-bot-token");
                if (!v) return std::nullopt;
                telegram.params["bot_token"] = v;
            } else if (arg == "--telegram-chat-id") {
                auto* v = next_arg(i, "--telegram-chat-id");
                if (!v) return std::nullopt;
                telegram.params["chat_id"] = v;
            } else if (arg == "--local-backend") {
                auto* v = next_arg(i, "--local-backend");
                if (!v) return std::nullopt;
                BackendConfig bc;
                bc.type = "local";
                bc.params["path"] = v;
                config.backends.push_back(std::move(bc));
            } else if (arg == "--chunk-size-mib") {
                auto* v = next_arg(i, "--chunk-size-mib");
                if (!v) return std::nullopt;
                config.chunk_size_mib = std::stod(v);
            } else if (arg == "--webhook-max-mib") {
                auto* v = next_arg(i, "--webhook-max-mib");
                if (!v) return std::nullopt;
                config.webhook_max_mib = std::stod(v);
            } else if (arg == "--bundle-max-mib") {
                auto* v = next_arg(i, "--bundle-max-mib");
                if (!v) return std::nullopt;
                config.bundle_max_mib = std::stod(v);
            } else if (arg == "--encryption-version") {
                auto* v = next_arg(i, "--encryption-version");
                if (!v) return std::nullopt;
                config.encryption_version = std::stoi(v);
            } else if (arg == "--worker-concurrency") {
                auto* v = next_arg(i, "--worker-concurrency");
                if (!v) return std::nullopt;
                config.worker_concurrency = std::stoull(v);
            } else if (arg == "--worker-poll-ms") {
                auto* v = next_arg(i, "--worker-poll-ms");
                if (!v) return std::nullopt;
                config.worker_poll_interval = std::chrono::milliseconds(std::stoll(v));
            } else if (arg == "--upload-parts-concurrency") {
                auto* v = next_arg(i, "--upload-parts-concurrency");
                if (!v) return std::nullopt;
                config.upload_parts_concurrency = std::stoull(v);
            } else if (arg == "--upload-retry-max") {
                auto* v = next_arg(i, "--upload-retry-max");
                if (!v) return std::nullopt;
                config.upload_retry_max = static_cast<uint32_t>(std::stoul(v));
            } else if (arg == "--upload-retry-base-ms") {
                auto* v = next_arg(i, "--upload-retry-base-ms");
                if (!v) return std::nullopt;
                config.upload_retry_base = std::chrono::milliseconds(std::stoll(v));
            } else if (arg == "--upload-retry-max-ms") {
                auto* v = next_arg(i, "--upload-retry-max-ms");
                if (!v) return std::nullopt;
                config.upload_retry_max_delay = std::chrono::milliseconds(std::stoll(v));
            } else if (arg == "--archive-retry-max") {
                auto* v = next_arg(i, "--archive-retry-max");
                if (!v) return std::nullopt;
                config.archive_retry_max = static_cast<uint32_t>(std::stoul(v));
            } else if (arg == "--processing-stale-minutes") {
                auto* v = next_arg(i, "--processing-stale-minutes");
                if (!v) return std::nullopt;
                config.processing_stale_minutes = std::stoull(v);
            } else if (arg == "--restore-prefetch") {
                auto* v = next_arg(i, "--restore-prefetch");
                if (!v) return std::nullopt;
                config.restore_prefetch = std::stoull(v);
            } else if (arg == "--trash-retention-days") {
                auto* v = next_arg(i, "--trash-retention-days");
                if (!v) return std::nullopt;
                config.trash_retention_days = std::stoull(v);
            } else if (arg == "--delete-sweep-interval") {
                auto* v = next_arg(i, "--delete-sweep-interval");
                if (!v) return std::nullopt;
                config.delete_sweep_interval_secs = std::stoull(v);
            } else if (arg == "--keep-staging") {
                config.delete_staging_after_upload = false;
            } else if (arg == "--connect-timeout") {
                auto* v = next_arg(i, "--connect-timeout");
                if (!v) return std::nullopt;
                config.connect_timeout = std::chrono::seconds(std::stoll(v));
            } else if (arg == "--request-timeout") {
                auto* v = next_arg(i, "--request-timeout");
                if (!v) return std::nullopt;
                config.request_timeout = std::chrono::seconds(std::stoll(v));
            } else if (arg == "--daemon") {
                config.daemonize = true;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--pid-file") {
                auto* v = next_arg(i, "--pid-file");
                if (!v) return std::nullopt;
                config.pid_file = v;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else if (positional && (arg.empty() || arg[0] != '-' || arg == "-")) {
                positional->push_back(arg);
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument: " << e.what() << "\n";
        return std::nullopt;
    }

    if (telegram.params.count("bot_token") || telegram.params.count("chat_id")) {
        config.backends.push_back(std::move(telegram));
    }

    config.apply_defaults();
    return config;
}

bool VaultConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("data_dir")) data_dir = j["data_dir"].get<std::string>();
        if (j.contains("master_key")) master_key = j["master_key"].get<std::string>();
        if (j.contains("chunk_size_mib")) chunk_size_mib = j["chunk_size_mib"].get<double>();
        if (j.contains("webhook_max_mib")) webhook_max_mib = j["webhook_max_mib"].get<double>();
        if (j.contains("bundle_max_mib")) bundle_max_mib = j["bundle_max_mib"].get<double>();
        if (j.contains("encryption_version")) encryption_version = j["encryption_version"].get<int>();
        if (j.contains("worker_concurrency")) worker_concurrency = j["worker_concurrency"].get<size_t>();
        if (j.contains("worker_poll_ms"))
            worker_poll_interval = std::chrono::milliseconds(j["worker_poll_ms"].get<int64_t>());
        if (j.contains("upload_parts_concurrency"))
            upload_parts_concurrency = j["upload_parts_concurrency"].get<size_t>();
        if (j.contains("upload_retry_max")) upload_retry_max = j["upload_retry_max"].get<uint32_t>();
        if (j.contains("upload_retry_base_ms"))
            upload_retry_base = std::chrono::milliseconds(j["upload_retry_base_ms"].get<int64_t>());
        if (j.contains("upload_retry_max_ms"))
            upload_retry_max_delay = std::chrono::milliseconds(j["upload_retry_max_ms"].get<int64_t>());
        if (j.contains("archive_retry_max")) archive_retry_max = j["archive_retry_max"].get<uint32_t>();
        if (j.contains("archive_retry_delay_secs"))
            archive_retry_delay_secs = j["archive_retry_delay_secs"].get<int64_t>();
        if (j.contains("processing_stale_minutes"))
            processing_stale_minutes = j["processing_stale_minutes"].get<size_t>();
        if (j.contains("restore_prefetch")) restore_prefetch = j["restore_prefetch"].get<size_t>();
        if (j.contains("trash_retention_days"))
            trash_retention_days = j["trash_retention_days"].get<size_t>();
        if (j.contains("delete_sweep_interval_secs"))
            delete_sweep_interval_secs = j["delete_sweep_interval_secs"].get<size_t>();
        if (j.contains("delete_staging_after_upload"))
            delete_staging_after_upload = j["delete_staging_after_upload"].get<bool>();
        if (j.contains("connect_timeout_secs"))
            connect_timeout = std::chrono::seconds(j["connect_timeout_secs"].get<int64_t>());
        if (j.contains("request_timeout_secs"))
            request_timeout = std::chrono::seconds(j["request_timeout_secs"].get<int64_t>());
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval_secs"))
            metrics_interval_secs = j["metrics_interval_secs"].get<size_t>();

        if (j.contains("backends") && j["backends"].is_array()) {
            for (auto& jb : j["backends"]) {
                if (jb.is_object()) backends.push_back(backend_from_json(jb));
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void VaultConfig::apply_defaults() {
    if (master_key.empty()) {
        if (const char* v = std::getenv("HOOKVAULT_MASTER_KEY")) master_key = v;
    }
    if (const char* v = std::getenv("HOOKVAULT_REQUEST_TIMEOUT")) {
        char* end = nullptr;
        long secs = std::strtol(v, &end, 10);
        if (end != v && secs > 0) request_timeout = std::chrono::seconds(secs);
    }

    for (auto& bc : backends) {
        if (bc.type == "telegram") {
            if (bc.params["bot_token"].empty()) {
                if (const char* v = std::getenv("HOOKVAULT_TELEGRAM_BOT_TOKEN")) bc.params["bot_token"] = v;
            }
            if (bc.params["chat_id"].empty()) {
                if (const char* v = std::getenv("HOOKVAULT_TELEGRAM_CHAT_ID")) bc.params["chat_id"] = v;
            }
        }

        if (!bc.id.empty()) continue;
        if (bc.type == "discord") {
            bc.id = webhook_id_from_url(bc.params["webhook_url"]);
        } else if (bc.type == "telegram") {
            bc.id = "telegram:" + bc.params["chat_id"];
        } else if (bc.type == "local") {
            bc.id = "local:" + std::filesystem::path(bc.params["path"]).filename().string();
        }
    }
}

std::string VaultConfig::validate() const {
    if (data_dir.empty()) return "data_dir is required (--data-dir)";
    if (master_key.empty()) return "master_key is required (--master-key or HOOKVAULT_MASTER_KEY)";
    if (backends.empty()) return "at least one backend is required";
    for (size_t i = 0; i < backends.size(); ++i) {
        auto err = backends[i].validate();
        if (!err.empty()) return "backend " + std::to_string(i) + ": " + err;
        for (size_t k = 0; k < i; ++k) {
            if (backends[k].id == backends[i].id) return "duplicate backend id: " + backends[i].id;
        }
    }
    if (!(chunk_size_mib > 0) || !(webhook_max_mib > 0)) return "chunk size must be > 0";
    if (chunk_size_bytes() == 0) return "chunk size rounds down to 0 bytes";
    if (encryption_version != 1 && encryption_version != 2)
        return "encryption_version must be 1 or 2";
    if (worker_concurrency == 0) return "worker_concurrency must be > 0";
    if (upload_retry_base.count() < 0 || upload_retry_max_delay < upload_retry_base)
        return "upload_retry_max_ms must be >= upload_retry_base_ms";
    if (connect_timeout.count() <= 0 || request_timeout.count() <= 0)
        return "timeouts must be > 0";
    return {};
}

uint64_t VaultConfig::chunk_size_bytes() const {
    double mib = std::min(chunk_size_mib, webhook_max_mib);
    return static_cast<uint64_t>(std::floor(mib * 1024 * 1024));
}

uint64_t VaultConfig::bundle_max_bytes() const {
    return static_cast<uint64_t>(std::floor(bundle_max_mib * 1024 * 1024));
}

std::string webhook_id_from_url(const std::string& url) {
    static const std::string marker = "/webhooks/";
    auto pos = url.find(marker);
    if (pos == std::string::npos) return {};
    pos += marker.size();
    auto end = url.find('/', pos);
    if (end == std::string::npos || end == pos) return {};
    return url.substr(pos, end - pos);
}

std::string mask_secret(const std::string& secret) {
    if (secret.size() <= 4) return std::string(secret.size(), '*');
    return std::string(secret.size() - 4, '*') + secret.substr(secret.size() - 4);
}

}  // namespace hookvault
