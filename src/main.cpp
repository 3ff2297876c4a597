#include "hookvault/log.hpp"
#include "hookvault/metrics.hpp"
#include "hookvault/vault.hpp"
#include "hookvault/vault_config.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace {

volatile std::sig_atomic_t g_stop = 0;

void on_signal(int) { g_stop = 1; }

// Double fork so the daemon is never a session leader with a terminal
bool detach() {
    for (int round = 0; round < 2; ++round) {
        pid_t pid = fork();
        if (pid < 0) return false;
        if (pid > 0) _exit(0);
        if (round == 0 && setsid() < 0) return false;
    }
    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        dup2(null_fd, STDIN_FILENO);
        if (null_fd != STDIN_FILENO) close(null_fd);
    }
    return true;
}

void ensure_parent(const std::string& file) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(file).parent_path(), ec);
}

bool redirect_output(const std::string& log_file) {
    ensure_parent(log_file);
    int fd = open(log_file.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd < 0) return false;
    dup2(fd, STDOUT_FILENO);
    dup2(fd, STDERR_FILENO);
    close(fd);
    return true;
}

bool looks_secret(const std::string& param) {
    for (const char* marker : {"token", "webhook", "key", "secret"}) {
        if (param.find(marker) != std::string::npos) return true;
    }
    return false;
}

void print_settings(const hookvault::VaultConfig& config) {
    using hookvault::mask_secret;
    std::cout << "hookvault " << HOOKVAULT_VERSION << "\n"
              << "  data-dir            " << config.data_dir << "\n"
              << "  master-key          " << mask_secret(config.master_key) << "\n"
              << "  chunk-size          " << config.chunk_size_bytes() << " bytes\n"
              << "  encryption          v" << config.encryption_version << "\n"
              << "  workers             " << config.worker_concurrency << " archives, "
              << config.upload_parts_concurrency << " parts each\n"
              << "  restore-prefetch    " << config.restore_prefetch << "\n";
    for (const auto& backend : config.backends) {
        std::cout << "  backend             " << backend.id << " [" << backend.type << "]\n";
        for (const auto& [param, value] : backend.params) {
            std::cout << "    " << param << " = " << (looks_secret(param) ? mask_secret(value) : value)
                      << "\n";
        }
    }
    std::cout.flush();
}

void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);
}

std::string host_name() {
    char buf[256] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0) return "unknown";
    return buf;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = hookvault::VaultConfig::from_args(argc, argv);
    if (!parsed) return 1;
    hookvault::VaultConfig config = std::move(*parsed);

    if (auto problem = config.validate(); !problem.empty()) {
        std::cerr << "hookvault: " << problem << "\n";
        return 1;
    }

    if (config.daemonize && !detach()) {
        std::cerr << "hookvault: could not detach from terminal\n";
        return 1;
    }
    if (!config.log_file.empty() && !redirect_output(config.log_file)) {
        std::cerr << "hookvault: cannot open log file " << config.log_file << "\n";
        return 1;
    }
    hookvault::set_verbose_logging(config.verbose);
    print_settings(config);

    if (!config.pid_file.empty()) {
        ensure_parent(config.pid_file);
        std::ofstream(config.pid_file) << getpid() << "\n";
    }
    install_signal_handlers();

    hookvault::Vault vault(config);

    std::unique_ptr<hookvault::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<hookvault::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"host", host_name()}});
        metrics->set_vault(&vault);
        vault.set_metrics(metrics.get());
    }

    if (auto failure = vault.start(); !failure.empty()) {
        hookvault::log_error("main", "startup failed: %s", failure.c_str());
        return 1;
    }
    if (metrics) metrics->start();
    hookvault::log_info("main", "running as pid %d", static_cast<int>(getpid()));

    // Shutdown happens here, never inside the handler
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    hookvault::log_info("main", "shutting down");
    vault.stop();
    vault.wait();
    if (metrics) metrics->stop();

    if (!config.pid_file.empty()) unlink(config.pid_file.c_str());
    return 0;
}
