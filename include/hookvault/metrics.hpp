#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace hookvault {

class Vault;

/// Observes the seconds between construction and destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& into) : into_(into), began_(Clock::now()) {}
    ~ScopedTimer() { into_.Observe(std::chrono::duration<double>(Clock::now() - began_).count()); }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    using Clock = std::chrono::steady_clock;
    prometheus::Histogram& into_;
    Clock::time_point began_;
};

/// Periodically writes the vault's counters to a Prometheus textfile that
/// node_exporter collects.
///
/// Counters follow Vault::get_stats() by delta. The status gauges are set from
/// the per-status archive counts. The uploader, restore engine and sweeper
/// time themselves into the histograms with ScopedTimer.
class MetricsExporter {
public:
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    void set_vault(Vault* vault) { vault_ = vault; }

    void start();

    /// Stop the writer thread and write one final snapshot.
    void stop();

    /// Pull counters and gauges from the vault now.
    void update_from_vault();

    prometheus::Histogram& part_upload_duration() { return *part_upload_duration_; }
    prometheus::Histogram& restore_duration() { return *restore_duration_; }
    prometheus::Histogram& deletion_duration() { return *deletion_duration_; }

    const std::filesystem::path& path() const { return prom_file_path_; }

private:
    void writer_loop();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    Vault* vault_ = nullptr;  // not owned

    // Stats as of the last snapshot
    struct Snapshot {
        uint64_t archives_completed = 0;
        uint64_t archives_failed = 0;
        uint64_t parts_uploaded = 0;
        uint64_t bytes_uploaded = 0;
        uint64_t upload_retries = 0;
        uint64_t restores_completed = 0;
        uint64_t restores_failed = 0;
        uint64_t restores_cancelled = 0;
        uint64_t bytes_restored = 0;
        uint64_t parts_deleted = 0;
        uint64_t archives_deleted = 0;
    };
    Snapshot prev_;
    std::mutex update_mutex_;

    // --- Counters ---
    prometheus::Counter* archives_ready_;
    prometheus::Counter* archives_failed_;
    prometheus::Counter* parts_uploaded_;
    prometheus::Counter* upload_bytes_;
    prometheus::Counter* upload_retries_;
    prometheus::Counter* restores_completed_;
    prometheus::Counter* restores_failed_;
    prometheus::Counter* restores_cancelled_;
    prometheus::Counter* restore_bytes_;
    prometheus::Counter* parts_deleted_;
    prometheus::Counter* archives_deleted_;

    // --- Gauges ---
    prometheus::Gauge* archives_queued_;
    prometheus::Gauge* archives_processing_;
    prometheus::Gauge* archives_ready_now_;
    prometheus::Gauge* archives_error_;

    // --- Histograms ---
    prometheus::Histogram* part_upload_duration_;
    prometheus::Histogram* restore_duration_;
    prometheus::Histogram* deletion_duration_;

    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace hookvault
