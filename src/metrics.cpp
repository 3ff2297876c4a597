#include "hookvault/metrics.hpp"
#include "hookvault/log.hpp"
#include "hookvault/vault.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace hookvault {

namespace {

// Advance `counter` by how far `now` moved past `prev`
void add_delta(prometheus::Counter& counter, uint64_t now, uint64_t& prev) {
    if (now > prev) {
        counter.Increment(static_cast<double>(now - prev));
        prev = now;
    }
}

}  // namespace

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {
    auto counters = [&](const char* name, const char* help) -> prometheus::Family<prometheus::Counter>& {
        return prometheus::BuildCounter().Name(name).Help(help).Labels(labels).Register(*registry_);
    };
    auto histogram = [&](const char* name, const char* help,
                         prometheus::Histogram::BucketBoundaries buckets) {
        return &prometheus::BuildHistogram().Name(name).Help(help).Labels(labels)
                    .Register(*registry_).Add({}, std::move(buckets));
    };

    auto& archives = counters("hookvault_archives_uploaded_total", "Archive upload attempts finished");
    archives_ready_ = &archives.Add({{"result", "ready"}});
    archives_failed_ = &archives.Add({{"result", "error"}});

    parts_uploaded_ = &counters("hookvault_parts_uploaded_total", "Parts stored on a backend").Add({});
    upload_bytes_ = &counters("hookvault_upload_bytes_total", "Stored bytes of uploaded parts").Add({});
    upload_retries_ = &counters("hookvault_backend_retries_total",
                                "Backend requests retried after a transient failure").Add({});

    auto& restores = counters("hookvault_restores_total", "Restores finished");
    restores_completed_ = &restores.Add({{"result", "completed"}});
    restores_failed_ = &restores.Add({{"result", "failed"}});
    restores_cancelled_ = &restores.Add({{"result", "cancelled"}});
    restore_bytes_ = &counters("hookvault_restore_bytes_total",
                               "Plaintext bytes delivered by restores").Add({});

    auto& deleted = counters("hookvault_deleted_total", "Remote objects and archives removed by the sweeper");
    parts_deleted_ = &deleted.Add({{"type", "part"}});
    archives_deleted_ = &deleted.Add({{"type", "archive"}});

    auto& by_status = prometheus::BuildGauge()
        .Name("hookvault_archives")
        .Help("Live archives by status")
        .Labels(labels)
        .Register(*registry_);
    archives_queued_ = &by_status.Add({{"status", "queued"}});
    archives_processing_ = &by_status.Add({{"status", "processing"}});
    archives_ready_now_ = &by_status.Add({{"status", "ready"}});
    archives_error_ = &by_status.Add({{"status", "error"}});

    part_upload_duration_ = histogram("hookvault_part_upload_duration_seconds",
                                      "Part upload duration in seconds, retries included",
                                      {0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});
    restore_duration_ = histogram("hookvault_restore_duration_seconds", "Restore duration in seconds",
                                  {0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 300});
    deletion_duration_ = histogram("hookvault_deletion_duration_seconds",
                                   "Time spent on one archive deletion pass",
                                   {0.01, 0.05, 0.1, 0.5, 1, 5, 10, 30, 60});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    std::lock_guard lock(cv_mutex_);
    if (running_) return;
    running_ = true;
    writer_thread_ = std::thread([this] { writer_loop(); });
}

void MetricsExporter::stop() {
    {
        std::lock_guard lock(cv_mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (writer_thread_.joinable()) writer_thread_.join();

    // Final snapshot so short runs still leave a file behind
    update_from_vault();
    write_file();
}

void MetricsExporter::writer_loop() {
    std::unique_lock lock(cv_mutex_);
    while (!cv_.wait_for(lock, write_interval_, [this] { return !running_; })) {
        lock.unlock();
        update_from_vault();
        write_file();
        lock.lock();
    }
}

void MetricsExporter::update_from_vault() {
    if (!vault_) return;
    auto s = vault_->get_stats();

    std::lock_guard lock(update_mutex_);

    auto status_count = [&s](const char* status) {
        auto it = s.archives_by_status.find(status);
        return static_cast<double>(it == s.archives_by_status.end() ? 0 : it->second);
    };
    archives_queued_->Set(status_count("queued"));
    archives_processing_->Set(status_count("processing"));
    archives_ready_now_->Set(status_count("ready"));
    archives_error_->Set(status_count("error"));

    // Increment counters by deltas since last snapshot
    add_delta(*archives_ready_, s.archives_completed, prev_.archives_completed);
    add_delta(*archives_failed_, s.archives_failed, prev_.archives_failed);
    add_delta(*parts_uploaded_, s.parts_uploaded, prev_.parts_uploaded);
    add_delta(*upload_bytes_, s.bytes_uploaded, prev_.bytes_uploaded);
    add_delta(*upload_retries_, s.upload_retries, prev_.upload_retries);
    add_delta(*restores_completed_, s.restores_completed, prev_.restores_completed);
    add_delta(*restores_failed_, s.restores_failed, prev_.restores_failed);
    add_delta(*restores_cancelled_, s.restores_cancelled, prev_.restores_cancelled);
    add_delta(*restore_bytes_, s.bytes_restored, prev_.bytes_restored);
    add_delta(*parts_deleted_, s.parts_deleted, prev_.parts_deleted);
    add_delta(*archives_deleted_, s.archives_deleted, prev_.archives_deleted);
}

void MetricsExporter::write_file() {
    if (prom_file_path_.empty()) return;

    // node_exporter must never read a half-written file
    auto staging = prom_file_path_;
    staging += ".tmp";
    {
        std::ofstream out(staging, std::ios::trunc);
        out << prometheus::TextSerializer().Serialize(registry_->Collect());
        if (!out.flush()) {
            log_warn("metrics", "cannot write %s", staging.c_str());
            return;
        }
    }
    std::error_code ec;
    std::filesystem::rename(staging, prom_file_path_, ec);
    if (ec) log_warn("metrics", "rename to %s failed: %s", prom_file_path_.c_str(), ec.message().c_str());
}

}  // namespace hookvault
