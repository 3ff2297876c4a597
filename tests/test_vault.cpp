// Integration tests for the vault engine against a local blob directory.
//
// Tests:
//   1. Manifest claims and idempotent part records
//   2. Upload and restore, per-part and whole-archive encryption
//   3. Resuming a partially uploaded archive
//   4. Failure handling: retryable, permanent, missing source
//   5. Bundles: layout, single-entry restore, size limit
//   6. Restore failures: mid-stream error, cancel, corrupted part
//   7. Deletion sweeper: resumable passes, already-gone parts, trash expiry
//   8. Vault facade: trash, shares, observers, quota, background workers
//   9. Metrics textfile

#include "test_harness.hpp"

#include "hookvault/archive_store.hpp"
#include "hookvault/backend.hpp"
#include "hookvault/collaborators.hpp"
#include "hookvault/error.hpp"
#include "hookvault/metrics.hpp"
#include "hookvault/vault.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <optional>

using namespace hookvault;

constexpr uint64_t kChunk = 1024 * 1024;
constexpr size_t kPayload = 2600000;  // three parts of kChunk, the last one short

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/// Local backend with scripted failures and call counters.
class FlakyBackend : public BlobBackend {
public:
    explicit FlakyBackend(std::unique_ptr<BlobBackend> inner) : inner_(std::move(inner)) {}

    std::string type_name() const override { return "flaky-" + inner_->type_name(); }
    const std::string& id() const override { return inner_->id(); }
    bool ready() const override { return inner_->ready(); }

    BlobRef upload(const crypto::Bytes& data, const std::string& filename,
                   const std::string& caption) override {
        ++upload_calls;
        if (filename == fail_upload_name || fail_uploads.load() > 0) {
            if (fail_uploads.load() > 0) --fail_uploads;
            throw Error(ErrorKind::FatalBackend, "scripted upload failure for " + filename, 503,
                        fail_retryable);
        }
        return inner_->upload(data, filename, caption);
    }

    crypto::Bytes fetch(const BlobRef& ref, const std::atomic<bool>* cancel) override {
        ++fetch_calls;
        int now = ++fetches_in_flight;
        int peak = max_fetches_in_flight.load();
        while (now > peak && !max_fetches_in_flight.compare_exchange_weak(peak, now)) {
        }
        struct Leave {
            std::atomic<int>& count;
            ~Leave() { --count; }
        } leave{fetches_in_flight};
        if (fetch_delay.count() > 0) std::this_thread::sleep_for(fetch_delay);

        if (!fail_fetch_suffix.empty() && ends_with(ref.message_id, fail_fetch_suffix)) {
            throw Error(ErrorKind::FatalBackend, "scripted fetch failure", 403);
        }
        auto data = inner_->fetch(ref, cancel);
        if (corrupt_fetch && !data.empty()) data[0] ^= 0x5A;
        return data;
    }

    void remove(const BlobRef& ref) override {
        int call = ++remove_calls;
        if (call == fail_remove_call) {
            throw Error(ErrorKind::TransientNetwork, "scripted delete failure");
        }
        inner_->remove(ref);
    }

    BlobBackend& inner() { return *inner_; }

    // Set while the vault is idle
    std::string fail_upload_name;
    std::atomic<int> fail_uploads{0};
    bool fail_retryable = true;
    std::string fail_fetch_suffix;
    bool corrupt_fetch = false;
    int fail_remove_call = 0;
    std::chrono::milliseconds fetch_delay{0};

    std::atomic<int> upload_calls{0};
    std::atomic<int> fetch_calls{0};
    std::atomic<int> fetches_in_flight{0};
    std::atomic<int> max_fetches_in_flight{0};
    std::atomic<int> remove_calls{0};

private:
    std::unique_ptr<BlobBackend> inner_;
};

/// Collects restored bytes in memory.
class MemorySink : public ByteSink {
public:
    bool write(const uint8_t* d, size_t n) override {
        if (decline_after && data.size() >= *decline_after) return false;
        data.append(reinterpret_cast<const char*>(d), n);
        return true;
    }
    void finish() override { finished = true; }
    void abort(const std::string& r) override {
        aborted = true;
        reason = r;
    }

    std::string data;
    std::optional<size_t> decline_after;
    bool finished = false;
    bool aborted = false;
    std::string reason;
};

struct TestVault {
    fs::path root;
    FlakyBackend* backend = nullptr;  // owned by the vault's pool
    std::unique_ptr<Vault> vault;

    ~TestVault() {
        vault.reset();
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    /// Write `content` outside the vault and queue it as one archive.
    Archive add_file(const std::string& name, const std::string& content,
                     const std::string& owner = "alice") {
        auto src = root / "incoming" / name;
        write_file(src, content);
        return vault->create_from_local_file(owner, src, name);
    }

    Archive reload(int64_t id) { return *vault->get_archive(id); }
};

static std::unique_ptr<TestVault> open_vault(int encryption_version,
                                             const std::function<void(VaultConfig&)>& tweak = {}) {
    auto t = std::make_unique<TestVault>();
    t->root = make_temp_dir("hv-vault");

    VaultConfig config;
    config.data_dir = t->root / "data";
    config.master_key = "test master key";
    config.chunk_size_mib = 1.0;
    config.encryption_version = encryption_version;
    config.upload_parts_concurrency = 1;
    config.archive_retry_max = 3;
    config.worker_poll_interval = std::chrono::milliseconds(50);

    BackendConfig bc;
    bc.type = "local";
    bc.id = "local:blobs";
    bc.params["path"] = (t->root / "blobs").string();
    config.backends.push_back(bc);

    if (tweak) tweak(config);

    BackendOptions options;
    options.retry.sleeper = [](std::chrono::milliseconds) {};
    auto flaky = std::make_unique<FlakyBackend>(BlobBackendFactory::create(bc, options));
    t->backend = flaky.get();
    auto pool = std::make_unique<BackendPool>();
    pool->add(std::move(flaky));

    t->vault = std::make_unique<Vault>(config, std::move(pool));
    auto err = t->vault->open();
    if (!err.empty()) throw std::runtime_error("vault open failed: " + err);
    return t;
}

static size_t count_files(const fs::path& dir) {
    size_t n = 0;
    std::error_code ec;
    for (const auto& e : fs::directory_iterator(dir, ec)) {
        if (e.is_regular_file()) ++n;
    }
    return n;
}

// ---------------------------------------------------------------------------
// 1. Manifest claims
// ---------------------------------------------------------------------------

static void test_store_claims() {
    std::cout << "\n=== Manifest claims ===" << std::endl;

    {
        TEST(exactly_one_concurrent_claim_wins);
        auto t = open_vault(2);
        auto a = t->add_file("a.bin", make_content(1000));
        auto& store = t->vault->store();

        std::atomic<int> wins{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&] {
                if (store.claim(a.id, ClaimLimits{})) ++wins;
            });
        }
        for (auto& th : threads) th.join();
        ASSERT_EQ(wins.load(), 1, "one winner");
        ASSERT_TRUE(t->reload(a.id).status == ArchiveStatus::Processing, "processing");
        ASSERT_TRUE(!store.claim_next(ClaimLimits{}), "nothing else claimable");
        PASS();
    }
    {
        TEST(record_part_is_idempotent);
        auto t = open_vault(2);
        auto a = t->add_file("a.bin", make_content(1000));
        auto& store = t->vault->store();
        ArchivePart p;
        p.index = 0;
        p.size = 1000;
        p.plain_size = 1000;
        p.hash = "h";
        p.message_id = "m";
        p.webhook_id = "local:blobs";
        ASSERT_TRUE(store.record_part(a.id, p), "first insert");
        ASSERT_TRUE(!store.record_part(a.id, p), "duplicate ignored");
        auto r = t->reload(a.id);
        ASSERT_EQ(r.uploaded_parts, 1u, "counted once");
        ASSERT_EQ(r.uploaded_bytes, 1000u, "bytes counted once");
        ASSERT_EQ(r.parts.size(), 1u, "one row");
        PASS();
    }
    {
        TEST(failed_archive_reclaim_rules);
        auto t = open_vault(2);
        auto a = t->add_file("a.bin", make_content(10));
        auto& store = t->vault->store();

        ASSERT_TRUE(store.claim(a.id, ClaimLimits{}), "claimed");
        store.mark_error(a.id, "boom", false);
        ASSERT_TRUE(!store.claim(a.id, ClaimLimits{}), "permanent error is not claimable");
        ASSERT_TRUE(t->vault->retry_archive(a.id), "manual retry");
        auto r = t->reload(a.id);
        ASSERT_TRUE(r.status == ArchiveStatus::Queued, "queued again");
        ASSERT_EQ(r.retry_count, 0u, "budget reset");

        ASSERT_TRUE(store.claim(a.id, ClaimLimits{}), "claimed again");
        store.mark_error(a.id, "flaky", true);
        ASSERT_TRUE(!store.claim(a.id, ClaimLimits{1, 0}), "retry budget spent");
        ASSERT_TRUE(!store.claim(a.id, ClaimLimits{5, 3600}), "retry delay not elapsed");
        ASSERT_TRUE(store.claim(a.id, ClaimLimits{5, 0}), "retryable error reclaimed");
        PASS();
    }
    {
        TEST(trashed_and_deleted_are_not_claimed);
        auto t = open_vault(2);
        auto a = t->add_file("a.bin", make_content(10));
        auto b = t->add_file("b.bin", make_content(10));
        ASSERT_TRUE(t->vault->request_trash(a.id), "trashed");
        ASSERT_TRUE(t->vault->request_delete(b.id), "delete requested");
        ASSERT_TRUE(!t->vault->store().claim_next(ClaimLimits{}), "nothing claimable");
        ASSERT_EQ(t->vault->process_pending(), 0u, "nothing processed");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. Upload and restore
// ---------------------------------------------------------------------------

static void test_upload_restore_per_part() {
    std::cout << "\n=== Upload and restore (per-part) ===" << std::endl;
    auto t = open_vault(2);
    auto content = make_content(kPayload, 11);
    auto src = t->root / "incoming" / "movie.bin";
    write_file(src, content);

    auto a = t->vault->create_from_local_file("alice", src, "holiday/movie.bin");
    int64_t id = a.id;

    {
        TEST(create_stages_and_queues);
        ASSERT_TRUE(a.status == ArchiveStatus::Queued, "queued");
        ASSERT_TRUE(!fs::exists(src), "source moved into staging");
        ASSERT_EQ(a.files.size(), 1u, "one file");
        ASSERT_TRUE(fs::exists(a.files[0].path), "staged copy exists");
        ASSERT_EQ(a.download_name, std::string("holiday_movie.bin"), "download name");
        ASSERT_EQ(a.original_size, kPayload, "size");
        ASSERT_EQ(a.chunk_size_bytes, kChunk, "chunk size");
        ASSERT_EQ(t->vault->store().used_bytes("alice"), static_cast<int64_t>(kPayload), "quota");
        PASS();
    }
    {
        TEST(process_uploads_three_parts);
        ASSERT_EQ(t->vault->process_pending(), 1u, "one archive processed");
        auto r = t->reload(id);
        ASSERT_TRUE(r.status == ArchiveStatus::Ready, "ready");
        ASSERT_EQ(r.total_parts, 3u, "three parts");
        ASSERT_EQ(r.uploaded_parts, 3u, "all recorded");
        ASSERT_EQ(r.parts[0].plain_size, kChunk, "part 0");
        ASSERT_EQ(r.parts[1].plain_size, kChunk, "part 1");
        ASSERT_EQ(r.parts[2].plain_size, kPayload - 2 * kChunk, "part 2");
        for (const auto& p : r.parts) {
            ASSERT_EQ(p.size, p.plain_size, "gcm keeps the length");
            ASSERT_EQ(p.iv.size(), crypto::kIvSize, "per-part iv");
            ASSERT_EQ(p.auth_tag.size(), crypto::kTagSize, "per-part tag");
            ASSERT_EQ(p.webhook_id, std::string("local:blobs"), "backend recorded");
        }
        ASSERT_TRUE(r.parts[0].iv != r.parts[1].iv, "fresh iv per part");
        ASSERT_TRUE(r.iv.empty(), "no archive-level iv");
        ASSERT_TRUE(!fs::exists(r.staging_dir), "staging released");
        ASSERT_EQ(count_files(t->root / "blobs"), 3u, "three blobs stored");
        PASS();
    }
    {
        TEST(stored_blobs_are_ciphertext);
        std::string joined;
        for (const auto& e : fs::directory_iterator(t->root / "blobs")) joined += read_file(e.path());
        ASSERT_TRUE(joined.find(content.substr(1000, 64)) == std::string::npos, "no plaintext on the host");
        PASS();
    }
    {
        TEST(download_round_trip);
        MemorySink sink;
        auto outcome = t->vault->get_download_stream(id, std::nullopt, sink);
        ASSERT_TRUE(outcome == RestoreOutcome::Completed, "completed");
        ASSERT_TRUE(sink.finished && !sink.aborted, "finished");
        ASSERT_EQ(sink.data.size(), content.size(), "size");
        ASSERT_TRUE(sink.data == content, "bytes");
        ASSERT_EQ(t->reload(id).files[0].download_count, 1u, "download counted");
        PASS();
    }
    {
        TEST(file_sink_renames_on_finish);
        auto out = t->root / "restored.bin";
        {
            FileSink sink(out);
            t->vault->get_download_stream(id, 0u, sink);
            ASSERT_EQ(sink.bytes_written(), kPayload, "bytes written");
        }
        ASSERT_TRUE(read_file(out) == content, "file content");
        ASSERT_TRUE(!fs::exists(t->root / "restored.bin.partial"), "no partial file");
        PASS();
    }
    {
        TEST(range_across_part_boundary);
        MemorySink sink;
        t->vault->get_range_stream(id, kChunk - 10, kChunk + 10, sink);
        ASSERT_TRUE(sink.data == content.substr(kChunk - 10, 21), "range bytes");

        MemorySink tail;
        t->vault->get_range_stream(id, kPayload - 5, kPayload - 1, tail);
        ASSERT_TRUE(tail.data == content.substr(kPayload - 5), "last bytes");

        MemorySink bad;
        ASSERT_THROWS_KIND(t->vault->get_range_stream(id, 0, kPayload, bad), ErrorKind::NotFound,
                           "past the end");
        ASSERT_TRUE(bad.aborted, "aborted");
        PASS();
    }
    {
        TEST(stats_reflect_work);
        auto s = t->vault->get_stats();
        ASSERT_EQ(s.archives_completed, 1u, "completed");
        ASSERT_EQ(s.parts_uploaded, 3u, "parts");
        ASSERT_EQ(s.bytes_uploaded, kPayload, "bytes");
        ASSERT_TRUE(s.restores_completed >= 2u, "restores");
        ASSERT_EQ(s.archives_by_status["ready"], 1u, "ready count");
        PASS();
    }
    {
        TEST(empty_file_round_trip);
        auto e = t->add_file("empty.txt", "");
        t->vault->process_pending();
        auto r = t->reload(e.id);
        ASSERT_TRUE(r.status == ArchiveStatus::Ready, "ready");
        ASSERT_EQ(r.total_parts, 1u, "one empty part");
        MemorySink sink;
        ASSERT_TRUE(t->vault->get_download_stream(e.id, std::nullopt, sink) == RestoreOutcome::Completed,
                    "completed");
        ASSERT_TRUE(sink.data.empty() && sink.finished, "nothing but finish");
        PASS();
    }
}

static void test_decimal_chunk_size() {
    std::cout << "\n=== Decimal chunk size ===" << std::endl;

    TEST(two_and_a_half_million_bytes_in_three_parts);
    // 1,000,000 / 2^20 is exact in binary, so the chunk is exactly 1,000,000 bytes
    auto t = open_vault(2, [](VaultConfig& c) { c.chunk_size_mib = 1000000.0 / 1048576.0; });
    auto content = make_content(2500000, 13);
    auto a = t->add_file("report.pdf", content);
    ASSERT_EQ(a.chunk_size_bytes, 1000000u, "chunk size");

    t->vault->process_pending();
    auto r = t->reload(a.id);
    ASSERT_TRUE(r.status == ArchiveStatus::Ready, "ready");
    ASSERT_EQ(r.total_parts, 3u, "total parts");
    ASSERT_EQ(r.uploaded_parts, 3u, "uploaded parts");
    ASSERT_EQ(r.parts[0].plain_size, 1000000u, "part 0");
    ASSERT_EQ(r.parts[1].plain_size, 1000000u, "part 1");
    ASSERT_EQ(r.parts[2].plain_size, 500000u, "part 2");

    MemorySink sink;
    t->vault->get_download_stream(a.id, std::nullopt, sink);
    ASSERT_TRUE(sink.data == content, "round trip");
    PASS();
}

static void test_upload_restore_whole_archive() {
    std::cout << "\n=== Upload and restore (whole-archive) ===" << std::endl;
    auto t = open_vault(1);
    auto content = make_content(kPayload, 12);
    auto a = t->add_file("disk.img", content);

    {
        TEST(whole_archive_upload);
        t->vault->process_pending();
        auto r = t->reload(a.id);
        ASSERT_TRUE(r.status == ArchiveStatus::Ready, "ready");
        ASSERT_EQ(r.encryption_version, 1, "version");
        ASSERT_EQ(r.iv.size(), crypto::kIvSize, "archive iv");
        ASSERT_EQ(r.auth_tag.size(), crypto::kTagSize, "archive tag");
        ASSERT_EQ(r.total_parts, 3u, "three parts");
        ASSERT_EQ(r.encrypted_size, kPayload, "ciphertext size");
        ASSERT_TRUE(r.parts[0].iv.empty(), "no per-part iv");
        PASS();
    }
    {
        TEST(whole_archive_download);
        MemorySink sink;
        t->vault->get_download_stream(a.id, std::nullopt, sink);
        ASSERT_TRUE(sink.finished, "finished");
        ASSERT_TRUE(sink.data == content, "bytes");
        PASS();
    }
    {
        TEST(whole_archive_fetches_one_part_at_a_time);
        t->backend->fetch_delay = std::chrono::milliseconds(30);
        t->backend->max_fetches_in_flight = 0;
        MemorySink sink;
        t->vault->get_download_stream(a.id, std::nullopt, sink);
        t->backend->fetch_delay = std::chrono::milliseconds(0);
        ASSERT_TRUE(sink.data == content, "bytes");
        ASSERT_EQ(t->backend->max_fetches_in_flight.load(), 1, "never more than one fetch");
        PASS();
    }
    {
        TEST(range_needs_per_part_encryption);
        MemorySink sink;
        ASSERT_THROWS_KIND(t->vault->get_range_stream(a.id, 0, 10, sink), ErrorKind::Configuration,
                           "v1 range");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. Resume
// ---------------------------------------------------------------------------

static void test_resume() {
    std::cout << "\n=== Resume ===" << std::endl;

    for (int version : {2, 1}) {
        std::cout << "  [v" << version << "]" << std::endl;
        auto t = open_vault(version, [](VaultConfig& c) { c.archive_retry_delay_secs = 3600; });
        auto content = make_content(kPayload, 20 + version);
        auto a = t->add_file("big.bin", content);

        TEST(partial_upload_then_resume);
        t->backend->fail_upload_name = "part_1";
        t->vault->process_pending();

        auto failed = t->reload(a.id);
        ASSERT_TRUE(failed.status == ArchiveStatus::Error, "error after part 1");
        ASSERT_EQ(failed.retry_count, 1u, "retry counted");
        ASSERT_TRUE(failed.error_retryable, "retryable");
        ASSERT_EQ(failed.uploaded_parts, 1u, "part 0 kept");
        ASSERT_TRUE(fs::exists(failed.staging_dir), "staging kept for the retry");
        ASSERT_EQ(t->backend->upload_calls.load(), 2, "part 2 never attempted");
        auto first_message = failed.parts[0].message_id;

        t->backend->fail_upload_name.clear();
        ASSERT_TRUE(t->vault->retry_archive(a.id), "requeued");
        t->vault->process_pending();

        auto r = t->reload(a.id);
        ASSERT_TRUE(r.status == ArchiveStatus::Ready, "ready");
        ASSERT_EQ(t->backend->upload_calls.load(), 4, "only parts 1 and 2 uploaded again");
        ASSERT_EQ(r.parts[0].message_id, first_message, "part 0 untouched");
        if (version == 1) {
            ASSERT_TRUE(r.iv == failed.iv, "iv reused on resume");
            ASSERT_TRUE(r.auth_tag == failed.auth_tag, "tag reproduced");
        }

        MemorySink sink;
        t->vault->get_download_stream(a.id, std::nullopt, sink);
        ASSERT_TRUE(sink.data == content, "mixed-attempt parts restore");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. Failure handling
// ---------------------------------------------------------------------------

static void test_failures() {
    std::cout << "\n=== Failure handling ===" << std::endl;

    {
        TEST(transient_failure_is_retried_automatically);
        auto t = open_vault(2);
        auto a = t->add_file("a.bin", make_content(3000));
        t->backend->fail_uploads = 1;
        ASSERT_EQ(t->vault->process_pending(), 2u, "failed once, then succeeded");
        auto r = t->reload(a.id);
        ASSERT_TRUE(r.status == ArchiveStatus::Ready, "ready");
        ASSERT_EQ(r.retry_count, 1u, "one failed attempt");
        ASSERT_EQ(t->vault->get_stats().archives_failed, 1u, "failure counted");
        PASS();
    }
    {
        TEST(retry_budget_is_bounded);
        auto t = open_vault(2);
        auto a = t->add_file("a.bin", make_content(3000));
        t->backend->fail_uploads = 100;
        ASSERT_EQ(t->vault->process_pending(), 3u, "archive_retry_max attempts");
        auto r = t->reload(a.id);
        ASSERT_TRUE(r.status == ArchiveStatus::Error, "error");
        ASSERT_EQ(r.retry_count, 3u, "budget used up");
        ASSERT_TRUE(!fs::exists(r.staging_dir), "staging released once permanent");
        PASS();
    }
    {
        TEST(non_retryable_failure_is_permanent);
        auto t = open_vault(2);
        auto a = t->add_file("a.bin", make_content(3000));
        t->backend->fail_uploads = 1;
        t->backend->fail_retryable = false;
        ASSERT_EQ(t->vault->process_pending(), 1u, "single attempt");
        auto r = t->reload(a.id);
        ASSERT_TRUE(r.status == ArchiveStatus::Error, "error");
        ASSERT_TRUE(!r.error_retryable, "not retryable");
        ASSERT_TRUE(r.error.find("scripted upload failure") != std::string::npos, "message kept");
        ASSERT_TRUE(!fs::exists(r.staging_dir), "staging released");
        PASS();
    }
    {
        TEST(missing_source_fails_archive);
        auto t = open_vault(2);
        auto a = t->add_file("a.bin", make_content(3000));
        fs::remove(a.files[0].path);
        t->vault->process_pending();
        auto r = t->reload(a.id);
        ASSERT_TRUE(r.status == ArchiveStatus::Error, "error");
        ASSERT_TRUE(r.error.find("missing_file") != std::string::npos, "missing_file");
        ASSERT_EQ(t->backend->upload_calls.load(), 0, "nothing uploaded");
        PASS();
    }
    {
        TEST(restore_of_unfinished_archive);
        auto t = open_vault(2);
        auto a = t->add_file("a.bin", make_content(3000));
        MemorySink sink;
        ASSERT_THROWS_KIND(t->vault->get_download_stream(a.id, std::nullopt, sink), ErrorKind::NotFound,
                           "queued archive");
        ASSERT_THROWS_KIND(t->vault->get_download_stream(9999, std::nullopt, sink), ErrorKind::NotFound,
                           "unknown archive");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. Bundles
// ---------------------------------------------------------------------------

static void test_bundles() {
    std::cout << "\n=== Bundles ===" << std::endl;

    for (int version : {2, 1}) {
        std::cout << "  [v" << version << "]" << std::endl;
        auto t = open_vault(version);
        auto c0 = make_content(100, 30);
        auto c1 = make_content(1500000, 31);
        auto c2 = make_content(5000, 32);
        write_file(t->root / "in" / "a.txt", c0);
        write_file(t->root / "in" / "b.bin", c1);
        write_file(t->root / "in" / "other" / "a.txt", c2);

        auto a = t->vault->create_bundle("alice",
                                         {{t->root / "in" / "a.txt", "a.txt"},
                                          {t->root / "in" / "b.bin", ""},
                                          {t->root / "in" / "other" / "a.txt", "a.txt"}},
                                         "photos");

        TEST(bundle_roundtrip);
        ASSERT_TRUE(a.is_bundle, "bundle");
        ASSERT_EQ(a.download_name, std::string("photos.zip"), "zip suffix");
        ASSERT_EQ(a.files[1].name, std::string("b.bin"), "name from path");
        ASSERT_EQ(a.files[2].name, std::string("a_1.txt"), "duplicate renamed");
        ASSERT_EQ(a.original_size, 1505100u, "total size");

        t->vault->process_pending();
        ASSERT_TRUE(t->reload(a.id).status == ArchiveStatus::Ready, "ready");
        ASSERT_EQ(t->reload(a.id).total_parts, 2u, "zip spans two parts");

        MemorySink whole;
        t->vault->get_download_stream(a.id, std::nullopt, whole);
        ASSERT_TRUE(whole.data.compare(0, 4, "PK\x03\x04") == 0, "zip payload");
        auto stored = t->reload(a.id);
        ASSERT_TRUE(stored.files[0].zip_offset > 0, "offset recorded");
        ASSERT_TRUE(whole.data.substr(stored.files[1].zip_offset, 1500000) == c1, "entry inside zip");
        ASSERT_TRUE(whole.data.substr(stored.files[2].zip_offset, 5000) == c2, "last entry inside zip");

        MemorySink e1, e2;
        t->vault->get_download_stream(a.id, 1u, e1);
        t->vault->get_download_stream(a.id, 2u, e2);
        ASSERT_TRUE(e1.data == c1, "entry 1 straddles parts");
        ASSERT_TRUE(e2.data == c2, "entry 2");
        auto r = t->reload(a.id);
        ASSERT_EQ(r.files[0].download_count, 1u, "whole download counts every file");
        ASSERT_EQ(r.files[1].download_count, 2u, "entry download counted on top");

        ASSERT_TRUE(t->vault->delete_file(a.id, 0), "file removed");
        MemorySink gone;
        ASSERT_THROWS_KIND(t->vault->get_download_stream(a.id, 0u, gone), ErrorKind::NotFound,
                           "deleted file");
        MemorySink range;
        ASSERT_THROWS_KIND(t->vault->get_range_stream(a.id, 0, 10, range), ErrorKind::Configuration,
                           "range on a bundle");
        PASS();
    }

    {
        TEST(bundle_size_limit);
        auto t = open_vault(2, [](VaultConfig& c) { c.bundle_max_mib = 1.0; });
        write_file(t->root / "in" / "x", make_content(800000));
        write_file(t->root / "in" / "y", make_content(800000));
        ASSERT_THROWS_KIND(t->vault->create_bundle("alice", {{t->root / "in" / "x", ""},
                                                             {t->root / "in" / "y", ""}}, "big"),
                           ErrorKind::Configuration, "over the limit");
        ASSERT_TRUE(fs::exists(t->root / "in" / "x"), "sources left in place");
        ASSERT_THROWS_KIND(t->vault->create_bundle("alice", {}, "none"), ErrorKind::Configuration,
                           "empty bundle");
        PASS();
    }    {
        TEST(bundle_download_names_with_utf8);
        auto t = open_vault(2);
        write_file(t->root / "in" / "p", make_content(10));
        write_file(t->root / "in" / "q", make_content(10));
        // Non-ASCII bytes land in the four-character tail being checked
        auto upper = t->vault->create_bundle("alice", {{t->root / "in" / "p", ""}}, "Fotos.ZIP");
        auto accented = t->vault->create_bundle("alice", {{t->root / "in" / "q", ""}},
                                                "vacances-\xc3\xa9t\xc3\xa9");
        ASSERT_EQ(upper.download_name, std::string("Fotos.ZIP"), "suffix kept");
        ASSERT_EQ(accented.download_name, std::string("vacances-\xc3\xa9t\xc3\xa9.zip"),
                  "suffix added");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 6. Restore failures
// ---------------------------------------------------------------------------

static void test_restore_failures() {
    std::cout << "\n=== Restore failures ===" << std::endl;
    auto t = open_vault(2);
    auto content = make_content(kPayload, 40);
    auto a = t->add_file("data.bin", content);
    t->vault->process_pending();

    {
        TEST(failure_mid_stream_aborts_sink);
        t->backend->fail_fetch_suffix = "_part_1";
        MemorySink sink;
        ASSERT_THROWS_KIND(t->vault->get_download_stream(a.id, std::nullopt, sink),
                           ErrorKind::FatalBackend, "part 1 fails");
        t->backend->fail_fetch_suffix.clear();
        ASSERT_TRUE(sink.data == content.substr(0, kChunk), "exactly part 0 delivered");
        ASSERT_TRUE(sink.aborted, "aborted");
        ASSERT_TRUE(!sink.finished, "never finished");
        ASSERT_EQ(t->reload(a.id).files[0].download_count, 0u, "not counted");
        PASS();
    }
    {
        TEST(declined_write_cancels);
        MemorySink sink;
        sink.decline_after = 0;
        auto outcome = t->vault->get_download_stream(a.id, std::nullopt, sink);
        ASSERT_TRUE(outcome == RestoreOutcome::Cancelled, "cancelled");
        ASSERT_TRUE(!sink.finished && !sink.aborted, "neither finished nor aborted");
        ASSERT_EQ(t->vault->get_stats().restores_cancelled, 1u, "counted");
        ASSERT_EQ(t->reload(a.id).files[0].download_count, 0u, "not counted");
        PASS();
    }
    {
        TEST(corrupted_part_is_rejected);
        t->backend->corrupt_fetch = true;
        MemorySink sink;
        ASSERT_THROWS_KIND(t->vault->get_download_stream(a.id, std::nullopt, sink),
                           ErrorKind::AuthenticationFailed, "hash mismatch");
        t->backend->corrupt_fetch = false;
        ASSERT_TRUE(sink.data.empty(), "nothing delivered");
        ASSERT_TRUE(sink.aborted, "aborted");
        PASS();
    }
    {
        TEST(archive_record_unchanged_by_failures);
        auto r = t->reload(a.id);
        ASSERT_TRUE(r.status == ArchiveStatus::Ready, "still ready");
        ASSERT_EQ(r.parts.size(), 3u, "parts intact");
        MemorySink sink;
        t->vault->get_download_stream(a.id, std::nullopt, sink);
        ASSERT_TRUE(sink.data == content, "still restorable");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 7. Deletion
// ---------------------------------------------------------------------------

class RecordingQuota : public QuotaService {
public:
    void adjust_used_bytes(const std::string& owner_id, int64_t delta) override {
        std::lock_guard lock(mutex);
        used[owner_id] += delta;
    }
    std::mutex mutex;
    std::map<std::string, int64_t> used;
};

static void test_deletion() {
    std::cout << "\n=== Deletion ===" << std::endl;

    {
        TEST(failed_pass_resumes_where_it_stopped);
        auto t = open_vault(2);
        auto a = t->add_file("a.bin", make_content(kPayload, 50));
        t->vault->process_pending();
        ASSERT_EQ(count_files(t->root / "blobs"), 3u, "three blobs");

        t->backend->fail_remove_call = 2;
        ASSERT_TRUE(t->vault->request_delete(a.id), "requested");
        ASSERT_TRUE(!t->vault->request_delete(a.id), "already requested");
        ASSERT_EQ(t->vault->sweep_deletions(), 0u, "first pass stops");

        auto mid = t->reload(a.id);
        ASSERT_EQ(mid.deleted_parts, 1u, "one part removed");
        ASSERT_EQ(mid.delete_total_parts, 3u, "total snapshot");
        ASSERT_TRUE(!mid.deleting, "claim released");
        ASSERT_EQ(mid.deleted_at, 0, "not deleted yet");
        ASSERT_EQ(count_files(t->root / "blobs"), 2u, "two blobs left");

        ASSERT_EQ(t->vault->sweep_deletions(), 1u, "second pass completes");
        auto done = t->reload(a.id);
        ASSERT_TRUE(done.deleted_at != 0, "deleted");
        ASSERT_TRUE(done.parts.empty(), "part rows dropped");
        ASSERT_EQ(t->backend->remove_calls.load(), 4, "part 0 not removed twice");
        ASSERT_EQ(count_files(t->root / "blobs"), 0u, "host emptied");
        ASSERT_EQ(t->vault->store().used_bytes("alice"), 0, "quota released");
        ASSERT_TRUE(t->vault->list_archives("alice").empty(), "gone from listings");

        MemorySink sink;
        ASSERT_THROWS_KIND(t->vault->get_download_stream(a.id, std::nullopt, sink), ErrorKind::NotFound,
                           "deleted archive");
        ASSERT_THROWS_KIND(t->vault->request_trash(a.id), ErrorKind::NotFound, "deleted archive");
        PASS();
    }
    {
        TEST(part_already_gone_counts_as_deleted);
        auto t = open_vault(2);
        auto a = t->add_file("a.bin", make_content(kPayload, 51));
        t->vault->process_pending();
        auto r = t->reload(a.id);
        const auto& p = r.parts[1];
        t->backend->inner().remove(BlobRef{p.url, p.message_id, p.webhook_id, p.file_id});

        t->vault->request_delete(a.id);
        ASSERT_EQ(t->vault->sweep_deletions(), 1u, "completes");
        ASSERT_TRUE(t->reload(a.id).deleted_at != 0, "deleted");
        ASSERT_EQ(t->vault->get_stats().parts_deleted, 3u, "all three counted");
        PASS();
    }
    {
        TEST(unfinished_archive_deletes_recorded_parts);
        auto t = open_vault(2, [](VaultConfig& c) { c.archive_retry_delay_secs = 3600; });
        auto a = t->add_file("a.bin", make_content(kPayload, 52));
        t->backend->fail_upload_name = "part_2";
        t->vault->process_pending();
        ASSERT_EQ(t->reload(a.id).uploaded_parts, 2u, "two parts uploaded");

        t->vault->request_delete(a.id);
        ASSERT_EQ(t->vault->sweep_deletions(), 1u, "deleted");
        ASSERT_EQ(t->backend->remove_calls.load(), 2, "only recorded parts removed");
        ASSERT_TRUE(!fs::exists(a.staging_dir), "staging removed");
        PASS();
    }
    {
        TEST(trash_expiry);
        auto keep = open_vault(2);
        auto a = keep->add_file("a.bin", make_content(100));
        keep->vault->process_pending();
        ASSERT_TRUE(keep->vault->request_trash(a.id), "trashed");
        ASSERT_EQ(keep->vault->sweep_deletions(), 0u, "within retention");
        ASSERT_TRUE(keep->reload(a.id).trashed_at != 0, "still in trash");

        auto expire = open_vault(2, [](VaultConfig& c) { c.trash_retention_days = 0; });
        auto b = expire->add_file("b.bin", make_content(100));
        expire->vault->process_pending();
        ASSERT_TRUE(expire->vault->request_trash(b.id), "trashed");
        ASSERT_EQ(expire->vault->sweep_deletions(), 1u, "expired trash deleted");
        ASSERT_TRUE(expire->reload(b.id).deleted_at != 0, "deleted");
        PASS();
    }
    {
        TEST(custom_quota_service);
        auto t = open_vault(2);
        RecordingQuota quota;
        t->vault->set_quota_service(&quota);
        auto a = t->add_file("a.bin", make_content(4321), "bob");
        ASSERT_EQ(quota.used["bob"], 4321, "incremented on create");
        t->vault->process_pending();
        t->vault->request_delete(a.id);
        t->vault->sweep_deletions();
        ASSERT_EQ(quota.used["bob"], 0, "decremented once on deletion");
        ASSERT_EQ(t->vault->store().used_bytes("bob"), 0, "manifest counter untouched");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 8. Vault facade
// ---------------------------------------------------------------------------

class FakeShares : public ShareLookup {
public:
    std::optional<ShareGrant> resolve(const std::string& token) override {
        auto it = grants.find(token);
        if (it == grants.end()) return std::nullopt;
        return it->second;
    }
    std::map<std::string, ShareGrant> grants;
};

class CountingObserver : public ArchiveObserver {
public:
    void on_archive_created(int64_t id) override { seen.push_back(id); }
    std::vector<int64_t> seen;
};

class ThrowingObserver : public ArchiveObserver {
public:
    void on_archive_created(int64_t) override { throw std::runtime_error("thumbnailer down"); }
};

/// Reports a thumbnail for every new archive, the way a thumbnail
/// service would.
class ThumbnailObserver : public ArchiveObserver {
public:
    explicit ThumbnailObserver(Vault& vault) : vault_(vault) {}

    void on_archive_created(int64_t id) override {
        ThumbnailInfo thumb;
        thumb.content_type = "image/webp";
        thumb.size = 2048;
        thumb.local_path = "/thumbs/" + std::to_string(id) + ".webp";
        recorded = vault_.record_thumbnail(id, 0, thumb);
    }

    bool recorded = false;

private:
    Vault& vault_;
};

static void test_facade() {
    std::cout << "\n=== Vault facade ===" << std::endl;

    {
        TEST(trash_and_untrash);
        auto t = open_vault(2);
        auto a = t->add_file("a.bin", make_content(10));
        ASSERT_TRUE(t->vault->request_trash(a.id), "trash");
        ASSERT_TRUE(!t->vault->request_trash(a.id), "already trashed");
        ASSERT_TRUE(t->reload(a.id).trashed_at != 0, "trashed_at set");
        ASSERT_TRUE(t->vault->restore_from_trash(a.id), "untrash");
        ASSERT_TRUE(!t->vault->restore_from_trash(a.id), "not in trash");
        ASSERT_EQ(t->reload(a.id).trashed_at, 0, "cleared");
        ASSERT_THROWS_KIND(t->vault->request_trash(424242), ErrorKind::NotFound, "unknown");
        PASS();
    }
    {
        TEST(share_lookup);
        auto t = open_vault(2);
        auto ready = t->add_file("r.bin", make_content(10));
        t->vault->process_pending();
        auto queued = t->add_file("q.bin", make_content(10));
        auto trashed = t->add_file("t.bin", make_content(10));
        t->vault->process_pending();
        t->vault->request_trash(trashed.id);

        ASSERT_TRUE(t->vault->archives_for_share("any").empty(), "no lookup set");

        FakeShares shares;
        shares.grants["live"] = ShareGrant{{ready.id, queued.id, trashed.id, 999}, 0};
        shares.grants["old"] = ShareGrant{{ready.id}, now_epoch() - 10};
        t->vault->set_share_lookup(&shares);

        // q.bin was processed by the second process_pending call
        auto live = t->vault->archives_for_share("live");
        ASSERT_EQ(live.size(), 2u, "ready, untrashed archives only");
        ASSERT_EQ(live[0].id, ready.id, "first");
        ASSERT_EQ(live[1].id, queued.id, "second");
        ASSERT_TRUE(t->vault->archives_for_share("old").empty(), "expired");
        ASSERT_TRUE(t->vault->archives_for_share("nope").empty(), "unknown token");
        PASS();
    }
    {
        TEST(observer_failures_do_not_block_creation);
        auto t = open_vault(2);
        ThrowingObserver bad;
        CountingObserver good;
        t->vault->add_observer(&bad);
        t->vault->add_observer(&good);
        auto a = t->add_file("a.bin", make_content(10));
        ASSERT_TRUE(a.id > 0, "created");
        ASSERT_EQ(good.seen.size(), 1u, "later observer notified");
        ASSERT_EQ(good.seen[0], a.id, "with the id");
        PASS();
    }
    {
        TEST(observer_records_thumbnail);
        auto t = open_vault(2);
        ThumbnailObserver thumbs(*t->vault);
        t->vault->add_observer(&thumbs);
        auto a = t->add_file("photo.jpg", make_content(10));
        ASSERT_TRUE(thumbs.recorded, "thumbnail accepted");
        auto stored = t->reload(a.id);
        const auto& thumb = stored.files[0].thumbnail;
        ASSERT_EQ(thumb.content_type, std::string("image/webp"), "content type");
        ASSERT_EQ(thumb.size, 2048u, "size");
        ASSERT_EQ(thumb.local_path, "/thumbs/" + std::to_string(a.id) + ".webp", "path");
        ASSERT_TRUE(thumb.updated_at > 0, "stamped");

        ThumbnailInfo failed;
        failed.failed_at = 42;
        failed.error = "decoder crashed";
        ASSERT_TRUE(t->vault->record_thumbnail(a.id, 0, failed), "failure recorded");
        ASSERT_EQ(t->reload(a.id).files[0].thumbnail.error, std::string("decoder crashed"), "error");
        ASSERT_EQ(t->reload(a.id).files[0].thumbnail.updated_at, 0, "failure not stamped");
        ASSERT_TRUE(!t->vault->record_thumbnail(a.id, 3, failed), "unknown position");
        ASSERT_THROWS_KIND(t->vault->record_thumbnail(424242, 0, failed), ErrorKind::NotFound,
                           "unknown archive");
        PASS();
    }
    {
        TEST(listing_and_previews);
        auto t = open_vault(2);
        auto a = t->add_file("a.bin", make_content(10));
        auto b = t->add_file("b.bin", make_content(10));
        t->add_file("c.bin", make_content(10), "carol");
        auto list = t->vault->list_archives("alice");
        ASSERT_EQ(list.size(), 2u, "alice has two");
        ASSERT_TRUE(t->vault->record_preview(a.id, 0), "preview");
        ASSERT_TRUE(!t->vault->record_preview(a.id, 5), "unknown position");
        ASSERT_EQ(t->reload(a.id).files[0].preview_count, 1u, "counted");
        ASSERT_TRUE(t->vault->delete_file(b.id, 0), "file deleted");
        ASSERT_TRUE(!t->vault->delete_file(b.id, 0), "already deleted");
        PASS();
    }
    {
        TEST(background_workers_upload);
        auto t = open_vault(2, [](VaultConfig& c) { c.worker_concurrency = 2; });
        auto a = t->add_file("a.bin", make_content(kPayload, 60));
        auto& store = t->vault->store();
        // Left processing as if the previous run crashed mid-upload
        ASSERT_TRUE(store.claim(a.id, ClaimLimits{}), "claimed");

        ASSERT_EMPTY(t->vault->start(), "start");
        auto b = t->add_file("b.bin", make_content(5000, 61));
        bool done = wait_for([&] {
            return t->reload(a.id).status == ArchiveStatus::Ready &&
                   t->reload(b.id).status == ArchiveStatus::Ready;
        }, 15000);
        t->vault->stop();
        ASSERT_TRUE(done, "both archives ready");

        MemorySink sink;
        t->vault->get_download_stream(a.id, std::nullopt, sink);
        ASSERT_TRUE(sink.data == make_content(kPayload, 60), "recovered archive restores");
        PASS();
    }
    {
        TEST(sweeper_thread_handles_requests);
        auto t = open_vault(2);
        auto a = t->add_file("a.bin", make_content(5000));
        t->vault->process_pending();
        ASSERT_EMPTY(t->vault->start(), "start");
        t->vault->request_delete(a.id);
        bool done = wait_for([&] { return t->reload(a.id).deleted_at != 0; }, 10000);
        t->vault->stop();
        ASSERT_TRUE(done, "deleted by the sweeper thread");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 9. Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;

    TEST(textfile_snapshot);
    auto t = open_vault(2);
    auto prom = t->root / "hookvault.prom";
    MetricsExporter metrics(prom, std::chrono::seconds(60), {{"host", "test"}});
    metrics.set_vault(t->vault.get());
    t->vault->set_metrics(&metrics);

    auto a = t->add_file("a.bin", make_content(kPayload, 70));
    t->vault->process_pending();
    MemorySink sink;
    t->vault->get_download_stream(a.id, std::nullopt, sink);

    metrics.start();
    metrics.stop();
    t->vault->set_metrics(nullptr);

    ASSERT_TRUE(fs::exists(prom), "file written");
    ASSERT_TRUE(!fs::exists(prom.string() + ".tmp"), "temp file renamed");
    auto text = read_file(prom);
    ASSERT_TRUE(text.find("hookvault_parts_uploaded_total") != std::string::npos, "parts counter");
    ASSERT_TRUE(text.find("hookvault_archives_uploaded_total") != std::string::npos, "archive counter");
    ASSERT_TRUE(text.find("hookvault_restores_total") != std::string::npos, "restore counter");
    ASSERT_TRUE(text.find("hookvault_part_upload_duration_seconds") != std::string::npos, "histogram");
    ASSERT_TRUE(text.find("status=\"ready\"") != std::string::npos, "status gauge");
    ASSERT_TRUE(text.find("host=\"test\"") != std::string::npos, "constant label");
    PASS();
}

int main() {
    std::cout << "hookvault engine test suite" << std::endl;
    std::cout << "===========================" << std::endl;

    test_store_claims();
    test_upload_restore_per_part();
    test_decimal_chunk_size();
    test_upload_restore_whole_archive();
    test_resume();
    test_failures();
    test_bundles();
    test_restore_failures();
    test_deletion();
    test_facade();
    test_metrics();

    return finish_suite();
}
