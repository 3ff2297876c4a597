#pragma once

// Minimal assertion harness shared by the hookvault test suites. Each suite
// is one executable; the exit code is the number of failures (capped at 1).

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

static int tests_passed = 0;
static int tests_failed = 0;

template <typename Msg>
void harness_fail(const Msg& msg) {
    std::cout << "FAIL: " << msg << std::endl;
    ++tests_failed;
}

template <typename Msg, typename Got, typename Want>
void harness_mismatch(const Msg& msg, const Got& got, const Want& want) {
    std::cout << "FAIL: " << msg << " (got \"" << got << "\", expected \"" << want << "\")"
              << std::endl;
    ++tests_failed;
}

#define TEST(name) (std::cout << "  " << #name << "... " << std::flush)

#define PASS()                              \
    do {                                    \
        std::cout << "OK" << std::endl;     \
        ++tests_passed;                     \
    } while (0)

#define FAIL(msg) harness_fail(msg)

#define ASSERT_TRUE(cond, msg)              \
    do {                                    \
        if (!(cond)) {                      \
            harness_fail(msg);              \
            return;                         \
        }                                   \
    } while (0)

#define ASSERT_EQ(a, b, msg)                \
    do {                                    \
        const auto& got_ = (a);             \
        const auto& want_ = (b);            \
        if (got_ != want_) {                \
            harness_mismatch(msg, got_, want_); \
            return;                         \
        }                                   \
    } while (0)

#define ASSERT_EMPTY(s, msg) ASSERT_TRUE((s).empty(), std::string(msg) + ": " + (s))
#define ASSERT_NOT_EMPTY(s, msg) ASSERT_TRUE(!(s).empty(), msg)

/// Run `stmt`, which must throw hookvault::Error of `expected_kind`.
#define ASSERT_THROWS_KIND(stmt, expected_kind, msg)                  \
    do {                                                              \
        bool threw_ = false;                                          \
        try {                                                         \
            stmt;                                                     \
        } catch (const hookvault::Error& e_) {                        \
            threw_ = true;                                            \
            if (e_.kind() != (expected_kind)) {                       \
                FAIL(std::string(msg) + " (wrong kind: " +            \
                     hookvault::error_kind_name(e_.kind()) + ": " +   \
                     e_.what() + ")");                                \
                return;                                               \
            }                                                         \
        }                                                             \
        ASSERT_TRUE(threw_, msg);                                     \
    } while (0)

[[maybe_unused]] static fs::path make_temp_dir(const std::string& prefix) {
    std::string tpl = (fs::temp_directory_path() / (prefix + "-XXXXXX")).string();
    if (!mkdtemp(tpl.data())) throw std::runtime_error("mkdtemp failed for " + tpl);
    return tpl;
}

[[maybe_unused]] static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream(path, std::ios::binary | std::ios::trunc) << content;
}

[[maybe_unused]] static std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

/// Deterministic pseudo-random content so mismatched offsets show up.
[[maybe_unused]] static std::string make_content(size_t size, uint32_t seed = 1) {
    std::string out(size, '\0');
    uint32_t x = seed * 2654435761u + 1;
    for (auto& c : out) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        c = static_cast<char>(x & 0xFF);
    }
    return out;
}

/// Polls `cond` every 50 ms until it holds or `timeout_ms` passes.
[[maybe_unused]] static bool wait_for(const std::function<bool()>& cond, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!cond()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return true;
}

[[maybe_unused]] static int finish_suite() {
    std::cout << "\n" << tests_passed << " passed, " << tests_failed << " failed" << std::endl;
    return tests_failed == 0 ? 0 : 1;
}
