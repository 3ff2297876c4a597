// hookvault-ctl: operator tool over a vault's manifest.
//
// Takes the same configuration flags as the daemon and works on the same
// data directory; the manifest's locking lets it run next to a live daemon.
//
// Usage: hookvault-ctl <config flags> [--owner <id>] <subcommand> [args]
//
// Subcommands:
//   put <file> [--name <n>] [--queue-only]   Queue a file (and upload it now)
//   bundle <name> <file>... [--queue-only]   Queue several files as one zip
//   get <id> <output> [--file <position>]    Restore an archive or one file
//   status <id>                              Archive record with parts
//   list                                     Archives of --owner
//   trash | untrash | delete | retry <id>    State changes
//   process                                  Upload everything claimable
//   sweep                                    Run one deletion sweep
//   stats                                    Counters and archive totals

#include "hookvault/archive.hpp"
#include "hookvault/archive_store.hpp"
#include "hookvault/error.hpp"
#include "hookvault/log.hpp"
#include "hookvault/restore_engine.hpp"
#include "hookvault/vault.hpp"
#include "hookvault/vault_config.hpp"

#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace {

struct CtlOptions {
    std::string owner = "local";
    std::string name;
    std::optional<uint32_t> file_position;
    bool queue_only = false;
};

void print_usage() {
    fprintf(stderr,
            "Usage: hookvault-ctl <config flags> [--owner <id>] <subcommand> [args]\n"
            "\n"
            "Subcommands:\n"
            "  put <file> [--name <n>] [--queue-only]\n"
            "  bundle <name> <file>... [--queue-only]\n"
            "  get <id> <output> [--file <position>]\n"
            "  status <id>\n"
            "  list\n"
            "  trash | untrash | delete | retry <id>\n"
            "  process\n"
            "  sweep\n"
            "  stats\n"
            "\n"
            "Config flags are those of hookvault (see hookvault --help).\n");
}

void format_timestamp(int64_t ts, char* buf, size_t buf_size) {
    if (ts == 0) {
        snprintf(buf, buf_size, "-");
        return;
    }
    time_t t = static_cast<time_t>(ts);
    struct tm tm_val;
    gmtime_r(&t, &tm_val);
    strftime(buf, buf_size, "%Y-%m-%dT%H:%M:%SZ", &tm_val);
}

int64_t parse_id(const std::string& arg) {
    char* end = nullptr;
    long long v = strtoll(arg.c_str(), &end, 10);
    if (arg.empty() || *end != '\0' || v <= 0) {
        throw hookvault::Error(hookvault::ErrorKind::NotFound, "invalid archive id: " + arg);
    }
    return static_cast<int64_t>(v);
}

void print_archive_line(const hookvault::Archive& a) {
    char created[32];
    format_timestamp(a.created_at, created, sizeof(created));
    printf("%" PRId64 "\t%-10s\t%" PRIu64 "\t%u/%u\t%s\t%s%s\n", a.id,
           hookvault::status_name(a.status), a.original_size, a.uploaded_parts, a.total_parts,
           created, a.display_name.c_str(), a.trashed_at ? " (trashed)" : "");
}

void print_archive(const hookvault::Archive& a) {
    char buf[32];
    printf("id:              %" PRId64 "\n", a.id);
    printf("owner:           %s\n", a.owner_id.c_str());
    printf("name:            %s\n", a.display_name.c_str());
    printf("download name:   %s\n", a.download_name.c_str());
    printf("bundle:          %s\n", a.is_bundle ? "yes" : "no");
    printf("encryption:      v%d\n", a.encryption_version);
    printf("status:          %s\n", hookvault::status_name(a.status));
    if (!a.error.empty()) {
        printf("error:           %s (%s, attempt %u)\n", a.error.c_str(),
               a.error_retryable ? "retryable" : "permanent", a.retry_count);
    }
    printf("size:            %" PRIu64 " bytes (%" PRIu64 " stored)\n", a.original_size,
           a.encrypted_size);
    printf("parts:           %u/%u (%" PRIu64 " bytes)\n", a.uploaded_parts, a.total_parts,
           a.uploaded_bytes);
    format_timestamp(a.created_at, buf, sizeof(buf));
    printf("created:         %s\n", buf);
    if (a.trashed_at) {
        format_timestamp(a.trashed_at, buf, sizeof(buf));
        printf("trashed:         %s\n", buf);
    }
    if (a.delete_requested_at) {
        printf("deletion:        %u/%u parts removed%s\n", a.deleted_parts, a.delete_total_parts,
               a.deleted_at ? ", done" : "");
    }
    for (const auto& f : a.files) {
        printf("file %u:          %s (%" PRIu64 " bytes, %" PRIu64 " downloads)%s\n", f.position,
               f.name.c_str(), f.size, f.download_count, f.deleted_at ? " deleted" : "");
    }
    for (const auto& p : a.parts) {
        printf("part %u:          %" PRIu64 " bytes on %s msg=%s\n", p.index, p.size,
               p.webhook_id.c_str(), p.message_id.c_str());
    }
}

int run(hookvault::Vault& vault, const std::vector<std::string>& args, const CtlOptions& opts) {
    const std::string& cmd = args[0];
    auto need = [&](size_t n) {
        if (args.size() < n + 1) {
            throw hookvault::Error(hookvault::ErrorKind::Configuration,
                                   cmd + " needs " + std::to_string(n) + " argument(s)");
        }
    };

    if (cmd == "put") {
        need(1);
        auto a = vault.create_from_local_file(opts.owner, args[1], opts.name);
        printf("queued %" PRId64 "\n", a.id);
        if (!opts.queue_only) vault.process_pending();
        auto now = vault.get_archive(a.id);
        if (now) print_archive_line(*now);
        return now && (opts.queue_only || now->ready()) ? 0 : 1;
    }

    if (cmd == "bundle") {
        need(2);
        std::vector<hookvault::BundleSource> sources;
        for (size_t i = 2; i < args.size(); ++i) {
            sources.push_back({args[i], ""});
        }
        auto a = vault.create_bundle(opts.owner, sources, args[1]);
        printf("queued %" PRId64 "\n", a.id);
        if (!opts.queue_only) vault.process_pending();
        auto now = vault.get_archive(a.id);
        if (now) print_archive_line(*now);
        return now && (opts.queue_only || now->ready()) ? 0 : 1;
    }

    if (cmd == "get") {
        need(2);
        hookvault::FileSink sink(args[2]);
        auto outcome = vault.get_download_stream(parse_id(args[1]), opts.file_position, sink);
        if (outcome != hookvault::RestoreOutcome::Completed) {
            fprintf(stderr, "restore cancelled\n");
            return 1;
        }
        printf("wrote %" PRIu64 " bytes to %s\n", sink.bytes_written(), args[2].c_str());
        return 0;
    }

    if (cmd == "status") {
        need(1);
        auto a = vault.get_archive(parse_id(args[1]));
        if (!a) {
            fprintf(stderr, "archive %s not found\n", args[1].c_str());
            return 1;
        }
        print_archive(*a);
        return 0;
    }

    if (cmd == "list") {
        for (const auto& a : vault.list_archives(opts.owner)) print_archive_line(a);
        return 0;
    }

    if (cmd == "trash" || cmd == "untrash" || cmd == "delete" || cmd == "retry") {
        need(1);
        int64_t id = parse_id(args[1]);
        bool ok = false;
        if (cmd == "trash") ok = vault.request_trash(id);
        else if (cmd == "untrash") ok = vault.restore_from_trash(id);
        else if (cmd == "delete") ok = vault.request_delete(id);
        else ok = vault.retry_archive(id);
        if (!ok) {
            fprintf(stderr, "%s: archive %" PRId64 " is not in a state that allows it\n",
                    cmd.c_str(), id);
            return 1;
        }
        printf("%s %" PRId64 ": ok\n", cmd.c_str(), id);
        return 0;
    }

    if (cmd == "process") {
        printf("processed %zu archive(s)\n", vault.process_pending());
        return 0;
    }

    if (cmd == "sweep") {
        printf("deleted %zu archive(s)\n", vault.sweep_deletions());
        return 0;
    }

    if (cmd == "stats") {
        auto s = vault.get_stats();
        for (const auto& [status, count] : s.archives_by_status) {
            printf("archives_%s\t%" PRIu64 "\n", status.c_str(), count);
        }
        printf("used_bytes\t%" PRId64 "\n", vault.store().used_bytes(opts.owner));
        return 0;
    }

    fprintf(stderr, "Unknown subcommand: %s\n", cmd.c_str());
    print_usage();
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    CtlOptions opts;

    // Peel off our own flags; the rest goes to the shared config parser
    std::vector<char*> rest;
    rest.push_back(argv[0]);
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--owner" || arg == "--name" || arg == "--file") {
            if (++i >= argc) {
                fprintf(stderr, "%s requires argument\n", arg.c_str());
                return 1;
            }
            if (arg == "--owner") {
                opts.owner = argv[i];
            } else if (arg == "--name") {
                opts.name = argv[i];
            } else {
                opts.file_position = static_cast<uint32_t>(strtoul(argv[i], nullptr, 10));
            }
        } else if (arg == "--queue-only") {
            opts.queue_only = true;
        } else {
            rest.push_back(argv[i]);
        }
    }

    std::vector<std::string> args;
    auto config = hookvault::VaultConfig::from_args(static_cast<int>(rest.size()), rest.data(), &args);
    if (!config) {
        print_usage();
        return 1;
    }
    if (args.empty()) {
        print_usage();
        return 1;
    }
    hookvault::set_verbose_logging(config->verbose);

    hookvault::Vault vault(*config);
    auto err = vault.open();
    if (!err.empty()) {
        fprintf(stderr, "Error: %s\n", err.c_str());
        return 1;
    }

    try {
        return run(vault, args, opts);
    } catch (const hookvault::Error& e) {
        fprintf(stderr, "Error (%s): %s\n", hookvault::error_kind_name(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
}
