#include "cache/FingerprintCache.hpp"
#include "config/ScanConfig.hpp"
#include "scanner/AstCommentVerifier.hpp"
#include "scanner/CommentExtractor.hpp"
#include "scanner/ScanOrchestrator.hpp"
#include "util/Logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace debtscan;

// Set from the signal handler; a watcher thread turns it into request_stop()
static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

namespace {

struct Options {
    std::optional<std::filesystem::path> config_path;
    bool precise = false;
    bool no_cache = false;
    bool clear_cache = false;
    std::optional<size_t> workers;
    std::vector<std::filesystem::path> files;
};

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [options] [FILE...]\n"
              << "Scan source files for TODO/FIXME/HACK/BUG/XXX comments.\n"
              << "Reads file paths from stdin (one per line) when none are given.\n\n"
              << "Options:\n"
              << "  --config PATH     Use this config file\n"
              << "  --precise         Keep only matches inside real comments\n"
              << "  --no-cache        Do not read or write the fingerprint cache\n"
              << "  --clear-cache     Empty the fingerprint cache before scanning\n"
              << "  --workers N       Number of worker threads\n"
              << "  --print-config    Print a config template and exit\n"
              << "  -h, --help        Show this help\n";
}

// Returns false after printing a message when the arguments are invalid
bool parse_args(int argc, char** argv, Options& opts, bool& exit_now) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            exit_now = true;
            return true;
        }
        if (arg == "--print-config") {
            std::cout << config::ConfigLoader::default_template();
            exit_now = true;
            return true;
        }
        if (arg == "--precise") {
            opts.precise = true;
        } else if (arg == "--no-cache") {
            opts.no_cache = true;
        } else if (arg == "--clear-cache") {
            opts.clear_cache = true;
        } else if (arg == "--config" || arg == "--workers") {
            if (i + 1 >= argc) {
                std::cerr << "debtscan: " << arg << " requires a value\n";
                return false;
            }
            std::string value = argv[++i];
            if (arg == "--config") {
                opts.config_path = std::filesystem::path(value);
            } else {
                try {
                    opts.workers = static_cast<size_t>(std::stoul(value));
                } catch (const std::exception&) {
                    std::cerr << "debtscan: invalid worker count: " << value << "\n";
                    return false;
                }
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "debtscan: unknown option " << arg << "\n";
            return false;
        } else {
            opts.files.emplace_back(arg);
        }
    }
    return true;
}

std::string format_finding(const model::FindingRecord& f) {
    std::string line = f.file + ":" + std::to_string(f.line) + ":" + std::to_string(f.column) +
                       ": " + f.tag.as_str();
    if (f.author || f.issue || f.priority) {
        std::string meta;
        auto add = [&meta](const std::string& part) {
            if (!meta.empty()) meta += ",";
            meta += part;
        };
        if (f.author) add(*f.author);
        if (f.issue) add("#" + *f.issue);
        if (f.priority) add(std::string("p:") + model::priority_to_string(*f.priority));
        line += "(" + meta + ")";
    }
    if (!f.message.empty()) {
        line += " " + f.message;
    }
    return line;
}

}  // namespace

int main(int argc, char** argv) {
    Options opts;
    bool exit_now = false;
    if (!parse_args(argc, argv, opts, exit_now)) {
        print_usage(argv[0]);
        return 2;
    }
    if (exit_now) {
        return 0;
    }

    try {
        config::ScanConfig cfg = config::ConfigLoader::load_config(opts.config_path);

        util::Logger::init(cfg.log_file.empty() ? util::Logger::default_log_path() : cfg.log_file,
                           util::Logger::parse_level(cfg.log_level),
                           cfg.log_to_stderr);
        util::Logger::info("debtscan starting" +
                           (cfg.source.empty() ? std::string() : " (config " + cfg.source.string() + ")"));

        if (opts.precise) cfg.precise = true;
        if (opts.workers) cfg.workers = *opts.workers;
        if (opts.no_cache) cfg.cache_enabled = false;

        if (opts.files.empty()) {
            std::string line;
            while (std::getline(std::cin, line)) {
                if (!line.empty()) opts.files.emplace_back(line);
            }
        }

        std::vector<std::string> tags = cfg.tags.empty() ? scanner::TagVocabulary::builtin_tags() : cfg.tags;
        tags.insert(tags.end(), cfg.custom_tags.begin(), cfg.custom_tags.end());
        scanner::TagVocabulary vocabulary(tags, cfg.case_sensitive);

        std::unique_ptr<scanner::ExtractionStrategy> strategy;
        if (cfg.precise) {
            strategy = std::make_unique<scanner::AstCommentVerifier>(vocabulary);
        } else {
            strategy = std::make_unique<scanner::CommentExtractor>(vocabulary);
        }

        cache::FingerprintCache cache;
        bool cache_ready = false;
        if (cfg.cache_enabled || opts.clear_cache) {
            auto db_path = cfg.cache_path.empty() ? cache::FingerprintCache::default_path() : cfg.cache_path;
            cache_ready = cache.open(db_path, scanner::IncrementalScanner::cache_schema_version(*strategy));
            if (!cache_ready) {
                std::cerr << "debtscan: cache unavailable, scanning without it\n";
            }
        }

        if (opts.clear_cache && cache_ready) {
            if (!cache.clear()) {
                std::cerr << "debtscan: could not clear cache\n";
            }
        }

        if (opts.files.empty()) {
            util::Logger::info("debtscan: No files to scan");
            return 0;
        }

        scanner::ScanOptions scan_options;
        scan_options.workers = cfg.workers;
        scan_options.mmap_threshold = cfg.mmap_threshold;
        scan_options.max_file_size = cfg.max_file_size;

        scanner::ScanOrchestrator orchestrator(scan_options,
                                               cache_ready && cfg.cache_enabled ? &cache : nullptr);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::jthread watcher([&orchestrator](std::stop_token st) {
            while (!st.stop_requested()) {
                if (g_shutdown.load()) {
                    util::Logger::info("debtscan: Interrupted, stopping after current files");
                    orchestrator.request_stop();
                    return;
                }
                std::this_thread::sleep_for(50ms);
            }
        });

        scanner::ScanReport report = orchestrator.scan(opts.files, *strategy);
        watcher.request_stop();

        for (const auto& finding : report.findings) {
            std::cout << format_finding(finding) << "\n";
        }
        for (const auto& error : report.errors) {
            std::cerr << error.file << ": " << model::error_kind_to_string(error.kind)
                      << " error: " << error.message << "\n";
        }

        const auto& stats = report.statistics;
        std::cerr << stats.total_findings << " findings in " << stats.files_with_findings << " of "
                  << stats.files_scanned << " files (" << stats.files_from_cache << " cached, "
                  << stats.files_skipped << " skipped, " << stats.files_failed << " failed) in "
                  << stats.elapsed.count() << "ms" << (report.cancelled ? " [cancelled]" : "") << "\n";

        util::Logger::info("debtscan finished");
        if (report.cancelled) return 130;
        return report.errors.empty() ? 0 : 1;
    } catch (const std::exception& e) {
        util::Logger::error(std::string("debtscan: Fatal: ") + e.what());
        std::cerr << "debtscan: " << e.what() << "\n";
        return 1;
    }
}
