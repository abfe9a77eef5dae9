// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangeget/cli/commands.hpp>
#include <rangeget/core/coordinator.hpp>
#include <rangeget/core/error.hpp>
#include <rangeget/core/http_session.hpp>
#include <rangeget/core/prober.hpp>
#include <rangeget/core/progress.hpp>
#include <rangeget/core/resolver.hpp>
#include <rangeget/log.hpp>
#include <rangeget/version.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <charconv>
#include <chrono>
#include <iostream>

using namespace rangeget::core;

namespace rangeget::cli {

namespace {

constexpr std::chrono::milliseconds UI_POLL_INTERVAL{100};

template <typename T>
std::optional<T> parse_number(std::string_view text) noexcept {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// Server-provided name wins over the URL's
std::string filename_for(const ResolvedResource& resolved, const ProbeResult& probe) {
    return probe.filename.empty() ? resolved.suggested_filename : suggest_filename(probe.filename);
}

// Redraws the per-part block in place
class PartPrinter {
public:
    explicit PartPrinter(bool enabled) noexcept
        : enabled_(enabled) {}

    void draw(const ProgressSnapshot& snap) {
        if (!enabled_) return;

        if (lines_ > 0) {
            std::cout << "\x1b[" << lines_ << "F";
        }
        for (const auto& view : snap.segments) {
            std::cout << render_segment_line(view, snap.segments.size()) << "\x1b[K\n";
        }

        std::string summary = format_bytes(snap.bytes_written);
        if (snap.total_size) {
            summary += " / " + format_bytes(*snap.total_size);
        }
        if (snap.speed_bps > 0.0) {
            summary += " @ " + format_speed(snap.speed_bps);
        }
        if (snap.eta) {
            summary += " ETA: " + format_time(static_cast<std::uint64_t>(snap.eta->count()));
        }
        std::cout << summary << "\x1b[K" << std::endl;

        lines_ = snap.segments.size() + 1;
    }

private:
    bool enabled_;
    std::size_t lines_{0};
};

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view option) -> std::optional<std::string_view> {
        if (i + 1 >= argc) {
            args.error = fmt::format("{} needs a value", option);
            return std::nullopt;
        }
        return std::string_view(argv[++i]);
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
            continue;
        }
        if (arg == "-n" || arg == "--splits") {
            if (auto v = value_of(i, arg)) {
                args.splits = parse_number<std::uint32_t>(*v);
                if (!args.splits || *args.splits == 0) args.error = "--splits must be a positive integer";
            }
            continue;
        }
        if (arg == "-c" || arg == "--chunk-size") {
            if (auto v = value_of(i, arg)) {
                args.chunk_size_kb = parse_number<std::uint64_t>(*v);
                if (!args.chunk_size_kb || *args.chunk_size_kb == 0) args.error = "--chunk-size must be a positive integer (KB)";
            }
            continue;
        }
        if (arg == "-r" || arg == "--retries") {
            if (auto v = value_of(i, arg)) {
                args.retries = parse_number<std::uint32_t>(*v);
                if (!args.retries) args.error = "--retries must be a non-negative integer";
            }
            continue;
        }
        if (arg == "--state-dir") {
            if (auto v = value_of(i, arg)) args.state_dir = *v;
            continue;
        }
        if (arg == "--config") {
            if (auto v = value_of(i, arg)) args.config_file = *v;
            continue;
        }
        if (arg.starts_with("-")) {
            args.error = fmt::format("unknown option {}", arg);
            break;
        }

        // Positionals: [command] <url> [url...] [filename]
        if (args.command == Command::none) {
            if (arg == "download") {
                args.command = Command::download;
                continue;
            }
            if (arg == "info") {
                args.command = Command::info;
                continue;
            }
            // A bare URL means download
            args.command = Command::download;
        }
        if (args.urls.empty() || arg.find("://") != std::string_view::npos) {
            args.urls.emplace_back(arg);
        } else if (args.command == Command::download && args.output.empty()) {
            args.output = arg;
        } else {
            args.error = fmt::format("unexpected argument {}", arg);
        }
    }

    if (args.error.empty() && args.command != Command::none) {
        if (args.urls.empty()) {
            args.error = "no URL specified";
        } else if (!args.output.empty() && args.urls.size() > 1) {
            args.error = "an output file name needs a single URL";
        }
    }
    return args;
}

std::expected<DownloadConfig, std::error_code> make_config(const CliArgs& args) noexcept {
    DownloadConfig cfg;
    if (!args.config_file.empty()) {
        auto loaded = load_config(args.config_file);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        cfg = std::move(*loaded);
    }

    if (args.splits) cfg.splits = args.splits;
    if (args.chunk_size_kb) cfg.chunk_size_kb = args.chunk_size_kb;
    if (args.retries) cfg.max_retries = *args.retries;
    if (!args.state_dir.empty()) cfg.state_dir = args.state_dir;

    if (auto ec = cfg.validate()) {
        return std::unexpected(ec);
    }
    return cfg;
}

//=============================================================================
// Commands
//=============================================================================

std::string choose_output(Transport& transport, const ResolvedResource& resolved) {
    ResourceProber prober(transport);
    auto probe = prober.probe(resolved.url);
    // A failing probe is reported again by the job itself
    if (!probe) {
        return resolved.suggested_filename;
    }
    return filename_for(resolved, *probe);
}

namespace {

// One job on the shared coordinator; prints progress and the outcome
std::error_code download_one(DownloadCoordinator& coordinator,
                             Transport& transport,
                             const std::string& url,
                             const std::string& requested_output,
                             bool quiet,
                             const std::atomic<bool>& interrupted) {
    DirectResolver resolver;
    auto resolved = resolver.resolve(url);
    if (!resolved) {
        std::cerr << "Error: " << resolved.error().message() << ": " << url << std::endl;
        return resolved.error();
    }
    std::string output = requested_output.empty() ? choose_output(transport, *resolved) : requested_output;

    if (auto ec = coordinator.start(resolved->url, output)) {
        std::cerr << "Error: " << ec.message() << std::endl;
        return ec;
    }

    PartPrinter printer(!quiet);
    bool header_printed = false;
    bool cancel_sent = false;

    while (true) {
        if (!cancel_sent && interrupted.load(std::memory_order_relaxed)) {
            std::cout << "\nInterrupted, saving progress..." << std::endl;
            coordinator.cancel();
            cancel_sent = true;
        }

        auto snap = coordinator.events().wait_pop_for(UI_POLL_INTERVAL);
        if (!snap) {
            if (coordinator.events().closed()) break;
            continue;
        }

        if (!header_printed) {
            auto job = coordinator.job();
            std::cout << "Total size: "
                      << (job.total_size ? format_bytes(*job.total_size) : std::string("unknown")) << "\n";
            std::cout << "Using " << job.splits << " splits and "
                      << format_bytes(job.chunk_size) << " chunk size" << std::endl;
            if (job.resumed) {
                std::cout << "Resuming from " << format_bytes(snap->bytes_written) << std::endl;
            }
            header_printed = true;
        }
        printer.draw(*snap);
    }

    auto result = coordinator.wait();
    if (result.state == JobState::completed) {
        std::cout << "Download Complete: " << output << " (" << format_bytes(result.bytes_downloaded) << ")"
                  << std::endl;
        return {};
    }

    std::cerr << "Error: " << result.error.message();
    if (!result.failed_segments.empty()) {
        std::cerr << fmt::format(" (failed parts: {})", fmt::join(result.failed_segments, ", "));
    }
    std::cerr << std::endl;
    if (result.error == DownloadErrc::cancelled || !result.failed_segments.empty()) {
        std::cerr << "Run the same command again to resume." << std::endl;
    }
    return result.error;
}

} // namespace

CliResult download(const CliArgs& args, const std::atomic<bool>& interrupted) noexcept {
    try {
        auto cfg = make_config(args);
        if (!cfg) {
            std::cerr << "Error: " << cfg.error().message() << std::endl;
            return std::unexpected(cfg.error());
        }

        HttpSession session(HttpOptions::from_config(*cfg));
        DownloadCoordinator coordinator(session, *cfg);

        std::error_code first_error;
        const auto count = args.urls.size();
        for (std::size_t i = 0; i < count; ++i) {
            if (interrupted.load(std::memory_order_relaxed)) {
                std::cerr << (count - i) << " download(s) not started" << std::endl;
                if (!first_error) first_error = make_error_code(DownloadErrc::cancelled);
                break;
            }
            if (count > 1) {
                std::cout << fmt::format("[{}/{}] {}", i + 1, count, args.urls[i]) << std::endl;
            }

            auto ec = download_one(coordinator, session, args.urls[i], args.output, args.quiet, interrupted);
            if (ec && !first_error) first_error = ec;
        }

        if (first_error) {
            return std::unexpected(first_error);
        }
        return EXIT_OK;
    } catch (const std::exception& e) {
        log::logger()->error("download: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

CliResult info(const std::string& url) noexcept {
    try {
        DirectResolver resolver;
        auto resolved = resolver.resolve(url);
        if (!resolved) {
            std::cerr << "Error: " << resolved.error().message() << ": " << url << std::endl;
            return std::unexpected(resolved.error());
        }

        HttpSession session;
        ResourceProber prober(session);
        auto probe = prober.probe(resolved->url);
        if (!probe) {
            std::cerr << "Error: " << probe.error().message() << std::endl;
            return std::unexpected(probe.error());
        }

        std::string filename = filename_for(*resolved, *probe);

        std::cout << "URL: " << resolved->url << "\n";
        std::cout << "Total size: "
                  << (probe->total_size ? format_bytes(*probe->total_size) : std::string("unknown")) << "\n";
        if (probe->total_size) {
            std::cout << "Bytes: " << *probe->total_size << "\n";
        }
        std::cout << "Accepts-Ranges: " << (probe->range_supported ? "yes" : "no") << "\n";
        std::cout << "Content-Type: " << (probe->content_type.empty() ? "unknown" : probe->content_type) << "\n";
        if (!probe->etag.empty()) {
            std::cout << "ETag: " << probe->etag << "\n";
        }
        std::cout << "Filename: " << filename << std::endl;
        return EXIT_OK;
    } catch (const std::exception& e) {
        log::logger()->error("info {}: {}", url, e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "rangeget " << rangeget::version.to_string() << " - parallel, resumable HTTP downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " download <URL> [FILE] [OPTIONS]\n";
    std::cout << "  " << program_name << " download <URL> <URL>... [OPTIONS]\n";
    std::cout << "  " << program_name << " info <URL>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "      --version           Show version information\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             No progress output, errors only\n";
    std::cout << "  -n, --splits <N>        Number of segments (default: by file size)\n";
    std::cout << "  -c, --chunk-size <KB>   Flush interval per segment in KB (default: by file size)\n";
    std::cout << "  -r, --retries <N>       Retries per segment (default: 3)\n";
    std::cout << "      --state-dir <DIR>   Keep resume records in DIR instead of beside FILE\n";
    std::cout << "      --config <FILE>     Read settings from a JSON file\n";
    std::cout << "\n";
    std::cout << "Several URLs are downloaded one after another, each named by the server or its URL.\n";
    std::cout << "An interrupted or failed download resumes when the same command is run again.\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " download https://example.com/file.zip\n";
    std::cout << "  " << program_name << " download https://example.com/large.iso image.iso -n 16\n";
    std::cout << "  " << program_name << " info https://example.com/file.zip\n";
}

void print_version() noexcept {
    std::cout << "rangeget " << rangeget::version.to_string() << " (built " << BUILD_DATE << ")" << std::endl;
    std::cout << "Built with C++23, libcurl " << HttpSession::curl_version() << std::endl;
}

} // namespace rangeget::cli
