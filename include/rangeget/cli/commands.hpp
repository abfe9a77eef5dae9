// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangeget/core/config.hpp>
#include <rangeget/core/resolver.hpp>
#include <rangeget/core/transport.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace rangeget::cli {

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

// CLI result
using CliResult = std::expected<int, std::error_code>;

enum class Command : std::uint8_t {
    none,
    download,
    info
};

// Command line arguments
struct CliArgs {
    Command command{Command::none};
    std::vector<std::string> urls;          // Downloaded in order
    std::string output;                     // Single URL only. Empty: named by the server or the URL
    std::optional<std::uint32_t> splits;
    std::optional<std::uint64_t> chunk_size_kb;
    std::optional<std::uint32_t> retries;
    std::string state_dir;
    std::string config_file;
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;                      // Usage problem, exit code 2
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Config file (if any) with command line overrides applied
[[nodiscard]] std::expected<core::DownloadConfig, std::error_code>
make_config(const CliArgs& args) noexcept;

// Download each URL in turn through one coordinator. `interrupted` is
// polled; once set the running job is cancelled and left resumable and the
// rest of the queue is skipped.
[[nodiscard]] CliResult download(const CliArgs& args, const std::atomic<bool>& interrupted) noexcept;

// File name to save `resolved` as when none was given: the server's
// Content-Disposition name if it sends one, else the name from the URL
[[nodiscard]] std::string choose_output(core::Transport& transport, const core::ResolvedResource& resolved);

// Probe a URL and print what the server reports
[[nodiscard]] CliResult info(const std::string& url) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace rangeget::cli
