// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangeget/core/resolver.hpp>
#include <rangeget/log.hpp>

namespace rangeget::core {

namespace {

constexpr std::string_view DEFAULT_STEM = "download";
constexpr std::string_view DEFAULT_EXTENSION = ".bin";

} // namespace

std::string suggest_filename(std::string_view name) {
    std::string clean = sanitize_filename(name);

    // "." and ".." are not usable names
    if (clean.find_first_not_of('.') == std::string::npos) {
        clean.clear();
    }
    if (clean.empty()) {
        clean = DEFAULT_STEM;
    }

    auto dot = clean.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == clean.size()) {
        clean += DEFAULT_EXTENSION;
    }
    return clean;
}

std::string suggest_filename(const Url& url) {
    return suggest_filename(url.filename());
}

std::expected<ResolvedResource, std::error_code>
DirectResolver::resolve(const std::string& url) {
    auto parsed = Url::parse(url);
    if (!parsed) {
        log::logger()->error("invalid URL: {}", url);
        return std::unexpected(parsed.error());
    }
    if (parsed->scheme() != "http" && parsed->scheme() != "https") {
        log::logger()->error("unsupported scheme '{}' in {}", parsed->scheme(), url);
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    ResolvedResource resource;
    resource.url = url;
    resource.suggested_filename = suggest_filename(*parsed);
    return resource;
}

} // namespace rangeget::core
