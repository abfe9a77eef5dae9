// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangeget/core/url.hpp>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace rangeget::core {

// A URL the core can fetch directly
struct ResolvedResource {
    std::string url;
    std::string suggested_filename;     // Sanitized, never empty
};

// Turns a user-supplied URL into a direct one. Platform extractors plug in
// here; the core only ever sees the resolved URL.
class ResourceResolver {
public:
    virtual ~ResourceResolver() = default;

    [[nodiscard]] virtual std::expected<ResolvedResource, std::error_code>
    resolve(const std::string& url) = 0;
};

// Accepts http(s) URLs as they are
class DirectResolver final : public ResourceResolver {
public:
    [[nodiscard]] std::expected<ResolvedResource, std::error_code>
    resolve(const std::string& url) override;
};

// File name for a URL: last path component, sanitized. Falls back to
// "download" and appends ".bin" when there is no extension.
[[nodiscard]] std::string suggest_filename(const Url& url);

// Same rules for a server-provided name (Content-Disposition)
[[nodiscard]] std::string suggest_filename(std::string_view name);

} // namespace rangeget::core
