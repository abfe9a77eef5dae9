// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangeget/core/config.hpp>
#include <rangeget/core/transport.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace rangeget::core {

struct HttpOptions {
    std::chrono::seconds connect_timeout{CONNECTION_TIMEOUT_SEC};
    std::chrono::seconds stall_timeout{STALL_TIMEOUT_SEC};
    std::size_t buffer_size{MAX_CURL_BUFFER_SIZE};
    std::string user_agent;

    [[nodiscard]] static HttpOptions from_config(const DownloadConfig& cfg);
};

// libcurl transport. Every request gets its own easy handle; DNS and TLS
// session caches are shared between them through a locked CURLSH.
class HttpSession final : public Transport {
public:
    explicit HttpSession(HttpOptions options = {});
    ~HttpSession() override;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) = delete;
    HttpSession& operator=(HttpSession&&) = delete;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    fetch(const std::string& url,
          const std::optional<ByteRange>& range,
          FetchHandler& handler,
          std::stop_token stop) override;

    // Global initialization (call once at startup)
    [[nodiscard]] static std::error_code global_init() noexcept;
    static void global_cleanup() noexcept;

    [[nodiscard]] static std::string curl_version();

private:
    struct Share;

    // Apply the options common to HEAD and GET
    void configure(void* curl, const std::string& url) const noexcept;

    HttpOptions options_;
    std::unique_ptr<Share> share_;
};

} // namespace rangeget::core
