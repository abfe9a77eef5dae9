// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangeget/core/http_session.hpp>
#include <rangeget/log.hpp>
#include <rangeget/version.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <mutex>

namespace rangeget::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct TransferContext {
    CURL* curl{nullptr};
    HttpResponse response;
    FetchHandler* handler{nullptr};
    std::stop_token stop;
    bool dispatched{false};
    std::error_code handler_error;
};

std::error_code curl_to_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:   return make_error_code(DownloadErrc::dns_error);
        case CURLE_COULDNT_CONNECT:         return make_error_code(DownloadErrc::refused);
        case CURLE_OPERATION_TIMEDOUT:      return make_error_code(DownloadErrc::timeout);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:      return make_error_code(DownloadErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:      return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:    return make_error_code(DownloadErrc::invalid_url);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:            return make_error_code(DownloadErrc::connection_lost);
        case CURLE_ABORTED_BY_CALLBACK:     return make_error_code(DownloadErrc::cancelled);
        default:                            return make_error_code(DownloadErrc::network_error);
    }
}

// Header callback for HEAD/GET responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!ctx) return total;

    std::string_view header(buffer, total);

    // A new status line starts a new response (redirect hop, 100 Continue)
    if (header.starts_with("HTTP/")) {
        ctx->response.headers.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    ctx->response.headers[lower_name] = std::string(value);
    return total;
}

// Hand the final response head to the handler exactly once
std::error_code dispatch_response(TransferContext& ctx) {
    if (ctx.dispatched) return {};
    ctx.dispatched = true;

    long http_code = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &http_code);
    ctx.response.status_code = static_cast<std::int32_t>(http_code);
    decode_headers(ctx.response);

    if (ctx.handler && ctx.handler->on_response) {
        return ctx.handler->on_response(ctx.response);
    }
    return {};
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    std::size_t bytes = size * nmemb;

    if (ctx->stop.stop_requested()) {
        ctx->handler_error = make_error_code(DownloadErrc::cancelled);
        return 0;
    }

    try {
        if (auto ec = dispatch_response(*ctx)) {
            ctx->handler_error = ec;
            return 0;
        }
        if (ctx->handler && ctx->handler->on_data) {
            if (auto ec = ctx->handler->on_data(ptr, bytes)) {
                ctx->handler_error = ec;
                return 0;
            }
        }
    } catch (const std::exception& e) {
        log::logger()->error("transfer handler threw: {}", e.what());
        ctx->handler_error = make_error_code(DownloadErrc::network_error);
        return 0;
    }

    return bytes;
}

// libcurl progress callback - aborts the transfer once a stop is requested
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    return ctx->stop.stop_requested() ? 1 : 0;
}

} // namespace

//=============================================================================
// HttpOptions
//=============================================================================

HttpOptions HttpOptions::from_config(const DownloadConfig& cfg) {
    HttpOptions options;
    options.connect_timeout = cfg.connect_timeout;
    options.stall_timeout = cfg.stall_timeout;
    options.user_agent = cfg.user_agent;
    if (cfg.chunk_size_kb) {
        options.buffer_size = static_cast<std::size_t>(
            std::min<std::uint64_t>(*cfg.chunk_size_kb * KiB, MAX_CURL_BUFFER_SIZE));
    }
    return options;
}

//=============================================================================
// HttpSession
//=============================================================================

struct HttpSession::Share {
    CURLSH* handle{nullptr};
    std::array<std::mutex, static_cast<std::size_t>(CURL_LOCK_DATA_LAST)> locks;
};

HttpSession::HttpSession(HttpOptions options)
    : options_(std::move(options))
    , share_(std::make_unique<Share>()) {
    if (options_.user_agent.empty()) {
        options_.user_agent = "rangeget/" + rangeget::version.to_string();
    }

    share_->handle = curl_share_init();
    if (!share_->handle) {
        log::logger()->warn("curl_share_init failed, requests will not share caches");
        return;
    }

    curl_lock_function lock_fn = [](CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<Share*>(userptr)->locks[static_cast<std::size_t>(data)].lock();
    };
    curl_unlock_function unlock_fn = [](CURL*, curl_lock_data data, void* userptr) {
        static_cast<Share*>(userptr)->locks[static_cast<std::size_t>(data)].unlock();
    };

    curl_share_setopt(share_->handle, CURLSHOPT_LOCKFUNC, lock_fn);
    curl_share_setopt(share_->handle, CURLSHOPT_UNLOCKFUNC, unlock_fn);
    curl_share_setopt(share_->handle, CURLSHOPT_USERDATA, share_.get());
    curl_share_setopt(share_->handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share_->handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
}

HttpSession::~HttpSession() {
    if (share_ && share_->handle) {
        curl_share_cleanup(share_->handle);
    }
}

void HttpSession::configure(void* handle, const std::string& url) const noexcept {
    auto* curl = static_cast<CURL*>(handle);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));

    // Abort when the transfer stays below 1 B/s for the stall window
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.stall_timeout.count()));

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

    // Content is stored as served, never decoded
    curl_easy_setopt(curl, CURLOPT_HTTP_CONTENT_DECODING, 0L);

    if (share_ && share_->handle) {
        curl_easy_setopt(curl, CURLOPT_SHARE, share_->handle);
    }
}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    TransferContext ctx;
    ctx.curl = curl.ptr;

    configure(curl.ptr, url);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &ctx);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        log::logger()->debug("HEAD {}: {}", url, curl_easy_strerror(result));
        return std::unexpected(curl_to_error(result));
    }

    if (auto ec = dispatch_response(ctx)) {
        return std::unexpected(ec);
    }
    return ctx.response;
}

std::expected<HttpResponse, std::error_code>
HttpSession::fetch(const std::string& url,
                   const std::optional<ByteRange>& range,
                   FetchHandler& handler,
                   std::stop_token stop) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    TransferContext ctx;
    ctx.curl = curl.ptr;
    ctx.handler = &handler;
    ctx.stop = stop;

    configure(curl.ptr, url);

    std::string range_spec;
    if (range) {
        range_spec = std::to_string(range->start) + "-";
        if (range->bounded()) {
            range_spec += std::to_string(range->end - 1);
        }
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range_spec.c_str());
    }

    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(options_.buffer_size));
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (ctx.handler_error) {
        return std::unexpected(ctx.handler_error);
    }
    if (result != CURLE_OK) {
        log::logger()->debug("GET {} [{}]: {}", url, range_spec, curl_easy_strerror(result));
        return std::unexpected(curl_to_error(result));
    }

    // Responses without a body never reached the write callback
    if (auto ec = dispatch_response(ctx)) {
        return std::unexpected(ec);
    }
    return ctx.response;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

std::error_code HttpSession::global_init() noexcept {
    auto rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        return curl_to_error(rc);
    }
    return {};
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

std::string HttpSession::curl_version() {
    const auto* info = curl_version_info(CURLVERSION_NOW);
    return info && info->version ? info->version : "unknown";
}

} // namespace rangeget::core
