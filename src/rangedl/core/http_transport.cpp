// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/core/http_transport.hpp>
#include <rangedl/core/config.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <new>
#include <string_view>
#include <vector>

namespace rangedl::core {

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

using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

HeaderList build_header_list(const RequestOptions& options) {
    curl_slist* list = nullptr;
    for (const auto& [name, value] : options.headers) {
        std::string line = name + ": " + value;
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next) {
            curl_slist_free_all(list);
            return HeaderList{nullptr, &curl_slist_free_all};
        }
        list = next;
    }
    return HeaderList{list, &curl_slist_free_all};
}

bool has_header(const RequestOptions& options, std::string_view wanted) noexcept {
    for (const auto& [name, value] : options.headers) {
        if (name.size() != wanted.size()) continue;
        bool same = true;
        for (std::size_t i = 0; i < name.size() && same; ++i) {
            same = std::tolower(static_cast<unsigned char>(name[i])) ==
                   std::tolower(static_cast<unsigned char>(wanted[i]));
        }
        if (same) return true;
    }
    return false;
}

void apply_common_options(CURL* curl, const std::string& url, curl_slist* headers) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }
}

// Header callback for HEAD responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<Headers*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);

    // A new status line starts a new response (redirect hop)
    if (header.starts_with("HTTP/")) {
        headers->clear();
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

    try {
        std::string lower_name;
        lower_name.reserve(name.size());
        for (char c : name) {
            lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        (*headers)[lower_name] = std::string(value);
    } catch (const std::bad_alloc&) {
        return 0;  // Aborts the transfer
    }
    return total;
}

// Re-chunks libcurl's writes into CHUNK_SIZE pieces for the handler
struct StreamContext {
    CURL* curl{nullptr};
    const ChunkHandler* handler{nullptr};
    std::vector<std::byte> buffer;
    bool expect_partial{false};
    bool checked_status{false};
    bool stopped{false};
    std::error_code error;

    bool deliver(std::size_t count) {
        bool keep_going = (*handler)(std::span<const std::byte>(buffer.data(), count));
        buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(count));
        if (!keep_going) {
            stopped = true;
        }
        return keep_going;
    }
};

std::size_t stream_write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* ctx = static_cast<StreamContext*>(userdata);
    std::size_t total = size * nmemb;
    if (!ctx || !ctx->handler) return 0;

    // A server that ignores Range answers 200 with the whole body
    if (!ctx->checked_status) {
        ctx->checked_status = true;
        long http_code = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &http_code);
        if (ctx->expect_partial && http_code == 200) {
            ctx->error = make_error_code(DownloadErrc::invalid_range);
            return 0;
        }
    }

    try {
        const auto* bytes = reinterpret_cast<const std::byte*>(ptr);
        ctx->buffer.insert(ctx->buffer.end(), bytes, bytes + total);
        while (ctx->buffer.size() >= CHUNK_SIZE) {
            if (!ctx->deliver(CHUNK_SIZE)) {
                return 0;
            }
        }
    } catch (const std::exception& e) {
        spdlog::debug("chunk handler threw: {}", e.what());
        ctx->error = make_error_code(DownloadErrc::network_error);
        return 0;
    }
    return total;
}

std::error_code curl_error(CURLcode result) noexcept {
    switch (result) {
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(DownloadErrc::invalid_url);
        case CURLE_RANGE_ERROR:
            return make_error_code(DownloadErrc::invalid_range);
        default:
            return make_error_code(DownloadErrc::network_error);
    }
}

} // namespace

//=============================================================================
// HttpTransport
//=============================================================================

std::expected<ResourceInfo, std::error_code>
HttpTransport::probe(const std::string& url, const RequestOptions& options) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(DownloadErrc::network_error));
        }

        HeaderList headers = build_header_list(options);
        ResourceInfo info{};

        apply_common_options(curl.ptr, url, headers.get());
        curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &info.headers);

        CURLcode result = curl_easy_perform(curl.ptr);
        if (result != CURLE_OK) {
            spdlog::debug("HEAD {}: {}", url, curl_easy_strerror(result));
            return std::unexpected(curl_error(result));
        }

        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        info.status_code = static_cast<std::int32_t>(http_code);
        if (http_code >= 400) {
            return std::unexpected(status_error(http_code));
        }

        // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T doesn't work for HEAD
        auto cl_it = info.headers.find("content-length");
        if (cl_it != info.headers.end() && !cl_it->second.empty()) {
            char* end = nullptr;
            unsigned long long val = std::strtoull(cl_it->second.c_str(), &end, 10);
            if (end == cl_it->second.c_str() + cl_it->second.size()) {
                info.content_length = static_cast<std::uint64_t>(val);
            }
        }

        auto ar_it = info.headers.find("accept-ranges");
        info.accepts_ranges = ar_it != info.headers.end() && ar_it->second.find("bytes") != std::string::npos;

        auto etag_it = info.headers.find("etag");
        if (etag_it != info.headers.end()) {
            info.etag = etag_it->second;
        }

        return info;
    } catch (const std::exception& e) {
        spdlog::debug("HEAD {}: {}", url, e.what());
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

std::error_code HttpTransport::stream_get(const std::string& url,
                                          const RequestOptions& options,
                                          const ChunkHandler& on_chunk) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return make_error_code(DownloadErrc::network_error);
        }

        HeaderList headers = build_header_list(options);

        StreamContext ctx;
        ctx.curl = curl.ptr;
        ctx.handler = &on_chunk;
        ctx.expect_partial = has_header(options, "Range");
        ctx.buffer.reserve(CHUNK_SIZE);

        apply_common_options(curl.ptr, url, headers.get());
        // Error bodies must never reach a segment file
        curl_easy_setopt(curl.ptr, CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, stream_write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);

        CURLcode result = curl_easy_perform(curl.ptr);

        if (ctx.stopped) {
            return make_error_code(DownloadErrc::cancelled);
        }
        if (ctx.error) {
            return ctx.error;
        }
        if (result == CURLE_HTTP_RETURNED_ERROR) {
            long http_code = 0;
            curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
            return status_error(http_code);
        }
        if (result != CURLE_OK) {
            spdlog::debug("GET {}: {}", url, curl_easy_strerror(result));
            return curl_error(result);
        }

        // Flush the tail that never filled a whole chunk
        if (!ctx.buffer.empty() && !ctx.deliver(ctx.buffer.size())) {
            return make_error_code(DownloadErrc::cancelled);
        }
        return {};
    } catch (const std::exception& e) {
        spdlog::debug("GET {}: {}", url, e.what());
        return make_error_code(DownloadErrc::network_error);
    }
}

std::error_code HttpTransport::status_error(long http_code) noexcept {
    if (http_code == 404) return make_error_code(DownloadErrc::not_found);
    if (http_code == 401 || http_code == 403) return make_error_code(DownloadErrc::permission_denied);
    if (http_code == 416) return make_error_code(DownloadErrc::invalid_range);
    if (http_code >= 500) return make_error_code(DownloadErrc::server_error);
    return make_error_code(DownloadErrc::http_error);
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpTransport::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpTransport::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace rangedl::core
