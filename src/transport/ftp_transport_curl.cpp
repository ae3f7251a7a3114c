/*
 * ftp_transport_curl.cpp
 *
 * Notes
 * - One CURL easy handle per session; libcurl keeps the FTP control connection
 *   alive between transfers on the same handle and sends QUIT on cleanup.
 * - list() uses NLST (CURLOPT_DIRLISTONLY); retrieve() streams RETR into a sink.
 * - Stalled transfers are aborted with the low-speed limit rather than a total
 *   timeout, since payloads can be hundreds of megabytes.
 *
 * Build
 * - Linked via CURL::libcurl.
 */

#include <pubmirror/logging/logging.h>
#include <pubmirror/transport/transport.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <string>
#include <string_view>

namespace pubmirror::transport {

namespace detail {

ErrorCode classifyCurlResult(int curlCode, long responseCode) {
    switch (static_cast<CURLcode>(curlCode)) {
        case CURLE_OK:
            return ErrorCode::Success;
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorCode::Timeout;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_FTP_ACCEPT_FAILED:
        case CURLE_FTP_ACCEPT_TIMEOUT:
        case CURLE_FTP_CANT_GET_HOST:
        case CURLE_FTP_WEIRD_PASV_REPLY:
        case CURLE_FTP_WEIRD_227_FORMAT:
        case CURLE_FTP_PORT_FAILED:
        case CURLE_WEIRD_SERVER_REPLY:
            return ErrorCode::NetworkError;
        case CURLE_PARTIAL_FILE:
            return ErrorCode::TransferInterrupted;
        case CURLE_REMOTE_FILE_NOT_FOUND:
            return ErrorCode::NotFound;
        case CURLE_LOGIN_DENIED:
            return ErrorCode::PermissionDenied;
        case CURLE_REMOTE_ACCESS_DENIED:
            // CWD into a missing directory is reported as access denied (550)
            return responseCode == 550 ? ErrorCode::NotFound : ErrorCode::PermissionDenied;
        case CURLE_FTP_COULDNT_RETR_FILE:
            if (responseCode >= 400 && responseCode < 500)
                return ErrorCode::ServerBusy;
            if (responseCode == 550)
                return ErrorCode::NotFound;
            return ErrorCode::NetworkError;
        case CURLE_WRITE_ERROR:
            return ErrorCode::IoError;
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
        case CURLE_NOT_BUILT_IN:
            return ErrorCode::InvalidArgument;
        case CURLE_OUT_OF_MEMORY:
        case CURLE_FAILED_INIT:
            return ErrorCode::InternalError;
        default:
            break;
    }
    // Transient FTP replies (421 service not available, 425/426 data connection, 450/451)
    if (responseCode >= 400 && responseCode < 500)
        return ErrorCode::ServerBusy;
    return ErrorCode::NetworkError;
}

std::vector<std::string> parseNameList(std::string_view body, std::string_view remoteDir) {
    std::string prefix(remoteDir);
    while (!prefix.empty() && prefix.back() == '/')
        prefix.pop_back();

    std::vector<std::string> out;
    std::size_t pos = 0;
    while (pos < body.size()) {
        auto eol = body.find('\n', pos);
        if (eol == std::string_view::npos)
            eol = body.size();
        auto line = body.substr(pos, eol - pos);
        pos = eol + 1;

        while (!line.empty() && (line.back() == '\r' || line.back() == ' '))
            line.remove_suffix(1);
        if (line.empty() || line == "." || line == "..")
            continue;

        if (line.find('/') != std::string_view::npos || prefix.empty()) {
            out.emplace_back(line);
        } else {
            std::string full = prefix;
            full.push_back('/');
            full.append(line);
            out.push_back(std::move(full));
        }
    }
    return out;
}

std::string buildUrl(const TransportConfig& config, std::string_view path, bool directory) {
    std::string collapsed;
    collapsed.reserve(path.size());
    for (char c : path) {
        if (c == '/' && (collapsed.empty() || collapsed.back() == '/'))
            continue;
        collapsed.push_back(c);
    }
    if (!collapsed.empty() && collapsed.back() == '/')
        collapsed.pop_back();

    std::string url = config.scheme + "://" + config.host;
    if (config.port > 0) {
        url.push_back(':');
        url.append(std::to_string(config.port));
    }
    url.push_back('/');
    url.append(collapsed);
    if (directory && !collapsed.empty())
        url.push_back('/');
    return url;
}

} // namespace detail

namespace {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct StringWriteContext {
    std::string body;
};

size_t string_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    static_cast<StringWriteContext*>(userdata)->body.append(ptr, total);
    return total;
}

struct SinkWriteContext {
    const ChunkSink* sink{nullptr};
    std::uint64_t delivered{0};
    std::optional<Error> sinkError;
};

size_t sink_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    auto* ctx = static_cast<SinkWriteContext*>(userdata);
    if (total == 0)
        return 0;

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (ctx->sink && *ctx->sink) ? (*ctx->sink)(bytes)
                                       : Result<void>{Error{ErrorCode::IoError, "No sink provided"}};
    if (!r) {
        ctx->sinkError = r.error();
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }
    ctx->delivered += static_cast<std::uint64_t>(total);
    return total;
}

class CurlFtpSession final : public ISession {
public:
    CurlFtpSession(CURL* curl, TransportConfig config, std::shared_ptr<spdlog::logger> logger)
        : curl_(curl), config_(std::move(config)), logger_(std::move(logger)) {}

    ~CurlFtpSession() override {
        if (curl_)
            curl_easy_cleanup(curl_);
    }

    CurlFtpSession(const CurlFtpSession&) = delete;
    CurlFtpSession& operator=(const CurlFtpSession&) = delete;

    Result<std::vector<std::string>> list(std::string_view remoteDir) override {
        if (!curl_)
            return Error{ErrorCode::InvalidState, "Session already closed"};

        const auto url = detail::buildUrl(config_, remoteDir, /*directory=*/true);
        StringWriteContext wctx;
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_DIRLISTONLY, 1L);
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, string_write_cb);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &wctx);

        CURLcode rc = curl_easy_perform(curl_);
        curl_easy_setopt(curl_, CURLOPT_DIRLISTONLY, 0L);
        if (rc != CURLE_OK) {
            return makeError(rc, "list(" + url + ")");
        }

        auto entries = detail::parseNameList(wctx.body, remoteDir);
        logger_->debug("Listed {} entries under {}", entries.size(), url);
        return entries;
    }

    Result<std::uint64_t> retrieve(std::string_view remotePath, const ChunkSink& sink) override {
        if (!curl_)
            return Error{ErrorCode::InvalidState, "Session already closed"};

        const auto url = detail::buildUrl(config_, remotePath, /*directory=*/false);
        SinkWriteContext wctx;
        wctx.sink = &sink;
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, sink_write_cb);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &wctx);

        CURLcode rc = curl_easy_perform(curl_);
        if (wctx.sinkError) {
            return *wctx.sinkError;
        }
        if (rc != CURLE_OK) {
            return makeError(rc, "retrieve(" + url + ")");
        }

        curl_off_t expected = -1;
        if (curl_easy_getinfo(curl_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &expected) == CURLE_OK &&
            expected >= 0 && static_cast<std::uint64_t>(expected) != wctx.delivered) {
            return Error{ErrorCode::TransferInterrupted,
                         "Short transfer for " + url + ": got " + std::to_string(wctx.delivered) +
                             " of " + std::to_string(expected) + " bytes"};
        }
        return wctx.delivered;
    }

    Result<void> close() override {
        if (!curl_)
            return {};
        // curl_easy_cleanup sends QUIT on a live control connection and never fails
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
        logger_->debug("Closed FTP session to {}", config_.host);
        return {};
    }

private:
    Error makeError(CURLcode rc, const std::string& where) const {
        long response = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response);
        Error err;
        err.code = detail::classifyCurlResult(static_cast<int>(rc), response);
        err.message = where + ": " + curl_easy_strerror(rc);
        if (response > 0) {
            err.message += " (reply " + std::to_string(response) + ")";
        }
        return err;
    }

    CURL* curl_{nullptr};
    TransportConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Common CURL easy handle configuration
void configure_common(CURL* curl, const TransportConfig& config) {
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(config.connectTimeout.count()));
    const auto stallSeconds =
        std::max<long>(1, static_cast<long>(config.stallTimeout.count() / 1000));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, stallSeconds);

    curl_easy_setopt(curl, CURLOPT_USERNAME, config.user.c_str());
    curl_easy_setopt(curl, CURLOPT_PASSWORD, config.password.c_str());

    if (config.proxy && !config.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, config.proxy->c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_FTP_RESPONSE_TIMEOUT,
                     std::max<long>(1, static_cast<long>(config.stallTimeout.count() / 1000)));
}

class CurlFtpTransport final : public ITransport {
public:
    explicit CurlFtpTransport(std::shared_ptr<spdlog::logger> logger)
        : logger_(logging::orDefault(std::move(logger))) {}

    Result<std::unique_ptr<ISession>> connect(const TransportConfig& config) override {
        if (config.host.empty()) {
            return Error{ErrorCode::InvalidArgument, "Remote host is empty"};
        }
        ensureCurlGlobalInit();

        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }
        configure_common(curl, config);

        // Log in now so connection failures surface at connect time
        const auto url = detail::buildUrl(config, "", /*directory=*/true);
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        CURLcode rc = curl_easy_perform(curl);
        curl_easy_setopt(curl, CURLOPT_NOBODY, 0L);
        if (rc != CURLE_OK) {
            long response = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response);
            Error err{detail::classifyCurlResult(static_cast<int>(rc), response),
                      "connect(" + url + "): " + curl_easy_strerror(rc)};
            curl_easy_cleanup(curl);
            return err;
        }

        logger_->info("Connected to {} as {}", config.host, config.user);
        return std::unique_ptr<ISession>(std::make_unique<CurlFtpSession>(curl, config, logger_));
    }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

std::unique_ptr<ITransport> makeCurlFtpTransport(std::shared_ptr<spdlog::logger> logger) {
    return std::make_unique<CurlFtpTransport>(std::move(logger));
}

} // namespace pubmirror::transport
