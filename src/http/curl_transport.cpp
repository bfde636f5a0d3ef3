/// @file curl_transport.cpp
/// @brief CurlTransport implementation over the libcurl easy interface.

#include "bulwark/http/curl_transport.hpp"

#include "bulwark/foundation/logger.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <deque>
#include <filesystem>
#include <mutex>

namespace bulwark::http {

using foundation::CancellationToken;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::ResilienceError;
using foundation::ResilienceResult;

namespace {

/// Process-wide curl_global_init, run once.
CURLcode globalInit() {
    static std::once_flag flag;
    static CURLcode status = CURLE_OK;
    std::call_once(flag, [] { status = curl_global_init(CURL_GLOBAL_DEFAULT); });
    return status;
}

/// Owns one CURL easy handle.
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() {
        if (handle_) {
            curl_easy_cleanup(handle_);
        }
    }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    [[nodiscard]] CURL* get() const noexcept { return handle_; }

private:
    CURL* handle_;
};

/// Owns a curl_slist of request headers.
class HeaderList {
public:
    HeaderList() = default;
    ~HeaderList() { curl_slist_free_all(list_); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    bool append(const std::string& line) {
        auto* next = curl_slist_append(list_, line.c_str());
        if (!next) {
            return false;
        }
        list_ = next;
        return true;
    }

    [[nodiscard]] curl_slist* get() const noexcept { return list_; }

private:
    curl_slist* list_ = nullptr;
};

size_t writeBody(char* data, size_t size, size_t count, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(data, size * count);
    return size * count;
}

std::string trim(std::string_view text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(begin, end - begin + 1));
}

size_t writeHeader(char* data, size_t size, size_t count, void* userdata) {
    auto* headers = static_cast<Headers*>(userdata);
    std::string_view line(data, size * count);

    // A new status line (redirect hop, 100 Continue) starts a fresh set.
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return size * count;
    }
    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        (*headers)[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
    }
    return size * count;
}

int onProgress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* token = static_cast<const CancellationToken*>(userdata);
    return (token->isCancelled() || token->isExpired()) ? 1 : 0;
}

ResilienceError tlsError(std::string message) {
    return ResilienceError(ErrorCode::TlsSetupFailed, std::move(message));
}

} // namespace

// -- Impl -------------------------------------------------------------------

struct CurlTransport::Impl {
    TransportOptions options;
    std::mutex poolMutex;
    std::deque<std::unique_ptr<CurlHandle>> idle;

    explicit Impl(TransportOptions opts) : options(std::move(opts)) {}

    std::unique_ptr<CurlHandle> acquire() {
        {
            std::lock_guard lock(poolMutex);
            if (!idle.empty()) {
                auto handle = std::move(idle.front());
                idle.pop_front();
                return handle;
            }
        }
        auto handle = std::make_unique<CurlHandle>();
        if (!handle->get()) {
            return nullptr;
        }
        return handle;
    }

    void release(std::unique_ptr<CurlHandle> handle) {
        if (options.disableKeepAlives) {
            return;
        }
        curl_easy_reset(handle->get());
        std::lock_guard lock(poolMutex);
        if (idle.size() < options.maxIdleConns) {
            idle.push_back(std::move(handle));
        }
    }

    void applyOptions(CURL* curl) const {
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);

        if (options.disableKeepAlives) {
            curl_easy_setopt(curl, CURLOPT_FORBID_REUSE, 1L);
        } else {
            auto idleSeconds = std::chrono::duration_cast<std::chrono::seconds>(
                options.idleConnTimeout);
            curl_easy_setopt(curl, CURLOPT_MAXAGE_CONN, static_cast<long>(idleSeconds.count()));
            curl_easy_setopt(curl, CURLOPT_MAXCONNECTS,
                             static_cast<long>(std::max<uint32_t>(1, options.maxIdleConnsPerHost)));
        }

        if (options.insecureSkipVerify) {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
        }
        if (!options.certFile.empty()) {
            curl_easy_setopt(curl, CURLOPT_SSLCERT, options.certFile.c_str());
            curl_easy_setopt(curl, CURLOPT_SSLKEY, options.keyFile.c_str());
        }
        if (!options.caFile.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, options.caFile.c_str());
        }
    }
};

// -- Construction ------------------------------------------------------------

ResilienceResult<std::unique_ptr<CurlTransport>> CurlTransport::create(TransportOptions options) {
    using R = ResilienceResult<std::unique_ptr<CurlTransport>>;

    if (options.certFile.empty() != options.keyFile.empty()) {
        return R::err(tlsError("client certificate and key must be given together"));
    }
    for (const auto* path : {&options.certFile, &options.keyFile, &options.caFile}) {
        std::error_code ec;
        if (!path->empty() && !std::filesystem::exists(*path, ec)) {
            return R::err(tlsError("TLS file not found: " + *path));
        }
    }

    if (auto status = globalInit(); status != CURLE_OK) {
        return R::err(ResilienceError(ErrorCode::TransportError,
                                      std::string("libcurl initialization failed: ") +
                                          curl_easy_strerror(status)));
    }
    return R::ok(std::unique_ptr<CurlTransport>(new CurlTransport(std::move(options))));
}

CurlTransport::CurlTransport(TransportOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

CurlTransport::~CurlTransport() = default;

const TransportOptions& CurlTransport::options() const noexcept {
    return impl_->options;
}

void CurlTransport::closeIdleConnections() {
    std::lock_guard lock(impl_->poolMutex);
    impl_->idle.clear();
}

// -- Execution ---------------------------------------------------------------

ResilienceResult<TransportResponse> CurlTransport::execute(const TransportRequest& request,
                                                           const CancellationToken& token) {
    using R = ResilienceResult<TransportResponse>;

    auto ready = token.check();
    if (ready.hasError()) {
        return R::err(std::move(ready).error());
    }

    auto handle = impl_->acquire();
    if (!handle) {
        return R::err(ResilienceError(ErrorCode::TransportError, "curl_easy_init failed"));
    }
    CURL* curl = handle->get();
    impl_->applyOptions(curl);

    TransportResponse response;
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, writeHeader);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, onProgress);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &token);

    if (auto remaining = token.remaining()) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(std::max<int64_t>(1, remaining->count())));
    }

    switch (request.method) {
        case Method::Get:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case Method::Head:
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
            break;
        case Method::Post:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            break;
        default:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, toString(request.method).data());
            break;
    }
    if (!request.body.empty() || request.method == Method::Post) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
    }

    HeaderList headerList;
    for (const auto& [name, value] : request.headers) {
        if (!headerList.append(name + ": " + value)) {
            return R::err(ResilienceError(ErrorCode::TransportError,
                                          "failed to build header list"));
        }
    }
    // Suppress libcurl's automatic "Expect: 100-continue" on large bodies.
    if (!headerList.append("Expect:")) {
        return R::err(ResilienceError(ErrorCode::TransportError, "failed to build header list"));
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList.get());

    CURLcode code = curl_easy_perform(curl);

    if (code == CURLE_OK) {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.statusCode = static_cast<int>(status);
        impl_->release(std::move(handle));
        return R::ok(std::move(response));
    }

    // The handle's state is unknown after a failed transfer; drop it.
    switch (code) {
        case CURLE_ABORTED_BY_CALLBACK:
        case CURLE_OPERATION_TIMEDOUT: {
            auto reason = token.check();
            if (reason.hasError()) {
                return R::err(std::move(reason).error());
            }
            return R::err(ResilienceError(ErrorCode::Timeout,
                                          "request to " + request.url + " timed out"));
        }
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return R::err(ResilienceError(ErrorCode::InvalidUrl,
                                          std::string(curl_easy_strerror(code)) + ": " +
                                              request.url));
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_ENGINE_INITFAILED:
            return R::err(tlsError(curl_easy_strerror(code)));
        default:
            BULWARK_LOG_DEBUG(LogCategory::Http,
                              "libcurl transfer failed: " + std::string(curl_easy_strerror(code)));
            return R::err(ResilienceError(ErrorCode::TransportError,
                                          std::string(curl_easy_strerror(code)) + " (" +
                                              request.url + ")"));
    }
}

} // namespace bulwark::http
