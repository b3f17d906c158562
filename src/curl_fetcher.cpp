#include "transferq/curl_fetcher.hpp"

#include "transferq/detail/curl_utils.hpp"
#include "transferq/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace transferq {

class CurlFetcher::Impl {
public:
    explicit Impl(Options options) : options_(std::move(options)) {
        detail::ensureCurlInitialized();
    }

    [[nodiscard]] FetchInfo probe(const std::string& source, const std::function<bool()>& keep_going) const {
        FetchInfo info;
        auto curl = detail::makeEasyHandle(source, options_.user_agent, options_.connect_timeout_seconds,
                                           options_.low_speed_time_seconds);
        if (!curl) {
            throw TransportError("Failed to allocate curl handle");
        }

        char error_buffer[CURL_ERROR_SIZE] = {};
        std::string headers;
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION,
            +[](char* ptr, size_t size, size_t nmemb, std::string* out) -> size_t {
                if (!out) {
                    return 0;
                }
                out->append(ptr, size * nmemb);
                return size * nmemb;
            });
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION,
            +[](void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int {
                const auto* keep = static_cast<const std::function<bool()>*>(clientp);
                return (keep && *keep && !(*keep)()) ? 1 : 0;
            });
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &keep_going);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res == CURLE_ABORTED_BY_CALLBACK) {
            spdlog::debug("HEAD {} stopped on request", source);
            return info;
        }
        if (res != CURLE_OK) {
            // Some hosts reject HEAD; the size is then learned from the GET.
            spdlog::warn("HEAD {} failed: {}", source, detail::describeCurlError(res, error_buffer));
            return info;
        }

        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        if (code >= 400) {
            spdlog::warn("HEAD {} returned HTTP {}", source, code);
            return info;
        }

        std::string lowered = headers;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        info.supports_range = lowered.find("accept-ranges: bytes") != std::string::npos;

        curl_off_t length = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        // -1 when the server omitted Content-Length.
        info.content_length = static_cast<std::uint64_t>(std::max<curl_off_t>(0, length));
        return info;
    }

    FetchOutcome fetch(const FetchRequest& request, const FetchCallbacks& callbacks) {
        auto curl = detail::makeEasyHandle(request.source, options_.user_agent,
                                           options_.connect_timeout_seconds, options_.low_speed_time_seconds);
        if (!curl) {
            throw TransportError("Failed to allocate curl handle");
        }

        std::unique_ptr<FILE, FileDeleter> file{
            std::fopen(request.artifact.c_str(), request.offset > 0 ? "ab" : "wb")};
        if (!file) {
            throwFileError("Cannot open artifact " + request.artifact.string(), errno);
        }

        WriteContext ctx;
        ctx.file = file.get();
        ctx.curl = curl.get();
        ctx.callbacks = &callbacks;
        ctx.offset = request.offset;

        char error_buffer[CURL_ERROR_SIZE] = {};
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::progressCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
        if (request.offset > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_RESUME_FROM_LARGE,
                             static_cast<curl_off_t>(request.offset));
        }

        const CURLcode res = curl_easy_perform(curl.get());

        if (std::fflush(file.get()) != 0 && res == CURLE_OK) {
            throwFileError("Failed to flush artifact", errno);
        }
        file.reset();

        if (ctx.stopped) {
            return FetchOutcome::Stopped;
        }
        if (ctx.write_errno != 0) {
            throwFileError("Failed to write artifact " + request.artifact.string(), ctx.write_errno);
        }
        if (res != CURLE_OK) {
            long code = 0;
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
            throw TransportError(detail::describeCurlError(res, error_buffer), isRetryable(res, code));
        }
        return FetchOutcome::Completed;
    }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    struct WriteContext {
        FILE* file{nullptr};
        CURL* curl{nullptr};
        const FetchCallbacks* callbacks{nullptr};
        std::uint64_t offset{0};
        bool size_reported{false};
        bool stopped{false};
        int write_errno{0};
    };

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<WriteContext*>(userdata);
        const size_t total = size * nmemb;
        if (!ctx || !ctx->file || total == 0) {
            return 0;
        }

        if (!ctx->size_reported) {
            ctx->size_reported = true;
            curl_off_t length = -1;
            curl_easy_getinfo(ctx->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
            if (length > 0 && ctx->callbacks->on_size) {
                ctx->callbacks->on_size(ctx->offset + static_cast<std::uint64_t>(length));
            }
        }

        const size_t written = std::fwrite(ptr, 1, total, ctx->file);
        if (written != total) {
            ctx->write_errno = errno != 0 ? errno : EIO;
            return 0;
        }

        if (ctx->callbacks->on_chunk && !ctx->callbacks->on_chunk(written)) {
            ctx->stopped = true;
            return 0;
        }
        return written;
    }

    static int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* ctx = static_cast<WriteContext*>(clientp);
        if (ctx && ctx->callbacks->keep_going && !ctx->callbacks->keep_going()) {
            ctx->stopped = true;
            return 1;
        }
        return 0;
    }

    [[noreturn]] static void throwFileError(const std::string& what, int err) {
        if (err == ENOSPC || err == EDQUOT) {
            throw CapacityError(fmt::format("{}: no space left on device", what));
        }
        throw TransportError(fmt::format("{}: {}", what, std::strerror(err)));
    }

    static bool isRetryable(CURLcode code, long http_code) {
        switch (code) {
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_LOGIN_DENIED:
        case CURLE_REMOTE_ACCESS_DENIED:
        case CURLE_REMOTE_FILE_NOT_FOUND:
        case CURLE_RANGE_ERROR:
            return false;
        case CURLE_HTTP_RETURNED_ERROR:
            return http_code >= 500 || http_code == 408 || http_code == 429;
        default:
            return true;
        }
    }

    Options options_;
};

CurlFetcher::CurlFetcher() : CurlFetcher(Options{}) {}

CurlFetcher::CurlFetcher(Options options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

CurlFetcher::~CurlFetcher() = default;

FetchInfo CurlFetcher::probe(const std::string& source, const std::function<bool()>& keep_going) {
    return impl_->probe(source, keep_going);
}

FetchOutcome CurlFetcher::fetch(const FetchRequest& request, const FetchCallbacks& callbacks) {
    return impl_->fetch(request, callbacks);
}

} // namespace transferq
