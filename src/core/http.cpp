#include "upkit/http.hpp"
#include "upkit/errors.hpp"
#include "upkit/logger.hpp"
#include "upkit/version.hpp"
#include <curl/curl.h>
#include <mutex>

namespace upkit {

namespace {

struct StreamContext {
    CURL* curl = nullptr;
    const Transport::ChunkCallback* callback = nullptr;
    bool aborted = false;
};

} // namespace

HTTP::HTTP() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t HTTP::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<StreamContext*>(userp);
    size_t totalSize = size * nmemb;

    curl_off_t contentLength = -1;
    curl_easy_getinfo(ctx->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength);
    std::uint64_t total = contentLength > 0 ? static_cast<std::uint64_t>(contentLength) : 0;

    if (!(*ctx->callback)(static_cast<const char*>(contents), totalSize, total)) {
        ctx->aborted = true;
        return 0; // makes curl fail the transfer with CURLE_WRITE_ERROR
    }
    return totalSize;
}

void HTTP::get(const std::string& url, std::chrono::seconds timeout, const ChunkCallback& onChunk) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw DownloadError("Failed to initialize cURL");
    }

    StreamContext ctx{curl, &onChunk, false};
    const std::string userAgent = "upkit/" + UPKIT_VERSION_STRING;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    // Never downgrade, not even across a redirect.
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "https");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "https");
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout.count()));
    // A stalled transfer counts as a network failure.
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(timeout.count()));

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    if (ctx.aborted) {
        throw CancelledError("Transfer aborted: " + url);
    }
    if (res != CURLE_OK) {
        std::string detail = curl_easy_strerror(res);
        if (res == CURLE_HTTP_RETURNED_ERROR) {
            detail = "HTTP " + std::to_string(status);
        }
        LOG_DEBUG("Request to " + url + " failed: " + detail);
        throw DownloadError("cURL request failed: " + detail);
    }
}

} // namespace upkit
