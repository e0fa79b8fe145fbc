#ifndef UPKIT_HTTP_HPP
#define UPKIT_HTTP_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace upkit {

// HTTPS capability shared by the feed client and the downloader.
class Transport {
public:
    // Return false to abort the transfer. `totalBytes` is 0 when the server
    // did not announce a length.
    using ChunkCallback = std::function<bool(const char* data, size_t size, std::uint64_t totalBytes)>;

    virtual ~Transport() = default;

    // Streams the body of `url` through `onChunk`. Throws DownloadError on
    // network or HTTP failure and CancelledError when `onChunk` aborts.
    virtual void get(const std::string& url, std::chrono::seconds timeout, const ChunkCallback& onChunk) = 0;
};

class HTTP : public Transport {
public:
    HTTP();

    void get(const std::string& url, std::chrono::seconds timeout, const ChunkCallback& onChunk) override;

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
};

} // namespace upkit

#endif // UPKIT_HTTP_HPP
