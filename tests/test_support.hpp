#ifndef UPKIT_TEST_SUPPORT_HPP
#define UPKIT_TEST_SUPPORT_HPP

#include "upkit/errors.hpp"
#include "upkit/http.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <openssl/evp.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace upkit::test {

// In-memory stand-in for the network. Each URL serves a fixed body, can be
// told to fail a number of times first, and can be held until released.
class ScriptedTransport : public Transport {
public:
    using ChunkHook = std::function<void(const std::string& url, std::uint64_t sentBytes)>;

    void setResponse(const std::string& url, std::string body, int failuresBeforeSuccess = 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[url] = Response{std::move(body), failuresBeforeSuccess};
    }

    void setChunkSize(std::size_t size) { chunkSize_ = std::max<std::size_t>(1, size); }

    // Called after every chunk is delivered, on the downloading thread.
    void setOnChunkSent(ChunkHook hook) { onChunkSent_ = std::move(hook); }

    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        cv_.notify_all();
    }

    std::size_t requestCount(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = requests_.find(url);
        return it == requests_.end() ? 0 : it->second;
    }

    void get(const std::string& url, std::chrono::seconds, const ChunkCallback& onChunk) override {
        std::string body;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ++requests_[url];
            cv_.wait(lock, [this] { return !held_; });

            auto it = responses_.find(url);
            if (it == responses_.end()) {
                throw DownloadError("HTTP 404");
            }
            if (it->second.failuresRemaining > 0) {
                --it->second.failuresRemaining;
                throw DownloadError("Connection reset by peer");
            }
            body = it->second.body;
        }

        std::uint64_t sent = 0;
        while (sent < body.size()) {
            std::size_t n = std::min<std::size_t>(chunkSize_, body.size() - sent);
            if (!onChunk(body.data() + sent, n, body.size())) {
                throw CancelledError("Transfer aborted: " + url);
            }
            sent += n;
            if (onChunkSent_) {
                onChunkSent_(url, sent);
            }
        }
    }

private:
    struct Response {
        std::string body;
        int failuresRemaining = 0;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, Response> responses_;
    std::map<std::string, std::size_t> requests_;
    std::size_t chunkSize_ = 4096;
    ChunkHook onChunkSent_;
    bool held_ = false;
};

class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "upkit-test-XXXXXX").string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = buf.data();
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

private:
    std::filesystem::path path_;
};

inline std::string sha256Hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest failed");
    }
    static const char* hex = "0123456789abcdef";
    std::string out;
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0f]);
    }
    return out;
}

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::size_t countEntries(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) return 0;
    return static_cast<std::size_t>(std::distance(std::filesystem::directory_iterator(dir),
                                                  std::filesystem::directory_iterator()));
}

struct ArchiveFile {
    std::string path;
    std::string content;
    int mode = 0644;
};

// Builds a gzip-compressed tarball in memory.
inline std::string makeTarGz(const std::vector<ArchiveFile>& files) {
    std::vector<char> buffer(1024 * 1024 + 64 * files.size() * 1024);
    std::size_t used = 0;

    struct archive* a = archive_write_new();
    archive_write_add_filter_gzip(a);
    archive_write_set_format_pax_restricted(a);
    if (archive_write_open_memory(a, buffer.data(), buffer.size(), &used) != ARCHIVE_OK) {
        archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    for (const auto& file : files) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, file.path.c_str());
        archive_entry_set_size(entry, static_cast<la_int64_t>(file.content.size()));
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, file.mode);
        archive_write_header(a, entry);
        archive_write_data(a, file.content.data(), file.content.size());
        archive_entry_free(entry);
    }

    archive_write_close(a);
    archive_write_free(a);
    return std::string(buffer.data(), used);
}

// Polls `condition` for up to `timeout`.
inline bool waitFor(const std::function<bool()>& condition,
                    std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

} // namespace upkit::test

#endif // UPKIT_TEST_SUPPORT_HPP
