#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace configdesk {

struct HttpResponse {
    int statusCode = 0;
    std::string body;
    std::unordered_map<std::string, std::string> headers; // lowercase names
    std::string error;                                    // transport error, empty on success

    bool ok() const { return error.empty() && statusCode >= 200 && statusCode < 300; }
};

/**
 * HttpModule - blocking HTTP client on top of libcurl
 *
 * - get(url, headers): fetch a resource into memory
 * - download(url, path, progress): stream a resource to a file
 *
 * One curl easy handle per call, so an instance may be shared between threads
 * as long as its defaults aren't being changed concurrently.
 */
class HttpModule {
public:
    // (bytes in this chunk, Content-Length if the server sent one)
    using ProgressCallback = std::function<void(size_t, std::optional<uint64_t>)>;

    HttpModule();
    ~HttpModule() = default;

    HttpResponse get(const std::string& url,
                     const std::unordered_map<std::string, std::string>& headers = {});

    // The file at `path` is removed again when the transfer fails
    HttpResponse download(const std::string& url, const std::string& path,
                          const ProgressCallback& progress = {});

    // Set default timeout (milliseconds)
    void setTimeout(int ms) { timeoutMs = ms; }
    int getTimeout() const { return timeoutMs; }

    static std::string urlEncode(const std::string& str);

private:
    int timeoutMs = 30000;
    std::unordered_map<std::string, std::string> defaultHeaders;
};

} // namespace configdesk
