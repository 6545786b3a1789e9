#include "HttpModule.hpp"
#include "configdesk/Constants.hpp"
#include "utils/Logger.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace configdesk {

namespace {

std::once_flag curlInitFlag;

void ensureCurlInitialized() {
    std::call_once(curlInitFlag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total = size * nmemb;
    userp->append(static_cast<char*>(contents), total);
    return total;
}

size_t HeaderCallback(void* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::unordered_map<std::string, std::string>*>(userdata);
    std::string headerStr(static_cast<char*>(buffer), size * nitems);

    // A new status line starts a new response (redirects)
    if (headerStr.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return size * nitems;
    }

    size_t colonPos = headerStr.find(':');
    if (colonPos != std::string::npos) {
        std::string key = headerStr.substr(0, colonPos);
        std::string value = headerStr.substr(colonPos + 1);

        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        (*headers)[key] = value;
    }
    return size * nitems;
}

struct DownloadState {
    std::ofstream* file;
    CURL* curl;
    const HttpModule::ProgressCallback* progress;
};

size_t FileWriteCallback(void* buffer, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<DownloadState*>(userdata);
    const size_t total = size * nmemb;
    state->file->write(static_cast<char*>(buffer), static_cast<std::streamsize>(total));
    if (!*state->file) {
        return 0; // aborts the transfer with CURLE_WRITE_ERROR
    }
    if (*state->progress) {
        curl_off_t length = -1;
        std::optional<uint64_t> contentLength;
        if (curl_easy_getinfo(state->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK && length >= 0) {
            contentLength = static_cast<uint64_t>(length);
        }
        (*state->progress)(total, contentLength);
    }
    return total;
}

curl_slist* buildHeaderList(const std::unordered_map<std::string, std::string>& defaults,
                            const std::unordered_map<std::string, std::string>& headers) {
    curl_slist* headerList = nullptr;
    for (const auto& [key, value] : defaults) {
        if (headers.count(key)) continue;
        std::string header = key + ": " + value;
        headerList = curl_slist_append(headerList, header.c_str());
    }
    for (const auto& [key, value] : headers) {
        std::string header = key + ": " + value;
        headerList = curl_slist_append(headerList, header.c_str());
    }
    return headerList;
}

} // namespace

HttpModule::HttpModule() {
    defaultHeaders["User-Agent"] = std::string(APP_NAME) + "/" + APP_VERSION;
}

HttpResponse HttpModule::get(const std::string& url,
                             const std::unordered_map<std::string, std::string>& headers) {
    ensureCurlInitialized();

    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Failed to initialize CURL";
        error("HttpModule: {}", response.error);
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeoutMs));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeoutMs / 3));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    curl_slist* headerList = buildHeaderList(defaultHeaders, headers);
    if (headerList) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
    }

    std::string responseBody;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody);

    std::unordered_map<std::string, std::string> responseHeaders;
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &responseHeaders);

    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        response.error = std::string("CURL error: ") + curl_easy_strerror(res);
        warning("HttpModule: GET {} - {}", url, response.error);
    } else {
        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        response.statusCode = static_cast<int>(httpCode);
        response.body = std::move(responseBody);
        response.headers = std::move(responseHeaders);
        debug("HttpModule: GET {} -> {}", url, response.statusCode);
    }

    curl_slist_free_all(headerList);
    curl_easy_cleanup(curl);
    return response;
}

HttpResponse HttpModule::download(const std::string& url, const std::string& path,
                                  const ProgressCallback& progress) {
    ensureCurlInitialized();

    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Failed to initialize CURL";
        error("HttpModule: {}", response.error);
        return response;
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        response.error = "Failed to open file for download: " + path;
        error("HttpModule: {}", response.error);
        curl_easy_cleanup(curl);
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    // Longer timeout for downloads
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeoutMs) * 10);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeoutMs / 3));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    // Error pages must not end up in the file
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

    curl_slist* headerList = buildHeaderList(defaultHeaders, {{"Accept", "application/octet-stream"}});
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);

    DownloadState state{&file, curl, &progress};
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, FileWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);

    CURLcode res = curl_easy_perform(curl);

    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    response.statusCode = static_cast<int>(httpCode);

    file.close();
    if (res == CURLE_OK && file.fail()) {
        response.error = "Failed to write " + path;
    } else if (res != CURLE_OK) {
        response.error = std::string("CURL error: ") + curl_easy_strerror(res);
    }

    if (!response.error.empty()) {
        error("HttpModule: Download of {} failed - {}", url, response.error);
        std::remove(path.c_str());
    } else {
        info("HttpModule: Downloaded {} -> {}", url, path);
    }

    curl_slist_free_all(headerList);
    curl_easy_cleanup(curl);
    return response;
}

std::string HttpModule::urlEncode(const std::string& str) {
    std::ostringstream oss;
    for (char c : str) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(uc) << std::nouppercase << std::dec;
        }
    }
    return oss.str();
}

} // namespace configdesk
