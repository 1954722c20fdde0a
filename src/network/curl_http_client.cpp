#include "clipcloud/network/curl_http_client.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace clipcloud {
namespace network {
namespace {

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// curl_slist that owns copies of its strings
struct HeaderList {
    std::vector<std::string> store;
    curl_slist* list = nullptr;

    HeaderList() = default;
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;
    ~HeaderList() { curl_slist_free_all(list); }

    void add(const std::string& header) {
        store.push_back(header);
        list = curl_slist_append(list, store.back().c_str());
    }
};

struct BodyReader {
    std::ifstream file;
    const std::string* memory = nullptr;
    std::uint64_t position = 0;
    std::uint64_t remaining = 0;
    bool failed = false;
};

struct ResponseWriter {
    CURL* handle = nullptr;
    HttpResponse* response = nullptr;
    const BodySinkFn* sink = nullptr;
    bool sink_failed = false;
};

struct ProgressRelay {
    const TransferHooks* hooks = nullptr;
    std::uint64_t upload_length = 0;
    curl_off_t last_uploaded = -1;
    curl_off_t last_downloaded = -1;
};

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// Signed URLs carry credentials in the query string; keep them out of logs
std::string without_query(const std::string& url) {
    return url.substr(0, url.find('?'));
}

size_t read_body(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* reader = static_cast<BodyReader*>(userdata);
    const std::uint64_t capacity = static_cast<std::uint64_t>(size) * nitems;
    const std::uint64_t wanted = std::min(capacity, reader->remaining);
    if (wanted == 0) {
        return 0;
    }

    if (reader->memory) {
        std::copy_n(reader->memory->data() + reader->position, wanted, buffer);
        reader->position += wanted;
        reader->remaining -= wanted;
        return static_cast<size_t>(wanted);
    }

    reader->file.read(buffer, static_cast<std::streamsize>(wanted));
    const auto got = static_cast<std::uint64_t>(reader->file.gcount());
    if (got != wanted) {
        // File shrank under us; the declared Content-Length can no longer be honoured
        reader->failed = true;
        return CURL_READFUNC_ABORT;
    }
    reader->remaining -= got;
    return static_cast<size_t>(got);
}

size_t collect_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* response = static_cast<HttpResponse*>(userdata);
    const size_t total = size * nitems;
    const std::string line(buffer, total);

    if (line.rfind("HTTP/", 0) == 0) {
        // New status line (e.g. after 100 Continue): drop headers of the previous one
        response->headers.clear();
        return total;
    }

    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        response->headers[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
    }
    return total;
}

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* writer = static_cast<ResponseWriter*>(userdata);
    const size_t total = size * nmemb;

    long status = 0;
    curl_easy_getinfo(writer->handle, CURLINFO_RESPONSE_CODE, &status);

    if (writer->sink && *writer->sink && status >= 200 && status < 300) {
        if (!(*writer->sink)(ptr, total)) {
            writer->sink_failed = true;
            return 0;
        }
        return total;
    }

    writer->response->body.append(ptr, total);
    return total;
}

int relay_progress(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                   curl_off_t ultotal, curl_off_t ulnow) {
    auto* relay = static_cast<ProgressRelay*>(clientp);
    const auto& hooks = *relay->hooks;

    if (hooks.upload_progress && ulnow != relay->last_uploaded) {
        relay->last_uploaded = ulnow;
        const auto total = ultotal > 0 ? static_cast<std::uint64_t>(ultotal) : relay->upload_length;
        hooks.upload_progress(static_cast<std::uint64_t>(ulnow), total);
    }
    if (hooks.download_progress && dlnow != relay->last_downloaded) {
        relay->last_downloaded = dlnow;
        hooks.download_progress(static_cast<std::uint64_t>(dlnow),
                                dltotal > 0 ? static_cast<std::uint64_t>(dltotal) : 0);
    }
    return 0;
}

} // namespace

CurlHttpClient::CurlHttpClient(CurlOptions options)
    : options_(options) {
    ensure_curl_global_init();
}

Result<HttpResponse> CurlHttpClient::perform(const HttpRequest& request,
                                             const TransferHooks& hooks) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return Fail<HttpResponse>(ErrorKind::Transfer, "Failed to initialise HTTP handle");
    }
    CURL* handle = curl.get();

    BodyReader reader;
    if (request.file_body) {
        const auto& source = *request.file_body;
        reader.file.open(source.path, std::ios::binary);
        if (!reader.file) {
            return Fail<HttpResponse>(ErrorKind::Transfer, "Failed to open upload source: " + source.path);
        }
        reader.file.seekg(static_cast<std::streamoff>(source.offset));
        if (!reader.file) {
            return Fail<HttpResponse>(ErrorKind::Transfer,
                                      "Failed to seek to offset " + std::to_string(source.offset) +
                                      " in " + source.path);
        }
        reader.remaining = source.length;
    } else {
        reader.memory = &request.body;
        reader.remaining = request.body.size();
    }

    HttpResponse response;
    ResponseWriter writer;
    writer.handle = handle;
    writer.response = &response;
    writer.sink = &hooks.body_sink;

    ProgressRelay relay;
    relay.hooks = &hooks;
    relay.upload_length = request.body_length();

    HeaderList headers;
    for (const auto& [name, value] : request.headers) {
        headers.add(name + ": " + value);
    }

    const auto body_length = static_cast<curl_off_t>(request.body_length());
    switch (request.method) {
        case HttpMethod::GET:
            curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::HEAD:
            curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
            break;
        case HttpMethod::PUT:
            curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(handle, CURLOPT_INFILESIZE_LARGE, body_length);
            headers.add("Expect:");
            break;
        case HttpMethod::POST:
            curl_easy_setopt(handle, CURLOPT_POST, 1L);
            curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, body_length);
            headers.add("Expect:");
            break;
        case HttpMethod::DELETE_METHOD:
            curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
    curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(options_.request_timeout.count()));
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, 120L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);

    if (request.method == HttpMethod::PUT || request.method == HttpMethod::POST) {
        curl_easy_setopt(handle, CURLOPT_READFUNCTION, &read_body);
        curl_easy_setopt(handle, CURLOPT_READDATA, &reader);
    }

    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, &collect_header);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &write_body);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &writer);

    if (hooks.upload_progress || hooks.download_progress) {
        curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, &relay_progress);
        curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &relay);
    }

    spdlog::debug("[HttpClient] {} {} ({} body bytes)",
                  HttpMethodUtils::to_string(request.method), without_query(request.url), request.body_length());

    const CURLcode code = curl_easy_perform(handle);
    if (code != CURLE_OK) {
        std::string reason;
        if (writer.sink_failed) {
            reason = "Failed writing response body";
        } else if (reader.failed) {
            reason = "Failed reading request body from " + request.file_body->path;
        } else {
            reason = error_buffer[0] != '\0' ? std::string(error_buffer) : std::string(curl_easy_strerror(code));
        }
        spdlog::debug("[HttpClient] {} {} failed: {}",
                      HttpMethodUtils::to_string(request.method), without_query(request.url), reason);
        return Fail<HttpResponse>(ErrorKind::Transfer, reason);
    }

    long status = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
    response.status_code = static_cast<int>(status);
    return Ok(std::move(response));
}

} // namespace network
} // namespace clipcloud
