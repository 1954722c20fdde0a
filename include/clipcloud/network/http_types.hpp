#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

#ifndef _WIN32
#include <strings.h>
#endif

namespace clipcloud {
namespace network {

/**
 * @brief HTTP request methods used against the authority and object store
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // Renamed to avoid Windows macro conflict
    HEAD
};

/**
 * @brief Case-insensitive ordering so header lookups follow RFC 7230
 */
struct HeaderNameLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const {
#ifdef _WIN32
        return _stricmp(lhs.c_str(), rhs.c_str()) < 0;
#else
        return strcasecmp(lhs.c_str(), rhs.c_str()) < 0;
#endif
    }
};

using HeaderMap = std::map<std::string, std::string, HeaderNameLess>;

/**
 * @brief A byte range of a local file streamed as the request body
 *
 * The body is read from disk while the request is in flight, so a request
 * for a multi-gigabyte part never holds more than one transport buffer.
 */
struct FileBody {
    std::string path;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
};

/**
 * @brief Outbound HTTP request
 *
 * Either `body` (small in-memory payloads such as JSON) or `file_body`
 * (streamed uploads) carries the payload, never both.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HeaderMap headers;
    std::string body;
    std::optional<FileBody> file_body;

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string get_header(const std::string& name) const {
        auto it = headers.find(name);
        return it != headers.end() ? it->second : std::string();
    }

    /**
     * @brief Number of payload bytes this request will send
     */
    std::uint64_t body_length() const {
        return file_body ? file_body->length : static_cast<std::uint64_t>(body.size());
    }
};

/**
 * @brief Response as seen by the caller
 *
 * When a body sink is used for a 2xx response, `body` stays empty and the
 * bytes went to the sink instead.
 */
struct HttpResponse {
    int status_code = 0;
    HeaderMap headers;
    std::string body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }

    std::string get_header(const std::string& name) const {
        auto it = headers.find(name);
        return it != headers.end() ? it->second : std::string();
    }

    bool has_header(const std::string& name) const {
        return headers.find(name) != headers.end();
    }
};

/**
 * @brief Byte-level progress: (bytes so far, bytes expected or 0 if unknown)
 */
using ByteProgressFn = std::function<void(std::uint64_t, std::uint64_t)>;

/**
 * @brief Receives response body bytes; returning false aborts the transfer
 */
using BodySinkFn = std::function<bool(const char*, std::size_t)>;

/**
 * @brief Optional streaming hooks for one request
 */
struct TransferHooks {
    ByteProgressFn upload_progress;
    ByteProgressFn download_progress;
    BodySinkFn body_sink;  ///< Only receives bodies of 2xx responses
};

class HttpMethodUtils {
public:
    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
        }
        return "UNKNOWN";
    }
};

} // namespace network
} // namespace clipcloud
