#pragma once

#include <string>

namespace clipcloud {
namespace network {

/**
 * @brief Percent-encode everything except A-Z a-z 0-9 - . _ ~
 *
 * Uses curl_easy_escape, so keys with spaces or slashes survive the trip
 * through the gateway's router as a single path component.
 * libcurl only fails here when out of memory, reported as std::bad_alloc.
 */
std::string url_encode_component(const std::string& value);

/**
 * @brief Standard base64 with '=' padding (Boost.Archive iterators)
 */
std::string base64_encode(std::string input);

/**
 * @brief "Basic <base64(user:password)>"
 */
std::string basic_auth_header(const std::string& user, const std::string& password);

} // namespace network
} // namespace clipcloud
