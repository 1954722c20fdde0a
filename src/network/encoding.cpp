#include "clipcloud/network/encoding.hpp"

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <curl/curl.h>

#include <cstdint>
#include <memory>
#include <new>

namespace clipcloud {
namespace network {

std::string url_encode_component(const std::string& value) {
    if (value.empty()) {
        return {};
    }

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw std::bad_alloc();
    }

    char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.length()));
    if (!escaped) {
        throw std::bad_alloc();
    }
    std::string result{escaped};
    curl_free(escaped);
    return result;
}

std::string base64_encode(std::string input) {
    // transform_width reads whole 3-byte groups; pad with zeros and trim afterwards
    const std::uint32_t num_pad_chars((3 - input.size() % 3) % 3);
    input.append(num_pad_chars, '\0');

    using boost::archive::iterators::base64_from_binary;
    using boost::archive::iterators::transform_width;
    using Base64Iterator = base64_from_binary<transform_width<std::string::const_iterator, 6, 8>>;

    std::string output(Base64Iterator(input.cbegin()),
                       Base64Iterator(input.cend() - num_pad_chars));
    output.append(num_pad_chars, '=');
    return output;
}

std::string basic_auth_header(const std::string& user, const std::string& password) {
    return "Basic " + base64_encode(user + ":" + password);
}

} // namespace network
} // namespace clipcloud
