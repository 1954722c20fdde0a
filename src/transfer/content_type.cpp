#include "clipcloud/transfer/content_type.hpp"


namespace clipcloud::transfer {
namespace {

bool has_suffix(const std::string& key, const std::string& suffix) {
    if (key.size() < suffix.size()) {
        return false;
    }
    return key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

Result<std::string> content_type_for(const std::string& key) {
    if (has_suffix(key, ".mp4")) {
        return Ok(std::string("video/mp4"));
    }
    if (has_suffix(key, ".png")) {
        return Ok(std::string("image/png"));
    }
    return Fail<std::string>(ErrorKind::UnsupportedType, "Unsupported file type for " + key);
}

} // namespace clipcloud::transfer
