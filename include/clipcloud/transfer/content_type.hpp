#pragma once

#include "clipcloud/core/result.hpp"

#include <string>

namespace clipcloud::transfer {

/**
 * @brief MIME type for an upload key, from its suffix
 *
 * Only `.mp4` and `.png` may be uploaded; anything else is UnsupportedType.
 * The suffix must match exactly: `CLIP.MP4` is rejected.
 */
Result<std::string> content_type_for(const std::string& key);

} // namespace clipcloud::transfer
