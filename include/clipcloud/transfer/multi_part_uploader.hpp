#pragma once

#include "clipcloud/core/result.hpp"
#include "clipcloud/events/event_bus.hpp"
#include "clipcloud/network/http_client.hpp"
#include "clipcloud/storage/signing_gateway.hpp"
#include "clipcloud/transfer/types.hpp"

#include <cstddef>
#include <string>

namespace clipcloud::transfer {

/**
 * @brief Uploads a large file as sequential byte-range parts
 *
 * FLOW:
 * 1. Ask the authority for a session; it decides the number of parts
 * 2. Plan ranges of policy.part_size; a count mismatch fails before any PUT
 * 3. PUT each range to its URL in order, keeping the ETag of each
 * 4. Complete the session with the ETags in part order
 *
 * A failed part aborts the upload without completing the session. The
 * authority expires abandoned sessions; nothing is cleaned up here.
 */
class MultiPartUploader {
public:
    MultiPartUploader(network::HttpClient& http,
                      storage::SigningGateway& gateway,
                      events::EventBus& bus,
                      TransferPolicy policy = {});

    /**
     * @return number of parts uploaded
     */
    Result<std::size_t> upload(const std::string& file_path, const ProgressCallback& progress = {});

private:
    network::HttpClient& http_;
    storage::SigningGateway& gateway_;
    events::EventBus& bus_;
    TransferPolicy policy_;
};

} // namespace clipcloud::transfer
