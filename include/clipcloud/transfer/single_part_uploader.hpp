#pragma once

#include "clipcloud/core/result.hpp"
#include "clipcloud/network/http_client.hpp"
#include "clipcloud/storage/signing_gateway.hpp"
#include "clipcloud/transfer/types.hpp"

#include <string>

namespace clipcloud::transfer {

/**
 * @brief Uploads a whole file with one PUT to one signed URL
 *
 * The object key is the file's base name. The body is streamed from disk.
 */
class SinglePartUploader {
public:
    SinglePartUploader(network::HttpClient& http, storage::SigningGateway& gateway);

    Result<void> upload(const std::string& file_path, const ProgressCallback& progress = {});

private:
    network::HttpClient& http_;
    storage::SigningGateway& gateway_;
};

} // namespace clipcloud::transfer
