#pragma once

#include "clipcloud/core/result.hpp"
#include "clipcloud/network/http_client.hpp"
#include "clipcloud/storage/signing_gateway.hpp"
#include "clipcloud/transfer/types.hpp"

#include <cstdint>
#include <string>

namespace clipcloud::transfer {

/**
 * @brief Streams an object from a pre-signed URL into `dest_dir/key`
 *
 * The object size comes from the authority so progress can be reported
 * while bytes arrive. Bytes go to disk as they are received; a failed
 * download removes the partial file. Keys must be plain file names: a key
 * with a directory part (`../x.mp4`, `/abs.mp4`) is rejected before any
 * request is made.
 */
class Downloader {
public:
    Downloader(network::HttpClient& http, storage::SigningGateway& gateway);

    /**
     * @return number of bytes written
     */
    Result<std::uint64_t> download(const std::string& key,
                                   const std::string& source_url,
                                   const std::string& dest_dir,
                                   const ProgressCallback& progress = {});

private:
    network::HttpClient& http_;
    storage::SigningGateway& gateway_;
};

} // namespace clipcloud::transfer
