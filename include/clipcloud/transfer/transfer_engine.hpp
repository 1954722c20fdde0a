#pragma once

#include "clipcloud/core/result.hpp"
#include "clipcloud/events/event_bus.hpp"
#include "clipcloud/network/http_client.hpp"
#include "clipcloud/storage/signing_gateway.hpp"
#include "clipcloud/sync/change_detector.hpp"
#include "clipcloud/transfer/types.hpp"

#include <cstdint>
#include <string>

namespace clipcloud::transfer {

/**
 * @brief Entry point for everything that moves bytes to or from the bucket
 *
 * Chooses the upload path by size, publishes lifecycle events on the bus
 * and advances the bucket's logical clock after every successful mutation
 * so other clients notice the change.
 *
 * EXAMPLE:
 * TransferEngine engine(http, gateway, detector, bus);
 * auto result = engine.upload("/recordings/match.mp4", [](int pct) { draw(pct); });
 * if (result.is_error()) { show(result.error().message); }
 */
class TransferEngine {
public:
    TransferEngine(network::HttpClient& http,
                   storage::SigningGateway& gateway,
                   sync::ChangeDetector& detector,
                   events::EventBus& bus,
                   TransferPolicy policy = {});

    /**
     * @brief Upload a local file under its base name
     *
     * Lengths below the policy threshold use one PUT; a length equal to or
     * above it goes multi-part.
     */
    Result<void> upload(const std::string& file_path, const ProgressCallback& progress = {});

    /**
     * @brief Store a JSON document under `key`
     */
    Result<void> put_json(const std::string& text, const std::string& key);

    Result<void> remove(const std::string& key);

    /**
     * @return number of bytes written to `dest_dir/key`
     */
    Result<std::uint64_t> download(const std::string& key,
                                   const std::string& source_url,
                                   const std::string& dest_dir,
                                   const ProgressCallback& progress = {});

    const TransferPolicy& policy() const { return policy_; }

private:
    Result<void> after_mutation(const std::string& key, const std::string& operation);
    void report_failure(const std::string& key, const std::string& operation, const Error& error);

    network::HttpClient& http_;
    storage::SigningGateway& gateway_;
    sync::ChangeDetector& detector_;
    events::EventBus& bus_;
    TransferPolicy policy_;
};

} // namespace clipcloud::transfer
