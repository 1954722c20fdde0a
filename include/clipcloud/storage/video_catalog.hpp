/**
 * @file video_catalog.hpp
 * @brief Remote store of per-video records
 *
 * WHAT IT DOES:
 * - list, add and remove records
 * - protect a record from housekeeping, tag it with free text
 * - advance the bucket clock after each change so peers refresh
 */

#pragma once

#include "clipcloud/core/result.hpp"
#include "clipcloud/storage/signing_gateway.hpp"
#include "clipcloud/sync/change_detector.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace clipcloud::storage {

/**
 * @brief Video metadata records kept by the authority next to the objects
 *
 * Records are passed through untouched; their shape belongs to the UI.
 * Every successful mutation advances the bucket clock.
 */
class VideoCatalog {
public:
    VideoCatalog(SigningGateway& gateway, sync::ChangeDetector& detector);

    /**
     * @return JSON array of records
     */
    Result<nlohmann::json> list();

    Result<void> add(const nlohmann::json& record);
    Result<void> remove(const std::string& name);
    Result<void> protect(const std::string& name, bool is_protected);
    Result<void> tag(const std::string& name, const std::string& tag);

private:
    Result<void> mutate(network::HttpRequest request, const std::string& action);

    SigningGateway& gateway_;
    sync::ChangeDetector& detector_;
};

} // namespace clipcloud::storage
