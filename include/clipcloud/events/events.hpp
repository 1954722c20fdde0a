/**
 * @file events.hpp
 * @brief Event types published by the transfer engine
 *
 * WHY THIS FILE EXISTS:
 * One place that lists everything a subscriber can observe, so the bus
 * stays the only coupling between the engine and whoever draws progress
 * bars or counts bytes.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: UploadCompletedEvent, BucketChangedEvent
 */

#pragma once

#include "clipcloud/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace clipcloud::events {

// ════════════════════════════════════════════════════════
// Transfer Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once the upload path has been chosen
 *
 * WHO EMITS: TransferEngine
 * WHO SUBSCRIBES: Logger
 */
struct UploadStartedEvent {
    std::string key;
    std::uint64_t total_bytes;
    bool multipart;
    std::chrono::system_clock::time_point timestamp;

    UploadStartedEvent(std::string k, std::uint64_t bytes, bool is_multipart)
        : key(std::move(k)),
          total_bytes(bytes),
          multipart(is_multipart),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted after each part of a multi-part upload is accepted
 *
 * WHO EMITS: MultiPartUploader
 * WHO SUBSCRIBES: Logger (debug)
 */
struct PartUploadedEvent {
    std::string key;
    std::size_t part_index;   ///< 0-based
    std::size_t part_count;
    std::uint64_t bytes;
    std::string token;        ///< Part-completion token, quotes stripped
};

/**
 * @brief Emitted when an upload (single, multi-part or JSON) has succeeded
 *
 * WHO EMITS: TransferEngine
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct UploadCompletedEvent {
    std::string key;
    std::uint64_t total_bytes;
    std::size_t parts;        ///< 1 for single-part uploads
    std::chrono::milliseconds duration;
};

/**
 * @brief Emitted when a download has been fully written to disk
 */
struct DownloadCompletedEvent {
    std::string key;
    std::string destination;
    std::uint64_t total_bytes;
    std::chrono::milliseconds duration;
};

/**
 * @brief Emitted when an object was removed from the store
 */
struct ObjectDeletedEvent {
    std::string key;
};

/**
 * @brief Emitted when any transfer or mutation fails, before the error is returned
 */
struct TransferFailedEvent {
    std::string key;
    std::string operation;    ///< "upload", "download", "put-json", "delete"
    Error error;
};

// ════════════════════════════════════════════════════════
// Change Detection Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when polling sees the remote logical clock move
 *
 * At most one event per detected drift. Payload is informational: the
 * receiver is expected to re-fetch state, not to diff clocks.
 *
 * WHO EMITS: sync::ChangeDetector (polling thread)
 * WHO SUBSCRIBES: UI refresh, Logger, Metrics
 */
struct BucketChangedEvent {
    std::string bucket;
    std::string previous;
    std::string current;
};

/**
 * @brief Emitted when this process advanced the logical clock after a mutation
 */
struct ClockAdvancedEvent {
    std::string bucket;
    std::string value;
};

} // namespace clipcloud::events
