/**
 * @file events.hpp
 * @brief Event types emitted during a deployment
 *
 * NAMING CONVENTION:
 * Events are past tense: TransferCompletedEvent, ResourceCreatedEvent
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace stratus::events {

// ════════════════════════════════════════════════════════
// Transfer Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once the destination has been reset, before the first segment
 */
struct TransferStartedEvent {
    std::string source;
    std::string destination;    ///< as resolved by the agent
    std::uint64_t total_bytes = 0;
    std::uint64_t segment_count = 0;
};

/**
 * @brief Emitted after every segment the agent acknowledged
 *
 * percent is non-decreasing over one transfer and is exactly 100 on the
 * last segment.
 */
struct TransferProgressEvent {
    std::string destination;
    std::uint64_t segment_index = 0;     ///< zero-based
    std::uint64_t segment_count = 0;
    std::size_t segment_bytes = 0;
    std::uint64_t bytes_sent = 0;
    std::uint64_t total_bytes = 0;
    double percent = 0.0;
};

struct TransferCompletedEvent {
    std::string source;
    std::string destination;
    std::uint64_t total_bytes = 0;
    std::uint64_t segment_count = 0;
    std::chrono::milliseconds duration{0};
};

struct TransferFailedEvent {
    std::string source;
    std::string destination;
    std::string error;
};

// ════════════════════════════════════════════════════════
// Convergence Events
// ════════════════════════════════════════════════════════

/**
 * @brief A missing resource was created (or a document updated)
 *
 * kind is one of "affinity-group", "network-site", "cloud-service",
 * "certificate", "virtual-machine".
 */
struct ResourceCreatedEvent {
    std::string kind;
    std::string name;
};

/**
 * @brief A resource exists with attributes other than the requested ones
 *
 * Soft failure: the resource is left untouched and the run continues.
 */
struct ResourceMismatchEvent {
    std::string kind;
    std::string name;
    std::string detail;
};

// ════════════════════════════════════════════════════════
// Pipeline Events
// ════════════════════════════════════════════════════════

struct StepStartedEvent {
    std::size_t index = 0;
    std::size_t total = 0;
    std::string name;
};

struct StepCompletedEvent {
    std::size_t index = 0;
    std::string name;
    std::chrono::milliseconds duration{0};
};

struct DeploymentCompletedEvent {
    std::string service;
    std::chrono::milliseconds duration{0};
};

struct DeploymentFailedEvent {
    std::string service;
    std::string step;
    std::string error;
};

} // namespace stratus::events
