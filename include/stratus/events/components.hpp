/**
 * @file components.hpp
 * @brief Event subscribers shipped with the deployer
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * ProgressComponent progress(bus);
 */

#pragma once

#include "stratus/events/event_bus.hpp"
#include "stratus/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace stratus::events {

/**
 * @brief Turns deployment events into log lines
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        bus.subscribe<TransferStartedEvent>([](const TransferStartedEvent& e) {
            spdlog::info("[Transfer] {} -> {} ({} bytes in {} segment(s))",
                e.source, e.destination, e.total_bytes, e.segment_count);
        });

        bus.subscribe<TransferProgressEvent>([](const TransferProgressEvent& e) {
            spdlog::info("[Transfer] {} segment {}/{} {:.1f}% ({}/{} bytes)",
                e.destination, e.segment_index + 1, e.segment_count, e.percent, e.bytes_sent, e.total_bytes);
        });

        bus.subscribe<TransferCompletedEvent>([](const TransferCompletedEvent& e) {
            spdlog::info("[Transfer] {} complete: {} bytes in {} ms",
                e.destination, e.total_bytes, e.duration.count());
        });

        bus.subscribe<TransferFailedEvent>([](const TransferFailedEvent& e) {
            spdlog::error("[Transfer] {} -> {} failed: {}", e.source, e.destination, e.error);
        });

        bus.subscribe<ResourceCreatedEvent>([](const ResourceCreatedEvent& e) {
            spdlog::info("[Resource] created {} '{}'", e.kind, e.name);
        });

        bus.subscribe<ResourceMismatchEvent>([](const ResourceMismatchEvent& e) {
            spdlog::warn("[Resource] {} '{}' differs from the request: {}", e.kind, e.name, e.detail);
        });

        bus.subscribe<StepStartedEvent>([](const StepStartedEvent& e) {
            spdlog::info("[Step {}/{}] {}", e.index + 1, e.total, e.name);
        });

        bus.subscribe<StepCompletedEvent>([](const StepCompletedEvent& e) {
            spdlog::debug("[Step {}] {} done in {} ms", e.index + 1, e.name, e.duration.count());
        });

        bus.subscribe<DeploymentCompletedEvent>([](const DeploymentCompletedEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Deployment of '{}' completed in {} ms", e.service, e.duration.count());
            spdlog::info("════════════════════════════════════════════");
        });

        bus.subscribe<DeploymentFailedEvent>([](const DeploymentFailedEvent& e) {
            spdlog::error("Deployment of '{}' failed at step '{}': {}", e.service, e.step, e.error);
        });
    }
};

/**
 * @brief Counters over one deployer run
 */
class ProgressComponent {
public:
    struct Stats {
        std::atomic<uint64_t> transfers_started{0};
        std::atomic<uint64_t> transfers_completed{0};
        std::atomic<uint64_t> transfers_failed{0};
        std::atomic<uint64_t> segments_sent{0};
        std::atomic<uint64_t> bytes_sent{0};
        std::atomic<uint64_t> resources_created{0};
        std::atomic<uint64_t> mismatches{0};
        std::atomic<uint64_t> steps_completed{0};
    };

    explicit ProgressComponent(EventBus& bus) {
        bus.subscribe<TransferStartedEvent>([this](const TransferStartedEvent&) {
            stats_.transfers_started++;
        });

        bus.subscribe<TransferProgressEvent>([this](const TransferProgressEvent& e) {
            stats_.segments_sent++;
            stats_.bytes_sent += e.segment_bytes;
            std::lock_guard lock(mutex_);
            last_percent_ = e.percent;
        });

        bus.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent&) {
            stats_.transfers_completed++;
        });

        bus.subscribe<TransferFailedEvent>([this](const TransferFailedEvent&) {
            stats_.transfers_failed++;
        });

        bus.subscribe<ResourceCreatedEvent>([this](const ResourceCreatedEvent&) {
            stats_.resources_created++;
        });

        bus.subscribe<ResourceMismatchEvent>([this](const ResourceMismatchEvent&) {
            stats_.mismatches++;
        });

        bus.subscribe<StepCompletedEvent>([this](const StepCompletedEvent&) {
            stats_.steps_completed++;
        });
    }

    const Stats& get_stats() const { return stats_; }

    double last_percent() const {
        std::lock_guard lock(mutex_);
        return last_percent_;
    }

    void log_summary() const {
        spdlog::info("Summary: {} resource(s) created, {} mismatch warning(s), {} transfer(s) ({} bytes, {} segments), {} failed",
            stats_.resources_created.load(),
            stats_.mismatches.load(),
            stats_.transfers_completed.load(),
            stats_.bytes_sent.load(),
            stats_.segments_sent.load(),
            stats_.transfers_failed.load());
    }

private:
    Stats stats_;
    mutable std::mutex mutex_;
    double last_percent_ = 0.0;
};

} // namespace stratus::events
