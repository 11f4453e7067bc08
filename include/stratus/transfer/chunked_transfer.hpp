#pragma once

#include "stratus/agent/session.hpp"
#include "stratus/core/result.hpp"
#include "stratus/events/event_bus.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace stratus::transfer {

struct TransferProgress {
    std::uint64_t segment_index = 0;
    std::uint64_t segment_count = 0;
    std::size_t segment_bytes = 0;
    std::uint64_t bytes_sent = 0;
    std::uint64_t total_bytes = 0;
    double percent = 0.0;
};

using ProgressCallback = std::function<void(const TransferProgress&)>;

/**
 * @brief How a file of total_bytes splits into segments of segment_size
 *
 * count = ceil(total / size); the last segment holds total mod size bytes,
 * or a full segment when that remainder is zero. An empty file has no
 * segments.
 */
struct SegmentPlan {
    std::uint64_t count = 0;
    std::size_t last_segment_size = 0;
};

SegmentPlan plan_segments(std::uint64_t total_bytes, std::size_t segment_size);

/**
 * @brief Streams a local file to an agent one segment per round trip
 *
 * The destination is reset once, then every segment is appended in source
 * order, then the destination is stat'ed and checked against the source
 * size. No retries: the first failing call aborts the transfer and whatever
 * was already appended stays on the remote side.
 */
class ChunkedFileTransfer {
public:
    static constexpr std::size_t kDefaultSegmentSize = 1024 * 1024;

    explicit ChunkedFileTransfer(std::size_t segment_size = kDefaultSegmentSize,
                                 events::EventBus* bus = nullptr);

    std::size_t segment_size() const noexcept { return segment_size_; }

    /**
     * @param destination path on the agent; relative paths use the agent's rules
     * @return the agent's view of the written file
     */
    Result<agent::RemoteFileInfo> send_file(const std::filesystem::path& source,
                                            const std::string& destination,
                                            agent::RemoteSession& session,
                                            const ProgressCallback& on_progress = {}) const;

private:
    Result<agent::RemoteFileInfo> stream_segments(const std::filesystem::path& source,
                                                  const std::string& destination,
                                                  agent::RemoteSession& session,
                                                  const ProgressCallback& on_progress) const;

    std::size_t segment_size_;
    events::EventBus* bus_;
};

} // namespace stratus::transfer
