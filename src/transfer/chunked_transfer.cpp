#include "stratus/transfer/chunked_transfer.hpp"
#include "stratus/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <vector>

namespace stratus::transfer {
namespace fs = std::filesystem;

SegmentPlan plan_segments(std::uint64_t total_bytes, std::size_t segment_size) {
    SegmentPlan plan;
    if (segment_size == 0 || total_bytes == 0) {
        return plan;
    }
    plan.count = (total_bytes + segment_size - 1) / segment_size;
    const auto remainder = static_cast<std::size_t>(total_bytes % segment_size);
    plan.last_segment_size = remainder == 0 ? segment_size : remainder;
    return plan;
}

ChunkedFileTransfer::ChunkedFileTransfer(std::size_t segment_size, events::EventBus* bus)
    : segment_size_(segment_size)
    , bus_(bus) {
}

Result<agent::RemoteFileInfo> ChunkedFileTransfer::send_file(const fs::path& source,
                                                             const std::string& destination,
                                                             agent::RemoteSession& session,
                                                             const ProgressCallback& on_progress) const {
    auto result = stream_segments(source, destination, session, on_progress);
    if (result.is_error() && bus_) {
        bus_->emit(events::TransferFailedEvent{source.string(), destination, result.error()});
    }
    return result;
}

Result<agent::RemoteFileInfo> ChunkedFileTransfer::stream_segments(const fs::path& source,
                                                                   const std::string& destination,
                                                                   agent::RemoteSession& session,
                                                                   const ProgressCallback& on_progress) const {
    if (segment_size_ == 0) {
        return Err<agent::RemoteFileInfo>(std::string("segment_size must be > 0"));
    }

    // Everything about the source is checked before the agent is touched
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        return Err<agent::RemoteFileInfo>("Source file not found: " + source.string());
    }
    const std::uint64_t total_bytes = fs::file_size(source, ec);
    if (ec) {
        return Err<agent::RemoteFileInfo>("Failed to stat source file " + source.string() + ": " + ec.message());
    }

    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return Err<agent::RemoteFileInfo>("Failed to open source file: " + source.string());
    }

    const auto started_at = std::chrono::steady_clock::now();

    // One setup round trip: delete, create parents, resolve with the agent's rules
    auto resolved = session.reset_file(destination);
    if (resolved.is_error()) {
        return Forward<agent::RemoteFileInfo>(resolved, "Failed to prepare " + destination);
    }
    const std::string& remote_path = resolved.value();

    const SegmentPlan plan = plan_segments(total_bytes, segment_size_);
    if (bus_) {
        bus_->emit(events::TransferStartedEvent{source.string(), remote_path, total_bytes, plan.count});
    }

    std::vector<std::uint8_t> buffer(segment_size_);
    std::uint64_t bytes_sent = 0;
    std::uint64_t segment_index = 0;

    // Never read past the size measured before the reset
    while (input && bytes_sent < total_bytes) {
        const auto wanted = static_cast<std::size_t>(
            std::min<std::uint64_t>(segment_size_, total_bytes - bytes_sent));
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(wanted));
        const auto bytes_read = static_cast<std::size_t>(input.gcount());
        if (bytes_read == 0) {
            break;
        }

        // Never send bytes beyond what was read
        const bool trimmed = bytes_read < segment_size_;
        if (trimmed) {
            buffer.resize(bytes_read);
        }

        auto appended = session.append(remote_path, buffer);
        if (appended.is_error()) {
            return Forward<agent::RemoteFileInfo>(appended, "Segment " + std::to_string(segment_index + 1) +
                                                  "/" + std::to_string(plan.count) + " of " + source.string());
        }

        bytes_sent += bytes_read;

        TransferProgress progress;
        progress.segment_index = segment_index;
        progress.segment_count = plan.count;
        progress.segment_bytes = bytes_read;
        progress.bytes_sent = bytes_sent;
        progress.total_bytes = total_bytes;
        progress.percent = bytes_sent == total_bytes
            ? 100.0
            : static_cast<double>(bytes_sent) * 100.0 / static_cast<double>(total_bytes);

        if (on_progress) {
            on_progress(progress);
        }
        if (bus_) {
            bus_->emit(events::TransferProgressEvent{remote_path, progress.segment_index, progress.segment_count,
                                                     progress.segment_bytes, progress.bytes_sent,
                                                     progress.total_bytes, progress.percent});
        }

        if (trimmed) {
            buffer.resize(segment_size_);
        }
        ++segment_index;
    }

    if (input.bad()) {
        return Err<agent::RemoteFileInfo>("Read error on " + source.string() + " after " +
                                          std::to_string(bytes_sent) + " bytes");
    }
    const bool grew = bytes_sent == total_bytes &&
                      input.peek() != std::ifstream::traits_type::eof();
    input.close();

    if (grew) {
        return Err<agent::RemoteFileInfo>("Source " + source.string() + " changed during transfer: grew past " +
                                          std::to_string(total_bytes) + " bytes");
    }
    if (bytes_sent != total_bytes) {
        return Err<agent::RemoteFileInfo>("Source " + source.string() + " changed during transfer: read " +
                                          std::to_string(bytes_sent) + " of " + std::to_string(total_bytes) + " bytes");
    }

    // One verification round trip
    auto info = session.stat(remote_path);
    if (info.is_error()) {
        return Forward<agent::RemoteFileInfo>(info, "Failed to verify " + remote_path);
    }
    if (!info.value().exists) {
        return Err<agent::RemoteFileInfo>("Destination " + remote_path + " is missing after transfer");
    }
    if (info.value().size != total_bytes) {
        return Err<agent::RemoteFileInfo>("Destination " + remote_path + " has " + std::to_string(info.value().size) +
                                          " bytes, expected " + std::to_string(total_bytes));
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at);
    spdlog::debug("Transferred {} to {}:{} in {} segment(s)", source.string(), session.endpoint(), remote_path,
                  segment_index);
    if (bus_) {
        bus_->emit(events::TransferCompletedEvent{source.string(), remote_path, total_bytes, segment_index, duration});
    }

    return info;
}

} // namespace stratus::transfer
