#include "stratus/agent/local_session.hpp"
#include "stratus/events/components.hpp"
#include "stratus/transfer/chunked_transfer.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace stratus::agent;
using stratus::transfer::ChunkedFileTransfer;
using stratus::transfer::TransferProgress;
using stratus::transfer::plan_segments;

namespace {

constexpr std::size_t kMiB = 1024 * 1024;

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("stratus_transfer_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string patterned_content(std::size_t size) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 31 + i / 7) & 0xFF);
    }
    return data;
}

fs::path write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    return path;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

class NullRunner : public CommandRunner {
public:
    stratus::Result<CommandOutcome> run(const std::vector<std::string>&) override {
        return stratus::Err<CommandOutcome>("no commands in this test");
    }
};

// In-memory agent that records every round trip
class RecordingSession : public RemoteSession {
public:
    const std::string& endpoint() const override { return name_; }
    bool is_open() const override { return true; }

    stratus::Result<std::string> reset_file(const std::string& path) override {
        calls.push_back("reset " + path);
        content.clear();
        return stratus::Ok("/remote/" + path);
    }

    stratus::Result<std::string> resolve_path(const std::string& path) override {
        calls.push_back("resolve " + path);
        return stratus::Ok("/remote/" + path);
    }

    stratus::Result<std::uint64_t> append(const std::string& path, const std::vector<std::uint8_t>& bytes) override {
        calls.push_back("append " + path);
        segment_sizes.push_back(bytes.size());
        if (on_append) {
            on_append();
        }
        if (fail_on_append && segment_sizes.size() == *fail_on_append) {
            return stratus::Err<std::uint64_t>("connection reset by peer");
        }
        content.insert(content.end(), bytes.begin(), bytes.end());
        return stratus::Ok(static_cast<std::uint64_t>(content.size()));
    }

    stratus::Result<RemoteFileInfo> stat(const std::string& path) override {
        calls.push_back("stat " + path);
        RemoteFileInfo info;
        info.path = path;
        info.exists = true;
        info.size = reported_size.value_or(content.size());
        return stratus::Ok(info);
    }

    stratus::Result<CommandOutcome> install_product(const std::string&) override {
        return stratus::Err<CommandOutcome>("unsupported");
    }
    stratus::Result<CommandOutcome> add_firewall_rule(const FirewallRule&) override {
        return stratus::Err<CommandOutcome>("unsupported");
    }
    stratus::Result<CommandOutcome> set_sql_authentication(SqlAuthenticationMode, const std::string&) override {
        return stratus::Err<CommandOutcome>("unsupported");
    }

    void close() override {}

    std::vector<std::string> calls;
    std::vector<std::size_t> segment_sizes;
    std::vector<std::uint8_t> content;
    std::optional<std::size_t> fail_on_append;
    std::optional<std::uint64_t> reported_size;
    std::function<void()> on_append;

private:
    std::string name_ = "recording";
};

} // namespace

TEST(SegmentPlanTest, SplitsIntoNominalSegments) {
    auto plan = plan_segments(2 * kMiB + kMiB / 2, kMiB);
    EXPECT_EQ(plan.count, 3u);
    EXPECT_EQ(plan.last_segment_size, kMiB / 2);

    auto exact = plan_segments(3 * kMiB, kMiB);
    EXPECT_EQ(exact.count, 3u);
    EXPECT_EQ(exact.last_segment_size, kMiB);

    auto empty = plan_segments(0, kMiB);
    EXPECT_EQ(empty.count, 0u);

    auto tiny = plan_segments(1, kMiB);
    EXPECT_EQ(tiny.count, 1u);
    EXPECT_EQ(tiny.last_segment_size, 1u);
}

TEST(ChunkedFileTransferTest, DefaultSegmentIsOneMiB) {
    ChunkedFileTransfer transfer;
    EXPECT_EQ(transfer.segment_size(), kMiB);
}

TEST(ChunkedFileTransferTest, StreamsTwoAndAHalfMiBInThreeSegments) {
    const auto dir = create_temp_dir();
    const std::string data = patterned_content(2 * kMiB + kMiB / 2);
    const auto source = write_file(dir / "app.zip", data);

    RecordingSession session;
    std::vector<TransferProgress> progress;
    ChunkedFileTransfer transfer;

    auto result = transfer.send_file(source, "site/app.zip", session,
                                     [&](const TransferProgress& p) { progress.push_back(p); });
    ASSERT_TRUE(result.is_ok()) << result.error();

    const std::vector<std::string> expected_calls{
        "reset site/app.zip",
        "append /remote/site/app.zip",
        "append /remote/site/app.zip",
        "append /remote/site/app.zip",
        "stat /remote/site/app.zip",
    };
    EXPECT_EQ(session.calls, expected_calls);
    EXPECT_EQ(session.segment_sizes, (std::vector<std::size_t>{kMiB, kMiB, kMiB / 2}));
    EXPECT_EQ(std::string(session.content.begin(), session.content.end()), data);

    EXPECT_TRUE(result.value().exists);
    EXPECT_EQ(result.value().size, data.size());
    EXPECT_EQ(result.value().path, "/remote/site/app.zip");

    ASSERT_EQ(progress.size(), 3u);
    EXPECT_NEAR(progress[0].percent, 40.0, 1e-9);
    EXPECT_NEAR(progress[1].percent, 80.0, 1e-9);
    EXPECT_DOUBLE_EQ(progress[2].percent, 100.0);
    EXPECT_EQ(progress[2].bytes_sent, data.size());
    EXPECT_EQ(progress[2].segment_count, 3u);
}

TEST(ChunkedFileTransferTest, ExactMultipleHasNoShortSegment) {
    const auto dir = create_temp_dir();
    const auto source = write_file(dir / "exact.bin", patterned_content(3 * 4096));

    RecordingSession session;
    ChunkedFileTransfer transfer(4096);
    auto result = transfer.send_file(source, "exact.bin", session);
    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(session.segment_sizes, (std::vector<std::size_t>{4096, 4096, 4096}));
    EXPECT_EQ(session.calls.size(), 5u);
}

TEST(ChunkedFileTransferTest, EmptySourceResetsAndVerifiesOnly) {
    const auto dir = create_temp_dir();
    const auto source = write_file(dir / "empty.txt", "");

    RecordingSession session;
    std::size_t progress_calls = 0;
    ChunkedFileTransfer transfer;
    auto result = transfer.send_file(source, "empty.txt", session,
                                     [&](const TransferProgress&) { ++progress_calls; });
    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(session.calls, (std::vector<std::string>{"reset empty.txt", "stat /remote/empty.txt"}));
    EXPECT_EQ(progress_calls, 0u);
    EXPECT_EQ(result.value().size, 0u);
}

TEST(ChunkedFileTransferTest, MissingSourceFailsBeforeAnyRemoteCall) {
    const auto dir = create_temp_dir();
    RecordingSession session;
    ChunkedFileTransfer transfer;

    auto result = transfer.send_file(dir / "does-not-exist.bin", "x.bin", session);
    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().find("not found"), std::string::npos);
    EXPECT_TRUE(session.calls.empty());

    auto directory = transfer.send_file(dir, "x.bin", session);
    ASSERT_TRUE(directory.is_error());
    EXPECT_TRUE(session.calls.empty());
}

TEST(ChunkedFileTransferTest, FailedSegmentAbortsWithoutVerification) {
    const auto dir = create_temp_dir();
    const auto source = write_file(dir / "big.bin", patterned_content(5 * 1024));

    RecordingSession session;
    session.fail_on_append = 2;
    stratus::events::EventBus bus;
    stratus::events::ProgressComponent counters(bus);
    ChunkedFileTransfer transfer(1024, &bus);

    auto result = transfer.send_file(source, "big.bin", session);
    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().find("connection reset by peer"), std::string::npos);
    EXPECT_NE(result.error().find("Segment 2/5"), std::string::npos);

    // reset + two appends, no retry and no stat
    EXPECT_EQ(session.calls.size(), 3u);
    EXPECT_EQ(session.content.size(), 1024u);
    EXPECT_EQ(counters.get_stats().transfers_failed.load(), 1u);
    EXPECT_EQ(counters.get_stats().transfers_completed.load(), 0u);
}

TEST(ChunkedFileTransferTest, SizeMismatchOnVerificationFails) {
    const auto dir = create_temp_dir();
    const auto source = write_file(dir / "file.bin", patterned_content(100));

    RecordingSession session;
    session.reported_size = 99;
    ChunkedFileTransfer transfer(64);
    auto result = transfer.send_file(source, "file.bin", session);
    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().find("expected 100"), std::string::npos);
}

TEST(ChunkedFileTransferTest, ZeroSegmentSizeIsRejected) {
    const auto dir = create_temp_dir();
    const auto source = write_file(dir / "file.bin", "abc");

    RecordingSession session;
    ChunkedFileTransfer transfer(0);
    EXPECT_TRUE(transfer.send_file(source, "file.bin", session).is_error());
    EXPECT_TRUE(session.calls.empty());
}

TEST(ChunkedFileTransferTest, ProgressIsMonotonicAndEventsFollow) {
    const auto dir = create_temp_dir();
    const auto source = write_file(dir / "odd.bin", patterned_content(10 * 1000 + 7));

    RecordingSession session;
    stratus::events::EventBus bus;
    stratus::events::ProgressComponent counters(bus);
    std::vector<double> percents;
    ChunkedFileTransfer transfer(1000, &bus);

    auto result = transfer.send_file(source, "odd.bin", session,
                                     [&](const TransferProgress& p) { percents.push_back(p.percent); });
    ASSERT_TRUE(result.is_ok()) << result.error();
    ASSERT_EQ(percents.size(), 11u);
    for (std::size_t i = 1; i < percents.size(); ++i) {
        EXPECT_GT(percents[i], percents[i - 1]);
    }
    EXPECT_DOUBLE_EQ(percents.back(), 100.0);

    const auto& stats = counters.get_stats();
    EXPECT_EQ(stats.transfers_started.load(), 1u);
    EXPECT_EQ(stats.transfers_completed.load(), 1u);
    EXPECT_EQ(stats.segments_sent.load(), 11u);
    EXPECT_EQ(stats.bytes_sent.load(), 10u * 1000u + 7u);
    EXPECT_DOUBLE_EQ(counters.last_percent(), 100.0);
}

TEST(ChunkedFileTransferTest, RepeatedTransferOverwritesThroughAgent) {
    const auto source_dir = create_temp_dir();
    const auto agent_root = create_temp_dir();
    NullRunner runner;
    AgentService service(agent_root, {}, runner);
    LocalAgentSession session(service);
    ChunkedFileTransfer transfer(1000);

    const std::string data = patterned_content(4321);
    const auto source = write_file(source_dir / "payload.bin", data);

    // Stale, longer content at the destination must not survive
    fs::create_directories(agent_root / "deep" / "dir");
    write_file(agent_root / "deep" / "dir" / "payload.bin", std::string(10000, 'x'));

    for (int run = 0; run < 2; ++run) {
        auto result = transfer.send_file(source, "deep/dir/payload.bin", session);
        ASSERT_TRUE(result.is_ok()) << result.error();
        EXPECT_EQ(result.value().size, data.size());
        EXPECT_EQ(read_file(agent_root / "deep" / "dir" / "payload.bin"), data);
    }
}

TEST(ChunkedFileTransferTest, CreatesMissingParentDirectories) {
    const auto source_dir = create_temp_dir();
    const auto agent_root = create_temp_dir();
    NullRunner runner;
    AgentService service(agent_root, {}, runner);
    LocalAgentSession session(service);

    const auto source = write_file(source_dir / "empty.cfg", "");
    ChunkedFileTransfer transfer;
    auto result = transfer.send_file(source, "new/nested/empty.cfg", session);
    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_TRUE(result.value().exists);
    EXPECT_TRUE(fs::exists(agent_root / "new" / "nested" / "empty.cfg"));
}

TEST(ChunkedFileTransferTest, GrowingSourceNeverSendsExtraBytes) {
    const auto dir = create_temp_dir();
    const auto source = write_file(dir / "log.bin", patterned_content(2048));

    RecordingSession session;
    bool grown = false;
    session.on_append = [&] {
        if (!grown) {
            std::ofstream out(source, std::ios::binary | std::ios::app);
            out << std::string(1500, 'g');
            grown = true;
        }
    };
    std::vector<double> percents;
    ChunkedFileTransfer transfer(1024);

    auto result = transfer.send_file(source, "log.bin", session,
                                     [&](const TransferProgress& p) { percents.push_back(p.percent); });
    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().find("changed during transfer"), std::string::npos);

    EXPECT_EQ(session.segment_sizes, (std::vector<std::size_t>{1024, 1024}));
    EXPECT_EQ(session.content.size(), 2048u);
    ASSERT_EQ(percents.size(), 2u);
    EXPECT_DOUBLE_EQ(percents.back(), 100.0);
    EXPECT_EQ(session.calls.back(), "append /remote/log.bin");
}
