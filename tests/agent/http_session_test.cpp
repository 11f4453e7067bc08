#include "stratus/agent/http_session.hpp"
#include "stratus/agent/routes.hpp"
#include "stratus/network/http_server.hpp"

#include <gtest/gtest.h>

#include <boost/asio.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;
using namespace stratus::agent;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("stratus_http_session_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

class RecordingRunner : public CommandRunner {
public:
    stratus::Result<CommandOutcome> run(const std::vector<std::string>& argv) override {
        calls.push_back(argv);
        return stratus::Ok(CommandOutcome{0, "done"});
    }

    std::vector<std::vector<std::string>> calls;
};

const Credentials kCredentials{"deploy", "secret"};

// A full agent on an ephemeral loopback port
class AgentOnLoopback {
public:
    AgentOnLoopback()
        : root_(create_temp_dir())
        , service_(root_, {{"install_product", {"webpi", "{product}"}}}, runner_)
        , server_(io_context_, "127.0.0.1", 0) {
        register_agent_routes(router_, service_, kCredentials);
        server_.set_handler([this](const stratus::network::HttpRequest& request) {
            return router_.handle_request(request);
        });
        thread_ = std::thread([this] { io_context_.run(); });
    }

    ~AgentOnLoopback() {
        io_context_.stop();
        thread_.join();
    }

    std::string uri() const { return "http://127.0.0.1:" + std::to_string(server_.port()); }
    const fs::path& root() const { return root_; }
    const RecordingRunner& runner() const { return runner_; }

private:
    fs::path root_;
    RecordingRunner runner_;
    AgentService service_;
    stratus::network::HttpRouter router_;
    boost::asio::io_context io_context_;
    stratus::network::HttpServer server_;
    std::thread thread_;
};

} // namespace

TEST(HttpAgentSessionTest, OpensAndStreamsFile) {
    AgentOnLoopback agent;
    HttpSessionFactory factory;

    auto opened = factory.open(agent.uri(), kCredentials);
    ASSERT_TRUE(opened.is_ok()) << opened.error();
    auto session = opened.take();
    EXPECT_TRUE(session->is_open());

    auto resolved = session->reset_file("upload/data.bin");
    ASSERT_TRUE(resolved.is_ok()) << resolved.error();

    const std::vector<std::uint8_t> first{'a', 'b', 'c'};
    const std::vector<std::uint8_t> second{0x00, 0xFF, 'z'};
    ASSERT_TRUE(session->append(resolved.value(), first).is_ok());
    auto size = session->append(resolved.value(), second);
    ASSERT_TRUE(size.is_ok()) << size.error();
    EXPECT_EQ(size.value(), 6u);

    auto info = session->stat(resolved.value());
    ASSERT_TRUE(info.is_ok());
    EXPECT_TRUE(info.value().exists);
    EXPECT_EQ(info.value().size, 6u);
    EXPECT_EQ(read_file(agent.root() / "upload" / "data.bin"), std::string("abc\0\xffz", 6));

    auto installed = session->install_product("WebMatrix");
    ASSERT_TRUE(installed.is_ok()) << installed.error();
    EXPECT_EQ(installed.value().output, "done");
    ASSERT_EQ(agent.runner().calls.size(), 1u);

    session->close();
    EXPECT_FALSE(session->is_open());
    EXPECT_TRUE(session->stat(resolved.value()).is_error());
}

TEST(HttpAgentSessionTest, WrongCredentialsFailHandshake) {
    AgentOnLoopback agent;
    HttpSessionFactory factory;

    auto opened = factory.open(agent.uri(), Credentials{"deploy", "wrong"});
    ASSERT_TRUE(opened.is_error());
    EXPECT_NE(opened.error().find("Invalid credentials"), std::string::npos);
}

TEST(HttpAgentSessionTest, AgentErrorsSurfaceAsMessages) {
    AgentOnLoopback agent;
    HttpSessionFactory factory;

    auto opened = factory.open(agent.uri(), kCredentials);
    ASSERT_TRUE(opened.is_ok()) << opened.error();
    auto session = opened.take();

    // Not in this agent's catalog
    auto firewall = session->add_firewall_rule(FirewallRule{"HTTP", FirewallProtocol::TCP, 80});
    ASSERT_TRUE(firewall.is_error());
    EXPECT_NE(firewall.error().find("not in the agent catalog"), std::string::npos);
}

TEST(HttpSessionFactoryTest, BadUriFailsWithoutConnecting) {
    HttpSessionFactory factory;
    EXPECT_TRUE(factory.open("ftp://host", kCredentials).is_error());
}
