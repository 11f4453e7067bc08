#include "stratus/agent/protocol.hpp"

#include <gtest/gtest.h>

using namespace stratus::agent;

TEST(AgentUriTest, ParsesHostAndPort) {
    auto endpoint = parse_agent_uri("http://10.0.0.4:5990/");
    ASSERT_TRUE(endpoint.is_ok());
    EXPECT_EQ(endpoint.value().host, "10.0.0.4");
    EXPECT_EQ(endpoint.value().port, 5990);
    EXPECT_EQ(endpoint.value().to_string(), "10.0.0.4:5990");
}

TEST(AgentUriTest, DefaultsPortAndScheme) {
    auto endpoint = parse_agent_uri("webvm.cloudapp.net");
    ASSERT_TRUE(endpoint.is_ok());
    EXPECT_EQ(endpoint.value().host, "webvm.cloudapp.net");
    EXPECT_EQ(endpoint.value().port, kDefaultAgentPort);
}

TEST(AgentUriTest, RejectsBadInput) {
    EXPECT_TRUE(parse_agent_uri("https://host:5986").is_error());
    EXPECT_TRUE(parse_agent_uri("http://host:port").is_error());
    EXPECT_TRUE(parse_agent_uri("http://host:70000").is_error());
    EXPECT_TRUE(parse_agent_uri("http://:5986").is_error());
}

TEST(ProtocolEnumsTest, ParseIsCaseInsensitive) {
    ASSERT_TRUE(parse_firewall_protocol("udp").is_ok());
    EXPECT_EQ(parse_firewall_protocol("udp").value(), FirewallProtocol::UDP);
    EXPECT_EQ(parse_sql_authentication_mode("Mixed").value(), SqlAuthenticationMode::Mixed);
    EXPECT_TRUE(parse_sql_authentication_mode("kerberos").is_error());
    EXPECT_EQ(to_string(SqlAuthenticationMode::Windows), "windows");
    EXPECT_EQ(to_string(FirewallProtocol::TCP), "TCP");
}

TEST(ProtocolPayloadTest, RemoteFileInfoFromJson) {
    RemoteFileInfo info{"/srv/site/app.zip", true, 2621440, 1700000000};
    auto decoded = remote_file_info_from_json(to_json(info));
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().path, info.path);
    EXPECT_TRUE(decoded.value().exists);
    EXPECT_EQ(decoded.value().size, 2621440u);

    EXPECT_TRUE(remote_file_info_from_json(nlohmann::json{{"exists", true}}).is_error());
}

TEST(ProtocolPayloadTest, FirewallRuleValidation) {
    auto rule = firewall_rule_from_json({{"name", "HTTP"}, {"port", 80}});
    ASSERT_TRUE(rule.is_ok());
    EXPECT_EQ(rule.value().protocol, FirewallProtocol::TCP);
    EXPECT_EQ(rule.value().port, 80);

    EXPECT_TRUE(firewall_rule_from_json({{"name", "HTTP"}, {"port", 0}}).is_error());
    EXPECT_TRUE(firewall_rule_from_json({{"name", ""}, {"port", 80}}).is_error());
    EXPECT_TRUE(firewall_rule_from_json({{"name", "x"}, {"port", 80}, {"protocol", "icmp"}}).is_error());
}

TEST(Base64Test, KnownVectors) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");

    EXPECT_EQ(base64_decode("Zm9vYg==").value_or(""), "foob");
    EXPECT_FALSE(base64_decode("Zm9").has_value());
    EXPECT_FALSE(base64_decode("Zm=v").has_value());
    EXPECT_FALSE(base64_decode("Zm9v!A==").has_value());
}

TEST(BasicAuthTest, HeaderRoundTrip) {
    const Credentials credentials{"deploy", "p@ss:word"};
    const auto header = basic_authorization(credentials);
    EXPECT_EQ(header.rfind("Basic ", 0), 0u);

    auto parsed = parse_basic_authorization(header);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->username, "deploy");
    EXPECT_EQ(parsed->password, "p@ss:word");

    EXPECT_FALSE(parse_basic_authorization("Bearer token").has_value());
    EXPECT_FALSE(parse_basic_authorization("Basic " + base64_encode("nocolon")).has_value());
}
