#include "stratus/cloud/state_cloud.hpp"
#include "stratus/netcfg/network_config.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace stratus::cloud;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("stratus_state_cloud_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string network_with_subnet() {
    stratus::netcfg::SiteRequest request;
    request.name = "webapp-vnet";
    request.affinity_group = "webapp-ag";
    request.subnet_name = "webappsubnet";
    return stratus::netcfg::serialize_network_config(
        stratus::netcfg::merge_site(stratus::netcfg::blank_network_config(), request));
}

VirtualMachineSpec sql_spec() {
    VirtualMachineSpec spec;
    spec.service = "webapp";
    spec.role_name = "sql";
    spec.host_name = "webapp-sql";
    spec.image = "sql-2012-image";
    spec.size = "Medium";
    spec.admin_username = "operator";
    spec.admin_password = "s3cret!";
    spec.virtual_network = "webapp-vnet";
    spec.subnet = "webappsubnet";
    spec.endpoints = {InputEndpoint{"sql", "tcp", 0, 1433}};
    return spec;
}

} // namespace

class JsonStateCloudTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto opened = JsonStateCloud::open("");
        ASSERT_TRUE(opened.is_ok()) << opened.error();
        cloud_ = opened.take();
    }

    void create_service() {
        ASSERT_TRUE(cloud_->create_affinity_group({"webapp-ag", "West US", "webapp"}).is_ok());
        ASSERT_TRUE(cloud_->create_cloud_service({"webapp", "webapp-ag", "webapp"}).is_ok());
    }

    std::unique_ptr<JsonStateCloud> cloud_;
};

TEST_F(JsonStateCloudTest, AbsentResourcesAreEmptyNotErrors) {
    auto group = cloud_->get_affinity_group("nope");
    ASSERT_TRUE(group.is_ok());
    EXPECT_FALSE(group.value().has_value());

    auto config = cloud_->get_network_config();
    ASSERT_TRUE(config.is_ok());
    EXPECT_FALSE(config.value().has_value());

    auto vm = cloud_->get_virtual_machine("webapp", "sql");
    ASSERT_TRUE(vm.is_ok());
    EXPECT_FALSE(vm.value().has_value());
}

TEST_F(JsonStateCloudTest, AffinityGroupCreateThenGet) {
    ASSERT_TRUE(cloud_->create_affinity_group({"webapp-ag", "West US", "label"}).is_ok());
    auto group = cloud_->get_affinity_group("webapp-ag");
    ASSERT_TRUE(group.is_ok());
    ASSERT_TRUE(group.value().has_value());
    EXPECT_EQ(group.value()->location, "West US");
    EXPECT_EQ(group.value()->label, "label");

    auto duplicate = cloud_->create_affinity_group({"webapp-ag", "East US", ""});
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_NE(duplicate.error().find("already exists"), std::string::npos);
    EXPECT_TRUE(cloud_->create_affinity_group({"", "West US", ""}).is_error());
}

TEST_F(JsonStateCloudTest, CloudServiceNeedsItsAffinityGroup) {
    auto orphan = cloud_->create_cloud_service({"webapp", "missing-ag", ""});
    ASSERT_TRUE(orphan.is_error());
    EXPECT_NE(orphan.error().find("missing-ag"), std::string::npos);

    create_service();
    auto duplicate = cloud_->create_cloud_service({"webapp", "webapp-ag", ""});
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_NE(duplicate.error().find("already exists"), std::string::npos);
}

TEST_F(JsonStateCloudTest, NetworkConfigIsValidatedBeforeStoring) {
    EXPECT_TRUE(cloud_->set_network_config("<not-xml").is_error());

    // The site references an affinity group that does not exist yet
    EXPECT_TRUE(cloud_->set_network_config(network_with_subnet()).is_error());
    EXPECT_FALSE(cloud_->get_network_config().value().has_value());

    ASSERT_TRUE(cloud_->create_affinity_group({"webapp-ag", "West US", ""}).is_ok());
    ASSERT_TRUE(cloud_->set_network_config(network_with_subnet()).is_ok());
    auto stored = cloud_->get_network_config();
    ASSERT_TRUE(stored.is_ok());
    ASSERT_TRUE(stored.value().has_value());
    EXPECT_EQ(*stored.value(), network_with_subnet());
}

TEST_F(JsonStateCloudTest, CertificatesNeedServiceAndUniqueThumbprint) {
    Certificate certificate;
    certificate.service = "webapp";
    certificate.thumbprint = "A9993E364706816ABA3E25717850C26C9CD0D89D";
    certificate.data = "YWJj";
    certificate.password = "pfx-password";

    EXPECT_TRUE(cloud_->add_certificate(certificate).is_error());

    create_service();
    ASSERT_TRUE(cloud_->add_certificate(certificate).is_ok());
    EXPECT_TRUE(cloud_->add_certificate(certificate).is_error());

    const auto& stored = cloud_->state()["certificates"];
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_FALSE(stored[0].contains("password"));
    EXPECT_EQ(stored[0]["format"], "pfx");
}

TEST_F(JsonStateCloudTest, VirtualMachineNeedsExistingSubnet) {
    create_service();

    auto no_network = cloud_->create_virtual_machine(sql_spec());
    ASSERT_TRUE(no_network.is_error());
    EXPECT_NE(no_network.error().find("no network configuration"), std::string::npos);

    ASSERT_TRUE(cloud_->set_network_config(network_with_subnet()).is_ok());

    auto wrong_subnet = sql_spec();
    wrong_subnet.subnet = "elsewhere";
    EXPECT_TRUE(cloud_->create_virtual_machine(wrong_subnet).is_error());

    auto wrong_network = sql_spec();
    wrong_network.virtual_network = "other-vnet";
    EXPECT_TRUE(cloud_->create_virtual_machine(wrong_network).is_error());

    auto created = cloud_->create_virtual_machine(sql_spec());
    ASSERT_TRUE(created.is_ok()) << created.error();

    auto vm = cloud_->get_virtual_machine("webapp", "sql");
    ASSERT_TRUE(vm.is_ok());
    ASSERT_TRUE(vm.value().has_value());
    EXPECT_EQ(vm.value()->host_name, "webapp-sql");
    EXPECT_EQ(vm.value()->status, "ReadyRole");
    ASSERT_EQ(vm.value()->endpoints.size(), 1u);
    EXPECT_EQ(vm.value()->endpoints[0].local_port, 1433);

    auto duplicate = cloud_->create_virtual_machine(sql_spec());
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_NE(duplicate.error().find("already exists"), std::string::npos);
}

TEST_F(JsonStateCloudTest, VirtualMachineNeedsCredentialsAndService) {
    auto orphan = sql_spec();
    orphan.service = "nowhere";
    EXPECT_TRUE(cloud_->create_virtual_machine(orphan).is_error());

    create_service();
    auto no_password = sql_spec();
    no_password.subnet.clear();
    no_password.admin_password.clear();
    EXPECT_TRUE(cloud_->create_virtual_machine(no_password).is_error());
}

TEST(JsonStateCloudPersistenceTest, StateSurvivesReopen) {
    const auto dir = create_temp_dir();
    const auto path = dir / "state.json";

    {
        auto opened = JsonStateCloud::open(path);
        ASSERT_TRUE(opened.is_ok()) << opened.error();
        auto cloud = opened.take();
        ASSERT_TRUE(cloud->create_affinity_group({"webapp-ag", "West US", ""}).is_ok());
        ASSERT_TRUE(cloud->create_cloud_service({"webapp", "webapp-ag", ""}).is_ok());
        ASSERT_TRUE(cloud->set_network_config(network_with_subnet()).is_ok());
    }
    EXPECT_TRUE(fs::exists(path));
    EXPECT_FALSE(fs::exists(dir / "state.json.tmp"));

    auto reopened = JsonStateCloud::open(path);
    ASSERT_TRUE(reopened.is_ok()) << reopened.error();
    auto cloud = reopened.take();
    EXPECT_TRUE(cloud->get_cloud_service("webapp").value().has_value());
    EXPECT_TRUE(cloud->get_network_config().value().has_value());
    EXPECT_TRUE(cloud->create_cloud_service({"webapp", "webapp-ag", ""}).is_error());
}

TEST(JsonStateCloudPersistenceTest, RejectsCorruptStateFile) {
    const auto dir = create_temp_dir();
    const auto path = dir / "state.json";
    {
        std::ofstream out(path);
        out << "{ this is not json";
    }
    EXPECT_TRUE(JsonStateCloud::open(path).is_error());

    {
        std::ofstream out(path, std::ios::trunc);
        out << "[1, 2, 3]";
    }
    EXPECT_TRUE(JsonStateCloud::open(path).is_error());
}

TEST(JsonStateCloudPersistenceTest, PartialStateFileFillsMissingCollections) {
    const auto dir = create_temp_dir();
    const auto path = dir / "state.json";
    {
        std::ofstream out(path);
        out << R"({"affinity_groups": [{"name": "webapp-ag", "location": "West US", "label": ""}]})";
    }
    auto opened = JsonStateCloud::open(path);
    ASSERT_TRUE(opened.is_ok()) << opened.error();
    auto cloud = opened.take();
    EXPECT_TRUE(cloud->get_affinity_group("webapp-ag").value().has_value());
    EXPECT_TRUE(cloud->create_cloud_service({"webapp", "webapp-ag", ""}).is_ok());
}

TEST(JsonStateCloudPersistenceTest, RejectsWrongTypedCollections) {
    const auto dir = create_temp_dir();
    const auto path = dir / "state.json";

    const std::vector<std::pair<std::string, std::string>> cases{
        {R"({"network_config": 42})", "network_config"},
        {R"({"affinity_groups": {}})", "affinity_groups"},
        {R"({"virtual_machines": "none"})", "virtual_machines"},
    };
    for (const auto& [content, key] : cases) {
        {
            std::ofstream out(path, std::ios::trunc);
            out << content;
        }
        auto opened = JsonStateCloud::open(path);
        ASSERT_TRUE(opened.is_error()) << content;
        EXPECT_NE(opened.error().find(key), std::string::npos) << opened.error();
    }
}

TEST(JsonStateCloudPersistenceTest, MalformedEntriesReadAsAbsent) {
    const auto dir = create_temp_dir();
    const auto path = dir / "state.json";
    {
        std::ofstream out(path);
        out << R"({
            "affinity_groups": [7, {"name": 5}, {"name": "webapp-ag", "location": ["West US"]}],
            "cloud_services": [{"name": "webapp", "affinity_group": "webapp-ag"}],
            "certificates": ["broken"],
            "virtual_machines": [null, {"service": "webapp", "role_name": "sql",
                                        "endpoints": [3, {"name": "sql", "local_port": "1433"}]}]
        })";
    }
    auto opened = JsonStateCloud::open(path);
    ASSERT_TRUE(opened.is_ok()) << opened.error();
    auto cloud = opened.take();

    auto group = cloud->get_affinity_group("webapp-ag");
    ASSERT_TRUE(group.is_ok());
    ASSERT_TRUE(group.value().has_value());
    EXPECT_TRUE(group.value()->location.empty());

    Certificate certificate;
    certificate.service = "webapp";
    certificate.thumbprint = "A9993E364706816ABA3E25717850C26C9CD0D89D";
    certificate.data = "YWJj";
    EXPECT_TRUE(cloud->add_certificate(certificate).is_ok());

    auto vm = cloud->get_virtual_machine("webapp", "sql");
    ASSERT_TRUE(vm.is_ok());
    ASSERT_TRUE(vm.value().has_value());
    ASSERT_EQ(vm.value()->endpoints.size(), 1u);
    EXPECT_EQ(vm.value()->endpoints[0].local_port, 0);
}
