#include "stratus/cloud/convergence.hpp"
#include "stratus/cloud/state_cloud.hpp"
#include "stratus/events/components.hpp"

#include <gtest/gtest.h>

using namespace stratus::cloud;
using stratus::netcfg::SiteRequest;

namespace {

// Delegates to an in-memory state cloud and counts the mutations
class CountingCloud : public CloudApi {
public:
    CountingCloud() : inner_(JsonStateCloud::open("").take()) {}

    stratus::Result<std::optional<AffinityGroup>> get_affinity_group(const std::string& name) override {
        return inner_->get_affinity_group(name);
    }
    stratus::Result<void> create_affinity_group(const AffinityGroup& group) override {
        ++affinity_group_creates;
        return inner_->create_affinity_group(group);
    }
    stratus::Result<std::optional<std::string>> get_network_config() override {
        if (fail_network_fetch) {
            return stratus::Err<std::optional<std::string>>("management endpoint unavailable");
        }
        return inner_->get_network_config();
    }
    stratus::Result<void> set_network_config(const std::string& xml) override {
        ++network_pushes;
        return inner_->set_network_config(xml);
    }
    stratus::Result<std::optional<CloudService>> get_cloud_service(const std::string& name) override {
        return inner_->get_cloud_service(name);
    }
    stratus::Result<void> create_cloud_service(const CloudService& service) override {
        return inner_->create_cloud_service(service);
    }
    stratus::Result<void> add_certificate(const Certificate& certificate) override {
        return inner_->add_certificate(certificate);
    }
    stratus::Result<std::optional<VirtualMachine>> get_virtual_machine(const std::string& service,
                                                                      const std::string& role_name) override {
        return inner_->get_virtual_machine(service, role_name);
    }
    stratus::Result<void> create_virtual_machine(const VirtualMachineSpec& spec) override {
        return inner_->create_virtual_machine(spec);
    }

    int affinity_group_creates = 0;
    int network_pushes = 0;
    bool fail_network_fetch = false;

private:
    std::unique_ptr<JsonStateCloud> inner_;
};

SiteRequest site_request() {
    SiteRequest request;
    request.name = "webapp-vnet";
    request.affinity_group = "webapp-ag";
    request.subnet_name = "webappsubnet";
    return request;
}

} // namespace

TEST(ConvergenceOutcomeTest, Names) {
    EXPECT_STREQ(to_string(ConvergenceOutcome::Created), "created");
    EXPECT_STREQ(to_string(ConvergenceOutcome::Updated), "updated");
    EXPECT_STREQ(to_string(ConvergenceOutcome::Unchanged), "unchanged");
    EXPECT_STREQ(to_string(ConvergenceOutcome::Mismatch), "mismatch");
}

TEST(EnsureAffinityGroupTest, CreatesOnceThenLeavesAlone) {
    CountingCloud cloud;
    stratus::events::EventBus bus;
    stratus::events::ProgressComponent progress(bus);

    auto first = ensure_affinity_group(cloud, {"webapp-ag", "West US", "webapp"}, &bus);
    ASSERT_TRUE(first.is_ok()) << first.error();
    EXPECT_EQ(first.value(), ConvergenceOutcome::Created);

    auto second = ensure_affinity_group(cloud, {"webapp-ag", "West US", "webapp"}, &bus);
    ASSERT_TRUE(second.is_ok()) << second.error();
    EXPECT_EQ(second.value(), ConvergenceOutcome::Unchanged);

    EXPECT_EQ(cloud.affinity_group_creates, 1);
    EXPECT_EQ(progress.get_stats().resources_created.load(), 1u);
}

TEST(EnsureAffinityGroupTest, LocationMismatchWarnsWithoutMutating) {
    CountingCloud cloud;
    ASSERT_TRUE(cloud.create_affinity_group({"webapp-ag", "East US", ""}).is_ok());

    stratus::events::EventBus bus;
    std::string detail;
    bus.subscribe<stratus::events::ResourceMismatchEvent>(
        [&detail](const stratus::events::ResourceMismatchEvent& e) { detail = e.detail; });

    auto outcome = ensure_affinity_group(cloud, {"webapp-ag", "West US", ""}, &bus);
    ASSERT_TRUE(outcome.is_ok()) << outcome.error();
    EXPECT_EQ(outcome.value(), ConvergenceOutcome::Mismatch);
    EXPECT_EQ(cloud.affinity_group_creates, 1);
    EXPECT_NE(detail.find("East US"), std::string::npos);
    EXPECT_NE(detail.find("West US"), std::string::npos);

    auto group = cloud.get_affinity_group("webapp-ag");
    EXPECT_EQ(group.value()->location, "East US");
}

TEST(EnsureNetworkSiteTest, BootstrapsMissingDocument) {
    CountingCloud cloud;
    ASSERT_TRUE(cloud.create_affinity_group({"webapp-ag", "West US", ""}).is_ok());

    stratus::events::EventBus bus;
    stratus::events::ProgressComponent progress(bus);
    auto outcome = ensure_network_site(cloud, site_request(), &bus);
    ASSERT_TRUE(outcome.is_ok()) << outcome.error();
    EXPECT_EQ(outcome.value(), ConvergenceOutcome::Created);
    EXPECT_EQ(cloud.network_pushes, 1);
    EXPECT_EQ(progress.get_stats().resources_created.load(), 1u);

    auto xml = cloud.get_network_config();
    ASSERT_TRUE(xml.is_ok());
    ASSERT_TRUE(xml.value().has_value());
    auto parsed = stratus::netcfg::parse_network_config(*xml.value());
    ASSERT_TRUE(parsed.is_ok()) << parsed.error();
    const auto* site = parsed.value().find_site("webapp-vnet");
    ASSERT_NE(site, nullptr);
    ASSERT_EQ(site->subnets.size(), 1u);
    EXPECT_EQ(site->subnets[0].address_prefix, "10.0.0.0/8");
}

TEST(EnsureNetworkSiteTest, SecondRunPushesNothing) {
    CountingCloud cloud;
    ASSERT_TRUE(cloud.create_affinity_group({"webapp-ag", "West US", ""}).is_ok());

    ASSERT_TRUE(ensure_network_site(cloud, site_request()).is_ok());
    auto again = ensure_network_site(cloud, site_request());
    ASSERT_TRUE(again.is_ok()) << again.error();
    EXPECT_EQ(again.value(), ConvergenceOutcome::Unchanged);
    EXPECT_EQ(cloud.network_pushes, 1);
}

TEST(EnsureNetworkSiteTest, ChangedSubnetUpdatesExistingSite) {
    CountingCloud cloud;
    ASSERT_TRUE(cloud.create_affinity_group({"webapp-ag", "West US", ""}).is_ok());
    ASSERT_TRUE(ensure_network_site(cloud, site_request()).is_ok());

    auto request = site_request();
    request.subnet_name = "datasubnet";
    request.subnet_prefix = "10.3.0.0/16";
    auto outcome = ensure_network_site(cloud, request);
    ASSERT_TRUE(outcome.is_ok()) << outcome.error();
    EXPECT_EQ(outcome.value(), ConvergenceOutcome::Updated);
    EXPECT_EQ(cloud.network_pushes, 2);

    auto parsed = stratus::netcfg::parse_network_config(*cloud.get_network_config().value());
    ASSERT_TRUE(parsed.is_ok()) << parsed.error();
    const auto* site = parsed.value().find_site("webapp-vnet");
    ASSERT_NE(site, nullptr);
    EXPECT_EQ(site->subnets.size(), 2u);
}

TEST(EnsureNetworkSiteTest, InvalidRequestTouchesNothing) {
    CountingCloud cloud;
    auto request = site_request();
    request.subnet_name.clear();
    EXPECT_TRUE(ensure_network_site(cloud, request).is_error());
    EXPECT_EQ(cloud.network_pushes, 0);
}

TEST(EnsureNetworkSiteTest, FetchFailureIsReported) {
    CountingCloud cloud;
    cloud.fail_network_fetch = true;
    auto outcome = ensure_network_site(cloud, site_request());
    ASSERT_TRUE(outcome.is_error());
    EXPECT_NE(outcome.error().find("management endpoint unavailable"), std::string::npos);
    EXPECT_EQ(cloud.network_pushes, 0);
}

TEST(EnsureNetworkSiteTest, ProviderRejectionIsAnError) {
    CountingCloud cloud;
    // No affinity group: the control plane refuses the document
    auto outcome = ensure_network_site(cloud, site_request());
    ASSERT_TRUE(outcome.is_error());
    EXPECT_NE(outcome.error().find("Failed to update network configuration"), std::string::npos);
}
