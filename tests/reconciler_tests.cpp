#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>

#include <mesos/state/in_memory.hpp>
#include <mesos/state/protobuf.hpp>

#include <process/future.hpp>
#include <process/gtest.hpp>

#include <stout/check.hpp>
#include <stout/gtest.hpp>
#include <stout/hashset.hpp>
#include <stout/result.hpp>
#include <stout/try.hpp>

#include "sdn/errors.hpp"
#include "sdn/master_metrics.hpp"
#include "sdn/messages.hpp"
#include "sdn/network_info.hpp"
#include "sdn/reconciler.hpp"
#include "sdn/state_client.hpp"

#include "mocks.hpp"

using std::string;
using std::vector;

using process::Future;

using testing::_;
using testing::DoAll;
using testing::HasSubstr;
using testing::NiceMock;
using testing::Return;
using testing::SaveArg;

using mesos::modules::sdn::CLUSTER_NETWORK_DEFAULT;
using mesos::modules::sdn::ClusterNetwork;
using mesos::modules::sdn::HostSubnet;
using mesos::modules::sdn::Metrics;
using mesos::modules::sdn::MULTI_TENANT_PLUGIN_NAME;
using mesos::modules::sdn::Network;
using mesos::modules::sdn::NetworkInfo;
using mesos::modules::sdn::Reconciler;
using mesos::modules::sdn::SdnError;
using mesos::modules::sdn::Service;
using mesos::modules::sdn::StateClient;
using mesos::modules::sdn::SUBNET_PLUGIN_NAME;
using mesos::modules::sdn::TUN;
using mesos::modules::sdn::Violation;
using mesos::modules::sdn::internal::MasterNetworkConfig;

using mesos::state::InMemoryStorage;

namespace mesos {
namespace sdn {
namespace tests {

constexpr char CLUSTER_NETWORK[] = "10.128.0.0/14";
constexpr char SERVICE_NETWORK[] = "172.30.0.0/16";
constexpr uint32_t HOST_SUBNET_LENGTH = 9;


class ReconcilerTest : public ::testing::Test
{
protected:
  ReconcilerTest()
    : state(&storage),
      stateClient(&state, Seconds(10)),
      client(&stateClient),
      metrics(std::make_shared<Metrics>()),
      reconciler(&client, &hostNetworks, metrics) {}

  static MasterNetworkConfig config(
      const string& plugin = MULTI_TENANT_PLUGIN_NAME,
      const string& clusterNetwork = CLUSTER_NETWORK,
      uint32_t hostSubnetLength = HOST_SUBNET_LENGTH,
      const string& serviceNetwork = SERVICE_NETWORK)
  {
    MasterNetworkConfig config;
    config.set_network_plugin_name(plugin);
    config.set_cluster_network_cidr(clusterNetwork);
    config.set_host_subnet_length(hostSubnetLength);
    config.set_service_network_cidr(serviceNetwork);
    return config;
  }

  static NetworkInfo networkInfo(const MasterNetworkConfig& config)
  {
    Try<NetworkInfo, SdnError> info = NetworkInfo::parse(
        config.cluster_network_cidr(),
        config.service_network_cidr());

    CHECK(!info.isError()) << info.error().message;
    return info.get();
  }

  Try<Reconciler::Outcome, SdnError> reconcile(
      const MasterNetworkConfig& config)
  {
    return reconciler.reconcile(networkInfo(config), config);
  }

  // Stores the record that `config` would produce.
  void persist(const MasterNetworkConfig& config)
  {
    ClusterNetwork clusterNetwork;
    clusterNetwork.set_name(CLUSTER_NETWORK_DEFAULT);
    clusterNetwork.set_network(config.cluster_network_cidr());
    clusterNetwork.set_host_subnet_length(config.host_subnet_length());
    clusterNetwork.set_service_network(config.service_network_cidr());
    clusterNetwork.set_plugin_name(config.network_plugin_name());

    CHECK_SOME(stateClient.createClusterNetwork(clusterNetwork));
  }

  void addHostSubnet(const string& host, const string& subnet)
  {
    HostSubnet hostSubnet;
    hostSubnet.set_host(host);
    hostSubnet.set_host_ip("192.168.122.10");
    hostSubnet.set_subnet(subnet);

    CHECK_SOME(stateClient.createHostSubnet(hostSubnet));
  }

  void addService(
      const string& tenant,
      const string& name,
      const string& clusterIP)
  {
    Service service;
    service.set_tenant(tenant);
    service.set_name(name);
    service.set_cluster_ip(clusterIP);

    CHECK_SOME(stateClient.createService(service));
  }

  InMemoryStorage storage;
  mesos::state::protobuf::State state;
  StateClient stateClient;
  NiceMock<MockClusterClient> client;
  NiceMock<MockHostNetworks> hostNetworks;
  std::shared_ptr<Metrics> metrics;
  Reconciler reconciler;
};


TEST_F(ReconcilerTest, CreateClusterNetwork)
{
  Try<Reconciler::Outcome, SdnError> outcome = reconcile(config());

  ASSERT_TRUE(outcome.isSome()) << outcome.error().message;
  EXPECT_EQ(Reconciler::Outcome::CREATE, outcome.get());

  Result<ClusterNetwork> stored =
    stateClient.getClusterNetwork(CLUSTER_NETWORK_DEFAULT);

  ASSERT_SOME(stored);
  EXPECT_EQ(CLUSTER_NETWORK_DEFAULT, stored->name());
  EXPECT_EQ(CLUSTER_NETWORK, stored->network());
  EXPECT_EQ(HOST_SUBNET_LENGTH, stored->host_subnet_length());
  EXPECT_EQ(SERVICE_NETWORK, stored->service_network());
  EXPECT_EQ(MULTI_TENANT_PLUGIN_NAME, stored->plugin_name());

  Future<double> created = metrics->cluster_network_created.value();
  AWAIT_READY(created);
  EXPECT_EQ(1, created.get());
}


TEST_F(ReconcilerTest, StoresCanonicalNetworks)
{
  Try<Reconciler::Outcome, SdnError> outcome = reconcile(
      config(SUBNET_PLUGIN_NAME, "10.128.3.1/14", 8, "172.30.1.1/16"));

  ASSERT_TRUE(outcome.isSome()) << outcome.error().message;

  Result<ClusterNetwork> stored =
    stateClient.getClusterNetwork(CLUSTER_NETWORK_DEFAULT);

  ASSERT_SOME(stored);
  EXPECT_EQ("10.128.0.0/14", stored->network());
  EXPECT_EQ("172.30.0.0/16", stored->service_network());
}


// An identical record is left alone without looking at the fleet.
TEST_F(ReconcilerTest, IdenticalRecordSkipsFleetCheck)
{
  persist(config());
  addHostSubnet("agent1", "10.128.0.0/23");
  addService("alpha", "web", "172.30.0.10");

  EXPECT_CALL(client, listHostSubnets()).Times(0);
  EXPECT_CALL(client, listServices()).Times(0);
  EXPECT_CALL(client, createClusterNetwork(_)).Times(0);
  EXPECT_CALL(client, updateClusterNetwork(_)).Times(0);
  EXPECT_CALL(hostNetworks, networks(_)).Times(0);

  Try<Reconciler::Outcome, SdnError> outcome = reconcile(config());

  ASSERT_TRUE(outcome.isSome()) << outcome.error().message;
  EXPECT_EQ(Reconciler::Outcome::NO_OP, outcome.get());

  Future<double> unchanged = metrics->cluster_network_unchanged.value();
  AWAIT_READY(unchanged);
  EXPECT_EQ(1, unchanged.get());
}


// A record holding a non-canonical CIDR is rewritten in canonical form.
TEST_F(ReconcilerTest, NonCanonicalRecordIsRewritten)
{
  persist(config(MULTI_TENANT_PLUGIN_NAME, "10.128.1.0/14"));

  EXPECT_CALL(client, updateClusterNetwork(_)).Times(1);

  Try<Reconciler::Outcome, SdnError> outcome = reconcile(config());

  ASSERT_TRUE(outcome.isSome()) << outcome.error().message;
  EXPECT_EQ(Reconciler::Outcome::UPDATE, outcome.get());

  Result<ClusterNetwork> stored =
    stateClient.getClusterNetwork(CLUSTER_NETWORK_DEFAULT);

  ASSERT_SOME(stored);
  EXPECT_EQ(CLUSTER_NETWORK, stored->network());

  Try<Reconciler::Outcome, SdnError> again = reconcile(config());

  ASSERT_TRUE(again.isSome()) << again.error().message;
  EXPECT_EQ(Reconciler::Outcome::NO_OP, again.get());
}


TEST_F(ReconcilerTest, Idempotent)
{
  Try<Reconciler::Outcome, SdnError> first = reconcile(config());

  ASSERT_TRUE(first.isSome()) << first.error().message;
  EXPECT_EQ(Reconciler::Outcome::CREATE, first.get());

  EXPECT_CALL(client, createClusterNetwork(_)).Times(0);
  EXPECT_CALL(client, updateClusterNetwork(_)).Times(0);

  for (int i = 0; i < 2; i++) {
    Try<Reconciler::Outcome, SdnError> outcome = reconcile(config());

    ASSERT_TRUE(outcome.isSome()) << outcome.error().message;
    EXPECT_EQ(Reconciler::Outcome::NO_OP, outcome.get());
  }
}


TEST_F(ReconcilerTest, UpdateClusterNetwork)
{
  persist(config(SUBNET_PLUGIN_NAME));
  addHostSubnet("agent1", "10.131.0.0/23");

  EXPECT_CALL(client, createClusterNetwork(_)).Times(0);

  Try<Reconciler::Outcome, SdnError> outcome = reconcile(config());

  ASSERT_TRUE(outcome.isSome()) << outcome.error().message;
  EXPECT_EQ(Reconciler::Outcome::UPDATE, outcome.get());

  Result<ClusterNetwork> stored =
    stateClient.getClusterNetwork(CLUSTER_NETWORK_DEFAULT);

  ASSERT_SOME(stored);
  EXPECT_EQ(CLUSTER_NETWORK_DEFAULT, stored->name());
  EXPECT_EQ(MULTI_TENANT_PLUGIN_NAME, stored->plugin_name());

  Future<double> updated = metrics->cluster_network_updated.value();
  AWAIT_READY(updated);
  EXPECT_EQ(1, updated.get());
}


// A service outside of the service network is rejected and nothing
// gets written.
TEST_F(ReconcilerTest, ServiceOutsideServiceNetwork)
{
  addService("alpha", "web", "192.168.1.5");

  EXPECT_CALL(client, createClusterNetwork(_)).Times(0);

  Try<Reconciler::Outcome, SdnError> outcome = reconcile(config());

  ASSERT_TRUE(outcome.isError());
  EXPECT_EQ(SdnError::CONFLICT, outcome.error().kind);
  ASSERT_EQ(1u, outcome.error().violations.size());
  EXPECT_EQ(
      Violation::SERVICE_IP_OUTSIDE_SERVICE_NETWORK,
      outcome.error().violations[0].kind);
  EXPECT_THAT(outcome.error().message, HasSubstr("192.168.1.5"));

  EXPECT_NONE(stateClient.getClusterNetwork(CLUSTER_NETWORK_DEFAULT));

  Future<double> failures = metrics->validation_failures.value();
  AWAIT_READY(failures);
  EXPECT_EQ(1, failures.get());
}


TEST_F(ReconcilerTest, RejectedUpdateKeepsRecord)
{
  persist(config(SUBNET_PLUGIN_NAME, "10.0.0.0/16", 8));
  addHostSubnet("agent1", "10.0.4.0/24");

  Result<ClusterNetwork> before =
    stateClient.getClusterNetwork(CLUSTER_NETWORK_DEFAULT);

  ASSERT_SOME(before);

  EXPECT_CALL(client, updateClusterNetwork(_)).Times(0);

  Try<Reconciler::Outcome, SdnError> outcome = reconcile(config());

  ASSERT_TRUE(outcome.isError());
  EXPECT_EQ(SdnError::CONFLICT, outcome.error().kind);
  EXPECT_THAT(outcome.error().message, HasSubstr("10.0.4.0/24"));

  Result<ClusterNetwork> after =
    stateClient.getClusterNetwork(CLUSTER_NETWORK_DEFAULT);

  ASSERT_SOME(after);
  EXPECT_EQ(before->SerializeAsString(), after->SerializeAsString());
}


TEST_F(ReconcilerTest, EnumeratesEveryViolation)
{
  addHostSubnet("agent1", "10.132.0.0/23");
  addHostSubnet("agent2", "10.128.2.0/23");
  addHostSubnet("agent3", "192.168.7.0/24");
  addService("alpha", "web", "172.30.4.4");
  addService("beta", "db", "10.96.0.1");

  Try<Reconciler::Outcome, SdnError> outcome = reconcile(config());

  ASSERT_TRUE(outcome.isError());
  EXPECT_EQ(SdnError::CONFLICT, outcome.error().kind);

  const vector<Violation>& violations = outcome.error().violations;

  ASSERT_EQ(3u, violations.size());
  EXPECT_EQ(Violation::HOST_SUBNET_OUTSIDE_CLUSTER_NETWORK, violations[0].kind);
  EXPECT_THAT(violations[0].detail, HasSubstr("10.132.0.0/23"));
  EXPECT_EQ(Violation::HOST_SUBNET_OUTSIDE_CLUSTER_NETWORK, violations[1].kind);
  EXPECT_THAT(violations[1].detail, HasSubstr("192.168.7.0/24"));
  EXPECT_EQ(Violation::SERVICE_IP_OUTSIDE_SERVICE_NETWORK, violations[2].kind);
  EXPECT_THAT(violations[2].detail, HasSubstr("10.96.0.1"));
}


// Raising the host subnet length from 8 to 9 would put two existing
// /24 subnets into the same /23 node subnet.
TEST_F(ReconcilerTest, HostSubnetsSharingANodeSubnet)
{
  persist(config(MULTI_TENANT_PLUGIN_NAME, CLUSTER_NETWORK, 8));
  addHostSubnet("agent1", "10.128.0.0/24");
  addHostSubnet("agent2", "10.128.1.0/24");
  addHostSubnet("agent3", "10.128.4.0/24");

  Result<ClusterNetwork> before =
    stateClient.getClusterNetwork(CLUSTER_NETWORK_DEFAULT);

  ASSERT_SOME(before);

  EXPECT_CALL(client, updateClusterNetwork(_)).Times(0);

  Try<Reconciler::Outcome, SdnError> outcome =
    reconcile(config(MULTI_TENANT_PLUGIN_NAME, CLUSTER_NETWORK, 9));

  ASSERT_TRUE(outcome.isError());
  EXPECT_EQ(SdnError::CONFLICT, outcome.error().kind);

  const vector<Violation>& violations = outcome.error().violations;

  ASSERT_EQ(1u, violations.size());
  EXPECT_EQ(Violation::HOST_SUBNET_COLLISION, violations[0].kind);
  EXPECT_THAT(violations[0].detail, HasSubstr("10.128.1.0/24"));
  EXPECT_THAT(violations[0].detail, HasSubstr("agent2"));

  Result<ClusterNetwork> after =
    stateClient.getClusterNetwork(CLUSTER_NETWORK_DEFAULT);

  ASSERT_SOME(after);
  EXPECT_EQ(before->SerializeAsString(), after->SerializeAsString());
}


TEST_F(ReconcilerTest, UnparsableClusterObjects)
{
  addHostSubnet("agent1", "not-a-subnet");
  addService("alpha", "web", "not-an-ip");

  Try<Reconciler::Outcome, SdnError> outcome = reconcile(config());

  ASSERT_TRUE(outcome.isError());
  EXPECT_EQ(SdnError::CONFLICT, outcome.error().kind);

  const vector<Violation>& violations = outcome.error().violations;

  ASSERT_EQ(2u, violations.size());
  EXPECT_EQ(Violation::HOST_SUBNET_UNPARSABLE, violations[0].kind);
  EXPECT_EQ(Violation::SERVICE_IP_UNPARSABLE, violations[1].kind);
}


// Services without an address and headless services are not checked.
TEST_F(ReconcilerTest, ServicesWithoutClusterIP)
{
  addService("alpha", "pending", "");
  addService("alpha", "headless", "None");
  addService("beta", "web", "172.30.0.20");

  Try<Reconciler::Outcome, SdnError> outcome = reconcile(config());

  ASSERT_TRUE(outcome.isSome()) << outcome.error().message;
  EXPECT_EQ(Reconciler::Outcome::CREATE, outcome.get());
}


TEST_F(ReconcilerTest, HostNetworkConflict)
{
  hashset<string> excluded;

  EXPECT_CALL(hostNetworks, networks(_))
    .WillOnce(DoAll(
        SaveArg<0>(&excluded),
        Return(Try<vector<Network>>(vector<Network>({
            Network::parse("192.168.122.10/24").get(),
            Network::parse("10.0.0.5/8").get()})))));

  EXPECT_CALL(client, listHostSubnets()).Times(0);
  EXPECT_CALL(client, listServices()).Times(0);
  EXPECT_CALL(client, createClusterNetwork(_)).Times(0);

  Try<Reconciler::Outcome, SdnError> outcome = reconcile(config());

  ASSERT_TRUE(outcome.isError());
  EXPECT_EQ(SdnError::CONFLICT, outcome.error().kind);
  ASSERT_EQ(1u, outcome.error().violations.size());
  EXPECT_EQ(
      Violation::HOST_NETWORK_CONFLICT,
      outcome.error().violations[0].kind);

  EXPECT_TRUE(excluded.contains(TUN));
}


TEST_F(ReconcilerTest, HostNetworksUnavailable)
{
  EXPECT_CALL(hostNetworks, networks(_))
    .WillOnce(Return(Try<vector<Network>>(Error("netlink unavailable"))));

  EXPECT_CALL(client, createClusterNetwork(_)).Times(0);

  Try<Reconciler::Outcome, SdnError> outcome = reconcile(config());

  ASSERT_TRUE(outcome.isError());
  EXPECT_EQ(SdnError::TRANSPORT, outcome.error().kind);
}


// Only an explicit "not found" leads to a create.
TEST_F(ReconcilerTest, FetchFailure)
{
  EXPECT_CALL(client, getClusterNetwork(CLUSTER_NETWORK_DEFAULT))
    .WillOnce(Return(Result<ClusterNetwork>(Error("connection refused"))));

  EXPECT_CALL(client, createClusterNetwork(_)).Times(0);
  EXPECT_CALL(client, updateClusterNetwork(_)).Times(0);

  Try<Reconciler::Outcome, SdnError> outcome = reconcile(config());

  ASSERT_TRUE(outcome.isError());
  EXPECT_EQ(SdnError::TRANSPORT, outcome.error().kind);
  EXPECT_THAT(outcome.error().message, HasSubstr("connection refused"));
}


TEST_F(ReconcilerTest, ListFailure)
{
  EXPECT_CALL(client, listServices())
    .WillOnce(Return(Try<mesos::modules::sdn::ServiceList>(
        Error("connection reset"))));

  EXPECT_CALL(client, createClusterNetwork(_)).Times(0);

  Try<Reconciler::Outcome, SdnError> outcome = reconcile(config());

  ASSERT_TRUE(outcome.isError());
  EXPECT_EQ(SdnError::TRANSPORT, outcome.error().kind);
}


TEST_F(ReconcilerTest, CreateFailure)
{
  EXPECT_CALL(client, createClusterNetwork(_))
    .WillOnce(Return(Try<ClusterNetwork>(Error("forbidden"))));

  Try<Reconciler::Outcome, SdnError> outcome = reconcile(config());

  ASSERT_TRUE(outcome.isError());
  EXPECT_EQ(SdnError::TRANSPORT, outcome.error().kind);
  EXPECT_THAT(outcome.error().message, HasSubstr("forbidden"));

  EXPECT_NONE(stateClient.getClusterNetwork(CLUSTER_NETWORK_DEFAULT));
}

} // namespace tests {
} // namespace sdn {
} // namespace mesos {
