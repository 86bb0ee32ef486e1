#include "reconciler.hpp"

#include <string>
#include <vector>

#include <glog/logging.h>

#include <process/owned.hpp>

#include <stout/foreach.hpp>
#include <stout/hashset.hpp>
#include <stout/result.hpp>
#include <stout/stringify.hpp>

#include "subnet_allocator.hpp"

using std::ostream;
using std::string;
using std::vector;

using process::Owned;

using mesos::modules::sdn::internal::MasterNetworkConfig;

namespace mesos {
namespace modules {
namespace sdn {

Reconciler::Reconciler(
    ClusterClient* _client,
    HostNetworks* _hostNetworks,
    const std::shared_ptr<Metrics>& _metrics)
  : client(_client),
    hostNetworks(_hostNetworks),
    metrics(_metrics) {}


Try<Reconciler::Outcome, SdnError> Reconciler::reconcile(
    const NetworkInfo& networkInfo,
    const MasterNetworkConfig& config)
{
  const string network = stringify(networkInfo.clusterNetwork());
  const string serviceNetwork = stringify(networkInfo.serviceNetwork());

  Result<ClusterNetwork> existing =
    client->getClusterNetwork(CLUSTER_NETWORK_DEFAULT);

  if (existing.isError()) {
    return SdnError::transport(
        "Failed to fetch cluster network '" +
        stringify(CLUSTER_NETWORK_DEFAULT) + "': " + existing.error());
  }

  ClusterNetwork clusterNetwork;
  Outcome outcome;

  if (existing.isSome()) {
    clusterNetwork.CopyFrom(existing.get());

    // The stored networks are compared with the canonical desired ones,
    // so a record holding a non-canonical CIDR gets rewritten.
    if (clusterNetwork.network() == network &&
        clusterNetwork.host_subnet_length() == config.host_subnet_length() &&
        clusterNetwork.service_network() == serviceNetwork &&
        clusterNetwork.plugin_name() == config.network_plugin_name()) {
      ++metrics->cluster_network_unchanged;
      LOG(INFO) << "ClusterNetwork " << clusterNetwork << " is up to date";
      return Outcome::NO_OP;
    }

    outcome = Outcome::UPDATE;
  } else {
    clusterNetwork.set_name(CLUSTER_NETWORK_DEFAULT);
    outcome = Outcome::CREATE;
  }

  Try<Nothing, SdnError> local =
    checkClusterNetworkAgainstLocalNetworks(networkInfo);

  if (local.isError()) {
    return local.error();
  }

  Try<Nothing, SdnError> objects =
    checkClusterNetworkAgainstClusterObjects(
        networkInfo,
        config.host_subnet_length());

  if (objects.isError()) {
    return objects.error();
  }

  clusterNetwork.set_network(network);
  clusterNetwork.set_host_subnet_length(config.host_subnet_length());
  clusterNetwork.set_service_network(serviceNetwork);
  clusterNetwork.set_plugin_name(config.network_plugin_name());

  if (outcome == Outcome::CREATE) {
    Try<ClusterNetwork> created = client->createClusterNetwork(clusterNetwork);
    if (created.isError()) {
      return SdnError::transport(
          "Failed to create cluster network: " + created.error());
    }

    ++metrics->cluster_network_created;
    LOG(INFO) << "Created ClusterNetwork " << created.get();
  } else {
    Try<ClusterNetwork> updated = client->updateClusterNetwork(clusterNetwork);
    if (updated.isError()) {
      return SdnError::transport(
          "Failed to update cluster network: " + updated.error());
    }

    ++metrics->cluster_network_updated;
    LOG(INFO) << "Updated ClusterNetwork " << updated.get();
  }

  return outcome;
}


Try<Nothing, SdnError> Reconciler::checkClusterNetworkAgainstLocalNetworks(
    const NetworkInfo& networkInfo)
{
  hashset<string> excluded;
  excluded.insert(TUN);

  Try<vector<Network>> networks = hostNetworks->networks(excluded);
  if (networks.isError()) {
    return SdnError::transport(networks.error());
  }

  vector<Violation> violations =
    networkInfo.checkHostNetworks(networks.get());

  if (!violations.empty()) {
    ++metrics->validation_failures;
    return SdnError::conflict(violations);
  }

  return Nothing();
}


Try<Nothing, SdnError> Reconciler::checkClusterNetworkAgainstClusterObjects(
    const NetworkInfo& networkInfo,
    uint32_t hostSubnetLength)
{
  const Network& clusterNetwork = networkInfo.clusterNetwork();
  const Network& serviceNetwork = networkInfo.serviceNetwork();

  vector<Violation> violations;

  // Node blocks taken by the subnets seen so far. Only tracked for a
  // host subnet length the cluster network can hold.
  Owned<SubnetAllocator> blocks;
  if (hostSubnetLength > 0 &&
      hostSubnetLength <= 32u - clusterNetwork.prefix()) {
    blocks.reset(new SubnetAllocator(clusterNetwork, hostSubnetLength));
  }

  // Ensure each host subnet is within the cluster network.
  Try<HostSubnetList> subnets = client->listHostSubnets();
  if (subnets.isError()) {
    return SdnError::transport(
        "Error in initializing/fetching subnets: " + subnets.error());
  }

  foreach (const HostSubnet& hostSubnet, subnets->items()) {
    Try<Network> subnet = Network::parse(hostSubnet.subnet());
    if (subnet.isError()) {
      violations.push_back(Violation(
          Violation::HOST_SUBNET_UNPARSABLE,
          "Failed to parse subnet '" + hostSubnet.subnet() + "' of host '" +
          hostSubnet.host() + "': " + subnet.error()));
      continue;
    }

    if (!clusterNetwork.contains(subnet.get())) {
      violations.push_back(Violation(
          Violation::HOST_SUBNET_OUTSIDE_CLUSTER_NETWORK,
          "Existing node subnet " + hostSubnet.subnet() + " of host '" +
          hostSubnet.host() + "' is not part of cluster network " +
          stringify(clusterNetwork)));
      continue;
    }

    // Subnets allocated with a smaller host subnet length can share a
    // node block once the length is raised.
    if (blocks.get() != nullptr && blocks->reserve(subnet.get()).isError()) {
      violations.push_back(Violation(
          Violation::HOST_SUBNET_COLLISION,
          "Existing node subnet " + hostSubnet.subnet() + " of host '" +
          hostSubnet.host() + "' shares a /" +
          stringify(static_cast<uint32_t>(blocks->nodePrefix())) +
          " node subnet with another host"));
    }
  }

  // Ensure each service is within the services network.
  Try<ServiceList> services = client->listServices();
  if (services.isError()) {
    return SdnError::transport(
        "Error in fetching services: " + services.error());
  }

  foreach (const Service& service, services->items()) {
    const string& clusterIP = service.cluster_ip();

    // Not allocated yet, or a headless service.
    if (clusterIP.empty() || clusterIP == CLUSTER_IP_NONE) {
      continue;
    }

    Try<IP> ip = IP::parse(clusterIP);
    if (ip.isError()) {
      violations.push_back(Violation(
          Violation::SERVICE_IP_UNPARSABLE,
          "Failed to parse IP '" + clusterIP + "' of service '" +
          service.tenant() + "/" + service.name() + "': " + ip.error()));
      continue;
    }

    if (!serviceNetwork.contains(ip.get())) {
      violations.push_back(Violation(
          Violation::SERVICE_IP_OUTSIDE_SERVICE_NETWORK,
          "Existing service '" + service.tenant() + "/" + service.name() +
          "' with IP " + clusterIP + " is not part of service network " +
          stringify(serviceNetwork)));
    }
  }

  if (!violations.empty()) {
    ++metrics->validation_failures;
    return SdnError::conflict(violations);
  }

  return Nothing();
}


ostream& operator<<(ostream& stream, Reconciler::Outcome outcome)
{
  switch (outcome) {
    case Reconciler::Outcome::NO_OP:  return stream << "NO_OP";
    case Reconciler::Outcome::CREATE: return stream << "CREATE";
    case Reconciler::Outcome::UPDATE: return stream << "UPDATE";
  }

  return stream;
}


ostream& operator<<(ostream& stream, const ClusterNetwork& clusterNetwork)
{
  return stream
    << clusterNetwork.name()
    << " (network: \"" << clusterNetwork.network() << "\""
    << ", hostSubnetBits: " << clusterNetwork.host_subnet_length()
    << ", serviceNetwork: \"" << clusterNetwork.service_network() << "\""
    << ", pluginName: \"" << clusterNetwork.plugin_name() << "\")";
}

} // namespace sdn {
} // namespace modules {
} // namespace mesos {
