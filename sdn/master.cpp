#include "master.hpp"

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/result.hpp>
#include <stout/stringify.hpp>

using std::string;

using process::Owned;

using mesos::modules::sdn::internal::MasterNetworkConfig;

namespace mesos {
namespace modules {
namespace sdn {

Master::Master(ClusterClient* _client, HostNetworks* _hostNetworks)
  : client(_client),
    metrics_(std::make_shared<Metrics>()),
    reconciler(_client, _hostNetworks, metrics_) {}


Try<Option<Reconciler::Outcome>, SdnError> Master::start(
    const MasterNetworkConfig& config)
{
  const IsolationMode mode = isolationMode(config.network_plugin_name());

  if (mode == IsolationMode::INACTIVE) {
    VLOG(1) << "Network plugin '" << config.network_plugin_name()
            << "' is not an SDN plugin";
    return Option<Reconciler::Outcome>::none();
  }

  LOG(INFO) << "Initializing SDN master of type '"
            << config.network_plugin_name() << "' (" << mode << ")";

  Try<NetworkInfo, SdnError> parsed = NetworkInfo::parse(
      config.cluster_network_cidr(),
      config.service_network_cidr());

  if (parsed.isError()) {
    return parsed.error();
  }

  const Network& clusterNetwork = parsed->clusterNetwork();
  const uint32_t hostSubnetLength = config.host_subnet_length();
  const uint32_t maxHostSubnetLength = 32 - clusterNetwork.prefix();

  if (hostSubnetLength == 0 || hostSubnetLength > maxHostSubnetLength) {
    return SdnError::configuration(
        "Invalid host subnet length " + stringify(hostSubnetLength) +
        " for cluster network " + stringify(clusterNetwork) +
        ": it has to be between 1 and " + stringify(maxHostSubnetLength));
  }

  Try<Reconciler::Outcome, SdnError> outcome =
    reconciler.reconcile(parsed.get(), config);

  if (outcome.isError()) {
    return outcome.error();
  }

  networkInfo_ = parsed.get();

  Try<Nothing> subnets =
    startSubnetAllocation(clusterNetwork, hostSubnetLength);

  if (subnets.isError()) {
    return SdnError::bootstrap(
        "Failed to start subnet allocation: " + subnets.error());
  }

  if (mode == IsolationMode::MULTI_TENANT ||
      mode == IsolationMode::NETWORK_POLICY) {
    Try<Nothing> tracking =
      startVnidTracking(mode == IsolationMode::MULTI_TENANT);

    if (tracking.isError()) {
      return SdnError::bootstrap(
          "Failed to start VNID tracking: " + tracking.error());
    }
  }

  return Option<Reconciler::Outcome>(outcome.get());
}


Try<Nothing> Master::startSubnetAllocation(
    const Network& clusterNetwork,
    uint32_t hostSubnetLength)
{
  Owned<SubnetAllocator> allocator(
      new SubnetAllocator(clusterNetwork, hostSubnetLength));

  Try<HostSubnetList> subnets = client->listHostSubnets();
  if (subnets.isError()) {
    return Error("Error in initializing/fetching subnets: " + subnets.error());
  }

  // Records that cannot be reserved are skipped.
  foreach (const HostSubnet& hostSubnet, subnets->items()) {
    Try<Network> subnet = Network::parse(hostSubnet.subnet());
    if (subnet.isError()) {
      LOG(WARNING) << "Skipping unparsable subnet " << hostSubnet.subnet()
                   << " of host '" << hostSubnet.host() << "': "
                   << subnet.error();
      continue;
    }

    Try<Nothing> reserved = allocator->reserve(subnet.get());
    if (reserved.isError()) {
      LOG(WARNING) << "Skipping the subnet of host '" << hostSubnet.host()
                   << "': " << reserved.error();
      continue;
    }

    if (hostSubnet.has_host_ip()) {
      hostSubnetNodeIPs.put(hostSubnet.host(), hostSubnet.host_ip());
    }

    VLOG(1) << "Reserved subnet " << subnet.get()
            << " of host '" << hostSubnet.host() << "'";
  }

  LOG(INFO) << "Started subnet allocation with "
            << subnets->items_size() << " existing host subnet(s)";

  subnetAllocator = allocator;

  return Nothing();
}


Try<Nothing> Master::startVnidTracking(bool multiTenant)
{
  Owned<VnidMap> vnids(new VnidMap(multiTenant));

  Try<ServiceList> services = client->listServices();
  if (services.isError()) {
    return Error("Error in fetching services: " + services.error());
  }

  Try<Nothing> started = vnids->start(services.get());
  if (started.isError()) {
    return Error(started.error());
  }

  vnids_ = vnids;

  return Nothing();
}


Try<HostSubnet> Master::addNode(const string& host, const string& hostIP)
{
  if (subnetAllocator.get() == nullptr) {
    return Error("Subnet allocation has not been started");
  }

  Try<IP> ip = IP::parse(hostIP);
  if (ip.isError()) {
    return Error(
        "Invalid IP '" + hostIP + "' of host '" + host + "': " + ip.error());
  }

  Result<HostSubnet> existing = client->getHostSubnet(host);
  if (existing.isError()) {
    return Error(
        "Error fetching the subnet of host '" + host + "': " +
        existing.error());
  }

  if (existing.isSome()) {
    if (existing->host_ip() == hostIP) {
      hostSubnetNodeIPs.put(host, hostIP);
      return existing.get();
    }

    HostSubnet hostSubnet = existing.get();
    hostSubnet.set_host_ip(hostIP);

    Try<HostSubnet> updated = client->updateHostSubnet(hostSubnet);
    if (updated.isError()) {
      return Error(
          "Error updating the subnet of host '" + host + "': " +
          updated.error());
    }

    LOG(INFO) << "Updated IP of host '" << host << "' from "
              << existing->host_ip() << " to " << hostIP;

    hostSubnetNodeIPs.put(host, hostIP);
    return updated.get();
  }

  Try<Network> subnet = subnetAllocator->allocate();
  if (subnet.isError()) {
    ++metrics_->subnet_allocation_failures;
    return Error(
        "Cannot allocate a subnet to host '" + host + "': " + subnet.error());
  }

  HostSubnet hostSubnet;
  hostSubnet.set_host(host);
  hostSubnet.set_host_ip(hostIP);
  hostSubnet.set_subnet(stringify(subnet.get()));

  Try<HostSubnet> created = client->createHostSubnet(hostSubnet);
  if (created.isError()) {
    ++metrics_->subnet_allocation_failures;

    Try<Nothing> freed = subnetAllocator->free(subnet.get());
    if (freed.isError()) {
      LOG(ERROR) << "Unable to release subnet " << subnet.get()
                 << ": " << freed.error();
    }

    return Error(
        "Error creating the subnet of host '" + host + "': " +
        created.error());
  }

  ++metrics_->subnets_allocated;
  hostSubnetNodeIPs.put(host, hostIP);

  LOG(INFO) << "Allocated subnet " << subnet.get()
            << " to host '" << host << "' (" << hostIP << ")";

  return created.get();
}


Try<Nothing> Master::deleteNode(const string& host)
{
  if (subnetAllocator.get() == nullptr) {
    return Error("Subnet allocation has not been started");
  }

  Result<HostSubnet> existing = client->getHostSubnet(host);
  if (existing.isError()) {
    return Error(
        "Error fetching the subnet of host '" + host + "': " +
        existing.error());
  }

  if (existing.isNone()) {
    return Error("Host '" + host + "' has no subnet");
  }

  Try<Network> subnet = Network::parse(existing->subnet());
  if (subnet.isError()) {
    return Error(
        "Unable to parse the subnet " + existing->subnet() +
        " of host '" + host + "': " + subnet.error());
  }

  Try<Nothing> deleted = client->deleteHostSubnet(host);
  if (deleted.isError()) {
    return Error(
        "Error deleting the subnet of host '" + host + "': " +
        deleted.error());
  }

  hostSubnetNodeIPs.erase(host);

  Try<Nothing> freed = subnetAllocator->free(subnet.get());
  if (freed.isError()) {
    return Error(
        "Deleted the subnet of host '" + host + "' but failed to release it: " +
        freed.error());
  }

  LOG(INFO) << "Released subnet " << subnet.get()
            << " of host '" << host << "'";

  return Nothing();
}

} // namespace sdn {
} // namespace modules {
} // namespace mesos {
