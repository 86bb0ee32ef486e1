#ifndef __SDN_MASTER_HPP__
#define __SDN_MASTER_HPP__

#include <stdint.h>

#include <memory>
#include <string>

#include <process/owned.hpp>

#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "client.hpp"
#include "errors.hpp"
#include "host.hpp"
#include "isolation.hpp"
#include "master_metrics.hpp"
#include "messages.hpp"
#include "network_info.hpp"
#include "node_ips.hpp"
#include "reconciler.hpp"
#include "subnet_allocator.hpp"
#include "vnid.hpp"

namespace mesos {
namespace modules {
namespace sdn {

// The SDN master. `start` brings the persisted `ClusterNetwork` in
// line with the configuration and then starts host subnet allocation
// and, for the multi-tenant and network-policy plugins, VNID
// tracking.
class Master
{
public:
  Master(ClusterClient* _client, HostNetworks* _hostNetworks);

  // Returns `None` without doing anything if the configured plugin is
  // not an SDN plugin. Otherwise returns what happened to the
  // `ClusterNetwork` record. Re-running `start` after a failure is
  // safe.
  Try<Option<Reconciler::Outcome>, SdnError> start(
      const internal::MasterNetworkConfig& config);

  Try<Nothing> startSubnetAllocation(
      const Network& clusterNetwork,
      uint32_t hostSubnetLength);

  Try<Nothing> startVnidTracking(bool multiTenant);

  // Makes sure `host` has a subnet and that the subnet records
  // `hostIP`.
  Try<HostSubnet> addNode(const std::string& host, const std::string& hostIP);

  // Releases the subnet of `host`.
  Try<Nothing> deleteNode(const std::string& host);

  const Option<NetworkInfo>& networkInfo() const { return networkInfo_; }

  SubnetAllocator* subnets() const { return subnetAllocator.get(); }

  VnidMap* vnids() const { return vnids_.get(); }

  const NodeIPTable& nodeIPs() const { return hostSubnetNodeIPs; }

  const std::shared_ptr<Metrics>& metrics() const { return metrics_; }

private:
  ClusterClient* client;

  std::shared_ptr<Metrics> metrics_;

  Reconciler reconciler;

  Option<NetworkInfo> networkInfo_;

  process::Owned<SubnetAllocator> subnetAllocator;

  process::Owned<VnidMap> vnids_;

  // Holds the node IP used in creating the host subnet of each node.
  NodeIPTable hostSubnetNodeIPs;
};

} // namespace sdn {
} // namespace modules {
} // namespace mesos {

#endif // __SDN_MASTER_HPP__
