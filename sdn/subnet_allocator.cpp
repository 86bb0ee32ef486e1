#include "subnet_allocator.hpp"

#include <glog/logging.h>

#include <stout/stringify.hpp>

namespace mesos {
namespace modules {
namespace sdn {

SubnetAllocator::SubnetAllocator(
    const Network& clusterNetwork,
    uint32_t hostSubnetLength)
  : network(clusterNetwork.canonical()),
    prefix(static_cast<uint8_t>(32 - hostSubnetLength))
{
  Network startSubnet = Network(network.begin(), prefix);
  Network endSubnet = Network(network.end(), prefix).canonical();

  LOG(INFO) << "Node subnets of " << network << ": "
            << startSubnet << " - " << endSubnet;

  freeNetworks +=
    (Bound<Network>::closed(startSubnet),
     Bound<Network>::closed(endSubnet));
}


Try<Network> SubnetAllocator::allocate()
{
  if (freeNetworks.empty()) {
    return Error(
        "No free subnets available in the cluster network " +
        stringify(network));
  }

  Network subnet = freeNetworks.begin()->lower();
  freeNetworks -= subnet;

  return subnet;
}


// Returns the node subnets covered by `subnet`. A subnet of a shorter
// prefix than the node prefix (e.g. one allocated before the host
// subnet length was decreased) covers several node subnets, a subnet
// of a longer prefix is part of one.
static IntervalSet<Network> cover(const Network& subnet, uint8_t prefix)
{
  IntervalSet<Network> covered;

  if (subnet.prefix() <= prefix) {
    covered +=
      (Bound<Network>::closed(Network(subnet.begin(), prefix)),
       Bound<Network>::closed(Network(subnet.end(), prefix).canonical()));
  } else {
    covered += Network(subnet.address(), prefix).canonical();
  }

  return covered;
}


Try<Nothing> SubnetAllocator::reserve(const Network& subnet)
{
  if (!network.contains(subnet)) {
    return Error(
        "Unable to reserve subnet " + stringify(subnet) +
        " outside of the cluster network " + stringify(network));
  }

  IntervalSet<Network> covered = cover(subnet, prefix);

  if (!freeNetworks.contains(covered)) {
    return Error(
        "Unable to reserve unavailable subnet " + stringify(subnet));
  }

  freeNetworks -= covered;

  return Nothing();
}


Try<Nothing> SubnetAllocator::free(const Network& subnet)
{
  if (!network.contains(subnet)) {
    return Error(
        "Cannot free " + stringify(subnet) + " since it does not belong "
        "to the cluster network " + stringify(network));
  }

  IntervalSet<Network> covered = cover(subnet, prefix);

  if (freeNetworks.intersects(covered)) {
    return Error(
        "Unable to free subnet " + stringify(subnet) +
        " that wasn't previously allocated");
  }

  freeNetworks += covered;

  return Nothing();
}

} // namespace sdn {
} // namespace modules {
} // namespace mesos {
