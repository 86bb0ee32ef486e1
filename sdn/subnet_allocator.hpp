#ifndef __SDN_SUBNET_ALLOCATOR_HPP__
#define __SDN_SUBNET_ALLOCATOR_HPP__

#include <stdint.h>

#include <stout/interval.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "network.hpp"

namespace mesos {
namespace modules {
namespace sdn {

// Hands out node subnets of prefix `32 - hostSubnetLength` from the
// cluster network.
class SubnetAllocator
{
public:
  // `hostSubnetLength` has to leave a node prefix that is not shorter
  // than the prefix of `clusterNetwork`.
  SubnetAllocator(const Network& clusterNetwork, uint32_t hostSubnetLength);

  Try<Network> allocate();

  // Marks every node subnet covered by `subnet` as allocated. Fails if
  // `subnet` is outside the cluster network or any of the node
  // subnets it covers is already allocated.
  Try<Nothing> reserve(const Network& subnet);

  // Releases every node subnet covered by `subnet`.
  Try<Nothing> free(const Network& subnet);

  const Network& clusterNetwork() const { return network; }

  uint8_t nodePrefix() const { return prefix; }

  bool exhausted() const { return freeNetworks.empty(); }

private:
  // Network allocated to the cluster.
  const Network network;

  // Prefix length allocated to each node.
  const uint8_t prefix;

  // Free subnets available in this network. The subnets are
  // calculated using the prefix length set for the nodes in
  // `prefix`.
  IntervalSet<Network> freeNetworks;
};

} // namespace sdn {
} // namespace modules {
} // namespace mesos {

#endif // __SDN_SUBNET_ALLOCATOR_HPP__
