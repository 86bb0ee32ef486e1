#ifndef __SDN_NETWORK_INFO_HPP__
#define __SDN_NETWORK_INFO_HPP__

#include <string>
#include <vector>

#include <stout/try.hpp>

#include "errors.hpp"
#include "network.hpp"

namespace mesos {
namespace modules {
namespace sdn {

// The validated address space of the cluster: the network node
// subnets are carved from and the network service addresses are
// assigned from. Both are canonical and never overlap.
class NetworkInfo
{
public:
  // Returns a `CONFIGURATION` error if either CIDR does not parse, is
  // degenerate (a /0 or a /32) or if the two networks overlap.
  static Try<NetworkInfo, SdnError> parse(
      const std::string& clusterNetwork,
      const std::string& serviceNetwork);

  const Network& clusterNetwork() const { return clusterNetwork_; }
  const Network& serviceNetwork() const { return serviceNetwork_; }

  // Checks the given host networks against both networks and returns
  // one violation per conflicting pair.
  std::vector<Violation> checkHostNetworks(
      const std::vector<Network>& hostNetworks) const;

private:
  NetworkInfo(const Network& _clusterNetwork, const Network& _serviceNetwork)
    : clusterNetwork_(_clusterNetwork),
      serviceNetwork_(_serviceNetwork) {}

  Network clusterNetwork_;
  Network serviceNetwork_;
};

} // namespace sdn {
} // namespace modules {
} // namespace mesos {

#endif // __SDN_NETWORK_INFO_HPP__
