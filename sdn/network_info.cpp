#include "network_info.hpp"

#include <stout/foreach.hpp>
#include <stout/stringify.hpp>

using std::string;
using std::vector;

namespace mesos {
namespace modules {
namespace sdn {

static Try<Network> parseNetwork(const string& name, const string& cidr)
{
  Try<Network> network = Network::parse(cidr);
  if (network.isError()) {
    return Error(
        "Failed to parse " + name + " '" + cidr + "': " + network.error());
  }

  if (network->prefix() == 0 || network->prefix() == 32) {
    return Error(
        "Invalid " + name + " '" + cidr + "': the prefix length has to be "
        "between 1 and 31");
  }

  return network->canonical();
}


Try<NetworkInfo, SdnError> NetworkInfo::parse(
    const string& clusterNetwork,
    const string& serviceNetwork)
{
  Try<Network> cluster = parseNetwork("cluster network", clusterNetwork);
  if (cluster.isError()) {
    return SdnError::configuration(cluster.error());
  }

  Try<Network> service = parseNetwork("service network", serviceNetwork);
  if (service.isError()) {
    return SdnError::configuration(service.error());
  }

  if (cluster->overlaps(service.get())) {
    return SdnError::configuration(
        "Cluster network " + stringify(cluster.get()) +
        " overlaps with service network " + stringify(service.get()));
  }

  return NetworkInfo(cluster.get(), service.get());
}


vector<Violation> NetworkInfo::checkHostNetworks(
    const vector<Network>& hostNetworks) const
{
  vector<Violation> violations;

  foreach (const Network& hostNetwork, hostNetworks) {
    if (clusterNetwork_.overlaps(hostNetwork)) {
      violations.push_back(Violation(
          Violation::HOST_NETWORK_CONFLICT,
          "Cluster network " + stringify(clusterNetwork_) +
          " conflicts with host network " + stringify(hostNetwork)));
    }

    if (serviceNetwork_.overlaps(hostNetwork)) {
      violations.push_back(Violation(
          Violation::HOST_NETWORK_CONFLICT,
          "Service network " + stringify(serviceNetwork_) +
          " conflicts with host network " + stringify(hostNetwork)));
    }
  }

  return violations;
}

} // namespace sdn {
} // namespace modules {
} // namespace mesos {
