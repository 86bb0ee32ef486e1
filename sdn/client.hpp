#ifndef __SDN_CLIENT_HPP__
#define __SDN_CLIENT_HPP__

#include <string>

#include <stout/nothing.hpp>
#include <stout/result.hpp>
#include <stout/try.hpp>

#include <sdn/sdn.hpp>

namespace mesos {
namespace modules {
namespace sdn {

// Access to the records of the cluster control plane. Every call is a
// single blocking round trip and is never retried. An `Error` means
// the control plane could not be reached or rejected the request.
class ClusterClient
{
public:
  virtual ~ClusterClient() {}

  // Returns `None` if no record with the given name exists.
  virtual Result<ClusterNetwork> getClusterNetwork(const std::string& name) = 0;

  // Fails if a record with the same name already exists.
  virtual Try<ClusterNetwork> createClusterNetwork(
      const ClusterNetwork& clusterNetwork) = 0;

  // Fails if no record with the same name exists.
  virtual Try<ClusterNetwork> updateClusterNetwork(
      const ClusterNetwork& clusterNetwork) = 0;

  virtual Try<HostSubnetList> listHostSubnets() = 0;

  // Returns `None` if the host has no subnet.
  virtual Result<HostSubnet> getHostSubnet(const std::string& host) = 0;

  virtual Try<HostSubnet> createHostSubnet(const HostSubnet& hostSubnet) = 0;

  virtual Try<HostSubnet> updateHostSubnet(const HostSubnet& hostSubnet) = 0;

  virtual Try<Nothing> deleteHostSubnet(const std::string& host) = 0;

  // Lists the services of all tenants.
  virtual Try<ServiceList> listServices() = 0;
};

} // namespace sdn {
} // namespace modules {
} // namespace mesos {

#endif // __SDN_CLIENT_HPP__
