#ifndef __SDN_STATE_CLIENT_HPP__
#define __SDN_STATE_CLIENT_HPP__

#include <string>
#include <vector>

#include <mesos/state/protobuf.hpp>

#include <stout/duration.hpp>
#include <stout/option.hpp>

#include "client.hpp"

namespace mesos {
namespace modules {
namespace sdn {

// `ClusterClient` that keeps the records in Mesos replicated state,
// one variable per record:
//
//   cluster-network/<name>
//   host-subnet/<host>
//   service/<tenant>/<name>
//
// Every operation blocks until the state answers or `timeout` passes.
class StateClient : public ClusterClient
{
public:
  StateClient(mesos::state::protobuf::State* _state, const Duration& _timeout);

  virtual Result<ClusterNetwork> getClusterNetwork(const std::string& name);

  virtual Try<ClusterNetwork> createClusterNetwork(
      const ClusterNetwork& clusterNetwork);

  virtual Try<ClusterNetwork> updateClusterNetwork(
      const ClusterNetwork& clusterNetwork);

  virtual Try<HostSubnetList> listHostSubnets();

  virtual Result<HostSubnet> getHostSubnet(const std::string& host);

  virtual Try<HostSubnet> createHostSubnet(const HostSubnet& hostSubnet);

  virtual Try<HostSubnet> updateHostSubnet(const HostSubnet& hostSubnet);

  virtual Try<Nothing> deleteHostSubnet(const std::string& host);

  virtual Try<ServiceList> listServices();

  // Services are owned by other components; this lets them (and the
  // tests) register one.
  Try<Service> createService(const Service& service);

private:
  template <typename T>
  Try<mesos::state::protobuf::Variable<T>> fetch(const std::string& key);

  template <typename T>
  Try<T> store(
      const std::string& key,
      const mesos::state::protobuf::Variable<T>& variable,
      const T& value);

  Try<std::vector<std::string>> names(const std::string& prefix);

  mesos::state::protobuf::State* state;

  const Duration timeout;
};

} // namespace sdn {
} // namespace modules {
} // namespace mesos {

#endif // __SDN_STATE_CLIENT_HPP__
