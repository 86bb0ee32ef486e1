#ifndef __SDN_RECONCILER_HPP__
#define __SDN_RECONCILER_HPP__

#include <memory>
#include <ostream>

#include <stdint.h>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "client.hpp"
#include "errors.hpp"
#include "host.hpp"
#include "master_metrics.hpp"
#include "messages.hpp"
#include "network_info.hpp"

namespace mesos {
namespace modules {
namespace sdn {

// Converges the persisted `ClusterNetwork` record to the desired
// configuration. The record is only written after the configuration
// has been validated against the local host and against every host
// subnet and service of the cluster; a rejected configuration leaves
// the record untouched.
class Reconciler
{
public:
  enum class Outcome
  {
    NO_OP,
    CREATE,
    UPDATE
  };

  Reconciler(
      ClusterClient* _client,
      HostNetworks* _hostNetworks,
      const std::shared_ptr<Metrics>& _metrics);

  Try<Outcome, SdnError> reconcile(
      const NetworkInfo& networkInfo,
      const internal::MasterNetworkConfig& config);

  // Fails with a `CONFLICT` listing every host network that collides
  // with the cluster or the service network. The overlay device is
  // not considered.
  Try<Nothing, SdnError> checkClusterNetworkAgainstLocalNetworks(
      const NetworkInfo& networkInfo);

  // Fails with a `CONFLICT` listing every host subnet outside of the
  // cluster network, every host subnet sharing a node block of
  // `hostSubnetLength` with an earlier one and every service address
  // outside of the service network.
  Try<Nothing, SdnError> checkClusterNetworkAgainstClusterObjects(
      const NetworkInfo& networkInfo,
      uint32_t hostSubnetLength);

private:
  ClusterClient* client;

  HostNetworks* hostNetworks;

  std::shared_ptr<Metrics> metrics;
};


std::ostream& operator<<(std::ostream& stream, Reconciler::Outcome outcome);

std::ostream& operator<<(
    std::ostream& stream,
    const ClusterNetwork& clusterNetwork);

} // namespace sdn {
} // namespace modules {
} // namespace mesos {

#endif // __SDN_RECONCILER_HPP__
