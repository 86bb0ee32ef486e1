#ifndef __SDN_MASTER_METRICS_HPP__
#define __SDN_MASTER_METRICS_HPP__

#include <process/metrics/counter.hpp>

namespace mesos {
namespace modules {
namespace sdn {

struct Metrics
{
  Metrics();
  ~Metrics();

  // Counts the reconciliations that created the `ClusterNetwork`
  // record.
  process::metrics::Counter cluster_network_created;

  // Counts the reconciliations that updated the `ClusterNetwork`
  // record.
  process::metrics::Counter cluster_network_updated;

  // Counts the reconciliations that found the `ClusterNetwork` record
  // already matching the configuration.
  process::metrics::Counter cluster_network_unchanged;

  // Counts the reconciliations rejected because the configuration
  // conflicts with the host or with existing cluster objects.
  process::metrics::Counter validation_failures;

  // Counts the number of host subnet allocation failures.
  process::metrics::Counter subnet_allocation_failures;

  // Counts the number of host subnets allocated.
  process::metrics::Counter subnets_allocated;
};

} // namespace sdn {
} // namespace modules {
} // namespace mesos {


#endif // __SDN_MASTER_METRICS_HPP__
