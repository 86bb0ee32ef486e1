#include "master_metrics.hpp"

#include <process/metrics/metrics.hpp>

namespace mesos {
namespace modules {
namespace sdn {

Metrics::Metrics()
  : cluster_network_created("sdn/master/cluster_network_created"),
    cluster_network_updated("sdn/master/cluster_network_updated"),
    cluster_network_unchanged("sdn/master/cluster_network_unchanged"),
    validation_failures("sdn/master/validation_failures"),

    subnet_allocation_failures("sdn/master/subnet_allocation_failures"),
    subnets_allocated("sdn/master/subnets_allocated")
{
  process::metrics::add(cluster_network_created);
  process::metrics::add(cluster_network_updated);
  process::metrics::add(cluster_network_unchanged);
  process::metrics::add(validation_failures);

  process::metrics::add(subnet_allocation_failures);
  process::metrics::add(subnets_allocated);
}

Metrics::~Metrics()
{
  process::metrics::remove(cluster_network_created);
  process::metrics::remove(cluster_network_updated);
  process::metrics::remove(cluster_network_unchanged);
  process::metrics::remove(validation_failures);

  process::metrics::remove(subnet_allocation_failures);
  process::metrics::remove(subnets_allocated);
}

} // namespace sdn {
} // namespace modules {
} // namespace mesos {
