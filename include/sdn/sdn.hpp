#ifndef __SDN_SDN_HPP__
#define __SDN_SDN_HPP__

// ONLY USEFUL AFTER RUNNING PROTOC.
#include <stdint.h>

#include <string>

#include <sdn/sdn.pb.h>

namespace mesos {
namespace modules {
namespace sdn {

// Name of the single `ClusterNetwork` record of the cluster.
constexpr char CLUSTER_NETWORK_DEFAULT[] = "default";

constexpr char SUBNET_PLUGIN_NAME[] = "mesos/sdn-subnet";
constexpr char MULTI_TENANT_PLUGIN_NAME[] = "mesos/sdn-multitenant";
constexpr char NETWORK_POLICY_PLUGIN_NAME[] = "mesos/sdn-networkpolicy";

// Overlay device of the data plane. Its addresses live inside the
// cluster network and are never treated as host networks.
constexpr char TUN[] = "tun0";

constexpr char MESOS_ZK[] = "MESOS_ZK";
constexpr char MESOS_QUORUM[] = "MESOS_QUORUM";

constexpr char DEFAULT_TENANT[] = "default";

// Services without an address use this `cluster_ip`.
constexpr char CLUSTER_IP_NONE[] = "None";

constexpr uint32_t GLOBAL_VNID = 0;
constexpr uint32_t MIN_VNID = 10;
constexpr uint32_t MAX_VNID = (1 << 24) - 1;

} // namespace sdn {
} // namespace modules {
} // namespace mesos {

#endif // __SDN_SDN_HPP__
