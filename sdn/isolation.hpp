#ifndef __SDN_ISOLATION_HPP__
#define __SDN_ISOLATION_HPP__

#include <ostream>
#include <string>

#include <sdn/sdn.hpp>

namespace mesos {
namespace modules {
namespace sdn {

// How tenants are isolated from each other. `INACTIVE` stands for a
// plugin that is not handled by this master.
enum class IsolationMode
{
  INACTIVE,
  SUBNET,
  MULTI_TENANT,
  NETWORK_POLICY
};


inline IsolationMode isolationMode(const std::string& pluginName)
{
  if (pluginName == SUBNET_PLUGIN_NAME) {
    return IsolationMode::SUBNET;
  } else if (pluginName == MULTI_TENANT_PLUGIN_NAME) {
    return IsolationMode::MULTI_TENANT;
  } else if (pluginName == NETWORK_POLICY_PLUGIN_NAME) {
    return IsolationMode::NETWORK_POLICY;
  }

  return IsolationMode::INACTIVE;
}


inline std::ostream& operator<<(std::ostream& stream, IsolationMode mode)
{
  switch (mode) {
    case IsolationMode::INACTIVE:       return stream << "inactive";
    case IsolationMode::SUBNET:         return stream << "subnet";
    case IsolationMode::MULTI_TENANT:   return stream << "multi-tenant";
    case IsolationMode::NETWORK_POLICY: return stream << "network-policy";
  }

  return stream;
}

} // namespace sdn {
} // namespace modules {
} // namespace mesos {

#endif // __SDN_ISOLATION_HPP__
