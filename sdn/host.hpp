#ifndef __SDN_HOST_HPP__
#define __SDN_HOST_HPP__

#include <string>
#include <vector>

#include <stout/hashset.hpp>
#include <stout/try.hpp>

#include "network.hpp"

namespace mesos {
namespace modules {
namespace sdn {

// Source of the IPv4 networks configured on the local host.
class HostNetworks
{
public:
  virtual ~HostNetworks() {}

  // Returns the networks of every link not named in `excluded`.
  // Loopback addresses are never returned.
  virtual Try<std::vector<Network>> networks(
      const hashset<std::string>& excluded) = 0;
};


// Enumerates the links of the host this process is running on.
class LinkHostNetworks : public HostNetworks
{
public:
  virtual Try<std::vector<Network>> networks(
      const hashset<std::string>& excluded);
};

} // namespace sdn {
} // namespace modules {
} // namespace mesos {

#endif // __SDN_HOST_HPP__
