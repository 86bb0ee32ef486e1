#include "host.hpp"

#include <ifaddrs.h>

#include <sys/socket.h>

#include <glog/logging.h>

#include <stout/error.hpp>
#include <stout/ip.hpp>
#include <stout/strings.hpp>

using std::string;
using std::vector;

namespace mesos {
namespace modules {
namespace sdn {

static const Network LOOPBACK = Network(IP(0x7f000000), 8);


// Every IPv4 address of every link is considered, including secondary
// addresses, not only the first one of each link.
Try<vector<Network>> LinkHostNetworks::networks(
    const hashset<string>& excluded)
{
  struct ifaddrs* ifaddr = nullptr;
  if (getifaddrs(&ifaddr) == -1) {
    return ErrnoError("Failed to get the addresses of the host links");
  }

  vector<Network> networks;

  for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
    if (ifa->ifa_name == nullptr ||
        ifa->ifa_addr == nullptr ||
        ifa->ifa_addr->sa_family != AF_INET) {
      continue;
    }

    // Address labels such as "eth0:1" belong to their link.
    const string link = strings::split(ifa->ifa_name, ":").front();
    if (excluded.contains(link)) {
      VLOG(1) << "Skipping link " << link;
      continue;
    }

    Try<net::IP> address = net::IP::create(*ifa->ifa_addr);
    if (address.isError()) {
      freeifaddrs(ifaddr);
      return Error(
          "Failed to get an IPv4 address of link " + link + ": " +
          address.error());
    }

    // A point-to-point link may come without a netmask.
    Try<net::IPNetwork> network = net::IPNetwork::create(address.get(), 32);
    if (ifa->ifa_netmask != nullptr) {
      Try<net::IP> netmask = net::IP::create(*ifa->ifa_netmask);
      if (netmask.isError()) {
        freeifaddrs(ifaddr);
        return Error(
            "Failed to get the netmask of link " + link + ": " +
            netmask.error());
      }

      network = net::IPNetwork::create(address.get(), netmask.get());
    }

    if (network.isError()) {
      freeifaddrs(ifaddr);
      return Error(
          "Failed to get an IPv4 network of link " + link + ": " +
          network.error());
    }

    Network hostNetwork(network->address(), network->prefix());
    if (LOOPBACK.contains(hostNetwork.address())) {
      continue;
    }

    VLOG(1) << "Found host network " << hostNetwork << " on link " << link;

    networks.push_back(hostNetwork);
  }

  freeifaddrs(ifaddr);

  return networks;
}

} // namespace sdn {
} // namespace modules {
} // namespace mesos {
