#ifndef __SDN_NETWORK_HPP__
#define __SDN_NETWORK_HPP__

#include <stdint.h>

#include <arpa/inet.h>

#include <ostream>
#include <string>

#include <stout/error.hpp>
#include <stout/ip.hpp>
#include <stout/stringify.hpp>
#include <stout/try.hpp>

namespace mesos {
namespace modules {
namespace sdn {

// IPv4 address. Adds the discrete increment and decrement operators
// required to keep addresses in an `IntervalSet`.
class IP : public net::IP
{
public:
  IP()
    : net::IP(0) {}

  // `address` is in host byte order.
  IP(const uint32_t address)
    : net::IP(address) {}

  IP(const struct in_addr& storage)
    : net::IP(storage) {}

  static Try<IP> convert(const net::IP& ip);
  static Try<IP> parse(const std::string& value);

  // Returns the address in host byte order.
  uint32_t value() const
  {
    return ntohl(in().get().s_addr);
  }

  bool operator==(const IP& that) const
  {
    return net::IP::operator==(that);
  }

  bool operator!=(const IP& that) const
  {
    return net::IP::operator!=(that);
  }

  bool operator<(const IP& that) const
  {
    return value() < that.value();
  }

  bool operator>(const IP& that) const
  {
    return value() > that.value();
  }

  IP& operator++()
  {
    *this = IP(value() + 1);
    return *this;
  }

  IP& operator--()
  {
    *this = IP(value() - 1);
    return *this;
  }
};


inline Try<IP> IP::convert(const net::IP& ip)
{
  if (ip.family() != AF_INET) {
    return Error("Only IPv4 addresses are supported: " + stringify(ip));
  }

  return IP(ip.in().get());
}


inline Try<IP> IP::parse(const std::string& value)
{
  Try<net::IP> ip = net::IP::parse(value, AF_INET);
  if (ip.isError()) {
    return Error(ip.error());
  }

  return IP(ip->in().get());
}


// Returns the string representation of the given IP using the
// canonical form, for example: "10.0.0.1".
inline std::ostream& operator<<(std::ostream& stream, const IP& ip)
{
  return stream << static_cast<const net::IP&>(ip);
}


// IPv4 network in CIDR notation. The address keeps whatever host bits
// it was created with; use `canonical()` to clear them.
class Network : public net::IPNetwork
{
public:
  Network()
    : net::IPNetwork(net::IP(0), net::IP(0)),
      prefix_(0) {}

  Network(const net::IP& address, uint8_t prefix)
    : net::IPNetwork(address, toMask(prefix)),
      prefix_(prefix) {}

  // Parses an IPv4 network such as "10.128.0.0/14".
  static Try<Network> parse(const std::string& value);

  // Helper function to convert prefix to netmask.
  static net::IP toMask(uint8_t prefix);

  uint8_t prefix() const { return prefix_; }

  // First address of the network.
  IP begin() const
  {
    return IP(address().in().get()).value() & mask();
  }

  // Last address of the network.
  IP end() const
  {
    return begin().value() | ~mask();
  }

  // The same network with the host bits of the address cleared, for
  // example "10.128.1.0/14" becomes "10.128.0.0/14".
  Network canonical() const
  {
    return Network(begin(), prefix_);
  }

  bool contains(const net::IP& ip) const
  {
    if (ip.family() != AF_INET) {
      return false;
    }

    return (IP(ip.in().get()).value() & mask()) == begin().value();
  }

  bool contains(const Network& that) const
  {
    return prefix_ <= that.prefix() && contains(that.address());
  }

  // Two CIDR blocks intersect iff one of them contains the other.
  bool overlaps(const Network& that) const
  {
    return contains(that.address()) || that.contains(address());
  }

  bool operator==(const Network& that) const
  {
    return net::IPNetwork::operator==(that);
  }

  bool operator!=(const Network& that) const
  {
    return net::IPNetwork::operator!=(that);
  }

  bool operator<(const Network& that) const
  {
    if (prefix_ != that.prefix()) {
      return prefix_ > that.prefix();
    } else {
      return begin() < that.begin();
    }
  }

  bool operator>(const Network& that) const
  {
    if (prefix_ != that.prefix()) {
      return prefix_ < that.prefix();
    } else {
      return begin() > that.begin();
    }
  }

  // Moves to the adjacent network of the same prefix length.
  Network& operator++()
  {
    *this = Network(IP(static_cast<uint32_t>(begin().value() + size())), prefix_);
    return *this;
  }

  Network& operator--()
  {
    *this = Network(IP(static_cast<uint32_t>(begin().value() - size())), prefix_);
    return *this;
  }

private:
  uint32_t mask() const
  {
    return prefix_ == 0 ? 0 : 0xffffffff << (32 - prefix_);
  }

  uint64_t size() const
  {
    return static_cast<uint64_t>(1) << (32 - prefix_);
  }

  uint8_t prefix_;
};


inline Try<Network> Network::parse(const std::string& value)
{
  Try<net::IPNetwork> ipNetwork = net::IPNetwork::parse(value, AF_INET);
  if (ipNetwork.isError()) {
    return Error(ipNetwork.error());
  }

  return Network(ipNetwork->address(), ipNetwork->prefix());
}


inline net::IP Network::toMask(uint8_t prefix)
{
  uint32_t mask = prefix == 0 ? 0 : 0xffffffff << (32 - prefix);
  return net::IP(mask);
}


// Returns the string representation of the given IP network using the
// canonical form with prefix. For example: "10.128.0.0/14".
inline std::ostream& operator<<(std::ostream& stream, const Network& network)
{
  return stream << static_cast<const net::IPNetwork&>(network);
}

} // namespace sdn {
} // namespace modules {
} // namespace mesos {

#endif // __SDN_NETWORK_HPP__
