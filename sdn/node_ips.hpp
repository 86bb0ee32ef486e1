#ifndef __SDN_NODE_IPS_HPP__
#define __SDN_NODE_IPS_HPP__

#include <mutex>
#include <string>

#include <stout/hashmap.hpp>
#include <stout/option.hpp>
#include <stout/synchronized.hpp>

namespace mesos {
namespace modules {
namespace sdn {

// Holds the node IP used in creating the host subnet of each node.
// Safe to use from several threads.
class NodeIPTable
{
public:
  void put(const std::string& node, const std::string& ip)
  {
    synchronized (mutex) {
      ips[node] = ip;
    }
  }

  Option<std::string> get(const std::string& node) const
  {
    synchronized (mutex) {
      return ips.get(node);
    }
  }

  bool erase(const std::string& node)
  {
    synchronized (mutex) {
      return ips.erase(node) > 0;
    }
  }

  size_t size() const
  {
    synchronized (mutex) {
      return ips.size();
    }
  }

private:
  mutable std::mutex mutex;

  hashmap<std::string, std::string> ips;
};

} // namespace sdn {
} // namespace modules {
} // namespace mesos {

#endif // __SDN_NODE_IPS_HPP__
