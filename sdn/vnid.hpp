#ifndef __SDN_VNID_HPP__
#define __SDN_VNID_HPP__

#include <stdint.h>

#include <string>

#include <stout/hashmap.hpp>
#include <stout/interval.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include <sdn/sdn.hpp>

namespace mesos {
namespace modules {
namespace sdn {

// Tracks the virtual network ID (VNID) of every tenant. In
// multi-tenant mode each tenant gets its own VNID, except for the
// `default` tenant which shares `GLOBAL_VNID` with everyone. In shared
// mode every tenant uses `GLOBAL_VNID` and isolation is left to
// network policies.
class VnidMap
{
public:
  explicit VnidMap(bool _multiTenant);

  // Assigns a VNID to the tenant of every service.
  Try<Nothing> start(const ServiceList& services);

  // Returns the VNID of `tenant`, assigning one if needed.
  Try<uint32_t> assign(const std::string& tenant);

  Try<Nothing> revoke(const std::string& tenant);

  Option<uint32_t> get(const std::string& tenant) const;

  bool multiTenant() const { return multiTenant_; }

  size_t size() const { return ids.size(); }

private:
  const bool multiTenant_;

  hashmap<std::string, uint32_t> ids;

  // Unused VNIDs between `MIN_VNID` and `MAX_VNID`.
  IntervalSet<uint32_t> freeIds;
};

} // namespace sdn {
} // namespace modules {
} // namespace mesos {

#endif // __SDN_VNID_HPP__
