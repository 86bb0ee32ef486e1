#include "vnid.hpp"

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/stringify.hpp>

using std::string;

namespace mesos {
namespace modules {
namespace sdn {

VnidMap::VnidMap(bool _multiTenant)
  : multiTenant_(_multiTenant)
{
  freeIds +=
    (Bound<uint32_t>::closed(MIN_VNID),
     Bound<uint32_t>::closed(MAX_VNID));
}


Try<Nothing> VnidMap::start(const ServiceList& services)
{
  LOG(INFO) << "Starting VNID tracking in "
            << (multiTenant_ ? "multi-tenant" : "shared") << " mode";

  foreach (const Service& service, services.items()) {
    Try<uint32_t> vnid = assign(service.tenant());
    if (vnid.isError()) {
      return Error(
          "Failed to assign a VNID to tenant '" + service.tenant() + "': " +
          vnid.error());
    }
  }

  LOG(INFO) << "Tracking " << ids.size() << " tenant(s)";

  return Nothing();
}


Try<uint32_t> VnidMap::assign(const string& tenant)
{
  if (ids.contains(tenant)) {
    return ids.at(tenant);
  }

  uint32_t vnid = GLOBAL_VNID;

  if (multiTenant_ && tenant != DEFAULT_TENANT) {
    if (freeIds.empty()) {
      return Error("Unable to allocate a VNID due to exhaustion");
    }

    vnid = freeIds.begin()->lower();
    freeIds -= vnid;
  }

  ids[tenant] = vnid;

  VLOG(1) << "Assigned VNID " << vnid << " to tenant '" << tenant << "'";

  return vnid;
}


Try<Nothing> VnidMap::revoke(const string& tenant)
{
  if (!ids.contains(tenant)) {
    return Error("Tenant '" + tenant + "' has no VNID");
  }

  uint32_t vnid = ids.at(tenant);
  ids.erase(tenant);

  if (vnid != GLOBAL_VNID) {
    freeIds += vnid;
  }

  VLOG(1) << "Revoked VNID " << vnid << " of tenant '" << tenant << "'";

  return Nothing();
}


Option<uint32_t> VnidMap::get(const string& tenant) const
{
  return ids.get(tenant);
}

} // namespace sdn {
} // namespace modules {
} // namespace mesos {
