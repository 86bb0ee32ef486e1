#ifndef __SDN_ERRORS_HPP__
#define __SDN_ERRORS_HPP__

#include <ostream>
#include <string>
#include <vector>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/strings.hpp>

namespace mesos {
namespace modules {
namespace sdn {

// A single inconsistency between the desired address space and the
// host or the cluster objects.
struct Violation
{
  enum Kind
  {
    HOST_NETWORK_CONFLICT,
    HOST_SUBNET_UNPARSABLE,
    HOST_SUBNET_OUTSIDE_CLUSTER_NETWORK,
    HOST_SUBNET_COLLISION,
    SERVICE_IP_UNPARSABLE,
    SERVICE_IP_OUTSIDE_SERVICE_NETWORK
  };

  Violation(Kind _kind, const std::string& _detail)
    : kind(_kind), detail(_detail) {}

  Kind kind;
  std::string detail;
};


// Error returned by the SDN master. `CONFLICT` errors carry every
// violation that was found, in the order it was found.
class SdnError : public Error
{
public:
  enum Kind
  {
    CONFIGURATION,
    TRANSPORT,
    CONFLICT,
    BOOTSTRAP
  };

  static SdnError configuration(const std::string& message)
  {
    return SdnError(CONFIGURATION, message);
  }

  static SdnError transport(const std::string& message)
  {
    return SdnError(TRANSPORT, message);
  }

  static SdnError bootstrap(const std::string& message)
  {
    return SdnError(BOOTSTRAP, message);
  }

  static SdnError conflict(const std::vector<Violation>& violations)
  {
    return SdnError(violations);
  }

  const Kind kind;
  const std::vector<Violation> violations;

private:
  SdnError(Kind _kind, const std::string& message)
    : Error(message), kind(_kind) {}

  explicit SdnError(const std::vector<Violation>& _violations)
    : Error(render(_violations)),
      kind(CONFLICT),
      violations(_violations) {}

  // A single violation renders as its detail, several as
  // "[first, second, ...]".
  static std::string render(const std::vector<Violation>& violations)
  {
    if (violations.size() == 1) {
      return violations.front().detail;
    }

    std::vector<std::string> details;
    foreach (const Violation& violation, violations) {
      details.push_back(violation.detail);
    }

    return "[" + strings::join(", ", details) + "]";
  }
};


inline std::ostream& operator<<(std::ostream& stream, SdnError::Kind kind)
{
  switch (kind) {
    case SdnError::CONFIGURATION: return stream << "configuration error";
    case SdnError::TRANSPORT:     return stream << "transport error";
    case SdnError::CONFLICT:      return stream << "conflict error";
    case SdnError::BOOTSTRAP:     return stream << "bootstrap error";
  }

  return stream << "unknown error";
}

} // namespace sdn {
} // namespace modules {
} // namespace mesos {

#endif // __SDN_ERRORS_HPP__
