#ifndef __SDN_MANAGER_HPP__
#define __SDN_MANAGER_HPP__

#include <mesos/mesos.hpp>
#include <mesos/log/log.hpp>
#include <mesos/module/anonymous.hpp>
#include <mesos/state/protobuf.hpp>
#include <mesos/state/storage.hpp>

#include <process/owned.hpp>

#include <stout/try.hpp>

#include "host.hpp"
#include "master.hpp"
#include "messages.hpp"
#include "state_client.hpp"

namespace mesos {
namespace modules {
namespace sdn {

// Anonymous module hosting the SDN master. Creating it reconciles the
// `ClusterNetwork` record and starts subnet allocation, so a manager
// that exists has a bootstrapped master.
class Manager : public Anonymous
{
public:
  static Try<Manager*> create(const internal::MasterConfig& masterConfig);

  virtual ~Manager();

  Master* master() const { return master_.get(); }

private:
  Manager(
      process::Owned<mesos::log::Log> _log,
      process::Owned<mesos::state::Storage> _storage,
      process::Owned<mesos::state::protobuf::State> _state,
      process::Owned<StateClient> _client,
      process::Owned<HostNetworks> _hostNetworks,
      process::Owned<Master> _master);

  // Declared in construction order so that the master goes first.
  process::Owned<mesos::log::Log> log;
  process::Owned<mesos::state::Storage> storage;
  process::Owned<mesos::state::protobuf::State> state;
  process::Owned<StateClient> client;
  process::Owned<HostNetworks> hostNetworks;
  process::Owned<Master> master_;
};

} // namespace sdn {
} // namespace modules {
} // namespace mesos {


mesos::modules::Anonymous* createSdnMasterManager(
    const mesos::Parameters& parameters);

#endif // __SDN_MANAGER_HPP__
