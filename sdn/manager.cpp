#include "manager.hpp"

#include <set>
#include <string>

#include <glog/logging.h>

#include <mesos/module.hpp>
#include <mesos/state/in_memory.hpp>
#include <mesos/state/log.hpp>
#include <mesos/zookeeper/url.hpp>

#include <process/pid.hpp>

#include <stout/duration.hpp>
#include <stout/foreach.hpp>
#include <stout/json.hpp>
#include <stout/numify.hpp>
#include <stout/option.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/protobuf.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include "isolation.hpp"

using std::set;
using std::string;

using process::Owned;
using process::UPID;

using mesos::log::Log;
using mesos::modules::Anonymous;
using mesos::modules::Module;
using mesos::modules::sdn::MESOS_QUORUM;
using mesos::modules::sdn::MESOS_ZK;
using mesos::modules::sdn::internal::MasterConfig;
using mesos::Parameters;
using mesos::state::InMemoryStorage;
using mesos::state::LogStorage;
using mesos::state::Storage;

namespace mesos {
namespace modules {
namespace sdn {

constexpr char REPLICATED_LOG_STORE[] = "sdn_replicated_log";
constexpr char REPLICATED_LOG_STORE_REPLICAS[] = "sdn_log_replicas";
constexpr char REPLICATED_LOG_METRICS_PREFIX[] = "sdn/master/";


Try<Manager*> Manager::create(const MasterConfig& masterConfig)
{
  // Nothing is set up for a plugin that is not an SDN plugin.
  if (isolationMode(masterConfig.network().network_plugin_name()) ==
      IsolationMode::INACTIVE) {
    LOG(INFO) << "Network plugin '"
              << masterConfig.network().network_plugin_name()
              << "' does not need the SDN master";

    Owned<Master> master(new Master(nullptr, nullptr));

    return new Manager(
        Owned<Log>(),
        Owned<Storage>(),
        Owned<mesos::state::protobuf::State>(),
        Owned<StateClient>(),
        Owned<HostNetworks>(),
        master);
  }

  Owned<Log> log;
  Owned<Storage> storage;

  // Check if we need to create the replicated log.
  if (masterConfig.has_replicated_log_dir()) {
    Try<Nothing> mkdir = os::mkdir(masterConfig.replicated_log_dir());
    if (mkdir.isError()) {
      return Error(
          "Unable to create replicated log directory: " +
          mkdir.error());
    }

    LOG(INFO) << "Initializing the replicated log.";

    // The ZK URL and Quorum can be specified through the JSON
    // config or through environment variables.
    Option<string> zkURL = None();
    if (masterConfig.has_zk() && masterConfig.zk().has_url()) {
      zkURL = masterConfig.zk().url();
    } else {
      zkURL = os::getenv(MESOS_ZK);
    }

    Option<uint32_t> quorum = None();
    if (masterConfig.has_zk() && masterConfig.zk().has_quorum()) {
      quorum = masterConfig.zk().quorum();
    } else {
      Option<string> _quorum = os::getenv(MESOS_QUORUM);
      if (_quorum.isSome()) {
        Try<uint32_t> result = numify<uint32_t>(_quorum.get());
        if (result.isError()) {
          return Error(
              "Error parsing environment variable 'MESOS_QUORUM'(" +
              _quorum.get() + "): " + result.error());
        }

        quorum = result.get();
      }
    }

    if (zkURL.isSome() && quorum.isNone()) {
      return Error(
          "Cannot use replicated log with ZK URL '" + zkURL.get() +
          "' without a quorum. Please specify quorum to be "
          "used with zookeeper");
    }

    if (zkURL.isSome() && quorum.isSome()) {
      LOG(INFO)
        << "Using replicated log with zookeeper URL "
        << zkURL.get() << " with a quorum of " << quorum.get();

      if (strings::startsWith(zkURL.get(), "file://")) {
        const string path = zkURL.get().substr(7);

        Try<string> read = os::read(path);
        if (read.isError()) {
          return Error("Error reading zookeeper configuration file '" +
                       path + "': " + read.error());
        }

        zkURL = strings::trim(read.get());
      }

      Try<zookeeper::URL> url = zookeeper::URL::parse(zkURL.get());
      if (url.isError()) {
        return Error("Error parsing ZooKeeper URL: " + url.error());
      }

      log = Owned<Log>(new Log(
          (int) quorum.get(),
          path::join(
            masterConfig.replicated_log_dir(),
            REPLICATED_LOG_STORE),
          url->servers,
          Seconds(masterConfig.zk().session_timeout()),
          path::join(url->path, REPLICATED_LOG_STORE_REPLICAS),
          url->authentication,
          true,
          string(REPLICATED_LOG_METRICS_PREFIX)));
    } else {
      LOG(INFO)
        << "Using replicated log with local storage with a quorum of one.";

      log = Owned<Log>(new Log(
          1,
          path::join(
            masterConfig.replicated_log_dir(),
            REPLICATED_LOG_STORE),
          set<UPID>(),
          true,
          string(REPLICATED_LOG_METRICS_PREFIX)));
    }

    storage = Owned<Storage>(new LogStorage(log.get()));
  } else {
    LOG(WARNING)
      << "No `replicated_log_dir` given, SDN records are kept in memory"
      << " and are lost when the master restarts";

    storage = Owned<Storage>(new InMemoryStorage());
  }

  Try<Duration> storeTimeout = Minutes(1);
  if (masterConfig.has_store_timeout()) {
    storeTimeout = Duration::parse(masterConfig.store_timeout());
    if (storeTimeout.isError()) {
      return Error("Error parsing storeTimeout: " + storeTimeout.error());
    }
  }

  Owned<mesos::state::protobuf::State> state(
      new mesos::state::protobuf::State(storage.get()));

  Owned<StateClient> client(
      new StateClient(state.get(), storeTimeout.get()));

  Owned<HostNetworks> hostNetworks(new LinkHostNetworks());

  Owned<Master> master(new Master(client.get(), hostNetworks.get()));

  Try<Option<Reconciler::Outcome>, SdnError> started =
    master->start(masterConfig.network());

  if (started.isError()) {
    return Error(
        "Failed to start the SDN master (" +
        stringify(started.error().kind) + "): " + started.error().message);
  }

  return new Manager(log, storage, state, client, hostNetworks, master);
}


Manager::Manager(
    Owned<Log> _log,
    Owned<Storage> _storage,
    Owned<mesos::state::protobuf::State> _state,
    Owned<StateClient> _client,
    Owned<HostNetworks> _hostNetworks,
    Owned<Master> _master)
  : log(_log),
    storage(_storage),
    state(_state),
    client(_client),
    hostNetworks(_hostNetworks),
    master_(_master) {}


Manager::~Manager()
{
  LOG(INFO) << "Shutting down the SDN master manager...";
}

} // namespace sdn {
} // namespace modules {
} // namespace mesos {


using mesos::modules::sdn::Manager;


Anonymous* createSdnMasterManager(const Parameters& parameters)
{
  Option<MasterConfig> masterConfig = None();

  foreach (const mesos::Parameter& parameter, parameters.parameter()) {
    LOG(INFO) << "SDN master parameter '" << parameter.key()
              << "=" << parameter.value() << "'";

    if (parameter.key() == "master_config") {
      if (!os::exists(parameter.value())) {
        LOG(ERROR) << "Unable to find Master configuration "
                   << parameter.value();
        return nullptr;
      }

      Try<string> config = os::read(parameter.value());
      if (config.isError()) {
        LOG(ERROR) << "Unable to read the Master "
                   << "configuration: " << config.error();
        return nullptr;
      }

      auto parseMasterConfig = [](const string& s) -> Try<MasterConfig> {
        Try<JSON::Object> json = JSON::parse<JSON::Object>(s);
        if (json.isError()) {
          return Error("JSON parse failed: " + json.error());
        }

        Try<MasterConfig> parse =
          ::protobuf::parse<MasterConfig>(json.get());

        if (parse.isError()) {
          return Error("Protobuf parse failed: " + parse.error());
        }

        return parse.get();
      };

      Try<MasterConfig> _masterConfig = parseMasterConfig(config.get());
      if (_masterConfig.isError()) {
        LOG(ERROR)
          << "Unable to parse the Master JSON configuration: "
          << _masterConfig.error();
        return nullptr;
      }

      masterConfig = _masterConfig.get();
    }
  }

  if (masterConfig.isNone()) {
    LOG(ERROR) << "Missing `master_config`";
    return nullptr;
  }

  Try<Manager*> manager = Manager::create(masterConfig.get());
  if (manager.isError()) {
    LOG(ERROR)
      << "Unable to create the SDN master manager module: "
      << manager.error();
    return nullptr;
  }

  return manager.get();
}


// Declares a helper module named 'SdnMasterManager'.
Module<Anonymous> com_mesosphere_mesos_SdnMasterManager(
    MESOS_MODULE_API_VERSION,
    MESOS_VERSION,
    "Mesosphere",
    "help@mesosphere.io",
    "Master SDN Helper Module",
    nullptr,
    createSdnMasterManager);
