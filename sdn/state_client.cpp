#include "state_client.hpp"

#include <set>

#include <process/future.hpp>

#include <stout/foreach.hpp>
#include <stout/none.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

using std::set;
using std::string;
using std::vector;

using process::Future;

using mesos::state::protobuf::Variable;

namespace mesos {
namespace modules {
namespace sdn {

constexpr char CLUSTER_NETWORK_KEY_PREFIX[] = "cluster-network/";
constexpr char HOST_SUBNET_KEY_PREFIX[] = "host-subnet/";
constexpr char SERVICE_KEY_PREFIX[] = "service/";


// Waits for `future` and turns anything but a ready future into an
// `Error`.
template <typename T>
static Try<T> awaitReady(
    const Future<T>& future,
    const Duration& timeout,
    const string& operation)
{
  if (!future.await(timeout)) {
    Future<T>(future).discard();

    return Error(
        "Failed to " + operation + " within " + stringify(timeout));
  }

  if (!future.isReady()) {
    return Error(
        "Failed to " + operation + ": " +
        (future.isFailed() ? future.failure() : "discarded"));
  }

  return future.get();
}


StateClient::StateClient(
    mesos::state::protobuf::State* _state,
    const Duration& _timeout)
  : state(_state),
    timeout(_timeout) {}


template <typename T>
Try<Variable<T>> StateClient::fetch(const string& key)
{
  return awaitReady(state->fetch<T>(key), timeout, "fetch '" + key + "'");
}


template <typename T>
Try<T> StateClient::store(
    const string& key,
    const Variable<T>& variable,
    const T& value)
{
  Try<Option<Variable<T>>> stored = awaitReady(
      state->store(variable.mutate(value)),
      timeout,
      "store '" + key + "'");

  if (stored.isError()) {
    return Error(stored.error());
  }

  // The variable was written by someone else since we fetched it.
  if (stored->isNone()) {
    return Error("Failed to store '" + key + "': concurrent modification");
  }

  return stored->get().get();
}


Try<vector<string>> StateClient::names(const string& prefix)
{
  Try<set<string>> names = awaitReady(state->names(), timeout, "list names");
  if (names.isError()) {
    return Error(names.error());
  }

  vector<string> result;
  foreach (const string& name, names.get()) {
    if (strings::startsWith(name, prefix)) {
      result.push_back(name);
    }
  }

  return result;
}


Result<ClusterNetwork> StateClient::getClusterNetwork(const string& name)
{
  Try<Variable<ClusterNetwork>> variable =
    fetch<ClusterNetwork>(CLUSTER_NETWORK_KEY_PREFIX + name);

  if (variable.isError()) {
    return Error(variable.error());
  }

  // A variable that has never been stored holds an empty record.
  if (!variable->get().has_name()) {
    return None();
  }

  return variable->get();
}


Try<ClusterNetwork> StateClient::createClusterNetwork(
    const ClusterNetwork& clusterNetwork)
{
  const string key = CLUSTER_NETWORK_KEY_PREFIX + clusterNetwork.name();

  Try<Variable<ClusterNetwork>> variable = fetch<ClusterNetwork>(key);
  if (variable.isError()) {
    return Error(variable.error());
  }

  if (variable->get().has_name()) {
    return Error(
        "Cluster network '" + clusterNetwork.name() + "' already exists");
  }

  return store(key, variable.get(), clusterNetwork);
}


Try<ClusterNetwork> StateClient::updateClusterNetwork(
    const ClusterNetwork& clusterNetwork)
{
  const string key = CLUSTER_NETWORK_KEY_PREFIX + clusterNetwork.name();

  Try<Variable<ClusterNetwork>> variable = fetch<ClusterNetwork>(key);
  if (variable.isError()) {
    return Error(variable.error());
  }

  if (!variable->get().has_name()) {
    return Error(
        "Cluster network '" + clusterNetwork.name() + "' does not exist");
  }

  return store(key, variable.get(), clusterNetwork);
}


Try<HostSubnetList> StateClient::listHostSubnets()
{
  Try<vector<string>> keys = names(HOST_SUBNET_KEY_PREFIX);
  if (keys.isError()) {
    return Error(keys.error());
  }

  HostSubnetList list;

  foreach (const string& key, keys.get()) {
    Try<Variable<HostSubnet>> variable = fetch<HostSubnet>(key);
    if (variable.isError()) {
      return Error(variable.error());
    }

    if (variable->get().has_host()) {
      list.add_items()->CopyFrom(variable->get());
    }
  }

  return list;
}


Result<HostSubnet> StateClient::getHostSubnet(const string& host)
{
  Try<Variable<HostSubnet>> variable =
    fetch<HostSubnet>(HOST_SUBNET_KEY_PREFIX + host);

  if (variable.isError()) {
    return Error(variable.error());
  }

  if (!variable->get().has_host()) {
    return None();
  }

  return variable->get();
}


Try<HostSubnet> StateClient::createHostSubnet(const HostSubnet& hostSubnet)
{
  const string key = HOST_SUBNET_KEY_PREFIX + hostSubnet.host();

  Try<Variable<HostSubnet>> variable = fetch<HostSubnet>(key);
  if (variable.isError()) {
    return Error(variable.error());
  }

  if (variable->get().has_host()) {
    return Error(
        "Host subnet for '" + hostSubnet.host() + "' already exists");
  }

  return store(key, variable.get(), hostSubnet);
}


Try<HostSubnet> StateClient::updateHostSubnet(const HostSubnet& hostSubnet)
{
  const string key = HOST_SUBNET_KEY_PREFIX + hostSubnet.host();

  Try<Variable<HostSubnet>> variable = fetch<HostSubnet>(key);
  if (variable.isError()) {
    return Error(variable.error());
  }

  if (!variable->get().has_host()) {
    return Error(
        "Host subnet for '" + hostSubnet.host() + "' does not exist");
  }

  return store(key, variable.get(), hostSubnet);
}


Try<Nothing> StateClient::deleteHostSubnet(const string& host)
{
  const string key = HOST_SUBNET_KEY_PREFIX + host;

  Try<Variable<HostSubnet>> variable = fetch<HostSubnet>(key);
  if (variable.isError()) {
    return Error(variable.error());
  }

  if (!variable->get().has_host()) {
    return Error("Host subnet for '" + host + "' does not exist");
  }

  Try<bool> expunged = awaitReady(
      state->expunge(variable.get()),
      timeout,
      "expunge '" + key + "'");

  if (expunged.isError()) {
    return Error(expunged.error());
  }

  if (!expunged.get()) {
    return Error("Failed to expunge '" + key + "': concurrent modification");
  }

  return Nothing();
}


Try<ServiceList> StateClient::listServices()
{
  Try<vector<string>> keys = names(SERVICE_KEY_PREFIX);
  if (keys.isError()) {
    return Error(keys.error());
  }

  ServiceList list;

  foreach (const string& key, keys.get()) {
    Try<Variable<Service>> variable = fetch<Service>(key);
    if (variable.isError()) {
      return Error(variable.error());
    }

    if (variable->get().has_name()) {
      list.add_items()->CopyFrom(variable->get());
    }
  }

  return list;
}


Try<Service> StateClient::createService(const Service& service)
{
  const string key =
    SERVICE_KEY_PREFIX + service.tenant() + "/" + service.name();

  Try<Variable<Service>> variable = fetch<Service>(key);
  if (variable.isError()) {
    return Error(variable.error());
  }

  if (variable->get().has_name()) {
    return Error(
        "Service '" + service.tenant() + "/" + service.name() +
        "' already exists");
  }

  return store(key, variable.get(), service);
}

} // namespace sdn {
} // namespace modules {
} // namespace mesos {
