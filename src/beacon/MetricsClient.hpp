#ifndef __SB_METRICS_CLIENT__
#define __SB_METRICS_CLIENT__

#include "GraphRegistry.hpp"
#include "Headers.hpp"
#include "HostInfo.hpp"
#include "MetricsOptions.hpp"
#include "ReportBuilder.hpp"
#include "ReportTransport.hpp"
#include "StateStore.hpp"
#include "TaskScheduler.hpp"

namespace sb {
/**
 * @brief Periodically reports usage statistics unless the server owner
 * opted out.
 *
 * The opt-out flag lives in the StateStore and is re-read on every check,
 * so an operator can flip it while the host runs; the next tick then
 * cancels the reporting task, tells every graph through `onOptOut()` and
 * sends its last report.
 *
 * At most one reporting task exists per client.  `start`, `enable`,
 * `disable`, `isOptedOut` and the opt-out check of each tick share
 * `optOutMutex`.  Reports are built and sent outside of it.
 *
 * A failed report is dropped and retried on the next tick.  It is logged
 * at INFO when the persisted debug flag is set.
 */
class MetricsClient {
 public:
  /**
   * @brief Loads the persisted state, generating and saving an id on the
   * first run.  A null `_environment` selects SystemEnvironmentProvider.
   * @throws StateStoreError if a first-run state cannot be saved.
   */
  MetricsClient(shared_ptr<HostInfoProvider> _host,
                shared_ptr<EnvironmentProvider> _environment,
                shared_ptr<StateStore> _store,
                shared_ptr<TaskScheduler> _scheduler,
                shared_ptr<ReportTransport> _transport,
                const MetricsOptions& _options = MetricsOptions());

  /** @brief Cancels the reporting task and waits for a running tick. */
  virtual ~MetricsClient();

  /**
   * @brief Client with the default collaborators: ini file in the user
   * config directory, thread scheduler and HTTP transport.
   */
  static shared_ptr<MetricsClient> create(
      shared_ptr<HostInfoProvider> host,
      const MetricsOptions& options = MetricsOptions());

  /** @brief Returns the graph called `name`, creating it if needed. */
  shared_ptr<Graph> createGraph(const string& name);

  /** @brief Registers a host constructed graph, de-duplicated by name. */
  void addGraph(const shared_ptr<Graph>& graph);

  /**
   * @brief Starts reporting.
   * @return false if opted out, true if a task runs after the call.
   */
  bool start();

  /**
   * @brief Re-reads the persisted opt-out flag.  Any failure to read it
   * counts as opted out.
   */
  bool isOptedOut();

  /** @brief Clears the opt-out flag and starts reporting. */
  void enable();

  /** @brief Sets the opt-out flag and stops reporting. */
  void disable();

  bool isRunning();

  /** @brief Location of the persisted settings. */
  string getConfigFile() const { return store->location(); }

  const string& getGuid() const { return guid; }

  bool isDebug() const { return debug; }

  shared_ptr<GraphRegistry> getGraphRegistry() const { return graphs; }

  /**
   * @brief Builds and sends one report, resetting the plotters if the
   * server says it was the first update of its window.
   * @throws DeliveryError or std::runtime_error when the report failed.
   */
  SubmitResult submitNow(bool isPing);

 protected:
  /**
   * @brief Body of the reporting task.  Does nothing unless the task
   * started as `generation` is still the current one.
   */
  void tick(const shared_ptr<bool>& firstPost, uint64_t generation);

  /** @brief isOptedOut() without locking.  Needs optOutMutex. */
  bool isOptedOutLocked();

  /** @brief start() without locking.  Needs optOutMutex. */
  bool startLocked();

  /**
   * @brief Persisted state to modify, falling back to the cached values if
   * the document cannot be read.  Needs optOutMutex.
   */
  PersistedState currentStateLocked();

  /**
   * @brief Cancels and clears the task, keeping its handle in
   * `pendingTasks`.  Needs optOutMutex.
   */
  void cancelTaskLocked();

  shared_ptr<HostInfoProvider> host;
  shared_ptr<EnvironmentProvider> environment;
  shared_ptr<StateStore> store;
  shared_ptr<TaskScheduler> scheduler;
  shared_ptr<ReportTransport> transport;
  MetricsOptions options;
  shared_ptr<GraphRegistry> graphs;
  unique_ptr<ReportBuilder> reportBuilder;
  /** @brief Persisted id, fixed for the life of the client. */
  string guid;
  /** @brief Persisted debug flag, read once at construction. */
  bool debug;
  /** @brief Guards the opt-out flag and `task`. */
  recursive_mutex optOutMutex;
  /** @brief The reporting task, null when not running. */
  shared_ptr<ScheduledTask> task;
  /** @brief Incremented for every task started. */
  uint64_t taskGeneration;
  /**
   * @brief Cancelled tasks whose last tick may still run.  The destructor
   * waits for them.
   */
  vector<shared_ptr<ScheduledTask>> pendingTasks;
};
}  // namespace sb

#endif  // __SB_METRICS_CLIENT__
