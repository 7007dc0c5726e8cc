#include "MetricsClient.hpp"

#include "HttpReportTransport.hpp"
#include "IniStateStore.hpp"
#include "ThreadTaskScheduler.hpp"

namespace sb {
MetricsClient::MetricsClient(shared_ptr<HostInfoProvider> _host,
                             shared_ptr<EnvironmentProvider> _environment,
                             shared_ptr<StateStore> _store,
                             shared_ptr<TaskScheduler> _scheduler,
                             shared_ptr<ReportTransport> _transport,
                             const MetricsOptions& _options)
    : host(_host),
      environment(_environment),
      store(_store),
      scheduler(_scheduler),
      transport(_transport),
      options(_options),
      graphs(new GraphRegistry()),
      debug(false),
      taskGeneration(0) {
  CHECK(host) << "Host info provider cannot be null";
  CHECK(store) << "State store cannot be null";
  CHECK(scheduler) << "Task scheduler cannot be null";
  CHECK(transport) << "Report transport cannot be null";
  CHECK(options.pingIntervalMinutes > 0)
      << "Ping interval must be positive: " << options.pingIntervalMinutes;

  if (store->exists()) {
    try {
      PersistedState state = store->load();
      debug = state.debug;
      guid = state.guid;
      if (guid.empty()) {
        state.guid = sole::uuid4().str();
        guid = state.guid;
        store->save(state);
      }
    } catch (const StateStoreError& e) {
      // Leave a broken document alone: isOptedOut() reports true until an
      // operator fixes it, so nothing is sent with this throwaway id.
      LOG(WARNING) << "[Metrics] Cannot use " << store->location() << ": "
                   << e.what();
      guid = sole::uuid4().str();
    }
  } else {
    PersistedState state;
    state.guid = sole::uuid4().str();
    guid = state.guid;
    store->save(state);
    LOG(INFO) << "[Metrics] Created " << store->location()
              << ". Set opt-out to true there to stop sending usage "
                 "statistics.";
  }

  if (!environment) {
    environment.reset(new SystemEnvironmentProvider());
  }
  reportBuilder.reset(new ReportBuilder(guid, host, environment, graphs));
  VLOG(1) << "[Metrics] StatsBeacon " << SB_VERSION << " reporting "
          << host->getPluginName() << " to " << options.baseUrl;
}

MetricsClient::~MetricsClient() {
  vector<shared_ptr<ScheduledTask>> oldTasks;
  {
    lock_guard<recursive_mutex> guard(optOutMutex);
    if (task) {
      cancelTaskLocked();
    }
    oldTasks.swap(pendingTasks);
  }
  // A tick of a cancelled task may still be submitting
  for (auto& oldTask : oldTasks) {
    oldTask->waitUntilIdle();
  }
}

shared_ptr<MetricsClient> MetricsClient::create(
    shared_ptr<HostInfoProvider> host, const MetricsOptions& options) {
  return make_shared<MetricsClient>(
      host, make_shared<SystemEnvironmentProvider>(),
      make_shared<IniStateStore>(IniStateStore::defaultLocation()),
      make_shared<ThreadTaskScheduler>(),
      make_shared<HttpReportTransport>(options), options);
}

shared_ptr<Graph> MetricsClient::createGraph(const string& name) {
  return graphs->createGraph(name);
}

void MetricsClient::addGraph(const shared_ptr<Graph>& graph) {
  graphs->addGraph(graph);
}

bool MetricsClient::start() {
  lock_guard<recursive_mutex> guard(optOutMutex);
  return startLocked();
}

bool MetricsClient::startLocked() {
  if (isOptedOutLocked()) {
    return false;
  }
  if (task) {
    return true;
  }

  // Numbering of pings starts over with every task
  auto firstPost = make_shared<bool>(true);
  uint64_t generation = ++taskGeneration;
  task = scheduler->scheduleRepeating(
      [this, firstPost, generation]() { tick(firstPost, generation); },
      chrono::milliseconds(0), chrono::minutes(options.pingIntervalMinutes));
  VLOG(1) << "[Metrics] Reporting every " << options.pingIntervalMinutes
          << " minute(s)";
  return true;
}

bool MetricsClient::isOptedOut() {
  lock_guard<recursive_mutex> guard(optOutMutex);
  return isOptedOutLocked();
}

bool MetricsClient::isOptedOutLocked() {
  try {
    return store->load().optOut;
  } catch (const std::exception& e) {
    if (debug) {
      LOG(INFO) << "[Metrics] " << e.what();
    }
    return true;
  }
}

PersistedState MetricsClient::currentStateLocked() {
  try {
    return store->load();
  } catch (const std::exception& e) {
    VLOG(1) << "[Metrics] Rewriting unreadable config: " << e.what();
    PersistedState state;
    state.guid = guid;
    state.debug = debug;
    return state;
  }
}

void MetricsClient::enable() {
  lock_guard<recursive_mutex> guard(optOutMutex);
  if (isOptedOutLocked()) {
    PersistedState state = currentStateLocked();
    state.optOut = false;
    store->save(state);
  }
  if (!task) {
    startLocked();
  }
}

void MetricsClient::disable() {
  lock_guard<recursive_mutex> guard(optOutMutex);
  if (!isOptedOutLocked()) {
    PersistedState state = currentStateLocked();
    state.optOut = true;
    store->save(state);
  }
  if (task) {
    cancelTaskLocked();
  }
}

bool MetricsClient::isRunning() {
  lock_guard<recursive_mutex> guard(optOutMutex);
  return task != nullptr;
}

void MetricsClient::cancelTaskLocked() {
  pendingTasks.erase(
      std::remove_if(pendingTasks.begin(), pendingTasks.end(),
                     [](const shared_ptr<ScheduledTask>& pending) {
                       return pending->isIdle();
                     }),
      pendingTasks.end());
  task->cancel();
  pendingTasks.push_back(task);
  task.reset();
}

void MetricsClient::tick(const shared_ptr<bool>& firstPost,
                         uint64_t generation) {
  {
    lock_guard<recursive_mutex> guard(optOutMutex);
    if (!task || generation != taskGeneration) {
      // Stopped or restarted while this tick was waiting for the lock
      return;
    }
    if (isOptedOutLocked()) {
      cancelTaskLocked();
      LOG(INFO) << "[Metrics] Opted out, no longer sending usage statistics";
      graphs->notifyOptOut();
      // The tick still sends its report
    }
  }

  bool isPing = !*firstPost;
  try {
    submitNow(isPing);
    // Pings start after the first report that got through
    *firstPost = false;
  } catch (const std::exception& e) {
    if (debug) {
      LOG(INFO) << "[Metrics] " << e.what();
    } else {
      VLOG(1) << "[Metrics] Report failed: " << e.what();
    }
  }
}

SubmitResult MetricsClient::submitNow(bool isPing) {
  string payload = reportBuilder->build(isPing);
  auto response = transport->submit(host->getPluginName(), payload, debug);
  SubmitResult result = parseSubmitResponse(response);
  if (result == SubmitResult::FIRST_UPDATE_THIS_HOUR) {
    VLOG(1) << "[Metrics] First update this hour, resetting plotters";
    graphs->resetPlotters();
  }
  return result;
}
}  // namespace sb
