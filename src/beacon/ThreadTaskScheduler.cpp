#include "ThreadTaskScheduler.hpp"

namespace sb {
class ThreadTaskScheduler::RepeatingTask
    : public ScheduledTask,
      public std::enable_shared_from_this<RepeatingTask> {
 public:
  RepeatingTask(function<void()> _action, chrono::milliseconds _initialDelay,
                chrono::milliseconds _period)
      : action(_action),
        initialDelay(_initialDelay),
        period(_period),
        cancelled(false),
        running(false),
        finished(false) {}

  ~RepeatingTask() {
    if (worker && worker->joinable()) {
      if (worker->get_id() == this_thread::get_id()) {
        worker->detach();
      } else {
        worker->join();
      }
    }
  }

  void start() {
    // The thread keeps the task alive until it returns
    auto self = shared_from_this();
    worker.reset(new thread([self]() { self->run(); }));
  }

  void cancel() override {
    {
      lock_guard<mutex> guard(taskMutex);
      cancelled = true;
    }
    taskCv.notify_all();
  }

  bool isCancelled() const override {
    lock_guard<mutex> guard(taskMutex);
    return cancelled;
  }

  bool isIdle() const override {
    lock_guard<mutex> guard(taskMutex);
    return finished || (cancelled && !running);
  }

  void waitUntilIdle() override {
    unique_lock<mutex> lock(taskMutex);
    if (workerId == this_thread::get_id()) {
      return;
    }
    taskCv.wait(lock, [this] { return finished || (cancelled && !running); });
  }

  bool isFinished() const {
    lock_guard<mutex> guard(taskMutex);
    return finished;
  }

  void join() {
    if (worker && worker->joinable() &&
        worker->get_id() != this_thread::get_id()) {
      worker->join();
    }
  }

 protected:
  void run() {
    auto nextRun = chrono::steady_clock::now() + initialDelay;
    {
      lock_guard<mutex> guard(taskMutex);
      workerId = this_thread::get_id();
    }
    while (true) {
      {
        unique_lock<mutex> lock(taskMutex);
        if (taskCv.wait_until(lock, nextRun, [this] { return cancelled; })) {
          break;
        }
        running = true;
      }
      try {
        action();
      } catch (const std::exception& e) {
        STERROR << "Repeating task failed: " << e.what();
      }
      {
        lock_guard<mutex> guard(taskMutex);
        running = false;
      }
      taskCv.notify_all();
      nextRun = chrono::steady_clock::now() + period;
    }
    {
      lock_guard<mutex> guard(taskMutex);
      finished = true;
    }
    taskCv.notify_all();
  }

  function<void()> action;
  chrono::milliseconds initialDelay;
  chrono::milliseconds period;
  mutable mutex taskMutex;
  condition_variable taskCv;
  bool cancelled;
  bool running;
  bool finished;
  thread::id workerId;
  unique_ptr<thread> worker;
};

ThreadTaskScheduler::ThreadTaskScheduler() : shuttingDown(false) {}

ThreadTaskScheduler::~ThreadTaskScheduler() { shutdown(); }

shared_ptr<ScheduledTask> ThreadTaskScheduler::scheduleRepeating(
    function<void()> action, chrono::milliseconds initialDelay,
    chrono::milliseconds period) {
  CHECK(action) << "Cannot schedule an empty action";
  CHECK(period.count() > 0) << "Repeating task needs a positive period";
  lock_guard<mutex> guard(tasksMutex);
  if (shuttingDown) {
    throw std::runtime_error("Scheduler is shut down");
  }
  pruneFinishedTasks();
  auto task = make_shared<RepeatingTask>(action, initialDelay, period);
  task->start();
  tasks.push_back(task);
  VLOG(1) << "Scheduled repeating task every " << period.count() << "ms";
  return task;
}

void ThreadTaskScheduler::shutdown() {
  vector<shared_ptr<RepeatingTask>> toJoin;
  {
    lock_guard<mutex> guard(tasksMutex);
    shuttingDown = true;
    toJoin.swap(tasks);
  }
  for (auto& task : toJoin) {
    task->cancel();
  }
  for (auto& task : toJoin) {
    task->join();
  }
}

void ThreadTaskScheduler::pruneFinishedTasks() {
  auto it = tasks.begin();
  while (it != tasks.end()) {
    if ((*it)->isFinished()) {
      (*it)->join();
      it = tasks.erase(it);
    } else {
      ++it;
    }
  }
}
}  // namespace sb
