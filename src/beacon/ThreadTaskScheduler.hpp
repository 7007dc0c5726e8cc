#ifndef __SB_THREAD_TASK_SCHEDULER__
#define __SB_THREAD_TASK_SCHEDULER__

#include "Headers.hpp"
#include "TaskScheduler.hpp"

namespace sb {
/**
 * @brief TaskScheduler that gives every repeating task its own thread.
 *
 * The next run of a task starts `period` after the previous run finished.
 * Threads are joined by `shutdown()` or the destructor.
 */
class ThreadTaskScheduler : public TaskScheduler {
 public:
  ThreadTaskScheduler();

  virtual ~ThreadTaskScheduler();

  shared_ptr<ScheduledTask> scheduleRepeating(
      function<void()> action, chrono::milliseconds initialDelay,
      chrono::milliseconds period) override;

  /** @brief Cancels every task and joins its thread. */
  void shutdown();

 protected:
  class RepeatingTask;

  /** @brief Joins tasks whose thread already ended.  Needs tasksMutex. */
  void pruneFinishedTasks();

  mutex tasksMutex;
  vector<shared_ptr<RepeatingTask>> tasks;
  bool shuttingDown;
};
}  // namespace sb

#endif  // __SB_THREAD_TASK_SCHEDULER__
