#ifndef __SB_TASK_SCHEDULER__
#define __SB_TASK_SCHEDULER__

#include "Headers.hpp"

namespace sb {
/**
 * @brief Handle of a repeating task.
 */
class ScheduledTask {
 public:
  virtual ~ScheduledTask() = default;

  /**
   * @brief No further runs start after this returns.  A run that is in
   * progress finishes normally.  Safe to call from inside the task.
   */
  virtual void cancel() = 0;

  virtual bool isCancelled() const = 0;

  /** @brief True once the task is cancelled and no run is in progress. */
  virtual bool isIdle() const = 0;

  /**
   * @brief Blocks until a cancelled task has no run in progress.  Returns
   * immediately when called from inside the task.
   */
  virtual void waitUntilIdle() = 0;
};

/**
 * @brief Runs actions periodically on a background execution context.
 */
class TaskScheduler {
 public:
  virtual ~TaskScheduler() = default;

  /**
   * @brief Runs `action` after `initialDelay`, then every `period` until the
   * returned task is cancelled.
   */
  virtual shared_ptr<ScheduledTask> scheduleRepeating(
      function<void()> action, chrono::milliseconds initialDelay,
      chrono::milliseconds period) = 0;
};
}  // namespace sb

#endif  // __SB_TASK_SCHEDULER__
