#include "TestHeaders.hpp"
#include "ThreadTaskScheduler.hpp"

using namespace sb;

namespace {
bool waitFor(function<bool()> condition) {
  auto deadline = chrono::steady_clock::now() + chrono::seconds(10);
  while (!condition()) {
    if (chrono::steady_clock::now() > deadline) {
      return false;
    }
    this_thread::sleep_for(chrono::milliseconds(1));
  }
  return true;
}
}  // namespace

TEST_CASE("Repeating task runs until cancelled", "[ThreadTaskScheduler]") {
  ThreadTaskScheduler scheduler;
  atomic<int> runs(0);
  auto task = scheduler.scheduleRepeating([&runs]() { runs++; },
                                          chrono::milliseconds(0),
                                          chrono::milliseconds(5));

  REQUIRE(waitFor([&runs]() { return runs >= 3; }));
  REQUIRE_FALSE(task->isCancelled());

  task->cancel();
  task->waitUntilIdle();
  REQUIRE(task->isCancelled());
  int runsAtCancel = runs;
  this_thread::sleep_for(chrono::milliseconds(50));
  REQUIRE(runs == runsAtCancel);
}

TEST_CASE("Initial delay is honored", "[ThreadTaskScheduler]") {
  ThreadTaskScheduler scheduler;
  atomic<int> runs(0);
  auto task = scheduler.scheduleRepeating([&runs]() { runs++; },
                                          chrono::hours(1), chrono::hours(1));
  this_thread::sleep_for(chrono::milliseconds(50));
  REQUIRE(runs == 0);
  task->cancel();
  task->waitUntilIdle();
  REQUIRE(runs == 0);
}

TEST_CASE("Task can cancel itself", "[ThreadTaskScheduler]") {
  ThreadTaskScheduler scheduler;
  atomic<int> runs(0);
  shared_ptr<ScheduledTask> task;
  mutex taskMutex;
  {
    lock_guard<mutex> guard(taskMutex);
    task = scheduler.scheduleRepeating(
        [&]() {
          runs++;
          lock_guard<mutex> lock(taskMutex);
          task->cancel();
          // Must not deadlock on the worker thread
          task->waitUntilIdle();
        },
        chrono::milliseconds(0), chrono::milliseconds(1));
  }

  REQUIRE(waitFor([&task]() { return task->isCancelled(); }));
  task->waitUntilIdle();
  this_thread::sleep_for(chrono::milliseconds(20));
  REQUIRE(runs == 1);
}

TEST_CASE("Exceptions do not stop the task", "[ThreadTaskScheduler]") {
  ThreadTaskScheduler scheduler;
  atomic<int> runs(0);
  auto task = scheduler.scheduleRepeating(
      [&runs]() {
        runs++;
        throw std::runtime_error("Simulated failure");
      },
      chrono::milliseconds(0), chrono::milliseconds(1));

  REQUIRE(waitFor([&runs]() { return runs >= 2; }));
  task->cancel();
  task->waitUntilIdle();
}

TEST_CASE("Shutdown stops every task", "[ThreadTaskScheduler]") {
  ThreadTaskScheduler scheduler;
  atomic<int> first(0);
  atomic<int> second(0);
  auto firstTask = scheduler.scheduleRepeating([&first]() { first++; },
                                               chrono::milliseconds(0),
                                               chrono::milliseconds(2));
  auto secondTask = scheduler.scheduleRepeating([&second]() { second++; },
                                                chrono::milliseconds(0),
                                                chrono::milliseconds(2));
  REQUIRE(waitFor([&]() { return first > 0 && second > 0; }));

  scheduler.shutdown();
  REQUIRE(firstTask->isCancelled());
  REQUIRE(secondTask->isCancelled());
  int firstRuns = first;
  int secondRuns = second;
  this_thread::sleep_for(chrono::milliseconds(20));
  REQUIRE(first == firstRuns);
  REQUIRE(second == secondRuns);

  REQUIRE_THROWS(scheduler.scheduleRepeating([]() {}, chrono::milliseconds(0),
                                             chrono::milliseconds(1)));
}

TEST_CASE("Finished tasks are released", "[ThreadTaskScheduler]") {
  ThreadTaskScheduler scheduler;
  for (int i = 0; i < 20; i++) {
    auto task = scheduler.scheduleRepeating([]() {}, chrono::milliseconds(0),
                                            chrono::milliseconds(1));
    task->cancel();
    task->waitUntilIdle();
  }
  auto last = scheduler.scheduleRepeating([]() {}, chrono::milliseconds(0),
                                          chrono::milliseconds(1));
  last->cancel();
}
