#ifndef __SB_PLOTTER__
#define __SB_PLOTTER__

#include "Headers.hpp"

namespace sb {
/**
 * @brief A named, polled integer data source contributing one column to a
 * Graph.
 *
 * `getValue()` is called from the reporting thread with no client lock held,
 * so implementations that share state with other threads must synchronize
 * it themselves.
 */
class Plotter {
 public:
  static constexpr const char* DEFAULT_NAME = "Default";

  Plotter() : name(DEFAULT_NAME) {}

  explicit Plotter(const string& _name) : name(_name) {}

  virtual ~Plotter() = default;

  /** @brief Current value reported for this column. */
  virtual int getValue() = 0;

  /** @brief Column name on the remote chart. */
  const string& getColumnName() const { return name; }

  /**
   * @brief Called once the server acknowledges the first update of its
   * aggregation window.  Counters should start over here.
   */
  virtual void reset() {}

 protected:
  /** @brief Column name, fixed at construction. */
  const string name;
};

/**
 * @brief Plotter backed by callables, for hosts that do not want to subclass.
 */
class FunctionPlotter : public Plotter {
 public:
  FunctionPlotter(const string& _name, function<int()> _valueFn,
                  function<void()> _resetFn = nullptr);

  int getValue() override;

  void reset() override;

 protected:
  function<int()> valueFn;
  function<void()> resetFn;
};
}  // namespace sb

#endif  // __SB_PLOTTER__
