#ifndef __SB_GRAPH__
#define __SB_GRAPH__

#include "Headers.hpp"
#include "Plotter.hpp"

namespace sb {
/**
 * @brief A named group of plotters, shown as one chart on the remote
 * dashboard.
 *
 * Graphs are identified by name.  Plotters are kept in insertion order and
 * are unique by column name.  All methods are safe to call from any thread.
 */
class Graph {
 public:
  explicit Graph(const string& _name);

  virtual ~Graph() = default;

  const string& getName() const { return name; }

  /**
   * @brief Adds a plotter.  A plotter whose column name is already present
   * is ignored.
   */
  void addPlotter(const shared_ptr<Plotter>& plotter);

  /** @brief Removes the plotter with the same column name, if any. */
  void removePlotter(const shared_ptr<Plotter>& plotter);

  /** @brief Snapshot of the plotters, in insertion order. */
  vector<shared_ptr<Plotter>> getPlotters() const;

  bool operator==(const Graph& other) const { return name == other.name; }
  bool operator!=(const Graph& other) const { return name != other.name; }

  /**
   * @brief Called once when the owning client stops because the server
   * owner opted out.
   */
  virtual void onOptOut() {}

 protected:
  const string name;
  mutable mutex plotterMutex;
  vector<shared_ptr<Plotter>> plotters;
};
}  // namespace sb

#endif  // __SB_GRAPH__
