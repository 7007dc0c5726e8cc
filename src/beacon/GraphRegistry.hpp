#ifndef __SB_GRAPH_REGISTRY__
#define __SB_GRAPH_REGISTRY__

#include "Graph.hpp"
#include "Headers.hpp"

namespace sb {
/**
 * @brief Owns the graphs reported by one metrics client.
 *
 * The reporting thread walks the registry while the host adds graphs and
 * plotters from its own threads, so every accessor hands out a snapshot.
 * Plotter callbacks (`getValue`, `reset`, `onOptOut`) always run with no
 * registry or graph lock held.
 */
class GraphRegistry {
 public:
  /**
   * @brief Returns the graph called `name`, creating and registering it if
   * it does not exist yet.
   */
  shared_ptr<Graph> createGraph(const string& name);

  /**
   * @brief Registers a host constructed graph.  A graph with the same name
   * that is already registered wins.
   * @return true if the graph was added.
   */
  bool addGraph(const shared_ptr<Graph>& graph);

  /** @brief Snapshot of the registered graphs, in registration order. */
  vector<shared_ptr<Graph>> getGraphs() const;

  size_t size() const;

  bool empty() const { return size() == 0; }

  /** @brief Calls `onOptOut()` on every registered graph. */
  void notifyOptOut();

  /** @brief Calls `reset()` on every plotter of every graph. */
  void resetPlotters();

 protected:
  mutable mutex graphMutex;
  vector<shared_ptr<Graph>> graphs;
};
}  // namespace sb

#endif  // __SB_GRAPH_REGISTRY__
