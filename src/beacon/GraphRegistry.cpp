#include "GraphRegistry.hpp"

namespace sb {
shared_ptr<Graph> GraphRegistry::createGraph(const string& name) {
  CHECK(!name.empty()) << "Graph name cannot be empty";
  lock_guard<mutex> guard(graphMutex);
  for (const auto& it : graphs) {
    if (it->getName() == name) {
      return it;
    }
  }
  auto graph = make_shared<Graph>(name);
  graphs.push_back(graph);
  return graph;
}

bool GraphRegistry::addGraph(const shared_ptr<Graph>& graph) {
  CHECK(graph) << "Graph cannot be null";
  lock_guard<mutex> guard(graphMutex);
  for (const auto& it : graphs) {
    if (*it == *graph) {
      VLOG(1) << "A graph named " << graph->getName()
              << " is already registered";
      return false;
    }
  }
  graphs.push_back(graph);
  return true;
}

vector<shared_ptr<Graph>> GraphRegistry::getGraphs() const {
  lock_guard<mutex> guard(graphMutex);
  return graphs;
}

size_t GraphRegistry::size() const {
  lock_guard<mutex> guard(graphMutex);
  return graphs.size();
}

void GraphRegistry::notifyOptOut() {
  for (const auto& graph : getGraphs()) {
    graph->onOptOut();
  }
}

void GraphRegistry::resetPlotters() {
  for (const auto& graph : getGraphs()) {
    for (const auto& plotter : graph->getPlotters()) {
      plotter->reset();
    }
  }
}
}  // namespace sb
