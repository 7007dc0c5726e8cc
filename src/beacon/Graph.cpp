#include "Graph.hpp"

namespace sb {
Graph::Graph(const string& _name) : name(_name) {
  CHECK(!name.empty()) << "Graph name cannot be empty";
}

void Graph::addPlotter(const shared_ptr<Plotter>& plotter) {
  CHECK(plotter) << "Plotter cannot be null";
  lock_guard<mutex> guard(plotterMutex);
  for (const auto& it : plotters) {
    if (it->getColumnName() == plotter->getColumnName()) {
      VLOG(1) << "Graph " << name << " already has a plotter named "
              << plotter->getColumnName();
      return;
    }
  }
  plotters.push_back(plotter);
}

void Graph::removePlotter(const shared_ptr<Plotter>& plotter) {
  CHECK(plotter) << "Plotter cannot be null";
  lock_guard<mutex> guard(plotterMutex);
  plotters.erase(
      std::remove_if(plotters.begin(), plotters.end(),
                     [&plotter](const shared_ptr<Plotter>& it) {
                       return it->getColumnName() == plotter->getColumnName();
                     }),
      plotters.end());
}

vector<shared_ptr<Plotter>> Graph::getPlotters() const {
  lock_guard<mutex> guard(plotterMutex);
  return plotters;
}
}  // namespace sb
