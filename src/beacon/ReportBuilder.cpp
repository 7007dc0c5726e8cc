#include "ReportBuilder.hpp"

#include "JsonPayload.hpp"

namespace sb {
ReportBuilder::ReportBuilder(const string& _guid,
                             shared_ptr<HostInfoProvider> _host,
                             shared_ptr<EnvironmentProvider> _environment,
                             shared_ptr<GraphRegistry> _graphs)
    : guid(_guid), host(_host), environment(_environment), graphs(_graphs) {
  CHECK(host) << "Host info provider cannot be null";
  CHECK(environment) << "Environment provider cannot be null";
  CHECK(graphs) << "Graph registry cannot be null";
}

string ReportBuilder::normalizeArch(const string& arch) {
  if (arch == "amd64") {
    return "x86_64";
  }
  return arch;
}

string ReportBuilder::build(bool isPing) const {
  EnvironmentInfo env = environment->getEnvironment();

  string json;
  json.reserve(1024);
  json.push_back('{');
  appendJsonPair(&json, "guid", guid);
  appendJsonPair(&json, "plugin_version", host->getPluginVersion());
  appendJsonPair(&json, "server_version", host->getServerVersion());
  appendJsonPair(&json, "players_online", to_string(host->getPlayersOnline()));

  appendJsonPair(&json, "osname", env.osName);
  appendJsonPair(&json, "osarch", normalizeArch(env.osArch));
  appendJsonPair(&json, "osversion", env.osVersion);
  appendJsonPair(&json, "cores", to_string(env.coreCount));
  appendJsonPair(&json, "auth_mode", host->isOnlineMode() ? "1" : "0");
  appendJsonPair(&json, "java_version", env.runtimeVersion);

  if (isPing) {
    appendJsonPair(&json, "ping", "1");
  }

  appendGraphs(&json);

  json.push_back('}');
  return json;
}

void ReportBuilder::appendGraphs(string* json) const {
  auto snapshot = graphs->getGraphs();
  if (snapshot.empty()) {
    return;
  }

  json->append(",\"graphs\":{");
  bool firstGraph = true;
  for (const auto& graph : snapshot) {
    string graphJson;
    graphJson.push_back('{');
    // getPlotters() copies under the graph lock, values are read unlocked
    for (const auto& plotter : graph->getPlotters()) {
      appendJsonPair(&graphJson, plotter->getColumnName(),
                     to_string(plotter->getValue()));
    }
    graphJson.push_back('}');

    if (!firstGraph) {
      json->push_back(',');
    }
    json->append(escapeJson(graph->getName()));
    json->push_back(':');
    json->append(graphJson);
    firstGraph = false;
  }
  json->push_back('}');
}
}  // namespace sb
