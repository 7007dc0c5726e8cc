#ifndef __SB_REPORT_BUILDER__
#define __SB_REPORT_BUILDER__

#include "GraphRegistry.hpp"
#include "Headers.hpp"
#include "HostInfo.hpp"

namespace sb {
/**
 * @brief Assembles the document sent to the collection server on each tick.
 *
 * The document is a flat object of host and environment facts, an optional
 * ping marker, and a `graphs` object mapping each graph name to its
 * `{column: value}` pairs.  Values are written with appendJsonPair, so
 * whether a value is quoted depends on its text.
 */
class ReportBuilder {
 public:
  ReportBuilder(const string& _guid, shared_ptr<HostInfoProvider> _host,
                shared_ptr<EnvironmentProvider> _environment,
                shared_ptr<GraphRegistry> _graphs);

  /**
   * @brief Builds one report.
   * @param isPing false for the first report of a task, true afterwards.
   */
  string build(bool isPing) const;

  /** @brief Maps "amd64" to "x86_64", everything else is unchanged. */
  static string normalizeArch(const string& arch);

 protected:
  /** @brief Appends `,"graphs":{...}` if any graph is registered. */
  void appendGraphs(string* json) const;

  string guid;
  shared_ptr<HostInfoProvider> host;
  shared_ptr<EnvironmentProvider> environment;
  shared_ptr<GraphRegistry> graphs;
};
}  // namespace sb

#endif  // __SB_REPORT_BUILDER__
