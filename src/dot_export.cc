#include "dot_export.hh"
#include "spdlog/fmt/fmt.h"
#include <sstream>

namespace graph_tools {

namespace {
// DOT quoted string, escaping quotes and backslashes
std::string Quote(const std::string &id) {
  std::string quoted = "\"";
  for (char c : id) {
    if (c == '"' || c == '\\') {
      quoted += '\\';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}
} // namespace

void WriteDot(const Graph &graph, std::ostream &os, const std::string &name) {
  os << "digraph " << Quote(name) << " {\n";
  for (const auto &entry : graph.GetAdjacency()) {
    os << fmt::format("  {};\n", Quote(entry.first));
  }
  for (const auto &[from, neighbors] : graph.GetAdjacency()) {
    for (const auto &[to, weight] : neighbors) {
      os << fmt::format("  {} -> {} [weight={}, label=\"{}\"];\n",
                        Quote(from), Quote(to), weight, weight);
    }
  }
  os << "}\n";
}

std::string ToDot(const Graph &graph, const std::string &name) {
  std::ostringstream ss;
  WriteDot(graph, ss, name);
  return ss.str();
}

} // namespace graph_tools
