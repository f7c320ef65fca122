#ifndef __GRAPH_TOOLS_DOT_EXPORT_HH__
#define __GRAPH_TOOLS_DOT_EXPORT_HH__

#include "graph.hh"
#include <ostream>
#include <string>

namespace graph_tools {

// Graphviz DOT description of the graph. Every vertex gets a node statement,
// every edge carries its weight as "weight" and "label" attributes.
std::string ToDot(const Graph &graph, const std::string &name = "G");

void WriteDot(const Graph &graph, std::ostream &os,
              const std::string &name = "G");

} // namespace graph_tools

#endif
