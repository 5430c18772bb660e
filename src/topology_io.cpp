#include "dvroute/core/topology_io.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "dvroute/core/error.hpp"

namespace dvroute::core {

Topology read_topology(std::istream& in) {
  std::vector<LabeledEdge> edges;
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    if (auto hash = line.find('#'); hash != std::string::npos) line.erase(hash);
    std::istringstream ls(line);
    std::string a;
    if (!(ls >> a)) continue;  // blank or comment-only
    std::string b;
    std::string cost_tok;
    if (!(ls >> b >> cost_tok)) {
      throw ConfigurationError("line " + std::to_string(lineno) + ": expected '<nodeA> <nodeB> <cost>'");
    }
    std::string extra;
    if (ls >> extra) {
      throw ConfigurationError("line " + std::to_string(lineno) + ": unexpected token '" + extra + "'");
    }
    Cost cost = 0.0;
    std::size_t used = 0;
    try {
      cost = std::stod(cost_tok, &used);
    } catch (const std::logic_error&) {
      used = 0;
    }
    if (used != cost_tok.size()) {
      throw ConfigurationError("line " + std::to_string(lineno) + ": invalid cost '" + cost_tok + "'");
    }
    edges.push_back(LabeledEdge{std::move(a), std::move(b), cost});
  }
  if (in.bad()) {
    throw ConfigurationError("error reading topology stream");
  }
  return Topology::from_edges(edges);
}

Topology load_topology(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    throw ConfigurationError("cannot open topology file: " + path);
  }
  return read_topology(f);
}

Topology demo_topology() {
  const std::vector<LabeledEdge> edges = {
    {"A", "B", 1}, {"A", "F", 3}, {"B", "C", 3},
    {"B", "F", 1}, {"B", "E", 5}, {"C", "D", 2},
    {"D", "E", 1}, {"E", "F", 2}, {"D", "F", 6},
  };
  return Topology::from_edges(edges);
}

} // namespace dvroute::core
