/* Edge-list topology files. */
#pragma once

#include <istream>
#include <string>

#include "dvroute/core/topology.hpp"

namespace dvroute::core {

// One link per line: "<nodeA> <nodeB> <cost>". '#' starts a comment and blank
// lines are skipped. Throws ConfigurationError naming the offending line.
[[nodiscard]] Topology read_topology(std::istream& in);

// Opens `path` and reads it with read_topology.
[[nodiscard]] Topology load_topology(const std::string& path);

// Six-router network used by the dvsim demo:
// A-B 1, A-F 3, B-C 3, B-F 1, B-E 5, C-D 2, D-E 1, E-F 2, D-F 6.
[[nodiscard]] Topology demo_topology();

} // namespace dvroute::core
