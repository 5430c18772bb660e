/*
  dvsim — command-line reporter for the distance-vector simulation.

  Prints the link costs, every router's table after each round, and the
  convergence round. Without --topology it runs the built-in six-router demo.
*/
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "dvroute/core/constants.hpp"
#include "dvroute/core/error.hpp"
#include "dvroute/core/log.hpp"
#include "dvroute/core/shortest_paths.hpp"
#include "dvroute/core/simulator.hpp"
#include "dvroute/core/topology_io.hpp"

using namespace dvroute::core;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitBadInput = 1;
constexpr int kExitNoConvergence = 2;
constexpr int kExitMismatch = 3;

struct CliOptions {
  std::optional<std::string> topology_path;
  std::optional<std::int32_t> max_rounds;
  bool quiet {false};
  bool verify {false};
  spdlog::level::level_enum log_level {spdlog::level::warn};
};

void usage(const char* prog) {
  fmt::print(stderr,
             "usage: {} [--topology FILE] [--max-rounds N] [--quiet] [--verify] [--log-level LEVEL]\n"
             "  --topology FILE   edge list, one '<nodeA> <nodeB> <cost>' per line\n"
             "  --max-rounds N    round cap (default: nodes - 1)\n"
             "  --quiet           print only the converged tables\n"
             "  --verify          check converged costs against Dijkstra\n"
             "  --log-level L     trace|debug|info|warn|warning|err|error|critical|off (default: warn)\n",
             prog);
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    auto value = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) return std::nullopt;
      return std::string(argv[++i]);
    };
    if (arg == "--topology") {
      opts.topology_path = value();
      if (!opts.topology_path) return std::nullopt;
    } else if (arg == "--max-rounds") {
      auto v = value();
      if (!v) return std::nullopt;
      try {
        opts.max_rounds = std::stoi(*v);
      } catch (const std::logic_error&) {
        return std::nullopt;
      }
    } else if (arg == "--log-level") {
      auto v = value();
      if (!v) return std::nullopt;
      auto lvl = parse_log_level(*v);
      if (!lvl) return std::nullopt;
      opts.log_level = *lvl;
    } else if (arg == "--quiet") {
      opts.quiet = true;
    } else if (arg == "--verify") {
      opts.verify = true;
    } else {
      return std::nullopt;
    }
  }
  return opts;
}

std::string format_cost(Cost c) {
  return fmt::format("{:g}", c);
}

void print_links(const Topology& topo) {
  fmt::print("Link costs:\n");
  const auto row = topo.row_offsets_view();
  const auto col = topo.col_indices_view();
  const auto cost = topo.adj_cost_view();
  for (NodeId u = 0; u < topo.num_nodes(); ++u) {
    for (auto j = row[static_cast<std::size_t>(u)]; j < row[static_cast<std::size_t>(u) + 1]; ++j) {
      NodeId v = col[static_cast<std::size_t>(j)];
      if (u < v) fmt::print("  {}-{}: {}\n", topo.name(u), topo.name(v), format_cost(cost[static_cast<std::size_t>(j)]));
    }
  }
}

void print_table(const Topology& topo, NodeId u, const TableSnapshot& table) {
  fmt::print("\nRouting table for router {}:\n", topo.name(u));
  fmt::print("{:^12}|{:^8}|{:^10}\n", "Destination", "Cost", "Next Hop");
  fmt::print("{}\n", std::string(32, '-'));
  for (const auto& e : table) {
    const std::string hop = e.next_hop == kNoNode ? "-" : topo.name(e.next_hop);
    fmt::print("{:^12}|{:^8}|{:^10}\n", topo.name(e.dst), format_cost(e.cost), hop);
  }
}

void print_round(const Topology& topo, const RoundSnapshot& snap) {
  fmt::print("\n{}\n{}\n", snap.round == 0 ? std::string("Initial tables") : fmt::format("Round {}", snap.round),
             std::string(20, '-'));
  for (std::size_t u = 0; u < snap.tables.size(); ++u) {
    print_table(topo, static_cast<NodeId>(u), snap.tables[u]);
  }
}

} // namespace

int main(int argc, char* argv[]) {
  auto cli = parse_args(argc, argv);
  if (!cli) {
    usage(argv[0]);
    return kExitBadInput;
  }
  logger()->set_level(cli->log_level);

  try {
    const Topology topo = cli->topology_path ? load_topology(*cli->topology_path) : demo_topology();
    logger()->info("loaded {} routers and {} links", topo.num_nodes(), topo.num_links());
    print_links(topo);

    SimulatorOptions opts;
    opts.max_rounds = cli->max_rounds;
    opts.record_snapshots = false;
    if (!cli->quiet) {
      opts.on_round = [&topo](const RoundSnapshot& snap) { print_round(topo, snap); };
    }
    const auto result = run_simulation(topo, opts);

    if (cli->quiet) {
      print_round(topo, RoundSnapshot{result.converged_round, result.final_tables});
    }
    fmt::print("\nConverged at round {}.\n", result.converged_round);

    if (cli->verify) {
      const auto mismatches = verify_tables(topo, result.final_tables);
      for (const auto& m : mismatches) logger()->error("verify: {}", m);
      if (!mismatches.empty()) return kExitMismatch;
      fmt::print("All tables match centralized shortest paths.\n");
    }
  } catch (const ConfigurationError& e) {
    logger()->error("invalid input: {}", e.what());
    return kExitBadInput;
  } catch (const TopologyError& e) {
    logger()->error("{} (rounds attempted: {})", e.what(), e.rounds_attempted());
    return kExitNoConvergence;
  }
  return kExitOk;
}
