/*
  Pybind11 module exposing DVRoute-Core C++ APIs to Python.

  Notes:
    - Topologies are built from (a, b, cost) tuples or from NumPy arrays
      (C-contiguous int32 ids, float64 costs).
    - Tables are returned as lists of (dst, cost, next_hop) tuples; cost is
      float('inf') and next_hop is -1 for unknown destinations.
    - ConfigurationError maps to a ValueError subclass; TopologyError to a
      RuntimeError subclass carrying rounds_attempted and last_snapshot.
*/
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include <span>
#include <string>
#include <tuple>
#include <vector>

#include "dvroute/core/error.hpp"
#include "dvroute/core/shortest_paths.hpp"
#include "dvroute/core/simulator.hpp"
#include "dvroute/core/topology.hpp"
#include "dvroute/core/topology_io.hpp"
#include "dvroute/core/types.hpp"

namespace py = pybind11;
using namespace dvroute::core;

// Helpers to check NumPy arrays
template <typename T>
static std::span<const T> as_span(const py::array& arr, const char* name) {
  if (!py::isinstance<py::array_t<T>>(arr)) {
    throw py::type_error(std::string(name) + ": expected numpy array of correct dtype");
  }
  if (!(arr.flags() & py::array::c_style)) {
    throw py::type_error(std::string(name) + ": array must be C-contiguous (use np.ascontiguousarray)");
  }
  auto buf = arr.request();
  if (buf.ndim != 1) throw py::type_error(std::string(name) + ": must be a 1-D array");
  return std::span<const T>(static_cast<const T*>(buf.ptr), static_cast<std::size_t>(buf.size));
}

static py::list table_to_list(const TableSnapshot& t) {
  py::list rows;
  for (const auto& e : t) rows.append(py::make_tuple(e.dst, e.cost, e.next_hop));
  return rows;
}

static py::list tables_to_list(const std::vector<TableSnapshot>& tables) {
  py::list out;
  for (const auto& t : tables) out.append(table_to_list(t));
  return out;
}

PYBIND11_MODULE(_dvroute_core, m) {
  m.doc() = "DVRoute-Core C++ bindings";

  static py::exception<ConfigurationError> config_exc(m, "ConfigurationError", PyExc_ValueError);
  static py::exception<TopologyError> topo_exc(m, "TopologyError", PyExc_RuntimeError);
  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) std::rethrow_exception(p);
    } catch (const ConfigurationError& e) {
      PyErr_SetString(config_exc.ptr(), e.what());
    } catch (const TopologyError& e) {
      py::object cls = topo_exc;
      py::object inst = cls(e.what());
      inst.attr("rounds_attempted") = e.rounds_attempted();
      inst.attr("last_snapshot") = py::cast(e.last_snapshot());
      PyErr_SetObject(topo_exc.ptr(), inst.ptr());
    }
  });

  py::class_<RoundSnapshot>(m, "RoundSnapshot")
      .def_readonly("round", &RoundSnapshot::round)
      .def_property_readonly("tables", [](const RoundSnapshot& s){ return tables_to_list(s.tables); });

  py::class_<Topology>(m, "Topology")
      .def_static(
          "from_edges",
          [](const std::vector<std::tuple<std::string, std::string, double>>& edges) {
            std::vector<LabeledEdge> le;
            le.reserve(edges.size());
            for (const auto& [a, b, c] : edges) le.push_back(LabeledEdge{a, b, c});
            return Topology::from_edges(le);
          },
          py::arg("edges"))
      .def_static(
          "from_arrays",
          [](std::int32_t num_nodes, py::array src, py::array dst, py::array cost) {
            auto src_s = as_span<std::int32_t>(src, "src");
            auto dst_s = as_span<std::int32_t>(dst, "dst");
            auto cost_s = as_span<double>(cost, "cost");
            return Topology::from_arrays(num_nodes, src_s, dst_s, cost_s);
          },
          py::arg("num_nodes"), py::arg("src"), py::arg("dst"), py::arg("cost"))
      .def_static("from_file", &load_topology, py::arg("path"))
      .def_static("demo", &demo_topology)
      .def("num_nodes", &Topology::num_nodes)
      .def("num_links", &Topology::num_links)
      .def("name", &Topology::name, py::arg("node"))
      .def("find", &Topology::find, py::arg("label"))
      .def("link_cost", &Topology::link_cost, py::arg("u"), py::arg("v"))
      .def("neighbors", [](const Topology& t, NodeId u){
        py::list out;
        for (const auto& n : t.neighbors(u)) out.append(py::make_tuple(n.id, n.cost));
        return out;
      }, py::arg("node"));

  py::class_<SimulationResult>(m, "SimulationResult")
      .def_readonly("snapshots", &SimulationResult::snapshots)
      .def_readonly("converged_round", &SimulationResult::converged_round)
      .def_property_readonly("final_tables", [](const SimulationResult& r){ return tables_to_list(r.final_tables); });

  m.def("run_simulation",
        [](const Topology& topo, py::object max_rounds, bool record_snapshots) {
          SimulatorOptions opts;
          if (!max_rounds.is_none()) opts.max_rounds = py::cast<std::int32_t>(max_rounds);
          opts.record_snapshots = record_snapshots;
          py::gil_scoped_release release;
          return run_simulation(topo, opts);
        }, py::arg("topology"), py::kw_only(), py::arg("max_rounds") = py::none(), py::arg("record_snapshots") = true);

  m.def("shortest_paths",
        [](const Topology& topo, NodeId src) {
          if (src < 0 || src >= topo.num_nodes()) throw py::value_error("src out of range");
          auto res = shortest_paths(topo, src);
          py::array_t<double> dist_arr(static_cast<py::ssize_t>(res.dist.size()));
          auto* out = dist_arr.mutable_data();
          for (std::size_t i = 0; i < res.dist.size(); ++i) out[i] = res.dist[i];
          return py::make_tuple(std::move(dist_arr), res.first_hop);
        }, py::arg("topology"), py::arg("src"));

  m.def("verify_tables",
        [](const Topology& topo, const SimulationResult& result, double rel_tol) {
          return verify_tables(topo, result.final_tables, rel_tol);
        }, py::arg("topology"), py::arg("result"), py::kw_only(), py::arg("rel_tol") = 1e-9);
}
