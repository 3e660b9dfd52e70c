/*
  Pybind11 module exposing StepGraph-Core C++ APIs to Python.

  Notes:
    - Graph objects are held by std::shared_ptr so a Recorder can keep the
      graph of its run alive.
    - Steps returned by a Stepper are references into its history buffer;
      they stay valid while the owning Recorder/Stepper object is alive.
    - Matrices and distance tables are returned as float64 arrays with inf
      for unknown entries.
*/
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <cstring>
#include <memory>
#include <vector>

#include "stepgraph/core/algorithms.hpp"
#include "stepgraph/core/comparator.hpp"
#include "stepgraph/core/error.hpp"
#include "stepgraph/core/generators.hpp"
#include "stepgraph/core/graph.hpp"
#include "stepgraph/core/heuristics.hpp"
#include "stepgraph/core/options.hpp"
#include "stepgraph/core/recorder.hpp"
#include "stepgraph/core/registry.hpp"
#include "stepgraph/core/step.hpp"
#include "stepgraph/core/stepper.hpp"
#include "stepgraph/core/types.hpp"

namespace py = pybind11;
using namespace stepgraph::core;

static py::array_t<double> to_array(const std::vector<double>& v) {
  py::array_t<double> arr(v.size());
  std::memcpy(arr.mutable_data(), v.data(), v.size() * sizeof(double));
  return arr;
}

PYBIND11_MODULE(_stepgraph_core, m) {
  m.doc() = "StepGraph-Core C++ bindings";

  py::register_exception<GraphError>(m, "GraphError", PyExc_ValueError);
  py::register_exception<ConfigError>(m, "ConfigError", PyExc_ValueError);
  py::register_exception<RuntimeError>(m, "RuntimeError", PyExc_RuntimeError);

  py::enum_<NodeState>(m, "NodeState")
      .value("UNVISITED", NodeState::Unvisited)
      .value("FRONTIER", NodeState::Frontier)
      .value("VISITED", NodeState::Visited)
      .value("CURRENT", NodeState::Current)
      .value("PATH", NodeState::OnPath)
      .value("BLOCKED", NodeState::Blocked)
      .value("SOURCE", NodeState::Source)
      .value("TARGET", NodeState::Target);

  py::enum_<EdgeState>(m, "EdgeState")
      .value("DEFAULT", EdgeState::Default)
      .value("RELAXED", EdgeState::Relaxed)
      .value("CHOSEN", EdgeState::Chosen)
      .value("IGNORED", EdgeState::Ignored);

  py::enum_<Heuristic>(m, "Heuristic")
      .value("EUCLIDEAN", Heuristic::Euclidean)
      .value("MANHATTAN", Heuristic::Manhattan)
      .value("OCTILE", Heuristic::Octile)
      .value("ZERO", Heuristic::Zero);
  m.def("parse_heuristic", &parse_heuristic, py::arg("name"));

  py::enum_<TieBreak>(m, "TieBreak")
      .value("INSERTION_ORDER", TieBreak::InsertionOrder)
      .value("LOWEST_NODE_ID", TieBreak::LowestNodeId);

  py::enum_<Winner>(m, "Winner")
      .value("LEFT", Winner::Left)
      .value("RIGHT", Winner::Right)
      .value("TIE", Winner::Tie);

  py::class_<SearchOptions>(m, "SearchOptions")
      .def(py::init<>())
      .def(py::init([](Heuristic heuristic, double heuristic_weight, TieBreak tie_break) {
        SearchOptions o; o.heuristic = heuristic; o.heuristic_weight = heuristic_weight; o.tie_break = tie_break; return o;
      }),
        py::kw_only(),
        py::arg("heuristic") = Heuristic::Euclidean,
        py::arg("heuristic_weight") = 1.0,
        py::arg("tie_break") = TieBreak::InsertionOrder)
      .def_readwrite("heuristic", &SearchOptions::heuristic)
      .def_readwrite("heuristic_weight", &SearchOptions::heuristic_weight)
      .def_readwrite("tie_break", &SearchOptions::tie_break);

  py::class_<Point>(m, "Point")
      .def(py::init([](double x, double y) { return Point{x, y}; }), py::arg("x"), py::arg("y"))
      .def_readwrite("x", &Point::x)
      .def_readwrite("y", &Point::y);

  py::class_<NodeSpec>(m, "NodeSpec")
      .def(py::init([](std::string key, std::optional<Point> position, bool blocked) {
        return NodeSpec{std::move(key), position, blocked};
      }),
        py::arg("key"), py::arg("position") = py::none(), py::arg("blocked") = false)
      .def_readwrite("key", &NodeSpec::key)
      .def_readwrite("position", &NodeSpec::position)
      .def_readwrite("blocked", &NodeSpec::blocked);

  py::class_<EdgeSpec>(m, "EdgeSpec")
      .def(py::init([](std::string source, std::string target, double weight) {
        return EdgeSpec{std::move(source), std::move(target), weight};
      }),
        py::arg("source"), py::arg("target"), py::arg("weight") = 1.0)
      .def_readwrite("source", &EdgeSpec::source)
      .def_readwrite("target", &EdgeSpec::target)
      .def_readwrite("weight", &EdgeSpec::weight);

  py::class_<Graph, std::shared_ptr<Graph>>(m, "Graph")
      .def_static("from_lists", [](const std::vector<NodeSpec>& nodes, const std::vector<EdgeSpec>& edges, bool directed) {
        return std::make_shared<Graph>(Graph::from_lists(nodes, edges, directed));
      }, py::arg("nodes"), py::arg("edges"), py::kw_only(), py::arg("directed") = false)
      .def("num_nodes", &Graph::num_nodes)
      .def("num_edges", &Graph::num_edges)
      .def_property_readonly("directed", &Graph::directed)
      .def("find_node", &Graph::find_node, py::arg("key"))
      .def("node_key", &Graph::node_key, py::arg("node"))
      .def("position", &Graph::position, py::arg("node"))
      .def("blocked", &Graph::blocked, py::arg("node"))
      .def("find_edge", &Graph::find_edge, py::arg("u"), py::arg("v"))
      .def("has_negative_weight", &Graph::has_negative_weight)
      .def("edge_src_view", [](const Graph& g) {
        auto s = g.edge_src_view();
        py::array_t<std::int32_t> arr(s.size());
        std::memcpy(arr.mutable_data(), s.data(), s.size() * sizeof(std::int32_t));
        return arr;
      })
      .def("edge_dst_view", [](const Graph& g) {
        auto s = g.edge_dst_view();
        py::array_t<std::int32_t> arr(s.size());
        std::memcpy(arr.mutable_data(), s.data(), s.size() * sizeof(std::int32_t));
        return arr;
      })
      .def("weight_view", [](py::object self_obj) {
        const Graph& g = py::cast<const Graph&>(self_obj);
        auto s = g.weight_view();
        return py::array(
            py::buffer_info(
                const_cast<double*>(s.data()),
                sizeof(double),
                py::format_descriptor<double>::format(),
                1,
                { s.size() },
                { sizeof(double) }
            ),
            self_obj
        );
      });

  m.def("generate_random", [](std::int32_t num_nodes, double edge_probability, std::uint32_t seed, bool directed,
                              bool weighted, std::int32_t weight_min, std::int32_t weight_max) {
    RandomGraphParams p;
    p.num_nodes = num_nodes; p.edge_probability = edge_probability; p.directed = directed;
    p.weighted = weighted; p.weight_min = weight_min; p.weight_max = weight_max;
    return std::make_shared<Graph>(generate_random(p, seed));
  }, py::arg("num_nodes") = 10, py::arg("edge_probability") = 0.3, py::arg("seed") = 0, py::kw_only(),
     py::arg("directed") = false, py::arg("weighted") = true, py::arg("weight_min") = 1, py::arg("weight_max") = 10);

  m.def("generate_grid", [](std::int32_t rows, std::int32_t cols, double wall_probability, std::uint32_t seed,
                            bool directed) {
    GridGraphParams p;
    p.rows = rows; p.cols = cols; p.wall_probability = wall_probability; p.directed = directed;
    return std::make_shared<Graph>(generate_grid(p, seed));
  }, py::arg("rows") = 6, py::arg("cols") = 8, py::arg("wall_probability") = 0.25, py::arg("seed") = 0,
     py::kw_only(), py::arg("directed") = false);

  m.def("generate_scale_free", [](std::int32_t num_nodes, std::int32_t edges_per_node, std::uint32_t seed,
                                  bool directed, bool weighted, std::int32_t weight_min, std::int32_t weight_max) {
    ScaleFreeParams p;
    p.num_nodes = num_nodes; p.m = edges_per_node; p.directed = directed;
    p.weighted = weighted; p.weight_min = weight_min; p.weight_max = weight_max;
    return std::make_shared<Graph>(generate_scale_free(p, seed));
  }, py::arg("num_nodes") = 15, py::arg("m") = 2, py::arg("seed") = 0, py::kw_only(),
     py::arg("directed") = false, py::arg("weighted") = true, py::arg("weight_min") = 1, py::arg("weight_max") = 10);

  py::class_<NodeChange>(m, "NodeChange")
      .def_readonly("node", &NodeChange::node)
      .def_readonly("state", &NodeChange::state);
  py::class_<EdgeChange>(m, "EdgeChange")
      .def_readonly("edge", &EdgeChange::edge)
      .def_readonly("state", &EdgeChange::state);
  py::class_<QueueEntry>(m, "QueueEntry")
      .def_readonly("node", &QueueEntry::node)
      .def_readonly("priority", &QueueEntry::priority);
  py::class_<ScoreRow>(m, "ScoreRow")
      .def_readonly("node", &ScoreRow::node)
      .def_readonly("g", &ScoreRow::g)
      .def_readonly("h", &ScoreRow::h)
      .def_readonly("f", &ScoreRow::f);

  py::class_<Overlay>(m, "Overlay")
      .def_readonly("queue", &Overlay::queue)
      .def_readonly("queue_backward", &Overlay::queue_backward)
      .def_readonly("stack", &Overlay::stack)
      .def_property_readonly("distances", [](const Overlay& o) { return to_array(o.distances); })
      .def_readonly("scores", &Overlay::scores)
      .def_property_readonly("matrix", [](const Overlay& o) { return to_array(o.matrix); })
      .def_readonly("round", &Overlay::round)
      .def_readonly("highlight_cell", &Overlay::highlight_cell);

  py::class_<RunResult>(m, "RunResult")
      .def_readonly("path", &RunResult::path)
      .def_readonly("path_edges", &RunResult::path_edges)
      .def_readonly("path_cost", &RunResult::path_cost)
      .def_readonly("nodes_visited", &RunResult::nodes_visited)
      .def_readonly("edges_relaxed", &RunResult::edges_relaxed)
      .def_readonly("negative_cycle", &RunResult::negative_cycle);

  py::class_<Step>(m, "Step")
      .def_readonly("step_number", &Step::step_number)
      .def_readonly("current_node", &Step::current_node)
      .def_readonly("current_edge", &Step::current_edge)
      .def_readonly("node_changes", &Step::node_changes)
      .def_readonly("edge_changes", &Step::edge_changes)
      .def_readonly("overlay", &Step::overlay)
      .def_readonly("pseudocode_line", &Step::pseudocode_line)
      .def_readonly("explanation", &Step::explanation)
      .def_readonly("result", &Step::result)
      .def("is_final", &Step::is_final)
      .def("__eq__", [](const Step& a, const Step& b) { return a == b; });

  py::class_<StateTable>(m, "StateTable")
      .def("node", &StateTable::node, py::arg("node"))
      .def("edge", &StateTable::edge, py::arg("edge"));

  py::class_<AlgorithmInfo>(m, "AlgorithmInfo")
      .def_readonly("key", &AlgorithmInfo::key)
      .def_readonly("label", &AlgorithmInfo::label)
      .def_property_readonly("pseudocode", [](const AlgorithmInfo& a) {
        std::vector<std::string> lines(a.pseudocode.begin(), a.pseudocode.end());
        return lines;
      })
      .def_readonly("tags", &AlgorithmInfo::tags)
      .def_readonly("complexity_time", &AlgorithmInfo::complexity_time)
      .def_readonly("complexity_space", &AlgorithmInfo::complexity_space)
      .def_readonly("supports_negative", &AlgorithmInfo::supports_negative)
      .def_readonly("is_all_pairs", &AlgorithmInfo::is_all_pairs)
      .def_readonly("heuristics", &AlgorithmInfo::heuristics)
      .def_readonly("description", &AlgorithmInfo::description)
      .def("has_heuristic", &AlgorithmInfo::has_heuristic);

  m.def("list_algorithms", []() {
    std::vector<const AlgorithmInfo*> out;
    for (const auto& a : default_registry().list()) out.push_back(&a);
    return out;
  }, py::return_value_policy::reference);
  m.def("get_algorithm", [](const std::string& key) { return &default_registry().get(key); },
        py::arg("key"), py::return_value_policy::reference);
  m.def("algorithms_by_tag", [](const std::string& tag) { return default_registry().by_tag(tag); },
        py::arg("tag"), py::return_value_policy::reference);

  py::class_<Stepper>(m, "Stepper")
      .def("next", &Stepper::next, py::return_value_policy::reference_internal)
      .def("prev", &Stepper::prev, py::return_value_policy::reference_internal)
      .def("rewind", &Stepper::rewind)
      .def("seek", &Stepper::seek, py::arg("n"), py::return_value_policy::reference_internal)
      .def("run_to_end", [](Stepper& s) {
        const Step* last = nullptr;
        { py::gil_scoped_release rel; last = s.run_to_end(); }
        return last;
      }, py::return_value_policy::reference_internal)
      .def("current", &Stepper::current, py::return_value_policy::reference_internal)
      .def_property_readonly("position", &Stepper::position)
      .def_property_readonly("buffered", &Stepper::buffered)
      .def_property_readonly("exhausted", &Stepper::exhausted)
      .def_property_readonly("producer_calls", &Stepper::producer_calls)
      .def("at", &Stepper::at, py::arg("index"), py::return_value_policy::reference_internal);

  py::class_<RunMetrics>(m, "RunMetrics")
      .def_readonly("algorithm_key", &RunMetrics::algorithm_key)
      .def_readonly("algorithm_label", &RunMetrics::algorithm_label)
      .def_readonly("source", &RunMetrics::source)
      .def_readonly("target", &RunMetrics::target)
      .def_readonly("heuristic", &RunMetrics::heuristic)
      .def_readonly("nodes_visited", &RunMetrics::nodes_visited)
      .def_readonly("edges_relaxed", &RunMetrics::edges_relaxed)
      .def_readonly("path_length", &RunMetrics::path_length)
      .def_readonly("path_cost", &RunMetrics::path_cost)
      .def_readonly("total_steps", &RunMetrics::total_steps)
      .def_readonly("wall_time_ms", &RunMetrics::wall_time_ms)
      .def_readonly("peak_buffered_steps", &RunMetrics::peak_buffered_steps)
      .def_readonly("path_found", &RunMetrics::path_found)
      .def_readonly("negative_cycle", &RunMetrics::negative_cycle);

  py::class_<Recorder>(m, "Recorder")
      .def(py::init<>())
      .def("start", [](Recorder& r, const std::string& algorithm, const std::string& source, const std::string& target,
                       std::shared_ptr<Graph> graph, const SearchOptions& opts) {
        r.start(algorithm, source, target, std::shared_ptr<const Graph>(std::move(graph)), opts);
      }, py::arg("algorithm"), py::arg("source"), py::arg("target"), py::arg("graph"),
         py::arg("options") = SearchOptions{})
      .def("run_to_completion", [](Recorder& r) {
        py::gil_scoped_release rel;
        return r.run_to_completion();
      })
      .def("run_to", [](Recorder& r, std::size_t position) {
        py::gil_scoped_release rel;
        return r.run_to(position);
      }, py::arg("position"))
      .def_property_readonly("started", &Recorder::started)
      .def_property_readonly("completed", &Recorder::completed)
      .def_property_readonly("stepper", py::overload_cast<>(&Recorder::stepper), py::return_value_policy::reference_internal)
      .def_property_readonly("metrics", &Recorder::metrics)
      .def("final_step", &Recorder::final_step, py::return_value_policy::reference_internal)
      .def("replay", [](const Recorder& r, std::size_t k) {
        const auto& h = r.stepper().history();
        std::vector<Step> steps(h.begin(), h.end());
        return replay(r.graph(), steps, k);
      }, py::arg("k"));

  py::class_<ComparisonResult>(m, "ComparisonResult")
      .def_readonly("left", &ComparisonResult::left)
      .def_readonly("right", &ComparisonResult::right)
      .def_readonly("nodes_visited", &ComparisonResult::nodes_visited)
      .def_readonly("edges_relaxed", &ComparisonResult::edges_relaxed)
      .def_readonly("path_cost", &ComparisonResult::path_cost)
      .def_readonly("wall_time", &ComparisonResult::wall_time);

  m.def("compare", py::overload_cast<const Recorder&, const Recorder&>(&compare), py::arg("left"), py::arg("right"));
  m.def("compare_metrics", py::overload_cast<const RunMetrics&, const RunMetrics&>(&compare),
        py::arg("left"), py::arg("right"));
}
