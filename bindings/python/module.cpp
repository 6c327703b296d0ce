/*
  Pybind11 module exposing ReliefRoute-Core C++ APIs to Python.

  Notes:
    - Records (Location, ReliefCenter, ...) are plain value types with
      read/write attributes; lists convert via pybind11/stl.h.
    - Random engines are seeded per call from an integer seed.
    - Long-running searches release the GIL.
    - Timestamps convert to datetime via pybind11/chrono.h.
*/
#include <pybind11/pybind11.h>
#include <pybind11/chrono.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <cstring>
#include <unordered_map>

#include "reliefroute/core/allocation.hpp"
#include "reliefroute/core/error.hpp"
#include "reliefroute/core/evaluator.hpp"
#include "reliefroute/core/model.hpp"
#include "reliefroute/core/optimizer.hpp"
#include "reliefroute/core/options.hpp"
#include "reliefroute/core/pareto_optimizer.hpp"
#include "reliefroute/core/road_graph.hpp"
#include "reliefroute/core/road_network.hpp"
#include "reliefroute/core/routing_engine.hpp"
#include "reliefroute/core/shortest_paths.hpp"
#include "reliefroute/core/types.hpp"

namespace py = pybind11;
using namespace reliefroute::core;

template <typename T>
static py::array_t<T> to_array(std::span<const T> s) {
  py::array_t<T> arr(s.size());
  std::memcpy(arr.mutable_data(), s.data(), s.size() * sizeof(T));
  return arr;
}

static py::dict path_to_dict(const RoadGraph& g, const PathResult& p) {
  py::list nodes;
  for (auto v : p.nodes) nodes.append(g.node_id(v));
  py::dict d;
  d["cost"] = p.cost;
  d["nodes"] = nodes;
  d["edges"] = p.edges;
  return d;
}

static NodeId require_node(const RoadGraph& g, const LocationId& id) {
  auto v = g.node_index(id);
  if (!v) throw py::key_error("unknown location '" + id + "'");
  return *v;
}

PYBIND11_MODULE(_reliefroute_core, m) {
  m.doc() = "ReliefRoute-Core C++ bindings";

  py::register_exception<NotFoundError>(m, "NotFoundError", PyExc_LookupError);
  py::register_exception<AssignmentError>(m, "AssignmentError", PyExc_ValueError);

  py::enum_<RoadCondition>(m, "RoadCondition")
      .value("EXCELLENT", RoadCondition::Excellent)
      .value("GOOD", RoadCondition::Good)
      .value("FAIR", RoadCondition::Fair)
      .value("POOR", RoadCondition::Poor)
      .value("DAMAGED", RoadCondition::Damaged)
      .value("BLOCKED", RoadCondition::Blocked)
      .def_property_readonly("multiplier", [](RoadCondition c){ return condition_multiplier(c); });

  py::enum_<TrafficLevel>(m, "TrafficLevel")
      .value("LIGHT", TrafficLevel::Light)
      .value("MODERATE", TrafficLevel::Moderate)
      .value("HEAVY", TrafficLevel::Heavy)
      .value("SEVERE", TrafficLevel::Severe)
      .def_property_readonly("multiplier", [](TrafficLevel t){ return traffic_multiplier(t); });

  py::enum_<PathMetric>(m, "PathMetric")
      .value("TIME", PathMetric::Time)
      .value("DISTANCE", PathMetric::Distance);

  py::enum_<LocationKind>(m, "LocationKind")
      .value("RELIEF_CENTER", LocationKind::ReliefCenter)
      .value("DISASTER_ZONE", LocationKind::DisasterZone)
      .value("TRANSIT", LocationKind::Transit);

  py::enum_<AllocationStatus>(m, "AllocationStatus")
      .value("OPTIMAL", AllocationStatus::Optimal)
      .value("INFEASIBLE", AllocationStatus::Infeasible);

  m.def("parse_road_condition", &parse_road_condition, py::arg("name"));
  m.def("parse_traffic_level", &parse_traffic_level, py::arg("name"));

  // ---- data model
  py::class_<Location>(m, "Location")
      .def(py::init([](LocationId id, std::string name, double lat, double lng, LocationKind kind){
        return Location{std::move(id), std::move(name), lat, lng, kind};
      }), py::arg("id"), py::arg("name") = "", py::arg("lat") = 0.0, py::arg("lng") = 0.0,
          py::arg("kind") = LocationKind::Transit)
      .def_readwrite("id", &Location::id)
      .def_readwrite("name", &Location::name)
      .def_readwrite("lat", &Location::lat)
      .def_readwrite("lng", &Location::lng)
      .def_readwrite("kind", &Location::kind);

  py::class_<Resource>(m, "Resource")
      .def(py::init([](std::string id, std::int64_t quantity, std::string name, std::string unit){
        return Resource{std::move(id), std::move(name), quantity, std::move(unit)};
      }), py::arg("id"), py::arg("quantity"), py::arg("name") = "", py::arg("unit") = "")
      .def_readwrite("id", &Resource::id)
      .def_readwrite("name", &Resource::name)
      .def_readwrite("quantity", &Resource::quantity)
      .def_readwrite("unit", &Resource::unit);

  py::class_<ReliefCenter>(m, "ReliefCenter")
      .def(py::init([](Location loc, std::vector<Resource> resources, std::int64_t capacity){
        ReliefCenter c{std::move(loc), std::move(resources), capacity};
        validate(c);
        return c;
      }), py::arg("location"), py::arg("resources"), py::arg("capacity"))
      .def_readwrite("location", &ReliefCenter::location)
      .def_readwrite("resources", &ReliefCenter::resources)
      .def_readwrite("capacity", &ReliefCenter::capacity)
      .def("stock_of", &ReliefCenter::stock_of, py::arg("resource_id"));

  py::class_<DisasterZone>(m, "DisasterZone")
      .def(py::init([](Location loc, int severity, std::int64_t population, std::vector<Resource> needed, int priority){
        DisasterZone z{std::move(loc), severity, population, std::move(needed), priority};
        validate(z);
        return z;
      }), py::arg("location"), py::arg("severity"), py::arg("population_affected"),
          py::arg("resources_needed"), py::arg("priority"))
      .def_readwrite("location", &DisasterZone::location)
      .def_readwrite("severity", &DisasterZone::severity)
      .def_readwrite("population_affected", &DisasterZone::population_affected)
      .def_readwrite("resources_needed", &DisasterZone::resources_needed)
      .def_readwrite("priority", &DisasterZone::priority);

  py::class_<Connection>(m, "Connection")
      .def(py::init([](LocationId from, LocationId to, double distance, std::optional<double> time){
        return Connection{std::move(from), std::move(to), distance, time};
      }), py::arg("from_id"), py::arg("to_id"), py::arg("distance"), py::arg("time") = py::none())
      .def_readwrite("from_id", &Connection::from)
      .def_readwrite("to_id", &Connection::to)
      .def_readwrite("distance", &Connection::distance)
      .def_readwrite("time", &Connection::time);

  py::class_<RouteSegment>(m, "RouteSegment")
      .def_readonly("from_id", &RouteSegment::from)
      .def_readonly("to_id", &RouteSegment::to)
      .def_readonly("base_distance", &RouteSegment::base_distance)
      .def_readonly("base_time", &RouteSegment::base_time)
      .def_readonly("condition", &RouteSegment::condition)
      .def_readonly("traffic", &RouteSegment::traffic)
      .def_readonly("last_updated", &RouteSegment::last_updated)
      .def_property_readonly("effective_time", &RouteSegment::effective_time)
      .def_property_readonly("is_passable", &RouteSegment::is_passable);

  py::class_<RouteObjectives>(m, "RouteObjectives")
      .def(py::init([](double time, double distance, double condition) {
             RouteObjectives o{time, distance, condition};
             validate(o);
             return o;
           }), py::kw_only(), py::arg("time") = 1.0, py::arg("distance") = 0.5, py::arg("condition") = 0.3)
      .def_readwrite("time", &RouteObjectives::time)
      .def_readwrite("distance", &RouteObjectives::distance)
      .def_readwrite("condition", &RouteObjectives::condition);

  // ---- graph snapshot and path search
  py::class_<RoadGraph, std::shared_ptr<RoadGraph>>(m, "RoadGraph")
      .def_static("from_connections",
          [](const std::vector<Location>& locations, const std::vector<Connection>& connections,
             double default_speed_kmh, bool add_reverse) {
            std::unordered_map<LocationId, NodeId> index;
            for (std::size_t i = 0; i < locations.size(); ++i) {
              index.emplace(locations[i].id, static_cast<NodeId>(i));
            }
            auto lookup = [&](const LocationId& id) {
              auto it = index.find(id);
              if (it == index.end()) throw NotFoundError("unknown location '" + id + "'");
              return it->second;
            };
            std::vector<NodeId> src, dst;
            std::vector<Cost> time, dist;
            for (auto const& c : connections) {
              src.push_back(lookup(c.from));
              dst.push_back(lookup(c.to));
              time.push_back(c.time.value_or(c.distance / default_speed_kmh));
              dist.push_back(c.distance);
            }
            return RoadGraph::from_arrays(locations, src, dst, time, dist, add_reverse);
          },
          py::arg("locations"), py::arg("connections"), py::kw_only(),
          py::arg("default_speed_kmh") = kDefaultSpeedKmh, py::arg("add_reverse") = false)
      .def("num_nodes", &RoadGraph::num_nodes)
      .def("num_edges", &RoadGraph::num_edges)
      .def("node_id", &RoadGraph::node_id, py::arg("v"))
      .def("node_index", &RoadGraph::node_index, py::arg("id"))
      .def("time_view", [](const RoadGraph& g){ return to_array<Cost>(g.time_view()); })
      .def("distance_view", [](const RoadGraph& g){ return to_array<Cost>(g.distance_view()); })
      .def("edge_src_view", [](const RoadGraph& g){ return to_array<NodeId>(g.edge_src_view()); })
      .def("edge_dst_view", [](const RoadGraph& g){ return to_array<NodeId>(g.edge_dst_view()); })
      .def("heuristic_scale", &RoadGraph::heuristic_scale);

  m.def("shortest_path",
        [](const RoadGraph& g, const LocationId& src, const LocationId& dst, PathMetric metric) {
          auto s = require_node(g, src);
          auto t = require_node(g, dst);
          PathResult p;
          {
            py::gil_scoped_release release;
            p = shortest_path(g, s, t, metric);
          }
          return path_to_dict(g, p);
        }, py::arg("g"), py::arg("src"), py::arg("dst"), py::kw_only(), py::arg("metric") = PathMetric::Time);

  m.def("astar_path",
        [](const RoadGraph& g, const LocationId& src, const LocationId& dst) {
          auto s = require_node(g, src);
          auto t = require_node(g, dst);
          PathResult p;
          {
            py::gil_scoped_release release;
            p = astar_path(g, s, t);
          }
          return path_to_dict(g, p);
        }, py::arg("g"), py::arg("src"), py::arg("dst"));

  m.def("weighted_shortest_path",
        [](const RoadGraph& g, const LocationId& src, const LocationId& dst,
           const RouteObjectives& objectives, const std::vector<double>& condition_factors) {
          auto s = require_node(g, src);
          auto t = require_node(g, dst);
          PathResult p;
          {
            py::gil_scoped_release release;
            const auto weights = combined_edge_weights(g, condition_factors, objectives);
            p = weighted_shortest_path(g, s, t, weights);
          }
          return path_to_dict(g, p);
        }, py::arg("g"), py::arg("src"), py::arg("dst"), py::kw_only(),
           py::arg("objectives") = RouteObjectives{}, py::arg("condition_factors") = std::vector<double>{});

  m.def("edge_disjoint_paths",
        [](const RoadGraph& g, const LocationId& src, const LocationId& dst, int k, PathMetric metric) {
          auto s = require_node(g, src);
          auto t = require_node(g, dst);
          std::vector<PathResult> paths;
          {
            py::gil_scoped_release release;
            paths = edge_disjoint_paths(g, s, t, k, metric);
          }
          py::list out;
          for (auto const& p : paths) out.append(path_to_dict(g, p));
          return out;
        }, py::arg("g"), py::arg("src"), py::arg("dst"), py::kw_only(), py::arg("k"),
           py::arg("metric") = PathMetric::Time);

  // ---- options
  py::class_<EvaluatorWeights>(m, "EvaluatorWeights")
      .def(py::init<>())
      .def_readwrite("coverage", &EvaluatorWeights::coverage)
      .def_readwrite("efficiency", &EvaluatorWeights::efficiency)
      .def_readwrite("distance", &EvaluatorWeights::distance)
      .def_readwrite("unreachable_penalty", &EvaluatorWeights::unreachable_penalty);

  py::class_<AnnealingCostModel>(m, "AnnealingCostModel")
      .def(py::init<>())
      .def_readwrite("unreachable_penalty", &AnnealingCostModel::unreachable_penalty);

  py::class_<GeneticOptions>(m, "GeneticOptions")
      .def(py::init([](int population_size, int generations, double mutation_rate,
                       double elite_fraction, int tournament_size, EvaluatorWeights weights){
        GeneticOptions o{population_size, generations, mutation_rate, elite_fraction, tournament_size, weights};
        validate(o);
        return o;
      }), py::kw_only(), py::arg("population_size") = 50, py::arg("generations") = 100,
          py::arg("mutation_rate") = 0.1, py::arg("elite_fraction") = 0.1, py::arg("tournament_size") = 3,
          py::arg("weights") = EvaluatorWeights{})
      .def_readwrite("population_size", &GeneticOptions::population_size)
      .def_readwrite("generations", &GeneticOptions::generations)
      .def_readwrite("mutation_rate", &GeneticOptions::mutation_rate)
      .def_readwrite("elite_fraction", &GeneticOptions::elite_fraction)
      .def_readwrite("tournament_size", &GeneticOptions::tournament_size)
      .def_readwrite("weights", &GeneticOptions::weights);

  py::class_<AnnealingOptions>(m, "AnnealingOptions")
      .def(py::init([](double initial_temperature, double cooling_rate, double min_temperature,
                       AnnealingCostModel cost){
        AnnealingOptions o{initial_temperature, cooling_rate, min_temperature, cost};
        validate(o);
        return o;
      }), py::kw_only(), py::arg("initial_temperature") = 1000.0, py::arg("cooling_rate") = 0.95,
          py::arg("min_temperature") = 1.0, py::arg("cost") = AnnealingCostModel{})
      .def_readwrite("initial_temperature", &AnnealingOptions::initial_temperature)
      .def_readwrite("cooling_rate", &AnnealingOptions::cooling_rate)
      .def_readwrite("min_temperature", &AnnealingOptions::min_temperature)
      .def_readwrite("cost", &AnnealingOptions::cost);

  py::class_<ParetoOptions>(m, "ParetoOptions")
      .def(py::init([](int population_size, int generations, double mutation_rate,
                       int tournament_size, double unreachable_penalty){
        ParetoOptions o{population_size, generations, mutation_rate, tournament_size, unreachable_penalty};
        validate(o);
        return o;
      }), py::kw_only(), py::arg("population_size") = 50, py::arg("generations") = 100,
          py::arg("mutation_rate") = 0.1, py::arg("tournament_size") = 2,
          py::arg("unreachable_penalty") = kDefaultUnreachablePenalty)
      .def_readwrite("population_size", &ParetoOptions::population_size)
      .def_readwrite("generations", &ParetoOptions::generations)
      .def_readwrite("mutation_rate", &ParetoOptions::mutation_rate)
      .def_readwrite("tournament_size", &ParetoOptions::tournament_size)
      .def_readwrite("unreachable_penalty", &ParetoOptions::unreachable_penalty);

  py::class_<RoutingOptions>(m, "RoutingOptions")
      .def(py::init<>())
      .def_readwrite("cache_ttl", &RoutingOptions::cache_ttl)
      .def_readwrite("history_limit", &RoutingOptions::history_limit)
      .def_readwrite("default_speed_kmh", &RoutingOptions::default_speed_kmh)
      .def_readwrite("astar_min_priority", &RoutingOptions::astar_min_priority)
      .def_readwrite("initial_condition", &RoutingOptions::initial_condition);

  // ---- allocation results
  py::class_<ResourceAllocation>(m, "ResourceAllocation")
      .def_readonly("center_id", &ResourceAllocation::center_id)
      .def_readonly("zone_id", &ResourceAllocation::zone_id)
      .def_readonly("resource_id", &ResourceAllocation::resource_id)
      .def_readonly("quantity", &ResourceAllocation::quantity);

  py::class_<DeliveryRoute>(m, "DeliveryRoute")
      .def_readonly("center_id", &DeliveryRoute::center_id)
      .def_readonly("zone_id", &DeliveryRoute::zone_id)
      .def_readonly("distance", &DeliveryRoute::distance);

  py::class_<AllocationSolution>(m, "AllocationSolution")
      .def_readonly("assignment", &AllocationSolution::assignment)
      .def_readonly("allocations", &AllocationSolution::allocations)
      .def_readonly("routes", &AllocationSolution::routes)
      .def_readonly("total_cost", &AllocationSolution::total_cost)
      .def_readonly("coverage_score", &AllocationSolution::coverage_score)
      .def_readonly("time_efficiency", &AllocationSolution::time_efficiency)
      .def("allocated", &AllocationSolution::allocated,
           py::arg("center_id"), py::arg("zone_id"), py::arg("resource_id"));

  py::class_<ExactAllocationResult>(m, "ExactAllocationResult")
      .def_readonly("status", &ExactAllocationResult::status)
      .def_readonly("allocations", &ExactAllocationResult::allocations)
      .def_readonly("objective", &ExactAllocationResult::objective)
      .def_readonly("unmet_demand", &ExactAllocationResult::unmet_demand);

  // ---- optimizer entry points
  m.def("optimize_allocation",
        [](const std::vector<ReliefCenter>& centers, const std::vector<DisasterZone>& zones,
           const RoadGraph& g, const GeneticOptions& options, std::uint64_t seed) {
          RandomEngine rng(seed);
          py::gil_scoped_release release;
          return optimize_allocation(centers, zones, g, options, rng);
        }, py::arg("centers"), py::arg("zones"), py::arg("network"), py::arg("options"), py::kw_only(),
           py::arg("seed") = 0);

  m.def("optimize_allocation",
        [](const std::vector<ReliefCenter>& centers, const std::vector<DisasterZone>& zones,
           const RoadGraph& g, const AnnealingOptions& options, std::uint64_t seed) {
          RandomEngine rng(seed);
          py::gil_scoped_release release;
          return optimize_allocation(centers, zones, g, options, rng);
        }, py::arg("centers"), py::arg("zones"), py::arg("network"), py::arg("options"), py::kw_only(),
           py::arg("seed") = 0);

  m.def("optimize_pareto_front",
        [](const std::vector<ReliefCenter>& centers, const std::vector<DisasterZone>& zones,
           const RoadGraph& g, const ParetoOptions& options, std::uint64_t seed) {
          RandomEngine rng(seed);
          py::gil_scoped_release release;
          return optimize_pareto_front(centers, zones, g, options, rng);
        }, py::arg("centers"), py::arg("zones"), py::arg("network"), py::arg("options"), py::kw_only(),
           py::arg("seed") = 0);

  m.def("exact_allocation",
        [](const std::vector<ReliefCenter>& centers, const std::vector<DisasterZone>& zones,
           const RoadGraph& g, bool require_full_coverage) {
          ProblemInstance problem(centers, zones, g);
          ExactAllocationOptions options;
          options.require_full_coverage = require_full_coverage;
          py::gil_scoped_release release;
          return exact_allocation(problem, options);
        }, py::arg("centers"), py::arg("zones"), py::arg("network"), py::kw_only(),
           py::arg("require_full_coverage") = false);

  // ---- routing engine
  py::class_<DynamicRoute>(m, "DynamicRoute")
      .def_readonly("id", &DynamicRoute::id)
      .def_readonly("origin", &DynamicRoute::origin)
      .def_readonly("destination", &DynamicRoute::destination)
      .def_readonly("waypoints", &DynamicRoute::waypoints)
      .def_readonly("segments", &DynamicRoute::segments)
      .def_readonly("total_distance", &DynamicRoute::total_distance)
      .def_readonly("estimated_time", &DynamicRoute::estimated_time)
      .def_readonly("priority", &DynamicRoute::priority)
      .def_readonly("created_at", &DynamicRoute::created_at)
      .def_readonly("last_updated", &DynamicRoute::last_updated);

  py::class_<RouteStatus>(m, "RouteStatus")
      .def_readonly("route_id", &RouteStatus::route_id)
      .def_property_readonly("status", [](const RouteStatus& s){ return std::string(s.status()); })
      .def_readonly("estimated_time", &RouteStatus::estimated_time)
      .def_readonly("total_distance", &RouteStatus::total_distance)
      .def_readonly("delay_factor", &RouteStatus::delay_factor)
      .def_readonly("blocked_segments", &RouteStatus::blocked_segments)
      .def_readonly("last_updated", &RouteStatus::last_updated)
      .def_readonly("waypoints", &RouteStatus::waypoints);

  py::class_<NetworkStatistics>(m, "NetworkStatistics")
      .def_readonly("total_segments", &NetworkStatistics::total_segments)
      .def_readonly("blocked_segments", &NetworkStatistics::blocked_segments)
      .def_readonly("passable_segments", &NetworkStatistics::passable_segments)
      .def_readonly("locations", &NetworkStatistics::locations)
      .def_readonly("active_routes", &NetworkStatistics::active_routes)
      .def_readonly("cached_routes", &NetworkStatistics::cached_routes)
      .def_readonly("traffic_distribution", &NetworkStatistics::traffic_distribution)
      .def_readonly("condition_distribution", &NetworkStatistics::condition_distribution);

  py::class_<WeightedRoute>(m, "WeightedRoute")
      .def_readonly("waypoints", &WeightedRoute::waypoints)
      .def_readonly("total_weight", &WeightedRoute::total_weight)
      .def_readonly("estimated_time", &WeightedRoute::estimated_time)
      .def_readonly("total_distance", &WeightedRoute::total_distance);

  py::class_<DynamicRoutingEngine>(m, "DynamicRoutingEngine")
      .def(py::init<RoutingOptions>(), py::arg("options") = RoutingOptions{})
      .def("initialize_network",
           [](DynamicRoutingEngine& e, const std::vector<Location>& locations,
              const std::vector<Connection>& connections) { e.initialize_network(locations, connections); },
           py::arg("locations"), py::arg("connections"))
      .def("add_location", &DynamicRoutingEngine::add_location, py::arg("location"))
      .def("add_segment", &DynamicRoutingEngine::add_segment,
           py::arg("from_id"), py::arg("to_id"), py::arg("distance"), py::arg("base_time"))
      .def("find_optimal_route",
           [](DynamicRoutingEngine& e, const LocationId& origin, const LocationId& destination,
              int priority, const std::vector<LocationId>& avoid_nodes) {
             py::gil_scoped_release release;
             return e.find_optimal_route(origin, destination, priority, avoid_nodes);
           }, py::arg("origin"), py::arg("destination"), py::arg("priority") = 3,
              py::arg("avoid_nodes") = std::vector<LocationId>{})
      .def("find_weighted_route",
           [](const DynamicRoutingEngine& e, const LocationId& origin, const LocationId& destination,
              const RouteObjectives& objectives) {
             py::gil_scoped_release release;
             return e.find_weighted_route(origin, destination, objectives);
           }, py::arg("origin"), py::arg("destination"), py::kw_only(),
              py::arg("objectives") = RouteObjectives{})
      .def("find_alternative_routes",
           [](DynamicRoutingEngine& e, const LocationId& origin, const LocationId& destination, int count) {
             py::gil_scoped_release release;
             return e.find_alternative_routes(origin, destination, count);
           }, py::arg("origin"), py::arg("destination"), py::arg("count") = 3)
      .def("update_condition", &DynamicRoutingEngine::update_condition,
           py::arg("from_id"), py::arg("to_id"), py::arg("condition"))
      .def("update_traffic", &DynamicRoutingEngine::update_traffic,
           py::arg("from_id"), py::arg("to_id"), py::arg("traffic"))
      .def("get_route_status", &DynamicRoutingEngine::get_route_status, py::arg("route_id"))
      .def("get_route", &DynamicRoutingEngine::get_route, py::arg("route_id"))
      .def("get_network_statistics", &DynamicRoutingEngine::get_network_statistics)
      .def("segment", &DynamicRoutingEngine::segment, py::arg("from_id"), py::arg("to_id"))
      .def("condition_history",
           [](const DynamicRoutingEngine& e, const LocationId& from, const LocationId& to) {
             py::list out;
             for (auto const& c : e.condition_history(from, to)) out.append(py::make_tuple(c.at, c.condition));
             return out;
           }, py::arg("from_id"), py::arg("to_id"))
      .def("traffic_history",
           [](const DynamicRoutingEngine& e, const LocationId& from, const LocationId& to) {
             py::list out;
             for (auto const& t : e.traffic_history(from, to)) out.append(py::make_tuple(t.at, t.traffic));
             return out;
           }, py::arg("from_id"), py::arg("to_id"))
      .def("simulate_traffic_conditions",
           [](DynamicRoutingEngine& e, std::uint64_t seed) {
             RandomEngine rng(seed);
             return e.simulate_traffic_conditions(rng);
           }, py::arg("seed") = 0)
      .def("simulate_road_incidents",
           [](DynamicRoutingEngine& e, std::uint64_t seed) {
             RandomEngine rng(seed);
             return e.simulate_road_incidents(rng);
           }, py::arg("seed") = 0)
      .def("sweep_expired_cache", &DynamicRoutingEngine::sweep_expired_cache)
      .def("remove_route", &DynamicRoutingEngine::remove_route, py::arg("route_id"))
      // Returns a private copy; the engine's snapshot stays immutable.
      .def("snapshot", [](const DynamicRoutingEngine& e) {
        return std::make_shared<RoadGraph>(*e.snapshot());
      });
}
