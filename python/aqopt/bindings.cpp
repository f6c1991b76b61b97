/**
 * @file bindings.cpp
 * @brief Python bindings for aqopt using pybind11
 *
 * Provides Python interface for:
 * - Well functions and single-well drawdown
 * - Well fields and superposition
 * - Pumping allocation and well siting
 * - Configuration and the Planner facade
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "aqopt/aqopt.hpp"
#include <cstdint>
#include <random>
#include <sstream>

namespace py = pybind11;
using namespace aqopt;

// ============================================================================
// Python Module Definition
// ============================================================================

PYBIND11_MODULE(aqopt_py, m) {
    m.doc() = R"pbdoc(
        aqopt: Aquifer drawdown and pumping optimization
        ================================================

        Analytical drawdown (Theis, Cooper-Jacob, Thiem) for confined
        aquifers, multi-well superposition, and optimal allocation of
        pumping rates under minimum-head constraints.

        Example:
            >>> import aqopt_py as aq
            >>> planner = aq.Planner(aq.Config.default_scenario())
            >>> result = planner.allocate(aq.AllocationMethod.Nonlinear)
            >>> result.rates
    )pbdoc";

    // Exceptions map onto ValueError
    py::register_exception<InvalidParameter>(m, "InvalidParameter", PyExc_ValueError);
    py::register_exception<NumericalDomainError>(m, "NumericalDomainError", PyExc_ValueError);

    // ========================================================================
    // Enums
    // ========================================================================

    py::enum_<DrawdownMethod>(m, "DrawdownMethod")
        .value("Theis", DrawdownMethod::Theis)
        .value("CooperJacob", DrawdownMethod::CooperJacob)
        .export_values();

    py::enum_<AllocationMethod>(m, "AllocationMethod")
        .value("Linear", AllocationMethod::Linear)
        .value("Nonlinear", AllocationMethod::Nonlinear)
        .export_values();

    py::enum_<LimitKind>(m, "LimitKind")
        .value("MinHead", LimitKind::MinHead)
        .value("MaxDrawdown", LimitKind::MaxDrawdown)
        .export_values();

    py::enum_<OptimizationStatus>(m, "OptimizationStatus")
        .value("Optimal", OptimizationStatus::Optimal)
        .value("Infeasible", OptimizationStatus::Infeasible)
        .value("NonConvergence", OptimizationStatus::NonConvergence)
        .value("SolverError", OptimizationStatus::SolverError)
        .export_values();

    // ========================================================================
    // Well Functions
    // ========================================================================

    m.def("theis_well_function", &theis_well_function, py::arg("u"));
    m.def("theis_u", &theis_u, py::arg("r"), py::arg("t"), py::arg("T"), py::arg("S"));
    m.def("theis_solution", &theis_solution,
          py::arg("r"), py::arg("t"), py::arg("Q"), py::arg("T"), py::arg("S"));
    m.def("cooper_jacob_solution", &cooper_jacob_solution,
          py::arg("r"), py::arg("t"), py::arg("Q"), py::arg("T"), py::arg("S"));
    m.def("thiem_solution", &thiem_solution,
          py::arg("r"), py::arg("Q"), py::arg("T"), py::arg("R"));
    m.def("thiem_head", &thiem_head,
          py::arg("r"), py::arg("Q"), py::arg("T"), py::arg("R"), py::arg("h0"));
    m.def("cooper_jacob_min_time", &cooper_jacob_min_time,
          py::arg("r"), py::arg("T"), py::arg("S"));

    // ========================================================================
    // Aquifer and Wells
    // ========================================================================

    py::class_<AquiferParameters>(m, "AquiferParameters")
        .def(py::init<Real, Real>(), py::arg("T"), py::arg("S"))
        .def_readwrite("T", &AquiferParameters::T)
        .def_readwrite("S", &AquiferParameters::S)
        .def("validate", &AquiferParameters::validate)
        .def("diffusivity", &AquiferParameters::diffusivity);

    py::class_<PumpingWell>(m, "PumpingWell")
        .def(py::init<Real, Real, Real, std::string, Real>(),
             py::arg("x"), py::arg("y"), py::arg("Q"),
             py::arg("name") = "", py::arg("r_well") = constants::DEFAULT_WELL_RADIUS)
        .def_property_readonly("x", &PumpingWell::x)
        .def_property_readonly("y", &PumpingWell::y)
        .def_property_readonly("name", &PumpingWell::name)
        .def_property_readonly("radius", &PumpingWell::radius)
        .def_property("rate", &PumpingWell::rate, &PumpingWell::set_rate)
        .def("compute_drawdown",
             py::overload_cast<const Vector&, const Vector&, Real, const AquiferParameters&,
                               DrawdownMethod>(&PumpingWell::compute_drawdown, py::const_),
             py::arg("xs"), py::arg("ys"), py::arg("t"), py::arg("params"),
             py::arg("method") = DrawdownMethod::Theis);

    py::class_<ConstraintPoint>(m, "ConstraintPoint")
        .def_static("from_min_head", &ConstraintPoint::from_min_head,
                    py::arg("x"), py::arg("y"), py::arg("h_min"), py::arg("name") = "")
        .def_static("from_max_drawdown", &ConstraintPoint::from_max_drawdown,
                    py::arg("x"), py::arg("y"), py::arg("s_max"), py::arg("name") = "")
        .def_readwrite("x", &ConstraintPoint::x)
        .def_readwrite("y", &ConstraintPoint::y)
        .def_readwrite("limit", &ConstraintPoint::limit)
        .def_readwrite("kind", &ConstraintPoint::kind)
        .def_readwrite("name", &ConstraintPoint::name);

    py::class_<WellField>(m, "WellField")
        .def(py::init<>())
        .def("add_well", &WellField::add_well)
        .def("remove_well", py::overload_cast<const std::string&>(&WellField::remove_well))
        .def("__len__", &WellField::size)
        .def("total_rate", &WellField::total_rate)
        .def("x", &WellField::x)
        .def("y", &WellField::y)
        .def("rates", &WellField::rates)
        .def("set_rates", &WellField::set_rates)
        .def("compute_total_drawdown",
             py::overload_cast<const Vector&, const Vector&, Real, const AquiferParameters&,
                               DrawdownMethod>(&WellField::compute_total_drawdown, py::const_),
             py::arg("xs"), py::arg("ys"), py::arg("t"), py::arg("params"),
             py::arg("method") = DrawdownMethod::Theis);

    // ========================================================================
    // Analysis
    // ========================================================================

    py::class_<SuperpositionEngine>(m, "SuperpositionEngine")
        .def(py::init<const AquiferParameters&, DrawdownMethod>())
        .def("drawdown",
             py::overload_cast<const WellField&, const Vector&, const Vector&, Real>(
                 &SuperpositionEngine::drawdown, py::const_))
        .def("response_matrix",
             py::overload_cast<const WellField&, const std::vector<ConstraintPoint>&, Real>(
                 &SuperpositionEngine::response_matrix, py::const_));

    m.def("drawdown_grid", &drawdown_grid,
          py::arg("field"), py::arg("xs"), py::arg("ys"), py::arg("t"),
          py::arg("params"), py::arg("method") = DrawdownMethod::Theis);
    m.def("interference_coefficient", &interference_coefficient,
          py::arg("field"), py::arg("reference_well"), py::arg("x"), py::arg("y"),
          py::arg("t"), py::arg("params"), py::arg("method") = DrawdownMethod::Theis);

    // ========================================================================
    // Optimization
    // ========================================================================

    py::class_<OptimizationResult>(m, "OptimizationResult")
        .def_readonly("method", &OptimizationResult::method)
        .def_readonly("status", &OptimizationResult::status)
        .def_readonly("success", &OptimizationResult::success)
        .def_readonly("authoritative", &OptimizationResult::authoritative)
        .def_readonly("rates", &OptimizationResult::rates)
        .def_readonly("total_rate", &OptimizationResult::total_rate)
        .def_readonly("heads", &OptimizationResult::heads)
        .def_readonly("theis_heads", &OptimizationResult::theis_heads)
        .def_readonly("iterations", &OptimizationResult::iterations)
        .def_readonly("max_u", &OptimizationResult::max_u)
        .def_readonly("message", &OptimizationResult::message)
        .def("__repr__", [](const OptimizationResult& r) {
            std::ostringstream os;
            r.print(os);
            return os.str();
        });

    py::class_<AllocationConfig>(m, "AllocationConfig")
        .def(py::init<>())
        .def_readwrite("max_iterations", &AllocationConfig::max_iterations)
        .def_readwrite("tolerance", &AllocationConfig::tolerance)
        .def_readwrite("constraint_tolerance", &AllocationConfig::constraint_tolerance)
        .def_readwrite("lp_timeout", &AllocationConfig::lp_timeout)
        .def_readwrite("verbose", &AllocationConfig::verbose)
        .def_readwrite("warn_cooper_jacob", &AllocationConfig::warn_cooper_jacob);

    py::class_<AllocationOptimizer>(m, "AllocationOptimizer")
        .def(py::init<>())
        .def(py::init<const AllocationConfig&>())
        .def("optimize",
             py::overload_cast<AllocationMethod, const std::vector<Vec2>&, Real, Real, Real,
                               const Vector&, const Vector&, const std::vector<Vec2>&, Real>(
                 &AllocationOptimizer::optimize, py::const_),
             py::arg("method"), py::arg("well_locations"), py::arg("T"), py::arg("S"),
             py::arg("h0"), py::arg("h_min"), py::arg("Q_max"),
             py::arg("constraint_points"), py::arg("t"))
        .def("optimize",
             py::overload_cast<AllocationMethod, const WellField&, const Vector&,
                               const std::vector<ConstraintPoint>&, const AquiferParameters&,
                               Real, Real>(&AllocationOptimizer::optimize, py::const_),
             py::arg("method"), py::arg("field"), py::arg("Q_max"), py::arg("points"),
             py::arg("params"), py::arg("h0"), py::arg("t"));

    py::class_<FeasibleRegion>(m, "FeasibleRegion")
        .def(py::init<Real, Real, Real, Real>(),
             py::arg("x_min"), py::arg("x_max"), py::arg("y_min"), py::arg("y_max"));

    py::class_<SitingResult>(m, "SitingResult")
        .def_readonly("locations", &SitingResult::locations)
        .def_readonly("rates", &SitingResult::rates)
        .def_readonly("violation", &SitingResult::violation)
        .def_readonly("feasible", &SitingResult::feasible)
        .def_readonly("iterations", &SitingResult::iterations)
        .def_readonly("heads", &SitingResult::heads)
        .def_readonly("message", &SitingResult::message);

    m.def("site_wells",
          [](Index n_wells, const FeasibleRegion& region, Real total_demand,
             Real T, Real S, Real h0, Real h_min,
             const std::vector<Vec2>& constraint_points, Real t,
             Index max_iter, std::uint64_t seed) {
              std::mt19937_64 rng(seed);
              return SitingOptimizer().search(n_wells, region, total_demand, T, S, h0, h_min,
                                              constraint_points, t, max_iter, rng);
          },
          py::arg("n_wells"), py::arg("region"), py::arg("total_demand"),
          py::arg("T"), py::arg("S"), py::arg("h0"), py::arg("h_min"),
          py::arg("constraint_points"), py::arg("t"), py::arg("max_iter"),
          py::arg("seed") = 42);

    // ========================================================================
    // Configuration and Planner
    // ========================================================================

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_static("from_file", [](const std::string& path) { return Config::from_file(path); })
        .def_static("from_string", &Config::from_string)
        .def_static("default_scenario", &Config::default_scenario)
        .def("to_file", [](const Config& c, const std::string& path) { c.to_file(path); })
        .def("to_string", &Config::to_string)
        .def("validate", &Config::validate);

    py::class_<Planner>(m, "Planner")
        .def(py::init<Config>())
        .def_static("from_config",
                    py::overload_cast<const std::string&>(&Planner::from_config))
        .def("allocate", py::overload_cast<>(&Planner::allocate, py::const_))
        .def("allocate", py::overload_cast<AllocationMethod>(&Planner::allocate, py::const_))
        .def("site", py::overload_cast<>(&Planner::site, py::const_))
        .def("drawdown_map", &Planner::drawdown_map)
        .def("report", [](const Planner& p) {
            std::ostringstream os;
            p.print_report(os);
            return os.str();
        });
}
