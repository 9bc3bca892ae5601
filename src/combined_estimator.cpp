#include "combined_estimator.hpp"
#include <ceres/ceres.h>
#include <cmath>
#include <iostream>

namespace settings_review {

CombinedMultiplierEstimator::CombinedMultiplierEstimator(CombinedEstimateOptions options, bool verbose)
  : options_(options)
  , verbose_(verbose) {}

std::optional<Eigen::Vector3d>
CombinedMultiplierEstimator::solve(const std::vector<PlaneConstraint> &constraints) const {
    if (constraints.empty()) {
        if (verbose_) { std::cout << "  [CombinedMultiplierEstimator] No constraints to combine." << std::endl; }
        return std::nullopt;
    }
    // Without the prior the stacked system is usually rank deficient.
    if (options_.prior_weight <= 0.0) {
        std::cerr << "  [CombinedMultiplierEstimator] Warning: prior weight must be positive, skipping." << std::endl;
        return std::nullopt;
    }

    double p[3] = { 1.0, 1.0, 1.0 };

    ceres::Problem problem;
    for (const auto &constraint : constraints) {
        problem.AddResidualBlock(new ceres::AutoDiffCostFunction<ConstraintResidual, 1, 3>(
                                   new ConstraintResidual(constraint)), // Takes ownership
                                 nullptr,
                                 p);
    }
    problem.AddResidualBlock(new ceres::AutoDiffCostFunction<NominalPriorResidual, 3, 3>(
                               new NominalPriorResidual(std::sqrt(options_.prior_weight))),
                             nullptr,
                             p);

    ceres::Solver::Options solver_options;
    solver_options.linear_solver_type = ceres::DENSE_QR;
    solver_options.minimizer_progress_to_stdout = verbose_;
    solver_options.max_num_iterations = options_.max_iterations;
    solver_options.function_tolerance = 1e-12;
    solver_options.gradient_tolerance = 1e-14;
    solver_options.parameter_tolerance = 1e-12;

    ceres::Solver::Summary summary;
    ceres::Solve(solver_options, &problem, &summary);

    if (verbose_) { std::cout << "  [CombinedMultiplierEstimator] Ceres Summary: " << summary.BriefReport() << std::endl; }

    if (!summary.IsSolutionUsable()) {
        std::cerr << "  [CombinedMultiplierEstimator] Warning: Ceres did not find a usable solution." << std::endl;
        return std::nullopt;
    }
    return Eigen::Vector3d(p[0], p[1], p[2]);
}

std::optional<EstimatedMultipliers>
CombinedMultiplierEstimator::estimate(const EstimationSession &session) const {
    std::vector<PlaneConstraint> constraints;
    for (const auto &interval : session.intervals()) {
        if (interval.constraint) { constraints.push_back(*interval.constraint); }
    }

    auto solution = solve(constraints);
    if (!solution) { return std::nullopt; }

    EstimatedMultipliers multipliers;
    multipliers.start_date = session.start_date();
    multipliers.end_date = session.end_date();
    multipliers.insulin_sensitivity_multiplier = 1.0 / (*solution)(0);
    multipliers.carb_sensitivity_multiplier = multipliers.insulin_sensitivity_multiplier;
    multipliers.carb_ratio_multiplier = 1.0 / (*solution)(1);
    multipliers.basal_multiplier = (*solution)(2);
    return multipliers;
}

} // namespace settings_review
