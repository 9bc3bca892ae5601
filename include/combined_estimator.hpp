#ifndef COMBINED_ESTIMATOR_HPP
#define COMBINED_ESTIMATOR_HPP

#include "estimation_config.hpp"
#include "estimation_interval.hpp"
#include "interval_assembler.hpp"
#include "projection_solver.hpp"

#include <optional>
#include <vector>

namespace settings_review {

/**
 * @brief Fits one multiplier set for a whole session with Ceres.
 *
 * Each interval estimated by the general estimator contributes its plane constraint
 * a*x + b*y + c*z = d as a residual; a prior residual weighted by prior_weight pulls
 * (x, y, z) toward the nominal (1, 1, 1). x and y are the inverse ISF and CR multipliers,
 * z the basal multiplier, as in the per-interval estimate.
 */
class CombinedMultiplierEstimator {
  public:
    explicit CombinedMultiplierEstimator(CombinedEstimateOptions options = CombinedEstimateOptions(),
                                         bool verbose = false);

    /**
     * @brief Solves for the inverse-multiplier vector (x, y, z).
     * @return std::nullopt if there are no constraints, the prior weight is not positive,
     *         or Ceres does not return a usable solution.
     */
    std::optional<Eigen::Vector3d> solve(const std::vector<PlaneConstraint> &constraints) const;

    /**
     * @brief Combines the constraints recorded on the session's intervals.
     *
     * The result spans the session's final window.
     */
    std::optional<EstimatedMultipliers> estimate(const EstimationSession &session) const;

  private:
    struct ConstraintResidual {
        explicit ConstraintResidual(const PlaneConstraint &constraint)
          : constraint_(constraint) {}

        template<typename T>
        bool operator()(const T *const p, T *residual) const {
            residual[0] = T(constraint_.a) * p[0] + T(constraint_.b) * p[1] + T(constraint_.c) * p[2] -
                          T(constraint_.d);
            return true;
        }

        PlaneConstraint constraint_;
    };

    struct NominalPriorResidual {
        explicit NominalPriorResidual(double sqrt_weight)
          : sqrt_weight_(sqrt_weight) {}

        template<typename T>
        bool operator()(const T *const p, T *residual) const {
            for (int i = 0; i < 3; ++i) { residual[i] = T(sqrt_weight_) * (p[i] - T(1.0)); }
            return true;
        }

        double sqrt_weight_;
    };

    CombinedEstimateOptions options_;
    bool verbose_;
};

} // namespace settings_review

#endif // COMBINED_ESTIMATOR_HPP
