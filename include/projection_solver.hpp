#ifndef PROJECTION_SOLVER_HPP
#define PROJECTION_SOLVER_HPP

#include <Eigen/Dense>

namespace settings_review {

/**
 * @brief Linear constraint a*x + b*y + c*z = d on the inverse multipliers.
 *
 * The general estimator solves one of these per interval; the combined estimator
 * stacks them.
 */
struct PlaneConstraint {
    double a = 0.0;
    double b = 0.0;
    double c = 0.0;
    double d = 0.0;

    Eigen::Vector3d normal() const { return Eigen::Vector3d(a, b, c); }
};

/**
 * @brief Point of the line a*x + b*y = c closest to (1, 1).
 *
 * The estimation problems are under-determined, so the nominal point (no correction)
 * is projected onto the single observed constraint.
 *
 * @return (x, y); (1, 1) when a == b == 0.
 */
Eigen::Vector2d
project_to_line(double a, double b, double c);

/**
 * @brief Point of the plane a*x + b*y + c*z = d closest to (1, 1, 1).
 *
 * @return (x, y, z); (1, 1, 1) when the normal vector is zero.
 */
Eigen::Vector3d
project_to_plane(double a, double b, double c, double d);

inline Eigen::Vector3d
project_to_plane(const PlaneConstraint &constraint) {
    return project_to_plane(constraint.a, constraint.b, constraint.c, constraint.d);
}

} // namespace settings_review

#endif // PROJECTION_SOLVER_HPP
