#include "projection_solver.hpp"

namespace settings_review {

namespace {

// Orthogonal projection of the all-ones point onto normal . p = rhs.
template<int N>
Eigen::Matrix<double, N, 1>
project_nominal_onto_hyperplane(const Eigen::Matrix<double, N, 1> &normal, double rhs) {
    using Vector = Eigen::Matrix<double, N, 1>;
    const Vector nominal = Vector::Ones();

    double dot_product = normal.squaredNorm();
    if (dot_product == 0.0) { return nominal; }

    double residual = normal.dot(nominal) - rhs;
    return nominal - normal * (residual / dot_product);
}

} // namespace

Eigen::Vector2d
project_to_line(double a, double b, double c) {
    return project_nominal_onto_hyperplane<2>(Eigen::Vector2d(a, b), c);
}

Eigen::Vector3d
project_to_plane(double a, double b, double c, double d) {
    return project_nominal_onto_hyperplane<3>(Eigen::Vector3d(a, b, c), d);
}

} // namespace settings_review
