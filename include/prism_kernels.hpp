#pragma once
// prism_kernels.hpp
// Closed-form magnetic field of a uniformly magnetized rectangular prism
//
// All functions take the observation point (easting, northing, upward), the
// prism boundaries (west, east, south, north, bottom, top) in meters and the
// magnetization vector (m_e, m_n, m_u) in A/m, and return tesla.
//
// Boundary contract:
//   - a point on a prism edge or vertex returns NaN for every component
//   - a point on a face plane uses atan(y / 0) = sign(y) * pi / 2
//   - ln(x + r) is evaluated as ln((y^2 + z^2) / (r - x)) for x < 0, and as
//     -ln(-2x) on the line that extends an edge beyond the prism
// Callers pass these values through unchanged.

#include <Eigen/Dense>

namespace prismag {
    namespace kernels {

        // Field (b_e, b_n, b_u) of one prism at one point
        Eigen::Vector3d magnetic_field(
            double easting, double northing, double upward,
            double west, double east, double south, double north, double bottom, double top,
            double magnetization_e, double magnetization_n, double magnetization_u
        );

        // Single components, cheaper than magnetic_field when only one is needed
        double magnetic_e(
            double easting, double northing, double upward,
            double west, double east, double south, double north, double bottom, double top,
            double magnetization_e, double magnetization_n, double magnetization_u
        );

        double magnetic_n(
            double easting, double northing, double upward,
            double west, double east, double south, double north, double bottom, double top,
            double magnetization_e, double magnetization_n, double magnetization_u
        );

        double magnetic_u(
            double easting, double northing, double upward,
            double west, double east, double south, double north, double bottom, double top,
            double magnetization_e, double magnetization_n, double magnetization_u
        );

        // True if the point lies on one of the twelve edges (vertices included)
        bool is_point_on_edge(
            double easting, double northing, double upward,
            double west, double east, double south, double north, double bottom, double top
        );

    } // namespace kernels
} // namespace prismag
