// prism_kernels.cpp
// Vertex sums of the second derivatives of the prism's 1/r volume integral
#include "prism_kernels.hpp"
#include "geometry.hpp"
#include <cmath>
#include <limits>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace prismag {
    namespace kernels {

        namespace {

            // atan(y / x) with the x -> 0+ limit on face planes
            inline double safe_atan2(double y, double x) {
                if (x != 0.0) {
                    return std::atan(y / x);
                }
                if (y > 0.0) return M_PI / 2.0;
                if (y < 0.0) return -M_PI / 2.0;
                return 0.0;
            }

            // ln(x + r) without cancellation for x < 0
            inline double safe_log(double x, double y, double z, double r) {
                if (r == 0.0) {
                    return 0.0;
                }
                if (x < 0.0) {
                    // Singular part cancels between the two vertices of the edge line
                    if (y == 0.0 && z == 0.0) {
                        return -std::log(-2.0 * x);
                    }
                    return std::log((y * y + z * z) / (r - x));
                }
                return std::log(x + r);
            }

            // Diagonal kernels
            inline double kernel_ee(double e, double n, double u, double r) {
                return -safe_atan2(n * u, e * r);
            }

            inline double kernel_nn(double e, double n, double u, double r) {
                return -safe_atan2(e * u, n * r);
            }

            inline double kernel_uu(double e, double n, double u, double r) {
                return -safe_atan2(e * n, u * r);
            }

            // Off-diagonal kernels
            inline double kernel_en(double e, double n, double u, double r) {
                return safe_log(u, e, n, r);
            }

            inline double kernel_eu(double e, double n, double u, double r) {
                return safe_log(n, e, u, r);
            }

            inline double kernel_nu(double e, double n, double u, double r) {
                return safe_log(e, n, u, r);
            }

            // Shifted vertex coordinates, vertex (i, j, k) = 0 picks the upper bound
            struct Vertex {
                double e, n, u, r;
                double sign;
            };

            inline Vertex make_vertex(int i, int j, int k,
                double easting, double northing, double upward,
                double west, double east, double south, double north, double bottom, double top)
            {
                Vertex v;
                v.e = (i == 0 ? east : west) - easting;
                v.n = (j == 0 ? north : south) - northing;
                v.u = (k == 0 ? top : bottom) - upward;
                v.r = std::sqrt(v.e * v.e + v.n * v.n + v.u * v.u);
                v.sign = ((i + j + k) % 2 == 0) ? 1.0 : -1.0;
                return v;
            }

            inline bool in_range(double x, double lower, double upper) {
                return lower <= x && x <= upper;
            }

        }

        bool is_point_on_edge(
            double easting, double northing, double upward,
            double west, double east, double south, double north, double bottom, double top
        ) {
            const bool on_e = (easting == west || easting == east);
            const bool on_n = (northing == south || northing == north);
            const bool on_u = (upward == bottom || upward == top);

            if (on_e && on_n && in_range(upward, bottom, top)) return true;
            if (on_e && on_u && in_range(northing, south, north)) return true;
            if (on_n && on_u && in_range(easting, west, east)) return true;
            return false;
        }

        Eigen::Vector3d magnetic_field(
            double easting, double northing, double upward,
            double west, double east, double south, double north, double bottom, double top,
            double magnetization_e, double magnetization_n, double magnetization_u
        ) {
            if (is_point_on_edge(easting, northing, upward, west, east, south, north, bottom, top)) {
                const double nan = std::numeric_limits<double>::quiet_NaN();
                return Eigen::Vector3d(nan, nan, nan);
            }

            // Accumulate the symmetric kernel tensor, then contract with M
            Eigen::Matrix3d T = Eigen::Matrix3d::Zero();

            for (int i = 0; i < 2; ++i) {
                for (int j = 0; j < 2; ++j) {
                    for (int k = 0; k < 2; ++k) {
                        const Vertex v = make_vertex(i, j, k, easting, northing, upward,
                            west, east, south, north, bottom, top);

                        T(0, 0) += v.sign * kernel_ee(v.e, v.n, v.u, v.r);
                        T(1, 1) += v.sign * kernel_nn(v.e, v.n, v.u, v.r);
                        T(2, 2) += v.sign * kernel_uu(v.e, v.n, v.u, v.r);
                        T(0, 1) += v.sign * kernel_en(v.e, v.n, v.u, v.r);
                        T(0, 2) += v.sign * kernel_eu(v.e, v.n, v.u, v.r);
                        T(1, 2) += v.sign * kernel_nu(v.e, v.n, v.u, v.r);
                    }
                }
            }
            T(1, 0) = T(0, 1);
            T(2, 0) = T(0, 2);
            T(2, 1) = T(1, 2);

            const Eigen::Vector3d M(magnetization_e, magnetization_n, magnetization_u);
            return MU0_OVER_4PI * (T * M);
        }

        double magnetic_e(
            double easting, double northing, double upward,
            double west, double east, double south, double north, double bottom, double top,
            double magnetization_e, double magnetization_n, double magnetization_u
        ) {
            if (is_point_on_edge(easting, northing, upward, west, east, south, north, bottom, top)) {
                return std::numeric_limits<double>::quiet_NaN();
            }

            double b = 0.0;
            for (int i = 0; i < 2; ++i) {
                for (int j = 0; j < 2; ++j) {
                    for (int k = 0; k < 2; ++k) {
                        const Vertex v = make_vertex(i, j, k, easting, northing, upward,
                            west, east, south, north, bottom, top);
                        b += v.sign * (
                            magnetization_e * kernel_ee(v.e, v.n, v.u, v.r)
                            + magnetization_n * kernel_en(v.e, v.n, v.u, v.r)
                            + magnetization_u * kernel_eu(v.e, v.n, v.u, v.r));
                    }
                }
            }
            return MU0_OVER_4PI * b;
        }

        double magnetic_n(
            double easting, double northing, double upward,
            double west, double east, double south, double north, double bottom, double top,
            double magnetization_e, double magnetization_n, double magnetization_u
        ) {
            if (is_point_on_edge(easting, northing, upward, west, east, south, north, bottom, top)) {
                return std::numeric_limits<double>::quiet_NaN();
            }

            double b = 0.0;
            for (int i = 0; i < 2; ++i) {
                for (int j = 0; j < 2; ++j) {
                    for (int k = 0; k < 2; ++k) {
                        const Vertex v = make_vertex(i, j, k, easting, northing, upward,
                            west, east, south, north, bottom, top);
                        b += v.sign * (
                            magnetization_e * kernel_en(v.e, v.n, v.u, v.r)
                            + magnetization_n * kernel_nn(v.e, v.n, v.u, v.r)
                            + magnetization_u * kernel_nu(v.e, v.n, v.u, v.r));
                    }
                }
            }
            return MU0_OVER_4PI * b;
        }

        double magnetic_u(
            double easting, double northing, double upward,
            double west, double east, double south, double north, double bottom, double top,
            double magnetization_e, double magnetization_n, double magnetization_u
        ) {
            if (is_point_on_edge(easting, northing, upward, west, east, south, north, bottom, top)) {
                return std::numeric_limits<double>::quiet_NaN();
            }

            double b = 0.0;
            for (int i = 0; i < 2; ++i) {
                for (int j = 0; j < 2; ++j) {
                    for (int k = 0; k < 2; ++k) {
                        const Vertex v = make_vertex(i, j, k, easting, northing, upward,
                            west, east, south, north, bottom, top);
                        b += v.sign * (
                            magnetization_e * kernel_eu(v.e, v.n, v.u, v.r)
                            + magnetization_n * kernel_nu(v.e, v.n, v.u, v.r)
                            + magnetization_u * kernel_uu(v.e, v.n, v.u, v.r));
                    }
                }
            }
            return MU0_OVER_4PI * b;
        }

    } // namespace kernels
} // namespace prismag
