#pragma once
// field_kernel.hpp
// Point x prism accumulation loops of the forward model
//
// Work is always split over observation points, never over prisms: each point
// index is written by exactly one thread and the prism tables are read-only,
// so the output vectors need no synchronisation.

#include <cstddef>
#include <vector>
#include "component.hpp"
#include "prism_kernels.hpp"
#include "prism_model.hpp"
#include "progress.hpp"

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace prismag {

    // Flattened observation points, all three vectors have the same length
    struct PointSet {
        std::vector<double> easting;
        std::vector<double> northing;
        std::vector<double> upward;

        std::size_t size() const { return easting.size(); }
    };

    namespace kernel {

        // Call body(l) once for every point index l, across OpenMP threads when concurrent
        template <typename Body>
        void for_each_point(std::size_t n_points, bool concurrent, Body&& body) {
            const long long n = static_cast<long long>(n_points);
#ifdef USE_OPENMP
#pragma omp parallel for schedule(static) if(concurrent)
#else
            (void)concurrent;
#endif
            for (long long l = 0; l < n; ++l) {
                body(static_cast<std::size_t>(l));
            }
        }

        // Add the field of every prism to b_e, b_n, b_u (tesla)
        template <typename T>
        void accumulate_field(
            const PointSet& points,
            const PrismModel& model,
            std::vector<T>& b_e,
            std::vector<T>& b_n,
            std::vector<T>& b_u,
            bool parallel,
            ProgressSink* progress = nullptr
        ) {
            const PrismTable& p = model.prisms;
            const MagnetizationTable& mag = model.magnetization;
            const Eigen::Index n_prisms = model.size();

            for_each_point(points.size(), parallel, [&](std::size_t l) {
                const double e = points.easting[l];
                const double n = points.northing[l];
                const double u = points.upward[l];

                for (Eigen::Index m = 0; m < n_prisms; ++m) {
                    const Eigen::Vector3d b = kernels::magnetic_field(
                        e, n, u,
                        p(m, WEST), p(m, EAST), p(m, SOUTH), p(m, NORTH), p(m, BOTTOM), p(m, TOP),
                        mag(m, 0), mag(m, 1), mag(m, 2));
                    b_e[l] += static_cast<T>(b(0));
                    b_n[l] += static_cast<T>(b(1));
                    b_u[l] += static_cast<T>(b(2));
                }

                if (progress) {
                    progress->update(1);
                }
            });
        }

        // Add one component of the field of every prism to result (tesla)
        template <typename T>
        void accumulate_component(
            const PointSet& points,
            const PrismModel& model,
            std::vector<T>& result,
            ComponentFunction forward,
            bool parallel,
            ProgressSink* progress = nullptr
        ) {
            const PrismTable& p = model.prisms;
            const MagnetizationTable& mag = model.magnetization;
            const Eigen::Index n_prisms = model.size();

            for_each_point(points.size(), parallel, [&](std::size_t l) {
                const double e = points.easting[l];
                const double n = points.northing[l];
                const double u = points.upward[l];

                for (Eigen::Index m = 0; m < n_prisms; ++m) {
                    result[l] += static_cast<T>(forward(
                        e, n, u,
                        p(m, WEST), p(m, EAST), p(m, SOUTH), p(m, NORTH), p(m, BOTTOM), p(m, TOP),
                        mag(m, 0), mag(m, 1), mag(m, 2)));
                }

                if (progress) {
                    progress->update(1);
                }
            });
        }

        // Threads the parallel mode would use
        inline int max_threads() {
#ifdef USE_OPENMP
            return omp_get_max_threads();
#else
            return 1;
#endif
        }

        // Fix the thread count of the parallel mode, <= 0 keeps the default
        inline void set_num_threads(int num_threads) {
#ifdef USE_OPENMP
            if (num_threads > 0) {
                omp_set_num_threads(num_threads);
                omp_set_dynamic(0);
            }
#else
            (void)num_threads;
#endif
        }

    } // namespace kernel
} // namespace prismag
