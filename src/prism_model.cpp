// prism_model.cpp
#include "prism_model.hpp"
#include "errors.hpp"
#include <algorithm>
#include <sstream>
#include <vector>

namespace prismag {

    void run_sanity_checks(const PrismTable& prisms, const MagnetizationTable& magnetization) {
        if (magnetization.rows() != prisms.rows()) {
            std::ostringstream oss;
            oss << "Number of magnetization vectors (" << magnetization.rows()
                << ") mismatch the number of prisms (" << prisms.rows() << ")";
            throw ShapeMismatch(oss.str());
        }
        if (magnetization.cols() != MAGNETIZATION_COLUMNS) {
            std::ostringstream oss;
            oss << "Found magnetization vectors with '" << magnetization.cols()
                << "' elements. Magnetization vectors should have only 3 elements.";
            throw ShapeMismatch(oss.str());
        }
        check_prisms(prisms);
    }

    void check_prisms(const PrismTable& prisms) {
        if (prisms.cols() != PRISM_COLUMNS) {
            std::ostringstream oss;
            oss << "Found prisms with '" << prisms.cols()
                << "' boundaries. Prisms should have exactly 6 boundaries.";
            throw ShapeMismatch(oss.str());
        }

        static const char* dimensions[] = { "easting", "northing", "upward" };

        for (Eigen::Index m = 0; m < prisms.rows(); ++m) {
            for (int axis = 0; axis < 3; ++axis) {
                const double lower = prisms(m, 2 * axis);
                const double upper = prisms(m, 2 * axis + 1);
                if (lower > upper) {
                    throw InvalidGeometry(static_cast<std::size_t>(m), dimensions[axis], lower, upper);
                }
            }
        }
    }

    PrismModel discard_null_prisms(const PrismTable& prisms, const MagnetizationTable& magnetization) {
        // Unchecked tables may be inconsistent: only read rows and columns both tables have
        const Eigen::Index n_rows = (prisms.cols() < PRISM_COLUMNS) ? 0
            : (std::min)(prisms.rows(), magnetization.rows());
        const Eigen::Index n_mag_cols = (std::min)(magnetization.cols(),
            static_cast<Eigen::Index>(MAGNETIZATION_COLUMNS));

        std::vector<Eigen::Index> keep;
        keep.reserve(static_cast<size_t>(n_rows));

        for (Eigen::Index m = 0; m < n_rows; ++m) {
            const bool zero_volume = prisms(m, WEST) == prisms(m, EAST)
                || prisms(m, SOUTH) == prisms(m, NORTH)
                || prisms(m, BOTTOM) == prisms(m, TOP);
            const bool null_magnetization = (magnetization.row(m).array() == 0.0).all();

            if (!zero_volume && !null_magnetization) {
                keep.push_back(m);
            }
        }

        PrismModel model;
        model.prisms.resize(static_cast<Eigen::Index>(keep.size()), PRISM_COLUMNS);
        model.magnetization = MagnetizationTable::Zero(static_cast<Eigen::Index>(keep.size()),
            MAGNETIZATION_COLUMNS);

        for (size_t i = 0; i < keep.size(); ++i) {
            const Eigen::Index row = static_cast<Eigen::Index>(i);
            model.prisms.row(row) = prisms.row(keep[i]).head(PRISM_COLUMNS);
            model.magnetization.row(row).head(n_mag_cols) = magnetization.row(keep[i]).head(n_mag_cols);
        }

        return model;
    }

} // namespace prismag
