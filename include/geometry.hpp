#pragma once
// geometry.hpp
// Prism and magnetization table definitions

#include <Eigen/Dense>

namespace prismag {

    // Constants
    constexpr double MU0_OVER_4PI = 1e-7;   // Vacuum permeability / 4pi [T·m/A]
    constexpr double TESLA_TO_NANOTESLA = 1e9;

    // One row per prism: west, east, south, north, bottom, top [m]
    using PrismTable = Eigen::MatrixXd;

    // One row per prism: m_easting, m_northing, m_upward [A/m]
    using MagnetizationTable = Eigen::MatrixXd;

    constexpr int PRISM_COLUMNS = 6;
    constexpr int MAGNETIZATION_COLUMNS = 3;

    // Column indices of a prism row
    enum PrismColumn {
        WEST = 0,
        EAST = 1,
        SOUTH = 2,
        NORTH = 3,
        BOTTOM = 4,
        TOP = 5
    };

    // Single prism boundaries
    struct Prism {
        double west, east;
        double south, north;
        double bottom, top;

        Prism(double w = 0, double e = 0, double s = 0, double n = 0, double b = 0, double t = 0)
            : west(w), east(e), south(s), north(n), bottom(b), top(t) {
        }

        double volume() const {
            return (east - west) * (north - south) * (top - bottom);
        }
    };

    // Append a prism and its magnetization vector as a new row of each table
    inline void append_prism(PrismTable& prisms, MagnetizationTable& magnetization,
        const Prism& p, const Eigen::Vector3d& m)
    {
        const Eigen::Index row = prisms.rows();
        prisms.conservativeResize(row + 1, PRISM_COLUMNS);
        magnetization.conservativeResize(row + 1, MAGNETIZATION_COLUMNS);
        prisms.row(row) << p.west, p.east, p.south, p.north, p.bottom, p.top;
        magnetization.row(row) = m.transpose();
    }

} // namespace prismag
