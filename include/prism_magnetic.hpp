#pragma once
// prism_magnetic.hpp
// Magnetic field of right-rectangular prisms in Cartesian coordinates

#include <string>
#include "field_kernel.hpp"
#include "geometry.hpp"
#include "grid_array.hpp"
#include "progress.hpp"

namespace prismag {

    // Easting, northing and upward of the observation points [m].
    // The three arrays must be broadcastable against each other.
    struct Coordinates {
        GridArray<double> easting;
        GridArray<double> northing;
        GridArray<double> upward;
    };

    // Field components [nT], shaped like the broadcast coordinates
    template <typename T>
    struct MagneticField {
        GridArray<T> b_e;
        GridArray<T> b_n;
        GridArray<T> b_u;
    };

    struct ForwardOptions {
        bool parallel = true;             // Split observation points across OpenMP threads
        bool disable_checks = false;      // Skip sanity checks on trusted input
        ProgressSink* progress = nullptr; // Receives one update per observation point
    };

    // Broadcast and flatten the coordinates, returning the broadcast shape
    PointSet flatten_coordinates(const Coordinates& coordinates, Shape& shape);

    // Magnetic field (b_e, b_n, b_u) generated by the prisms, in nT.
    // T selects the storage and accumulation precision (float or double).
    // Throws ShapeMismatch or InvalidGeometry before any computation.
    template <typename T = double>
    MagneticField<T> prism_magnetic(
        const Coordinates& coordinates,
        const PrismTable& prisms,
        const MagnetizationTable& magnetization,
        const ForwardOptions& options = ForwardOptions()
    );

    // Single component ("easting", "northing" or "upward") of the field, in nT.
    // Prefer prism_magnetic when more than one component is needed.
    // Throws InvalidComponent, ShapeMismatch or InvalidGeometry.
    template <typename T = double>
    GridArray<T> prism_magnetic_component(
        const Coordinates& coordinates,
        const PrismTable& prisms,
        const MagnetizationTable& magnetization,
        const std::string& component,
        const ForwardOptions& options = ForwardOptions()
    );

    extern template MagneticField<float> prism_magnetic<float>(
        const Coordinates&, const PrismTable&, const MagnetizationTable&, const ForwardOptions&);
    extern template MagneticField<double> prism_magnetic<double>(
        const Coordinates&, const PrismTable&, const MagnetizationTable&, const ForwardOptions&);
    extern template GridArray<float> prism_magnetic_component<float>(
        const Coordinates&, const PrismTable&, const MagnetizationTable&,
        const std::string&, const ForwardOptions&);
    extern template GridArray<double> prism_magnetic_component<double>(
        const Coordinates&, const PrismTable&, const MagnetizationTable&,
        const std::string&, const ForwardOptions&);

} // namespace prismag
