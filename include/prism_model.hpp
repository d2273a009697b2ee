#pragma once
// prism_model.hpp
// Sanity checks and null prism removal for a prism model

#include "geometry.hpp"

namespace prismag {

    // Row-aligned prisms and magnetization vectors
    struct PrismModel {
        PrismTable prisms;
        MagnetizationTable magnetization;

        Eigen::Index size() const { return prisms.rows(); }
    };

    // Check magnetization shape against the prisms, then the prism boundaries.
    // Throws ShapeMismatch or InvalidGeometry on the first violation found.
    void run_sanity_checks(const PrismTable& prisms, const MagnetizationTable& magnetization);

    // Check west <= east, south <= north and bottom <= top for every prism.
    // Equal boundaries describe a zero-volume prism and are accepted.
    void check_prisms(const PrismTable& prisms);

    // Remove prisms with zero volume or an all-zero magnetization vector,
    // keeping the relative order of the remaining rows
    PrismModel discard_null_prisms(const PrismTable& prisms, const MagnetizationTable& magnetization);

} // namespace prismag
