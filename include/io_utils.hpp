// io_utils.hpp
// Input/Output utilities for forward modelling runs
#pragma once

#include <string>
#include <vector>
#include "geometry.hpp"
#include "grid_array.hpp"
#include "prism_magnetic.hpp"

namespace prismag {

    // Settings of one forward modelling run, read from a JSON file
    struct RunConfig {
        PrismTable prisms;
        MagnetizationTable magnetization;
        Coordinates coordinates;
        std::string component = "all";      // "all" or a single component name
        std::string dtype = "float64";      // "float64" or "float32"
        bool parallel = true;
        bool disable_checks = false;
        bool progressbar = false;
        int threads = 0;
        std::string output_path;
    };

    // Regular grid of observation points, shape (n_northing, n_easting)
    Coordinates grid_coordinates(
        double west, double east, double south, double north,
        std::size_t n_northing, std::size_t n_easting,
        double upward
    );

    // Load run configuration from JSON
    bool load_run_config(const std::string& json_path, RunConfig& run);

    // Load observation points from CSV (columns: easting, northing, upward)
    bool load_observation_points(const std::string& csv_path, Coordinates& coordinates);

    // Save the three field components to CSV
    template <typename T>
    bool save_field(
        const std::string& output_path,
        const Coordinates& coordinates,
        const MagneticField<T>& field
    );

    // Save a single field component to CSV
    template <typename T>
    bool save_component(
        const std::string& output_path,
        const Coordinates& coordinates,
        const std::string& component,
        const GridArray<T>& values
    );

} // namespace prismag
