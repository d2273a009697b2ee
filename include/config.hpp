// config.hpp
// Compile-time defaults for the forward modelling tools
#pragma once
#include <string>

namespace prismag {
    namespace config {
        const std::string OUTPUT_DIR = "results";
        const std::string OUTPUT_FIELD = "results/magnetic_field.csv";
        const std::string BENCHMARK_OUTPUT = "results/benchmark_parallel.csv";

        namespace output {
            const int PRECISION = 12;
            const int PROGRESS_INTERVAL = 1000;   // Observation points between progress lines
        }

        namespace parallel {
            const int NUM_THREADS = 0;            // 0: OpenMP default
            const bool ENABLE_POINT_PARALLEL = true;
        }

        // Synthetic model used by the benchmark
        namespace benchmark {
            const int GRID_EASTING = 60;
            const int GRID_NORTHING = 60;
            const int PRISMS_PER_SIDE = 12;
            const int LAYERS = 4;
            const double OBSERVATION_HEIGHT = 100.0;   // [m]
            const double REGION_SIZE = 6000.0;         // [m]
            const double LAYER_THICKNESS = 250.0;      // [m]
            const int REPEATS = 3;
        }
    }

}
