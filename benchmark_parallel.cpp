// benchmark_parallel.cpp
// Multi-core performance benchmark for the prism magnetic forward model

#include <iostream>
#include <iomanip>
#include <vector>
#include <chrono>
#include <fstream>
#include <algorithm>
#include <string>
#include <sys/stat.h>

#ifdef USE_OPENMP
#include <omp.h>
#endif

#include "config.hpp"
#include "geometry.hpp"
#include "io_utils.hpp"
#include "prism_magnetic.hpp"

using namespace prismag;

struct BenchmarkResult {
    int num_threads;      // 0 for the serial kernel
    std::size_t points;
    std::size_t prisms;
    double total_time_s;
    double throughput;    // Point-prism evaluations per second
    double speedup;
    double efficiency;
};

// Layered block model with alternating magnetization directions
void build_model(PrismTable& prisms, MagnetizationTable& magnetization) {
    using namespace config::benchmark;

    const double size = REGION_SIZE / PRISMS_PER_SIDE;
    prisms.resize(0, PRISM_COLUMNS);
    magnetization.resize(0, MAGNETIZATION_COLUMNS);

    for (int k = 0; k < LAYERS; ++k) {
        for (int i = 0; i < PRISMS_PER_SIDE; ++i) {
            for (int j = 0; j < PRISMS_PER_SIDE; ++j) {
                Prism p(j * size, (j + 1) * size, i * size, (i + 1) * size,
                    -(k + 1) * LAYER_THICKNESS, -k * LAYER_THICKNESS);
                double sign = ((i + j + k) % 2 == 0) ? 1.0 : -1.0;
                append_prism(prisms, magnetization, p, Eigen::Vector3d(0.5, -0.3, sign * 1.2));
            }
        }
    }
}

double time_forward(const Coordinates& coords, const PrismTable& prisms,
    const MagnetizationTable& magnetization, bool parallel) {
    ForwardOptions options;
    options.parallel = parallel;

    double best = 0.0;
    for (int r = 0; r < config::benchmark::REPEATS; ++r) {
        auto start_time = std::chrono::high_resolution_clock::now();
        MagneticField<double> field = prism_magnetic(coords, prisms, magnetization, options);
        auto end_time = std::chrono::high_resolution_clock::now();

        double elapsed = std::chrono::duration<double>(end_time - start_time).count();
        if (r == 0 || elapsed < best) best = elapsed;
        (void)field;
    }
    return best;
}

void save_benchmark_results(const std::vector<BenchmarkResult>& results, const std::string& filename) {
    std::ofstream ofs(filename);
    if (!ofs.is_open()) {
        std::cerr << "[ERROR] Failed to save: " << filename << std::endl;
        return;
    }

    ofs << "num_threads,points,prisms,total_time_s,throughput,speedup,efficiency\n";

    for (const auto& r : results) {
        ofs << r.num_threads << ","
            << r.points << ","
            << r.prisms << ","
            << std::fixed << std::setprecision(4) << r.total_time_s << ","
            << std::setprecision(1) << r.throughput << ","
            << std::setprecision(3) << r.speedup << ","
            << std::setprecision(3) << r.efficiency << "\n";
    }

    std::cout << "[OK] Benchmark results saved to: " << filename << std::endl;
}

int main() {
    std::cout << "\n";
    std::cout << "============================================\n";
    std::cout << "  Multi-Core Performance Benchmark\n";
    std::cout << "  Prism Magnetic Forward Model\n";
    std::cout << "============================================\n\n";

#ifdef USE_OPENMP
    int max_threads = omp_get_max_threads();
    std::cout << "OpenMP: Enabled\n";
    std::cout << "Max available threads: " << max_threads << "\n\n";
#else
    int max_threads = 1;
    std::cout << "OpenMP: NOT AVAILABLE\n";
    std::cout << "Serial kernel only\n\n";
#endif

    PrismTable prisms;
    MagnetizationTable magnetization;
    build_model(prisms, magnetization);

    using namespace config::benchmark;
    Coordinates coords = grid_coordinates(0.0, REGION_SIZE, 0.0, REGION_SIZE,
        GRID_NORTHING, GRID_EASTING, OBSERVATION_HEIGHT);

    const std::size_t n_points = static_cast<std::size_t>(GRID_NORTHING) * GRID_EASTING;
    const std::size_t n_prisms = static_cast<std::size_t>(prisms.rows());
    std::cout << "Model: " << n_prisms << " prisms, " << n_points << " observation points\n\n";

    std::vector<BenchmarkResult> results;

    std::cout << "Serial kernel... " << std::flush;
    BenchmarkResult serial;
    serial.num_threads = 0;
    serial.points = n_points;
    serial.prisms = n_prisms;
    serial.total_time_s = time_forward(coords, prisms, magnetization, false);
    serial.throughput = n_points * n_prisms / serial.total_time_s;
    serial.speedup = 1.0;
    serial.efficiency = 1.0;
    results.push_back(serial);
    std::cout << "Done! Time: " << std::fixed << std::setprecision(3) << serial.total_time_s << " s\n";

    int max_test_threads = (std::min)(16, max_threads);
    for (int num_threads = 1; num_threads <= max_test_threads; ++num_threads) {
#ifdef USE_OPENMP
        omp_set_num_threads(num_threads);
        omp_set_dynamic(0);
#endif
        std::cout << "Testing with " << num_threads << " thread(s)... " << std::flush;

        BenchmarkResult result;
        result.num_threads = num_threads;
        result.points = n_points;
        result.prisms = n_prisms;
        result.total_time_s = time_forward(coords, prisms, magnetization, true);
        result.throughput = n_points * n_prisms / result.total_time_s;
        result.speedup = serial.total_time_s / result.total_time_s;
        result.efficiency = result.speedup / num_threads;
        results.push_back(result);

        std::cout << "Done! "
            << "Time: " << std::fixed << std::setprecision(3) << result.total_time_s << " s, "
            << "Speedup: " << std::setprecision(2) << result.speedup << "x\n";
    }

    std::cout << "\n============================================\n";
    std::cout << "  Benchmark Results Summary\n";
    std::cout << "============================================\n\n";

    std::cout << std::left << std::setw(10) << "Threads"
        << std::setw(12) << "Time (s)"
        << std::setw(20) << "Evaluations/s"
        << std::setw(12) << "Speedup"
        << std::setw(12) << "Efficiency" << "\n";
    std::cout << std::string(66, '-') << "\n";

    for (const auto& r : results) {
        std::cout << std::left << std::setw(10) << (r.num_threads == 0 ? std::string("serial") : std::to_string(r.num_threads))
            << std::setw(12) << std::fixed << std::setprecision(3) << r.total_time_s
            << std::setw(20) << std::scientific << std::setprecision(3) << r.throughput
            << std::setw(12) << std::fixed << std::setprecision(2) << r.speedup
            << std::setw(12) << std::setprecision(1) << (r.efficiency * 100) << "%\n";
    }

    std::cout << std::string(66, '-') << "\n\n";

    auto optimal = std::max_element(results.begin(), results.end(),
        [](const BenchmarkResult& a, const BenchmarkResult& b) {
            return a.throughput < b.throughput;
        });

    std::cout << "Optimal configuration:\n";
    std::cout << "  Threads: " << optimal->num_threads << "\n";
    std::cout << "  Speedup: " << std::fixed << std::setprecision(2) << optimal->speedup << "x over serial\n\n";

    mkdir(config::OUTPUT_DIR.c_str(), 0755);
    save_benchmark_results(results, config::BENCHMARK_OUTPUT);

    return 0;
}
