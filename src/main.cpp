// main.cpp
// Forward model the magnetic field of a prism model described in a JSON file
#include <iostream>
#include <chrono>
#include <iomanip>
#include <memory>
#include <string>
#include <algorithm>
#include <sys/stat.h>

#include "component.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "io_utils.hpp"
#include "prism_magnetic.hpp"
#include "prism_model.hpp"

using namespace prismag;

namespace {

    template <typename T>
    void print_range(const std::string& name, const GridArray<T>& values) {
        if (values.size() == 0) return;
        auto minmax = std::minmax_element(values.values.begin(), values.values.end());
        std::cout << "  " << std::left << std::setw(10) << name
            << "min: " << std::setw(16) << *minmax.first
            << "max: " << *minmax.second << " nT" << std::endl;
    }

    template <typename T>
    bool run_forward(const RunConfig& run, ProgressSink* progress) {
        ForwardOptions options;
        options.parallel = run.parallel;
        options.disable_checks = run.disable_checks;
        options.progress = progress;

        std::cout << std::setprecision(6);

        if (run.component == "all") {
            MagneticField<T> field = prism_magnetic<T>(
                run.coordinates, run.prisms, run.magnetization, options);

            std::cout << "\nField range:" << std::endl;
            print_range("b_e", field.b_e);
            print_range("b_n", field.b_n);
            print_range("b_u", field.b_u);
            return save_field(run.output_path, run.coordinates, field);
        }

        GridArray<T> values = prism_magnetic_component<T>(
            run.coordinates, run.prisms, run.magnetization, run.component, options);

        std::cout << "\nField range:" << std::endl;
        print_range("b_" + run.component, values);
        return save_component(run.output_path, run.coordinates, run.component, values);
    }

}

int main(int argc, char** argv) {
    std::cout << "============================================" << std::endl;
    std::cout << "  Prism Magnetic Forward Model" << std::endl;
    std::cout << "============================================\n" << std::endl;

    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <run.json>" << std::endl;
        return -1;
    }

    RunConfig run;
    if (!load_run_config(argv[1], run)) {
        std::cerr << "[ERROR] Failed to load configuration!" << std::endl;
        return -1;
    }

#ifdef USE_OPENMP
    if (run.threads > 0) {
        kernel::set_num_threads(run.threads);
        std::cout << "[Override] Using user-specified threads: " << run.threads << std::endl;
    }
    std::cout << "OpenMP: " << (run.parallel ? "Enabled" : "Disabled for this run")
        << " (max threads: " << kernel::max_threads() << ")" << std::endl;
#else
    std::cout << "OpenMP: NOT AVAILABLE, running serial kernel" << std::endl;
#endif

    Shape shape;
    std::size_t n_points = 0;
    try {
        n_points = flatten_coordinates(run.coordinates, shape).size();
    }
    catch (const ShapeMismatch& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return -1;
    }
    std::cout << "[INFO] Observation points: " << n_points
        << " (shape " << shape_to_string(shape) << ")" << std::endl;
    std::cout << "[INFO] Prisms: " << run.prisms.rows();
    if (run.magnetization.rows() == run.prisms.rows()
        && run.magnetization.cols() == MAGNETIZATION_COLUMNS
        && run.prisms.cols() == PRISM_COLUMNS) {
        const PrismModel active = discard_null_prisms(run.prisms, run.magnetization);
        std::cout << " (" << active.size() << " after discarding null prisms)";
    }
    std::cout << std::endl;
    std::cout << "[INFO] Component: " << run.component << ", dtype: " << run.dtype << std::endl;

    mkdir(config::OUTPUT_DIR.c_str(), 0755);

    std::unique_ptr<ConsoleProgressBar> progress;
    if (run.progressbar) {
        progress = std::make_unique<ConsoleProgressBar>(n_points);
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    bool saved = false;
    try {
        if (run.dtype == "float32") {
            saved = run_forward<float>(run, progress.get());
        }
        else {
            saved = run_forward<double>(run, progress.get());
        }
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return -1;
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    double elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    std::cout << "\nTotal time: " << std::fixed << std::setprecision(2) << elapsed_ms << " ms" << std::endl;

    if (!saved) {
        std::cerr << "[ERROR] Failed to save results!" << std::endl;
        return -1;
    }

    return 0;
}
