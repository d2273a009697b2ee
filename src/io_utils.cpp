// io_utils.cpp
// Implementation of run configuration loading and result writing
#include "io_utils.hpp"
#include "csv_parser.hpp"
#include "config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <vector>

using json = nlohmann::json;

namespace prismag {

    namespace {

        // One row per entry of a list of lists, or a single row for a flat list
        bool parse_table(const json& j, int columns, const std::string& name, Eigen::MatrixXd& table) {
            if (!j.is_array()) {
                std::cerr << "Error: '" << name << "' must be a list" << std::endl;
                return false;
            }

            const bool single_row = !j.empty() && j[0].is_number();
            const json rows = single_row ? json::array({ j }) : j;

            // Keep the actual column count so the sanity checks can report it
            int n_cols = columns;
            if (!rows.empty() && rows[0].is_array()) {
                n_cols = static_cast<int>(rows[0].size());
            }

            table.resize(static_cast<Eigen::Index>(rows.size()), n_cols);
            for (size_t i = 0; i < rows.size(); ++i) {
                if (!rows[i].is_array() || static_cast<int>(rows[i].size()) != n_cols) {
                    std::cerr << "Error: row " << i << " of '" << name
                        << "' must be a list of " << n_cols << " numbers" << std::endl;
                    return false;
                }
                for (int k = 0; k < n_cols; ++k) {
                    table(static_cast<Eigen::Index>(i), k) = rows[i][k].get<double>();
                }
            }
            return true;
        }

        // Grid dimensions must be positive integers whose product fits in memory
        bool parse_grid_shape(const json& shape, std::size_t& n_northing, std::size_t& n_easting) {
            std::size_t dims[2] = { 0, 0 };
            for (int k = 0; k < 2; ++k) {
                if (!shape[k].is_number_integer() || shape[k].get<long long>() <= 0) {
                    std::cerr << "Error: grid 'shape' entries must be positive integers, got "
                        << shape[k].dump() << std::endl;
                    return false;
                }
                dims[k] = static_cast<std::size_t>(shape[k].get<long long>());
            }
            if (dims[0] > std::vector<double>().max_size() / dims[1]) {
                std::cerr << "Error: grid 'shape' [" << dims[0] << ", " << dims[1]
                    << "] has too many points" << std::endl;
                return false;
            }
            n_northing = dims[0];
            n_easting = dims[1];
            return true;
        }

        bool parse_observations(const json& obs, const std::string& base_dir, Coordinates& coordinates) {
            if (obs.contains("file")) {
                std::string path = obs["file"].get<std::string>();
                if (!path.empty() && path[0] != '/') {
                    path = base_dir + path;
                }
                return load_observation_points(path, coordinates);
            }

            if (obs.contains("grid")) {
                const json& g = obs["grid"];
                const json& region = g.at("region");
                const json& shape = g.at("shape");
                if (region.size() != 4 || shape.size() != 2) {
                    std::cerr << "Error: grid needs 'region' [w, e, s, n] and 'shape' [n_northing, n_easting]"
                        << std::endl;
                    return false;
                }
                std::size_t n_northing = 0;
                std::size_t n_easting = 0;
                if (!parse_grid_shape(shape, n_northing, n_easting)) {
                    return false;
                }
                coordinates = grid_coordinates(
                    region[0].get<double>(), region[1].get<double>(),
                    region[2].get<double>(), region[3].get<double>(),
                    n_northing, n_easting,
                    g.value("upward", 0.0));
                return true;
            }

            std::cerr << "Error: 'observations' needs either 'file' or 'grid'" << std::endl;
            return false;
        }

        std::string directory_of(const std::string& path) {
            const size_t slash = path.find_last_of('/');
            return (slash == std::string::npos) ? "" : path.substr(0, slash + 1);
        }

    }

    Coordinates grid_coordinates(
        double west, double east, double south, double north,
        std::size_t n_northing, std::size_t n_easting,
        double upward
    ) {
        const Shape shape = { n_northing, n_easting };
        std::vector<double> e(n_northing * n_easting);
        std::vector<double> n(n_northing * n_easting);

        const double de = n_easting > 1 ? (east - west) / (n_easting - 1) : 0.0;
        const double dn = n_northing > 1 ? (north - south) / (n_northing - 1) : 0.0;

        for (std::size_t i = 0; i < n_northing; ++i) {
            for (std::size_t j = 0; j < n_easting; ++j) {
                e[i * n_easting + j] = west + j * de;
                n[i * n_easting + j] = south + i * dn;
            }
        }

        Coordinates coordinates;
        coordinates.easting = GridArray<double>(shape, e);
        coordinates.northing = GridArray<double>(shape, n);
        coordinates.upward = GridArray<double>(upward);
        return coordinates;
    }

    bool load_run_config(const std::string& json_path, RunConfig& run) {
        std::ifstream file(json_path);
        if (!file.is_open()) {
            std::cerr << "Error: Cannot open configuration file: " << json_path << std::endl;
            return false;
        }

        try {
            json j;
            file >> j;

            if (!parse_table(j.at("prisms"), PRISM_COLUMNS, "prisms", run.prisms)) {
                return false;
            }
            if (!parse_table(j.at("magnetization"), MAGNETIZATION_COLUMNS, "magnetization", run.magnetization)) {
                return false;
            }
            if (!parse_observations(j.at("observations"), directory_of(json_path), run.coordinates)) {
                return false;
            }

            run.component = j.value("component", std::string("all"));
            run.dtype = j.value("dtype", std::string("float64"));
            run.parallel = j.value("parallel", config::parallel::ENABLE_POINT_PARALLEL);
            run.disable_checks = j.value("disable_checks", false);
            run.progressbar = j.value("progressbar", false);
            run.threads = j.value("threads", config::parallel::NUM_THREADS);
            run.output_path = j.value("output", config::OUTPUT_FIELD);

            if (run.dtype != "float64" && run.dtype != "float32") {
                std::cerr << "Error: Invalid dtype '" << run.dtype
                    << "'. It must be either 'float64' or 'float32'." << std::endl;
                return false;
            }

            std::cout << "[OK] Loaded " << run.prisms.rows() << " prisms from " << json_path << std::endl;
            return true;
        }
        catch (const std::exception& e) {
            std::cerr << "Error parsing configuration JSON: " << e.what() << std::endl;
            return false;
        }
    }

    bool load_observation_points(const std::string& csv_path, Coordinates& coordinates) {
        std::vector<std::vector<std::string>> rows;

        if (!CSVParser::parse_file(csv_path, rows, true)) {
            std::cerr << "Error: Cannot open observations file: " << csv_path << std::endl;
            return false;
        }

        std::vector<double> e, n, u;
        e.reserve(rows.size());
        n.reserve(rows.size());
        u.reserve(rows.size());

        for (size_t i = 0; i < rows.size(); ++i) {
            const auto& tokens = rows[i];
            double values[3];
            if (tokens.size() < 3
                || !CSVParser::to_double(tokens[0], values[0])
                || !CSVParser::to_double(tokens[1], values[1])
                || !CSVParser::to_double(tokens[2], values[2])) {
                std::cerr << "Error: Invalid observation row " << i + 1 << " in " << csv_path << std::endl;
                return false;
            }
            e.push_back(values[0]);
            n.push_back(values[1]);
            u.push_back(values[2]);
        }

        coordinates.easting = GridArray<double>(e);
        coordinates.northing = GridArray<double>(n);
        coordinates.upward = GridArray<double>(u);

        std::cout << "[OK] Loaded " << e.size() << " observation points" << std::endl;
        return true;
    }

    template <typename T>
    bool save_field(
        const std::string& output_path,
        const Coordinates& coordinates,
        const MagneticField<T>& field
    ) {
        std::ofstream file(output_path);
        if (!file.is_open()) {
            std::cerr << "Error: Cannot open output file: " << output_path << std::endl;
            return false;
        }

        Shape shape;
        const PointSet points = flatten_coordinates(coordinates, shape);

        file << std::setprecision(config::output::PRECISION);
        file << "easting,northing,upward,b_e,b_n,b_u\n";

        for (size_t i = 0; i < points.size(); ++i) {
            file << points.easting[i] << "," << points.northing[i] << "," << points.upward[i] << ","
                << field.b_e[i] << "," << field.b_n[i] << "," << field.b_u[i] << "\n";
        }

        std::cout << "[OK] Results saved to: " << output_path << std::endl;
        return true;
    }

    template <typename T>
    bool save_component(
        const std::string& output_path,
        const Coordinates& coordinates,
        const std::string& component,
        const GridArray<T>& values
    ) {
        std::ofstream file(output_path);
        if (!file.is_open()) {
            std::cerr << "Error: Cannot open output file: " << output_path << std::endl;
            return false;
        }

        Shape shape;
        const PointSet points = flatten_coordinates(coordinates, shape);

        file << std::setprecision(config::output::PRECISION);
        file << "easting,northing,upward,b_" << component << "\n";

        for (size_t i = 0; i < points.size(); ++i) {
            file << points.easting[i] << "," << points.northing[i] << "," << points.upward[i] << ","
                << values[i] << "\n";
        }

        std::cout << "[OK] Results saved to: " << output_path << std::endl;
        return true;
    }

    template bool save_field<float>(const std::string&, const Coordinates&, const MagneticField<float>&);
    template bool save_field<double>(const std::string&, const Coordinates&, const MagneticField<double>&);
    template bool save_component<float>(const std::string&, const Coordinates&,
        const std::string&, const GridArray<float>&);
    template bool save_component<double>(const std::string&, const Coordinates&,
        const std::string&, const GridArray<double>&);

} // namespace prismag
