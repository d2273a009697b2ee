#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include "io_utils.hpp"

using namespace prismag;

class IoUtilsTest : public ::testing::Test {
protected:
    std::string dir = ::testing::TempDir();

    std::string write_file(const std::string& name, const std::string& content) {
        std::string path = dir + name;
        std::ofstream file(path);
        file << content;
        return path;
    }

    static std::string first_line(const std::string& path) {
        std::ifstream file(path);
        std::string line;
        std::getline(file, line);
        return line;
    }
};

TEST_F(IoUtilsTest, GridCoordinates) {
    Coordinates c = grid_coordinates(0.0, 30.0, 100.0, 120.0, 3, 4, 50.0);
    EXPECT_EQ(c.easting.shape, Shape({ 3, 4 }));
    EXPECT_EQ(c.northing.shape, Shape({ 3, 4 }));
    EXPECT_TRUE(c.upward.shape.empty());

    EXPECT_DOUBLE_EQ(c.easting[0], 0.0);
    EXPECT_DOUBLE_EQ(c.easting[3], 30.0);
    EXPECT_DOUBLE_EQ(c.easting[5], 10.0);
    EXPECT_DOUBLE_EQ(c.northing[3], 100.0);
    EXPECT_DOUBLE_EQ(c.northing[4], 110.0);
    EXPECT_DOUBLE_EQ(c.northing[11], 120.0);
    EXPECT_DOUBLE_EQ(c.upward[0], 50.0);
}

TEST_F(IoUtilsTest, LoadRunConfigWithGrid) {
    std::string path = write_file("run_grid.json", R"({
        "prisms": [[-10, 10, -10, 10, -20, -5], [20, 30, -5, 5, -10, 0]],
        "magnetization": [[0, 0, 1], [1, 2, 3]],
        "observations": {"grid": {"region": [-50, 50, -40, 40], "shape": [9, 11], "upward": 5}},
        "component": "upward",
        "dtype": "float32",
        "parallel": false,
        "progressbar": true,
        "threads": 2,
        "output": "out.csv"
    })");

    RunConfig run;
    ASSERT_TRUE(load_run_config(path, run));
    EXPECT_EQ(run.prisms.rows(), 2);
    EXPECT_EQ(run.prisms.cols(), 6);
    EXPECT_DOUBLE_EQ(run.prisms(1, 0), 20.0);
    EXPECT_DOUBLE_EQ(run.magnetization(1, 2), 3.0);
    EXPECT_EQ(run.coordinates.easting.shape, Shape({ 9, 11 }));
    EXPECT_DOUBLE_EQ(run.coordinates.upward[0], 5.0);
    EXPECT_EQ(run.component, "upward");
    EXPECT_EQ(run.dtype, "float32");
    EXPECT_FALSE(run.parallel);
    EXPECT_FALSE(run.disable_checks);
    EXPECT_TRUE(run.progressbar);
    EXPECT_EQ(run.threads, 2);
    EXPECT_EQ(run.output_path, "out.csv");
}

// A flat list is a single prism, observation paths are relative to the JSON file
TEST_F(IoUtilsTest, LoadRunConfigWithSinglePrismAndCsv) {
    write_file("points.csv", "easting,northing,upward\n0,0,10\n5.5,-2,10\n# comment\n\n12,3,20\n");
    std::string path = write_file("run_csv.json", R"({
        "prisms": [-10, 10, -10, 10, -20, -5],
        "magnetization": [0.5, 0, 1],
        "observations": {"file": "points.csv"}
    })");

    RunConfig run;
    ASSERT_TRUE(load_run_config(path, run));
    EXPECT_EQ(run.prisms.rows(), 1);
    EXPECT_EQ(run.magnetization.rows(), 1);
    EXPECT_EQ(run.magnetization.cols(), 3);
    EXPECT_EQ(run.coordinates.easting.shape, Shape({ 3 }));
    EXPECT_DOUBLE_EQ(run.coordinates.easting[1], 5.5);
    EXPECT_DOUBLE_EQ(run.coordinates.upward[2], 20.0);
    EXPECT_EQ(run.component, "all");
    EXPECT_EQ(run.dtype, "float64");
    EXPECT_TRUE(run.parallel);
}

// Wrong column counts are kept so the sanity checks can report them
TEST_F(IoUtilsTest, MagnetizationColumnCountPreserved) {
    std::string path = write_file("run_cols.json", R"({
        "prisms": [[-10, 10, -10, 10, -20, -5]],
        "magnetization": [[1, 2, 3, 4]],
        "observations": {"grid": {"region": [0, 1, 0, 1], "shape": [2, 2]}}
    })");

    RunConfig run;
    ASSERT_TRUE(load_run_config(path, run));
    EXPECT_EQ(run.magnetization.cols(), 4);
}

TEST_F(IoUtilsTest, InvalidInputsRejected) {
    RunConfig run;
    EXPECT_FALSE(load_run_config(dir + "does_not_exist.json", run));
    EXPECT_FALSE(load_run_config(write_file("broken.json", "{ not json"), run));
    EXPECT_FALSE(load_run_config(write_file("no_obs.json",
        R"({"prisms": [0, 1, 0, 1, 0, 1], "magnetization": [1, 0, 0], "observations": {}})"), run));
    EXPECT_FALSE(load_run_config(write_file("bad_dtype.json",
        R"({"prisms": [0, 1, 0, 1, 0, 1], "magnetization": [1, 0, 0],
            "observations": {"grid": {"region": [0, 1, 0, 1], "shape": [2, 2]}}, "dtype": "int8"})"), run));

    Coordinates c;
    EXPECT_FALSE(load_observation_points(write_file("bad.csv", "e,n,u\n1,2\n"), c));
    EXPECT_FALSE(load_observation_points(write_file("nan.csv", "e,n,u\n1,abc,3\n"), c));
}

TEST_F(IoUtilsTest, InvalidGridShapesRejected) {
    const char* shapes[] = { "[0, 5]", "[5, 0]", "[-1, 3]", "[2.5, 3]", "[\"4\", 3]",
        "[4294967296, 4294967296]", "[9223372036854775807, 2]" };
    for (const char* shape : shapes) {
        RunConfig run;
        const std::string text = std::string(R"({"prisms": [0, 1, 0, 1, 0, 1], "magnetization": [1, 0, 0],
            "observations": {"grid": {"region": [0, 1, 0, 1], "shape": )") + shape + "}}}";
        EXPECT_FALSE(load_run_config(write_file("bad_shape.json", text), run)) << "shape " << shape;
    }

    RunConfig run;
    ASSERT_TRUE(load_run_config(write_file("one_point.json",
        R"({"prisms": [0, 1, 0, 1, 0, 1], "magnetization": [1, 0, 0],
            "observations": {"grid": {"region": [0, 1, 0, 1], "shape": [1, 1]}}})"), run));
    EXPECT_EQ(run.coordinates.easting.size(), 1u);
}

TEST_F(IoUtilsTest, SaveFieldAndComponent) {
    Coordinates c = grid_coordinates(0.0, 1.0, 0.0, 1.0, 2, 2, 0.0);
    MagneticField<double> field;
    field.b_e = GridArray<double>(Shape({ 2, 2 }), { 1, 2, 3, 4 });
    field.b_n = field.b_e;
    field.b_u = field.b_e;

    std::string path = dir + "field.csv";
    ASSERT_TRUE(save_field(path, c, field));
    EXPECT_EQ(first_line(path), "easting,northing,upward,b_e,b_n,b_u");

    std::string component_path = dir + "component.csv";
    GridArray<float> values(Shape({ 2, 2 }), { 1.f, 2.f, 3.f, 4.f });
    ASSERT_TRUE(save_component(component_path, c, "upward", values));
    EXPECT_EQ(first_line(component_path), "easting,northing,upward,b_upward");

    std::ifstream file(component_path);
    std::string line;
    int rows = 0;
    std::getline(file, line);
    while (std::getline(file, line)) ++rows;
    EXPECT_EQ(rows, 4);
}
