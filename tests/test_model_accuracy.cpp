// test_model_accuracy.cpp
// Prism field compared with the equivalent point dipole
#include <gtest/gtest.h>
#include <vector>
#include "geometry.hpp"
#include "prism_kernels.hpp"

using namespace prismag;

namespace {

    // B(r) = (mu0/4pi) * [3(m·r̂)r̂ - m] / r³
    Eigen::Vector3d dipole_kernel(const Eigen::Vector3d& r, const Eigen::Vector3d& m) {
        double r_mag = r.norm();
        Eigen::Vector3d r_hat = r / r_mag;
        double r3 = r_mag * r_mag * r_mag;
        return MU0_OVER_4PI * (3.0 * m.dot(r_hat) * r_hat - m) / r3;
    }

}

class ModelAccuracyTest : public ::testing::Test {
protected:
    void SetUp() override {
        magnetization = Eigen::Vector3d(1.0, -2.0, 3.0);
        moment = magnetization * cube.volume();
    }

    // 10 m cube centred on the origin
    Prism cube{ -5.0, 5.0, -5.0, 5.0, -5.0, 5.0 };
    Eigen::Vector3d magnetization;
    Eigen::Vector3d moment;

    Eigen::Vector3d prism_field(const Eigen::Vector3d& p) const {
        return kernels::magnetic_field(p(0), p(1), p(2),
            cube.west, cube.east, cube.south, cube.north, cube.bottom, cube.top,
            magnetization(0), magnetization(1), magnetization(2));
    }

    double relative_difference(const Eigen::Vector3d& p) const {
        Eigen::Vector3d b_dipole = dipole_kernel(p, moment);
        return (prism_field(p) - b_dipole).norm() / b_dipole.norm();
    }
};

// Far from the cube the prism and dipole models agree
TEST_F(ModelAccuracyTest, FarFieldMatchesDipole) {
    std::vector<Eigen::Vector3d> points = {
        Eigen::Vector3d(1000.0, 0.0, 0.0),
        Eigen::Vector3d(0.0, -1000.0, 0.0),
        Eigen::Vector3d(0.0, 0.0, 1000.0),
        Eigen::Vector3d(600.0, 500.0, -400.0),
        Eigen::Vector3d(-300.0, 700.0, 650.0)
    };

    for (const auto& p : points) {
        EXPECT_LT(relative_difference(p), 1e-3) << "at (" << p.transpose() << ")";
    }
}

// The dipole approximation improves with distance
TEST_F(ModelAccuracyTest, DifferenceShrinksWithDistance) {
    Eigen::Vector3d direction = Eigen::Vector3d(0.6, 0.3, 0.8).normalized();
    std::vector<double> distances = { 15.0, 30.0, 100.0, 400.0 };

    double previous = relative_difference(direction * distances[0]);
    for (size_t i = 1; i < distances.size(); ++i) {
        double current = relative_difference(direction * distances[i]);
        EXPECT_LT(current, previous) << "distance " << distances[i] << " m";
        previous = current;
    }
}
