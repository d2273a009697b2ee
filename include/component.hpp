#pragma once
// component.hpp
// Selection of a single magnetic field component

#include <string>

namespace prismag {

    enum class Component {
        Easting,
        Northing,
        Upward
    };

    // Single-component analytic function, same arguments as kernels::magnetic_e
    using ComponentFunction = double (*)(
        double, double, double,
        double, double, double, double, double, double,
        double, double, double);

    // "easting", "northing" or "upward", throws InvalidComponent otherwise
    Component parse_component(const std::string& name);

    std::string component_name(Component component);

    ComponentFunction forward_function(Component component);

} // namespace prismag
