// component.cpp
#include "component.hpp"
#include "errors.hpp"
#include "prism_kernels.hpp"

namespace prismag {

    Component parse_component(const std::string& name) {
        if (name == "easting") return Component::Easting;
        if (name == "northing") return Component::Northing;
        if (name == "upward") return Component::Upward;
        throw InvalidComponent(name);
    }

    std::string component_name(Component component) {
        switch (component) {
        case Component::Easting: return "easting";
        case Component::Northing: return "northing";
        case Component::Upward: return "upward";
        }
        return "";
    }

    ComponentFunction forward_function(Component component) {
        switch (component) {
        case Component::Easting: return &kernels::magnetic_e;
        case Component::Northing: return &kernels::magnetic_n;
        case Component::Upward: return &kernels::magnetic_u;
        }
        return nullptr;
    }

} // namespace prismag
