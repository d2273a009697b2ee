// errors.cpp
#include "errors.hpp"
#include <sstream>

namespace prismag {

    namespace {

        std::string geometry_message(std::size_t prism_index, const std::string& dimension,
            double lower, double upper)
        {
            static const char* lower_names[] = { "west", "south", "bottom" };
            static const char* upper_names[] = { "east", "north", "top" };
            int axis = (dimension == "easting") ? 0 : (dimension == "northing") ? 1 : 2;

            std::ostringstream oss;
            oss << "Invalid prism " << prism_index << ": the " << lower_names[axis]
                << " boundary (" << lower << ") can't be greater than the "
                << upper_names[axis] << " one (" << upper << ") along " << dimension << ".";
            return oss.str();
        }

    }

    InvalidGeometry::InvalidGeometry(std::size_t prism_index, const std::string& dimension,
        double lower, double upper)
        : std::invalid_argument(geometry_message(prism_index, dimension, lower, upper)),
        prism_index_(prism_index),
        dimension_(dimension)
    {
    }

    InvalidComponent::InvalidComponent(const std::string& component)
        : std::invalid_argument("Invalid component '" + component
            + "'. It must be either 'easting', 'northing' or 'upward'."),
        component_(component)
    {
    }

} // namespace prismag
