#pragma once
// errors.hpp
// Validation errors raised before any forward modelling work starts

#include <cstddef>
#include <stdexcept>
#include <string>

namespace prismag {

    // Table or coordinate shapes that cannot be used together
    class ShapeMismatch : public std::invalid_argument {
    public:
        explicit ShapeMismatch(const std::string& what)
            : std::invalid_argument(what) {
        }
    };

    // Prism whose lower boundary is greater than its upper boundary
    class InvalidGeometry : public std::invalid_argument {
    public:
        InvalidGeometry(std::size_t prism_index, const std::string& dimension,
            double lower, double upper);

        std::size_t prism_index() const { return prism_index_; }
        const std::string& dimension() const { return dimension_; }

    private:
        std::size_t prism_index_;
        std::string dimension_;
    };

    // Component name outside "easting", "northing", "upward"
    class InvalidComponent : public std::invalid_argument {
    public:
        explicit InvalidComponent(const std::string& component);

        const std::string& component() const { return component_; }

    private:
        std::string component_;
    };

} // namespace prismag
