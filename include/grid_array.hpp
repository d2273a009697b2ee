#pragma once
// grid_array.hpp
// N-dimensional row-major array used for coordinates and results

#include <cstddef>
#include <string>
#include <vector>

namespace prismag {

    using Shape = std::vector<std::size_t>;

    template <typename T>
    struct GridArray {
        Shape shape;            // Empty for a scalar
        std::vector<T> values;  // Row-major, size() == product of shape

        GridArray() : values(1, T(0)) {}

        GridArray(T scalar) : values(1, scalar) {}

        GridArray(const std::vector<T>& v) : shape{ v.size() }, values(v) {}

        GridArray(const Shape& s, const std::vector<T>& v) : shape(s), values(v) {}

        std::size_t size() const { return values.size(); }

        std::size_t ndim() const { return shape.size(); }

        T& operator[](std::size_t i) { return values[i]; }
        const T& operator[](std::size_t i) const { return values[i]; }
    };

    // Number of elements of an array with the given shape
    std::size_t shape_size(const Shape& shape);

    std::string shape_to_string(const Shape& shape);

    // NumPy broadcasting: shapes are right-aligned and every dimension must be
    // equal or 1. Throws ShapeMismatch if they cannot be broadcast together.
    Shape broadcast_shapes(const std::vector<Shape>& shapes);

    // Expand an array to a broadcast-compatible target shape and flatten it
    template <typename T>
    std::vector<T> broadcast_ravel(const GridArray<T>& array, const Shape& target) {
        const std::size_t n = shape_size(target);
        std::vector<T> out(n);

        if (array.size() == n && array.shape == target) {
            out = array.values;
            return out;
        }

        // Strides of the source aligned to the target's trailing dimensions,
        // zero where the source dimension is broadcast
        const std::size_t offset = target.size() - array.shape.size();
        std::vector<std::size_t> strides(target.size(), 0);
        std::size_t stride = 1;
        for (std::size_t d = array.shape.size(); d-- > 0;) {
            strides[d + offset] = (array.shape[d] == 1) ? 0 : stride;
            stride *= array.shape[d];
        }

        std::vector<std::size_t> index(target.size(), 0);
        for (std::size_t i = 0; i < n; ++i) {
            std::size_t source = 0;
            for (std::size_t d = 0; d < target.size(); ++d) {
                source += index[d] * strides[d];
            }
            out[i] = array.values[source];

            // Advance the multi-index, last dimension fastest
            for (std::size_t d = target.size(); d-- > 0;) {
                if (++index[d] < target[d]) break;
                index[d] = 0;
            }
        }
        return out;
    }

} // namespace prismag
