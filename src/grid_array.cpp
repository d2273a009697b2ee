// grid_array.cpp
#include "grid_array.hpp"
#include "errors.hpp"
#include <algorithm>
#include <sstream>

namespace prismag {

    std::size_t shape_size(const Shape& shape) {
        std::size_t n = 1;
        for (std::size_t d : shape) {
            n *= d;
        }
        return n;
    }

    std::string shape_to_string(const Shape& shape) {
        std::ostringstream oss;
        oss << "(";
        for (std::size_t d = 0; d < shape.size(); ++d) {
            if (d > 0) oss << ", ";
            oss << shape[d];
        }
        if (shape.size() == 1) oss << ",";
        oss << ")";
        return oss.str();
    }

    Shape broadcast_shapes(const std::vector<Shape>& shapes) {
        std::size_t ndim = 0;
        for (const auto& s : shapes) {
            ndim = (std::max)(ndim, s.size());
        }

        Shape result(ndim, 1);
        for (const auto& s : shapes) {
            const std::size_t offset = ndim - s.size();
            for (std::size_t d = 0; d < s.size(); ++d) {
                std::size_t& out = result[d + offset];
                if (s[d] == out || s[d] == 1) {
                    continue;
                }
                if (out == 1) {
                    out = s[d];
                    continue;
                }

                std::ostringstream oss;
                oss << "Coordinate arrays could not be broadcast together with shapes";
                for (const auto& t : shapes) {
                    oss << " " << shape_to_string(t);
                }
                throw ShapeMismatch(oss.str());
            }
        }
        return result;
    }

} // namespace prismag
