// prism_magnetic.cpp
// Forward modelling entry points: broadcast, check, filter, accumulate, convert
#include "prism_magnetic.hpp"
#include "component.hpp"
#include "prism_model.hpp"

namespace prismag {

    namespace {

        template <typename T>
        GridArray<T> to_nanotesla(std::vector<T>& values, const Shape& shape) {
            for (T& v : values) {
                v *= static_cast<T>(TESLA_TO_NANOTESLA);
            }
            return GridArray<T>(shape, values);
        }

    }

    PointSet flatten_coordinates(const Coordinates& coordinates, Shape& shape) {
        shape = broadcast_shapes({
            coordinates.easting.shape,
            coordinates.northing.shape,
            coordinates.upward.shape
        });

        PointSet points;
        points.easting = broadcast_ravel(coordinates.easting, shape);
        points.northing = broadcast_ravel(coordinates.northing, shape);
        points.upward = broadcast_ravel(coordinates.upward, shape);
        return points;
    }

    template <typename T>
    MagneticField<T> prism_magnetic(
        const Coordinates& coordinates,
        const PrismTable& prisms,
        const MagnetizationTable& magnetization,
        const ForwardOptions& options
    ) {
        Shape shape;
        const PointSet points = flatten_coordinates(coordinates, shape);

        if (!options.disable_checks) {
            run_sanity_checks(prisms, magnetization);
        }

        const PrismModel model = discard_null_prisms(prisms, magnetization);

        std::vector<T> b_e(points.size(), T(0));
        std::vector<T> b_n(points.size(), T(0));
        std::vector<T> b_u(points.size(), T(0));

        kernel::accumulate_field(points, model, b_e, b_n, b_u, options.parallel, options.progress);

        MagneticField<T> field;
        field.b_e = to_nanotesla(b_e, shape);
        field.b_n = to_nanotesla(b_n, shape);
        field.b_u = to_nanotesla(b_u, shape);
        return field;
    }

    template <typename T>
    GridArray<T> prism_magnetic_component(
        const Coordinates& coordinates,
        const PrismTable& prisms,
        const MagnetizationTable& magnetization,
        const std::string& component,
        const ForwardOptions& options
    ) {
        Shape shape;
        const PointSet points = flatten_coordinates(coordinates, shape);

        const ComponentFunction forward = forward_function(parse_component(component));

        if (!options.disable_checks) {
            run_sanity_checks(prisms, magnetization);
        }

        const PrismModel model = discard_null_prisms(prisms, magnetization);

        std::vector<T> result(points.size(), T(0));

        kernel::accumulate_component(points, model, result, forward, options.parallel, options.progress);

        return to_nanotesla(result, shape);
    }

    template MagneticField<float> prism_magnetic<float>(
        const Coordinates&, const PrismTable&, const MagnetizationTable&, const ForwardOptions&);
    template MagneticField<double> prism_magnetic<double>(
        const Coordinates&, const PrismTable&, const MagnetizationTable&, const ForwardOptions&);
    template GridArray<float> prism_magnetic_component<float>(
        const Coordinates&, const PrismTable&, const MagnetizationTable&,
        const std::string&, const ForwardOptions&);
    template GridArray<double> prism_magnetic_component<double>(
        const Coordinates&, const PrismTable&, const MagnetizationTable&,
        const std::string&, const ForwardOptions&);

} // namespace prismag
