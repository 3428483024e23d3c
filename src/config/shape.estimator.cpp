#include "shape.estimator.hh"
#include "dsio.common.hh"
#include "errors.hh"
#include "macros.hh"

#include <algorithm>
#include <optional>

namespace {
bool
has_zero_volume(const dsio::Shape& shape)
{
    return std::any_of(shape.begin(), shape.end(), [](uint64_t extent) {
        return extent == 0;
    });
}

void
validate_inputs(const dsio::Shape& full_shape,
                size_t itemsize,
                uint64_t target_bytes)
{
    EXPECT_AS(dsio::InvalidShapeError,
              !full_shape.empty(),
              "Cannot estimate shapes for an array with no axes");
    EXPECT_AS(dsio::InvalidShapeError,
              itemsize > 0,
              "Element size must be positive");
    EXPECT_AS(dsio::InvalidShapeError,
              target_bytes > 0,
              "Target size must be positive");
}

// pick the axis with the smallest extent that can still grow; among equals,
// the one with the largest full/current ratio, then the lowest index
std::optional<size_t>
next_axis_to_grow(const dsio::Shape& shape, const dsio::Shape& full_shape)
{
    std::optional<size_t> axis;
    for (size_t i = 0; i < shape.size(); ++i) {
        if (shape[i] >= full_shape[i]) {
            continue;
        }

        if (!axis) {
            axis = i;
            continue;
        }

        const auto a = *axis;
        if (shape[i] < shape[a]) {
            axis = i;
        } else if (shape[i] == shape[a] && full_shape[i] > full_shape[a]) {
            axis = i; // equal extents, so the larger array has more room
        }
    }

    return axis;
}

dsio::Shape
grow_to_target(dsio::Shape shape,
               const dsio::Shape& full_shape,
               uint64_t target_elements)
{
    uint64_t n_elements = dsio::volume(shape);

    while (n_elements < target_elements) {
        const auto axis = next_axis_to_grow(shape, full_shape);
        if (!axis) {
            break; // every axis spans the full array
        }

        const auto a = *axis;
        const uint64_t others = n_elements / shape[a];
        const uint64_t needed = (target_elements + others - 1) / others;

        const uint64_t extent =
          std::min({ full_shape[a], 2 * shape[a], needed });

        shape[a] = extent;
        n_elements = others * extent;
    }

    return shape;
}

uint64_t
target_elements(uint64_t target_bytes, size_t itemsize)
{
    return std::max<uint64_t>(1, (target_bytes + itemsize - 1) / itemsize);
}
} // namespace

dsio::Shape
dsio::estimate_chunk_shape(const Shape& full_shape,
                           size_t itemsize,
                           uint64_t chunk_target_bytes)
{
    validate_inputs(full_shape, itemsize, chunk_target_bytes);

    if (has_zero_volume(full_shape)) {
        LOG_DEBUG("Array of shape ",
                  shape_to_string(full_shape),
                  " has no elements; chunk shape is the full shape");
        return full_shape;
    }

    return grow_to_target(Shape(full_shape.size(), 1),
                          full_shape,
                          target_elements(chunk_target_bytes, itemsize));
}

dsio::Shape
dsio::estimate_buffer_shape(const Shape& full_shape,
                            const Shape& chunk_shape,
                            size_t itemsize,
                            uint64_t buffer_target_bytes)
{
    validate_inputs(full_shape, itemsize, buffer_target_bytes);

    if (has_zero_volume(full_shape)) {
        return full_shape;
    }

    EXPECT_AS(ShapeMismatchError,
              chunk_shape.size() == full_shape.size(),
              "Chunk shape ",
              shape_to_string(chunk_shape),
              " does not have the same rank as full shape ",
              shape_to_string(full_shape));
    for (size_t i = 0; i < full_shape.size(); ++i) {
        EXPECT_AS(ShapeMismatchError,
                  chunk_shape[i] > 0 && chunk_shape[i] <= full_shape[i],
                  "Chunk shape ",
                  shape_to_string(chunk_shape),
                  " does not fit in full shape ",
                  shape_to_string(full_shape),
                  " along axis ",
                  i);
    }

    Shape buffer_shape =
      grow_to_target(chunk_shape,
                     full_shape,
                     target_elements(buffer_target_bytes, itemsize));

    // buffers must hold a whole number of chunks along partial axes
    for (size_t i = 0; i < buffer_shape.size(); ++i) {
        if (buffer_shape[i] == full_shape[i]) {
            continue;
        }

        const auto c = chunk_shape[i];
        const auto rounded = c * ((buffer_shape[i] + c - 1) / c);
        buffer_shape[i] = std::min(rounded, full_shape[i]);
    }

    return buffer_shape;
}

dsio::ShapeEstimate
dsio::estimate_default_shapes(const Shape& full_shape,
                              size_t itemsize,
                              const EstimationTargets& targets)
{
    ShapeEstimate estimate;
    estimate.chunk_shape =
      estimate_chunk_shape(full_shape, itemsize, targets.chunk_target_bytes);
    estimate.buffer_shape = estimate_buffer_shape(full_shape,
                                                  estimate.chunk_shape,
                                                  itemsize,
                                                  targets.buffer_target_bytes);

    return estimate;
}

uint64_t
dsio::estimate_memory_usage(const Shape& shape, size_t itemsize)
{
    EXPECT_AS(std::overflow_error,
              size_in_bytes_fits(shape, itemsize),
              "Size in bytes of shape ",
              shape_to_string(shape),
              " with item size ",
              itemsize,
              " overflows 64 bits");

    return volume(shape) * itemsize;
}
