#pragma once

#include "definitions.hh"

#include <cstddef> // size_t

namespace dsio {
/**
 * @brief Target sizes, in bytes, for default chunk and buffer shapes.
 */
struct EstimationTargets
{
    uint64_t chunk_target_bytes{ DEFAULT_CHUNK_TARGET_BYTES };
    uint64_t buffer_target_bytes{ DEFAULT_BUFFER_TARGET_BYTES };
};

struct ShapeEstimate
{
    Shape chunk_shape;
    Shape buffer_shape;
};

/**
 * @brief Estimate a default chunk shape.
 * @details Starting from a unit shape, repeatedly grow the unsaturated axis
 * with the smallest current extent (ties go to the axis with the most room
 * left relative to @p full_shape) by doubling it, capped at the full extent
 * and at the extent that just reaches the target. Stops once the chunk
 * reaches @p chunk_target_bytes or every axis spans the full array.
 * @note A zero-volume @p full_shape is returned unchanged.
 * @param full_shape The extent of the full array.
 * @param itemsize The number of bytes per element.
 * @param chunk_target_bytes The target size of a chunk.
 * @return The chunk shape.
 * @throw InvalidShapeError if @p full_shape is empty, or if @p itemsize or
 * @p chunk_target_bytes is zero.
 */
Shape
estimate_chunk_shape(const Shape& full_shape,
                     size_t itemsize,
                     uint64_t chunk_target_bytes = DEFAULT_CHUNK_TARGET_BYTES);

/**
 * @brief Estimate a default buffer shape for a given chunk shape.
 * @details Grows from @p chunk_shape the same way chunks are grown from a
 * unit shape, then rounds each axis that does not span the full array up to a
 * multiple of the chunk extent, capped at the full extent.
 * @note A zero-volume @p full_shape is returned unchanged.
 * @throw InvalidShapeError if @p full_shape is empty, or if @p itemsize or
 * @p buffer_target_bytes is zero.
 * @throw ShapeMismatchError if @p chunk_shape does not fit in @p full_shape.
 */
Shape
estimate_buffer_shape(const Shape& full_shape,
                      const Shape& chunk_shape,
                      size_t itemsize,
                      uint64_t buffer_target_bytes = DEFAULT_BUFFER_TARGET_BYTES);

/**
 * @brief Estimate both default shapes for an array.
 */
ShapeEstimate
estimate_default_shapes(const Shape& full_shape,
                        size_t itemsize,
                        const EstimationTargets& targets = {});

/**
 * @brief Get the number of bytes held by an array of the given shape.
 */
uint64_t
estimate_memory_usage(const Shape& shape, size_t itemsize);
} // namespace dsio
