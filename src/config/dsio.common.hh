#pragma once

#include "dataset.io.types.h"
#include "definitions.hh"

#include <cstddef> // size_t
#include <string>
#include <string_view>
#include <vector>

namespace dsio {
/**
 * @brief Get the number of elements in an array of the given shape.
 * @param shape The shape.
 * @return The product of the extents of @p shape, or 1 for a rank-0 shape.
 * @throw std::overflow_error if the product does not fit in 64 bits.
 */
uint64_t
volume(const Shape& shape);

/** @brief Check that the byte size of an array of @p shape fits in 64 bits. */
bool
size_in_bytes_fits(const Shape& shape, size_t itemsize) noexcept;

/**
 * @brief Render a shape the way NumPy renders a tuple, e.g. "(100, 4)".
 */
std::string
shape_to_string(const Shape& shape);

/**
 * @brief Join strings with a separator.
 * @param items The strings to join.
 * @param separator Placed between consecutive items.
 * @return The joined string.
 */
std::string
join(const std::vector<std::string>& items, std::string_view separator = ", ");

/**
 * @brief Split a slash-delimited location into its segments.
 * @param location The location, e.g. "acquisition/Series/data".
 * @return The segments, in order. Empty segments are preserved.
 */
std::vector<std::string>
split_location(std::string_view location);

/**
 * @brief Render a byte count with decimal (SI) units, e.g. "10.00 MB".
 */
std::string
human_readable_bytes(uint64_t nbytes);

/**
 * @brief Get the display name of a backend kind.
 * @param backend The backend kind.
 * @return "hdf5" or "zarr".
 * @throw std::invalid_argument if the backend kind is not recognized.
 */
const char*
backend_to_string(DsioBackend backend);

/**
 * @brief Get the number of CPUs available to the process.
 * @return The number of hardware threads, at least 1.
 */
uint32_t
available_cpu_count();
} // namespace dsio
