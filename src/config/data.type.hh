#pragma once

#include "dataset.io.types.h"

#include <cstddef> // size_t
#include <string>
#include <string_view>

namespace dsio {
/**
 * @brief Get the number of bytes for a fixed-width data type.
 * @param data_type The data type.
 * @return The number of bytes for the data type.
 * @throw std::invalid_argument if the data type has no fixed width.
 */
size_t
bytes_of_type(DsioDataType data_type);

/**
 * @brief The element type of a dataset.
 * @details Numeric and boolean kinds have a fixed width. Strings are stored
 * with the fixed width of their longest element. Object arrays have pointer
 * width and must be resolved to strings before they can be configured.
 */
class DataType
{
  public:
    explicit DataType(DsioDataType kind);

    /**
     * @brief Create a fixed-width string type.
     * @param width The width, in bytes, of the longest element. Must be
     * nonzero.
     */
    static DataType string_of_width(size_t width);

    /**
     * @brief Parse a display name, e.g. "float64", "str12" or "object".
     * @throw UnsupportedDtypeError if @p name is not a known type.
     */
    static DataType from_name(std::string_view name);

    DsioDataType kind() const noexcept { return kind_; }
    size_t itemsize() const noexcept { return itemsize_; }

    bool is_object() const noexcept { return kind_ == DsioDataType_object; }
    bool is_string() const noexcept { return kind_ == DsioDataType_string; }

    /** @brief NumPy-style display name, e.g. "uint16" or "str32". */
    std::string name() const;

    bool operator==(const DataType& other) const = default;

  private:
    DataType(DsioDataType kind, size_t itemsize);

    DsioDataType kind_;
    size_t itemsize_;
};
} // namespace dsio
