#pragma once

#include "compression.catalog.hh"
#include "data.type.hh"
#include "definitions.hh"
#include "shape.estimator.hh"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dsio {
/**
 * @brief An already-configured codec, passed by value instead of by name.
 * @details Bypasses name resolution, so it is the way to opt in to codecs the
 * catalog excludes, such as lossy ones. For HDF5, @p filter_id identifies the
 * registered filter and @p configuration holds its parameters in order.
 */
struct CodecInstance
{
    DsioBackend backend;
    std::string id;
    uint32_t filter_id{ 0 };
    nlohmann::json configuration = nlohmann::json::object();

    bool operator==(const CodecInstance& other) const = default;
};

/** @brief No compression, a codec name, or an explicit codec. */
using CompressionMethod =
  std::variant<std::monostate, std::string, CodecInstance>;

/** @brief A filter name or an explicit filter codec. */
using FilterMethod = std::variant<std::string, CodecInstance>;

struct HDF5DatasetSettings
{
    bool operator==(const HDF5DatasetSettings&) const = default;
};

struct ZarrDatasetSettings
{
    std::vector<FilterMethod> filter_methods;
    std::optional<std::vector<nlohmann::json>> filter_options;

    bool operator==(const ZarrDatasetSettings&) const = default;
};

using BackendDatasetSettings =
  std::variant<HDF5DatasetSettings, ZarrDatasetSettings>;

/**
 * @brief The frozen identity of a dataset.
 */
struct DatasetInfo
{
    std::string object_id;
    std::string location;
    std::string dataset_name;
    DataType dtype;
    Shape full_shape;

    bool operator==(const DatasetInfo&) const = default;
};

/**
 * @brief Get the display name of a compression method: the codec name,
 * "none", or the id of an explicit codec.
 */
std::string
compression_method_name(const CompressionMethod& method);

/**
 * @brief Make a compression method from a name, mapping "none" to no
 * compression.
 */
CompressionMethod
make_compression_method(std::string_view name);

/**
 * @brief The validated storage configuration of one dataset.
 * @details Instances are immutable. The with_*() methods return a new,
 * fully validated descriptor and leave this one unchanged.
 */
class DatasetDescriptor
{
  public:
    /**
     * @brief Construct a descriptor from explicit fields.
     * @param catalog The compression catalog of the target backend.
     * @param info The identity of the dataset.
     * @param chunk_shape The on-disk chunk shape.
     * @param buffer_shape The in-memory write buffer shape.
     * @param compression_method The compression method.
     * @param compression_options Options interpreted by the codec.
     * @param backend_settings Backend-specific settings. If absent, the
     * defaults for the catalog's backend.
     * @throw ShapeMismatchError if the shapes violate the chunking
     * invariants.
     * @throw UnknownCompressionMethodError if a method name does not resolve.
     */
    DatasetDescriptor(
      std::shared_ptr<const CompressionCatalog> catalog,
      DatasetInfo info,
      Shape chunk_shape,
      Shape buffer_shape,
      CompressionMethod compression_method = std::string(
        GENERIC_LOSSLESS_COMPRESSION),
      std::optional<nlohmann::json> compression_options = std::nullopt,
      std::optional<BackendDatasetSettings> backend_settings = std::nullopt);

    /**
     * @brief Construct a descriptor with estimated chunk and buffer shapes
     * and the generic lossless compression method.
     */
    static DatasetDescriptor from_defaults(
      std::shared_ptr<const CompressionCatalog> catalog,
      std::string_view object_id,
      std::string_view location,
      std::string_view dataset_name,
      const Shape& full_shape,
      const DataType& dtype,
      const EstimationTargets& targets = {},
      CompressionMethod compression_method = std::string(
        GENERIC_LOSSLESS_COMPRESSION));

    /**
     * @brief Parse a descriptor from its JSON view.
     * @see to_json()
     */
    static DatasetDescriptor from_json(
      const nlohmann::json& json,
      std::shared_ptr<const CompressionCatalog> catalog);

    /**
     * @brief Describe the fields of a descriptor for a backend as a JSON
     * schema.
     * @note Explicit codec instances have no JSON equivalent and are left
     * out.
     */
    static nlohmann::json json_schema(const CompressionCatalog& catalog);

    const std::string& object_id() const noexcept { return info_.object_id; }
    const std::string& location() const noexcept { return info_.location; }
    const std::string& dataset_name() const noexcept
    {
        return info_.dataset_name;
    }
    const DataType& dtype() const noexcept { return info_.dtype; }
    const Shape& full_shape() const noexcept { return info_.full_shape; }
    const DatasetInfo& info() const noexcept { return info_; }

    const Shape& chunk_shape() const noexcept { return chunk_shape_; }
    const Shape& buffer_shape() const noexcept { return buffer_shape_; }
    const CompressionMethod& compression_method() const noexcept
    {
        return compression_method_;
    }
    const std::optional<nlohmann::json>& compression_options() const noexcept
    {
        return compression_options_;
    }
    const BackendDatasetSettings& backend_settings() const noexcept
    {
        return backend_settings_;
    }

    DsioBackend backend() const noexcept;
    const std::shared_ptr<const CompressionCatalog>& catalog() const noexcept
    {
        return catalog_;
    }

    [[nodiscard]] DatasetDescriptor with_chunk_shape(Shape chunk_shape) const;
    [[nodiscard]] DatasetDescriptor with_buffer_shape(Shape buffer_shape) const;
    [[nodiscard]] DatasetDescriptor with_shapes(Shape chunk_shape,
                                                Shape buffer_shape) const;
    [[nodiscard]] DatasetDescriptor with_compression(
      CompressionMethod method,
      std::optional<nlohmann::json> options = std::nullopt) const;

    /**
     * @brief Set the filters applied before compression.
     * @throw InvalidFilterConfigurationError if this is not a Zarr
     * descriptor, or if @p options does not match @p methods one-to-one.
     */
    [[nodiscard]] DatasetDescriptor with_filters(
      std::vector<FilterMethod> methods,
      std::optional<std::vector<nlohmann::json>> options = std::nullopt) const;

    /** @brief Size of the full array, in bytes. */
    uint64_t full_size_bytes() const;

    /** @brief Memory held by one write buffer, in bytes. */
    uint64_t buffer_size_bytes() const;

    /** @brief Uncompressed size of one chunk, in bytes. */
    uint64_t chunk_size_bytes() const;

    /** @brief Build the backend's I/O keyword arguments for this dataset. */
    nlohmann::json io_arguments() const;

    /** @brief Render a human-readable block describing this dataset. */
    std::string render_summary() const;

    nlohmann::json to_json() const;

    bool operator==(const DatasetDescriptor& other) const;

  private:
    std::shared_ptr<const CompressionCatalog> catalog_;
    DatasetInfo info_;

    Shape chunk_shape_;
    Shape buffer_shape_;
    CompressionMethod compression_method_;
    std::optional<nlohmann::json> compression_options_;
    BackendDatasetSettings backend_settings_;

    void validate_() const;
    void validate_identity_() const;
    void validate_shapes_() const;
    void validate_compression_() const;
    void validate_filters_() const;
};
} // namespace dsio
