#pragma once

#include "compression.catalog.hh"
#include "configuration.builder.hh"
#include "dataset.descriptor.hh"
#include "dsio.common.hh"
#include "object.graph.hh"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace dsio {
struct HDF5BackendOptions
{
};

struct ZarrBackendOptions
{
    int number_of_jobs{ 1 };
};

using BackendOptions = std::variant<HDF5BackendOptions, ZarrBackendOptions>;

/**
 * @brief The dataset descriptors to apply to one file, keyed by location,
 * plus options for the backend's writer.
 */
class BackendConfiguration
{
  public:
    using const_iterator = std::vector<DatasetDescriptor>::const_iterator;

    explicit BackendConfiguration(
      std::shared_ptr<const CompressionCatalog> catalog,
      uint32_t available_cpus = available_cpu_count());

    /**
     * @brief Build a configuration with default descriptors for every
     * writable dataset in @p graph.
     * @throw NoWritableDatasetsError if the graph has none.
     * @throw BackendMismatchError if @p graph was read for appending from a
     * file of another backend.
     */
    static BackendConfiguration from_object_graph(
      const ObjectGraph& graph,
      DsioBackend backend,
      const BuilderSettings& settings = {});
    static BackendConfiguration from_object_graph(
      const ObjectGraph& graph,
      std::shared_ptr<const CompressionCatalog> catalog,
      const BuilderSettings& settings = {});

    /**
     * @brief Build a configuration for a graph read from a file opened for
     * appending, with that file's backend.
     * @throw InvalidSettingsError if @p graph was not read for appending.
     */
    static BackendConfiguration from_object_graph(
      const ObjectGraph& graph,
      const BuilderSettings& settings = {});

    /** @brief JSON schema of a configuration for @p catalog's backend. */
    static nlohmann::json json_schema(const CompressionCatalog& catalog);

    DsioBackend backend() const noexcept { return catalog_->backend(); }
    const std::shared_ptr<const CompressionCatalog>& catalog() const noexcept
    {
        return catalog_;
    }

    /**
     * @throw LocationNotFoundError if no dataset is configured at
     * @p location.
     */
    const DatasetDescriptor& get(std::string_view location) const;

    /**
     * @brief Insert a descriptor, or replace the one at @p location.
     * @throw LocationMismatchError if the descriptor's location is not
     * @p location.
     * @throw BackendCompressionMismatchError if the descriptor was built for
     * another backend, or uses codecs this configuration's catalog does not
     * resolve.
     */
    void set(std::string_view location, DatasetDescriptor descriptor);

    bool contains(std::string_view location) const;
    std::vector<std::string> locations() const;
    size_t size() const noexcept { return descriptors_.size(); }

    const_iterator begin() const noexcept { return descriptors_.begin(); }
    const_iterator end() const noexcept { return descriptors_.end(); }

    const BackendOptions& options() const noexcept { return options_; }

    /**
     * @brief Get the number of jobs the Zarr writer should use.
     * @throw std::logic_error if this is not a Zarr configuration.
     */
    int number_of_jobs() const;

    /**
     * @brief Set the number of jobs the Zarr writer should use.
     * @details Negative values count back from all CPUs: -1 uses all of them,
     * -2 all but one.
     * @throw InvalidJobCountError if @p n is 0 or its magnitude exceeds the
     * available CPUs, or if this is not a Zarr configuration.
     */
    void set_number_of_jobs(int n);

    /** @brief The number of jobs as a positive worker count. */
    uint32_t resolved_number_of_jobs() const;

    uint32_t available_cpus() const noexcept { return available_cpus_; }

    /** @brief Render a report of every dataset. Never throws. */
    std::string render_summary() const noexcept;

    nlohmann::json to_json() const;

    /**
     * @brief Use the same compression for every dataset.
     * @details Either every descriptor is replaced or none is.
     * @throw UnknownCompressionMethodError if @p method does not resolve.
     * @throw InvalidCompressionOptionsError if @p options are not valid for
     * @p method.
     */
    void apply_global_compression(
      CompressionMethod method,
      std::optional<nlohmann::json> options = std::nullopt);

    /**
     * @brief Replace the object id of each descriptor with the id of the node
     * holding the same location in @p graph.
     * @throw LocationNotFoundError if a location is not in @p graph.
     */
    void rebind_object_ids(const ObjectGraph& graph);

  private:
    std::shared_ptr<const CompressionCatalog> catalog_;
    uint32_t available_cpus_;
    BackendOptions options_;

    std::vector<DatasetDescriptor> descriptors_;
    std::unordered_map<std::string, size_t> index_;
};
} // namespace dsio
