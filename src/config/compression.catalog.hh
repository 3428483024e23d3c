#pragma once

#include "dataset.io.types.h"

#include <nlohmann/json.hpp>

#include <functional> // std::less
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dsio {
class DatasetDescriptor;

enum class CodecOrigin
{
    Native,
    Plugin,
};

/**
 * @brief A compression method or filter a backend can apply per chunk.
 */
struct Codec
{
    std::string name;
    DsioBackend backend;
    uint32_t filter_id{ 0 }; /**< HDF5 filter identifier; 0 for Zarr codecs */
    CodecOrigin origin{ CodecOrigin::Native };
    bool lossy{ false };
};

/**
 * @brief A set of codecs supplied by the embedding application, e.g., from a
 * filter plugin package loaded at startup.
 */
struct CodecProvider
{
    std::string name;
    DsioBackend backend;
    std::vector<Codec> codecs;
};

/**
 * @brief The compression methods selectable by name for one backend.
 * @details The catalog starts from the backend's native codecs and removes
 * those that the container layer already applies, that do not reduce data,
 * or that are lossy. Codecs from injected providers are merged in under their
 * own names, subject to the same exclusions. Lossy codecs can still be used by
 * passing an explicit codec instance to a descriptor.
 */
class CompressionCatalog
{
  public:
    explicit CompressionCatalog(DsioBackend backend,
                                std::vector<CodecProvider> providers = {});

    /**
     * @brief Get the shared catalog of native codecs for a backend.
     */
    static std::shared_ptr<const CompressionCatalog> native(
      DsioBackend backend);

    /** @brief Names of the backend's codecs, before exclusions. */
    static const std::vector<std::string>& native_names(DsioBackend backend);

    /** @brief Names the backend never resolves. */
    static const std::vector<std::string>& denied_names(DsioBackend backend);

    DsioBackend backend() const noexcept { return backend_; }

    /**
     * @brief Resolve a compression method name.
     * @details "generic-lossless" resolves to the backend's standard lossless
     * codec.
     * @param name The compression method name.
     * @return The codec.
     * @throw UnknownCompressionMethodError if @p name is not in the catalog.
     */
    const Codec& resolve(std::string_view name) const;

    /** @brief Check whether @p name resolves. */
    bool contains(std::string_view name) const;

    /** @brief The resolvable names, sorted. */
    std::vector<std::string> names() const;

    /**
     * @brief Build the keyword arguments the backend's writer expects for a
     * dataset.
     * @details HDF5: {chunks, compression, compression_opts}, plus
     * allow_plugin_filters for plugin or explicit filters. Zarr: {chunks,
     * compressor, filters}, with numcodecs-style codec configurations.
     * @param descriptor The dataset descriptor.
     * @return The keyword arguments.
     * @throw BackendCompressionMismatchError if @p descriptor targets another
     * backend.
     * @throw InvalidCompressionOptionsError if the compression options are not
     * valid for the codec.
     */
    nlohmann::json build_io_arguments(const DatasetDescriptor& descriptor) const;

  private:
    DsioBackend backend_;
    std::map<std::string, Codec, std::less<>> codecs_;

    void merge_provider_(const CodecProvider& provider);

    nlohmann::json make_hdf5_arguments_(
      const DatasetDescriptor& descriptor) const;
    nlohmann::json make_zarr_arguments_(
      const DatasetDescriptor& descriptor) const;
};
} // namespace dsio
