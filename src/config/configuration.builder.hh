#pragma once

#include "compression.catalog.hh"
#include "dataset.descriptor.hh"
#include "object.graph.hh"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace dsio {
enum class BuildMode
{
    Default,  // estimate every dataset; skip those already in the file
    Existing, // adopt the stored layout of datasets already in the file
};

struct BuilderSettings
{
    uint64_t chunk_target_bytes{ DEFAULT_CHUNK_TARGET_BYTES };
    uint64_t buffer_target_bytes{ DEFAULT_BUFFER_TARGET_BYTES };
    CompressionMethod compression_method{ std::string(
      GENERIC_LOSSLESS_COMPRESSION) };
    BuildMode mode{ BuildMode::Default };

    /**
     * @brief Check that the targets are nonzero and that the buffer target is
     * at least the chunk target.
     * @throw InvalidSettingsError if not.
     */
    void validate() const;
};

/**
 * @brief Walks an object graph and produces one default descriptor for each
 * writable array field.
 */
class ConfigurationBuilder
{
  public:
    explicit ConfigurationBuilder(
      std::shared_ptr<const CompressionCatalog> catalog,
      BuilderSettings settings = {});

    /**
     * @brief Build default descriptors for every writable "data" and
     * "timestamps" field in @p graph, in traversal order.
     * @details Nodes are visited depth first, children in insertion order.
     * @throw UnsupportedDtypeError if an object array holds non-text
     * elements.
     */
    std::vector<DatasetDescriptor> build(const ObjectGraph& graph) const;

    /**
     * @brief Map the location of every array field in @p graph to the id of
     * the node that holds it.
     */
    static std::unordered_map<std::string, std::string> map_locations(
      const ObjectGraph& graph);

  private:
    std::shared_ptr<const CompressionCatalog> catalog_;
    BuilderSettings settings_;

    std::optional<DatasetDescriptor> make_descriptor_(
      const GraphNode& node,
      const std::string& location,
      const std::string& field_name,
      const ArrayField& field) const;

    DatasetDescriptor adopt_stored_(const GraphNode& node,
                                    const std::string& location,
                                    const std::string& field_name,
                                    const StoredDataset& stored) const;
};
} // namespace dsio
