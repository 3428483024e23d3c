#pragma once

#include "data.type.hh"
#include "dataset.io.types.h"
#include "definitions.hh"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dsio {
/** @brief An array held in memory. */
struct MaterializedArray
{
    Shape shape;
    DataType dtype;
};

/**
 * @brief A lazy source that iterates over chunks of a larger array and
 * carries its own chunk and buffer shape hints.
 */
struct ChunkedArraySource
{
    Shape full_shape;
    DataType dtype;
    Shape chunk_shape;
    Shape buffer_shape;
};

/** @brief A one-dimensional array of heterogeneous elements. */
struct ObjectArray
{
    std::vector<nlohmann::json> elements;
};

/** @brief A dataset that lives on another node. */
struct DatasetLink
{
    std::string target_object_id;
};

/** @brief An array of references to other nodes. */
struct ReferenceArray
{
    std::vector<std::string> object_ids;
};

/**
 * @brief A dataset already written to a file being appended to, with the
 * layout it was stored with.
 */
struct StoredDataset
{
    Shape shape;
    DataType dtype;
    DsioBackend backend;
    std::optional<Shape> chunk_shape; /**< nullopt for contiguous storage */
    std::optional<std::string> compression; /**< nullopt if uncompressed */
    std::optional<nlohmann::json> compression_options;
};

/** @brief An array already wrapped with its own I/O settings. */
struct ConfiguredDataset
{
    Shape shape;
    DataType dtype;
};

using ArrayField = std::variant<MaterializedArray,
                                ChunkedArraySource,
                                ObjectArray,
                                DatasetLink,
                                ReferenceArray,
                                StoredDataset,
                                ConfiguredDataset>;

using NodeIndex = size_t;

struct GraphNode
{
    std::string object_id;
    std::string name;
    std::map<std::string, ArrayField> fields;
    std::vector<NodeIndex> children; // in insertion order
};

/**
 * @brief A tree of named data objects, stored in an arena.
 * @details Nodes refer to their children by index and hold no reference to
 * their parent. Object ids are unique across the graph, and child names are
 * unique under each parent.
 */
class ObjectGraph
{
  public:
    explicit ObjectGraph(std::string_view root_object_id,
                         std::string_view root_name = "root");

    NodeIndex root() const noexcept { return 0; }

    /**
     * @brief Add a child node.
     * @return The index of the new node.
     * @throw std::out_of_range if @p parent is not a node in this graph.
     * @throw InvalidSettingsError if @p object_id is already used, or if
     * @p parent already has a child named @p name.
     */
    NodeIndex add_node(NodeIndex parent,
                       std::string_view object_id,
                       std::string_view name);

    /**
     * @brief Set (or replace) an array field on a node.
     * @throw std::out_of_range if @p node is not a node in this graph.
     */
    void set_field(NodeIndex node, std::string_view name, ArrayField field);

    const GraphNode& node(NodeIndex index) const;
    size_t size() const noexcept { return nodes_.size(); }

    std::optional<NodeIndex> find(std::string_view object_id) const;

    /**
     * @brief Record that this graph was read from a file opened for
     * appending, written with @p backend.
     */
    void set_append_backend(DsioBackend backend);

    /** @brief The backend of the file being appended to, if any. */
    std::optional<DsioBackend> append_backend() const noexcept
    {
        return append_backend_;
    }

  private:
    std::vector<GraphNode> nodes_;
    std::optional<DsioBackend> append_backend_;
};
} // namespace dsio
