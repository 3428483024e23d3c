#include "object.graph.hh"
#include "errors.hh"
#include "macros.hh"

#include <algorithm>

dsio::ObjectGraph::ObjectGraph(std::string_view root_object_id,
                               std::string_view root_name)
{
    EXPECT_AS(InvalidSettingsError,
              !root_object_id.empty(),
              "Root object id must not be empty");

    nodes_.push_back({ .object_id = std::string(root_object_id),
                       .name = std::string(root_name) });
}

dsio::NodeIndex
dsio::ObjectGraph::add_node(NodeIndex parent,
                            std::string_view object_id,
                            std::string_view name)
{
    if (parent >= nodes_.size()) {
        throw std::out_of_range(LOG_ERROR("Node index ",
                                          parent,
                                          " is out of range for a graph of ",
                                          nodes_.size(),
                                          " nodes"));
    }

    EXPECT_AS(InvalidSettingsError,
              !object_id.empty() && !name.empty(),
              "Object id and name must not be empty");
    EXPECT_AS(InvalidSettingsError,
              name.find('/') == std::string_view::npos,
              "Node name '",
              name,
              "' must not contain '/'");
    EXPECT_AS(InvalidSettingsError,
              !find(object_id).has_value(),
              "Object id '",
              object_id,
              "' is already in the graph");

    const auto& siblings = nodes_[parent].children;
    EXPECT_AS(InvalidSettingsError,
              std::none_of(siblings.begin(),
                           siblings.end(),
                           [this, name](NodeIndex i) {
                               return nodes_[i].name == name;
                           }),
              "Node '",
              nodes_[parent].name,
              "' already has a child named '",
              name,
              "'");

    const NodeIndex index = nodes_.size();
    nodes_.push_back(
      { .object_id = std::string(object_id), .name = std::string(name) });
    nodes_[parent].children.push_back(index);

    return index;
}

void
dsio::ObjectGraph::set_field(NodeIndex node,
                             std::string_view name,
                             ArrayField field)
{
    if (node >= nodes_.size()) {
        throw std::out_of_range(LOG_ERROR("Node index ",
                                          node,
                                          " is out of range for a graph of ",
                                          nodes_.size(),
                                          " nodes"));
    }

    EXPECT_AS(InvalidSettingsError,
              !name.empty() && name.find('/') == std::string_view::npos,
              "Invalid field name '",
              name,
              "'");

    nodes_[node].fields.insert_or_assign(std::string(name), std::move(field));
}

const dsio::GraphNode&
dsio::ObjectGraph::node(NodeIndex index) const
{
    return nodes_.at(index);
}

void
dsio::ObjectGraph::set_append_backend(DsioBackend backend)
{
    EXPECT_AS(InvalidSettingsError,
              backend == DsioBackend_HDF5 || backend == DsioBackend_Zarr,
              "Invalid backend: ",
              backend);

    append_backend_ = backend;
}

std::optional<dsio::NodeIndex>
dsio::ObjectGraph::find(std::string_view object_id) const
{
    for (NodeIndex i = 0; i < nodes_.size(); ++i) {
        if (nodes_[i].object_id == object_id) {
            return i;
        }
    }

    return std::nullopt;
}
