#include "writer.handle.hh"
#include "errors.hh"
#include "macros.hh"

dsio::WriterHandle
dsio::WriterHandle::from_object_graph(const ObjectGraph& graph)
{
    WriterHandle handle;
    for (NodeIndex i = 0; i < graph.size(); ++i) {
        const auto& node = graph.node(i);
        for (const auto& [name, field] : node.fields) {
            if (name != "data" && name != "timestamps") {
                continue;
            }

            handle.add_target(node.object_id,
                              name,
                              std::holds_alternative<DatasetLink>(field));
        }
    }

    return handle;
}

dsio::WriterTarget&
dsio::WriterHandle::add_target(std::string_view object_id,
                               std::string_view dataset_name,
                               bool is_link)
{
    Key key{ std::string(object_id), std::string(dataset_name) };
    EXPECT_AS(InvalidSettingsError,
              !targets_.contains(key),
              "Target '",
              object_id,
              "/",
              dataset_name,
              "' already exists");

    auto it = targets_.emplace(key,
                               WriterTarget{
                                 .object_id = key.first,
                                 .dataset_name = key.second,
                                 .is_link = is_link,
                               })
                .first;

    return it->second;
}

dsio::WriterTarget*
dsio::WriterHandle::find_target(std::string_view object_id,
                                std::string_view dataset_name)
{
    auto it = targets_.find({ std::string(object_id), std::string(dataset_name) });
    return it == targets_.end() ? nullptr : &it->second;
}

const dsio::WriterTarget*
dsio::WriterHandle::find_target(std::string_view object_id,
                                std::string_view dataset_name) const
{
    auto it = targets_.find({ std::string(object_id), std::string(dataset_name) });
    return it == targets_.end() ? nullptr : &it->second;
}

std::vector<std::string>
dsio::WriterHandle::target_keys() const
{
    std::vector<std::string> keys;
    keys.reserve(targets_.size());
    for (const auto& [key, target] : targets_) {
        keys.push_back(key.first + "/" + key.second);
    }

    return keys;
}
