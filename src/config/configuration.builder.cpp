#include "configuration.builder.hh"
#include "dsio.common.hh"
#include "errors.hh"
#include "macros.hh"

#include <algorithm>
#include <functional>
#include <utility>

namespace {
bool
is_writable_field(const std::string& name)
{
    return name == "data" || name == "timestamps";
}

using FieldVisitor = std::function<void(const dsio::GraphNode&,
                                        const std::string&, // location
                                        const std::string&, // field name
                                        const dsio::ArrayField&)>;

// depth first, children in insertion order; the root contributes no segment
void
visit_fields(const dsio::ObjectGraph& graph, const FieldVisitor& visit)
{
    std::vector<std::pair<dsio::NodeIndex, std::string>> stack;
    stack.emplace_back(graph.root(), "");

    while (!stack.empty()) {
        auto [index, path] = std::move(stack.back());
        stack.pop_back();

        const auto& node = graph.node(index);
        for (const auto& [field_name, field] : node.fields) {
            if (!is_writable_field(field_name)) {
                continue;
            }

            const auto location =
              path.empty() ? field_name : path + "/" + field_name;
            visit(node, location, field_name, field);
        }

        for (auto it = node.children.rbegin(); it != node.children.rend();
             ++it) {
            const auto& child = graph.node(*it);
            stack.emplace_back(*it,
                               path.empty() ? child.name
                                            : path + "/" + child.name);
        }
    }
}

bool
has_zero_length_axis(const dsio::Shape& shape)
{
    return std::find(shape.begin(), shape.end(), 0) != shape.end();
}
} // namespace

void
dsio::BuilderSettings::validate() const
{
    EXPECT_AS(InvalidSettingsError,
              chunk_target_bytes > 0,
              "Chunk target must be positive");
    EXPECT_AS(InvalidSettingsError,
              buffer_target_bytes > 0,
              "Buffer target must be positive");
    EXPECT_AS(InvalidSettingsError,
              buffer_target_bytes >= chunk_target_bytes,
              "Buffer target (",
              human_readable_bytes(buffer_target_bytes),
              ") must be at least the chunk target (",
              human_readable_bytes(chunk_target_bytes),
              ")");
}

dsio::ConfigurationBuilder::ConfigurationBuilder(
  std::shared_ptr<const CompressionCatalog> catalog,
  BuilderSettings settings)
  : catalog_(std::move(catalog))
  , settings_(std::move(settings))
{
    CHECK(catalog_);
    settings_.validate();

    if (const auto* name =
          std::get_if<std::string>(&settings_.compression_method);
        name && *name != NO_COMPRESSION) {
        catalog_->resolve(*name);
    }
}

std::vector<dsio::DatasetDescriptor>
dsio::ConfigurationBuilder::build(const ObjectGraph& graph) const
{
    std::vector<DatasetDescriptor> descriptors;

    visit_fields(graph,
                 [this, &descriptors](const GraphNode& node,
                                      const std::string& location,
                                      const std::string& field_name,
                                      const ArrayField& field) {
                     auto descriptor =
                       make_descriptor_(node, location, field_name, field);
                     if (descriptor) {
                         descriptors.push_back(std::move(*descriptor));
                     }
                 });

    LOG_DEBUG("Found ",
              descriptors.size(),
              " configurable datasets for the ",
              backend_to_string(catalog_->backend()),
              " backend");

    return descriptors;
}

std::unordered_map<std::string, std::string>
dsio::ConfigurationBuilder::map_locations(const ObjectGraph& graph)
{
    std::unordered_map<std::string, std::string> locations;

    visit_fields(graph,
                 [&locations](const GraphNode& node,
                              const std::string& location,
                              const std::string&,
                              const ArrayField&) {
                     locations.emplace(location, node.object_id);
                 });

    return locations;
}

std::optional<dsio::DatasetDescriptor>
dsio::ConfigurationBuilder::make_descriptor_(const GraphNode& node,
                                             const std::string& location,
                                             const std::string& field_name,
                                             const ArrayField& field) const
{
    const EstimationTargets targets{
        .chunk_target_bytes = settings_.chunk_target_bytes,
        .buffer_target_bytes = settings_.buffer_target_bytes,
    };

    auto from_array =
      [&](const Shape& shape,
          const DataType& dtype) -> std::optional<DatasetDescriptor> {
        if (has_zero_length_axis(shape)) {
            LOG_DEBUG("Skipping empty dataset at location '", location, "'");
            return std::nullopt;
        }

        return DatasetDescriptor::from_defaults(catalog_,
                                                node.object_id,
                                                location,
                                                field_name,
                                                shape,
                                                dtype,
                                                targets,
                                                settings_.compression_method);
    };

    if (const auto* array = std::get_if<MaterializedArray>(&field)) {
        return from_array(array->shape, array->dtype);
    }

    if (const auto* source = std::get_if<ChunkedArraySource>(&field)) {
        if (has_zero_length_axis(source->full_shape)) {
            LOG_DEBUG("Skipping empty dataset at location '", location, "'");
            return std::nullopt;
        }

        DatasetInfo info{
            .object_id = node.object_id,
            .location = location,
            .dataset_name = field_name,
            .dtype = source->dtype,
            .full_shape = source->full_shape,
        };

        return DatasetDescriptor(catalog_,
                                 std::move(info),
                                 source->chunk_shape,
                                 source->buffer_shape,
                                 settings_.compression_method);
    }

    if (const auto* objects = std::get_if<ObjectArray>(&field)) {
        size_t width = 1;
        for (const auto& element : objects->elements) {
            EXPECT_AS(UnsupportedDtypeError,
                      element.is_string(),
                      "Object array at location '",
                      location,
                      "' holds an element that is not text: ",
                      element.dump(),
                      ". Only text elements are supported");
            width = std::max(width, element.get<std::string>().size());
        }

        return from_array({ objects->elements.size() },
                          DataType::string_of_width(width));
    }

    if (const auto* stored = std::get_if<StoredDataset>(&field)) {
        if (stored->backend != catalog_->backend()) {
            return from_array(stored->shape, stored->dtype);
        }

        if (settings_.mode == BuildMode::Existing &&
            !has_zero_length_axis(stored->shape)) {
            return adopt_stored_(node, location, field_name, *stored);
        }

        LOG_DEBUG("Skipping dataset at location '",
                  location,
                  "', already written by this backend");
        return std::nullopt;
    }

    // links, references and datasets that carry their own I/O settings
    return std::nullopt;
}

dsio::DatasetDescriptor
dsio::ConfigurationBuilder::adopt_stored_(const GraphNode& node,
                                          const std::string& location,
                                          const std::string& field_name,
                                          const StoredDataset& stored) const
{
    DatasetInfo info{
        .object_id = node.object_id,
        .location = location,
        .dataset_name = field_name,
        .dtype = stored.dtype,
        .full_shape = stored.shape,
    };

    // a contiguous dataset is one chunk; the buffer always spans the array
    const Shape chunk_shape = stored.chunk_shape.value_or(stored.shape);

    CompressionMethod method;
    std::optional<nlohmann::json> options;
    if (stored.compression.has_value()) {
        method = make_compression_method(*stored.compression);
        options = stored.compression_options;
    }

    LOG_DEBUG("Adopting stored layout of dataset at location '",
              location,
              "': chunks ",
              shape_to_string(chunk_shape),
              ", compression ",
              compression_method_name(method));

    return DatasetDescriptor(catalog_,
                             std::move(info),
                             chunk_shape,
                             stored.shape,
                             std::move(method),
                             std::move(options));
}
