#include "backend.configuration.hh"
#include "errors.hh"
#include "macros.hh"

#include <algorithm>
#include <sstream>

namespace {
uint32_t
default_number_of_jobs(uint32_t available_cpus)
{
    return std::max(available_cpus, 2u) - 1;
}

std::vector<std::string>
method_names(const dsio::DatasetDescriptor& descriptor)
{
    std::vector<std::string> names;
    if (const auto* name =
          std::get_if<std::string>(&descriptor.compression_method())) {
        names.push_back(*name);
    }

    if (const auto* zarr = std::get_if<dsio::ZarrDatasetSettings>(
          &descriptor.backend_settings())) {
        for (const auto& filter : zarr->filter_methods) {
            if (const auto* name = std::get_if<std::string>(&filter)) {
                names.push_back(*name);
            }
        }
    }

    return names;
}
} // namespace

dsio::BackendConfiguration::BackendConfiguration(
  std::shared_ptr<const CompressionCatalog> catalog,
  uint32_t available_cpus)
  : catalog_(std::move(catalog))
  , available_cpus_(std::max(available_cpus, 1u))
  , options_(HDF5BackendOptions{})
{
    CHECK(catalog_);

    if (catalog_->backend() == DsioBackend_Zarr) {
        options_ = ZarrBackendOptions{
            .number_of_jobs =
              static_cast<int>(default_number_of_jobs(available_cpus_)),
        };
    }
}

dsio::BackendConfiguration
dsio::BackendConfiguration::from_object_graph(const ObjectGraph& graph,
                                              DsioBackend backend,
                                              const BuilderSettings& settings)
{
    return from_object_graph(graph, CompressionCatalog::native(backend), settings);
}

dsio::BackendConfiguration
dsio::BackendConfiguration::from_object_graph(
  const ObjectGraph& graph,
  std::shared_ptr<const CompressionCatalog> catalog,
  const BuilderSettings& settings)
{
    CHECK(catalog);
    if (const auto appending = graph.append_backend()) {
        EXPECT_AS(BackendMismatchError,
                  *appending == catalog->backend(),
                  "Object '",
                  graph.node(graph.root()).object_id,
                  "' is being appended to a ",
                  backend_to_string(*appending),
                  " file, but the ",
                  backend_to_string(catalog->backend()),
                  " backend was requested");
    }

    ConfigurationBuilder builder(catalog, settings);
    auto descriptors = builder.build(graph);

    EXPECT_AS(NoWritableDatasetsError,
              !descriptors.empty(),
              "No datasets to configure were found in object '",
              graph.node(graph.root()).object_id,
              "'");

    BackendConfiguration configuration(std::move(catalog));
    for (auto& descriptor : descriptors) {
        const auto location = descriptor.location();
        configuration.set(location, std::move(descriptor));
    }

    return configuration;
}

dsio::BackendConfiguration
dsio::BackendConfiguration::from_object_graph(const ObjectGraph& graph,
                                              const BuilderSettings& settings)
{
    const auto appending = graph.append_backend();
    EXPECT_AS(InvalidSettingsError,
              appending.has_value(),
              "A backend must be given for object '",
              graph.node(graph.root()).object_id,
              "', which was not read from a file opened for appending");

    LOG_DEBUG("Detected the ",
              backend_to_string(*appending),
              " backend of the file being appended to");

    return from_object_graph(graph, *appending, settings);
}

nlohmann::json
dsio::BackendConfiguration::json_schema(const CompressionCatalog& catalog)
{
    nlohmann::json properties = {
        { "backend", { { "const", backend_to_string(catalog.backend()) } } },
        { "datasets",
          {
            { "type", "array" },
            { "items", DatasetDescriptor::json_schema(catalog) },
          } },
    };

    std::string title = "HDF5BackendConfiguration";
    if (catalog.backend() == DsioBackend_Zarr) {
        title = "ZarrBackendConfiguration";
        properties["number_of_jobs"] = { { "type", "integer" },
                                         { "not", { { "const", 0 } } } };
    }

    return {
        { "title", title },
        { "type", "object" },
        { "properties", properties },
        { "required", nlohmann::json::array({ "backend", "datasets" }) },
    };
}

const dsio::DatasetDescriptor&
dsio::BackendConfiguration::get(std::string_view location) const
{
    auto it = index_.find(std::string(location));
    EXPECT_FOUND(LocationNotFoundError,
                 it != index_.end(),
                 locations(),
                 "No dataset is configured at location '",
                 location,
                 "'. Configured locations: ",
                 join(locations()));

    return descriptors_[it->second];
}

void
dsio::BackendConfiguration::set(std::string_view location,
                                DatasetDescriptor descriptor)
{
    EXPECT_AS(LocationMismatchError,
              descriptor.location() == location,
              "Descriptor for location '",
              descriptor.location(),
              "' cannot be stored at location '",
              location,
              "'");

    EXPECT_AS(BackendCompressionMismatchError,
              descriptor.backend() == backend(),
              "Descriptor for location '",
              location,
              "' was built for the ",
              backend_to_string(descriptor.backend()),
              " backend, but this configuration uses the ",
              backend_to_string(backend()),
              " backend");

    if (descriptor.catalog() != catalog_) {
        for (const auto& name : method_names(descriptor)) {
            EXPECT_AS(BackendCompressionMismatchError,
                      catalog_->contains(name),
                      "Compression method '",
                      name,
                      "' of the descriptor for location '",
                      location,
                      "' is not available to this configuration");
        }

        // rebind to this configuration's catalog
        descriptor = DatasetDescriptor(catalog_,
                                       descriptor.info(),
                                       descriptor.chunk_shape(),
                                       descriptor.buffer_shape(),
                                       descriptor.compression_method(),
                                       descriptor.compression_options(),
                                       descriptor.backend_settings());
    }

    if (auto it = index_.find(descriptor.location()); it != index_.end()) {
        descriptors_[it->second] = std::move(descriptor);
        return;
    }

    // the index must never point past the end of descriptors_
    std::string key = descriptor.location();
    descriptors_.push_back(std::move(descriptor));
    try {
        index_.emplace(std::move(key), descriptors_.size() - 1);
    } catch (const std::exception&) {
        descriptors_.pop_back();
        throw;
    }
}

bool
dsio::BackendConfiguration::contains(std::string_view location) const
{
    return index_.contains(std::string(location));
}

std::vector<std::string>
dsio::BackendConfiguration::locations() const
{
    std::vector<std::string> result;
    result.reserve(descriptors_.size());
    for (const auto& descriptor : descriptors_) {
        result.push_back(descriptor.location());
    }

    return result;
}

int
dsio::BackendConfiguration::number_of_jobs() const
{
    const auto* zarr = std::get_if<ZarrBackendOptions>(&options_);
    if (!zarr) {
        throw std::logic_error(
          LOG_ERROR("The ",
                    backend_to_string(backend()),
                    " backend has no number of jobs"));
    }

    return zarr->number_of_jobs;
}

void
dsio::BackendConfiguration::set_number_of_jobs(int n)
{
    auto* zarr = std::get_if<ZarrBackendOptions>(&options_);
    EXPECT_AS(InvalidJobCountError,
              zarr != nullptr,
              "The ",
              backend_to_string(backend()),
              " backend has no number of jobs");

    const int64_t cpus = available_cpus_;
    EXPECT_AS(InvalidJobCountError,
              n != 0 && n >= -cpus && n <= cpus,
              "Invalid number of jobs ",
              n,
              ". Must be nonzero and between -",
              cpus,
              " and ",
              cpus);

    zarr->number_of_jobs = n;
}

uint32_t
dsio::BackendConfiguration::resolved_number_of_jobs() const
{
    const auto n = number_of_jobs();
    if (n > 0) {
        return static_cast<uint32_t>(n);
    }

    return static_cast<uint32_t>(static_cast<int64_t>(available_cpus_) + 1 + n);
}

std::string
dsio::BackendConfiguration::render_summary() const noexcept
{
    try {
        const std::string header =
          std::string("Configurable datasets identified using the ") +
          backend_to_string(backend()) + " backend";

        std::ostringstream ss;
        ss << header << "\n" << std::string(header.size(), '-') << "\n";
        for (const auto& descriptor : descriptors_) {
            ss << descriptor.render_summary();
        }

        return ss.str();
    } catch (const std::exception& exc) {
        LOG_ERROR("Failed to render configuration summary: ", exc.what());
    }

    return {};
}

nlohmann::json
dsio::BackendConfiguration::to_json() const
{
    auto datasets = nlohmann::json::array();
    for (const auto& descriptor : descriptors_) {
        datasets.push_back(descriptor.to_json());
    }

    nlohmann::json j = {
        { "backend", backend_to_string(backend()) },
        { "datasets", datasets },
    };
    if (const auto* zarr = std::get_if<ZarrBackendOptions>(&options_)) {
        j["number_of_jobs"] = zarr->number_of_jobs;
    }

    return j;
}

void
dsio::BackendConfiguration::apply_global_compression(
  CompressionMethod method,
  std::optional<nlohmann::json> options)
{
    std::vector<DatasetDescriptor> recompressed;
    recompressed.reserve(descriptors_.size());
    for (const auto& descriptor : descriptors_) {
        recompressed.push_back(descriptor.with_compression(method, options));
    }

    descriptors_ = std::move(recompressed);

    LOG_DEBUG("Compression of ",
              descriptors_.size(),
              " datasets set to ",
              compression_method_name(method));
}

void
dsio::BackendConfiguration::rebind_object_ids(const ObjectGraph& graph)
{
    const auto graph_locations = ConfigurationBuilder::map_locations(graph);

    std::vector<std::string> known;
    known.reserve(graph_locations.size());
    for (const auto& [location, object_id] : graph_locations) {
        known.push_back(location);
    }

    std::vector<DatasetDescriptor> rebound;
    rebound.reserve(descriptors_.size());
    for (const auto& descriptor : descriptors_) {
        auto it = graph_locations.find(descriptor.location());
        EXPECT_FOUND(LocationNotFoundError,
                     it != graph_locations.end(),
                     known,
                     "Location '",
                     descriptor.location(),
                     "' was not found in object '",
                     graph.node(graph.root()).object_id,
                     "'");

        auto info = descriptor.info();
        info.object_id = it->second;
        rebound.emplace_back(catalog_,
                             std::move(info),
                             descriptor.chunk_shape(),
                             descriptor.buffer_shape(),
                             descriptor.compression_method(),
                             descriptor.compression_options(),
                             descriptor.backend_settings());
    }

    descriptors_ = std::move(rebound);
}
