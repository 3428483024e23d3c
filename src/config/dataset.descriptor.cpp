#include "dataset.descriptor.hh"
#include "dsio.common.hh"
#include "errors.hh"
#include "macros.hh"

#include <algorithm>
#include <sstream>

namespace {
constexpr const char* dataset_names[] = { "data", "timestamps" };

bool
is_known_dataset_name(std::string_view name)
{
    return std::any_of(std::begin(dataset_names),
                       std::end(dataset_names),
                       [name](const char* known) { return name == known; });
}

dsio::CompressionMethod
normalize(dsio::CompressionMethod method)
{
    if (const auto* name = std::get_if<std::string>(&method);
        name && *name == dsio::NO_COMPRESSION) {
        return std::monostate{};
    }

    return method;
}

dsio::BackendDatasetSettings
default_backend_settings(DsioBackend backend)
{
    if (backend == DsioBackend_Zarr) {
        return dsio::ZarrDatasetSettings{};
    }

    return dsio::HDF5DatasetSettings{};
}

nlohmann::json
codec_instance_to_json(const dsio::CodecInstance& instance)
{
    nlohmann::json j = {
        { "id", instance.id },
        { "configuration", instance.configuration },
    };
    if (instance.filter_id != 0) {
        j["filter_id"] = instance.filter_id;
    }

    return j;
}

dsio::CodecInstance
codec_instance_from_json(const nlohmann::json& j, DsioBackend backend)
{
    dsio::CodecInstance instance{ .backend = backend,
                                  .id = j.at("id").get<std::string>() };
    if (j.contains("filter_id")) {
        instance.filter_id = j["filter_id"].get<uint32_t>();
    }
    if (j.contains("configuration")) {
        instance.configuration = j["configuration"];
    }

    return instance;
}

nlohmann::json
filter_method_to_json(const dsio::FilterMethod& method)
{
    if (const auto* name = std::get_if<std::string>(&method)) {
        return *name;
    }

    return codec_instance_to_json(std::get<dsio::CodecInstance>(method));
}

std::string
filter_method_name(const dsio::FilterMethod& method)
{
    if (const auto* name = std::get_if<std::string>(&method)) {
        return *name;
    }

    return std::get<dsio::CodecInstance>(method).id;
}

nlohmann::json
shape_schema()
{
    return {
        { "type", "array" },
        { "items", { { "type", "integer" }, { "minimum", 1 } } },
    };
}
} // namespace

std::string
dsio::compression_method_name(const CompressionMethod& method)
{
    if (std::holds_alternative<std::monostate>(method)) {
        return NO_COMPRESSION;
    }

    if (const auto* name = std::get_if<std::string>(&method)) {
        return *name;
    }

    return std::get<CodecInstance>(method).id;
}

dsio::CompressionMethod
dsio::make_compression_method(std::string_view name)
{
    return normalize(std::string(name));
}

dsio::DatasetDescriptor::DatasetDescriptor(
  std::shared_ptr<const CompressionCatalog> catalog,
  DatasetInfo info,
  Shape chunk_shape,
  Shape buffer_shape,
  CompressionMethod compression_method,
  std::optional<nlohmann::json> compression_options,
  std::optional<BackendDatasetSettings> backend_settings)
  : catalog_(std::move(catalog))
  , info_(std::move(info))
  , chunk_shape_(std::move(chunk_shape))
  , buffer_shape_(std::move(buffer_shape))
  , compression_method_(normalize(std::move(compression_method)))
  , compression_options_(std::move(compression_options))
  , backend_settings_(HDF5DatasetSettings{})
{
    CHECK(catalog_); // required

    backend_settings_ = backend_settings.has_value()
                          ? std::move(*backend_settings)
                          : default_backend_settings(catalog_->backend());

    validate_();
}

dsio::DatasetDescriptor
dsio::DatasetDescriptor::from_defaults(
  std::shared_ptr<const CompressionCatalog> catalog,
  std::string_view object_id,
  std::string_view location,
  std::string_view dataset_name,
  const Shape& full_shape,
  const DataType& dtype,
  const EstimationTargets& targets,
  CompressionMethod compression_method)
{
    EXPECT_AS(UnsupportedDtypeError,
              !dtype.is_object(),
              "Cannot configure dataset at location '",
              location,
              "': object arrays must be resolved to a concrete type");

    auto estimate =
      estimate_default_shapes(full_shape, dtype.itemsize(), targets);

    DatasetInfo info{
        .object_id = std::string(object_id),
        .location = std::string(location),
        .dataset_name = std::string(dataset_name),
        .dtype = dtype,
        .full_shape = full_shape,
    };

    return { std::move(catalog),
             std::move(info),
             std::move(estimate.chunk_shape),
             std::move(estimate.buffer_shape),
             std::move(compression_method) };
}

dsio::DatasetDescriptor
dsio::DatasetDescriptor::from_json(
  const nlohmann::json& json,
  std::shared_ptr<const CompressionCatalog> catalog)
{
    CHECK(catalog);
    const auto backend = catalog->backend();

    try {
        DatasetInfo info{
            .object_id = json.at("object_id").get<std::string>(),
            .location = json.at("location").get<std::string>(),
            .dataset_name = json.at("dataset_name").get<std::string>(),
            .dtype =
              DataType::from_name(json.at("dtype").get<std::string>()),
            .full_shape = json.at("full_shape").get<Shape>(),
        };

        CompressionMethod method = std::string(GENERIC_LOSSLESS_COMPRESSION);
        if (json.contains("compression_method")) {
            const auto& m = json["compression_method"];
            if (m.is_null()) {
                method = std::monostate{};
            } else if (m.is_object()) {
                method = codec_instance_from_json(m, backend);
            } else {
                method = make_compression_method(m.get<std::string>());
            }
        }

        std::optional<nlohmann::json> options;
        if (json.contains("compression_options") &&
            !json["compression_options"].is_null()) {
            options = json["compression_options"];
        }

        std::optional<BackendDatasetSettings> settings;
        if (backend == DsioBackend_Zarr) {
            ZarrDatasetSettings zarr_settings;
            if (json.contains("filter_methods") &&
                !json["filter_methods"].is_null()) {
                for (const auto& f : json["filter_methods"]) {
                    if (f.is_object()) {
                        zarr_settings.filter_methods.emplace_back(
                          codec_instance_from_json(f, backend));
                    } else {
                        zarr_settings.filter_methods.emplace_back(
                          f.get<std::string>());
                    }
                }
            }
            if (json.contains("filter_options") &&
                !json["filter_options"].is_null()) {
                zarr_settings.filter_options =
                  json["filter_options"].get<std::vector<nlohmann::json>>();
            }
            settings = std::move(zarr_settings);
        }

        return { std::move(catalog),
                 std::move(info),
                 json.at("chunk_shape").get<Shape>(),
                 json.at("buffer_shape").get<Shape>(),
                 std::move(method),
                 std::move(options),
                 std::move(settings) };
    } catch (const nlohmann::json::exception& exc) {
        const std::string err =
          LOG_ERROR("Malformed dataset descriptor: ", exc.what());
        throw InvalidSettingsError(err);
    }
}

nlohmann::json
dsio::DatasetDescriptor::json_schema(const CompressionCatalog& catalog)
{
    auto method_names = catalog.names();
    method_names.emplace_back(GENERIC_LOSSLESS_COMPRESSION);

    nlohmann::json properties = {
        { "object_id", { { "type", "string" } } },
        { "location", { { "type", "string" } } },
        { "dataset_name",
          { { "enum", nlohmann::json::array({ "data", "timestamps" }) } } },
        { "dtype", { { "type", "string" } } },
        { "full_shape", shape_schema() },
        { "chunk_shape", shape_schema() },
        { "buffer_shape", shape_schema() },
        { "compression_method",
          {
            { "anyOf",
              { { { "enum", method_names } }, { { "type", "null" } } } },
            { "default", GENERIC_LOSSLESS_COMPRESSION },
          } },
        { "compression_options",
          { { "anyOf",
              { { { "type", "object" } }, { { "type", "null" } } } } } },
    };

    std::string title = "HDF5DatasetIOConfiguration";
    if (catalog.backend() == DsioBackend_HDF5) {
        properties["compression_options"]["anyOf"].push_back(
          nlohmann::json{ { "type", "array" } });
    } else {
        title = "ZarrDatasetIOConfiguration";
        properties["filter_methods"] = {
            { "anyOf",
              { { { "type", "array" },
                  { "items", { { "enum", catalog.names() } } } },
                { { "type", "null" } } } },
        };
        properties["filter_options"] = {
            { "anyOf",
              { { { "type", "array" },
                  { "items", { { "type", "object" } } } },
                { { "type", "null" } } } },
        };
    }

    return {
        { "title", title },
        { "type", "object" },
        { "properties", properties },
        { "required",
          { "object_id",
            "location",
            "dataset_name",
            "dtype",
            "full_shape",
            "chunk_shape",
            "buffer_shape" } },
    };
}

DsioBackend
dsio::DatasetDescriptor::backend() const noexcept
{
    return catalog_->backend();
}

dsio::DatasetDescriptor
dsio::DatasetDescriptor::with_chunk_shape(Shape chunk_shape) const
{
    DatasetDescriptor copy(*this);
    copy.chunk_shape_ = std::move(chunk_shape);
    copy.validate_();

    return copy;
}

dsio::DatasetDescriptor
dsio::DatasetDescriptor::with_buffer_shape(Shape buffer_shape) const
{
    DatasetDescriptor copy(*this);
    copy.buffer_shape_ = std::move(buffer_shape);
    copy.validate_();

    return copy;
}

dsio::DatasetDescriptor
dsio::DatasetDescriptor::with_shapes(Shape chunk_shape,
                                     Shape buffer_shape) const
{
    DatasetDescriptor copy(*this);
    copy.chunk_shape_ = std::move(chunk_shape);
    copy.buffer_shape_ = std::move(buffer_shape);
    copy.validate_();

    return copy;
}

dsio::DatasetDescriptor
dsio::DatasetDescriptor::with_compression(
  CompressionMethod method,
  std::optional<nlohmann::json> options) const
{
    DatasetDescriptor copy(*this);
    copy.compression_method_ = normalize(std::move(method));
    copy.compression_options_ = std::move(options);
    copy.validate_();

    return copy;
}

dsio::DatasetDescriptor
dsio::DatasetDescriptor::with_filters(
  std::vector<FilterMethod> methods,
  std::optional<std::vector<nlohmann::json>> options) const
{
    EXPECT_AS(InvalidFilterConfigurationError,
              backend() == DsioBackend_Zarr,
              "Filters are not supported by the ",
              backend_to_string(backend()),
              " backend (dataset at location '",
              location(),
              "')");

    DatasetDescriptor copy(*this);
    copy.backend_settings_ = ZarrDatasetSettings{
        .filter_methods = std::move(methods),
        .filter_options = std::move(options),
    };
    copy.validate_();

    return copy;
}

uint64_t
dsio::DatasetDescriptor::full_size_bytes() const
{
    return estimate_memory_usage(info_.full_shape, info_.dtype.itemsize());
}

uint64_t
dsio::DatasetDescriptor::buffer_size_bytes() const
{
    return estimate_memory_usage(buffer_shape_, info_.dtype.itemsize());
}

uint64_t
dsio::DatasetDescriptor::chunk_size_bytes() const
{
    return estimate_memory_usage(chunk_shape_, info_.dtype.itemsize());
}

nlohmann::json
dsio::DatasetDescriptor::io_arguments() const
{
    return catalog_->build_io_arguments(*this);
}

std::string
dsio::DatasetDescriptor::render_summary() const
{
    std::ostringstream ss;

    ss << "\n" << location() << "\n" << std::string(location().size(), '-');
    ss << "\n  dtype : " << dtype().name();
    ss << "\n  full shape of source array : " << shape_to_string(full_shape());
    ss << "\n  full size of source array : "
       << human_readable_bytes(full_size_bytes());
    ss << "\n";
    ss << "\n  buffer shape : " << shape_to_string(buffer_shape_);
    ss << "\n  expected RAM usage : "
       << human_readable_bytes(buffer_size_bytes());
    ss << "\n";
    ss << "\n  chunk shape : " << shape_to_string(chunk_shape_);
    ss << "\n  disk space usage per chunk : "
       << human_readable_bytes(chunk_size_bytes());
    ss << "\n";
    ss << "\n  compression method : "
       << compression_method_name(compression_method_);
    if (compression_options_.has_value()) {
        ss << "\n  compression options : " << compression_options_->dump();
    }
    ss << "\n";

    if (const auto* zarr = std::get_if<ZarrDatasetSettings>(&backend_settings_);
        zarr && !zarr->filter_methods.empty()) {
        std::vector<std::string> names;
        for (const auto& method : zarr->filter_methods) {
            names.push_back(filter_method_name(method));
        }
        ss << "\n  filter methods : [" << join(names) << "]";
        if (zarr->filter_options.has_value()) {
            ss << "\n  filter options : "
               << nlohmann::json(*zarr->filter_options).dump();
        }
        ss << "\n";
    }

    return ss.str();
}

nlohmann::json
dsio::DatasetDescriptor::to_json() const
{
    nlohmann::json j = {
        { "object_id", object_id() },
        { "location", location() },
        { "dataset_name", dataset_name() },
        { "dtype", dtype().name() },
        { "full_shape", full_shape() },
        { "chunk_shape", chunk_shape_ },
        { "buffer_shape", buffer_shape_ },
        { "compression_method", nullptr },
        { "compression_options", nullptr },
    };

    if (const auto* name = std::get_if<std::string>(&compression_method_)) {
        j["compression_method"] = *name;
    } else if (const auto* instance =
                 std::get_if<CodecInstance>(&compression_method_)) {
        j["compression_method"] = codec_instance_to_json(*instance);
    }

    if (compression_options_.has_value()) {
        j["compression_options"] = *compression_options_;
    }

    if (const auto* zarr =
          std::get_if<ZarrDatasetSettings>(&backend_settings_)) {
        j["filter_methods"] = nullptr;
        j["filter_options"] = nullptr;

        if (!zarr->filter_methods.empty()) {
            auto methods = nlohmann::json::array();
            for (const auto& method : zarr->filter_methods) {
                methods.push_back(filter_method_to_json(method));
            }
            j["filter_methods"] = methods;
        }
        if (zarr->filter_options.has_value()) {
            j["filter_options"] = *zarr->filter_options;
        }
    }

    return j;
}

bool
dsio::DatasetDescriptor::operator==(const DatasetDescriptor& other) const
{
    return backend() == other.backend() && info_ == other.info_ &&
           chunk_shape_ == other.chunk_shape_ &&
           buffer_shape_ == other.buffer_shape_ &&
           compression_method_ == other.compression_method_ &&
           compression_options_ == other.compression_options_ &&
           backend_settings_ == other.backend_settings_;
}

void
dsio::DatasetDescriptor::validate_() const
{
    validate_identity_();
    validate_shapes_();
    validate_compression_();
    validate_filters_();

    // options are checked by the codec itself
    [[maybe_unused]] auto arguments = catalog_->build_io_arguments(*this);
}

void
dsio::DatasetDescriptor::validate_identity_() const
{
    EXPECT_AS(InvalidSettingsError,
              !info_.object_id.empty(),
              "Object id is empty for dataset at location '",
              info_.location,
              "'");

    EXPECT_AS(InvalidLocationError,
              !info_.location.empty(),
              "Dataset location is empty");

    const auto segments = split_location(info_.location);
    for (const auto& segment : segments) {
        EXPECT_AS(InvalidLocationError,
                  !segment.empty(),
                  "Dataset location '",
                  info_.location,
                  "' has an empty segment");
    }

    EXPECT_AS(InvalidLocationError,
              is_known_dataset_name(info_.dataset_name),
              "Invalid dataset name '",
              info_.dataset_name,
              "'. Must be one of: data, timestamps");

    EXPECT_AS(InvalidLocationError,
              segments.back() == info_.dataset_name,
              "Dataset name '",
              info_.dataset_name,
              "' does not match the final segment of location '",
              info_.location,
              "'");

    EXPECT_AS(UnsupportedDtypeError,
              !info_.dtype.is_object(),
              "Object arrays are not supported (dataset at location '",
              info_.location,
              "')");
}

void
dsio::DatasetDescriptor::validate_shapes_() const
{
    const auto& full_shape = info_.full_shape;
    const auto& location = info_.location;

    EXPECT_AS(InvalidShapeError,
              !full_shape.empty(),
              "Full shape has no axes for dataset at location '",
              location,
              "'");
    for (size_t i = 0; i < full_shape.size(); ++i) {
        EXPECT_AS(InvalidShapeError,
                  full_shape[i] > 0,
                  "Full shape ",
                  shape_to_string(full_shape),
                  " has a zero-length axis ",
                  i,
                  " for dataset at location '",
                  location,
                  "'");
    }

    EXPECT_AS(InvalidShapeError,
              size_in_bytes_fits(full_shape, info_.dtype.itemsize()),
              "Full shape ",
              shape_to_string(full_shape),
              " is too large to address for dataset at location '",
              location,
              "'");

    EXPECT_AS(ShapeMismatchError,
              chunk_shape_.size() == buffer_shape_.size(),
              "Rank of chunk shape ",
              shape_to_string(chunk_shape_),
              " does not match rank of buffer shape ",
              shape_to_string(buffer_shape_),
              " for dataset at location '",
              location,
              "'");
    EXPECT_AS(ShapeMismatchError,
              buffer_shape_.size() == full_shape.size(),
              "Rank of buffer shape ",
              shape_to_string(buffer_shape_),
              " does not match rank of full shape ",
              shape_to_string(full_shape),
              " for dataset at location '",
              location,
              "'");

    for (size_t i = 0; i < full_shape.size(); ++i) {
        EXPECT_AS(ShapeMismatchError,
                  chunk_shape_[i] > 0,
                  "Chunk shape ",
                  shape_to_string(chunk_shape_),
                  " is zero along axis ",
                  i,
                  " for dataset at location '",
                  location,
                  "'");
        EXPECT_AS(ShapeMismatchError,
                  chunk_shape_[i] <= buffer_shape_[i],
                  "Chunk shape ",
                  shape_to_string(chunk_shape_),
                  " exceeds buffer shape ",
                  shape_to_string(buffer_shape_),
                  " along axis ",
                  i,
                  " for dataset at location '",
                  location,
                  "'");
        EXPECT_AS(ShapeMismatchError,
                  buffer_shape_[i] <= full_shape[i],
                  "Buffer shape ",
                  shape_to_string(buffer_shape_),
                  " exceeds full shape ",
                  shape_to_string(full_shape),
                  " along axis ",
                  i,
                  " for dataset at location '",
                  location,
                  "'");
        EXPECT_AS(ShapeMismatchError,
                  buffer_shape_[i] == full_shape[i] ||
                    buffer_shape_[i] % chunk_shape_[i] == 0,
                  "Chunk shape ",
                  shape_to_string(chunk_shape_),
                  " does not evenly divide buffer shape ",
                  shape_to_string(buffer_shape_),
                  " along axis ",
                  i,
                  " for dataset at location '",
                  location,
                  "'");
    }
}

void
dsio::DatasetDescriptor::validate_compression_() const
{
    const auto backend = catalog_->backend();

    EXPECT_AS(BackendCompressionMismatchError,
              (backend == DsioBackend_Zarr) ==
                std::holds_alternative<ZarrDatasetSettings>(backend_settings_),
              "Dataset settings for location '",
              info_.location,
              "' do not belong to the ",
              backend_to_string(backend),
              " backend");

    if (const auto* name = std::get_if<std::string>(&compression_method_)) {
        catalog_->resolve(*name);
    } else if (const auto* instance =
                 std::get_if<CodecInstance>(&compression_method_)) {
        EXPECT_AS(BackendCompressionMismatchError,
                  instance->backend == backend,
                  "Codec '",
                  instance->id,
                  "' was built for the ",
                  backend_to_string(instance->backend),
                  " backend, but dataset at location '",
                  info_.location,
                  "' is configured for the ",
                  backend_to_string(backend),
                  " backend");
        EXPECT_AS(InvalidCompressionOptionsError,
                  !instance->id.empty(),
                  "Explicit codec for dataset at location '",
                  info_.location,
                  "' has an empty id");
    }

    if (!compression_options_.has_value()) {
        return;
    }

    // HDF5 filters may take positional parameters
    EXPECT_AS(InvalidCompressionOptionsError,
              compression_options_->is_object() ||
                (backend == DsioBackend_HDF5 &&
                 compression_options_->is_array()),
              "Compression options for dataset at location '",
              info_.location,
              "' must be a JSON object",
              backend == DsioBackend_HDF5 ? " or array" : "",
              ", got ",
              compression_options_->dump());

    EXPECT_AS(InvalidCompressionOptionsError,
              !std::holds_alternative<std::monostate>(compression_method_) ||
                compression_options_->empty(),
              "Compression options ",
              compression_options_->dump(),
              " were given for dataset at location '",
              info_.location,
              "', but compression is disabled");
}

void
dsio::DatasetDescriptor::validate_filters_() const
{
    const auto* zarr = std::get_if<ZarrDatasetSettings>(&backend_settings_);
    if (!zarr) {
        return;
    }

    const auto& methods = zarr->filter_methods;
    const auto& options = zarr->filter_options;

    if (options.has_value()) {
        EXPECT_AS(InvalidFilterConfigurationError,
                  !methods.empty(),
                  "Filter options were given for dataset at location '",
                  info_.location,
                  "', but no filter methods");
        EXPECT_AS(InvalidFilterConfigurationError,
                  options->size() == methods.size(),
                  "Length mismatch between filter methods (",
                  methods.size(),
                  " methods specified) and filter options (",
                  options->size(),
                  " options found) for dataset at location '",
                  info_.location,
                  "'");
        for (const auto& option : *options) {
            EXPECT_AS(InvalidFilterConfigurationError,
                      option.is_object(),
                      "Filter options must be JSON objects, got ",
                      option.dump());
        }
    }

    for (const auto& method : methods) {
        if (const auto* name = std::get_if<std::string>(&method)) {
            catalog_->resolve(*name);
        } else {
            const auto& instance = std::get<CodecInstance>(method);
            EXPECT_AS(BackendCompressionMismatchError,
                      instance.backend == catalog_->backend(),
                      "Filter '",
                      instance.id,
                      "' was built for the ",
                      backend_to_string(instance.backend),
                      " backend");
        }
    }
}
