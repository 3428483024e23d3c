#include "compression.catalog.hh"
#include "dataset.descriptor.hh"
#include "dsio.common.hh"
#include "errors.hh"
#include "macros.hh"

#include <blosc.h>
#include <hdf5.h>

#include <algorithm>
#include <set>

namespace {
// registered by h5py; not defined by the HDF5 library itself
constexpr uint32_t LZF_FILTER_ID = 32000;

constexpr const char* BLOSC_DEFAULT_CNAME = "lz4";
constexpr int BLOSC_DEFAULT_CLEVEL = 5;

bool
contains_name(const std::vector<std::string>& names, std::string_view name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

std::vector<dsio::Codec>
native_codecs(DsioBackend backend)
{
    std::vector<dsio::Codec> codecs;

    if (backend == DsioBackend_HDF5) {
        codecs = {
            { .name = "gzip", .backend = backend, .filter_id = H5Z_FILTER_DEFLATE },
            { .name = "lzf", .backend = backend, .filter_id = LZF_FILTER_ID },
            { .name = "szip", .backend = backend, .filter_id = H5Z_FILTER_SZIP },
            { .name = "shuffle",
              .backend = backend,
              .filter_id = H5Z_FILTER_SHUFFLE },
            { .name = "fletcher32",
              .backend = backend,
              .filter_id = H5Z_FILTER_FLETCHER32 },
            { .name = "scaleoffset",
              .backend = backend,
              .filter_id = H5Z_FILTER_SCALEOFFSET,
              .lossy = true },
        };
    } else {
        for (const auto& name : dsio::CompressionCatalog::native_names(backend)) {
            const bool lossy =
              name == "astype" || name == "bitround" || name == "quantize";
            codecs.push_back(
              { .name = name, .backend = backend, .lossy = lossy });
        }
    }

    return codecs;
}

void
expect_keys(const nlohmann::json& options,
            const std::set<std::string>& allowed,
            std::string_view codec)
{
    for (const auto& [key, value] : options.items()) {
        EXPECT_AS(dsio::InvalidCompressionOptionsError,
                  allowed.contains(key),
                  "Unsupported option '",
                  key,
                  "' for codec '",
                  codec,
                  "'");
    }
}

void
expect_integer_in_range(const nlohmann::json& options,
                        const std::string& key,
                        int lo,
                        int hi,
                        std::string_view codec)
{
    if (!options.contains(key)) {
        return;
    }

    const auto& value = options[key];
    EXPECT_AS(dsio::InvalidCompressionOptionsError,
              value.is_number_integer(),
              "Option '",
              key,
              "' for codec '",
              codec,
              "' must be an integer, got ",
              value.dump());

    // unsigned values past INT64_MAX would wrap negative
    bool in_range = false;
    if (value.is_number_unsigned()) {
        const auto n = value.get<uint64_t>();
        in_range = hi >= 0 && n <= static_cast<uint64_t>(hi) &&
                   (lo <= 0 || n >= static_cast<uint64_t>(lo));
    } else {
        const auto n = value.get<int64_t>();
        in_range = n >= lo && n <= hi;
    }
    EXPECT_AS(dsio::InvalidCompressionOptionsError,
              in_range,
              "Option '",
              key,
              "' for codec '",
              codec,
              "' must be between ",
              lo,
              " and ",
              hi,
              ", got ",
              value.dump());
}

void
expect_keyed_options(const nlohmann::json& options, std::string_view codec)
{
    EXPECT_AS(dsio::InvalidCompressionOptionsError,
              options.is_object(),
              "Options for codec '",
              codec,
              "' must be a JSON object, got ",
              options.dump());
}

// HDF5 filter parameters are positional (cd_values)
nlohmann::json
filter_parameters(const nlohmann::json& options, std::string_view codec)
{
    if (options.is_array()) {
        return options;
    }

    EXPECT_AS(dsio::InvalidCompressionOptionsError,
              options.is_object() && options.empty(),
              "Parameters for HDF5 filter '",
              codec,
              "' are positional and must be a JSON array, got ",
              options.dump());

    return nlohmann::json::array();
}

nlohmann::json
make_blosc_config(const nlohmann::json& options)
{
    expect_keyed_options(options, "blosc");
    expect_keys(options, { "cname", "clevel", "shuffle", "blocksize" }, "blosc");

    nlohmann::json config = {
        { "id", "blosc" },
        { "cname", BLOSC_DEFAULT_CNAME },
        { "clevel", BLOSC_DEFAULT_CLEVEL },
        { "shuffle", BLOSC_SHUFFLE },
        { "blocksize", 0 },
    };

    if (options.contains("cname")) {
        const auto& cname = options["cname"];
        EXPECT_AS(dsio::InvalidCompressionOptionsError,
                  cname.is_string(),
                  "Blosc compressor name must be a string, got ",
                  cname.dump());

        const auto name = cname.get<std::string>();
        EXPECT_AS(dsio::InvalidCompressionOptionsError,
                  blosc_compname_to_compcode(name.c_str()) >= 0,
                  "Blosc was not built with compressor '",
                  name,
                  "'. Available compressors: ",
                  blosc_list_compressors());
        config["cname"] = name;
    }

    expect_integer_in_range(options, "clevel", 0, 9, "blosc");
    if (options.contains("clevel")) {
        config["clevel"] = options["clevel"];
    }

    if (options.contains("shuffle")) {
        const auto& shuffle = options["shuffle"];
        EXPECT_AS(dsio::InvalidCompressionOptionsError,
                  shuffle.is_number_integer(),
                  "Blosc shuffle must be an integer, got ",
                  shuffle.dump());

        const auto mode = shuffle.get<int64_t>();
        EXPECT_AS(dsio::InvalidCompressionOptionsError,
                  mode == BLOSC_NOSHUFFLE || mode == BLOSC_SHUFFLE ||
                    mode == BLOSC_BITSHUFFLE,
                  "Invalid Blosc shuffle ",
                  mode,
                  ". Must be one of ",
                  BLOSC_NOSHUFFLE,
                  " (none), ",
                  BLOSC_SHUFFLE,
                  " (byte) or ",
                  BLOSC_BITSHUFFLE,
                  " (bit)");
        config["shuffle"] = static_cast<int>(mode);
    }

    if (options.contains("blocksize")) {
        const auto& blocksize = options["blocksize"];
        EXPECT_AS(dsio::InvalidCompressionOptionsError,
                  blocksize.is_number_unsigned(),
                  "Blosc blocksize must be a nonnegative integer, got ",
                  blocksize.dump());
        config["blocksize"] = blocksize;
    }

    return config;
}

// numcodecs-style configuration: {"id": name, ...options}
nlohmann::json
make_zarr_codec_config(const std::string& name,
                       const nlohmann::json& options,
                       dsio::CodecOrigin origin)
{
    expect_keyed_options(options, name);

    if (origin == dsio::CodecOrigin::Native) {
        if (name == "blosc") {
            return make_blosc_config(options);
        }
        if (name == "gzip" || name == "zlib") {
            expect_keys(options, { "level" }, name);
            expect_integer_in_range(options, "level", 0, 9, name);
        } else if (name == "bz2") {
            expect_keys(options, { "level" }, name);
            expect_integer_in_range(options, "level", 1, 9, name);
        } else if (name == "zstd") {
            expect_integer_in_range(options, "level", -131072, 22, name);
        }
    }

    nlohmann::json config = options;
    config["id"] = name;

    return config;
}

nlohmann::json
make_zarr_codec_config(const dsio::CodecInstance& instance)
{
    nlohmann::json config = instance.configuration.is_object()
                              ? instance.configuration
                              : nlohmann::json::object();
    config["id"] = instance.id;

    return config;
}

void
expect_no_options_for_instance(const dsio::CodecInstance& instance,
                               const std::optional<nlohmann::json>& options)
{
    EXPECT_AS(dsio::InvalidCompressionOptionsError,
              !options.has_value() || options->empty(),
              "Codec '",
              instance.id,
              "' is already configured; pass its parameters in the codec "
              "configuration instead of compression options");
}
} // namespace

dsio::CompressionCatalog::CompressionCatalog(
  DsioBackend backend,
  std::vector<CodecProvider> providers)
  : backend_(backend)
{
    EXPECT(backend == DsioBackend_HDF5 || backend == DsioBackend_Zarr,
           "Invalid backend: ",
           backend);

    const auto& denied = denied_names(backend_);
    for (auto& codec : native_codecs(backend_)) {
        if (contains_name(denied, codec.name)) {
            continue;
        }
        codecs_.emplace(codec.name, std::move(codec));
    }

    for (const auto& provider : providers) {
        merge_provider_(provider);
    }
}

std::shared_ptr<const dsio::CompressionCatalog>
dsio::CompressionCatalog::native(DsioBackend backend)
{
    static const auto hdf5 =
      std::make_shared<const CompressionCatalog>(DsioBackend_HDF5);
    static const auto zarr =
      std::make_shared<const CompressionCatalog>(DsioBackend_Zarr);

    switch (backend) {
        case DsioBackend_HDF5:
            return hdf5;
        case DsioBackend_Zarr:
            return zarr;
        default:
            throw std::invalid_argument(
              LOG_ERROR("Invalid backend: ", backend));
    }
}

const std::vector<std::string>&
dsio::CompressionCatalog::native_names(DsioBackend backend)
{
    static const std::vector<std::string> hdf5{
        "gzip", "lzf", "szip", "shuffle", "fletcher32", "scaleoffset",
    };

    // the numcodecs registry
    static const std::vector<std::string> zarr{
        "blosc",      "zstd",       "lz4",        "zlib",
        "gzip",       "bz2",        "lzma",       "delta",
        "packbits",   "categorize", "fixedscaleoffset",
        "quantize",   "bitround",   "astype",     "pickle",
        "json2",      "msgpack2",   "base64",     "shuffle",
        "bitshuffle", "adler32",    "crc32",      "crc32c",
        "fletcher32", "jenkins_lookup3",          "vlen-utf8",
        "vlen-bytes", "vlen-array", "n5_wrapper",
    };

    return backend == DsioBackend_Zarr ? zarr : hdf5;
}

const std::vector<std::string>&
dsio::CompressionCatalog::denied_names(DsioBackend backend)
{
    // shuffle and fletcher32 are set by the container layer; scaleoffset is
    // lossy
    static const std::vector<std::string> hdf5{
        "shuffle",
        "fletcher32",
        "scaleoffset",
    };

    static const std::vector<std::string> zarr{
        // no data reduction
        "json2",
        "pickle",
        "base64",
        // applied by the container layer
        "vlen-utf8",
        "vlen-bytes",
        "vlen-array",
        "msgpack2",
        // byte reordering
        "shuffle",
        "bitshuffle",
        // checksums
        "adler32",
        "crc32",
        "crc32c",
        "fletcher32",
        "jenkins_lookup3",
        "fixedscaleoffset",
        "n5_wrapper",
        // lossy
        "astype",
        "bitround",
        "quantize",
    };

    return backend == DsioBackend_Zarr ? zarr : hdf5;
}

const dsio::Codec&
dsio::CompressionCatalog::resolve(std::string_view name) const
{
    if (name == GENERIC_LOSSLESS_COMPRESSION) {
        name = "gzip";
    }

    auto it = codecs_.find(name);
    EXPECT_FOUND(UnknownCompressionMethodError,
                 it != codecs_.end(),
                 names(),
                 "Unknown compression method '",
                 name,
                 "' for the ",
                 backend_to_string(backend_),
                 " backend. Valid methods: ",
                 join(names()));

    return it->second;
}

bool
dsio::CompressionCatalog::contains(std::string_view name) const
{
    if (name == GENERIC_LOSSLESS_COMPRESSION) {
        name = "gzip";
    }

    return codecs_.find(name) != codecs_.end();
}

std::vector<std::string>
dsio::CompressionCatalog::names() const
{
    std::vector<std::string> result;
    result.reserve(codecs_.size());
    for (const auto& [name, codec] : codecs_) {
        result.push_back(name);
    }

    return result;
}

nlohmann::json
dsio::CompressionCatalog::build_io_arguments(
  const DatasetDescriptor& descriptor) const
{
    EXPECT_AS(BackendCompressionMismatchError,
              descriptor.backend() == backend_,
              "Dataset at location '",
              descriptor.location(),
              "' is configured for the ",
              backend_to_string(descriptor.backend()),
              " backend, not the ",
              backend_to_string(backend_),
              " backend");

    if (backend_ == DsioBackend_Zarr) {
        return make_zarr_arguments_(descriptor);
    }

    return make_hdf5_arguments_(descriptor);
}

void
dsio::CompressionCatalog::merge_provider_(const CodecProvider& provider)
{
    EXPECT_AS(BackendCompressionMismatchError,
              provider.backend == backend_,
              "Codec provider '",
              provider.name,
              "' supplies ",
              backend_to_string(provider.backend),
              " codecs, not ",
              backend_to_string(backend_),
              " codecs");

    const auto& denied = denied_names(backend_);
    for (const auto& codec : provider.codecs) {
        if (codec.backend != backend_ || codec.lossy ||
            contains_name(denied, codec.name)) {
            LOG_DEBUG("Skipping codec '",
                      codec.name,
                      "' from provider '",
                      provider.name,
                      "'");
            continue;
        }

        if (backend_ == DsioBackend_HDF5 && codec.filter_id == 0) {
            LOG_WARNING("Codec '",
                        codec.name,
                        "' from provider '",
                        provider.name,
                        "' has no HDF5 filter id. Skipping.");
            continue;
        }

        Codec plugin = codec;
        plugin.origin = CodecOrigin::Plugin;
        if (!codecs_.emplace(plugin.name, std::move(plugin)).second) {
            LOG_DEBUG("Codec '",
                      codec.name,
                      "' from provider '",
                      provider.name,
                      "' is already defined");
        }
    }
}

nlohmann::json
dsio::CompressionCatalog::make_hdf5_arguments_(
  const DatasetDescriptor& descriptor) const
{
    const auto& method = descriptor.compression_method();
    const auto options =
      descriptor.compression_options().value_or(nlohmann::json::object());

    nlohmann::json args = {
        { "chunks", descriptor.chunk_shape() },
        { "compression", false },
        { "compression_opts", nullptr },
    };

    if (std::holds_alternative<std::monostate>(method)) {
        return args;
    }

    if (const auto* instance = std::get_if<CodecInstance>(&method)) {
        expect_no_options_for_instance(*instance,
                                       descriptor.compression_options());
        EXPECT_AS(InvalidCompressionOptionsError,
                  instance->filter_id != 0,
                  "HDF5 codec '",
                  instance->id,
                  "' has no filter id");

        args["compression"] = instance->filter_id;
        args["compression_opts"] =
          filter_parameters(instance->configuration, instance->id);
        args["allow_plugin_filters"] = true;
        return args;
    }

    const auto& codec = resolve(std::get<std::string>(method));
    if (codec.origin == CodecOrigin::Plugin) {
        args["compression"] = codec.filter_id;
        args["compression_opts"] = filter_parameters(options, codec.name);
        args["allow_plugin_filters"] = true;
        return args;
    }

    expect_keyed_options(options, codec.name);
    args["compression"] = codec.name;
    if (codec.name == "gzip") {
        expect_keys(options, { "level" }, codec.name);
        expect_integer_in_range(options, "level", 0, 9, codec.name);
        if (options.contains("level")) {
            args["compression_opts"] = options["level"];
        }
    } else if (codec.name == "lzf") {
        expect_keys(options, {}, codec.name);
    } else if (codec.name == "szip") {
        expect_keys(options, { "options_mask", "pixels_per_block" }, codec.name);
        if (!options.empty()) {
            EXPECT_AS(InvalidCompressionOptionsError,
                      !options.contains("options_mask") ||
                        options["options_mask"].is_string(),
                      "szip options mask must be a string, got ",
                      options["options_mask"].dump());
            const auto mask = options.value("options_mask", std::string("nn"));
            EXPECT_AS(InvalidCompressionOptionsError,
                      mask == "ec" || mask == "nn",
                      "Invalid szip options mask '",
                      mask,
                      "'. Must be 'ec' or 'nn'");

            expect_integer_in_range(
              options, "pixels_per_block", 2, 32, codec.name);
            const auto ppb = options.value("pixels_per_block", 8);
            EXPECT_AS(InvalidCompressionOptionsError,
                      ppb % 2 == 0,
                      "szip pixels per block must be even, got ",
                      ppb);

            args["compression_opts"] = nlohmann::json::array({ mask, ppb });
        }
    }

    return args;
}

nlohmann::json
dsio::CompressionCatalog::make_zarr_arguments_(
  const DatasetDescriptor& descriptor) const
{
    const auto& method = descriptor.compression_method();
    const auto options =
      descriptor.compression_options().value_or(nlohmann::json::object());

    nlohmann::json args = {
        { "chunks", descriptor.chunk_shape() },
        { "compressor", false },
        { "filters", nullptr },
    };

    if (const auto* name = std::get_if<std::string>(&method)) {
        const auto& codec = resolve(*name);
        args["compressor"] =
          make_zarr_codec_config(codec.name, options, codec.origin);
    } else if (const auto* instance = std::get_if<CodecInstance>(&method)) {
        expect_no_options_for_instance(*instance,
                                       descriptor.compression_options());
        args["compressor"] = make_zarr_codec_config(*instance);
    }

    const auto* settings =
      std::get_if<ZarrDatasetSettings>(&descriptor.backend_settings());
    if (!settings || settings->filter_methods.empty()) {
        return args;
    }

    auto filters = nlohmann::json::array();
    for (size_t i = 0; i < settings->filter_methods.size(); ++i) {
        const auto& filter = settings->filter_methods[i];
        const auto filter_options = settings->filter_options.has_value()
                                      ? settings->filter_options->at(i)
                                      : nlohmann::json::object();

        if (const auto* name = std::get_if<std::string>(&filter)) {
            const auto& codec = resolve(*name);
            filters.push_back(
              make_zarr_codec_config(codec.name, filter_options, codec.origin));
        } else {
            filters.push_back(
              make_zarr_codec_config(std::get<CodecInstance>(filter)));
        }
    }
    args["filters"] = filters;

    return args;
}
