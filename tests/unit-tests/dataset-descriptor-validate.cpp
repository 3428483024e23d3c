#include "dataset.descriptor.hh"
#include "dsio.common.hh"
#include "errors.hh"
#include "unit.test.macros.hh"

namespace {
const auto hdf5 = dsio::CompressionCatalog::native(DsioBackend_HDF5);
const auto zarr = dsio::CompressionCatalog::native(DsioBackend_Zarr);

dsio::DatasetDescriptor
make_default(const std::shared_ptr<const dsio::CompressionCatalog>& catalog)
{
    return dsio::DatasetDescriptor::from_defaults(
      catalog,
      "8f5e2a1c",
      "acquisition/TimeSeries/data",
      "data",
      { 1'000'000, 4 },
      dsio::DataType(DsioDataType_float64));
}

void
defaults_are_deterministic()
{
    const auto a = make_default(hdf5);
    const auto b = make_default(hdf5);
    EXPECT(a == b, "Defaults differ between identical calls");

    EXPECT(a.chunk_shape() == dsio::Shape({ 312'500, 4 }),
           "Unexpected chunk shape ",
           dsio::shape_to_string(a.chunk_shape()));
    EXPECT(a.buffer_shape() == a.full_shape(), "Expected full buffer");
    EXPECT(std::get<std::string>(a.compression_method()) ==
             dsio::GENERIC_LOSSLESS_COMPRESSION,
           "Expected generic lossless compression");
    EXPECT_EQ(uint64_t, a.chunk_size_bytes(), 10'000'000);
    EXPECT_EQ(uint64_t, a.full_size_bytes(), 32'000'000);

    EXPECT(!(make_default(hdf5) == make_default(zarr)),
           "Descriptors for different backends compare equal");
}

void
failed_mutation_keeps_original()
{
    const auto descriptor = make_default(hdf5);
    const auto chunk_shape = descriptor.chunk_shape();

    // chunk larger than the buffer along axis 0
    EXPECT_THROWS(dsio::ShapeMismatchError,
                  (void)descriptor.with_chunk_shape({ 2'000'000, 4 }));
    EXPECT(descriptor.chunk_shape() == chunk_shape, "Chunk shape changed");

    const auto smaller =
      descriptor.with_shapes({ 1000, 2 }, { 500'000, 4 });
    EXPECT(smaller.chunk_shape() == dsio::Shape({ 1000, 2 }),
           "Chunk shape was not set");
    EXPECT(descriptor.chunk_shape() == chunk_shape,
           "Original chunk shape changed");

    // chunk does not divide the buffer along axis 0
    EXPECT_THROWS(dsio::ShapeMismatchError,
                  (void)smaller.with_buffer_shape({ 500'500, 4 }));
    EXPECT_THROWS(dsio::ShapeMismatchError,
                  (void)smaller.with_buffer_shape({ 500'000, 4, 1 }));
    EXPECT_THROWS(dsio::ShapeMismatchError,
                  (void)smaller.with_chunk_shape({ 0, 2 }));
    EXPECT_THROWS(dsio::ShapeMismatchError,
                  (void)smaller.with_buffer_shape({ 2'000'000, 4 }));

    // a full axis need not be a multiple of the chunk
    const auto ragged = descriptor.with_shapes({ 300'000, 3 }, { 1'000'000, 4 });
    EXPECT(ragged.buffer_shape() == ragged.full_shape(), "Expected full buffer");
}

void
compression_is_resolved()
{
    const auto descriptor = make_default(hdf5);

    bool thrown = false;
    try {
        (void)dsio::DatasetDescriptor(
          hdf5,
          { .object_id = "a1",
            .location = "data",
            .dataset_name = "data",
            .dtype = dsio::DataType(DsioDataType_float64),
            .full_shape = { 10, 10 } },
          { 10, 10 },
          { 10, 10 },
          std::string("not-a-codec"));
    } catch (const dsio::UnknownCompressionMethodError& exc) {
        thrown = true;
        EXPECT(exc.alternatives() == hdf5->names(),
               "Error should list valid names");
    }
    EXPECT(thrown, "Expected UnknownCompressionMethodError");

    EXPECT_THROWS(dsio::UnknownCompressionMethodError,
                  (void)descriptor.with_compression(std::string("blosc")));
    EXPECT_THROWS(dsio::UnknownCompressionMethodError,
                  (void)descriptor.with_compression(std::string("shuffle")));

    const auto uncompressed =
      descriptor.with_compression(dsio::make_compression_method("none"));
    EXPECT(
      std::holds_alternative<std::monostate>(uncompressed.compression_method()),
      "Expected no compression");
    EXPECT_STR_EQ(dsio::compression_method_name(
                    uncompressed.compression_method()),
                  "none");

    const auto lzf = descriptor.with_compression(std::string("lzf"));
    EXPECT_STR_EQ(dsio::compression_method_name(lzf.compression_method()),
                  "lzf");
    EXPECT(descriptor.compression_method() !=
             lzf.compression_method(),
           "Original compression changed");

    EXPECT_THROWS(dsio::InvalidCompressionOptionsError,
                  (void)descriptor.with_compression(std::string("gzip"),
                                                    nlohmann::json(4)));
}

void
identity_is_validated()
{
    auto make = [](std::string object_id,
                   std::string location,
                   std::string dataset_name,
                   dsio::DataType dtype,
                   dsio::Shape full_shape) {
        const auto chunk_shape = full_shape;
        return dsio::DatasetDescriptor(
          hdf5,
          { .object_id = std::move(object_id),
            .location = std::move(location),
            .dataset_name = std::move(dataset_name),
            .dtype = dtype,
            .full_shape = full_shape },
          chunk_shape,
          chunk_shape);
    };

    const dsio::DataType f32(DsioDataType_float32);

    (void)make("id", "processing/ecephys/LFP/timestamps", "timestamps", f32, { 5 });

    EXPECT_THROWS(dsio::InvalidLocationError,
                  (void)make("id", "acquisition/Series/values", "values", f32, { 5 }));
    EXPECT_THROWS(dsio::InvalidLocationError,
                  (void)make("id", "acquisition/Series/data", "timestamps", f32, { 5 }));
    EXPECT_THROWS(dsio::InvalidLocationError,
                  (void)make("id", "acquisition//data", "data", f32, { 5 }));
    EXPECT_THROWS(dsio::InvalidSettingsError,
                  (void)make("", "data", "data", f32, { 5 }));
    EXPECT_THROWS(dsio::UnsupportedDtypeError,
                  (void)make("id",
                             "data",
                             "data",
                             dsio::DataType(DsioDataType_object),
                             { 5 }));
    EXPECT_THROWS(dsio::InvalidShapeError,
                  (void)make("id", "data", "data", f32, {}));
    EXPECT_THROWS(dsio::InvalidShapeError,
                  (void)make("id", "data", "data", f32, { 5, 0 }));
    EXPECT_THROWS(dsio::UnsupportedDtypeError,
                  (void)dsio::DatasetDescriptor::from_defaults(
                    hdf5,
                    "id",
                    "data",
                    "data",
                    { 5 },
                    dsio::DataType(DsioDataType_object)));
}

void
oversized_shape_is_rejected()
{
    // 2^64 elements cannot be addressed in bytes
    EXPECT_THROWS(dsio::InvalidShapeError,
                  (void)dsio::DatasetDescriptor::from_defaults(
                    hdf5,
                    "8f5e2a1c",
                    "acquisition/TimeSeries/data",
                    "data",
                    { 1ULL << 32, 1ULL << 32 },
                    dsio::DataType(DsioDataType_float64)));
}

void
filters_are_validated()
{
    const auto descriptor = make_default(zarr);

    const auto filtered =
      descriptor.with_filters({ std::string("delta") },
                              std::vector<nlohmann::json>{
                                { { "dtype", "<f8" } } });
    const auto& settings =
      std::get<dsio::ZarrDatasetSettings>(filtered.backend_settings());
    EXPECT_EQ(size_t, settings.filter_methods.size(), 1);

    EXPECT_THROWS(dsio::InvalidFilterConfigurationError,
                  (void)descriptor.with_filters(
                    {}, std::vector<nlohmann::json>{ nlohmann::json::object() }));
    EXPECT_THROWS(
      dsio::InvalidFilterConfigurationError,
      (void)descriptor.with_filters(
        { std::string("delta"), std::string("packbits") },
        std::vector<nlohmann::json>{ nlohmann::json::object() }));
    EXPECT_THROWS(dsio::UnknownCompressionMethodError,
                  (void)descriptor.with_filters({ std::string("shuffle") }));
    EXPECT_THROWS(dsio::InvalidFilterConfigurationError,
                  (void)make_default(hdf5).with_filters({ std::string("delta") }));

    // zarr settings on an HDF5 descriptor
    EXPECT_THROWS(dsio::BackendCompressionMismatchError,
                  (void)dsio::DatasetDescriptor(
                    hdf5,
                    descriptor.info(),
                    descriptor.chunk_shape(),
                    descriptor.buffer_shape(),
                    std::string("gzip"),
                    std::nullopt,
                    dsio::ZarrDatasetSettings{}));
}

void
summary_mentions_every_field()
{
    const auto descriptor =
      make_default(zarr)
        .with_compression(std::string("blosc"), nlohmann::json{ { "clevel", 3 } })
        .with_filters({ std::string("delta") },
                      std::vector<nlohmann::json>{ { { "dtype", "<f8" } } });

    const auto summary = descriptor.render_summary();
    for (const std::string expected : {
           "acquisition/TimeSeries/data\n---------------------------",
           "dtype : float64",
           "full shape of source array : (1000000, 4)",
           "full size of source array : 32.00 MB",
           "buffer shape : (1000000, 4)",
           "expected RAM usage : 32.00 MB",
           "chunk shape : (312500, 4)",
           "disk space usage per chunk : 10.00 MB",
           "compression method : blosc",
           "compression options : {\"clevel\":3}",
           "filter methods : [delta]",
         }) {
        EXPECT(summary.find(expected) != std::string::npos,
               "Summary is missing '",
               expected,
               "':\n",
               summary);
    }
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        defaults_are_deterministic();
        failed_mutation_keeps_original();
        compression_is_resolved();
        identity_is_validated();
        oversized_shape_is_rejected();
        filters_are_validated();
        summary_mentions_every_field();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
