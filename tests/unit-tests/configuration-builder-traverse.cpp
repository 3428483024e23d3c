#include "configuration.builder.hh"
#include "dsio.common.hh"
#include "errors.hh"
#include "unit.test.macros.hh"

namespace {
const dsio::DataType float64(DsioDataType_float64);

dsio::ObjectGraph
make_graph()
{
    dsio::ObjectGraph graph("nwbfile-0001", "root");

    const auto acquisition =
      graph.add_node(graph.root(), "acquisition-0001", "acquisition");
    const auto series = graph.add_node(acquisition, "series-0001", "Series");
    graph.set_field(series,
                    "data",
                    dsio::MaterializedArray{ .shape = { 1'000'000, 4 },
                                             .dtype = float64 });
    graph.set_field(
      series,
      "timestamps",
      dsio::MaterializedArray{ .shape = { 1'000'000 }, .dtype = float64 });
    graph.set_field(
      series,
      "unit",
      dsio::MaterializedArray{ .shape = { 1 }, .dtype = float64 });

    const auto camera = graph.add_node(acquisition, "camera-0001", "Camera");
    graph.set_field(camera,
                    "data",
                    dsio::ChunkedArraySource{
                      .full_shape = { 2000, 480, 640 },
                      .dtype = dsio::DataType(DsioDataType_uint8),
                      .chunk_shape = { 10, 480, 640 },
                      .buffer_shape = { 100, 480, 640 } });

    const auto linked = graph.add_node(acquisition, "linked-0001", "Linked");
    graph.set_field(linked, "data", dsio::DatasetLink{ "series-0001" });
    graph.set_field(
      linked,
      "timestamps",
      dsio::MaterializedArray{ .shape = { 1'000'000 }, .dtype = float64 });

    const auto processing =
      graph.add_node(graph.root(), "processing-0001", "processing");
    const auto labels = graph.add_node(processing, "labels-0001", "Labels");
    graph.set_field(labels, "data", dsio::ObjectArray{ { "a", "bcd", "ef" } });

    const auto refs = graph.add_node(processing, "refs-0001", "Refs");
    graph.set_field(
      refs, "data", dsio::ReferenceArray{ { "series-0001", "camera-0001" } });

    const auto stored = graph.add_node(processing, "stored-0001", "Stored");
    graph.set_field(stored,
                    "data",
                    dsio::StoredDataset{
                      .shape = { 100 },
                      .dtype = dsio::DataType(DsioDataType_int32),
                      .backend = DsioBackend_HDF5 });

    const auto wrapped = graph.add_node(processing, "wrapped-0001", "Wrapped");
    graph.set_field(
      wrapped,
      "data",
      dsio::ConfiguredDataset{ .shape = { 10 }, .dtype = float64 });

    const auto empty = graph.add_node(processing, "empty-0001", "Empty");
    graph.set_field(
      empty, "data", dsio::MaterializedArray{ .shape = { 0, 3 }, .dtype = float64 });

    return graph;
}

std::vector<std::string>
locations_of(const std::vector<dsio::DatasetDescriptor>& descriptors)
{
    std::vector<std::string> locations;
    for (const auto& descriptor : descriptors) {
        locations.push_back(descriptor.location());
    }
    return locations;
}

void
build_for_hdf5()
{
    const auto graph = make_graph();
    const dsio::ConfigurationBuilder builder(
      dsio::CompressionCatalog::native(DsioBackend_HDF5));
    const auto descriptors = builder.build(graph);

    const std::vector<std::string> expected{
        "acquisition/Series/data",
        "acquisition/Series/timestamps",
        "acquisition/Camera/data",
        "acquisition/Linked/timestamps",
        "processing/Labels/data",
    };
    EXPECT(locations_of(descriptors) == expected,
           "Unexpected locations: ",
           dsio::join(locations_of(descriptors)));

    EXPECT_STR_EQ(descriptors[0].object_id(), "series-0001");
    EXPECT_STR_EQ(descriptors[1].dataset_name(), "timestamps");
    EXPECT_STR_EQ(descriptors[3].object_id(), "linked-0001");

    // hints from a chunked source are adopted as is
    const auto& camera = descriptors[2];
    EXPECT(camera.chunk_shape() == dsio::Shape({ 10, 480, 640 }),
           "Unexpected chunk shape ",
           dsio::shape_to_string(camera.chunk_shape()));
    EXPECT(camera.buffer_shape() == dsio::Shape({ 100, 480, 640 }),
           "Unexpected buffer shape ",
           dsio::shape_to_string(camera.buffer_shape()));

    // text object arrays become fixed-width strings
    const auto& labels = descriptors[4];
    EXPECT_STR_EQ(labels.dtype().name(), "str3");
    EXPECT(labels.full_shape() == dsio::Shape({ 3 }),
           "Unexpected shape ",
           dsio::shape_to_string(labels.full_shape()));
}

void
build_for_zarr()
{
    const auto graph = make_graph();
    const dsio::ConfigurationBuilder builder(
      dsio::CompressionCatalog::native(DsioBackend_Zarr));
    const auto locations = locations_of(builder.build(graph));

    // datasets stored by the other backend are rewritten
    EXPECT_EQ(size_t, locations.size(), 6);
    EXPECT_STR_EQ(locations.back(), "processing/Stored/data");
}

void
settings_are_applied()
{
    const auto graph = make_graph();
    const auto catalog = dsio::CompressionCatalog::native(DsioBackend_HDF5);

    const dsio::ConfigurationBuilder builder(
      catalog,
      { .chunk_target_bytes = 1'000'000,
        .buffer_target_bytes = 2'000'000,
        .compression_method = dsio::make_compression_method("none") });
    for (const auto& descriptor : builder.build(graph)) {
        EXPECT(std::holds_alternative<std::monostate>(
                 descriptor.compression_method()),
               "Expected no compression at ",
               descriptor.location());
    }

    const auto series = builder.build(graph).front();
    EXPECT_EQ(uint64_t, series.chunk_size_bytes(), 1'000'000);

    EXPECT_THROWS(dsio::InvalidSettingsError,
                  (void)dsio::ConfigurationBuilder(catalog,
                                             { .chunk_target_bytes = 0 }));
    EXPECT_THROWS(dsio::InvalidSettingsError,
                  (void)dsio::ConfigurationBuilder(
                    catalog,
                    { .chunk_target_bytes = 2'000'000,
                      .buffer_target_bytes = 1'000'000 }));
    EXPECT_THROWS(
      dsio::UnknownCompressionMethodError,
      (void)dsio::ConfigurationBuilder(
        catalog, { .compression_method = std::string("blosc") }));
}

dsio::ObjectGraph
make_appended_graph()
{
    const dsio::DataType int16(DsioDataType_int16);

    dsio::ObjectGraph graph("nwbfile-0002");
    graph.set_append_backend(DsioBackend_HDF5);

    const auto acquisition =
      graph.add_node(graph.root(), "acquisition-0002", "acquisition");

    const auto chunked = graph.add_node(acquisition, "chunked-0002", "Chunked");
    graph.set_field(chunked,
                    "data",
                    dsio::StoredDataset{
                      .shape = { 10'000, 32 },
                      .dtype = int16,
                      .backend = DsioBackend_HDF5,
                      .chunk_shape = dsio::Shape{ 1000, 32 },
                      .compression = "gzip",
                      .compression_options = nlohmann::json{ { "level", 4 } } });

    const auto contiguous =
      graph.add_node(acquisition, "contiguous-0002", "Contiguous");
    graph.set_field(contiguous,
                    "data",
                    dsio::StoredDataset{ .shape = { 500 },
                                         .dtype = int16,
                                         .backend = DsioBackend_HDF5 });

    const auto copied = graph.add_node(acquisition, "copied-0002", "Copied");
    graph.set_field(copied,
                    "data",
                    dsio::StoredDataset{ .shape = { 200, 2 },
                                         .dtype = int16,
                                         .backend = DsioBackend_Zarr });

    return graph;
}

void
existing_mode_adopts_stored_layout()
{
    const auto graph = make_appended_graph();
    const auto catalog = dsio::CompressionCatalog::native(DsioBackend_HDF5);

    const dsio::ConfigurationBuilder existing(
      catalog, { .mode = dsio::BuildMode::Existing });
    const auto descriptors = existing.build(graph);
    EXPECT_EQ(size_t, descriptors.size(), 3);

    const auto& chunked = descriptors[0];
    EXPECT_STR_EQ(chunked.location(), "acquisition/Chunked/data");
    EXPECT(chunked.chunk_shape() == dsio::Shape({ 1000, 32 }),
           "Unexpected chunk shape ",
           dsio::shape_to_string(chunked.chunk_shape()));
    EXPECT(chunked.buffer_shape() == chunked.full_shape(),
           "Expected the buffer to span the array");
    EXPECT_STR_EQ(dsio::compression_method_name(chunked.compression_method()),
                  "gzip");
    EXPECT_EQ(int, (*chunked.compression_options())["level"].get<int>(), 4);

    // contiguous, uncompressed
    const auto& contiguous = descriptors[1];
    EXPECT(contiguous.chunk_shape() == contiguous.full_shape(),
           "Contiguous storage is a single chunk");
    EXPECT(std::holds_alternative<std::monostate>(
             contiguous.compression_method()),
           "Expected no compression");

    // written by the other backend, so estimated from scratch
    const auto& copied = descriptors[2];
    EXPECT_STR_EQ(copied.location(), "acquisition/Copied/data");
    EXPECT(std::get<std::string>(copied.compression_method()) ==
             dsio::GENERIC_LOSSLESS_COMPRESSION,
           "Expected default compression");

    // the default mode leaves stored datasets alone
    const dsio::ConfigurationBuilder defaults(catalog);
    const auto rewritten = defaults.build(graph);
    EXPECT_EQ(size_t, rewritten.size(), 1);
    EXPECT_STR_EQ(rewritten.front().location(), "acquisition/Copied/data");
}

void
reject_mixed_object_arrays()
{
    dsio::ObjectGraph graph("root-id");
    const auto table = graph.add_node(graph.root(), "table-id", "table");
    graph.set_field(table, "data", dsio::ObjectArray{ { "a", 1, 2.5 } });

    const dsio::ConfigurationBuilder builder(
      dsio::CompressionCatalog::native(DsioBackend_HDF5));
    EXPECT_THROWS(dsio::UnsupportedDtypeError, (void)builder.build(graph));
}

void
map_locations_to_objects()
{
    const auto locations =
      dsio::ConfigurationBuilder::map_locations(make_graph());

    EXPECT_STR_EQ(locations.at("acquisition/Series/timestamps"), "series-0001");
    EXPECT_STR_EQ(locations.at("acquisition/Linked/data"), "linked-0001");
    EXPECT_STR_EQ(locations.at("processing/Refs/data"), "refs-0001");
    EXPECT(!locations.contains("acquisition/Series/unit"),
           "Only data and timestamps fields are datasets");
}

void
graph_rejects_duplicates()
{
    dsio::ObjectGraph graph("root-id");
    const auto a = graph.add_node(graph.root(), "a-id", "a");

    EXPECT_THROWS(dsio::InvalidSettingsError,
                  graph.add_node(graph.root(), "a-id", "b"));
    EXPECT_THROWS(dsio::InvalidSettingsError,
                  graph.add_node(graph.root(), "b-id", "a"));
    EXPECT_THROWS(dsio::InvalidSettingsError,
                  graph.add_node(a, "c-id", "nested/name"));
    EXPECT_THROWS(std::out_of_range, graph.add_node(42, "d-id", "d"));

    EXPECT(graph.find("a-id") == a, "Node lookup by id failed");
    EXPECT(!graph.find("missing").has_value(), "Unexpected node found");
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        build_for_hdf5();
        build_for_zarr();
        settings_are_applied();
        existing_mode_adopts_stored_layout();
        reject_mixed_object_arrays();
        map_locations_to_objects();
        graph_rejects_duplicates();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
