#include "backend.applier.hh"
#include "errors.hh"
#include "unit.test.macros.hh"

namespace {
dsio::ObjectGraph
make_graph()
{
    const dsio::DataType int16(DsioDataType_int16);

    dsio::ObjectGraph graph("file-id");
    const auto acquisition =
      graph.add_node(graph.root(), "acquisition-id", "acquisition");

    const auto raw = graph.add_node(acquisition, "raw-id", "Raw");
    graph.set_field(raw,
                    "data",
                    dsio::MaterializedArray{ .shape = { 600'000, 32 },
                                             .dtype = int16 });
    graph.set_field(raw,
                    "timestamps",
                    dsio::MaterializedArray{
                      .shape = { 600'000 },
                      .dtype = dsio::DataType(DsioDataType_float64) });

    const auto filtered = graph.add_node(acquisition, "filtered-id", "Filtered");
    graph.set_field(filtered,
                    "data",
                    dsio::MaterializedArray{ .shape = { 600'000, 32 },
                                             .dtype = int16 });
    graph.set_field(filtered, "timestamps", dsio::DatasetLink{ "raw-id" });

    return graph;
}

void
apply_to_zarr_writer()
{
    const auto graph = make_graph();
    auto configuration =
      dsio::BackendConfiguration::from_object_graph(graph, DsioBackend_Zarr);
    configuration.set_number_of_jobs(1);

    auto handle = dsio::WriterHandle::from_object_graph(graph);
    EXPECT_EQ(size_t, handle.size(), 4);

    dsio::apply_configuration(configuration, handle);

    EXPECT(handle.is_configured(), "Writer should be configured");
    EXPECT(handle.number_of_jobs() == 1, "Job count was not set");

    const auto* raw = handle.find_target("raw-id", "data");
    CHECK(raw);
    CHECK(raw->io_arguments.has_value());
    EXPECT((*raw->io_arguments)["chunks"] ==
             nlohmann::json(configuration.get("acquisition/Raw/data")
                              .chunk_shape()),
           "Unexpected chunks: ",
           raw->io_arguments->dump());
    EXPECT_STR_EQ(
      (*raw->io_arguments)["compressor"]["id"].get<std::string>(), "gzip");

    // the link is configured where its data lives
    const auto* link = handle.find_target("filtered-id", "timestamps");
    CHECK(link);
    CHECK(link->is_link);
    EXPECT(!link->io_arguments.has_value(), "Links take no arguments");

    EXPECT_THROWS(dsio::AlreadyConfiguredError,
                  dsio::apply_configuration(configuration, handle));
}

void
apply_to_hdf5_writer()
{
    const auto graph = make_graph();
    const auto configuration =
      dsio::BackendConfiguration::from_object_graph(graph, DsioBackend_HDF5);

    auto handle = dsio::WriterHandle::from_object_graph(graph);
    dsio::apply_configuration(configuration, handle);

    EXPECT(!handle.number_of_jobs().has_value(), "HDF5 takes no job count");
    const auto* timestamps = handle.find_target("raw-id", "timestamps");
    CHECK(timestamps && timestamps->io_arguments.has_value());
    EXPECT_STR_EQ(
      (*timestamps->io_arguments)["compression"].get<std::string>(), "gzip");
}

void
missing_target()
{
    const auto graph = make_graph();
    const auto configuration =
      dsio::BackendConfiguration::from_object_graph(graph, DsioBackend_HDF5);

    dsio::WriterHandle handle;
    handle.add_target("raw-id", "data");
    handle.add_target("raw-id", "timestamps");

    bool thrown = false;
    try {
        dsio::apply_configuration(configuration, handle);
    } catch (const dsio::TargetNotFoundError& exc) {
        thrown = true;
        const std::vector<std::string> expected{ "raw-id/data",
                                                 "raw-id/timestamps" };
        EXPECT(exc.alternatives() == expected,
               "Error should list the available targets");
    }
    EXPECT(thrown, "Expected TargetNotFoundError");

    // nothing was applied
    EXPECT(!handle.is_configured(), "Writer should not be configured");
    EXPECT(!handle.find_target("raw-id", "data")->io_arguments.has_value(),
           "Target was modified");
}

void
preconfigured_target()
{
    const auto graph = make_graph();
    const auto configuration =
      dsio::BackendConfiguration::from_object_graph(graph, DsioBackend_HDF5);

    auto handle = dsio::WriterHandle::from_object_graph(graph);
    handle.find_target("filtered-id", "data")->io_arguments =
      nlohmann::json{ { "chunks", { 10, 32 } } };

    EXPECT_THROWS(dsio::AlreadyConfiguredError,
                  dsio::apply_configuration(configuration, handle));
    EXPECT(!handle.find_target("raw-id", "data")->io_arguments.has_value(),
           "Target was modified");

    EXPECT_THROWS(dsio::InvalidSettingsError,
                  handle.add_target("raw-id", "data"));
}
void
two_locations_for_one_target()
{
    const auto graph = make_graph();
    auto configuration =
      dsio::BackendConfiguration::from_object_graph(graph, DsioBackend_HDF5);

    // a second location that resolves to the same writer target
    const std::string copy = "processing/RawCopy/data";
    configuration.set(copy,
                      dsio::DatasetDescriptor::from_defaults(
                        configuration.catalog(),
                        "raw-id",
                        copy,
                        "data",
                        { 600'000, 32 },
                        dsio::DataType(DsioDataType_int16),
                        {},
                        std::string("lzf")));

    auto handle = dsio::WriterHandle::from_object_graph(graph);
    EXPECT_THROWS(dsio::AlreadyConfiguredError,
                  dsio::apply_configuration(configuration, handle));
    EXPECT(!handle.is_configured(), "Writer should not be configured");
    EXPECT(!handle.find_target("raw-id", "data")->io_arguments.has_value(),
           "Target was modified");
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        apply_to_zarr_writer();
        apply_to_hdf5_writer();
        missing_target();
        preconfigured_target();
        two_locations_for_one_target();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
