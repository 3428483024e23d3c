#include "compression.catalog.hh"
#include "definitions.hh"
#include "errors.hh"
#include "unit.test.macros.hh"

#include <algorithm>

namespace {
bool
has_name(const std::vector<std::string>& names, const std::string& name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

void
check_deny_list(DsioBackend backend)
{
    const auto catalog = dsio::CompressionCatalog::native(backend);
    const auto names = catalog->names();

    for (const auto& denied : dsio::CompressionCatalog::denied_names(backend)) {
        EXPECT(!catalog->contains(denied),
               "Denied codec '",
               denied,
               "' is resolvable");
        EXPECT(!has_name(names, denied), "Denied codec '", denied, "' listed");
        EXPECT_THROWS(dsio::UnknownCompressionMethodError,
                      catalog->resolve(denied));
    }

    // everything else that is native stays
    for (const auto& native : dsio::CompressionCatalog::native_names(backend)) {
        const auto& denied = dsio::CompressionCatalog::denied_names(backend);
        if (!has_name(denied, native)) {
            EXPECT(has_name(names, native), "Missing codec '", native, "'");
        }
    }

    EXPECT(std::is_sorted(names.begin(), names.end()), "Names are not sorted");
}

void
check_hdf5_names()
{
    const auto catalog = dsio::CompressionCatalog::native(DsioBackend_HDF5);
    const std::vector<std::string> expected{ "gzip", "lzf", "szip" };
    EXPECT(catalog->names() == expected, "Unexpected HDF5 codecs");

    EXPECT_EQ(int, catalog->resolve("gzip").filter_id, 1);
    EXPECT_EQ(int, catalog->resolve("lzf").filter_id, 32000);
    EXPECT(catalog->resolve("szip").origin == dsio::CodecOrigin::Native,
           "szip should be native");
}

void
check_zarr_names()
{
    const auto catalog = dsio::CompressionCatalog::native(DsioBackend_Zarr);
    const std::vector<std::string> expected{
        "blosc", "bz2",  "categorize", "delta", "gzip",
        "lz4",   "lzma", "packbits",   "zlib",  "zstd",
    };
    EXPECT(catalog->names() == expected, "Unexpected Zarr codecs");
}

void
check_generic_lossless()
{
    for (auto backend : { DsioBackend_HDF5, DsioBackend_Zarr }) {
        const auto catalog = dsio::CompressionCatalog::native(backend);
        EXPECT(catalog->contains(dsio::GENERIC_LOSSLESS_COMPRESSION),
               "Generic lossless compression should resolve");
        EXPECT_STR_EQ(
          catalog->resolve(dsio::GENERIC_LOSSLESS_COMPRESSION).name, "gzip");
    }
}

void
check_unknown_lists_alternatives()
{
    const auto catalog = dsio::CompressionCatalog::native(DsioBackend_HDF5);

    bool thrown = false;
    try {
        catalog->resolve("not-a-codec");
    } catch (const dsio::UnknownCompressionMethodError& exc) {
        thrown = true;
        EXPECT(exc.alternatives() == catalog->names(),
               "Error should list the valid names");

        const std::string what = exc.what();
        EXPECT(what.find("not-a-codec") != std::string::npos,
               "Message should name the method: ",
               what);
        EXPECT(what.find("lzf") != std::string::npos,
               "Message should list valid methods: ",
               what);
    }
    EXPECT(thrown, "Expected UnknownCompressionMethodError");

    // "none" is not a codec
    EXPECT(!catalog->contains("none"), "'none' should not resolve");
}

void
check_plugin_providers()
{
    dsio::CodecProvider provider{
        .name = "hdf5plugin",
        .backend = DsioBackend_HDF5,
        .codecs = {
          { .name = "zstd", .backend = DsioBackend_HDF5, .filter_id = 32015 },
          { .name = "bitshuffle",
            .backend = DsioBackend_HDF5,
            .filter_id = 32008 },
          { .name = "sz", .backend = DsioBackend_HDF5, .filter_id = 32017, .lossy = true },
          { .name = "fletcher32",
            .backend = DsioBackend_HDF5,
            .filter_id = 32099 },
          { .name = "gzip", .backend = DsioBackend_HDF5, .filter_id = 32100 },
          { .name = "nofilter", .backend = DsioBackend_HDF5 },
        },
    };

    const dsio::CompressionCatalog catalog(DsioBackend_HDF5, { provider });

    EXPECT(catalog.contains("zstd"), "Plugin codec zstd should resolve");
    EXPECT(catalog.contains("bitshuffle"), "Plugin codec bitshuffle should resolve");
    EXPECT(catalog.resolve("zstd").origin == dsio::CodecOrigin::Plugin,
           "zstd should come from a plugin");
    EXPECT_EQ(int, catalog.resolve("zstd").filter_id, 32015);

    EXPECT(!catalog.contains("sz"), "Lossy plugin codecs must not resolve");
    EXPECT(!catalog.contains("fletcher32"), "Denied names must not resolve");
    EXPECT(!catalog.contains("nofilter"), "Codecs without filter ids must not resolve");

    // plugins never override native codecs
    EXPECT_EQ(int, catalog.resolve("gzip").filter_id, 1);
    EXPECT(catalog.resolve("gzip").origin == dsio::CodecOrigin::Native,
           "gzip should stay native");

    // the shared native catalog is unaffected
    EXPECT(!dsio::CompressionCatalog::native(DsioBackend_HDF5)->contains("zstd"),
           "Native catalog should not see plugin codecs");

    dsio::CodecProvider zarr_provider{ .name = "numcodecs-extra",
                                       .backend = DsioBackend_Zarr };
    EXPECT_THROWS(
      dsio::BackendCompressionMismatchError,
      (void)dsio::CompressionCatalog(DsioBackend_HDF5, { zarr_provider }));
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        check_deny_list(DsioBackend_HDF5);
        check_deny_list(DsioBackend_Zarr);
        check_hdf5_names();
        check_zarr_names();
        check_generic_lossless();
        check_unknown_lists_alternatives();
        check_plugin_providers();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
