#include "dataset.io.h"
#include "compression.catalog.hh"
#include "data.type.hh"
#include "errors.hh"
#include "macros.hh"
#include "shape.estimator.hh"

#include <algorithm>

namespace {
DsioStatusCode
translate_error(const std::exception& exc)
{
    if (dynamic_cast<const dsio::InvalidShapeError*>(&exc)) {
        return DsioStatusCode_InvalidShape;
    }
    if (dynamic_cast<const std::overflow_error*>(&exc)) {
        return DsioStatusCode_InvalidShape;
    }
    if (dynamic_cast<const dsio::ShapeMismatchError*>(&exc)) {
        return DsioStatusCode_ShapeMismatch;
    }
    if (dynamic_cast<const dsio::UnknownCompressionMethodError*>(&exc)) {
        return DsioStatusCode_UnknownCompressionMethod;
    }
    if (dynamic_cast<const dsio::UnsupportedDtypeError*>(&exc)) {
        return DsioStatusCode_UnsupportedDataType;
    }
    if (dynamic_cast<const dsio::InvalidSettingsError*>(&exc)) {
        return DsioStatusCode_InvalidSettings;
    }

    return DsioStatusCode_InternalError;
}
} // namespace

extern "C"
{
    uint32_t Dsio_get_api_version()
    {
        return DATASET_IO_API_VERSION;
    }

    DsioStatusCode Dsio_set_log_level(DsioLogLevel level)
    {
        EXPECT_VALID_ARGUMENT(
          level < DsioLogLevelCount, "Invalid log level: ", level);

        try {
            Logger::set_log_level(level);
        } catch (const std::exception& e) {
            LOG_ERROR("Error setting log level: ", e.what());
            return DsioStatusCode_InternalError;
        }
        return DsioStatusCode_Success;
    }

    DsioLogLevel Dsio_get_log_level()
    {
        return Logger::get_log_level();
    }

    const char* Dsio_get_status_message(DsioStatusCode code)
    {
        switch (code) {
            case DsioStatusCode_Success:
                return "Success";
            case DsioStatusCode_InvalidArgument:
                return "Invalid argument";
            case DsioStatusCode_InvalidShape:
                return "Invalid shape";
            case DsioStatusCode_ShapeMismatch:
                return "Shape mismatch";
            case DsioStatusCode_UnknownCompressionMethod:
                return "Unknown compression method";
            case DsioStatusCode_UnsupportedDataType:
                return "Unsupported data type";
            case DsioStatusCode_InvalidSettings:
                return "Invalid settings";
            case DsioStatusCode_InternalError:
                return "Internal error";
            default:
                return "Unknown error";
        }
    }

    DsioStatusCode Dsio_estimate_default_shapes(
      const uint64_t* full_shape,
      size_t rank,
      DsioDataType data_type,
      const DsioEstimationSettings* settings,
      uint64_t* chunk_shape,
      uint64_t* buffer_shape)
    {
        EXPECT_VALID_ARGUMENT(full_shape, "Null pointer: full_shape");
        EXPECT_VALID_ARGUMENT(chunk_shape, "Null pointer: chunk_shape");
        EXPECT_VALID_ARGUMENT(buffer_shape, "Null pointer: buffer_shape");
        EXPECT_VALID_ARGUMENT(rank > 0, "Invalid rank: ", rank);
        EXPECT_VALID_ARGUMENT(
          data_type < DsioDataTypeCount, "Invalid data type: ", data_type);

        dsio::EstimationTargets targets;
        if (settings) {
            if (settings->chunk_target_bytes > 0) {
                targets.chunk_target_bytes = settings->chunk_target_bytes;
            }
            if (settings->buffer_target_bytes > 0) {
                targets.buffer_target_bytes = settings->buffer_target_bytes;
            }
        }

        try {
            const dsio::DataType dtype(data_type);
            const dsio::Shape shape(full_shape, full_shape + rank);
            const auto estimate =
              dsio::estimate_default_shapes(shape, dtype.itemsize(), targets);

            std::copy(estimate.chunk_shape.begin(),
                      estimate.chunk_shape.end(),
                      chunk_shape);
            std::copy(estimate.buffer_shape.begin(),
                      estimate.buffer_shape.end(),
                      buffer_shape);
        } catch (const std::exception& exc) {
            LOG_ERROR("Error estimating shapes: ", exc.what());
            return translate_error(exc);
        }

        return DsioStatusCode_Success;
    }

    DsioStatusCode Dsio_estimate_buffer_memory_usage(
      const uint64_t* buffer_shape,
      size_t rank,
      DsioDataType data_type,
      uint64_t* usage)
    {
        EXPECT_VALID_ARGUMENT(buffer_shape, "Null pointer: buffer_shape");
        EXPECT_VALID_ARGUMENT(usage, "Null pointer: usage");
        EXPECT_VALID_ARGUMENT(
          data_type < DsioDataTypeCount, "Invalid data type: ", data_type);

        try {
            const dsio::DataType dtype(data_type);
            *usage = dsio::estimate_memory_usage(
              dsio::Shape(buffer_shape, buffer_shape + rank), dtype.itemsize());
        } catch (const std::exception& exc) {
            LOG_ERROR("Error estimating memory usage: ", exc.what());
            return translate_error(exc);
        }

        return DsioStatusCode_Success;
    }

    DsioStatusCode Dsio_is_compression_method_available(DsioBackend backend,
                                                        const char* name,
                                                        bool* available)
    {
        EXPECT_VALID_ARGUMENT(name, "Null pointer: name");
        EXPECT_VALID_ARGUMENT(available, "Null pointer: available");
        EXPECT_VALID_ARGUMENT(
          backend < DsioBackendCount, "Invalid backend: ", backend);

        try {
            *available = dsio::CompressionCatalog::native(backend)->contains(name);
        } catch (const std::exception& exc) {
            LOG_ERROR("Error looking up compression method: ", exc.what());
            return translate_error(exc);
        }

        return DsioStatusCode_Success;
    }
}
