#ifndef H_DATASET_IO_TYPES_V0
#define H_DATASET_IO_TYPES_V0

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        DsioStatusCode_Success = 0,
        DsioStatusCode_InvalidArgument,
        DsioStatusCode_InvalidShape,
        DsioStatusCode_ShapeMismatch,
        DsioStatusCode_UnknownCompressionMethod,
        DsioStatusCode_UnsupportedDataType,
        DsioStatusCode_InvalidSettings,
        DsioStatusCode_InternalError,
        DsioStatusCodeCount,
    } DsioStatusCode;

    typedef enum
    {
        DsioLogLevel_Debug = 0,
        DsioLogLevel_Info,
        DsioLogLevel_Warning,
        DsioLogLevel_Error,
        DsioLogLevel_None,
        DsioLogLevelCount
    } DsioLogLevel;

    typedef enum
    {
        DsioDataType_uint8 = 0,
        DsioDataType_uint16,
        DsioDataType_uint32,
        DsioDataType_uint64,
        DsioDataType_int8,
        DsioDataType_int16,
        DsioDataType_int32,
        DsioDataType_int64,
        DsioDataType_float32,
        DsioDataType_float64,
        DsioDataType_bool,
        DsioDataType_string,
        DsioDataType_object,
        DsioDataTypeCount
    } DsioDataType;

    typedef enum
    {
        DsioBackend_HDF5 = 0,
        DsioBackend_Zarr,
        DsioBackendCount
    } DsioBackend;

    /**
     * @brief Target sizes used when estimating default chunk and buffer
     * shapes.
     * @details A zero target selects the library default (10 MB per chunk,
     * 0.5 GB per buffer).
     */
    typedef struct
    {
        uint64_t chunk_target_bytes;  /**< Target size of a single chunk */
        uint64_t buffer_target_bytes; /**< Target size of the write buffer */
    } DsioEstimationSettings;

#ifdef __cplusplus
}
#endif

#endif // H_DATASET_IO_TYPES_V0
