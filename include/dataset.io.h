#ifndef H_DATASET_IO_V0
#define H_DATASET_IO_V0

#include "dataset.io.types.h"

#define DATASET_IO_API_VERSION 0

#ifdef __cplusplus
extern "C"
{
#endif

    /**
     * @brief Get the version of the dataset I/O API.
     * @return The version of the dataset I/O API.
     */
    uint32_t Dsio_get_api_version();

    /**
     * @brief Set the log level for the dataset I/O API.
     * @param level The log level.
     * @return DsioStatusCode_Success on success, or an error code on failure.
     */
    DsioStatusCode Dsio_set_log_level(DsioLogLevel level);

    /**
     * @brief Get the log level for the dataset I/O API.
     * @return The log level for the dataset I/O API.
     */
    DsioLogLevel Dsio_get_log_level();

    /**
     * @brief Get the message for the given status code.
     * @param status The status code.
     * @return A human-readable status message.
     */
    const char* Dsio_get_status_message(DsioStatusCode status);

    /**
     * @brief Estimate default chunk and buffer shapes for an array.
     * @details The chunk shape is grown from a unit shape until it reaches the
     * chunk target, and the buffer shape is grown from the chunk shape until
     * it reaches the buffer target. Along every axis not spanning the whole
     * array, the buffer shape is a multiple of the chunk shape.
     * @param[in] full_shape The extent of the full array along each axis.
     * @param[in] rank The number of axes in @p full_shape.
     * @param[in] data_type The element type of the array.
     * @param[in] settings Optional target sizes. NULL selects the defaults.
     * @param[out] chunk_shape Array of @p rank elements receiving the chunk
     * shape.
     * @param[out] buffer_shape Array of @p rank elements receiving the buffer
     * shape.
     * @return DsioStatusCode_Success on success, or an error code on failure.
     */
    DsioStatusCode Dsio_estimate_default_shapes(
      const uint64_t* full_shape,
      size_t rank,
      DsioDataType data_type,
      const DsioEstimationSettings* settings,
      uint64_t* chunk_shape,
      uint64_t* buffer_shape);

    /**
     * @brief Estimate the memory, in bytes, held by a single write buffer.
     * @param[in] buffer_shape The buffer shape.
     * @param[in] rank The number of axes in @p buffer_shape.
     * @param[in] data_type The element type of the array.
     * @param[out] usage The estimated memory usage, in bytes.
     * @return DsioStatusCode_Success on success, or an error code on failure.
     */
    DsioStatusCode Dsio_estimate_buffer_memory_usage(
      const uint64_t* buffer_shape,
      size_t rank,
      DsioDataType data_type,
      uint64_t* usage);

    /**
     * @brief Check whether a compression method can be selected by name for
     * a backend, using the backend's native codec set.
     * @param[in] backend The backend kind.
     * @param[in] name The compression method name.
     * @param[out] available True if @p name resolves, false otherwise.
     * @return DsioStatusCode_Success on success, or an error code on failure.
     */
    DsioStatusCode Dsio_is_compression_method_available(DsioBackend backend,
                                                        const char* name,
                                                        bool* available);

#ifdef __cplusplus
}
#endif

#endif // H_DATASET_IO_V0
