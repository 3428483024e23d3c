#pragma once

#include "logger.hh"

#include <stdexcept>

#define EXPECT_AS(ErrorType, e, ...)                                           \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw ErrorType(__err);                                            \
        }                                                                      \
    } while (0)
#define EXPECT(e, ...) EXPECT_AS(std::runtime_error, e, __VA_ARGS__)
#define CHECK(e) EXPECT(e, "Expression evaluated as false:\n\t", #e)

#define EXPECT_VALID_ARGUMENT(e, ...)                                          \
    do {                                                                       \
        if (!(e)) {                                                            \
            LOG_ERROR(__VA_ARGS__);                                            \
            return DsioStatusCode_InvalidArgument;                             \
        }                                                                      \
    } while (0)

// for lookup errors, which carry the valid alternatives
#define EXPECT_FOUND(ErrorType, e, alternatives, ...)                          \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw ErrorType(__err, alternatives);                              \
        }                                                                      \
    } while (0)
