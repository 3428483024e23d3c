#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace dsio {
/**
 * @brief Base class of every error raised while building, validating or
 * applying a backend configuration.
 */
class ConfigurationError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Raised when a name or identifier does not resolve.
 * @details Carries the valid alternatives, sorted, so that callers can
 * present them.
 */
class LookupError : public ConfigurationError
{
  public:
    LookupError(const std::string& what, std::vector<std::string> alternatives);

    const std::vector<std::string>& alternatives() const noexcept;

  private:
    std::vector<std::string> alternatives_;
};

// shape errors
class InvalidShapeError : public ConfigurationError
{
  public:
    using ConfigurationError::ConfigurationError;
};

class ShapeMismatchError : public ConfigurationError
{
  public:
    using ConfigurationError::ConfigurationError;
};

// lookup errors
class UnknownCompressionMethodError : public LookupError
{
  public:
    using LookupError::LookupError;
};

class TargetNotFoundError : public LookupError
{
  public:
    using LookupError::LookupError;
};

class LocationNotFoundError : public LookupError
{
  public:
    using LookupError::LookupError;
};

// cross-backend errors
class BackendCompressionMismatchError : public ConfigurationError
{
  public:
    using ConfigurationError::ConfigurationError;
};

// the requested backend is not the one of the file being appended to
class BackendMismatchError : public ConfigurationError
{
  public:
    using ConfigurationError::ConfigurationError;
};

// unsupported data
class UnsupportedDtypeError : public ConfigurationError
{
  public:
    using ConfigurationError::ConfigurationError;
};

// sequencing errors
class AlreadyConfiguredError : public ConfigurationError
{
  public:
    using ConfigurationError::ConfigurationError;
};

class NoWritableDatasetsError : public ConfigurationError
{
  public:
    using ConfigurationError::ConfigurationError;
};

// validation of other fields
class InvalidLocationError : public ConfigurationError
{
  public:
    using ConfigurationError::ConfigurationError;
};

class LocationMismatchError : public ConfigurationError
{
  public:
    using ConfigurationError::ConfigurationError;
};

class InvalidFilterConfigurationError : public ConfigurationError
{
  public:
    using ConfigurationError::ConfigurationError;
};

class InvalidCompressionOptionsError : public ConfigurationError
{
  public:
    using ConfigurationError::ConfigurationError;
};

class InvalidJobCountError : public ConfigurationError
{
  public:
    using ConfigurationError::ConfigurationError;
};

class InvalidSettingsError : public ConfigurationError
{
  public:
    using ConfigurationError::ConfigurationError;
};
} // namespace dsio
