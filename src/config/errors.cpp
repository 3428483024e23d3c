#include "errors.hh"

#include <algorithm>

dsio::LookupError::LookupError(const std::string& what,
                               std::vector<std::string> alternatives)
  : ConfigurationError(what)
  , alternatives_(std::move(alternatives))
{
    std::sort(alternatives_.begin(), alternatives_.end());
}

const std::vector<std::string>&
dsio::LookupError::alternatives() const noexcept
{
    return alternatives_;
}
