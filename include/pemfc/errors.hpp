#pragma once

#include <stdexcept>
#include <string>

namespace pemfc {

// A parameter outside its physical domain (T, pressures, alpha, resistance, i_limit,
// or sweep options).
class InvalidParameter : public std::invalid_argument {
public:
  explicit InvalidParameter(const std::string& what) : std::invalid_argument(what) {}
};

// A loss equation evaluated where it has no finite value.
class DomainError : public std::domain_error {
public:
  explicit DomainError(const std::string& what) : std::domain_error(what) {}
};

} // namespace pemfc
