#pragma once

/// @file include/qmj/errors.hpp
/// @brief Exception types raised at the configuration and ingestion
///        boundaries. The per-period core never throws them.

#include <stdexcept>
#include <string>

namespace qmj {

/// Invalid configuration or a required input column that is absent.
/// Raised before any period is processed.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Malformed input data: unparseable cells, duplicate keys.
class DataError : public std::runtime_error {
public:
    explicit DataError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace qmj
