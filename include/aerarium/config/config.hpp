#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <aerarium/config/error.hpp>
#include <aerarium/ledger/types.hpp>

namespace aerarium::config {

namespace section {

constexpr std::string_view global = "global";
constexpr std::string_view ledger = "ledger";

} // namespace section

namespace option {

constexpr std::string_view log_level              = "log-level";
constexpr std::string_view max_name_length        = "max-name-length";
constexpr std::string_view max_description_length = "max-description-length";
constexpr std::string_view max_uri_length         = "max-uri-length";

} // namespace option

struct options
{
  std::string log_level = "info";
  aerarium::ledger::options ledger;
};

/**
 * Reads the YAML document at path. Options are taken from the "ledger"
 * section, then the "global" section, and fall back to their defaults.
 */
result< options > load( const std::filesystem::path& path );

/**
 * Same as load, for a document held in memory. An empty document yields the
 * defaults.
 */
result< options > parse( std::string_view document );

} // namespace aerarium::config
