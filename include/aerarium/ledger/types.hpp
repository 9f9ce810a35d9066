#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <boost/serialization/string.hpp>

#include <aerarium/protocol/serialization.hpp>

namespace aerarium::ledger {

struct royalty
{
  std::uint64_t rate = 0;

  bool operator==( const royalty& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & rate;
  }
};

struct collection_meta
{
  std::string name;
  std::string description;
  std::string uri;
  std::uint64_t count = 0;
  std::optional< std::uint64_t > maximum;

  bool operator==( const collection_meta& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & name;
    ar & description;
    ar & uri;
    ar & count;
    ar & maximum;
  }
};

struct token_meta
{
  std::string collection;
  std::string description;
  std::string uri;
  std::optional< std::uint64_t > maximum;
  std::optional< std::uint64_t > supply;
  ledger::royalty royalty;

  bool operator==( const token_meta& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & collection;
    ar & description;
    ar & uri;
    ar & maximum;
    ar & supply;
    ar & royalty;
  }
};

/**
 * Limits on the user supplied strings stored by the ledger, in bytes.
 */
struct options
{
  std::size_t max_name_length        = 128;
  std::size_t max_description_length = 2'048;
  std::size_t max_uri_length         = 512;
};

} // namespace aerarium::ledger
