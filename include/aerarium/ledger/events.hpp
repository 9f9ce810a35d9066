#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <aerarium/ledger/asset_identity.hpp>
#include <aerarium/ledger/types.hpp>
#include <aerarium/protocol/account.hpp>

namespace aerarium::ledger {

/**
 * Event streams. Each resource owns one handle per stream it emits on.
 */
enum class event_stream : std::uint32_t // NOLINT(performance-enum-size)
{
  collection_created,
  token_type_created,
  minted,
  deposited,
  withdrawn
};

namespace event_name {

constexpr std::string_view collection_created = "aerarium.collection_created";
constexpr std::string_view token_type_created = "aerarium.token_type_created";
constexpr std::string_view minted             = "aerarium.minted";
constexpr std::string_view deposited          = "aerarium.deposited";
constexpr std::string_view withdrawn          = "aerarium.withdrawn";

} // namespace event_name

struct event_handle
{
  std::uint32_t stream  = 0;
  std::uint64_t counter = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & stream;
    ar & counter;
  }
};

struct collection_created
{
  protocol::account creator{};
  std::string name;
  std::string uri;
  std::string description;
  std::optional< std::uint64_t > maximum;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & creator;
    ar & name;
    ar & uri;
    ar & description;
    ar & maximum;
  }
};

struct token_type_created
{
  asset_identity identity;
  token_meta metadata;
  std::uint64_t initial_amount = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & identity;
    ar & metadata;
    ar & initial_amount;
  }
};

struct minted
{
  asset_identity identity;
  std::uint64_t amount = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & identity;
    ar & amount;
  }
};

struct deposited
{
  asset_identity identity;
  std::uint64_t amount = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & identity;
    ar & amount;
  }
};

struct withdrawn
{
  asset_identity identity;
  std::uint64_t amount = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & identity;
    ar & amount;
  }
};

} // namespace aerarium::ledger
