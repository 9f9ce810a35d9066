#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include <aerarium/ledger/asset_identity.hpp>
#include <aerarium/ledger/error.hpp>
#include <aerarium/ledger/events.hpp>
#include <aerarium/ledger/execution_context.hpp>
#include <aerarium/ledger/types.hpp>
#include <aerarium/ledger/value_unit.hpp>
#include <aerarium/protocol/account.hpp>

namespace aerarium::ledger {

/**
 * Root record of a creator's registry. Collections, token metadata and
 * capabilities live in their own spaces.
 */
struct registry_record
{
  event_handle collection_events{ std::to_underlying( event_stream::collection_created ), 0 };
  event_handle token_events{ std::to_underlying( event_stream::token_type_created ), 0 };
  event_handle mint_events{ std::to_underlying( event_stream::minted ), 0 };

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & collection_events;
    ar & token_events;
    ar & mint_events;
  }
};

/**
 * Collections and token types defined by each creator, and the capabilities
 * that gate minting and burning them.
 */
class collection_registry final
{
public:
  collection_registry( execution_context& context ) noexcept;
  collection_registry( const collection_registry& ) = delete;
  collection_registry( collection_registry&& )      = delete;
  ~collection_registry()                            = default;

  collection_registry& operator=( const collection_registry& ) = delete;
  collection_registry& operator=( collection_registry&& )      = delete;

  std::error_code create_collection( const protocol::account& creator,
                                     const std::string& name,
                                     const std::string& description,
                                     const std::string& uri,
                                     std::optional< std::uint64_t > maximum );

  /**
   * Defines a token type in one of the creator's collections and returns its
   * identity. A positive initial amount is minted in to the creator's own
   * inventory. Without supply monitoring the maximum is recorded but not
   * enforced.
   */
  result< asset_identity > create_token_type( const protocol::account& creator,
                                              const std::string& collection,
                                              const std::string& name,
                                              const std::string& description,
                                              bool monitor_supply,
                                              std::uint64_t initial_amount,
                                              std::optional< std::uint64_t > maximum,
                                              const std::string& uri,
                                              std::uint64_t royalty_rate );

  /**
   * Mints in to the destination inventory. The mint capability is looked up
   * in the authorizer's registry, the metadata under the identity's creator.
   */
  std::error_code mint( const protocol::account& authorizer,
                        const protocol::account& destination,
                        const asset_identity& identity,
                        std::uint64_t amount );

  std::error_code burn( const protocol::account& owner, value_unit&& unit );

  bool published( const protocol::account& creator ) const;
  std::optional< collection_meta > collection( const protocol::account& creator, const std::string& name ) const;
  std::optional< token_meta > token( const asset_identity& identity ) const;
  std::optional< std::uint64_t > supply( const asset_identity& identity ) const;

  bool has_mint_capability( const protocol::account& account, const asset_identity& identity ) const;
  bool has_burn_capability( const protocol::account& account, const asset_identity& identity ) const;

private:
  std::error_code validate( const std::string& str, std::size_t limit ) const;

  execution_context& _context;
};

} // namespace aerarium::ledger
