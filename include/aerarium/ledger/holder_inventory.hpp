#pragma once

#include <cstdint>
#include <utility>

#include <aerarium/ledger/asset_identity.hpp>
#include <aerarium/ledger/error.hpp>
#include <aerarium/ledger/events.hpp>
#include <aerarium/ledger/execution_context.hpp>
#include <aerarium/ledger/value_unit.hpp>
#include <aerarium/protocol/account.hpp>

namespace aerarium::ledger {

/**
 * Root record of an account's inventory. Slots live in their own space.
 */
struct inventory_record
{
  event_handle deposit_events{ std::to_underlying( event_stream::deposited ), 0 };
  event_handle withdraw_events{ std::to_underlying( event_stream::withdrawn ), 0 };

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & deposit_events;
    ar & withdraw_events;
  }
};

/**
 * Per-account balances, one slot per token type the account has touched.
 */
class holder_inventory final
{
public:
  holder_inventory( execution_context& context ) noexcept;
  holder_inventory( const holder_inventory& ) = delete;
  holder_inventory( holder_inventory&& )      = delete;
  ~holder_inventory()                         = default;

  holder_inventory& operator=( const holder_inventory& ) = delete;
  holder_inventory& operator=( holder_inventory&& )      = delete;

  bool initialized( const protocol::account& account ) const;
  bool has_slot( const protocol::account& account, const asset_identity& identity ) const;

  void ensure_initialized( const protocol::account& account );
  std::error_code initialize_slot( const protocol::account& account, const asset_identity& identity );

  std::error_code deposit( const protocol::account& account, value_unit&& unit );
  std::error_code deposit_without_event( const protocol::account& account, value_unit&& unit );

  result< value_unit > withdraw( const protocol::account& account, const asset_identity& identity, std::uint64_t amount );

  std::uint64_t balance_of( const protocol::account& account, const asset_identity& identity ) const;

  std::error_code transfer( const protocol::account& from,
                            const protocol::account& to,
                            const asset_identity& identity,
                            std::uint64_t amount );

  std::error_code direct_transfer( const protocol::account& sender,
                                   const protocol::account& receiver,
                                   const asset_identity& identity,
                                   std::uint64_t amount );

private:
  inventory_record load_or_create( const protocol::account& account );
  std::error_code merge_into_slot( const protocol::account& account, value_unit& unit );

  execution_context& _context;
};

} // namespace aerarium::ledger
