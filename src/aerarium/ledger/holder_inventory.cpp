#include <aerarium/ledger/holder_inventory.hpp>
#include <aerarium/ledger/table.hpp>

namespace aerarium::ledger {

using inventory_resource = resource< inventory_record >;
using balance_table      = table< asset_identity, std::uint64_t >;

holder_inventory::holder_inventory( execution_context& context ) noexcept:
    _context( context )
{}

bool holder_inventory::initialized( const protocol::account& account ) const
{
  return inventory_resource( _context.state(), account, space_id::inventory ).exists();
}

bool holder_inventory::has_slot( const protocol::account& account, const asset_identity& identity ) const
{
  return balance_table( _context.state(), account, space_id::balances ).contains( identity );
}

inventory_record holder_inventory::load_or_create( const protocol::account& account )
{
  inventory_resource inventory( _context.state(), account, space_id::inventory );

  if( auto record = inventory.get(); record )
    return *record;

  inventory_record record;
  inventory.put( record );
  return record;
}

void holder_inventory::ensure_initialized( const protocol::account& account )
{
  load_or_create( account );
}

std::error_code holder_inventory::initialize_slot( const protocol::account& account, const asset_identity& identity )
{
  if( !initialized( account ) )
    return ledger_errc::store_not_published;

  balance_table balances( _context.state(), account, space_id::balances );

  if( balances.contains( identity ) )
    return ledger_errc::already_has_balance;

  balances.put( identity, 0 );
  return ledger_errc::ok;
}

std::error_code holder_inventory::merge_into_slot( const protocol::account& account, value_unit& unit )
{
  balance_table balances( _context.state(), account, space_id::balances );

  auto slot = value_unit( unit.identity(), balances.get( unit.identity() ).value_or( 0 ) );

  if( auto error = merge( slot, std::move( unit ) ); error )
    return error;

  balances.put( slot.identity(), slot.take() );
  return ledger_errc::ok;
}

std::error_code holder_inventory::deposit( const protocol::account& account, value_unit&& unit )
{
  auto record = load_or_create( account );

  const deposited payload{ unit.identity(), unit.amount() };

  if( auto error = merge_into_slot( account, unit ); error )
    return error;

  _context.emit( account, record.deposit_events, event_name::deposited, payload );
  inventory_resource( _context.state(), account, space_id::inventory ).put( record );

  return ledger_errc::ok;
}

std::error_code holder_inventory::deposit_without_event( const protocol::account& account, value_unit&& unit )
{
  load_or_create( account );
  return merge_into_slot( account, unit );
}

result< value_unit >
holder_inventory::withdraw( const protocol::account& account, const asset_identity& identity, std::uint64_t amount )
{
  inventory_resource inventory( _context.state(), account, space_id::inventory );

  auto record = inventory.get();
  if( !record )
    return std::unexpected( ledger_errc::store_not_published );

  balance_table balances( _context.state(), account, space_id::balances );

  auto balance = balances.get( identity );
  if( !balance )
    return std::unexpected( ledger_errc::balance_not_published );

  if( *balance < amount )
    return std::unexpected( ledger_errc::arithmetic_underflow );

  balances.put( identity, *balance - amount );

  _context.emit( account, record->withdraw_events, event_name::withdrawn, withdrawn{ identity, amount } );
  inventory.put( *record );

  return value_unit( identity, amount );
}

std::uint64_t holder_inventory::balance_of( const protocol::account& account, const asset_identity& identity ) const
{
  return balance_table( _context.state(), account, space_id::balances ).get( identity ).value_or( 0 );
}

std::error_code holder_inventory::transfer( const protocol::account& from,
                                            const protocol::account& to,
                                            const asset_identity& identity,
                                            std::uint64_t amount )
{
  auto unit = withdraw( from, identity, amount );
  if( !unit )
    return unit.error();

  return deposit( to, std::move( *unit ) );
}

std::error_code holder_inventory::direct_transfer( const protocol::account& sender,
                                                   const protocol::account& receiver,
                                                   const asset_identity& identity,
                                                   std::uint64_t amount )
{
  auto unit = withdraw( sender, identity, amount );
  if( !unit )
    return unit.error();

  ensure_initialized( receiver );
  return deposit( receiver, std::move( *unit ) );
}

} // namespace aerarium::ledger
