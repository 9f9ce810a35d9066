#include <limits>

#include <boost/locale/utf.hpp>

#include <aerarium/ledger/capability.hpp>
#include <aerarium/ledger/collection_registry.hpp>
#include <aerarium/ledger/holder_inventory.hpp>
#include <aerarium/ledger/table.hpp>
#include <aerarium/log.hpp>

namespace aerarium::ledger {

using registry_resource = resource< registry_record >;
using collection_table  = table< std::string, collection_meta >;
using token_table       = table< asset_identity, token_meta >;
using mint_cap_table    = table< asset_identity, mint_capability >;
using burn_cap_table    = table< asset_identity, burn_capability >;

namespace {

template< typename T >
bool validate_utf( std::basic_string_view< T > str )
{
  auto it = str.begin();
  while( it != str.end() )
  {
    const boost::locale::utf::code_point cp = boost::locale::utf::utf_traits< T >::decode( it, str.end() );
    if( cp == boost::locale::utf::illegal )
      return false;
    else if( cp == boost::locale::utf::incomplete )
      return false;
  }
  return true;
}

} // namespace

collection_registry::collection_registry( execution_context& context ) noexcept:
    _context( context )
{}

std::error_code collection_registry::validate( const std::string& str, std::size_t limit ) const
{
  if( str.size() > limit )
    return ledger_errc::invalid_argument;

  if( !validate_utf( std::string_view( str ) ) )
    return ledger_errc::invalid_argument;

  return ledger_errc::ok;
}

std::error_code collection_registry::create_collection( const protocol::account& creator,
                                                        const std::string& name,
                                                        const std::string& description,
                                                        const std::string& uri,
                                                        std::optional< std::uint64_t > maximum )
{
  const auto& opts = _context.options();

  if( auto error = validate( name, opts.max_name_length ); error )
    return error;

  if( auto error = validate( description, opts.max_description_length ); error )
    return error;

  if( auto error = validate( uri, opts.max_uri_length ); error )
    return error;

  registry_resource registry( _context.state(), creator, space_id::registry );
  auto record = registry.get().value_or( registry_record{} );

  collection_table collections( _context.state(), creator, space_id::collections );

  if( collections.contains( name ) )
    return ledger_errc::collection_already_exists;

  collections.put( name, collection_meta{ name, description, uri, 0, maximum } );

  _context.emit( creator,
                 record.collection_events,
                 event_name::collection_created,
                 collection_created{ creator, name, uri, description, maximum } );
  registry.put( record );

  LOG_DEBUG( aerarium::log::instance(),
             "Created collection '{}' for creator {}",
             name,
             aerarium::log::hex{ creator.data(), creator.size() } );

  return ledger_errc::ok;
}

result< asset_identity > collection_registry::create_token_type( const protocol::account& creator,
                                                                 const std::string& collection,
                                                                 const std::string& name,
                                                                 const std::string& description,
                                                                 bool monitor_supply,
                                                                 std::uint64_t initial_amount,
                                                                 std::optional< std::uint64_t > maximum,
                                                                 const std::string& uri,
                                                                 std::uint64_t royalty_rate )
{
  const auto& opts = _context.options();

  if( auto error = validate( name, opts.max_name_length ); error )
    return std::unexpected( error );

  if( auto error = validate( description, opts.max_description_length ); error )
    return std::unexpected( error );

  if( auto error = validate( uri, opts.max_uri_length ); error )
    return std::unexpected( error );

  registry_resource registry( _context.state(), creator, space_id::registry );

  auto record = registry.get();
  if( !record )
    return std::unexpected( ledger_errc::registry_not_published );

  collection_table collections( _context.state(), creator, space_id::collections );

  auto meta = collections.get( collection );
  if( !meta )
    return std::unexpected( ledger_errc::collection_not_published );

  asset_identity identity{ creator, collection, name };
  token_table tokens( _context.state(), creator, space_id::token_metadata );

  if( tokens.contains( identity ) )
    return std::unexpected( ledger_errc::token_already_exists );

  if( meta->maximum && meta->count + 1 > *meta->maximum )
    return std::unexpected( ledger_errc::collection_limit_exceeded );

  meta->count++;
  collections.put( collection, *meta );

  token_meta metadata{ collection,
                       description,
                       uri,
                       maximum,
                       monitor_supply ? std::optional< std::uint64_t >( 0 ) : std::nullopt,
                       royalty{ royalty_rate } };
  tokens.put( identity, metadata );

  mint_cap_table( _context.state(), creator, space_id::mint_capabilities ).put( identity, mint_capability{ identity } );
  burn_cap_table( _context.state(), creator, space_id::burn_capabilities ).put( identity, burn_capability{ identity } );

  _context.emit( creator,
                 record->token_events,
                 event_name::token_type_created,
                 token_type_created{ identity, metadata, initial_amount } );
  registry.put( *record );

  if( initial_amount > 0 )
  {
    if( auto error = mint( creator, creator, identity, initial_amount ); error )
      return std::unexpected( error );
  }

  LOG_DEBUG( aerarium::log::instance(),
             "Created token type '{}' in collection '{}' for creator {}",
             name,
             collection,
             aerarium::log::hex{ creator.data(), creator.size() } );

  return identity;
}

std::error_code collection_registry::mint( const protocol::account& authorizer,
                                           const protocol::account& destination,
                                           const asset_identity& identity,
                                           std::uint64_t amount )
{
  if( !published( authorizer ) )
    return ledger_errc::registry_not_published;

  if( !has_mint_capability( authorizer, identity ) )
    return ledger_errc::no_mint_capability;

  token_table tokens( _context.state(), identity.creator, space_id::token_metadata );

  auto metadata = tokens.get( identity );
  if( !metadata )
    return ledger_errc::token_not_published;

  if( metadata->supply )
  {
    if( *metadata->supply > std::numeric_limits< std::uint64_t >::max() - amount )
      return ledger_errc::arithmetic_overflow;

    auto supply = *metadata->supply + amount;

    if( metadata->maximum && supply > *metadata->maximum )
      return ledger_errc::mint_limit_exceeded;

    metadata->supply = supply;
  }

  // Supply is only written once the new value has landed in a slot
  if( auto error = holder_inventory( _context ).deposit( destination, value_unit( identity, amount ) ); error )
    return error;

  if( metadata->supply )
    tokens.put( identity, *metadata );

  registry_resource registry( _context.state(), identity.creator, space_id::registry );

  auto record = registry.get();
  if( !record )
    return ledger_errc::registry_not_published;

  _context.emit( identity.creator, record->mint_events, event_name::minted, minted{ identity, amount } );
  registry.put( *record );

  return ledger_errc::ok;
}

std::error_code collection_registry::burn( const protocol::account& owner, value_unit&& unit )
{
  if( !published( owner ) )
    return ledger_errc::registry_not_published;

  if( !has_burn_capability( owner, unit.identity() ) )
    return ledger_errc::no_burn_capability;

  token_table tokens( _context.state(), unit.identity().creator, space_id::token_metadata );

  auto metadata = tokens.get( unit.identity() );
  if( !metadata )
    return ledger_errc::token_not_published;

  if( metadata->supply )
  {
    if( *metadata->supply < unit.amount() )
      return ledger_errc::arithmetic_underflow;

    *metadata->supply -= unit.take();
    tokens.put( unit.identity(), *metadata );
  }
  else
  {
    unit.take();
  }

  return ledger_errc::ok;
}

bool collection_registry::published( const protocol::account& creator ) const
{
  return registry_resource( _context.state(), creator, space_id::registry ).exists();
}

std::optional< collection_meta > collection_registry::collection( const protocol::account& creator,
                                                                  const std::string& name ) const
{
  return collection_table( _context.state(), creator, space_id::collections ).get( name );
}

std::optional< token_meta > collection_registry::token( const asset_identity& identity ) const
{
  return token_table( _context.state(), identity.creator, space_id::token_metadata ).get( identity );
}

std::optional< std::uint64_t > collection_registry::supply( const asset_identity& identity ) const
{
  if( auto metadata = token( identity ); metadata )
    return metadata->supply;

  return {};
}

bool collection_registry::has_mint_capability( const protocol::account& account,
                                               const asset_identity& identity ) const
{
  return mint_cap_table( _context.state(), account, space_id::mint_capabilities ).contains( identity );
}

bool collection_registry::has_burn_capability( const protocol::account& account,
                                               const asset_identity& identity ) const
{
  return burn_cap_table( _context.state(), account, space_id::burn_capabilities ).contains( identity );
}

} // namespace aerarium::ledger
