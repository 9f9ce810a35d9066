#include <aerarium/controller/controller.hpp>

#include <aerarium/log.hpp>

#include <memory>
#include <utility>

namespace aerarium::controller {

controller::controller( const ledger::options& options ):
    _options( options )
{}

controller::controller( const config::options& options ):
    _options( options.ledger )
{
  aerarium::log::set_level( options.log_level );
}

controller::~controller()
{
  close();
}

void controller::open()
{
  _db.open();
  LOG_INFO( aerarium::log::instance(), "Opened ledger database" );
}

void controller::close()
{
  _db.close();
}

std::error_code controller::create_limited_collection( const protocol::account& creator,
                                                       const std::string& name,
                                                       const std::string& description,
                                                       const std::string& uri,
                                                       std::uint64_t maximum )
{
  return execute(
    [ & ]( ledger::execution_context& context )
    {
      return ledger::collection_registry( context ).create_collection( creator, name, description, uri, maximum );
    } );
}

std::error_code controller::create_unlimited_collection( const protocol::account& creator,
                                                         const std::string& name,
                                                         const std::string& description,
                                                         const std::string& uri )
{
  return execute(
    [ & ]( ledger::execution_context& context )
    {
      return ledger::collection_registry( context ).create_collection( creator,
                                                                       name,
                                                                       description,
                                                                       uri,
                                                                       std::nullopt );
    } );
}

ledger::result< ledger::asset_identity > controller::create_limited_token( const protocol::account& creator,
                                                                           const std::string& collection,
                                                                           const std::string& name,
                                                                           const std::string& description,
                                                                           bool monitor_supply,
                                                                           std::uint64_t initial_amount,
                                                                           std::uint64_t maximum,
                                                                           const std::string& uri,
                                                                           std::uint64_t royalty_rate )
{
  return execute(
    [ & ]( ledger::execution_context& context )
    {
      return ledger::collection_registry( context ).create_token_type( creator,
                                                                       collection,
                                                                       name,
                                                                       description,
                                                                       monitor_supply,
                                                                       initial_amount,
                                                                       maximum,
                                                                       uri,
                                                                       royalty_rate );
    } );
}

ledger::result< ledger::asset_identity > controller::create_unlimited_token( const protocol::account& creator,
                                                                             const std::string& collection,
                                                                             const std::string& name,
                                                                             const std::string& description,
                                                                             bool monitor_supply,
                                                                             std::uint64_t initial_amount,
                                                                             const std::string& uri,
                                                                             std::uint64_t royalty_rate )
{
  return execute(
    [ & ]( ledger::execution_context& context )
    {
      return ledger::collection_registry( context ).create_token_type( creator,
                                                                       collection,
                                                                       name,
                                                                       description,
                                                                       monitor_supply,
                                                                       initial_amount,
                                                                       std::nullopt,
                                                                       uri,
                                                                       royalty_rate );
    } );
}

std::error_code controller::direct_transfer( const protocol::account& sender,
                                             const protocol::account& receiver,
                                             const protocol::account& creator,
                                             const std::string& collection,
                                             const std::string& name,
                                             std::uint64_t amount )
{
  return execute(
    [ & ]( ledger::execution_context& context )
    {
      return ledger::holder_inventory( context ).direct_transfer( sender,
                                                                  receiver,
                                                                  ledger::asset_identity{ creator, collection, name },
                                                                  amount );
    } );
}

std::error_code controller::transfer( const protocol::account& from,
                                      const protocol::account& to,
                                      const protocol::account& creator,
                                      const std::string& collection,
                                      const std::string& name,
                                      std::uint64_t amount )
{
  return execute(
    [ & ]( ledger::execution_context& context )
    {
      return ledger::holder_inventory( context ).transfer( from,
                                                           to,
                                                           ledger::asset_identity{ creator, collection, name },
                                                           amount );
    } );
}

std::error_code controller::initialize_inventory( const protocol::account& account )
{
  return execute(
    [ & ]( ledger::execution_context& context ) -> std::error_code
    {
      ledger::holder_inventory( context ).ensure_initialized( account );
      return ledger::ledger_errc::ok;
    } );
}

std::error_code controller::initialize_slot_for( const protocol::account& account,
                                                 const protocol::account& creator,
                                                 const std::string& collection,
                                                 const std::string& name )
{
  return execute(
    [ & ]( ledger::execution_context& context )
    {
      ledger::holder_inventory inventory( context );
      inventory.ensure_initialized( account );
      return inventory.initialize_slot( account, ledger::asset_identity{ creator, collection, name } );
    } );
}

std::error_code controller::mint( const protocol::account& authorizer,
                                  const protocol::account& destination,
                                  const protocol::account& creator,
                                  const std::string& collection,
                                  const std::string& name,
                                  std::uint64_t amount )
{
  return execute(
    [ & ]( ledger::execution_context& context )
    {
      return ledger::collection_registry( context ).mint( authorizer,
                                                          destination,
                                                          ledger::asset_identity{ creator, collection, name },
                                                          amount );
    } );
}

std::error_code controller::burn( const protocol::account& owner,
                                  const protocol::account& creator,
                                  const std::string& collection,
                                  const std::string& name,
                                  std::uint64_t amount )
{
  return execute(
    [ & ]( ledger::execution_context& context ) -> std::error_code
    {
      auto unit = ledger::holder_inventory( context ).withdraw( owner,
                                                                ledger::asset_identity{ creator, collection, name },
                                                                amount );
      if( !unit )
        return unit.error();

      return ledger::collection_registry( context ).burn( owner, std::move( *unit ) );
    } );
}

std::uint64_t controller::balance_of( const protocol::account& account, const ledger::asset_identity& identity ) const
{
  ledger::execution_context context( _db.head(), std::make_shared< ledger::chronicler_session >(), _options );
  return ledger::holder_inventory( context ).balance_of( account, identity );
}

std::optional< ledger::collection_meta > controller::collection( const protocol::account& creator,
                                                                 const std::string& name ) const
{
  ledger::execution_context context( _db.head(), std::make_shared< ledger::chronicler_session >(), _options );
  return ledger::collection_registry( context ).collection( creator, name );
}

std::optional< ledger::token_meta > controller::token( const ledger::asset_identity& identity ) const
{
  ledger::execution_context context( _db.head(), std::make_shared< ledger::chronicler_session >(), _options );
  return ledger::collection_registry( context ).token( identity );
}

std::optional< std::uint64_t > controller::supply( const ledger::asset_identity& identity ) const
{
  ledger::execution_context context( _db.head(), std::make_shared< ledger::chronicler_session >(), _options );
  return ledger::collection_registry( context ).supply( identity );
}

const std::vector< protocol::event >& controller::events() const noexcept
{
  return _chronicler.events();
}

} // namespace aerarium::controller
