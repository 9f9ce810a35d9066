#pragma once

#include <aerarium/config.hpp>
#include <aerarium/ledger.hpp>
#include <aerarium/log.hpp>
#include <aerarium/protocol.hpp>
#include <aerarium/state_db.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace aerarium::controller {

namespace detail {

inline std::error_code error_of( const std::error_code& ec ) noexcept
{
  return ec;
}

template< typename T >
std::error_code error_of( const ledger::result< T >& r ) noexcept
{
  return r.has_value() ? std::error_code{} : r.error();
}

} // namespace detail

class controller
{
public:
  controller( const ledger::options& options = {} );
  controller( const config::options& options );
  controller( const controller& ) = delete;
  controller( controller&& )      = delete;
  ~controller();

  controller& operator=( const controller& ) = delete;
  controller& operator=( controller&& )      = delete;

  void open();
  void close();

  std::error_code create_limited_collection( const protocol::account& creator,
                                             const std::string& name,
                                             const std::string& description,
                                             const std::string& uri,
                                             std::uint64_t maximum );

  std::error_code create_unlimited_collection( const protocol::account& creator,
                                               const std::string& name,
                                               const std::string& description,
                                               const std::string& uri );

  ledger::result< ledger::asset_identity > create_limited_token( const protocol::account& creator,
                                                                 const std::string& collection,
                                                                 const std::string& name,
                                                                 const std::string& description,
                                                                 bool monitor_supply,
                                                                 std::uint64_t initial_amount,
                                                                 std::uint64_t maximum,
                                                                 const std::string& uri,
                                                                 std::uint64_t royalty_rate );

  ledger::result< ledger::asset_identity > create_unlimited_token( const protocol::account& creator,
                                                                   const std::string& collection,
                                                                   const std::string& name,
                                                                   const std::string& description,
                                                                   bool monitor_supply,
                                                                   std::uint64_t initial_amount,
                                                                   const std::string& uri,
                                                                   std::uint64_t royalty_rate );

  std::error_code direct_transfer( const protocol::account& sender,
                                   const protocol::account& receiver,
                                   const protocol::account& creator,
                                   const std::string& collection,
                                   const std::string& name,
                                   std::uint64_t amount );

  std::error_code transfer( const protocol::account& from,
                            const protocol::account& to,
                            const protocol::account& creator,
                            const std::string& collection,
                            const std::string& name,
                            std::uint64_t amount );

  std::error_code initialize_inventory( const protocol::account& account );

  std::error_code initialize_slot_for( const protocol::account& account,
                                       const protocol::account& creator,
                                       const std::string& collection,
                                       const std::string& name );

  std::error_code mint( const protocol::account& authorizer,
                        const protocol::account& destination,
                        const protocol::account& creator,
                        const std::string& collection,
                        const std::string& name,
                        std::uint64_t amount );

  std::error_code burn( const protocol::account& owner,
                        const protocol::account& creator,
                        const std::string& collection,
                        const std::string& name,
                        std::uint64_t amount );

  /**
   * Runs function as a single transaction. The function receives the
   * transaction's execution context and returns either a std::error_code or a
   * ledger::result. On success the writes are squashed in to the head and the
   * events committed, on failure both are dropped.
   */
  template< typename Function >
  std::invoke_result_t< Function, ledger::execution_context& > execute( Function&& function )
  {
    auto node    = _db.head()->make_child();
    auto session = std::make_shared< ledger::chronicler_session >();

    auto outcome = [ & ]()
    {
      ledger::execution_context context( node, session, _options );
      return std::invoke( std::forward< Function >( function ), context );
    }();

    if( auto error = detail::error_of( outcome ); error )
    {
      node->discard();
      LOG_DEBUG( aerarium::log::instance(), "Transaction reverted: {}", error.message() );
      return outcome;
    }

    LOG_DEBUG( aerarium::log::instance(), "Transaction applied with {} events", session->events().size() );
    node->squash();
    _chronicler.commit( *session );

    return outcome;
  }

  std::uint64_t balance_of( const protocol::account& account, const ledger::asset_identity& identity ) const;
  std::optional< ledger::collection_meta > collection( const protocol::account& creator, const std::string& name ) const;
  std::optional< ledger::token_meta > token( const ledger::asset_identity& identity ) const;
  std::optional< std::uint64_t > supply( const ledger::asset_identity& identity ) const;
  const std::vector< protocol::event >& events() const noexcept;

private:
  state_db::database _db;
  ledger::chronicler _chronicler;
  ledger::options _options;
};

} // namespace aerarium::controller
