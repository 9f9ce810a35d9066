#pragma once

#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include <aerarium/ledger/chronicler.hpp>
#include <aerarium/ledger/events.hpp>
#include <aerarium/ledger/types.hpp>
#include <aerarium/protocol.hpp>
#include <aerarium/state_db/state_node.hpp>

namespace aerarium::ledger {

/**
 * Everything a ledger operation may touch during one transaction: the state
 * node it reads and writes, the chronicler session collecting its events and
 * the ledger options.
 */
class execution_context final
{
public:
  execution_context( const state_db::state_node_ptr& state,
                     const std::shared_ptr< chronicler_session >& session,
                     const ledger::options& options = {} );
  execution_context( const execution_context& ) = delete;
  execution_context( execution_context&& )      = delete;
  ~execution_context()                          = default;

  execution_context& operator=( const execution_context& ) = delete;
  execution_context& operator=( execution_context&& )      = delete;

  state_db::state_node& state() const;
  const ledger::options& options() const noexcept;

  /**
   * Records an event on the handle's stream and advances the handle. The
   * caller writes the resource holding the handle back to state.
   */
  template< typename Payload >
  void emit( const protocol::account& source, event_handle& handle, std::string_view name, const Payload& payload )
  {
    protocol::event ev;
    ev.stream   = handle.stream;
    ev.sequence = handle.counter++;
    ev.source   = source;
    ev.name     = name;
    ev.data     = protocol::pack( payload );
    ev.impacted.push_back( source );

    _session->push_event( std::move( ev ) );
  }

private:
  state_db::state_node_ptr _state;
  std::shared_ptr< chronicler_session > _session;
  ledger::options _options;
};

} // namespace aerarium::ledger
