#include <aerarium/ledger/execution_context.hpp>

#include <stdexcept>

namespace aerarium::ledger {

execution_context::execution_context( const state_db::state_node_ptr& state,
                                      const std::shared_ptr< chronicler_session >& session,
                                      const ledger::options& options ):
    _state( state ),
    _session( session ),
    _options( options )
{
  if( !_state )
    throw std::runtime_error( "state node does not exist" );

  if( !_session )
    throw std::runtime_error( "chronicler session does not exist" );
}

state_db::state_node& execution_context::state() const
{
  return *_state;
}

const ledger::options& execution_context::options() const noexcept
{
  return _options;
}

} // namespace aerarium::ledger
