#include <aerarium/ledger/chronicler.hpp>

#include <iterator>
#include <utility>

namespace aerarium::ledger {

/*
 * Chronicler session
 */

void chronicler_session::push_event( protocol::event&& ev )
{
  _events.emplace_back( std::move( ev ) );
}

const std::vector< protocol::event >& chronicler_session::events() const noexcept
{
  return _events;
}

std::vector< protocol::event > chronicler_session::release() noexcept
{
  return std::exchange( _events, {} );
}

/*
 * Chronicler
 */

void chronicler::commit( chronicler_session& session )
{
  auto events = session.release();
  _events.insert( _events.end(), std::make_move_iterator( events.begin() ), std::make_move_iterator( events.end() ) );
}

const std::vector< protocol::event >& chronicler::events() const noexcept
{
  return _events;
}

} // namespace aerarium::ledger
