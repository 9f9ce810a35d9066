#include <aerarium/ledger/table.hpp>

#include <algorithm>
#include <utility>

namespace aerarium::ledger {

static_assert( protocol::account_length == state_db::address_size );

state_db::object_space make_space( const protocol::account& owner, space_id id ) noexcept
{
  state_db::object_space space;
  std::ranges::copy( owner, space.address.begin() );
  space.id = std::to_underlying( id );
  return space;
}

} // namespace aerarium::ledger
