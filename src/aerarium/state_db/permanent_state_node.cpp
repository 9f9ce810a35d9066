#include <aerarium/state_db/state_delta.hpp>
#include <aerarium/state_db/state_node.hpp>

namespace aerarium::state_db {

permanent_state_node::permanent_state_node( const std::shared_ptr< state_delta >& delta ) noexcept:
    _delta( delta )
{}

std::shared_ptr< state_delta > permanent_state_node::mutable_delta()
{
  return _delta;
}

const std::shared_ptr< state_delta >& permanent_state_node::delta() const
{
  return _delta;
}

} // namespace aerarium::state_db
