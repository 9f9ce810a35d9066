#include <aerarium/state_db/database.hpp>

namespace aerarium::state_db {

database::~database()
{
  close();
}

void database::open()
{
  if( _root )
    throw std::runtime_error( "database is already open" );

  _root = std::make_shared< state_delta >();
}

void database::close()
{
  _root.reset();
}

bool database::is_open() const noexcept
{
  return static_cast< bool >( _root );
}

permanent_state_node_ptr database::head() const
{
  if( !_root )
    throw std::runtime_error( "database is not open" );

  return std::make_shared< permanent_state_node >( _root );
}

} // namespace aerarium::state_db
