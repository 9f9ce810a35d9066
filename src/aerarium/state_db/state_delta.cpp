#include <aerarium/state_db/state_delta.hpp>

#include <algorithm>
#include <iterator>

namespace aerarium::state_db {

std::int64_t state_delta::remove( std::vector< std::byte >&& key )
{
  if( complete() )
    throw std::runtime_error( "cannot modify a complete state delta" );

  std::int64_t size = 0;

  if( auto itr = _objects.find( key ); itr != _objects.end() )
  {
    size -= std::ssize( itr->first ) + std::ssize( itr->second );
    _objects.erase( itr );
  }

  if( !root() && size == 0 )
    if( auto current_value = get( key ); current_value )
      size -= std::ssize( key ) + std::ssize( *current_value );

  if( size && !root() )
    _removed_objects.emplace( std::move( key ) );

  return size;
}

std::optional< std::span< const std::byte > > state_delta::get( const std::vector< std::byte >& key ) const
{
  for( const state_delta* node = this; node; node = node->_parent.get() )
  {
    if( node->removed( key ) )
      return {};

    if( auto itr = node->_objects.find( key ); itr != node->_objects.end() )
      return std::span< const std::byte >( itr->second );
  }

  return {};
}

void state_delta::squash()
{
  if( root() )
    throw std::runtime_error( "cannot squash a root state delta" );

  if( complete() )
    throw std::runtime_error( "state delta has already been squashed" );

  auto& parent = *_parent;

  if( parent.complete() )
    throw std::runtime_error( "cannot squash in to a complete state delta" );

  // An object removed here only needs to be removed from the parent, and an
  // object written here clears any removal recorded in the parent.
  for( auto itr = _removed_objects.begin(); itr != _removed_objects.end(); itr = _removed_objects.begin() )
  {
    parent._objects.erase( *itr );

    if( !parent.root() )
      parent._removed_objects.insert( _removed_objects.extract( itr ) );
    else
      _removed_objects.erase( itr );
  }

  while( !_objects.empty() )
  {
    auto object = _objects.extract( _objects.begin() );

    if( !parent.root() )
      parent._removed_objects.erase( object.key() );

    parent._objects.insert_or_assign( std::move( object.key() ), std::move( object.mapped() ) );
  }

  parent._revision = std::max( parent._revision, _revision );
  mark_complete();
}

void state_delta::clear()
{
  _objects.clear();
  _removed_objects.clear();
}

bool state_delta::removed( const std::vector< std::byte >& key ) const
{
  return _removed_objects.contains( key );
}

bool state_delta::root() const
{
  return !_parent;
}

std::uint64_t state_delta::revision() const
{
  return _revision;
}

void state_delta::set_revision( std::uint64_t revision )
{
  _revision = revision;
}

bool state_delta::complete() const
{
  return _complete;
}

void state_delta::mark_complete()
{
  _complete = true;
}

const std::shared_ptr< state_delta >& state_delta::parent() const
{
  return _parent;
}

std::shared_ptr< state_delta > state_delta::make_child()
{
  auto child       = std::make_shared< state_delta >();
  child->_parent   = shared_from_this();
  child->_revision = _revision + 1;
  return child;
}

} // namespace aerarium::state_db
