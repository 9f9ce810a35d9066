#pragma once

#include <aerarium/state_db/types.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <set>
#include <span>
#include <stdexcept>
#include <vector>

namespace aerarium::state_db {

using object_map = std::map< std::vector< std::byte >, std::vector< std::byte > >;

/**
 * A layer of writes and removals on top of an optional parent delta.
 *
 * Reads fall through to the parent chain unless the key was written or
 * removed in this layer. A delta without a parent is a root delta and
 * owns the complete state.
 */
class state_delta final: public std::enable_shared_from_this< state_delta >
{
private:
  std::shared_ptr< state_delta > _parent;
  object_map _objects;
  std::set< std::vector< std::byte > > _removed_objects;

  std::uint64_t _revision = 0;
  bool _complete          = false;

public:
  state_delta() noexcept = default;

  state_delta& operator=( const state_delta& ) = delete;
  state_delta& operator=( state_delta&& )      = delete;
  state_delta( const state_delta& )            = delete;
  state_delta( state_delta&& )                 = delete;

  ~state_delta() = default;

  template< std::ranges::range ValueType >
  std::int64_t put( std::vector< std::byte >&& key, const ValueType& value );
  std::int64_t remove( std::vector< std::byte >&& key );
  std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const;

  /**
   * Merges this delta in to its parent. The delta is complete afterwards and
   * rejects further writes.
   */
  void squash();
  void clear();

  bool removed( const std::vector< std::byte >& key ) const;
  bool root() const;

  std::uint64_t revision() const;
  void set_revision( std::uint64_t revision );

  bool complete() const;
  void mark_complete();

  const std::shared_ptr< state_delta >& parent() const;

  std::shared_ptr< state_delta > make_child();
};

template< std::ranges::range ValueType >
std::int64_t state_delta::put( std::vector< std::byte >&& key, const ValueType& value )
{
  if( complete() )
    throw std::runtime_error( "cannot modify a complete state delta" );

  std::int64_t size = std::ssize( key ) + std::ssize( value );
  if( auto current_value = get( key ); current_value )
    size -= std::ssize( key ) + std::ssize( *current_value );

  _removed_objects.erase( key );
  _objects.insert_or_assign( std::move( key ),
                             std::vector< std::byte >( std::ranges::begin( value ), std::ranges::end( value ) ) );

  return size;
}

} // namespace aerarium::state_db
