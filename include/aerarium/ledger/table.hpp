#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <boost/endian/conversion.hpp>

#include <aerarium/memory.hpp>
#include <aerarium/protocol/account.hpp>
#include <aerarium/protocol/serialization.hpp>
#include <aerarium/state_db/state_node.hpp>

namespace aerarium::ledger {

/**
 * Object spaces owned by every account. The first four hold the collection
 * registry, the last two hold the holder inventory.
 */
enum class space_id : std::uint32_t // NOLINT(performance-enum-size)
{
  registry,
  collections,
  token_metadata,
  mint_capabilities,
  burn_capabilities,
  inventory,
  balances
};

state_db::object_space make_space( const protocol::account& owner, space_id id ) noexcept;

template< typename T >
struct codec
{
  static std::vector< std::byte > encode( const T& t )
  {
    return protocol::pack( t );
  }

  static T decode( std::span< const std::byte > bytes )
  {
    return protocol::unpack< T >( bytes );
  }
};

template<>
struct codec< std::uint64_t >
{
  static std::vector< std::byte > encode( std::uint64_t value )
  {
    boost::endian::native_to_little_inplace( value );
    auto bytes = memory::as_bytes( value );
    return std::vector< std::byte >( bytes.begin(), bytes.end() );
  }

  static std::uint64_t decode( std::span< const std::byte > bytes )
  {
    auto value = memory::bit_cast< std::uint64_t >( bytes );
    boost::endian::little_to_native_inplace( value );
    return value;
  }
};

/**
 * The single record of type Record an account holds in one object space.
 */
template< typename Record >
class resource final
{
public:
  resource( state_db::state_node& state, const protocol::account& owner, space_id id ):
      _state( state ),
      _space( make_space( owner, id ) )
  {}

  bool exists() const
  {
    return _state.get( _space, {} ).has_value();
  }

  std::optional< Record > get() const
  {
    if( auto object = _state.get( _space, {} ); object )
      return codec< Record >::decode( *object );

    return {};
  }

  void put( const Record& record )
  {
    _state.put( _space, {}, codec< Record >::encode( record ) );
  }

private:
  state_db::state_node& _state;
  state_db::object_space _space;
};

/**
 * Records of type Value keyed by Key within one object space of an account.
 */
template< typename Key, typename Value >
class table final
{
public:
  table( state_db::state_node& state, const protocol::account& owner, space_id id ):
      _state( state ),
      _space( make_space( owner, id ) )
  {}

  bool contains( const Key& key ) const
  {
    return _state.get( _space, codec< Key >::encode( key ) ).has_value();
  }

  std::optional< Value > get( const Key& key ) const
  {
    if( auto object = _state.get( _space, codec< Key >::encode( key ) ); object )
      return codec< Value >::decode( *object );

    return {};
  }

  void put( const Key& key, const Value& value )
  {
    _state.put( _space, codec< Key >::encode( key ), codec< Value >::encode( value ) );
  }

  void remove( const Key& key )
  {
    _state.remove( _space, codec< Key >::encode( key ) );
  }

private:
  state_db::state_node& _state;
  state_db::object_space _space;
};

} // namespace aerarium::ledger
