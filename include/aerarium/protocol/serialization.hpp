#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/split_free.hpp>

#include <aerarium/memory/memory.hpp>

namespace boost::serialization {

template< class Archive, class T >
void save( Archive& ar, const std::optional< T >& opt, const unsigned int version )
{
  const bool engaged = opt.has_value();
  ar << engaged;
  if( engaged )
    ar << *opt;
}

template< class Archive, class T >
void load( Archive& ar, std::optional< T >& opt, const unsigned int version )
{
  bool engaged = false;
  ar >> engaged;
  if( engaged )
  {
    T value{};
    ar >> value;
    opt = std::move( value );
  }
  else
    opt.reset();
}

template< class Archive, class T >
void serialize( Archive& ar, std::optional< T >& opt, const unsigned int version )
{
  boost::serialization::split_free( ar, opt, version );
}

} // namespace boost::serialization

namespace aerarium::protocol {

constexpr auto archive_flags = boost::archive::no_header | boost::archive::no_tracking;

/**
 * Encodes a serializable object with a headerless boost binary archive.
 */
template< typename T >
std::vector< std::byte > pack( const T& t )
{
  std::stringstream ss;

  {
    boost::archive::binary_oarchive oa( ss, archive_flags );
    oa << t;
  }

  auto str = ss.str();
  auto bytes = memory::as_bytes( str );
  return std::vector< std::byte >( bytes.begin(), bytes.end() );
}

template< typename T >
T unpack( std::span< const std::byte > bytes )
{
  std::stringstream ss( std::string( memory::pointer_cast< const char* >( bytes.data() ), bytes.size() ) );
  boost::archive::binary_iarchive ia( ss, archive_flags );

  T t{};
  ia >> t;
  return t;
}

} // namespace aerarium::protocol
