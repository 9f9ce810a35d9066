#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string_view>

#include <boost/serialization/binary_object.hpp>

namespace aerarium::protocol {

constexpr std::size_t account_length = 32;

struct account: std::array< std::byte, account_length >
{
  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & boost::serialization::make_binary_object( data(), size() );
  }
};

/**
 * Builds an account whose address bytes spell the given string, zero padded.
 */
account named_account( std::string_view str ) noexcept;

} // namespace aerarium::protocol
