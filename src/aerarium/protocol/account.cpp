#include <aerarium/protocol/account.hpp>

#include <algorithm>

namespace aerarium::protocol {

account named_account( std::string_view str ) noexcept
{
  account a{};

  std::size_t length = std::min( str.length(), a.size() );
  for( std::size_t i = 0; i < length; ++i )
    a.at( i ) = static_cast< std::byte >( str[ i ] );

  return a;
}

} // namespace aerarium::protocol
