#include <aerarium/log/formatter.hpp>

#include <string_view>

namespace aerarium::log {

std::string to_hex( std::span< const std::byte > bytes )
{
  constexpr std::string_view digits = "0123456789abcdef";

  std::string str = "0x";
  str.reserve( str.size() + bytes.size() * 2 );

  for( auto b: bytes )
  {
    auto value = std::to_integer< unsigned int >( b );
    str.push_back( digits[ value >> 4 ] );
    str.push_back( digits[ value & 0x0f ] );
  }

  return str;
}

} // namespace aerarium::log
