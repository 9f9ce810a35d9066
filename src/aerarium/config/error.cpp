#include <aerarium/config/error.hpp>

#include <utility>

namespace aerarium::config {

struct _config_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _config_category::name() const noexcept
{
  return "config";
}

std::string _config_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< config_errc >( condition ) )
  {
    case config_errc::ok:
      return "ok"s;
    case config_errc::file_not_found:
      return "file not found"s;
    case config_errc::malformed_document:
      return "malformed document"s;
    case config_errc::invalid_value:
      return "invalid value"s;
  }
  std::unreachable();
}

const std::error_category& config_category() noexcept
{
  static _config_category category;
  return category;
}

std::error_code make_error_code( config_errc e )
{
  return std::error_code( static_cast< int >( e ), config_category() );
}

} // namespace aerarium::config
