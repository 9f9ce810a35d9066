#pragma once

#include <expected>
#include <system_error>

namespace aerarium::config {

enum class config_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  file_not_found,
  malformed_document,
  invalid_value
};

const std::error_category& config_category() noexcept;

std::error_code make_error_code( config_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace aerarium::config

template<>
struct std::is_error_code_enum< aerarium::config::config_errc >: public std::true_type
{};
