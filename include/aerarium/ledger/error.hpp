#pragma once

#include <expected>
#include <system_error>

namespace aerarium::ledger {

enum class ledger_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,

  registry_not_published,
  store_not_published,
  collection_not_published,
  token_not_published,
  balance_not_published,

  already_has_balance,
  collection_already_exists,
  token_already_exists,

  collection_limit_exceeded,
  mint_limit_exceeded,

  no_mint_capability,
  no_burn_capability,

  invalid_merge,
  split_amount_exceeds_balance,
  arithmetic_underflow,
  arithmetic_overflow,

  invalid_argument
};

const std::error_category& ledger_category() noexcept;

std::error_code make_error_code( ledger_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace aerarium::ledger

template<>
struct std::is_error_code_enum< aerarium::ledger::ledger_errc >: public std::true_type
{};
