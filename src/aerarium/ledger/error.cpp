#include <aerarium/ledger/error.hpp>

#include <string>
#include <utility>

namespace aerarium::ledger {

struct _ledger_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "ledger";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< ledger_errc >( condition ) )
    {
      case ledger_errc::ok:
        return "ok"s;
      case ledger_errc::registry_not_published:
        return "collection registry not published"s;
      case ledger_errc::store_not_published:
        return "holder inventory not published"s;
      case ledger_errc::collection_not_published:
        return "collection not published"s;
      case ledger_errc::token_not_published:
        return "token type not published"s;
      case ledger_errc::balance_not_published:
        return "balance not published"s;
      case ledger_errc::already_has_balance:
        return "already has balance"s;
      case ledger_errc::collection_already_exists:
        return "collection already exists"s;
      case ledger_errc::token_already_exists:
        return "token type already exists"s;
      case ledger_errc::collection_limit_exceeded:
        return "collection limit exceeded"s;
      case ledger_errc::mint_limit_exceeded:
        return "mint limit exceeded"s;
      case ledger_errc::no_mint_capability:
        return "no mint capability"s;
      case ledger_errc::no_burn_capability:
        return "no burn capability"s;
      case ledger_errc::invalid_merge:
        return "invalid merge"s;
      case ledger_errc::split_amount_exceeds_balance:
        return "split amount exceeds balance"s;
      case ledger_errc::arithmetic_underflow:
        return "arithmetic underflow"s;
      case ledger_errc::arithmetic_overflow:
        return "arithmetic overflow"s;
      case ledger_errc::invalid_argument:
        return "invalid argument"s;
    }
    std::unreachable();
  }
};

const std::error_category& ledger_category() noexcept
{
  static _ledger_category category;
  return category;
}

std::error_code make_error_code( ledger_errc e )
{
  return std::error_code( static_cast< int >( e ), ledger_category() );
}

} // namespace aerarium::ledger
