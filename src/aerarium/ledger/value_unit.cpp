#include <aerarium/ledger/value_unit.hpp>

#include <limits>
#include <utility>

namespace aerarium::ledger {

value_unit::value_unit( const asset_identity& identity, std::uint64_t amount ):
    _identity( identity ),
    _amount( amount )
{}

value_unit::value_unit( value_unit&& other ) noexcept:
    _identity( other._identity ),
    _amount( other.take() )
{}

const asset_identity& value_unit::identity() const noexcept
{
  return _identity;
}

std::uint64_t value_unit::amount() const noexcept
{
  return _amount;
}

value_unit value_unit::zero( const asset_identity& identity )
{
  return value_unit( identity, 0 );
}

std::uint64_t value_unit::take() noexcept
{
  return std::exchange( _amount, 0 );
}

result< value_unit > split( value_unit& unit, std::uint64_t amount )
{
  if( amount > unit._amount )
    return std::unexpected( ledger_errc::split_amount_exceeds_balance );

  unit._amount -= amount;
  return value_unit( unit._identity, amount );
}

std::error_code merge( value_unit& destination, value_unit&& source )
{
  if( destination._identity != source._identity )
    return ledger_errc::invalid_merge;

  if( std::numeric_limits< std::uint64_t >::max() - destination._amount < source._amount )
    return ledger_errc::arithmetic_overflow;

  destination._amount += source.take();
  return ledger_errc::ok;
}

} // namespace aerarium::ledger
