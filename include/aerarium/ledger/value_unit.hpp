#pragma once

#include <cstdint>

#include <aerarium/ledger/asset_identity.hpp>
#include <aerarium/ledger/error.hpp>

namespace aerarium::ledger {

class collection_registry;
class holder_inventory;
class value_unit;

result< value_unit > split( value_unit& unit, std::uint64_t amount );
std::error_code merge( value_unit& destination, value_unit&& source );

/**
 * A quantity of one token type in transit.
 *
 * A value_unit can be moved but never copied or assigned over. Only the
 * ledger creates units with a non-zero amount (mint, withdraw, split), and
 * value leaves a unit only through a successful merge, deposit or burn. When
 * one of those fails the unit keeps its amount. A moved-from unit holds
 * nothing.
 */
class value_unit final
{
public:
  value_unit( const value_unit& ) = delete;
  value_unit( value_unit&& other ) noexcept;
  ~value_unit() = default;

  value_unit& operator=( const value_unit& ) = delete;
  value_unit& operator=( value_unit&& )      = delete;

  const asset_identity& identity() const noexcept;
  std::uint64_t amount() const noexcept;

  /**
   * An empty unit of the given token type.
   */
  static value_unit zero( const asset_identity& identity );

private:
  friend class collection_registry;
  friend class holder_inventory;
  friend result< value_unit > split( value_unit& unit, std::uint64_t amount );
  friend std::error_code merge( value_unit& destination, value_unit&& source );

  value_unit( const asset_identity& identity, std::uint64_t amount );

  std::uint64_t take() noexcept;

  asset_identity _identity;
  std::uint64_t _amount = 0;
};

} // namespace aerarium::ledger
