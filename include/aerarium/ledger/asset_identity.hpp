#pragma once

#include <compare>
#include <string>

#include <boost/serialization/string.hpp>

#include <aerarium/protocol/account.hpp>

namespace aerarium::ledger {

/**
 * Globally unique name of a token type: the account that created it, the
 * collection it belongs to and its name within that collection.
 */
struct asset_identity
{
  protocol::account creator{};
  std::string collection;
  std::string name;

  auto operator<=>( const asset_identity& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & creator;
    ar & collection;
    ar & name;
  }
};

} // namespace aerarium::ledger
