#pragma once

#include <aerarium/ledger/asset_identity.hpp>

namespace aerarium::ledger {

/**
 * Authorizes minting of one token type. Capabilities are written once, when
 * the token type is created, and are only ever looked up by identity in the
 * registry space of the account presenting them.
 */
struct mint_capability
{
  asset_identity identity;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & identity;
  }
};

struct burn_capability
{
  asset_identity identity;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & identity;
  }
};

} // namespace aerarium::ledger
