#pragma once

#include <aerarium/ledger/asset_identity.hpp>
#include <aerarium/ledger/capability.hpp>
#include <aerarium/ledger/chronicler.hpp>
#include <aerarium/ledger/collection_registry.hpp>
#include <aerarium/ledger/error.hpp>
#include <aerarium/ledger/events.hpp>
#include <aerarium/ledger/execution_context.hpp>
#include <aerarium/ledger/holder_inventory.hpp>
#include <aerarium/ledger/types.hpp>
#include <aerarium/ledger/value_unit.hpp>
