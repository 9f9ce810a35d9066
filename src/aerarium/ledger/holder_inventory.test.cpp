// NOLINTBEGIN

#include <gtest/gtest.h>

#include <memory>

#include <aerarium/ledger.hpp>
#include <aerarium/protocol.hpp>
#include <aerarium/state_db.hpp>

using namespace aerarium;

namespace {

class holder_inventory_test: public ::testing::Test
{
protected:
  holder_inventory_test()
  {
    db.open();
    node    = db.head()->make_child();
    session = std::make_shared< ledger::chronicler_session >();
    context = std::make_unique< ledger::execution_context >( node, session );

    ledger::collection_registry registry( *context );
    EXPECT_FALSE( registry.create_collection( creator, "coins", "", "", std::nullopt ) );

    auto id = registry.create_token_type( creator, "coins", "gold", "", true, 0, std::nullopt, "", 0 );
    EXPECT_TRUE( id.has_value() );
    gold = *id;

    session->release();
  }

  std::size_t count_events( std::string_view name ) const
  {
    std::size_t count = 0;
    for( const auto& ev: session->events() )
      if( ev.name == name )
        count++;

    return count;
  }

  state_db::database db;
  std::shared_ptr< state_db::temporary_state_node > node;
  std::shared_ptr< ledger::chronicler_session > session;
  std::unique_ptr< ledger::execution_context > context;

  protocol::account creator = protocol::named_account( "creator" );
  protocol::account alice   = protocol::named_account( "alice" );
  protocol::account bob     = protocol::named_account( "bob" );
  ledger::asset_identity gold;
};

} // namespace

TEST_F( holder_inventory_test, initialization )
{
  ledger::holder_inventory inventory( *context );

  EXPECT_FALSE( inventory.initialized( alice ) );
  EXPECT_EQ( inventory.initialize_slot( alice, gold ), ledger::ledger_errc::store_not_published );

  inventory.ensure_initialized( alice );
  inventory.ensure_initialized( alice );
  EXPECT_TRUE( inventory.initialized( alice ) );
  EXPECT_FALSE( inventory.has_slot( alice, gold ) );

  EXPECT_FALSE( inventory.initialize_slot( alice, gold ) );
  EXPECT_TRUE( inventory.has_slot( alice, gold ) );
  EXPECT_EQ( inventory.balance_of( alice, gold ), 0 );

  EXPECT_EQ( inventory.initialize_slot( alice, gold ), ledger::ledger_errc::already_has_balance );
  EXPECT_TRUE( session->events().empty() );
}

TEST_F( holder_inventory_test, balance_of_missing )
{
  ledger::holder_inventory inventory( *context );
  EXPECT_EQ( inventory.balance_of( alice, gold ), 0 );

  inventory.ensure_initialized( alice );
  EXPECT_EQ( inventory.balance_of( alice, gold ), 0 );
}

TEST_F( holder_inventory_test, withdraw_errors )
{
  ledger::holder_inventory inventory( *context );

  auto unit = inventory.withdraw( alice, gold, 1 );
  ASSERT_FALSE( unit.has_value() );
  EXPECT_EQ( unit.error(), ledger::ledger_errc::store_not_published );

  inventory.ensure_initialized( alice );
  auto missing = inventory.withdraw( alice, gold, 1 );
  ASSERT_FALSE( missing.has_value() );
  EXPECT_EQ( missing.error(), ledger::ledger_errc::balance_not_published );

  ASSERT_FALSE( ledger::collection_registry( *context ).mint( creator, alice, gold, 5 ) );
  auto excess = inventory.withdraw( alice, gold, 6 );
  ASSERT_FALSE( excess.has_value() );
  EXPECT_EQ( excess.error(), ledger::ledger_errc::arithmetic_underflow );
  EXPECT_EQ( inventory.balance_of( alice, gold ), 5 );
}

TEST_F( holder_inventory_test, deposit_and_withdraw )
{
  ledger::holder_inventory inventory( *context );
  ASSERT_FALSE( ledger::collection_registry( *context ).mint( creator, alice, gold, 10 ) );
  session->release();

  auto unit = inventory.withdraw( alice, gold, 4 );
  ASSERT_TRUE( unit.has_value() );
  EXPECT_EQ( unit->amount(), 4 );
  EXPECT_EQ( inventory.balance_of( alice, gold ), 6 );

  EXPECT_FALSE( inventory.deposit( bob, std::move( *unit ) ) );
  EXPECT_TRUE( inventory.initialized( bob ) );
  EXPECT_EQ( inventory.balance_of( bob, gold ), 4 );

  ASSERT_EQ( session->events().size(), 2 );

  const auto& withdraw_event = session->events()[ 0 ];
  EXPECT_EQ( withdraw_event.name, ledger::event_name::withdrawn );
  EXPECT_EQ( withdraw_event.source, alice );
  EXPECT_EQ( withdraw_event.sequence, 0 );
  auto withdrawn = protocol::unpack< ledger::withdrawn >( withdraw_event.data );
  EXPECT_EQ( withdrawn.identity, gold );
  EXPECT_EQ( withdrawn.amount, 4 );

  const auto& deposit_event = session->events()[ 1 ];
  EXPECT_EQ( deposit_event.name, ledger::event_name::deposited );
  EXPECT_EQ( deposit_event.source, bob );
  EXPECT_EQ( deposit_event.sequence, 0 );
  auto deposited = protocol::unpack< ledger::deposited >( deposit_event.data );
  EXPECT_EQ( deposited.identity, gold );
  EXPECT_EQ( deposited.amount, 4 );
}

TEST_F( holder_inventory_test, deposit_without_event )
{
  ledger::holder_inventory inventory( *context );
  ASSERT_FALSE( ledger::collection_registry( *context ).mint( creator, alice, gold, 10 ) );

  auto unit = inventory.withdraw( alice, gold, 10 );
  ASSERT_TRUE( unit.has_value() );
  session->release();

  EXPECT_FALSE( inventory.deposit_without_event( bob, std::move( *unit ) ) );
  EXPECT_EQ( inventory.balance_of( bob, gold ), 10 );
  EXPECT_TRUE( session->events().empty() );
}

TEST_F( holder_inventory_test, deposit_sequence_advances )
{
  ledger::holder_inventory inventory( *context );
  ASSERT_FALSE( ledger::collection_registry( *context ).mint( creator, alice, gold, 1 ) );
  ASSERT_FALSE( ledger::collection_registry( *context ).mint( creator, alice, gold, 1 ) );

  std::vector< std::uint64_t > sequences;
  for( const auto& ev: session->events() )
    if( ev.name == ledger::event_name::deposited )
      sequences.push_back( ev.sequence );

  EXPECT_EQ( sequences, ( std::vector< std::uint64_t >{ 0, 1 } ) );
}

TEST_F( holder_inventory_test, direct_transfer )
{
  ledger::holder_inventory inventory( *context );
  ASSERT_FALSE( ledger::collection_registry( *context ).mint( creator, alice, gold, 100 ) );
  session->release();

  EXPECT_FALSE( inventory.direct_transfer( alice, bob, gold, 30 ) );
  EXPECT_EQ( inventory.balance_of( alice, gold ), 70 );
  EXPECT_EQ( inventory.balance_of( bob, gold ), 30 );
  EXPECT_EQ( count_events( ledger::event_name::withdrawn ), 1 );
  EXPECT_EQ( count_events( ledger::event_name::deposited ), 1 );

  EXPECT_EQ( inventory.direct_transfer( alice, bob, gold, 71 ), ledger::ledger_errc::arithmetic_underflow );
  EXPECT_EQ( inventory.balance_of( alice, gold ), 70 );
  EXPECT_EQ( inventory.balance_of( bob, gold ), 30 );
}

TEST_F( holder_inventory_test, transfer_conserves_supply )
{
  ledger::holder_inventory inventory( *context );
  ledger::collection_registry registry( *context );
  ASSERT_FALSE( registry.mint( creator, alice, gold, 50 ) );

  EXPECT_FALSE( inventory.transfer( alice, bob, gold, 20 ) );
  EXPECT_FALSE( inventory.transfer( bob, alice, gold, 5 ) );
  EXPECT_FALSE( inventory.transfer( alice, alice, gold, 10 ) );

  EXPECT_EQ( inventory.balance_of( alice, gold ), 35 );
  EXPECT_EQ( inventory.balance_of( bob, gold ), 15 );
  EXPECT_EQ( registry.supply( gold ), 50 );
  EXPECT_EQ( inventory.balance_of( alice, gold ) + inventory.balance_of( bob, gold ), *registry.supply( gold ) );
}

// NOLINTEND
