// NOLINTBEGIN

#include <gtest/gtest.h>

#include <aerarium/state_db/state_delta.hpp>

TEST( state_delta, crud )
{
  auto delta = std::make_shared< aerarium::state_db::state_delta >();
  ASSERT_TRUE( delta );

  EXPECT_EQ( delta->revision(), 0 );
  delta->set_revision( 1 );
  EXPECT_EQ( delta->revision(), 1 );

  EXPECT_FALSE( delta->complete() );
  EXPECT_TRUE( delta->root() );
  EXPECT_FALSE( delta->parent() );

  EXPECT_FALSE( delta->get( { std::byte{ 0x01 } } ) );

  std::vector< std::byte > key_1{ std::byte{ 0x01 } }, value_1{ std::byte{ 0x10 } };
  EXPECT_EQ( delta->put( std::vector< std::byte >( key_1 ), value_1 ), key_1.size() + value_1.size() );
  if( auto value = delta->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1 ) );
  else
    ADD_FAILURE() << "delta did not return a value";

  std::vector< std::byte > key_2{ std::byte{ 0x02 } }, value_2{ std::byte{ 0x20 }, std::byte{ 0x21 } };
  EXPECT_EQ( delta->put( std::vector< std::byte >( key_2 ), value_2 ), key_2.size() + value_2.size() );
  if( auto value = delta->get( key_2 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_2 ) );
  else
    ADD_FAILURE() << "delta did not return a value";

  std::vector< std::byte > value_1a{ std::byte{ 0x10 }, std::byte{ 0x11 }, std::byte{ 0x12 } };
  EXPECT_EQ( delta->put( std::vector< std::byte >( key_1 ), value_1a ), value_1a.size() - value_1.size() );
  if( auto value = delta->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1a ) );
  else
    ADD_FAILURE() << "delta did not return a value";

  EXPECT_EQ( delta->remove( std::vector< std::byte >( key_1 ) ), -1 * std::int64_t( key_1.size() + value_1a.size() ) );
  EXPECT_FALSE( delta->get( key_1 ) );
  EXPECT_EQ( delta->remove( std::vector< std::byte >( key_1 ) ), 0 );

  delta->clear();
  EXPECT_FALSE( delta->get( key_1 ) );
  EXPECT_FALSE( delta->get( key_2 ) );
}

TEST( state_delta, children )
{
  auto parent = std::make_shared< aerarium::state_db::state_delta >();

  std::vector< std::byte > key_1{ std::byte{ 0x01 } }, value_1{ std::byte{ 0x10 } };
  parent->put( std::vector< std::byte >( key_1 ), value_1 );

  std::vector< std::byte > key_2{ std::byte{ 0x02 } }, value_2{ std::byte{ 0x20 } };
  parent->put( std::vector< std::byte >( key_2 ), value_2 );

  auto child = parent->make_child();
  ASSERT_TRUE( child );
  EXPECT_FALSE( child->root() );
  EXPECT_EQ( child->parent(), parent );
  EXPECT_EQ( child->revision(), parent->revision() + 1 );

  std::vector< std::byte > key_3{ std::byte{ 0x03 } }, value_3{ std::byte{ 0x30 } };
  EXPECT_EQ( child->put( std::vector< std::byte >( key_3 ), value_3 ), key_3.size() + value_3.size() );
  EXPECT_FALSE( parent->get( key_3 ) );
  if( auto value = child->get( key_3 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_3 ) );
  else
    ADD_FAILURE() << "child did not return a value";

  std::vector< std::byte > value_1a{ std::byte{ 0x10 }, std::byte{ 0x11 } };
  EXPECT_EQ( child->put( std::vector< std::byte >( key_1 ), value_1a ), value_1a.size() - value_1.size() );
  if( auto value = parent->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1 ) );
  else
    ADD_FAILURE() << "parent did not return a value";

  if( auto value = child->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1a ) );
  else
    ADD_FAILURE() << "child did not return a value";

  EXPECT_EQ( child->remove( std::vector< std::byte >( key_2 ) ), -1 * std::int64_t( key_2.size() + value_2.size() ) );
  EXPECT_TRUE( child->removed( key_2 ) );
  EXPECT_FALSE( child->get( key_2 ) );
  EXPECT_TRUE( parent->get( key_2 ) );

  // Writing a removed key makes it visible again
  std::vector< std::byte > value_2a{ std::byte{ 0x22 } };
  child->put( std::vector< std::byte >( key_2 ), value_2a );
  EXPECT_FALSE( child->removed( key_2 ) );
  if( auto value = child->get( key_2 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_2a ) );
  else
    ADD_FAILURE() << "child did not return a value";
}

TEST( state_delta, squash )
{
  auto parent = std::make_shared< aerarium::state_db::state_delta >();

  std::vector< std::byte > key_1{ std::byte{ 0x01 } }, value_1{ std::byte{ 0x10 } };
  std::vector< std::byte > key_2{ std::byte{ 0x02 } }, value_2{ std::byte{ 0x20 } };
  std::vector< std::byte > key_3{ std::byte{ 0x03 } }, value_3{ std::byte{ 0x30 } };
  parent->put( std::vector< std::byte >( key_1 ), value_1 );
  parent->put( std::vector< std::byte >( key_2 ), value_2 );

  auto child = parent->make_child();
  auto grandchild = child->make_child();

  std::vector< std::byte > value_1a{ std::byte{ 0x11 } };
  child->put( std::vector< std::byte >( key_1 ), value_1a );
  grandchild->remove( std::vector< std::byte >( key_2 ) );
  grandchild->put( std::vector< std::byte >( key_3 ), value_3 );

  EXPECT_THROW( parent->squash(), std::runtime_error );

  grandchild->squash();
  EXPECT_TRUE( grandchild->complete() );
  EXPECT_THROW( grandchild->put( std::vector< std::byte >( key_3 ), value_3 ), std::runtime_error );
  EXPECT_THROW( grandchild->squash(), std::runtime_error );

  EXPECT_TRUE( child->removed( key_2 ) );
  EXPECT_FALSE( child->get( key_2 ) );
  EXPECT_TRUE( child->get( key_3 ) );
  EXPECT_TRUE( parent->get( key_2 ) );
  EXPECT_FALSE( parent->get( key_3 ) );

  child->squash();

  if( auto value = parent->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1a ) );
  else
    ADD_FAILURE() << "parent did not return a value";

  EXPECT_FALSE( parent->get( key_2 ) );
  EXPECT_FALSE( parent->removed( key_2 ) );

  if( auto value = parent->get( key_3 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_3 ) );
  else
    ADD_FAILURE() << "parent did not return a value";

  EXPECT_EQ( parent->revision(), 2 );
}

// NOLINTEND
