// NOLINTBEGIN

#include <gtest/gtest.h>

#include <aerarium/memory.hpp>
#include <aerarium/state_db.hpp>

namespace {

aerarium::state_db::object_space make_space( std::uint8_t address, std::uint32_t id )
{
  aerarium::state_db::object_space space;
  space.address[ 0 ] = std::byte{ address };
  space.id           = id;
  return space;
}

} // namespace

TEST( state_node, database )
{
  aerarium::state_db::database db;
  EXPECT_FALSE( db.is_open() );
  EXPECT_THROW( db.head(), std::runtime_error );

  db.open();
  EXPECT_TRUE( db.is_open() );
  EXPECT_THROW( db.open(), std::runtime_error );

  auto head = db.head();
  ASSERT_TRUE( head );
  EXPECT_EQ( head->revision(), 0 );

  db.close();
  EXPECT_FALSE( db.is_open() );
}

TEST( state_node, object_spaces )
{
  aerarium::state_db::database db;
  db.open();

  auto head = db.head();

  const std::vector< std::byte > key{ std::byte{ 0x01 } }, value{ std::byte{ 0xaa } };

  head->put( make_space( 1, 0 ), key, value );

  EXPECT_TRUE( head->get( make_space( 1, 0 ), key ) );
  EXPECT_FALSE( head->get( make_space( 1, 1 ), key ) );
  EXPECT_FALSE( head->get( make_space( 2, 0 ), key ) );

  EXPECT_LT( head->remove( make_space( 1, 0 ), key ), 0 );
  EXPECT_FALSE( head->get( make_space( 1, 0 ), key ) );
}

TEST( state_node, temporary_nodes )
{
  aerarium::state_db::database db;
  db.open();

  const auto space = make_space( 1, 0 );
  const std::vector< std::byte > key{ std::byte{ 0x01 } }, value{ std::byte{ 0xaa } };

  auto discarded = db.head()->make_child();
  discarded->put( space, key, value );
  EXPECT_TRUE( discarded->get( space, key ) );
  discarded->discard();

  EXPECT_FALSE( db.head()->get( space, key ) );
  EXPECT_THROW( discarded->get( space, key ), std::runtime_error );
  EXPECT_THROW( discarded->squash(), std::runtime_error );

  auto applied = db.head()->make_child();
  applied->put( space, key, value );
  EXPECT_FALSE( db.head()->get( space, key ) );
  applied->squash();

  if( auto object = db.head()->get( space, key ); object )
    EXPECT_TRUE( std::ranges::equal( *object, value ) );
  else
    ADD_FAILURE() << "head did not return a value";

  EXPECT_EQ( db.head()->revision(), 1 );
  EXPECT_THROW( applied->squash(), std::runtime_error );
}

// NOLINTEND
