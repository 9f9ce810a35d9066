#pragma once

#include <aerarium/state_db/state_node.hpp>

namespace aerarium::state_db {

/**
 * database owns the root state delta of the ledger.
 *
 * Writes happen on temporary children of the head node, which are squashed
 * back in to the head once they succeed. Calls on database are not thread
 * safe; the caller serializes transactions.
 */
class database final
{
public:
  database() noexcept = default;
  database( const database& ) = delete;
  database( database&& )      = delete;
  ~database();

  database& operator=( const database& ) = delete;
  database& operator=( database&& )      = delete;

  /**
   * Open the database with an empty state.
   */
  void open();

  /**
   * Close the database, dropping all state.
   */
  void close();

  bool is_open() const noexcept;

  /**
   * Get and return the current "head" node.
   */
  permanent_state_node_ptr head() const;

private:
  std::shared_ptr< state_delta > _root;
};

} // namespace aerarium::state_db
