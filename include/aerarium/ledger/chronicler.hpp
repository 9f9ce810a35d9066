#pragma once

#include <aerarium/protocol/event.hpp>

#include <vector>

namespace aerarium::ledger {

/**
 * Buffers the events of a single transaction until it is applied.
 */
class chronicler_session final
{
public:
  void push_event( protocol::event&& ev );
  const std::vector< protocol::event >& events() const noexcept;
  std::vector< protocol::event > release() noexcept;

private:
  std::vector< protocol::event > _events;
};

/**
 * Append-only record of the events of every applied transaction.
 */
class chronicler final
{
public:
  void commit( chronicler_session& session );
  const std::vector< protocol::event >& events() const noexcept;

private:
  std::vector< protocol::event > _events;
};

} // namespace aerarium::ledger
