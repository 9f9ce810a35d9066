#pragma once

#include <aerarium/state_db/database.hpp>
#include <aerarium/state_db/state_delta.hpp>
#include <aerarium/state_db/state_node.hpp>
#include <aerarium/state_db/types.hpp>
