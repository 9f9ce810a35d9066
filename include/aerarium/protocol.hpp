#pragma once

#include <aerarium/protocol/account.hpp>
#include <aerarium/protocol/event.hpp>
#include <aerarium/protocol/serialization.hpp>
