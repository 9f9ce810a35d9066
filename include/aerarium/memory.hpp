#pragma once

#include <aerarium/memory/memory.hpp>
