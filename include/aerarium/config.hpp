#pragma once

#include <aerarium/config/config.hpp>
#include <aerarium/config/error.hpp>
