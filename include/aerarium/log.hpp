#pragma once

#include <aerarium/log/log.hpp>
