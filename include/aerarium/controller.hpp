#pragma once

#include <aerarium/controller/controller.hpp>
