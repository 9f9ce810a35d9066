#pragma once

#include <string>

#include <quill/LogMacros.h>

#include <aerarium/log/formatter.hpp>
#include <aerarium/log/frontend.hpp>

namespace aerarium::log {

void initialize() noexcept;
logger* instance() noexcept;

/**
 * Sets the level of the root logger by name, e.g. "debug", "info" or "warning".
 * Throws quill::QuillError on an unknown level.
 */
void set_level( const std::string& level );

} // namespace aerarium::log
