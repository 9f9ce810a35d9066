#pragma once

#include <cstddef>
#include <span>
#include <string>

#include <quill/BinaryDataDeferredFormatCodec.h>

namespace aerarium::log {

/**
 * Lower case hex with a leading "0x".
 */
std::string to_hex( std::span< const std::byte > bytes );

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

} // namespace aerarium::log

template<>
struct fmtquill::formatter< aerarium::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const aerarium::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                aerarium::log::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< aerarium::log::hex >: quill::BinaryDataDeferredFormatCodec< aerarium::log::hex >
{};
