#include <aerarium/config/config.hpp>

#include <cstdint>
#include <optional>

#include <quill/core/LogLevel.h>
#include <quill/core/QuillError.h>
#include <yaml-cpp/yaml.h>

namespace aerarium::config {

namespace {

template< typename T >
std::optional< T > get_option( std::string_view key, const T& default_value, const YAML::Node& ledger_config, const YAML::Node& global_config )
{
  const std::string name( key );

  try
  {
    if( ledger_config && ledger_config[ name ] )
      return ledger_config[ name ].template as< T >();

    if( global_config && global_config[ name ] )
      return global_config[ name ].template as< T >();
  }
  catch( const YAML::BadConversion& )
  {
    return {};
  }

  return default_value;
}

result< std::size_t > get_length( std::string_view key, std::size_t default_value, const YAML::Node& ledger_config, const YAML::Node& global_config )
{
  auto length = get_option< std::uint64_t >( key, default_value, ledger_config, global_config );

  if( !length || *length == 0 )
    return std::unexpected( config_errc::invalid_value );

  return static_cast< std::size_t >( *length );
}

result< options > from_node( const YAML::Node& config )
{
  options opts;

  if( !config || config.IsNull() )
    return opts;

  if( !config.IsMap() )
    return std::unexpected( config_errc::malformed_document );

  YAML::Node global_config = config[ std::string( section::global ) ];
  YAML::Node ledger_config = config[ std::string( section::ledger ) ];

  for( const auto& node: { global_config, ledger_config } )
  {
    if( node && !node.IsNull() && !node.IsMap() )
      return std::unexpected( config_errc::malformed_document );
  }

  auto log_level = get_option< std::string >( option::log_level, opts.log_level, ledger_config, global_config );
  if( !log_level || log_level->empty() )
    return std::unexpected( config_errc::invalid_value );

  try
  {
    static_cast< void >( quill::loglevel_from_string( *log_level ) );
  }
  catch( const quill::QuillError& )
  {
    return std::unexpected( config_errc::invalid_value );
  }

  opts.log_level = *log_level;

  auto name_length = get_length( option::max_name_length, opts.ledger.max_name_length, ledger_config, global_config );
  if( !name_length )
    return std::unexpected( name_length.error() );

  auto description_length = get_length( option::max_description_length,
                                        opts.ledger.max_description_length,
                                        ledger_config,
                                        global_config );
  if( !description_length )
    return std::unexpected( description_length.error() );

  auto uri_length = get_length( option::max_uri_length, opts.ledger.max_uri_length, ledger_config, global_config );
  if( !uri_length )
    return std::unexpected( uri_length.error() );

  opts.ledger.max_name_length        = *name_length;
  opts.ledger.max_description_length = *description_length;
  opts.ledger.max_uri_length         = *uri_length;

  return opts;
}

} // namespace

result< options > load( const std::filesystem::path& path )
{
  if( !std::filesystem::exists( path ) )
    return std::unexpected( config_errc::file_not_found );

  YAML::Node config;

  try
  {
    config = YAML::LoadFile( path.string() );
  }
  catch( const YAML::BadFile& )
  {
    return std::unexpected( config_errc::file_not_found );
  }
  catch( const YAML::ParserException& )
  {
    return std::unexpected( config_errc::malformed_document );
  }

  return from_node( config );
}

result< options > parse( std::string_view document )
{
  YAML::Node config;

  try
  {
    config = YAML::Load( std::string( document ) );
  }
  catch( const YAML::ParserException& )
  {
    return std::unexpected( config_errc::malformed_document );
  }

  return from_node( config );
}

} // namespace aerarium::config
