#include <kdisp_runtime/kdisp_config.h>
#include <charconv>
#include <cstdlib>
#include <sstream>
#include <cctype>

namespace
{

o_string get_env( const char * name )
{
  const char * val = std::getenv( name );
  if( val == nullptr || *val == '\0' ) return {};
  return std::string( val );
}

status parse_size( const char * name, const std::string& text, size_t& out )
{
  size_t val = 0;
  auto [ptr, ec] = std::from_chars( text.data(), text.data() + text.size(), val );

  if( ec != std::errc{} || ptr != text.data() + text.size() )
    return make_error( kdisp_err::INVALID_CONFIG,
                       std::string(name) + "=\"" + text + "\" is not a non-negative integer" );
  out = val;
  return status{};
}

std::string lower( std::string s )
{
  std::ranges::transform( s, s.begin(), [](unsigned char c){ return std::tolower(c); } );
  return s;
}

}

std::string device_class_name( device_class dc )
{
  switch( dc )
  {
    case device_class::GPU         : return "gpu";
    case device_class::ACCELERATOR : return "accelerator";
    case device_class::CPU         : return "cpu";
    case device_class::ALL         : return "all";
  }
  return "unknown";
}

status kdisp_config::from_env( kdisp_config& cfg )
{
  if( auto v = get_env("KDISP_ELEMENT_COUNT") )
    if( auto st = parse_size( "KDISP_ELEMENT_COUNT", *v, cfg.element_count ); !st ) return st;

  if( auto v = get_env("KDISP_GROUP_WIDTH") )
    if( auto st = parse_size( "KDISP_GROUP_WIDTH", *v, cfg.group_width ); !st ) return st;

  if( auto v = get_env("KDISP_DEVICE_TYPE") )
  {
    auto name = lower( *v );
    if( name == "gpu" )              cfg.device = device_class::GPU;
    else if( name == "accelerator" ) cfg.device = device_class::ACCELERATOR;
    else if( name == "cpu" )         cfg.device = device_class::CPU;
    else if( name == "all" )         cfg.device = device_class::ALL;
    else return make_error( kdisp_err::INVALID_CONFIG,
                            "KDISP_DEVICE_TYPE=\"" + *v + "\" must be gpu, accelerator, cpu or all" );
  }

  if( auto v = get_env("KDISP_PLATFORM") ) cfg.platform_filter = v;

  if( auto v = get_env("KDISP_KERNEL_FILE") ) cfg.kernel_file = v;

  if( auto v = get_env("KDISP_ENTRY_POINT") ) cfg.entry_point = *v;

  if( auto v = get_env("KDISP_TIMEOUT_MS") )
  {
    size_t ms = 0;
    if( auto st = parse_size( "KDISP_TIMEOUT_MS", *v, ms ); !st ) return st;
    if( ms == 0 )
      return make_error( kdisp_err::INVALID_CONFIG, "KDISP_TIMEOUT_MS must be positive" );
    cfg.timeout = std::chrono::milliseconds( ms );
  }

  if( auto v = get_env("KDISP_VERBOSE") )
  {
    if( *v == "1" )      cfg.verbose = true;
    else if( *v == "0" ) cfg.verbose = false;
    else return make_error( kdisp_err::INVALID_CONFIG, "KDISP_VERBOSE must be 0 or 1" );
  }

  return status{};
}

std::string kdisp_config::to_string() const
{
  std::stringstream ss;
  ss << "element_count=" << element_count
     << " group_width=" << group_width
     << " device=" << device_class_name( device )
     << " platform=" << platform_filter.value_or("*")
     << " kernel=" << kernel_file.value_or("<embedded>")
     << " entry_point=" << entry_point
     << " timeout_ms=";
  if( timeout ) ss << timeout->count();
  else ss << "none";
  return ss.str();
}
