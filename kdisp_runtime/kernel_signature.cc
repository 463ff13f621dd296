#include <kdisp_runtime/kernel_signature.h>
#include <iterator>

std::string elem_type_name( elem_t type )
{
  switch( type )
  {
    case elem_t::FLOAT32 : return "float";
    case elem_t::INT32   : return "int";
    case elem_t::UINT32  : return "uint";
  }
  return "unknown";
}

std::string role_name( buffer_role role )
{
  switch( role )
  {
    case buffer_role::INPUT_A : return "InputA";
    case buffer_role::INPUT_B : return "InputB";
    case buffer_role::OUTPUT  : return "Output";
  }
  return "unknown";
}

std::optional<uint> kernel_signature::slot_of( buffer_role role ) const
{
  auto it = std::ranges::find( args, role, &kernel_arg_desc::role );

  if( it == args.end() ) return {};

  return (uint) std::distance( args.begin(), it );
}

status kernel_signature::check_binding( uint index, buffer_role role, elem_t type, DIRECTION dir ) const
{
  if( index >= args.size() )
    return make_error( kdisp_err::ARGUMENT_MISMATCH,
                       entry_point + " has " + std::to_string( args.size() ) +
                       " arguments, cannot bind index " + std::to_string(index) );

  auto& expected = args[index];

  if( expected.role != role )
    return make_error( kdisp_err::ARGUMENT_MISMATCH,
                       "index " + std::to_string(index) + " of " + entry_point + " expects " +
                       role_name(expected.role) + ", got " + role_name(role) );

  if( expected.type != type )
    return make_error( kdisp_err::ARGUMENT_MISMATCH,
                       "index " + std::to_string(index) + " of " + entry_point + " expects " +
                       elem_type_name(expected.type) + " elements, got " + elem_type_name(type) );

  if( expected.dir != dir )
    return make_error( kdisp_err::ARGUMENT_MISMATCH,
                       "index " + std::to_string(index) + " of " + entry_point +
                       " was bound with the wrong access direction" );

  return status{};
}
