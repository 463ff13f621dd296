#include <vector>
#include <string>
#include <cstdint>
#include <type_traits>
#include <utils/common.h>

#pragma once

enum struct elem_t { FLOAT32, INT32, UINT32 };

enum struct buffer_role { INPUT_A, INPUT_B, OUTPUT };

constexpr size_t elem_size( elem_t type )
{
  switch( type )
  {
    case elem_t::FLOAT32 : return sizeof(float);
    case elem_t::INT32   : return sizeof(int32_t);
    case elem_t::UINT32  : return sizeof(uint32_t);
  }
  return 0;
}

//spelling of the element type in kernel argument metadata
std::string elem_type_name( elem_t );

std::string role_name( buffer_role );

template<typename T>
constexpr bool is_elem_type( elem_t type )
{
  if constexpr( std::is_same_v<T, float> )         return type == elem_t::FLOAT32;
  else if constexpr( std::is_same_v<T, int32_t> )  return type == elem_t::INT32;
  else if constexpr( std::is_same_v<T, uint32_t> ) return type == elem_t::UINT32;
  else return false;
}

struct kernel_arg_desc
{
  buffer_role role;
  elem_t      type;
  DIRECTION   dir;
};

/* Ordered argument contract of one kernel entry point.
 * Slot i of the vector is kernel argument index i. */
struct kernel_signature
{
  std::string entry_point;
  std::vector<kernel_arg_desc> args;

  size_t num_args() const { return args.size(); }

  std::optional<uint> slot_of( buffer_role ) const;

  //verifies a buffer described by (role, type, dir) may be bound at index
  status check_binding( uint index, buffer_role role, elem_t type, DIRECTION dir ) const;

};
