#include <string>
#include <kdisp_runtime/kernel_signature.h>

#pragma once

//embedded copy of kernels/vector_add.cl
inline const std::string g_VectorAddSrc = R"CLC(
__kernel void vector_add(__global const float* in_a,
                         __global const float* in_b,
                         __global float* out)
{
  size_t index = get_global_id(0);
  out[index] = in_a[index] + in_b[index];
}
)CLC";

inline kernel_signature vector_add_signature( std::string entry_point = "vector_add" )
{
  return kernel_signature{ entry_point,
                           { {buffer_role::INPUT_A, elem_t::FLOAT32, DIRECTION::IN  },
                             {buffer_role::INPUT_B, elem_t::FLOAT32, DIRECTION::IN  },
                             {buffer_role::OUTPUT,  elem_t::FLOAT32, DIRECTION::OUT } } };
}
