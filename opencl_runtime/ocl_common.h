#include <string>
#include <utils/common.h>

#pragma once

#ifndef CL_TARGET_OPENCL_VERSION
#define CL_TARGET_OPENCL_VERSION 300
#endif
//clCreateCommandQueue is kept for 1.2-only platforms
#define CL_USE_DEPRECATED_OPENCL_1_2_APIS
#include <CL/cl.h>

const char * cl_err_string( cl_int );

inline status cl_error( kdisp_err kind, const std::string& what, cl_int err )
{
  return make_error( kind, what + " failed : " + cl_err_string(err), err );
}

//reads a string-valued clGet*Info query
template<typename Fn>
std::string cl_info_string( Fn&& query )
{
  size_t sz = 0;
  if( query( 0, nullptr, &sz ) != CL_SUCCESS || sz == 0 ) return {};

  std::string out( sz, '\0' );
  if( query( sz, out.data(), nullptr ) != CL_SUCCESS ) return {};

  //drop the terminating null
  while( !out.empty() && out.back() == '\0' ) out.pop_back();
  return out;
}
