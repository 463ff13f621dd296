#include <opencl_runtime/ocl_pipeline.h>

status ocl_pipeline::build( const ocl_context& ctx, const entry_point_handle& entry,
                            const kernel_signature& sig, std::unique_ptr<ocl_pipeline>& out )
{
  KDISP_LOG( "calling ocl_pipeline::" << __func__ << " for " << entry.name );

  if( entry.kernel == nullptr )
    return make_error( kdisp_err::PIPELINE_BUILD_ERROR, "no kernel for entry point " + entry.name );

  auto pipe = std::unique_ptr<ocl_pipeline>( new ocl_pipeline() );
  pipe->_entry     = entry;
  pipe->_signature = sig;

  if( auto st = pipe->_check_signature(); !st ) return st;
  if( auto st = pipe->_query_limits( ctx.device() ); !st ) return st;

  KDISP_LOG( "Pipeline " << entry.name << " max_threads_per_group=" << pipe->_max_threads );

  out = std::move( pipe );
  return status{};
}

status ocl_pipeline::_check_signature()
{
  cl_int err;
  cl_uint num_args = 0;

  err = clGetKernelInfo( _entry.kernel, CL_KERNEL_NUM_ARGS, sizeof(cl_uint), &num_args, NULL );
  if( err != CL_SUCCESS )
    return cl_error( kdisp_err::PIPELINE_BUILD_ERROR, "CL_KERNEL_NUM_ARGS query", err );

  if( num_args != _signature.num_args() )
    return make_error( kdisp_err::PIPELINE_BUILD_ERROR,
                       _entry.name + " takes " + std::to_string(num_args) + " arguments, expected " +
                       std::to_string( _signature.num_args() ) );

  for( uint i = 0; i < num_args; i++ )
  {
    auto& expected = _signature.args[i];
    auto arg_name  = _entry.name + " argument " + std::to_string(i);

    cl_kernel_arg_address_qualifier addr;
    err = clGetKernelArgInfo( _entry.kernel, i, CL_KERNEL_ARG_ADDRESS_QUALIFIER, sizeof(addr), &addr, NULL );

    //metadata is optional, only the argument count is checked without it
    if( err == CL_KERNEL_ARG_INFO_NOT_AVAILABLE )
    {
      KDISP_LOG( "No argument metadata for " << _entry.name << ", skipping type checks" );
      return status{};
    }
    if( err != CL_SUCCESS )
      return cl_error( kdisp_err::PIPELINE_BUILD_ERROR, "CL_KERNEL_ARG_ADDRESS_QUALIFIER query", err );

    if( addr != CL_KERNEL_ARG_ADDRESS_GLOBAL )
      return make_error( kdisp_err::PIPELINE_BUILD_ERROR, arg_name + " is not a __global buffer" );

    auto type_name = cl_info_string( [&](size_t sz, void * val, size_t * ret )
    {
      return clGetKernelArgInfo( _entry.kernel, i, CL_KERNEL_ARG_TYPE_NAME, sz, val, ret );
    } );

    //some drivers report "float *"
    std::erase( type_name, ' ' );
    auto expected_name = elem_type_name( expected.type ) + "*";
    if( type_name != expected_name )
      return make_error( kdisp_err::PIPELINE_BUILD_ERROR,
                         arg_name + " is " + type_name + ", expected " + expected_name );

    cl_kernel_arg_type_qualifier quals = 0;
    err = clGetKernelArgInfo( _entry.kernel, i, CL_KERNEL_ARG_TYPE_QUALIFIER, sizeof(quals), &quals, NULL );
    if( err != CL_SUCCESS )
      return cl_error( kdisp_err::PIPELINE_BUILD_ERROR, "CL_KERNEL_ARG_TYPE_QUALIFIER query", err );

    bool is_const = (quals & CL_KERNEL_ARG_TYPE_CONST) != 0;
    if( expected.dir != DIRECTION::IN && is_const )
      return make_error( kdisp_err::PIPELINE_BUILD_ERROR, arg_name + " is const but must be written" );
  }

  return status{};
}

status ocl_pipeline::_query_limits( const accel_device& dev )
{
  cl_int err;
  size_t wg_size = 0;

  err = clGetKernelWorkGroupInfo( _entry.kernel, dev.id, CL_KERNEL_WORK_GROUP_SIZE,
                                  sizeof(size_t), &wg_size, NULL );
  if( err != CL_SUCCESS )
    return cl_error( kdisp_err::PIPELINE_BUILD_ERROR, "CL_KERNEL_WORK_GROUP_SIZE query", err );

  _max_threads = std::min( wg_size, dev.max_work_item_x );

  if( _max_threads == 0 )
    return make_error( kdisp_err::PIPELINE_BUILD_ERROR, _entry.name + " reports a zero work-group limit" );

  return status{};
}
