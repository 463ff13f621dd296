#include <opencl_runtime/ocl_program.h>
#include <fstream>
#include <sstream>
#include <iterator>

status read_kernel_source( const kernel_desc& kd, std::string& src )
{
  auto impl = kd.get_kernel_def();

  if( !impl )
    return make_error( kdisp_err::KERNEL_SOURCE_UNAVAILABLE,
                       "no definition given for " + kd.get_kernel_name() );

  if( kd.get_kernel_type() == kernel_t::INT_SRC )
  {
    src = impl.value();
    return status{};
  }

  if( !is_file( impl ) )
    return make_error( kdisp_err::KERNEL_SOURCE_UNAVAILABLE,
                       "Could not locate " + impl.value() );

  //read contents of file
  std::ifstream file( impl.value(), std::ios::binary );
  if( !file.good() )
    return make_error( kdisp_err::KERNEL_SOURCE_UNAVAILABLE,
                       "Could not open " + impl.value() );

  src = std::string( (std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>() );
  KDISP_LOG( "Read " << src.size() << " bytes of kernel source from " << impl.value() );

  return status{};
}

status ocl_program::compile( const ocl_context& ctx, const std::string& src, std::unique_ptr<ocl_program>& out )
{
  KDISP_LOG( "calling ocl_program::" << __func__ );
  cl_int err;
  auto& dev = ctx.device();

  if( src.find_first_not_of( " \t\r\n" ) == std::string::npos )
    return make_error( kdisp_err::COMPILATION_ERROR, "kernel source is empty" );

  auto prog = std::unique_ptr<ocl_program>( new ocl_program() );

  const char * src_ptr = src.c_str();
  size_t src_size      = src.size();

  prog->_program = clCreateProgramWithSource( ctx.get_ctx(), 1, &src_ptr, &src_size, &err );
  if( err != CL_SUCCESS )
  {
    prog->_program = nullptr;
    return cl_error( kdisp_err::COMPILATION_ERROR, "clCreateProgramWithSource", err );
  }

  //arg info lets the pipeline check the kernel signature
  std::string options = dev.cl_std_option + " -cl-kernel-arg-info";

  err = clBuildProgram( prog->_program, 1, &dev.id, options.c_str(), NULL, NULL );
  if( err != CL_SUCCESS )
  {
    auto build_log = _get_build_log( prog->_program, dev.id );
    KDISP_LOG( "Failed to build program : " << build_log );
    auto diag = build_log.empty() ? std::string("clBuildProgram failed") : build_log;
    return make_error( kdisp_err::COMPILATION_ERROR, diag, err );
  }

  size_t num_kernels = 0;
  err = clGetProgramInfo( prog->_program, CL_PROGRAM_NUM_KERNELS, sizeof(size_t), &num_kernels, NULL );
  if( err != CL_SUCCESS )
    return cl_error( kdisp_err::COMPILATION_ERROR, "CL_PROGRAM_NUM_KERNELS query", err );

  if( num_kernels == 0 )
    return make_error( kdisp_err::COMPILATION_ERROR, "program declares no kernel entry points" );

  KDISP_LOG( "Successfully created program with " << num_kernels << " kernel(s)" );
  out = std::move( prog );
  return status{};
}

status ocl_program::lookup_entry_point( const std::string& name, entry_point_handle& handle )
{
  cl_int err;

  if( auto it = _kernels.find( name ); it != _kernels.end() && it->second )
  {
    handle = entry_point_handle{ name, it->second.value() };
    return status{};
  }

  auto kernel = clCreateKernel( _program, name.c_str(), &err );

  if( err == CL_INVALID_KERNEL_NAME )
  {
    std::string declared;
    for( auto& kname : kernel_names() ) declared += (declared.empty() ? "" : ", ") + kname;

    return make_error( kdisp_err::ENTRY_POINT_NOT_FOUND,
                       name + " (program declares: " + declared + ")", err );
  }
  else if( err != CL_SUCCESS )
    return cl_error( kdisp_err::ENTRY_POINT_NOT_FOUND, "clCreateKernel(" + name + ")", err );

  KDISP_LOG( "Successfully created kernel for " << name );
  _kernels[name] = kernel;
  handle = entry_point_handle{ name, kernel };

  return status{};
}

std::vector<std::string> ocl_program::kernel_names() const
{
  auto names = cl_info_string( [&](size_t sz, void * val, size_t * ret )
  {
    return clGetProgramInfo( _program, CL_PROGRAM_KERNEL_NAMES, sz, val, ret );
  } );

  //semicolon separated list
  std::vector<std::string> out;
  std::stringstream ss( names );
  for( std::string kname; std::getline( ss, kname, ';' ); )
    if( !kname.empty() ) out.push_back( kname );

  return out;
}

std::string ocl_program::_get_build_log( cl_program program, cl_device_id dev_id )
{
  return cl_info_string( [&](size_t sz, void * val, size_t * ret )
  {
    return clGetProgramBuildInfo( program, dev_id, CL_PROGRAM_BUILD_LOG, sz, val, ret );
  } );
}

ocl_program::~ocl_program()
{
  for( auto& [kname, kernel] : _kernels )
    if( kernel ) clReleaseKernel( kernel.value() );

  if( _program ) clReleaseProgram( _program );
}
