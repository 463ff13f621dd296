#include <opencl_runtime/ocl_context.h>
#include <ranges>
#include <regex>
#include <sstream>
#include <iterator>

std::string accel_device::to_string() const
{
  std::stringstream ss;
  ss << name << " (" << vendor << ", " << platform_name << ", " << version << ")"
     << " non_uniform_groups=" << std::boolalpha << non_uniform_groups
     << " max_work_item_x=" << max_work_item_x
     << " max_alloc=" << max_alloc;
  return ss.str();
}

status ocl_context::acquire_default_device( const kdisp_config& cfg, std::unique_ptr<ocl_context>& out )
{
  KDISP_LOG( "calling ocl_context::" << __func__ << " device=" << device_class_name(cfg.device) );

  //a GPU request falls back to dedicated accelerators
  std::vector<cl_device_type> search_order;
  switch( cfg.device )
  {
    case device_class::GPU         : search_order = { CL_DEVICE_TYPE_GPU, CL_DEVICE_TYPE_ACCELERATOR }; break;
    case device_class::ACCELERATOR : search_order = { CL_DEVICE_TYPE_ACCELERATOR }; break;
    case device_class::CPU         : search_order = { CL_DEVICE_TYPE_CPU }; break;
    case device_class::ALL         : search_order = { CL_DEVICE_TYPE_ALL }; break;
  }

  auto platforms = _get_platforms( cfg.platform_filter );

  if( platforms.empty() )
    return make_error( kdisp_err::DEVICE_UNAVAILABLE,
                       "no OpenCL platform found" +
                       (cfg.platform_filter ? " matching \"" + *cfg.platform_filter + "\"" : std::string{}) );

  for( auto dev_type : search_order )
  {
    auto to_devices = [&](cl_platform_id plat_id )
    {
      return std::make_pair( plat_id, _get_devices( plat_id, dev_type ) );
    };

    auto has_devices = []( const auto& entry ){ return !entry.second.empty(); };

    auto candidates = platforms | std::views::transform( to_devices )
                                | std::views::filter( has_devices )
                                | std::views::take(1);

    for( auto [plat_id, devices] : candidates )
    {
      auto ctx = std::unique_ptr<ocl_context>( new ocl_context() );

      if( auto st = ctx->_query_device( plat_id, devices.front() ); !st ) return st;
      if( auto st = ctx->_create_ctx(); !st ) return st;

      KDISP_LOG( "Found device " << ctx->_device.to_string() );
      out = std::move( ctx );
      return status{};
    }
  }

  return make_error( kdisp_err::DEVICE_UNAVAILABLE,
                     "no " + device_class_name(cfg.device) + " device found on " +
                     std::to_string( platforms.size() ) + " platform(s)" );
}

ocl_context::~ocl_context()
{
  if( _host_queue ) clReleaseCommandQueue( _host_queue );
  if( _ctx ) clReleaseContext( _ctx );
}

std::vector<cl_platform_id> ocl_context::_get_platforms( o_string filter )
{
  cl_uint num_platforms = 0;

  //get numbers of platforms available
  if( clGetPlatformIDs( 0, NULL, &num_platforms ) != CL_SUCCESS || num_platforms == 0 )
  {
    KDISP_LOG( "Could not find any platforms!" );
    return {};
  }

  std::vector<cl_platform_id> plat_ids( num_platforms );
  if( clGetPlatformIDs( num_platforms, plat_ids.data(), NULL ) != CL_SUCCESS ) return {};

  auto name_matches = [&](cl_platform_id plat_id)
  {
    if( !filter ) return true;

    auto plat_name = cl_info_string( [&](size_t sz, void * val, size_t * ret )
    {
      return clGetPlatformInfo( plat_id, CL_PLATFORM_NAME, sz, val, ret );
    } );

    return subsearch( plat_name, filter.value() );
  };

  std::vector<cl_platform_id> out;
  std::ranges::copy( plat_ids | std::views::filter( name_matches ), std::back_inserter(out) );

  KDISP_LOG( "Found " << out.size() << " matching platform(s) of " << num_platforms );
  return out;
}

std::vector<cl_device_id> ocl_context::_get_devices( cl_platform_id plat_id, cl_device_type dev_type )
{
  cl_uint num_devs = 0;

  //CL_DEVICE_NOT_FOUND is the normal answer for an absent device type
  if( clGetDeviceIDs( plat_id, dev_type, 0, NULL, &num_devs ) != CL_SUCCESS || num_devs == 0 )
    return {};

  std::vector<cl_device_id> devices( num_devs );
  if( clGetDeviceIDs( plat_id, dev_type, num_devs, devices.data(), NULL ) != CL_SUCCESS )
    return {};

  return devices;
}

status ocl_context::_query_device( cl_platform_id plat_id, cl_device_id dev_id )
{
  cl_int err;
  auto& dev = _device;
  dev.platform = plat_id;
  dev.id       = dev_id;

  auto dev_string = [&]( cl_device_info param )
  {
    return cl_info_string( [&](size_t sz, void * val, size_t * ret )
    {
      return clGetDeviceInfo( dev_id, param, sz, val, ret );
    } );
  };

  dev.platform_name = cl_info_string( [&](size_t sz, void * val, size_t * ret )
  {
    return clGetPlatformInfo( plat_id, CL_PLATFORM_NAME, sz, val, ret );
  } );
  dev.name    = dev_string( CL_DEVICE_NAME );
  dev.vendor  = dev_string( CL_DEVICE_VENDOR );
  dev.version = dev_string( CL_DEVICE_VERSION );

  err = clGetDeviceInfo( dev_id, CL_DEVICE_TYPE, sizeof(cl_device_type), &dev.type, NULL );
  if( err != CL_SUCCESS ) return cl_error( kdisp_err::DEVICE_UNAVAILABLE, "CL_DEVICE_TYPE query", err );

  //"OpenCL <major>.<minor> <vendor specific>"
  std::smatch match;
  static const std::regex version_re( R"(OpenCL (\d+)\.(\d+))" );
  if( std::regex_search( dev.version, match, version_re ) )
  {
    dev.major = std::stoi( match[1].str() );
    dev.minor = std::stoi( match[2].str() );
  }

  if( dev.major >= 3 )
  {
    cl_bool non_uniform = CL_FALSE;
    err = clGetDeviceInfo( dev_id, CL_DEVICE_NON_UNIFORM_WORK_GROUP_SUPPORT,
                           sizeof(cl_bool), &non_uniform, NULL );
    dev.non_uniform_groups = (err == CL_SUCCESS) && (non_uniform == CL_TRUE);
    if( dev.non_uniform_groups ) dev.cl_std_option = "-cl-std=CL3.0";
  }
  else if( dev.major == 2 )
  {
    //mandatory for OpenCL C 2.x programs
    dev.non_uniform_groups = true;
    dev.cl_std_option      = "-cl-std=CL2.0";
  }

  cl_uint dims = 0;
  err = clGetDeviceInfo( dev_id, CL_DEVICE_MAX_WORK_ITEM_DIMENSIONS, sizeof(cl_uint), &dims, NULL );
  if( err != CL_SUCCESS || dims == 0 )
    return cl_error( kdisp_err::DEVICE_UNAVAILABLE, "CL_DEVICE_MAX_WORK_ITEM_DIMENSIONS query", err );

  std::vector<size_t> item_sizes( dims );
  err = clGetDeviceInfo( dev_id, CL_DEVICE_MAX_WORK_ITEM_SIZES, sizeof(size_t) * dims, item_sizes.data(), NULL );
  if( err != CL_SUCCESS ) return cl_error( kdisp_err::DEVICE_UNAVAILABLE, "CL_DEVICE_MAX_WORK_ITEM_SIZES query", err );
  dev.max_work_item_x = std::max<size_t>( item_sizes[0], 1 );

  err = clGetDeviceInfo( dev_id, CL_DEVICE_MAX_MEM_ALLOC_SIZE, sizeof(cl_ulong), &dev.max_alloc, NULL );
  if( err != CL_SUCCESS ) return cl_error( kdisp_err::DEVICE_UNAVAILABLE, "CL_DEVICE_MAX_MEM_ALLOC_SIZE query", err );

  return status{};
}

status ocl_context::_create_ctx()
{
  cl_int err;

  _ctx = clCreateContext( NULL, 1, &_device.id, NULL, NULL, &err );
  if( err != CL_SUCCESS )
  {
    _ctx = nullptr;
    return cl_error( kdisp_err::DEVICE_UNAVAILABLE, "clCreateContext", err );
  }

  //1.2 entry point, available on every platform version
  _host_queue = clCreateCommandQueue( _ctx, _device.id, 0, &err );
  if( err != CL_SUCCESS )
  {
    _host_queue = nullptr;
    return cl_error( kdisp_err::QUEUE_CREATION_FAILURE, "clCreateCommandQueue (host queue)", err );
  }

  KDISP_LOG( "Created context and host queue for " << _device.name );
  return status{};
}
