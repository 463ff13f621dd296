#include <opencl_runtime/ocl_buffers.h>
#include <limits>
#include <new>

status shared_buffer::allocate( const ocl_context& ctx, size_t count, elem_t type, buffer_role role,
                                std::unique_ptr<shared_buffer>& out )
{
  return allocate( ctx, count, type, role, default_direction(role), out );
}

status shared_buffer::allocate( const ocl_context& ctx, size_t count, elem_t type, buffer_role role,
                                DIRECTION dir, std::unique_ptr<shared_buffer>& out )
{
  cl_int err;
  size_t type_size = elem_size( type );

  KDISP_LOG( "Allocating " << role_name(role) << " : " << count << " x " << type_size << " bytes" );

  if( count > std::numeric_limits<size_t>::max() / type_size )
    return make_error( kdisp_err::ALLOCATION_FAILURE, role_name(role) + " size overflows" );

  size_t sz = count * type_size;

  if( sz > ctx.device().max_alloc )
    return make_error( kdisp_err::ALLOCATION_FAILURE,
                       role_name(role) + " needs " + std::to_string(sz) +
                       " bytes, device limit is " + std::to_string( ctx.device().max_alloc ) );

  auto buff = std::unique_ptr<shared_buffer>( new shared_buffer() );
  buff->_ctx   = &ctx;
  buff->_count = count;
  buff->_type  = type;
  buff->_role  = role;
  buff->_dir   = dir;

  //a zero-length dispatch binds no memory object
  if( sz == 0 )
  {
    out = std::move( buff );
    return status{};
  }

  try
  {
    buff->_host_storage.resize( sz );
  }
  catch( const std::bad_alloc& )
  {
    return make_error( kdisp_err::ALLOCATION_FAILURE,
                       "Could not allocate " + std::to_string(sz) + " bytes of host storage for " + role_name(role) );
  }

  cl_mem_flags buffer_properties = CL_MEM_USE_HOST_PTR;
  if( dir == DIRECTION::IN ) buffer_properties |= CL_MEM_READ_ONLY;
  else if( dir == DIRECTION::OUT ) buffer_properties |= CL_MEM_WRITE_ONLY;
  else buffer_properties |= CL_MEM_READ_WRITE;

  buff->_mem = clCreateBuffer( ctx.get_ctx(), buffer_properties, sz, buff->_host_storage.data(), &err );
  if( err != CL_SUCCESS )
  {
    buff->_mem = nullptr;
    return cl_error( kdisp_err::ALLOCATION_FAILURE, "clCreateBuffer(" + role_name(role) + ")", err );
  }

  out = std::move( buff );
  return status{};
}

shared_buffer::~shared_buffer()
{
  if( _mem ) clReleaseMemObject( _mem );
}

status shared_buffer::map( cl_map_flags flags, void *& ptr )
{
  cl_int err;

  if( _mem == nullptr )
    return make_error( kdisp_err::ARGUMENT_MISMATCH, "cannot map zero-length buffer " + role_name(_role) );

  ptr = clEnqueueMapBuffer( _ctx->host_queue(), _mem, CL_TRUE, flags, 0, bytes(), 0, NULL, NULL, &err );
  if( err != CL_SUCCESS )
  {
    ptr = nullptr;
    return cl_error( kdisp_err::DEVICE_FAULT, "clEnqueueMapBuffer(" + role_name(_role) + ")", err );
  }

  return status{};
}

status shared_buffer::unmap( void * ptr )
{
  cl_int err;
  cl_event unmap_event;

  err = clEnqueueUnmapMemObject( _ctx->host_queue(), _mem, ptr, 0, NULL, &unmap_event );
  if( err != CL_SUCCESS )
    return cl_error( kdisp_err::DEVICE_FAULT, "clEnqueueUnmapMemObject(" + role_name(_role) + ")", err );

  //the host write is complete once the unmap is
  err = clWaitForEvents( 1, &unmap_event );
  clReleaseEvent( unmap_event );

  if( err != CL_SUCCESS )
    return cl_error( kdisp_err::DEVICE_FAULT, "unmap of " + role_name(_role), err );

  return status{};
}

status shared_buffer_set::allocate_set( const ocl_context& ctx, const kernel_signature& sig,
                                        size_t count, shared_buffer_set& out )
{
  shared_buffer_set set;
  set._count = count;

  for( auto& arg : sig.args )
  {
    std::unique_ptr<shared_buffer> buff;
    if( auto st = shared_buffer::allocate( ctx, count, arg.type, arg.role, arg.dir, buff ); !st )
      return st;

    set._buffers.push_back( std::move(buff) );
  }

  out = std::move( set );
  return status{};
}

shared_buffer * shared_buffer_set::find( buffer_role role ) const
{
  for( auto& buff : _buffers )
    if( buff->role() == role ) return buff.get();

  return nullptr;
}
