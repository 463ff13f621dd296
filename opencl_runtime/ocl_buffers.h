#include <memory>
#include <vector>
#include <type_traits>
#include <utils/common.h>
#include <kdisp_runtime/kernel_signature.h>
#include <opencl_runtime/ocl_common.h>
#include <opencl_runtime/ocl_context.h>

#pragma once

constexpr DIRECTION default_direction( buffer_role role )
{
  return role == buffer_role::OUTPUT ? DIRECTION::OUT : DIRECTION::IN;
}

/* Host-and-device visible region. The host storage is page aligned and
 * handed to the driver with CL_MEM_USE_HOST_PTR; every host access goes
 * through a blocking map on the context's host queue. */
class shared_buffer
{

  public:

    static status allocate( const ocl_context&, size_t count, elem_t, buffer_role,
                            std::unique_ptr<shared_buffer>& );

    static status allocate( const ocl_context&, size_t count, elem_t, buffer_role, DIRECTION,
                            std::unique_ptr<shared_buffer>& );

    ~shared_buffer();

    shared_buffer( const shared_buffer& ) = delete;
    shared_buffer& operator=( const shared_buffer& ) = delete;

    //synchronous host write, buffer[i] = gen(i)
    template<typename Gen>
    status fill( Gen&& gen );

    size_t count() const { return _count; }
    size_t bytes() const { return _count * elem_size(_type); }
    elem_t type() const { return _type; }
    buffer_role role() const { return _role; }
    DIRECTION dir() const { return _dir; }

    //null for a zero-length buffer
    cl_mem mem() const { return _mem; }

    //set between submission and the completion barrier
    bool in_flight() const { return _in_flight; }
    void set_in_flight( bool flight ) { _in_flight = flight; }

    status map( cl_map_flags, void *& );
    status unmap( void * );

  private:

    shared_buffer() = default;

    const ocl_context *          _ctx = nullptr;
    aligned_vector<unsigned char> _host_storage;
    cl_mem      _mem   = nullptr;
    size_t      _count = 0;
    elem_t      _type  = elem_t::FLOAT32;
    buffer_role _role  = buffer_role::INPUT_A;
    DIRECTION   _dir   = DIRECTION::IN;
    bool        _in_flight = false;

};

template<typename Gen>
status shared_buffer::fill( Gen&& gen )
{
  using T = std::invoke_result_t<Gen, size_t>;

  if( !is_elem_type<T>( _type ) )
    return make_error( kdisp_err::ARGUMENT_MISMATCH,
                       "generator type does not match " + elem_type_name(_type) + " buffer " + role_name(_role) );

  if( _in_flight )
    return make_error( kdisp_err::BUFFER_IN_FLIGHT, "cannot fill " + role_name(_role) + " while submitted" );

  if( _count == 0 ) return status{};

  void * ptr = nullptr;
  if( auto st = map( CL_MAP_WRITE_INVALIDATE_REGION, ptr ); !st ) return st;

  auto vals = static_cast<T *>( ptr );
  for( size_t i = 0; i < _count; i++ ) vals[i] = gen(i);

  return unmap( ptr );
}

/* One buffer per kernel argument, all with the same element count. */
class shared_buffer_set
{

  public:

    static status allocate_set( const ocl_context&, const kernel_signature&, size_t count, shared_buffer_set& );

    shared_buffer * find( buffer_role ) const;

    size_t count() const { return _count; }

    std::vector<std::unique_ptr<shared_buffer> >& buffers() { return _buffers; }

  private:

    std::vector<std::unique_ptr<shared_buffer> > _buffers;
    size_t _count = 0;

};
