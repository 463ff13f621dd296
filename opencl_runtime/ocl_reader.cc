#include <opencl_runtime/ocl_reader.h>

status read_all( shared_buffer& buffer, size_t count, std::unique_ptr<mapped_view<float> >& out )
{
  KDISP_LOG( "calling " << __func__ << " on " << role_name( buffer.role() ) << " for " << count << " element(s)" );

  if( buffer.in_flight() )
    return make_error( kdisp_err::BUFFER_IN_FLIGHT,
                       "cannot read " + role_name( buffer.role() ) + " before the completion barrier" );

  if( !is_elem_type<float>( buffer.type() ) )
    return make_error( kdisp_err::ARGUMENT_MISMATCH,
                       role_name( buffer.role() ) + " holds " + elem_type_name( buffer.type() ) + ", not float" );

  if( count > buffer.count() )
    return make_error( kdisp_err::ARGUMENT_MISMATCH,
                       "requested " + std::to_string(count) + " elements, " + role_name( buffer.role() ) +
                       " has " + std::to_string( buffer.count() ) );

  if( count == 0 )
  {
    out = std::make_unique<mapped_view<float> >();
    return status{};
  }

  void * ptr = nullptr;
  if( auto st = buffer.map( CL_MAP_READ, ptr ); !st ) return st;

  out = std::make_unique<mapped_view<float> >( &buffer, static_cast<float *>( ptr ), count );
  return status{};
}
