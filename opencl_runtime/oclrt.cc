#include <opencl_runtime/oclrt.h>
#include <kernels/vector_add.h>

std::shared_ptr<ocl_runtime> ocl_runtime::_global_ptr;

//////////////////////////////////////////////////////////////////////////////////
/////////////////////////////////////invocation///////////////////////////////////
//////////////////////////////////////////////////////////////////////////////////
invocation::~invocation()
{
  //host storage backs the device buffers, drain before it is freed
  if( _seq && _seq->state() == seq_state::SUBMITTED && _queue )
  {
    cl_int err = clFinish( _queue->get() );
    if( err != CL_SUCCESS )
      std::cerr << "invocation teardown : clFinish failed : " << cl_err_string(err) << std::endl;
    _seq->retire();
  }
}

status invocation::fill_inputs()
{
  auto input_a = _buffers.find( buffer_role::INPUT_A );
  auto input_b = _buffers.find( buffer_role::INPUT_B );
  if( input_a == nullptr || input_b == nullptr )
    return make_error( kdisp_err::ARGUMENT_MISMATCH, "invocation is missing an input buffer" );

  if( auto st = input_a->fill( []( size_t i ){ return static_cast<float>(i); } ); !st ) return st;

  return input_b->fill( []( size_t i ){ return static_cast<float>(2 * i); } );
}

status invocation::submit()
{
  if( !_seq )
    return make_error( kdisp_err::SUBMISSION_FAILURE, "invocation has not been recorded" );

  return _seq->submit();
}

status invocation::wait( std::optional<std::chrono::milliseconds> timeout )
{
  if( !_seq )
    return make_error( kdisp_err::SUBMISSION_FAILURE, "invocation has not been recorded" );

  if( timeout ) return wait_for( *_seq, timeout.value() );

  return wait_until_complete( *_seq );
}

status invocation::read_output( std::unique_ptr<mapped_view<float> >& out )
{
  return read_output( _buffers.count(), out );
}

status invocation::read_output( size_t count, std::unique_ptr<mapped_view<float> >& out )
{
  auto output = _buffers.find( buffer_role::OUTPUT );
  if( output == nullptr )
    return make_error( kdisp_err::ARGUMENT_MISMATCH, "invocation has no Output buffer" );

  return read_all( *output, count, out );
}

//////////////////////////////////////////////////////////////////////////////////
////////////////////////////////////ocl_runtime///////////////////////////////////
//////////////////////////////////////////////////////////////////////////////////
status ocl_runtime::get_singleton( const kdisp_config& cfg, std::shared_ptr<ocl_runtime>& out )
{
  if( _global_ptr )
  {
    out = _global_ptr;
    return status{};
  }

  auto rt = std::shared_ptr<ocl_runtime>( new ocl_runtime() );
  if( auto st = rt->_init( cfg ); !st ) return st;

  out = _global_ptr = rt;
  return status{};
}

status ocl_runtime::_init( const kdisp_config& cfg )
{
  KDISP_LOG( "Ctor'ing ocl_runtime with " << cfg.to_string() );
  _config = cfg;

  if( auto st = ocl_context::acquire_default_device( cfg, _ctx ); !st ) return st;

  kernel_desc kd = cfg.kernel_file ?
                   kernel_desc{ kernel_t::EXT_SRC, cfg.entry_point, cfg.kernel_file } :
                   kernel_desc{ kernel_t::INT_SRC, cfg.entry_point, g_VectorAddSrc };

  std::string src;
  if( auto st = read_kernel_source( kd, src ); !st ) return st;

  if( auto st = ocl_program::compile( *_ctx, src, _program ); !st ) return st;

  entry_point_handle entry;
  if( auto st = _program->lookup_entry_point( cfg.entry_point, entry ); !st ) return st;

  return ocl_pipeline::build( *_ctx, entry, vector_add_signature( cfg.entry_point ), _pipeline );
}

status ocl_runtime::execute( size_t element_count, size_t group_width, std::unique_ptr<invocation>& out )
{
  KDISP_LOG( "calling ocl_runtime::" << __func__ << " with " << element_count << " element(s)" );

  std::unique_ptr<invocation> inv;
  if( auto st = allocate( element_count, inv ); !st ) return st;
  if( auto st = inv->fill_inputs(); !st ) return st;
  if( auto st = record( *inv, group_width ); !st ) return st;
  if( auto st = inv->submit(); !st ) return st;

  out = std::move( inv );
  return status{};
}

status ocl_runtime::allocate( size_t element_count, std::unique_ptr<invocation>& out )
{
  auto inv = std::unique_ptr<invocation>( new invocation() );

  if( auto st = shared_buffer_set::allocate_set( *_ctx, _pipeline->signature(), element_count, inv->_buffers ); !st )
    return st;

  out = std::move( inv );
  return status{};
}

status ocl_runtime::record( invocation& inv, size_t group_width )
{
  auto& sig = _pipeline->signature();
  size_t element_count = inv._buffers.count();

  if( inv._seq )
    return make_error( kdisp_err::SEQUENCE_CREATION_FAILURE, "invocation was already recorded" );

  if( auto st = ocl_queue::create( *_ctx, inv._queue ); !st ) return st;
  if( auto st = command_sequence::begin_sequence( *inv._queue, inv._seq ); !st ) return st;

  compute_pass * pass = nullptr;
  if( auto st = inv._seq->begin_compute_pass( pass ); !st ) return st;

  if( auto st = pass->bind( *_pipeline ); !st ) return st;

  for( auto& buff : inv._buffers.buffers() )
  {
    auto slot = sig.slot_of( buff->role() );
    if( !slot )
      return make_error( kdisp_err::ARGUMENT_MISMATCH, role_name( buff->role() ) + " has no kernel slot" );

    if( auto st = pass->bind( *buff, slot.value() ); !st ) return st;
  }

  inv._geom = compute_grid_geometry( element_count, _pipeline->max_threads_per_group(),
                                     group_width, _ctx->device().non_uniform_groups );

  if( auto st = pass->dispatch( inv._geom ); !st ) return st;

  return pass->end_pass();
}
