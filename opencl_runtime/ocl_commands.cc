#include <opencl_runtime/ocl_commands.h>
#include <type_traits>

//////////////////////////////////////////////////////////////////////////////////
////////////////////////////////////ocl_queue/////////////////////////////////////
//////////////////////////////////////////////////////////////////////////////////
status ocl_queue::create( const ocl_context& ctx, std::unique_ptr<ocl_queue>& out )
{
  cl_int err;
  auto q = std::unique_ptr<ocl_queue>( new ocl_queue() );
  q->_ctx = &ctx;

  q->_queue = clCreateCommandQueue( ctx.get_ctx(), ctx.device().id, 0, &err );
  if( err != CL_SUCCESS )
  {
    q->_queue = nullptr;
    return cl_error( kdisp_err::QUEUE_CREATION_FAILURE, "clCreateCommandQueue", err );
  }

  KDISP_LOG( "Created submission queue" );
  out = std::move( q );
  return status{};
}

ocl_queue::~ocl_queue()
{
  if( _queue ) clReleaseCommandQueue( _queue );
}

//////////////////////////////////////////////////////////////////////////////////
///////////////////////////////////compute_pass///////////////////////////////////
//////////////////////////////////////////////////////////////////////////////////
status compute_pass::bind( ocl_pipeline& pipeline )
{
  if( !_open )
    return make_error( kdisp_err::ARGUMENT_MISMATCH, "bind on an ended compute pass" );

  _pipeline = &pipeline;
  _slots.assign( pipeline.signature().num_args(), nullptr );
  _seq._ops.emplace_back( bind_pipeline_op{ &pipeline } );

  return status{};
}

status compute_pass::bind( shared_buffer& buffer, uint index )
{
  if( !_open )
    return make_error( kdisp_err::ARGUMENT_MISMATCH, "bind on an ended compute pass" );

  if( _pipeline == nullptr )
    return make_error( kdisp_err::ARGUMENT_MISMATCH,
                       "buffer " + role_name( buffer.role() ) + " bound before a pipeline" );

  auto& sig = _pipeline->signature();
  if( auto st = sig.check_binding( index, buffer.role(), buffer.type(), buffer.dir() ); !st )
    return st;

  //all arguments of one dispatch share the element count
  for( auto bound : _slots )
    if( bound && bound != &buffer && bound->count() != buffer.count() )
      return make_error( kdisp_err::ARGUMENT_MISMATCH,
                         role_name( buffer.role() ) + " has " + std::to_string( buffer.count() ) +
                         " elements, " + role_name( bound->role() ) + " has " + std::to_string( bound->count() ) );

  _slots[index] = &buffer;
  _seq._ops.emplace_back( bind_buffer_op{ &buffer, index } );

  return status{};
}

status compute_pass::dispatch( const thread_grid_geometry& geom )
{
  if( !_open )
    return make_error( kdisp_err::ARGUMENT_MISMATCH, "dispatch on an ended compute pass" );

  if( _seq.dispatched_geometry() )
    return make_error( kdisp_err::ARGUMENT_MISMATCH, "command sequence already holds a dispatch" );

  //kernels index with get_global_id(0) only
  if( geom.grid.y != 1 || geom.grid.z != 1 || geom.group.y != 1 || geom.group.z != 1 )
    return make_error( kdisp_err::ARGUMENT_MISMATCH,
                       "only 1-D dispatches are supported, got " + geom.to_string() );

  if( _pipeline == nullptr )
    return make_error( kdisp_err::ARGUMENT_MISMATCH, "dispatch without a pipeline" );

  for( uint i = 0; i < _slots.size(); i++ )
    if( _slots[i] == nullptr )
      return make_error( kdisp_err::ARGUMENT_MISMATCH,
                         _pipeline->entry_point() + " argument " + std::to_string(i) + " is unbound" );

  if( geom.group.volume() > _pipeline->max_threads_per_group() )
    return make_error( kdisp_err::ARGUMENT_MISMATCH,
                       "group " + geom.to_string() + " exceeds max_threads_per_group " +
                       std::to_string( _pipeline->max_threads_per_group() ) );

  //the kernel has no bounds check, the grid must match the data exactly
  size_t work_items = _slots.empty() ? 0 : _slots.front()->count();
  if( geom.grid.volume() != work_items )
    return make_error( kdisp_err::ARGUMENT_MISMATCH,
                       "grid " + geom.to_string() + " does not cover exactly " +
                       std::to_string( work_items ) + " work-items" );

  bool non_uniform = _seq._queue->context().device().non_uniform_groups;
  if( !geom.empty() && !non_uniform && (geom.grid.x % geom.group.x) != 0 )
    return make_error( kdisp_err::ARGUMENT_MISMATCH,
                       "device requires uniform work-groups, got " + geom.to_string() );

  _seq._ops.emplace_back( dispatch_op{ geom } );

  return status{};
}

status compute_pass::end_pass()
{
  if( !_open )
    return make_error( kdisp_err::PASS_CREATION_FAILURE, "compute pass already ended" );

  _open = false;
  return status{};
}

//////////////////////////////////////////////////////////////////////////////////
/////////////////////////////////command_sequence/////////////////////////////////
//////////////////////////////////////////////////////////////////////////////////
status command_sequence::begin_sequence( ocl_queue& queue, std::unique_ptr<command_sequence>& out )
{
  if( queue.get() == nullptr )
    return make_error( kdisp_err::SEQUENCE_CREATION_FAILURE, "queue is not valid" );

  auto seq = std::unique_ptr<command_sequence>( new command_sequence() );
  seq->_queue = &queue;

  out = std::move( seq );
  return status{};
}

command_sequence::~command_sequence()
{
  if( _event ) clReleaseEvent( _event );
}

status command_sequence::begin_compute_pass( compute_pass *& pass )
{
  if( _state != seq_state::RECORDING )
    return make_error( kdisp_err::PASS_CREATION_FAILURE, "sequence is no longer recording" );

  if( !_passes.empty() && _passes.back()->is_open() )
    return make_error( kdisp_err::PASS_CREATION_FAILURE, "a compute pass is already open" );

  _passes.push_back( std::unique_ptr<compute_pass>( new compute_pass( *this ) ) );
  pass = _passes.back().get();

  return status{};
}

std::optional<thread_grid_geometry> command_sequence::dispatched_geometry() const
{
  for( auto& op : _ops )
    if( auto dop = std::get_if<dispatch_op>( &op ) ) return dop->geom;

  return {};
}

status command_sequence::submit()
{
  KDISP_LOG( "calling command_sequence::" << __func__ << " with " << _ops.size() << " recorded op(s)" );

  if( _state != seq_state::RECORDING )
    return make_error( kdisp_err::SUBMISSION_FAILURE, "sequence was already submitted" );

  if( !_passes.empty() && _passes.back()->is_open() )
    return make_error( kdisp_err::SUBMISSION_FAILURE, "compute pass was not ended" );

  cl_event evt = nullptr;
  if( auto st = _replay( evt ); !st ) return st;

  cl_int err = clFlush( _queue->get() );
  if( err != CL_SUCCESS )
  {
    clReleaseEvent( evt );
    return cl_error( kdisp_err::SUBMISSION_FAILURE, "clFlush", err );
  }

  _event = evt;
  _state = seq_state::SUBMITTED;
  for( auto buff : _bound ) buff->set_in_flight( true );

  return status{};
}

status command_sequence::_replay( cl_event& evt )
{
  cl_int err = CL_SUCCESS;
  ocl_pipeline * pipeline = nullptr;
  status st;

  auto visitor = [&]( auto& op )
  {
    using T = std::decay_t<decltype(op)>;

    if constexpr( std::is_same_v<T, bind_pipeline_op> )
    {
      pipeline = op.pipeline;
    }
    else if constexpr( std::is_same_v<T, bind_buffer_op> )
    {
      cl_mem mem = op.buffer->mem();
      err = clSetKernelArg( pipeline->kernel(), op.index, sizeof(cl_mem), mem ? &mem : NULL );
      if( err != CL_SUCCESS )
        st = cl_error( kdisp_err::SUBMISSION_FAILURE, "clSetKernelArg(" + std::to_string(op.index) + ")", err );
      else _bound.push_back( op.buffer );
    }
    else
    {
      KDISP_LOG( "Dispatching " << pipeline->entry_point() << " " << op.geom.to_string() );

      const char * call = nullptr;

      //an empty grid still produces a completion event
      if( op.geom.empty() )
      {
        call = "clEnqueueMarkerWithWaitList";
        err  = clEnqueueMarkerWithWaitList( _queue->get(), 0, NULL, &evt );
      }
      else
      {
        auto grid  = op.geom.grid.as_array();
        auto group = op.geom.group.as_array();
        call = "clEnqueueNDRangeKernel";
        err  = clEnqueueNDRangeKernel( _queue->get(), pipeline->kernel(), 1, NULL,
                                       grid.data(), group.data(), 0, NULL, &evt );
      }

      if( err != CL_SUCCESS )
        st = cl_error( kdisp_err::SUBMISSION_FAILURE, call, err );
    }
  };

  for( auto& op : _ops )
  {
    std::visit( visitor, op );
    if( !st ) break;
  }

  if( !st )
  {
    _bound.clear();
    if( evt ) clReleaseEvent( evt );
    evt = nullptr;
    return st;
  }

  //nothing dispatched, signal completion through a marker
  if( evt == nullptr )
  {
    err = clEnqueueMarkerWithWaitList( _queue->get(), 0, NULL, &evt );
    if( err != CL_SUCCESS )
      return cl_error( kdisp_err::SUBMISSION_FAILURE, "clEnqueueMarkerWithWaitList", err );
  }

  return status{};
}

void command_sequence::retire()
{
  for( auto buff : _bound ) buff->set_in_flight( false );
  _bound.clear();
  _state = seq_state::RETIRED;
}
