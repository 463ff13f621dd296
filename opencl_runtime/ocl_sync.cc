#include <opencl_runtime/ocl_sync.h>

void completion_signal::notify( cl_int final_status )
{
  {
    std::lock_guard<std::mutex> lk( mu );
    done        = true;
    exec_status = final_status;
  }
  cv.notify_all();
}

status await_signal( completion_signal& sig, std::chrono::milliseconds timeout, cl_int& exec_status )
{
  std::unique_lock<std::mutex> lk( sig.mu );
  if( !sig.cv.wait_for( lk, timeout, [&]{ return sig.done; } ) )
    return make_error( kdisp_err::TIMEOUT,
                       "sequence did not complete within " + std::to_string( timeout.count() ) + "ms" );

  exec_status = sig.exec_status;
  return status{};
}

static void CL_CALLBACK _on_complete( cl_event, cl_int exec_status, void * user_data )
{
  auto sig = static_cast<std::shared_ptr<completion_signal> *>( user_data );
  (*sig)->notify( exec_status );
  delete sig;
}

static status _check_submitted( const command_sequence& seq )
{
  if( seq.state() != seq_state::SUBMITTED || seq.event() == nullptr )
    return make_error( kdisp_err::SUBMISSION_FAILURE, "sequence is not in flight" );

  return status{};
}

static status _finish( command_sequence& seq, cl_int exec_status )
{
  //buffers are released for host access on success and on fault
  seq.retire();

  if( exec_status < 0 )
    return cl_error( kdisp_err::DEVICE_FAULT, "command execution", exec_status );

  return status{};
}

status wait_until_complete( command_sequence& seq )
{
  KDISP_LOG( "calling " << __func__ );

  if( auto st = _check_submitted( seq ); !st ) return st;

  cl_event evt = seq.event();
  cl_int err   = clWaitForEvents( 1, &evt );

  cl_int exec_status = CL_COMPLETE;
  cl_int qerr = clGetEventInfo( evt, CL_EVENT_COMMAND_EXECUTION_STATUS,
                                sizeof(cl_int), &exec_status, NULL );
  if( qerr != CL_SUCCESS )
  {
    seq.retire();
    return cl_error( kdisp_err::DEVICE_FAULT, "CL_EVENT_COMMAND_EXECUTION_STATUS query", qerr );
  }

  //CL_EXEC_STATUS_ERROR_FOR_EVENTS_IN_WAIT_LIST carries no detail, report the event status
  if( err != CL_SUCCESS && exec_status >= 0 )
  {
    seq.retire();
    return cl_error( kdisp_err::DEVICE_FAULT, "clWaitForEvents", err );
  }

  return _finish( seq, exec_status );
}

status wait_for( command_sequence& seq, std::chrono::milliseconds timeout )
{
  KDISP_LOG( "calling " << __func__ << " with timeout " << timeout.count() << "ms" );

  if( auto st = _check_submitted( seq ); !st ) return st;

  auto& sig = seq.signal();
  if( !sig )
  {
    sig = std::make_shared<completion_signal>();
    auto user_data = new std::shared_ptr<completion_signal>( sig );

    cl_int err = clSetEventCallback( seq.event(), CL_COMPLETE, _on_complete, user_data );
    if( err != CL_SUCCESS )
    {
      delete user_data;
      sig.reset();
      return cl_error( kdisp_err::DEVICE_FAULT, "clSetEventCallback", err );
    }
  }

  cl_int exec_status = CL_COMPLETE;
  if( auto st = await_signal( *sig, timeout, exec_status ); !st ) return st;

  return _finish( seq, exec_status );
}
