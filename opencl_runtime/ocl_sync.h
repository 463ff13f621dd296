#include <chrono>
#include <mutex>
#include <condition_variable>
#include <utils/common.h>
#include <opencl_runtime/ocl_common.h>
#include <opencl_runtime/ocl_commands.h>

#pragma once

//shared between the waiting thread and the driver callback
struct completion_signal
{
  std::mutex              mu;
  std::condition_variable cv;
  bool   done        = false;
  cl_int exec_status = CL_COMPLETE;

  //marks completion with the event's final execution status
  void notify( cl_int final_status );
};

//waits for notify(); TIMEOUT when the deadline passes first
status await_signal( completion_signal&, std::chrono::milliseconds, cl_int& exec_status );

//blocks until the submitted sequence finishes, then retires it
status wait_until_complete( command_sequence& );

/* Bounded wait. TIMEOUT leaves the sequence SUBMITTED so it can be
 * waited on again; the callback keeps the signal alive on its own. */
status wait_for( command_sequence&, std::chrono::milliseconds );
