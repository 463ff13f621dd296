#include <vector>
#include <string>
#include <string_view>
#include <optional>
#include <algorithm>
#include <iostream>
#include <filesystem>
#include <boost/align/aligned_allocator.hpp>

#pragma once

typedef std::optional<std::string> o_string;

//page alignment keeps CL_MEM_USE_HOST_PTR buffers zero-copy
constexpr size_t g_HostAlignment = 4096;

template <typename T>
using aligned_vector = std::vector<T, boost::alignment::aligned_allocator<T, g_HostAlignment>>;

enum struct DIRECTION { IN, INOUT, OUT };

enum struct kdisp_err
{
  NONE=0,
  DEVICE_UNAVAILABLE,
  COMPILATION_ERROR,
  KERNEL_SOURCE_UNAVAILABLE,
  ENTRY_POINT_NOT_FOUND,
  PIPELINE_BUILD_ERROR,
  ALLOCATION_FAILURE,
  QUEUE_CREATION_FAILURE,
  SEQUENCE_CREATION_FAILURE,
  PASS_CREATION_FAILURE,
  ARGUMENT_MISMATCH,
  SUBMISSION_FAILURE,
  BUFFER_IN_FLIGHT,
  DEVICE_FAULT,
  TIMEOUT,
  INVALID_CONFIG
};

inline std::string_view to_string( kdisp_err err )
{
  switch( err )
  {
    case kdisp_err::NONE                      : return "None";
    case kdisp_err::DEVICE_UNAVAILABLE        : return "DeviceUnavailable";
    case kdisp_err::COMPILATION_ERROR         : return "CompilationError";
    case kdisp_err::KERNEL_SOURCE_UNAVAILABLE : return "KernelSourceUnavailable";
    case kdisp_err::ENTRY_POINT_NOT_FOUND     : return "EntryPointNotFound";
    case kdisp_err::PIPELINE_BUILD_ERROR      : return "PipelineBuildError";
    case kdisp_err::ALLOCATION_FAILURE        : return "AllocationFailure";
    case kdisp_err::QUEUE_CREATION_FAILURE    : return "QueueCreationFailure";
    case kdisp_err::SEQUENCE_CREATION_FAILURE : return "SequenceCreationFailure";
    case kdisp_err::PASS_CREATION_FAILURE     : return "PassCreationFailure";
    case kdisp_err::ARGUMENT_MISMATCH         : return "ArgumentMismatch";
    case kdisp_err::SUBMISSION_FAILURE        : return "SubmissionFailure";
    case kdisp_err::BUFFER_IN_FLIGHT          : return "BufferInFlight";
    case kdisp_err::DEVICE_FAULT              : return "DeviceFault";
    case kdisp_err::TIMEOUT                   : return "Timeout";
    case kdisp_err::INVALID_CONFIG            : return "InvalidConfig";
  }
  return "Unknown";
}

struct status {
  kdisp_err err = kdisp_err::NONE;
  //diagnostic text, e.g. the compiler build log
  std::string diag;
  //native api error code when the failure came from the driver
  int api_code = 0;

  operator bool() const
  {
    return err == kdisp_err::NONE;
  }

  std::string describe() const
  {
    std::string out{ to_string(err) };
    if( !diag.empty() ) out += ": " + diag;
    if( api_code != 0 ) out += " (api error " + std::to_string(api_code) + ")";
    return out;
  }

};

inline status make_error( kdisp_err err, std::string diag, int api_code = 0 )
{
  return status{ err, std::move(diag), api_code };
}

template <typename Container>
bool subsearch(const Container& cont, const std::string& s)
{
    return std::search(cont.begin(), cont.end(), s.begin(), s.end()) != cont.end();
}

inline bool is_file( std::optional<std::string> file )
{
  if( !file ) return false;

  return std::filesystem::is_regular_file( file.value() );

}

////////////////////////////////////////////////////////////////////////////////
//logging
////////////////////////////////////////////////////////////////////////////////
inline bool& verbose_logging()
{
  static bool verbose = false;
  return verbose;
}

#define KDISP_LOG(msg)                                    \
  do {                                                    \
    if( verbose_logging() )                               \
      std::clog << "[kdisp] " << msg << std::endl;        \
  } while(0)
