#include <memory>
#include <string>
#include <vector>
#include <utils/common.h>
#include <kdisp_runtime/kdisp_config.h>
#include <opencl_runtime/ocl_common.h>

#pragma once

struct accel_device
{
  cl_platform_id platform = nullptr;
  cl_device_id   id       = nullptr;
  cl_device_type type     = 0;

  std::string platform_name;
  std::string name;
  std::string vendor;
  std::string version;

  //device OpenCL version, e.g. {3, 0}
  int major = 1, minor = 0;

  //true when the dispatch grid need not be a multiple of the group size
  bool non_uniform_groups = false;

  //-cl-std flag matching the device, empty for OpenCL C 1.x
  std::string cl_std_option;

  size_t   max_work_item_x = 1;
  cl_ulong max_alloc       = 0;

  std::string to_string() const;
};

/* Accelerator context: one selected device, its OpenCL context
 * and a host-access queue used only to map shared buffers. */
class ocl_context
{

  public:

    static status acquire_default_device( const kdisp_config&, std::unique_ptr<ocl_context>& );

    ~ocl_context();

    ocl_context( const ocl_context& ) = delete;
    ocl_context& operator=( const ocl_context& ) = delete;

    const accel_device& device() const { return _device; }

    cl_context get_ctx() const { return _ctx; }

    cl_command_queue host_queue() const { return _host_queue; }

  private:

    ocl_context() = default;

    static std::vector<cl_platform_id> _get_platforms( o_string );

    static std::vector<cl_device_id> _get_devices( cl_platform_id, cl_device_type );

    status _query_device( cl_platform_id, cl_device_id );

    status _create_ctx();

    accel_device     _device;
    cl_context       _ctx        = nullptr;
    cl_command_queue _host_queue = nullptr;

};
