#include <memory>
#include <string>
#include <utils/common.h>
#include <kdisp_runtime/kernel_signature.h>
#include <opencl_runtime/ocl_common.h>
#include <opencl_runtime/ocl_context.h>
#include <opencl_runtime/ocl_program.h>

#pragma once

class ocl_pipeline
{

  public:

    static status build( const ocl_context&, const entry_point_handle&,
                         const kernel_signature&, std::unique_ptr<ocl_pipeline>& );

    //never exceeded by a dispatched group width
    size_t max_threads_per_group() const { return _max_threads; }

    cl_kernel kernel() const { return _entry.kernel; }

    const std::string& entry_point() const { return _entry.name; }

    const kernel_signature& signature() const { return _signature; }

  private:

    ocl_pipeline() = default;

    status _check_signature();

    status _query_limits( const accel_device& );

    //kernel is owned by the ocl_program
    entry_point_handle _entry;
    kernel_signature   _signature;
    size_t _max_threads = 1;

};
