#include <chrono>
#include <memory>
#include <optional>
#include <utils/common.h>
#include <kdisp_runtime/kdisp_config.h>
#include <kdisp_runtime/grid_geometry.h>
#include <kdisp_runtime/kernel_signature.h>
#include <opencl_runtime/ocl_context.h>
#include <opencl_runtime/ocl_program.h>
#include <opencl_runtime/ocl_pipeline.h>
#include <opencl_runtime/ocl_buffers.h>
#include <opencl_runtime/ocl_commands.h>
#include <opencl_runtime/ocl_sync.h>
#include <opencl_runtime/ocl_reader.h>

#pragma once

/* One submitted dispatch: owns its queue, buffers and sequence.
 * No state is shared between invocations. */
class invocation
{

  public:

    ~invocation();

    invocation( const invocation& ) = delete;
    invocation& operator=( const invocation& ) = delete;

    //A[i] = i, B[i] = 2i
    status fill_inputs();

    status submit();

    //unset timeout waits without a deadline
    status wait( std::optional<std::chrono::milliseconds> timeout = {} );

    //the whole output buffer
    status read_output( std::unique_ptr<mapped_view<float> >& );

    status read_output( size_t count, std::unique_ptr<mapped_view<float> >& );

    const thread_grid_geometry& geometry() const { return _geom; }

    size_t element_count() const { return _buffers.count(); }

    command_sequence& sequence() { return *_seq; }

    shared_buffer_set& buffers() { return _buffers; }

  private:

    friend class ocl_runtime;

    invocation() = default;

    //declaration order is teardown order in reverse
    std::unique_ptr<ocl_queue>        _queue;
    shared_buffer_set                 _buffers;
    std::unique_ptr<command_sequence> _seq;
    thread_grid_geometry              _geom;

};

class ocl_runtime
{

  public:

    //first successful call selects the device and builds the pipeline
    static status get_singleton( const kdisp_config&, std::shared_ptr<ocl_runtime>& );

    //allocate, fill_inputs, record and submit in one call
    status execute( size_t element_count, size_t group_width, std::unique_ptr<invocation>& );

    //shared buffers for every kernel argument
    status allocate( size_t element_count, std::unique_ptr<invocation>& );

    //queue, sequence and one compute pass holding the dispatch
    status record( invocation&, size_t group_width );

    const accel_device& device() const { return _ctx->device(); }

    const ocl_context& context() const { return *_ctx; }

    ocl_pipeline& pipeline() { return *_pipeline; }

    size_t max_threads_per_group() const { return _pipeline->max_threads_per_group(); }

    const kdisp_config& config() const { return _config; }

  private:

    ocl_runtime() = default;

    status _init( const kdisp_config& );

    kdisp_config                  _config;
    std::unique_ptr<ocl_context>  _ctx;
    std::unique_ptr<ocl_program>  _program;
    std::unique_ptr<ocl_pipeline> _pipeline;

    static std::shared_ptr<ocl_runtime> _global_ptr;

};
