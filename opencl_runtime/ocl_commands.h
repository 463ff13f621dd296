#include <memory>
#include <vector>
#include <variant>
#include <optional>
#include <utils/common.h>
#include <kdisp_runtime/grid_geometry.h>
#include <opencl_runtime/ocl_common.h>
#include <opencl_runtime/ocl_context.h>
#include <opencl_runtime/ocl_pipeline.h>
#include <opencl_runtime/ocl_buffers.h>

#pragma once

//submission channel, reusable across sequences
class ocl_queue
{

  public:

    static status create( const ocl_context&, std::unique_ptr<ocl_queue>& );

    ~ocl_queue();

    ocl_queue( const ocl_queue& ) = delete;
    ocl_queue& operator=( const ocl_queue& ) = delete;

    cl_command_queue get() const { return _queue; }

    const ocl_context& context() const { return *_ctx; }

  private:

    ocl_queue() = default;

    const ocl_context * _ctx   = nullptr;
    cl_command_queue    _queue = nullptr;

};

struct bind_pipeline_op { ocl_pipeline * pipeline; };
struct bind_buffer_op   { shared_buffer * buffer; uint index; };
struct dispatch_op      { thread_grid_geometry geom; };

using recorded_op = std::variant<bind_pipeline_op, bind_buffer_op, dispatch_op>;

enum struct seq_state { RECORDING, SUBMITTED, RETIRED };

class command_sequence;

//defined with the completion barrier
struct completion_signal;

/* Encoding context for compute operations inside one sequence.
 * Owned by its command_sequence. */
class compute_pass
{

  public:

    status bind( ocl_pipeline& );

    status bind( shared_buffer&, uint index );

    status dispatch( const thread_grid_geometry& );

    status end_pass();

    bool is_open() const { return _open; }

  private:

    friend class command_sequence;

    explicit compute_pass( command_sequence& seq ) : _seq( seq ) {}

    command_sequence& _seq;
    ocl_pipeline *    _pipeline = nullptr;
    std::vector<shared_buffer *> _slots;
    bool _open = true;

};

/* One-shot recording of bind and dispatch operations, holding at most
 * one dispatch so that submit yields exactly one completion event.
 * RECORDING -> submit() -> SUBMITTED -> barrier -> RETIRED */
class command_sequence
{

  public:

    static status begin_sequence( ocl_queue&, std::unique_ptr<command_sequence>& );

    ~command_sequence();

    command_sequence( const command_sequence& ) = delete;
    command_sequence& operator=( const command_sequence& ) = delete;

    status begin_compute_pass( compute_pass *& );

    status submit();

    seq_state state() const { return _state; }

    cl_event event() const { return _event; }

    //geometry of the single dispatch, if one was recorded
    std::optional<thread_grid_geometry> dispatched_geometry() const;

    //called by the completion barrier, releases buffers for host access
    void retire();

    std::shared_ptr<completion_signal>& signal() { return _signal; }

  private:

    friend class compute_pass;

    command_sequence() = default;

    status _replay( cl_event& );

    ocl_queue * _queue = nullptr;
    std::vector<recorded_op> _ops;
    std::vector<std::unique_ptr<compute_pass> > _passes;
    std::vector<shared_buffer *> _bound;
    seq_state _state  = seq_state::RECORDING;
    cl_event  _event  = nullptr;
    std::shared_ptr<completion_signal> _signal;

};
