#include <gtest/gtest.h>
#include <chrono>
#include <vector>
#include <opencl_runtime/oclrt.h>
#include <kernels/vector_add.h>

namespace
{

//any OpenCL device qualifies, CPU implementations included
kdisp_config device_config()
{
  kdisp_config cfg;
  cfg.device = device_class::ALL;
  return cfg;
}

class DevicePipelineTest : public ::testing::Test
{
  protected:

    void SetUp() override
    {
      auto st = ocl_context::acquire_default_device( device_config(), _ctx );
      if( st.err == kdisp_err::DEVICE_UNAVAILABLE ) GTEST_SKIP() << st.describe();
      ASSERT_TRUE( st ) << st.describe();

      st = ocl_runtime::get_singleton( device_config(), _rt );
      ASSERT_TRUE( st ) << st.describe();
    }

    //submits, waits and copies the output for comparison
    std::vector<float> run( size_t count, size_t group_width = g_DefaultGroupWidth )
    {
      std::unique_ptr<invocation> inv;
      auto st = _rt->execute( count, group_width, inv );
      EXPECT_TRUE( st ) << st.describe();
      if( !st ) return {};

      st = inv->wait();
      EXPECT_TRUE( st ) << st.describe();

      std::unique_ptr<mapped_view<float> > view;
      st = inv->read_output( view );
      EXPECT_TRUE( st ) << st.describe();
      if( !st ) return {};

      return std::vector<float>( view->values().begin(), view->values().end() );
    }

    std::unique_ptr<ocl_context> _ctx;
    std::shared_ptr<ocl_runtime> _rt;
};

}

TEST_F( DevicePipelineTest, OneMillionElementsSumToThreeI )
{
  auto out = run( 1000000 );
  ASSERT_EQ( out.size(), 1000000u );

  EXPECT_EQ( out[0], 0.0f );
  EXPECT_EQ( out[1], 3.0f );
  EXPECT_EQ( out[999999], 2999997.0f );

  for( size_t i = 0; i < out.size(); i++ )
    ASSERT_EQ( out[i], static_cast<float>(3 * i) ) << "at index " << i;
}

TEST_F( DevicePipelineTest, ZeroElementsCompleteWithEmptyOutput )
{
  std::unique_ptr<invocation> inv;
  ASSERT_TRUE( _rt->execute( 0, g_DefaultGroupWidth, inv ) );
  EXPECT_TRUE( inv->geometry().empty() );

  auto st = inv->wait();
  ASSERT_TRUE( st ) << st.describe();

  std::unique_ptr<mapped_view<float> > view;
  ASSERT_TRUE( inv->read_output( view ) );
  EXPECT_EQ( view->size(), 0u );
  EXPECT_TRUE( view->values().empty() );
}

TEST_F( DevicePipelineTest, SingleElementUsesGroupOfOne )
{
  std::unique_ptr<invocation> inv;
  ASSERT_TRUE( _rt->execute( 1, g_DefaultGroupWidth, inv ) );
  EXPECT_EQ( inv->geometry().group.x, 1u );
  ASSERT_TRUE( inv->wait() );

  std::unique_ptr<mapped_view<float> > view;
  ASSERT_TRUE( inv->read_output( view ) );
  ASSERT_EQ( view->size(), 1u );
  EXPECT_EQ( (*view)[0], 0.0f );
}

TEST_F( DevicePipelineTest, RepeatedRunsAreIdentical )
{
  auto first  = run( 65537 );
  auto second = run( 65537 );

  ASSERT_EQ( first.size(), 65537u );
  EXPECT_EQ( first, second );
}

TEST_F( DevicePipelineTest, GroupNeverExceedsPipelineLimit )
{
  for( size_t count : {1, 17, 255, 256, 1000, 4099} )
  {
    std::unique_ptr<invocation> inv;
    ASSERT_TRUE( _rt->execute( count, 0, inv ) );
    EXPECT_LE( inv->geometry().group.x, _rt->max_threads_per_group() );
    EXPECT_EQ( inv->geometry().grid.x, count );
    ASSERT_TRUE( inv->wait() );
  }
}

TEST_F( DevicePipelineTest, BoundedWaitCompletes )
{
  std::unique_ptr<invocation> inv;
  ASSERT_TRUE( _rt->execute( 4096, g_DefaultGroupWidth, inv ) );

  auto st = inv->wait( std::chrono::milliseconds( 30000 ) );
  ASSERT_TRUE( st ) << st.describe();
  EXPECT_EQ( inv->sequence().state(), seq_state::RETIRED );

  //a retired sequence has nothing left to wait on
  EXPECT_EQ( inv->wait().err, kdisp_err::SUBMISSION_FAILURE );

  std::unique_ptr<mapped_view<float> > view;
  ASSERT_TRUE( inv->read_output( view ) );
  EXPECT_EQ( (*view)[4095], static_cast<float>(3 * 4095) );
}

TEST_F( DevicePipelineTest, HostAccessWhileInFlightIsRejected )
{
  std::unique_ptr<invocation> inv;
  ASSERT_TRUE( _rt->execute( 1024, g_DefaultGroupWidth, inv ) );

  auto input_a = inv->buffers().find( buffer_role::INPUT_A );
  ASSERT_NE( input_a, nullptr );
  EXPECT_EQ( input_a->fill( []( size_t ){ return 1.0f; } ).err, kdisp_err::BUFFER_IN_FLIGHT );

  std::unique_ptr<mapped_view<float> > view;
  EXPECT_EQ( inv->read_output( view ).err, kdisp_err::BUFFER_IN_FLIGHT );

  ASSERT_TRUE( inv->wait() );
  EXPECT_FALSE( input_a->in_flight() );
  EXPECT_TRUE( inv->read_output( view ) );
}

TEST_F( DevicePipelineTest, SecondSubmitFails )
{
  std::unique_ptr<invocation> inv;
  ASSERT_TRUE( _rt->execute( 512, g_DefaultGroupWidth, inv ) );

  EXPECT_EQ( inv->sequence().submit().err, kdisp_err::SUBMISSION_FAILURE );
  ASSERT_TRUE( inv->wait() );
}

TEST_F( DevicePipelineTest, ReadingPastTheBufferIsAMismatch )
{
  std::unique_ptr<invocation> inv;
  ASSERT_TRUE( _rt->execute( 64, g_DefaultGroupWidth, inv ) );
  ASSERT_TRUE( inv->wait() );

  std::unique_ptr<mapped_view<float> > view;
  EXPECT_EQ( inv->read_output( 65, view ).err, kdisp_err::ARGUMENT_MISMATCH );
}

TEST_F( DevicePipelineTest, MisboundSlotIsRejected )
{
  std::unique_ptr<shared_buffer> output;
  ASSERT_TRUE( shared_buffer::allocate( _rt->context(), 16, elem_t::FLOAT32, buffer_role::OUTPUT, output ) );

  std::unique_ptr<ocl_queue> queue;
  ASSERT_TRUE( ocl_queue::create( _rt->context(), queue ) );

  std::unique_ptr<command_sequence> seq;
  ASSERT_TRUE( command_sequence::begin_sequence( *queue, seq ) );

  compute_pass * pass = nullptr;
  ASSERT_TRUE( seq->begin_compute_pass( pass ) );

  //buffers need a pipeline first
  EXPECT_EQ( pass->bind( *output, 2 ).err, kdisp_err::ARGUMENT_MISMATCH );

  ASSERT_TRUE( pass->bind( _rt->pipeline() ) );
  EXPECT_EQ( pass->bind( *output, 0 ).err, kdisp_err::ARGUMENT_MISMATCH );
  EXPECT_EQ( pass->bind( *output, 3 ).err, kdisp_err::ARGUMENT_MISMATCH );
  EXPECT_TRUE( pass->bind( *output, 2 ) );

  //slots 0 and 1 are still unbound
  auto geom = compute_grid_geometry( 16, _rt->max_threads_per_group() );
  EXPECT_EQ( pass->dispatch( geom ).err, kdisp_err::ARGUMENT_MISMATCH );

  //submitting with an open pass is refused
  EXPECT_EQ( seq->submit().err, kdisp_err::SUBMISSION_FAILURE );
  ASSERT_TRUE( pass->end_pass() );
  EXPECT_EQ( pass->end_pass().err, kdisp_err::PASS_CREATION_FAILURE );
}

TEST_F( DevicePipelineTest, GridMustCoverTheDataExactly )
{
  shared_buffer_set set;
  ASSERT_TRUE( shared_buffer_set::allocate_set( _rt->context(), _rt->pipeline().signature(), 16, set ) );

  std::unique_ptr<ocl_queue> queue;
  ASSERT_TRUE( ocl_queue::create( _rt->context(), queue ) );

  std::unique_ptr<command_sequence> seq;
  ASSERT_TRUE( command_sequence::begin_sequence( *queue, seq ) );

  compute_pass * pass = nullptr;
  ASSERT_TRUE( seq->begin_compute_pass( pass ) );
  ASSERT_TRUE( pass->bind( _rt->pipeline() ) );

  for( auto& buff : set.buffers() )
    ASSERT_TRUE( pass->bind( *buff, _rt->pipeline().signature().slot_of( buff->role() ).value() ) );

  auto short_grid = compute_grid_geometry( 10, _rt->max_threads_per_group() );
  EXPECT_EQ( pass->dispatch( short_grid ).err, kdisp_err::ARGUMENT_MISMATCH );
}

TEST_F( DevicePipelineTest, InvalidSourceReportsBuildLog )
{
  std::unique_ptr<ocl_program> prog;
  auto st = ocl_program::compile( *_ctx, "__kernel void vector_add( __global float* a { a[0] = ; }", prog );

  EXPECT_EQ( st.err, kdisp_err::COMPILATION_ERROR );
  EXPECT_FALSE( st.diag.empty() );
  EXPECT_EQ( prog.get(), nullptr );
}

TEST_F( DevicePipelineTest, EmptySourceIsACompilationError )
{
  std::unique_ptr<ocl_program> prog;
  EXPECT_EQ( ocl_program::compile( *_ctx, "  \n", prog ).err, kdisp_err::COMPILATION_ERROR );
}

TEST_F( DevicePipelineTest, UnknownEntryPointIsNotFound )
{
  std::unique_ptr<ocl_program> prog;
  auto st = ocl_program::compile( *_ctx, g_VectorAddSrc, prog );
  ASSERT_TRUE( st ) << st.describe();

  entry_point_handle entry;
  EXPECT_EQ( prog->lookup_entry_point( "vector_mul", entry ).err, kdisp_err::ENTRY_POINT_NOT_FOUND );

  ASSERT_TRUE( prog->lookup_entry_point( "vector_add", entry ) );
  EXPECT_NE( entry.kernel, nullptr );
}

TEST_F( DevicePipelineTest, SignatureArityIsChecked )
{
  std::string src = "__kernel void vector_add( __global const float* a, __global float* out )"
                    "{ out[get_global_id(0)] = a[get_global_id(0)]; }";

  std::unique_ptr<ocl_program> prog;
  ASSERT_TRUE( ocl_program::compile( *_ctx, src, prog ) );

  entry_point_handle entry;
  ASSERT_TRUE( prog->lookup_entry_point( "vector_add", entry ) );

  std::unique_ptr<ocl_pipeline> pipe;
  EXPECT_EQ( ocl_pipeline::build( *_ctx, entry, vector_add_signature(), pipe ).err,
             kdisp_err::PIPELINE_BUILD_ERROR );
}

TEST_F( DevicePipelineTest, ShippedKernelFileBuilds )
{
  kernel_desc kd{ kernel_t::EXT_SRC, "vector_add", std::string(KDISP_KERNEL_DIR) + "/vector_add.cl" };
  std::string src;
  ASSERT_TRUE( read_kernel_source( kd, src ) );

  std::unique_ptr<ocl_program> prog;
  auto st = ocl_program::compile( *_ctx, src, prog );
  ASSERT_TRUE( st ) << st.describe();

  entry_point_handle entry;
  ASSERT_TRUE( prog->lookup_entry_point( "vector_add", entry ) );

  std::unique_ptr<ocl_pipeline> pipe;
  st = ocl_pipeline::build( *_ctx, entry, vector_add_signature(), pipe );
  ASSERT_TRUE( st ) << st.describe();
  EXPECT_GE( pipe->max_threads_per_group(), 1u );
}

namespace
{

//binds every buffer of set to its kernel slot on a fresh pass of seq
status bind_all( ocl_pipeline& pipeline, shared_buffer_set& set, command_sequence& seq, compute_pass *& pass )
{
  if( auto st = seq.begin_compute_pass( pass ); !st ) return st;
  if( auto st = pass->bind( pipeline ); !st ) return st;

  for( auto& buff : set.buffers() )
    if( auto st = pass->bind( *buff, pipeline.signature().slot_of( buff->role() ).value() ); !st ) return st;

  return status{};
}

}

TEST_F( DevicePipelineTest, OnlyLinearGeometryIsDispatched )
{
  shared_buffer_set set;
  ASSERT_TRUE( shared_buffer_set::allocate_set( _rt->context(), _rt->pipeline().signature(), 16, set ) );

  std::unique_ptr<ocl_queue> queue;
  ASSERT_TRUE( ocl_queue::create( _rt->context(), queue ) );

  std::unique_ptr<command_sequence> seq;
  ASSERT_TRUE( command_sequence::begin_sequence( *queue, seq ) );

  compute_pass * pass = nullptr;
  ASSERT_TRUE( bind_all( _rt->pipeline(), set, *seq, pass ) );

  //same volume as the data, but only grid.x would be issued
  thread_grid_geometry folded{ dims3{8, 2, 1}, dims3{1, 1, 1} };
  EXPECT_EQ( pass->dispatch( folded ).err, kdisp_err::ARGUMENT_MISMATCH );

  thread_grid_geometry tall_group{ dims3{16, 1, 1}, dims3{1, 2, 1} };
  EXPECT_EQ( pass->dispatch( tall_group ).err, kdisp_err::ARGUMENT_MISMATCH );

  EXPECT_FALSE( seq->dispatched_geometry().has_value() );

  auto geom = compute_grid_geometry( 16, _rt->max_threads_per_group(), g_DefaultGroupWidth,
                                     _rt->device().non_uniform_groups );
  ASSERT_TRUE( pass->dispatch( geom ) );
  ASSERT_TRUE( seq->dispatched_geometry().has_value() );
  EXPECT_EQ( seq->dispatched_geometry()->grid, geom.grid );
  EXPECT_EQ( seq->dispatched_geometry()->group, geom.group );
}

TEST_F( DevicePipelineTest, SequenceHoldsOneDispatch )
{
  shared_buffer_set set;
  ASSERT_TRUE( shared_buffer_set::allocate_set( _rt->context(), _rt->pipeline().signature(), 32, set ) );

  std::unique_ptr<ocl_queue> queue;
  ASSERT_TRUE( ocl_queue::create( _rt->context(), queue ) );

  std::unique_ptr<command_sequence> seq;
  ASSERT_TRUE( command_sequence::begin_sequence( *queue, seq ) );

  auto geom = compute_grid_geometry( 32, _rt->max_threads_per_group(), g_DefaultGroupWidth,
                                     _rt->device().non_uniform_groups );

  compute_pass * first = nullptr;
  ASSERT_TRUE( bind_all( _rt->pipeline(), set, *seq, first ) );
  ASSERT_TRUE( first->dispatch( geom ) );
  EXPECT_EQ( first->dispatch( geom ).err, kdisp_err::ARGUMENT_MISMATCH );
  ASSERT_TRUE( first->end_pass() );

  compute_pass * second = nullptr;
  ASSERT_TRUE( bind_all( _rt->pipeline(), set, *seq, second ) );
  EXPECT_EQ( second->dispatch( geom ).err, kdisp_err::ARGUMENT_MISMATCH );
  ASSERT_TRUE( second->end_pass() );

  auto st = seq->submit();
  ASSERT_TRUE( st ) << st.describe();
  ASSERT_TRUE( wait_until_complete( *seq ) );
  EXPECT_EQ( seq->state(), seq_state::RETIRED );
}

TEST_F( DevicePipelineTest, StepwiseInvocation )
{
  std::unique_ptr<invocation> inv;
  ASSERT_TRUE( _rt->allocate( 300, inv ) );

  EXPECT_EQ( inv->submit().err, kdisp_err::SUBMISSION_FAILURE );

  ASSERT_TRUE( inv->fill_inputs() );
  ASSERT_TRUE( _rt->record( *inv, 0 ) );
  EXPECT_EQ( _rt->record( *inv, 0 ).err, kdisp_err::SEQUENCE_CREATION_FAILURE );

  ASSERT_TRUE( inv->submit() );
  ASSERT_TRUE( inv->wait() );

  std::unique_ptr<mapped_view<float> > view;
  ASSERT_TRUE( inv->read_output( view ) );
  ASSERT_EQ( view->size(), 300u );
  EXPECT_EQ( (*view)[299], static_cast<float>(3 * 299) );
}
