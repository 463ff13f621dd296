#include <iostream>
#include <opencl_runtime/oclrt.h>
#include <kdisp_runtime/result_report.h>

static int fail( const std::string& step, const status& st )
{
  std::cerr << "kdisp: " << step << " failed: " << st.describe() << std::endl;
  return 1;
}

int main()
{
  kdisp_config cfg;
  if( auto st = kdisp_config::from_env( cfg ); !st ) return fail( "configuration", st );

  verbose_logging() = cfg.verbose;
  KDISP_LOG( cfg.to_string() );

  std::shared_ptr<ocl_runtime> rt;
  if( auto st = ocl_runtime::get_singleton( cfg, rt ); !st ) return fail( "runtime setup", st );

  KDISP_LOG( "Selected " << rt->device().to_string() );

  std::unique_ptr<invocation> inv;
  if( auto st = rt->allocate( cfg.element_count, inv ); !st ) return fail( "allocate", st );
  if( auto st = inv->fill_inputs(); !st ) return fail( "fill", st );
  if( auto st = rt->record( *inv, cfg.group_width ); !st ) return fail( "record", st );
  if( auto st = inv->submit(); !st ) return fail( "submit", st );
  if( auto st = inv->wait( cfg.timeout ); !st ) return fail( "wait", st );

  std::unique_ptr<mapped_view<float> > view;
  if( auto st = inv->read_output( view ); !st ) return fail( "read back", st );

  print_results( std::cout, view->values() );

  return 0;
}
