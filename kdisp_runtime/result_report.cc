#include <kdisp_runtime/result_report.h>
#include <iomanip>

static void print_value( std::ostream& os, size_t i, float v )
{
  os << "C[" << i << "] = " << std::fixed << std::setprecision(1) << v << "\n";
}

void print_results( std::ostream& os, std::span<const float> vals )
{
  size_t n          = vals.size();
  size_t head       = std::min( n, g_ReportEdge );
  size_t tail_start = std::max( head, n > g_ReportEdge ? n - g_ReportEdge : 0 );

  for( size_t i = 0; i < head; i++ ) print_value( os, i, vals[i] );

  if( tail_start > head ) os << "...\n";

  for( size_t i = tail_start; i < n; i++ ) print_value( os, i, vals[i] );

  os.flush();
}
