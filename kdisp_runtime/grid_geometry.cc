#include <kdisp_runtime/grid_geometry.h>
#include <sstream>

std::string thread_grid_geometry::to_string() const
{
  std::stringstream ss;
  ss << "grid=(" << grid.x << ", " << grid.y << ", " << grid.z << ") "
     << "group=(" << group.x << ", " << group.y << ", " << group.z << ")";
  return ss.str();
}

size_t largest_divisor_upto( size_t n, size_t limit )
{
  if( n == 0 || limit == 0 ) return 1;

  for( size_t d = std::min(n, limit); d > 1; d-- )
    if( n % d == 0 ) return d;

  return 1;
}

thread_grid_geometry compute_grid_geometry( size_t work_items, size_t max_threads,
                                            size_t group_width, bool non_uniform )
{
  thread_grid_geometry geom;
  size_t limit = std::max<size_t>( max_threads, 1 );

  size_t width = (group_width == 0) ? limit : group_width;
  width = std::min( { width, limit, std::max<size_t>(work_items, 1) } );

  if( !non_uniform ) width = largest_divisor_upto( work_items, width );

  geom.grid  = dims3{ work_items, 1, 1 };
  geom.group = dims3{ width, 1, 1 };

  return geom;
}
