#include <array>
#include <string>
#include <utils/common.h>

#pragma once

//default tuning constant for the group width
constexpr size_t g_DefaultGroupWidth = 256;

struct dims3
{
  size_t x = 1, y = 1, z = 1;

  size_t volume() const { return x * y * z; }

  std::array<size_t, 3> as_array() const { return {x, y, z}; }

  bool operator==( const dims3& ) const = default;
};

struct thread_grid_geometry
{
  dims3 grid;
  dims3 group;

  bool empty() const { return grid.volume() == 0; }

  std::string to_string() const;
};

/* Derives the 1-D dispatch geometry for work_items.
 *   grid  = (work_items, 1, 1), never rounded up
 *   group = min(group_width, max_threads, max(work_items, 1))
 * group_width == 0 derives the width from max_threads.
 * Without non-uniform work-group support the group is lowered to the
 * largest divisor of work_items, so the grid stays exact. */
thread_grid_geometry compute_grid_geometry( size_t work_items, size_t max_threads,
                                            size_t group_width = g_DefaultGroupWidth,
                                            bool non_uniform = true );

//largest d <= limit with n % d == 0, 1 when n == 0
size_t largest_divisor_upto( size_t n, size_t limit );
