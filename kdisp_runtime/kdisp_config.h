#include <chrono>
#include <string>
#include <optional>
#include <utils/common.h>
#include <kdisp_runtime/grid_geometry.h>

#pragma once

enum struct device_class { GPU, ACCELERATOR, CPU, ALL };

std::string device_class_name( device_class );

struct kdisp_config
{
  size_t       element_count = 1000000;
  size_t       group_width   = g_DefaultGroupWidth;
  device_class device        = device_class::GPU;
  o_string     platform_filter;
  o_string     kernel_file;
  std::string  entry_point   = "vector_add";
  //unset means wait without a deadline
  std::optional<std::chrono::milliseconds> timeout;
  bool         verbose       = false;

  //overlays KDISP_* environment variables on the defaults
  static status from_env( kdisp_config& );

  std::string to_string() const;
};
