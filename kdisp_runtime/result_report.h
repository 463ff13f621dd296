#include <span>
#include <ostream>
#include <utils/common.h>

#pragma once

//values shown at each end of the output
constexpr size_t g_ReportEdge = 10;

/* Writes "C[i] = <value>" for the first and last g_ReportEdge values,
 * with a "..." line where values are skipped. */
void print_results( std::ostream&, std::span<const float> );
