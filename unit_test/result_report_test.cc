#include <gtest/gtest.h>
#include <sstream>
#include <vector>
#include <kdisp_runtime/result_report.h>

namespace
{

std::vector<std::string> report_lines( size_t n )
{
  std::vector<float> vals( n );
  for( size_t i = 0; i < n; i++ ) vals[i] = static_cast<float>(3 * i);

  std::stringstream ss;
  print_results( ss, vals );

  std::vector<std::string> lines;
  for( std::string line; std::getline( ss, line ); ) lines.push_back( line );
  return lines;
}

}

TEST( ResultReport, EmptyOutputPrintsNothing )
{
  EXPECT_TRUE( report_lines( 0 ).empty() );
}

TEST( ResultReport, SingleValue )
{
  auto lines = report_lines( 1 );

  ASSERT_EQ( lines.size(), 1u );
  EXPECT_EQ( lines[0], "C[0] = 0.0" );
}

TEST( ResultReport, ShortOutputHasNoSeparator )
{
  auto lines = report_lines( 15 );

  ASSERT_EQ( lines.size(), 15u );
  EXPECT_EQ( lines[14], "C[14] = 42.0" );
  for( auto& line : lines ) EXPECT_NE( line, "..." );
}

TEST( ResultReport, TwentyValuesPrintEachOnce )
{
  auto lines = report_lines( 20 );

  ASSERT_EQ( lines.size(), 20u );
  EXPECT_EQ( lines[9],  "C[9] = 27.0" );
  EXPECT_EQ( lines[10], "C[10] = 30.0" );
  EXPECT_EQ( lines[19], "C[19] = 57.0" );
}

TEST( ResultReport, SeparatorMarksSkippedValues )
{
  auto lines = report_lines( 21 );

  ASSERT_EQ( lines.size(), 21u );
  EXPECT_EQ( lines[9],  "C[9] = 27.0" );
  EXPECT_EQ( lines[10], "..." );
  EXPECT_EQ( lines[11], "C[11] = 33.0" );
  EXPECT_EQ( lines[20], "C[20] = 60.0" );
}

TEST( ResultReport, OneMillionValues )
{
  auto lines = report_lines( 1000000 );

  ASSERT_EQ( lines.size(), 21u );
  EXPECT_EQ( lines[0],  "C[0] = 0.0" );
  EXPECT_EQ( lines[1],  "C[1] = 3.0" );
  EXPECT_EQ( lines[10], "..." );
  EXPECT_EQ( lines[11], "C[999990] = 2999970.0" );
  EXPECT_EQ( lines[20], "C[999999] = 2999997.0" );
}
