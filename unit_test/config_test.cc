#include <gtest/gtest.h>
#include <cstdlib>
#include <kdisp_runtime/kdisp_config.h>

namespace
{

const char * g_Vars[] = { "KDISP_ELEMENT_COUNT", "KDISP_GROUP_WIDTH", "KDISP_DEVICE_TYPE",
                          "KDISP_PLATFORM", "KDISP_KERNEL_FILE", "KDISP_ENTRY_POINT",
                          "KDISP_TIMEOUT_MS", "KDISP_VERBOSE" };

class ConfigTest : public ::testing::Test
{
  protected:

    void SetUp() override    { clear(); }
    void TearDown() override { clear(); }

    static void clear()
    {
      for( auto var : g_Vars ) unsetenv( var );
    }
};

}

TEST_F( ConfigTest, DefaultsWithoutEnvironment )
{
  kdisp_config cfg;
  ASSERT_TRUE( kdisp_config::from_env( cfg ) );

  EXPECT_EQ( cfg.element_count, 1000000u );
  EXPECT_EQ( cfg.group_width, 256u );
  EXPECT_EQ( cfg.device, device_class::GPU );
  EXPECT_EQ( cfg.entry_point, "vector_add" );
  EXPECT_FALSE( cfg.kernel_file.has_value() );
  EXPECT_FALSE( cfg.timeout.has_value() );
  EXPECT_FALSE( cfg.verbose );
}

TEST_F( ConfigTest, ReadsOverrides )
{
  setenv( "KDISP_ELEMENT_COUNT", "4096", 1 );
  setenv( "KDISP_GROUP_WIDTH", "0", 1 );
  setenv( "KDISP_DEVICE_TYPE", "CPU", 1 );
  setenv( "KDISP_PLATFORM", "Portable", 1 );
  setenv( "KDISP_TIMEOUT_MS", "1500", 1 );
  setenv( "KDISP_VERBOSE", "1", 1 );

  kdisp_config cfg;
  ASSERT_TRUE( kdisp_config::from_env( cfg ) );

  EXPECT_EQ( cfg.element_count, 4096u );
  EXPECT_EQ( cfg.group_width, 0u );
  EXPECT_EQ( cfg.device, device_class::CPU );
  EXPECT_EQ( cfg.platform_filter.value_or(""), "Portable" );
  ASSERT_TRUE( cfg.timeout.has_value() );
  EXPECT_EQ( cfg.timeout->count(), 1500 );
  EXPECT_TRUE( cfg.verbose );
}

TEST_F( ConfigTest, RejectsMalformedValues )
{
  kdisp_config cfg;

  setenv( "KDISP_ELEMENT_COUNT", "12abc", 1 );
  EXPECT_EQ( kdisp_config::from_env( cfg ).err, kdisp_err::INVALID_CONFIG );
  unsetenv( "KDISP_ELEMENT_COUNT" );

  setenv( "KDISP_GROUP_WIDTH", "-4", 1 );
  EXPECT_EQ( kdisp_config::from_env( cfg ).err, kdisp_err::INVALID_CONFIG );
  unsetenv( "KDISP_GROUP_WIDTH" );

  setenv( "KDISP_DEVICE_TYPE", "fpga", 1 );
  EXPECT_EQ( kdisp_config::from_env( cfg ).err, kdisp_err::INVALID_CONFIG );
  unsetenv( "KDISP_DEVICE_TYPE" );

  setenv( "KDISP_TIMEOUT_MS", "0", 1 );
  EXPECT_EQ( kdisp_config::from_env( cfg ).err, kdisp_err::INVALID_CONFIG );
  unsetenv( "KDISP_TIMEOUT_MS" );

  setenv( "KDISP_VERBOSE", "yes", 1 );
  EXPECT_EQ( kdisp_config::from_env( cfg ).err, kdisp_err::INVALID_CONFIG );
}
