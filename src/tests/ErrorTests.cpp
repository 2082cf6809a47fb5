#include <gtest/gtest.h>
#include <format>
#include <string>

#include "../core/Exception.hpp"

using namespace robotrace::core;

TEST(Errors, Each_Code_Throws_Its_Own_Type)
{
    EXPECT_THROW(RR_THROW(error::Code::Rules, "r"), error::RulesError);
    EXPECT_THROW(RR_THROW(error::Code::State, "s"), error::StateError);
    EXPECT_THROW(RR_THROW(error::Code::Catalog, "c"), error::CatalogError);
    EXPECT_THROW(RR_THROW(error::Code::Config, "c"), error::ConfigError);
    EXPECT_THROW(RR_THROW(error::Code::Actuator, "a"), error::ActuatorError);
    EXPECT_THROW(RR_THROW(error::Code::Serialization, "s"), error::SerializationError);
    EXPECT_THROW(RR_THROW(error::Code::Network, "n"), error::NetworkError);
    EXPECT_THROW(RR_ASSERT(1 + 1 == 3, "math"), error::AssertionError);
    EXPECT_NO_THROW(RR_ASSERT(1 + 1 == 2, "math"));
}

TEST(Errors, Report_Names_Code_Message_And_Origin)
{
    try
    {
        RR_THROW(error::Code::Network, "could not reach ws://nowhere");
        FAIL() << "no throw";
    }
    catch (OmegaException<error::Code> const& e)
    {
        EXPECT_EQ(e.code(), error::Code::Network);
        EXPECT_EQ(e.what(), "could not reach ws://nowhere");

        std::string const report = std::format("{}", e);
        EXPECT_TRUE(report.starts_with("[Network] could not reach ws://nowhere\n"));
        EXPECT_NE(report.find("ErrorTests.cpp"), std::string::npos);

        // the backtrace is captured at the throw site and printed under the origin
        EXPECT_FALSE(e.stack().empty());
        EXPECT_TRUE(report.ends_with(e.trace()));
    }
}
