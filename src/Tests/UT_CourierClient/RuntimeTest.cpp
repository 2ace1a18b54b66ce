//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/Parser.hpp"
#include "Components/Configuration/StatusCode.hpp"
#include "CourierClient/Runtime.hpp"
#include "CourierClient/StartupOptions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] Startup::ParseCode ParseArguments(Startup::Options& options, std::vector<std::string> arguments);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Configuration = R"({
    "version": "0.1.0",
    "endpoint": { "domain": 1, "address": "0x1111111111111111111111111111111111111111" },
    "relay": { "address": "0xaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa" }
})";

constexpr std::string_view TargetDomain = "2";
constexpr std::string_view TargetAddress = "0x2222222222222222222222222222222222222222";
constexpr std::string_view ZeroAddress = "0x0000000000000000000000000000000000000000";
constexpr std::string_view Greeting = "Hello, cross-domain world!";

// The loopback relay's base fee plus one unit per gas of the execution limit.
constexpr std::string_view ExpectedQuote = "quote: 51000\n";

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class CourierRuntimeSuite : public testing::Test
{
protected:
    void SetUp() override
    {
        auto const pInformation = testing::UnitTest::GetInstance()->current_test_info();
        m_directory = std::filesystem::temp_directory_path() / "courier-runtime-tests" / pInformation->name();
        std::filesystem::remove_all(m_directory);
        ASSERT_TRUE(std::filesystem::create_directories(m_directory));

        m_filepath = m_directory / "config.json";
        std::ofstream writer{ m_filepath, std::ios::out | std::ios::trunc };
        writer << test::Configuration;
        writer.close();

        m_upParser = std::make_unique<Configuration::Parser>(m_filepath);
        ASSERT_EQ(m_upParser->FetchOptions().first, Configuration::StatusCode::Success);
    }

    void TearDown() override
    {
        std::error_code error;
        std::filesystem::remove_all(m_directory, error);
    }

    [[nodiscard]] std::int32_t Execute(std::initializer_list<std::string> arguments, std::string& output) const
    {
        std::vector<std::string> supplied{
            "--config", m_filepath.string(), "--target-domain", std::string{ test::TargetDomain } };
        supplied.insert(supplied.end(), arguments);

        Startup::Options options;
        if (local::ParseArguments(options, supplied) != Startup::ParseCode::Success) { return -1; }

        std::ostringstream stream;
        auto const code = Runtime::Execute(options, *m_upParser, stream);
        output = stream.str();
        return code;
    }

    std::filesystem::path m_directory;
    std::filesystem::path m_filepath;
    std::unique_ptr<Configuration::Parser> m_upParser;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CourierRuntimeSuite, QuoteOnlyTest)
{
    std::string output;
    EXPECT_EQ(Execute({ "--quote-only" }, output), 0);
    EXPECT_EQ(output, test::ExpectedQuote);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CourierRuntimeSuite, DeliveryTest)
{
    std::string output;
    EXPECT_EQ(Execute({ "--target", test::TargetAddress.data(), "--message", test::Greeting.data() }, output), 0);
    EXPECT_EQ(output, std::string{ test::ExpectedQuote } + "received: " + test::Greeting.data() + "\n");
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CourierRuntimeSuite, ZeroTargetTest)
{
    // The zero recipient is rejected by the send after the quote, no target endpoint is created for it.
    std::string output;
    EXPECT_EQ(Execute({ "--target", test::ZeroAddress.data(), "--message", test::Greeting.data() }, output), 1);
    EXPECT_EQ(output, test::ExpectedQuote);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CourierRuntimeSuite, InsufficientFundsTest)
{
    std::string output;
    EXPECT_EQ(Execute(
        { "--target", test::TargetAddress.data(), "--message", test::Greeting.data(), "--funds", "50999" }, output), 1);
    EXPECT_EQ(output, test::ExpectedQuote);
}

//----------------------------------------------------------------------------------------------------------------------

Startup::ParseCode local::ParseArguments(Startup::Options& options, std::vector<std::string> arguments)
{
    arguments.insert(arguments.begin(), "courier");

    std::vector<char*> argv;
    for (auto& argument : arguments) { argv.emplace_back(argument.data()); }
    argv.emplace_back(nullptr);

    return options.Parse(static_cast<std::int32_t>(arguments.size()), argv.data());
}

//----------------------------------------------------------------------------------------------------------------------
