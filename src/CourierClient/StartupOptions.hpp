//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Chain/Address.hpp"
#include "Components/Chain/ChainTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/program_options.hpp>
#include <spdlog/common.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Startup {
//----------------------------------------------------------------------------------------------------------------------

enum class ParseCode : std::uint32_t { Malformed, ExitRequested, Success };

class Options;

//----------------------------------------------------------------------------------------------------------------------
} // Startup namespace
//----------------------------------------------------------------------------------------------------------------------

class Startup::Options
{
public:
    static constexpr std::string_view Help = "help";
    static constexpr std::string_view Version = "version";
    static constexpr std::string_view Verbosity = "verbosity";
    static constexpr std::string_view ConfigurationFilepath = "config";
    static constexpr std::string_view TargetDomain = "target-domain";
    static constexpr std::string_view TargetAddress = "target";
    static constexpr std::string_view Sender = "sender";
    static constexpr std::string_view Message = "message";
    static constexpr std::string_view Funds = "funds";
    static constexpr std::string_view QuoteOnly = "quote-only";

    Options();

    void SetupDescriptions();
    [[nodiscard]] ParseCode Parse(std::int32_t argc, char** argv);

    [[nodiscard]] std::string GenerateHelpText(std::int32_t argc, char** argv) const;
    [[nodiscard]] std::string GenerateVersionText(std::int32_t argc, char** argv) const;

    [[nodiscard]] spdlog::level::level_enum GetVerbosityLevel() const;
    [[nodiscard]] std::string const& GetConfigPath() const;
    [[nodiscard]] Chain::Domain GetTargetDomain() const;
    [[nodiscard]] Chain::Address const& GetTargetAddress() const;
    [[nodiscard]] std::optional<Chain::Address> const& GetSender() const;
    [[nodiscard]] std::string const& GetMessage() const;
    [[nodiscard]] std::optional<Chain::Amount> const& GetFunds() const;
    [[nodiscard]] bool IsQuoteOnly() const;

private:
    using VerbosityLevels = std::vector<std::pair<std::string, spdlog::level::level_enum>>;

    boost::program_options::options_description m_descriptions;
    boost::program_options::variables_map m_options;
    VerbosityLevels m_levels;

    spdlog::level::level_enum m_verbosity;
    std::string m_configurationFilepath;
    Chain::Domain m_targetDomain;
    Chain::Address m_targetAddress;
    std::optional<Chain::Address> m_optSender;
    std::string m_message;
    std::optional<Chain::Amount> m_optFunds;
    bool m_quoteOnly;
};

//----------------------------------------------------------------------------------------------------------------------
