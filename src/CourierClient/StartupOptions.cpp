//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "StartupOptions.hpp"
#include "Components/Configuration/Defaults.hpp"
#include "Utilities/Version.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

std::uint32_t GetTerminalWidth();

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Startup::Options::Options()
    : m_descriptions()
    , m_options()
    , m_levels()
    , m_verbosity(spdlog::level::info)
    , m_configurationFilepath()
    , m_targetDomain()
    , m_targetAddress()
    , m_optSender()
    , m_message()
    , m_optFunds()
    , m_quoteOnly(false)
{
    SetupDescriptions();
}

//----------------------------------------------------------------------------------------------------------------------

void Startup::Options::SetupDescriptions()
{
    std::uint32_t const width = local::GetTerminalWidth();
    boost::program_options::options_description general("General Options", width);
    auto AddGeneralOption = general.add_options();

    AddGeneralOption(Help.data(), "Display this help text and exit.");
    AddGeneralOption(Version.data(), "Display the version information and exit.");

    // Option to set the log verbosity level.
    {
        m_levels = {
            { "trace", spdlog::level::trace },
            { "debug", spdlog::level::debug },
            { "info", spdlog::level::info },
            { "warning", spdlog::level::warn },
            { "error", spdlog::level::err },
            { "critical", spdlog::level::critical },
            { "none", spdlog::level::off },
        };

        std::ostringstream oss;
        oss << "Sets the maximum log level for console output. ";
        oss << "Options: [";
        std::size_t idx = 0;
        for (auto const& [name, value] : m_levels) {
            oss << name << ((++idx < m_levels.size()) ? ", " : "");
        }
        oss << "]";
        AddGeneralOption(
            Verbosity.data(),
            boost::program_options::value<std::string>()->value_name("<level>")->default_value("info"),
            oss.str().c_str());
    }

    m_descriptions.add(general);

    boost::program_options::options_description configuration("Configuration Options", width);
    auto AddConfigurationOption = configuration.add_options();

    // Option to set the configuration filepath.
    {
        std::ostringstream oss;
        oss << "Set the configuration filepath. This may specify a complete filepath or ";
        oss << "directory. If a directory is specified \"" << Configuration::Defaults::ConfigurationFilename;
        oss << "\" is assumed.";
        AddConfigurationOption(
            ConfigurationFilepath.data(),
            boost::program_options::value(&m_configurationFilepath)->value_name("<filepath>")->default_value(
                std::string{ Configuration::Defaults::ConfigurationFilename }),
            oss.str().c_str());
    }

    m_descriptions.add(configuration);

    boost::program_options::options_description delivery("Delivery Options", width);
    auto AddDeliveryOption = delivery.add_options();

    AddDeliveryOption(
        TargetDomain.data(),
        boost::program_options::value<std::uint32_t>()->value_name("<domain>"),
        "The domain the message is sent to.");

    AddDeliveryOption(
        TargetAddress.data(),
        boost::program_options::value<std::string>()->value_name("<address>"),
        "The hexadecimal address of the endpoint receiving the message on the target domain.");

    AddDeliveryOption(
        Sender.data(),
        boost::program_options::value<std::string>()->value_name("<address>"),
        "The hexadecimal address recorded as the author of the message. Defaults to the configured endpoint.");

    AddDeliveryOption(
        Message.data(),
        boost::program_options::value(&m_message)->value_name("<text>"),
        "The text of the message.");

    AddDeliveryOption(
        Funds.data(),
        boost::program_options::value<std::uint64_t>()->value_name("<amount>"),
        "The funds supplied to pay for the delivery. Defaults to the quoted cost.");

    AddDeliveryOption(
        QuoteOnly.data(),
        boost::program_options::bool_switch()->default_value(false),
        "Display the cost of a delivery to the target domain and exit.");

    m_descriptions.add(delivery);
}

//----------------------------------------------------------------------------------------------------------------------

Startup::ParseCode Startup::Options::Parse(std::int32_t argc, char** argv)
{
    constexpr auto IsOptionSupplied = [] (
        boost::program_options::variables_map const& options,
        std::string_view option) -> bool
    {
        return options.count(option.data()) && !options[option.data()].defaulted();
    };

    constexpr auto ParseAddress = [] (
        boost::program_options::variables_map const& options,
        std::string_view option) -> std::optional<Chain::Address>
    {
        auto const optAddress = Chain::Address::FromString(options[option.data()].as<std::string>());
        if (!optAddress) { std::cout << "The '" << option << "' option must be a hexadecimal address." << std::endl; }
        return optAddress;
    };

    try {
        boost::program_options::store(
            boost::program_options::command_line_parser(argc, argv).options(m_descriptions).run(), m_options);
        boost::program_options::notify(m_options);
    } catch (std::exception const& e) {
        std::cout << "An error occured parsing startup options due to: ";
        std::cout << e.what() << "." << std::endl;
        return ParseCode::Malformed;
    }

    if (IsOptionSupplied(m_options, Help)) {
        std::cout << GenerateHelpText(argc, argv) << std::endl;
        return ParseCode::ExitRequested;
    }

    if (IsOptionSupplied(m_options, Version)) {
        std::cout << GenerateVersionText(argc, argv) << std::endl;
        return ParseCode::ExitRequested;
    }

    if (IsOptionSupplied(m_options, Verbosity)) {
        auto const& argument = m_options[Verbosity.data()].as<std::string>();
        auto const itr = std::ranges::find_if(m_levels, [&argument] (auto const& item) -> bool {
            return (argument == item.first);
        });

        if (itr == m_levels.end()) {
            std::cout << "Unrecognized verbosity level!" << std::endl;
            return ParseCode::Malformed;
        }

        m_verbosity = itr->second;
    }

    if (m_configurationFilepath.empty()) {
        std::cout << "The configuration filepath cannot be empty." << std::endl;
        return ParseCode::Malformed;
    }

    m_quoteOnly = m_options[QuoteOnly.data()].as<bool>();

    if (!IsOptionSupplied(m_options, TargetDomain)) {
        std::cout << "The '" << TargetDomain << "' option is required." << std::endl;
        return ParseCode::Malformed;
    }

    auto const domain = m_options[TargetDomain.data()].as<std::uint32_t>();
    if (domain > std::numeric_limits<Chain::Domain::UnderlyingType>::max()) {
        std::cout << "The '" << TargetDomain << "' option exceeds the maximum domain value." << std::endl;
        return ParseCode::Malformed;
    }
    m_targetDomain = Chain::Domain{ static_cast<Chain::Domain::UnderlyingType>(domain) };

    if (IsOptionSupplied(m_options, TargetAddress)) {
        auto const optAddress = ParseAddress(m_options, TargetAddress);
        if (!optAddress) { return ParseCode::Malformed; }
        m_targetAddress = *optAddress;
    }

    if (IsOptionSupplied(m_options, Sender)) {
        m_optSender = ParseAddress(m_options, Sender);
        if (!m_optSender) { return ParseCode::Malformed; }
    }

    if (IsOptionSupplied(m_options, Funds)) {
        m_optFunds = Chain::Amount{ m_options[Funds.data()].as<std::uint64_t>() };
    }

    // A quote only requires the target domain, a delivery also requires a recipient and the message text.
    if (!m_quoteOnly) {
        if (!IsOptionSupplied(m_options, TargetAddress)) {
            std::cout << "The '" << TargetAddress << "' option is required to send a message." << std::endl;
            return ParseCode::Malformed;
        }

        if (!IsOptionSupplied(m_options, Message)) {
            std::cout << "The '" << Message << "' option is required to send a message." << std::endl;
            return ParseCode::Malformed;
        }
    }

    return ParseCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateHelpText([[maybe_unused]] std::int32_t argc, char** argv) const
{
    std::ostringstream oss;
    std::string name = std::filesystem::path(argv[0]).stem().string();
    oss << "Usage: " << name << " [options] \n" << m_descriptions;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateVersionText([[maybe_unused]] std::int32_t argc, char** argv) const
{
    std::ostringstream oss;
    std::string name = std::filesystem::path(argv[0]).stem().string();
    oss << name << " (Courier) " << Courier::Version;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

spdlog::level::level_enum Startup::Options::GetVerbosityLevel() const
{
    return m_verbosity;
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Startup::Options::GetConfigPath() const
{
    return m_configurationFilepath;
}

//----------------------------------------------------------------------------------------------------------------------

Chain::Domain Startup::Options::GetTargetDomain() const
{
    return m_targetDomain;
}

//----------------------------------------------------------------------------------------------------------------------

Chain::Address const& Startup::Options::GetTargetAddress() const
{
    return m_targetAddress;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Chain::Address> const& Startup::Options::GetSender() const
{
    return m_optSender;
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Startup::Options::GetMessage() const
{
    return m_message;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Chain::Amount> const& Startup::Options::GetFunds() const
{
    return m_optFunds;
}

//----------------------------------------------------------------------------------------------------------------------

bool Startup::Options::IsQuoteOnly() const
{
    return m_quoteOnly;
}

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t local::GetTerminalWidth()
{
    struct winsize size;
    if (::ioctl(::fileno(stdout), TIOCGWINSZ, &size) != 0 || size.ws_col == 0) {
        return boost::program_options::options_description::m_default_line_length;
    }
    return static_cast<std::uint32_t>(size.ws_col);
}

//----------------------------------------------------------------------------------------------------------------------
