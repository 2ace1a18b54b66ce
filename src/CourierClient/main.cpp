//----------------------------------------------------------------------------------------------------------------------
// File: main.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Runtime.hpp"
#include "StartupOptions.hpp"
#include "Components/Configuration/Parser.hpp"
#include "Components/Configuration/StatusCode.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <iostream>
#include <memory>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Startup {
//----------------------------------------------------------------------------------------------------------------------

using Resources = std::pair<ParseCode, std::unique_ptr<Configuration::Parser>>;

Resources InitializeResources(Options& options, std::int32_t argc, char** argv);

//----------------------------------------------------------------------------------------------------------------------
} // Startup namespace
//----------------------------------------------------------------------------------------------------------------------

std::int32_t main(std::int32_t argc, char** argv)
{
    Startup::Options options;
    auto const [code, upParser] = Startup::InitializeResources(options, argc, argv);
    switch (code) {
        case Startup::ParseCode::Success: break;
        case Startup::ParseCode::ExitRequested: return 0;
        case Startup::ParseCode::Malformed: return 1;
    }

    return Runtime::Execute(options, *upParser, std::cout);
}

//----------------------------------------------------------------------------------------------------------------------

Startup::Resources Startup::InitializeResources(Options& options, std::int32_t argc, char** argv)
{
    switch (options.Parse(argc, argv)) {
        // On success, we can continue directly to initializing the runtime resources.
        case ParseCode::Success: break;
        // Early return when we don't need initialize the resources (e.g. when "--help" is used).
        case ParseCode::ExitRequested: return { ParseCode::ExitRequested, nullptr };
        // Log out an error and early return when the provided flags were malformed.
        default: {
            std::cout << "Unable to parse startup options!" << std::endl;
            return { ParseCode::Malformed, nullptr };
        }
    }

    // Initialize the logging resources for the application.
    LogUtils::InitializeLoggers(options.GetVerbosityLevel());
    auto const logger = LogUtils::GetLogger(LogUtils::Name::Core); // From here on we should use the logger for errors.

    // Create a configuration parser to read the configuration file at the provided location. If we fail to read the
    // file log an error and return early.
    auto upParser = std::make_unique<Configuration::Parser>(options.GetConfigPath());
    if (auto const [status, error] = upParser->FetchOptions(); status != Configuration::StatusCode::Success) {
        logger->critical(
            "Unable to use the configuration file at {}! Reason: {}", upParser->GetFilepath().string(), error);
        return { ParseCode::Malformed, nullptr };
    }

    // Indicate that the startup resources have been successfully initialized and provide them to the caller.
    return { ParseCode::Success, std::move(upParser) };
}

//----------------------------------------------------------------------------------------------------------------------
