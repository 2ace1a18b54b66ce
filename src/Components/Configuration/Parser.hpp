//----------------------------------------------------------------------------------------------------------------------
// File: Parser.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Field.hpp"
#include "Options.hpp"
#include "StatusCode.hpp"
#include "Components/Chain/Address.hpp"
#include "Components/Chain/ChainTypes.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class Parser;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::Parser final
{
public:
    explicit Parser(std::filesystem::path const& filepath);

    Parser(Parser const&) = delete;
    Parser& operator=(Parser const&) = delete;

    // Reads, decodes, and validates the configuration file. The accessors below are only meaningful after a
    // successful fetch.
    [[nodiscard]] DeserializationResult FetchOptions();

    [[nodiscard]] std::filesystem::path const& GetFilepath() const;
    [[nodiscard]] std::string const& GetVersion() const;
    [[nodiscard]] Chain::Domain GetEndpointDomain() const;
    [[nodiscard]] Chain::Address const& GetEndpointAddress() const;
    [[nodiscard]] Chain::Address const& GetRelayAddress() const;
    [[nodiscard]] bool UseReplayProtection() const;

    [[nodiscard]] bool Validated() const;

    [[nodiscard]] bool SetReplayProtection(bool enabled);

private:
    [[nodiscard]] DeserializationResult ProcessFile();
    [[nodiscard]] DeserializationResult Deserialize(std::string_view serialized);

    [[nodiscard]] ValidationResult ValidateOptions();

    LogUtils::Logger m_logger;

    Field<Symbols::Version, std::string> m_version;
    std::filesystem::path m_filepath;

    Options::Endpoint m_endpoint;
    Options::Relay m_relay;
    Options::Receiver m_receiver;

    bool m_validated;
};

//----------------------------------------------------------------------------------------------------------------------
