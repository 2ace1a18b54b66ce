//----------------------------------------------------------------------------------------------------------------------
// File: Parser.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Parser.hpp"
#include "Defaults.hpp"
#include "SerializationErrors.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] bool IsNonEmptyVersion(std::string const& version);

template<typename OptionsGroup>
[[nodiscard]] Configuration::DeserializationResult MergeGroup(
    boost::json::object const& json, OptionsGroup& group);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: JSON Schema.
//----------------------------------------------------------------------------------------------------------------------
// "version": String,
// "endpoint": {
//     "domain": Integer,
//     "address": String
// },
// "relay": {
//     "address": String
// },
// "receiver": {
//     "replay_protection": Optional Boolean
// }
//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::Parser(std::filesystem::path const& filepath)
    : m_logger(LogUtils::GetLogger(LogUtils::Name::Core))
    , m_version(local::IsNonEmptyVersion)
    , m_filepath(filepath)
    , m_endpoint()
    , m_relay()
    , m_receiver()
    , m_validated(false)
{
    // If the filepath names a directory, the default configuration filename is assumed.
    if (!m_filepath.empty() && !m_filepath.has_filename()) { m_filepath /= Defaults::ConfigurationFilename; }
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::FetchOptions()
{
    if (auto const status = ProcessFile(); status.first != StatusCode::Success) { return status; }
    if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Configuration::Parser::GetFilepath() const { return m_filepath; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Parser::GetVersion() const { return m_version.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

Chain::Domain Configuration::Parser::GetEndpointDomain() const { return m_endpoint.GetDomain(); }

//----------------------------------------------------------------------------------------------------------------------

Chain::Address const& Configuration::Parser::GetEndpointAddress() const { return m_endpoint.GetAddress(); }

//----------------------------------------------------------------------------------------------------------------------

Chain::Address const& Configuration::Parser::GetRelayAddress() const { return m_relay.GetAddress(); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::UseReplayProtection() const { return m_receiver.UseReplayProtection(); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::Validated() const { return m_validated; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetReplayProtection(bool enabled)
{
    return m_receiver.SetReplayProtection(enabled);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::ProcessFile()
{
    if (m_filepath.empty()) { return { StatusCode::FileError, "A configuration filepath was not provided." }; }

    std::error_code error;
    if (!std::filesystem::is_regular_file(m_filepath, error)) {
        std::ostringstream oss;
        oss << "Failed to locate a configuration file at: " << m_filepath;
        return { StatusCode::FileError, oss.str() };
    }

    auto const size = std::filesystem::file_size(m_filepath, error);
    if (error) { return { StatusCode::FileError, "Failed to determine the configuration file size." }; }
    if (size > Defaults::FileSizeLimit) {
        return {
            StatusCode::FileError,
            fmt::format("The configuration file exceeds the maximum size of {} bytes.", Defaults::FileSizeLimit)
        };
    }

    std::stringstream buffer;
    {
        std::ifstream reader{ m_filepath };
        if (reader.fail()) [[unlikely]] {
            return { StatusCode::FileError, "Failed to open configuration file for reading." };
        }
        buffer << reader.rdbuf(); // Read the file into the buffer stream.
    }

    m_logger->debug("Reading configuration file at: {}.", m_filepath.string());
    return Deserialize(buffer.str());
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::Deserialize(std::string_view serialized)
{
    if (serialized.empty()) { return { StatusCode::DecodeError, "The configuration file is empty." }; }

    try {
        boost::json::parse_options options;
        options.allow_comments = true;
        options.allow_trailing_commas = true;

        boost::json::error_code error;
        auto const value = boost::json::parse(serialized, error, boost::json::storage_ptr{}, options);
        if (error || !value.is_object()) {
            return { StatusCode::DecodeError, "Failed to read the configuration file as valid JSON." };
        }

        auto const& json = value.as_object();

        // Required field parsing.
        if (auto const itr = json.find(m_version.GetFieldName()); itr != json.end()) {
            if (!itr->value().is_string()) {
                return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("string", m_version.GetFieldName()) };
            }

            auto const& version = itr->value().as_string();
            if (!m_version.SetValueFromConfig(std::string{ version.data(), version.size() })) {
                return { StatusCode::InputError, CreateInvalidValueMessage(m_version.GetFieldName()) };
            }
        } else {
            return { StatusCode::InputError, CreateMissingFieldMessage(m_version.GetFieldName()) };
        }

        if (auto const status = local::MergeGroup(json, m_endpoint); status.first != StatusCode::Success) {
            return status;
        }

        if (auto const status = local::MergeGroup(json, m_relay); status.first != StatusCode::Success) {
            return status;
        }

        if (auto const status = local::MergeGroup(json, m_receiver); status.first != StatusCode::Success) {
            return status;
        }
    } catch (std::exception const& exception) {
        return {
            StatusCode::DecodeError,
            fmt::format("Encountered an unexpected error while deserializing the configuration file: {}", exception.what())
        };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Parser::ValidateOptions()
{
    m_validated = false; // Explicitly disable the validation result in case anything fails.

    if (!m_version.Allowable()) {
        return { StatusCode::InputError, CreateMissingFieldMessage(m_version.GetFieldName()) };
    }

    if (auto const status = m_endpoint.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_relay.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }

    m_validated = true;

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsNonEmptyVersion(std::string const& version)
{
    return !version.empty();
}

//----------------------------------------------------------------------------------------------------------------------

template<typename OptionsGroup>
Configuration::DeserializationResult local::MergeGroup(boost::json::object const& json, OptionsGroup& group)
{
    using namespace Configuration;

    auto const itr = json.find(OptionsGroup::GetFieldName());
    if (itr == json.end()) {
        if (OptionsGroup::IsOptional()) { return { StatusCode::Success, "" }; }
        return { StatusCode::InputError, CreateMissingFieldMessage(OptionsGroup::GetFieldName()) };
    }

    if (!itr->value().is_object()) {
        return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("object", OptionsGroup::GetFieldName()) };
    }

    return group.Merge(itr->value().as_object());
}

//----------------------------------------------------------------------------------------------------------------------
