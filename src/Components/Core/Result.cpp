//----------------------------------------------------------------------------------------------------------------------
// File: Result.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Result.hpp"
//----------------------------------------------------------------------------------------------------------------------

std::string_view Courier::GetResultDescription(ResultCode code) noexcept
{
    switch (code) {
        case ResultCode::Accepted: return "Accepted";
        case ResultCode::InvalidArgument: return "Invalid argument";
        case ResultCode::InsufficientFunds: return "Insufficient funds";
        case ResultCode::Unauthorized: return "Unauthorized";
        case ResultCode::DecodeError: return "Decode error";
        case ResultCode::DuplicateDelivery: return "Duplicate delivery";
        case ResultCode::UpstreamError: return "Upstream error";
        default: return "Unknown result";
    }
}

//----------------------------------------------------------------------------------------------------------------------

Courier::Result::Result() noexcept
    : std::exception()
    , m_code(ResultCode::Accepted)
    , m_detail()
    , m_message()
{
}

//----------------------------------------------------------------------------------------------------------------------

Courier::Result::Result(ResultCode code) noexcept
    : std::exception()
    , m_code(code)
    , m_detail()
    , m_message()
{
}

//----------------------------------------------------------------------------------------------------------------------

Courier::Result::Result(ResultCode code, std::string_view detail)
    : std::exception()
    , m_code(code)
    , m_detail(detail)
    , m_message(GetResultDescription(code))
{
    if (!m_detail.empty()) { m_message.append(" (").append(m_detail).append(")"); }
}

//----------------------------------------------------------------------------------------------------------------------

bool Courier::Result::operator==(Result const& other) const noexcept { return m_code == other.m_code; }

//----------------------------------------------------------------------------------------------------------------------

bool Courier::Result::operator==(ResultCode other) const noexcept { return m_code == other; }

//----------------------------------------------------------------------------------------------------------------------

Courier::Result::operator bool() const noexcept { return IsSuccess(); }

//----------------------------------------------------------------------------------------------------------------------

char const* Courier::Result::what() const noexcept
{
    // Results without a detail do not allocate, fall back onto the static description of the code.
    if (m_message.empty()) { return GetResultDescription(m_code).data(); }
    return m_message.c_str();
}

//----------------------------------------------------------------------------------------------------------------------

bool Courier::Result::IsSuccess() const noexcept { return m_code == ResultCode::Accepted; }

//----------------------------------------------------------------------------------------------------------------------

bool Courier::Result::IsError() const noexcept { return !IsSuccess(); }

//----------------------------------------------------------------------------------------------------------------------

Courier::ResultCode Courier::Result::GetCode() const noexcept { return m_code; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Courier::Result::GetDetail() const noexcept { return m_detail; }

//----------------------------------------------------------------------------------------------------------------------

std::ostream& Courier::operator<<(std::ostream& stream, Result const& result)
{
    return stream << result.what();
}

//----------------------------------------------------------------------------------------------------------------------
