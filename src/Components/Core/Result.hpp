//----------------------------------------------------------------------------------------------------------------------
// File: Result.hpp
// Description: The outcome of a courier operation. A result is returned from every operation and is thrown only by
// constructors that are unable to produce a usable object.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Courier {
//----------------------------------------------------------------------------------------------------------------------

class Result;

enum class ResultCode : std::uint32_t {
    Accepted,
    InvalidArgument,
    InsufficientFunds,
    Unauthorized,
    DecodeError,
    DuplicateDelivery,
    UpstreamError
};

[[nodiscard]] std::string_view GetResultDescription(ResultCode code) noexcept;

std::ostream& operator<<(std::ostream& stream, Result const& result);

//----------------------------------------------------------------------------------------------------------------------
} // Courier namespace
//----------------------------------------------------------------------------------------------------------------------

class Courier::Result : public std::exception
{
public:
    Result() noexcept;
    Result(ResultCode code) noexcept;
    Result(ResultCode code, std::string_view detail);

    ~Result() = default;
    Result(Result const& other) = default;
    Result(Result&& other) = default;
    Result& operator=(Result const& other) = default;
    Result& operator=(Result&& other) = default;

    // Results compare by code only, the detail is informational.
    [[nodiscard]] bool operator==(Result const& other) const noexcept;
    [[nodiscard]] bool operator==(ResultCode other) const noexcept;

    operator bool() const noexcept;

    [[nodiscard]] virtual char const* what() const noexcept override;
    [[nodiscard]] bool IsSuccess() const noexcept;
    [[nodiscard]] bool IsError() const noexcept;
    [[nodiscard]] ResultCode GetCode() const noexcept;
    [[nodiscard]] std::string const& GetDetail() const noexcept;

private:
    ResultCode m_code;
    std::string m_detail;
    std::string m_message;
};

//----------------------------------------------------------------------------------------------------------------------
