#pragma once
#include <cstdint>

namespace cjkpost
{

enum class Status : std::uint8_t
{
    Ok = 0,
    InvalidInput,         // bad local argument or malformed unit data
    UnsupportedProtocol,  // protocol id not in the registry
    ProtocolViolation,    // fragment sequence is inconsistent
    CryptoFailure         // cipher reported an error (opaque)
};

inline const char *status_name(Status s)
{
    switch (s)
    {
        case Status::Ok:
            return "Ok";
        case Status::InvalidInput:
            return "InvalidInput";
        case Status::UnsupportedProtocol:
            return "UnsupportedProtocol";
        case Status::ProtocolViolation:
            return "ProtocolViolation";
        case Status::CryptoFailure:
            return "CryptoFailure";
    }
    return "?";
}

}  // namespace cjkpost
