#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the session sync framework.

#include <cstdint>
#include <string_view>

namespace csync::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // Session (0x0100 - 0x01FF)
    NotAuthorized = 0x0100,
    OperationInProgress = 0x0101,
    SessionNotActive = 0x0102,
    SessionEnded = 0x0103,
    SessionAlreadyStarted = 0x0104,
    StaleCompletion = 0x0105,

    // Persistence (0x0200 - 0x02FF)
    PersistenceUnavailable = 0x0200,
    PersistenceFailure = 0x0201,

    // Codec (0x0300 - 0x03FF)
    MalformedSnapshot = 0x0300,

    // Replication (0x0400 - 0x04FF)
    ReplicationFailed = 0x0400,
    InvalidMessage = 0x0401,

    // Network (0x0500 - 0x05FF)
    NetworkError = 0x0500,
    ConnectionFailed = 0x0501,
    ConnectionLost = 0x0502,
    SendFailed = 0x0503,
    ListenFailed = 0x0504,
    PeerNotFound = 0x0505,

    // Database (0x0600 - 0x06FF)
    DatabaseError = 0x0600,
    QueryFailed = 0x0601,
    TransactionFailed = 0x0602,
    NotConnected = 0x0603,
    ConnectionPoolExhausted = 0x0604,

    // Config (0x0700 - 0x07FF)
    ConfigLoadFailed = 0x0700,
    ConfigKeyNotFound = 0x0701,
    ConfigTypeMismatch = 0x0702,
    ConfigInvalidValue = 0x0703,

    // Thread (0x0800 - 0x08FF)
    ThreadError = 0x0800,
    JobScheduleFailed = 0x0801,
    JobNotFound = 0x0802,
    JobCancelled = 0x0803,

    // Logger (0x0900 - 0x09FF)
    LoggerError = 0x0900,
    LoggerFlushFailed = 0x0901,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Session";
        case 0x0200: return "Persistence";
        case 0x0300: return "Codec";
        case 0x0400: return "Replication";
        case 0x0500: return "Network";
        case 0x0600: return "Database";
        case 0x0700: return "Config";
        case 0x0800: return "Thread";
        case 0x0900: return "Logger";
        default: return "Unknown";
    }
}

/// Return the symbolic name of an error code (used in log lines).
constexpr std::string_view errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:                return "Success";
        case ErrorCode::Unknown:                return "Unknown";
        case ErrorCode::InvalidArgument:        return "InvalidArgument";
        case ErrorCode::NotFound:               return "NotFound";
        case ErrorCode::AlreadyExists:          return "AlreadyExists";
        case ErrorCode::NotImplemented:         return "NotImplemented";
        case ErrorCode::NotAuthorized:          return "NotAuthorized";
        case ErrorCode::OperationInProgress:    return "OperationInProgress";
        case ErrorCode::SessionNotActive:       return "SessionNotActive";
        case ErrorCode::SessionEnded:           return "SessionEnded";
        case ErrorCode::SessionAlreadyStarted:  return "SessionAlreadyStarted";
        case ErrorCode::StaleCompletion:        return "StaleCompletion";
        case ErrorCode::PersistenceUnavailable: return "PersistenceUnavailable";
        case ErrorCode::PersistenceFailure:     return "PersistenceFailure";
        case ErrorCode::MalformedSnapshot:      return "MalformedSnapshot";
        case ErrorCode::ReplicationFailed:      return "ReplicationFailed";
        case ErrorCode::InvalidMessage:         return "InvalidMessage";
        case ErrorCode::NetworkError:           return "NetworkError";
        case ErrorCode::ConnectionFailed:       return "ConnectionFailed";
        case ErrorCode::ConnectionLost:         return "ConnectionLost";
        case ErrorCode::SendFailed:             return "SendFailed";
        case ErrorCode::ListenFailed:           return "ListenFailed";
        case ErrorCode::PeerNotFound:           return "PeerNotFound";
        case ErrorCode::DatabaseError:          return "DatabaseError";
        case ErrorCode::QueryFailed:            return "QueryFailed";
        case ErrorCode::TransactionFailed:      return "TransactionFailed";
        case ErrorCode::NotConnected:           return "NotConnected";
        case ErrorCode::ConnectionPoolExhausted: return "ConnectionPoolExhausted";
        case ErrorCode::ConfigLoadFailed:       return "ConfigLoadFailed";
        case ErrorCode::ConfigKeyNotFound:      return "ConfigKeyNotFound";
        case ErrorCode::ConfigTypeMismatch:     return "ConfigTypeMismatch";
        case ErrorCode::ConfigInvalidValue:     return "ConfigInvalidValue";
        case ErrorCode::ThreadError:            return "ThreadError";
        case ErrorCode::JobScheduleFailed:      return "JobScheduleFailed";
        case ErrorCode::JobNotFound:            return "JobNotFound";
        case ErrorCode::JobCancelled:           return "JobCancelled";
        case ErrorCode::LoggerError:            return "LoggerError";
        case ErrorCode::LoggerFlushFailed:      return "LoggerFlushFailed";
    }
    return "Unknown";
}

} // namespace csync::foundation
