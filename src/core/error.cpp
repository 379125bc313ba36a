#include <carlink/core/error.hpp>

namespace carlink::core {

std::string ErrorCategory::message(int ev) const {
    switch (static_cast<ErrorCode>(ev)) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::InvalidMessage: return "Invalid message";
        case ErrorCode::MissingField: return "Missing required field";
        case ErrorCode::UnknownTarget: return "Unknown target";
        case ErrorCode::NotInRoom: return "Not in a room";
        case ErrorCode::NegotiationFailed: return "Negotiation failed";
        case ErrorCode::TransportFailed: return "Transport failed";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::ConnectionClosed: return "Connection closed";
        case ErrorCode::ConnectionTimeout: return "Connection timeout";
        case ErrorCode::MalformedFrame: return "Malformed frame";
        case ErrorCode::ResourceNotFound: return "Resource not found";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileAccessDenied: return "File access denied";
        case ErrorCode::InvalidData: return "Invalid data";
    }
    return "Unknown error";
}

std::error_condition ErrorCategory::default_error_condition(int ev) const noexcept {
    switch (static_cast<ErrorCode>(ev)) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::MissingField:
        case ErrorCode::InvalidData:
            return std::errc::invalid_argument;
        case ErrorCode::InvalidMessage: return std::errc::bad_message;
        case ErrorCode::UnknownTarget: return std::errc::host_unreachable;
        case ErrorCode::ConnectionFailed: return std::errc::connection_refused;
        case ErrorCode::ConnectionClosed: return std::errc::connection_reset;
        case ErrorCode::ConnectionTimeout: return std::errc::timed_out;
        case ErrorCode::MalformedFrame: return std::errc::illegal_byte_sequence;
        case ErrorCode::FileNotFound: return std::errc::no_such_file_or_directory;
        case ErrorCode::FileAccessDenied: return std::errc::permission_denied;
        default:
            return {ev, *this};
    }
}

} // namespace carlink::core
