// include/TCAT/Error.h
// Synopsis: Transport and protocol error codes for the TCAT register engine.

#pragma once

#include <string>
#include <system_error>

namespace TCAT {

/**
 * @brief Failure reported by a transaction port for one asynchronous request.
 */
enum class TransportError {
    Success = 0,        // Request completed
    Timeout,            // No response within the timeout
    IOError,            // General I/O error on the node handle
    BusReset,           // Generation changed while the request was in flight
    Busy,               // Responder busy
    AddressError,       // Responder rejected the address
    ShortResponse,      // Response carried fewer bytes than requested
    NotOpen,            // Node handle not open
    BadArgument         // Unaligned offset or length
};

/**
 * @brief Failure kinds of the extension engine.
 *
 * Section kinds wrap a TransportError; the others are detected locally.
 */
enum class ExtensionError {
    Success = 0,
    SectionTable,           // Bootstrap of section offsets failed
    GlobalSection,
    CapabilityUnavailable,  // Caps section missing, short or unreadable
    ApplSection,
    PeakSection,
    StreamFormat,
    RouterSection,
    CmdSection,
    CurrentConfig,
    StandaloneSection,
    FeatureUnavailable,     // Capability bit not set
    RoutingCapacityExceeded,
    MalformedEntry,
    StaleCapabilities,      // Used after bus reset without bootstrap
    InvalidClockSource,
    UnavailableFixedBlock,  // Fixed entry references an absent block
    BadArgument,
    CommandFailed,          // Command section returned non-zero
    ModelNotFound,
    InvalidModelSpec
};

namespace detail {
    struct TransportErrorCategory : std::error_category {
        const char* name() const noexcept override { return "TCAT.Transport"; }
        std::string message(int ev) const override {
            switch (static_cast<TransportError>(ev)) {
                case TransportError::Success: return "Success";
                case TransportError::Timeout: return "Transaction timed out";
                case TransportError::IOError: return "I/O error";
                case TransportError::BusReset: return "Bus reset during transaction";
                case TransportError::Busy: return "Responder busy";
                case TransportError::AddressError: return "Address error";
                case TransportError::ShortResponse: return "Short response";
                case TransportError::NotOpen: return "Node not open";
                case TransportError::BadArgument: return "Invalid argument";
                default: return "Unknown transport error";
            }
        }
    };

    struct ExtensionErrorCategory : std::error_category {
        const char* name() const noexcept override { return "TCAT.Extension"; }
        std::string message(int ev) const override {
            switch (static_cast<ExtensionError>(ev)) {
                case ExtensionError::Success: return "Success";
                case ExtensionError::SectionTable: return "Section table error";
                case ExtensionError::GlobalSection: return "Global section error";
                case ExtensionError::CapabilityUnavailable: return "Capability unavailable";
                case ExtensionError::ApplSection: return "Application section error";
                case ExtensionError::PeakSection: return "Peak section error";
                case ExtensionError::StreamFormat: return "Stream format section error";
                case ExtensionError::RouterSection: return "Router section error";
                case ExtensionError::CmdSection: return "Command section error";
                case ExtensionError::CurrentConfig: return "Current configuration section error";
                case ExtensionError::StandaloneSection: return "Standalone section error";
                case ExtensionError::FeatureUnavailable: return "Feature unavailable";
                case ExtensionError::RoutingCapacityExceeded: return "Routing capacity exceeded";
                case ExtensionError::MalformedEntry: return "Malformed entry";
                case ExtensionError::StaleCapabilities: return "Capabilities stale after bus reset";
                case ExtensionError::InvalidClockSource: return "Clock source not available";
                case ExtensionError::UnavailableFixedBlock: return "Fixed entry references absent block";
                case ExtensionError::BadArgument: return "Invalid argument";
                case ExtensionError::CommandFailed: return "Command returned failure";
                case ExtensionError::ModelNotFound: return "Model not found";
                case ExtensionError::InvalidModelSpec: return "Invalid model specification";
                default: return "Unknown error";
            }
        }
    };
}

inline const std::error_category& transport_error_category() noexcept {
    static detail::TransportErrorCategory category;
    return category;
}

inline const std::error_category& extension_error_category() noexcept {
    static detail::ExtensionErrorCategory category;
    return category;
}

inline std::error_code make_error_code(TransportError e) noexcept {
    return {static_cast<int>(e), transport_error_category()};
}

inline std::error_code make_error_code(ExtensionError e) noexcept {
    return {static_cast<int>(e), extension_error_category()};
}

/**
 * @brief Error returned by every engine operation.
 */
struct ProtocolError {
    ExtensionError code{ExtensionError::Success};
    TransportError transport{TransportError::Success}; ///< Cause when code names a register section

    std::error_code errorCode() const { return make_error_code(code); }

    std::string message() const {
        std::string msg = make_error_code(code).message();
        if (transport != TransportError::Success) {
            msg += ": ";
            msg += make_error_code(transport).message();
        }
        return msg;
    }

    bool operator==(const ProtocolError& other) const = default;
};

inline ProtocolError makeTransportError(ExtensionError section, TransportError cause) noexcept {
    return ProtocolError{section, cause};
}

inline ProtocolError makeError(ExtensionError code) noexcept {
    return ProtocolError{code, TransportError::Success};
}

} // namespace TCAT

namespace std {
    template<>
    struct is_error_code_enum<TCAT::TransportError> : true_type {};
    template<>
    struct is_error_code_enum<TCAT::ExtensionError> : true_type {};
}
