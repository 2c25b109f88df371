#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace nzbstream {

enum class ErrorCategory {
    None,
    Config,
    Manifest,
    Archive,
    Transport,
    Extraction,
    Filesystem,
    Mount,
    Request,
    Cancelled,
    Internal
};

enum class ErrorCode {
    None,
    Unknown,
    ConfigMissing,
    ConfigInvalid,
    InvalidManifest,
    HeaderParseError,
    NoArchiveVolumes,
    RequiresPassword,
    RequiresExtraction,
    TransportError,
    ExtractionFailure,
    UnknownArchiveFormat,
    NoMediaFound,
    Cancelled,
    MountNotFound,
    MountNotReady,
    FileNotFound,
    RangeNotSatisfiable,
    FilesystemError,
    Internal
};

struct ErrorInfo {
    ErrorCategory category{ErrorCategory::None};
    ErrorCode code{ErrorCode::None};
    bool retryable{false};
    std::string userMessage;
    std::string detail;

    bool ok() const { return code == ErrorCode::None; }
};

inline const char* errorCategoryLabel(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::Config: return "Config";
        case ErrorCategory::Manifest: return "Manifest";
        case ErrorCategory::Archive: return "Archive";
        case ErrorCategory::Transport: return "Transport";
        case ErrorCategory::Extraction: return "Extraction";
        case ErrorCategory::Filesystem: return "Filesystem";
        case ErrorCategory::Mount: return "Mount";
        case ErrorCategory::Request: return "Request";
        case ErrorCategory::Cancelled: return "Cancelled";
        case ErrorCategory::Internal: return "Internal";
        default: return "Unknown";
    }
}

inline const char* errorCodeLabel(ErrorCode c) {
    switch (c) {
        case ErrorCode::None: return "None";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::ConfigMissing: return "ConfigMissing";
        case ErrorCode::ConfigInvalid: return "ConfigInvalid";
        case ErrorCode::InvalidManifest: return "InvalidManifest";
        case ErrorCode::HeaderParseError: return "HeaderParseError";
        case ErrorCode::NoArchiveVolumes: return "NoArchiveVolumes";
        case ErrorCode::RequiresPassword: return "RequiresPassword";
        case ErrorCode::RequiresExtraction: return "RequiresExtraction";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::ExtractionFailure: return "ExtractionFailure";
        case ErrorCode::UnknownArchiveFormat: return "UnknownArchiveFormat";
        case ErrorCode::NoMediaFound: return "NoMediaFound";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::MountNotFound: return "MountNotFound";
        case ErrorCode::MountNotReady: return "MountNotReady";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::RangeNotSatisfiable: return "RangeNotSatisfiable";
        case ErrorCode::FilesystemError: return "FilesystemError";
        case ErrorCode::Internal: return "Internal";
        default: return "Unknown";
    }
}

inline ErrorCategory categoryForCode(ErrorCode c) {
    switch (c) {
        case ErrorCode::None: return ErrorCategory::None;
        case ErrorCode::ConfigMissing:
        case ErrorCode::ConfigInvalid: return ErrorCategory::Config;
        case ErrorCode::InvalidManifest: return ErrorCategory::Manifest;
        case ErrorCode::HeaderParseError:
        case ErrorCode::NoArchiveVolumes:
        case ErrorCode::RequiresPassword:
        case ErrorCode::RequiresExtraction:
        case ErrorCode::UnknownArchiveFormat: return ErrorCategory::Archive;
        case ErrorCode::TransportError: return ErrorCategory::Transport;
        case ErrorCode::ExtractionFailure:
        case ErrorCode::NoMediaFound: return ErrorCategory::Extraction;
        case ErrorCode::Cancelled: return ErrorCategory::Cancelled;
        case ErrorCode::MountNotFound:
        case ErrorCode::MountNotReady: return ErrorCategory::Mount;
        case ErrorCode::FileNotFound:
        case ErrorCode::RangeNotSatisfiable: return ErrorCategory::Request;
        case ErrorCode::FilesystemError: return ErrorCategory::Filesystem;
        default: return ErrorCategory::Internal;
    }
}

inline bool defaultRetryable(ErrorCode c) {
    return c == ErrorCode::TransportError ||
           c == ErrorCode::MountNotReady ||
           c == ErrorCode::RequiresExtraction ||
           c == ErrorCode::FilesystemError;
}

inline ErrorInfo makeError(ErrorCode code, const std::string& userMessage, const std::string& detail = {}) {
    ErrorInfo out;
    out.code = code;
    out.category = categoryForCode(code);
    out.retryable = defaultRetryable(code);
    out.userMessage = userMessage;
    out.detail = detail;
    return out;
}

inline bool isCancellation(const ErrorInfo& err) {
    return err.code == ErrorCode::Cancelled;
}

// "userMessage (detail)" for log lines.
inline std::string describeError(const ErrorInfo& err) {
    std::string out = std::string(errorCodeLabel(err.code)) + ": " + err.userMessage;
    if (!err.detail.empty() && err.detail != err.userMessage) out += " (" + err.detail + ")";
    return out;
}

inline std::string toLowerCopy(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

// Map a free-form codec or transport message onto the taxonomy.
inline ErrorInfo classifyError(const std::string& detail, ErrorCategory hint = ErrorCategory::None) {
    ErrorInfo out;
    out.detail = detail;
    out.category = hint;
    out.code = ErrorCode::Unknown;

    const std::string l = toLowerCopy(detail);

    auto set = [&](ErrorCode code, const char* user) {
        out.code = code;
        out.category = categoryForCode(code);
        out.userMessage = user;
        out.retryable = defaultRetryable(code);
    };

    if (l.find("cancel") != std::string::npos || l.find("aborted") != std::string::npos) {
        set(ErrorCode::Cancelled, "Operation was cancelled.");
    } else if (l.find("passphrase") != std::string::npos || l.find("password") != std::string::npos ||
               l.find("encrypted") != std::string::npos) {
        if (hint == ErrorCategory::Extraction) {
            set(ErrorCode::ExtractionFailure, "Archive password is missing or incorrect.");
        } else {
            set(ErrorCode::RequiresPassword, "Archive is password protected.");
        }
    } else if (l.find("article not found") != std::string::npos || l.find("no such article") != std::string::npos ||
               l.find("connection") != std::string::npos || l.find("timeout") != std::string::npos ||
               l.find("timed out") != std::string::npos || l.find("transport") != std::string::npos) {
        set(ErrorCode::TransportError, "Failed to fetch data from the article source.");
    } else if (l.find("truncated") != std::string::npos || l.find("damaged") != std::string::npos ||
               l.find("corrupt") != std::string::npos || l.find("unsupported") != std::string::npos ||
               l.find("unrecognized archive") != std::string::npos) {
        set(ErrorCode::ExtractionFailure, "Archive is damaged or uses an unsupported format.");
    } else if (l.find("no space") != std::string::npos || l.find("permission denied") != std::string::npos ||
               l.find("write failed") != std::string::npos || l.find("open failed") != std::string::npos) {
        set(ErrorCode::FilesystemError, "Failed to write to storage.");
    } else if (l.find("missing config") != std::string::npos) {
        set(ErrorCode::ConfigMissing, "Configuration file is missing.");
    } else if (l.find("invalid config") != std::string::npos) {
        set(ErrorCode::ConfigInvalid, "Configuration format is invalid.");
    }

    if (out.category == ErrorCategory::None) out.category = hint == ErrorCategory::None ? ErrorCategory::Internal : hint;
    if (out.userMessage.empty()) {
        switch (out.category) {
            case ErrorCategory::Config: out.userMessage = "Configuration error."; break;
            case ErrorCategory::Manifest: out.userMessage = "Invalid NZB manifest."; break;
            case ErrorCategory::Archive: out.userMessage = "Archive could not be read."; break;
            case ErrorCategory::Transport: out.userMessage = "Article source error."; out.retryable = true; break;
            case ErrorCategory::Extraction: out.userMessage = "Extraction failed."; break;
            case ErrorCategory::Filesystem: out.userMessage = "Storage error."; out.retryable = true; break;
            case ErrorCategory::Mount: out.userMessage = "Mount is not available."; break;
            case ErrorCategory::Request: out.userMessage = "Invalid request."; break;
            case ErrorCategory::Cancelled: out.userMessage = "Operation was cancelled."; break;
            case ErrorCategory::Internal: out.userMessage = "Internal error."; break;
            default: out.userMessage = "Unknown error."; break;
        }
    }

    return out;
}

} // namespace nzbstream
