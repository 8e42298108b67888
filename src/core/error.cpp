// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

// ---------------------------------------------------------------------------
// error_code_name: human-readable label for every ErrorCode variant
// ---------------------------------------------------------------------------
std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:                    return "NONE";

        // Validation
        case ErrorCode::VALIDATION_ERROR:        return "VALIDATION_ERROR";
        case ErrorCode::VALIDATION_RANGE:        return "VALIDATION_RANGE";

        // Oracle
        case ErrorCode::ORACLE_ERROR:            return "ORACLE_ERROR";
        case ErrorCode::ORACLE_NOT_ENABLED:      return "ORACLE_NOT_ENABLED";
        case ErrorCode::ORACLE_ALREADY_ENABLED:  return "ORACLE_ALREADY_ENABLED";
        case ErrorCode::ORACLE_STALE_LOOKBACK:   return "ORACLE_STALE_LOOKBACK";

        // Fee controller
        case ErrorCode::FEE_ERROR:               return "FEE_ERROR";
        case ErrorCode::FEE_NOT_INITIALIZED:     return "FEE_NOT_INITIALIZED";
        case ErrorCode::FEE_ALREADY_INITIALIZED: return "FEE_ALREADY_INITIALIZED";

        // Authorization
        case ErrorCode::AUTH_ERROR:              return "AUTH_ERROR";
        case ErrorCode::AUTH_UNAUTHORIZED:       return "AUTH_UNAUTHORIZED";

        // Configuration
        case ErrorCode::CONFIG_ERROR:            return "CONFIG_ERROR";
        case ErrorCode::CONFIG_PARSE:            return "CONFIG_PARSE";

        // Internal
        case ErrorCode::INTERNAL_ERROR:          return "INTERNAL_ERROR";
        case ErrorCode::NOT_IMPLEMENTED:         return "NOT_IMPLEMENTED";
    }

    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Error::format: build a diagnostic string including source location
// ---------------------------------------------------------------------------
std::string Error::format() const {
    if (code_ == ErrorCode::NONE) {
        return "no error";
    }

    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    // Append source location when available (file name is non-empty).
    const char* file = location_.file_name();
    if (file && file[0] != '\0') {
        oss << " [" << file
            << ':' << location_.line()
            << ':' << location_.column() << ']';
    }

    return oss.str();
}

} // namespace core
