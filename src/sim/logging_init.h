#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Logging setup for the command-line tools.
//
// Configures the global Logger from the configuration keys:
//   - loglevel       threshold (trace .. fatal, off)
//   - logcategories  comma-separated category list
//   - logfile        optional append-mode log file, rotated when large
// ---------------------------------------------------------------------------

#include "core/config.h"
#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace sim {

/// Apply the logging keys of @p config.  CONFIG_PARSE for an unknown
/// level, CONFIG_ERROR when the log file cannot be opened.
[[nodiscard]] core::Result<void> init_logging(const core::Config& config);

/// Maximum log file size before rotation, in bytes.
inline constexpr uint64_t MAX_LOG_FILE_SIZE = 10 * 1024 * 1024;  // 10 MB

/// Rename @p log_path to "<name>.1" (replacing an older one) when it is at
/// least @p max_size bytes.  Returns true if rotation was performed.
bool rotate_log_file(const std::filesystem::path& log_path,
                     uint64_t max_size = MAX_LOG_FILE_SIZE);

/// Tool name, build and compiler line written at startup.
[[nodiscard]] std::string get_startup_banner();

} // namespace sim
