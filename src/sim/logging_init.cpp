// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "sim/logging_init.h"
#include "core/logging.h"

#include <sstream>
#include <string>
#include <system_error>

namespace sim {

core::Result<void> init_logging(const core::Config& config) {
    auto& logger = core::Logger::instance();

    if (auto level_str = config.get(core::CONF_LOGLEVEL)) {
        auto level = core::parse_log_level(*level_str);
        if (!level) {
            return core::make_error(core::ErrorCode::CONFIG_PARSE,
                                    "unknown log level '" + *level_str + "'");
        }
        logger.set_level(*level);
    }

    if (auto cats = config.get(core::CONF_LOGCATEGORIES)) {
        logger.set_categories(core::parse_log_categories(*cats));
    }

    if (auto file = config.get(core::CONF_LOGFILE); file && !file->empty()) {
        const std::filesystem::path log_path(*file);
        rotate_log_file(log_path);
        if (!logger.set_log_file(log_path)) {
            return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                    "cannot open log file " + log_path.string());
        }
    }

    LOG_INFO(core::LogCategory::NONE, get_startup_banner());
    return core::make_ok();
}

bool rotate_log_file(const std::filesystem::path& log_path, uint64_t max_size) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(log_path, ec);
    if (ec || size < max_size) return false;

    const std::filesystem::path rotated_path =
        log_path.parent_path() / (log_path.filename().string() + ".1");

    std::filesystem::remove(rotated_path, ec);
    if (ec) {
        LOG_WARN(core::LogCategory::NONE,
                 "failed to remove old rotated log: " + rotated_path.string());
    }

    std::filesystem::rename(log_path, rotated_path, ec);
    if (ec) {
        LOG_WARN(core::LogCategory::NONE,
                 "failed to rotate log file " + log_path.string() + ": " +
                 ec.message());
        return false;
    }
    return true;
}

std::string get_startup_banner() {
    std::ostringstream ss;
    ss << "dynfee feesim | build " << __DATE__ << " " << __TIME__
       << " | "
#if defined(__clang__)
       << "Clang " << __clang_major__ << "." << __clang_minor__
#elif defined(__GNUC__)
       << "GCC " << __GNUC__ << "." << __GNUC_MINOR__
#else
       << "unknown compiler"
#endif
       << " | C++ " << __cplusplus;
    return ss.str();
}

} // namespace sim
