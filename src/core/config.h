#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Configuration key constants
// ---------------------------------------------------------------------------

// Policy defaults (apply to every pool without an override).
inline constexpr const char* CONF_TARGETCAPSPERDAY   = "targetcapsperday";
inline constexpr const char* CONF_DECAYWINDOW        = "capbudgetdecaywindow";
inline constexpr const char* CONF_FREQSCALINGUNIT    = "freqscalingunit";
inline constexpr const char* CONF_MINBASEFEE         = "minbasefee";
inline constexpr const char* CONF_MAXBASEFEE         = "maxbasefee";
inline constexpr const char* CONF_MAXSTEP            = "maxstep";
inline constexpr const char* CONF_UPDATEINTERVAL     = "basefeeupdateinterval";
inline constexpr const char* CONF_SURGEDECAYPERIOD   = "surgedecayperiod";
inline constexpr const char* CONF_SURGEMULTIPLIER    = "surgemultiplier";
inline constexpr const char* CONF_MAXABSTICKMOVE     = "maxabstickmove";
inline constexpr const char* CONF_BASEFEEFACTOR      = "basefeefactor";
inline constexpr const char* CONF_DEFAULTBASEFEE     = "defaultbasefee";
inline constexpr const char* CONF_CAPMODE            = "capmode";
inline constexpr const char* CONF_BLOCKDURATION      = "blockduration";

// Per-pool override, repeatable: pooloverride=<pool-id-hex>:<key>=<value>
inline constexpr const char* CONF_POOLOVERRIDE       = "pooloverride";

// Oracle
inline constexpr const char* CONF_SAMPLECAPACITY     = "samplecapacity";

// Logging
inline constexpr const char* CONF_LOGLEVEL           = "loglevel";
inline constexpr const char* CONF_LOGCATEGORIES      = "logcategories";
inline constexpr const char* CONF_LOGFILE            = "logfile";

// Simulator
inline constexpr const char* CONF_CONF               = "conf";
inline constexpr const char* CONF_SCENARIO           = "scenario";
inline constexpr const char* CONF_STEPS              = "steps";
inline constexpr const char* CONF_INTERVAL           = "interval";
inline constexpr const char* CONF_SEED               = "seed";
inline constexpr const char* CONF_STARTTICK          = "starttick";
inline constexpr const char* CONF_HELP               = "help";

// ---------------------------------------------------------------------------
// Config  --  layered configuration with two sources
//
// Priority order: command-line args  >  config file  >  programmatic set()
// Multi-value keys (e.g. -pooloverride=a -pooloverride=b) are accumulated
// into a vector accessible via get_list().
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    // -- source loading -----------------------------------------------------

    /// Parse command-line arguments.
    /// Accepted formats:
    ///   -key=value   --key=value   (key/value pair)
    ///   -key         --key         (boolean flag, value = "1")
    /// Positional arguments are rejected with CONFIG_PARSE.
    Result<void> parse_args(int argc, const char* const argv[]);

    /// Parse an INI-style configuration file.
    /// Format per line:  key=value
    /// Lines starting with '#' and blank lines are ignored.
    /// Returns CONFIG_ERROR if the file cannot be opened and CONFIG_PARSE
    /// (with the line number) for a line whose key is empty.
    Result<void> parse_file(const std::filesystem::path& path);

    /// Parse configuration text already in memory (same format as a file).
    Result<void> parse_text(std::string_view text,
                            std::string_view origin = "<text>");

    // -- setters / getters --------------------------------------------------

    /// Set a key to a single value (replaces any previous values).
    void set(std::string_view key, std::string value);

    /// Return the first value for @p key, or std::nullopt if absent.
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    /// Return the first value for @p key, or @p default_val if absent.
    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    /// Return the value for @p key parsed as int64, or @p default_val.
    /// Unparseable values are logged and replaced by @p default_val.
    [[nodiscard]] int64_t get_int(std::string_view key,
                                  int64_t default_val = 0) const;

    /// Strict variant: absent keys yield @p default_val, unparseable
    /// values (trailing garbage, overflow) yield CONFIG_PARSE.
    [[nodiscard]] Result<int64_t> get_int_checked(
        std::string_view key, int64_t default_val) const;

    /// Strict unsigned variant (rejects a leading '-').
    [[nodiscard]] Result<uint64_t> get_uint_checked(
        std::string_view key, uint64_t default_val) const;

    /// Return the value for @p key parsed as bool, or @p default_val.
    /// Truthy: "1", "true", "yes", "on" (case-insensitive).
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    /// Return the value for @p key parsed as double, or @p default_val.
    [[nodiscard]] double get_double(std::string_view key,
                                    double default_val = 0.0) const;

    /// Return all values associated with @p key (multi-value support).
    [[nodiscard]] std::vector<std::string> get_list(
        std::string_view key) const;

    /// Check whether @p key exists in any source.
    [[nodiscard]] bool has(std::string_view key) const;

private:
    // Two separate maps so that CLI args always override file values.
    // Lookup checks cli_values_ first, then file_values_.
    using ValueMap =
        std::unordered_map<std::string, std::vector<std::string>>;

    ValueMap cli_values_;
    ValueMap file_values_;

    void insert(ValueMap& target, std::string_view key, std::string value);
    [[nodiscard]] const std::vector<std::string>* lookup(
        std::string_view key) const;
};

} // namespace core
