// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "policy/policy_params.h"
#include "core/config.h"

#include <array>
#include <charconv>

namespace policy {

namespace {

core::Error range_error(std::string_view field, const std::string& detail) {
    return core::make_error(core::ErrorCode::VALIDATION_RANGE,
                            std::string(field) + ": " + detail);
}

template <typename Int>
core::Result<void> parse_into(std::string_view key, std::string_view text,
                              std::optional<Int>& out) {
    Int value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                     value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return core::make_error(core::ErrorCode::CONFIG_PARSE,
                                "invalid value '" + std::string(text) +
                                "' for " + std::string(key));
    }
    out = value;
    return core::make_ok();
}

using FieldSetter = core::Result<void> (*)(PolicyOverride&, std::string_view);

struct FieldEntry {
    const char* key;
    FieldSetter set;
};

#define DYNFEE_POLICY_FIELD(conf_key, member)                                  \
    FieldEntry{conf_key, [](PolicyOverride& ov, std::string_view v) {          \
        return parse_into(conf_key, v, ov.member);                             \
    }}

const std::array<FieldEntry, 13> FIELD_TABLE = {
    DYNFEE_POLICY_FIELD(core::CONF_TARGETCAPSPERDAY, target_caps_per_day),
    DYNFEE_POLICY_FIELD(core::CONF_DECAYWINDOW, cap_budget_decay_window_seconds),
    DYNFEE_POLICY_FIELD(core::CONF_FREQSCALINGUNIT, freq_scaling_unit),
    DYNFEE_POLICY_FIELD(core::CONF_MINBASEFEE, min_base_fee_ppm),
    DYNFEE_POLICY_FIELD(core::CONF_MAXBASEFEE, max_base_fee_ppm),
    DYNFEE_POLICY_FIELD(core::CONF_MAXSTEP, max_step_ppm),
    DYNFEE_POLICY_FIELD(core::CONF_UPDATEINTERVAL, base_fee_update_interval_seconds),
    DYNFEE_POLICY_FIELD(core::CONF_SURGEDECAYPERIOD, surge_decay_period_seconds),
    DYNFEE_POLICY_FIELD(core::CONF_SURGEMULTIPLIER, surge_fee_multiplier_ppm),
    DYNFEE_POLICY_FIELD(core::CONF_MAXABSTICKMOVE, max_abs_tick_move),
    DYNFEE_POLICY_FIELD(core::CONF_BASEFEEFACTOR, base_fee_factor_ppm),
    DYNFEE_POLICY_FIELD(core::CONF_DEFAULTBASEFEE, default_base_fee_ppm),
    DYNFEE_POLICY_FIELD(core::CONF_BLOCKDURATION, block_duration_seconds),
};

#undef DYNFEE_POLICY_FIELD

template <typename T>
void take(std::optional<T>& dst, const std::optional<T>& src) {
    if (src) dst = src;
}

} // namespace

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

core::Result<void> validate_params(const PolicyParams& p) {
    if (p.max_base_fee_ppm > MAX_BASE_FEE_LIMIT_PPM) {
        return range_error("max_base_fee_ppm",
                           std::to_string(p.max_base_fee_ppm) +
                           " exceeds 1000000");
    }
    if (p.min_base_fee_ppm > p.max_base_fee_ppm) {
        return range_error("min_base_fee_ppm",
                           std::to_string(p.min_base_fee_ppm) +
                           " > max_base_fee_ppm " +
                           std::to_string(p.max_base_fee_ppm));
    }
    if (p.target_caps_per_day == 0) {
        return range_error("target_caps_per_day", "must be positive");
    }
    if (p.cap_budget_decay_window_seconds == 0) {
        return range_error("cap_budget_decay_window_seconds",
                           "must be positive");
    }
    if (p.freq_scaling_unit == 0) {
        return range_error("freq_scaling_unit", "must be positive");
    }
    if (p.max_step_ppm == 0 || p.max_step_ppm > PPM) {
        return range_error("max_step_ppm", "must be in (0, 1000000]");
    }
    if (p.surge_fee_multiplier_ppm > MAX_SURGE_MULTIPLIER_PPM) {
        return range_error("surge_fee_multiplier_ppm",
                           std::to_string(p.surge_fee_multiplier_ppm) +
                           " exceeds 30000000");
    }
    if (p.max_abs_tick_move < 0 || p.max_abs_tick_move > MAX_TICK_MOVE_LIMIT) {
        return range_error("max_abs_tick_move",
                           std::to_string(p.max_abs_tick_move) +
                           " outside [0, " +
                           std::to_string(MAX_TICK_MOVE_LIMIT) + "]");
    }
    if (p.default_base_fee_ppm < p.min_base_fee_ppm ||
        p.default_base_fee_ppm > p.max_base_fee_ppm) {
        return range_error("default_base_fee_ppm",
                           "outside [min_base_fee_ppm, max_base_fee_ppm]");
    }
    if (p.block_duration_seconds == 0) {
        return range_error("block_duration_seconds", "must be positive");
    }
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// PolicyOverride
// ---------------------------------------------------------------------------

PolicyParams PolicyOverride::apply_to(const PolicyParams& base) const {
    PolicyParams p = base;
    p.target_caps_per_day = target_caps_per_day.value_or(p.target_caps_per_day);
    p.cap_budget_decay_window_seconds =
        cap_budget_decay_window_seconds.value_or(p.cap_budget_decay_window_seconds);
    p.freq_scaling_unit = freq_scaling_unit.value_or(p.freq_scaling_unit);
    p.min_base_fee_ppm = min_base_fee_ppm.value_or(p.min_base_fee_ppm);
    p.max_base_fee_ppm = max_base_fee_ppm.value_or(p.max_base_fee_ppm);
    p.max_step_ppm = max_step_ppm.value_or(p.max_step_ppm);
    p.base_fee_update_interval_seconds =
        base_fee_update_interval_seconds.value_or(p.base_fee_update_interval_seconds);
    p.surge_decay_period_seconds =
        surge_decay_period_seconds.value_or(p.surge_decay_period_seconds);
    p.surge_fee_multiplier_ppm =
        surge_fee_multiplier_ppm.value_or(p.surge_fee_multiplier_ppm);
    p.max_abs_tick_move = max_abs_tick_move.value_or(p.max_abs_tick_move);
    p.base_fee_factor_ppm = base_fee_factor_ppm.value_or(p.base_fee_factor_ppm);
    p.default_base_fee_ppm = default_base_fee_ppm.value_or(p.default_base_fee_ppm);
    p.cap_mode = cap_mode.value_or(p.cap_mode);
    p.block_duration_seconds =
        block_duration_seconds.value_or(p.block_duration_seconds);
    return p;
}

void PolicyOverride::merge(const PolicyOverride& newer) {
    take(target_caps_per_day, newer.target_caps_per_day);
    take(cap_budget_decay_window_seconds, newer.cap_budget_decay_window_seconds);
    take(freq_scaling_unit, newer.freq_scaling_unit);
    take(min_base_fee_ppm, newer.min_base_fee_ppm);
    take(max_base_fee_ppm, newer.max_base_fee_ppm);
    take(max_step_ppm, newer.max_step_ppm);
    take(base_fee_update_interval_seconds, newer.base_fee_update_interval_seconds);
    take(surge_decay_period_seconds, newer.surge_decay_period_seconds);
    take(surge_fee_multiplier_ppm, newer.surge_fee_multiplier_ppm);
    take(max_abs_tick_move, newer.max_abs_tick_move);
    take(base_fee_factor_ppm, newer.base_fee_factor_ppm);
    take(default_base_fee_ppm, newer.default_base_fee_ppm);
    take(cap_mode, newer.cap_mode);
    take(block_duration_seconds, newer.block_duration_seconds);
}

bool PolicyOverride::empty() const {
    return !target_caps_per_day && !cap_budget_decay_window_seconds &&
           !freq_scaling_unit && !min_base_fee_ppm && !max_base_fee_ppm &&
           !max_step_ppm && !base_fee_update_interval_seconds &&
           !surge_decay_period_seconds && !surge_fee_multiplier_ppm &&
           !max_abs_tick_move && !base_fee_factor_ppm &&
           !default_base_fee_ppm && !cap_mode && !block_duration_seconds;
}

// ---------------------------------------------------------------------------
// Textual field access
// ---------------------------------------------------------------------------

core::Result<void> set_policy_field(PolicyOverride& ov, std::string_view key,
                                    std::string_view value) {
    if (key == core::CONF_CAPMODE) {
        auto mode = oracle::parse_cap_mode(value);
        if (!mode) {
            return core::make_error(core::ErrorCode::CONFIG_PARSE,
                                    "invalid cap mode '" + std::string(value) +
                                    "' (expected step or block)");
        }
        ov.cap_mode = *mode;
        return core::make_ok();
    }
    for (const auto& entry : FIELD_TABLE) {
        if (key == entry.key) return entry.set(ov, value);
    }
    return core::make_error(core::ErrorCode::CONFIG_PARSE,
                            "unknown policy key '" + std::string(key) + "'");
}

bool is_policy_key(std::string_view key) {
    if (key == core::CONF_CAPMODE) return true;
    for (const auto& entry : FIELD_TABLE) {
        if (key == entry.key) return true;
    }
    return false;
}

std::string describe(const PolicyParams& p) {
    return "target=" + std::to_string(p.target_caps_per_day) + "/day" +
           " window=" + std::to_string(p.cap_budget_decay_window_seconds) + "s" +
           " base=[" + std::to_string(p.min_base_fee_ppm) + "," +
           std::to_string(p.max_base_fee_ppm) + "]ppm" +
           " step=" + std::to_string(p.max_step_ppm) + "ppm" +
           " interval=" + std::to_string(p.base_fee_update_interval_seconds) + "s" +
           " surge=" + std::to_string(p.surge_fee_multiplier_ppm) + "ppm/" +
           std::to_string(p.surge_decay_period_seconds) + "s" +
           " maxmove=" + std::to_string(p.max_abs_tick_move) +
           " mode=" + std::string(oracle::cap_mode_name(p.cap_mode));
}

} // namespace policy
