// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "policy/policy_manager.h"
#include "core/logging.h"

#include <utility>
#include <vector>

namespace policy {

namespace {

/// "<hex>:<key>=<value>" -> (pool, key, value)
struct OverrideEntry {
    pool::PoolId pool;
    std::string key;
    std::string value;
};

core::Result<OverrideEntry> parse_override_entry(std::string_view text) {
    auto colon = text.find(':');
    auto eq = text.find('=', colon == std::string_view::npos ? 0 : colon);
    if (colon == std::string_view::npos || eq == std::string_view::npos) {
        return core::make_error(core::ErrorCode::CONFIG_PARSE,
                                "pooloverride '" + std::string(text) +
                                "' is not <pool-id>:<key>=<value>");
    }
    auto id = pool::PoolId::parse_hex(text.substr(0, colon));
    if (!id) {
        return core::make_error(core::ErrorCode::CONFIG_PARSE,
                                "pooloverride has a malformed pool id '" +
                                std::string(text.substr(0, colon)) + "'");
    }
    return OverrideEntry{*id,
                         std::string(text.substr(colon + 1, eq - colon - 1)),
                         std::string(text.substr(eq + 1))};
}

} // namespace

PolicyParams PolicyManager::params(const pool::PoolId& pool) const {
    READ_LOCK(mutex_);
    auto it = overrides_.find(pool);
    return it == overrides_.end() ? defaults_ : it->second.apply_to(defaults_);
}

PolicyParams PolicyManager::defaults() const {
    READ_LOCK(mutex_);
    return defaults_;
}

core::Result<void> PolicyManager::set_defaults(const PolicyParams& p) {
    DYNFEE_TRY_VOID(validate_params(p));

    WRITE_LOCK(mutex_);
    for (const auto& [pool, ov] : overrides_) {
        auto merged = validate_params(ov.apply_to(p));
        if (!merged.ok()) {
            return core::make_error(core::ErrorCode::VALIDATION_RANGE,
                                    "override of pool " + pool.to_short_hex() +
                                    " invalid under new defaults: " +
                                    merged.error().message());
        }
    }
    defaults_ = p;
    LOG_INFO(core::LogCategory::POLICY, "defaults: " + describe(p));
    return core::make_ok();
}

core::Result<void> PolicyManager::set_override(const pool::PoolId& pool,
                                               const PolicyOverride& ov) {
    WRITE_LOCK(mutex_);
    PolicyOverride merged;
    if (auto it = overrides_.find(pool); it != overrides_.end()) {
        merged = it->second;
    }
    merged.merge(ov);

    const PolicyParams effective = merged.apply_to(defaults_);
    DYNFEE_TRY_VOID(validate_params(effective));

    overrides_.insert_or_assign(pool, std::move(merged));
    LOG_INFO(core::LogCategory::POLICY,
             "pool " + pool.to_short_hex() + ": " + describe(effective));
    return core::make_ok();
}

bool PolicyManager::clear_override(const pool::PoolId& pool) {
    WRITE_LOCK(mutex_);
    const bool erased = overrides_.erase(pool) != 0;
    if (erased) {
        LOG_INFO(core::LogCategory::POLICY,
                 "pool " + pool.to_short_hex() + ": override cleared");
    }
    return erased;
}

bool PolicyManager::has_override(const pool::PoolId& pool) const {
    READ_LOCK(mutex_);
    return overrides_.count(pool) != 0;
}

std::size_t PolicyManager::override_count() const {
    READ_LOCK(mutex_);
    return overrides_.size();
}

core::Result<void> PolicyManager::load_config(const core::Config& config) {
    // Global defaults: every policy key present in the configuration.
    PolicyOverride global;
    for (const char* key : {core::CONF_TARGETCAPSPERDAY, core::CONF_DECAYWINDOW,
                            core::CONF_FREQSCALINGUNIT, core::CONF_MINBASEFEE,
                            core::CONF_MAXBASEFEE, core::CONF_MAXSTEP,
                            core::CONF_UPDATEINTERVAL, core::CONF_SURGEDECAYPERIOD,
                            core::CONF_SURGEMULTIPLIER, core::CONF_MAXABSTICKMOVE,
                            core::CONF_BASEFEEFACTOR, core::CONF_DEFAULTBASEFEE,
                            core::CONF_CAPMODE, core::CONF_BLOCKDURATION}) {
        if (auto value = config.get(key)) {
            DYNFEE_TRY_VOID(set_policy_field(global, key, *value));
        }
    }
    const PolicyParams new_defaults = global.apply_to(PolicyParams{});
    DYNFEE_TRY_VOID(validate_params(new_defaults));

    // Per-pool overrides, grouped by pool.
    std::unordered_map<pool::PoolId, PolicyOverride> pool_overrides;
    for (const auto& text : config.get_list(core::CONF_POOLOVERRIDE)) {
        DYNFEE_TRY_ASSIGN(entry, parse_override_entry(text));
        DYNFEE_TRY_VOID(set_policy_field(pool_overrides[entry.pool],
                                         entry.key, entry.value));
    }
    for (const auto& [pool, ov] : pool_overrides) {
        auto valid = validate_params(ov.apply_to(new_defaults));
        if (!valid.ok()) {
            return core::make_error(core::ErrorCode::VALIDATION_RANGE,
                                    "pool " + pool.to_short_hex() + ": " +
                                    valid.error().message());
        }
    }

    std::size_t count = 0;
    {
        WRITE_LOCK(mutex_);
        defaults_ = new_defaults;
        overrides_ = std::move(pool_overrides);
        count = overrides_.size();
    }
    LOG_INFO(core::LogCategory::CONFIG,
             "policy loaded: " + describe(new_defaults) + ", " +
             std::to_string(count) + " pool override(s)");
    return core::make_ok();
}

} // namespace policy
