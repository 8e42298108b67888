// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// feesim -- drive one pool through a simulated market and print its fees
//
// Usage:
//   feesim [options]
//
// Options:
//   -scenario=calm|volatile   price walk (default: calm)
//   -steps=N                  number of swaps (default: 200)
//   -interval=S               seconds between swaps (default: 60)
//   -seed=N                   walk seed (default: 1)
//   -starttick=T              initial tick (default: 0)
//   -conf=FILE                read key=value settings from FILE
//   -<policy key>=VALUE       any policy default, e.g. -maxstep=20000
//   -pooloverride=ID:KEY=VAL  per-pool override (repeatable)
//   -loglevel=LEVEL -logcategories=LIST -logfile=FILE
//
// Exit status: 0 on success, 1 on a configuration error, 2 when the
// simulation itself fails.
// ---------------------------------------------------------------------------

#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"
#include "core/time.h"
#include "oracle/observations.h"
#include "policy/policy_manager.h"
#include "policy/policy_params.h"
#include "sim/logging_init.h"
#include "sim/scenario.h"

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <string>

namespace {

constexpr int EXIT_CONFIG_ERROR = 1;
constexpr int EXIT_RUN_ERROR    = 2;

void print_usage() {
    std::cout << "Usage: feesim [options]\n\n"
              << "Options:\n"
              << "  -scenario=calm|volatile   price walk (default: calm)\n"
              << "  -steps=N                  number of swaps (default: 200)\n"
              << "  -interval=S               seconds between swaps (default: 60)\n"
              << "  -seed=N                   walk seed (default: 1)\n"
              << "  -starttick=T              initial tick (default: 0)\n"
              << "  -conf=FILE                read key=value settings from FILE\n"
              << "  -<policy key>=VALUE       policy default, e.g. -maxstep=20000\n"
              << "  -pooloverride=ID:KEY=VAL  per-pool override (repeatable)\n"
              << "  -loglevel=LEVEL           trace, debug, info, warn, error, off\n"
              << "  -logcategories=LIST       e.g. fee,oracle\n"
              << "  -logfile=FILE             also log to FILE\n";
}

int config_error(const core::Error& err) {
    std::cerr << "feesim: " << err.format() << "\n";
    return EXIT_CONFIG_ERROR;
}

core::Result<sim::ScenarioConfig> scenario_from_config(const core::Config& config) {
    sim::ScenarioConfig cfg;

    const std::string name = config.get_or(core::CONF_SCENARIO, "calm");
    auto market = sim::parse_market(name);
    if (!market) {
        return core::make_error(core::ErrorCode::CONFIG_PARSE,
                                "unknown scenario '" + name + "'");
    }
    cfg.market = *market;

    DYNFEE_TRY_ASSIGN(steps, config.get_uint_checked(core::CONF_STEPS, cfg.steps));
    DYNFEE_TRY_ASSIGN(interval,
                      config.get_uint_checked(core::CONF_INTERVAL, cfg.interval_seconds));
    DYNFEE_TRY_ASSIGN(seed, config.get_uint_checked(core::CONF_SEED, cfg.seed));
    DYNFEE_TRY_ASSIGN(start_tick,
                      config.get_int_checked(core::CONF_STARTTICK, cfg.start_tick));
    DYNFEE_TRY_ASSIGN(capacity, config.get_uint_checked(core::CONF_SAMPLECAPACITY,
                                                        cfg.sample_capacity));

    if (steps > 1'000'000) {
        return core::make_error(core::ErrorCode::CONFIG_PARSE,
                                "steps must be at most 1000000");
    }
    if (interval == 0 || interval > 86'400) {
        return core::make_error(core::ErrorCode::CONFIG_PARSE,
                                "interval must be in [1, 86400]");
    }
    if (start_tick < oracle::MIN_TICK || start_tick > oracle::MAX_TICK) {
        return core::make_error(core::ErrorCode::CONFIG_PARSE,
                                "starttick outside the tick range");
    }
    if (capacity == 0 || capacity > oracle::MAX_CARDINALITY) {
        return core::make_error(core::ErrorCode::CONFIG_PARSE,
                                "samplecapacity must be in [1, 65535]");
    }

    cfg.steps = static_cast<uint32_t>(steps);
    cfg.interval_seconds = static_cast<uint32_t>(interval);
    cfg.seed = seed;
    cfg.start_tick = static_cast<int32_t>(start_tick);
    cfg.sample_capacity = static_cast<uint16_t>(capacity);
    DYNFEE_TRY_VOID(sim::validate_scenario(cfg));
    return cfg;
}

void print_trace(const sim::ScenarioResult& result) {
    std::printf("pool %s  initial base fee %u ppm\n",
                result.pool.to_hex().c_str(), result.initial_base_fee_ppm);
    std::printf("%6s %12s %8s %8s %6s %9s %9s %9s\n", "step", "time", "tick",
                "oracle", "cap", "base", "surge", "total");

    bool in_cap = false;
    for (const auto& p : result.trace) {
        if (p.in_cap && !in_cap) {
            std::printf("------ CAP START at %s\n",
                        core::format_iso8601(static_cast<int64_t>(p.timestamp)).c_str());
        } else if (!p.in_cap && in_cap) {
            std::printf("------ CAP END at %s\n",
                        core::format_iso8601(static_cast<int64_t>(p.timestamp)).c_str());
        }
        in_cap = p.in_cap;

        std::printf("%6u %12llu %8d %8d %6s %9u %9llu %9llu\n", p.step,
                    static_cast<unsigned long long>(p.timestamp), p.tick,
                    p.recorded_tick, p.capped ? "yes" : "-", p.base_fee_ppm,
                    static_cast<unsigned long long>(p.surge_fee_ppm),
                    static_cast<unsigned long long>(p.total_fee_ppm));
    }

    std::printf("capped steps %zu, cap events started %zu, ended %zu\n",
                result.capped_steps, result.cap_starts, result.cap_ends);
}

} // namespace

int main(int argc, char* argv[]) {
    core::Config config;
    if (auto res = config.parse_args(argc, argv); !res.ok()) {
        print_usage();
        return config_error(res.error());
    }
    if (config.get_bool(core::CONF_HELP)) {
        print_usage();
        return 0;
    }
    if (auto conf_file = config.get(core::CONF_CONF)) {
        if (auto res = config.parse_file(*conf_file); !res.ok()) {
            return config_error(res.error());
        }
    }

    if (auto res = sim::init_logging(config); !res.ok()) {
        return config_error(res.error());
    }

    policy::PolicyManager policy;
    if (auto res = policy.load_config(config); !res.ok()) {
        return config_error(res.error());
    }

    auto scenario = scenario_from_config(config);
    if (!scenario.ok()) return config_error(scenario.error());

    LOG_INFO(core::LogCategory::CONFIG,
             "policy defaults: " + policy::describe(policy.defaults()));

    core::StopWatch watch;
    auto result = sim::run_scenario(scenario.value(), policy);
    if (!result.ok()) {
        LOG_ERROR(core::LogCategory::SIM, result.error().format());
        std::cerr << "feesim: " << result.error().format() << "\n";
        return EXIT_RUN_ERROR;
    }

    print_trace(result.value());
    LOG_INFO(core::LogCategory::SIM,
             "finished in " + std::to_string(watch.elapsed_ms()) + " ms");
    core::Logger::instance().flush();
    return 0;
}
