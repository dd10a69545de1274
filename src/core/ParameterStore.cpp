#include "ParameterStore.hpp"
#include "../config/Config.hpp"
#include "../utils/Errors.hpp"
#include <cmath>
#include <string>
#include <spdlog/spdlog.h>

MemoryParameters MemoryParameters::defaults() {
    MemoryParameters p;
    p.w = {
        0.5701, 1.4436, 4.1386, 10.9355, 5.1443,
        1.2006, 0.8627, 0.0362, 1.629, 0.1342,
        1.0166, 2.1174, 0.0839, 0.3204, 1.4676,
        0.219, 2.8237, 0.2188, 0.9859
    };
    p.target_retention = 0.9;
    p.maximum_interval_days = 36500;
    return p;
}

ParameterStore::ParameterStore()
    : params(MemoryParameters::defaults()), defaults(true)
{
    spdlog::debug("ParameterStore using built-in defaults");
}

ParameterStore::ParameterStore(const SchedulerConfig& config)
    : params(MemoryParameters::defaults()), defaults(config.weights.empty())
{
    if (!config.weights.empty())
        params.w = config.weights;
    params.target_retention = config.target_retention;
    params.maximum_interval_days = config.maximum_interval_days;

    validate(params);
    spdlog::info("ParameterStore ready: {} weights ({}), target_retention={:.3f}",
        params.w.size(), defaults ? "defaults" : "configured", params.target_retention);
}

ParameterStore::ParameterStore(const MemoryParameters& p)
    : params(p), defaults(false)
{
    validate(params);
}

void ParameterStore::validate(const MemoryParameters& p) {
    if (p.w.size() < MemoryParameters::kWeightCount) {
        spdlog::error("Parameter vector has {} weights, need {}", p.w.size(), MemoryParameters::kWeightCount);
        throw ConfigurationError("Memory parameter vector needs " + std::to_string(MemoryParameters::kWeightCount) +
            " weights, got " + std::to_string(p.w.size()));
    }
    for (std::size_t i = 0; i < p.w.size(); ++i) {
        if (!std::isfinite(p.w[i]))
            throw ConfigurationError("Memory parameter w" + std::to_string(i) + " is not finite");
    }
    if (!(p.target_retention > 0.0 && p.target_retention < 1.0))
        throw ConfigurationError("Target retention must be in (0,1)");
    if (p.maximum_interval_days < 1)
        throw ConfigurationError("Maximum interval must be at least one day");
}
