#include "config/Config.hpp"
#include "core/ParameterStore.hpp"
#include "utils/Errors.hpp"
#include "TestSupport.hpp"

#include <cassert>
#include <iostream>
#include <limits>

namespace {

bool RejectsConfig(const SchedulerConfig& config) {
    try {
        ParameterStore store(config);
    } catch (const ConfigurationError&) {
        return true;
    }
    return false;
}

void TestDefaultsWhenUnconfigured() {
    ParameterStore store;
    const MemoryParameters& p = store.activeParameters();

    assert(store.usingDefaults());
    assert(p.w.size() == MemoryParameters::kWeightCount);
    assert(testing_support::Near(p.target_retention, 0.9));
    assert(p.maximum_interval_days == 36500);

    ParameterStore fromEmptyConfig{ SchedulerConfig() };
    assert(fromEmptyConfig.usingDefaults());
    assert(fromEmptyConfig.activeParameters().w == p.w);
}

void TestConfiguredWeightsAreUsed() {
    SchedulerConfig config;
    config.weights.assign(MemoryParameters::kWeightCount, 1.0);
    config.target_retention = 0.85;

    ParameterStore store(config);
    assert(!store.usingDefaults());
    assert(store.activeParameters().w[2] == 1.0);
    assert(testing_support::Near(store.activeParameters().target_retention, 0.85));
}

void TestShortWeightVectorIsFatal() {
    SchedulerConfig config;
    config.weights.assign(18, 1.0);
    assert(RejectsConfig(config));

    MemoryParameters p = MemoryParameters::defaults();
    p.w.pop_back();
    bool threw = false;
    try {
        ParameterStore store(p);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);
}

void TestInvalidValuesAreFatal() {
    SchedulerConfig nonFinite;
    nonFinite.weights.assign(MemoryParameters::kWeightCount, 1.0);
    nonFinite.weights[4] = std::numeric_limits<double>::quiet_NaN();
    assert(RejectsConfig(nonFinite));

    SchedulerConfig badRetention;
    badRetention.target_retention = 1.0;
    assert(RejectsConfig(badRetention));
    badRetention.target_retention = 0.0;
    assert(RejectsConfig(badRetention));

    SchedulerConfig badInterval;
    badInterval.maximum_interval_days = 0;
    assert(RejectsConfig(badInterval));
}

} // namespace

int main() {
    testing_support::QuietLogs();

    TestDefaultsWhenUnconfigured();
    TestConfiguredWeightsAreUsed();
    TestShortWeightVectorIsFatal();
    TestInvalidValuesAreFatal();

    std::cout << "recollect_unit_parameter_store: pass\n";
    return 0;
}
