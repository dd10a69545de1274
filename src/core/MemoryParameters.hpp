#pragma once
#include <cstddef>
#include <vector>

/*
  Weights w0..w18 of the difficulty/stability/retrievability model plus the
  target retention used to turn stability into an interval.
*/
struct MemoryParameters {
    static constexpr std::size_t kWeightCount = 19;

    std::vector<double> w;
    double target_retention = 0.9;
    int maximum_interval_days = 36500;

    // FSRS-5 defaults
    static MemoryParameters defaults();
};
