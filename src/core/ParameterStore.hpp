#pragma once
#include "MemoryParameters.hpp"

struct SchedulerConfig;

/*
  Holds the active memory-model parameters for a scheduling run.

  Validation happens once, here: a configured weight vector with fewer than
  19 entries or a retention outside (0,1) throws ConfigurationError from the
  constructor. With no configured weights the built-in defaults are used.
*/
class ParameterStore {
public:
    ParameterStore();
    explicit ParameterStore(const SchedulerConfig& config);
    explicit ParameterStore(const MemoryParameters& params);

    const MemoryParameters& activeParameters() const { return params; }
    bool usingDefaults() const { return defaults; }

private:
    MemoryParameters params;
    bool defaults;

    static void validate(const MemoryParameters& p);
};
