#pragma once
#include <string>
#include <vector>

// Memory-model settings. An empty weight list means "use built-in defaults".
struct SchedulerConfig {
    std::vector<double> weights;
    double target_retention = 0.9;
    int maximum_interval_days = 36500;
};

// Defaults applied to sessions when the caller does not override them.
struct SessionDefaults {
    int max_reviews = 50;
    int max_new_cards = 20;
    int weak_lapse_threshold = 2;      // WeakFocus picks lapse_count > threshold
    long long fast_answer_ms = 3000;   // correct and faster -> EASY
    long long slow_answer_ms = 8000;   // correct and faster -> GOOD, else HARD
    int seconds_per_question = 30;
};

struct StorageConfig {
    std::string deck_path = "deck.dat";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;                  // empty -> stdout
    std::string pattern;               // empty -> default pattern
};

struct AppConfig {
    SchedulerConfig scheduler;
    SessionDefaults session;
    StorageConfig storage;
    LoggingConfig logging;
};
