#include "ConfigLoader.hpp"
#include "../utils/Errors.hpp"
#include <set>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

void rejectUnknownKeys(const YAML::Node& node, const std::string& section, const std::set<std::string>& allowed) {
    if (!node.IsMap())
        throw ConfigurationError("Section '" + section + "' must be a mapping");

    for (auto it : node) {
        const std::string key = it.first.Scalar();
        if (allowed.count(key) == 0)
            throw ConfigurationError("Unknown configuration key '" + section + "." + key + "'");
    }
}

template <typename T>
T readScalar(const YAML::Node& node, const std::string& name) {
    try {
        return node.as<T>();
    }
    catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid value for '" + name + "': " + e.what());
    }
}

void parseScheduler(const YAML::Node& node, SchedulerConfig& out) {
    rejectUnknownKeys(node, "scheduler", { "weights", "target_retention", "maximum_interval_days" });

    if (node["weights"]) {
        const YAML::Node& w = node["weights"];
        if (!w.IsSequence())
            throw ConfigurationError("'scheduler.weights' must be a list of numbers");
        out.weights.clear();
        for (std::size_t i = 0; i < w.size(); ++i)
            out.weights.push_back(readScalar<double>(w[i], "scheduler.weights[" + std::to_string(i) + "]"));
    }
    if (node["target_retention"])
        out.target_retention = readScalar<double>(node["target_retention"], "scheduler.target_retention");
    if (node["maximum_interval_days"])
        out.maximum_interval_days = readScalar<int>(node["maximum_interval_days"], "scheduler.maximum_interval_days");

    if (!(out.target_retention > 0.0 && out.target_retention < 1.0))
        throw ConfigurationError("'scheduler.target_retention' must be in (0,1)");
    if (out.maximum_interval_days < 1)
        throw ConfigurationError("'scheduler.maximum_interval_days' must be >= 1");
}

void parseSession(const YAML::Node& node, SessionDefaults& out) {
    rejectUnknownKeys(node, "session", { "max_reviews", "max_new_cards", "weak_lapse_threshold",
                                         "fast_answer_ms", "slow_answer_ms", "seconds_per_question" });

    if (node["max_reviews"]) out.max_reviews = readScalar<int>(node["max_reviews"], "session.max_reviews");
    if (node["max_new_cards"]) out.max_new_cards = readScalar<int>(node["max_new_cards"], "session.max_new_cards");
    if (node["weak_lapse_threshold"])
        out.weak_lapse_threshold = readScalar<int>(node["weak_lapse_threshold"], "session.weak_lapse_threshold");
    if (node["fast_answer_ms"]) out.fast_answer_ms = readScalar<long long>(node["fast_answer_ms"], "session.fast_answer_ms");
    if (node["slow_answer_ms"]) out.slow_answer_ms = readScalar<long long>(node["slow_answer_ms"], "session.slow_answer_ms");
    if (node["seconds_per_question"])
        out.seconds_per_question = readScalar<int>(node["seconds_per_question"], "session.seconds_per_question");

    if (out.max_reviews < 0 || out.max_new_cards < 0)
        throw ConfigurationError("Session limits cannot be negative");
    if (out.fast_answer_ms < 0 || out.slow_answer_ms < out.fast_answer_ms)
        throw ConfigurationError("'session.slow_answer_ms' must be >= 'session.fast_answer_ms' >= 0");
    if (out.seconds_per_question < 1)
        throw ConfigurationError("'session.seconds_per_question' must be >= 1");
}

void parseStorage(const YAML::Node& node, StorageConfig& out) {
    rejectUnknownKeys(node, "storage", { "deck_path" });
    if (node["deck_path"]) out.deck_path = readScalar<std::string>(node["deck_path"], "storage.deck_path");
}

void parseLogging(const YAML::Node& node, LoggingConfig& out) {
    rejectUnknownKeys(node, "logging", { "level", "file", "pattern" });
    if (node["level"]) out.level = readScalar<std::string>(node["level"], "logging.level");
    if (node["file"]) out.file = readScalar<std::string>(node["file"], "logging.file");
    if (node["pattern"]) out.pattern = readScalar<std::string>(node["pattern"], "logging.pattern");
}

AppConfig parseRoot(const YAML::Node& root) {
    AppConfig config;
    if (!root || root.IsNull())
        return config;

    rejectUnknownKeys(root, "<root>", { "scheduler", "session", "storage", "logging" });

    if (root["scheduler"]) parseScheduler(root["scheduler"], config.scheduler);
    if (root["session"]) parseSession(root["session"], config.session);
    if (root["storage"]) parseStorage(root["storage"], config.storage);
    if (root["logging"]) parseLogging(root["logging"], config.logging);
    return config;
}

} // namespace

AppConfig ConfigLoader::loadFromYaml(const std::string& path) {
    spdlog::info("Loading configuration from '{}'", path);
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    }
    catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to load YAML config '" + path + "': " + e.what());
    }
    return parseRoot(root);
}

AppConfig ConfigLoader::loadFromString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    }
    catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Failed to parse YAML config: ") + e.what());
    }
    return parseRoot(root);
}
