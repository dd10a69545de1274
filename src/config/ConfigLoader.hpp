#pragma once
#include <string>
#include "Config.hpp"

/*
  Loads AppConfig from YAML.

  Every section is optional; missing keys keep their defaults. Unknown keys,
  wrong scalar types and out-of-range values raise ConfigurationError.
*/
class ConfigLoader {
public:
    static AppConfig loadFromYaml(const std::string& path);
    static AppConfig loadFromString(const std::string& yaml);
};
