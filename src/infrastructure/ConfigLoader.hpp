/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Every key is optional. Keys that are missing, mistyped or out of range
 * keep their built-in default.
 */

#pragma once

#include <string>
#include "domain/AppConfig.hpp"

namespace finnews::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads the settings file at the given path.
     * @param path Settings file. A missing file yields the defaults silently.
     */
    static domain::AppConfig Load(const std::string& path);

    /** @brief Applies the keys of an already parsed JSON document text. */
    static domain::AppConfig FromJsonText(const std::string& text);
};

} // namespace finnews::infrastructure
