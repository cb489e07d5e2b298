/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading tracker configuration (settings.json).
 *
 * Provides a unified way to access the store location, micro-session policy and
 * classification overrides without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <filesystem>
#include <string>

#include "domain/services/Classification.hpp"
#include "domain/services/MicroSessionPolicy.hpp"

namespace taskwalker::infrastructure {

/**
 * @struct TrackerSettings
 * @brief Effective configuration. Every field has a usable default.
 */
struct TrackerSettings {
    std::filesystem::path dataLocation;
    domain::MicroSessionPolicy policy;
    domain::ClassificationTable classification = domain::ClassificationTable::Defaults();
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from @p configPath.
     *
     * A missing file yields the defaults. A malformed file or an invalid key is
     * reported on stderr and the affected values fall back to their defaults.
     */
    static TrackerSettings Load(const std::filesystem::path& configPath);

    /** @brief Load() on PathUtils::GetSettingsPath(). */
    static TrackerSettings LoadDefault();
};

} // namespace taskwalker::infrastructure
