/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "infrastructure/PathUtils.hpp"

namespace taskwalker::infrastructure {

namespace {

using namespace taskwalker::domain;

void ApplyPolicy(const nlohmann::json& j, MicroSessionPolicy& policy) {
    if (j.contains("micro_session_seconds")) {
        auto seconds = j["micro_session_seconds"].get<std::int64_t>();
        if (seconds < 0) {
            std::cerr << "[ConfigLoader] micro_session_seconds must not be negative; keeping "
                      << policy.thresholdSecs << std::endl;
        } else {
            policy.thresholdSecs = seconds;
        }
    }
    if (j.contains("micro_merge")) policy.mergeEnabled = j["micro_merge"].get<bool>();
    if (j.contains("micro_purge")) policy.purgeEnabled = j["micro_purge"].get<bool>();
    if (j.contains("purge_trigger")) {
        auto name = j["purge_trigger"].get<std::string>();
        if (auto trigger = PurgeTriggerFromString(name)) {
            policy.purgeTrigger = *trigger;
        } else {
            std::cerr << "[ConfigLoader] Unknown purge_trigger '" << name << "'; using "
                      << PurgeTriggerToString(policy.purgeTrigger) << std::endl;
        }
    }
}

void ApplyClassificationRow(const nlohmann::json& row, ClassificationTable& table) {
    auto tier = PrecedenceTierFromString(row.value("tier", ""));
    auto status = StatusFromString(row.value("status", ""));
    if (!tier || !status) {
        std::cerr << "[ConfigLoader] Skipping classification row with unknown tier or status: "
                  << row.dump() << std::endl;
        return;
    }

    ClassificationKey key{*tier, row.value("queued", false), row.value("history", false)};
    Classification current = table.lookup(key);

    Classification entry;
    entry.status = *status;
    entry.label = row.value("label", StatusToString(*status));
    entry.sortOrder = row.value("sort", current.sortOrder);
    entry.color = row.value("color", current.color);
    table.set(key, entry);
}

} // namespace

TrackerSettings ConfigLoader::Load(const std::filesystem::path& configPath) {
    TrackerSettings settings;
    settings.dataLocation = PathUtils::GetStoreDir();

    if (!std::filesystem::exists(configPath)) {
        return settings;
    }

    nlohmann::json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
        return settings;
    }

    try {
        if (j.contains("data_location")) {
            settings.dataLocation = j["data_location"].get<std::string>();
        }
        ApplyPolicy(j, settings.policy);
        if (j.contains("classification")) {
            for (const auto& row : j["classification"]) {
                ApplyClassificationRow(row, settings.classification);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Invalid value in " << configPath << ": " << e.what() << std::endl;
        return TrackerSettings{PathUtils::GetStoreDir(), domain::MicroSessionPolicy{}, domain::ClassificationTable::Defaults()};
    }

    return settings;
}

TrackerSettings ConfigLoader::LoadDefault() {
    return Load(PathUtils::GetSettingsPath());
}

} // namespace taskwalker::infrastructure
