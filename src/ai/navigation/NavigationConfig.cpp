/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/navigation/NavigationConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <format>

namespace Wayfinder {

namespace {

// Absent keys keep the current value; present keys must have the right type
bool readFloat(const JsonValue& obj, const char* key, float& out) {
    const JsonValue* value = obj.find(key);
    if (!value) {
        return true;
    }
    auto num = value->tryAsFloat();
    if (!num) {
        SETTINGS_ERROR(std::format("'{}' must be a finite number", key));
        return false;
    }
    out = *num;
    return true;
}

bool readInt(const JsonValue& obj, const char* key, int& out) {
    const JsonValue* value = obj.find(key);
    if (!value) {
        return true;
    }
    auto num = value->tryAsInt();
    if (!num) {
        SETTINGS_ERROR(std::format("'{}' must be an integer", key));
        return false;
    }
    out = *num;
    return true;
}

bool readBool(const JsonValue& obj, const char* key, bool& out) {
    const JsonValue* value = obj.find(key);
    if (!value) {
        return true;
    }
    auto flag = value->tryAsBool();
    if (!flag) {
        SETTINGS_ERROR(std::format("'{}' must be a boolean", key));
        return false;
    }
    out = *flag;
    return true;
}

bool applyJson(const JsonValue& root, NavigationConfig& config) {
    if (!root.isObject()) {
        SETTINGS_ERROR("Navigation config root is not a JSON object");
        return false;
    }

    const JsonValue* nested = root.find("navigation");
    const JsonValue& obj = nested ? *nested : root;
    if (!obj.isObject()) {
        SETTINGS_ERROR("'navigation' is not a JSON object");
        return false;
    }

    NavigationConfig updated = config;
    bool ok = readFloat(obj, "cellSize", updated.cellSize) &&
              readInt(obj, "maxGridCells", updated.maxGridCells) &&
              readFloat(obj, "maxSlopeDegrees", updated.maxSlopeDegrees) &&
              readFloat(obj, "stepHeight", updated.stepHeight) &&
              readFloat(obj, "padding", updated.padding) &&
              readFloat(obj, "sampleHeight", updated.sampleHeight) &&
              readInt(obj, "nearestCellRadius", updated.nearestCellRadius) &&
              readFloat(obj, "smoothingCosThreshold", updated.smoothingCosThreshold) &&
              readBool(obj, "smoothByDefault", updated.smoothByDefault);
    if (!ok) {
        return false;
    }

    // null clears the override
    if (const JsonValue* linkCost = obj.find("defaultLinkCost")) {
        if (linkCost->isNull()) {
            updated.defaultLinkCost.reset();
        } else if (auto cost = linkCost->tryAsFloat()) {
            updated.defaultLinkCost = *cost;
        } else {
            SETTINGS_ERROR("'defaultLinkCost' must be a number or null");
            return false;
        }
    }

    if (auto error = updated.validate()) {
        SETTINGS_ERROR("Rejected navigation config: " + *error);
        return false;
    }

    config = updated;
    return true;
}

} // namespace

std::optional<std::string> NavigationConfig::validate() const {
    if (!(cellSize > 0.0f) || !std::isfinite(cellSize)) {
        return std::format("cellSize must be positive: {}", cellSize);
    }
    if (maxGridCells < 1 || maxGridCells > MAX_CELLS_PER_AXIS) {
        return std::format("maxGridCells must be within [1, {}]: {}", MAX_CELLS_PER_AXIS, maxGridCells);
    }
    if (!(maxSlopeDegrees >= 0.0f && maxSlopeDegrees <= 90.0f)) {
        return std::format("maxSlopeDegrees must be within [0, 90]: {}", maxSlopeDegrees);
    }
    if (!(stepHeight >= 0.0f)) {
        return std::format("stepHeight must not be negative: {}", stepHeight);
    }
    if (!(padding >= 0.0f)) {
        return std::format("padding must not be negative: {}", padding);
    }
    if (!(sampleHeight >= 0.0f)) {
        return std::format("sampleHeight must not be negative: {}", sampleHeight);
    }
    if (nearestCellRadius < 1 || nearestCellRadius > MAX_CELLS_PER_AXIS) {
        return std::format("nearestCellRadius must be within [1, {}]: {}", MAX_CELLS_PER_AXIS, nearestCellRadius);
    }
    if (!(smoothingCosThreshold > 0.0f && smoothingCosThreshold <= 1.0f)) {
        return std::format("smoothingCosThreshold must be within (0, 1]: {}", smoothingCosThreshold);
    }
    if (defaultLinkCost && !(*defaultLinkCost > 0.0f && std::isfinite(*defaultLinkCost))) {
        return std::format("defaultLinkCost must be positive: {}", *defaultLinkCost);
    }
    return std::nullopt;
}

bool loadNavigationConfig(const std::string& path, NavigationConfig& config) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        SETTINGS_ERROR("Failed to load navigation config from file: " + path + " - " + reader.getLastError());
        return false;
    }

    if (!applyJson(reader.getRoot(), config)) {
        return false;
    }

    SETTINGS_INFO("Loaded navigation config from file: " + path);
    return true;
}

bool parseNavigationConfig(const std::string& json, NavigationConfig& config) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR("Failed to parse navigation config - " + reader.getLastError());
        return false;
    }
    return applyJson(reader.getRoot(), config);
}

} // namespace Wayfinder
