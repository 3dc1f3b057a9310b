#include "common/config_helpers.hpp"

#include "common/config_store.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace odal::config {

bool ReadBoolConfig(const json::Value &root, std::initializer_list<const char*> paths, bool defaultValue) {
    for (const char* path : paths) {
        if (const auto* value = ResolveConfigPath(root, path)) {
            if (value->is_boolean()) {
                return value->get<bool>();
            }
            if (value->is_number_integer()) {
                return value->get<long long>() != 0;
            }
            if (value->is_number_float()) {
                return value->get<double>() != 0.0;
            }
            if (value->is_string()) {
                std::string text = value->get<std::string>();
                std::transform(text.begin(), text.end(), text.begin(),
                               [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
                if (text == "true" || text == "1" || text == "yes" || text == "on") {
                    return true;
                }
                if (text == "false" || text == "0" || text == "no" || text == "off") {
                    return false;
                }
            }
            spdlog::warn("Config '{}' cannot be interpreted as boolean", path);
        }
    }
    return defaultValue;
}

uint16_t ReadUInt16Config(const json::Value &root, std::initializer_list<const char*> paths, uint16_t defaultValue) {
    for (const char* path : paths) {
        if (auto value = ConfigValueUInt16(root, path)) {
            if (*value > 0) {
                return *value;
            }
            spdlog::warn("Config '{}' must be positive; falling back", path);
            return defaultValue;
        }

        if (ResolveConfigPath(root, path)) {
            spdlog::warn("Config '{}' is not a valid uint16", path);
            return defaultValue;
        }
    }
    return defaultValue;
}

int ReadIntConfig(const json::Value &root, std::initializer_list<const char*> paths, int defaultValue, int minValue) {
    for (const char* path : paths) {
        const auto* value = ResolveConfigPath(root, path);
        if (!value) {
            continue;
        }

        long long number = 0;
        if (value->is_number_integer()) {
            number = value->get<long long>();
        } else if (value->is_number_float()) {
            number = std::llround(value->get<double>());
        } else if (value->is_string()) {
            try {
                number = std::stoll(value->get<std::string>());
            } catch (const std::exception &) {
                spdlog::warn("Config '{}' string value is not a valid integer", path);
                return defaultValue;
            }
        } else {
            spdlog::warn("Config '{}' cannot be interpreted as integer", path);
            return defaultValue;
        }

        if (number < minValue || number > std::numeric_limits<int>::max()) {
            spdlog::warn("Config '{}' is out of range; falling back", path);
            return defaultValue;
        }
        return static_cast<int>(number);
    }
    return defaultValue;
}

std::string ReadStringConfig(const json::Value &root, const char *path, const std::string &defaultValue) {
    if (auto value = ConfigValueString(root, path)) {
        return *value;
    }
    return defaultValue;
}

} // namespace odal::config
