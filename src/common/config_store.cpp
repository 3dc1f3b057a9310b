#include "common/config_store.hpp"

#include <fstream>
#include <limits>

namespace odal::config {

std::optional<json::Value> LoadJsonFile(const std::filesystem::path &path,
                                        const std::string &label,
                                        spdlog::level::level_enum missingLevel) {
    if (!std::filesystem::exists(path)) {
        spdlog::log(missingLevel, "config: {} not found: {}", label, path.string());
        return std::nullopt;
    }

    std::ifstream stream(path);
    if (!stream) {
        spdlog::error("config: Failed to open {}: {}", label, path.string());
        return std::nullopt;
    }

    try {
        json::Value value;
        stream >> value;
        return value;
    } catch (const std::exception &e) {
        spdlog::error("config: Failed to parse {}: {}", label, e.what());
        return std::nullopt;
    }
}

void MergeJsonObjects(json::Value &destination, const json::Value &source) {
    if (!destination.is_object() || !source.is_object()) {
        destination = source;
        return;
    }

    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto &key = it.key();
        const auto &value = it.value();

        if (value.is_object() && destination.contains(key) && destination[key].is_object()) {
            MergeJsonObjects(destination[key], value);
        } else {
            destination[key] = value;
        }
    }
}

const json::Value *ResolveConfigPath(const json::Value &root, const std::string &path) {
    if (path.empty()) {
        return &root;
    }

    const json::Value *current = &root;
    std::size_t position = 0;

    while (position <= path.size()) {
        const std::size_t dot = path.find('.', position);
        const bool lastSegment = (dot == std::string::npos);
        const std::string segment = path.substr(position, lastSegment ? std::string::npos : dot - position);
        if (segment.empty() || !current->is_object()) {
            return nullptr;
        }

        auto it = current->find(segment);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);

        if (lastSegment) {
            break;
        }
        position = dot + 1;
    }

    return current;
}

std::optional<uint16_t> ConfigValueUInt16(const json::Value &root, const std::string &path) {
    const auto *value = ResolveConfigPath(root, path);
    if (!value) {
        return std::nullopt;
    }

    auto clampToUint16 = [](long long number) -> std::optional<uint16_t> {
        if (number < 0 || number > std::numeric_limits<uint16_t>::max()) {
            return std::nullopt;
        }
        return static_cast<uint16_t>(number);
    };

    if (value->is_number_unsigned()) {
        const auto number = value->get<unsigned long long>();
        if (number > std::numeric_limits<uint16_t>::max()) {
            return std::nullopt;
        }
        return static_cast<uint16_t>(number);
    }

    if (value->is_number_integer()) {
        return clampToUint16(value->get<long long>());
    }

    if (value->is_string()) {
        try {
            return clampToUint16(std::stoll(value->get<std::string>()));
        } catch (const std::exception &) {
            return std::nullopt;
        }
    }

    return std::nullopt;
}

std::optional<std::string> ConfigValueString(const json::Value &root, const std::string &path) {
    const auto *value = ResolveConfigPath(root, path);
    if (!value || !value->is_string()) {
        return std::nullopt;
    }
    return value->get<std::string>();
}

} // namespace odal::config
