#pragma once

#include "common/json.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <optional>
#include <string>

namespace odal::config {

std::optional<json::Value> LoadJsonFile(const std::filesystem::path &path,
                                        const std::string &label,
                                        spdlog::level::level_enum missingLevel);

// Objects merge key by key; anything else in source replaces destination.
void MergeJsonObjects(json::Value &destination, const json::Value &source);

// Dotted lookup ("network.pingDivisor.batch"); nullptr when any segment is missing.
const json::Value *ResolveConfigPath(const json::Value &root, const std::string &path);

std::optional<uint16_t> ConfigValueUInt16(const json::Value &root, const std::string &path);
std::optional<std::string> ConfigValueString(const json::Value &root, const std::string &path);

} // namespace odal::config
