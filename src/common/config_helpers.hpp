#pragma once

#include "common/json.hpp"

#include <initializer_list>
#include <string>

#include <cstdint>

namespace odal::config {

bool ReadBoolConfig(const json::Value &root, std::initializer_list<const char*> paths, bool defaultValue);
uint16_t ReadUInt16Config(const json::Value &root, std::initializer_list<const char*> paths, uint16_t defaultValue);
int ReadIntConfig(const json::Value &root, std::initializer_list<const char*> paths, int defaultValue, int minValue = 0);
std::string ReadStringConfig(const json::Value &root, const char *path, const std::string &defaultValue);

} // namespace odal::config
