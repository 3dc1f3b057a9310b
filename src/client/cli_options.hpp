#pragma once

#include <string>
#include <vector>

namespace odal {

struct CliOptions {
    std::string master;
    bool masterRequested = false;
    std::string server;
    std::string ping;
    std::vector<std::string> iwads;
    std::string configPath;
    std::string userConfigPath;
    bool lan = false;
    bool quickMatch = false;
    bool monitor = false;
    bool watch = false;
    bool verbose = false;
    std::string logLevel;
    bool logLevelExplicit = false;
    bool timestampLogging = false;
};

CliOptions ParseCliOptions(int argc, char *argv[]);

} // namespace odal
