#pragma once

#include "protocol/odalpapi.hpp"

#include <set>
#include <string>
#include <utility>

namespace odal {

class IwadInventory {
public:
    virtual ~IwadInventory() = default;
    // Lowercase game ids ("doom2", "plutonia", ...) the user can launch.
    virtual std::set<std::string> availableGameIds() const = 0;
};

class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void notify(const std::string &title, const std::string &body, bool flashRequested) = 0;
};

class ConnectSink {
public:
    virtual ~ConnectSink() = default;
    virtual void connect(const ServerInfo &server) = 0;
};

class StaticIwadInventory : public IwadInventory {
public:
    StaticIwadInventory() = default;
    explicit StaticIwadInventory(std::set<std::string> gameIds) : gameIds(std::move(gameIds)) {}

    std::set<std::string> availableGameIds() const override {
        return gameIds;
    }

private:
    std::set<std::string> gameIds;
};

} // namespace odal
