#include "odal/odal.h"

#include <iostream>

namespace odal::examples {

class PrintingNotifier final : public NotificationSink {
public:
    void notify(const std::string &title, const std::string &body, bool) override {
        std::cout << title << ": " << body << std::endl;
    }
};

} // namespace odal::examples

int main() {
    odal::DiscoveryClient client;
    odal::ServerRegistry registry;

    std::vector<odal::ServerAddress> addresses;
    try {
        addresses = client.queryMasterServer({odal::DEFAULT_MASTER_HOST, odal::DEFAULT_MASTER_PORT}).get();
    } catch (const odal::QueryError &e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    odal::FanOutScheduler scheduler(client);
    scheduler.queryAll(addresses, [&registry](const std::vector<odal::ServerInfo> &servers,
                                              odal::FanOutScheduler::BatchPhase) {
        registry.setServers(servers);
    }).wait();

    odal::StaticIwadInventory iwads({"doom2", "freedoom2"});
    odal::MatchmakingEngine engine(registry, iwads);
    odal::examples::PrintingNotifier notifier;
    engine.setNotificationSink(&notifier);

    const auto result = engine.quickMatch();
    if (result.server) {
        std::cout << "Best server: " << result.server->displayName() << " (" << result.server->address.key() << ")"
                  << std::endl;
    } else {
        std::cout << result.reason << std::endl;
    }

    return 0;
}
