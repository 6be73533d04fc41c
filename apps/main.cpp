#include "ecp/catalog/AppCatalogFetcher.hpp"
#include "ecp/control/DeviceControlClient.hpp"
#include "ecp/discovery/DiscoveryClient.hpp"
#include "ecp/log/Log.hpp"

#include <iostream>
#include <string>
#include <string_view>

using namespace ecp;

// Usage:
//   ecp_demo                 list devices and the first device's apps
//   ecp_demo VolumeUp        ...then send a key to the first device
//   ecp_demo text:hello      ...then type "hello"
//   ecp_demo launch:12       ...then launch app 12
int main(int argc, char** argv) {
    discovery::DiscoveryClient discovery;
    auto found = discovery.discover();
    if (!found) {
        std::cerr << "Discovery failed: " << found.error().message() << "\n";
        return 1;
    }

    const auto& devices = found.value();
    if (devices.empty()) {
        std::cout << "No devices found.\n";
        return 0;
    }

    std::cout << "Found " << devices.size() << " device(s):\n";
    for (const auto& device : devices) {
        std::cout << "  " << device.toString() << "\n";
    }

    const DeviceAddress& target = devices.front();

    catalog::AppCatalogFetcher fetcher;
    auto apps = fetcher.fetchApps(target);
    std::cout << "Apps on " << target.toString() << ":\n";
    for (const auto& app : apps.value()) {
        std::cout << "  " << app.id << "  " << app.name << "\n";
    }

    if (argc < 2) {
        return 0;
    }

    control::DeviceControlClient remote;
    const std::string_view action = argv[1];

    if (action.rfind("text:", 0) == 0) {
        auto sent = remote.sendText(target, action.substr(5));
        std::cout << "Sent text (" << sent.value().attempted - sent.value().failed
                  << "/" << sent.value().attempted << " characters delivered)\n";
    } else if (action.rfind("launch:", 0) == 0) {
        auto launched = remote.launchApp(target, action.substr(7));
        if (!launched.isOk()) {
            std::cerr << "Launch request not delivered: " << launched.error().message() << "\n";
            return 1;
        }
        std::cout << "Launching app " << action.substr(7) << "\n";
    } else if (auto command = control::commandFromToken(action)) {
        auto sent = remote.sendCommand(target, *command);
        if (!sent.isOk()) {
            std::cerr << "Command not delivered: " << sent.error().message() << "\n";
            return 1;
        }
        std::cout << "Sent command: " << control::toToken(*command) << "\n";
    } else {
        std::cerr << "Unknown command '" << action << "'. Known commands:";
        for (auto command : control::allCommands()) {
            std::cerr << ' ' << control::toToken(command);
        }
        std::cerr << "\n";
        return 2;
    }

    return 0;
}
