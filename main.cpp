#include <cstring>
#include <exception>
#include <iostream>
#include <string>

#include "app/NewsApp.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace {

void PrintUsage(const char* programName) {
    std::cout << "Usage:\n";
    std::cout << "  " << programName << " [--config <settings.json>]\n";
    std::cout << "      --config: optional JSON settings file (default: settings.json if present)\n";
}

} // namespace

int main(int argc, char* argv[]) {
    // ConsoleInput relies on std::cin keeping its own buffer
    std::ios::sync_with_stdio(false);

    std::string configPath = "settings.json";

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            configPath = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            PrintUsage(argv[0]);
            return 0;
        } else {
            PrintUsage(argv[0]);
            return 1;
        }
    }

    try {
        finnews::app::NewsApp app(finnews::infrastructure::ConfigLoader::Load(configPath));
        return app.Run();
    } catch (const std::exception& e) {
        std::cerr << "[Main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
