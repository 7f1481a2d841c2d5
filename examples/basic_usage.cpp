// Basic YamlFusion usage example
// Compile: g++ -std=c++20 -I../include basic_usage.cpp -o basic_usage

#define RYML_SINGLE_HDR_DEFINE_NOW
#include <YamlFusion/YamlFusion.hpp>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace YamlFusion;

struct Config {
    std::string app_name;
    int version;
    bool debug_mode;

    struct Server {
        std::string host;
        std::uint16_t port;
    };
    Server server;
    std::vector<std::string> features;
    std::optional<std::string> owner;
};

int main() {
    const char* yaml = R"(app_name: MyApp
version: 1
debug_mode: true
server:
  host: localhost
  port: 8080
features: [login, 'yes', search]
)";

    Config config;
    auto result = Parse(config, std::string_view(yaml));

    if (!result) {
        std::cout << "Parse error: " << FormatError(result, yaml) << std::endl;
        return 1;
    }

    std::cout << "Successfully parsed!" << std::endl;
    std::cout << "App: " << config.app_name << std::endl;
    std::cout << "Version: " << config.version << std::endl;
    std::cout << "Debug: " << (config.debug_mode ? "ON" : "OFF") << std::endl;
    std::cout << "Server: " << config.server.host << ":" << config.server.port << std::endl;
    std::cout << "Features: " << config.features.size() << std::endl;

    config.server.port = 9090;
    config.owner = "ops";
    std::string out;
    if (auto sr = Serialize(config, out); !sr) {
        std::cout << "Serialize error: " << sr.error().to_string() << std::endl;
        return 1;
    }
    std::cout << "\n" << out;

    // port is a u16 here
    const char* bad = "app_name: x\nversion: 1\ndebug_mode: false\nserver: {host: h, port: 70000}\nfeatures: []\n";
    auto badResult = Parse(config, std::string_view(bad));
    std::cout << "\n" << FormatError(badResult, bad) << std::endl;

    return 0;
}
