#include <iostream>
#include <string>
#include <vector>
#include "cli/fleet_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        std::string config_path;
        std::vector<std::string> args;
        for (int i = 1; i < argc; i++) {
            std::string a = argv[i];
            if (a == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (a == "--version") {
                std::cout << theme::teal("fleetlink") << theme::dim(" version 0.1.0") << "\n";
                return 0;
            } else if (a == "--help" || a == "-h") {
                print_usage();
                return 0;
            } else {
                args.push_back(a);
            }
        }

        FleetCLI cli(config_path);
        return cli.run(args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
