#include <iostream>
#include <stdexcept>

#include "app/TrekPlannerApp.hpp"

int main(int argc, char* argv[]) {
    using trekplanner::app::TrekPlannerApp;

    trekplanner::app::CommandLineOptions options;
    try {
        options = TrekPlannerApp::ParseArguments(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[main] " << e.what() << std::endl;
        TrekPlannerApp::PrintUsage(std::cerr);
        return TrekPlannerApp::kExitUsage;
    }

    TrekPlannerApp app;
    return app.run(options, std::cout);
}
