/**
 * @file TrekPlannerApp.hpp
 * @brief Command-line application wiring configuration, catalog and services.
 */

#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace trekplanner::app {

/**
 * @struct CommandLineOptions
 * @brief Parsed flags. Unset optionals fall back to settings.json, then to built-in defaults.
 */
struct CommandLineOptions {
    std::optional<std::string> configPath;
    std::optional<std::string> catalogPath;
    std::optional<std::string> language;
    std::string city;
    std::string country;
    std::string theme;
    int planSize = 6;
    std::string startTime = "09:00";
    std::string endTime = "22:00";
    bool listLocations = false;
    bool showHelp = false;
};

/**
 * @class TrekPlannerApp
 * @brief Main application class. Produces one itinerary (or location list) per run.
 */
class TrekPlannerApp {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitIoError = 1;
    static constexpr int kExitUsage = 2;
    static constexpr int kExitDataFailure = 3;
    static constexpr int kExitInternalError = 4;

    /**
     * @brief Parses argv.
     * @throws std::invalid_argument on unknown flags or missing values.
     */
    static CommandLineOptions ParseArguments(int argc, const char* const argv[]);

    static void PrintUsage(std::ostream& os);

    /**
     * @brief Runs the application and writes JSON to @p out.
     * @return Process exit code.
     */
    int run(const CommandLineOptions& options, std::ostream& out);
};

} // namespace trekplanner::app
