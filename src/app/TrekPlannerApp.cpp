/**
 * @file TrekPlannerApp.cpp
 * @brief Implementation of the TrekPlannerApp class.
 */
#include "app/TrekPlannerApp.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>

#include "application/ItineraryService.hpp"
#include "application/ThemeEmbeddingService.hpp"
#include "domain/ItineraryRequest.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ItineraryJsonWriter.hpp"
#include "infrastructure/JsonCatalogRepository.hpp"
#include "infrastructure/OllamaEmbeddingAdapter.hpp"
#include "infrastructure/PathUtils.hpp"

namespace trekplanner::app {

namespace {

int ExitCodeFor(domain::ItineraryErrorKind kind) {
    return kind == domain::ItineraryErrorKind::SchedulingInvariantViolation
        ? TrekPlannerApp::kExitInternalError
        : TrekPlannerApp::kExitDataFailure;
}

domain::ItineraryRequest BuildRequest(const CommandLineOptions& options, const std::string& language) {
    auto theme = domain::ThemeFromString(options.theme);
    if (!theme) {
        throw std::invalid_argument("Unknown theme '" + options.theme +
                                    "' (expected cultural, adventure, foodies, family, couples or friends).");
    }
    auto start = domain::TimeOfDay::Parse(options.startTime);
    auto end = domain::TimeOfDay::Parse(options.endTime);
    if (!start || !end) {
        throw std::invalid_argument("Times must be HH:MM.");
    }

    domain::ItineraryRequest request;
    request.city = options.city;
    request.country = options.country;
    request.theme = *theme;
    request.planSize = options.planSize;
    request.startTime = *start;
    request.endTime = *end;
    request.language = language;
    request.validate();
    return request;
}

} // namespace

CommandLineOptions TrekPlannerApp::ParseArguments(int argc, const char* const argv[]) {
    CommandLineOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") options.showHelp = true;
        else if (arg == "--list-locations") options.listLocations = true;
        else if (arg == "--config") options.configPath = value();
        else if (arg == "--catalog") options.catalogPath = value();
        else if (arg == "--lang") options.language = value();
        else if (arg == "--city") options.city = value();
        else if (arg == "--country") options.country = value();
        else if (arg == "--theme") options.theme = value();
        else if (arg == "--start") options.startTime = value();
        else if (arg == "--end") options.endTime = value();
        else if (arg == "--plan-size") {
            const std::string raw = value();
            try {
                size_t consumed = 0;
                options.planSize = std::stoi(raw, &consumed);
                if (consumed != raw.size()) throw std::invalid_argument(raw);
            } catch (const std::exception&) {
                throw std::invalid_argument("--plan-size expects an integer, got '" + raw + "'");
            }
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return options;
}

void TrekPlannerApp::PrintUsage(std::ostream& os) {
    os << "Usage: trekplanner --city CITY --country COUNTRY --theme THEME\n"
       << "                   [--plan-size N] [--start HH:MM] [--end HH:MM] [--lang CODE]\n"
       << "                   [--catalog catalog.json] [--config settings.json]\n"
       << "       trekplanner --list-locations [--catalog catalog.json] [--config settings.json]\n"
       << "Themes: cultural, adventure, foodies, family, couples, friends\n";
}

int TrekPlannerApp::run(const CommandLineOptions& options, std::ostream& out) {
    if (options.showHelp) {
        PrintUsage(out);
        return kExitOk;
    }

    const std::string configPath = options.configPath
        ? *options.configPath
        : infrastructure::PathUtils::GetDefaultConfigFile().string();
    const auto config = infrastructure::ConfigLoader::Load(configPath);
    const std::string catalogPath = options.catalogPath.value_or(config.catalogPath);
    const std::string language = options.language.value_or(config.defaultLanguage);

    std::shared_ptr<infrastructure::JsonCatalogRepository> catalog;
    try {
        catalog = std::make_shared<infrastructure::JsonCatalogRepository>(catalogPath, config.defaultLanguage);
    } catch (const std::exception& e) {
        std::cerr << "[TrekPlannerApp] " << e.what() << std::endl;
        return kExitIoError;
    }

    if (options.listLocations) {
        out << infrastructure::ItineraryJsonWriter::ToJson(catalog->listLocations()).dump(2) << std::endl;
        return kExitOk;
    }

    domain::ItineraryRequest request;
    try {
        request = BuildRequest(options, language);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[TrekPlannerApp] " << e.what() << std::endl;
        PrintUsage(std::cerr);
        return kExitUsage;
    }

    auto themes = infrastructure::ConfigLoader::BuildThemeTable(config);
    if (config.embeddings.enabled) {
        auto provider = std::make_shared<infrastructure::OllamaEmbeddingAdapter>(
            config.embeddings.host, config.embeddings.port, config.embeddings.model);
        application::ThemeEmbeddingService embeddingService(
            provider, infrastructure::PathUtils::GetThemeEmbeddingCacheFile().string());
        themes = embeddingService.enrich(themes);
    }

    application::ItineraryService service(catalog, themes,
                                          application::ScoringWeights{config.semanticWeight, config.keywordWeight},
                                          application::SchedulerOptions{config.alignmentMinutes});

    const auto result = service.generate(request);
    if (!result.succeeded()) {
        out << infrastructure::ItineraryJsonWriter::ToJson(*result.error).dump(2) << std::endl;
        if (result.error->kind == domain::ItineraryErrorKind::NoPoisFound) {
            const auto suggestions = catalog->suggestLocations(request.city, request.country);
            if (!suggestions.empty()) {
                std::cerr << "[TrekPlannerApp] Did you mean:" << std::endl;
                for (const auto& s : suggestions) {
                    std::cerr << "[TrekPlannerApp]   " << s.city << ", " << s.country << std::endl;
                }
            }
        }
        return ExitCodeFor(result.error->kind);
    }

    out << infrastructure::ItineraryJsonWriter::ToJson(*result.itinerary).dump(2) << std::endl;
    return kExitOk;
}

} // namespace trekplanner::app
