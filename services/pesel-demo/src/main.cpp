/**
 * @file main.cpp
 * @brief PESEL demo - parse a sample number and generate a new one
 *
 * Usage: pesel-demo [--json] [PESEL]
 *
 * Environment:
 *   LOG_LEVEL          spdlog level (default: info)
 *   LOG_FILE           rotating log file, disabled when empty
 *   PESEL_DATE_POLICY  strict | permissive (default: strict)
 *   PESEL_SAMPLE       number parsed when none is given (default: 44051401458)
 *   PESEL_JSON         print JSON instead of text, same as --json (default: false)
 */

#include <pesel/codec/pesel.h>
#include "config_manager.h"
#include "exceptions.h"
#include "logger.h"

#include <json/json.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

using pesel::codec::ParseOptions;
using pesel::codec::Pesel;
using pesel::codec::Sex;
using pesel::common::ConfigManager;

namespace {

constexpr const char* DEFAULT_SAMPLE = "44051401458";

// Birth date used for the generation half of the demo
constexpr int GENERATE_YEAR = 1980;
constexpr int GENERATE_MONTH = 5;
constexpr int GENERATE_DAY = 26;

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--json] [PESEL]\n"
              << "Parses PESEL (or $PESEL_SAMPLE, default " << DEFAULT_SAMPLE << ")\n"
              << "and generates a new number for a male born "
              << pesel::codec::BirthDate{GENERATE_YEAR, GENERATE_MONTH, GENERATE_DAY} << ".\n";
}

void print(const Pesel& pesel, bool asJson) {
    if (asJson) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        std::cout << Json::writeString(builder, pesel.toJson()) << std::endl;
    } else {
        std::cout << pesel << std::endl;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto& config = ConfigManager::getInstance();

    const std::string logFile = config.getString(ConfigManager::LOG_FILE);
    pesel::common::Logger::initialize(
        "pesel-demo",
        config.getString(ConfigManager::LOG_LEVEL, "info"),
        !logFile.empty(),
        logFile);

    bool asJson = config.getBool(ConfigManager::PESEL_JSON, false);
    std::string sample = config.getString(ConfigManager::PESEL_SAMPLE, DEFAULT_SAMPLE);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--json") {
            asJson = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            sample = arg;
        }
    }

    try {
        ParseOptions options;
        options.datePolicy = config.datePolicy();
        spdlog::debug("Parsing sample with {} date policy",
                      pesel::codec::datePolicyToString(options.datePolicy));

        auto parsed = Pesel::parse(sample, options);
        if (!parsed) {
            spdlog::error("Invalid PESEL provided: {} ({})",
                          parsed.error().message(), pesel::codec::toString(parsed.error().kind()));
            std::cerr << "invalid PESEL provided: " << parsed.error() << std::endl;
            pesel::common::Logger::flush();
            return 1;
        }
        print(parsed.value(), asJson);

        if (!asJson) {
            std::cout << "--- PESEL generation ----" << std::endl;
        }

        auto generated = Pesel::generate(GENERATE_YEAR, GENERATE_MONTH, GENERATE_DAY, Sex::Male);
        if (!generated) {
            spdlog::error("Generation failed: {}", generated.error().message());
            pesel::common::Logger::flush();
            return 1;
        }
        print(generated.value(), asJson);

    } catch (const pesel::common::PeselException& e) {
        spdlog::critical("{}", e.what());
        pesel::common::Logger::flush();
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Unexpected error: {}", e.what());
        pesel::common::Logger::flush();
        return 1;
    }

    pesel::common::Logger::flush();
    return 0;
}
