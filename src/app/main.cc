#include <iostream>
#include <string>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "chain/coordinator.h"
#include "common/configuration.h"
#include "telemetry/temperature_monitor.h"

using namespace Giftchain;

namespace {

int RunPresents(const GiftchainConfig& config) {
    CoordinatorOptions options;
    options.servants = config.presents.servants.get();
    options.seed = static_cast<uint64_t>(config.presents.seed.get());
    options.thank_you_cards = config.presents.thank_you_cards.get();
    options.query_every = config.presents.query_every.get();

    Coordinator coordinator(static_cast<Item>(config.presents.max_item.get()), options);
    coordinator.Run();

    std::cout << "The servants have processed " << coordinator.Expected().size()
              << " presents and added " << coordinator.FinalCount() << " to the chain";
    if (options.thank_you_cards) {
        std::cout << ", writing " << coordinator.CardsWritten() << " thank you notes";
    }
    std::cout << std::endl;
    if (options.query_every > 0) {
        std::cout << "Membership queries issued: " << coordinator.QueriesIssued() << std::endl;
    }

    if (config.presents.verify.get()) {
        if (!coordinator.Verify()) {
            LOG(ERROR) << "Verification failed";
            return 1;
        }
        LOG(INFO) << "Verification passed";
    }
    return 0;
}

int RunTemperature(const GiftchainConfig& config) {
    MonitorOptions options;
    options.sensors = config.telemetry.sensors.get();
    options.speedup = config.telemetry.speedup.get();
    options.reports = config.telemetry.reports.get();
    options.min_temp = config.telemetry.min_temp.get();
    options.max_temp = config.telemetry.max_temp.get();
    options.window_minutes = config.telemetry.window_minutes.get();
    options.top_n = config.telemetry.top_n.get();

    int report_number = 0;
    TemperatureMonitor monitor(options, [&report_number](const Report& report) {
        std::cout << "\nReport " << ++report_number << "\n" << FormatReport(report) << std::flush;
    });
    monitor.Run();

    if (monitor.ReportsGenerated() < options.reports) {
        LOG(ERROR) << "Only " << monitor.ReportsGenerated() << " of " << options.reports
                   << " reports were generated";
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    // Setup command line options
    cxxopts::Options options("giftchain", "Concurrent present chain and temperature monitor");

    options.add_options()
        ("command", "presents | temperature", cxxopts::value<std::string>()->default_value("presents"))
        ("f,config", "YAML configuration file", cxxopts::value<std::string>())
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("m,max_item", "Number of presents in the bag", cxxopts::value<int64_t>())
        ("n,servants", "Number of servant threads", cxxopts::value<int>())
        ("seed", "Shuffle seed (0 = random)", cxxopts::value<int64_t>())
        ("thank_you_cards", "Alternate adding presents with writing thank you cards")
        ("query_every", "Every n-th servant iteration checks a random present", cxxopts::value<int>())
        ("no_verify", "Skip checking the chain after the run")
        ("s,sensors", "Number of temperature sensors", cxxopts::value<int>())
        ("speedup", "Simulated time speedup", cxxopts::value<int64_t>())
        ("r,reports", "Number of hourly reports to generate", cxxopts::value<int>())
        ("h,help", "Print usage");
    options.parse_positional({"command"});
    options.positional_help("<command>");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        LOG(ERROR) << "Invalid command line: " << e.what();
        return 1;
    }

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    FLAGS_v = result["log_level"].as<int>();

    Configuration& configuration = Configuration::getInstance();
    if (result.count("config") && !configuration.loadFromFile(result["config"].as<std::string>())) {
        LOG(ERROR) << "Failed to load configuration file";
        for (const auto& error : configuration.getValidationErrors()) {
            LOG(ERROR) << "Config validation error: " << error;
        }
        return 1;
    }

    // Command line wins over the configuration file
    GiftchainConfig& config = configuration.config();
    if (result.count("max_item")) config.presents.max_item.set(result["max_item"].as<int64_t>());
    if (result.count("servants")) config.presents.servants.set(result["servants"].as<int>());
    if (result.count("seed")) config.presents.seed.set(result["seed"].as<int64_t>());
    if (result.count("thank_you_cards")) config.presents.thank_you_cards.set(true);
    if (result.count("query_every")) config.presents.query_every.set(result["query_every"].as<int>());
    if (result.count("no_verify")) config.presents.verify.set(false);
    if (result.count("sensors")) config.telemetry.sensors.set(result["sensors"].as<int>());
    if (result.count("speedup")) config.telemetry.speedup.set(result["speedup"].as<int64_t>());
    if (result.count("reports")) config.telemetry.reports.set(result["reports"].as<int>());

    if (!configuration.validate()) {
        LOG(ERROR) << "Configuration validation failed";
        for (const auto& error : configuration.getValidationErrors()) {
            LOG(ERROR) << "Validation error: " << error;
        }
        return 1;
    }

    const std::string command = result["command"].as<std::string>();
    if (command == "presents") {
        return RunPresents(config);
    }
    if (command == "temperature") {
        return RunTemperature(config);
    }

    LOG(ERROR) << "Invalid command: " << command << " (expected presents or temperature)";
    return 1;
}
