// Sorter
#include "sort/Sorter.hpp"
#include "sort/model/RunSummary.hpp"

// Misc
#include "cli/Options.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

// Libraries
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <boost/program_options/errors.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/exceptions.h>

using namespace fsort::config;
using namespace fsort::sort;
using namespace fsort::cli;

namespace {
const auto interruptFlag = std::make_shared<std::atomic<bool>>(false);

void signalHandler(const int) {
    interruptFlag->store(true);
}

int code(const ExitCode c) { return static_cast<int>(c); }

bool writeReport(const std::filesystem::path& path, const model::RunSummary& summary) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) return false;
    out << nlohmann::json(summary).dump(2) << '\n';
    return static_cast<bool>(out);
}
}

int main(const int argc, char** argv) {
    Options opts;
    try {
        opts = parse(argc, argv);
    } catch (const boost::program_options::error& e) {
        std::cerr << "error: " << e.what() << "\n\n" << usage(argv[0]);
        return code(ExitCode::UsageError);
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n";
        return code(ExitCode::UsageError);
    }

    if (opts.help) {
        std::cout << usage(argv[0]);
        return code(ExitCode::Ok);
    }

    try {
        ConfigRegistry::init(resolveConfig(opts));
        fsort::log::Registry::init(ConfigRegistry::get().logging);
        if (opts.verbose) fsort::log::Registry::setLevel(spdlog::level::debug);
    } catch (const YAML::Exception& e) {
        std::cerr << "[-] Failed to read configuration: " << e.what() << std::endl;
        return code(ExitCode::StartupFailure);
    } catch (const std::exception& e) {
        std::cerr << "[-] Failed to initialize filesorter: " << e.what() << std::endl;
        return code(ExitCode::StartupFailure);
    }

    const auto log = fsort::log::Registry::filesorter();
    const auto& cnf = ConfigRegistry::get().sorter;

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    log->info("[*] Starting file sorter");
    log->info("[*] Source folder: {}", std::filesystem::absolute(opts.source).string());
    log->info("[*] Output folder: {}", std::filesystem::absolute(opts.output).string());
    log->info("[*] Max concurrent operations: {}", cnf.max_concurrent);

    auto exitCode = ExitCode::Ok;

    try {
        const Sorter sorter(cnf, interruptFlag);

        if (!sorter.validateSource(opts.source)) {
            log->info("[*] Nothing processed");
            fsort::log::Registry::shutdown();
            return code(opts.strict ? ExitCode::StartupFailure : ExitCode::Ok);
        }

        const auto summary = sorter.process(opts.source, opts.output);

        if (interruptFlag->load()) log->warn("[!] Interrupted; remaining files were not copied");

        if (opts.reportPath) {
            if (writeReport(*opts.reportPath, summary))
                log->info("[*] Run report written to {}", opts.reportPath->string());
            else {
                log->error("[-] Failed to write run report to {}", opts.reportPath->string());
                if (opts.strict) exitCode = ExitCode::StartupFailure;
            }
        }

        if (opts.strict && !summary.allSucceeded()) exitCode = ExitCode::CopyFailures;
    } catch (const std::exception& e) {
        log->critical("[-] Unexpected failure: {}", e.what());
        if (opts.strict) exitCode = ExitCode::StartupFailure;
    }

    log->info("[✓] Work finished");
    fsort::log::Registry::shutdown();
    return code(exitCode);
}
