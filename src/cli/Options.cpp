#include "cli/Options.hpp"

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <sstream>
#include <stdexcept>

namespace po = boost::program_options;

namespace fsort::cli {

static po::options_description visibleOptions() {
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show this help and exit")
        ("max-concurrent", po::value<int>()->value_name("N"),
            "Maximum number of simultaneous copy operations (default: 10)")
        ("verbose,v", po::bool_switch(), "Enable detailed logging (per-file found/copied lines)")
        ("config", po::value<std::string>()->value_name("PATH"), "YAML configuration file")
        ("log-file", po::value<std::string>()->value_name("PATH"),
            "Log file, appended to across runs (default: file_sorter.log)")
        ("report", po::value<std::string>()->value_name("PATH"), "Write the run summary as JSON to PATH")
        ("strict", po::bool_switch(), "Exit non-zero on an invalid source or any failed copy");
    return desc;
}

Options parse(const int argc, const char* const argv[]) {
    po::options_description hidden("Positional");
    hidden.add_options()
        ("source_folder", po::value<std::string>(), "Folder with the files to sort")
        ("output_folder", po::value<std::string>(), "Folder that receives the sorted files");

    po::options_description all;
    all.add(visibleOptions()).add(hidden);

    po::positional_options_description positional;
    positional.add("source_folder", 1).add("output_folder", 1);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
    po::notify(vm);

    Options opts;
    if (vm.count("help")) {
        opts.help = true;
        return opts;
    }

    if (!vm.count("source_folder")) throw po::required_option("source_folder");
    if (!vm.count("output_folder")) throw po::required_option("output_folder");

    opts.source = vm["source_folder"].as<std::string>();
    opts.output = vm["output_folder"].as<std::string>();
    opts.verbose = vm["verbose"].as<bool>();
    opts.strict = vm["strict"].as<bool>();

    if (vm.count("max-concurrent")) {
        const auto n = vm["max-concurrent"].as<int>();
        if (n < 1) throw std::invalid_argument(fmt::format("--max-concurrent must be a positive integer, got {}", n));
        opts.maxConcurrent = n;
    }

    if (vm.count("config")) opts.configPath = vm["config"].as<std::string>();
    if (vm.count("log-file")) opts.logFile = vm["log-file"].as<std::string>();
    if (vm.count("report")) opts.reportPath = vm["report"].as<std::string>();

    return opts;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Sorts files by extension: copies every file of <source_folder> into\n"
        << "<output_folder>/<extension>/, leaving the source untouched.\n\n"
        << "Usage: " << program << " [options] <source_folder> <output_folder>\n\n"
        << visibleOptions() << "\n"
        << "Examples:\n"
        << "  " << program << " /source/folder /output/folder\n"
        << "  " << program << " ~/Downloads ~/Sorted --max-concurrent 20\n"
        << "  " << program << " . ./sorted_files --verbose\n";
    return out.str();
}

config::Config resolveConfig(const Options& opts) {
    config::Config cfg = opts.configPath ? config::loadConfig(*opts.configPath) : config::Config{};

    if (opts.maxConcurrent) cfg.sorter.max_concurrent = static_cast<unsigned int>(*opts.maxConcurrent);
    if (opts.logFile) cfg.logging.log_file = *opts.logFile;

    cfg.validate();
    return cfg;
}

}
