#include "log/Registry.hpp"

#include <filesystem>
#include <stdexcept>

namespace fsort::log {

void Registry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    log_file_ = cnf.log_file;

    namespace fs = std::filesystem;
    if (log_file_.has_parent_path() && !fs::exists(log_file_.parent_path()))
        fs::create_directories(log_file_.parent_path());

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // persistent file sink, appended across runs
    file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_.string(), /*truncate=*/false);
    file_sink_->set_level(cnf.levels.file_log_level);
    file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("filesorter", sub_levels.filesorter);
    makeLogger("scan",       sub_levels.scan);
    makeLogger("copy",       sub_levels.copy);
    makeLogger("sched",      sub_levels.sched);
    makeLogger("report",     sub_levels.report);

    initialized_ = true;
    filesorter()->debug("[Registry] Initialized, writing to {}", log_file_.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::setLevel(const spdlog::level::level_enum level) {
    if (!initialized_) return;
    console_sink_->set_level(level);
    file_sink_->set_level(level);
    for (const auto* name : {"filesorter", "scan", "copy", "sched", "report"})
        get(name)->set_level(level);
}

void Registry::shutdown() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    spdlog::drop_all();
    console_sink_.reset();
    file_sink_.reset();
    initialized_ = false;
}

}
