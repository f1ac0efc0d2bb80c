#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace tugofwar {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;
    
    std::filesystem::path logs_path;
    if (std::filesystem::path(log_dir).is_absolute()) {
        logs_path = log_dir;
    } else {
        logs_path = utils::PathUtils::resolveRelativePath(log_dir);
    }
    
    std::filesystem::create_directories(logs_path);
    
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
        
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logs_path.string() + "/tugofwar.log", 1024 * 1024 * 10, 3
        );
        
        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);
        
        setup_logger_ = spdlog::daily_logger_mt("setups", logs_path.string() + "/setups.log");
        setup_logger_->set_pattern("%Y-%m-%d %H:%M:%S,%v");
        
        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());
        
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::logSetup(long long setup_id, const std::string& event, int strike,
                      const std::string& side, double premium, double pnl_pct) {
    if (setup_logger_) {
        std::ostringstream oss;
        oss << setup_id << "," << event << "," << strike << "," << side << ","
            << std::fixed << std::setprecision(2) << premium << ","
            << std::fixed << std::setprecision(2) << pnl_pct;
        setup_logger_->info(oss.str());
    }
}

} // namespace tugofwar
