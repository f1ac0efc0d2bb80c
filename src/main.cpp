#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "analytics/TugOfWarEngine.h"
#include "backtest/SnapshotHistory.h"
#include "core/learning/EmaAccuracyLearner.h"
#include "core/orchestration/DecisionCycleCoordinator.h"
#include "core/state/EventJournalJsonl.h"
#include "core/state/TradeSetupStoreJson.h"
#include "engine/SetupLifecycleManager.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace tugofwar;

namespace {

struct ReplayOptions {
    std::string snapshots_path;
    std::string config_path = "config/config.json";
    bool json_mode = false;
    bool verbose = false;
    bool persist = true;
};

void printUsage() {
    std::cout << "Usage: tugofwar_replay <snapshots.jsonl|snapshots.json> [options]\n"
              << "  --config <path>   config file (default config/config.json)\n"
              << "  --json            print the summary as JSON\n"
              << "  --verbose         print every analysis\n"
              << "  --no-persist      keep setups and journal in memory only\n";
}

bool parseArgs(int argc, char* argv[], ReplayOptions& options) {
    if (argc < 2) {
        return false;
    }
    options.snapshots_path = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--json") {
            options.json_mode = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--no-persist") {
            options.persist = false;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

std::filesystem::path resolvePath(const std::string& path) {
    if (std::filesystem::path(path).is_absolute()) {
        return path;
    }
    return utils::PathUtils::resolveRelativePath(path);
}

void printEvent(const engine::LifecycleEvent& event) {
    const auto& s = event.setup;
    std::cout << "  [" << engine::SetupLifecycleManager::toString(event.type) << "] #" << s.id
              << " " << toString(s.direction) << " " << s.strike << " " << toString(s.option_side)
              << std::fixed << std::setprecision(2)
              << " entry=" << s.entry_premium << " sl=" << s.sl_premium << " t1=" << s.target1_premium;
    if (s.profit_loss_pct) {
        std::cout << " pnl=" << *s.profit_loss_pct << "%";
    }
    std::cout << " (" << event.reason << ")\n";
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        ReplayOptions options;
        if (!parseArgs(argc, argv, options)) {
            printUsage();
            return 1;
        }

        Config::getInstance().load(options.config_path);
        auto& config = Config::getInstance();
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        if (!options.json_mode) {
            std::cout << "\n";
            std::cout << "=============================================\n";
            std::cout << "       OI Tug-of-War Replay\n";
            std::cout << "=============================================\n\n";
        }

        if (!std::filesystem::exists(options.snapshots_path)) {
            std::cerr << "Snapshot file not found: " << options.snapshots_path << "\n";
            return 1;
        }
        LOG_INFO("Starting replay with file: {}", options.snapshots_path);

        auto learner = std::make_shared<core::learning::EmaAccuracyLearner>(config.getLearnerConfig());
        const auto learner_path = resolvePath(config.getLearnerStatePath());
        if (options.persist && learner->load(learner_path)) {
            LOG_INFO("Learner state loaded: ema_accuracy={:.3f}", learner->emaAccuracy());
        }

        std::shared_ptr<core::ITradeSetupStore> store;
        std::shared_ptr<core::IEventJournal> journal;
        if (options.persist) {
            store = std::make_shared<core::TradeSetupStoreJson>(resolvePath(config.getSetupStorePath()));
            journal = std::make_shared<core::EventJournalJsonl>(resolvePath(config.getJournalPath()));
        }

        const auto session = config.getSessionConfig();
        core::DecisionCycleCoordinator coordinator(
            analytics::TugOfWarEngine(config.getScoringConfig()),
            engine::SetupLifecycleManager(config.getLifecycleConfig(), session),
            learner,
            store,
            journal
        );
        coordinator.restore();

        const auto frames = backtest::SnapshotHistory::load(options.snapshots_path);
        if (frames.empty()) {
            std::cerr << "No usable snapshots in " << options.snapshots_path << "\n";
            return 1;
        }

        backtest::RollingHistory rolling(config.getHistoryConfig());
        long long current_day = -1;
        int analysed = 0;
        int skipped = 0;

        for (const auto& frame : frames) {
            const long long day = sessionDay(frame.snapshot.timestamp_ms, session.utc_offset_minutes);
            if (day != current_day) {
                if (current_day >= 0) {
                    learner->resetPause();
                }
                rolling.clear();
                current_day = day;
            }

            const auto history = rolling.contextFor(frame);
            const auto result = coordinator.runCycle(frame.snapshot, history);
            rolling.push(frame.snapshot);

            if (!result.analysis.valid) {
                ++skipped;
                continue;
            }
            ++analysed;

            if (options.verbose && !options.json_mode) {
                std::cout << analytics::formatSummary(result.analysis) << "\n";
                if (result.live_pnl) {
                    std::cout << "  open #" << result.live_pnl->setup_id << " "
                              << strategy::toString(result.live_pnl->status) << " premium="
                              << result.live_pnl->current_premium << " pnl="
                              << result.live_pnl->pnl_pct << "%\n";
                }
            }
            if (!options.json_mode) {
                for (const auto& event : result.outcome.events) {
                    printEvent(event);
                }
            }
        }

        if (options.persist && !learner->save(learner_path)) {
            LOG_WARN("Failed to save learner state to {}", learner_path.string());
        }

        const auto& stats = coordinator.performance().overall();
        if (options.json_mode) {
            nlohmann::json j;
            j["snapshots"] = frames.size();
            j["analysed"] = analysed;
            j["skipped"] = skipped;
            j["setups"] = stats.setups;
            j["wins"] = stats.wins;
            j["losses"] = stats.losses;
            j["cancelled"] = stats.cancelled;
            j["expired"] = stats.expired;
            j["win_rate"] = stats.winRate();
            j["avg_pnl_pct"] = stats.averagePnlPct();
            j["profit_factor"] = stats.profitFactor();
            j["ema_accuracy"] = learner->emaAccuracy();
            nlohmann::json by_verdict = nlohmann::json::object();
            for (const auto& [verdict, s] : coordinator.performance().byVerdict()) {
                by_verdict[analytics::toString(verdict)] = {
                    {"setups", s.setups}, {"wins", s.wins}, {"losses", s.losses}, {"win_rate", s.winRate()}
                };
            }
            j["by_verdict"] = by_verdict;
            std::cout << j.dump(2) << std::endl;
        } else {
            std::cout << "\n=== Replay Summary ===\n"
                      << "Snapshots: " << frames.size() << " (analysed " << analysed
                      << ", skipped " << skipped << ")\n"
                      << "Setups: " << stats.setups << "  Won: " << stats.wins
                      << "  Lost: " << stats.losses << "  Cancelled: " << stats.cancelled
                      << "  Expired: " << stats.expired << "\n"
                      << std::fixed << std::setprecision(2)
                      << "Win rate: " << stats.winRate() * 100.0 << "%"
                      << "  Avg P&L: " << stats.averagePnlPct() << "%"
                      << "  Profit factor: " << stats.profitFactor() << "\n"
                      << "Learner EMA accuracy: " << learner->emaAccuracy()
                      << (learner->isPaused() ? " (paused)" : "") << "\n";
        }

        LOG_INFO("Replay finished: {} setups, win rate {:.1f}%", stats.setups, stats.winRate() * 100.0);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
