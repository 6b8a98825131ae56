#include "Config.hpp"
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

bool parseLogLevel(const std::string& name, spdlog::level::level_enum& out) {
    if (name == "trace") out = spdlog::level::trace;
    else if (name == "debug") out = spdlog::level::debug;
    else if (name == "info") out = spdlog::level::info;
    else if (name == "warn" || name == "warning") out = spdlog::level::warn;
    else if (name == "error") out = spdlog::level::err;
    else if (name == "critical") out = spdlog::level::critical;
    else if (name == "off") out = spdlog::level::off;
    else return false;
    return true;
}

Status Config::resolveDirectory(const std::string& overrideDir, std::string& out) {
    if (!overrideDir.empty()) {
        out = overrideDir;
        return Status::ok();
    }

    const char* env = std::getenv("DECOUVERTES_CONFIG_DIR");
    if (env && *env) {
        out = env;
        return Status::ok();
    }

    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return Status::error(ErrorKind::Configuration,
            "Could not find user home directory. Set HOME or DECOUVERTES_CONFIG_DIR.");
    }
    out = (fs::path(home) / ".config" / "decouvertes").string();
    return Status::ok();
}

Status Config::load(const std::string& configDir, Config& out) {
    std::error_code ec;
    if (!fs::is_directory(configDir, ec)) {
        return Status::error(ErrorKind::Configuration,
            "Config directory not found at " + configDir +
            ". Please create it and place your 'cards.json' file inside.");
    }

    Config cfg;
    fs::path dir(configDir);
    cfg.config_dir = configDir;
    cfg.cards_file = (dir / "cards.json").string();
    cfg.progress_file = (dir / "player_progress.json").string();
    cfg.single_progress_file = (dir / "progress.json").string();
    cfg.settings_file = (dir / "settings.json").string();
    cfg.log_file = (dir / "decouvertes.log").string();

    std::ifstream in(cfg.settings_file);
    if (in) {
        std::stringstream buffer;
        buffer << in.rdbuf();
        Status st = cfg.applySettings(buffer.str());
        if (!st) return st;
    }

    const char* level = std::getenv("DECOUVERTES_LOG_LEVEL");
    if (level && *level && !parseLogLevel(level, cfg.log_level)) {
        return Status::error(ErrorKind::Configuration,
            std::string("Unknown log level '") + level + "' in DECOUVERTES_LOG_LEVEL");
    }

    out = cfg;
    return Status::ok();
}

Status Config::applySettings(const std::string& text) {
    try {
        auto json = nlohmann::json::parse(text);
        if (!json.is_object())
            throw std::invalid_argument("settings must be a JSON object");

        auto weights = json.find("box_weights");
        if (weights != json.end()) {
            if (!weights->is_array() || weights->empty())
                throw std::invalid_argument("'box_weights' must be a non-empty array of positive integers");

            std::vector<int> w;
            for (const auto& v : *weights) {
                // parsed positive integers are stored unsigned
                if (!v.is_number_unsigned() || v.get<std::uint64_t>() < 1
                    || v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
                    throw std::invalid_argument("'box_weights' must be a non-empty array of positive integers");
                w.push_back(v.get<int>());
            }
            schedule = BoxSchedule(w);
        }

        auto level = json.find("log_level");
        if (level != json.end()) {
            if (!level->is_string() || !parseLogLevel(level->get<std::string>(), log_level))
                throw std::invalid_argument("'log_level' must be one of trace, debug, info, warn, error, critical, off");
        }

        auto file = json.find("log_file");
        if (file != json.end()) {
            if (!file->is_string() || file->get<std::string>().empty())
                throw std::invalid_argument("'log_file' must be a non-empty string");
            fs::path p(file->get<std::string>());
            log_file = p.is_absolute() ? p.string() : (fs::path(config_dir) / p).string();
        }
    }
    catch (const nlohmann::json::exception& ex) {
        return Status::error(ErrorKind::MalformedData, "Error parsing " + settings_file + ": " + ex.what());
    }
    catch (const std::invalid_argument& ex) {
        return Status::error(ErrorKind::MalformedData, "Invalid " + settings_file + ": " + ex.what());
    }
    return Status::ok();
}
