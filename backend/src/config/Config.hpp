#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include "../core/BoxSchedule.hpp"
#include "../utils/Status.hpp"

/*
  Everything lives in one directory:
    cards.json             card catalog (required)
    player_progress.json   multi-player progress
    progress.json          single-player progress (legacy layout)
    settings.json          optional: box_weights, log_level, log_file
    decouvertes.log        default log file
*/
struct Config {
    std::string config_dir;
    std::string cards_file;
    std::string progress_file;
    std::string single_progress_file;
    std::string settings_file;
    std::string log_file;
    spdlog::level::level_enum log_level = spdlog::level::info;
    BoxSchedule schedule;

    // --config-dir, then $DECOUVERTES_CONFIG_DIR, then $HOME/.config/decouvertes.
    static Status resolveDirectory(const std::string& overrideDir, std::string& out);

    // Fails with Configuration when the directory does not exist.
    static Status load(const std::string& configDir, Config& out);

    // Applies a settings.json document on top of the defaults.
    Status applySettings(const std::string& text);
};

bool parseLogLevel(const std::string& name, spdlog::level::level_enum& out);
