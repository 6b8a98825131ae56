#pragma once
#include <ctime>
#include <random>
#include <string>
#include "Arguments.hpp"
#include "../config/Config.hpp"
#include "../utils/Status.hpp"

// One function per CLI command. Each loads what it needs from the config
// directory, saves what it changed, and leaves the exact stdout text in out.
namespace Commands
{
    extern const char* const DONE_MESSAGE;

    // Checks the command name, unknown options and required options.
    // Runs before the config directory is touched.
    Status validate(const Arguments& args);

    Status run(const Arguments& args, const Config& config, std::mt19937_64& rng, std::time_t now, std::string& out);

    // Empty playerId selects the single-player progress file.
    Status getCard(const Config& config, const std::string& playerId, std::mt19937_64& rng,
        std::time_t now, std::string& out);
    Status checkAnswer(const Config& config, const std::string& playerId, const std::string& cardId,
        const std::string& answer, std::time_t now, std::string& out);

    Status createPlayer(const Config& config, const std::string& name, std::string& out);
    Status listPlayers(const Config& config, std::string& out);
    Status deletePlayer(const Config& config, const std::string& playerId, std::string& out);
    Status getStats(const Config& config, const std::string& playerId, std::time_t now, std::string& out);

    std::string usage();
}
