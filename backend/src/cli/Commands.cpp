#include "Commands.hpp"
#include <sstream>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "../core/AnswerChecker.hpp"
#include "../core/CardCatalog.hpp"
#include "../core/Selector.hpp"
#include "../core/StatsReporter.hpp"
#include "../players/PlayerRegistry.hpp"
#include "../storage/JsonCodec.hpp"
#include "../storage/ProgressStore.hpp"

namespace
{
    struct CommandInfo {
        const char* name;
        std::vector<std::string> options;
        std::vector<std::string> required;
    };

    const std::vector<CommandInfo>& commandTable() {
        static const std::vector<CommandInfo> table = {
            { "get-card", { "player-id", "config-dir" }, {} },
            { "check-answer", { "id", "answer", "player-id", "config-dir" }, { "id", "answer" } },
            { "create-player", { "name", "config-dir" }, { "name" } },
            { "list-players", { "config-dir" }, {} },
            { "delete-player", { "player-id", "config-dir" }, { "player-id" } },
            { "get-stats", { "player-id", "config-dir" }, { "player-id" } },
            { "help", {}, {} },
        };
        return table;
    }

    const CommandInfo* findCommand(const std::string& name) {
        for (const auto& c : commandTable()) {
            if (name == c.name) return &c;
        }
        return nullptr;
    }

    std::string dumpCompact(const nlohmann::ordered_json& json) {
        return json.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace) + "\n";
    }

    ProgressStore storeFor(const Config& config, const std::string& playerId) {
        if (playerId.empty())
            return ProgressStore(config.single_progress_file, ProgressLayout::SinglePlayer);
        return ProgressStore(config.progress_file, ProgressLayout::MultiPlayer);
    }

    Status playerFor(ProgressStore& store, const std::string& playerId, PlayerRecord*& player) {
        if (playerId.empty()) {
            player = &store.singlePlayer();
            return Status::ok();
        }
        player = store.findPlayer(playerId);
        if (!player) {
            spdlog::warn("Player {} not found", playerId);
            return Status::error(ErrorKind::NotFound, "Player with ID '" + playerId + "' not found.");
        }
        return Status::ok();
    }
}

namespace Commands
{
    const char* const DONE_MESSAGE = "Congratulations, you have mastered all cards!";

    Status validate(const Arguments& args) {
        const CommandInfo* info = findCommand(args.command);
        if (!info) {
            return Status::error(ErrorKind::Validation,
                "Unknown command: " + args.command + ". Run 'decouvertes help' for the list of commands.");
        }

        Status st = args.allowOnly(info->options);
        if (!st) return st;

        for (const auto& key : info->required) {
            if (!args.has(key)) {
                return Status::error(ErrorKind::Validation,
                    "--" + key + " is required for " + args.command + ".");
            }
        }
        // A blank answer line is rejected before any progress is touched.
        for (const auto& key : info->options) {
            if (args.has(key) && args.get(key).empty()) {
                return Status::error(ErrorKind::Validation, "--" + key + " must not be empty.");
            }
        }
        return Status::ok();
    }

    Status run(const Arguments& args, const Config& config, std::mt19937_64& rng, std::time_t now, std::string& out) {
        Status st = validate(args);
        if (!st) return st;

        spdlog::debug("Running command '{}'", args.command);

        const std::string& cmd = args.command;
        if (cmd == "get-card") return getCard(config, args.get("player-id"), rng, now, out);
        if (cmd == "check-answer")
            return checkAnswer(config, args.get("player-id"), args.get("id"), args.get("answer"), now, out);
        if (cmd == "create-player") return createPlayer(config, args.get("name"), out);
        if (cmd == "list-players") return listPlayers(config, out);
        if (cmd == "delete-player") return deletePlayer(config, args.get("player-id"), out);
        if (cmd == "get-stats") return getStats(config, args.get("player-id"), now, out);

        out = usage();
        return Status::ok();
    }

    Status getCard(const Config& config, const std::string& playerId, std::mt19937_64& rng,
        std::time_t now, std::string& out)
    {
        CardCatalog catalog;
        Status st = CardCatalog::loadFromFile(config.cards_file, catalog);
        if (!st) return st;

        ProgressStore store = storeFor(config, playerId);
        st = store.load();
        if (!st) return st;

        PlayerRecord* player = nullptr;
        st = playerFor(store, playerId, player);
        if (!st) return st;

        Selector selector(config.schedule, rng);
        if (selector.ensureEntries(catalog, *player, now) > 0) {
            st = store.save();
            if (!st) return st;
        }

        const Card* card = selector.select(catalog, *player);
        if (!card) {
            nlohmann::ordered_json done = nlohmann::ordered_json::object();
            done["id"] = "done";
            done["prompt"] = DONE_MESSAGE;
            out = dumpCompact(done);
            return Status::ok();
        }

        out = dumpCompact(JsonCodec::cardToJson(*card));
        return Status::ok();
    }

    Status checkAnswer(const Config& config, const std::string& playerId, const std::string& cardId,
        const std::string& answer, std::time_t now, std::string& out)
    {
        CardCatalog catalog;
        Status st = CardCatalog::loadFromFile(config.cards_file, catalog);
        if (!st) return st;

        ProgressStore store = storeFor(config, playerId);
        st = store.load();
        if (!st) return st;

        PlayerRecord* player = nullptr;
        st = playerFor(store, playerId, player);
        if (!st) return st;

        AnswerChecker checker(catalog);
        CheckResult result;
        st = checker.check(*player, cardId, answer, now, result);
        if (!st) return st;

        st = store.save();
        if (!st) return st;

        nlohmann::ordered_json json = nlohmann::ordered_json::object();
        json["correct"] = result.correct;
        json["new_box"] = result.new_box;
        json["solution"] = result.solution;
        out = dumpCompact(json);
        return Status::ok();
    }

    Status createPlayer(const Config& config, const std::string& name, std::string& out) {
        ProgressStore store(config.progress_file);
        Status st = store.load();
        if (!st) return st;

        PlayerRegistry registry(store);
        std::string id;
        st = registry.create(name, id);
        if (!st) return st;

        out = id + "\n";
        return Status::ok();
    }

    Status listPlayers(const Config& config, std::string& out) {
        ProgressStore store(config.progress_file);
        Status st = store.load();
        if (!st) return st;

        PlayerRegistry registry(store);
        auto players = registry.list();
        if (players.empty()) {
            out = "No players found. Create one with: decouvertes create-player --name=NAME\n";
            return Status::ok();
        }

        std::ostringstream oss;
        for (const auto& p : players) {
            oss << "Name: " << p.name << ", ID: " << p.id << "\n";
        }
        out = oss.str();
        return Status::ok();
    }

    Status deletePlayer(const Config& config, const std::string& playerId, std::string& out) {
        ProgressStore store(config.progress_file);
        Status st = store.load();
        if (!st) return st;

        PlayerRegistry registry(store);
        PlayerSummary removed;
        st = registry.remove(playerId, removed);
        if (!st) return st;

        out = "Player '" + removed.name + "' (ID: " + removed.id + ") deleted.\n";
        return Status::ok();
    }

    Status getStats(const Config& config, const std::string& playerId, std::time_t now, std::string& out) {
        ProgressStore store(config.progress_file);
        Status st = store.load();
        if (!st) return st;

        PlayerRecord* player = nullptr;
        st = playerFor(store, playerId, player);
        if (!st) return st;

        StatsReporter reporter(config.schedule);
        out = reporter.format(reporter.compute(*player, now));
        return Status::ok();
    }

    std::string usage() {
        return
            "Usage: decouvertes <command> [options]\n"
            "\n"
            "Commands:\n"
            "  get-card [--player-id=ID]                          Print the next card as JSON\n"
            "  check-answer --id=ID --answer=TEXT [--player-id=ID] Grade an answer and print the result as JSON\n"
            "  create-player --name=NAME                          Create a player and print its ID\n"
            "  list-players                                       List all players\n"
            "  delete-player --player-id=ID                       Delete a player and its progress\n"
            "  get-stats --player-id=ID                           Print a player's statistics\n"
            "  help                                               Show this message\n"
            "\n"
            "Every command accepts --config-dir=PATH (default: $DECOUVERTES_CONFIG_DIR or ~/.config/decouvertes).\n"
            "Without --player-id, get-card and check-answer use the single-player progress.json.\n";
    }
}
