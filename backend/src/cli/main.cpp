#include <ctime>
#include <iostream>
#include <random>
#include <string>
#include <sodium.h>

#include "../utils/logging.hpp"
#include "../utils/Status.hpp"
#include "../config/Config.hpp"
#include "Arguments.hpp"
#include "Commands.hpp"

static int fail(const Status& st) {
    if (!Log::writesToStderr())
        spdlog::error("{}: {}", errorKindName(st.kind()), st.message());
    std::cerr << "Error: " << st.message() << "\n";
    return exitCodeFor(st.kind());
}

int main(int argc, char* argv[]) {
    Log::initStderr();

    Arguments args;
    Status st = Arguments::parse(argc, argv, args);
    if (!st) return fail(st);

    st = Commands::validate(args);
    if (!st) return fail(st);

    if (args.command == "help") {
        std::cout << Commands::usage();
        return 0;
    }

    std::string dir;
    st = Config::resolveDirectory(args.get("config-dir"), dir);
    if (!st) return fail(st);

    Config config;
    st = Config::load(dir, config);
    if (!st) return fail(st);

    Log::init(config.log_file, config.log_level);

    if (sodium_init() < 0) {
        std::cerr << "Error: failed to initialize libsodium\n";
        return 1;
    }

    std::random_device rd;
    std::seed_seq seed{ rd(), rd(), rd(), rd() };
    std::mt19937_64 rng(seed);

    std::string out;
    st = Commands::run(args, config, rng, std::time(nullptr), out);
    if (!st) return fail(st);

    std::cout << out;
    return 0;
}
