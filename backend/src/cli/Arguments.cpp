#include "Arguments.hpp"
#include <algorithm>

std::string Arguments::get(const std::string& key) const {
    auto it = options.find(key);
    if (it == options.end()) return "";
    return it->second;
}

Status Arguments::parse(int argc, const char* const argv[], Arguments& out) {
    out = Arguments();
    if (argc < 2) {
        return Status::error(ErrorKind::Validation,
            "Expected a command: get-card, check-answer, create-player, list-players, delete-player or get-stats.");
    }

    std::string first = argv[1];
    if (first == "--help" || first == "-h" || first == "-help") first = "help";
    if (!first.empty() && first[0] == '-') {
        return Status::error(ErrorKind::Validation, "Expected a command before option '" + first + "'.");
    }
    out.command = first;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 2 || arg[0] != '-') {
            return Status::error(ErrorKind::Validation, "Unexpected argument '" + arg + "'.");
        }

        size_t start = arg[1] == '-' ? 2 : 1;
        std::string key;
        std::string value;
        size_t eq = arg.find('=', start);
        if (eq != std::string::npos) {
            key = arg.substr(start, eq - start);
            value = arg.substr(eq + 1);
        }
        else {
            key = arg.substr(start);
            if (i + 1 >= argc) {
                return Status::error(ErrorKind::Validation, "Option --" + key + " needs a value.");
            }
            value = argv[++i];
        }

        if (key.empty()) {
            return Status::error(ErrorKind::Validation, "Malformed option '" + arg + "'.");
        }
        out.options[key] = value;
    }
    return Status::ok();
}

Status Arguments::allowOnly(const std::vector<std::string>& allowed) const {
    for (const auto& p : options) {
        if (std::find(allowed.begin(), allowed.end(), p.first) == allowed.end()) {
            return Status::error(ErrorKind::Validation,
                "Unknown option --" + p.first + " for " + command + ".");
        }
    }
    return Status::ok();
}
