#pragma once
#include <map>
#include <string>
#include <vector>
#include "../utils/Status.hpp"

// "decouvertes <command> [--key=value | --key value | -key=value ...]"
class Arguments {
public:
    std::string command;
    std::map<std::string, std::string> options;

    static Status parse(int argc, const char* const argv[], Arguments& out);

    bool has(const std::string& key) const { return options.count(key) != 0; }
    std::string get(const std::string& key) const;

    // Validation error naming the first option not in allowed.
    Status allowOnly(const std::vector<std::string>& allowed) const;
};
