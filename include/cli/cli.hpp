#pragma once

#include <string>
#include <vector>
#include <map>
#include <algorithm>
#include <functional>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace lore {
namespace cli {

/**
 * @brief Raised for malformed command lines; the CLI prints command help after it
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

enum class ArgKind {
    Value,      // --name <value>, at most once
    Flag,       // --name, presence only
    List        // --name <value>, may repeat; every occurrence is kept
};

/**
 * @brief Option accepted by a command
 */
struct ArgDef {
    std::string name;               // Long name, used as "--name"
    std::string short_name;         // Single letter, used as "-x"; may be empty
    std::string description;
    ArgKind kind = ArgKind::Value;
    bool required = false;
    std::string default_value;      // Applied when the option is absent
};

/**
 * @brief Value(s) given for one option
 *
 * Numeric accessors fall back to the caller's default when the option is
 * absent, and throw UsageError when it is present but not a number.
 */
struct ArgValue {
    std::string name;
    std::vector<std::string> values;

    bool present() const { return !values.empty(); }

    const std::string& last() const {
        static const std::string empty;
        return values.empty() ? empty : values.back();
    }

    std::string str(const std::string& fallback = "") const {
        return present() ? last() : fallback;
    }

    int as_int(int fallback) const {
        if (!present()) return fallback;
        size_t used = 0;
        int parsed = 0;
        try {
            parsed = std::stoi(last(), &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used == 0 || used != last().size()) {
            throw UsageError("--" + name + " expects an integer, got '" + last() + "'");
        }
        return parsed;
    }

    double as_double(double fallback) const {
        if (!present()) return fallback;
        size_t used = 0;
        double parsed = 0.0;
        try {
            parsed = std::stod(last(), &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used == 0 || used != last().size()) {
            throw UsageError("--" + name + " expects a number, got '" + last() + "'");
        }
        return parsed;
    }

    /**
     * @brief Every occurrence, each split on delim, empty pieces dropped
     */
    std::vector<std::string> split(char delim) const {
        std::vector<std::string> pieces;
        for (const auto& value : values) {
            std::stringstream ss(value);
            std::string piece;
            while (std::getline(ss, piece, delim)) {
                if (!piece.empty()) pieces.push_back(piece);
            }
        }
        return pieces;
    }
};

/**
 * @brief Parsed command line of one command
 */
class Args {
public:
    std::map<std::string, ArgValue> named;
    std::vector<std::string> positional;

    ArgValue get(const std::string& name) const {
        auto it = named.find(name);
        return it != named.end() ? it->second : ArgValue{name, {}};
    }

    bool has(const std::string& name) const {
        auto it = named.find(name);
        return it != named.end() && it->second.present();
    }

    std::string require(const std::string& name) const {
        if (!has(name)) {
            throw UsageError("Missing required argument: --" + name);
        }
        return named.at(name).last();
    }

    /**
     * @brief Text to process: --text, else the file named by --input
     *        ("-" reads stdin), else the positional words joined by spaces
     */
    std::string input_text() const {
        if (has("text")) {
            return named.at("text").last();
        }

        if (has("input")) {
            const std::string& path = named.at("input").last();
            std::ostringstream buffer;
            if (path == "-") {
                buffer << std::cin.rdbuf();
            } else {
                std::ifstream file(path);
                if (!file.is_open()) {
                    throw std::runtime_error("Failed to open input file: " + path);
                }
                buffer << file.rdbuf();
            }
            return buffer.str();
        }

        std::string joined;
        for (const auto& word : positional) {
            if (!joined.empty()) joined += ' ';
            joined += word;
        }
        return joined;
    }
};

/**
 * @brief A subcommand: its options and the function that runs it
 */
struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;

    std::string usage(const std::string& program_name) const {
        std::ostringstream out;
        out << "Usage: " << program_name << " " << name;
        for (const auto& arg : args) {
            if (arg.required) out << " --" << arg.name << " <value>";
        }
        out << " [options]\n\n" << description << "\n\nOptions:\n";

        for (const auto& arg : args) {
            std::string left = "--" + arg.name;
            if (!arg.short_name.empty()) left += ", -" + arg.short_name;
            if (arg.kind != ArgKind::Flag) left += " <value>";

            out << "  " << left << "\n      " << arg.description;
            if (!arg.default_value.empty()) out << " (default: " << arg.default_value << ")";
            if (arg.kind == ArgKind::List) out << " [repeatable]";
            if (arg.required) out << " [required]";
            out << "\n";
        }
        return out.str();
    }

    /**
     * @brief Parse the words following the command name
     *
     * Accepts "--name value", "--name=value", "-x value" and bare words.
     * A lone "--" ends option parsing. Throws UsageError on unknown options,
     * missing values, repeated non-list options and missing required options.
     */
    Args parse(const std::vector<std::string>& words) const {
        Args result;

        auto find_def = [this](const std::string& word) -> const ArgDef* {
            for (const auto& def : args) {
                if (word == "--" + def.name) return &def;
                if (!def.short_name.empty() && word == "-" + def.short_name) return &def;
            }
            return nullptr;
        };

        auto record = [&result](const ArgDef& def, const std::string& value) {
            ArgValue& slot = result.named[def.name];
            slot.name = def.name;
            if (slot.present() && def.kind == ArgKind::Value) {
                throw UsageError("--" + def.name + " given more than once");
            }
            if (def.kind == ArgKind::Flag) {
                slot.values.assign(1, value);
            } else {
                slot.values.push_back(value);
            }
        };

        bool options_done = false;
        for (size_t i = 0; i < words.size(); ++i) {
            const std::string& word = words[i];

            if (options_done || word.empty() || word[0] != '-' || word == "-") {
                result.positional.push_back(word);
                continue;
            }
            if (word == "--") {
                options_done = true;
                continue;
            }

            std::string key = word;
            std::string inline_value;
            bool has_inline = false;
            size_t eq = word.find('=');
            if (word.compare(0, 2, "--") == 0 && eq != std::string::npos) {
                key = word.substr(0, eq);
                inline_value = word.substr(eq + 1);
                has_inline = true;
            }

            const ArgDef* def = find_def(key);
            if (!def) {
                throw UsageError("Unknown argument: " + word);
            }

            if (def->kind == ArgKind::Flag) {
                if (has_inline) {
                    throw UsageError("--" + def->name + " takes no value");
                }
                record(*def, "true");
            } else if (has_inline) {
                record(*def, inline_value);
            } else if (i + 1 < words.size()) {
                record(*def, words[++i]);
            } else {
                throw UsageError(word + " requires a value");
            }
        }

        for (const auto& def : args) {
            if (result.has(def.name)) continue;
            if (def.required) {
                throw UsageError("Missing required argument: --" + def.name);
            }
            if (!def.default_value.empty()) {
                result.named[def.name] = ArgValue{def.name, {def.default_value}};
            }
        }

        return result;
    }
};

/**
 * @brief Dispatches "program <command> [options]" to registered commands
 */
class CLI {
public:
    CLI(const std::string& program_name, const std::string& version)
        : program_name_(program_name), version_(version) {}

    void register_command(Command cmd) {
        std::string name = cmd.name;
        commands_[name] = std::move(cmd);
    }

    int run(int argc, char** argv) {
        std::vector<std::string> words(argv + 1, argv + argc);
        if (words.empty()) {
            std::cerr << help();
            return 1;
        }

        const std::string& cmd_name = words.front();
        if (cmd_name == "--help" || cmd_name == "-h") {
            std::cout << help();
            return 0;
        }
        if (cmd_name == "--version") {
            std::cout << program_name_ << " " << version_ << "\n";
            return 0;
        }

        auto it = commands_.find(cmd_name);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd_name << "\n"
                      << "Run '" << program_name_ << " --help' for available commands.\n";
            return 1;
        }
        const Command& cmd = it->second;

        words.erase(words.begin());
        for (const auto& word : words) {
            if (word == "--help" || word == "-h") {
                std::cout << cmd.usage(program_name_);
                return 0;
            }
        }

        try {
            return cmd.handler(cmd.parse(words));
        } catch (const UsageError& e) {
            std::cerr << "Error: " << e.what() << "\n\n" << cmd.usage(program_name_);
            return 2;
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    std::string help() const {
        size_t width = 0;
        for (const auto& entry : commands_) {
            width = std::max(width, entry.first.size());
        }

        std::ostringstream out;
        out << program_name_ << " " << version_
            << " - entity canonicalization and graph-ranked context\n\n"
            << "Usage: " << program_name_ << " <command> [options]\n\nCommands:\n";
        for (const auto& entry : commands_) {
            out << "  " << entry.first << std::string(width - entry.first.size() + 3, ' ')
                << entry.second.description << "\n";
        }
        out << "\nRun '" << program_name_ << " <command> --help' for command options.\n";
        return out.str();
    }

    const Command* find(const std::string& name) const {
        auto it = commands_.find(name);
        return it != commands_.end() ? &it->second : nullptr;
    }

private:
    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace cli
} // namespace lore
