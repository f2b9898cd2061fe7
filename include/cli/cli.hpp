#pragma once

#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace lodbook {

// Value of one option on the command line
struct OptionValue {
    std::string value;
    bool is_set = false;

    /**
     * @throws std::runtime_error if the value is not a number
     */
    int as_int(int default_val = 0) const {
        if (!is_set) return default_val;
        size_t used = 0;
        int number = 0;
        try {
            number = std::stoi(value, &used);
        } catch (const std::exception&) {
            throw std::runtime_error("Expected a number, got: " + value);
        }
        if (used != value.size()) {
            throw std::runtime_error("Expected a number, got: " + value);
        }
        return number;
    }
};

// Options given to one command, by long name
class Args {
public:
    OptionValue get(const std::string& name, const std::string& default_val = "") const {
        auto it = values_.find(name);
        if (it != values_.end()) return it->second;
        return OptionValue{default_val, !default_val.empty()};
    }

    bool has(const std::string& name) const {
        auto it = values_.find(name);
        return it != values_.end() && it->second.is_set;
    }

    // Presence of a flag option
    bool flag(const std::string& name) const {
        return has(name) && get(name).value != "false";
    }

    std::string require(const std::string& name) const {
        if (!has(name)) {
            throw std::runtime_error("Missing required argument: --" + name);
        }
        return values_.at(name).value;
    }

    void set(const std::string& name, const std::string& value) {
        values_[name] = OptionValue{value, true};
    }

private:
    std::map<std::string, OptionValue> values_;
};

// Declaration of one option
struct OptionSpec {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;   // Takes no value
};

// A subcommand and its options
struct Command {
    std::string name;
    std::string description;
    std::vector<OptionSpec> options;
    std::function<int(const Args&)> handler;

    // Option named by "--name" or "-n", nullptr if none
    const OptionSpec* find_option(const std::string& token) const {
        for (const auto& option : options) {
            if (token == "--" + option.name) return &option;
            if (!option.short_name.empty() && token == "-" + option.short_name) return &option;
        }
        return nullptr;
    }

    /**
     * @brief Read this command's options
     * @throws std::runtime_error on unknown arguments, stray positional
     *         arguments, missing values or missing required options
     */
    Args parse(const std::vector<std::string>& tokens) const {
        Args args;

        for (size_t i = 0; i < tokens.size(); ++i) {
            const std::string& token = tokens[i];

            // --name=value
            size_t eq = token.find('=');
            if (token.rfind("--", 0) == 0 && eq != std::string::npos) {
                const OptionSpec* option = find_option(token.substr(0, eq));
                if (!option) {
                    throw std::runtime_error("Unknown argument: " + token);
                }
                args.set(option->name, token.substr(eq + 1));
                continue;
            }

            const OptionSpec* option = find_option(token);
            if (!option) {
                throw std::runtime_error("Unknown argument: " + token);
            }

            if (option->is_flag) {
                args.set(option->name, "true");
            } else if (i + 1 < tokens.size()) {
                args.set(option->name, tokens[++i]);
            } else {
                throw std::runtime_error("Argument " + token + " requires a value");
            }
        }

        for (const auto& option : options) {
            if (args.has(option.name)) continue;
            if (option.required) {
                throw std::runtime_error("Missing required argument: --" + option.name);
            }
            if (!option.default_value.empty()) {
                args.set(option.name, option.default_value);
            }
        }

        return args;
    }

    void print_help(const std::string& program) const {
        std::cout << "\nUsage: " << program << " " << name;
        for (const auto& option : options) {
            if (option.required) {
                std::cout << " --" << option.name << " <value>";
            }
        }
        std::cout << " [options]\n\n" << description << "\n\nOptions:\n";

        for (const auto& option : options) {
            std::cout << "  --" << option.name;
            if (!option.short_name.empty()) std::cout << ", -" << option.short_name;
            if (!option.is_flag) std::cout << " <value>";
            std::cout << "\n      " << option.description;
            if (!option.default_value.empty()) {
                std::cout << " (default: " << option.default_value << ")";
            }
            if (option.required) std::cout << " [required]";
            std::cout << "\n";
        }
        std::cout << "\n";
    }
};

// Dispatches `<program> <command> [options]` to registered commands
class CLI {
public:
    CLI(const std::string& program_name, const std::string& version)
        : program_name_(program_name), version_(version) {}

    void register_command(Command command) {
        commands_[command.name] = std::move(command);
    }

    int run(int argc, char** argv) {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string name = argv[1];
        if (name == "--help" || name == "-h") {
            print_help();
            return 0;
        }
        if (name == "--version" || name == "-v") {
            std::cout << program_name_ << " version " << version_ << "\n";
            return 0;
        }

        auto it = commands_.find(name);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << name << "\n"
                      << "Run '" << program_name_ << " --help' for available commands.\n";
            return 1;
        }
        const Command& command = it->second;

        std::vector<std::string> tokens(argv + 2, argv + argc);
        for (const auto& token : tokens) {
            if (token == "--help" || token == "-h") {
                command.print_help(program_name_);
                return 0;
            }
        }

        Args args;
        try {
            args = command.parse(tokens);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            command.print_help(program_name_);
            return 1;
        }

        try {
            return command.handler(args);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    void print_help() const {
        std::cout << program_name_ << " - cross-link narrative documents with entity records\n\n"
                  << "Usage: " << program_name_ << " <command> [options]\n\nCommands:\n";
        for (const auto& [name, command] : commands_) {
            std::cout << "  " << name << std::string(name.size() < 12 ? 12 - name.size() : 1, ' ')
                      << command.description << "\n";
        }
        std::cout << "\nRun '" << program_name_ << " <command> --help' for command-specific options.\n"
                  << "\nVersion: " << version_ << "\n";
    }

private:
    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace lodbook
