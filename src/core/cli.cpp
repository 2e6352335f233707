#include "chunkwire/core/cli.hpp"
#include "chunkwire/core/utils.hpp"
#include <charconv>
#include <iomanip>
#include <iostream>

namespace chunkwire::core {

CommandLineParser::CommandLineParser(std::string program_name)
    : program_name_(std::move(program_name))
    , options_{
        {'h', "help", "", "Show this help message", ""},
        {'v', "version", "", "Show version information", ""},
        {'c', "config", "file", "Configuration file path", "~/.chunkwire.conf"},
        {'p', "port", "port", "TCP port to listen on or connect to", "", true},
        {'o', "output", "dir", "Directory completed downloads are written to", "./downloads"},
        {'\0', "peer-id", "id", "Stable peer id used for resuming (default: random)", ""},
        {'\0', "verbose", "", "Enable verbose logging", ""},
    } {
}

const CommandLineParser::Option* CommandLineParser::find(const std::string& name) const {
    for (const auto& option : options_) {
        if (option.name == name) {
            return &option;
        }
    }
    return nullptr;
}

const CommandLineParser::Option* CommandLineParser::find(char short_name) const {
    for (const auto& option : options_) {
        if (option.short_name != '\0' && option.short_name == short_name) {
            return &option;
        }
    }
    return nullptr;
}

bool CommandLineParser::store(const Option& option, const std::string& spelling, std::string value) {
    if (option.numeric) {
        int parsed = 0;
        auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (ec != std::errc() || end != value.data() + value.size()) {
            error_ = "Invalid value for " + spelling + ": " + value;
            return false;
        }
    }
    values_[option.name] = std::move(value);
    return true;
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    values_.clear();
    positional_args_.clear();
    error_.clear();

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done || arg.size() < 2 || arg[0] != '-') {
            positional_args_.push_back(std::move(arg));
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        const Option* option = nullptr;
        std::string spelling;
        std::string inline_value;
        bool has_inline = false;

        if (arg[1] == '-') {
            auto eq = arg.find('=');
            spelling = arg.substr(0, eq);
            option = find(spelling.substr(2));
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                has_inline = true;
            }
        } else {
            spelling = arg.substr(0, 2);
            option = find(arg[1]);
            if (arg.size() > 2) {
                inline_value = arg.substr(2);
                has_inline = true;
            }
        }

        if (!option) {
            error_ = "Unknown option: " + spelling;
            return false;
        }

        if (option->value_name.empty()) {
            if (has_inline) {
                error_ = "Option " + spelling + " takes no value";
                return false;
            }
            values_[option->name] = "true";
            continue;
        }

        if (!has_inline) {
            if (i + 1 >= argc) {
                error_ = "Option " + spelling + " requires a value";
                return false;
            }
            inline_value = argv[++i];
        }
        if (!store(*option, spelling, std::move(inline_value))) {
            return false;
        }
    }

    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return values_.count(name) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    if (auto it = values_.find(name); it != values_.end()) {
        return it->second;
    }
    if (const auto* option = find(name); option && !option->default_value.empty()) {
        return option->default_value;
    }
    return default_value;
}

int CommandLineParser::get_int_option(const std::string& name, int default_value) const {
    auto value = get_option(name);
    int parsed = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (value.empty() || ec != std::errc() || end != value.data() + value.size()) {
        return default_value;
    }
    return parsed;
}

bool CommandLineParser::get_bool_option(const std::string& name, bool default_value) const {
    if (!has_option(name)) return default_value;

    auto value = utils::StringUtils::to_lower(get_option(name));
    return value == "true" || value == "1" || value == "yes";
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";

    for (const auto& option : options_) {
        std::string label = option.short_name != '\0'
            ? std::string("-") + option.short_name + ", --" + option.name
            : "    --" + option.name;
        if (!option.value_name.empty()) {
            label += " <" + option.value_name + ">";
        }

        std::cout << "  " << std::left << std::setw(26) << label << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version " << CHUNKWIRE_VERSION << "\n";
}

}
