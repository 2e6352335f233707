#pragma once

#include <map>
#include <string>
#include <vector>

namespace chunkwire::core {

// Global options shared by every command. Commands and their arguments
// are left in get_positional_args() for the CommandRegistry.
class CommandLineParser {
public:
    struct Option {
        char short_name;          // '\0' when there is none
        std::string name;
        std::string value_name;   // empty for flags
        std::string description;
        std::string default_value;
        bool numeric = false;
    };

    explicit CommandLineParser(std::string program_name);

    // Accepts --name=value, --name value, -x value and -xvalue. Flags take no value.
    bool parse(int argc, char* argv[]);

    bool has_option(const std::string& name) const;
    // The parsed value, else the option's own default, else default_value.
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    int get_int_option(const std::string& name, int default_value = 0) const;
    bool get_bool_option(const std::string& name, bool default_value = false) const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    const Option* find(const std::string& name) const;
    const Option* find(char short_name) const;
    bool store(const Option& option, const std::string& spelling, std::string value);

    std::string program_name_;
    std::vector<Option> options_;
    std::map<std::string, std::string> values_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
