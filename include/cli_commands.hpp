#ifndef GRIM_CLI_COMMANDS_HPP
#define GRIM_CLI_COMMANDS_HPP

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "evaluator.hpp"

namespace grim {
namespace cli {

// Structure to hold parsed grim.json data
struct ProjectConfig {
    std::string name;
    std::string version;
    std::string entry;

    // "interpreter" section; unset keys fall back to the defaults
    struct Interpreter {
        std::optional<LoopScope> loop_scope;
        std::optional<bool> color;
        std::optional<bool> banner;
    };
    Interpreter interpreter;

    std::string root;  // directory holding the grim.json

    bool is_valid = false;
};

// Command-line flags, before they are merged with grim.json
struct CommandLine {
    std::optional<std::string> script;
    std::optional<std::string> config_path;
    std::optional<LoopScope> loop_scope;
    bool no_color = false;
};

// Effective settings for one run
struct RunSettings {
    EvaluatorOptions evaluator;
    bool color = true;
    bool banner = false;
};

// Command result structure
struct CommandResult {
    int exit_code;
    std::string message;
};

// Main command dispatcher: `grim [options] <file>`
CommandResult execute_command(const std::vector<std::string>& args,
    std::istream& in = std::cin,
    std::ostream& out = std::cout,
    std::ostream& err = std::cerr);

// Parses flags into `cmd`. Returns a result when the command is already
// finished (help, version, usage error), nullopt when a script should run.
std::optional<CommandResult> parse_command_line(const std::vector<std::string>& args, CommandLine& cmd);

// Lex, parse and evaluate one script file.
CommandResult run_script(const std::string& path, const RunSettings& settings,
    std::istream& in = std::cin,
    std::ostream& out = std::cout);

RunSettings resolve_settings(const std::optional<ProjectConfig>& config, const CommandLine& cmd);

// Helper functions
std::optional<ProjectConfig> find_and_parse_grim_json(const std::string& start_dir = ".", std::ostream& diag = std::cerr);
std::optional<ProjectConfig> parse_grim_json(const std::string& filepath, std::ostream& diag = std::cerr);
std::string get_project_root(const std::string& start_dir = ".");
std::optional<LoopScope> parse_loop_scope(const std::string& text);
std::string usage_text();

}  // namespace cli
}  // namespace grim

#endif  // GRIM_CLI_COMMANDS_HPP
