#include "cli_commands.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "GrimError.hpp"
#include "SourceManager.hpp"
#include "colors.hpp"
#include "evaluator.hpp"
#include "lexer.hpp"
#include "parser.hpp"

#ifndef GRIM_VERSION
#define GRIM_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace grim {
namespace cli {

static const char* kConfigFileName = "grim.json";
static const char* kScriptExtension = ".grim";

std::optional<LoopScope> parse_loop_scope(const std::string& text) {
    if (text == "shared") return LoopScope::Shared;
    if (text == "per-iteration") return LoopScope::PerIteration;
    return std::nullopt;
}

std::string usage_text() {
    return "Usage: grim [options] <file>\n"
           "Options:\n"
           "  -h, --help              Show this help message\n"
           "  -v, --version           Print version and exit\n"
           "  --config <path>         Use this grim.json instead of searching for one\n"
           "  --loop-scope <mode>     Loop body scope: shared | per-iteration\n"
           "  --no-color              Never colorize diagnostics\n"
           "  --                      End of options\n"
           "\n"
           "Without <file>, the \"entry\" script named in grim.json is run.";
}

// Parse grim.json properly with nlohmann/json
std::optional<ProjectConfig> parse_grim_json(const std::string& filepath, std::ostream& diag) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        json j = json::parse(file);

        ProjectConfig config;
        config.is_valid = true;
        config.root = fs::absolute(fs::path(filepath)).parent_path().string();

        // Extract basic fields with defaults
        config.name = j.value("name", "");
        config.version = j.value("version", "");
        config.entry = j.value("entry", "");

        if (j.contains("interpreter") && j["interpreter"].is_object()) {
            const json& interp = j["interpreter"];

            if (interp.contains("loop_scope")) {
                const json& ls = interp["loop_scope"];
                std::optional<LoopScope> scope;
                if (ls.is_string()) scope = parse_loop_scope(ls.get<std::string>());
                if (scope) {
                    config.interpreter.loop_scope = scope;
                } else {
                    diag << "Warning: " << filepath << ": invalid interpreter.loop_scope " << ls.dump()
                         << " (expected \"shared\" or \"per-iteration\"); ignored" << std::endl;
                }
            }

            for (const char* key : {"color", "banner"}) {
                if (!interp.contains(key)) continue;
                const json& v = interp[key];
                if (!v.is_boolean()) {
                    diag << "Warning: " << filepath << ": interpreter." << key << " must be true or false; ignored" << std::endl;
                    continue;
                }
                if (std::string(key) == "color")
                    config.interpreter.color = v.get<bool>();
                else
                    config.interpreter.banner = v.get<bool>();
            }
        }

        return config;

    } catch (const json::parse_error& e) {
        diag << "Warning: JSON parse error in " << filepath << ": " << e.what() << "; using defaults" << std::endl;
        return std::nullopt;
    } catch (const json::exception& e) {
        diag << "Warning: Invalid " << kConfigFileName << " at " << filepath << ": " << e.what() << "; using defaults" << std::endl;
        return std::nullopt;
    }
}

std::string get_project_root(const std::string& start_dir) {
    std::error_code ec;
    fs::path current = fs::absolute(start_dir, ec);
    if (ec) return "";

    while (true) {
        fs::path config_path = current / kConfigFileName;
        if (fs::exists(config_path, ec)) {
            return current.string();
        }

        if (!current.has_parent_path() || current == current.parent_path()) {
            break;
        }
        current = current.parent_path();
    }

    return "";
}

std::optional<ProjectConfig> find_and_parse_grim_json(const std::string& start_dir, std::ostream& diag) {
    std::string root = get_project_root(start_dir);
    if (root.empty()) {
        return std::nullopt;
    }

    return parse_grim_json((fs::path(root) / kConfigFileName).string(), diag);
}

std::optional<CommandResult> parse_command_line(const std::vector<std::string>& args, CommandLine& cmd) {
    bool seen_double_dash = false;

    // option value may be given as `--opt value` or `--opt=value`
    auto take_value = [&](size_t& i, const std::string& arg, const std::string& name, std::string& value) -> bool {
        if (arg.size() > name.size() && arg.compare(0, name.size() + 1, name + "=") == 0) {
            value = arg.substr(name.size() + 1);
            return true;
        }
        if (i + 1 >= args.size()) return false;
        value = args[++i];
        return true;
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        // If it looks like an option (starts with '-') handle/validate it
        if (!seen_double_dash && arg.size() > 1 && arg[0] == '-') {
            if (arg == "--") {
                seen_double_dash = true;
                continue;
            }
            if (arg == "-v" || arg == "--version") {
                return CommandResult{0, std::string("grim v") + GRIM_VERSION};
            }
            if (arg == "-h" || arg == "--help") {
                return CommandResult{0, usage_text()};
            }
            if (arg == "--no-color") {
                cmd.no_color = true;
                continue;
            }
            if (arg.rfind("--config", 0) == 0 && (arg.size() == 8 || arg[8] == '=')) {
                std::string value;
                if (!take_value(i, arg, "--config", value) || value.empty()) {
                    return CommandResult{1, "grim: option '--config' requires a path"};
                }
                cmd.config_path = value;
                continue;
            }
            if (arg.rfind("--loop-scope", 0) == 0 && (arg.size() == 12 || arg[12] == '=')) {
                std::string value;
                if (!take_value(i, arg, "--loop-scope", value)) {
                    return CommandResult{1, "grim: option '--loop-scope' requires a mode (shared | per-iteration)"};
                }
                auto scope = parse_loop_scope(value);
                if (!scope) {
                    return CommandResult{1, "grim: invalid loop scope '" + value + "' (expected shared or per-iteration)"};
                }
                cmd.loop_scope = scope;
                continue;
            }
            return CommandResult{1, "grim: unknown option '" + arg + "'\nTry 'grim --help' for more information."};
        }

        // First non-option argument is treated as filename
        if (cmd.script) {
            return CommandResult{1, "grim: unexpected argument '" + arg + "' (only one script can be run)"};
        }
        cmd.script = arg;
    }

    return std::nullopt;
}

RunSettings resolve_settings(const std::optional<ProjectConfig>& config, const CommandLine& cmd) {
    RunSettings settings;
    if (config) {
        if (config->interpreter.loop_scope) settings.evaluator.loop_scope = *config->interpreter.loop_scope;
        if (config->interpreter.color) settings.color = *config->interpreter.color;
        if (config->interpreter.banner) settings.banner = *config->interpreter.banner;
    }
    // flags override the project file
    if (cmd.loop_scope) settings.evaluator.loop_scope = *cmd.loop_scope;
    if (cmd.no_color) settings.color = false;
    return settings;
}

// `main` may be given without its extension when main.grim exists
static std::optional<fs::path> resolve_script_path(const std::string& potential) {
    fs::path p(potential);
    std::error_code ec;
    if (fs::exists(p, ec)) return p;
    if (!p.has_extension()) {
        fs::path candidate = p;
        candidate += kScriptExtension;
        if (fs::exists(candidate, ec)) return candidate;
    }
    return std::nullopt;
}

CommandResult run_script(const std::string& path, const RunSettings& settings, std::istream& in, std::ostream& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return {1, "Error: Could not open file " + path};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string source_code = buffer.str();

    SourceManager src_mgr(path, source_code);

    if (settings.banner) {
        out << "Hi!\n"
            << "Grim language interpreter started!\n";
    }

    try {
        Lexer lexer(source_code, path, &src_mgr);
        std::vector<Token> tokens = lexer.tokenize();

        Parser parser(tokens);
        std::unique_ptr<ProgramNode> ast = parser.parse();

        Evaluator evaluator(settings.evaluator, in, out);
        evaluator.evaluate(ast.get());
    } catch (const GrimError& e) {
        out.flush();
        return {1, std::string("Error: ") + e.what()};
    } catch (const std::exception& e) {
        out.flush();
        return {1, std::string("Error: InternalError\n") + e.what()};
    }

    if (settings.banner) {
        out << "Goodbye =)\n";
    }
    out.flush();
    return {0, ""};
}

CommandResult execute_command(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err) {
    CommandLine cmd;
    if (auto done = parse_command_line(args, cmd)) {
        return *done;
    }

    std::optional<ProjectConfig> config;
    if (cmd.config_path) {
        std::error_code ec;
        if (!fs::is_regular_file(*cmd.config_path, ec)) {
            return {1, "Error: Config file not found: " + *cmd.config_path};
        }
        config = parse_grim_json(*cmd.config_path, err);
    } else {
        std::string start_dir = ".";
        if (cmd.script) {
            fs::path dir = fs::path(*cmd.script).parent_path();
            if (!dir.empty()) start_dir = dir.string();
        }
        config = find_and_parse_grim_json(start_dir, err);
    }

    RunSettings settings = resolve_settings(config, cmd);

    std::string script;
    if (cmd.script) {
        script = *cmd.script;
    } else if (config && !config->entry.empty()) {
        script = (fs::path(config->root) / config->entry).string();
    } else {
        return {1, "Error: No script given and no \"entry\" in " + std::string(kConfigFileName) + "\n" + usage_text()};
    }

    auto resolved = resolve_script_path(script);
    if (!resolved) {
        return {1, "Error: File not found: " + script};
    }

    CommandResult result = run_script(resolved->string(), settings, in, out);
    if (result.exit_code != 0 && settings.color && &err == &std::cerr && Color::supports_color(STDERR_FILENO)) {
        result.message = Color::paint(result.message, Color::red, true);
    }
    return result;
}

}  // namespace cli
}  // namespace grim
