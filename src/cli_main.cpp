#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "stringly/Document.hpp"
#include "stringly/EnvMapper.hpp"
#include "stringly/Errors.hpp"
#include "stringly/Loader.hpp"
#include "stringly/Parse.hpp"
#include "stringly/Util.hpp"
#include "ServiceSettings.hpp"

using namespace stringly;
using stringly::cli::ServiceSettings;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("stringly-cli", "Read & update typed service settings via dotted keys");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("c,config", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
            ("p,prefix", "Env-var prefix for overrides", cxxopts::value<std::string>())
            ("overrides", "Comma-separated key:value pairs", cxxopts::value<std::string>()->default_value(""))
            ("to", "Dump format (json|toml)", cxxopts::value<std::string>()->default_value("json"))
            ("h,help", "Show help");

        // Command + sub-options captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: get KEY | set KEY VALUE | type KEY | keys | dump [--to json|toml]\n";
            return 0;
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        const std::string cmd = cmdv[0];

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
                return false;
            }
            return true;
        };

        // SET (requires --config; only the file layer is written back)
        if (cmd == "set") {
            if (!expect_args(3)) return 1;
            if (!result.count("config")) {
                std::cerr << "Error: --config must be provided for `set`\n";
                return 1;
            }
            const std::string path = result["config"].as<std::string>();
            const std::string key = cmdv[1];
            Value parsed = parse_value(cmdv[2]);

            ServiceSettings settings;
            apply_document(settings, load_document(path));
            set(settings, key, parsed);
            write_document(path, snapshot(settings));
            std::cout << "Set " << key << " = " << parsed << " in " << path << "\n";
            return 0;
        }

        // Layers: defaults -> file -> env (prefix) -> overrides
        ServiceSettings settings;
        if (result.count("config")) {
            apply_document(settings, load_document(result["config"].as<std::string>()));
        }
        if (result.count("prefix")) {
            apply_env(settings, result["prefix"].as<std::string>());
        }
        apply_overrides(settings, parse_overrides(result["overrides"].as<std::string>()));

        // GET
        if (cmd == "get") {
            if (!expect_args(2)) return 1;
            std::cout << get(settings, cmdv[1]) << "\n";
            return 0;
        }

        // TYPE
        if (cmd == "type") {
            if (!expect_args(2)) return 1;
            try {
                std::cout << get(settings, cmdv[1]).type_name() << "\n";
            } catch (const CantSerialize& aggregate) {
                std::cout << aggregate.type_name() << "\n";
            }
            return 0;
        }

        // KEYS
        if (cmd == "keys") {
            for (const auto& [key, value] : flatten(settings)) {
                std::cout << key << " (" << value.type_name() << ")\n";
            }
            return 0;
        }

        // DUMP
        if (cmd == "dump") {
            const std::string to = result["to"].as<std::string>();
            const nlohmann::json doc = snapshot(settings);
            if (to == "toml") {
                std::cout << to_toml_string(doc) << "\n";
            } else if (to == "json") {
                std::cout << doc.dump(2) << "\n";
            } else {
                std::cerr << "Error: unknown dump format '" << to << "'\n";
                return 1;
            }
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
