#include <cxxopts.hpp>
#include <iostream>
#include <memory>
#include <vector>
#include "persondir/Config.hpp"
#include "persondir/Directory.hpp"
#include "persondir/Errors.hpp"
#include "persondir/Loader.hpp"
#include "persondir/Log.hpp"
#include "persondir/Util.hpp"

using namespace persondir;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("persondir", "Merge person attributes from several sources");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("c,config", "Path to JSON/TOML config", cxxopts::value<std::string>())
            ("p,prefix", "Env-var prefix for overrides", cxxopts::value<std::string>())
            ("overrides", "Comma-separated dot.key:JSON_value pairs", cxxopts::value<std::string>()->default_value(""))
            ("s,strategy", "Merge strategy: multivalued | replacing | noncolliding", cxxopts::value<std::string>())
            ("distinct", "Skip duplicate values when merging multivalued attributes")
            ("v,verbose", "Log debug output to stderr")
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: merge FILE1 FILE2 [FILE...] | lookup UID [FILE...] | attributes [FILE...]\n";
            return 0;
        }

        if (result.count("verbose")) {
            set_log_level(spdlog::level::debug);
        }

        // Prepare LoadOptions; command-line flags override everything else
        LoadOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        if (result.count("prefix")) load.prefix = result["prefix"].as<std::string>();
        if (result.count("overrides")) {
            load.overrides = parse_overrides(result["overrides"].as<std::string>());
        }
        if (result.count("strategy")) load.overrides["merger.strategy"] = result["strategy"].as<std::string>();
        if (result.count("distinct")) load.overrides["merger.distinct"] = true;

        Settings settings = Settings::from_config(Config::load(load));

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        const std::string cmd = cmdv[0];
        std::vector<std::string> args(cmdv.begin() + 1, cmdv.end());

        // MERGE
        if (cmd == "merge") {
            if (args.size() < 2) {
                std::cerr << "Error: merge needs at least two person files\n";
                return 1;
            }
            auto merger = settings.make_merger();
            PersonSet merged = merge_people_files(*merger, args);
            std::cout << people_to_json(merged).dump(2) << "\n";
            return 0;
        }

        // LOOKUP
        if (cmd == "lookup") {
            if (args.empty()) {
                std::cerr << "Error: lookup needs a UID\n";
                return 1;
            }
            const std::string uid = args[0];
            std::vector<std::string> files(args.begin() + 1, args.end());
            if (files.empty()) files = settings.source_files;
            if (files.empty()) {
                std::cerr << "Error: no person files given and sources.files is empty\n";
                return 1;
            }

            auto directory = build_directory(settings, files);
            PersonPtr person = directory->get_person(uid);
            if (!person) {
                std::cout << "null\n";
                return 1;
            }
            std::cout << people_to_json(PersonSet{person})[0].dump(2) << "\n";
            return 0;
        }

        // ATTRIBUTES
        if (cmd == "attributes") {
            std::vector<std::string> files = args.empty() ? settings.source_files : args;
            auto directory = build_directory(settings, files);

            Value out = Value::object();
            out["query"] = directory->get_available_query_attributes();
            out["user"] = directory->get_possible_user_attribute_names();
            std::cout << out.dump(2) << "\n";
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const IncorrectResultSize& irs) {
        std::cerr << "Error: lookup is ambiguous, " << irs.actual() << " people matched\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
