#include <cxxopts.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "pyson/Convert.hpp"
#include "pyson/Document.hpp"
#include "pyson/Errors.hpp"
#include "pyson/Loader.hpp"
#include "pyson/Parse.hpp"
#include "pyson/Validate.hpp"

using namespace pyson;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("pyson", "Inspect, edit & convert pyson documents");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("f,file", "Path to pyson document (.json is imported)", cxxopts::value<std::string>())
            ("to", "Target format for convert: json|toml", cxxopts::value<std::string>()->default_value("json"))
            ("o,out", "Write convert output to FILE", cxxopts::value<std::string>())
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: validate | get NAME | set NAME TYPE VALUE | rename OLD NEW | dump | convert [--to json|toml] [--out FILE]\n";
            return 0;
        }

        if (!result.count("file")) {
            std::cerr << "Error: --file must be provided\n";
            return 1;
        }
        const std::string path = result["file"].as<std::string>();

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        const std::string cmd = cmdv[0];

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
                std::exit(1);
            }
        };

        // VALIDATE (line syntax only, duplicate names are not checked)
        if (cmd == "validate") {
            bool ok = is_valid_document(read_text_file(path));
            std::cout << (ok ? "valid" : "invalid") << "\n";
            return ok ? 0 : 1;
        }

        // GET
        if (cmd == "get") {
            expect_args(2);
            DocumentMap doc = to_map(load_any_file(path));
            auto it = doc.find(cmdv[1]);
            if (it == doc.end()) {
                std::cerr << "Name not found: " << cmdv[1] << "\n";
                return 1;
            }
            std::cout << it->second.content() << "\n";
            return 0;
        }

        // SET (creates the file when missing)
        if (cmd == "set") {
            expect_args(4);
            NamedValue entry = parse_entry(cmdv[1] + ":" + cmdv[2] + ":" + cmdv[3]);
            bool replaced = set_entry_in_file(path, entry);
            std::cout << (replaced ? "Set " : "Added ") << entry.encode() << " in " << path << "\n";
            return 0;
        }

        // RENAME
        if (cmd == "rename") {
            expect_args(3);
            std::string old_name = rename_entry_in_file(path, cmdv[1], cmdv[2]);
            std::cout << "Renamed " << old_name << " -> " << cmdv[2] << " in " << path << "\n";
            return 0;
        }

        // DUMP
        if (cmd == "dump") {
            std::cout << encode_document(load_any_file(path));
            return 0;
        }

        // CONVERT
        if (cmd == "convert") {
            const std::string to = result["to"].as<std::string>();
            Document doc = load_any_file(path);
            std::string text;
            if (to == "toml") {
                text = to_toml_string(doc);
            } else if (to == "json") {
                text = to_json(doc).dump(2);
            } else {
                std::cerr << "Error: unsupported target format '" << to << "'\n";
                return 1;
            }

            if (result.count("out")) {
                const std::string out = result["out"].as<std::string>();
                std::ofstream ofs(out);
                if (!ofs) { std::cerr << "Error: cannot write to " << out << "\n"; return 1; }
                ofs << text << "\n";
                std::cout << "Wrote " << (to == "toml" ? "TOML" : "JSON") << " to " << out << "\n";
            } else {
                std::cout << text << "\n";
            }
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const EntryError& ee) {
        std::cerr << "Error: " << ee.what() << " [" << error_code_name(ee.cause()) << "]\n";
        return 1;
    } catch (const PysonError& pe) {
        std::cerr << "Error: " << pe.what() << " [" << error_code_name(pe.code()) << "]\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
