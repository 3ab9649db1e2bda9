#include <cxxopts.hpp>
#include <iostream>
#include <nlohmann/json.hpp>
#include "overlay/Convert.hpp"
#include "overlay/DotPath.hpp"
#include "overlay/Errors.hpp"
#include "overlay/Loader.hpp"
#include "overlay/MergeResult.hpp"
#include "overlay/Serialize.hpp"
#include "overlay/Validate.hpp"

using namespace overlay;

namespace {

void print_changelog(const MergeResult& result) {
    std::cerr << "Changes: " << result.changelog().to_summary().dump(2) << "\n";
    for (const auto& w : result.warnings()) {
        std::cerr << "Warning: " << w << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("overlay", "Merge configuration overlays into existing documents");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("o,out", "Output file (merge: defaults to EXISTING)", cxxopts::value<std::string>())
            ("to", "Output format for convert: yaml|json|toml", cxxopts::value<std::string>()->default_value("yaml"))
            ("dry-run", "Print the merged document instead of writing it")
            ("summary", "Print the merge changelog as JSON")
            ("v,verbose", "Report changes and warnings on stderr")
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: merge EXISTING UPDATE | validate FILE | get FILE KEY | convert FILE\n";
            return 0;
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];
        const bool verbose = result.count("verbose") > 0;

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
                return false;
            }
            return true;
        };

        // MERGE
        if (cmd == "merge") {
            if (!expect_args(3)) return 1;
            const std::string existing_path = cmdv[1];
            const std::string update_path = cmdv[2];

            // A missing target is a new file: merge onto nothing
            const std::string existing = file_exists(existing_path) ? read_text_file(existing_path) : "";
            const std::string update = read_text_file(update_path);

            MergeResult merged = merge_documents(existing, update);
            // to_text() can still fail the result
            const std::string text = merged.success() ? merged.to_text() : "";
            if (!merged.success()) {
                for (const auto& e : merged.errors()) {
                    std::cerr << "Error: " << e << "\n";
                }
                std::cerr << "Left " << existing_path << " unchanged\n";
                return 1;
            }

            if (verbose) print_changelog(merged);
            if (result.count("summary")) {
                std::cout << merged.changelog().to_summary().dump(2) << "\n";
            }

            if (result.count("dry-run")) {
                std::cout << text << "\n";
                return 0;
            }

            const std::string out = result.count("out") ? result["out"].as<std::string>() : existing_path;
            write_text_file(out, text.empty() ? text : text + "\n");
            std::cout << "Merged " << update_path << " into " << out << "\n";
            return 0;
        }

        // VALIDATE
        if (cmd == "validate") {
            if (!expect_args(2)) return 1;
            const auto report = validate_document(read_text_file(cmdv[1]));
            if (report.valid) {
                std::cout << "valid\n";
                return 0;
            }
            for (const auto& e : report.errors) {
                std::cerr << cmdv[1] << ": " << e << "\n";
            }
            return 1;
        }

        // GET
        if (cmd == "get") {
            if (!expect_args(3)) return 1;
            const Value doc = load_document_file(cmdv[1]);
            try {
                std::cout << get_by_dot(doc, cmdv[2])->dump(2) << "\n";
            } catch (const KeyError& ex) {
                std::cerr << ex.what() << "\n";
                return 1;
            }
            return 0;
        }

        // CONVERT
        if (cmd == "convert") {
            if (!expect_args(2)) return 1;
            const Value doc = load_document_file(cmdv[1]);
            const std::string to = result["to"].as<std::string>();

            std::string text;
            if (to == "json") text = to_json_string(doc, 2);
            else if (to == "toml") text = to_toml_string(doc);
            else if (to == "yaml") text = serialize_document(doc);
            else {
                std::cerr << "Error: unknown format '" << to << "'\n";
                return 1;
            }

            if (result.count("out")) {
                const std::string out = result["out"].as<std::string>();
                write_text_file(out, text + "\n");
                std::cout << "Wrote " << to << " to " << out << "\n";
            } else {
                std::cout << text << "\n";
            }
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const ParseError& pe) {
        std::cerr << "Parse error: " << pe.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
