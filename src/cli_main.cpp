#include <cxxopts.hpp>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "strata/CliOptions.hpp"
#include "strata/Errors.hpp"
#include "strata/Loader.hpp"
#include "strata/Merge.hpp"

using namespace strata;

int main(int argc, char** argv) {
    try {
        auto options = make_cli_options();
        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("files")) {
            std::cout << options.help() << "\n";
            return result.count("help") ? 0 : 1;
        }

        const MergeOptions merge_opts = build_merge_options(result);

        std::vector<Value> layers;
        for (const auto& file : result["files"].as<std::vector<std::string>>()) {
            layers.push_back(load_config_file(file));
        }

        Value merged = deep_merge_all(layers, merge_opts);

        const std::string to = result["to"].as<std::string>();
        std::string text;
        if (to == "json") {
            text = to_json_string(merged, 2) + "\n";
        } else if (to == "toml") {
            text = to_toml_string(merged);
        } else {
            std::cerr << "Error: unknown output format '" << to << "'\n";
            return 1;
        }

        if (result.count("out")) {
            const std::string out = result["out"].as<std::string>();
            std::ofstream ofs(out);
            if (!ofs) {
                std::cerr << "Error: cannot write to " << out << "\n";
                return 1;
            }
            ofs << text;
        } else {
            std::cout << text;
        }
        return 0;

    } catch (const ConfigError& err) {
        std::cerr << "Error: " << err.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
