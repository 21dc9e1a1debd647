//
//  main.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-16.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "tempoit/activation.h"
#include "tempoit/config.h"
#include "tempoit/logging.hpp"
#include "tempoit/pipeline.h"
#include "tempoit/preset.h"
#include "tempoit/version.h"

#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitItemFailure = 1;
constexpr int kExitUsage = 2;

void print_usage(std::ostream& out) {
    out << "Usage:\n"
        << "  tempoit [options] single <activations> [-o output]\n"
        << "  tempoit [options] batch <activations...> [-o output_dir] [-s suffix] [-j jobs]\n"
        << "\n"
        << "Inputs are activation caches (binary or text).\n"
        << "\n"
        << "Options:\n"
        << "  --preset <name>        apply a preset (";
    const auto presets = tempoit::tempo_preset_names();
    for (std::size_t i = 0; i < presets.size(); ++i) {
        out << (i ? ", " : "") << presets[i];
    }
    out << ")\n"
        << "  --config <file>        read key=value options from a file\n"
        << "  --<option> <value>     set an option:";
    for (const auto& name : tempoit::config_option_names()) {
        out << " " << name;
    }
    out << "\n"
        << "  --save                 write the activation cache instead of tempi\n"
        << "  --save-text            as --save, text format\n"
        << "  --timeout <seconds>    per-item time limit in batch mode\n"
        << "  -v, --verbose          debug logging\n"
        << "  --version              print the version\n"
        << "  -h, --help             show this help\n";
}

bool is_flag_option(const std::string& name) {
    return name == "verbose" || name == "profile";
}

std::string option_key(std::string arg) {
    arg.erase(0, 2);
    std::replace(arg.begin(), arg.end(), '-', '_');
    return arg;
}

} // namespace

int main(int argc, char** argv) {
    tempoit::TempoConfig config;
    tempoit::PipelineOptions options;
    std::string mode;
    std::string output;
    std::vector<std::string> inputs;
    bool save = false;
    auto save_format = tempoit::ActivationCacheFormat::Binary;

    const std::vector<std::string> known = tempoit::config_option_names();
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next_value = [&](std::string* value) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            *value = argv[++i];
            return true;
        };

        std::string value;
        std::string error;
        if (arg == "-h" || arg == "--help") {
            print_usage(std::cout);
            return kExitOk;
        }
        if (arg == "--version") {
            std::cout << "tempoit " << tempoit::version_string() << "\n";
            return kExitOk;
        }
        if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--profile") {
            config.profile = true;
        } else if (arg == "--save") {
            save = true;
            save_format = tempoit::ActivationCacheFormat::Binary;
        } else if (arg == "--save-text") {
            save = true;
            save_format = tempoit::ActivationCacheFormat::Text;
        } else if (arg == "-o" || arg == "--output") {
            if (!next_value(&output)) {
                return kExitUsage;
            }
        } else if (arg == "-s" || arg == "--suffix") {
            if (!next_value(&options.suffix)) {
                return kExitUsage;
            }
        } else if (arg == "-j" || arg == "--jobs") {
            if (!next_value(&value)) {
                return kExitUsage;
            }
            if (!tempoit::parse_size(value, &options.jobs) || options.jobs == 0) {
                std::cerr << "Invalid value '" << value << "' for " << arg
                          << " (expected a positive count).\n";
                return kExitUsage;
            }
        } else if (arg == "--timeout") {
            if (!next_value(&value)) {
                return kExitUsage;
            }
            if (!tempoit::parse_double(value, &options.item_timeout_seconds) ||
                options.item_timeout_seconds < 0.0) {
                std::cerr << "Invalid value '" << value << "' for " << arg
                          << " (expected seconds, 0 disables the limit).\n";
                return kExitUsage;
            }
        } else if (arg == "--preset") {
            if (!next_value(&value)) {
                return kExitUsage;
            }
            const auto preset = tempoit::make_tempo_preset(value);
            if (!preset) {
                std::cerr << "Unknown preset: " << value << "\n";
                return kExitUsage;
            }
            preset->apply(config);
        } else if (arg == "--config") {
            if (!next_value(&value)) {
                return kExitUsage;
            }
            if (!tempoit::load_config_file(value, config, &error)) {
                std::cerr << error << "\n";
                return kExitUsage;
            }
        } else if (arg.rfind("--", 0) == 0) {
            const std::string key = option_key(arg);
            if (std::find(known.begin(), known.end(), key) == known.end() &&
                key != "fps" && key != "format") {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(std::cerr);
                return kExitUsage;
            }
            if (is_flag_option(key)) {
                value = "true";
            } else if (!next_value(&value)) {
                return kExitUsage;
            }
            if (!tempoit::apply_config_option(config, key, value, &error)) {
                std::cerr << error << "\n";
                return kExitUsage;
            }
        } else if (mode.empty()) {
            mode = arg;
        } else {
            inputs.push_back(arg);
        }
    }

    tempoit::set_log_verbosity_from_config(config);

    if (mode != "single" && mode != "batch") {
        print_usage(std::cerr);
        return kExitUsage;
    }
    if (inputs.empty() || (mode == "single" && inputs.size() != 1)) {
        std::cerr << "Mode '" << mode << "' needs "
                  << (mode == "single" ? "exactly one input" : "at least one input") << ".\n";
        return kExitUsage;
    }

    std::vector<std::unique_ptr<tempoit::OutputStage>> stages;
    if (save) {
        stages.push_back(std::make_unique<tempoit::CacheWriterStage>(save_format));
    } else {
        stages.push_back(std::make_unique<tempoit::TempoOutputStage>(config));
    }
    if (mode == "batch") {
        options.output_dir = output;
    }
    tempoit::PipelineRunner runner(std::make_unique<tempoit::CachedActivationSource>(),
                                   std::move(stages),
                                   options);

    std::string error;
    if (!runner.validate(&error)) {
        std::cerr << error << "\n";
        return kExitUsage;
    }

    if (mode == "single") {
        const tempoit::ItemResult result = runner.run_single(inputs.front(), output);
        return result.ok ? kExitOk : kExitItemFailure;
    }

    const tempoit::BatchReport report = runner.run_batch(inputs);
    if (!report.error.empty()) {
        std::cerr << report.error << "\n";
        return kExitUsage;
    }
    for (const auto& item : report.items) {
        if (!item.ok) {
            std::cerr << "FAILED " << item.input << ": " << item.error << "\n";
        }
    }
    return report.ok() ? kExitOk : kExitItemFailure;
}
