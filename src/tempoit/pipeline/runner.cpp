//
//  runner.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-15.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "worker_pool.h"

#include "tempoit/logging.hpp"
#include "tempoit/pipeline.h"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace tempoit {
namespace {

double elapsed_ms_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
        .count();
}

bool timed_out(const ItemContext& context, const char* stage, std::string* error) {
    if (!context.expired()) {
        return false;
    }
    if (error) {
        *error = std::string("Timed out ") + stage + ".";
    }
    return true;
}

bool writes_stdout(const std::string& output) {
    return output.empty() || output == "-";
}

// Comparable form of a path; two items map to the same file when their keys match.
std::string path_key(const std::string& path) {
    std::error_code ec;
    std::filesystem::path full = std::filesystem::absolute(path, ec);
    if (ec) {
        full = path;
    }
    return full.lexically_normal().string();
}

} // namespace

std::size_t BatchReport::succeeded() const {
    return static_cast<std::size_t>(
        std::count_if(items.begin(), items.end(), [](const ItemResult& item) { return item.ok; }));
}

std::size_t BatchReport::failed() const {
    return items.size() - succeeded();
}

PipelineRunner::PipelineRunner(std::unique_ptr<ActivationSource> source,
                               std::vector<std::unique_ptr<OutputStage>> outputs,
                               PipelineOptions options)
    : source_(std::move(source)),
      outputs_(std::move(outputs)),
      options_(std::move(options)) {}

PipelineRunner::~PipelineRunner() = default;

bool PipelineRunner::validate(std::string* error) const {
    if (!source_) {
        if (error) {
            *error = "Pipeline has no input stage.";
        }
        return false;
    }
    if (outputs_.empty()) {
        if (error) {
            *error = "Pipeline has no output stage.";
        }
        return false;
    }
    for (const auto& stage : outputs_) {
        if (!stage) {
            if (error) {
                *error = "Pipeline has an empty output stage.";
            }
            return false;
        }
        if (!stage->validate(error)) {
            return false;
        }
    }
    if (options_.item_timeout_seconds < 0.0) {
        if (error) {
            *error = "Invalid configuration: item timeout must not be negative.";
        }
        return false;
    }
    return true;
}

ItemContext PipelineRunner::make_context(const std::string& input,
                                         const std::string& output) const {
    ItemContext context;
    context.input = input;
    context.output = output;
    if (options_.item_timeout_seconds > 0.0) {
        context.has_deadline = true;
        context.deadline = std::chrono::steady_clock::now() +
            std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::duration<double>(options_.item_timeout_seconds));
    }
    return context;
}

bool PipelineRunner::run_item(const ItemContext& context,
                              std::ostream& out,
                              std::string* error) const {
    if (timed_out(context, "before loading", error)) {
        return false;
    }

    ActivationFunction activation;
    std::string detail;
    if (!source_->load(context.input, &activation, &detail)) {
        if (error) {
            *error = std::string(source_->name()) + ": " + detail;
        }
        return false;
    }
    if (timed_out(context, "after loading", error)) {
        return false;
    }

    for (const auto& stage : outputs_) {
        detail.clear();
        if (!stage->process(activation, context, out, &detail)) {
            if (error) {
                *error = std::string(stage->name()) + ": " + detail;
            }
            // A deadline hit inside the stage reads better as a timeout.
            timed_out(context, (std::string("in ") + stage->name()).c_str(), error);
            return false;
        }
        if (timed_out(context, (std::string("after ") + stage->name()).c_str(), error)) {
            return false;
        }
    }
    return true;
}

ItemResult PipelineRunner::process(const std::string& input, std::ostream& out) const {
    ItemResult result;
    result.input = input;
    const auto start = std::chrono::steady_clock::now();

    std::string error;
    if (!validate(&error)) {
        result.error = error;
        TEMPOIT_LOG_ERROR("Pipeline: " << error);
        return result;
    }

    const ItemContext context = make_context(input, std::string());
    try {
        result.ok = run_item(context, out, &error);
    } catch (const std::exception& err) {
        error = std::string("Exception: ") + err.what();
        result.ok = false;
    } catch (...) {
        error = "Unknown exception.";
        result.ok = false;
    }
    if (!result.ok) {
        result.error = error;
        TEMPOIT_LOG_ERROR("Pipeline: " << input << ": " << error);
    }
    result.elapsed_ms = elapsed_ms_since(start);
    return result;
}

ItemResult PipelineRunner::run_to_path(const std::string& input, const std::string& output) const {
    ItemResult result;
    result.input = input;
    result.output = writes_stdout(output) ? std::string("-") : output;
    const auto start = std::chrono::steady_clock::now();

    // Buffer the whole item so a failure never leaves a partial output behind.
    std::ostringstream buffer(std::ios::out | std::ios::binary);
    std::string error;
    const ItemContext context = make_context(input, result.output);
    try {
        result.ok = run_item(context, buffer, &error);
    } catch (const std::exception& err) {
        error = std::string("Exception: ") + err.what();
        result.ok = false;
    } catch (...) {
        error = "Unknown exception.";
        result.ok = false;
    }

    if (result.ok) {
        const std::string data = buffer.str();
        if (writes_stdout(output)) {
            std::cout.write(data.data(), static_cast<std::streamsize>(data.size()));
            std::cout.flush();
            if (!std::cout) {
                result.ok = false;
                error = "Failed to write to standard output.";
            }
        } else {
            std::ofstream file(output, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                result.ok = false;
                error = "Failed to open output: " + output;
            } else {
                file.write(data.data(), static_cast<std::streamsize>(data.size()));
                file.close();
                if (!file) {
                    result.ok = false;
                    error = "Failed to write output: " + output;
                    std::error_code ec;
                    std::filesystem::remove(output, ec);
                }
            }
        }
    }

    if (!result.ok) {
        result.error = error;
        TEMPOIT_LOG_ERROR("Pipeline: " << input << ": " << error);
    } else {
        TEMPOIT_LOG_DEBUG("Pipeline: " << input << " -> " << result.output);
    }
    result.elapsed_ms = elapsed_ms_since(start);
    return result;
}

ItemResult PipelineRunner::run_single(const std::string& input, const std::string& output) const {
    std::string error;
    if (!validate(&error)) {
        ItemResult result;
        result.input = input;
        result.output = output;
        result.error = error;
        TEMPOIT_LOG_ERROR("Pipeline: " << error);
        return result;
    }
    if (!writes_stdout(output) && path_key(output) == path_key(input)) {
        ItemResult result;
        result.input = input;
        result.output = output;
        result.error = "Output path " + output + " would overwrite the input.";
        TEMPOIT_LOG_ERROR("Pipeline: " << input << ": " << result.error);
        return result;
    }
    return run_to_path(input, output);
}

std::string PipelineRunner::output_path_for(const std::string& input) const {
    namespace fs = std::filesystem;
    const fs::path in(input);
    std::string suffix = options_.suffix;
    if (suffix.empty() && !outputs_.empty() && outputs_.front()) {
        suffix = outputs_.front()->default_suffix();
    }
    const fs::path dir = options_.output_dir.empty() ? in.parent_path() : fs::path(options_.output_dir);
    return (dir / (in.stem().string() + suffix)).string();
}

BatchReport PipelineRunner::run_batch(const std::vector<std::string>& inputs) const {
    BatchReport report;
    std::string error;
    if (!validate(&error)) {
        report.error = error;
        TEMPOIT_LOG_ERROR("Pipeline: " << error);
        return report;
    }

    if (!options_.output_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(options_.output_dir, ec);
        if (ec) {
            report.error = "Failed to create output directory " + options_.output_dir + ": " +
                ec.message();
            TEMPOIT_LOG_ERROR("Pipeline: " << report.error);
            return report;
        }
    }

    // Items sharing an output file would overwrite each other; the first one keeps it.
    std::vector<std::string> outputs(inputs.size());
    std::vector<std::string> conflicts(inputs.size());
    std::unordered_map<std::string, std::size_t> claimed;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        outputs[i] = output_path_for(inputs[i]);
        const std::string key = path_key(outputs[i]);
        if (key == path_key(inputs[i])) {
            conflicts[i] = "Output path " + outputs[i] + " would overwrite the input.";
            continue;
        }
        const auto claim = claimed.emplace(key, i);
        if (!claim.second) {
            conflicts[i] = "Duplicate output path " + outputs[i] + ", already used by " +
                inputs[claim.first->second] + ".";
        }
    }

    const auto start = std::chrono::steady_clock::now();
    report.items.resize(inputs.size());
    detail::run_indexed(inputs.size(), options_.jobs, [&](std::size_t index) {
        if (!conflicts[index].empty()) {
            ItemResult& item = report.items[index];
            item.input = inputs[index];
            item.output = outputs[index];
            item.error = conflicts[index];
            TEMPOIT_LOG_ERROR("Pipeline: " << inputs[index] << ": " << conflicts[index]);
            return;
        }
        report.items[index] = run_to_path(inputs[index], outputs[index]);
    });

    TEMPOIT_LOG_INFO("Pipeline: batch of " << inputs.size() << " items, "
                     << report.succeeded() << " ok, " << report.failed() << " failed, ms="
                     << elapsed_ms_since(start));
    return report;
}

} // namespace tempoit
