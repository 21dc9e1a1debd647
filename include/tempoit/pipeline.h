//
//  pipeline.h
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-15.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "tempoit/activation.h"
#include "tempoit/config.h"
#include "tempoit/tempo.h"

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace tempoit {

/// @brief Per-item state handed to output stages.
struct ItemContext {
    std::string input;
    std::string output;
    bool has_deadline = false;
    std::chrono::steady_clock::time_point deadline;

    bool expired() const;
    CancelCheck cancel_check() const;
};

/// @brief Output stage of the pipeline.
///
/// `process` must be safe to call concurrently for different items.
class OutputStage {
public:
    virtual ~OutputStage() = default;
    virtual const char* name() const = 0;

    // Suffix appended to the input stem when batch mode derives output paths.
    virtual const char* default_suffix() const = 0;

    // Checked once before any item runs.
    virtual bool validate(std::string* error) const;

    virtual bool process(const ActivationFunction& activation,
                         const ItemContext& context,
                         std::ostream& out,
                         std::string* error) const = 0;
};

/// @brief Estimates tempi and writes them in the configured output format.
class TempoOutputStage : public OutputStage {
public:
    explicit TempoOutputStage(const TempoConfig& config);

    const char* name() const override {
        return "tempo";
    }
    const char* default_suffix() const override {
        return ".bpm.txt";
    }

    bool validate(std::string* error) const override;

    bool process(const ActivationFunction& activation,
                 const ItemContext& context,
                 std::ostream& out,
                 std::string* error) const override;

    const TempoConfig& config() const {
        return config_;
    }

private:
    TempoConfig config_;
};

/// @brief Persists the activation itself instead of estimating tempi.
class CacheWriterStage : public OutputStage {
public:
    explicit CacheWriterStage(ActivationCacheFormat format = ActivationCacheFormat::Binary);

    const char* name() const override {
        return "cache";
    }
    const char* default_suffix() const override {
        return format_ == ActivationCacheFormat::Binary ? ".act" : ".act.txt";
    }

    bool process(const ActivationFunction& activation,
                 const ItemContext& context,
                 std::ostream& out,
                 std::string* error) const override;

private:
    ActivationCacheFormat format_;
};

struct PipelineOptions {
    // Batch outputs go here; empty places them beside their inputs.
    std::string output_dir;
    // Empty selects the first output stage's default suffix.
    std::string suffix;
    std::size_t jobs = 1;
    // Cooperative per-item deadline; 0 disables it.
    double item_timeout_seconds = 0.0;
};

struct ItemResult {
    std::string input;
    std::string output;
    bool ok = false;
    std::string error;
    double elapsed_ms = 0.0;
};

struct BatchReport {
    std::vector<ItemResult> items;
    // Set when the pipeline refused to start (invalid configuration).
    std::string error;

    std::size_t succeeded() const;
    std::size_t failed() const;
    bool ok() const {
        return error.empty() && failed() == 0;
    }
};

/// @brief Runs input stage → output stages for one item or a batch.
///
/// Each item owns its activation and results; one item's failure is
/// recorded in its ItemResult and never stops the others.
class PipelineRunner {
public:
    PipelineRunner(std::unique_ptr<ActivationSource> source,
                   std::vector<std::unique_ptr<OutputStage>> outputs,
                   PipelineOptions options = {});
    ~PipelineRunner();

    PipelineRunner(const PipelineRunner&) = delete;
    PipelineRunner& operator=(const PipelineRunner&) = delete;

    bool validate(std::string* error) const;

    // Run one item into a caller-provided stream.
    ItemResult process(const std::string& input, std::ostream& out) const;

    // Run one item; `output` empty or "-" writes to standard output.
    ItemResult run_single(const std::string& input, const std::string& output) const;

    BatchReport run_batch(const std::vector<std::string>& inputs) const;

    std::string output_path_for(const std::string& input) const;

    const PipelineOptions& options() const {
        return options_;
    }

private:
    ItemContext make_context(const std::string& input, const std::string& output) const;
    bool run_item(const ItemContext& context, std::ostream& out, std::string* error) const;
    ItemResult run_to_path(const std::string& input, const std::string& output) const;

    std::unique_ptr<ActivationSource> source_;
    std::vector<std::unique_ptr<OutputStage>> outputs_;
    PipelineOptions options_;
};

} // namespace tempoit
