//
//  activation.h
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace tempoit {

/// @brief Per-frame beat activation at a fixed frame rate.
///
/// Values are finite and non-negative. An `fps` of zero means the producer
/// did not record its frame rate; consumers then fall back to the
/// configured frame rate.
struct ActivationFunction {
    std::vector<float> values;
    double fps = 0.0;

    double duration_seconds() const {
        return fps > 0.0 ? static_cast<double>(values.size()) / fps : 0.0;
    }
};

/// @brief Reject negative or non-finite activation values.
bool validate_activation(const ActivationFunction& activation, std::string* error);

enum class ActivationCacheFormat {
    Binary,
    Text,
};

bool write_activation_cache(std::ostream& out,
                            const ActivationFunction& activation,
                            ActivationCacheFormat format,
                            std::string* error);

bool write_activation_cache(const std::string& path,
                            const ActivationFunction& activation,
                            ActivationCacheFormat format,
                            std::string* error);

/// @brief Read a cache stream; the format is detected from the leading magic.
bool read_activation_cache(std::istream& in,
                           ActivationFunction* activation,
                           std::string* error);

bool read_activation_cache(const std::string& path,
                           ActivationFunction* activation,
                           std::string* error);

/// @brief Input stage of the pipeline.
///
/// Implementations must be safe to call concurrently for different inputs.
class ActivationSource {
public:
    virtual ~ActivationSource() = default;
    virtual const char* name() const = 0;
    virtual bool load(const std::string& input,
                      ActivationFunction* activation,
                      std::string* error) const = 0;
};

/// @brief Loads activations previously written by `write_activation_cache`.
class CachedActivationSource : public ActivationSource {
public:
    const char* name() const override {
        return "cache";
    }

    bool load(const std::string& input,
              ActivationFunction* activation,
              std::string* error) const override;
};

/// @brief Adapts an external beat activation analyzer.
///
/// The analyzer receives the input name (usually an audio file path) and
/// produces the activation; how it computes it is up to the caller.
class AnalyzerActivationSource : public ActivationSource {
public:
    using Analyzer = std::function<bool(const std::string& input,
                                        ActivationFunction* activation,
                                        std::string* error)>;

    explicit AnalyzerActivationSource(Analyzer analyzer, std::string label = "analyzer");

    const char* name() const override {
        return label_.c_str();
    }

    bool load(const std::string& input,
              ActivationFunction* activation,
              std::string* error) const override;

private:
    Analyzer analyzer_;
    std::string label_;
};

} // namespace tempoit
