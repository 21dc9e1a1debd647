//
//  cache.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-14.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "tempoit/activation.h"

#include "tempoit/logging.hpp"
#include "tempoit/version.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <istream>
#include <ostream>
#include <sstream>
#include <type_traits>
#include <utility>

namespace tempoit {
namespace {

constexpr char kBinaryMagic[4] = {'T', 'M', 'P', 'A'};
constexpr const char* kTextFpsTag = "fps=";
// Upper bound for the up-front reservation; larger caches grow as they are read.
constexpr std::uint64_t kMaxReserveFrames = 1u << 24;

void set_error(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

template <typename T>
void write_le(std::ostream& out, T value) {
    static_assert(std::is_trivially_copyable<T>::value, "plain value expected");
    unsigned char bytes[sizeof(T)];
    std::memcpy(bytes, &value, sizeof(T));
    std::uint16_t probe = 1;
    unsigned char first = 0;
    std::memcpy(&first, &probe, 1);
    if (first != 1) {
        std::reverse(bytes, bytes + sizeof(T));
    }
    out.write(reinterpret_cast<const char*>(bytes), sizeof(T));
}

template <typename T>
bool read_le(std::istream& in, T* value) {
    unsigned char bytes[sizeof(T)];
    if (!in.read(reinterpret_cast<char*>(bytes), sizeof(T))) {
        return false;
    }
    std::uint16_t probe = 1;
    unsigned char first = 0;
    std::memcpy(&first, &probe, 1);
    if (first != 1) {
        std::reverse(bytes, bytes + sizeof(T));
    }
    std::memcpy(value, bytes, sizeof(T));
    return true;
}

bool write_binary(std::ostream& out, const ActivationFunction& activation) {
    out.write(kBinaryMagic, sizeof(kBinaryMagic));
    write_le<std::uint32_t>(out, activation_cache_version());
    write_le<double>(out, activation.fps);
    write_le<std::uint64_t>(out, static_cast<std::uint64_t>(activation.values.size()));
    for (float value : activation.values) {
        write_le<float>(out, value);
    }
    return out.good();
}

bool write_text(std::ostream& out, const ActivationFunction& activation) {
    out << "# " << kTextFpsTag << std::setprecision(17) << activation.fps << "\n";
    out << std::setprecision(9);
    for (float value : activation.values) {
        out << value << "\n";
    }
    return out.good();
}

bool read_binary(std::istream& in, ActivationFunction* activation, std::string* error) {
    char magic[4] = {};
    if (!in.read(magic, sizeof(magic)) ||
        std::memcmp(magic, kBinaryMagic, sizeof(kBinaryMagic)) != 0) {
        set_error(error, "Activation cache: bad magic.");
        return false;
    }

    std::uint32_t version = 0;
    double fps = 0.0;
    std::uint64_t count = 0;
    if (!read_le(in, &version) || !read_le(in, &fps) || !read_le(in, &count)) {
        set_error(error, "Activation cache: truncated header.");
        return false;
    }
    if (version != activation_cache_version()) {
        set_error(error, "Activation cache: unsupported version " + std::to_string(version) + ".");
        return false;
    }
    if (!std::isfinite(fps) || fps < 0.0) {
        set_error(error, "Activation cache: invalid frame rate.");
        return false;
    }

    ActivationFunction result;
    result.fps = fps;
    result.values.reserve(static_cast<std::size_t>(std::min(count, kMaxReserveFrames)));
    for (std::uint64_t i = 0; i < count; ++i) {
        float value = 0.0f;
        if (!read_le(in, &value)) {
            set_error(error,
                      "Activation cache: truncated after " + std::to_string(i) + " of " +
                          std::to_string(count) + " frames.");
            return false;
        }
        result.values.push_back(value);
    }
    if (in.peek() != std::char_traits<char>::eof()) {
        set_error(error, "Activation cache: trailing bytes after frame data.");
        return false;
    }

    *activation = std::move(result);
    return true;
}

// Range and sign are checked by validate_activation.
bool parse_float(const std::string& token, float* out) {
    char* end = nullptr;
    const float parsed = std::strtof(token.c_str(), &end);
    if (end == token.c_str() || *end != '\0') {
        return false;
    }
    *out = parsed;
    return true;
}

bool read_text(std::istream& in, ActivationFunction* activation, std::string* error) {
    ActivationFunction result;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const std::size_t first = line.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        if (line[first] == '#') {
            const std::size_t tag = line.find(kTextFpsTag, first);
            if (tag != std::string::npos) {
                const std::string text = line.substr(tag + std::strlen(kTextFpsTag));
                char* end = nullptr;
                const double fps = std::strtod(text.c_str(), &end);
                if (end == text.c_str() || !std::isfinite(fps) || fps < 0.0) {
                    set_error(error,
                              "Activation cache: invalid fps header on line " +
                                  std::to_string(line_number) + ".");
                    return false;
                }
                result.fps = fps;
            }
            continue;
        }

        std::istringstream tokens(line);
        std::string token;
        while (tokens >> token) {
            float value = 0.0f;
            if (!parse_float(token, &value)) {
                set_error(error,
                          "Activation cache: invalid value '" + token + "' on line " +
                              std::to_string(line_number) + ".");
                return false;
            }
            result.values.push_back(value);
        }
    }
    if (in.bad()) {
        set_error(error, "Activation cache: read error.");
        return false;
    }

    *activation = std::move(result);
    return true;
}

} // namespace

bool validate_activation(const ActivationFunction& activation, std::string* error) {
    if (!std::isfinite(activation.fps) || activation.fps < 0.0) {
        set_error(error, "Activation has an invalid frame rate.");
        return false;
    }
    for (std::size_t i = 0; i < activation.values.size(); ++i) {
        const float value = activation.values[i];
        if (!std::isfinite(value) || value < 0.0f) {
            std::ostringstream message;
            message << "Activation value " << value << " at frame " << i
                    << " is negative or not finite.";
            set_error(error, message.str());
            return false;
        }
    }
    return true;
}

bool write_activation_cache(std::ostream& out,
                            const ActivationFunction& activation,
                            ActivationCacheFormat format,
                            std::string* error) {
    if (!validate_activation(activation, error)) {
        return false;
    }
    const bool ok = (format == ActivationCacheFormat::Binary) ? write_binary(out, activation)
                                                              : write_text(out, activation);
    if (!ok) {
        set_error(error, "Failed to write activation cache.");
        return false;
    }
    return true;
}

bool write_activation_cache(const std::string& path,
                            const ActivationFunction& activation,
                            ActivationCacheFormat format,
                            std::string* error) {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        set_error(error, "Failed to open activation cache for writing: " + path);
        return false;
    }
    if (!write_activation_cache(out, activation, format, error)) {
        return false;
    }
    out.close();
    if (!out) {
        set_error(error, "Failed to finish activation cache: " + path);
        return false;
    }
    TEMPOIT_LOG_DEBUG("Activation cache: wrote " << activation.values.size() << " frames to "
                      << path);
    return true;
}

bool read_activation_cache(std::istream& in, ActivationFunction* activation, std::string* error) {
    if (!activation) {
        set_error(error, "No activation output given.");
        return false;
    }

    const int first = in.peek();
    if (first == std::char_traits<char>::eof()) {
        // An empty cache is an empty activation at an unknown frame rate.
        *activation = ActivationFunction{};
        return true;
    }

    ActivationFunction loaded;
    const bool ok = (first == kBinaryMagic[0]) ? read_binary(in, &loaded, error)
                                               : read_text(in, &loaded, error);
    if (!ok) {
        return false;
    }
    if (!validate_activation(loaded, error)) {
        return false;
    }
    *activation = std::move(loaded);
    return true;
}

bool read_activation_cache(const std::string& path,
                           ActivationFunction* activation,
                           std::string* error) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        set_error(error, "Failed to open activation cache: " + path);
        return false;
    }
    std::string detail;
    if (!read_activation_cache(in, activation, &detail)) {
        set_error(error, detail + " (" + path + ")");
        return false;
    }
    TEMPOIT_LOG_DEBUG("Activation cache: read " << activation->values.size() << " frames at "
                      << activation->fps << " fps from " << path);
    return true;
}

} // namespace tempoit
