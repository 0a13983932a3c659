#include "cli_options.h"

#include <raga/dsp/core/window_functions.h>

#include <cxxopts.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <map>
#include <utility>

namespace Raga {
namespace Tools {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool isKnownSubtype(const std::string& subtype) {
    return subtype == "PCM_16" || subtype == "PCM_24" || subtype == "FLOAT";
}

std::optional<std::pair<std::string, std::string>> findStemClash(
    const std::vector<std::string>& inputs) {
    std::map<std::string, std::string> seen;
    for (const std::string& input : inputs) {
        const std::string stem = std::filesystem::path(input).stem().string();
        const auto [it, inserted] = seen.emplace(stem, input);
        if (!inserted) {
            return std::make_pair(it->second, input);
        }
    }
    return std::nullopt;
}

cxxopts::Options buildOptions() {
    cxxopts::Options options("raga-separate",
        "Split a sitar/tabla recording into harmonic and percussive stems");

    options.add_options()
        ("i,input", "Input audio file (repeatable, or positional)",
            cxxopts::value<std::vector<std::string>>())
        ("o,output", "Output directory", cxxopts::value<std::string>()->default_value("separated"))
        ("h,help", "Print usage");

    options.add_options("HPSS")
        ("window", "STFT window size in samples", cxxopts::value<int>()->default_value("2048"))
        ("hop", "STFT hop size in samples", cxxopts::value<int>()->default_value("512"))
        ("kernel-time", "Harmonic median length in frames (odd)",
            cxxopts::value<int>()->default_value("31"))
        ("kernel-freq", "Percussive median length in bins (odd)",
            cxxopts::value<int>()->default_value("31"))
        ("power", "Soft mask exponent", cxxopts::value<float>()->default_value("2.0"))
        ("mode", "Mask mode: soft|binary", cxxopts::value<std::string>()->default_value("soft"))
        ("window-type", "Window: hann|hamming|blackman",
            cxxopts::value<std::string>()->default_value("hann"))
        ("boundary", "Median edge handling: reflect|clamp",
            cxxopts::value<std::string>()->default_value("reflect"))
        ("no-normalize", "Keep stems unscaled even if they clip")
        ("eq", "Also write a band-stopped harmonic_clean stem")
        ("eq-low", "Band-stop lower edge in Hz", cxxopts::value<double>()->default_value("10"))
        ("eq-high", "Band-stop upper edge in Hz", cxxopts::value<double>()->default_value("4000"));

    options.add_options("Backend")
        ("backend", "Separator: hpss|demucs", cxxopts::value<std::string>()->default_value("hpss"))
        ("demucs-model", "Demucs model name", cxxopts::value<std::string>()->default_value("htdemucs_ft"))
        ("neural-retries", "Retries when the neural model runs out of resources",
            cxxopts::value<int>()->default_value("2"));

    options.add_options("Output")
        ("subtype", "WAV sample format: PCM_16|PCM_24|FLOAT",
            cxxopts::value<std::string>()->default_value("PCM_16"))
        ("j,jobs", "Files processed concurrently", cxxopts::value<int>()->default_value("1"))
        ("log-level", "trace|debug|info|warn|error|off",
            cxxopts::value<std::string>()->default_value("info"));

    options.parse_positional({"input"});
    options.positional_help("<input>...");
    return options;
}

CliParseResult fail(CliParseResult result, std::string message) {
    result.ok = false;
    result.error = std::move(message);
    return result;
}

} // namespace

std::optional<DSP::MaskMode> parseMaskMode(std::string_view text) {
    const std::string s = lowercase(text);
    if (s == "soft") return DSP::MaskMode::Soft;
    if (s == "binary" || s == "hard") return DSP::MaskMode::Binary;
    return std::nullopt;
}

std::optional<DSP::WindowType> parseWindowType(std::string_view text) {
    const std::string s = lowercase(text);
    if (s == "hann" || s == "hanning") return DSP::WindowType::Hann;
    if (s == "hamming") return DSP::WindowType::Hamming;
    if (s == "blackman") return DSP::WindowType::Blackman;
    return std::nullopt;
}

std::optional<DSP::BoundaryMode> parseBoundaryMode(std::string_view text) {
    const std::string s = lowercase(text);
    if (s == "reflect") return DSP::BoundaryMode::Reflect;
    if (s == "clamp" || s == "nearest") return DSP::BoundaryMode::Clamp;
    return std::nullopt;
}

std::optional<BackendKind> parseBackend(std::string_view text) {
    const std::string s = lowercase(text);
    if (s == "hpss") return BackendKind::HPSS;
    if (s == "demucs") return BackendKind::Demucs;
    return std::nullopt;
}

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view text) {
    const std::string s = lowercase(text);
    if (s == "trace") return spdlog::level::trace;
    if (s == "debug") return spdlog::level::debug;
    if (s == "info") return spdlog::level::info;
    if (s == "warn" || s == "warning") return spdlog::level::warn;
    if (s == "error") return spdlog::level::err;
    if (s == "off") return spdlog::level::off;
    return std::nullopt;
}

CliParseResult parseCommandLine(int argc, const char* const* argv) {
    cxxopts::Options options = buildOptions();

    CliParseResult result;
    result.helpText = options.help({"", "HPSS", "Backend", "Output"});

    cxxopts::ParseResult parsed;
    try {
        parsed = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        return fail(std::move(result), e.what());
    }

    if (parsed.count("help") > 0) {
        result.ok = true;
        result.helpRequested = true;
        return result;
    }

    CliOptions& opts = result.options;
    try {
        if (parsed.count("input") > 0) {
            opts.inputs = parsed["input"].as<std::vector<std::string>>();
        }
        opts.outputDir = parsed["output"].as<std::string>();

        DSP::HPSSConfig& hpss = opts.hpss;
        hpss.windowSize = parsed["window"].as<int>();
        hpss.hopSize = parsed["hop"].as<int>();
        hpss.filterLengthTime = parsed["kernel-time"].as<int>();
        hpss.filterLengthFreq = parsed["kernel-freq"].as<int>();
        hpss.power = parsed["power"].as<float>();
        hpss.normalizeOutput = parsed.count("no-normalize") == 0;
        hpss.bandStop.enabled = parsed.count("eq") > 0;
        hpss.bandStop.lowHz = parsed["eq-low"].as<double>();
        hpss.bandStop.highHz = parsed["eq-high"].as<double>();

        const auto mode = parseMaskMode(parsed["mode"].as<std::string>());
        if (!mode) return fail(std::move(result), "unknown --mode '" + parsed["mode"].as<std::string>() + "'");
        hpss.mode = *mode;

        const auto window = parseWindowType(parsed["window-type"].as<std::string>());
        if (!window) {
            return fail(std::move(result),
                        "unknown --window-type '" + parsed["window-type"].as<std::string>() + "'");
        }
        hpss.windowType = *window;

        const auto boundary = parseBoundaryMode(parsed["boundary"].as<std::string>());
        if (!boundary) {
            return fail(std::move(result),
                        "unknown --boundary '" + parsed["boundary"].as<std::string>() + "'");
        }
        hpss.boundary = *boundary;

        const auto backend = parseBackend(parsed["backend"].as<std::string>());
        if (!backend) {
            return fail(std::move(result),
                        "unknown --backend '" + parsed["backend"].as<std::string>() + "'");
        }
        opts.backend = *backend;
        opts.demucsModel = parsed["demucs-model"].as<std::string>();
        opts.neuralRetries = parsed["neural-retries"].as<int>();

        opts.subtype = parsed["subtype"].as<std::string>();
        opts.jobs = parsed["jobs"].as<int>();

        const auto level = parseLogLevel(parsed["log-level"].as<std::string>());
        if (!level) {
            return fail(std::move(result),
                        "unknown --log-level '" + parsed["log-level"].as<std::string>() + "'");
        }
        opts.logLevel = *level;
    } catch (const cxxopts::exceptions::exception& e) {
        return fail(std::move(result), e.what());
    }

    if (opts.inputs.empty()) {
        return fail(std::move(result), "no input files given");
    }
    // Stems land in <output>/<input stem>/, so two inputs sharing a stem would
    // overwrite each other (and share a demucs scratch directory)
    if (const auto clash = findStemClash(opts.inputs)) {
        return fail(std::move(result), "inputs '" + clash->first + "' and '" + clash->second
                    + "' would write to the same output directory");
    }
    if (!isKnownSubtype(opts.subtype)) {
        return fail(std::move(result), "unknown --subtype '" + opts.subtype + "'");
    }
    if (opts.jobs < 1) {
        return fail(std::move(result), "--jobs must be at least 1");
    }
    if (opts.neuralRetries < 0) {
        return fail(std::move(result), "--neural-retries must not be negative");
    }
    if (opts.backend == BackendKind::HPSS) {
        if (DSP::ValidationResult check = opts.hpss.validate(); !check) {
            return fail(std::move(result), check.errorMessage);
        }
    }

    result.ok = true;
    return result;
}

} // namespace Tools
} // namespace Raga
