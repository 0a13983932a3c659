// ==============================================================================
// raga-separate - Command-Line Options
// ==============================================================================
// Parses argv into a CliOptions value with cxxopts. Parsing has no side
// effects: help text and errors are returned to the caller for printing.
// ==============================================================================

#pragma once

#include <raga/dsp/primitives/median_filter.h>
#include <raga/dsp/processors/hpss_classifier.h>
#include <raga/dsp/systems/hpss_separator.h>

#include <spdlog/common.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Raga {
namespace Tools {

enum class BackendKind {
    HPSS,
    Demucs
};

/// @brief Everything the tool needs to run
struct CliOptions {
    std::vector<std::string> inputs;
    std::string outputDir = "separated";

    DSP::HPSSConfig hpss;

    BackendKind backend = BackendKind::HPSS;
    std::string demucsModel = "htdemucs_ft";
    int neuralRetries = 2;

    std::string subtype = "PCM_16";
    int jobs = 1;
    spdlog::level::level_enum logLevel = spdlog::level::info;
};

/// @brief Outcome of parseCommandLine
struct CliParseResult {
    bool ok = false;
    bool helpRequested = false;
    std::string error;     ///< Set when ok == false
    std::string helpText;  ///< Always filled
    CliOptions options;
};

[[nodiscard]] CliParseResult parseCommandLine(int argc, const char* const* argv);

// Enum spellings accepted on the command line (case-insensitive)
[[nodiscard]] std::optional<DSP::MaskMode> parseMaskMode(std::string_view text);
[[nodiscard]] std::optional<DSP::WindowType> parseWindowType(std::string_view text);
[[nodiscard]] std::optional<DSP::BoundaryMode> parseBoundaryMode(std::string_view text);
[[nodiscard]] std::optional<BackendKind> parseBackend(std::string_view text);
[[nodiscard]] std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view text);

} // namespace Tools
} // namespace Raga
