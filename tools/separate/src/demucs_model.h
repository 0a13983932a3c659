// ==============================================================================
// raga-separate - Demucs Neural Backend
// ==============================================================================
// Binds DSP::NeuralSeparateFn to the external `demucs` command: the input is
// written to a scratch WAV, demucs is run as a child process, and the stems
// it writes are read back. Also provides the retry policy the tool wraps
// around any neural model.
// ==============================================================================

#pragma once

#include <raga/dsp/core/separation_error.h>
#include <raga/dsp/systems/separation_backend.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace Raga {
namespace Tools {

struct DemucsSettings {
    std::string model = "htdemucs_ft";
    std::string executable = "demucs";
    std::filesystem::path workDir;  ///< Scratch directory, removed afterwards
};

/// @brief Map a demucs exit status to the error taxonomy
/// @param exitCode Process exit code (127 = command not found)
[[nodiscard]] DSP::SeparationError classifyExitCode(int exitCode) noexcept;

/// @brief Shell command line that runs demucs on one file
[[nodiscard]] std::string demucsCommand(const DemucsSettings& settings,
                                        const std::filesystem::path& input,
                                        const std::filesystem::path& outputDir);

/// @brief Model callable that shells out to demucs
[[nodiscard]] DSP::NeuralSeparateFn makeDemucsModel(DemucsSettings settings,
                                                    std::shared_ptr<spdlog::logger> logger);

/// @brief Wrap a model so ResourceExhausted failures are retried
/// @param model Underlying callable
/// @param retries Extra attempts after the first
/// @param baseDelay Delay before the first retry, doubled on each further one
/// @param sleeper Waits for a duration (std::this_thread::sleep_for by default)
[[nodiscard]] DSP::NeuralSeparateFn withRetries(
    DSP::NeuralSeparateFn model,
    int retries,
    std::chrono::milliseconds baseDelay,
    std::shared_ptr<spdlog::logger> logger,
    std::function<void(std::chrono::milliseconds)> sleeper = {});

} // namespace Tools
} // namespace Raga
