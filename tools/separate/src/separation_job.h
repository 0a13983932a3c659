// ==============================================================================
// raga-separate - Per-File Job
// ==============================================================================
// Read one input, run the selected backend, report stem statistics and write
// <output>/<input stem>/<stem name>.wav. Jobs share nothing but the logger.
// ==============================================================================

#pragma once

#include "cli_options.h"

#include <raga/dsp/core/separation_error.h>
#include <raga/dsp/systems/separation_backend.h>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace Raga {
namespace Tools {

/// @brief Outcome of one file
struct JobReport {
    std::filesystem::path input;
    DSP::SeparationError error = DSP::SeparationError::Success;
    std::string errorMessage;
    std::vector<std::filesystem::path> written;

    [[nodiscard]] explicit operator bool() const noexcept {
        return error == DSP::SeparationError::Success;
    }
};

/// @brief Backend described by the options, for one input file
[[nodiscard]] DSP::SeparationBackend makeBackend(const CliOptions& options,
                                                 const std::filesystem::path& input,
                                                 const std::shared_ptr<spdlog::logger>& logger);

/// @brief Output path of one stem
[[nodiscard]] std::filesystem::path stemPath(const CliOptions& options,
                                             const std::filesystem::path& input,
                                             const std::string& stemName);

/// @brief Process a single input file end to end
[[nodiscard]] JobReport runJob(const CliOptions& options,
                               const std::filesystem::path& input,
                               const std::shared_ptr<spdlog::logger>& logger);

} // namespace Tools
} // namespace Raga
