#include "demucs_model.h"

#include "wav_io.h"

#include <cstdlib>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#endif

namespace Raga {
namespace Tools {

namespace {

/// Quote for /bin/sh: wrap in single quotes, escape embedded ones
std::string shellQuote(const std::string& text) {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

int decodeSystemStatus(int status) {
#if defined(__unix__) || defined(__APPLE__)
    if (status == -1) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
#else
    return status;
#endif
}

DSP::NeuralSeparation modelFailure(DSP::SeparationError code, std::string message) {
    DSP::NeuralSeparation result;
    result.error = code;
    result.errorMessage = std::move(message);
    return result;
}

/// Removes the scratch directory when the run ends
struct ScratchDirectory {
    std::filesystem::path path;

    ~ScratchDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

} // namespace

DSP::SeparationError classifyExitCode(int exitCode) noexcept {
    if (exitCode == 0) return DSP::SeparationError::Success;
    // 126: found but not executable, 127: not found
    if (exitCode == 126 || exitCode == 127) return DSP::SeparationError::ModelUnavailable;
    return DSP::SeparationError::ResourceExhausted;
}

std::string demucsCommand(const DemucsSettings& settings,
                          const std::filesystem::path& input,
                          const std::filesystem::path& outputDir) {
    return shellQuote(settings.executable) + " -n " + shellQuote(settings.model)
         + " -o " + shellQuote(outputDir.string()) + " " + shellQuote(input.string());
}

DSP::NeuralSeparateFn makeDemucsModel(DemucsSettings settings,
                                      std::shared_ptr<spdlog::logger> logger) {
    return [settings = std::move(settings), logger = std::move(logger)](
               const std::vector<float>& waveform, double sampleRate) {
        ScratchDirectory scratch{settings.workDir};
        const std::filesystem::path inputPath = scratch.path / "mixture.wav";
        const std::filesystem::path outputDir = scratch.path / "out";
        const int rate = static_cast<int>(sampleRate);

        if (DSP::ValidationResult written = writeMonoWav(inputPath, waveform, rate, "FLOAT");
            !written) {
            return modelFailure(written.error, std::move(written.errorMessage));
        }

        const std::string command = demucsCommand(settings, inputPath, outputDir);
        logger->debug("running: {}", command);
        const int exitCode = decodeSystemStatus(std::system(command.c_str()));
        const DSP::SeparationError status = classifyExitCode(exitCode);
        if (status != DSP::SeparationError::Success) {
            return modelFailure(status, "demucs exited with status " + std::to_string(exitCode));
        }

        // demucs writes <out>/<model>/<input stem>/<source>.wav
        const std::filesystem::path stemDir = outputDir / settings.model / inputPath.stem();
        std::error_code ec;
        if (!std::filesystem::is_directory(stemDir, ec)) {
            return modelFailure(DSP::SeparationError::ModelUnavailable,
                                "demucs produced no output in " + stemDir.string());
        }

        DSP::NeuralSeparation result;
        for (const auto& entry : std::filesystem::directory_iterator(stemDir, ec)) {
            if (entry.path().extension() != ".wav") continue;

            AudioReadResult stem = readMonoAudio(entry.path());
            if (!stem) {
                return modelFailure(stem.error, std::move(stem.errorMessage));
            }
            if (stem.audio.sampleRate != rate) {
                return modelFailure(DSP::SeparationError::IOError,
                    "demucs stem '" + entry.path().filename().string() + "' is at "
                    + std::to_string(stem.audio.sampleRate) + " Hz, input is "
                    + std::to_string(rate) + " Hz");
            }
            result.stems.push_back({entry.path().stem().string(), std::move(stem.audio.samples)});
        }
        if (ec) {
            return modelFailure(DSP::SeparationError::IOError,
                                "cannot list " + stemDir.string() + ": " + ec.message());
        }
        if (result.stems.empty()) {
            return modelFailure(DSP::SeparationError::ModelUnavailable,
                                "demucs produced no stems in " + stemDir.string());
        }
        return result;
    };
}

DSP::NeuralSeparateFn withRetries(DSP::NeuralSeparateFn model,
                                  int retries,
                                  std::chrono::milliseconds baseDelay,
                                  std::shared_ptr<spdlog::logger> logger,
                                  std::function<void(std::chrono::milliseconds)> sleeper) {
    if (!sleeper) {
        sleeper = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
    return [model = std::move(model), retries, baseDelay,
            logger = std::move(logger), sleeper = std::move(sleeper)](
               const std::vector<float>& waveform, double sampleRate) {
        std::chrono::milliseconds delay = baseDelay;
        DSP::NeuralSeparation result = model(waveform, sampleRate);
        for (int attempt = 1;
             attempt <= retries && result.error == DSP::SeparationError::ResourceExhausted;
             ++attempt) {
            logger->warn("neural model exhausted resources ({}), retry {}/{} in {} ms",
                         result.errorMessage, attempt, retries, delay.count());
            sleeper(delay);
            delay *= 2;
            result = model(waveform, sampleRate);
        }
        return result;
    };
}

} // namespace Tools
} // namespace Raga
