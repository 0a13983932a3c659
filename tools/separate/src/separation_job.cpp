#include "separation_job.h"

#include "demucs_model.h"
#include "wav_io.h"

#include <raga/dsp/core/signal_stats.h>
#include <raga/dsp/core/window_functions.h>

#include <chrono>
#include <exception>
#include <utility>

namespace Raga {
namespace Tools {

namespace {

constexpr std::chrono::milliseconds kNeuralRetryBaseDelay{500};

JobReport failure(JobReport report, DSP::SeparationError code, std::string message) {
    report.error = code;
    report.errorMessage = std::move(message);
    return report;
}

void logConfiguration(const CliOptions& options, const std::shared_ptr<spdlog::logger>& logger) {
    const DSP::HPSSConfig& c = options.hpss;
    logger->debug("hpss: window={} hop={} kernel(time={}, freq={}) power={} mode={} "
                  "window-type={} boundary={} normalize={} eq={}",
                  c.windowSize, c.hopSize, c.filterLengthTime, c.filterLengthFreq, c.power,
                  DSP::maskModeName(c.mode), DSP::windowTypeName(c.windowType),
                  DSP::boundaryModeName(c.boundary), c.normalizeOutput,
                  c.bandStop.enabled ? std::to_string(c.bandStop.lowHz) + "-"
                                           + std::to_string(c.bandStop.highHz) + " Hz"
                                     : std::string("off"));
}

} // namespace

DSP::SeparationBackend makeBackend(const CliOptions& options,
                                   const std::filesystem::path& input,
                                   const std::shared_ptr<spdlog::logger>& logger) {
    if (options.backend == BackendKind::HPSS) {
        return DSP::HPSSBackend{options.hpss};
    }

    DemucsSettings settings;
    settings.model = options.demucsModel;
    settings.workDir = std::filesystem::path(options.outputDir) / input.stem()
                     / ".demucs-work";

    DSP::NeuralBackend backend;
    backend.modelName = options.demucsModel;
    backend.separate = withRetries(makeDemucsModel(std::move(settings), logger),
                                   options.neuralRetries, kNeuralRetryBaseDelay, logger);
    return backend;
}

std::filesystem::path stemPath(const CliOptions& options,
                               const std::filesystem::path& input,
                               const std::string& stemName) {
    return std::filesystem::path(options.outputDir) / input.stem() / (stemName + ".wav");
}

JobReport runJob(const CliOptions& options,
                 const std::filesystem::path& input,
                 const std::shared_ptr<spdlog::logger>& logger) {
    JobReport report;
    report.input = input;

    // Filesystem and allocation failures surface as exceptions; they fail
    // this file only.
    try {
        AudioReadResult read = readMonoAudio(input);
        if (!read) {
            logger->error("{}: {} ({})", input.string(), read.errorMessage,
                          DSP::errorToString(read.error));
            return failure(std::move(report), read.error, std::move(read.errorMessage));
        }
        const AudioData& audio = read.audio;
        const DSP::SignalStats inputStats = DSP::measureSignal(
            audio.samples.data(), audio.samples.size(), audio.sampleRate);
        logger->info("{}: {} Hz, {} channel(s) -> mono, {:.2f} s, rms {:.1f} dBFS, peak {:.1f} dBFS",
                     input.filename().string(), audio.sampleRate, audio.sourceChannels,
                     inputStats.durationSeconds, inputStats.rmsDb(), inputStats.peakDb());

        const DSP::SeparationBackend backend = makeBackend(options, input, logger);
        logger->info("{}: separating with {}", input.filename().string(),
                     DSP::backendName(backend));
        if (options.backend == BackendKind::HPSS) {
            logConfiguration(options, logger);
        }

        const auto start = std::chrono::steady_clock::now();
        DSP::StemSet stems = DSP::runSeparation(backend, audio.samples, audio.sampleRate);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (!stems) {
            logger->error("{}: separation failed: {} ({})", input.string(), stems.errorMessage,
                          DSP::errorToString(stems.error));
            return failure(std::move(report), stems.error, std::move(stems.errorMessage));
        }
        logger->info("{}: {} stem(s) in {} ms", input.filename().string(), stems.stems.size(),
                     elapsed.count());

        for (const DSP::Stem& stem : stems.stems) {
            const DSP::SignalStats stats = DSP::measureSignal(
                stem.samples.data(), stem.samples.size(), stems.sampleRate);
            const std::filesystem::path path = stemPath(options, input, stem.name);

            DSP::ValidationResult written =
                writeMonoWav(path, stem.samples, audio.sampleRate, options.subtype);
            if (!written) {
                logger->error("{}: {}", path.string(), written.errorMessage);
                return failure(std::move(report), written.error, std::move(written.errorMessage));
            }
            logger->info("  {:<16} rms {:7.1f} dBFS  peak {:7.1f} dBFS -> {}", stem.name,
                         stats.rmsDb(), stats.peakDb(), path.string());
            report.written.push_back(path);
        }
    } catch (const std::exception& e) {
        logger->error("{}: {}", input.string(), e.what());
        return failure(std::move(report), DSP::SeparationError::IOError, e.what());
    }
    return report;
}

} // namespace Tools
} // namespace Raga
