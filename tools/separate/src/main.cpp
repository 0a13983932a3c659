// ==============================================================================
// raga-separate
// ==============================================================================
// Splits mono mixtures of a plucked string instrument and hand percussion into
// harmonic and percussive stems.
//
//   raga-separate -o stems/ recording.wav
//   raga-separate --backend demucs --demucs-model htdemucs_ft a.wav b.wav -j 2
// ==============================================================================

#include "cli_options.h"
#include "separation_job.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <future>
#include <iostream>
#include <vector>

int main(int argc, char** argv) {
    using namespace Raga::Tools;

    const CliParseResult parsed = parseCommandLine(argc, argv);
    if (parsed.helpRequested) {
        std::cout << parsed.helpText << std::endl;
        return 0;
    }
    if (!parsed.ok) {
        std::cerr << "raga-separate: " << parsed.error << "\n\n" << parsed.helpText << std::endl;
        return 2;
    }
    const CliOptions& options = parsed.options;

    auto logger = spdlog::stdout_color_mt("raga");
    logger->set_level(options.logLevel);
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    // Run at most options.jobs files at a time
    const auto batch = static_cast<size_t>(options.jobs);
    size_t failed = 0;
    for (size_t first = 0; first < options.inputs.size(); first += batch) {
        const size_t last = std::min(first + batch, options.inputs.size());

        std::vector<std::future<JobReport>> running;
        running.reserve(last - first);
        for (size_t i = first; i < last; ++i) {
            running.push_back(std::async(std::launch::async, [&options, &logger, i] {
                return runJob(options, options.inputs[i], logger);
            }));
        }
        for (auto& job : running) {
            if (!job.get()) ++failed;
        }
    }

    if (failed > 0) {
        logger->error("{} of {} file(s) failed", failed, options.inputs.size());
        return 1;
    }
    logger->info("done: {} file(s) written to {}", options.inputs.size(), options.outputDir);
    return 0;
}
