// ==============================================================================
// raga-separate - Audio File I/O
// ==============================================================================
// Thin libsndfile wrapper: read any supported container as mono float
// (channels averaged, native sample rate) and write mono WAV stems.
// ==============================================================================

#pragma once

#include <raga/dsp/core/separation_error.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Raga {
namespace Tools {

/// @brief Decoded mono waveform
struct AudioData {
    std::vector<float> samples;
    int sampleRate = 0;
    int sourceChannels = 0;  ///< Channel count before downmix
    int sourceFormat = 0;    ///< libsndfile SF_FORMAT_* of the file
};

struct AudioReadResult {
    DSP::SeparationError error = DSP::SeparationError::Success;
    std::string errorMessage;
    AudioData audio;

    [[nodiscard]] explicit operator bool() const noexcept {
        return error == DSP::SeparationError::Success;
    }
};

/// @brief libsndfile format for a WAV subtype name (PCM_16, PCM_24, FLOAT)
[[nodiscard]] std::optional<int> wavFormatForSubtype(std::string_view subtype);

/// @brief Read a file and downmix to mono
/// @return IOError if the file cannot be opened or decoded
[[nodiscard]] AudioReadResult readMonoAudio(const std::filesystem::path& path);

/// @brief Write a mono WAV file, creating parent directories
/// @return IOError on any failure, InvalidParameter for an unknown subtype
[[nodiscard]] DSP::ValidationResult writeMonoWav(const std::filesystem::path& path,
                                                 const std::vector<float>& samples,
                                                 int sampleRate,
                                                 std::string_view subtype);

} // namespace Tools
} // namespace Raga
