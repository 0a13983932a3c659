#include "wav_io.h"

#include <sndfile.h>

#include <memory>
#include <string>
#include <system_error>
#include <utility>

namespace Raga {
namespace Tools {

namespace {

struct SndfileCloser {
    void operator()(SNDFILE* file) const noexcept {
        if (file) sf_close(file);
    }
};

using SndfileHandle = std::unique_ptr<SNDFILE, SndfileCloser>;

AudioReadResult readFailure(std::string message) {
    AudioReadResult result;
    result.error = DSP::SeparationError::IOError;
    result.errorMessage = std::move(message);
    return result;
}

} // namespace

std::optional<int> wavFormatForSubtype(std::string_view subtype) {
    if (subtype == "PCM_16") return SF_FORMAT_WAV | SF_FORMAT_PCM_16;
    if (subtype == "PCM_24") return SF_FORMAT_WAV | SF_FORMAT_PCM_24;
    if (subtype == "FLOAT") return SF_FORMAT_WAV | SF_FORMAT_FLOAT;
    return std::nullopt;
}

AudioReadResult readMonoAudio(const std::filesystem::path& path) {
    SF_INFO info{};
    SndfileHandle file(sf_open(path.string().c_str(), SFM_READ, &info));
    if (!file) {
        return readFailure("cannot open '" + path.string() + "': " + sf_strerror(nullptr));
    }
    if (info.channels <= 0 || info.samplerate <= 0) {
        return readFailure("'" + path.string() + "' has no audio channels");
    }

    const auto channels = static_cast<size_t>(info.channels);
    const auto frames = static_cast<size_t>(info.frames);
    std::vector<float> interleaved(frames * channels);

    const sf_count_t read = sf_readf_float(file.get(), interleaved.data(),
                                           static_cast<sf_count_t>(frames));
    if (read < 0) {
        return readFailure("decode error in '" + path.string() + "': "
                           + sf_strerror(file.get()));
    }

    AudioReadResult result;
    AudioData& audio = result.audio;
    audio.sampleRate = info.samplerate;
    audio.sourceChannels = info.channels;
    audio.sourceFormat = info.format;
    audio.samples.resize(static_cast<size_t>(read));

    const float scale = 1.0f / static_cast<float>(channels);
    for (size_t f = 0; f < audio.samples.size(); ++f) {
        float sum = 0.0f;
        for (size_t c = 0; c < channels; ++c) {
            sum += interleaved[f * channels + c];
        }
        audio.samples[f] = sum * scale;
    }
    return result;
}

DSP::ValidationResult writeMonoWav(const std::filesystem::path& path,
                                   const std::vector<float>& samples,
                                   int sampleRate,
                                   std::string_view subtype) {
    using DSP::SeparationError;
    using DSP::ValidationResult;

    const auto format = wavFormatForSubtype(subtype);
    if (!format) {
        return ValidationResult::fail(SeparationError::InvalidParameter,
                                      "unsupported WAV subtype '" + std::string(subtype) + "'");
    }

    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return ValidationResult::fail(SeparationError::IOError,
                "cannot create '" + path.parent_path().string() + "': " + ec.message());
        }
    }

    SF_INFO info{};
    info.samplerate = sampleRate;
    info.channels = 1;
    info.format = *format;
    if (!sf_format_check(&info)) {
        return ValidationResult::fail(SeparationError::InvalidParameter,
            "invalid WAV format at " + std::to_string(sampleRate) + " Hz");
    }

    SndfileHandle file(sf_open(path.string().c_str(), SFM_WRITE, &info));
    if (!file) {
        return ValidationResult::fail(SeparationError::IOError,
            "cannot create '" + path.string() + "': " + sf_strerror(nullptr));
    }
    // Saturate instead of wrapping when float samples exceed full scale
    sf_command(file.get(), SFC_SET_CLIPPING, nullptr, SF_TRUE);

    const auto count = static_cast<sf_count_t>(samples.size());
    if (sf_write_float(file.get(), samples.data(), count) != count) {
        return ValidationResult::fail(SeparationError::IOError,
            "short write to '" + path.string() + "': " + sf_strerror(file.get()));
    }
    return ValidationResult::ok();
}

} // namespace Tools
} // namespace Raga
