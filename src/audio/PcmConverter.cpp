#include "audio/PcmConverter.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

PcmConverter::PcmConverter(int deviceRate, int deviceChannels, int targetRate)
    : deviceRate_(deviceRate > 0 ? deviceRate : targetRate)
    , deviceChannels_(std::max(1, deviceChannels))
    , targetRate_(targetRate)
    , passthrough_(deviceRate_ == targetRate_ && deviceChannels_ == 1) {}

int PcmConverter::deviceFramesPerChunk(int chunkMs) const {
    long long targetFrames = (long long)targetRate_ * chunkMs / 1000;
    return static_cast<int>(targetFrames * deviceRate_ / targetRate_);
}

std::vector<uint8_t> PcmConverter::convert(const int16_t* interleaved,
                                           size_t frameCount) const {
    if (!interleaved || frameCount == 0) return {};

    std::vector<int16_t> mono = downmix(interleaved, frameCount, deviceChannels_);
    if (deviceRate_ != targetRate_)
        mono = resampleLinear(mono, deviceRate_, targetRate_);
    return encodeLE(mono);
}

std::vector<int16_t> PcmConverter::downmix(const int16_t* interleaved,
                                           size_t frameCount, int channels) {
    std::vector<int16_t> mono(frameCount);
    if (channels <= 1) {
        std::copy(interleaved, interleaved + frameCount, mono.begin());
        return mono;
    }

    for (size_t f = 0; f < frameCount; f++) {
        const int16_t* frame = interleaved + f * channels;
        int sum = 0;
        for (int ch = 0; ch < channels; ch++)
            sum += frame[ch];
        // Floor division so negative and positive sums round the same way
        int avg = sum / channels;
        if (sum % channels != 0 && sum < 0) avg -= 1;
        mono[f] = static_cast<int16_t>(avg);
    }
    return mono;
}

std::vector<int16_t> PcmConverter::resampleLinear(const std::vector<int16_t>& samples,
                                                  int srcRate, int dstRate) {
    if (samples.empty() || srcRate == dstRate || srcRate <= 0 || dstRate <= 0)
        return samples;

    const size_t n = samples.size();
    const double step = static_cast<double>(srcRate) / dstRate;
    const size_t outLen = static_cast<size_t>(
        std::llround(static_cast<double>(n) * dstRate / srcRate));

    std::vector<int16_t> out;
    out.reserve(outLen);

    for (size_t i = 0; i < outLen; i++) {
        double pos  = i * step;
        size_t idx  = static_cast<size_t>(pos);
        double frac = pos - static_cast<double>(idx);

        int value;
        if (idx + 1 < n) {
            value = static_cast<int>(samples[idx] * (1.0 - frac) +
                                     samples[idx + 1] * frac);
        } else if (idx < n) {
            value = samples[idx];
        } else {
            break;
        }

        value = std::clamp(value,
                           (int)std::numeric_limits<int16_t>::min(),
                           (int)std::numeric_limits<int16_t>::max());
        out.push_back(static_cast<int16_t>(value));
    }
    return out;
}

std::vector<uint8_t> PcmConverter::encodeLE(const std::vector<int16_t>& samples) {
    std::vector<uint8_t> bytes(samples.size() * 2);
    for (size_t i = 0; i < samples.size(); i++) {
        auto u = static_cast<uint16_t>(samples[i]);
        bytes[2 * i]     = static_cast<uint8_t>(u & 0xFF);
        bytes[2 * i + 1] = static_cast<uint8_t>(u >> 8);
    }
    return bytes;
}
