#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

// Normalises device PCM (any rate, any channel count, interleaved s16) to
// the wire format: mono, target rate, little-endian s16, no header.
//
//   1. downmix   average all channels per frame, floor-rounded
//   2. resample  linear interpolation, round(n * dst / src) output samples,
//                clamped to the 16-bit range
//   3. encode    tightly packed little-endian bytes
class PcmConverter {
public:
    PcmConverter(int deviceRate, int deviceChannels, int targetRate);

    // True when the device format already matches the wire format
    bool passthrough() const { return passthrough_; }

    int deviceRate() const { return deviceRate_; }
    int deviceChannels() const { return deviceChannels_; }
    int targetRate() const { return targetRate_; }

    // Device frames to read per chunk so one chunk lasts chunkMs
    int deviceFramesPerChunk(int chunkMs) const;

    // frameCount interleaved device frames -> wire bytes. Empty input
    // gives empty output.
    std::vector<uint8_t> convert(const int16_t* interleaved, size_t frameCount) const;

    static std::vector<int16_t> downmix(const int16_t* interleaved,
                                        size_t frameCount, int channels);

    static std::vector<int16_t> resampleLinear(const std::vector<int16_t>& samples,
                                               int srcRate, int dstRate);

    static std::vector<uint8_t> encodeLE(const std::vector<int16_t>& samples);

private:
    int  deviceRate_;
    int  deviceChannels_;
    int  targetRate_;
    bool passthrough_;
};
