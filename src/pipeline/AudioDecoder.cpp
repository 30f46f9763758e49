#include "../../include/tactus/pipeline/AudioDecoder.h"
#include "../../include/tactus/core/Errors.h"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace tactus::pipeline {

static const char* kUnableToDecode = "Unable to decode audio data";

/**
 * @brief Reads a 16-bit unsigned integer in little-endian order.
 */
static uint16_t read_u16_le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

/**
 * @brief Reads a 32-bit unsigned integer in little-endian order.
 */
static uint32_t read_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8)
         | (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

static void write_u16_le(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

static void write_u32_le(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

static bool hasTag(const std::vector<uint8_t>& bytes, size_t offset, const char* tag) {
    const size_t len = std::strlen(tag);
    return bytes.size() >= offset + len && std::memcmp(bytes.data() + offset, tag, len) == 0;
}

static core::EncodingError malformed(const std::string& detail) {
    return core::EncodingError(std::string(kUnableToDecode) + ": " + detail);
}

AudioDecoder::AudioDecoder(DecoderConfig config)
    : m_config(config) {
}

AudioDecoder::Container AudioDecoder::sniffContainer(const std::vector<uint8_t>& bytes) {
    if (hasTag(bytes, 0, "RIFF") && hasTag(bytes, 8, "WAVE")) return Container::Wav;
    if (hasTag(bytes, 0, "fLaC")) return Container::Flac;
    if (hasTag(bytes, 0, "OggS")) return Container::Ogg;
    if (hasTag(bytes, 4, "ftyp")) return Container::Mp4;
    if (hasTag(bytes, 0, "ID3")) return Container::Mp3;
    // Bare MPEG audio frame sync
    if (bytes.size() >= 2 && bytes[0] == 0xFF && (bytes[1] & 0xE0) == 0xE0) return Container::Mp3;
    return Container::Unknown;
}

std::string AudioDecoder::toString(Container container) {
    switch (container) {
        case Container::Wav:  return "wav";
        case Container::Flac: return "flac";
        case Container::Mp3:  return "mp3";
        case Container::Ogg:  return "ogg";
        case Container::Mp4:  return "mp4";
        case Container::Unknown: break;
    }
    return "unknown";
}

std::vector<uint8_t> AudioDecoder::readFile(const std::string& path) const {
    std::ifstream f(path, std::ios::binary | std::ios::ate);
    if (!f) throw core::DecodeError("Failed to open audio file: " + path);

    const std::streamoff size = f.tellg();
    if (size < 0) throw core::DecodeError("Failed to read audio file: " + path);
    if (static_cast<unsigned long long>(size) > m_config.maxFileBytes) {
        throw core::DecodeError("Audio file exceeds maximum size of " + std::to_string(m_config.maxFileBytes)
                                + " bytes: " + path);
    }

    std::vector<uint8_t> bytes(static_cast<size_t>(size));
    f.seekg(0, std::ios::beg);
    if (size > 0 && !f.read(reinterpret_cast<char*>(bytes.data()), size)) {
        throw core::DecodeError("Failed to read audio file: " + path);
    }
    return bytes;
}

core::AudioSignal AudioDecoder::decode(const std::vector<uint8_t>& bytes) const {
    if (!m_config.enabled) {
        throw core::EnvironmentUnavailableError("Audio decoding is disabled");
    }

    const Container container = sniffContainer(bytes);
    switch (container) {
        case Container::Wav:
            return decodeWav(bytes);
        case Container::Unknown:
            throw core::EncodingError(kUnableToDecode);
        default:
            std::cerr << "[Decoder] No decoder for container: " << toString(container) << std::endl;
            throw core::EnvironmentUnavailableError("No decoder available for " + toString(container) + " audio");
    }
}

core::AudioSignal AudioDecoder::decodeFile(const std::string& path) const {
    return decode(readFile(path));
}

std::vector<std::string> AudioDecoder::supportedContainers() const {
    if (!m_config.enabled) return {};
    return {toString(Container::Wav)};
}

/**
 * @brief Decodes a RIFF/WAVE file held in memory.
 *
 * Walks the chunk list for 'fmt ' and 'data' (unknown chunks are skipped,
 * odd-sized chunks are padded) and converts the first channel to float in
 * [-1, 1]. WAVE_FORMAT_EXTENSIBLE is resolved through its sub-format GUID.
 */
core::AudioSignal AudioDecoder::decodeWav(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < 12) throw malformed("truncated RIFF header");

    uint16_t audioFormat = 0, numChannels = 0, bitsPerSample = 0, blockAlign = 0;
    uint32_t sampleRate = 0;
    bool haveFmt = false;
    size_t dataPos = 0, dataSize = 0;
    bool haveData = false;

    // Chunk reading loop
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const std::string chunkId(reinterpret_cast<const char*>(bytes.data() + pos), 4);
        const size_t chunkSize = read_u32_le(bytes.data() + pos + 4);
        const size_t body = pos + 8;
        if (chunkSize > bytes.size() - body) {
            throw malformed("chunk '" + chunkId + "' runs past end of file");
        }

        if (chunkId == "fmt ") {
            if (chunkSize < 16) throw malformed("'fmt ' chunk too small");
            const uint8_t* p = bytes.data() + body;
            audioFormat = read_u16_le(p);
            numChannels = read_u16_le(p + 2);
            sampleRate = read_u32_le(p + 4);
            blockAlign = read_u16_le(p + 12);
            bitsPerSample = read_u16_le(p + 14);
            // WAVE_FORMAT_EXTENSIBLE: the real format code opens the sub-format GUID
            if (audioFormat == 0xFFFE && chunkSize >= 40) audioFormat = read_u16_le(p + 24);
            haveFmt = true;
        } else if (chunkId == "data") {
            dataPos = body;
            dataSize = chunkSize;
            haveData = true;
        }

        // Skip to the next chunk, honouring the pad byte of odd-sized chunks
        pos = body + chunkSize + (chunkSize % 2);
        if (haveFmt && haveData) break;
    }

    if (!haveFmt || !haveData) throw malformed("missing 'fmt ' or 'data' chunk");
    if (numChannels == 0 || sampleRate == 0 || sampleRate > 2147483647u) {
        throw malformed("invalid channel count or sample rate");
    }

    const size_t bytesPerSample = bitsPerSample / 8;
    const bool pcm = audioFormat == 1 && (bitsPerSample == 8 || bitsPerSample == 16
                                          || bitsPerSample == 24 || bitsPerSample == 32);
    const bool ieee = audioFormat == 3 && bitsPerSample == 32;
    if (!pcm && !ieee) {
        throw malformed("unsupported format " + std::to_string(audioFormat) + " with "
                        + std::to_string(bitsPerSample) + " bits");
    }

    const size_t frameBytes = std::max<size_t>(blockAlign, bytesPerSample * numChannels);
    const size_t frames = dataSize / frameBytes;
    std::vector<float> mono(frames);

    // First channel of each frame
    for (size_t i = 0; i < frames; ++i) {
        const uint8_t* s = bytes.data() + dataPos + i * frameBytes;
        float v = 0.0f;
        if (ieee) {
            std::memcpy(&v, s, 4);
        } else if (bitsPerSample == 8) {
            // 8-bit PCM is unsigned with a 128 offset
            v = (static_cast<float>(s[0]) - 128.0f) / 128.0f;
        } else if (bitsPerSample == 16) {
            v = static_cast<float>(static_cast<int16_t>(read_u16_le(s))) / 32768.0f;
        } else if (bitsPerSample == 24) {
            int32_t x = s[0] | (s[1] << 8) | (s[2] << 16);
            // Sign extension for 24-bit value
            if (x & 0x800000) x |= ~0xFFFFFF;
            v = static_cast<float>(x) / 8388608.0f;
        } else {
            v = static_cast<float>(static_cast<double>(static_cast<int32_t>(read_u32_le(s))) / 2147483648.0);
        }
        mono[i] = v;
    }

    return core::AudioSignal(std::move(mono), static_cast<int>(sampleRate));
}

std::vector<uint8_t> AudioDecoder::encodeWav16(const core::AudioSignal& signal) {
    const uint32_t dataBytes = static_cast<uint32_t>(signal.size() * 2);
    const uint32_t rate = static_cast<uint32_t>(std::max(0, signal.getSampleRate()));

    std::vector<uint8_t> out;
    out.reserve(44 + dataBytes);
    out.insert(out.end(), {'R', 'I', 'F', 'F'});
    write_u32_le(out, 36 + dataBytes);
    out.insert(out.end(), {'W', 'A', 'V', 'E', 'f', 'm', 't', ' '});
    write_u32_le(out, 16);
    write_u16_le(out, 1);        // PCM
    write_u16_le(out, 1);        // mono
    write_u32_le(out, rate);
    write_u32_le(out, rate * 2); // byte rate
    write_u16_le(out, 2);        // block align
    write_u16_le(out, 16);
    out.insert(out.end(), {'d', 'a', 't', 'a'});
    write_u32_le(out, dataBytes);

    for (float x : signal.samples()) {
        const float clamped = std::max(-1.0f, std::min(1.0f, x));
        const int16_t s = static_cast<int16_t>(std::lround(clamped * 32767.0f));
        write_u16_le(out, static_cast<uint16_t>(s));
    }
    return out;
}

} // namespace tactus::pipeline
