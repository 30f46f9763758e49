//
// Audio container decoding for the tempo worker.
//

#ifndef TACTUS_AUDIODECODER_H
#define TACTUS_AUDIODECODER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "../core/AudioSignal.h"

namespace tactus::pipeline {

    /**
     * @brief Configuration of the audio decoder.
     */
    struct DecoderConfig {
        /** @brief When false every decode request fails as an unavailable environment (default: true). */
        bool enabled = true;

        /** @brief Largest file readFile() accepts, in bytes (default: 50 MiB). */
        size_t maxFileBytes = 50ull * 1024 * 1024;
    };

    /**
     * @brief Turns encoded audio (file path or bytes) into a mono AudioSignal.
     *
     * Uncompressed WAV (PCM 8/16/24/32-bit, IEEE float 32-bit, little-endian)
     * is decoded natively. Other containers are recognised by their magic bytes
     * and reported as unavailable. Only the first channel is kept.
     */
    class AudioDecoder {
    public:
        /** @brief Container families recognised by sniffContainer(). */
        enum class Container { Wav, Flac, Mp3, Ogg, Mp4, Unknown };

        /**
         * @brief Constructs a decoder.
         * @param config Enable flag and file size limit.
         */
        explicit AudioDecoder(DecoderConfig config = DecoderConfig());

        /**
         * @brief Identifies a container from its leading bytes.
         * @param bytes The file contents (only the first 12 bytes are inspected).
         * @return The container family, Unknown if nothing matches.
         */
        static Container sniffContainer(const std::vector<uint8_t>& bytes);

        /** @brief Lower-case name of a container ("wav", "flac", ...). */
        static std::string toString(Container container);

        /**
         * @brief Reads a whole file into memory.
         *
         * @param path The file path.
         * @return The file bytes.
         * @throws core::DecodeError If the file cannot be read or exceeds maxFileBytes.
         */
        std::vector<uint8_t> readFile(const std::string& path) const;

        /**
         * @brief Decodes an in-memory container.
         *
         * @param bytes The container bytes.
         * @return The first channel as a signal at the file's sample rate.
         * @throws core::EncodingError If the bytes are malformed or not audio.
         * @throws core::EnvironmentUnavailableError If decoding is disabled or the container has no decoder in this build.
         */
        core::AudioSignal decode(const std::vector<uint8_t>& bytes) const;

        /**
         * @brief readFile() followed by decode().
         */
        core::AudioSignal decodeFile(const std::string& path) const;

        /** @brief True if decode() can succeed for at least one container. */
        bool isAvailable() const { return m_config.enabled; }

        /** @brief Names of the containers decode() accepts; empty when disabled. */
        std::vector<std::string> supportedContainers() const;

        /**
         * @brief Encodes a signal as a mono 16-bit PCM WAV file.
         *
         * Samples are clamped to [-1, 1] and scaled by 32767.
         * @param signal The signal to encode.
         * @return The complete RIFF/WAVE file.
         */
        static std::vector<uint8_t> encodeWav16(const core::AudioSignal& signal);

    private:
        static core::AudioSignal decodeWav(const std::vector<uint8_t>& bytes);

        DecoderConfig m_config;
    };

} // namespace tactus::pipeline

#endif //TACTUS_AUDIODECODER_H
