#pragma once

#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "TempoEstimate.h"

namespace tactus::core {

/**
 * @brief One decoded request message.
 *
 * A request carries either raw samples (channelData + sampleRate) or an
 * encoded audio container (a file path or the file bytes), or is a probe.
 */
struct TempoRequest {
    /** @brief True for a capability probe; every other field is then ignored. */
    bool probe = false;

    /** @brief The estimator to run. */
    TempoMethod method = TempoMethod::Autocorrelation;

    /** @brief The method string as sent, empty if the key was absent. */
    std::string requestedMethod;

    /** @brief False if requestedMethod named no known method. */
    bool methodRecognised = true;

    /** @brief Raw mono samples. */
    std::optional<std::vector<float>> channelData;

    /** @brief Sample rate of channelData in Hz. */
    int sampleRate = 0;

    /** @brief Path of an audio file to decode. */
    std::optional<std::string> filePath;

    /** @brief Bytes of an audio file to decode. */
    std::optional<std::vector<uint8_t>> fileBytes;

    /** @brief True if the request must go through the decoder. */
    bool needsDecoding() const { return filePath.has_value() || fileBytes.has_value(); }
};

/**
 * @brief Manages the JSON message contract of the tempo worker.
 *
 * Parses requests and builds success, failure and probe responses.
 */
class JsonContract {
public:
    /** @brief The current version number of the message contract. */
    static constexpr int CURRENT_VERSION = 1;

    /**
     * @brief Parses a request message.
     *
     * @param request The JSON request.
     * @param defaultMethod Method used when the request carries no "method" key.
     * @return The decoded request.
     * @throws std::invalid_argument If the request is not an object, lacks audio, or a field has the wrong type or range
     *         (including samples that do not fit a finite float).
     */
    static TempoRequest parseRequest(const nlohmann::json& request,
                                     TempoMethod defaultMethod = TempoMethod::Autocorrelation) {
        if (!request.is_object()) {
            throw std::invalid_argument("Request must be a JSON object");
        }

        TempoRequest out;
        if (request.contains("probe") && request["probe"].is_boolean() && request["probe"].get<bool>()) {
            out.probe = true;
            return out;
        }

        // Method: missing selects the default, unknown falls back to autocorrelation
        out.method = defaultMethod;
        if (request.contains("method")) {
            if (!request["method"].is_string()) {
                throw std::invalid_argument("Field 'method' must be a string");
            }
            out.requestedMethod = request["method"].get<std::string>();
            auto parsed = parseTempoMethod(out.requestedMethod);
            out.methodRecognised = parsed.has_value();
            out.method = parsed ? *parsed : TempoMethod::Autocorrelation;
        }

        if (request.contains("channelData")) {
            const auto& data = request["channelData"];
            if (!data.is_array()) {
                throw std::invalid_argument("Field 'channelData' must be an array of numbers");
            }
            std::vector<float> samples;
            samples.reserve(data.size());
            for (const auto& v : data) {
                if (!v.is_number()) {
                    throw std::invalid_argument("Field 'channelData' must be an array of numbers");
                }
                // Values beyond float range would turn into inf
                const double sample = v.get<double>();
                if (!std::isfinite(sample) || std::abs(sample) > std::numeric_limits<float>::max()) {
                    throw std::invalid_argument("Field 'channelData' must hold finite float samples");
                }
                samples.push_back(static_cast<float>(sample));
            }

            if (!request.contains("sampleRate") || !request["sampleRate"].is_number()) {
                throw std::invalid_argument("Field 'sampleRate' is required with 'channelData'");
            }
            const double rate = request["sampleRate"].get<double>();
            if (!std::isfinite(rate) || rate <= 0.0 || rate != std::floor(rate) || rate > 2147483647.0) {
                throw std::invalid_argument("Field 'sampleRate' must be a positive integer");
            }
            out.channelData = std::move(samples);
            out.sampleRate = static_cast<int>(rate);
            return out;
        }

        if (request.contains("file")) {
            const auto& file = request["file"];
            if (file.is_string()) {
                out.filePath = file.get<std::string>();
            } else if (file.is_binary()) {
                const auto& bin = file.get_binary();
                out.fileBytes = std::vector<uint8_t>(bin.begin(), bin.end());
            } else {
                throw std::invalid_argument("Field 'file' must be a path string or binary data");
            }
            return out;
        }

        throw std::invalid_argument("Request carries neither 'channelData' nor 'file'");
    }

    /**
     * @brief Builds a success response.
     * @param estimate The estimate to report.
     * @param method The method name to echo, as the caller sent it.
     * @return {"bpm", "confidence", "method"}.
     */
    static nlohmann::json makeResponse(const TempoEstimate& estimate, const std::string& method) {
        nlohmann::json out = estimate.toJson();
        out["method"] = method;
        return out;
    }

    /**
     * @brief Builds a failure response.
     *
     * @param method The method name to echo.
     * @param error The error message.
     * @param encodingError True if the audio container itself was malformed; the flag is omitted otherwise.
     * @return {"bpm": null, "confidence": 0, "method", "error"[, "encodingError": true]}.
     */
    static nlohmann::json makeErrorResponse(const std::string& method, const std::string& error,
                                            bool encodingError = false) {
        nlohmann::json out = TempoEstimate::none().toJson();
        out["method"] = method;
        out["error"] = error;
        if (encodingError) out["encodingError"] = true;
        return out;
    }

    /**
     * @brief Builds the capability probe response.
     *
     * @param audioDecodingAvailable Whether encoded audio can be decoded.
     * @param containers The container names the decoder accepts.
     * @param version The engine version.
     * @return The probe response.
     */
    static nlohmann::json makeProbeResponse(bool audioDecodingAvailable,
                                            const std::vector<std::string>& containers,
                                            const std::string& version) {
        nlohmann::json methods = nlohmann::json::array();
        for (TempoMethod m : allTempoMethods()) methods.push_back(toString(m));

        return {
            {"audioDecodingAvailable", audioDecodingAvailable},
            {"containers", containers},
            {"methods", methods},
            {"version", version},
            {"contractVersion", CURRENT_VERSION}
        };
    }

    /**
     * @brief Validates a success or failure response against the contract.
     *
     * Checks field presence and types, the BPM range, the confidence range,
     * and that a null BPM carries confidence 0.
     * @param response The response to check.
     * @return true if the response is well formed.
     */
    static bool validate(const nlohmann::json& response) {
        if (!response.is_object()) return false;
        if (!response.contains("bpm") || !response.contains("confidence") || !response.contains("method")) {
            return false;
        }
        if (!response["method"].is_string() || !response["confidence"].is_number()) return false;

        const double confidence = response["confidence"].get<double>();
        if (!(confidence >= 0.0 && confidence <= 1.0)) return false;

        const auto& bpm = response["bpm"];
        if (bpm.is_null()) {
            if (confidence != 0.0) return false;
        } else if (!bpm.is_number_integer() || !inTempoRange(bpm.get<double>())) {
            return false;
        }

        if (response.contains("error") && !response["error"].is_string()) return false;
        if (response.contains("encodingError") && !response["encodingError"].is_boolean()) return false;
        return true;
    }
};

} // namespace tactus::core
