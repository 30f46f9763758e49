#include <iostream>
#include <fstream>
#include <chrono>
#include <cctype>
#include <cstdlib>
#include <string>
#include "../include/tactus/pipeline/TempoWorker.h"
#include "../include/tactus/core/JsonContract.h"
#include <nlohmann/json.hpp>

/**
 * @brief Checks whether a path ends with a (case-insensitive) ".wav" extension.
 */
static bool isWavPath(const std::string& path) {
    if (path.size() < 4) return false;
    std::string ext = path.substr(path.size() - 4);
    for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ext == ".wav";
}

/**
 * @brief Main function for the Tactus tempo estimation executable.
 *
 * Reads a request (JSON file, or a WAV file that is wrapped into a file request),
 * applies an optional configuration file, handles the request and writes the
 * JSON response.
 * @param argc The number of command-line arguments.
 * @param argv The command-line arguments.
 * @return 0 on success, 1 for an error response, 2 usage, 3/4 configuration, 5 request.
 */
int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <request.json|input.wav> <response.json> [config.json]" << std::endl;
        return 2;
    }
    const std::string inputPath = argv[1];
    const std::string outputPath = argv[2];

    // Optional configuration file (JSON merge-patch over the defaults)
    nlohmann::json cfg = nlohmann::json::object();
    if (argc >= 4) {
        const std::string configPath = argv[3];
        std::ifstream cfgIn(configPath);
        if (!cfgIn.is_open()) {
            std::cerr << "[Config] Could not open configuration file: " << configPath << std::endl;
            return 3;
        }
        try {
            cfgIn >> cfg;
            std::cout << "[Config] Loaded configuration from: " << configPath << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[Config] Failed to parse JSON ('" << configPath << "'): " << e.what() << std::endl;
            return 4;
        }
    }
    const char* envDebug = std::getenv("TACTUS_DEBUG");
    if (envDebug && std::string(envDebug) == "1") {
        cfg["debug"] = true;
    }

    try {
        auto startTime = std::chrono::high_resolution_clock::now();
        tactus::pipeline::TempoWorker worker(cfg);

        // Build the request
        nlohmann::json request;
        if (isWavPath(inputPath)) {
            request = {
                {"method", worker.getConfig().value("defaultMethod", std::string("autocorrelation"))},
                {"file", inputPath}
            };
        } else {
            std::ifstream reqIn(inputPath);
            if (!reqIn.is_open()) {
                std::cerr << "Could not open request file: " << inputPath << std::endl;
                return 5;
            }
            try {
                reqIn >> request;
            } catch (const std::exception& e) {
                std::cerr << "Failed to parse request JSON ('" << inputPath << "'): " << e.what() << std::endl;
                return 5;
            }
        }

        nlohmann::json response = worker.handle(request);

        auto endTime = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count();

        std::ofstream outFile(outputPath);
        if (!outFile.is_open()) {
            std::cerr << "Could not open output file: " << outputPath << std::endl;
            return 1;
        }
        outFile << response.dump(2);
        outFile.close();

        if (response.contains("error")) {
            std::cerr << "Error: " << response["error"].get<std::string>() << std::endl;
            return 1;
        }

        if (response.contains("bpm")) {
            if (!tactus::core::JsonContract::validate(response)) {
                std::cerr << "Warning: Response validation failed! The result may not conform to the contract." << std::endl;
            }
            std::cout << "BPM: " << response["bpm"] << " (confidence: " << response["confidence"]
                      << ", method: " << response["method"].get<std::string>() << ")" << std::endl;
        }
        std::cout << "Processing time: " << duration / 1000.0 << " seconds" << std::endl;
        std::cout << "Output saved to: " << outputPath << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
