#include <iostream>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../include/tactus/core/JsonContract.h"
#include "../include/tactus/pipeline/AudioDecoder.h"
#include "../include/tactus/pipeline/TempoWorker.h"
#include "test_signals.h"

using tactus::core::JsonContract;
using tactus::pipeline::AudioDecoder;
using tactus::pipeline::TempoWorker;

static nlohmann::json samples_request(const std::string& method, const tactus::core::AudioSignal& sig) {
    nlohmann::json req;
    req["method"] = method;
    req["channelData"] = sig.samples();
    req["sampleRate"] = sig.getSampleRate();
    return req;
}

static bool expect_error(const nlohmann::json& res, bool encodingError) {
    if (!res.contains("error") || !res["bpm"].is_null() || res["confidence"].get<double>() != 0.0) {
        std::cerr << "Expected an error response, got " << res.dump() << std::endl;
        return false;
    }
    if (res.contains("encodingError") != encodingError) {
        std::cerr << "encodingError flag mismatch: " << res.dump() << std::endl;
        return false;
    }
    return JsonContract::validate(res);
}

bool test_worker_channel_data_request() {
    TempoWorker worker;
    auto sig = synth_kicks(16000, 120.0, 10.0);
    nlohmann::json res = worker.handle(samples_request("peak-picking", sig));
    std::cout << "peak-picking response: " << res.dump() << std::endl;
    if (!JsonContract::validate(res) || res.contains("error")) return false;
    if (res["bpm"] != 120 || res["method"] != "peak-picking" || res["confidence"].get<double>() != 1.0) return false;

    nlohmann::json combined = worker.handle(samples_request("combined", sig));
    return combined["bpm"] == 120 && combined["method"] == "combined";
}

bool test_worker_method_defaults() {
    TempoWorker worker;
    auto sig = synth_kicks(16000, 120.0, 2.0);

    nlohmann::json req = samples_request("bogus", sig);
    nlohmann::json unknown = worker.handle(req);
    req.erase("method");
    nlohmann::json missing = worker.handle(req);
    // Both run autocorrelation, whose default gate rejects unit-level audio;
    // an unknown method is echoed back as sent
    return unknown["method"] == "bogus" && !unknown.contains("error") && unknown["bpm"].is_null()
           && missing["method"] == "autocorrelation" && JsonContract::validate(missing);
}

bool test_worker_invalid_requests() {
    TempoWorker worker;
    nlohmann::json badRate = {{"method", "spectral-flux"}, {"channelData", {0.0, 0.5, -0.5}}, {"sampleRate", 0}};
    nlohmann::json badData = {{"method", "spectral-flux"}, {"channelData", {0.0, "x"}}, {"sampleRate", 8000}};
    nlohmann::json noAudio = {{"method", "peak-picking"}};
    nlohmann::json hugeSample = {{"method", "autocorrelation"}, {"channelData", {1e300, 0.0, 0.0, 0.0}},
                                 {"sampleRate", 8000}};
    nlohmann::json nanSample = {{"method", "autocorrelation"},
                                {"channelData", {0.0, std::numeric_limits<double>::quiet_NaN()}},
                                {"sampleRate", 8000}};

    nlohmann::json r2 = worker.handle(hugeSample);
    if (!expect_error(r2, false) || r2["error"].get<std::string>().find("finite") == std::string::npos) {
        std::cerr << "Out-of-float-range sample accepted: " << r2.dump() << std::endl;
        return false;
    }
    if (!expect_error(worker.handle(nanSample), false)) return false;

    nlohmann::json r1 = worker.handle(badRate);
    if (!expect_error(r1, false) || r1["method"] != "spectral-flux") return false;
    return expect_error(worker.handle(badData), false) && expect_error(worker.handle(noAudio), false)
           && expect_error(worker.handle(nlohmann::json::array({1, 2, 3})), false);
}

bool test_worker_binary_file_request() {
    TempoWorker worker;
    std::vector<uint8_t> wav = AudioDecoder::encodeWav16(synth_kicks(16000, 120.0, 10.0));
    nlohmann::json req = {{"method", "peak-picking"}, {"file", nlohmann::json::binary(wav)}};
    nlohmann::json res = worker.handle(req);
    std::cout << "binary file response: " << res.dump() << std::endl;
    return res["bpm"] == 120 && !res.contains("error");
}

bool test_worker_file_path_request() {
    const std::string path = "tactus_test_worker.wav";
    std::vector<uint8_t> wav = AudioDecoder::encodeWav16(synth_kicks(44100, 120.0, 10.0));
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(wav.data()), static_cast<std::streamsize>(wav.size()));
    }
    TempoWorker worker;
    nlohmann::json res = worker.handle({{"method", "combined"}, {"file", path}});

    // Same file through a worker whose size limit is too small
    TempoWorker limited(nlohmann::json{{"decoder", {{"maxFileBytes", 1024}}}});
    nlohmann::json tooBig = limited.handle({{"method", "combined"}, {"file", path}});
    std::remove(path.c_str());

    std::cout << "file path response: " << res.dump() << std::endl;
    return res["bpm"] == 120 && res["method"] == "combined" && expect_error(tooBig, false);
}

bool test_worker_decoding_errors() {
    TempoWorker worker;
    std::vector<uint8_t> junk = {'n', 'o', 't', ' ', 'a', 'u', 'd', 'i', 'o'};
    nlohmann::json bad = worker.handle({{"method", "spectral-flux"}, {"file", nlohmann::json::binary(junk)}});
    if (!expect_error(bad, true) || bad["method"] != "spectral-flux") return false;
    if (bad["error"].get<std::string>().find("Unable to decode audio data") == std::string::npos) return false;

    std::vector<uint8_t> flac = {'f', 'L', 'a', 'C', 0, 0, 0, 0x22};
    if (!expect_error(worker.handle({{"file", nlohmann::json::binary(flac)}}), false)) return false;

    TempoWorker disabled(nlohmann::json{{"decoder", {{"enabled", false}}}});
    std::vector<uint8_t> wav = AudioDecoder::encodeWav16(synth_kicks(8000, 120.0, 1.0));
    return expect_error(disabled.handle({{"file", nlohmann::json::binary(wav)}}), false);
}

bool test_worker_probe() {
    TempoWorker worker;
    nlohmann::json p = worker.handle({{"probe", true}});
    if (p["audioDecodingAvailable"] != true || p["containers"] != nlohmann::json::array({"wav"})) return false;
    if (p["methods"] != nlohmann::json::array({"autocorrelation", "spectral-flux", "peak-picking", "combined"})) {
        return false;
    }
    if (p["estimators"]["combined"] != "1.0.0" || p["estimators"].size() != 4) return false;

    TempoWorker disabled(nlohmann::json{{"decoder", {{"enabled", false}}}});
    nlohmann::json q = disabled.probe();
    return q["audioDecodingAvailable"] == false && q["containers"].empty() && q["version"] == TempoWorker::VERSION;
}

bool test_worker_config_patch() {
    TempoWorker worker;
    if (worker.getEstimatorNames().size() != 4) return false;

    try {
        worker.setConfig({{"estimators", {{"autocorrelation", {{"minCorrelation", -1.0}}}}}});
        std::cerr << "Negative minCorrelation must be rejected" << std::endl;
        return false;
    } catch (const std::runtime_error& e) {
        if (std::string(e.what()) != "Failed to initialize estimator: autocorrelation") return false;
    }
    // The rejected patch left the previous configuration in place
    if (worker.getConfig()["estimators"]["autocorrelation"]["minCorrelation"] != 0.1) return false;

    try {
        worker.setConfig({{"defaultMethod", "tap-tempo"}});
        return false;
    } catch (const std::runtime_error&) {
    }

    try {
        worker.setConfig({{"decoder", {{"maxFileBytes", -1}}}});
        std::cerr << "Negative maxFileBytes must be rejected" << std::endl;
        return false;
    } catch (const std::runtime_error&) {
    }
    try {
        worker.setConfig({{"estimators", {{"spectral-flux", {{"hopSize", -1}}}}}});
        return false;
    } catch (const std::runtime_error& e) {
        if (std::string(e.what()) != "Failed to initialize estimator: spectral-flux") return false;
    }
    if (worker.getConfig()["decoder"]["maxFileBytes"] != 52428800) return false;

    // Sensitive autocorrelation plus a new default method
    worker.setConfig({{"defaultMethod", "combined"},
                      {"estimators", {{"autocorrelation", {{"minCorrelation", 1e-7}}}}}});
    auto sig = synth_kicks(44100, 120.0, 10.0);
    nlohmann::json req = samples_request("autocorrelation", sig);
    req.erase("method");
    nlohmann::json res = worker.handle(req);
    if (res["method"] != "combined" || res["bpm"] != 120) return false;
    if (std::abs(res["confidence"].get<double>() - 0.97919) > 1e-3) return false;

    tactus::core::TempoEstimate direct = worker.run(tactus::core::TempoMethod::Autocorrelation, sig);
    return direct.bpm == 120 && direct.confidence > 0.5;
}
