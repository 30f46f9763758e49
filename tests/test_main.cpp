#include <iostream>
#include <cstdlib>
#include <exception>
#include <string>

// Declarations of test functions
bool test_truncate_keeps_thirty_seconds();
bool test_decimation_factor();
bool test_high_pass_recursion();
bool test_boxcar_low_pass();
bool test_decimation_aliases_without_prefilter();
bool test_find_peaks_threshold_and_neighbours();
bool test_onset_peaks_sparse_clicks();
bool test_onset_peaks_spacing_is_strict();
bool test_onset_peaks_window_longer_than_signal();
bool test_histogram_mode_prefers_first_seen();
bool test_autocorrelation_default_gate_rejects();
bool test_autocorrelation_impulses_120();
bool test_autocorrelation_kicks_120();
bool test_autocorrelation_scale_invariance();
bool test_autocorrelation_fft_matches_direct();
bool test_short_input_autocorrelation_vs_flux();
bool test_autocorrelation_degenerate_inputs();
bool test_autocorrelation_noise_is_valid_and_deterministic();
bool test_autocorrelation_estimator_config();
bool test_spectral_flux_kicks_120();
bool test_spectral_flux_range_edges();
bool test_spectral_flux_48k();
bool test_spectral_flux_silence_and_short_input();
bool test_spectral_flux_estimator_config();
bool test_peak_picking_kicks_120();
bool test_peak_picking_octave_folding();
bool test_peak_picking_sample_rates();
bool test_peak_picking_silence();
bool test_peak_picking_estimator_config();
bool test_cluster_tolerance();
bool test_consensus_greedy_vs_sorted();
bool test_consensus_weighted_average_and_ties();
bool test_consensus_without_usable_estimates();
bool test_combined_kicks_120();
bool test_combined_with_sensitive_autocorrelation();
bool test_combined_silence_and_determinism();
bool test_all_estimators_respect_invariants();
bool test_combined_estimator_config();
bool test_sniff_container();
bool test_wav16_round_trip();
bool test_wav_first_channel_formats();
bool test_malformed_wav_is_encoding_error();
bool test_unsupported_container_is_environment_error();
bool test_read_file_limits();
bool test_worker_channel_data_request();
bool test_worker_method_defaults();
bool test_worker_invalid_requests();
bool test_worker_binary_file_request();
bool test_worker_file_path_request();
bool test_worker_decoding_errors();
bool test_worker_probe();
bool test_worker_config_patch();

int main() {
    int failed = 0;
    int total = 0;

    const char* quietEnv = std::getenv("TACTUS_TEST_QUIET");
    bool quiet = quietEnv && std::string(quietEnv) != "0";

    if (!quiet) std::cout << "Running tests..." << std::endl;

    // Runs one test; an escaping exception counts as a failure
    auto run_test = [&](const char* name, bool (*fn)()) {
        ++total;
        bool ok = false;
        try {
            ok = fn();
        } catch (const std::exception& e) {
            std::cerr << name << " threw: " << e.what() << std::endl;
        }
        if (!quiet || !ok) {
            std::cout << "- " << name << ": " << (ok ? "PASS" : "FAIL") << std::endl;
        }
        if (!ok) ++failed;
    };

    run_test("test_truncate_keeps_thirty_seconds", &test_truncate_keeps_thirty_seconds);
    run_test("test_decimation_factor", &test_decimation_factor);
    run_test("test_high_pass_recursion", &test_high_pass_recursion);
    run_test("test_boxcar_low_pass", &test_boxcar_low_pass);
    run_test("test_decimation_aliases_without_prefilter", &test_decimation_aliases_without_prefilter);
    run_test("test_find_peaks_threshold_and_neighbours", &test_find_peaks_threshold_and_neighbours);
    run_test("test_onset_peaks_sparse_clicks", &test_onset_peaks_sparse_clicks);
    run_test("test_onset_peaks_spacing_is_strict", &test_onset_peaks_spacing_is_strict);
    run_test("test_onset_peaks_window_longer_than_signal", &test_onset_peaks_window_longer_than_signal);
    run_test("test_histogram_mode_prefers_first_seen", &test_histogram_mode_prefers_first_seen);
    run_test("test_autocorrelation_default_gate_rejects", &test_autocorrelation_default_gate_rejects);
    run_test("test_autocorrelation_impulses_120", &test_autocorrelation_impulses_120);
    run_test("test_autocorrelation_kicks_120", &test_autocorrelation_kicks_120);
    run_test("test_autocorrelation_scale_invariance", &test_autocorrelation_scale_invariance);
    run_test("test_autocorrelation_fft_matches_direct", &test_autocorrelation_fft_matches_direct);
    run_test("test_short_input_autocorrelation_vs_flux", &test_short_input_autocorrelation_vs_flux);
    run_test("test_autocorrelation_degenerate_inputs", &test_autocorrelation_degenerate_inputs);
    run_test("test_autocorrelation_noise_is_valid_and_deterministic", &test_autocorrelation_noise_is_valid_and_deterministic);
    run_test("test_autocorrelation_estimator_config", &test_autocorrelation_estimator_config);
    run_test("test_spectral_flux_kicks_120", &test_spectral_flux_kicks_120);
    run_test("test_spectral_flux_range_edges", &test_spectral_flux_range_edges);
    run_test("test_spectral_flux_48k", &test_spectral_flux_48k);
    run_test("test_spectral_flux_silence_and_short_input", &test_spectral_flux_silence_and_short_input);
    run_test("test_spectral_flux_estimator_config", &test_spectral_flux_estimator_config);
    run_test("test_peak_picking_kicks_120", &test_peak_picking_kicks_120);
    run_test("test_peak_picking_octave_folding", &test_peak_picking_octave_folding);
    run_test("test_peak_picking_sample_rates", &test_peak_picking_sample_rates);
    run_test("test_peak_picking_silence", &test_peak_picking_silence);
    run_test("test_peak_picking_estimator_config", &test_peak_picking_estimator_config);
    run_test("test_cluster_tolerance", &test_cluster_tolerance);
    run_test("test_consensus_greedy_vs_sorted", &test_consensus_greedy_vs_sorted);
    run_test("test_consensus_weighted_average_and_ties", &test_consensus_weighted_average_and_ties);
    run_test("test_consensus_without_usable_estimates", &test_consensus_without_usable_estimates);
    run_test("test_combined_kicks_120", &test_combined_kicks_120);
    run_test("test_combined_with_sensitive_autocorrelation", &test_combined_with_sensitive_autocorrelation);
    run_test("test_combined_silence_and_determinism", &test_combined_silence_and_determinism);
    run_test("test_all_estimators_respect_invariants", &test_all_estimators_respect_invariants);
    run_test("test_combined_estimator_config", &test_combined_estimator_config);
    run_test("test_sniff_container", &test_sniff_container);
    run_test("test_wav16_round_trip", &test_wav16_round_trip);
    run_test("test_wav_first_channel_formats", &test_wav_first_channel_formats);
    run_test("test_malformed_wav_is_encoding_error", &test_malformed_wav_is_encoding_error);
    run_test("test_unsupported_container_is_environment_error", &test_unsupported_container_is_environment_error);
    run_test("test_read_file_limits", &test_read_file_limits);
    run_test("test_worker_channel_data_request", &test_worker_channel_data_request);
    run_test("test_worker_method_defaults", &test_worker_method_defaults);
    run_test("test_worker_invalid_requests", &test_worker_invalid_requests);
    run_test("test_worker_binary_file_request", &test_worker_binary_file_request);
    run_test("test_worker_file_path_request", &test_worker_file_path_request);
    run_test("test_worker_decoding_errors", &test_worker_decoding_errors);
    run_test("test_worker_probe", &test_worker_probe);
    run_test("test_worker_config_patch", &test_worker_config_patch);

    int passed = total - failed;
    std::cout << "Summary: " << passed << "/" << total << " passed, " << failed << " failed" << std::endl;

    return failed == 0 ? 0 : 1;
}
