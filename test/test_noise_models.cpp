// test/test_noise_models.cpp
/**
 * Unit Test: Noise models
 *
 * Test Coverage:
 *   1. Same seed replays the same stream
 *   2. "none" is an exact passthrough
 *   3. Gaussian statistics
 *   4. Bias walk stays within its bound
 *   5. Reseed clears the walk
 */

#include "sensors/noise_channel.hpp"
#include "utils/noise.hpp"
#include "test_harness.hpp"

#include <vector>

// Test 1: Determinism
void test_seed_determinism(TestResult& result) {
    std::cout << "\n=== Test 1: Seed Determinism ===\n";

    utils::NoiseGenerator a(42);
    utils::NoiseGenerator b(42);
    utils::NoiseGenerator c(43);

    bool same = true;
    bool differs = false;
    for (int i = 0; i < 100; ++i) {
        const double va = a.gaussian(1.0);
        const double vb = b.gaussian(1.0);
        const double vc = c.gaussian(1.0);
        same = same && (va == vb);
        differs = differs || (va != vc);
    }
    result.check(same, "Equal seeds produce identical streams");
    result.check(differs, "Different seeds produce different streams");

    a.reseed(7);
    b.reseed(7);
    result.check(a.gaussian(0.5) == b.gaussian(0.5), "Reseed restarts the stream");
}

// Test 2: Passthrough
void test_none_passthrough(TestResult& result) {
    std::cout << "\n=== Test 2: None Model ===\n";

    sensors::NoiseParams p;
    p.model = sensors::NoiseModelKind::None;
    p.sigma = 5.0;   // ignored

    sensors::NoiseChannel ch(p, 1);
    bool exact = true;
    for (int i = 0; i < 50; ++i) {
        ch.step(0.01);
        exact = exact && (ch.apply(1.2345) == 1.2345);
    }
    result.check(exact, "none returns ground truth unchanged");
}

// Test 3: Gaussian mean / stddev
void test_gaussian_statistics(TestResult& result) {
    std::cout << "\n=== Test 3: Gaussian Statistics ===\n";

    sensors::NoiseParams p;
    p.model = sensors::NoiseModelKind::Gaussian;
    p.sigma = 0.1;

    sensors::NoiseChannel ch(p, 99);
    const int n = 20000;
    double sum = 0.0;
    double sum_sq = 0.0;
    for (int i = 0; i < n; ++i) {
        const double e = ch.apply(0.0);
        sum += e;
        sum_sq += e * e;
    }
    const double mean = sum / n;
    const double stddev = std::sqrt(sum_sq / n - mean * mean);

    if (std::abs(mean) < 0.005) {
        result.pass("Mean ~ 0: " + std::to_string(mean));
    } else {
        result.fail("Mean too far from 0: " + std::to_string(mean));
    }
    if (is_close(stddev, 0.1, 0.05)) {
        result.pass("Stddev ~ sigma: " + std::to_string(stddev));
    } else {
        result.fail("Stddev off: " + std::to_string(stddev));
    }
}

// Test 4: Bounded walk
void test_bias_bound(TestResult& result) {
    std::cout << "\n=== Test 4: Bias Walk Bound ===\n";

    utils::BiasModel walk(0.0, 1.0, 0.05, 5);
    double max_abs = 0.0;
    for (int i = 0; i < 10000; ++i) {
        max_abs = std::max(max_abs, std::abs(walk.step(0.01)));
    }
    result.check(max_abs <= 0.05, "Walk clamped to bound: max |b| = " + std::to_string(max_abs));
    result.check(max_abs > 0.0, "Walk actually moves");

    sensors::NoiseParams p;
    p.model = sensors::NoiseModelKind::BiasRandomWalk;
    p.bias = 0.3;
    p.random_walk_sigma = 0.5;
    p.bias_bound = 0.1;

    sensors::NoiseChannel ch(p, 3);
    bool within = true;
    for (int i = 0; i < 5000; ++i) {
        ch.step(0.01);
        const double y = ch.apply(1.0);
        // sigma = 0: y = 1 + bias + walk
        within = within && y >= 1.2 - 1e-12 && y <= 1.4 + 1e-12;
    }
    result.check(within, "Constant bias plus bounded walk stays in [bias - bound, bias + bound]");
}

// Test 5: Reseed clears walk state
void test_reseed_clears_walk(TestResult& result) {
    std::cout << "\n=== Test 5: Reseed Clears Walk ===\n";

    sensors::NoiseParams p;
    p.model = sensors::NoiseModelKind::BiasRandomWalk;
    p.sigma = 0.01;
    p.random_walk_sigma = 0.2;
    p.bias_tau_s = 50.0;

    sensors::NoiseChannel ch(p, 11);
    for (int i = 0; i < 200; ++i) ch.step(0.01);
    result.check(ch.walk() != 0.0, "Walk accumulated before reseed");

    ch.reseed(11);
    result.check(ch.walk() == 0.0, "Walk zeroed by reseed");

    std::vector<double> first;
    for (int i = 0; i < 20; ++i) {
        ch.step(0.01);
        first.push_back(ch.apply(0.0));
    }
    ch.reseed(11);
    bool replay = true;
    for (int i = 0; i < 20; ++i) {
        ch.step(0.01);
        replay = replay && (ch.apply(0.0) == first[i]);
    }
    result.check(replay, "Same seed after reseed replays identical noise");
}

int main() {
    print_title("Noise Model Unit Tests");

    TestResult result;

    test_seed_determinism(result);
    test_none_passthrough(result);
    test_gaussian_statistics(result);
    test_bias_bound(result);
    test_reseed_clears_walk(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
