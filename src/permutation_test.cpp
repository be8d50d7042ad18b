#include "orotune/permutation_test.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace orotune {

// ============================================================================
// Kuiper Test
// ============================================================================

double kuiper_false_positive_probability(double statistic, double effective_n) {
    if (effective_n <= 0.0) {
        return 1.0;
    }
    const double sqrt_n = std::sqrt(effective_n);
    const double lambda = (sqrt_n + 0.155 + 0.24 / sqrt_n) * statistic;
    if (lambda < 0.4) {
        return 1.0;
    }

    // Q_KP(λ) = 2 Σ (4 j² λ² - 1) exp(-2 j² λ²)
    double sum = 0.0;
    const double lambda2 = lambda * lambda;
    for (int j = 1; j <= 100; ++j) {
        const double j2l2 = static_cast<double>(j * j) * lambda2;
        const double term = (4.0 * j2l2 - 1.0) * std::exp(-2.0 * j2l2);
        sum += term;
        if (std::abs(term) <= 1e-12 * std::abs(sum)) {
            break;
        }
    }
    return std::clamp(2.0 * sum, 0.0, 1.0);
}

KuiperResult kuiper_two_sample(std::span<const double> a, std::span<const double> b) {
    KuiperResult result;
    if (a.empty() || b.empty()) {
        return result;
    }

    std::vector<double> sa(a.begin(), a.end());
    std::vector<double> sb(b.begin(), b.end());
    std::sort(sa.begin(), sa.end());
    std::sort(sb.begin(), sb.end());

    const double na = static_cast<double>(sa.size());
    const double nb = static_cast<double>(sb.size());
    size_t ia = 0;
    size_t ib = 0;
    double d_plus = 0.0;
    double d_minus = 0.0;

    // Walk the merged order, stepping past ties in both samples together
    while (ia < sa.size() && ib < sb.size()) {
        const double v = std::min(sa[ia], sb[ib]);
        while (ia < sa.size() && sa[ia] == v) ++ia;
        while (ib < sb.size() && sb[ib] == v) ++ib;
        const double diff = static_cast<double>(ia) / na - static_cast<double>(ib) / nb;
        d_plus = std::max(d_plus, diff);
        d_minus = std::max(d_minus, -diff);
    }
    // Remaining tail only moves one CDF toward 1
    if (ia < sa.size()) {
        d_minus = std::max(d_minus, 1.0 - static_cast<double>(ia) / na);
    }
    if (ib < sb.size()) {
        d_plus = std::max(d_plus, 1.0 - static_cast<double>(ib) / nb);
    }

    result.statistic = d_plus + d_minus;
    result.p_value = kuiper_false_positive_probability(result.statistic, na * nb / (na + nb));
    return result;
}

// ============================================================================
// Mann-Whitney U
// ============================================================================

double mann_whitney_greater(std::span<const double> observed, std::span<const double> null) {
    const size_t n1 = observed.size();
    const size_t n2 = null.size();
    if (n1 == 0 || n2 == 0) {
        return 1.0;
    }

    struct Entry {
        double value;
        bool first;
    };
    std::vector<Entry> pooled;
    pooled.reserve(n1 + n2);
    for (double v : observed) pooled.push_back({v, true});
    for (double v : null) pooled.push_back({v, false});
    std::sort(pooled.begin(), pooled.end(),
              [](const Entry& l, const Entry& r) { return l.value < r.value; });

    // Average ranks over ties, accumulating the tie correction
    const size_t n = pooled.size();
    double rank_sum_first = 0.0;
    double tie_term = 0.0;
    size_t i = 0;
    while (i < n) {
        size_t j = i;
        while (j + 1 < n && pooled[j + 1].value == pooled[i].value) ++j;
        const double avg_rank = 0.5 * static_cast<double>(i + j) + 1.0;
        for (size_t k = i; k <= j; ++k) {
            if (pooled[k].first) rank_sum_first += avg_rank;
        }
        const double t = static_cast<double>(j - i + 1);
        tie_term += t * t * t - t;
        i = j + 1;
    }

    const double dn1 = static_cast<double>(n1);
    const double dn2 = static_cast<double>(n2);
    const double dn = dn1 + dn2;
    const double u1 = rank_sum_first - dn1 * (dn1 + 1.0) / 2.0;
    const double mu = dn1 * dn2 / 2.0;
    const double variance = dn1 * dn2 / 12.0 * ((dn + 1.0) - tie_term / (dn * (dn - 1.0)));
    if (variance <= 0.0) {
        return 1.0;
    }

    const double z = (u1 - mu - 0.5) / std::sqrt(variance);
    return 0.5 * std::erfc(z / std::sqrt(2.0));
}

// ============================================================================
// Permutation Tester
// ============================================================================

PermutationSignificanceTester::PermutationSignificanceTester(const Config& config)
    : config_(config)
    , estimator_(CircularTuningEstimator::Config{config.n_bins}) {
    if (config_.n_permutations == 0) {
        throw std::invalid_argument("Permutation test needs at least one permutation");
    }
}

PermutationSignificanceTester::PermutationSignificanceTester()
    : PermutationSignificanceTester(Config{}) {}

PermutationSignificanceTester::Result PermutationSignificanceTester::test(
    std::span<const double> all_phases,
    std::span<const double> spike_phases,
    double sample_rate_hz,
    uint64_t seed_offset) const {

    Result result;
    const std::vector<size_t> occupancy = estimator_.phase_histogram(all_phases);
    result.observed = estimator_.estimate(spike_phases, occupancy, sample_rate_hz);

    if (all_phases.empty() || spike_phases.empty()) {
        result.null_modulation.assign(config_.n_permutations, 0.0);
        return result;
    }

    std::mt19937_64 rng;
    if (config_.seed) {
        rng.seed(static_cast<uint64_t>(*config_.seed) + seed_offset);
    } else {
        std::random_device rd;
        rng.seed((static_cast<uint64_t>(rd()) << 32) ^ rd());
    }
    std::uniform_int_distribution<size_t> pick(0, all_phases.size() - 1);

    std::vector<double> resampled(spike_phases.size());
    result.null_modulation.reserve(config_.n_permutations);
    for (size_t p = 0; p < config_.n_permutations; ++p) {
        for (auto& phase : resampled) {
            phase = all_phases[pick(rng)];
        }
        const TuningCurve null_curve = estimator_.estimate(resampled, occupancy, sample_rate_hz);
        result.null_modulation.push_back(null_curve.modulation_index);
    }

    const double observed_mi = result.observed.modulation_index;
    result.permutation_p = mann_whitney_greater(std::span<const double>(&observed_mi, 1),
                                                result.null_modulation);

    const KuiperResult kuiper = kuiper_two_sample(spike_phases, all_phases);
    result.kuiper_statistic = kuiper.statistic;
    result.kuiper_p = kuiper.p_value;
    return result;
}

}  // namespace orotune
