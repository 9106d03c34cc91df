/*
 * engram C++11 - Softmax Sampler Implementation
 */
#include <engram/memory/sampler.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace engram {

SoftmaxSampler::SoftmaxSampler(uint64_t seed) {
    if (seed == 0) {
        std::random_device rd;
        seed = (static_cast<uint64_t>(rd()) << 32) | rd();
    }
    rng_.seed(seed);
}

std::vector<double> SoftmaxSampler::probabilities(const std::vector<double>& weights,
                                                  double temperature) {
    std::vector<double> p(weights.size(), 0.0);
    if (weights.empty()) return p;
    
    if (temperature <= GREEDY_TEMPERATURE) {
        size_t best = static_cast<size_t>(
            std::max_element(weights.begin(), weights.end()) - weights.begin());
        p[best] = 1.0;
        return p;
    }
    
    // Subtract the max before exponentiating to avoid overflow
    double top = *std::max_element(weights.begin(), weights.end());
    double total = 0.0;
    for (size_t i = 0; i < weights.size(); ++i) {
        p[i] = std::exp((weights[i] - top) / temperature);
        total += p[i];
    }
    for (size_t i = 0; i < p.size(); ++i) p[i] /= total;
    return p;
}

size_t SoftmaxSampler::sample(const std::vector<double>& weights, double temperature) {
    if (weights.empty()) {
        throw std::invalid_argument("SoftmaxSampler::sample needs at least one weight");
    }
    if (temperature <= GREEDY_TEMPERATURE) {
        return static_cast<size_t>(
            std::max_element(weights.begin(), weights.end()) - weights.begin());
    }
    
    std::vector<double> p = probabilities(weights, temperature);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    double r = unit(rng_);
    double acc = 0.0;
    for (size_t i = 0; i < p.size(); ++i) {
        acc += p[i];
        if (r < acc) return i;
    }
    return p.size() - 1;
}

} // namespace engram
