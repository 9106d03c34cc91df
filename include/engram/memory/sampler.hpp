/*
 * engram C++11 - Softmax Sampler
 * 
 * Temperature-controlled choice among weighted options. A temperature at
 * or below GREEDY_TEMPERATURE always picks the heaviest option; larger
 * temperatures flatten the distribution toward uniform.
 */
#ifndef ENGRAM_MEMORY_SAMPLER_HPP
#define ENGRAM_MEMORY_SAMPLER_HPP

#include <vector>
#include <random>
#include <cstdint>

namespace engram {

const double GREEDY_TEMPERATURE = 1e-6;

class SoftmaxSampler {
public:
    // seed 0 draws a nondeterministic seed
    explicit SoftmaxSampler(uint64_t seed = 0);
    
    // Index into weights; weights must be non-empty. Ties under greedy
    // selection go to the lowest index.
    size_t sample(const std::vector<double>& weights, double temperature);
    
    // softmax(weights / temperature)
    static std::vector<double> probabilities(const std::vector<double>& weights, double temperature);

private:
    std::mt19937_64 rng_;
};

} // namespace engram

#endif // ENGRAM_MEMORY_SAMPLER_HPP
