#ifndef FRAME_GA_HPP
#define FRAME_GA_HPP

#include <functional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "fitness.hpp"
#include "frame.hpp"
#include "frame_problem.hpp"

struct GenerationSummary
{
    int generation;
    double best_fitness;
    double mean_fitness; // over individuals whose analysis succeeded
    int feasible_count;
    int failed_count;
    FitnessRecord best;
};

// Truncation-selection GA with elitism, uniform crossover and bounded mutation
class FrameGA
{
public:
    // Called once per generation with the best record seen so far
    using GenerationObserver = std::function<void(int generation, const FitnessRecord &best_ever)>;

    // Throws std::invalid_argument if the problem configuration is inconsistent
    explicit FrameGA(const FrameProblem &problem);

    void setObserver(GenerationObserver observer) { observer_ = std::move(observer); }

    void initializePopulation();

    // Evaluate in population order, serially or on n_threads workers
    std::vector<FitnessRecord> evaluatePopulation() const;

    // Evaluate, rank, track best-ever and replace the population with the
    // offspring. Returns the ranked records of the evaluated generation.
    std::vector<FitnessRecord> evolveGeneration();

    // Full run; returns the best record seen across all generations
    FitnessRecord optimize();

    // Child takes each variable from either parent with equal probability, then mutates
    Frame crossover(const Frame &parent1, const Frame &parent2);

    const std::vector<Frame> &population() const { return population_; }
    const FitnessRecord &bestEver() const { return best_; }
    bool hasBest() const { return has_best_; }
    const std::vector<GenerationSummary> &history() const { return history_; }
    int generation() const { return generation_; }
    long seed() const { return seed_; }
    const FrameProblem &problem() const { return problem_; }

    void exportHistory(const std::string &filename) const;

private:
    FrameProblem problem_;
    std::vector<Frame> population_;
    std::mt19937 rng_;
    long seed_;
    int generation_;

    FitnessRecord best_;
    bool has_best_;
    std::vector<GenerationSummary> history_;
    GenerationObserver observer_;

    GenerationSummary summarize(const std::vector<FitnessRecord> &ranked) const;
    void reproduce(const std::vector<FitnessRecord> &ranked);
};

#endif // FRAME_GA_HPP
