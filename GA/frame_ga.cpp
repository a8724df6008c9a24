#include "frame_ga.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <iostream>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "logging.hpp"

using namespace std;

FrameGA::FrameGA(const FrameProblem &problem)
    : problem_(problem), seed_(problem.ga.seed), generation_(0), has_best_(false)
{
    problem_.validate();

    if (seed_ == 0)
    {
        // Use random seed if not specified
        random_device rd;
        while (seed_ == 0)
            seed_ = rd();
    }
    rng_.seed(seed_);

    best_.fitness = numeric_limits<double>::infinity();
}

void FrameGA::initializePopulation()
{
    population_.clear();
    population_.reserve(problem_.ga.pop_size);
    for (int i = 0; i < problem_.ga.pop_size; i++)
    {
        population_.push_back(Frame::randomFrame(problem_.bounds, rng_));
    }

    generation_ = 0;
    has_best_ = false;
    best_ = FitnessRecord();
    best_.fitness = numeric_limits<double>::infinity();
    history_.clear();
}

vector<FitnessRecord> FrameGA::evaluatePopulation() const
{
    int n = static_cast<int>(population_.size());
    vector<FitnessRecord> records(n);

    int n_threads = min(problem_.ga.n_threads, max(n, 1));
    if (n_threads <= 1)
    {
        for (int i = 0; i < n; i++)
        {
            records[i] = evaluateFrame(population_[i], problem_);
        }
        return records;
    }

    // Contiguous blocks per worker; each slot is written by exactly one thread
    vector<thread> threads;
    vector<exception_ptr> errors(n_threads);
    int block = (n + n_threads - 1) / n_threads;

    for (int t = 0; t < n_threads; t++)
    {
        int begin = t * block;
        int end = min(n, begin + block);
        threads.emplace_back([this, &records, &errors, t, begin, end]()
                             {
            try
            {
                for (int i = begin; i < end; i++)
                {
                    records[i] = evaluateFrame(population_[i], problem_);
                }
            }
            catch (...)
            {
                errors[t] = current_exception();
            } });
    }

    for (auto &th : threads)
    {
        th.join();
    }
    for (const auto &err : errors)
    {
        if (err)
        {
            rethrow_exception(err);
        }
    }
    return records;
}

Frame FrameGA::crossover(const Frame &parent1, const Frame &parent2)
{
    bernoulli_distribution pick_first(0.5);

    Frame child;
    child.width = pick_first(rng_) ? parent1.width : parent2.width;
    child.height = pick_first(rng_) ? parent1.height : parent2.height;
    child.area_left = pick_first(rng_) ? parent1.area_left : parent2.area_left;
    child.area_right = pick_first(rng_) ? parent1.area_right : parent2.area_right;
    child.area_base = pick_first(rng_) ? parent1.area_base : parent2.area_base;

    child.mutate(problem_.ga.mutation_rate, problem_.bounds, rng_);
    return child;
}

GenerationSummary FrameGA::summarize(const vector<FitnessRecord> &ranked) const
{
    GenerationSummary summary;
    summary.generation = generation_;
    summary.best = ranked.front();
    summary.best_fitness = ranked.front().fitness;
    summary.feasible_count = 0;
    summary.failed_count = 0;

    double total = 0.0;
    int evaluated = 0;
    for (const auto &rec : ranked)
    {
        if (rec.analysis_failed)
        {
            summary.failed_count++;
            continue;
        }
        if (isFeasible(rec.max_stress, rec.max_deflection, problem_.constraints))
        {
            summary.feasible_count++;
        }
        total += rec.fitness;
        evaluated++;
    }
    summary.mean_fitness = evaluated > 0 ? total / evaluated : numeric_limits<double>::infinity();
    return summary;
}

void FrameGA::reproduce(const vector<FitnessRecord> &ranked)
{
    int pop_size = problem_.ga.pop_size;
    int num_parents = pop_size / 2;

    vector<Frame> new_pop;
    new_pop.reserve(pop_size);

    // Elitism: keep top frames unchanged
    for (int i = 0; i < problem_.ga.elite_count; i++)
    {
        new_pop.push_back(ranked[i].frame);
    }

    // Truncation selection: top half are parents, drawn with replacement
    uniform_int_distribution<int> parent_dist(0, num_parents - 1);
    while (static_cast<int>(new_pop.size()) < pop_size)
    {
        const Frame &parent1 = ranked[parent_dist(rng_)].frame;
        const Frame &parent2 = ranked[parent_dist(rng_)].frame;
        new_pop.push_back(crossover(parent1, parent2));
    }

    population_ = new_pop;
}

vector<FitnessRecord> FrameGA::evolveGeneration()
{
    if (population_.empty())
    {
        initializePopulation();
    }

    vector<FitnessRecord> ranked = evaluatePopulation();

    // Rank by fitness, lower is better
    sort(ranked.begin(), ranked.end(),
         [](const FitnessRecord &a, const FitnessRecord &b)
         {
             return a.fitness < b.fitness;
         });

    const FitnessRecord &best_current = ranked.front();
    if (!has_best_ || best_current.fitness < best_.fitness)
    {
        best_ = best_current;
        has_best_ = true;

        if (problem_.ga.verbose)
        {
            lock_guard<mutex> lock(logMutex());
            cout << "Generation " << generation_ << ": Best mass = " << best_current.mass
                 << " kg, Max stress = " << best_current.max_stress
                 << " Pa, Max defl = " << best_current.max_deflection << " m" << endl;
        }
    }

    history_.push_back(summarize(ranked));

    if (observer_)
    {
        observer_(generation_, best_);
    }

    reproduce(ranked);
    generation_++;

    return ranked;
}

FitnessRecord FrameGA::optimize()
{
    if (problem_.ga.verbose)
    {
        lock_guard<mutex> lock(logMutex());
        cout << "Initializing population of " << problem_.ga.pop_size << " frames (seed " << seed_ << ")..." << endl;
    }

    initializePopulation();

    for (int gen = 0; gen < problem_.ga.generations; gen++)
    {
        evolveGeneration();
    }

    if (problem_.ga.verbose)
    {
        const GenerationSummary &last = history_.back();
        lock_guard<mutex> lock(logMutex());
        cout << "GA completed after " << generation_ << " generations: best fitness " << best_.fitness
             << ", last generation " << last.feasible_count << "/" << problem_.ga.pop_size << " feasible";
        if (last.failed_count > 0)
        {
            cout << ", " << last.failed_count << " failed analyses";
        }
        cout << endl;
    }

    return best_;
}

void FrameGA::exportHistory(const string &filename) const
{
    ofstream file(filename);
    if (!file)
    {
        throw runtime_error("cannot open " + filename + " for writing");
    }

    file << "generation,best_fitness,mean_fitness,feasible,failed,mass,max_stress,max_deflection,"
            "width,height,area_left,area_right,area_base"
         << endl;

    for (const auto &summary : history_)
    {
        const FitnessRecord &b = summary.best;
        file << summary.generation << "," << summary.best_fitness << "," << summary.mean_fitness << ","
             << summary.feasible_count << "," << summary.failed_count << ","
             << b.mass << "," << b.max_stress << "," << b.max_deflection << ","
             << b.frame.width << "," << b.frame.height << ","
             << b.frame.area_left << "," << b.frame.area_right << "," << b.frame.area_base << endl;
    }
    file.close();

    if (problem_.ga.verbose)
    {
        lock_guard<mutex> lock(logMutex());
        cout << "History exported to " << filename << " (" << history_.size() << " generations)" << endl;
    }
}
