#include "frame_problem.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

using namespace std;

namespace
{
    void requirePositive(double value, const string &name)
    {
        if (!(value > 0.0) || !isfinite(value))
        {
            throw invalid_argument(name + " must be a positive finite value, got " + to_string(value));
        }
    }

    void requireRange(double lo, double hi, const string &name)
    {
        requirePositive(lo, "min " + name);
        requirePositive(hi, "max " + name);
        if (lo > hi)
        {
            throw invalid_argument("bounds for " + name + " are inverted: min " + to_string(lo) +
                                   " > max " + to_string(hi));
        }
    }
}

void Material::validate() const
{
    requirePositive(E, "material E");
    requirePositive(density, "material density");
    requirePositive(yield_stress, "material yield_stress");
    if (!(nu > -1.0 && nu < 0.5))
    {
        throw invalid_argument("material nu must lie in (-1, 0.5), got " + to_string(nu));
    }
}

void DesignBounds::validate() const
{
    requireRange(min_width, max_width, "width");
    requireRange(min_height, max_height, "height");
    requireRange(min_area, max_area, "area");
}

void Constraints::validate() const
{
    requirePositive(yield_stress, "yield_stress");
    requirePositive(deflection_limit, "deflection_limit");
    if (!(penalty_factor >= 0.0) || !isfinite(penalty_factor))
    {
        throw invalid_argument("penalty_factor must be non-negative, got " + to_string(penalty_factor));
    }
}

void GAParams::validate() const
{
    if (pop_size < 3)
    {
        throw invalid_argument("pop_size must be at least 3, got " + to_string(pop_size));
    }
    if (generations < 1)
    {
        throw invalid_argument("generations must be at least 1, got " + to_string(generations));
    }
    if (!(mutation_rate >= 0.0 && mutation_rate <= 1.0))
    {
        throw invalid_argument("mutation_rate must lie in [0, 1], got " + to_string(mutation_rate));
    }
    if (elite_count < 1 || elite_count >= pop_size)
    {
        throw invalid_argument("elite_count must lie in [1, pop_size - 1], got " + to_string(elite_count));
    }
    if (n_threads < 1)
    {
        throw invalid_argument("n_threads must be at least 1, got " + to_string(n_threads));
    }
}

void FrameProblem::validate() const
{
    material.validate();
    bounds.validate();
    constraints.validate();
    ga.validate();
    requirePositive(load.apex_load, "apex_load");
    if (constraints.yield_stress != material.yield_stress)
    {
        throw invalid_argument("constraints yield_stress " + to_string(constraints.yield_stress) +
                               " does not match material yield_stress " + to_string(material.yield_stress));
    }
}

FrameProblem createSteelTriangleProblem()
{
    FrameProblem problem;

    problem.material = Material();
    problem.bounds = DesignBounds();
    problem.load.apex_load = 100000.0; // ~10 t

    problem.constraints.yield_stress = problem.material.yield_stress;
    problem.constraints.deflection_limit = 0.1;
    problem.constraints.penalty_factor = 10.0;

    // Optimization parameters
    problem.ga.pop_size = 30;
    problem.ga.generations = 100;
    problem.ga.mutation_rate = 0.1;
    problem.ga.elite_count = 2;

    return problem;
}
