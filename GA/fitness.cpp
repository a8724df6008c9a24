#include "fitness.hpp"

#include <iostream>
#include <limits>
#include <mutex>

#include "frame_analysis.hpp"
#include "logging.hpp"

using namespace std;

double fitness(double mass, double max_stress, double max_deflection, const Constraints &constraints)
{
    double result = mass;

    if (max_stress > constraints.yield_stress)
    {
        // Stress constraint violation penalty
        result += mass * constraints.penalty_factor * ((max_stress / constraints.yield_stress) - 1.0);
    }

    if (max_deflection > constraints.deflection_limit)
    {
        // Deflection constraint violation penalty
        result += mass * constraints.penalty_factor * ((max_deflection / constraints.deflection_limit) - 1.0);
    }

    return result;
}

bool isFeasible(double max_stress, double max_deflection, const Constraints &constraints)
{
    return max_stress <= constraints.yield_stress && max_deflection <= constraints.deflection_limit;
}

FitnessRecord evaluateFrame(const Frame &frame, const FrameProblem &problem)
{
    FitnessRecord record;
    record.frame = frame;

    try
    {
        FrameAnalysis analysis = analyzeFrame(frame, problem.material, problem.load);
        record.mass = analysis.mass;
        record.max_stress = analysis.max_stress;
        record.max_deflection = analysis.max_deflection;
        record.fitness = fitness(analysis.mass, analysis.max_stress, analysis.max_deflection, problem.constraints);
    }
    catch (const AnalysisError &e)
    {
        record.analysis_failed = true;
        record.fitness = numeric_limits<double>::infinity();
        record.max_stress = numeric_limits<double>::infinity();
        record.max_deflection = numeric_limits<double>::infinity();

        lock_guard<mutex> lock(logMutex());
        cerr << "Error: " << e.what() << endl;
    }

    return record;
}
