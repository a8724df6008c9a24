#ifndef FITNESS_HPP
#define FITNESS_HPP

#include "frame.hpp"
#include "frame_problem.hpp"

// Fitness = mass + mass*k*(stress/yield - 1) + mass*k*(defl/limit - 1), each
// penalty applied only when its constraint is violated. Lower is better.
double fitness(double mass, double max_stress, double max_deflection, const Constraints &constraints);

bool isFeasible(double max_stress, double max_deflection, const Constraints &constraints);

// One ranked entry of a generation
struct FitnessRecord
{
    double fitness;
    Frame frame;
    double mass;
    double max_stress;
    double max_deflection;
    bool analysis_failed;

    FitnessRecord() : fitness(0.0), mass(0.0), max_stress(0.0), max_deflection(0.0), analysis_failed(false) {}
};

// Analyze and score a frame. A failed analysis yields an infeasible record
// with infinite fitness instead of an exception.
FitnessRecord evaluateFrame(const Frame &frame, const FrameProblem &problem);

#endif // FITNESS_HPP
