#ifndef FRAME_ANALYSIS_HPP
#define FRAME_ANALYSIS_HPP

#include <array>

#include "frame.hpp"
#include "frame_problem.hpp"
#include "section.hpp"
#include "truss_solver.hpp"

// Member order everywhere: left leg, right leg, base tie
struct FrameAnalysis
{
    double mass;
    double max_stress;
    double max_deflection;

    std::array<double, 3> member_forces; // tension positive (N)
    std::array<double, 3> member_stresses;
    std::array<SectionProperties, 3> sections;
};

// Planar pin-jointed model of the frame: left base pinned, right base on a
// roller, apex loaded downward
TrussModel buildFrameModel(const Frame &frame, const Material &material, const LoadCase &load);

// Throws AnalysisError when the geometry cannot be analyzed. Stateless and
// safe to call concurrently on different frames.
FrameAnalysis analyzeFrame(const Frame &frame, const Material &material, const LoadCase &load);

#endif // FRAME_ANALYSIS_HPP
