#include "frame_analysis.hpp"

#include <algorithm>
#include <cmath>
#include <map>

using namespace Eigen;
using namespace std;

namespace
{
    const int LEFT = 0;
    const int RIGHT = 1;
    const int TOP = 2;

    void checkGeometry(const Frame &frame)
    {
        const double values[] = {frame.width, frame.height, frame.area_left, frame.area_right, frame.area_base};
        for (double v : values)
        {
            if (!(v > 0.0) || !isfinite(v))
            {
                throw AnalysisError("analysis failed for this geometry: " + frame.toString());
            }
        }
    }

    int nodeIndex(const string &name)
    {
        if (name == Frame::LEFT_NODE)
            return LEFT;
        if (name == Frame::RIGHT_NODE)
            return RIGHT;
        if (name == Frame::TOP_NODE)
            return TOP;
        throw AnalysisError("unknown frame node " + name);
    }

    Vector2d unitVector(const TrussModel &model, int from, int to)
    {
        Vector2d delta = (model.nodes.row(to) - model.nodes.row(from)).transpose();
        return delta / delta.norm();
    }
}

TrussModel buildFrameModel(const Frame &frame, const Material &material, const LoadCase &load)
{
    checkGeometry(frame);

    TrussModel model;

    // In-plane (x, y) coordinates; the frame lies in z = 0
    map<string, Vector3d> nodes = frame.nodes();
    model.nodes = MatrixXd(3, 2);
    for (const auto &entry : nodes)
    {
        int idx = nodeIndex(entry.first);
        model.nodes(idx, 0) = entry.second.x();
        model.nodes(idx, 1) = entry.second.y();
    }

    vector<Member> members = frame.members();
    model.bars = MatrixXi(static_cast<int>(members.size()), 2);
    for (size_t i = 0; i < members.size(); i++)
    {
        model.bars(i, 0) = nodeIndex(members[i].start_node);
        model.bars(i, 1) = nodeIndex(members[i].end_node);
        model.areas.push_back(members[i].area);
        model.E.push_back(material.E);
    }

    // Downward point load at the apex
    model.f_vector = VectorXd::Zero(model.nDof());
    model.f_vector(TOP * 2 + 1) = -load.apex_load;

    // Left support pinned (x, y), right support roller (y)
    model.fixed_dof = {LEFT * 2, LEFT * 2 + 1, RIGHT * 2 + 1};

    return model;
}

FrameAnalysis analyzeFrame(const Frame &frame, const Material &material, const LoadCase &load)
{
    TrussModel model = buildFrameModel(frame, material, load);
    TrussResult solution = solveTruss(model);

    double rx_left = solution.reactions(LEFT * 2);
    double ry_left = solution.reactions(LEFT * 2 + 1);
    double ry_right = solution.reactions(RIGHT * 2 + 1);

    // Joint equilibrium at the pinned support: R + N_leg*e_leg + N_base*e_base = 0
    Vector2d e_left = unitVector(model, LEFT, TOP);
    Vector2d e_base = unitVector(model, LEFT, RIGHT);
    Matrix2d joint;
    joint.col(0) = e_left;
    joint.col(1) = e_base;
    if (std::abs(joint.determinant()) < 1e-12)
    {
        throw AnalysisError("analysis failed for this geometry: collinear members at " +
                            string(Frame::LEFT_NODE));
    }
    Vector2d n_left = joint.partialPivLu().solve(-Vector2d(rx_left, ry_left));

    // Roller support: only the vertical equation is needed for the right leg
    Vector2d e_right = unitVector(model, RIGHT, TOP);
    if (std::abs(e_right.y()) < 1e-12)
    {
        throw AnalysisError("analysis failed for this geometry: flat right leg");
    }
    double n_right = -ry_right / e_right.y();

    FrameAnalysis result;
    result.member_forces = {n_left(0), n_right, n_left(1)};

    const double areas[] = {frame.area_left, frame.area_right, frame.area_base};
    result.max_stress = 0.0;
    for (int i = 0; i < 3; i++)
    {
        result.member_stresses[i] = std::abs(result.member_forces[i]) / areas[i];
        if (!isfinite(result.member_stresses[i]))
        {
            throw AnalysisError("analysis failed for this geometry: non-finite stress in " +
                                frame.members()[i].name);
        }
        result.sections[i] = sectionProperties(Section::squareFromArea(areas[i]));
        result.max_stress = max(result.max_stress, result.member_stresses[i]);
    }

    result.max_deflection = std::abs(solution.displacements(TOP * 2 + 1));
    result.mass = frame.calcMass(material.density);

    if (!isfinite(result.max_deflection))
    {
        throw AnalysisError("analysis failed for this geometry: non-finite deflection");
    }
    return result;
}
