#ifndef TRUSS_SOLVER_HPP
#define TRUSS_SOLVER_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <eigen3/Eigen/Dense>

// Raised when a geometry or model cannot be solved
class AnalysisError : public std::runtime_error
{
public:
    explicit AnalysisError(const std::string &what) : std::runtime_error(what) {}
};

// Pin-jointed truss. Nodes have 2 or 3 columns, which sets the DOFs per node.
struct TrussModel
{
    Eigen::MatrixXd nodes;
    Eigen::MatrixXi bars; // zero-based node indices
    std::vector<double> areas;
    std::vector<double> E;
    Eigen::VectorXd f_vector;
    std::vector<int> fixed_dof;

    int dim() const { return static_cast<int>(nodes.cols()); }
    int nDof() const { return static_cast<int>(nodes.rows()) * dim(); }
    int nBars() const { return static_cast<int>(bars.rows()); }
};

struct TrussResult
{
    Eigen::VectorXd displacements; // full DOF vector
    Eigen::VectorXd reactions;     // K*U - F, non-zero only at fixed DOFs
    Eigen::VectorXd axial_forces;  // tension positive, from element strain
    Eigen::VectorXd stresses;
    double max_displacement;
};

TrussResult solveTruss(const TrussModel &model);

#endif // TRUSS_SOLVER_HPP
