#include "truss_solver.hpp"

#include <algorithm>
#include <cmath>

using namespace Eigen;
using namespace std;

namespace
{
    void checkModel(const TrussModel &model)
    {
        int dim = model.dim();
        if (dim != 2 && dim != 3)
        {
            throw AnalysisError("truss nodes must have 2 or 3 coordinates, got " + to_string(dim));
        }
        if (model.bars.cols() != 2)
        {
            throw AnalysisError("truss bars must have exactly 2 node columns");
        }
        if (static_cast<int>(model.areas.size()) != model.nBars() ||
            static_cast<int>(model.E.size()) != model.nBars())
        {
            throw AnalysisError("truss areas/E must have one entry per bar");
        }
        if (model.f_vector.size() != model.nDof())
        {
            throw AnalysisError("force vector size " + to_string(model.f_vector.size()) +
                                " does not match " + to_string(model.nDof()) + " DOFs");
        }
        if (!model.nodes.allFinite() || !model.f_vector.allFinite())
        {
            throw AnalysisError("truss has non-finite node coordinates or loads");
        }

        int n_nodes = static_cast<int>(model.nodes.rows());
        for (int i = 0; i < model.nBars(); i++)
        {
            int node1 = model.bars(i, 0);
            int node2 = model.bars(i, 1);
            if (node1 < 0 || node1 >= n_nodes || node2 < 0 || node2 >= n_nodes)
            {
                throw AnalysisError("bar " + to_string(i) + " has invalid node indices: " +
                                    to_string(node1) + ", " + to_string(node2));
            }
            if (!(model.areas[i] > 0.0) || !(model.E[i] > 0.0) ||
                !isfinite(model.areas[i]) || !isfinite(model.E[i]))
            {
                throw AnalysisError("bar " + to_string(i) + " needs positive area and modulus");
            }
        }
        for (int dof : model.fixed_dof)
        {
            if (dof < 0 || dof >= model.nDof())
            {
                throw AnalysisError("fixed DOF " + to_string(dof) + " out of range");
            }
        }
    }

    // Unit vector and length of bar i
    double barGeometry(const TrussModel &model, int i, VectorXd &direction)
    {
        VectorXd coord1 = model.nodes.row(model.bars(i, 0)).transpose();
        VectorXd coord2 = model.nodes.row(model.bars(i, 1)).transpose();
        VectorXd delta = coord2 - coord1;
        double L = delta.norm();

        if (L < 1e-10)
        {
            throw AnalysisError("bar " + to_string(i) + " has zero length");
        }
        direction = delta / L;
        return L;
    }
}

TrussResult solveTruss(const TrussModel &model)
{
    checkModel(model);

    int n_dof = model.nDof();
    int dim = model.dim();

    MatrixXd K = MatrixXd::Zero(n_dof, n_dof);

    // Build stiffness matrix: ke = (EA/L) * [c c^T, -c c^T; -c c^T, c c^T]
    for (int i = 0; i < model.nBars(); i++)
    {
        VectorXd direction;
        double L = barGeometry(model, i, direction);
        double k_val = (model.E[i] * model.areas[i]) / L;

        MatrixXd cc = direction * direction.transpose() * k_val;
        int base1 = model.bars(i, 0) * dim;
        int base2 = model.bars(i, 1) * dim;

        K.block(base1, base1, dim, dim) += cc;
        K.block(base2, base2, dim, dim) += cc;
        K.block(base1, base2, dim, dim) -= cc;
        K.block(base2, base1, dim, dim) -= cc;
    }

    // Apply boundary conditions
    vector<int> free_dofs;
    for (int i = 0; i < n_dof; i++)
    {
        if (find(model.fixed_dof.begin(), model.fixed_dof.end(), i) == model.fixed_dof.end())
        {
            free_dofs.push_back(i);
        }
    }

    int n_free = static_cast<int>(free_dofs.size());
    VectorXd U = VectorXd::Zero(n_dof);

    if (n_free > 0)
    {
        MatrixXd K_free(n_free, n_free);
        VectorXd F_free(n_free);

        for (int i = 0; i < n_free; i++)
        {
            F_free(i) = model.f_vector(free_dofs[i]);
            for (int j = 0; j < n_free; j++)
            {
                K_free(i, j) = K(free_dofs[i], free_dofs[j]);
            }
        }

        // A mechanism leaves a (near) zero pivot; reject it instead of regularizing
        LDLT<MatrixXd> ldlt(K_free);
        double scale = K_free.diagonal().cwiseAbs().maxCoeff();
        double min_pivot = ldlt.vectorD().cwiseAbs().minCoeff();
        if (ldlt.info() != Success || !(scale > 0.0) || min_pivot < 1e-12 * scale)
        {
            throw AnalysisError("singular stiffness matrix (unstable or mechanism truss)");
        }

        VectorXd U_free = ldlt.solve(F_free);
        if (!U_free.allFinite())
        {
            throw AnalysisError("non-finite displacement solution");
        }

        for (int i = 0; i < n_free; i++)
        {
            U(free_dofs[i]) = U_free(i);
        }
    }

    TrussResult result;
    result.displacements = U;

    // Reactions only exist at supports
    VectorXd residual = K * U - model.f_vector;
    result.reactions = VectorXd::Zero(n_dof);
    for (int dof : model.fixed_dof)
    {
        result.reactions(dof) = residual(dof);
    }

    // Axial forces and stresses from element elongation
    result.axial_forces = VectorXd::Zero(model.nBars());
    result.stresses = VectorXd::Zero(model.nBars());
    for (int i = 0; i < model.nBars(); i++)
    {
        VectorXd direction;
        double L = barGeometry(model, i, direction);

        VectorXd u1 = U.segment(model.bars(i, 0) * dim, dim);
        VectorXd u2 = U.segment(model.bars(i, 1) * dim, dim);
        double elongation = (u2 - u1).dot(direction);
        double strain = elongation / L;

        result.stresses(i) = model.E[i] * strain;
        result.axial_forces(i) = result.stresses(i) * model.areas[i];
    }

    result.max_displacement = (n_dof > 0) ? U.array().abs().maxCoeff() : 0.0;
    return result;
}
