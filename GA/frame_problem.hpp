#ifndef FRAME_PROBLEM_HPP
#define FRAME_PROBLEM_HPP

// Material properties (steel by default)
struct Material
{
    double E;            // Young's modulus (Pa)
    double nu;           // Poisson's ratio
    double density;      // kg/m^3
    double yield_stress; // Pa

    Material() : E(210e9), nu(0.3), density(7850.0), yield_stress(250e6) {}

    void validate() const;
};

// Closed bounds for the five design variables
struct DesignBounds
{
    double min_width, max_width;   // m
    double min_height, max_height; // m
    double min_area, max_area;     // m^2

    DesignBounds() : min_width(1.0), max_width(10.0),
                     min_height(1.0), max_height(10.0),
                     min_area(1e-4), max_area(1.0) {}

    void validate() const;
};

struct LoadCase
{
    double apex_load; // N, applied downward at the apex

    LoadCase() : apex_load(100000.0) {}
};

struct Constraints
{
    double yield_stress;     // Pa, must equal Material::yield_stress
    double deflection_limit; // m
    double penalty_factor;

    Constraints() : yield_stress(250e6), deflection_limit(0.1), penalty_factor(10.0) {}

    void validate() const;
};

struct GAParams
{
    int pop_size;
    int generations;
    double mutation_rate;
    int elite_count;
    int n_threads;
    long seed; // 0 draws a seed from random_device
    bool verbose;

    GAParams() : pop_size(30), generations(100), mutation_rate(0.1), elite_count(2),
                 n_threads(1), seed(0), verbose(true) {}

    void validate() const;
};

struct FrameProblem
{
    Material material;
    DesignBounds bounds;
    LoadCase load;
    Constraints constraints;
    GAParams ga;

    // Throws std::invalid_argument on the first inconsistent field
    void validate() const;
};

// Reference problem: steel triangle, 100 kN apex load, 0.1 m deflection limit
FrameProblem createSteelTriangleProblem();

#endif // FRAME_PROBLEM_HPP
