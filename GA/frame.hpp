#ifndef FRAME_HPP
#define FRAME_HPP

#include <map>
#include <random>
#include <string>
#include <vector>
#include <eigen3/Eigen/Dense>

#include "frame_problem.hpp"

// Member connectivity: two node identifiers and the area of the bar
struct Member
{
    std::string name;
    std::string start_node;
    std::string end_node;
    double area;
};

// Symmetric triangular truss: two base nodes `width` apart and an apex at
// (width/2, height). Members are left leg, right leg and base tie.
class Frame
{
public:
    static const char *const LEFT_NODE;
    static const char *const RIGHT_NODE;
    static const char *const TOP_NODE;

    double width;
    double height;
    double area_left;
    double area_right;
    double area_base;

    Frame() : width(1.0), height(1.0), area_left(1e-4), area_right(1e-4), area_base(1e-4) {}
    Frame(double width, double height, double area_left, double area_right, double area_base);

    // Uniform independent sample of every variable inside its bounds
    static Frame randomFrame(const DesignBounds &bounds, std::mt19937 &rng);

    // Each variable is perturbed with probability `rate` by up to 10% of its
    // bound range and clamped back into bounds
    void mutate(double rate, const DesignBounds &bounds, std::mt19937 &rng);

    // Node coordinates, always derived from the current width/height
    std::map<std::string, Eigen::Vector3d> nodes() const;
    std::vector<Member> members() const;

    double legLength() const;
    double baseLength() const { return width; }

    // density * sum(area * length) over the three members
    double calcMass(double density) const;

    bool withinBounds(const DesignBounds &bounds) const;
    bool sameParameters(const Frame &other) const;

    std::string toString() const;
};

#endif // FRAME_HPP
