#include "frame.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

using namespace Eigen;
using namespace std;

const char *const Frame::LEFT_NODE = "N_left";
const char *const Frame::RIGHT_NODE = "N_right";
const char *const Frame::TOP_NODE = "N_top";

namespace
{
    double clampTo(double value, double lo, double hi)
    {
        return max(lo, min(value, hi));
    }

    void perturb(double &value, double lo, double hi, double rate, mt19937 &rng)
    {
        uniform_real_distribution<double> chance(0.0, 1.0);
        if (chance(rng) < rate)
        {
            double delta = (hi - lo) * 0.1;
            uniform_real_distribution<double> step(-delta, delta);
            value += step(rng);
            value = clampTo(value, lo, hi);
        }
    }
}

Frame::Frame(double width, double height, double area_left, double area_right, double area_base)
    : width(width), height(height), area_left(area_left), area_right(area_right), area_base(area_base)
{
}

Frame Frame::randomFrame(const DesignBounds &bounds, mt19937 &rng)
{
    uniform_real_distribution<double> w_dist(bounds.min_width, bounds.max_width);
    uniform_real_distribution<double> h_dist(bounds.min_height, bounds.max_height);
    uniform_real_distribution<double> a_dist(bounds.min_area, bounds.max_area);

    double w = w_dist(rng);
    double h = h_dist(rng);
    double a_left = a_dist(rng);
    double a_right = a_dist(rng);
    double a_base = a_dist(rng);
    return Frame(w, h, a_left, a_right, a_base);
}

void Frame::mutate(double rate, const DesignBounds &bounds, mt19937 &rng)
{
    perturb(width, bounds.min_width, bounds.max_width, rate, rng);
    perturb(height, bounds.min_height, bounds.max_height, rate, rng);
    perturb(area_left, bounds.min_area, bounds.max_area, rate, rng);
    perturb(area_right, bounds.min_area, bounds.max_area, rate, rng);
    perturb(area_base, bounds.min_area, bounds.max_area, rate, rng);
}

map<string, Vector3d> Frame::nodes() const
{
    map<string, Vector3d> result;
    result[LEFT_NODE] = Vector3d(0.0, 0.0, 0.0);
    result[RIGHT_NODE] = Vector3d(width, 0.0, 0.0);
    result[TOP_NODE] = Vector3d(width / 2.0, height, 0.0);
    return result;
}

vector<Member> Frame::members() const
{
    return {
        {"M_left", LEFT_NODE, TOP_NODE, area_left},
        {"M_right", RIGHT_NODE, TOP_NODE, area_right},
        {"M_base", LEFT_NODE, RIGHT_NODE, area_base}};
}

double Frame::legLength() const
{
    double half = width / 2.0;
    return sqrt(half * half + height * height);
}

double Frame::calcMass(double density) const
{
    double leg = legLength();
    return (area_left * leg + area_right * leg + area_base * baseLength()) * density;
}

bool Frame::withinBounds(const DesignBounds &bounds) const
{
    auto inside = [](double v, double lo, double hi)
    { return v >= lo && v <= hi; };

    return inside(width, bounds.min_width, bounds.max_width) &&
           inside(height, bounds.min_height, bounds.max_height) &&
           inside(area_left, bounds.min_area, bounds.max_area) &&
           inside(area_right, bounds.min_area, bounds.max_area) &&
           inside(area_base, bounds.min_area, bounds.max_area);
}

bool Frame::sameParameters(const Frame &other) const
{
    return width == other.width && height == other.height &&
           area_left == other.area_left && area_right == other.area_right &&
           area_base == other.area_base;
}

string Frame::toString() const
{
    ostringstream out;
    out << fixed << "Frame(width=" << setprecision(2) << width << ", height=" << height
        << ", areas=[" << setprecision(4) << area_left << ", " << area_right << ", " << area_base << "])";
    return out.str();
}
