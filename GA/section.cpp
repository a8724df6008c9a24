#include "section.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

using namespace std;

namespace
{
    void requirePositive(double value, const char *name)
    {
        if (!(value > 0.0) || !isfinite(value))
        {
            throw invalid_argument(string("section ") + name + " must be positive, got " + to_string(value));
        }
    }
}

Section Section::square(double side)
{
    Section s;
    s.kind = SectionKind::Square;
    s.side = side;
    return s;
}

Section Section::squareFromArea(double area)
{
    requirePositive(area, "area");
    return square(sqrt(area));
}

Section Section::tube(double outer_diameter, double inner_diameter)
{
    Section s;
    s.kind = SectionKind::Tube;
    s.outer_diameter = outer_diameter;
    s.inner_diameter = inner_diameter;
    return s;
}

Section Section::box(double outer_width, double outer_height, double inner_width, double inner_height)
{
    Section s;
    s.kind = SectionKind::Box;
    s.outer_width = outer_width;
    s.outer_height = outer_height;
    s.inner_width = inner_width;
    s.inner_height = inner_height;
    return s;
}

SectionProperties sectionProperties(const Section &section)
{
    SectionProperties p;

    switch (section.kind)
    {
    case SectionKind::Square:
    {
        requirePositive(section.side, "side");
        double s = section.side;
        double s4 = s * s * s * s;
        p.A = s * s;
        p.Iy = p.Iz = s4 / 12.0;
        p.J = 0.1406 * s4; // Saint-Venant constant for a solid square
        return p;
    }
    case SectionKind::Tube:
    {
        double D = section.outer_diameter;
        double d = section.inner_diameter;
        requirePositive(D, "outer_diameter");
        if (d < 0.0 || d >= D)
        {
            throw invalid_argument("tube inner_diameter must lie in [0, outer_diameter), got " + to_string(d));
        }
        p.A = M_PI / 4.0 * (D * D - d * d);
        p.Iy = p.Iz = M_PI / 64.0 * (pow(D, 4) - pow(d, 4));
        p.J = 2.0 * p.Iy;
        return p;
    }
    case SectionKind::Box:
    {
        double W = section.outer_width, H = section.outer_height;
        double w = section.inner_width, h = section.inner_height;
        requirePositive(W, "outer_width");
        requirePositive(H, "outer_height");
        if (w < 0.0 || h < 0.0 || w >= W || h >= H)
        {
            throw invalid_argument("box inner dimensions must be non-negative and smaller than the outer ones");
        }
        p.A = W * H - w * h;
        p.Iy = (W * pow(H, 3) - w * pow(h, 3)) / 12.0;
        p.Iz = (H * pow(W, 3) - h * pow(w, 3)) / 12.0;

        if (w == 0.0 || h == 0.0)
        {
            // Solid rectangle, b >= t
            double b = max(W, H), t = min(W, H);
            p.J = b * pow(t, 3) * (1.0 / 3.0 - 0.21 * (t / b) * (1.0 - pow(t, 4) / (12.0 * pow(b, 4))));
        }
        else
        {
            // Thin-walled hollow rectangle (Bredt), wall thickness from each pair of faces
            double t_w = (W - w) / 2.0;
            double t_h = (H - h) / 2.0;
            double a = W - t_w;
            double b = H - t_h;
            p.J = 2.0 * t_w * t_h * a * a * b * b / (a * t_w + b * t_h);
        }
        return p;
    }
    }

    throw invalid_argument("unknown section kind");
}

double tubeFrameMass(double density, const vector<TubeSegment> &segments)
{
    double mass = 0.0;
    for (const auto &seg : segments)
    {
        requirePositive(seg.length, "length");
        requirePositive(seg.wall_thickness, "wall_thickness");
        double inner = seg.outer_diameter - 2.0 * seg.wall_thickness;
        SectionProperties p = sectionProperties(Section::tube(seg.outer_diameter, max(inner, 0.0)));
        mass += density * p.A * seg.length;
    }
    return mass;
}
