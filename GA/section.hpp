#ifndef SECTION_HPP
#define SECTION_HPP

#include <vector>

enum class SectionKind
{
    Square,
    Tube,
    Box
};

// Cross-section shape. Only the dimensions belonging to `kind` are meaningful.
struct Section
{
    SectionKind kind;

    double side; // Square

    double outer_diameter; // Tube
    double inner_diameter;

    double outer_width; // Box
    double outer_height;
    double inner_width;
    double inner_height;

    static Section square(double side);
    static Section squareFromArea(double area);
    static Section tube(double outer_diameter, double inner_diameter);
    static Section box(double outer_width, double outer_height, double inner_width, double inner_height);

private:
    Section() : kind(SectionKind::Square), side(0.0), outer_diameter(0.0), inner_diameter(0.0),
                outer_width(0.0), outer_height(0.0), inner_width(0.0), inner_height(0.0) {}
};

struct SectionProperties
{
    double A;
    double Iy;
    double Iz;
    double J;
};

// Throws std::invalid_argument for non-positive dimensions or inner >= outer
SectionProperties sectionProperties(const Section &section);

struct TubeSegment
{
    double outer_diameter;
    double wall_thickness;
    double length;
};

double tubeFrameMass(double density, const std::vector<TubeSegment> &segments);

#endif // SECTION_HPP
