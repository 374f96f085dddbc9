#include "fsh_tables.h"

#include <stdexcept>
#include <string>

#define NA FSH_NOT_AUTHORED

// Columns: North, Northeast, East, Southeast, South, Southwest, West, Northwest
const MinimalObstructionTable TABLE_17_4 = {
    /* jan */ { 0.48, 1.00, 0.49, 0.92, 0.23, NA, 1.00, 0.85 },
    /* feb */ { 0.81, 1.00, 0.83, 0.79, 0.91, NA, 0.96, 0.85 },
    /* mar */ { 0.87, 1.00, 0.93, 0.82, 1.00, NA, 0.97, 0.89 },
    /* apr */ { 0.95, 0.99, 0.92, 0.91, 1.00, NA, 0.97, 0.82 },
    /* may */ { 1.00, 0.97, 0.99, 0.95, 1.00, NA, 0.88, 0.88 },
    /* jun */ { 1.00, 0.97, 1.00, 0.90, 1.00, NA, 0.91, 0.93 },
    /* jul */ { 0.99, 0.97, 1.00, 0.93, 1.00, NA, 0.91, 0.92 },
    /* aug */ { 0.98, 0.98, 0.99, 0.94, 1.00, NA, 0.98, 0.89 },
    /* sep */ { 0.92, 1.00, 0.91, 0.87, 1.00, NA, 0.97, 0.85 },
    /* oct */ { 0.86, 1.00, 0.88, 0.84, 0.97, NA, 0.96, 0.83 },
    /* nov */ { 0.70, 1.00, 0.71, 0.92, 0.61, NA, 0.98, 0.90 },
    /* dec */ { 0.40, 1.00, 0.58, 0.86, 0.19, NA, 1.00, 0.87 },
};

// Per orientation: { ho < 0.5, 0.5 <= ho < 1.0, ho >= 1.0 }
const ObstructionTable TABLE_17_7 = {
    /* jan */ { {0.44, 0.25, 0.25}, {1.00, 1.00, 1.00}, {0.45, 0.24, 0.24}, {0.80, 0.55, 0.55},
                {0.19, 0.19, 0.19}, {NA, NA, NA},       {1.00, 1.00, 1.00}, {0.75, 0.49, 0.49} },
    /* feb */ { {0.59, 0.44, 0.35}, {1.00, 1.00, 1.00}, {0.66, 0.51, 0.38}, {0.79, 0.68, 0.54},
                {0.60, 0.30, 0.30}, {NA, NA, NA},       {0.94, 0.91, 0.91}, {0.85, 0.72, 0.61} },
    /* mar */ { {0.79, 0.48, 0.38}, {1.00, 1.00, 1.00}, {0.83, 0.53, 0.41}, {0.75, 0.70, 0.53},
                {0.95, 0.43, 0.35}, {NA, NA, NA},       {0.93, 0.85, 0.82}, {0.80, 0.73, 0.57} },
    /* apr */ { {0.89, 0.58, 0.39}, {0.97, 0.97, 0.97}, {0.84, 0.56, 0.38}, {0.82, 0.66, 0.50},
                {1.00, 0.76, 0.36}, {NA, NA, NA},       {0.97, 0.88, 0.75}, {0.74, 0.54, 0.43} },
    /* may */ { {0.99, 0.82, 0.47}, {0.96, 0.91, 0.91}, {0.95, 0.75, 0.44}, {0.89, 0.71, 0.54},
                {1.00, 1.00, 0.46}, {NA, NA, NA},       {0.89, 0.88, 0.74}, {0.83, 0.62, 0.47} },
    /* jun */ { {0.99, 0.88, 0.53}, {0.94, 0.86, 0.84}, {0.99, 0.85, 0.49}, {0.89, 0.71, 0.53},
                {1.00, 1.00, 0.56}, {NA, NA, NA},       {0.81, 0.79, 0.66}, {0.86, 0.66, 0.49} },
    /* jul */ { {0.99, 0.83, 0.51}, {0.95, 0.90, 0.89}, {0.99, 0.82, 0.43}, {0.87, 0.69, 0.54},
                {1.00, 1.00, 0.56}, {NA, NA, NA},       {0.85, 0.84, 0.71}, {0.88, 0.71, 0.55} },
    /* aug */ { {0.95, 0.74, 0.46}, {0.98, 0.96, 0.96}, {0.91, 0.67, 0.40}, {0.90, 0.72, 0.57},
                {1.00, 0.95, 0.42}, {NA, NA, NA},       {0.96, 0.92, 0.87}, {0.80, 0.77, 0.66} },
    /* sep */ { {0.84, 0.50, 0.38}, {1.00, 1.00, 1.00}, {0.84, 0.54, 0.39}, {0.77, 0.67, 0.51},
                {0.99, 0.55, 0.34}, {NA, NA, NA},       {0.95, 0.87, 0.80}, {0.77, 0.66, 0.53} },
    /* oct */ { {0.70, 0.50, 0.33}, {1.00, 1.00, 1.00}, {0.74, 0.42, 0.35}, {0.75, 0.71, 0.52},
                {0.82, 0.30, 0.28}, {NA, NA, NA},       {0.95, 0.90, 0.91}, {0.76, 0.75, 0.57} },
    /* nov */ { {0.56, 0.38, 0.30}, {1.00, 1.00, 1.00}, {0.46, 0.34, 0.31}, {0.89, 0.60, 0.58},
                {0.24, 0.24, 0.24}, {NA, NA, NA},       {0.98, 0.98, 0.98}, {0.87, 0.74, 0.62} },
    /* dec */ { {0.38, 0.25, 0.25}, {1.00, 1.00, 1.00}, {0.54, 0.26, 0.26}, {0.71, 0.55, 0.55},
                {0.19, 0.19, 0.19}, {NA, NA, NA},       {1.00, 1.00, 1.00}, {0.79, 0.61, 0.61} },
};

#undef NA

FshTableSet tablesForMode(CalculationMode mode) {
    switch (mode) {
        case CalculationMode::Heating:
            return { &TABLE_17_4, &TABLE_17_7, &TABLE_17_7 };
        // tabel 17.5, 17.6, 17.8 and 17.9 values are not available
        case CalculationMode::Cooling:
        case CalculationMode::Solar:
            break;
    }
    return { nullptr, nullptr, nullptr };
}

HoCategory hoCategory(double hoRatio) {
    if (hoRatio < 0.5) return HoCategory::LessThanHalf;
    if (hoRatio < 1.0) return HoCategory::HalfToOne;
    return HoCategory::OneOrMore;
}

const char* hoCategoryLabel(HoCategory category) {
    switch (category) {
        case HoCategory::LessThanHalf: return "<0.5";
        case HoCategory::HalfToOne:    return "0.5-1.0";
        case HoCategory::OneOrMore:    return ">=1.0";
    }
    return "?";
}

const char* classificationName(Classification c) {
    switch (c) {
        case Classification::MinimalObstruction: return "MinimalObstruction";
        case Classification::Overhang:           return "Overhang";
        case Classification::ContextObstruction: return "ContextObstruction";
        case Classification::Error:              return "Error";
    }
    return "Error";
}

const char* classificationAbbreviation(Classification c) {
    switch (c) {
        case Classification::MinimalObstruction: return "Min";
        case Classification::Overhang:           return "Ove";
        case Classification::ContextObstruction: return "Bel";
        case Classification::Error:              return "Err";
    }
    return "???";
}

int branchIndex(Classification c) {
    switch (c) {
        case Classification::MinimalObstruction: return 0;
        case Classification::Overhang:           return 1;
        default:                                 return 2;
    }
}

double authoredFsh(const FshTableSet &tables, Classification c, Orientation o,
                   int month, HoCategory category)
{
    if (month < 1 || month > NUM_MONTHS)
        throw std::out_of_range("month " + std::to_string(month) + " outside 1..12");
    if (o == Orientation::Unknown)
        throw std::out_of_range("orientation is unknown");

    const int m = month - 1;
    const int col = static_cast<int>(o);
    switch (c) {
        case Classification::MinimalObstruction:
            return tables.minimal ? (*tables.minimal)[m][col] : FSH_NOT_AUTHORED;
        case Classification::Overhang:
            return tables.overhang ? (*tables.overhang)[m][col][static_cast<int>(category)] : FSH_NOT_AUTHORED;
        case Classification::ContextObstruction:
            return tables.context ? (*tables.context)[m][col][static_cast<int>(category)] : FSH_NOT_AUTHORED;
        case Classification::Error:
            break;
    }
    return FSH_NOT_AUTHORED;
}

static double lookupOrDefault(const FshTableSet &tables, Classification c, Orientation o,
                              int month, HoCategory category)
{
    double value = authoredFsh(tables, c, o, month, category);
    return value == FSH_NOT_AUTHORED ? 1.0 : value;
}

double lookupFsh(Classification c, Orientation o, int month, double hoRatio,
                 CalculationMode mode)
{
    if (c == Classification::Error || o == Orientation::Unknown ||
        month < 1 || month > NUM_MONTHS)
        return 1.0;

    const FshTableSet tables = tablesForMode(mode);
    const HoCategory category = hoCategory(hoRatio);

    double value = authoredFsh(tables, c, o, month, category);
    if (value != FSH_NOT_AUTHORED)
        return value;
    if (o == Orientation::SouthWest) {
        double south = lookupOrDefault(tables, c, Orientation::South, month, category);
        double west  = lookupOrDefault(tables, c, Orientation::West, month, category);
        return (south + west) / 2.0;
    }
    return 1.0;
}
