#ifndef FSH_TABLES_H
#define FSH_TABLES_H

#include "orientation.h"
#include "classifier_settings.h"

enum class Classification {
    MinimalObstruction,
    Overhang,
    ContextObstruction,
    Error
};

enum class HoCategory {
    LessThanHalf,
    HalfToOne,
    OneOrMore
};

static const int NUM_MONTHS        = 12;
static const int NUM_HO_CATEGORIES = 3;

// Marks a cell the standard does not author.
static const double FSH_NOT_AUTHORED = -1.0;

typedef double MinimalObstructionTable[NUM_MONTHS][NUM_ORIENTATIONS];
typedef double ObstructionTable[NUM_MONTHS][NUM_ORIENTATIONS][NUM_HO_CATEGORIES];

// NEN 5060 tabel 17.4, Fsh;obst;mi
extern const MinimalObstructionTable TABLE_17_4;
// NEN 5060 tabel 17.7, Fsh;obst;m
extern const ObstructionTable TABLE_17_7;

struct FshTableSet {
    const MinimalObstructionTable *minimal;
    const ObstructionTable        *overhang;
    const ObstructionTable        *context;
};

// Tables that apply for a calculation mode. A null table means the mode has
// no authored values for that classification.
FshTableSet tablesForMode(CalculationMode mode);

HoCategory  hoCategory(double hoRatio);
const char* hoCategoryLabel(HoCategory category);

const char* classificationName(Classification c);
const char* classificationAbbreviation(Classification c);
// Output branch of the host integration: 0 minimal, 1 overhang, 2 otherwise.
int         branchIndex(Classification c);

// FSH_NOT_AUTHORED when the cell is absent. Throws std::out_of_range for a
// month outside 1..12 or Orientation::Unknown.
double authoredFsh(const FshTableSet &tables, Classification c, Orientation o,
                   int month, HoCategory category);

// Reduction factor for a classified window. Absent cells resolve to 1.0;
// an unauthored Southwest is the mean of South and West.
double lookupFsh(Classification c, Orientation o, int month, double hoRatio,
                 CalculationMode mode = CalculationMode::Heating);

#endif
