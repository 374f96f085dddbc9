#ifndef CLASSIFIER_H
#define CLASSIFIER_H

#include <string>
#include <vector>

#include "surface_properties.h"
#include "orientation.h"
#include "obstruction_solver.h"
#include "sky_sampling.h"
#include "fsh_tables.h"
#include "classifier_settings.h"

enum class DominantFactor {
    Neither,
    Shading,
    Context,
    Error
};

const char* dominantFactorName(DominantFactor d);

struct ClassificationResult {
    Classification classification = Classification::Error;
    double         fsh            = 1.0;
    Orientation    orientation    = Orientation::Unknown;
    double         hoRatio        = 0.0;

    double contextAngle   = 0.0;
    double shadingAngle   = 90.0;
    double contextBlocked = 0.0;
    double shadingBlocked = 0.0;

    DominantFactor dominant = DominantFactor::Error;
    // e.g. "Shading (25 >= 0)"
    std::string    dominantDetail = "Error";

    double      windowHeight         = 0.0;
    int         relevantContextItems = 0;
    std::string debugTrace;
};

ClassificationResult makeErrorResult(const std::string &reason = std::string());

struct ClassificationDecision {
    Classification classification;
    DominantFactor dominant;
    double         hoRatio;
    double         contextBlocked;
    double         shadingBlocked;
    bool           contextSignificant;
    bool           shadingSignificant;
};

// Context ho approximation: tan(angle), 0 at or below the horizon, the upper
// ho bound from the cap angle on, clamped to [0, maxHoRatio].
double contextAngleToHoRatio(double contextAngle, const ClassifierSettings &settings);

// Stateless comparison of the sky blocked by context (horizon up to
// contextAngle) and by the shading device (shadingAngle up to zenith).
// Ties go to the shading device.
ClassificationDecision decideClassification(double contextAngle,
                                            double shadingAngle,
                                            bool   hasShading,
                                            double shadingHoRatio,
                                            const ClassifierSettings &settings);

// Classifies one window. Never throws for per-window problems (invalid window,
// unusable shading mesh, numeric failure); those produce an Error record.
// Throws std::invalid_argument for a month outside 1..12.
ClassificationResult classifyWindow(const Mesh &window,
                                    const Mesh *shading,
                                    const ContextSet &context,
                                    int month,
                                    CalculationMode mode,
                                    const ClassifierSettings &settings,
                                    RayDirectionCache &cache,
                                    int windowIndex = 0);

// Convenience overload: prepares the context set and a private cache.
ClassificationResult classifyWindow(const Mesh &window,
                                    const Mesh *shading,
                                    const std::vector<Mesh> &contextMeshes,
                                    int month,
                                    CalculationMode mode = CalculationMode::Heating,
                                    const ClassifierSettings &settings = ClassifierSettings());

struct BatchResult {
    std::vector<ClassificationResult> results;
    int contextItemsUsed    = 0;
    int contextItemsSkipped = 0;
};

// One result per window, in input order. shadings[i] (if present and not
// null) is the device paired with windows[i].
BatchResult classifyBatch(const std::vector<Mesh> &windows,
                          const std::vector<const Mesh*> &shadings,
                          const std::vector<Mesh> &contextMeshes,
                          int month,
                          CalculationMode mode = CalculationMode::Heating,
                          const ClassifierSettings &settings = ClassifierSettings());

void logWindowResult(const std::string &path, int windowIndex, const ClassificationResult &r);

#endif
