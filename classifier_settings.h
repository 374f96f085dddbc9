#ifndef CLASSIFIER_SETTINGS_H
#define CLASSIFIER_SETTINGS_H

#include <string>
#include <vector>

enum class CalculationMode {
    Heating,
    Cooling,
    Solar
};

// Accepts H/heating, C/cooling, P/solar (any case). Anything else is Heating.
CalculationMode parseCalculationMode(const std::string &text);
const char* calculationModeName(CalculationMode mode);

struct ClassifierSettings {
    // sky fan for context rays
    std::vector<double> elevationAngles = { 5, 10, 15, 20, 25, 30, 35, 40,
                                            45, 50, 55, 60, 65, 70, 75, 80 };
    double azimuthSpread = 60.0;
    int    azimuthSteps  = 9;

    // window sampling
    double sampleInset          = 0.1;
    double lateralOffsetFraction = 0.35;

    // hit validity windows
    double minRayDistance     = 0.05;
    double maxContextDistance = 500.0;
    double maxShadingDistance = 50.0;

    // shading profile rays, straight along the normal
    std::vector<double> shadingElevations = { 5, 10, 15, 20, 25, 30, 35, 40, 45,
                                              50, 55, 60, 65, 70, 75, 80, 85 };

    double significanceThreshold = 20.0;
    double weightedAverageShare  = 0.7;
    double absoluteMaximumShare  = 0.3;

    double maxHoRatio          = 2.0;
    double contextAngleHoCap   = 89.0;
    int    normalKeyDecimals   = 3;

    bool        verbose    = false;
    bool        debugTrace = false;
    std::string logFile;
};

#endif
