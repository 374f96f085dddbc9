#include "classifier_settings.h"

#include <algorithm>
#include <cctype>

CalculationMode parseCalculationMode(const std::string &text) {
    std::string s = text;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "c" || s == "cooling") return CalculationMode::Cooling;
    if (s == "p" || s == "solar")   return CalculationMode::Solar;
    return CalculationMode::Heating;
}

const char* calculationModeName(CalculationMode mode) {
    switch (mode) {
        case CalculationMode::Heating: return "heating";
        case CalculationMode::Cooling: return "cooling";
        case CalculationMode::Solar:   return "solar";
    }
    return "heating";
}
