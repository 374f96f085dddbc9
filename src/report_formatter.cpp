#include "report_formatter.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

static const char* MONTH_NAMES[NUM_MONTHS] = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"
};

static std::string repeat(char c, int n) {
    return std::string(static_cast<size_t>(n), c);
}

std::vector<std::string> formatReportHeader(const ReportInputSummary &input) {
    const char *monthName = (input.month >= 1 && input.month <= NUM_MONTHS)
                                ? MONTH_NAMES[input.month - 1] : "Unknown";
    std::vector<std::string> lines;
    lines.push_back(repeat('=', 80));
    lines.push_back("NEN 5060 WINDOW SHADING CLASSIFICATION");
    lines.push_back(repeat('=', 80));
    lines.push_back("");
    lines.push_back("INPUT SUMMARY:");
    lines.push_back("  Windows: " + std::to_string(input.numWindows));
    lines.push_back("  Shading devices: " + std::to_string(input.numShading));
    lines.push_back("  Context buildings: " + std::to_string(input.numContext));
    lines.push_back("  Analysis month: " + std::to_string(input.month) + " (" + monthName + ")");
    lines.push_back(std::string("  Calculation mode: ") + calculationModeName(input.mode));
    lines.push_back("");

    std::ostringstream threshold;
    threshold << std::fixed << std::setprecision(1) << input.significanceThreshold;
    lines.push_back("METHODOLOGY:");
    lines.push_back("  - Context obstruction: blocks sky from 0deg up to context_angle");
    lines.push_back("  - Shading obstruction: blocks sky from shading_angle up to 90deg");
    lines.push_back("  - Comparison: context_blocked vs shading_blocked (= 90 - shading_angle)");
    lines.push_back("  - Threshold for 'significant': " + threshold.str() + "deg");
    lines.push_back("");
    lines.push_back(repeat('=', 80));
    lines.push_back("");
    lines.push_back("PROCESSING WINDOWS...");
    lines.push_back(repeat('-', 80));

    std::ostringstream columns;
    columns << std::setw(5) << "Win" << " "
            << std::setw(7) << "Ctx" << " "
            << std::setw(7) << "Shd" << " "
            << std::setw(8) << "Ctx_blk" << " "
            << std::setw(8) << "Shd_blk" << " "
            << std::setw(14) << "Dominant" << " "
            << std::setw(8) << "Class" << " "
            << std::setw(7) << "Fsh";
    lines.push_back(columns.str());
    lines.push_back(repeat('-', 80));
    return lines;
}

std::string formatReportRow(int windowIndex, const ClassificationResult &r) {
    std::ostringstream ss;
    ss << std::fixed
       << std::setw(5) << windowIndex << " "
       << std::setprecision(1)
       << std::setw(7) << r.contextAngle << " "
       << std::setw(7) << r.shadingAngle << " "
       << std::setw(8) << r.contextBlocked << " "
       << std::setw(8) << r.shadingBlocked << " "
       << std::setw(14) << r.dominantDetail.substr(0, 14) << " "
       << std::setw(8) << classificationAbbreviation(r.classification) << " "
       << std::setprecision(3)
       << std::setw(7) << r.fsh;
    return ss.str();
}

static std::string distributionLine(const char *label, int count, int total) {
    std::ostringstream ss;
    ss << "  " << std::left << std::setw(22) << label << std::right
       << std::setw(4) << count << " windows ("
       << std::fixed << std::setprecision(1) << 100.0 * count / total << "%)";
    return ss.str();
}

static std::string angleLine(const std::vector<double> &values) {
    double lo = *std::min_element(values.begin(), values.end());
    double hi = *std::max_element(values.begin(), values.end());
    double sum = 0.0;
    for (double v : values) sum += v;
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1)
       << "  Raw angles:  min=" << lo << "deg  max=" << hi << "deg  avg=" << sum / values.size() << "deg";
    return ss.str();
}

std::vector<std::string> formatReportSummary(const std::vector<ClassificationResult> &results) {
    int countMin = 0, countOve = 0, countBel = 0, countErr = 0;
    std::vector<double> contextAngles, shadingAngles, fshFactors;
    for (const auto &r : results) {
        switch (r.classification) {
            case Classification::MinimalObstruction: countMin++; break;
            case Classification::Overhang:           countOve++; break;
            case Classification::ContextObstruction: countBel++; break;
            case Classification::Error:              countErr++; break;
        }
        contextAngles.push_back(r.contextAngle);
        shadingAngles.push_back(r.shadingAngle);
        fshFactors.push_back(r.fsh);
    }
    const int total = std::max(1, static_cast<int>(results.size()));

    std::vector<std::string> lines;
    lines.push_back("");
    lines.push_back(repeat('=', 80));
    lines.push_back("SUMMARY");
    lines.push_back(repeat('=', 80));
    lines.push_back("");
    lines.push_back("CLASSIFICATION DISTRIBUTION:");
    lines.push_back(distributionLine("MinimalObstruction:", countMin, total));
    lines.push_back(distributionLine("Overhang:", countOve, total));
    lines.push_back(distributionLine("ContextObstruction:", countBel, total));
    if (countErr > 0) {
        std::ostringstream ss;
        ss << "  " << std::left << std::setw(22) << "Errors:" << std::right << std::setw(4) << countErr << " windows";
        lines.push_back(ss.str());
    }

    if (!results.empty()) {
        lines.push_back("");
        lines.push_back("CONTEXT OBSTRUCTION:");
        lines.push_back(angleLine(contextAngles));
        lines.push_back("");
        lines.push_back("SHADING OBSTRUCTION:");
        lines.push_back(angleLine(shadingAngles));

        double lo = *std::min_element(fshFactors.begin(), fshFactors.end());
        double hi = *std::max_element(fshFactors.begin(), fshFactors.end());
        double sum = 0.0;
        for (double f : fshFactors) sum += f;
        std::ostringstream range, avg;
        range << std::fixed << std::setprecision(3) << "  Range: " << lo << " to " << hi;
        avg << std::fixed << std::setprecision(3) << "  Average: " << sum / fshFactors.size();
        lines.push_back("");
        lines.push_back("FSH FACTORS:");
        lines.push_back(range.str());
        lines.push_back(avg.str());
    }

    lines.push_back("");
    lines.push_back(repeat('=', 80));
    return lines;
}
