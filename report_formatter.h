#ifndef REPORT_FORMATTER_H
#define REPORT_FORMATTER_H

#include <string>
#include <vector>

#include "classifier.h"

struct ReportInputSummary {
    int numWindows  = 0;
    int numShading  = 0;
    int numContext  = 0;
    int month       = 1;
    CalculationMode mode = CalculationMode::Heating;
    double significanceThreshold = 20.0;
};

std::vector<std::string> formatReportHeader(const ReportInputSummary &input);

// Win Ctx Shd Ctx_blk Shd_blk Dominant Class Fsh
std::string formatReportRow(int windowIndex, const ClassificationResult &r);

std::vector<std::string> formatReportSummary(const std::vector<ClassificationResult> &results);

#endif
