#define _USE_MATH_DEFINES

#include "classifier.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>

static const char* RULE = "======================================================================";

const char* dominantFactorName(DominantFactor d) {
    switch (d) {
        case DominantFactor::Neither: return "Neither";
        case DominantFactor::Shading: return "Shading";
        case DominantFactor::Context: return "Context";
        case DominantFactor::Error:   return "Error";
    }
    return "Error";
}

ClassificationResult makeErrorResult(const std::string &reason) {
    ClassificationResult r;
    r.classification = Classification::Error;
    r.fsh            = 1.0;
    r.orientation    = Orientation::Unknown;
    r.hoRatio        = 0.0;
    r.contextAngle   = 0.0;
    r.shadingAngle   = 90.0;
    r.dominant       = DominantFactor::Error;
    r.dominantDetail = "Error";
    if (!reason.empty())
        r.debugTrace = "ERROR: " + reason;
    return r;
}

static void checkMonth(int month) {
    if (month < 1 || month > NUM_MONTHS)
        throw std::invalid_argument("month must be in 1..12, got " + std::to_string(month));
}

double contextAngleToHoRatio(double contextAngle, const ClassifierSettings &settings) {
    if (contextAngle <= 0.0)
        return 0.0;
    if (contextAngle >= settings.contextAngleHoCap)
        return settings.maxHoRatio;
    double ho = std::tan(contextAngle * M_PI / 180.0);
    return std::clamp(ho, 0.0, settings.maxHoRatio);
}

ClassificationDecision decideClassification(double contextAngle,
                                            double shadingAngle,
                                            bool   hasShading,
                                            double shadingHoRatio,
                                            const ClassifierSettings &settings)
{
    ClassificationDecision d;
    d.contextBlocked     = contextAngle;
    d.shadingBlocked     = 90.0 - shadingAngle;
    d.contextSignificant = d.contextBlocked > settings.significanceThreshold;
    d.shadingSignificant = hasShading && d.shadingBlocked > settings.significanceThreshold;

    if (!d.contextSignificant && !d.shadingSignificant) {
        d.classification = Classification::MinimalObstruction;
        d.dominant       = DominantFactor::Neither;
        d.hoRatio        = 0.0;
    } else if (d.shadingSignificant &&
               (!d.contextSignificant || d.shadingBlocked >= d.contextBlocked)) {
        d.classification = Classification::Overhang;
        d.dominant       = DominantFactor::Shading;
        d.hoRatio        = std::clamp(shadingHoRatio, 0.0, settings.maxHoRatio);
    } else {
        d.classification = Classification::ContextObstruction;
        d.dominant       = DominantFactor::Context;
        d.hoRatio        = contextAngleToHoRatio(contextAngle, settings);
    }
    return d;
}

static std::string dominantDetail(const ClassificationDecision &d, const ClassifierSettings &settings) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(0);
    switch (d.dominant) {
        case DominantFactor::Neither:
            ss << "Neither (<" << static_cast<int>(settings.significanceThreshold) << ")";
            break;
        case DominantFactor::Shading:
            ss << "Shading (" << d.shadingBlocked << " >= " << d.contextBlocked << ")";
            break;
        case DominantFactor::Context:
            ss << "Context (" << d.contextBlocked << " > " << d.shadingBlocked << ")";
            break;
        case DominantFactor::Error:
            ss << "Error";
            break;
    }
    return ss.str();
}

static ClassificationResult classifyValidWindow(const Mesh &window,
                                                const Mesh *shading,
                                                const ContextSet &context,
                                                int month,
                                                CalculationMode mode,
                                                const ClassifierSettings &settings,
                                                RayDirectionCache &cache,
                                                int windowIndex)
{
    const bool trace = settings.debugTrace;
    std::ostringstream dbg;
    if (trace) {
        dbg << RULE << "\n" << "WINDOW " << windowIndex << " ANALYSIS\n" << RULE << "\n";
    }

    if (window.empty()) {
        return makeErrorResult(window.vertices.empty() ? "window mesh has no vertices"
                                                       : "window mesh has no triangles");
    }
    MeshProperties props = computeMeshProperties(window);
    if (!props.valid)
        return makeErrorResult("window normal is degenerate");

    ClassificationResult r;
    r.orientation  = classifyOrientation(props.normal);
    r.windowHeight = props.bbox.height();

    if (trace) {
        dbg << std::fixed;
        dbg << "\n[1] WINDOW PROPERTIES\n"
            << std::setprecision(2)
            << "    Center: (" << props.center.x << ", " << props.center.y << ", " << props.center.z << ")\n"
            << std::setprecision(3)
            << "    Normal: (" << props.normal.x << ", " << props.normal.y << ", " << props.normal.z << ")\n"
            << std::setprecision(2)
            << "    Size: " << r.windowHeight << "m height, Z range " << props.bbox.min.z
            << " to " << props.bbox.max.z << "\n"
            << "    Orientation: " << orientationName(r.orientation) << "\n";
    }

    std::vector<SamplePoint> samples = generateSamplePoints(props.bbox, props.normal, settings);
    std::shared_ptr<const RayDirectionSet> directions = cache.get(props.normal);

    if (trace) {
        dbg << "\n[2] RAY CASTING SETUP\n"
            << "    " << samples.size() << " sample points on window\n"
            << "    " << directions->size() << " ray directions per sample\n"
            << "    Total rays for context: " << samples.size() * directions->size() << "\n";
    }

    std::vector<const ContextItem*> relevant =
        filterContextForWindow(context.items, props.center, props.normal, props.bbox, settings);
    r.relevantContextItems = static_cast<int>(relevant.size());

    ContextCastStats stats;
    r.contextAngle = castContextRays(samples, *directions, relevant, settings, &stats);

    if (trace) {
        dbg << "\n[3] CONTEXT ANALYSIS\n"
            << "    " << relevant.size() << " of " << context.items.size()
            << " context objects in front of window\n";
        if (relevant.empty()) {
            dbg << "      No context geometry after filtering\n";
        } else {
            double pct = 100.0 * stats.raysBlocked / std::max(1, stats.raysCast);
            dbg << std::setprecision(1)
                << "      Context: " << stats.raysCast << " rays cast, " << stats.raysBlocked
                << " blocked (" << pct << "%)\n"
                << "      Sample angles:";
            for (double a : stats.sampleMaxima)
                dbg << " " << a;
            dbg << "\n"
                << "      Weighted avg: " << stats.weightedAverage << "deg, Max: " << stats.absoluteMaximum
                << "deg, Final: " << r.contextAngle << "deg\n";
        }
    }

    // an unusable shading mesh throws here and ends up as an Error record
    std::unique_ptr<MeshIntersector> shadingIntersector;
    if (shading)
        shadingIntersector = std::make_unique<MeshIntersector>(*shading);

    ShadingCastResult shd = castShadingRays(props.bbox, props.normal, shadingIntersector.get(), settings);
    r.shadingAngle = shd.elevation;

    if (trace) {
        dbg << "\n[4] SHADING ANALYSIS\n";
        if (!shading) {
            dbg << "      No shading device for this window\n";
        } else {
            dbg << "      Shading: " << shd.hits << " hits out of " << settings.shadingElevations.size()
                << " test angles\n"
                << std::setprecision(1) << "      Min blocked: " << shd.elevation << "deg, "
                << std::setprecision(2) << "Projection: " << shd.projectionDepth << "m, "
                << std::setprecision(3) << "ho=" << shd.hoRatio << "\n";
        }
    }

    ClassificationDecision decision =
        decideClassification(r.contextAngle, r.shadingAngle, shading != nullptr, shd.hoRatio, settings);
    r.classification = decision.classification;
    r.dominant       = decision.dominant;
    r.dominantDetail = dominantDetail(decision, settings);
    r.hoRatio        = decision.hoRatio;
    r.contextBlocked = decision.contextBlocked;
    r.shadingBlocked = decision.shadingBlocked;

    if (trace) {
        dbg << std::setprecision(1)
            << "\n[5] CLASSIFICATION DECISION\n"
            << "    Context: " << r.contextAngle << "deg angle -> " << r.contextBlocked << "deg blocked "
            << (decision.contextSignificant ? "(SIGNIFICANT)" : "(minimal)") << "\n"
            << "    Shading: " << r.shadingAngle << "deg angle -> " << r.shadingBlocked << "deg blocked "
            << (decision.shadingSignificant ? "(SIGNIFICANT)" : "(minimal)") << "\n"
            << "    Threshold: " << settings.significanceThreshold << "deg\n"
            << "    -> Dominant factor: " << r.dominantDetail << "\n"
            << "    -> Classification: " << classificationName(r.classification) << "\n";
    }

    r.fsh = lookupFsh(r.classification, r.orientation, month, r.hoRatio, mode);

    if (trace) {
        const char *category = hoCategoryLabel(hoCategory(r.hoRatio));
        dbg << std::setprecision(3)
            << "\n[6] FSH LOOKUP (" << calculationModeName(mode) << ")\n"
            << "    ho ratio: " << r.hoRatio << " -> category: " << category << "\n";
        if (r.classification == Classification::MinimalObstruction)
            dbg << "    Table: 17.4[" << month << "][" << orientationName(r.orientation) << "] = " << r.fsh << "\n";
        else
            dbg << "    Table: 17.7[" << month << "][" << orientationName(r.orientation) << "]["
                << category << "] = " << r.fsh << "\n";
        dbg << "\n" << RULE << "\n"
            << "RESULT: " << classificationName(r.classification) << " | " << orientationName(r.orientation)
            << " | Fsh=" << r.fsh << " | ho=" << r.hoRatio << "\n"
            << RULE << "\n";
        r.debugTrace = dbg.str();
    }
    return r;
}

ClassificationResult classifyWindow(const Mesh &window,
                                    const Mesh *shading,
                                    const ContextSet &context,
                                    int month,
                                    CalculationMode mode,
                                    const ClassifierSettings &settings,
                                    RayDirectionCache &cache,
                                    int windowIndex)
{
    checkMonth(month);
    try {
        ClassificationResult r = classifyValidWindow(window, shading, context, month, mode,
                                                     settings, cache, windowIndex);
        if (!settings.debugTrace)
            r.debugTrace.clear();
        return r;
    } catch (const std::exception &e) {
        std::cerr << "[Classifier] Window " << windowIndex << ": " << e.what() << "\n";
        ClassificationResult r = makeErrorResult(e.what());
        if (!settings.debugTrace)
            r.debugTrace.clear();
        return r;
    }
}

ClassificationResult classifyWindow(const Mesh &window,
                                    const Mesh *shading,
                                    const std::vector<Mesh> &contextMeshes,
                                    int month,
                                    CalculationMode mode,
                                    const ClassifierSettings &settings)
{
    checkMonth(month);
    ContextSet context = buildContextSet(contextMeshes, settings.verbose);
    RayDirectionCache cache(settings);
    return classifyWindow(window, shading, context, month, mode, settings, cache, 0);
}

void logWindowResult(const std::string &path, int windowIndex, const ClassificationResult &r) {
    static std::mutex logMutex;
    std::lock_guard<std::mutex> lock(logMutex);

    std::ofstream logFile(path, std::ios::app);
    if (!logFile) {
        std::cerr << "[Log] Cannot open " << path << " for writing.\n";
        return;
    }
    if (logFile.tellp() == 0) {
        logFile << "Window,Orientation,ContextAngle,ShadingAngle,Classification,HoRatio,Fsh\n";
    }
    logFile << windowIndex << ","
            << orientationName(r.orientation) << ","
            << std::fixed << std::setprecision(2) << r.contextAngle << ","
            << r.shadingAngle << ","
            << classificationName(r.classification) << ","
            << std::setprecision(3) << r.hoRatio << ","
            << r.fsh << "\n";
}

BatchResult classifyBatch(const std::vector<Mesh> &windows,
                          const std::vector<const Mesh*> &shadings,
                          const std::vector<Mesh> &contextMeshes,
                          int month,
                          CalculationMode mode,
                          const ClassifierSettings &settings)
{
    checkMonth(month);
    if (shadings.size() > windows.size()) {
        std::cerr << "[Batch] Warning: " << shadings.size() - windows.size()
                  << " shading entries without a window are ignored.\n";
    }

    BatchResult batch;
    ContextSet context = buildContextSet(contextMeshes, settings.verbose);
    batch.contextItemsUsed    = static_cast<int>(context.items.size());
    batch.contextItemsSkipped = context.skipped;

    RayDirectionCache cache(settings);
    std::vector<Vector3> normals;
    for (const auto &w : windows) {
        if (w.empty())
            continue;
        MeshProperties props = computeMeshProperties(w);
        if (props.valid)
            normals.push_back(props.normal);
    }
    cache.prewarm(normals);

    const int NW = static_cast<int>(windows.size());
    batch.results.resize(NW);

    #pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < NW; i++) {
        const Mesh *shading = i < static_cast<int>(shadings.size()) ? shadings[i] : nullptr;
        batch.results[i] = classifyWindow(windows[i], shading, context, month, mode, settings, cache, i);
        if (!settings.logFile.empty())
            logWindowResult(settings.logFile, i, batch.results[i]);
    }

    if (settings.verbose) {
        std::cout << "[Batch] Classified " << NW << " windows ("
                  << cache.size() << " distinct ray fans, "
                  << batch.contextItemsUsed << " context items).\n";
    }
    return batch;
}
