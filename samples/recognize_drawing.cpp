/**
 * @file recognize_drawing.cpp
 * @brief Recognition walkthrough - score synthetic drawings in both modes
 *
 * Usage: ./recognize_drawing [target_character]
 *
 * 1. Build a three-stroke drawing and a single sloppy stroke
 * 2. Validate both against the target
 * 3. Recognize in strict and lenient mode, with timing
 * 4. Batch recognition and template cache statistics
 */

#include <KanaReco/KanaReco.h>

#include <iostream>
#include <iomanip>
#include <cmath>
#include <string>
#include <vector>

using namespace Kana::Reco;
using namespace Kana::Reco::Recognition;

// Evenly spaced points on a segment, 40ms apart
Stroke MakeLine(double x0, double y0, double x1, double y1, int32_t n, int64_t t0) {
    Stroke stroke;
    for (int32_t i = 0; i < n; ++i) {
        double t = (n > 1) ? static_cast<double>(i) / (n - 1) : 0.0;
        stroke.emplace_back(x0 + (x1 - x0) * t, y0 + (y1 - y0) * t, t0 + 40 * i);
    }
    return stroke;
}

Stroke MakeArc(double cx, double cy, double r, double fromDeg, double toDeg, int32_t n, int64_t t0) {
    Stroke stroke;
    for (int32_t i = 0; i < n; ++i) {
        double a = DegToRad(fromDeg + (toDeg - fromDeg) * i / (n - 1));
        stroke.emplace_back(cx + r * std::cos(a), cy + r * std::sin(a), t0 + 40 * i);
    }
    return stroke;
}

void PrintResult(const char* label, const RecognitionResult& result) {
    std::cout << "   " << std::left << std::setw(10) << label
              << " status=" << ToString(result.status)
              << " confidence=" << std::fixed << std::setprecision(3) << result.confidence
              << " recognized=" << (result.recognized ? "yes" : "no");
    if (result.details.expectedStrokes) {
        std::cout << " strokes=" << result.details.strokeCount << "/" << *result.details.expectedStrokes;
    }
    if (result.details.encouragementLevel) {
        std::cout << " encouragement=" << Scoring::ToString(*result.details.encouragementLevel);
    }
    std::cout << std::endl;

    if (result.details.timing) {
        result.details.timing->Print();
    }
}

void PrintValidation(const char* label, const ValidationReport& report) {
    std::cout << "   " << label << ": " << (report.valid ? "valid" : "invalid") << std::endl;
    for (const auto& issue : report.issues) {
        std::cout << "     - " << issue << std::endl;
    }
}

int main(int argc, char* argv[]) {
    std::string target = "あ";
    if (argc > 1) {
        target = argv[1];
    }

    std::cout << "=== KanaReco " << GetVersion() << " Recognition Demo ===" << std::endl;
    std::cout << "Target: " << target << std::endl;

    // =========================================================================
    // 1. Drawings
    // =========================================================================
    Drawing careful;
    careful.AddStroke(MakeLine(20, 60, 180, 55, 9, 0));
    careful.AddStroke(MakeLine(95, 20, 105, 200, 10, 600));
    careful.AddStroke(MakeArc(110, 140, 50, -60, 200, 12, 1200));

    Drawing sloppy;
    sloppy.AddStroke({StrokePoint(300, 310, 0), StrokePoint(304, 318, 30),
                      StrokePoint(310, 322, 60), StrokePoint(316, 324, 90)});

    std::cout << "\n1. Drawings" << std::endl;
    std::cout << "   careful: " << careful.StrokeCount() << " strokes, "
              << careful.TotalPoints() << " points" << std::endl;
    std::cout << "   sloppy:  " << sloppy.StrokeCount() << " strokes, "
              << sloppy.TotalPoints() << " points" << std::endl;

    // =========================================================================
    // 2. Validation
    // =========================================================================
    RecognizerParams params = RecognizerParams()
        .SetTiming(RecognitionTimingParams().SetEnableTiming(true))
        .SetVerbose(true);
    Recognizer recognizer(params);

    recognizer.SetErrorCallback([](const RecognitionError& error) {
        std::cerr << "   [error callback] " << error.type << ": " << error.message << std::endl;
    });

    std::cout << "\n2. Validation" << std::endl;
    PrintValidation("careful", recognizer.Validate(careful, target));
    PrintValidation("empty", recognizer.Validate(Drawing(), ""));

    // =========================================================================
    // 3. Recognition
    // =========================================================================
    std::cout << "\n3. Recognition" << std::endl;
    PrintResult("strict", recognizer.Recognize(careful, target, RecognitionMode::Strict));
    PrintResult("lenient", recognizer.RecognizeForChild(careful, target));
    PrintResult("sloppy", recognizer.RecognizeForChild(sloppy, target));
    PrintResult("empty", recognizer.RecognizeForChild(Drawing(), target));

    // =========================================================================
    // 4. Batch and Cache
    // =========================================================================
    std::cout << "\n4. Batch" << std::endl;
    std::vector<Drawing> batch = {careful, sloppy, Drawing()};
    std::vector<RecognitionResult> results = recognizer.RecognizeBatch(batch, "く", RecognitionMode::Lenient);
    for (size_t i = 0; i < results.size(); ++i) {
        std::cout << "   [" << i << "] く confidence=" << std::fixed << std::setprecision(3)
                  << results[i].confidence << std::endl;
    }

    Template::TemplateCacheStats stats = recognizer.GetMemoryUsage();
    std::cout << "\n5. Template cache" << std::endl;
    std::cout << "   cached=" << stats.cachedTemplates
              << " pending=" << stats.pendingLoads
              << " loads=" << stats.completedLoads
              << " supported=" << stats.totalSupported << std::endl;
    std::cout << "   evicted=" << recognizer.CleanupTemplateCache(5) << std::endl;

    return 0;
}
