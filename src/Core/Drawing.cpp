/**
 * @file Drawing.cpp
 * @brief Drawing container implementation
 */

#include <KanaReco/Core/Drawing.h>
#include <KanaReco/Core/Constants.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <limits>

namespace Kana::Reco {

namespace {

int64_t NowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

std::optional<Rect2d> ComputeBoundingBox(const StrokeArray& strokes) {
    double minX = std::numeric_limits<double>::infinity();
    double minY = std::numeric_limits<double>::infinity();
    double maxX = -std::numeric_limits<double>::infinity();
    double maxY = -std::numeric_limits<double>::infinity();
    bool any = false;

    for (const auto& stroke : strokes) {
        for (const auto& pt : stroke) {
            minX = std::min(minX, pt.x);
            minY = std::min(minY, pt.y);
            maxX = std::max(maxX, pt.x);
            maxY = std::max(maxY, pt.y);
            any = true;
        }
    }

    if (!any) {
        return std::nullopt;
    }
    return Rect2d{minX, minY, maxX - minX, maxY - minY};
}

Drawing::Drawing() : timestamp_(NowMillis()) {}

Drawing::Drawing(const StrokeArray& strokes, std::optional<int64_t> timestamp)
    : timestamp_(timestamp.value_or(NowMillis()))
{
    strokes_.reserve(strokes.size());
    for (const auto& stroke : strokes) {
        if (!stroke.empty()) {
            strokes_.push_back(stroke);
        }
    }
    UpdateBoundingBox();
}

bool Drawing::AddStroke(const Stroke& points) {
    if (points.empty()) {
#ifdef KANARECO_DEBUG
        fprintf(stderr, "[Drawing] Ignoring empty stroke\n");
#endif
        return false;
    }

    strokes_.push_back(points);
    UpdateBoundingBox();
    return true;
}

void Drawing::Clear() {
    strokes_.clear();
    boundingBox_.reset();
}

int32_t Drawing::TotalPoints() const {
    size_t total = 0;
    for (const auto& stroke : strokes_) {
        total += stroke.size();
    }
    return static_cast<int32_t>(total);
}

double Drawing::GetComplexity() const {
    if (IsEmpty()) {
        return 0.0;
    }

    double area = boundingBox_ ? boundingBox_->Area() : 0.0;
    double strokeComplexity = std::min(StrokeCount() / 10.0, 1.0);
    double pointComplexity = std::min(TotalPoints() / 100.0, 1.0);
    double areaComplexity = std::min(area / 10000.0, 1.0);

    return (strokeComplexity + pointComplexity + areaComplexity) / 3.0;
}

DrawingSummary Drawing::GetSummary() const {
    DrawingSummary summary;
    summary.strokeCount = StrokeCount();
    summary.pointCount = TotalPoints();
    summary.complexity = GetComplexity();
    summary.boundingBox = boundingBox_;
    summary.timestamp = timestamp_;
    summary.isEmpty = IsEmpty();
    return summary;
}

void Drawing::UpdateBoundingBox() {
    boundingBox_ = ComputeBoundingBox(strokes_);
}

} // namespace Kana::Reco
