#pragma once

#include <QJsonObject>
#include <map>
#include <vector>

#include "timeline/layout/Types.hpp"

namespace timeline {
namespace layout {

struct RegionTelemetry
{
    int count = 0;
    int events = 0;
    std::vector<int> eventsPerHalfColumn;
    int totalCells = 0;
    int usedCells = 0;
};

struct LayoutTelemetry
{
    struct Events
    {
        int total = 0;
        int invalid = 0;
        int outsideView = 0;
    };
    struct HalfColumns
    {
        RegionTelemetry above;
        RegionTelemetry below;
    };
    struct Capacity
    {
        int totalCells = 0;
        int usedCells = 0;
        double utilization = 0.0; // percent
    };
    struct Degradation
    {
        std::map<CardType, int> degradedCountByType;
        std::map<CardType, int> promotedCountByType;
    };
    struct Aggregation
    {
        int totalAggregations = 0;
        int eventsAggregated = 0;
    };
    struct Cards
    {
        int single = 0;
        int multiContained = 0;
        int summaryContained = 0;
    };

    Events events;
    HalfColumns halfColumns;
    Capacity capacity;
    Degradation degradation;
    Aggregation aggregation;
    Cards cards;

    int degradedCount(CardType type) const;
    int promotedCount(CardType type) const;
    bool reconciles() const;
    QJsonObject toJson() const;
};

class TelemetryAggregator
{
public:
    LayoutTelemetry summarize(const std::vector<ColumnGroup> &groups, int invalidEvents, int outsideView) const;

private:
    static void addRegion(RegionTelemetry &region, const ColumnGroup &group);
};

} // namespace layout
} // namespace timeline
