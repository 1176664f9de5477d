#pragma once

#include <optional>
#include <vector>

#include "timeline/data/Event.hpp"
#include "timeline/layout/LayoutConfig.hpp"
#include "timeline/layout/StabilityLayer.hpp"
#include "timeline/layout/Telemetry.hpp"
#include "timeline/layout/TimeMapper.hpp"
#include "timeline/layout/Types.hpp"

namespace timeline {
namespace layout {

struct LayoutResult
{
    std::vector<PositionedCard> cards;
    std::vector<Anchor> anchors;
    std::vector<ColumnGroup> columns;
    std::vector<SpatialCluster> clusters;
    LayoutTelemetry telemetry;
};

struct LayoutPass
{
    LayoutResult result;
    StabilityMemory memory;
};

// Returns nullopt only for a non-finite viewport.
class LayoutEngine
{
public:
    explicit LayoutEngine(LayoutConfig config = LayoutConfig());

    const LayoutConfig &config() const { return m_config; }

    std::optional<LayoutPass> run(const std::vector<data::TimelineEvent> &events,
                                  const ViewWindow &window,
                                  const Viewport &viewport,
                                  const StabilityMemory &previous = StabilityMemory()) const;

    // Lays out a single region. Reads nothing but its own candidate list.
    std::vector<ColumnGroup> layoutRegion(Region region,
                                          const std::vector<TimedEvent> &candidates,
                                          const TimeMapper &mapper,
                                          const LayoutGeometry &geometry,
                                          const StabilityMemory &previous) const;

    static std::vector<SpatialCluster> pairClusters(const std::vector<ColumnGroup> &columns);

private:
    LayoutConfig m_config;
};

// Owns the cross-pass memory of one timeline instance.
class LayoutSession
{
public:
    explicit LayoutSession(LayoutConfig config = LayoutConfig());

    std::optional<LayoutResult> layout(const std::vector<data::TimelineEvent> &events,
                                       const ViewWindow &window,
                                       const Viewport &viewport);
    void reset();
    void setConfig(const LayoutConfig &config);

    const LayoutConfig &config() const { return m_engine.config(); }
    const StabilityMemory &memory() const { return m_memory; }

private:
    LayoutEngine m_engine;
    StabilityMemory m_memory;
};

} // namespace layout
} // namespace timeline
