#include "timeline/layout/LayoutEngine.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

#include "timeline/core/Logging.hpp"
#include "timeline/layout/AlternatingDispatcher.hpp"
#include "timeline/layout/AnchorPositioner.hpp"
#include "timeline/layout/Clusterer.hpp"
#include "timeline/layout/DegradationEngine.hpp"

namespace timeline {
namespace layout {

namespace {
bool isFiniteViewport(const Viewport &viewport)
{
    return std::isfinite(viewport.width) && std::isfinite(viewport.height);
}

bool spansOverlap(const ColumnGroup &lhs, const ColumnGroup &rhs)
{
    return lhs.startX <= rhs.endX && rhs.startX <= lhs.endX;
}
} // namespace

LayoutEngine::LayoutEngine(LayoutConfig config)
    : m_config(std::move(config))
{
}

std::vector<ColumnGroup> LayoutEngine::layoutRegion(Region region,
                                                    const std::vector<TimedEvent> &candidates,
                                                    const TimeMapper &mapper,
                                                    const LayoutGeometry &geometry,
                                                    const StabilityMemory &previous) const
{
    const Clusterer clusterer(m_config);
    const StabilityLayer stability(previous, m_config.stabilityThreshold);
    const DegradationEngine degradation(m_config, geometry);
    const AnchorPositioner anchors(mapper, geometry.timelineY());
    const int capacity = geometry.cellBudget(region);

    std::vector<ColumnGroup> columns = stability.stabilize(clusterer.cluster(region, candidates));
    std::vector<ColumnGroup> placed;
    placed.reserve(columns.size());
    for (auto &column : columns) {
        column.capacity = capacity;
        placed.push_back(anchors.position(degradation.apply(std::move(column))));
    }
    return placed;
}

std::vector<SpatialCluster> LayoutEngine::pairClusters(const std::vector<ColumnGroup> &columns)
{
    std::vector<const ColumnGroup *> above;
    std::vector<const ColumnGroup *> below;
    for (const auto &column : columns) {
        (column.side == Region::Above ? above : below).push_back(&column);
    }

    std::vector<SpatialCluster> clusters;
    std::vector<bool> belowUsed(below.size(), false);
    auto makeCluster = [&clusters](const ColumnGroup *up, const ColumnGroup *down) {
        SpatialCluster cluster;
        cluster.id = QStringLiteral("cluster-%1").arg(clusters.size());
        cluster.aboveGroupId = up ? up->id : QString();
        cluster.belowGroupId = down ? down->id : QString();
        cluster.startX = qMin(up ? up->startX : down->startX, down ? down->startX : up->startX);
        cluster.endX = qMax(up ? up->endX : down->endX, down ? down->endX : up->endX);
        clusters.push_back(cluster);
    };

    for (const auto *up : above) {
        const ColumnGroup *partner = nullptr;
        for (std::size_t index = 0; index < below.size(); ++index) {
            if (!belowUsed[index] && spansOverlap(*up, *below[index])) {
                belowUsed[index] = true;
                partner = below[index];
                break;
            }
        }
        makeCluster(up, partner);
    }
    for (std::size_t index = 0; index < below.size(); ++index) {
        if (!belowUsed[index]) {
            makeCluster(nullptr, below[index]);
        }
    }

    std::stable_sort(clusters.begin(), clusters.end(), [](const SpatialCluster &lhs, const SpatialCluster &rhs) {
        return lhs.startX < rhs.startX;
    });
    for (std::size_t index = 0; index < clusters.size(); ++index) {
        clusters[index].id = QStringLiteral("cluster-%1").arg(index);
    }
    return clusters;
}

std::optional<LayoutPass> LayoutEngine::run(const std::vector<data::TimelineEvent> &events,
                                            const ViewWindow &window,
                                            const Viewport &viewport,
                                            const StabilityMemory &previous) const
{
    if (!isFiniteViewport(viewport)) {
        qCWarning(lcLayout) << "rejecting layout pass for non-finite viewport" << viewport.width << viewport.height;
        return std::nullopt;
    }

    const LayoutGeometry geometry(m_config, viewport);
    const ViewWindow cleanWindow = TimeMapper::sanitizeWindow(window);
    if (cleanWindow.viewStart != window.viewStart || cleanWindow.viewEnd != window.viewEnd) {
        qCDebug(lcLayout) << "view window" << window.viewStart << window.viewEnd << "sanitized to"
                          << cleanWindow.viewStart << cleanWindow.viewEnd;
    }

    int invalid = 0;
    std::vector<TimedEvent> dated;
    dated.reserve(events.size());
    for (const auto &event : events) {
        const auto timestamp = eventTimestamp(event);
        if (!timestamp) {
            qCDebug(lcLayout) << "excluding event with unparsable date" << event.id << event.date;
            ++invalid;
            continue;
        }
        TimedEvent timed;
        timed.event = event;
        timed.timestamp = *timestamp;
        dated.push_back(std::move(timed));
    }

    LayoutPass pass;
    if (dated.empty()) {
        pass.result.telemetry = TelemetryAggregator().summarize({}, invalid, 0);
        return pass;
    }

    const auto [earliest, latest] = std::minmax_element(dated.begin(), dated.end(),
                                                        [](const TimedEvent &lhs, const TimedEvent &rhs) {
                                                            return lhs.timestamp < rhs.timestamp;
                                                        });
    const TimeMapper mapper = TimeMapper::forWindow(earliest->timestamp, latest->timestamp, cleanWindow, geometry);

    int outsideView = 0;
    std::vector<TimedEvent> visible;
    visible.reserve(dated.size());
    for (auto &event : dated) {
        if (!mapper.isVisible(event.timestamp)) {
            ++outsideView;
            continue;
        }
        event.x = mapper.xForTime(event.timestamp);
        visible.push_back(std::move(event));
    }

    const DispatchResult dispatched = AlternatingDispatcher().dispatch(std::move(visible));
    std::vector<ColumnGroup> columns = layoutRegion(Region::Above, dispatched.above, mapper, geometry, previous);
    std::vector<ColumnGroup> belowColumns = layoutRegion(Region::Below, dispatched.below, mapper, geometry, previous);
    columns.insert(columns.end(),
                   std::make_move_iterator(belowColumns.begin()),
                   std::make_move_iterator(belowColumns.end()));

    const AnchorPositioner anchors(mapper, geometry.timelineY());
    for (const auto &column : columns) {
        pass.result.cards.insert(pass.result.cards.end(), column.cards.begin(), column.cards.end());
        pass.result.anchors.push_back(anchors.anchorFor(column));
    }
    pass.result.clusters = pairClusters(columns);
    pass.result.telemetry = TelemetryAggregator().summarize(columns, invalid, outsideView);
    pass.memory = StabilityLayer::remember(columns);
    pass.result.columns = std::move(columns);

    qCDebug(lcLayout) << "layout pass:" << pass.result.telemetry.events.total << "events,"
                      << pass.result.columns.size() << "columns," << pass.result.cards.size() << "cards";
    return pass;
}

LayoutSession::LayoutSession(LayoutConfig config)
    : m_engine(std::move(config))
{
}

std::optional<LayoutResult> LayoutSession::layout(const std::vector<data::TimelineEvent> &events,
                                                  const ViewWindow &window,
                                                  const Viewport &viewport)
{
    auto pass = m_engine.run(events, window, viewport, m_memory);
    if (!pass) {
        return std::nullopt;
    }
    m_memory = std::move(pass->memory);
    return std::move(pass->result);
}

void LayoutSession::reset()
{
    m_memory = StabilityMemory();
}

void LayoutSession::setConfig(const LayoutConfig &config)
{
    m_engine = LayoutEngine(config);
    reset();
}

} // namespace layout
} // namespace timeline
