#include "timeline/layout/DegradationEngine.hpp"

#include <algorithm>

#include "timeline/layout/AlternatingDispatcher.hpp"

namespace timeline {
namespace layout {

DegradationEngine::DegradationEngine(const LayoutConfig &config, const LayoutGeometry &geometry)
    : m_config(config)
    , m_geometry(geometry)
{
}

DegradationState DegradationEngine::denser(DegradationState state)
{
    switch (state) {
    case DegradationState::Full:
        return DegradationState::Compact;
    case DegradationState::Compact:
        return DegradationState::TitleOnly;
    case DegradationState::TitleOnly:
    case DegradationState::Overflowed:
        return DegradationState::Overflowed;
    }
    return DegradationState::Overflowed;
}

DegradationState DegradationEngine::lessDegraded(DegradationState state)
{
    switch (state) {
    case DegradationState::Full:
    case DegradationState::Compact:
        return DegradationState::Full;
    case DegradationState::TitleOnly:
        return DegradationState::Compact;
    case DegradationState::Overflowed:
        return DegradationState::TitleOnly;
    }
    return DegradationState::Full;
}

int DegradationEngine::requiredCells(int eventCount, DegradationState state) const
{
    return CapacityAllocator::requiredCells(eventCount, cardTypeFor(state), m_config.multiEventFootprint);
}

StateSelection DegradationEngine::selectState(int eventCount, int capacity, DegradationState start) const
{
    StateSelection selection;
    // Overflow is a consequence of capacity, never a starting point.
    DegradationState state = start == DegradationState::Overflowed ? DegradationState::TitleOnly : start;

    while (state != DegradationState::Overflowed && requiredCells(eventCount, state) > capacity) {
        state = denser(state);
    }

    while (state != DegradationState::Full && state != DegradationState::Overflowed && capacity > 0) {
        const double utilization = static_cast<double>(requiredCells(eventCount, state)) / capacity;
        const DegradationState better = lessDegraded(state);
        if (utilization >= m_config.promotionThreshold || requiredCells(eventCount, better) > capacity) {
            break;
        }
        state = better;
        selection.promoted = true;
    }

    selection.state = state;
    return selection;
}

PositionedCard DegradationEngine::makeCard(const ColumnGroup &group,
                                           CardType type,
                                           int cellIndex,
                                           QStringList eventIds) const
{
    PositionedCard card;
    card.id = QStringLiteral("%1-%2").arg(group.id).arg(group.cards.size());
    card.groupId = group.id;
    card.side = group.side;
    card.type = type;
    card.footprintCells = footprintCells(type, m_config.multiEventFootprint);
    card.cellIndex = cellIndex;
    card.eventIds = std::move(eventIds);
    const QRectF rect = m_geometry.cardRect(group.side, group.startX, cellIndex, card.footprintCells);
    card.x = rect.x();
    card.y = rect.y();
    card.width = rect.width();
    card.height = rect.height();
    return card;
}

void DegradationEngine::placeUniform(ColumnGroup &group, CapacityAllocator &allocator, CardType type) const
{
    const int footprint = footprintCells(type, m_config.multiEventFootprint);
    for (const auto &event : group.events) {
        const auto cell = allocator.allocate(footprint);
        if (!cell) {
            group.overflowEvents.push_back(event);
            continue;
        }
        group.cards.push_back(makeCard(group, type, *cell, QStringList{ event.event.id }));
    }
}

void DegradationEngine::placeOverflowed(ColumnGroup &group, CapacityAllocator &allocator) const
{
    const int count = static_cast<int>(group.events.size());
    const int capacity = allocator.capacity();
    const int multiFootprint = m_config.multiEventFootprint;

    int titleCount = capacity;
    int mergedCount = 0;
    if (m_config.aggregationEnabled && multiFootprint > 0 && capacity >= multiFootprint) {
        const int reservedTitles = capacity - multiFootprint;
        const int merged = qMin(m_config.multiEventCapacity, count - reservedTitles);
        // Only merge when one card shows more events than its cells would as title-only cards.
        if (merged > multiFootprint) {
            titleCount = reservedTitles;
            mergedCount = merged;
        }
    }

    int index = 0;
    for (; index < titleCount && index < count; ++index) {
        const auto cell = allocator.allocate(1);
        if (!cell) {
            break;
        }
        group.cards.push_back(makeCard(group, CardType::TitleOnly, *cell, QStringList{ group.events[index].event.id }));
    }

    if (mergedCount > 0) {
        const auto cell = allocator.allocate(multiFootprint);
        if (cell) {
            QStringList ids;
            for (int merged = 0; merged < mergedCount && index < count; ++merged, ++index) {
                ids << group.events[index].event.id;
            }
            group.cards.push_back(makeCard(group, CardType::MultiEvent, *cell, ids));
        }
    }

    for (; index < count; ++index) {
        group.overflowEvents.push_back(group.events[index]);
    }
}

ColumnGroup DegradationEngine::apply(ColumnGroup group) const
{
    group.events = AlternatingDispatcher::sorted(std::move(group.events));
    group.cards.clear();
    group.overflowEvents.clear();

    const int count = static_cast<int>(group.events.size());
    const DegradationState start = group.preferredState.value_or(DegradationState::Full);
    const StateSelection selection = selectState(count, group.capacity, start);
    group.state = selection.state;
    group.promoted = selection.promoted;

    CapacityAllocator allocator(group.capacity);
    switch (group.state) {
    case DegradationState::Full:
        placeUniform(group, allocator, CardType::Full);
        break;
    case DegradationState::Compact:
        placeUniform(group, allocator, CardType::Compact);
        break;
    case DegradationState::TitleOnly:
        placeUniform(group, allocator, CardType::TitleOnly);
        break;
    case DegradationState::Overflowed:
        placeOverflowed(group, allocator);
        break;
    }
    group.usedCells = allocator.usedCells();
    return group;
}

} // namespace layout
} // namespace timeline
