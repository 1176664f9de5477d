#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QtGlobal>
#include <optional>
#include <vector>

#include "timeline/data/Event.hpp"

namespace timeline {
namespace layout {

enum class Region
{
    Above,
    Below
};

enum class CardType
{
    Full,
    Compact,
    TitleOnly,
    MultiEvent
};

// Overflowed renders as title-only cards plus a badge.
enum class DegradationState
{
    Full,
    Compact,
    TitleOnly,
    Overflowed
};

QString toString(Region region);
QString toString(CardType type);
QString toString(DegradationState state);

int footprintCells(CardType type, int multiEventFootprint);
int detailRank(CardType type);
CardType cardTypeFor(DegradationState state);

struct ViewWindow
{
    double viewStart = 0.0;
    double viewEnd = 1.0;
};

struct Viewport
{
    double width = 0.0;
    double height = 0.0;
};

struct TimedEvent
{
    data::TimelineEvent event;
    qint64 timestamp = 0; // UTC milliseconds
    double x = 0.0;
};

struct PositionedCard
{
    QString id;
    QString groupId;
    Region side = Region::Above;
    CardType type = CardType::Full;
    int footprintCells = 0;
    int cellIndex = 0;
    QStringList eventIds;
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
};

bool operator==(const PositionedCard &lhs, const PositionedCard &rhs);
bool operator!=(const PositionedCard &lhs, const PositionedCard &rhs);

struct ColumnGroup
{
    QString id;
    Region side = Region::Above;
    double startX = 0.0;
    double endX = 0.0;
    double centerX = 0.0;
    qint64 anchorTime = 0;
    double anchorX = 0.0;
    std::vector<TimedEvent> events;
    int capacity = 0;
    int usedCells = 0;
    DegradationState state = DegradationState::Full;
    std::optional<DegradationState> preferredState;
    bool promoted = false;
    std::vector<PositionedCard> cards;
    std::vector<TimedEvent> overflowEvents;
};

struct Anchor
{
    QString id;
    QString groupId;
    Region side = Region::Above;
    QDateTime time;
    double x = 0.0;
    double y = 0.0;
    QStringList eventIds;
    int visibleCount = 0;
    int overflowCount = 0;
};

// Pairing of an above and a below column whose spans overlap. Descriptive only.
struct SpatialCluster
{
    QString id;
    QString aboveGroupId;
    QString belowGroupId;
    double startX = 0.0;
    double endX = 0.0;
};

} // namespace layout
} // namespace timeline
