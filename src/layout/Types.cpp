#include "timeline/layout/Types.hpp"

namespace timeline {
namespace layout {

QString toString(Region region)
{
    switch (region) {
    case Region::Above:
        return QStringLiteral("above");
    case Region::Below:
        return QStringLiteral("below");
    }
    return QString();
}

QString toString(CardType type)
{
    switch (type) {
    case CardType::Full:
        return QStringLiteral("full");
    case CardType::Compact:
        return QStringLiteral("compact");
    case CardType::TitleOnly:
        return QStringLiteral("title-only");
    case CardType::MultiEvent:
        return QStringLiteral("multi-event");
    }
    return QString();
}

QString toString(DegradationState state)
{
    switch (state) {
    case DegradationState::Full:
        return QStringLiteral("full");
    case DegradationState::Compact:
        return QStringLiteral("compact");
    case DegradationState::TitleOnly:
        return QStringLiteral("title-only");
    case DegradationState::Overflowed:
        return QStringLiteral("overflowed");
    }
    return QString();
}

int footprintCells(CardType type, int multiEventFootprint)
{
    switch (type) {
    case CardType::Full:
        return 4;
    case CardType::Compact:
        return 2;
    case CardType::TitleOnly:
        return 1;
    case CardType::MultiEvent:
        return multiEventFootprint;
    }
    return 0;
}

int detailRank(CardType type)
{
    switch (type) {
    case CardType::Full:
        return 3;
    case CardType::Compact:
        return 2;
    case CardType::TitleOnly:
        return 1;
    case CardType::MultiEvent:
        return 0;
    }
    return 0;
}

CardType cardTypeFor(DegradationState state)
{
    switch (state) {
    case DegradationState::Full:
        return CardType::Full;
    case DegradationState::Compact:
        return CardType::Compact;
    case DegradationState::TitleOnly:
    case DegradationState::Overflowed:
        return CardType::TitleOnly;
    }
    return CardType::TitleOnly;
}

bool operator==(const PositionedCard &lhs, const PositionedCard &rhs)
{
    return lhs.id == rhs.id
        && lhs.groupId == rhs.groupId
        && lhs.side == rhs.side
        && lhs.type == rhs.type
        && lhs.footprintCells == rhs.footprintCells
        && lhs.cellIndex == rhs.cellIndex
        && lhs.eventIds == rhs.eventIds
        && lhs.x == rhs.x
        && lhs.y == rhs.y
        && lhs.width == rhs.width
        && lhs.height == rhs.height;
}

bool operator!=(const PositionedCard &lhs, const PositionedCard &rhs)
{
    return !(lhs == rhs);
}

} // namespace layout
} // namespace timeline
