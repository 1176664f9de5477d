#pragma once

#include <vector>

#include "timeline/layout/TimeMapper.hpp"
#include "timeline/layout/Types.hpp"

namespace timeline {
namespace layout {

class AnchorPositioner
{
public:
    AnchorPositioner(const TimeMapper &mapper, double timelineY);

    static qint64 temporalMidpoint(const std::vector<TimedEvent> &events);

    ColumnGroup position(ColumnGroup group) const;
    Anchor anchorFor(const ColumnGroup &group) const;

private:
    TimeMapper m_mapper;
    double m_timelineY = 0.0;
};

} // namespace layout
} // namespace timeline
