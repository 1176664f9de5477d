#include "timeline/ui/LayoutViewModel.hpp"

#include "timeline/core/Logging.hpp"
#include "timeline/data/EventRepository.hpp"

#include <cmath>

namespace timeline {
namespace ui {

namespace {
constexpr double MinimumSpan = 0.001;
}

LayoutViewModel::LayoutViewModel(data::EventRepository &repository,
                                 const layout::LayoutConfig &config,
                                 QObject *parent)
    : QObject(parent)
    , m_repository(repository)
    , m_session(config)
{
    m_pending.setSingleShot(true);
    m_pending.setInterval(0);
    connect(&m_pending, &QTimer::timeout, this, &LayoutViewModel::refresh);
}

void LayoutViewModel::setViewWindow(const layout::ViewWindow &window)
{
    m_window = layout::TimeMapper::sanitizeWindow(window);
    requestLayout();
}

void LayoutViewModel::setViewport(const layout::Viewport &viewport)
{
    m_viewport = viewport;
    requestLayout();
}

void LayoutViewModel::setConfig(const layout::LayoutConfig &config)
{
    m_session.setConfig(config);
    requestLayout();
}

void LayoutViewModel::zoom(double factor, double focus)
{
    if (!std::isfinite(factor) || factor <= 0.0 || !std::isfinite(focus)) {
        return;
    }
    const double span = m_window.viewEnd - m_window.viewStart;
    const double pivot = m_window.viewStart + span * qBound(0.0, focus, 1.0);
    const double newSpan = qBound(MinimumSpan, span * factor, 1.0);
    double start = pivot - (pivot - m_window.viewStart) * (newSpan / qMax(span, MinimumSpan));
    start = qBound(0.0, start, 1.0 - newSpan);
    setViewWindow({ start, start + newSpan });
}

void LayoutViewModel::pan(double fraction)
{
    if (!std::isfinite(fraction)) {
        return;
    }
    const double span = m_window.viewEnd - m_window.viewStart;
    const double start = qBound(0.0, m_window.viewStart + span * fraction, 1.0 - span);
    setViewWindow({ start, start + span });
}

void LayoutViewModel::requestLayout()
{
    if (!m_pending.isActive()) {
        m_pending.start();
    }
}

void LayoutViewModel::refresh()
{
    m_pending.stop();
    auto result = m_session.layout(m_repository.snapshot(), m_window, m_viewport);
    if (!result) {
        qCDebug(lcUi) << "layout pass rejected, keeping previous result";
        emit layoutRejected();
        return;
    }
    m_result = std::move(result);
    emit layoutChanged();
}

const layout::LayoutResult &LayoutViewModel::result() const
{
    return m_result ? *m_result : m_empty;
}

} // namespace ui
} // namespace timeline
