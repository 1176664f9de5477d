#pragma once

#include <QObject>
#include <QTimer>
#include <optional>

#include "timeline/layout/LayoutEngine.hpp"

namespace timeline {
namespace data {
class EventRepository;
}

namespace ui {

// Requests within one event-loop turn collapse into a single layout pass.
class LayoutViewModel : public QObject
{
    Q_OBJECT

public:
    LayoutViewModel(data::EventRepository &repository,
                    const layout::LayoutConfig &config = layout::LayoutConfig(),
                    QObject *parent = nullptr);

    void setViewWindow(const layout::ViewWindow &window);
    void setViewport(const layout::Viewport &viewport);
    void setConfig(const layout::LayoutConfig &config);

    void zoom(double factor, double focus = 0.5);
    void pan(double fraction);

    const layout::ViewWindow &viewWindow() const { return m_window; }
    const layout::Viewport &viewport() const { return m_viewport; }
    const layout::LayoutConfig &config() const { return m_session.config(); }

    // Schedules a pass on the next event-loop turn.
    void requestLayout();
    // Runs a pass immediately, dropping any pending request.
    void refresh();

    bool hasResult() const { return m_result.has_value(); }
    const layout::LayoutResult &result() const;

signals:
    void layoutChanged();
    void layoutRejected();

private:
    data::EventRepository &m_repository;
    layout::LayoutSession m_session;
    layout::ViewWindow m_window;
    layout::Viewport m_viewport;
    std::optional<layout::LayoutResult> m_result;
    layout::LayoutResult m_empty;
    QTimer m_pending;
};

} // namespace ui
} // namespace timeline
