#pragma once

#include <QColor>
#include <QHash>
#include <QPoint>
#include <QString>
#include <QWidget>
#include <optional>

#include "timeline/layout/Types.hpp"

namespace timeline {
namespace ui {

class LayoutViewModel;

class TimelineView : public QWidget
{
    Q_OBJECT

public:
    explicit TimelineView(LayoutViewModel &viewModel, QWidget *parent = nullptr);
    ~TimelineView() override;

signals:
    void cardActivated(const QString &cardId);

protected:
    void paintEvent(QPaintEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;
    void wheelEvent(QWheelEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    bool event(QEvent *event) override;

private:
    void rebuildTitles();
    const layout::PositionedCard *cardAt(const QPointF &pos) const;
    QString cardLabel(const layout::PositionedCard &card) const;
    QColor cardColor(layout::CardType type) const;

    LayoutViewModel &m_viewModel;
    QHash<QString, QString> m_titles;
    std::optional<QPoint> m_dragOrigin;
    bool m_dragged = false;
};

} // namespace ui
} // namespace timeline
