#include "timeline/ui/TimelineView.hpp"

#include <QHelpEvent>
#include <QMouseEvent>
#include <QPaintEvent>
#include <QPainter>
#include <QResizeEvent>
#include <QToolTip>
#include <QWheelEvent>

#include "timeline/ui/LayoutViewModel.hpp"

namespace timeline {
namespace ui {

namespace {
constexpr double CardCornerRadius = 4.0;
constexpr double AnchorRadius = 4.0;
constexpr double BadgeRadius = 10.0;
constexpr double ZoomInFactor = 0.8;
constexpr double ZoomOutFactor = 1.25;
constexpr double WheelPanFraction = 0.1;
constexpr int DragThreshold = 4;
} // namespace

TimelineView::TimelineView(LayoutViewModel &viewModel, QWidget *parent)
    : QWidget(parent)
    , m_viewModel(viewModel)
{
    setMouseTracking(true);
    setMinimumSize(480, 320);
    connect(&m_viewModel, &LayoutViewModel::layoutChanged, this, [this]() {
        rebuildTitles();
        update();
    });
}

TimelineView::~TimelineView() = default;

void TimelineView::rebuildTitles()
{
    m_titles.clear();
    for (const auto &column : m_viewModel.result().columns) {
        for (const auto &timed : column.events) {
            m_titles.insert(timed.event.id, timed.event.title);
        }
    }
}

QString TimelineView::cardLabel(const layout::PositionedCard &card) const
{
    if (card.type == layout::CardType::MultiEvent) {
        return tr("%n events", nullptr, card.eventIds.size());
    }
    if (card.eventIds.isEmpty()) {
        return QString();
    }
    return m_titles.value(card.eventIds.front(), card.eventIds.front());
}

QColor TimelineView::cardColor(layout::CardType type) const
{
    QColor color = palette().highlight().color();
    switch (type) {
    case layout::CardType::Full:
        return color;
    case layout::CardType::Compact:
        return color.lighter(120);
    case layout::CardType::TitleOnly:
        return color.lighter(140);
    case layout::CardType::MultiEvent:
        return palette().mid().color();
    }
    return color;
}

void TimelineView::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);
    QPainter painter(this);
    painter.fillRect(rect(), palette().base());

    const layout::LayoutResult &result = m_viewModel.result();
    const layout::LayoutGeometry geometry(m_viewModel.config(), m_viewModel.viewport());
    const double axisY = geometry.timelineY();

    painter.setPen(palette().dark().color());
    painter.drawLine(QPointF(geometry.leftEdge(), axisY),
                     QPointF(geometry.leftEdge() + geometry.usableWidth(), axisY));

    painter.setRenderHint(QPainter::Antialiasing, true);
    for (const auto &card : result.cards) {
        const QRectF cardRect(card.x, card.y, card.width, card.height);
        const QColor color = cardColor(card.type);
        painter.setPen(color.darker(130));
        painter.setBrush(color);
        painter.drawRoundedRect(cardRect, CardCornerRadius, CardCornerRadius);

        painter.setPen(Qt::white);
        const QRectF textRect = cardRect.adjusted(6, 2, -6, -2);
        const int flags = card.type == layout::CardType::Full
            ? int(Qt::AlignLeft | Qt::AlignTop)
            : int(Qt::AlignLeft | Qt::AlignVCenter);
        painter.drawText(textRect, flags,
                         painter.fontMetrics().elidedText(cardLabel(card), Qt::ElideRight,
                                                          static_cast<int>(textRect.width())));
    }

    for (const auto &anchor : result.anchors) {
        const QPointF center(anchor.x, anchor.y);
        painter.setPen(palette().windowText().color());
        painter.setBrush(palette().windowText());
        painter.drawEllipse(center, AnchorRadius, AnchorRadius);
        if (anchor.overflowCount > 0) {
            const QRectF badge(center.x() + AnchorRadius, center.y() - BadgeRadius * 2,
                               BadgeRadius * 3, BadgeRadius * 2);
            painter.setBrush(palette().highlight());
            painter.setPen(Qt::NoPen);
            painter.drawRoundedRect(badge, BadgeRadius, BadgeRadius);
            painter.setPen(palette().highlightedText().color());
            painter.drawText(badge, Qt::AlignCenter, tr("+%1").arg(anchor.overflowCount));
        }
    }
}

void TimelineView::resizeEvent(QResizeEvent *event)
{
    QWidget::resizeEvent(event);
    m_viewModel.setViewport({ static_cast<double>(width()), static_cast<double>(height()) });
}

void TimelineView::wheelEvent(QWheelEvent *event)
{
    const QPoint angle = event->angleDelta();
    if (event->modifiers().testFlag(Qt::ControlModifier)) {
        if (angle.y() != 0) {
            const layout::LayoutGeometry geometry(m_viewModel.config(), m_viewModel.viewport());
            const double focus = geometry.usableWidth() > 0.0
                ? (event->posF().x() - geometry.leftEdge()) / geometry.usableWidth()
                : 0.5;
            m_viewModel.zoom(angle.y() > 0 ? ZoomInFactor : ZoomOutFactor, focus);
        }
        event->accept();
        return;
    }
    const int delta = angle.x() != 0 ? angle.x() : angle.y();
    if (delta != 0) {
        m_viewModel.pan(-static_cast<double>(delta) / 120.0 * WheelPanFraction);
        event->accept();
        return;
    }
    QWidget::wheelEvent(event);
}

void TimelineView::mousePressEvent(QMouseEvent *event)
{
    if (event->button() == Qt::LeftButton) {
        m_dragOrigin = event->pos();
        m_dragged = false;
        event->accept();
        return;
    }
    QWidget::mousePressEvent(event);
}

void TimelineView::mouseMoveEvent(QMouseEvent *event)
{
    if (!m_dragOrigin) {
        QWidget::mouseMoveEvent(event);
        return;
    }
    const int dx = event->pos().x() - m_dragOrigin->x();
    if (!m_dragged && qAbs(dx) < DragThreshold) {
        return;
    }
    m_dragged = true;
    const layout::LayoutGeometry geometry(m_viewModel.config(), m_viewModel.viewport());
    if (geometry.usableWidth() > 0.0) {
        m_viewModel.pan(-static_cast<double>(dx) / geometry.usableWidth());
    }
    m_dragOrigin = event->pos();
    event->accept();
}

void TimelineView::mouseReleaseEvent(QMouseEvent *event)
{
    if (event->button() == Qt::LeftButton && m_dragOrigin) {
        if (!m_dragged) {
            if (const auto *card = cardAt(event->pos())) {
                emit cardActivated(card->id);
            }
        }
        m_dragOrigin.reset();
        m_dragged = false;
        event->accept();
        return;
    }
    QWidget::mouseReleaseEvent(event);
}

bool TimelineView::event(QEvent *event)
{
    if (event->type() == QEvent::ToolTip) {
        auto *helpEvent = static_cast<QHelpEvent *>(event);
        if (const auto *card = cardAt(helpEvent->pos())) {
            QStringList lines;
            for (const auto &id : card->eventIds) {
                lines << m_titles.value(id, id);
            }
            QToolTip::showText(helpEvent->globalPos(), lines.join(QLatin1Char('\n')), this);
            return true;
        }
        QToolTip::hideText();
        event->ignore();
        return true;
    }
    return QWidget::event(event);
}

const layout::PositionedCard *TimelineView::cardAt(const QPointF &pos) const
{
    for (const auto &card : m_viewModel.result().cards) {
        if (QRectF(card.x, card.y, card.width, card.height).contains(pos)) {
            return &card;
        }
    }
    return nullptr;
}

} // namespace ui
} // namespace timeline
