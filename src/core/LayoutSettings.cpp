#include "timeline/core/LayoutSettings.hpp"

#include <QSettings>
#include <QString>
#include <cmath>

#include "timeline/core/Logging.hpp"

namespace timeline {
namespace core {

namespace {
double readDouble(QSettings &settings, const QString &key, double fallback, double minimum, double maximum)
{
    const QVariant value = settings.value(key);
    if (!value.isValid()) {
        return fallback;
    }
    bool ok = false;
    const double parsed = value.toDouble(&ok);
    if (!ok || !std::isfinite(parsed)) {
        qCWarning(lcData) << "ignoring invalid setting" << key << value;
        return fallback;
    }
    return qBound(minimum, parsed, maximum);
}

int readInt(QSettings &settings, const QString &key, int fallback, int minimum, int maximum)
{
    const QVariant value = settings.value(key);
    if (!value.isValid()) {
        return fallback;
    }
    bool ok = false;
    const int parsed = value.toInt(&ok);
    if (!ok) {
        qCWarning(lcData) << "ignoring invalid setting" << key << value;
        return fallback;
    }
    return qBound(minimum, parsed, maximum);
}
} // namespace

layout::LayoutConfig LayoutSettings::load(QSettings &settings)
{
    layout::LayoutConfig config;
    settings.beginGroup(QStringLiteral("layout"));
    config.cardWidth = readDouble(settings, QStringLiteral("cardWidth"), config.cardWidth, 40.0, 2000.0);
    config.titleOnlyHeight = readDouble(settings, QStringLiteral("titleOnlyHeight"), config.titleOnlyHeight, 8.0, 400.0);
    config.cardSpacing = readDouble(settings, QStringLiteral("cardSpacing"), config.cardSpacing, 0.0, 200.0);
    config.headerSafeZone = readDouble(settings, QStringLiteral("headerSafeZone"), config.headerSafeZone, 0.0, 1000.0);
    config.aboveTimelineMargin = readDouble(settings, QStringLiteral("aboveTimelineMargin"), config.aboveTimelineMargin, 0.0, 1000.0);
    config.belowTimelineMargin = readDouble(settings, QStringLiteral("belowTimelineMargin"), config.belowTimelineMargin, 0.0, 1000.0);
    config.leftMargin = readDouble(settings, QStringLiteral("leftMargin"), config.leftMargin, 0.0, 2000.0);
    config.rightMargin = readDouble(settings, QStringLiteral("rightMargin"), config.rightMargin, 0.0, 2000.0);
    config.minCellsPerRegion = readInt(settings, QStringLiteral("minCellsPerRegion"), config.minCellsPerRegion, 1, 64);
    config.maxCellsPerRegion = readInt(settings, QStringLiteral("maxCellsPerRegion"), config.maxCellsPerRegion,
                                       config.minCellsPerRegion, 64);
    config.minColumnWidth = readDouble(settings, QStringLiteral("minColumnWidth"), config.minColumnWidth, 1.0, 4000.0);
    config.proximityMergeThreshold = readDouble(settings, QStringLiteral("proximityMergeThreshold"),
                                                config.proximityMergeThreshold, 0.0, 1000.0);
    config.stabilityThreshold = readDouble(settings, QStringLiteral("stabilityThreshold"), config.stabilityThreshold, 0.0, 1000.0);
    config.promotionThreshold = readDouble(settings, QStringLiteral("promotionThreshold"), config.promotionThreshold, 0.0, 1.0);
    config.multiEventFootprint = readInt(settings, QStringLiteral("multiEventFootprint"), config.multiEventFootprint, 1, 16);
    config.multiEventCapacity = readInt(settings, QStringLiteral("multiEventCapacity"), config.multiEventCapacity, 2, 100);
    config.aggregationEnabled = settings.value(QStringLiteral("aggregationEnabled"), config.aggregationEnabled).toBool();
    settings.endGroup();
    return config;
}

void LayoutSettings::save(QSettings &settings, const layout::LayoutConfig &config)
{
    settings.beginGroup(QStringLiteral("layout"));
    settings.setValue(QStringLiteral("cardWidth"), config.cardWidth);
    settings.setValue(QStringLiteral("titleOnlyHeight"), config.titleOnlyHeight);
    settings.setValue(QStringLiteral("cardSpacing"), config.cardSpacing);
    settings.setValue(QStringLiteral("headerSafeZone"), config.headerSafeZone);
    settings.setValue(QStringLiteral("aboveTimelineMargin"), config.aboveTimelineMargin);
    settings.setValue(QStringLiteral("belowTimelineMargin"), config.belowTimelineMargin);
    settings.setValue(QStringLiteral("leftMargin"), config.leftMargin);
    settings.setValue(QStringLiteral("rightMargin"), config.rightMargin);
    settings.setValue(QStringLiteral("minCellsPerRegion"), config.minCellsPerRegion);
    settings.setValue(QStringLiteral("maxCellsPerRegion"), config.maxCellsPerRegion);
    settings.setValue(QStringLiteral("minColumnWidth"), config.minColumnWidth);
    settings.setValue(QStringLiteral("proximityMergeThreshold"), config.proximityMergeThreshold);
    settings.setValue(QStringLiteral("stabilityThreshold"), config.stabilityThreshold);
    settings.setValue(QStringLiteral("promotionThreshold"), config.promotionThreshold);
    settings.setValue(QStringLiteral("multiEventFootprint"), config.multiEventFootprint);
    settings.setValue(QStringLiteral("multiEventCapacity"), config.multiEventCapacity);
    settings.setValue(QStringLiteral("aggregationEnabled"), config.aggregationEnabled);
    settings.endGroup();
}

} // namespace core
} // namespace timeline
