#include "timeline/core/AppContext.hpp"

#include "timeline/core/LayoutSettings.hpp"
#include "timeline/data/DataProvider.hpp"

#include <QSettings>

namespace timeline {
namespace core {

AppContext::AppContext()
    : m_dataProvider(std::make_unique<data::DataProvider>())
{
    QSettings settings;
    m_layoutConfig = LayoutSettings::load(settings);
}

AppContext::~AppContext() = default;

data::EventRepository &AppContext::eventRepository()
{
    return m_dataProvider->eventRepository();
}

const layout::LayoutConfig &AppContext::layoutConfig() const
{
    return m_layoutConfig;
}

void AppContext::setLayoutConfig(const layout::LayoutConfig &config)
{
    m_layoutConfig = config;
    QSettings settings;
    LayoutSettings::save(settings, m_layoutConfig);
}

} // namespace core
} // namespace timeline
