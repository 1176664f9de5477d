#pragma once

#include <memory>

#include "timeline/layout/LayoutConfig.hpp"

namespace timeline {
namespace data {
class DataProvider;
class EventRepository;
}

namespace core {

class AppContext
{
public:
    AppContext();
    ~AppContext();

    data::EventRepository &eventRepository();

    const layout::LayoutConfig &layoutConfig() const;
    void setLayoutConfig(const layout::LayoutConfig &config);

private:
    std::unique_ptr<data::DataProvider> m_dataProvider;
    layout::LayoutConfig m_layoutConfig;
};

} // namespace core
} // namespace timeline
