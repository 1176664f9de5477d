#pragma once

#include "timeline/layout/LayoutConfig.hpp"

class QSettings;

namespace timeline {
namespace core {

// Persists layout tuning under the "layout/" group of a QSettings store.
class LayoutSettings
{
public:
    static layout::LayoutConfig load(QSettings &settings);
    static void save(QSettings &settings, const layout::LayoutConfig &config);
};

} // namespace core
} // namespace timeline
