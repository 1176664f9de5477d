#include <QApplication>
#include <QCoreApplication>
#include <QString>

#include "version.h"

#include "timeline/core/AppContext.hpp"
#include "timeline/core/Logging.hpp"
#include "timeline/ui/LayoutViewModel.hpp"
#include "timeline/ui/TimelineView.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Timeline Layout"));
    QCoreApplication::setApplicationName(QStringLiteral("Timeline Viewer"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTimelineLayoutVersion));

    QApplication app(argc, argv);

    timeline::core::AppContext context;
    timeline::ui::LayoutViewModel viewModel(context.eventRepository(), context.layoutConfig());
    QObject::connect(&viewModel, &timeline::ui::LayoutViewModel::layoutChanged, [&viewModel]() {
        const auto &telemetry = viewModel.result().telemetry;
        qCDebug(lcUi) << "telemetry" << telemetry.toJson();
    });

    timeline::ui::TimelineView view(viewModel);
    view.setWindowTitle(QObject::tr("Timeline Viewer %1").arg(QString::fromLatin1(kTimelineLayoutVersion)));
    QObject::connect(&view, &timeline::ui::TimelineView::cardActivated, [](const QString &cardId) {
        qCInfo(lcUi) << "card activated" << cardId;
    });
    view.resize(1280, 720);
    view.show();

    return app.exec();
}
