#include "growth_service.h"
#include "core/shared/config_manager.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDir>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("growthengine-service"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    ge::EngineError error;
    std::optional<ge::EngineConfig> config = ge::ConfigManager::load(&error);
    if (!config.has_value()) {
        LOG_ERROR(geCore, "Invalid configuration: %s", qPrintable(error.message));
        return 2;
    }
    if (config->dbPath.isEmpty()) {
        const QString dataDir = ge::ServiceBase::dataDirectory();
        QDir().mkpath(dataDir);
        config->dbPath = dataDir + QStringLiteral("/ledger.db");
    }

    ge::GrowthService service(*config);
    if (!service.initialize(&error)) {
        LOG_ERROR(geCore, "Growth service failed to initialize: %s", qPrintable(error.message));
        return 1;
    }
    return service.run();
}
