#pragma once

#include "core/shared/engine_config.h"
#include "core/shared/engine_error.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace ge {

// ConfigManager -- JSON load/save and load-time validation of EngineConfig.
//
// The config file lives at $GROWTHENGINE_CONFIG when set, otherwise at
//   <GenericDataLocation>/growthengine/config.json
// Keys absent from the file keep their defaults.
class ConfigManager {
public:
    // Load and validate. A missing file yields the defaults; an unreadable
    // or invalid file yields nullopt with the reason in `error`.
    static std::optional<EngineConfig> load(EngineError* error = nullptr);
    static std::optional<EngineConfig> loadFromFile(const QString& filePath,
                                                    EngineError* error = nullptr);

    static bool save(const EngineConfig& config, const QString& filePath);

    static QString configFilePath();

    static QJsonObject toJson(const EngineConfig& config);
    static EngineConfig fromJson(const QJsonObject& json);

    // Reject business parameters that would break engine invariants
    // (non-monotonic commission schedule, non-positive thresholds, ...).
    static bool validate(const EngineConfig& config, EngineError* error = nullptr);
};

} // namespace ge
