#pragma once

#include "core/engine/growth_engine.h"
#include "core/ipc/service_base.h"

#include <QMutex>
#include <QTimer>

#include <atomic>
#include <memory>
#include <thread>

namespace ge {

// GrowthService -- the growth engine behind the local socket.
//
// Requests are handled on the event loop thread through one GrowthEngine.
// The scheduled showcase job (reconcile, then rank) runs on a worker
// thread that opens its own engine on the same ledger file.
class GrowthService : public ServiceBase {
    Q_OBJECT
public:
    explicit GrowthService(const EngineConfig& config, Clock clock = systemClock(),
                           QObject* parent = nullptr);
    ~GrowthService() override;

    // Open the ledger and arm the showcase timer. Must succeed before run().
    bool initialize(EngineError* error = nullptr);

    QJsonObject handleRequest(const QJsonObject& request) override;

    // Start the showcase job unless one is in flight. Returns false when
    // a job is already running.
    bool startShowcaseJob();
    bool showcaseJobRunning() const { return m_jobRunning.load(); }
    void waitForShowcaseJob();

    GrowthEngine* engine() const { return m_engine.get(); }

private:
    QJsonObject handleRegisterSite(uint64_t id, const QJsonObject& params);
    QJsonObject handleRetireSite(uint64_t id, const QJsonObject& params);
    QJsonObject handleSetUserTier(uint64_t id, const QJsonObject& params);
    QJsonObject handleRecordShare(uint64_t id, const QJsonObject& params);
    QJsonObject handleRecordPageview(uint64_t id, const QJsonObject& params);
    QJsonObject handleRecordReferralConversion(uint64_t id, const QJsonObject& params);
    QJsonObject handleUpdateReferralStatus(uint64_t id, const QJsonObject& params);
    QJsonObject handleSettlePeriod(uint64_t id, const QJsonObject& params);
    QJsonObject handleReverseCommission(uint64_t id, const QJsonObject& params);
    QJsonObject handleClaimCommissions(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetScore(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetSite(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetShowcase(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetCommissionSummary(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetMilestoneStatus(uint64_t id, const QJsonObject& params);
    QJsonObject handleRunShowcase(uint64_t id, const QJsonObject& params);
    QJsonObject handleReconcile(uint64_t id);

    void runShowcaseJob();
    QJsonObject jobStatusJson() const;
    void joinJobThreadIfNeeded();
    void broadcastNotification(const GrowthNotification& notification);

    EngineConfig m_config;
    Clock m_clock;
    std::unique_ptr<GrowthEngine> m_engine;
    QTimer* m_showcaseTimer = nullptr;

    std::atomic<bool> m_jobRunning{false};
    std::atomic<qint64> m_jobStartedAtMs{0};
    std::atomic<qint64> m_jobFinishedAtMs{0};
    std::thread m_jobThread;
    mutable QMutex m_jobMutex;
    QJsonObject m_lastJobResult;
};

} // namespace ge
