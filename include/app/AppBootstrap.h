#ifndef APPBOOTSTRAP_H
#define APPBOOTSTRAP_H

#include "repository/InstrumentUniverse.h"
#include "services/StrategyConfig.h"
#include <QString>
#include <memory>

class QCoreApplication;
class ConfigLoader;
class XTSMarketDataClient;
class XTSInteractiveClient;
class StrangleService;

/**
 * @brief Console application startup controller
 *
 * Orchestrates the startup sequence:
 *   1. Load config.ini (path from the first argument, else search)
 *   2. Initialize file logging
 *   3. Log in to XTS market data and interactive APIs
 *   4. Load the option universe (master file or download)
 *   5. Refresh the snapshot once and show it
 *   6. Run the order queue prompt, then wait for armed jobs
 */
class AppBootstrap {
public:
    explicit AppBootstrap(QCoreApplication *app);
    ~AppBootstrap();

    /**
     * @brief Run the full sequence.
     * @return Process exit code (0 when every armed job has finished)
     */
    int run();

private:
    // ── Bootstrap phases ─────────────────────────────────────────────────
    bool loadConfiguration();
    void setupFileLogging();
    bool loadStrategy();
    bool loginToXTS();
    bool loadInstrumentUniverse();
    void runOrderQueue();

    void cleanup();

    // ── Members ──────────────────────────────────────────────────────────
    QCoreApplication *m_app;
    std::unique_ptr<ConfigLoader> m_config;
    QString           m_configPath;
    StrategyConfig    m_strategy;
    InstrumentUniverse m_universe;

    std::unique_ptr<XTSMarketDataClient>  m_marketData;
    std::unique_ptr<XTSInteractiveClient> m_interactive;
    std::unique_ptr<StrangleService>      m_service;
};

#endif // APPBOOTSTRAP_H
