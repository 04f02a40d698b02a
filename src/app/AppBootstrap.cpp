#include "app/AppBootstrap.h"

#include "api/XTSInteractiveClient.h"
#include "api/XTSMarketDataClient.h"
#include "app/ConsolePrompt.h"
#include "repository/MasterFileParser.h"
#include "services/StrangleService.h"
#include "utils/ConfigLoader.h"
#include "utils/FileLogger.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>
#include <cstdio>

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

AppBootstrap::AppBootstrap(QCoreApplication *app)
    : m_app(app)
{
}

AppBootstrap::~AppBootstrap()
{
    cleanup();
}

// ═══════════════════════════════════════════════════════════════════════════
// Main entry point
// ═══════════════════════════════════════════════════════════════════════════

int AppBootstrap::run()
{
    fprintf(stderr, "[Bootstrap] Starting StrangleSeller...\n");
    fflush(stderr);

    if (!loadConfiguration())
        return 1;
    setupFileLogging();

    if (!loadStrategy())
        return 1;
    if (!loginToXTS())
        return 1;
    if (!loadInstrumentUniverse())
        return 1;

    runOrderQueue();

    cleanup();
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration loading
// ═══════════════════════════════════════════════════════════════════════════

bool AppBootstrap::loadConfiguration()
{
    m_config = std::make_unique<ConfigLoader>();

    QStringList candidates;
    const QStringList args = m_app->arguments();
    if (args.size() > 1) {
        // Explicit path only, no fallback
        candidates << args.at(1);
    } else {
        QString appDir = QCoreApplication::applicationDirPath();
        candidates << QDir::current().filePath("config.ini");
        candidates << QDir(appDir).filePath("config.ini");
        candidates << QDir(appDir).filePath("../configs/config.ini");
        candidates << QDir::current().filePath("configs/config.ini");
    }

    for (const QString &candidate : candidates) {
        QFileInfo info(candidate);
        if (info.exists() && info.isFile() && m_config->load(info.absoluteFilePath())) {
            m_configPath = info.absoluteFilePath();
            fprintf(stderr, "[Bootstrap] Config loaded: %s\n", qPrintable(m_configPath));
            fflush(stderr);
            return true;
        }
    }

    fprintf(stderr, "[Bootstrap] No usable config.ini, tried:\n");
    for (const QString &candidate : candidates)
        fprintf(stderr, "  %s\n", qPrintable(candidate));
    fflush(stderr);
    return false;
}

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════

void AppBootstrap::setupFileLogging()
{
    QString logPath = FileLogger::setup(m_config->getLogDirectory(),
                                        m_config->getDebugLogging());
    if (logPath.isEmpty())
        qWarning() << "[Bootstrap] File logging unavailable, console only";
    else
        qInfo() << "[Bootstrap] Logging to" << logPath;
}

// ═══════════════════════════════════════════════════════════════════════════
// Strategy settings
// ═══════════════════════════════════════════════════════════════════════════

bool AppBootstrap::loadStrategy()
{
    m_strategy = StrategyConfig::fromConfig(*m_config);

    QString error;
    if (!m_strategy.isValid(&error)) {
        qCritical() << "[Bootstrap] Invalid [STRATEGY] settings:" << error;
        return false;
    }

    qInfo() << "[Bootstrap] Underlying" << m_strategy.underlying
            << "reference" << m_strategy.underlyingExchange << m_strategy.underlyingSymbol
            << "window" << m_strategy.strikeWindow
            << "tolerance" << m_strategy.priceTolerance
            << "similarity" << m_strategy.similarityTolerance
            << "SL fraction" << m_strategy.stopLossFraction
            << "lots" << m_strategy.lotMultiplier;
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// XTS login
// ═══════════════════════════════════════════════════════════════════════════

bool AppBootstrap::loginToXTS()
{
    QString mdUrl = m_config->getXTSMDUrl();
    QString iaUrl = m_config->getXTSUrl();
    if (mdUrl.isEmpty() || iaUrl.isEmpty()) {
        qCritical() << "[Bootstrap] [XTS] url and mdurl must be set";
        return false;
    }

    m_marketData = std::make_unique<XTSMarketDataClient>(
        mdUrl, m_config->getMarketDataAppKey(), m_config->getMarketDataSecretKey(),
        m_config->getSource());
    m_interactive = std::make_unique<XTSInteractiveClient>(
        iaUrl, m_config->getInteractiveAppKey(), m_config->getInteractiveSecretKey(),
        m_config->getSource());

    bool ok = true;
    m_marketData->login([&ok](bool success, const QString &message) {
        if (!success) {
            qCritical() << "[Bootstrap]" << message;
            ok = false;
        }
    });
    if (!ok)
        return false;

    m_interactive->login([&ok](bool success, const QString &message) {
        if (!success) {
            qCritical() << "[Bootstrap]" << message;
            ok = false;
        }
    });
    if (!ok)
        return false;

    m_interactive->setProductType(m_strategy.productType);
    m_marketData->registerSymbol(m_strategy.underlyingExchange,
                                 m_strategy.underlyingSymbol,
                                 m_strategy.underlyingInstrumentID);
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Instrument universe
// ═══════════════════════════════════════════════════════════════════════════

bool AppBootstrap::loadInstrumentUniverse()
{
    const QDate today = QDate::currentDate();
    QString error;

    if (!m_strategy.masterFile.isEmpty()) {
        qInfo() << "[Bootstrap] Loading master file" << m_strategy.masterFile;
        if (!m_universe.loadFromMasterFile(m_strategy.masterFile, m_strategy.underlying,
                                           today, &error)) {
            qCritical() << "[Bootstrap] Universe load failed:" << error;
            return false;
        }
    } else {
        qInfo() << "[Bootstrap] Downloading NSEFO master contracts";
        QString masterData;
        bool downloaded = false;
        m_marketData->downloadMasterContracts(
            QStringList() << "NSEFO",
            [&](bool success, const QString &data, const QString &message) {
                downloaded = success;
                if (success)
                    masterData = data;
                else
                    error = message;
            });
        if (!downloaded) {
            qCritical() << "[Bootstrap] Master download failed:" << error;
            return false;
        }

        int skipped = 0;
        QVector<ContractData> contracts = MasterFileParser::parseContent(masterData, &skipped);
        qInfo() << "[Bootstrap] Parsed" << contracts.size() << "option contracts, skipped"
                << skipped << "lines";
        if (!m_universe.build(contracts, m_strategy.underlying, today, 2, &error)) {
            qCritical() << "[Bootstrap] Universe build failed:" << error;
            return false;
        }
    }

    qInfo() << "[Bootstrap] Selected expiry" << m_universe.expiry().toString("ddMMMyyyy").toUpper()
            << "contracts" << m_universe.contracts().size()
            << "strike spacing" << m_universe.strikeSpacing();
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Order queue
// ═══════════════════════════════════════════════════════════════════════════

void AppBootstrap::runOrderQueue()
{
    m_service = std::make_unique<StrangleService>(m_universe, *m_marketData,
                                                  *m_interactive, m_strategy);

    QTextStream in(stdin);
    QTextStream out(stdout);
    ConsolePrompt prompt(*m_service, in, out);
    m_service->setEventSink(prompt.eventSink());

    out << QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss") << "\n"
        << "Selected option chain -> " << m_strategy.underlying << "\n"
        << "Selected expiry -> " << m_universe.expiry().toString("yyyy-MM-dd") << "\n"
        << "refreshing data...\n";
    out.flush();

    QFuture<SnapshotRefreshResult> refresh = m_service->refreshSnapshotAsync();
    refresh.waitForFinished();
    SnapshotRefreshResult startup = refresh.result();
    if (startup.success)
        prompt.printSnapshot(startup.snapshot);
    else
        qWarning() << "[Bootstrap] Startup refresh failed, jobs refresh on their own:"
                   << startup.error;

    prompt.run();

    int pending = m_service->pendingJobs();
    if (pending > 0)
        qInfo() << "[Bootstrap] Waiting for" << pending << "queued order(s)";
    m_service->waitForAll();
    m_service->setEventSink(nullptr);
    qInfo() << "[Bootstrap] All queued orders finished";
}

// ═══════════════════════════════════════════════════════════════════════════
// Cleanup
// ═══════════════════════════════════════════════════════════════════════════

void AppBootstrap::cleanup()
{
    // Service first: its destructor joins job threads using the clients
    m_service.reset();
    m_interactive.reset();
    m_marketData.reset();
    FileLogger::cleanup();
}
