#include "utils/ConfigLoader.h"
#include <QDebug>
#include <QFile>
#include <QTextStream>

ConfigLoader::ConfigLoader()
    : m_loaded(false)
{
}

ConfigLoader::~ConfigLoader()
{
}

bool ConfigLoader::load(const QString &filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "[Config] Failed to open config file:" << filePath;
        return false;
    }

    QTextStream in(&file);
    QString currentSection;

    while (!in.atEnd()) {
        parseLine(in.readLine(), currentSection);
    }

    file.close();
    m_loaded = true;

    qDebug() << "[Config] Configuration loaded from:" << filePath;
    qDebug() << "[Config] Sections found:" << m_config.keys();

    return true;
}

void ConfigLoader::loadFromString(const QString &content)
{
    QString currentSection;
    const QStringList lines = content.split('\n');
    for (const QString &line : lines) {
        parseLine(line, currentSection);
    }
    m_loaded = true;
}

void ConfigLoader::parseLine(const QString &rawLine, QString &currentSection)
{
    QString line = rawLine.trimmed();

    // Skip empty lines and comments
    if (line.isEmpty() || line.startsWith('#') || line.startsWith(';')) {
        return;
    }

    // Check for section header [SECTION]
    if (line.startsWith('[') && line.endsWith(']')) {
        currentSection = line.mid(1, line.length() - 2).trimmed();
        if (!m_config.contains(currentSection)) {
            m_config[currentSection] = QMap<QString, QString>();
        }
        return;
    }

    // Parse key = value pairs
    int equalPos = line.indexOf('=');
    if (equalPos > 0) {
        QString key = line.left(equalPos).trimmed();
        QString value = line.mid(equalPos + 1).trimmed();

        // Store in default section if no section defined yet
        if (currentSection.isEmpty()) {
            currentSection = "DEFAULT";
        }

        m_config[currentSection][key] = value;
    }
}

QString ConfigLoader::getValue(const QString &section, const QString &key, const QString &defaultValue) const
{
    if (m_config.contains(section) && m_config[section].contains(key)) {
        return m_config[section][key];
    }
    return defaultValue;
}

int ConfigLoader::getInt(const QString &section, const QString &key, int defaultValue) const
{
    QString value = getValue(section, key);
    if (!value.isEmpty()) {
        bool ok;
        int result = value.toInt(&ok);
        if (ok) return result;
        qWarning() << "[Config] Not an integer:" << section << key << value;
    }
    return defaultValue;
}

double ConfigLoader::getDouble(const QString &section, const QString &key, double defaultValue) const
{
    QString value = getValue(section, key);
    if (!value.isEmpty()) {
        bool ok;
        double result = value.toDouble(&ok);
        if (ok) return result;
        qWarning() << "[Config] Not a number:" << section << key << value;
    }
    return defaultValue;
}

bool ConfigLoader::getBool(const QString &section, const QString &key, bool defaultValue) const
{
    QString value = getValue(section, key).toLower();
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    } else if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    return defaultValue;
}

QString ConfigLoader::getMarketDataAppKey() const
{
    return getValue("CREDENTIALS", "marketdata_appkey");
}

QString ConfigLoader::getMarketDataSecretKey() const
{
    return getValue("CREDENTIALS", "marketdata_secretkey");
}

QString ConfigLoader::getInteractiveAppKey() const
{
    return getValue("CREDENTIALS", "interactive_appkey");
}

QString ConfigLoader::getInteractiveSecretKey() const
{
    return getValue("CREDENTIALS", "interactive_secretkey");
}

QString ConfigLoader::getSource() const
{
    return getValue("CREDENTIALS", "source", "WEBAPI");
}

QString ConfigLoader::getXTSUrl() const
{
    return getValue("XTS", "url");
}

QString ConfigLoader::getXTSMDUrl() const
{
    return getValue("XTS", "mdurl");
}

QString ConfigLoader::getLogDirectory() const
{
    return getValue("LOGGING", "directory", "logs");
}

bool ConfigLoader::getDebugLogging() const
{
    return getBool("LOGGING", "debug", false);
}
