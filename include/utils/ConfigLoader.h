#ifndef CONFIGLOADER_H
#define CONFIGLOADER_H

#include <QMap>
#include <QString>

/**
 * @brief INI configuration reader
 *
 * [SECTION] headers, key = value pairs, '#' and ';' comments. Keys before
 * the first section land in DEFAULT.
 */
class ConfigLoader
{
public:
    ConfigLoader();
    ~ConfigLoader();

    // Load configuration from file
    bool load(const QString &filePath);

    // Load configuration from INI text (used by tests and embedded defaults)
    void loadFromString(const QString &content);

    // Get configuration values
    QString getValue(const QString &section, const QString &key, const QString &defaultValue = "") const;
    int getInt(const QString &section, const QString &key, int defaultValue = 0) const;
    double getDouble(const QString &section, const QString &key, double defaultValue = 0.0) const;
    bool getBool(const QString &section, const QString &key, bool defaultValue = false) const;

    // Check if configuration is loaded
    bool isLoaded() const { return m_loaded; }

    // Credentials
    QString getMarketDataAppKey() const;
    QString getMarketDataSecretKey() const;
    QString getInteractiveAppKey() const;
    QString getInteractiveSecretKey() const;
    QString getSource() const;

    // XTS settings
    QString getXTSUrl() const;
    QString getXTSMDUrl() const;

    // Logging
    QString getLogDirectory() const;
    bool getDebugLogging() const;

private:
    bool m_loaded;
    QMap<QString, QMap<QString, QString>> m_config;

    void parseLine(const QString &rawLine, QString &currentSection);
};

#endif // CONFIGLOADER_H
