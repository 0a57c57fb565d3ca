#pragma once
#include <QString>

class QSettings;

namespace tsm {

struct EngineOptions {
    bool    correlate             = true;
    bool    contentStreamFallback = true;
    bool    skipEmptyText         = true;
    int     actualTextLimit       = 100;
    bool    markTagged            = true;
    QString defaultLanguage       = QStringLiteral("en-US");

    // Keys live under the "engine" group; missing keys keep their defaults.
    static EngineOptions fromSettings(QSettings& settings);
    void toSettings(QSettings& settings) const;

    // Reads an INI file. A missing file yields the defaults.
    static EngineOptions fromIniFile(const QString& path);
};

} // namespace tsm
