#include "options.h"
#include <QDebug>
#include <QFileInfo>
#include <QSettings>

namespace tsm {

EngineOptions EngineOptions::fromSettings(QSettings& settings) {
    EngineOptions o;
    settings.beginGroup(QStringLiteral("engine"));
    o.correlate             = settings.value("correlate", o.correlate).toBool();
    o.contentStreamFallback = settings.value("contentStreamFallback", o.contentStreamFallback).toBool();
    o.skipEmptyText         = settings.value("skipEmptyText", o.skipEmptyText).toBool();
    o.actualTextLimit       = settings.value("actualTextLimit", o.actualTextLimit).toInt();
    o.markTagged            = settings.value("markTagged", o.markTagged).toBool();
    o.defaultLanguage       = settings.value("defaultLanguage", o.defaultLanguage).toString();
    settings.endGroup();

    if (o.actualTextLimit < 0) {
        qWarning() << "Options: actualTextLimit" << o.actualTextLimit << "is negative, using 0";
        o.actualTextLimit = 0;
    }
    return o;
}

void EngineOptions::toSettings(QSettings& settings) const {
    settings.beginGroup(QStringLiteral("engine"));
    settings.setValue("correlate", correlate);
    settings.setValue("contentStreamFallback", contentStreamFallback);
    settings.setValue("skipEmptyText", skipEmptyText);
    settings.setValue("actualTextLimit", actualTextLimit);
    settings.setValue("markTagged", markTagged);
    settings.setValue("defaultLanguage", defaultLanguage);
    settings.endGroup();
}

EngineOptions EngineOptions::fromIniFile(const QString& path) {
    if (!QFileInfo::exists(path)) {
        qWarning() << "Options: No config at" << path << "- using defaults";
        return {};
    }
    QSettings settings(path, QSettings::IniFormat);
    return fromSettings(settings);
}

} // namespace tsm
