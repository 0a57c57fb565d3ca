#include "report.h"
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSet>
#include <algorithm>

namespace tsm {

QJsonObject mcidMapToJson(const QHash<QString, QVector<ContentRef>>& map) {
    // Sorted keys keep the output stable across runs
    QStringList ids = map.keys();
    std::sort(ids.begin(), ids.end());

    QJsonObject o;
    for (const QString& id : ids) {
        QJsonArray refs;
        for (const ContentRef& r : map.value(id)) {
            QJsonObject ref;
            ref["Pg"]   = r.page;
            ref["MCID"] = r.mcid;
            refs.append(ref);
        }
        o[id] = refs;
    }
    return o;
}

QJsonObject buildReport(const SessionResult& session, const ReportInput& input) {
    QJsonObject info;
    info["generated_at"] = input.generatedAt.toString(Qt::ISODate);
    info["tool_name"]    = QStringLiteral("tagsmith");
    info["source_file"]  = QFileInfo(input.sourceFile).fileName();
    info["export_file"]  = input.exportFile.isEmpty()
        ? QStringLiteral("N/A") : QFileInfo(input.exportFile).fileName();

    QJsonObject meta;
    meta["title"]       = session.info.title.isEmpty() ? QStringLiteral("Not set") : session.info.title;
    meta["language"]    = session.info.language.isEmpty() ? QStringLiteral("Not set") : session.info.language;
    meta["marked_flag"] = session.marked;
    meta["accessibility_flags_set"] = session.info.tagged;

    QJsonArray details;
    QSet<int> pages;
    for (const auto& m : session.modifications) {
        QJsonObject d;
        d["page"]        = m.page;
        d["id"]          = m.elementId;
        d["role"]        = m.role;
        d["synthesized"] = m.synthesized;
        if (m.nodeId) d["node"] = QString::number(m.nodeId);
        if (!m.properties.isEmpty()) d["properties"] = m.properties;
        details.append(d);
        pages.insert(m.page);
    }
    QJsonObject mods;
    mods["total_elements_modified"] = session.modifications.size();
    mods["pages_with_changes"]      = pages.size();
    mods["details"]                 = details;

    int mcids = 0;
    for (const auto& refs : session.mcidMap)
        mcids += refs.size();

    QJsonObject sess;
    sess["ok"]         = session.ok;
    sess["cancelled"]  = session.cancelled;
    if (!session.error.isEmpty()) sess["error"] = session.error;
    sess["counters"]   = session.counters.toJson();
    sess["mcid_count"] = mcids;

    QJsonObject diags;
    diags["total"]    = session.diagnostics.size();
    diags["errors"]   = countSeverity(session.diagnostics, Severity::Error);
    diags["warnings"] = countSeverity(session.diagnostics, Severity::Warning);
    diags["issues"]   = diagnosticsToJson(session.diagnostics);

    QJsonObject o;
    o["report_info"]           = info;
    o["metadata_changes"]      = meta;
    o["element_modifications"] = mods;
    o["session"]               = sess;
    o["diagnostics"]           = diags;
    return o;
}

bool writeJsonFile(const QString& path, const QJsonObject& o, QString* error) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (error) *error = QStringLiteral("cannot write %1: %2").arg(path, file.errorString());
        return false;
    }
    QByteArray bytes = QJsonDocument(o).toJson(QJsonDocument::Indented);
    if (file.write(bytes) != bytes.size()) {
        if (error) *error = QStringLiteral("short write to %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}

} // namespace tsm
