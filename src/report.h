#pragma once
#include "engine.h"
#include <QDateTime>

namespace tsm {

// element id -> [{"Pg", "MCID"}, ...]
QJsonObject mcidMapToJson(const QHash<QString, QVector<ContentRef>>& map);

// ── Remediation report ──
//
//   { "report_info":           {generated_at, tool_name, source_file, export_file},
//     "metadata_changes":      {title, language, marked_flag, accessibility_flags_set},
//     "element_modifications": {total_elements_modified, pages_with_changes, details[]},
//     "session":               {ok, cancelled, error?, counters, mcid_count},
//     "diagnostics":           {total, errors, warnings, issues[]} }

struct ReportInput {
    QString   sourceFile;               // base names only
    QString   exportFile;
    QDateTime generatedAt = QDateTime::currentDateTime();
};

QJsonObject buildReport(const SessionResult& session, const ReportInput& input);

bool writeJsonFile(const QString& path, const QJsonObject& o, QString* error = nullptr);

} // namespace tsm
