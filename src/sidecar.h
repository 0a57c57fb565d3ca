#pragma once
#include "core.h"
#include <QMap>

namespace tsm {

// ── Sidecar ──
//
// Persisted per-page overlay of user edits, layered over fresh extraction on
// every run. Canonical file shape:
//
//   { "document": {"title", "language", "tagged"},
//     "pages": { "<page>": { "elements": [ {"id", "role", "bbox"?, "text"?,
//                                           "properties"?} ] } } }
//
// fromJson() also accepts the older shapes (pages as an array, elements keyed
// by id, role kept inside properties, loose title/alt_text/actual_text/language
// keys) and normalizes them here; nothing downstream sees raw JSON.

class Sidecar {
public:
    DocumentInfo                         document;
    QMap<int, QVector<SidecarOverride>>  pages;

    // Empty sidecar with one element list per page.
    static Sidecar forPageCount(int pageCount);

    static Sidecar fromJson(const QJsonObject& o, Diagnostics* diags = nullptr);
    QJsonObject toJson() const;

    bool load(const QString& path, QString* error = nullptr, Diagnostics* diags = nullptr);
    bool save(const QString& path, QString* error = nullptr) const;

    // "<dir>/<stem>_sidecar.json" next to the document.
    static QString defaultPathFor(const QString& documentPath);

    QVector<SidecarOverride> overridesForPage(int page) const { return pages.value(page); }
    const SidecarOverride*   findOverride(int page, const QString& id) const;

    // Records a user edit. "role" and "bbox" keys are lifted into the
    // matching fields; the rest merge into properties. An unknown id on a
    // known page is appended. Returns false when the page has no entry.
    bool updateElement(int page, const QString& id, const QJsonObject& properties);

    int elementCount() const;
};

// Parses one raw element entry. Returns false (and leaves out untouched) when
// the entry has no usable id.
bool overrideFromJson(const QJsonValue& v, const QString& fallbackId, SidecarOverride* out);

} // namespace tsm
