#pragma once
#include "core.h"
#include <QStringList>

namespace tsm {

class StructTree;

struct TableSpec {
    QString     title = QStringLiteral("Table");
    int         rows  = 1;
    int         cols  = 1;
    QStringList headers;
    bool        hasHeaderRow = false;

    static TableSpec fromJson(const QJsonObject& o);
};

struct ListSpec {
    QString     title    = QStringLiteral("List");
    QStringList items;
    QString     listType = QStringLiteral("unordered");   // "ordered" numbers the labels

    static ListSpec fromJson(const QJsonObject& o);
};

// ok is false only when the container node itself could not be created. A
// child that fails is skipped and reported in diagnostics.
struct CompositeResult {
    bool        ok      = false;
    uint64_t    id      = 0;
    int         created = 0;   // nodes created, container included
    int         failed  = 0;
    QString     error;
    Diagnostics diagnostics;
};

// Table -> TR per row -> TH (header row) / TD per column.
CompositeResult createTable(StructTree& tree, const TableSpec& spec);

// L -> LI per item -> Lbl ("1." / bullet) + LBody (item text).
CompositeResult createList(StructTree& tree, const ListSpec& spec);

} // namespace tsm
