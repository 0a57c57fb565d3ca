#include "composite.h"
#include "structtree.h"
#include <QDebug>
#include <algorithm>

namespace tsm {

namespace {

QStringList stringList(const QJsonValue& v) {
    QStringList out;
    for (const auto& item : v.toArray())
        out.append(item.toString());
    return out;
}

// Creates a node and hangs it under parent. Failures are recorded and the
// caller moves on.
uint64_t addChild(StructTree& tree, CompositeResult& res, uint64_t parent,
                  const QString& type, const StructAttrs& attrs) {
    NodeResult r = tree.createNode(type, attrs);
    if (!r.ok) {
        res.failed++;
        res.diagnostics.append({Severity::Warning, -1,
                                QStringLiteral("%1 '%2' skipped: %3").arg(type, attrs.title, r.error)});
        return 0;
    }
    res.created++;
    QString err;
    if (!tree.attach(parent, r.id, &err)) {
        res.failed++;
        res.diagnostics.append({Severity::Warning, -1,
                                QStringLiteral("%1 '%2' left at root: %3").arg(type, attrs.title, err)});
    }
    return r.id;
}

StructAttrs titled(const QString& title) {
    StructAttrs a;
    a.title = title;
    return a;
}

} // namespace

TableSpec TableSpec::fromJson(const QJsonObject& o) {
    TableSpec s;
    s.title        = o["title"].toString(s.title);
    s.rows         = o["rows"].toInt(s.rows);
    s.cols         = o["cols"].toInt(s.cols);
    s.headers      = stringList(o["headers"]);
    s.hasHeaderRow = o["has_header_row"].toBool(false);
    return s;
}

ListSpec ListSpec::fromJson(const QJsonObject& o) {
    ListSpec s;
    s.title    = o["title"].toString(s.title);
    s.items    = stringList(o["items"]);
    s.listType = o["list_type"].toString(s.listType);
    return s;
}

CompositeResult createTable(StructTree& tree, const TableSpec& spec) {
    CompositeResult res;
    const int rows = std::max(0, spec.rows);
    const int cols = std::max(0, spec.cols);

    NodeResult table = tree.createNode(QStringLiteral("Table"), titled(spec.title));
    if (!table.ok) {
        res.error = table.error;
        qWarning() << "Composite: Table" << spec.title << "not created:" << table.error;
        return res;
    }
    res.ok = true;
    res.id = table.id;
    res.created = 1;

    for (int r = 0; r < rows; r++) {
        const bool headerRow = spec.hasHeaderRow && r == 0;
        QString rowTitle = QStringLiteral("Row %1").arg(r + 1);
        if (headerRow) rowTitle += QStringLiteral(" (Header)");

        uint64_t row = addChild(tree, res, table.id, QStringLiteral("TR"), titled(rowTitle));
        if (!row) continue;

        for (int c = 0; c < cols; c++) {
            QString cellTitle = headerRow && c < spec.headers.size()
                ? spec.headers[c]
                : QStringLiteral("Cell %1,%2").arg(r + 1).arg(c + 1);
            addChild(tree, res, row, headerRow ? QStringLiteral("TH") : QStringLiteral("TD"),
                     titled(cellTitle));
        }
    }

    qDebug() << "Composite: Table" << spec.title << rows << "x" << cols
             << "-" << res.created << "node(s)," << res.failed << "failure(s)";
    return res;
}

CompositeResult createList(StructTree& tree, const ListSpec& spec) {
    CompositeResult res;
    const bool ordered = spec.listType == QLatin1String("ordered");

    NodeResult list = tree.createNode(QStringLiteral("L"), titled(spec.title));
    if (!list.ok) {
        res.error = list.error;
        qWarning() << "Composite: List" << spec.title << "not created:" << list.error;
        return res;
    }
    res.ok = true;
    res.id = list.id;
    res.created = 1;

    for (int i = 0; i < spec.items.size(); i++) {
        uint64_t item = addChild(tree, res, list.id, QStringLiteral("LI"),
                                 titled(QStringLiteral("Item %1").arg(i + 1)));
        if (!item) continue;

        QString label = ordered ? QStringLiteral("%1.").arg(i + 1) : QString(QChar(0x2022));
        addChild(tree, res, item, QStringLiteral("Lbl"), titled(label));

        StructAttrs body = titled(spec.items[i]);
        body.actualText = spec.items[i];
        addChild(tree, res, item, QStringLiteral("LBody"), body);
    }

    qDebug() << "Composite:" << (ordered ? "Ordered" : "Unordered") << "list" << spec.title
             << "-" << spec.items.size() << "item(s)," << res.failed << "failure(s)";
    return res;
}

} // namespace tsm
