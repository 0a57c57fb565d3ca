#include <QtTest/QTest>
#include <QTemporaryDir>
#include <QSettings>
#include <QJsonDocument>
#include "engine.h"
#include "document.h"
#include "options.h"
#include "report.h"
#include "sidecar.h"
#include "structtree.h"

using tsm::Engine;
using tsm::EngineOptions;
using tsm::MemoryDocument;
using tsm::Sidecar;

static QJsonObject parse(const char* json) {
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

static MemoryDocument reportDoc() {
    return MemoryDocument::fromJson(parse(R"({
        "pages": [
            {"blocks": [
                {"bbox": [72, 700, 300, 720], "text": "Annual Report"},
                {"bbox": [72, 650, 500, 690], "text": "Revenue grew 12 percent.",
                 "lines": [{"spans": [{"text": "Revenue grew", "bbox": [72, 670, 200, 690]},
                                      {"text": "12 percent.", "bbox": [200, 670, 300, 690]}]}]},
                {"bbox": [72, 600, 500, 640], "text": "   "}
             ],
             "images": [{"rects": [[100, 100, 300, 300]]}],
             "content": "BT (Annual Report) Tj (Revenue grew) Tj (12 percent.) Tj ET"},
            {"blocks": [{"bbox": [72, 700, 300, 720], "text": "Contact us"}],
             "content": "BT (Contact us) Tj ET"}
        ]
    })"));
}

static Sidecar reportSidecar() {
    return Sidecar::fromJson(parse(R"({
        "document": {"title": "Annual", "language": "en-GB"},
        "pages": {
            "0": {"elements": [
                {"id": "text_0_0", "role": "H1", "properties": {"title": "Document title"}},
                {"id": "image_0_0_0", "role": "Figure", "properties": {"alt_text": "Company logo"}}
            ]},
            "1": {"elements": [
                {"id": "table_1_0", "role": "Table",
                 "properties": {"title": "Offices", "rows": 2, "cols": 2,
                                "headers": ["City", "Phone"], "has_header_row": true}},
                {"id": "list_1_1", "role": "L",
                 "properties": {"items": ["a", "b"], "list_type": "ordered"}}
            ]}
        }
    })"));
}

class TestEngine : public QObject {
    Q_OBJECT
private slots:
    void fullSession() {
        MemoryDocument doc = reportDoc();
        Engine engine;
        auto res = engine.run(doc, reportSidecar());

        QVERIFY2(res.ok, qPrintable(res.error));
        QVERIFY(!res.cancelled);
        QVERIFY(!engine.isRunning());

        const auto& c = res.counters;
        QCOMPARE(c.pages, 2);
        QCOMPARE(c.elements, 7);
        QCOMPARE(c.patched, 2);
        QCOMPARE(c.synthesized, 2);
        QCOMPARE(c.skippedEmpty, 1);
        QCOMPARE(c.nodesCreated, 4);
        QCOMPARE(c.compositeNodes, (1 + 2 + 4) + (1 + 2 * 3));
        QCOMPARE(c.nodeFailures, 0);
        QCOMPARE(c.directMatches, 4);
        QCOMPARE(c.pagesSkipped, 0);

        // committed once, metadata applied
        QCOMPARE(doc.writeCount(), 1);
        QCOMPARE(doc.structTreeRoot().toObject(), res.structTree);
        QCOMPARE(doc.info().title, QString("Annual"));
        QCOMPARE(doc.info().language, QString("en-GB"));
        QVERIFY(doc.info().tagged);
        QVERIFY(doc.isMarked());

        const tsm::StructTree* tree = engine.tree();
        QVERIFY(tree);
        QCOMPARE(tree->rootKids().size(), 6);

        uint64_t h1 = res.nodeByElementId.value("text_0_0");
        QCOMPARE(tree->node(h1)->type, QString("H1"));
        QCOMPARE(tree->node(h1)->attrs.title, QString("Document title"));
        QCOMPARE(tree->node(h1)->attrs.actualText, QString("Annual Report"));

        uint64_t fig = res.nodeByElementId.value("image_0_0_0");
        QCOMPARE(tree->node(fig)->attrs.title, QString("Figure 0-3"));
        QCOMPARE(tree->node(fig)->attrs.altText, QString("Company logo"));

        uint64_t para = res.nodeByElementId.value("text_0_1");
        QCOMPARE(tree->node(para)->attrs.title, QString("Text block 0-1"));
        QCOMPARE(tree->contentRefs(para).size(), 2);
        QVERIFY(!res.nodeByElementId.contains("text_0_2"));

        uint64_t table = res.nodeByElementId.value("table_1_0");
        QCOMPARE(tree->node(table)->type, QString("Table"));
        QCOMPARE(tree->node(table)->attrs.title, QString("Offices"));
        QCOMPARE(tree->childNodes(table).size(), 2);
        uint64_t list = res.nodeByElementId.value("list_1_1");
        QCOMPARE(tree->node(list)->type, QString("L"));

        // id -> MCID map
        QCOMPARE(res.mcidMap.value("text_0_1").size(), 2);
        QCOMPARE(res.mcidMap.value("text_1_0").first(), (tsm::ContentRef{1, 3}));

        QCOMPARE(res.modifications.size(), 4);
        QVERIFY(!res.modifications[0].synthesized);
        QVERIFY(res.modifications[2].synthesized);
        QVERIFY(res.statusReport.contains("Structure Tree: Present"));
        QVERIFY(res.elementSummary.startsWith("Created"));
    }

    void checkpointsInOrder() {
        MemoryDocument doc = reportDoc();
        Engine engine;
        QVector<tsm::Progress> seen;
        auto res = engine.run(doc, reportSidecar(), [&](const tsm::Progress& p) {
            seen.append(p);
            return true;
        });
        QVERIFY(res.ok);

        QCOMPARE(seen.size(), 1 + 3 * 2 + 1);
        QCOMPARE(seen.first().checkpoint, tsm::Checkpoint::RootCreated);
        QCOMPARE(seen[1].checkpoint, tsm::Checkpoint::ElementsReconciled);
        QCOMPARE(seen[2].checkpoint, tsm::Checkpoint::NodesCreated);
        QCOMPARE(seen[3].checkpoint, tsm::Checkpoint::CorrelationDone);
        QCOMPARE(seen[4].page, 1);
        QCOMPARE(seen.last().checkpoint, tsm::Checkpoint::SessionComplete);
        QCOMPARE(seen.last().percent, 100);
        for (int i = 1; i < seen.size(); i++)
            QVERIFY(seen[i].percent >= seen[i - 1].percent);
    }

    void cancellationStopsWithoutCommit() {
        MemoryDocument doc = reportDoc();
        Engine engine;
        auto res = engine.run(doc, reportSidecar(), [](const tsm::Progress& p) {
            return p.checkpoint != tsm::Checkpoint::NodesCreated;
        });
        QVERIFY(!res.ok);
        QVERIFY(res.cancelled);
        QVERIFY(res.error.contains("nodes-created"));
        QCOMPARE(doc.writeCount(), 0);
        // partial tree is still reported
        QCOMPARE(res.counters.nodesCreated, 3);
        QCOMPARE(res.counters.directMatches, 0);
        QVERIFY(!engine.isRunning());
    }

    void cancelAfterCommitIsIgnored() {
        MemoryDocument doc = reportDoc();
        Engine engine;
        auto res = engine.run(doc, reportSidecar(), [](const tsm::Progress& p) {
            return p.checkpoint != tsm::Checkpoint::SessionComplete;
        });
        QVERIFY(res.ok);
        QVERIFY(!res.cancelled);
        QVERIFY(res.error.isEmpty());
        QCOMPARE(doc.writeCount(), 1);
    }

    void notReentrant() {
        MemoryDocument doc = reportDoc();
        MemoryDocument other = reportDoc();
        Engine engine;
        tsm::SessionResult nested;
        bool tried = false;

        auto res = engine.run(doc, reportSidecar(), [&](const tsm::Progress& p) {
            if (p.checkpoint == tsm::Checkpoint::RootCreated && !tried) {
                tried = true;
                nested = engine.run(other, Sidecar());
            }
            return true;
        });

        QVERIFY(tried);
        QVERIFY(!nested.ok);
        QVERIFY(nested.error.contains("already running"));
        QCOMPARE(other.writeCount(), 0);
        QVERIFY(res.ok);
    }

    void sessionsStartFresh() {
        Engine engine;
        MemoryDocument first = reportDoc();
        QVERIFY(engine.run(first, reportSidecar()).ok);

        MemoryDocument second = reportDoc();
        auto res = engine.run(second, reportSidecar());
        QVERIFY(res.ok);
        QCOMPARE(res.mcidMap.value("text_0_0").first().mcid, 0);
        QCOMPARE(engine.tree()->nodes().first().id, uint64_t(1));
    }

    void unrecognizedRootIsFatal() {
        MemoryDocument doc = reportDoc();
        doc.setStructTreeRoot(QJsonArray{"broken"});
        Engine engine;
        auto res = engine.run(doc, reportSidecar());
        QVERIFY(!res.ok);
        QVERIFY(!res.cancelled);
        QCOMPARE(doc.writeCount(), 0);
        QCOMPARE(tsm::countSeverity(res.diagnostics, tsm::Severity::Error), 1);
        QCOMPARE(doc.structTreeRoot().toArray().size(), 1);
    }

    void existingRootKept() {
        MemoryDocument doc = reportDoc();
        doc.setStructTreeRoot(QJsonObject{{"Type", "StructTreeRoot"},
                                          {"K", QJsonArray{QJsonObject{{"S", "Document"}}}}});
        Engine engine;
        auto res = engine.run(doc, Sidecar());
        QVERIFY(res.ok);
        QJsonArray kids = res.structTree["K"].toArray();
        QCOMPARE(kids[0].toObject()["S"].toString(), QString("Document"));
        QCOMPARE(kids.size(), 1 + 4);
    }

    void unreadablePageIsWarning() {
        MemoryDocument doc = reportDoc();
        doc.pages()[1].content.reset();
        Engine engine;
        auto res = engine.run(doc, Sidecar());
        QVERIFY(res.ok);
        QCOMPARE(res.counters.pagesSkipped, 1);
        QCOMPARE(res.counters.directMatches, 3);
        QVERIFY(!res.mcidMap.contains("text_1_0"));
        QCOMPARE(tsm::countSeverity(res.diagnostics, tsm::Severity::Warning), 1);
    }

    void optionsShapeTheSession() {
        EngineOptions opts;
        opts.correlate = false;
        opts.skipEmptyText = false;
        opts.actualTextLimit = 5;
        opts.markTagged = false;

        MemoryDocument doc = reportDoc();
        Engine engine(opts);
        auto res = engine.run(doc, Sidecar());
        QVERIFY(res.ok);
        QVERIFY(res.mcidMap.isEmpty());
        QCOMPARE(res.counters.skippedEmpty, 0);
        QCOMPARE(res.counters.nodesCreated, 5);
        QVERIFY(!doc.isMarked());

        uint64_t first = res.nodeByElementId.value("text_0_0");
        QCOMPARE(engine.tree()->node(first)->attrs.actualText, QString("Annua..."));
    }

    void defaultLanguageFillsMissingLanguage() {
        EngineOptions opts;
        opts.defaultLanguage = "de-DE";
        MemoryDocument doc = reportDoc();
        Engine engine(opts);
        auto res = engine.run(doc, Sidecar());
        QVERIFY(res.ok);
        QCOMPARE(doc.info().language, QString("de-DE"));

        // a sidecar language wins
        MemoryDocument other = reportDoc();
        QVERIFY(Engine(opts).run(other, reportSidecar()).ok);
        QCOMPARE(other.info().language, QString("en-GB"));
    }

    void failedNodesAreRecoverable() {
        MemoryDocument doc = reportDoc();
        doc.rejectType("Figure");
        Engine engine;
        auto res = engine.run(doc, reportSidecar());
        QVERIFY(res.ok);
        QCOMPARE(res.counters.nodeFailures, 1);
        QVERIFY(!res.nodeByElementId.contains("image_0_0_0"));
        QCOMPARE(res.modifications[1].nodeId, uint64_t(0));
    }

    // ── Options ──

    void optionsFromIni() {
        QTemporaryDir dir;
        QString path = dir.filePath("tagsmith.ini");
        {
            QSettings s(path, QSettings::IniFormat);
            s.setValue("engine/correlate", false);
            s.setValue("engine/actualTextLimit", 40);
            s.setValue("engine/defaultLanguage", "de-DE");
        }
        EngineOptions o = EngineOptions::fromIniFile(path);
        QVERIFY(!o.correlate);
        QCOMPARE(o.actualTextLimit, 40);
        QCOMPARE(o.defaultLanguage, QString("de-DE"));
        // untouched keys keep defaults
        QVERIFY(o.contentStreamFallback);
        QVERIFY(o.skipEmptyText);
        QVERIFY(o.markTagged);
    }

    void optionsRoundTripAndDefaults() {
        QTemporaryDir dir;
        QString path = dir.filePath("rt.ini");
        EngineOptions o;
        o.skipEmptyText = false;
        o.actualTextLimit = 7;
        {
            QSettings s(path, QSettings::IniFormat);
            o.toSettings(s);
        }
        EngineOptions back = EngineOptions::fromIniFile(path);
        QVERIFY(!back.skipEmptyText);
        QCOMPARE(back.actualTextLimit, 7);

        EngineOptions missing = EngineOptions::fromIniFile(dir.filePath("nope.ini"));
        QVERIFY(missing.correlate);
        QCOMPARE(missing.actualTextLimit, 100);
        QCOMPARE(missing.defaultLanguage, QString("en-US"));
    }

    // ── Report ──

    void remediationReport() {
        MemoryDocument doc = reportDoc();
        Engine engine;
        auto res = engine.run(doc, reportSidecar());

        tsm::ReportInput in;
        in.sourceFile = "/tmp/in/annual.json";
        QJsonObject r = tsm::buildReport(res, in);
        QCOMPARE(r["report_info"].toObject()["source_file"].toString(), QString("annual.json"));
        QCOMPARE(r["report_info"].toObject()["export_file"].toString(), QString("N/A"));
        QCOMPARE(r["metadata_changes"].toObject()["title"].toString(), QString("Annual"));
        QVERIFY(r["metadata_changes"].toObject()["marked_flag"].toBool());

        QJsonObject mods = r["element_modifications"].toObject();
        QCOMPARE(mods["total_elements_modified"].toInt(), 4);
        QCOMPARE(mods["pages_with_changes"].toInt(), 2);
        QCOMPARE(r["session"].toObject()["mcid_count"].toInt(), 4);
        QVERIFY(r["session"].toObject()["ok"].toBool());

        QJsonObject map = tsm::mcidMapToJson(res.mcidMap);
        QCOMPARE(map["text_0_1"].toArray().size(), 2);
        QCOMPARE(map["text_0_0"].toArray()[0].toObject()["MCID"].toInt(), 0);
    }
};

QTEST_GUILESS_MAIN(TestEngine)
#include "test_engine.moc"
