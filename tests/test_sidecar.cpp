#include <QtTest/QTest>
#include <QTemporaryDir>
#include <QFile>
#include <QJsonDocument>
#include "sidecar.h"

using tsm::Sidecar;
using tsm::SidecarOverride;

static QJsonObject parse(const char* json) {
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

class TestSidecar : public QObject {
    Q_OBJECT
private slots:
    void canonicalShape() {
        Sidecar s = Sidecar::fromJson(parse(R"({
            "document": {"title": "Q3 Report", "language": "fr-FR", "tagged": true},
            "pages": {"0": {"elements": [
                {"id": "text_0_0", "role": "H1", "properties": {"title": "Heading"}},
                {"id": "image_0_0_0", "role": "Figure", "bbox": [1, 2, 3, 4],
                 "properties": {"alt_text": "Logo"}}
            ]}}
        })"));

        QCOMPARE(s.document.title, QString("Q3 Report"));
        QCOMPARE(s.document.language, QString("fr-FR"));
        QVERIFY(s.document.tagged);
        QCOMPARE(s.elementCount(), 2);

        const SidecarOverride* h = s.findOverride(0, "text_0_0");
        QVERIFY(h);
        QCOMPARE(*h->role, QString("H1"));
        QVERIFY(!h->bbox.has_value());
        QVERIFY(!h->text.has_value());

        const SidecarOverride* fig = s.findOverride(0, "image_0_0_0");
        QVERIFY(fig);
        QCOMPARE(*fig->bbox, (tsm::BBox{1, 2, 3, 4}));
        QCOMPARE(fig->properties["alt_text"].toString(), QString("Logo"));
    }

    void legacyShapesNormalized() {
        // pages as an array, elements keyed by id, role and bbox inside
        // properties, loose title key
        Sidecar s = Sidecar::fromJson(parse(R"({
            "pages": [
                {"elements": {}},
                {"elements": {
                    "text_1_0": {"properties": {"role": "H2", "bbox": [0, 0, 50, 10]},
                                 "title": "Intro"}
                }}
            ]
        })"));

        QCOMPARE(s.pages.size(), 2);
        QVERIFY(s.overridesForPage(0).isEmpty());
        const SidecarOverride* ov = s.findOverride(1, "text_1_0");
        QVERIFY(ov);
        QCOMPARE(*ov->role, QString("H2"));
        QCOMPARE(*ov->bbox, (tsm::BBox{0, 0, 50, 10}));
        QCOMPARE(ov->properties["title"].toString(), QString("Intro"));
        QVERIFY(!ov->properties.contains("role"));
        QVERIFY(!ov->properties.contains("bbox"));
    }

    void duplicateIdsMerged() {
        tsm::Diagnostics diags;
        Sidecar s = Sidecar::fromJson(parse(R"({"pages": {"0": {"elements": [
            {"id": "text_0_0", "role": "P", "properties": {"language": "de"}},
            {"id": "text_0_1", "role": "P"},
            {"id": "text_0_0", "role": "H1"}
        ]}}})"), &diags);

        QCOMPARE(s.overridesForPage(0).size(), 2);
        QCOMPARE(s.overridesForPage(0)[0].id, QString("text_0_0"));
        QCOMPARE(*s.overridesForPage(0)[0].role, QString("H1"));
        QCOMPARE(s.overridesForPage(0)[0].properties["language"].toString(), QString("de"));
        QCOMPARE(diags.size(), 1);
        QCOMPARE(diags[0].severity, tsm::Severity::Warning);
    }

    void entriesWithoutIdSkipped() {
        tsm::Diagnostics diags;
        Sidecar s = Sidecar::fromJson(parse(R"({"pages": {"0": {"elements": [
            {"role": "P"}, "junk", {"id": "text_0_0"}
        ]}, "cover": {"elements": []}}})"), &diags);
        QCOMPARE(s.elementCount(), 1);
        QCOMPARE(s.pages.size(), 1);
        QCOMPARE(diags.size(), 3);
    }

    void roundTripThroughFile() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        Sidecar s = Sidecar::forPageCount(2);
        s.document.title = "Doc";
        QVERIFY(s.updateElement(0, "text_0_0", QJsonObject{{"role", "H1"}, {"title", "Top"}}));
        QVERIFY(s.updateElement(1, "image_1_0_0",
                                QJsonObject{{"alt_text", "Chart"}, {"bbox", QJsonArray{0, 0, 10, 10}}}));
        QVERIFY(s.updateElement(1, "custom_note", QJsonObject{{"text", "extra"}}));

        QString path = dir.filePath("doc_sidecar.json");
        QString err;
        QVERIFY2(s.save(path, &err), qPrintable(err));

        Sidecar back;
        QVERIFY2(back.load(path, &err), qPrintable(err));
        QCOMPARE(back.document, s.document);
        QCOMPARE(back.elementCount(), s.elementCount());
        for (auto it = s.pages.begin(); it != s.pages.end(); ++it)
            for (const auto& ov : it.value()) {
                const SidecarOverride* b = back.findOverride(it.key(), ov.id);
                QVERIFY2(b, qPrintable(ov.id));
                QCOMPARE(*b, ov);
            }
    }

    void loadRejectsGarbage() {
        QTemporaryDir dir;
        QString path = dir.filePath("bad.json");
        QFile f(path);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("[1, 2");
        f.close();

        Sidecar s;
        QString err;
        QVERIFY(!s.load(path, &err));
        QVERIFY(!err.isEmpty());
        QVERIFY(!s.load(dir.filePath("missing.json"), &err));
    }

    void updateElementMergesExisting() {
        Sidecar s = Sidecar::forPageCount(1);
        QVERIFY(s.updateElement(0, "text_0_0", QJsonObject{{"role", "H2"}, {"language", "en"}}));
        QVERIFY(s.updateElement(0, "text_0_0", QJsonObject{{"title", "Heading"}}));

        QCOMPARE(s.overridesForPage(0).size(), 1);
        const SidecarOverride* ov = s.findOverride(0, "text_0_0");
        QCOMPARE(*ov->role, QString("H2"));
        QCOMPARE(ov->properties["language"].toString(), QString("en"));
        QCOMPARE(ov->properties["title"].toString(), QString("Heading"));
    }

    void updateElementDefaultsRole() {
        Sidecar s = Sidecar::forPageCount(1);
        QVERIFY(s.updateElement(0, "text_0_4", QJsonObject{{"alt_text", "x"}}));
        QCOMPARE(*s.findOverride(0, "text_0_4")->role, QString("P"));
    }

    void updateElementUnknownPage() {
        Sidecar s = Sidecar::forPageCount(1);
        QVERIFY(!s.updateElement(5, "text_5_0", QJsonObject{{"role", "P"}}));
        QCOMPARE(s.elementCount(), 0);
    }

    void defaultPath() {
        QCOMPARE(Sidecar::defaultPathFor("/data/in/report.v2.pdf"),
                 QString("/data/in/report.v2_sidecar.json"));
    }
};

QTEST_GUILESS_MAIN(TestSidecar)
#include "test_sidecar.moc"
