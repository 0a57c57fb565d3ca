#include <QtTest/QTest>
#include <QSet>
#include "reconciler.h"

using tsm::Element;
using tsm::SidecarOverride;

static Element textElement(int page, int block, const QString& text) {
    Element e;
    e.id   = tsm::textElementId(page, block);
    e.kind = tsm::ElementKind::Text;
    e.bbox = {10, 10.0 + block * 20, 200, 25.0 + block * 20};
    e.text = text;
    return e;
}

static Element imageElement(int page, int img) {
    Element e;
    e.id   = tsm::imageElementId(page, img, 0);
    e.kind = tsm::ElementKind::Image;
    e.bbox = {0, 300, 100, 400};
    e.role = "Figure";
    e.properties["alt_text"] = QString();
    return e;
}

static SidecarOverride override(const QString& id) {
    SidecarOverride ov;
    ov.id = id;
    return ov;
}

class TestReconciler : public QObject {
    Q_OBJECT

private:
    QVector<Element> m_page;

private slots:
    void init() {
        m_page = {textElement(0, 0, "Annual Report"), textElement(0, 1, "Revenue grew."),
                  imageElement(0, 0)};
    }

    void noOverridesPassesThrough() {
        auto r = tsm::reconcile(0, m_page, {});
        QCOMPARE(r.elements, m_page);
        QCOMPARE(r.patched, 0);
        QCOMPARE(r.synthesized, 0);
    }

    void fieldLevelPatch() {
        SidecarOverride ov = override("text_0_0");
        ov.role = QString("H1");
        ov.properties["title"] = "Heading";

        auto r = tsm::reconcile(0, m_page, {ov});
        QCOMPARE(r.patched, 1);
        const Element& e = r.elements[0];
        QCOMPARE(e.role, QString("H1"));
        QCOMPARE(e.property("title"), QString("Heading"));
        // fields the override lacks keep extracted values
        QCOMPARE(e.bbox, m_page[0].bbox);
        QCOMPARE(*e.text, QString("Annual Report"));
        QCOMPARE(e.kind, tsm::ElementKind::Text);
    }

    void propertiesMergeKeyByKey() {
        SidecarOverride ov = override("image_0_0_0");
        ov.properties["alt_text"] = "Bar chart";
        ov.properties["language"] = "en";

        auto r = tsm::reconcile(0, m_page, {ov});
        const Element& e = r.elements[2];
        QCOMPARE(e.property("alt_text"), QString("Bar chart"));
        QCOMPARE(e.property("language"), QString("en"));
        QCOMPARE(e.role, QString("Figure"));
    }

    void sidecarOnlyElementSynthesized() {
        SidecarOverride note = override("note_0_1");
        note.text = QString("Added by hand");

        SidecarOverride fig = override("image_0_9_0");
        fig.bbox = tsm::BBox{5, 5, 50, 50};

        auto r = tsm::reconcile(0, m_page, {note, fig});
        QCOMPARE(r.synthesized, 2);
        QCOMPARE(r.elements.size(), m_page.size() + 2);

        const Element& n = r.elements[3];
        QCOMPARE(n.id, QString("note_0_1"));
        QCOMPARE(n.kind, tsm::ElementKind::Text);
        QCOMPARE(n.role, QString("P"));
        QCOMPARE(n.bbox, tsm::kSyntheticBBox);
        QCOMPARE(*n.text, QString("Added by hand"));

        const Element& f = r.elements[4];
        QCOMPARE(f.kind, tsm::ElementKind::Image);
        QCOMPARE(f.bbox, (tsm::BBox{5, 5, 50, 50}));
    }

    void countInvariantAndUniqueIds() {
        QVector<SidecarOverride> ovs = {override("text_0_1"), override("extra_a"),
                                        override("extra_b"), override("image_0_0_0")};
        auto r = tsm::reconcile(0, m_page, ovs);

        QSet<QString> extractedIds;
        for (const auto& e : m_page) extractedIds.insert(e.id);
        QSet<QString> overrideIds;
        for (const auto& o : ovs) overrideIds.insert(o.id);

        QCOMPARE(r.elements.size(), (extractedIds | overrideIds).size());

        QSet<QString> seen;
        for (const auto& e : r.elements) {
            QVERIFY2(!seen.contains(e.id), qPrintable(e.id));
            seen.insert(e.id);
        }
    }

    void extractedOrderPreserved() {
        auto r = tsm::reconcile(0, m_page, {override("image_0_0_0"), override("text_0_0")});
        QCOMPARE(r.elements[0].id, QString("text_0_0"));
        QCOMPARE(r.elements[1].id, QString("text_0_1"));
        QCOMPARE(r.elements[2].id, QString("image_0_0_0"));
    }

    void duplicateOverridesMerge() {
        SidecarOverride a = override("text_0_1");
        a.role = QString("Quote");
        SidecarOverride b = override("text_0_1");
        b.properties["language"] = "la";

        auto r = tsm::reconcile(0, m_page, {a, b});
        QCOMPARE(r.elements.size(), m_page.size());
        QCOMPARE(r.elements[1].role, QString("Quote"));
        QCOMPARE(r.elements[1].property("language"), QString("la"));
    }

    void duplicateExtractedDropped() {
        QVector<Element> page = m_page;
        page.append(textElement(0, 0, "again"));
        auto r = tsm::reconcile(0, page, {});
        QCOMPARE(r.elements.size(), m_page.size());
        QCOMPARE(r.diagnostics.size(), 1);
        QCOMPARE(r.diagnostics[0].page, 0);
    }

    void idempotent() {
        SidecarOverride ov = override("text_0_0");
        ov.role = QString("H1");
        QVector<SidecarOverride> ovs = {ov, override("side_1")};

        auto first  = tsm::reconcile(0, m_page, ovs);
        auto second = tsm::reconcile(0, m_page, ovs);
        QCOMPARE(first.elements, second.elements);

        // feeding the result back in changes nothing either
        auto again = tsm::reconcile(0, first.elements, ovs);
        QCOMPARE(again.elements, first.elements);
    }
};

QTEST_GUILESS_MAIN(TestReconciler)
#include "test_reconciler.moc"
