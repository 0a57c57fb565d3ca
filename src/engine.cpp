#include "engine.h"
#include "composite.h"
#include "correlator.h"
#include "document.h"
#include "reconciler.h"
#include "sidecar.h"
#include "structtree.h"
#include <QDebug>

namespace tsm {

const char* checkpointName(Checkpoint c) {
    switch (c) {
    case Checkpoint::RootCreated:        return "root-created";
    case Checkpoint::ElementsReconciled: return "elements-reconciled";
    case Checkpoint::NodesCreated:       return "nodes-created";
    case Checkpoint::CorrelationDone:    return "correlation-done";
    case Checkpoint::SessionComplete:    return "session-complete";
    }
    return "unknown";
}

QJsonObject SessionCounters::toJson() const {
    QJsonObject o;
    o["pages"]           = pages;
    o["pages_skipped"]   = pagesSkipped;
    o["elements"]        = elements;
    o["patched"]         = patched;
    o["synthesized"]     = synthesized;
    o["skipped_empty"]   = skippedEmpty;
    o["nodes_created"]   = nodesCreated;
    o["node_failures"]   = nodeFailures;
    o["composite_nodes"] = compositeNodes;
    o["direct_matches"]  = directMatches;
    o["fuzzy_matches"]   = fuzzyMatches;
    o["unmatched"]       = unmatched;
    return o;
}

namespace {

struct RunningGuard {
    bool& flag;
    explicit RunningGuard(bool& f) : flag(f) { flag = true; }
    ~RunningGuard() { flag = false; }
};

bool isTableElement(const Element& e) {
    return e.role == QLatin1String("Table") && e.properties.contains("rows");
}

bool isListElement(const Element& e) {
    return e.role == QLatin1String("L") && e.properties.value("items").isArray();
}

} // namespace

Engine::Engine(EngineOptions options) : m_options(std::move(options)) {}

Engine::~Engine() = default;

// ── Element -> node mapping ──

bool Engine::attrsForElement(const Element& e, int page, int index,
                             const EngineOptions& options, StructAttrs* out) {
    const QString text   = e.text.value_or(QString());
    const QString actual = e.property("actual_text");

    if (options.skipEmptyText && e.kind == ElementKind::Text
        && text.trimmed().isEmpty() && actual.isEmpty())
        return false;

    StructAttrs a;
    a.title = e.property("title");
    if (a.title.isEmpty()) {
        a.title = e.kind == ElementKind::Image
            ? QStringLiteral("Figure %1-%2").arg(page).arg(index)
            : QStringLiteral("Text block %1-%2").arg(page).arg(index);
    }
    a.altText  = e.property("alt_text");
    a.language = e.property("language");
    if (!actual.isEmpty())
        a.actualText = actual;
    else if (text.size() > options.actualTextLimit)
        a.actualText = text.left(options.actualTextLimit) + QStringLiteral("...");
    else
        a.actualText = text;

    if (out) *out = a;
    return true;
}

// ── Session ──

bool Engine::report(const ProgressFn& progress, Checkpoint c, int page, int percent,
                    const QString& message, SessionResult& res) {
    if (!progress) return true;
    if (progress({c, page, percent, message})) return true;

    res.cancelled = true;
    res.error = QStringLiteral("cancelled at %1").arg(checkpointName(c));
    res.diagnostics.append({Severity::Info, page, res.error});
    qDebug() << "Engine: Session cancelled at" << checkpointName(c) << "page" << page;
    return false;
}

uint64_t Engine::expandComposite(const Element& e, int page, SessionResult& res) {
    CompositeResult cr = isTableElement(e)
        ? createTable(*m_tree, TableSpec::fromJson(e.properties))
        : createList(*m_tree, ListSpec::fromJson(e.properties));

    for (Diagnostic d : cr.diagnostics) {
        d.page = page;
        res.diagnostics.append(d);
    }
    res.counters.compositeNodes += cr.created;
    res.counters.nodeFailures   += cr.failed;

    if (!cr.ok) {
        res.counters.nodeFailures++;
        res.diagnostics.append({Severity::Warning, page,
                                QStringLiteral("%1 %2 not expanded: %3").arg(e.role, e.id, cr.error)});
        return 0;
    }
    return cr.id;
}

// Synthesized elements follow the extracted ones, so index >= extractedCount
// marks a sidecar-only element.
void Engine::createNodes(int page, const QVector<Element>& elements, int extractedCount,
                         const Sidecar& sidecar, SessionResult& res) {
    for (int i = 0; i < elements.size(); i++) {
        const Element& e = elements[i];
        const SidecarOverride* ov = sidecar.findOverride(page, e.id);

        uint64_t id = 0;
        if (isTableElement(e) || isListElement(e)) {
            id = expandComposite(e, page, res);
        } else {
            StructAttrs attrs;
            if (!attrsForElement(e, page, i, m_options, &attrs)) {
                res.counters.skippedEmpty++;
            } else {
                NodeResult nr = m_tree->createNode(e.role, attrs);
                if (nr.ok) {
                    id = nr.id;
                    res.counters.nodesCreated++;
                } else {
                    res.counters.nodeFailures++;
                    qWarning() << "Engine: No node for" << e.id << "-" << nr.error;
                    res.diagnostics.append({Severity::Warning, page,
                                            QStringLiteral("element %1: %2").arg(e.id, nr.error)});
                }
            }
        }

        if (id) res.nodeByElementId.insert(e.id, id);
        if (ov) {
            ElementRecord rec;
            rec.page        = page;
            rec.elementId   = e.id;
            rec.role        = e.role;
            rec.nodeId      = id;
            rec.synthesized = i >= extractedCount;
            rec.properties  = e.properties;
            res.modifications.append(rec);
        }
    }
}

SessionResult Engine::run(Document& doc, const Sidecar& sidecar, const ProgressFn& progress) {
    SessionResult res;
    if (m_running) {
        res.error = QStringLiteral("an engine session is already running");
        res.diagnostics.append({Severity::Error, -1, res.error});
        qWarning() << "Engine:" << res.error;
        return res;
    }
    RunningGuard guard(m_running);

    m_tree = std::make_unique<StructTree>(&doc);
    m_correlator = std::make_unique<Correlator>(*m_tree);

    auto finish = [&](bool ok) {
        res.ok             = ok;
        res.structTree     = m_tree->toJson();
        res.mcidMap        = m_correlator->mcidMap();
        res.statusReport   = m_tree->statusReport();
        res.elementSummary = m_tree->elementSummary();
        return res;
    };

    // Root
    RootResult root = m_tree->initRoot(doc.structTreeRoot());
    if (!root.ok) {
        res.error = root.error;
        res.diagnostics.append({Severity::Error, -1, root.error});
        qWarning() << "Engine: Structure root failed:" << root.error;
        return finish(false);
    }
    if (!report(progress, Checkpoint::RootCreated, -1, 5,
                root.enhanced ? QStringLiteral("Enhanced existing structure tree")
                              : QStringLiteral("Created structure tree"), res))
        return finish(false);

    // Metadata
    res.info = sidecar.document;
    if (res.info.language.isEmpty())
        res.info.language = m_options.defaultLanguage;
    res.info.tagged = res.info.tagged || m_options.markTagged;
    res.marked = m_options.markTagged;
    if (!doc.applyInfo(res.info, res.marked))
        res.diagnostics.append({Severity::Info, -1,
                                QStringLiteral("document does not accept title/language/marked info")});

    // Pages
    const int pageCount = doc.pageCount();
    res.counters.pages = pageCount;
    auto pct = [pageCount](int page, int stage) {
        return 10 + (80 * (page * 3 + stage)) / qMax(1, pageCount * 3);
    };

    for (int page = 0; page < pageCount; page++) {
        ReconcileResult rr = reconcile(page, doc.extractElements(page), sidecar.overridesForPage(page));
        res.counters.elements    += rr.elements.size();
        res.counters.patched     += rr.patched;
        res.counters.synthesized += rr.synthesized;
        res.diagnostics += rr.diagnostics;
        if (!report(progress, Checkpoint::ElementsReconciled, page, pct(page, 1),
                    QStringLiteral("Page %1: %2 element(s)").arg(page).arg(rr.elements.size()), res))
            return finish(false);

        createNodes(page, rr.elements, rr.elements.size() - rr.synthesized, sidecar, res);
        if (!report(progress, Checkpoint::NodesCreated, page, pct(page, 2),
                    QStringLiteral("Page %1: %2 node(s) in tree").arg(page).arg(m_tree->nodes().size()), res))
            return finish(false);

        if (m_options.correlate) {
            QHash<QString, uint64_t> pageMap;
            for (const auto& e : rr.elements)
                if (res.nodeByElementId.contains(e.id))
                    pageMap.insert(e.id, res.nodeByElementId.value(e.id));

            CorrelateResult cr = m_correlator->correlatePage(doc, page, rr.elements, pageMap,
                                                             m_options.contentStreamFallback);
            if (!cr.ok) res.counters.pagesSkipped++;
            res.counters.directMatches += cr.direct;
            res.counters.fuzzyMatches  += cr.fuzzy;
            res.counters.unmatched     += cr.misses;
            res.diagnostics += cr.diagnostics;
        }
        if (!report(progress, Checkpoint::CorrelationDone, page, pct(page, 3),
                    QStringLiteral("Page %1: next MCID %2").arg(page).arg(m_correlator->nextMcid()), res))
            return finish(false);
    }

    // Commit
    if (!doc.writeStructTreeRoot(m_tree->toJson())) {
        res.error = QStringLiteral("document refused the structure tree");
        res.diagnostics.append({Severity::Error, -1, res.error});
        qWarning() << "Engine:" << res.error;
        return finish(false);
    }

    qDebug() << "Engine: Session complete -" << res.counters.nodesCreated << "node(s),"
             << res.counters.compositeNodes << "composite node(s),"
             << m_correlator->nextMcid() << "MCID(s)";

    // The tree is already committed; a cancel here has nothing left to stop.
    if (progress)
        progress({Checkpoint::SessionComplete, -1, 100, QStringLiteral("Structure tree written")});
    return finish(true);
}

} // namespace tsm
