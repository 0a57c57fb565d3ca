#pragma once
#include "core.h"
#include "options.h"
#include <QHash>
#include <functional>
#include <memory>

namespace tsm {

class Document;
class Sidecar;
class StructTree;
class Correlator;

// ── Progress ──

enum class Checkpoint : uint8_t {
    RootCreated, ElementsReconciled, NodesCreated, CorrelationDone, SessionComplete
};

const char* checkpointName(Checkpoint c);

struct Progress {
    Checkpoint checkpoint = Checkpoint::RootCreated;
    int        page       = -1;    // -1 for session-wide checkpoints
    int        percent    = 0;
    QString    message;
};

// Called synchronously at each checkpoint. Returning false cancels the
// session at that point.
using ProgressFn = std::function<bool(const Progress&)>;

// ── Session result ──

struct SessionCounters {
    int pages            = 0;
    int pagesSkipped     = 0;   // no readable content stream
    int elements         = 0;   // effective elements after reconciliation
    int patched          = 0;
    int synthesized      = 0;
    int skippedEmpty     = 0;
    int nodesCreated     = 0;
    int nodeFailures     = 0;
    int compositeNodes   = 0;
    int directMatches    = 0;
    int fuzzyMatches     = 0;
    int unmatched        = 0;

    QJsonObject toJson() const;
};

// One effective element the sidecar touched, for the remediation report.
struct ElementRecord {
    int         page   = 0;
    QString     elementId;
    QString     role;
    uint64_t    nodeId = 0;        // 0 when no node was created
    bool        synthesized = false;
    QJsonObject properties;
};

struct SessionResult {
    bool            ok        = false;
    bool            cancelled = false;
    QString         error;
    Diagnostics     diagnostics;
    DocumentInfo    info;                 // what was applied to the document
    bool            marked = false;
    QJsonObject     structTree;
    QHash<QString, QVector<ContentRef>> mcidMap;
    QHash<QString, uint64_t>            nodeByElementId;
    QVector<ElementRecord>              modifications;
    SessionCounters counters;
    QString         statusReport;
    QString         elementSummary;
};

// ── Engine ──
//
// Drives one remediation session over a document: root, metadata, then per
// page reconcile -> nodes -> correlation, then commit. Owns the session state
// (node ids, MCID counter) and is not reentrant.

class Engine {
public:
    explicit Engine(EngineOptions options = {});
    ~Engine();

    const EngineOptions& options() const { return m_options; }
    void setOptions(const EngineOptions& options) { m_options = options; }

    bool isRunning() const { return m_running; }

    SessionResult run(Document& doc, const Sidecar& sidecar, const ProgressFn& progress = {});

    // Tree of the last session; null before the first run.
    const StructTree* tree() const { return m_tree.get(); }

    // Node attributes for an effective element. Returns false when the element
    // is skipped (blank text, skipEmptyText set).
    static bool attrsForElement(const Element& e, int page, int index,
                                const EngineOptions& options, StructAttrs* out);

private:
    bool report(const ProgressFn& progress, Checkpoint c, int page, int percent,
                const QString& message, SessionResult& res);
    void createNodes(int page, const QVector<Element>& elements, int extractedCount,
                     const Sidecar& sidecar, SessionResult& res);
    uint64_t expandComposite(const Element& e, int page, SessionResult& res);

    EngineOptions               m_options;
    bool                        m_running = false;
    std::unique_ptr<StructTree> m_tree;
    std::unique_ptr<Correlator> m_correlator;
};

} // namespace tsm
