#pragma once
#include "core.h"
#include <QHash>
#include <QStringList>

namespace tsm {

class Document;
class StructTree;

// ── Text matching helpers ──

// Trims and strips the '(' ')' '\' characters text-show operands carry.
QString normalizeCandidate(const QString& text);

// Index of the first anchored position (other than exclude) whose text
// contains the normalized candidate or is contained by it; failing that, whose
// text contains the candidate's first 10 characters when the candidate is
// longer than 3. -1 when nothing matches.
int findTextMatch(const QString& candidate, const QVector<TextPosition>& positions,
                  int exclude = -1);

// String operands of the text-show operators in a content stream, in stream
// order: "(..) Tj", "[..] TJ", "(..) '" and "(..) \"". TJ arrays are returned
// with their kerning numbers dropped.
QStringList scanTextRuns(const QByteArray& content);

// Unanchored candidate positions built from scanTextRuns().
QVector<TextPosition> candidatesFromStream(const QByteArray& content);

// One anchored position per element that carries text (actual_text wins).
QVector<TextPosition> anchorsFromElements(const QVector<Element>& elements);

// ── Correlator ──

struct CorrelateResult {
    bool                ok = true;     // false: the page was skipped
    QVector<ContentRef> refs;
    int                 direct = 0;
    int                 fuzzy  = 0;
    int                 misses = 0;
    Diagnostics         diagnostics;
};

// Session-scoped MCID allocation plus the two matching strategies. MCIDs
// start at 0, increase strictly across pages and are never reused until
// reset().
class Correlator {
public:
    explicit Correlator(StructTree& tree) : m_tree(tree) {}

    // Anchored positions whose element id is in the map are linked directly;
    // every other position goes through findTextMatch() against targets
    // (null: the anchored entries of positions).
    CorrelateResult correlate(int page, const QVector<TextPosition>& positions,
                              const QHash<QString, uint64_t>& nodeByElementId,
                              const QVector<TextPosition>* targets = nullptr);

    // Links the document's text positions. When none of them resolves
    // directly and streamFallback is set, the page's content-stream runs are
    // matched against the text of elements instead. A missing or unreadable
    // stream skips the page.
    CorrelateResult correlatePage(const Document& doc, int page,
                                  const QVector<Element>& elements,
                                  const QHash<QString, uint64_t>& nodeByElementId,
                                  bool streamFallback);

    int  nextMcid() const { return m_nextMcid; }
    void reset();

    // element id -> references assigned to it this session
    const QHash<QString, QVector<ContentRef>>& mcidMap() const { return m_mcidMap; }

private:
    bool link(int page, const QString& elementId, uint64_t nodeId, CorrelateResult& res);

    StructTree& m_tree;
    int         m_nextMcid = 0;
    QHash<QString, QVector<ContentRef>> m_mcidMap;
};

} // namespace tsm
