#include "correlator.h"
#include "document.h"
#include "structtree.h"
#include <QDebug>
#include <algorithm>

namespace tsm {

// Prefix length used by the approximate match.
static constexpr int kPrefixLen = 10;

QString normalizeCandidate(const QString& text) {
    QString s = text.trimmed();
    s.remove(QLatin1Char('\\'));
    s.remove(QLatin1Char('('));
    s.remove(QLatin1Char(')'));
    return s;
}

int findTextMatch(const QString& candidate, const QVector<TextPosition>& positions, int exclude) {
    const QString c = normalizeCandidate(candidate);
    // An empty candidate is contained in everything; never a match.
    if (c.isEmpty()) return -1;

    for (int i = 0; i < positions.size(); i++) {
        if (i == exclude || !positions[i].hasAnchor()) continue;
        const QString& stored = positions[i].text;
        if (stored.isEmpty()) continue;
        if (stored.contains(c) || c.contains(stored))
            return i;
    }

    if (c.size() > 3) {
        const QString prefix = c.left(kPrefixLen);
        for (int i = 0; i < positions.size(); i++) {
            if (i == exclude || !positions[i].hasAnchor()) continue;
            if (positions[i].text.contains(prefix))
                return i;
        }
    }
    return -1;
}

// ── Content stream scanner ──
//
// Just enough of the content-stream lexer to find text-show operands:
//
//   literal string  '(' ... ')'   balanced parentheses, '\' escapes
//   hex string      '<' hex '>'   decoded to bytes
//   array           '[' ... ']'   string elements concatenated, numbers dropped
//   comment         '%' to end of line
//   anything else   a number or operator token
//
// Operands are returned in their literal form ("(Hello)"), arrays as the
// concatenation of their strings ("(Hel)(lo)").

namespace {

class ContentScanner {
public:
    explicit ContentScanner(const QByteArray& data) : m_data(data) {}

    QStringList scan() {
        QStringList runs;
        while (!atEnd()) {
            char ch = peek();
            if (isSpace(ch)) { advance(); continue; }
            if (ch == '%') { skipComment(); continue; }
            if (ch == '(') { setOperand(Operand::String, readLiteral()); continue; }
            if (ch == '[') { setOperand(Operand::Array, readArray()); continue; }
            if (ch == '<') {
                if (peek(1) == '<') { m_pos += 2; clearOperand(); continue; }
                setOperand(Operand::String, readHex());
                continue;
            }
            if (ch == '>' || ch == ']' || ch == ')' || ch == '{' || ch == '}') {
                advance();
                continue;
            }
            if (ch == '/') { advance(); readWord(); clearOperand(); continue; }

            QByteArray word = readWord();
            if (word.isEmpty()) { advance(); continue; }
            if (isNumber(word)) continue;   // operands such as aw/ac for '"'

            if ((word == "Tj" || word == "'" || word == "\"") && m_kind == Operand::String)
                runs.append(QString::fromLatin1(m_operand));
            else if (word == "TJ" && m_kind == Operand::Array)
                runs.append(QString::fromLatin1(m_operand));
            clearOperand();
        }
        return runs;
    }

private:
    enum class Operand { None, String, Array };

    const QByteArray& m_data;
    int        m_pos  = 0;
    Operand    m_kind = Operand::None;
    QByteArray m_operand;

    bool atEnd() const { return m_pos >= m_data.size(); }
    char peek(int ahead = 0) const {
        int p = m_pos + ahead;
        return p < m_data.size() ? m_data[p] : '\0';
    }
    void advance() { m_pos++; }

    static bool isSpace(char ch) {
        return ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t' || ch == '\f' || ch == '\0';
    }
    static bool isDelimiter(char ch) {
        return ch == '(' || ch == ')' || ch == '<' || ch == '>' || ch == '['
            || ch == ']' || ch == '{' || ch == '}' || ch == '/' || ch == '%';
    }
    static bool isNumber(const QByteArray& w) {
        bool ok = false;
        w.toDouble(&ok);
        return ok;
    }

    void setOperand(Operand kind, const QByteArray& text) { m_kind = kind; m_operand = text; }
    void clearOperand() { m_kind = Operand::None; m_operand.clear(); }

    void skipComment() {
        while (!atEnd() && peek() != '\n' && peek() != '\r') advance();
    }

    QByteArray readWord() {
        int start = m_pos;
        while (!atEnd() && !isSpace(peek()) && !isDelimiter(peek())) advance();
        return m_data.mid(start, m_pos - start);
    }

    // Cursor on '('. Returns the string including its outer parentheses.
    QByteArray readLiteral() {
        int start = m_pos;
        int depth = 0;
        while (!atEnd()) {
            char ch = peek();
            if (ch == '\\') { m_pos += 2; continue; }
            advance();
            if (ch == '(') depth++;
            else if (ch == ')' && --depth == 0) break;
        }
        return m_data.mid(start, m_pos - start);
    }

    // Cursor on '<'. Returns the decoded bytes wrapped in parentheses.
    QByteArray readHex() {
        advance();
        QByteArray hex;
        while (!atEnd() && peek() != '>') {
            if (!isSpace(peek())) hex.append(peek());
            advance();
        }
        if (!atEnd()) advance();
        if (hex.size() % 2) hex.append('0');
        return '(' + QByteArray::fromHex(hex) + ')';
    }

    // Cursor on '['. Concatenates the string elements.
    QByteArray readArray() {
        advance();
        QByteArray out;
        while (!atEnd() && peek() != ']') {
            char ch = peek();
            if (ch == '(') out += readLiteral();
            else if (ch == '<') out += readHex();
            else advance();
        }
        if (!atEnd()) advance();
        return out;
    }
};

} // namespace

QStringList scanTextRuns(const QByteArray& content) {
    return ContentScanner(content).scan();
}

QVector<TextPosition> candidatesFromStream(const QByteArray& content) {
    QVector<TextPosition> out;
    const QStringList runs = scanTextRuns(content);
    for (int i = 0; i < runs.size(); i++) {
        TextPosition tp;
        tp.text    = runs[i];
        tp.spanIdx = i;
        out.append(tp);
    }
    return out;
}

QVector<TextPosition> anchorsFromElements(const QVector<Element>& elements) {
    QVector<TextPosition> out;
    for (const auto& e : elements) {
        QString text = e.property(QStringLiteral("actual_text"));
        if (text.isEmpty()) text = e.text.value_or(QString()).trimmed();
        if (text.isEmpty()) continue;
        TextPosition tp;
        tp.elementId = e.id;
        tp.text      = text;
        tp.bbox      = e.bbox;
        out.append(tp);
    }
    return out;
}

// ── Correlator ──

void Correlator::reset() {
    m_nextMcid = 0;
    m_mcidMap.clear();
}

bool Correlator::link(int page, const QString& elementId, uint64_t nodeId, CorrelateResult& res) {
    if (!m_tree.node(nodeId)) {
        res.diagnostics.append({Severity::Warning, page,
                                QStringLiteral("element %1 maps to missing node %2").arg(elementId).arg(nodeId)});
        return false;
    }
    ContentRef ref{page, m_nextMcid};
    if (!m_tree.appendContentRef(nodeId, ref))
        return false;
    m_nextMcid++;
    m_mcidMap[elementId].append(ref);
    res.refs.append(ref);
    return true;
}

CorrelateResult Correlator::correlate(int page, const QVector<TextPosition>& positions,
                                      const QHash<QString, uint64_t>& nodeByElementId,
                                      const QVector<TextPosition>* targets) {
    CorrelateResult res;
    const QVector<TextPosition>& pool = targets ? *targets : positions;

    for (int i = 0; i < positions.size(); i++) {
        const TextPosition& p = positions[i];
        if (p.hasAnchor()) {
            auto it = nodeByElementId.constFind(p.elementId);
            if (it != nodeByElementId.constEnd() && link(page, p.elementId, it.value(), res))
                res.direct++;
            else
                res.misses++;
            continue;
        }

        int m = findTextMatch(p.text, pool, targets ? -1 : i);
        if (m < 0) {
            res.misses++;
            continue;
        }
        const QString& target = pool[m].elementId;
        auto it = nodeByElementId.constFind(target);
        if (it != nodeByElementId.constEnd() && link(page, target, it.value(), res))
            res.fuzzy++;
        else
            res.misses++;
    }

    qDebug() << "Correlator: page" << page << "-" << res.direct << "direct," << res.fuzzy
             << "fuzzy," << res.misses << "unmatched";
    return res;
}

CorrelateResult Correlator::correlatePage(const Document& doc, int page,
                                          const QVector<Element>& elements,
                                          const QHash<QString, uint64_t>& nodeByElementId,
                                          bool streamFallback) {
    QByteArray content;
    if (!doc.readContentStream(page, &content)) {
        qWarning() << "Correlator: page" << page << "has no readable content stream, skipped";
        CorrelateResult res;
        res.ok = false;
        res.diagnostics.append({Severity::Warning, page,
                                QStringLiteral("content stream missing or unreadable; no marked content")});
        return res;
    }

    QVector<TextPosition> positions = doc.textPositions(page);
    bool anyDirect = std::any_of(positions.begin(), positions.end(), [&](const TextPosition& p) {
        return p.hasAnchor() && nodeByElementId.contains(p.elementId);
    });
    if (anyDirect || !streamFallback)
        return correlate(page, positions, nodeByElementId);

    // Stream runs stand in only here; next to direct links they would mark
    // the same text twice.
    // Only targets with a node can take a link.
    QVector<TextPosition> targets;
    for (const auto& t : positions + anchorsFromElements(elements))
        if (t.hasAnchor() && nodeByElementId.contains(t.elementId))
            targets.append(t);
    return correlate(page, positions + candidatesFromStream(content), nodeByElementId, &targets);
}

} // namespace tsm
