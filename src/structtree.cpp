#include "structtree.h"
#include "document.h"
#include <QDebug>
#include <QSet>

namespace tsm {

// Nesting deeper than this is treated as corrupt when serializing.
static constexpr int kMaxDepth = 256;

StructTree::StructTree(Document* doc) : m_doc(doc) {}

// ── Root ──

RootResult StructTree::initRoot(const QJsonValue& existing) {
    if (isReady())
        return {false, false, 0, QStringLiteral("structure root already initialized")};

    if (existing.isUndefined() || existing.isNull()) {
        RoleMap roleMap = RoleMap::standard();
        if (m_doc) {
            StructNode rootObj;
            rootObj.id   = 0;
            rootObj.type = QStringLiteral("StructTreeRoot");
            if (!m_doc->makeIndirect(rootObj)) {
                qWarning() << "StructTree: Failed to register structure root";
                return {false, false, 0, QStringLiteral("document refused the structure root")};
            }
        }
        m_roleMap = roleMap;
        m_foreignKids = QJsonArray();
        m_state = State::RootReady;
        qDebug() << "StructTree: New structure root with" << m_roleMap.size() << "role mappings";
        return {true, false, m_roleMap.size(), {}};
    }

    if (!existing.isObject()) {
        qWarning() << "StructTree: Existing structure root is not a dictionary, leaving it alone";
        return {false, false, 0, QStringLiteral("existing structure root has an unrecognized representation")};
    }

    const QJsonObject root = existing.toObject();
    RoleMap roleMap;
    if (root.contains("RoleMap")) {
        if (!root["RoleMap"].isObject()) {
            qWarning() << "StructTree: Existing RoleMap is not a dictionary, leaving it alone";
            return {false, false, 0, QStringLiteral("existing role map has an unrecognized representation")};
        }
        roleMap = RoleMap::fromJson(root["RoleMap"].toObject());
    }
    int added = roleMap.mergeStandard();

    QJsonArray kids;
    if (root["K"].isArray())
        kids = root["K"].toArray();
    else if (root.contains("K") && !root["K"].isNull())
        kids.append(root["K"]);

    m_roleMap = roleMap;
    m_foreignKids = kids;
    m_state = State::RootReady;
    qDebug() << "StructTree: Enhanced existing structure root with" << added
             << "role mapping(s)," << kids.size() << "existing child(ren) kept";
    return {true, true, added, {}};
}

// ── Nodes ──

NodeResult StructTree::createNode(const QString& type, const StructAttrs& attrs) {
    if (!isReady())
        return {false, 0, QStringLiteral("structure tree must be created first")};
    if (type.isEmpty())
        return {false, 0, QStringLiteral("node type is empty")};
    if (!m_roleMap.isResolvable(type))
        return {false, 0, QStringLiteral("role '%1' does not resolve through the role map").arg(type)};

    StructNode n;
    n.id       = m_nextId;
    n.type     = type;
    n.attrs    = attrs;
    n.parentId = 0;

    if (m_doc && !m_doc->makeIndirect(n))
        return {false, 0, QStringLiteral("document refused %1 node").arg(type)};

    m_nextId++;
    m_nodes.append(n);
    m_rootKids.append(n.id);
    m_idCache.insert(n.id, m_nodes.size() - 1);
    return {true, n.id, {}};
}

int StructTree::indexOfId(uint64_t id) const {
    if (m_idCache.size() != m_nodes.size()) {
        m_idCache.clear();
        for (int i = 0; i < m_nodes.size(); i++)
            m_idCache[m_nodes[i].id] = i;
    }
    return m_idCache.value(id, -1);
}

const StructNode* StructTree::node(uint64_t id) const {
    int idx = indexOfId(id);
    return idx < 0 ? nullptr : &m_nodes[idx];
}

bool StructTree::isAncestor(uint64_t ancestorId, uint64_t id) const {
    QSet<uint64_t> visited;
    const StructNode* cur = node(id);
    while (cur && cur->parentId != 0) {
        if (visited.contains(cur->id)) break;
        visited.insert(cur->id);
        if (cur->parentId == ancestorId) return true;
        cur = node(cur->parentId);
    }
    return false;
}

void StructTree::detach(StructNode& child) {
    if (child.parentId == 0) {
        m_rootKids.removeAll(child.id);
        return;
    }
    int pi = indexOfId(child.parentId);
    if (pi < 0) return;
    auto& kids = m_nodes[pi].kids;
    for (int i = 0; i < kids.size(); i++) {
        const uint64_t* kid = std::get_if<uint64_t>(&kids[i]);
        if (kid && *kid == child.id) {
            kids.remove(i);
            return;
        }
    }
}

bool StructTree::attach(uint64_t parentId, uint64_t childId, QString* error) {
    auto fail = [&](const QString& msg) {
        if (error) *error = msg;
        return false;
    };
    if (!isReady())
        return fail(QStringLiteral("structure tree must be created first"));

    int ci = indexOfId(childId);
    if (ci < 0)
        return fail(QStringLiteral("unknown child node %1").arg(childId));
    if (parentId != 0 && indexOfId(parentId) < 0)
        return fail(QStringLiteral("unknown parent node %1").arg(parentId));
    if (parentId == childId || (parentId != 0 && isAncestor(childId, parentId)))
        return fail(QStringLiteral("attaching %1 under %2 would create a cycle")
                        .arg(childId).arg(parentId));

    detach(m_nodes[ci]);
    m_nodes[ci].parentId = parentId;
    if (parentId == 0)
        m_rootKids.append(childId);
    else
        m_nodes[indexOfId(parentId)].kids.append(StructKid{childId});
    return true;
}

QVector<std::optional<uint64_t>> StructTree::createBatch(const QVector<NodeSpec>& specs,
                                                         Diagnostics* diags) {
    QVector<std::optional<uint64_t>> out;
    out.reserve(specs.size());
    int created = 0;

    for (int i = 0; i < specs.size(); i++) {
        const NodeSpec& spec = specs[i];
        StructAttrs attrs;
        attrs.title      = spec.title ? *spec.title : QStringLiteral("Element %1").arg(i + 1);
        attrs.altText    = spec.altText;
        attrs.actualText = spec.actualText;
        attrs.language   = spec.language;

        NodeResult r = createNode(spec.type, attrs);
        if (!r.ok) {
            qWarning() << "StructTree: Batch entry" << i + 1 << "failed:" << r.error;
            if (diags)
                diags->append({Severity::Warning, -1,
                               QStringLiteral("batch entry %1 (%2): %3").arg(i + 1).arg(spec.type, r.error)});
            out.append(std::nullopt);
            continue;
        }
        created++;
        out.append(r.id);

        if (spec.parentId != 0) {
            QString err;
            if (!node(spec.parentId)) {
                qWarning() << "StructTree: Batch entry" << i + 1 << "names unknown parent"
                           << spec.parentId << "- left at root";
                if (diags)
                    diags->append({Severity::Warning, -1,
                                   QStringLiteral("batch entry %1: unknown parent %2, left at root")
                                       .arg(i + 1).arg(spec.parentId)});
            } else if (!attach(spec.parentId, r.id, &err)) {
                if (diags)
                    diags->append({Severity::Warning, -1,
                                   QStringLiteral("batch entry %1: %2").arg(i + 1).arg(err)});
            }
        }
    }

    qDebug() << "StructTree: Batch complete:" << created << "/" << specs.size() << "created";
    return out;
}

bool StructTree::appendContentRef(uint64_t nodeId, const ContentRef& ref) {
    int idx = indexOfId(nodeId);
    if (idx < 0) return false;
    m_nodes[idx].kids.append(StructKid{ref});
    return true;
}

QVector<uint64_t> StructTree::childNodes(uint64_t id) const {
    if (id == 0) return m_rootKids;
    QVector<uint64_t> out;
    const StructNode* n = node(id);
    if (!n) return out;
    for (const auto& kid : n->kids)
        if (const uint64_t* cid = std::get_if<uint64_t>(&kid))
            out.append(*cid);
    return out;
}

QVector<ContentRef> StructTree::contentRefs(uint64_t id) const {
    QVector<ContentRef> out;
    const StructNode* n = node(id);
    if (!n) return out;
    for (const auto& kid : n->kids)
        if (const ContentRef* ref = std::get_if<ContentRef>(&kid))
            out.append(*ref);
    return out;
}

void StructTree::reset() {
    m_state = State::Uninitialized;
    m_roleMap = RoleMap();
    m_foreignKids = QJsonArray();
    m_nodes.clear();
    m_rootKids.clear();
    m_idCache.clear();
    m_nextId = 1;
}

// ── Serialization ──

QJsonObject StructTree::nodeToJson(const StructNode& n, int depth) const {
    QJsonObject o;
    o["Type"] = QStringLiteral("StructElem");
    o["S"]    = n.type;
    o["ID"]   = static_cast<qint64>(n.id);
    if (!n.attrs.isEmpty())
        o["A"] = n.attrs.toJson();

    QJsonArray kids;
    for (const auto& kid : n.kids) {
        if (const ContentRef* ref = std::get_if<ContentRef>(&kid)) {
            kids.append(ref->toJson());
        } else if (depth < kMaxDepth) {
            const StructNode* c = node(std::get<uint64_t>(kid));
            if (c) kids.append(nodeToJson(*c, depth + 1));
        }
    }
    o["K"] = kids;
    return o;
}

QJsonObject StructTree::toJson() const {
    QJsonObject o;
    if (!isReady()) return o;

    QJsonArray kids = m_foreignKids;
    for (uint64_t id : m_rootKids)
        if (const StructNode* n = node(id))
            kids.append(nodeToJson(*n, 0));

    o["Type"]    = QStringLiteral("StructTreeRoot");
    o["RoleMap"] = m_roleMap.toJson();
    o["K"]       = kids;
    return o;
}

// ── Reporting ──

TreeInfo StructTree::verify() const {
    TreeInfo info;
    info.hasRoot       = isReady();
    info.hasRoleMap    = isReady() && !m_roleMap.isEmpty();
    info.roleMappings  = m_roleMap.size();
    info.childElements = m_foreignKids.size() + m_rootKids.size();
    info.nodeCount     = m_nodes.size();
    for (const auto& n : m_nodes)
        for (const auto& kid : n.kids)
            if (std::holds_alternative<ContentRef>(kid)) info.contentRefs++;
    return info;
}

QString StructTree::statusReport() const {
    TreeInfo info = verify();
    QString r = QStringLiteral("Structure Tree Status:\n");
    r += QStringLiteral("   Structure Tree: %1\n").arg(info.hasRoot ? QStringLiteral("Present") : QStringLiteral("Missing"));
    r += QStringLiteral("   Role Map: %1\n").arg(info.hasRoleMap ? QStringLiteral("Present") : QStringLiteral("Missing"));
    r += QStringLiteral("   Role Mappings: %1\n").arg(info.roleMappings);
    r += QStringLiteral("   Child Elements: %1\n").arg(info.childElements);
    r += QStringLiteral("   Marked Content References: %1\n").arg(info.contentRefs);

    if (info.hasRoleMap) {
        r += QStringLiteral("\n   Role Mappings:\n");
        const auto& entries = m_roleMap.entries();
        for (auto it = entries.begin(); it != entries.end(); ++it)
            r += QStringLiteral("      %1 -> %2\n").arg(it.key(), it.value());
    }
    return r;
}

QString StructTree::elementSummary() const {
    if (m_nodes.isEmpty())
        return QStringLiteral("No structure elements created yet");

    QString s = QStringLiteral("Created %1 structure element(s):\n").arg(m_nodes.size());
    for (const auto& n : m_nodes) {
        s += QStringLiteral("   %1. %2").arg(n.id).arg(n.type);
        if (!n.attrs.title.isEmpty())
            s += QStringLiteral(" - %1").arg(n.attrs.title);
        if (!n.attrs.altText.isEmpty())
            s += QStringLiteral(" (Alt: %1)").arg(n.attrs.altText);
        s += QLatin1Char('\n');
    }
    return s;
}

} // namespace tsm
