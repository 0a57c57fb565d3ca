#pragma once
#include "core.h"
#include "rolemap.h"
#include <QHash>
#include <optional>

namespace tsm {

class Document;

struct NodeResult {
    bool     ok = false;
    uint64_t id = 0;
    QString  error;
};

struct RootResult {
    bool    ok             = false;
    bool    enhanced       = false;  // an existing root was reused
    int     mappingsAdded  = 0;
    QString error;
};

// One entry of a batch. A null title becomes "Element <n>".
struct NodeSpec {
    QString                 type = QStringLiteral("P");
    std::optional<QString>  title;
    QString                 altText;
    QString                 actualText;
    QString                 language;
    uint64_t                parentId = 0;    // 0 = stay at the root
};

struct TreeInfo {
    bool hasRoot       = false;
    bool hasRoleMap    = false;
    int  roleMappings  = 0;
    int  childElements = 0;   // direct children of the root
    int  nodeCount     = 0;
    int  contentRefs   = 0;
};

// ── StructTree ──
//
// Structure-tree registry for one session. Nodes live in a flat vector
// indexed by id; parent/child links are node ids. Every operation except
// initRoot() fails while no root exists.

class StructTree {
public:
    enum class State { Uninitialized, RootReady };

    explicit StructTree(Document* doc = nullptr);

    // No existing root (undefined value): fresh root with the standard role
    // map. Existing root: must be a JSON object; its RoleMap (if any) must be
    // an object and only gains the missing standard entries. Its children
    // are kept verbatim. On failure nothing changes.
    RootResult initRoot(const QJsonValue& existing = QJsonValue(QJsonValue::Undefined));

    State state() const { return m_state; }
    bool  isReady() const { return m_state == State::RootReady; }

    // Creates a node attached to the root.
    NodeResult createNode(const QString& type, const StructAttrs& attrs = {});

    // Moves child to the end of parent's children. parentId 0 is the root.
    bool attach(uint64_t parentId, uint64_t childId, QString* error = nullptr);

    // Independent creation per entry: a failed entry yields nullopt and the
    // rest continue. parentId wiring happens after each creation.
    QVector<std::optional<uint64_t>> createBatch(const QVector<NodeSpec>& specs,
                                                 Diagnostics* diags = nullptr);

    bool appendContentRef(uint64_t nodeId, const ContentRef& ref);

    const StructNode*          node(uint64_t id) const;
    int                        indexOfId(uint64_t id) const;
    const QVector<StructNode>& nodes() const { return m_nodes; }
    const QVector<uint64_t>&   rootKids() const { return m_rootKids; }
    QVector<uint64_t>          childNodes(uint64_t id) const;
    QVector<ContentRef>        contentRefs(uint64_t id) const;
    bool                       isAncestor(uint64_t ancestorId, uint64_t id) const;
    const RoleMap&             roleMap() const { return m_roleMap; }

    // Drops the root and every node; the next node id starts over at 1.
    void reset();

    QJsonObject toJson() const;
    TreeInfo    verify() const;
    QString     statusReport() const;
    QString     elementSummary() const;

private:
    QJsonObject nodeToJson(const StructNode& n, int depth) const;
    void        detach(StructNode& child);

    Document*           m_doc;
    State               m_state  = State::Uninitialized;
    RoleMap             m_roleMap;
    QJsonArray          m_foreignKids;   // children of an enhanced root
    QVector<StructNode> m_nodes;
    QVector<uint64_t>   m_rootKids;
    uint64_t            m_nextId = 1;
    mutable QHash<uint64_t, int> m_idCache;
};

} // namespace tsm
