#pragma once
#include <QString>
#include <QStringList>
#include <QMap>
#include <QJsonObject>

namespace tsm {

// ── Standard role vocabulary ──

struct RoleMeta {
    const char* tag;
    const char* standard;   // tag the role map points it at
};

inline constexpr RoleMeta kStandardRoles[] = {
    // Headings collapse onto the generic heading
    {"H1", "H"}, {"H2", "H"}, {"H3", "H"}, {"H4", "H"}, {"H5", "H"}, {"H6", "H"},
    // Block
    {"P", "P"}, {"H", "H"}, {"L", "L"}, {"LI", "LI"}, {"Lbl", "Lbl"}, {"LBody", "LBody"},
    // Table
    {"Table", "Table"}, {"TR", "TR"}, {"TH", "TH"}, {"TD", "TD"},
    // Inline
    {"Span", "Span"}, {"Quote", "Quote"}, {"Note", "Note"}, {"Reference", "Reference"},
    {"BibEntry", "BibEntry"}, {"Code", "Code"},
    // Illustration
    {"Figure", "Figure"}, {"Formula", "Formula"}, {"Form", "Form"},
    // Grouping
    {"Document", "Document"}, {"Part", "Part"}, {"Div", "Div"}, {"Sect", "Sect"},
    {"Art", "Art"}, {"BlockQuote", "BlockQuote"}, {"Caption", "Caption"},
    {"TOC", "TOC"}, {"TOCI", "TOCI"}, {"Index", "Index"},
    {"NonStruct", "NonStruct"}, {"Private", "Private"},
    // Link
    {"Link", "Link"}, {"Annot", "Annot"},
};

inline constexpr int kStandardRoleCount =
    int(sizeof(kStandardRoles) / sizeof(kStandardRoles[0]));

bool isStandardRole(const QString& tag);
QStringList standardRoleTags();

// ── RoleMap ──
// Maps author/custom role names onto the standard vocabulary. Mutation is
// additive only: an existing mapping is never overwritten or removed.

class RoleMap {
public:
    static RoleMap standard();

    // Reads an existing /RoleMap. Values are accepted as plain strings or
    // as PDF name strings with a leading '/'.
    static RoleMap fromJson(const QJsonObject& o);

    // Adds every standard mapping absent from this map. Returns the count added.
    int mergeStandard();

    // Adds tag -> target unless tag is already mapped.
    bool insert(const QString& tag, const QString& target);

    bool    contains(const QString& tag) const { return m_map.contains(tag); }
    QString value(const QString& tag) const { return m_map.value(tag); }

    // Follows the mapping chain until it reaches a standard tag. Returns an
    // empty string when the chain is broken or cyclic.
    QString resolve(const QString& tag) const;

    // A type is usable for a node when it is mapped and resolves to a
    // standard tag.
    bool isResolvable(const QString& tag) const;

    int  size() const { return m_map.size(); }
    bool isEmpty() const { return m_map.isEmpty(); }
    const QMap<QString, QString>& entries() const { return m_map; }

    QJsonObject toJson() const;

private:
    QMap<QString, QString> m_map;
};

} // namespace tsm
