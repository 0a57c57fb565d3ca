#pragma once
#include <QString>
#include <QVector>
#include <QJsonObject>
#include <QJsonArray>
#include <QJsonValue>
#include <cstdint>
#include <optional>
#include <variant>

namespace tsm {

// ── Element kind ──

enum class ElementKind : uint8_t {
    Text, Image
};

// ── Unified kind metadata table (single source of truth) ──

struct ElementKindMeta {
    ElementKind kind;
    const char* name;         // sidecar/fixture name: "text", "image"
    const char* idPrefix;     // element id prefix: "text_", "image_"
    const char* defaultRole;  // role assigned at extraction
};

inline constexpr ElementKindMeta kElementKindMeta[] = {
    // kind                 name     idPrefix   defaultRole
    {ElementKind::Text,    "text",  "text_",   "P"},
    {ElementKind::Image,   "image", "image_",  "Figure"},
};

inline constexpr const ElementKindMeta* kindMeta(ElementKind k) {
    for (const auto& m : kElementKindMeta)
        if (m.kind == k) return &m;
    return nullptr;
}

inline const char* kindToString(ElementKind k) {
    auto* m = kindMeta(k);
    return m ? m->name : "unknown";
}

inline ElementKind kindFromString(const QString& s) {
    for (const auto& m : kElementKindMeta)
        if (s == m.name) return m.kind;
    return ElementKind::Text;
}

// Ids that do not carry the image prefix are treated as text.
inline ElementKind kindFromElementId(const QString& id) {
    if (id.startsWith(QLatin1String(kindMeta(ElementKind::Image)->idPrefix)))
        return ElementKind::Image;
    return ElementKind::Text;
}

inline QString defaultRoleFor(ElementKind k) {
    auto* m = kindMeta(k);
    return QString::fromLatin1(m ? m->defaultRole : "P");
}

// ── Element ids ──
//
// "text_<page>_<block>" and "image_<page>_<img>_<rect>". Ordinals follow
// extraction order; sidecar overrides are keyed by these strings, so a change
// in extraction order silently detaches user edits.

inline QString textElementId(int page, int block) {
    return QStringLiteral("text_%1_%2").arg(page).arg(block);
}

inline QString imageElementId(int page, int img, int rect) {
    return QStringLiteral("image_%1_%2_%3").arg(page).arg(img).arg(rect);
}

// ── BBox ──

struct BBox {
    double x0 = 0, y0 = 0, x1 = 0, y1 = 0;

    bool operator==(const BBox& o) const {
        return x0 == o.x0 && y0 == o.y0 && x1 == o.x1 && y1 == o.y1;
    }
    bool operator!=(const BBox& o) const { return !(*this == o); }

    double width()  const { return x1 - x0; }
    double height() const { return y1 - y0; }

    QJsonArray toJson() const { return QJsonArray{x0, y0, x1, y1}; }

    // Accepts a four-number array; anything else is rejected.
    static std::optional<BBox> fromJson(const QJsonValue& v) {
        if (!v.isArray()) return std::nullopt;
        QJsonArray a = v.toArray();
        if (a.size() != 4) return std::nullopt;
        for (const auto& c : a)
            if (!c.isDouble()) return std::nullopt;
        return BBox{a[0].toDouble(), a[1].toDouble(), a[2].toDouble(), a[3].toDouble()};
    }
};

// Bounding box given to sidecar-only elements that never stored one.
inline constexpr BBox kSyntheticBBox{0, 0, 100, 20};

// ── Element ──

struct Element {
    QString                id;
    ElementKind            kind = ElementKind::Text;
    BBox                   bbox;
    QString                role = QStringLiteral("P");
    std::optional<QString> text;
    QJsonObject            properties;   // alt_text, language, actual_text, scope, title, ...

    QString property(const QString& key) const {
        return properties.value(key).toString();
    }

    bool operator==(const Element& o) const {
        return id == o.id && kind == o.kind && bbox == o.bbox && role == o.role
            && text == o.text && properties == o.properties;
    }
    bool operator!=(const Element& o) const { return !(*this == o); }
};

// ── SidecarOverride ──
// Field-level patch: every member is individually optional and only the
// present ones replace extracted values.

struct SidecarOverride {
    QString                id;
    std::optional<QString> role;
    std::optional<BBox>    bbox;
    std::optional<QString> text;
    QJsonObject            properties;

    // Later fields win; properties merge key by key.
    void mergeFrom(const SidecarOverride& o) {
        if (o.role) role = o.role;
        if (o.bbox) bbox = o.bbox;
        if (o.text) text = o.text;
        for (auto it = o.properties.begin(); it != o.properties.end(); ++it)
            properties[it.key()] = it.value();
    }

    QJsonObject toJson() const {
        QJsonObject o;
        o["id"] = id;
        if (role) o["role"] = *role;
        if (bbox) o["bbox"] = bbox->toJson();
        if (text) o["text"] = *text;
        if (!properties.isEmpty()) o["properties"] = properties;
        return o;
    }

    bool operator==(const SidecarOverride& o) const {
        return id == o.id && role == o.role && bbox == o.bbox
            && text == o.text && properties == o.properties;
    }
    bool operator!=(const SidecarOverride& o) const { return !(*this == o); }
};

// ── TextPosition ──
// One text span as positioned on the page. An empty elementId marks an
// unanchored run (e.g. a string operand lifted from a content stream).

struct TextPosition {
    QString elementId;
    QString text;
    BBox    bbox;
    QString font;
    double  size     = 12;
    int     blockIdx = -1;
    int     lineIdx  = -1;
    int     spanIdx  = -1;

    bool hasAnchor() const { return !elementId.isEmpty(); }
};

// ── ContentRef ──

struct ContentRef {
    int page = 0;
    int mcid = 0;

    bool operator==(const ContentRef& o) const { return page == o.page && mcid == o.mcid; }
    bool operator!=(const ContentRef& o) const { return !(*this == o); }

    QJsonObject toJson() const {
        QJsonObject o;
        o["Type"] = QStringLiteral("MCR");
        o["Pg"]   = page;
        o["MCID"] = mcid;
        return o;
    }
};

// ── Structure node ──

struct StructAttrs {
    QString title;
    QString altText;
    QString actualText;
    QString language;

    bool isEmpty() const {
        return title.isEmpty() && altText.isEmpty()
            && actualText.isEmpty() && language.isEmpty();
    }

    QJsonObject toJson() const {
        QJsonObject o;
        if (!title.isEmpty())      o["Title"]      = title;
        if (!altText.isEmpty())    o["Alt"]        = altText;
        if (!actualText.isEmpty()) o["ActualText"] = actualText;
        if (!language.isEmpty())   o["Lang"]       = language;
        return o;
    }
};

// A child is either another node (by id) or a marked-content reference.
using StructKid = std::variant<uint64_t, ContentRef>;

struct StructNode {
    uint64_t           id       = 0;
    QString            type;            // role tag, the dispatch key
    StructAttrs        attrs;           // title is display only
    uint64_t           parentId = 0;    // 0 = structure root
    QVector<StructKid> kids;
};

// ── DocumentInfo ──

struct DocumentInfo {
    QString title;
    QString language;                // empty = engine default
    bool    tagged   = false;

    QJsonObject toJson() const {
        QJsonObject o;
        o["title"]    = title;
        o["language"] = language;
        o["tagged"]   = tagged;
        return o;
    }
    static DocumentInfo fromJson(const QJsonObject& o) {
        DocumentInfo d;
        d.title    = o["title"].toString();
        d.language = o["language"].toString();
        d.tagged   = o["tagged"].toBool(false);
        return d;
    }

    bool operator==(const DocumentInfo& o) const {
        return title == o.title && language == o.language && tagged == o.tagged;
    }
};

// ── Diagnostics ──

enum class Severity : uint8_t {
    Info, Warning, Error
};

struct Diagnostic {
    Severity severity = Severity::Info;
    int      page     = -1;   // -1 = not page scoped
    QString  message;
};

using Diagnostics = QVector<Diagnostic>;

inline const char* severityToString(Severity s) {
    switch (s) {
    case Severity::Info:    return "info";
    case Severity::Warning: return "warning";
    case Severity::Error:   return "error";
    }
    return "info";
}

inline int countSeverity(const Diagnostics& diags, Severity s) {
    int n = 0;
    for (const auto& d : diags)
        if (d.severity == s) n++;
    return n;
}

inline QJsonArray diagnosticsToJson(const Diagnostics& diags) {
    QJsonArray arr;
    for (const auto& d : diags) {
        QJsonObject o;
        o["severity"] = severityToString(d.severity);
        if (d.page >= 0) o["page"] = d.page;
        o["message"] = d.message;
        arr.append(o);
    }
    return arr;
}

} // namespace tsm
