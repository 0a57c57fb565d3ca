#pragma once
#include "core.h"
#include <QByteArray>
#include <QSet>
#include <memory>

namespace tsm {

// ── Document interface ──
//
// The engine's only view of the source document: element and text-position
// extraction, content-stream bytes, and the handful of object-model operations
// needed to hang a structure tree off the catalog. Implementations own all
// container-format I/O.

class Document {
public:
    virtual ~Document() = default;

    virtual int pageCount() const = 0;

    // Current /StructTreeRoot, or an undefined value when the document has none.
    virtual QJsonValue structTreeRoot() const = 0;

    // Registers a node as an indirect object. The structure root is passed
    // with id 0 and type "StructTreeRoot".
    virtual bool makeIndirect(const StructNode& node) = 0;

    // Replaces the catalog's /StructTreeRoot with the given tree.
    virtual bool writeStructTreeRoot(const QJsonObject& root) = 0;

    virtual QVector<Element>      extractElements(int page) const = 0;
    virtual QVector<TextPosition> textPositions(int page) const = 0;

    // False when the page has no content stream or it cannot be decoded.
    virtual bool readContentStream(int page, QByteArray* out) const = 0;

    // Title/language into the info dictionary, marked flag into /MarkInfo.
    virtual bool applyInfo(const DocumentInfo& info, bool marked) {
        Q_UNUSED(info); Q_UNUSED(marked); return false;
    }
};

// ── MemoryDocument ──
//
// Document over a JSON fixture, the shape an extraction dump takes:
//
//   { "pages": [ { "blocks":  [ {"bbox":[..], "text":"..",
//                                "lines":[ {"spans":[ {"text","bbox","font","size"} ]} ]} ],
//                  "images":  [ {"rects":[ [..], .. ]} ],
//                  "content": "BT (Hello) Tj ET" } ],
//     "StructTreeRoot": { .. } }
//
// Blocks without "lines" contribute one span carrying the block text. A page
// without "content" (or with a non-string one) has no readable stream.

class MemoryDocument : public Document {
public:
    struct Span {
        QString text;
        BBox    bbox;
        QString font;
        double  size = 12;
    };
    struct Block {
        BBox                    bbox;
        QString                 text;
        QVector<QVector<Span>>  lines;
    };
    struct Page {
        QVector<Block>           blocks;
        QVector<QVector<BBox>>   images;     // per image, its placement rects
        std::optional<QByteArray> content;
    };

    MemoryDocument() = default;
    explicit MemoryDocument(QVector<Page> pages) : m_pages(std::move(pages)) {}

    static MemoryDocument fromJson(const QJsonObject& o);
    static std::unique_ptr<MemoryDocument> fromFile(const QString& path, QString* error = nullptr);

    QVector<Page>& pages() { return m_pages; }
    void setStructTreeRoot(const QJsonValue& root) { m_root = root; }

    // Failure injection for callers exercising partial-success paths.
    void rejectType(const QString& type) { m_rejectedTypes.insert(type); }
    void rejectRoot(bool reject) { m_rejectRoot = reject; }

    int        pageCount() const override { return m_pages.size(); }
    QJsonValue structTreeRoot() const override { return m_root; }
    bool       makeIndirect(const StructNode& node) override;
    bool       writeStructTreeRoot(const QJsonObject& root) override;

    QVector<Element>      extractElements(int page) const override;
    QVector<TextPosition> textPositions(int page) const override;
    bool                  readContentStream(int page, QByteArray* out) const override;
    bool                  applyInfo(const DocumentInfo& info, bool marked) override;

    // What the engine wrote back
    const QVector<StructNode>& indirectObjects() const { return m_objects; }
    int                        writeCount() const { return m_writes; }
    const DocumentInfo&        info() const { return m_info; }
    bool                       isMarked() const { return m_marked; }

private:
    QVector<Page>       m_pages;
    QJsonValue          m_root = QJsonValue(QJsonValue::Undefined);
    QVector<StructNode> m_objects;
    QSet<QString>       m_rejectedTypes;
    bool                m_rejectRoot = false;
    int                 m_writes     = 0;
    DocumentInfo        m_info;
    bool                m_marked     = false;
};

} // namespace tsm
