#include "document.h"
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>

namespace tsm {

namespace {

BBox bboxOrZero(const QJsonValue& v) {
    auto b = BBox::fromJson(v);
    return b ? *b : BBox{};
}

MemoryDocument::Page pageFromJson(const QJsonObject& po) {
    MemoryDocument::Page page;

    for (const auto& bv : po["blocks"].toArray()) {
        const QJsonObject bo = bv.toObject();
        MemoryDocument::Block block;
        block.bbox = bboxOrZero(bo["bbox"]);
        block.text = bo["text"].toString();
        for (const auto& lv : bo["lines"].toArray()) {
            QVector<MemoryDocument::Span> line;
            for (const auto& sv : lv.toObject()["spans"].toArray()) {
                const QJsonObject so = sv.toObject();
                MemoryDocument::Span span;
                span.text = so["text"].toString();
                span.bbox = bboxOrZero(so["bbox"]);
                span.font = so["font"].toString();
                span.size = so["size"].toDouble(12);
                line.append(span);
            }
            block.lines.append(line);
        }
        page.blocks.append(block);
    }

    for (const auto& iv : po["images"].toArray()) {
        QVector<BBox> rects;
        for (const auto& rv : iv.toObject()["rects"].toArray())
            rects.append(bboxOrZero(rv));
        page.images.append(rects);
    }

    QJsonValue content = po["content"];
    if (content.isString())
        page.content = content.toString().toLatin1();

    return page;
}

} // namespace

MemoryDocument MemoryDocument::fromJson(const QJsonObject& o) {
    MemoryDocument doc;
    for (const auto& pv : o["pages"].toArray())
        doc.m_pages.append(pageFromJson(pv.toObject()));
    if (o.contains("StructTreeRoot"))
        doc.m_root = o["StructTreeRoot"];
    return doc;
}

std::unique_ptr<MemoryDocument> MemoryDocument::fromFile(const QString& path, QString* error) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        if (error) *error = QStringLiteral("cannot open %1: %2").arg(path, f.errorString());
        return nullptr;
    }
    QJsonParseError pe;
    QJsonDocument jd = QJsonDocument::fromJson(f.readAll(), &pe);
    if (pe.error != QJsonParseError::NoError) {
        if (error) *error = QStringLiteral("%1: %2 at offset %3")
                                .arg(path, pe.errorString()).arg(pe.offset);
        return nullptr;
    }
    if (!jd.isObject()) {
        if (error) *error = QStringLiteral("%1: top level is not an object").arg(path);
        return nullptr;
    }
    return std::make_unique<MemoryDocument>(fromJson(jd.object()));
}

bool MemoryDocument::makeIndirect(const StructNode& node) {
    if (node.id == 0 ? m_rejectRoot : m_rejectedTypes.contains(node.type)) {
        qWarning() << "MemoryDocument: Refused indirect object" << node.type << node.id;
        return false;
    }
    m_objects.append(node);
    return true;
}

bool MemoryDocument::writeStructTreeRoot(const QJsonObject& root) {
    if (m_rejectRoot) return false;
    m_root = root;
    m_writes++;
    return true;
}

QVector<Element> MemoryDocument::extractElements(int page) const {
    if (page < 0 || page >= m_pages.size()) return {};
    const Page& p = m_pages[page];

    QVector<Element> out;
    for (int i = 0; i < p.blocks.size(); i++) {
        Element e;
        e.id   = textElementId(page, i);
        e.kind = ElementKind::Text;
        e.bbox = p.blocks[i].bbox;
        e.text = p.blocks[i].text.trimmed();
        e.role = defaultRoleFor(ElementKind::Text);
        out.append(e);
    }
    for (int i = 0; i < p.images.size(); i++) {
        for (int j = 0; j < p.images[i].size(); j++) {
            Element e;
            e.id   = imageElementId(page, i, j);
            e.kind = ElementKind::Image;
            e.bbox = p.images[i][j];
            e.role = defaultRoleFor(ElementKind::Image);
            e.properties["alt_text"] = QString();
            out.append(e);
        }
    }
    return out;
}

QVector<TextPosition> MemoryDocument::textPositions(int page) const {
    if (page < 0 || page >= m_pages.size()) return {};
    const Page& p = m_pages[page];

    QVector<TextPosition> out;
    for (int b = 0; b < p.blocks.size(); b++) {
        const Block& block = p.blocks[b];
        QVector<QVector<Span>> lines = block.lines;
        if (lines.isEmpty())
            lines.append(QVector<Span>{Span{block.text, block.bbox, QString(), 12}});

        for (int l = 0; l < lines.size(); l++) {
            for (int s = 0; s < lines[l].size(); s++) {
                const Span& span = lines[l][s];
                QString text = span.text.trimmed();
                if (text.isEmpty()) continue;
                TextPosition tp;
                tp.elementId = textElementId(page, b);
                tp.text      = text;
                tp.bbox      = span.bbox;
                tp.font      = span.font;
                tp.size      = span.size;
                tp.blockIdx  = b;
                tp.lineIdx   = l;
                tp.spanIdx   = s;
                out.append(tp);
            }
        }
    }
    return out;
}

bool MemoryDocument::readContentStream(int page, QByteArray* out) const {
    if (page < 0 || page >= m_pages.size()) return false;
    const auto& content = m_pages[page].content;
    if (!content) return false;
    if (out) *out = *content;
    return true;
}

bool MemoryDocument::applyInfo(const DocumentInfo& info, bool marked) {
    m_info   = info;
    m_marked = marked;
    return true;
}

} // namespace tsm
