#include "sidecar.h"
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QHash>
#include <QJsonDocument>
#include <QJsonParseError>

namespace tsm {

namespace {

// Keys older sidecars stored loose on the element instead of in "properties".
const char* const kLooseKeys[] = {"title", "alt_text", "actual_text", "language"};

void appendOrMerge(QVector<SidecarOverride>& list, QHash<QString, int>& index,
                   const SidecarOverride& ov, int page, Diagnostics* diags) {
    auto it = index.find(ov.id);
    if (it == index.end()) {
        index.insert(ov.id, list.size());
        list.append(ov);
        return;
    }
    list[it.value()].mergeFrom(ov);
    qWarning() << "Sidecar: Duplicate element id merged:" << ov.id << "on page" << page;
    if (diags)
        diags->append({Severity::Warning, page,
                       QStringLiteral("duplicate sidecar entry %1 merged").arg(ov.id)});
}

QVector<SidecarOverride> elementsFromJson(const QJsonValue& ev, int page, Diagnostics* diags) {
    QVector<SidecarOverride> list;
    QHash<QString, int> index;

    auto take = [&](const QJsonValue& v, const QString& fallbackId) {
        SidecarOverride ov;
        if (!overrideFromJson(v, fallbackId, &ov)) {
            if (diags)
                diags->append({Severity::Warning, page,
                               QStringLiteral("sidecar entry without id skipped")});
            return;
        }
        appendOrMerge(list, index, ov, page, diags);
    };

    if (ev.isArray()) {
        for (const auto& v : ev.toArray())
            take(v, QString());
    } else if (ev.isObject()) {
        QJsonObject eo = ev.toObject();
        for (auto it = eo.begin(); it != eo.end(); ++it)
            take(it.value(), it.key());
    }
    return list;
}

} // namespace

bool overrideFromJson(const QJsonValue& v, const QString& fallbackId, SidecarOverride* out) {
    if (!v.isObject()) return false;
    const QJsonObject o = v.toObject();

    SidecarOverride ov;
    ov.id = o["id"].toString(fallbackId);
    if (ov.id.isEmpty()) return false;

    ov.properties = o["properties"].toObject();
    for (const char* key : kLooseKeys) {
        QString k = QString::fromLatin1(key);
        if (o.contains(k) && !ov.properties.contains(k))
            ov.properties[k] = o[k];
    }

    if (o["role"].isString())
        ov.role = o["role"].toString();
    else if (ov.properties.value(QStringLiteral("role")).isString())
        ov.role = ov.properties.value(QStringLiteral("role")).toString();
    ov.properties.remove(QStringLiteral("role"));

    if (auto b = BBox::fromJson(o["bbox"]))
        ov.bbox = b;
    else if (auto pb = BBox::fromJson(ov.properties.value(QStringLiteral("bbox"))))
        ov.bbox = pb;
    ov.properties.remove(QStringLiteral("bbox"));

    if (o["text"].isString())
        ov.text = o["text"].toString();

    *out = ov;
    return true;
}

Sidecar Sidecar::forPageCount(int pageCount) {
    Sidecar s;
    for (int i = 0; i < pageCount; i++)
        s.pages.insert(i, {});
    return s;
}

Sidecar Sidecar::fromJson(const QJsonObject& o, Diagnostics* diags) {
    Sidecar s;
    s.document = DocumentInfo::fromJson(o["document"].toObject());

    QJsonValue pv = o["pages"];
    if (pv.isObject()) {
        QJsonObject po = pv.toObject();
        for (auto it = po.begin(); it != po.end(); ++it) {
            bool ok = false;
            int page = it.key().toInt(&ok);
            if (!ok || page < 0) {
                qWarning() << "Sidecar: Ignoring non-numeric page key:" << it.key();
                if (diags)
                    diags->append({Severity::Warning, -1,
                                   QStringLiteral("page key '%1' is not a page index").arg(it.key())});
                continue;
            }
            s.pages.insert(page, elementsFromJson(it.value().toObject()["elements"], page, diags));
        }
    } else if (pv.isArray()) {
        QJsonArray pa = pv.toArray();
        for (int page = 0; page < pa.size(); page++)
            s.pages.insert(page, elementsFromJson(pa[page].toObject()["elements"], page, diags));
    }
    return s;
}

QJsonObject Sidecar::toJson() const {
    QJsonObject pagesObj;
    for (auto it = pages.begin(); it != pages.end(); ++it) {
        QJsonArray elements;
        for (const auto& ov : it.value())
            elements.append(ov.toJson());
        QJsonObject page;
        page["elements"] = elements;
        pagesObj[QString::number(it.key())] = page;
    }

    QJsonObject o;
    o["document"] = document.toJson();
    o["pages"]    = pagesObj;
    return o;
}

bool Sidecar::load(const QString& path, QString* error, Diagnostics* diags) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) *error = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        return false;
    }
    QJsonParseError pe;
    QJsonDocument jdoc = QJsonDocument::fromJson(file.readAll(), &pe);
    if (pe.error != QJsonParseError::NoError || !jdoc.isObject()) {
        if (error) *error = QStringLiteral("%1: not a sidecar document (%2)")
                                .arg(path, pe.errorString());
        return false;
    }
    *this = fromJson(jdoc.object(), diags);
    qDebug() << "Sidecar: Loaded" << elementCount() << "element(s) from" << path;
    return true;
}

bool Sidecar::save(const QString& path, QString* error) const {
    QJsonDocument jdoc(toJson());
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (error) *error = QStringLiteral("cannot write %1: %2").arg(path, file.errorString());
        return false;
    }
    QByteArray bytes = jdoc.toJson(QJsonDocument::Indented);
    if (file.write(bytes) != bytes.size()) {
        if (error) *error = QStringLiteral("short write to %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}

QString Sidecar::defaultPathFor(const QString& documentPath) {
    QFileInfo fi(documentPath);
    return fi.dir().filePath(fi.completeBaseName() + QStringLiteral("_sidecar.json"));
}

const SidecarOverride* Sidecar::findOverride(int page, const QString& id) const {
    auto it = pages.constFind(page);
    if (it == pages.constEnd()) return nullptr;
    for (const auto& ov : it.value())
        if (ov.id == id) return &ov;
    return nullptr;
}

bool Sidecar::updateElement(int page, const QString& id, const QJsonObject& properties) {
    auto it = pages.find(page);
    if (it == pages.end()) {
        qWarning() << "Sidecar: Page" << page << "not found, edit to" << id << "dropped";
        return false;
    }

    SidecarOverride patch;
    patch.id = id;
    patch.properties = properties;
    if (properties["role"].isString())
        patch.role = properties["role"].toString();
    if (auto b = BBox::fromJson(properties["bbox"]))
        patch.bbox = b;
    patch.properties.remove(QStringLiteral("role"));
    patch.properties.remove(QStringLiteral("bbox"));

    for (auto& ov : it.value()) {
        if (ov.id == id) {
            ov.mergeFrom(patch);
            return true;
        }
    }

    if (!patch.role) patch.role = QStringLiteral("P");
    it.value().append(patch);
    qDebug() << "Sidecar: Created entry" << id << "on page" << page;
    return true;
}

int Sidecar::elementCount() const {
    int n = 0;
    for (const auto& list : pages)
        n += list.size();
    return n;
}

} // namespace tsm
