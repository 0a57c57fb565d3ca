#include "reconciler.h"
#include <QDebug>
#include <QHash>
#include <QSet>

namespace tsm {

Element applyOverride(const Element& extracted, const SidecarOverride& ov) {
    Element e = extracted;
    if (ov.role) e.role = *ov.role;
    if (ov.bbox) e.bbox = *ov.bbox;
    if (ov.text) e.text = *ov.text;
    for (auto it = ov.properties.begin(); it != ov.properties.end(); ++it)
        e.properties[it.key()] = it.value();
    return e;
}

Element synthesizeElement(const SidecarOverride& ov) {
    Element e;
    e.id         = ov.id;
    e.kind       = kindFromElementId(ov.id);
    e.bbox       = ov.bbox ? *ov.bbox : kSyntheticBBox;
    e.text       = ov.text ? *ov.text : QString();
    e.role       = ov.role ? *ov.role : QStringLiteral("P");
    e.properties = ov.properties;
    return e;
}

ReconcileResult reconcile(int page, const QVector<Element>& extracted,
                          const QVector<SidecarOverride>& overrides) {
    ReconcileResult r;

    // Overrides by id; a repeated id merges into the first entry's slot.
    QHash<QString, int> ovIndex;
    QVector<SidecarOverride> ovs;
    ovs.reserve(overrides.size());
    for (const auto& ov : overrides) {
        auto it = ovIndex.find(ov.id);
        if (it == ovIndex.end()) {
            ovIndex.insert(ov.id, ovs.size());
            ovs.append(ov);
        } else {
            ovs[it.value()].mergeFrom(ov);
        }
    }

    QSet<QString> seen;
    r.elements.reserve(extracted.size() + ovs.size());
    for (const auto& e : extracted) {
        if (seen.contains(e.id)) {
            qWarning() << "Reconciler: Duplicate extracted id dropped:" << e.id << "page" << page;
            r.diagnostics.append({Severity::Warning, page,
                                  QStringLiteral("duplicate extracted element %1 dropped").arg(e.id)});
            continue;
        }
        seen.insert(e.id);

        auto it = ovIndex.constFind(e.id);
        if (it != ovIndex.constEnd()) {
            r.elements.append(applyOverride(e, ovs[it.value()]));
            r.patched++;
        } else {
            r.elements.append(e);
        }
    }

    for (const auto& ov : ovs) {
        if (seen.contains(ov.id)) continue;
        seen.insert(ov.id);
        r.elements.append(synthesizeElement(ov));
        r.synthesized++;
    }

    qDebug() << "Reconciler: page" << page << "-" << extracted.size() << "extracted,"
             << r.patched << "patched," << r.synthesized << "sidecar-only";
    return r;
}

} // namespace tsm
