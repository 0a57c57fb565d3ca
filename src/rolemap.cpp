#include "rolemap.h"
#include <QSet>

namespace tsm {

static QString stripNamePrefix(const QString& s) {
    return s.startsWith(QLatin1Char('/')) ? s.mid(1) : s;
}

bool isStandardRole(const QString& tag) {
    for (const auto& r : kStandardRoles)
        if (tag == QLatin1String(r.tag)) return true;
    return false;
}

QStringList standardRoleTags() {
    QStringList out;
    out.reserve(kStandardRoleCount);
    for (const auto& r : kStandardRoles)
        out.append(QString::fromLatin1(r.tag));
    return out;
}

RoleMap RoleMap::standard() {
    RoleMap m;
    m.mergeStandard();
    return m;
}

RoleMap RoleMap::fromJson(const QJsonObject& o) {
    RoleMap m;
    for (auto it = o.begin(); it != o.end(); ++it) {
        QString tag = stripNamePrefix(it.key());
        QString target = stripNamePrefix(it.value().toString());
        if (tag.isEmpty() || target.isEmpty()) continue;
        m.m_map.insert(tag, target);
    }
    return m;
}

int RoleMap::mergeStandard() {
    int added = 0;
    for (const auto& r : kStandardRoles) {
        if (insert(QString::fromLatin1(r.tag), QString::fromLatin1(r.standard)))
            added++;
    }
    return added;
}

bool RoleMap::insert(const QString& tag, const QString& target) {
    if (tag.isEmpty() || target.isEmpty() || m_map.contains(tag))
        return false;
    m_map.insert(tag, target);
    return true;
}

QString RoleMap::resolve(const QString& tag) const {
    QSet<QString> visited;
    QString cur = tag;
    while (m_map.contains(cur)) {
        if (visited.contains(cur)) return {};
        visited.insert(cur);
        QString next = m_map.value(cur);
        // A standard tag mapped onto itself terminates the chain.
        if (next == cur) return isStandardRole(cur) ? cur : QString();
        cur = next;
    }
    return isStandardRole(cur) ? cur : QString();
}

bool RoleMap::isResolvable(const QString& tag) const {
    if (!m_map.contains(tag)) return false;
    return !resolve(tag).isEmpty();
}

QJsonObject RoleMap::toJson() const {
    QJsonObject o;
    for (auto it = m_map.begin(); it != m_map.end(); ++it)
        o[it.key()] = it.value();
    return o;
}

} // namespace tsm
