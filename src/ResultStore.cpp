#include "ResultStore.h"

#include <QDebug>

void ResultStore::put(const QString &qualifiedName, const QString &text) {
    QWriteLocker locker(&m_lock);
    m_units.insert(qualifiedName, text);
}

QString ResultStore::get(const QString &qualifiedName, bool *found) const {
    QReadLocker locker(&m_lock);
    auto it = m_units.constFind(qualifiedName);
    if (found) *found = (it != m_units.constEnd());
    if (it == m_units.constEnd()) return QString();
    return it.value();
}

bool ResultStore::contains(const QString &qualifiedName) const {
    QReadLocker locker(&m_lock);
    return m_units.contains(qualifiedName);
}

void ResultStore::clear() {
    QWriteLocker locker(&m_lock);
    qDebug() << "[Store] Dropping" << m_units.size() << "unit(s)";
    m_units.clear();
}

QStringList ResultStore::allNames() const {
    QReadLocker locker(&m_lock);
    return m_units.keys();
}

int ResultStore::size() const {
    QReadLocker locker(&m_lock);
    return m_units.size();
}

QString ResultStore::textForDisplay(const QString &qualifiedName) const {
    bool found = false;
    QString text = get(qualifiedName, &found);
    if (!found)
        return QString("// Class not found: %1").arg(qualifiedName);
    if (text.isNull())
        return QString("// Error decompiling class: %1").arg(qualifiedName);
    return text;
}
