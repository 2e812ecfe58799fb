#pragma once

#include <QMap>
#include <QReadWriteLock>
#include <QString>
#include <QStringList>

// Decompiled source keyed by qualified class name ("pkg/sub/Name").
// Written by the pipeline worker, read by the worker and the GUI thread.
class ResultStore {
public:
    ResultStore() = default;
    ResultStore(const ResultStore &) = delete;
    ResultStore &operator=(const ResultStore &) = delete;

    void put(const QString &qualifiedName, const QString &text);

    // Returns a null QString when the name has no text yet.
    // `found` distinguishes a missing entry from a stored empty text.
    QString get(const QString &qualifiedName, bool *found = nullptr) const;

    bool contains(const QString &qualifiedName) const;
    void clear();

    // Sorted; this is the iteration order for tree building and export.
    QStringList allNames() const;
    int size() const;

    // Stored text, or a placeholder comment when the name is unknown or the
    // engine produced no text for it.
    QString textForDisplay(const QString &qualifiedName) const;

private:
    mutable QReadWriteLock  m_lock;
    QMap<QString, QString>  m_units;
};
