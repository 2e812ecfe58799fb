#pragma once

#include <QChar>
#include <QString>
#include <QStringList>
#include <memory>
#include <vector>

class PackageNode;
class MemberNode;

// A node of the class tree: either a package or a decompiled member.
class NamespaceNode {
public:
    enum class Kind { Package, Member };

    virtual ~NamespaceNode() = default;

    Kind kind() const { return m_kind; }
    virtual QString label() const = 0;

    // nullptr when the node is of the other kind
    const PackageNode *asPackage() const;
    const MemberNode  *asMember() const;

protected:
    explicit NamespaceNode(Kind kind) : m_kind(kind) {}

private:
    Kind m_kind;
};

class MemberNode : public NamespaceNode {
public:
    MemberNode(const QString &displayName, const QString &qualifiedName);

    QString label() const override { return m_displayName; }
    const QString &displayName() const { return m_displayName; }
    const QString &qualifiedName() const { return m_qualifiedName; }

private:
    QString m_displayName;
    QString m_qualifiedName;
};

class PackageNode : public NamespaceNode {
public:
    explicit PackageNode(const QString &segment = QString());

    QString label() const override { return m_segment; }
    const QString &segment() const { return m_segment; }

    int childCount() const { return static_cast<int>(m_children.size()); }
    const NamespaceNode *childAt(int index) const;
    const PackageNode *childPackage(const QString &segment) const;
    const MemberNode *childMember(const QString &displayName) const;

    // Recursive lookups
    int memberCount() const;
    const MemberNode *findMember(const QString &qualifiedName) const;

    PackageNode *addPackage(const QString &segment);
    // A member with the same display name is replaced in place.
    MemberNode *addMember(const QString &displayName, const QString &qualifiedName);

private:
    QString m_segment;
    std::vector<std::unique_ptr<NamespaceNode>> m_children;
};

using NamespaceTreePtr = std::shared_ptr<const PackageNode>;

// Builds the package hierarchy for a flat list of qualified names.
// Names are deduplicated and visited in lexicographic order, so sibling order
// is the order in which each prefix first appears in that sequence.
std::unique_ptr<PackageNode> buildNamespaceTree(const QStringList &qualifiedNames,
                                                QChar delimiter = QChar('/'));
