#include "NamespaceTree.h"

#include <QDebug>
#include <QHash>

const PackageNode *NamespaceNode::asPackage() const {
    return m_kind == Kind::Package ? static_cast<const PackageNode *>(this) : nullptr;
}

const MemberNode *NamespaceNode::asMember() const {
    return m_kind == Kind::Member ? static_cast<const MemberNode *>(this) : nullptr;
}

MemberNode::MemberNode(const QString &displayName, const QString &qualifiedName)
    : NamespaceNode(Kind::Member)
    , m_displayName(displayName)
    , m_qualifiedName(qualifiedName) {}

PackageNode::PackageNode(const QString &segment)
    : NamespaceNode(Kind::Package)
    , m_segment(segment) {}

const NamespaceNode *PackageNode::childAt(int index) const {
    if (index < 0 || index >= childCount()) return nullptr;
    return m_children[index].get();
}

const PackageNode *PackageNode::childPackage(const QString &segment) const {
    for (const auto &child : m_children) {
        const PackageNode *pkg = child->asPackage();
        if (pkg && pkg->segment() == segment) return pkg;
    }
    return nullptr;
}

const MemberNode *PackageNode::childMember(const QString &displayName) const {
    for (const auto &child : m_children) {
        const MemberNode *member = child->asMember();
        if (member && member->displayName() == displayName) return member;
    }
    return nullptr;
}

int PackageNode::memberCount() const {
    int count = 0;
    for (const auto &child : m_children) {
        if (const PackageNode *pkg = child->asPackage())
            count += pkg->memberCount();
        else
            ++count;
    }
    return count;
}

const MemberNode *PackageNode::findMember(const QString &qualifiedName) const {
    for (const auto &child : m_children) {
        if (const MemberNode *member = child->asMember()) {
            if (member->qualifiedName() == qualifiedName) return member;
        } else if (const MemberNode *found = child->asPackage()->findMember(qualifiedName)) {
            return found;
        }
    }
    return nullptr;
}

PackageNode *PackageNode::addPackage(const QString &segment) {
    m_children.push_back(std::make_unique<PackageNode>(segment));
    return static_cast<PackageNode *>(m_children.back().get());
}

MemberNode *PackageNode::addMember(const QString &displayName, const QString &qualifiedName) {
    auto node = std::make_unique<MemberNode>(displayName, qualifiedName);
    MemberNode *raw = node.get();
    for (auto &child : m_children) {
        const MemberNode *existing = child->asMember();
        if (existing && existing->displayName() == displayName) {
            child = std::move(node);
            return raw;
        }
    }
    m_children.push_back(std::move(node));
    return raw;
}

std::unique_ptr<PackageNode> buildNamespaceTree(const QStringList &qualifiedNames, QChar delimiter) {
    auto root = std::make_unique<PackageNode>();

    QStringList names = qualifiedNames;
    names.sort();
    names.removeDuplicates();

    // full prefix ("a/b") -> package node, so shared prefixes are created once
    QHash<QString, PackageNode *> packages;

    for (const QString &name : names) {
        const QStringList parts = name.split(delimiter, Qt::SkipEmptyParts);
        if (parts.isEmpty()) {
            qWarning() << "[Tree] Ignoring name without segments:" << name;
            continue;
        }

        PackageNode *current = root.get();
        QString prefix;
        for (int i = 0; i < parts.size() - 1; ++i) {
            if (!prefix.isEmpty()) prefix += delimiter;
            prefix += parts[i];

            PackageNode *pkg = packages.value(prefix, nullptr);
            if (!pkg) {
                pkg = current->addPackage(parts[i]);
                packages.insert(prefix, pkg);
            }
            current = pkg;
        }
        current->addMember(parts.last(), name);
    }

    qDebug() << "[Tree] Built" << packages.size() << "package(s) for" << names.size() << "name(s)";
    return root;
}
