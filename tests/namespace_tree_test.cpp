#include <gtest/gtest.h>
#include "NamespaceTree.h"

namespace {

// Indented outline: "+pkg" for packages, "-Name=qualified" for members.
QString outline(const PackageNode &pkg, int depth = 0) {
    QString out;
    for (int i = 0; i < pkg.childCount(); ++i) {
        const NamespaceNode *child = pkg.childAt(i);
        out += QString(depth * 2, ' ');
        if (const PackageNode *sub = child->asPackage()) {
            out += "+" + sub->segment() + "\n";
            out += outline(*sub, depth + 1);
        } else {
            const MemberNode *member = child->asMember();
            out += "-" + member->displayName() + "=" + member->qualifiedName() + "\n";
        }
    }
    return out;
}

// Follows the segments of a name down from the root.
const MemberNode *walk(const PackageNode &root, const QString &name) {
    const QStringList parts = name.split('/', Qt::SkipEmptyParts);
    const PackageNode *current = &root;
    for (int i = 0; i < parts.size() - 1; ++i) {
        current = current->childPackage(parts[i]);
        if (!current) return nullptr;
    }
    return current->childMember(parts.last());
}

} // namespace

TEST(NamespaceTreeTest, GroupsMembersUnderPackages) {
    auto root = buildNamespaceTree({"a/B", "a/C", "a/b/D"});

    ASSERT_EQ(root->childCount(), 1);
    const PackageNode *a = root->childPackage("a");
    ASSERT_NE(a, nullptr);
    ASSERT_EQ(a->childCount(), 3);
    EXPECT_NE(a->childMember("B"), nullptr);
    EXPECT_NE(a->childMember("C"), nullptr);

    const PackageNode *b = a->childPackage("b");
    ASSERT_NE(b, nullptr);
    ASSERT_EQ(b->childCount(), 1);
    const MemberNode *d = b->childMember("D");
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(d->qualifiedName(), "a/b/D");
}

TEST(NamespaceTreeTest, EveryNameReachableExactlyOnce) {
    const QStringList names = {
        "org/x/Alpha", "org/x/y/Beta", "org/z/Gamma", "com/Delta", "Epsilon", "org/x/y/z/w/Zeta"
    };
    auto root = buildNamespaceTree(names);

    EXPECT_EQ(root->memberCount(), names.size());
    for (const QString &name : names) {
        const MemberNode *member = walk(*root, name);
        ASSERT_NE(member, nullptr) << name.toStdString();
        EXPECT_EQ(member->qualifiedName(), name);
        EXPECT_EQ(root->findMember(name), member);
    }
}

TEST(NamespaceTreeTest, SiblingOrderFollowsSortedFirstAppearance) {
    auto root = buildNamespaceTree({"b/Y", "a/b/D", "a/C", "a/B", "b/X"});
    EXPECT_EQ(outline(*root),
              "+a\n"
              "  -B=a/B\n"
              "  -C=a/C\n"
              "  +b\n"
              "    -D=a/b/D\n"
              "+b\n"
              "  -X=b/X\n"
              "  -Y=b/Y\n");
}

TEST(NamespaceTreeTest, SameSetInAnyOrderGivesSameTree) {
    const QString first  = outline(*buildNamespaceTree({"p/q/R", "p/S", "T", "p/q/U"}));
    const QString second = outline(*buildNamespaceTree({"p/q/U", "T", "p/S", "p/q/R"}));
    EXPECT_EQ(first, second);
}

TEST(NamespaceTreeTest, SingleSegmentHangsOffRoot) {
    auto root = buildNamespaceTree({"Main"});
    ASSERT_EQ(root->childCount(), 1);
    const MemberNode *member = root->childAt(0)->asMember();
    ASSERT_NE(member, nullptr);
    EXPECT_EQ(member->displayName(), "Main");
    EXPECT_EQ(member->qualifiedName(), "Main");
    EXPECT_EQ(root->childAt(0)->asPackage(), nullptr);
}

TEST(NamespaceTreeTest, DuplicatesCollapse) {
    auto root = buildNamespaceTree({"x/Y", "x/Y", "x/Y"});
    EXPECT_EQ(root->memberCount(), 1);
    ASSERT_NE(root->childPackage("x"), nullptr);
    EXPECT_EQ(root->childPackage("x")->childCount(), 1);
}

TEST(NamespaceTreeTest, EmptyInputGivesEmptyRoot) {
    auto root = buildNamespaceTree({});
    EXPECT_EQ(root->childCount(), 0);
    EXPECT_EQ(root->memberCount(), 0);
    EXPECT_EQ(root->kind(), NamespaceNode::Kind::Package);
}

TEST(NamespaceTreeTest, SharedPrefixCreatedOnce) {
    auto root = buildNamespaceTree({"a/b/C", "a/b/D", "a/E"});
    ASSERT_EQ(root->childCount(), 1);
    const PackageNode *a = root->childPackage("a");
    ASSERT_NE(a, nullptr);
    int packages = 0;
    for (int i = 0; i < a->childCount(); ++i)
        if (a->childAt(i)->asPackage()) ++packages;
    EXPECT_EQ(packages, 1);
    EXPECT_EQ(a->childPackage("b")->childCount(), 2);
}

TEST(NamespaceTreeTest, EmptySegmentsAreSkipped) {
    auto root = buildNamespaceTree({"a//B", "", "/"});
    EXPECT_EQ(root->memberCount(), 1);
    const MemberNode *b = walk(*root, "a/B");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->qualifiedName(), "a//B");
}

TEST(NamespaceTreeTest, CustomDelimiter) {
    auto root = buildNamespaceTree({"java.lang.String", "java.util.List"}, QChar('.'));
    const PackageNode *java = root->childPackage("java");
    ASSERT_NE(java, nullptr);
    ASSERT_NE(java->childPackage("lang"), nullptr);
    EXPECT_EQ(java->childPackage("lang")->childMember("String")->qualifiedName(), "java.lang.String");
}
