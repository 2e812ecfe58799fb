#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "ResultStore.h"

TEST(ResultStoreTest, PutThenGet) {
    ResultStore store;
    store.put("com/example/Foo", "class Foo {}");

    bool found = false;
    EXPECT_EQ(store.get("com/example/Foo", &found), "class Foo {}");
    EXPECT_TRUE(found);
    EXPECT_TRUE(store.contains("com/example/Foo"));
    EXPECT_EQ(store.size(), 1);
}

TEST(ResultStoreTest, PutOverwrites) {
    ResultStore store;
    store.put("Foo", "v1");
    store.put("Foo", "v2");
    EXPECT_EQ(store.get("Foo"), "v2");
    EXPECT_EQ(store.size(), 1);
}

TEST(ResultStoreTest, MissingNameIsNull) {
    ResultStore store;
    bool found = true;
    QString text = store.get("nope", &found);
    EXPECT_TRUE(text.isNull());
    EXPECT_FALSE(found);
}

TEST(ResultStoreTest, EmptyTextIsStillPresent) {
    ResultStore store;
    store.put("Empty", QString(""));
    bool found = false;
    QString text = store.get("Empty", &found);
    EXPECT_TRUE(found);
    EXPECT_FALSE(text.isNull());
    EXPECT_TRUE(text.isEmpty());
}

TEST(ResultStoreTest, ClearDropsEverything) {
    ResultStore store;
    store.put("a/A", "x");
    store.put("b/B", "y");
    store.clear();
    EXPECT_EQ(store.size(), 0);
    EXPECT_TRUE(store.allNames().isEmpty());
    EXPECT_FALSE(store.contains("a/A"));
}

TEST(ResultStoreTest, AllNamesAreSorted) {
    ResultStore store;
    store.put("z/Z", "");
    store.put("a/b/C", "");
    store.put("a/A", "");
    EXPECT_EQ(store.allNames(), (QStringList{"a/A", "a/b/C", "z/Z"}));
}

TEST(ResultStoreTest, DisplayTextPlaceholders) {
    ResultStore store;
    store.put("ok/Good", "class Good {}");
    store.put("bad/Broken", QString());

    EXPECT_EQ(store.textForDisplay("ok/Good"), "class Good {}");
    EXPECT_EQ(store.textForDisplay("bad/Broken"), "// Error decompiling class: bad/Broken");
    EXPECT_EQ(store.textForDisplay("missing/Gone"), "// Class not found: missing/Gone");
}

TEST(ResultStoreTest, ConcurrentWritersAndReaders) {
    ResultStore store;
    const int perWriter = 500;

    std::vector<std::thread> threads;
    for (int w = 0; w < 4; ++w) {
        threads.emplace_back([&store, w, perWriter]() {
            for (int i = 0; i < perWriter; ++i)
                store.put(QString("w%1/C%2").arg(w).arg(i), QString::number(i));
        });
    }
    threads.emplace_back([&store]() {
        for (int i = 0; i < 200; ++i) {
            const QStringList names = store.allNames();
            for (const QString &name : names)
                EXPECT_TRUE(store.contains(name));
        }
    });
    for (auto &t : threads) t.join();

    EXPECT_EQ(store.size(), 4 * perWriter);
    EXPECT_EQ(store.get("w3/C499"), "499");
}
