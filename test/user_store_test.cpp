#include "gtest/gtest.h"
#include "storage/user_store.hpp"
#include <limits>

using namespace userapi;

class UserStoreTest : public ::testing::Test {
protected:
    UserStore store;

    void addUsers(int count) {
        for (int i = 1; i <= count; ++i)
            store.addUser(User{i, "user" + std::to_string(i), "user" + std::to_string(i) + "@example.com"});
    }
};

TEST_F(UserStoreTest, AddThenGet) {
    User alice{1, "Alice", "alice@example.com"};
    store.addUser(alice);

    auto found = store.getUser(1);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, alice);
    EXPECT_FALSE(store.getUser(2).has_value());
}

TEST_F(UserStoreTest, ListDefaultsToFirstTen) {
    addUsers(12);
    auto users = store.listUsers();
    ASSERT_EQ(users.size(), 10u);
    EXPECT_EQ(users.front().id, 1);
    EXPECT_EQ(users.back().id, 10);
}

TEST_F(UserStoreTest, ListPaging) {
    addUsers(5);

    auto second = store.listUsers(2, 2);
    ASSERT_EQ(second.size(), 2u);
    EXPECT_EQ(second[0].id, 3);
    EXPECT_EQ(second[1].id, 4);

    auto last = store.listUsers(3, 2);
    ASSERT_EQ(last.size(), 1u);
    EXPECT_EQ(last[0].id, 5);

    EXPECT_TRUE(store.listUsers(4, 2).empty());
    EXPECT_TRUE(store.listUsers(std::numeric_limits<int64_t>::max(), 2).empty());
    EXPECT_EQ(store.listUsers(1, std::numeric_limits<int64_t>::max()).size(), 5u);
}

TEST_F(UserStoreTest, ListNonPositiveArgumentsAreEmpty) {
    addUsers(3);
    EXPECT_TRUE(store.listUsers(0, 10).empty());
    EXPECT_TRUE(store.listUsers(-1, 10).empty());
    EXPECT_TRUE(store.listUsers(1, 0).empty());
    EXPECT_TRUE(store.listUsers(1, -5).empty());
}

TEST_F(UserStoreTest, UpdateKeepsPosition) {
    addUsers(3);
    EXPECT_TRUE(store.updateUser(2, User{2, "Bob", "bob@example.com"}));

    auto users = store.listUsers();
    ASSERT_EQ(users.size(), 3u);
    EXPECT_EQ(users[1], (User{2, "Bob", "bob@example.com"}));
}

TEST_F(UserStoreTest, UpdateMissingDoesNothing) {
    addUsers(2);
    auto before = store.listUsers();
    EXPECT_FALSE(store.updateUser(9, User{9, "Nobody", "nobody@example.com"}));
    EXPECT_EQ(store.listUsers(), before);
}

TEST_F(UserStoreTest, AddAcceptsDuplicateIds) {
    store.addUser(User{1, "First", "first@example.com"});
    store.addUser(User{1, "Second", "second@example.com"});
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.getUser(1)->name, "First");
}

TEST_F(UserStoreTest, AddIfAbsentRejectsDuplicateIds) {
    EXPECT_TRUE(store.addUserIfAbsent(User{1, "First", "first@example.com"}));
    EXPECT_FALSE(store.addUserIfAbsent(User{1, "Second", "second@example.com"}));
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.getUser(1)->name, "First");
}

TEST_F(UserStoreTest, DeleteRemovesAllMatches) {
    store.addUser(User{1, "A", "a@example.com"});
    store.addUser(User{2, "B", "b@example.com"});
    store.addUser(User{1, "C", "c@example.com"});

    EXPECT_EQ(store.deleteUser(1), 2u);
    EXPECT_FALSE(store.getUser(1).has_value());
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.deleteUser(1), 0u);
}
