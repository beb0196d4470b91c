#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <asbridge/handle.hpp>

TEST(handle_arena, emplace_and_get)
{
    asbridge::handle_arena<std::string> arena;
    EXPECT_TRUE(arena.empty());

    asbridge::handle_id id = arena.emplace("hello");
    ASSERT_TRUE(id);
    EXPECT_EQ(arena.size(), 1);

    std::string* str = arena.get(id);
    ASSERT_TRUE(str != nullptr);
    EXPECT_EQ(*str, "hello");

    // Addresses stay valid while other objects are added
    for(int i = 0; i < 100; ++i)
        (void)arena.emplace(std::to_string(i));
    EXPECT_EQ(arena.get(id), str);
    EXPECT_EQ(arena.size(), 101);
}

TEST(handle_arena, null_id)
{
    asbridge::handle_arena<int> arena;
    (void)arena.emplace(1);

    asbridge::handle_id null_id;
    EXPECT_FALSE(null_id);
    EXPECT_FALSE(arena.contains(null_id));
    EXPECT_EQ(arena.get(null_id), nullptr);
    EXPECT_FALSE(arena.erase(null_id));
}

TEST(handle_arena, stale_after_erase)
{
    asbridge::handle_arena<int> arena;

    asbridge::handle_id a = arena.emplace(1);
    EXPECT_TRUE(arena.erase(a));
    EXPECT_FALSE(arena.erase(a));
    EXPECT_FALSE(arena.contains(a));

    // The slot is reused with a new generation
    asbridge::handle_id b = arena.emplace(2);
    EXPECT_EQ(b.index, a.index);
    EXPECT_NE(b.generation, a.generation);
    EXPECT_EQ(arena.get(a), nullptr);
    ASSERT_TRUE(arena.contains(b));
    EXPECT_EQ(*arena.get(b), 2);
}

TEST(handle_arena, clear)
{
    asbridge::handle_arena<std::shared_ptr<int>> arena;

    auto shared = std::make_shared<int>(42);
    asbridge::handle_id a = arena.emplace(shared);
    asbridge::handle_id b = arena.emplace(shared);
    EXPECT_EQ(shared.use_count(), 3);

    arena.clear();
    EXPECT_TRUE(arena.empty());
    EXPECT_EQ(shared.use_count(), 1);
    EXPECT_FALSE(arena.contains(a));
    EXPECT_FALSE(arena.contains(b));

    asbridge::handle_id c = arena.emplace(nullptr);
    EXPECT_TRUE(arena.contains(c));
    EXPECT_FALSE(arena.contains(a));
    EXPECT_FALSE(arena.contains(b));
}

namespace test_handle
{
struct picky
{
    explicit picky(int val)
        : val(val)
    {
        if(val < 0)
            throw std::invalid_argument("negative");
    }

    int val;
};
} // namespace test_handle

TEST(handle_arena, throwing_constructor)
{
    using test_handle::picky;
    asbridge::handle_arena<picky> arena;

    EXPECT_THROW((void)arena.emplace(-1), std::invalid_argument);
    EXPECT_TRUE(arena.empty());

    // The failed construction did not take a slot
    asbridge::handle_id a = arena.emplace(1);
    EXPECT_EQ(a.index, 0);
    EXPECT_EQ(a.generation, 1);

    EXPECT_TRUE(arena.erase(a));
    EXPECT_THROW((void)arena.emplace(-2), std::invalid_argument);
    EXPECT_TRUE(arena.empty());
    EXPECT_FALSE(arena.contains(a));

    // The free slot is still available
    asbridge::handle_id b = arena.emplace(2);
    EXPECT_EQ(b.index, a.index);
    EXPECT_EQ(arena.get(b)->val, 2);
    EXPECT_EQ(arena.size(), 1);

    asbridge::handle_id c = arena.emplace(3);
    EXPECT_EQ(c.index, 1);
    arena.clear();
    EXPECT_TRUE(arena.empty());
    EXPECT_FALSE(arena.contains(b));
    EXPECT_FALSE(arena.contains(c));
}

int main(int argc, char* argv[])
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
