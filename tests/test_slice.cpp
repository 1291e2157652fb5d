/*
 * Slice tests - TPipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <tpipe/op/slice.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace tpipe;

// Counts how many items were pulled so laziness can be checked.
class VecPipe : public Pipe {
public:
    VecPipe(std::size_t n, std::size_t* pulled) : m_n(n), m_pulled(pulled) {}
    std::optional<Item> next() override {
        if (m_i >= m_n) return std::nullopt;
        ++*m_pulled;
        return Item{std::to_string(m_i++)};
    }
private:
    std::size_t m_n;
    std::size_t m_i = 0;
    std::size_t* m_pulled;
};

using Ranges = std::vector<Bounds<std::size_t>>;

static std::vector<std::string> run_slice(std::size_t n, const Ranges& ranges, std::size_t* pulled = nullptr) {
    std::size_t local = 0;
    SlicePipe s(std::make_unique<VecPipe>(n, pulled ? pulled : &local), ranges);
    std::vector<std::string> out;
    while (auto item = s.next()) out.push_back(item_text(std::move(*item)));
    return out;
}

TEST(SliceUnion, OverlappingRanges) {
    Ranges r{{0, 5}, {7, 10}, {3, 9}};
    auto out = run_slice(11, r);
    EXPECT_EQ(out.size(), 11u);
    EXPECT_EQ(out.front(), "0");
    EXPECT_EQ(out.back(), "10");
}

TEST(SliceUnion, GapsAreDropped) {
    Ranges r{{1, 2}, {5, 5}};
    EXPECT_EQ(run_slice(10, r), (std::vector<std::string>{"1", "2", "5"}));
}

TEST(SliceUnion, OpenBounds) {
    Ranges r{{std::nullopt, 1}, {8, std::nullopt}};
    EXPECT_EQ(run_slice(10, r), (std::vector<std::string>{"0", "1", "8", "9"}));
}

TEST(SliceLazy, StopsPullingAfterLastRange) {
    std::size_t pulled = 0;
    Ranges r{{std::nullopt, 2}};
    EXPECT_EQ(run_slice(1000, r, &pulled).size(), 3u);
    EXPECT_EQ(pulled, 3u);
}

TEST(SliceEdge, InvertedAndEmpty) {
    std::size_t pulled = 0;
    Ranges inverted{{5, 2}};
    EXPECT_TRUE(run_slice(10, inverted, &pulled).empty());
    EXPECT_EQ(pulled, 0u);
    EXPECT_TRUE(run_slice(10, Ranges{}).empty());
}

TEST(SliceParse, SingleIndexAndBounds) {
    auto one = parse_slice_range("4");
    ASSERT_TRUE(one);
    EXPECT_EQ(*one->min, 4u);
    EXPECT_EQ(*one->max, 4u);
    EXPECT_FALSE(parse_slice_range(","));
    EXPECT_FALSE(parse_slice_range("-1,3"));
    EXPECT_FALSE(parse_slice_range("a"));
}
