#include <gtest/gtest.h>
#include <profiling/profile_kind.hpp>

TEST(ProfileKind, Endpoints) {
    EXPECT_EQ(profile_endpoint(ProfileKind::Heap).value(), "/debug/pprof/heap");
    EXPECT_EQ(profile_endpoint(ProfileKind::CPU).value(), "/debug/pprof/profile");
    EXPECT_EQ(profile_endpoint(ProfileKind::Block).value(), "/debug/pprof/block");
    EXPECT_EQ(profile_endpoint(ProfileKind::Trace).value(), "/debug/pprof/trace");
    EXPECT_EQ(profile_endpoint(ProfileKind::MemAllocs).value(), "/debug/pprof/allocs");
    EXPECT_EQ(profile_endpoint(ProfileKind::Mutex).value(), "/debug/pprof/mutex");
    EXPECT_EQ(profile_endpoint(ProfileKind::Goroutine).value(), "/debug/pprof/goroutine");
    EXPECT_EQ(profile_endpoint(ProfileKind::ThreadCreate).value(), "/debug/pprof/threadcreate");
}

TEST(ProfileKind, SentinelAndOutOfRange) {
    EXPECT_FALSE(is_supported(ProfileKind::Unknown));
    EXPECT_FALSE(profile_endpoint(ProfileKind::Unknown).has_value());
    EXPECT_FALSE(is_supported(static_cast<ProfileKind>(profile_kind_count())));
    EXPECT_FALSE(is_supported(static_cast<ProfileKind>(-1)));
    EXPECT_EQ(profile_name(static_cast<ProfileKind>(42)), "unknown");
}

TEST(ProfileKind, ParseNames) {
    EXPECT_EQ(parse_profile_kind("mem-allocs").value(), ProfileKind::MemAllocs);
    EXPECT_EQ(parse_profile_kind("thread-create").value(), ProfileKind::ThreadCreate);
    EXPECT_FALSE(parse_profile_kind("unknown").has_value());
    EXPECT_FALSE(parse_profile_kind("allocs").has_value());
}

TEST(ProfileKind, AllKindsInTableOrder) {
    auto kinds = all_profile_kinds();
    ASSERT_EQ(kinds.size(), 8u);
    EXPECT_EQ(kinds.front(), ProfileKind::Heap);
    EXPECT_EQ(kinds.back(), ProfileKind::ThreadCreate);
    for (auto kind : kinds) {
        EXPECT_EQ(parse_profile_kind(profile_name(kind)).value(), kind);
    }
}

TEST(ProfileKind, DurationKinds) {
    EXPECT_TRUE(takes_duration(ProfileKind::CPU));
    EXPECT_TRUE(takes_duration(ProfileKind::Trace));
    EXPECT_FALSE(takes_duration(ProfileKind::Heap));
}
