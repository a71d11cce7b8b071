#include <doctest/doctest.h>

#include <faceid/app/frame_source.hpp>

#include "runtime/test_support.hpp"

#include <utility>

using faceid::testing::FakeFrameSource;

TEST_SUITE("faceid::FrameSourceLease") {
  TEST_CASE("FrameSourceLease: Acquire opens and destruction closes") {
    FakeFrameSource source;
    source.frame = faceid::testing::MakeSplitFrame(8, 8);

    {
      auto lease = faceid::FrameSourceLease::Acquire(source);
      REQUIRE(lease.has_value());
      CHECK(lease->Active());
      CHECK(source.IsOpen());

      const auto frame = lease->GrabFrame();
      REQUIRE(frame.has_value());
      CHECK_EQ(frame->Width(), 8);
    }

    CHECK_FALSE(source.IsOpen());
    CHECK_EQ(source.opens, 1U);
    CHECK_EQ(source.closes, 1U);
  }

  TEST_CASE("FrameSourceLease: Open source is busy") {
    FakeFrameSource source;
    auto first = faceid::FrameSourceLease::Acquire(source);
    REQUIRE(first.has_value());

    const auto second = faceid::FrameSourceLease::Acquire(source);
    REQUIRE_FALSE(second.has_value());
    CHECK_EQ(second.error(), faceid::FrameSourceError::kBusy);
    CHECK_EQ(source.opens, 1U);
    CHECK(source.IsOpen());
  }

  TEST_CASE("FrameSourceLease: Open failure") {
    FakeFrameSource source;
    source.fail_open = true;

    const auto lease = faceid::FrameSourceLease::Acquire(source);
    REQUIRE_FALSE(lease.has_value());
    CHECK_EQ(lease.error(), faceid::FrameSourceError::kUnavailable);
    CHECK_EQ(source.closes, 0U);
  }

  TEST_CASE("FrameSourceLease: Moving transfers ownership") {
    FakeFrameSource source;
    auto acquired = faceid::FrameSourceLease::Acquire(source);
    REQUIRE(acquired.has_value());

    faceid::FrameSourceLease moved(std::move(*acquired));
    CHECK(moved.Active());
    CHECK_FALSE(acquired->Active());

    acquired->Release();
    CHECK(source.IsOpen());

    faceid::FrameSourceLease assigned;
    assigned = std::move(moved);
    CHECK(assigned.Active());
    CHECK(source.IsOpen());

    assigned.Release();
    CHECK_FALSE(assigned.Active());
    CHECK_FALSE(source.IsOpen());
    CHECK_EQ(source.closes, 1U);

    assigned.Release();
    CHECK_EQ(source.closes, 1U);
  }

  TEST_CASE("FrameSourceLease: Empty lease") {
    faceid::FrameSourceLease lease;
    CHECK_FALSE(lease);

    const auto frame = lease.GrabFrame();
    REQUIRE_FALSE(frame.has_value());
    CHECK_EQ(frame.error(), faceid::FrameSourceError::kUnavailable);
  }
}
