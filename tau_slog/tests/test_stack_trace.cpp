#include <gtest/gtest.h>

#include <string>

#include "../include/tau_slog/stack_trace.hpp"

using tau::slog::StackSnapshot;

static size_t count_of(const std::string& haystack, const std::string& needle)
{
  size_t n = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size()))
  {
    ++n;
  }
  return n;
}

TEST(StackSnapshot, CapturesFrames)
{
  auto snapshot = StackSnapshot::Capture();
  EXPECT_FALSE(snapshot.Empty());
  EXPECT_LE(snapshot.Depth(), static_cast<size_t>(TAU_SLOG_STACK_DEPTH));
}

TEST(StackSnapshot, DepthIsBounded)
{
  auto snapshot = StackSnapshot::Capture(0, 2);
  EXPECT_GE(snapshot.Depth(), 1u);
  EXPECT_LE(snapshot.Depth(), 2u);
}

TEST(StackSnapshot, FormatLayout)
{
  auto snapshot = StackSnapshot::Capture();
  std::string out = snapshot.Format("boom");

  EXPECT_EQ(out.rfind("boom:\n\n", 0), 0u);
  EXPECT_EQ(count_of(out, "(...)\n\t"), snapshot.Depth());
  EXPECT_EQ(out.back(), '\n');
}

TEST(StackSnapshot, SkipPastBottomIsEmpty)
{
  auto snapshot = StackSnapshot::Capture(10000);
  EXPECT_TRUE(snapshot.Empty());
  EXPECT_EQ(snapshot.Format("desc"), "desc:\n\n");
}
