#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "net/sse_client.hpp"

namespace {
std::vector<SseMessage> FeedAll(SseParser& parser, const std::string& text) {
  std::vector<SseMessage> out;
  parser.Feed(text.data(), text.size(), out);
  return out;
}
}

TEST(SseParser, DefaultsEventNameToMessage) {
  SseParser parser;
  auto out = FeedAll(parser, "data: {\"hash\":\"0x01\"}\n\n");
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].event, "message");
  EXPECT_EQ(out[0].data, "{\"hash\":\"0x01\"}");
}

TEST(SseParser, HandlesArbitraryChunking) {
  const std::string stream = "data: first\n\ndata: second\n\n";
  SseParser parser;
  std::vector<SseMessage> out;
  for (char c : stream) parser.Feed(&c, 1, out);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].data, "first");
  EXPECT_EQ(out[1].data, "second");
}

TEST(SseParser, JoinsMultiLineData) {
  SseParser parser;
  auto out = FeedAll(parser, "data: line one\ndata:line two\n\n");
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].data, "line one\nline two");
}

TEST(SseParser, IgnoresCommentsAndKeepAlives) {
  SseParser parser;
  auto out = FeedAll(parser, ": keep-alive\n\n:ping\ndata: x\n\n\n");
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].data, "x");
}

TEST(SseParser, ReadsEventAndIdFields) {
  SseParser parser;
  auto out = FeedAll(parser, "event: ping\nid: 7\ndata: {}\n\ndata: next\n\n");
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].event, "ping");
  EXPECT_EQ(out[0].id, "7");
  // The event name applies to one message only.
  EXPECT_EQ(out[1].event, "message");
}

TEST(SseParser, AcceptsCrlfLineEndings) {
  SseParser parser;
  auto out = FeedAll(parser, "data: a\r\n\r\ndata: b\r\n\r\n");
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].data, "a");
  EXPECT_EQ(out[1].data, "b");
}

TEST(SseParser, ResetDropsPartialMessage) {
  SseParser parser;
  EXPECT_TRUE(FeedAll(parser, "data: half").empty());
  parser.Reset();
  auto out = FeedAll(parser, "data: whole\n\n");
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].data, "whole");
}
