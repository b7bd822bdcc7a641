#include <gtest/gtest.h>
#include "collectors/mev_share_collector.hpp"
#include "common/errors.hpp"

// Nothing listens on the discard port of the loopback interface, so the
// first connection attempt is refused straight away.
TEST(MevShareCollector, UnreachableSourceFailsToOpen) {
  HttpClientTuning tuning;
  tuning.connect_timeout_ms = 1000;
  tuning.enable_http2 = false;
  MevShareCollector collector("http://127.0.0.1:9/", ReconnectPolicy{10, 20}, tuning);
  EXPECT_EQ(collector.Name(), "mev-share");
  try {
    collector.GetEventStream();
    FAIL() << "expected SourceUnavailable";
  } catch (const SourceUnavailable& e) {
    EXPECT_NE(std::string(e.what()).find("http://127.0.0.1:9/"), std::string::npos);
  }
}

TEST(MevShareCollector, StreamEndsAfterFailedOpen) {
  HttpClientTuning tuning;
  tuning.connect_timeout_ms = 1000;
  MevShareEventStream stream("http://127.0.0.1:9/", ReconnectPolicy{10, 20}, tuning);
  EXPECT_THROW(stream.WaitUntilOpen(), SourceUnavailable);
  EXPECT_FALSE(stream.Next().has_value());
}
