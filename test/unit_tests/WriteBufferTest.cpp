#include "WriteBuffer.hpp"

#include "TestHeaders.hpp"

using namespace st;

TEST_CASE("WriteBuffer basic operations", "[WriteBuffer]") {
  WriteBuffer buffer;

  SECTION("Empty buffer state") {
    REQUIRE(buffer.canAcceptMore() == true);
    REQUIRE(buffer.hasPendingData() == false);
    REQUIRE(buffer.size() == 0);
    REQUIRE(buffer.frameCount() == 0);

    size_t count;
    const char *data = buffer.peekData(&count);
    REQUIRE(data == nullptr);
    REQUIRE(count == 0);
  }

  SECTION("Enqueue and peek") {
    REQUIRE(buffer.enqueue("\xc0\x0ahi\xc0"));
    REQUIRE(buffer.hasPendingData() == true);
    REQUIRE(buffer.size() == 5);

    size_t count;
    const char *data = buffer.peekData(&count);
    REQUIRE(data != nullptr);
    REQUIRE(count == 5);
    REQUIRE(string(data, count) == "\xc0\x0ahi\xc0");
  }

  SECTION("Partial write keeps the frame at the front") {
    buffer.enqueue("frame1");
    buffer.enqueue("frame2");
    buffer.consume(2);
    REQUIRE(buffer.size() == 10);
    REQUIRE(buffer.frameCount() == 2);

    size_t count;
    const char *data = buffer.peekData(&count);
    REQUIRE(string(data, count) == "ame1");
  }

  SECTION("Consume across frames") {
    buffer.enqueue("abc");
    buffer.enqueue("defgh");
    buffer.consume(5);
    REQUIRE(buffer.size() == 3);
    REQUIRE(buffer.frameCount() == 1);

    size_t count;
    const char *data = buffer.peekData(&count);
    REQUIRE(string(data, count) == "fgh");
  }

  SECTION("Drain returns everything in order") {
    buffer.enqueue("abc");
    buffer.enqueue("def");
    buffer.consume(1);
    REQUIRE(buffer.drain() == "bcdef");
    REQUIRE(!buffer.hasPendingData());
    REQUIRE(buffer.size() == 0);
  }

  SECTION("Clear buffer") {
    buffer.enqueue("hello");
    buffer.enqueue("world");
    buffer.clear();

    REQUIRE(buffer.hasPendingData() == false);
    REQUIRE(buffer.size() == 0);
    REQUIRE(buffer.canAcceptMore() == true);
  }

  SECTION("Empty frame is ignored") {
    REQUIRE(buffer.enqueue(""));
    REQUIRE(buffer.hasPendingData() == false);
  }
}

TEST_CASE("WriteBuffer backpressure", "[WriteBuffer]") {
  WriteBuffer buffer;

  string largeFrame(WriteBuffer::MAX_BUFFER_SIZE, 'x');
  REQUIRE(buffer.enqueue(largeFrame));
  REQUIRE(buffer.canAcceptMore() == false);

  REQUIRE(!buffer.enqueue("late"));
  REQUIRE(buffer.getDroppedFrames() == 1);
  REQUIRE(buffer.size() == WriteBuffer::MAX_BUFFER_SIZE);

  buffer.consume(1024);
  REQUIRE(buffer.canAcceptMore() == true);
  REQUIRE(buffer.enqueue("late"));
  REQUIRE(buffer.frameCount() == 2);
}
