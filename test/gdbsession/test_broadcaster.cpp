#include <doctest/doctest.h>

#include <memory>
#include <string>

#include "gdbsession/channel/broadcaster.hpp"
#include "recording_channel.hpp"

using gdbsession::broadcaster;
using gdbsession::test::recording_channel;

TEST_CASE("broadcaster delivers to every subscriber once") {
  broadcaster fanout;
  auto first = std::make_shared<recording_channel>();
  auto second = std::make_shared<recording_channel>();

  CHECK(fanout.subscribe(first));
  CHECK(fanout.subscribe(second));
  CHECK_FALSE(fanout.subscribe(first));
  CHECK_FALSE(fanout.subscribe(nullptr));
  CHECK(fanout.subscribers() == 2);

  CHECK(fanout.broadcast(R"({"type":"console","payload":"hi"})") == 2);
  CHECK(first->take().size() == 1);
  CHECK(second->take().size() == 1);
}

TEST_CASE("broadcaster drops a channel that refuses a message") {
  broadcaster fanout;
  auto healthy = std::make_shared<recording_channel>();
  auto stuck = std::make_shared<recording_channel>();
  fanout.subscribe(healthy);
  fanout.subscribe(stuck);

  stuck->refuse();
  CHECK(fanout.broadcast(R"({"type":"console","payload":"a"})") == 1);
  CHECK(fanout.subscribers() == 1);
  CHECK_FALSE(stuck->open());
  CHECK(healthy->open());

  CHECK(fanout.broadcast(R"({"type":"console","payload":"b"})") == 1);
  CHECK(healthy->take().size() == 2);
}

TEST_CASE("unsubscribe leaves the channel open and tracks idle time") {
  broadcaster fanout;
  auto created = fanout.idle_since();
  auto target = std::make_shared<recording_channel>();
  fanout.subscribe(target);

  CHECK(fanout.unsubscribe(target.get()));
  CHECK_FALSE(fanout.unsubscribe(target.get()));
  CHECK(target->open());
  CHECK(fanout.subscribers() == 0);
  CHECK(fanout.idle_since() >= created);
  CHECK(fanout.broadcast(R"({"type":"console","payload":"x"})") == 0);
  CHECK(target->take().empty());
}

TEST_CASE("send_to reaches one channel and close_all closes the rest") {
  broadcaster fanout;
  auto first = std::make_shared<recording_channel>();
  auto second = std::make_shared<recording_channel>();
  fanout.subscribe(first);
  fanout.subscribe(second);

  CHECK(fanout.send_to(first, R"({"type":"error","payload":"only you"})"));
  CHECK(first->take().size() == 1);
  CHECK(second->take().empty());

  fanout.close_all();
  CHECK(fanout.subscribers() == 0);
  CHECK_FALSE(first->open());
  CHECK_FALSE(second->open());
  CHECK_FALSE(fanout.send_to(first, R"({"type":"error","payload":"late"})"));
}
