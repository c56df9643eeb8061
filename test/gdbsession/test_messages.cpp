#include <doctest/doctest.h>

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "gdbsession/protocol/messages.hpp"

using gdbsession::action_kind;
using gdbsession::parse_status;
using json = nlohmann::json;

TEST_CASE("parse_action reads every action name") {
  auto run = gdbsession::parse_action_text(R"({"action":"run","args":{"stop_at_entry":true}})");
  REQUIRE(run.ok());
  CHECK(run.request.kind == action_kind::run);
  CHECK(run.request.stop_at_entry);

  CHECK(gdbsession::parse_action_text(R"({"action":"continue"})").request.kind == action_kind::cont);
  CHECK(gdbsession::parse_action_text(R"({"action":"break","args":{"location":"main.c:3"}})").request.location == "main.c:3");
  CHECK(gdbsession::parse_action_text(R"({"action":"get_context","args":null})").ok());
  CHECK(gdbsession::to_string(action_kind::set_breakpoint) == "break");
  CHECK(gdbsession::parse_action_kind("get_analysis_context") == action_kind::get_analysis_context);
  CHECK_FALSE(gdbsession::parse_action_kind("attach").has_value());
}

TEST_CASE("parse_action accepts numeric ids and counts") {
  auto remove = gdbsession::parse_action_text(R"({"action":"remove_breakpoint","args":{"id":3}})");
  REQUIRE(remove.ok());
  CHECK(remove.request.id == "3");

  auto memory = gdbsession::parse_action_text(R"({"action":"read_memory","args":{"address":"&buf","count":"64"}})");
  REQUIRE(memory.ok());
  CHECK(memory.request.address == "&buf");
  CHECK(memory.request.count == 64);

  auto defaulted = gdbsession::parse_action_text(R"({"action":"read_memory","args":{"address":"0x10"}})");
  REQUIRE(defaulted.ok());
  CHECK(defaulted.request.count == 256);

  auto children = gdbsession::parse_action_text(R"({"action":"var_list_children","args":{"name":"var1"}})");
  REQUIRE(children.ok());
  CHECK(children.request.name == "var1");
}

TEST_CASE("parse_action reports malformed messages") {
  CHECK(gdbsession::parse_action_text("{not json").status == parse_status::invalid_json);
  CHECK(gdbsession::parse_action_text("[1,2]").status == parse_status::not_object);
  CHECK(gdbsession::parse_action_text(R"({"args":{}})").status == parse_status::missing_action);

  auto unknown = gdbsession::parse_action_text(R"({"action":"explode"})");
  CHECK(unknown.status == parse_status::unknown_action);
  CHECK(unknown.error == "unknown action: explode");

  auto init = gdbsession::parse_action_text(R"({"action":"init","args":{}})");
  CHECK(init.status == parse_status::invalid_args);
  CHECK(init.error == "init: missing executable");

  CHECK(gdbsession::parse_action_text(R"({"action":"run","args":{"stop_at_entry":"yes"}})").status ==
        parse_status::invalid_args);
  CHECK(gdbsession::parse_action_text(R"({"action":"read_memory","args":{"address":"x","count":"many"}})").status ==
        parse_status::invalid_args);
  CHECK(gdbsession::parse_action_text(R"({"action":"var_create","args":"x"})").status == parse_status::invalid_args);
}

TEST_CASE("parse_handshake only accepts session objects without an action") {
  CHECK(gdbsession::parse_handshake(json::parse(R"({"session":"abc"})")) == std::optional<std::string>("abc"));
  CHECK_FALSE(gdbsession::parse_handshake(json::parse(R"({"session":""})")).has_value());
  CHECK_FALSE(gdbsession::parse_handshake(json::parse(R"({"session":"abc","action":"run"})")).has_value());
  CHECK_FALSE(gdbsession::parse_handshake(json::parse(R"({"session":5})")).has_value());
}

TEST_CASE("state_update carries status, location, stack and variables") {
  gdbsession::state_snapshot snapshot;
  auto idle = json::parse(gdbsession::messages::state_update(snapshot));
  CHECK(idle["type"] == "state_update");
  CHECK(idle["payload"]["status"] == "Ready");
  CHECK(idle["payload"]["location"].is_null());
  CHECK(idle["payload"]["stack"].empty());

  snapshot.status = gdbsession::session_status::paused;
  snapshot.location = gdbsession::source_location{"main.c", "/src/main.c", 7, "main"};
  snapshot.stack.push_back(gdbsession::stack_frame{0, "0x401000", "main", "main.c", "/src/main.c", 7});
  snapshot.variables.push_back(gdbsession::variable{"argc", "1", std::string("int")});
  snapshot.variables.push_back(gdbsession::variable{"p", "0x0", std::nullopt});

  auto paused = json::parse(gdbsession::messages::state_update(snapshot));
  const auto& payload = paused["payload"];
  CHECK(payload["status"] == "Paused");
  CHECK(payload["location"]["fullname"] == "/src/main.c");
  CHECK(payload["location"]["line"] == 7);
  CHECK(payload["stack"][0]["function"] == "main");
  CHECK(payload["stack"][0]["address"] == "0x401000");
  CHECK(payload["variables"][0]["type"] == "int");
  CHECK_FALSE(payload["variables"][1].contains("type"));
}

TEST_CASE("event messages use the type and payload envelope") {
  auto console = json::parse(gdbsession::messages::console("hello\n"));
  CHECK(console["type"] == "console");
  CHECK(console["payload"] == "hello\n");

  auto error = json::parse(gdbsession::messages::error("run: not available while Running"));
  CHECK(error["type"] == "error");
  CHECK(error["payload"] == "run: not available while Running");

  auto bp = json::parse(gdbsession::messages::breakpoint_created(gdbsession::breakpoint{"2", "main.c", "", 9}));
  CHECK(bp["payload"]["id"] == "2");
  CHECK(bp["payload"]["line"] == 9);
  CHECK_FALSE(bp["payload"].contains("fullname"));

  gdbsession::memory_block block;
  block.address_text = "0x1000";
  block.bytes = {std::byte{0xca}, std::byte{0xfe}};
  auto memory = json::parse(gdbsession::messages::memory_read(block));
  CHECK(memory["type"] == "memory_read");
  CHECK(memory["payload"]["address"] == "0x1000");
  CHECK(memory["payload"]["contents"] == "cafe");

  gdbsession::var_object child{"var1.x", "x", "3", "int", 0, std::string("var1")};
  auto children = json::parse(gdbsession::messages::var_children("var1", "pt", {child}));
  CHECK(children["payload"]["name"] == "var1");
  CHECK(children["payload"]["expression"] == "pt");
  CHECK(children["payload"]["children"][0]["name"] == "var1.x");
  CHECK(children["payload"]["children"][0]["expression"] == "x");

  auto log = json::parse(gdbsession::messages::log_event(gdbsession::log_entry{gdbsession::log_level::gdb, "warn", "t"}));
  CHECK(log["payload"]["level"] == "gdb");
  CHECK(log["payload"]["text"] == "warn");
}

TEST_CASE("messages survive text that is not valid UTF-8") {
  auto text = gdbsession::messages::console(std::string("bad \xff byte"));
  auto parsed = json::parse(text, nullptr, false);
  REQUIRE_FALSE(parsed.is_discarded());
  CHECK(parsed["type"] == "console");
}
