#include <doctest/doctest.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

#include "gdbsession/mi/mi_codec.hpp"
#include "gdbsession/mi/mi_payloads.hpp"

namespace mi = gdbsession::mi;

namespace {

mi::mi_results results_of(std::string_view line) {
  auto rec = mi::parse_record(line);
  if (auto* result = std::get_if<mi::result_record>(&rec)) {
    return result->results;
  }
  if (auto* async = std::get_if<mi::async_record>(&rec)) {
    return async->results;
  }
  return {};
}

} // namespace

TEST_CASE("decode_stack reads every frame") {
  auto frames = mi::decode_stack(results_of(
      "^done,stack=[frame={level=\"0\",addr=\"0x0000555555555131\",func=\"crash\",file=\"crash.c\","
      "fullname=\"/src/crash.c\",line=\"4\"},frame={level=\"1\",addr=\"0x0000555555555150\",func=\"main\"}]"
  ));
  REQUIRE(frames.size() == 2);
  CHECK(frames[0].function == "crash");
  CHECK(frames[0].fullname == "/src/crash.c");
  CHECK(frames[0].line == 4);
  CHECK(frames[1].level == 1);
  CHECK(frames[1].file.empty());
  CHECK(frames[1].line == 0);
}

TEST_CASE("decode_variables accepts simple values and name-only lists") {
  auto vars = mi::decode_variables(results_of(
      "^done,variables=[{name=\"count\",type=\"int\",value=\"3\"},{name=\"buf\",type=\"char [16]\"}]"
  ));
  REQUIRE(vars.size() == 2);
  CHECK(vars[0].name == "count");
  CHECK(vars[0].value == "3");
  CHECK(vars[0].type == std::optional<std::string>("int"));
  CHECK(vars[1].value.empty());

  auto names = mi::decode_variables(results_of("^done,locals=[name=\"a\",name=\"b\"]"));
  REQUIRE(names.size() == 2);
  CHECK(names[1].name == "b");
  CHECK_FALSE(names[1].type.has_value());

  CHECK(mi::decode_variables(results_of("^done")).empty());
}

TEST_CASE("decode_breakpoint reads resolved and pending breakpoints") {
  auto resolved = mi::decode_breakpoint(results_of(
      "^done,bkpt={number=\"1\",type=\"breakpoint\",disp=\"keep\",file=\"main.c\",fullname=\"/src/main.c\","
      "line=\"12\",original-location=\"main.c:12\"}"
  ));
  REQUIRE(resolved.has_value());
  CHECK(resolved->bp.id == "1");
  CHECK(resolved->bp.file == "main.c");
  CHECK(resolved->bp.line == 12);
  CHECK_FALSE(resolved->temporary);

  auto pending = mi::decode_breakpoint(
      results_of("^done,bkpt={number=\"2\",type=\"breakpoint\",disp=\"keep\",pending=\"lib.c:30\","
                 "original-location=\"lib.c:30\"}")
  );
  REQUIRE(pending.has_value());
  CHECK(pending->bp.file == "lib.c");
  CHECK(pending->bp.line == 30);

  auto temporary = mi::decode_breakpoint(results_of("=breakpoint-created,bkpt={number=\"3\",disp=\"del\",func=\"main\"}"));
  REQUIRE(temporary.has_value());
  CHECK(temporary->temporary);

  CHECK_FALSE(mi::decode_breakpoint(results_of("^done,bkpt={type=\"breakpoint\"}")).has_value());
  CHECK(mi::decode_deleted_breakpoint(results_of("=breakpoint-deleted,id=\"4\"")) == std::optional<std::string>("4"));
}

TEST_CASE("decode_var_created and decode_var_children keep handles and parents") {
  auto created = mi::decode_var_created(
      results_of("^done,name=\"var1\",numchild=\"2\",value=\"{...}\",type=\"struct point\",has_more=\"0\""), "pt"
  );
  REQUIRE(created.has_value());
  CHECK(created->handle == "var1");
  CHECK(created->expression == "pt");
  CHECK(created->numchild == 2);
  CHECK(created->type == "struct point");

  auto children = mi::decode_var_children(
      results_of("^done,numchild=\"2\",children=[child={name=\"var1.x\",exp=\"x\",numchild=\"0\",value=\"1\","
                 "type=\"int\"},child={name=\"var1.y\",exp=\"y\",numchild=\"0\",value=\"2\",type=\"int\"}],"
                 "has_more=\"0\""),
      "var1"
  );
  REQUIRE(children.size() == 2);
  CHECK(children[0].handle == "var1.x");
  CHECK(children[0].expression == "x");
  CHECK(children[1].value == "2");
  CHECK(children[1].parent == std::optional<std::string>("var1"));

  CHECK_FALSE(mi::decode_var_created(results_of("^done,numchild=\"0\""), "x").has_value());
}

TEST_CASE("decode_memory joins contiguous blocks and stops at gaps") {
  auto block = mi::decode_memory(results_of(
      "^done,memory=[{begin=\"0x1000\",offset=\"0x0\",end=\"0x1002\",contents=\"0102\"},"
      "{begin=\"0x1002\",offset=\"0x2\",end=\"0x1004\",contents=\"0304\"},"
      "{begin=\"0x1010\",offset=\"0x10\",end=\"0x1011\",contents=\"ff\"}]"
  ));
  REQUIRE(block.has_value());
  CHECK(block->base_address == 0x1000);
  CHECK(block->address_text == "0x1000");
  REQUIRE(block->bytes.size() == 4);
  CHECK(std::to_integer<int>(block->bytes[2]) == 3);
  CHECK(std::to_integer<int>(block->bytes[3]) == 4);

  CHECK_FALSE(mi::decode_memory(results_of("^done,memory=[{begin=\"0x10\",contents=\"0\"}]")).has_value());
  CHECK_FALSE(mi::decode_memory(results_of("^done,memory=[]")).has_value());
}

TEST_CASE("decode_memory starts at the first readable byte") {
  auto block = mi::decode_memory(
      results_of("^done,memory=[{begin=\"0x1010\",offset=\"0x10\",end=\"0x1012\",contents=\"abcd\"}]")
  );
  REQUIRE(block.has_value());
  CHECK(block->base_address == 0x1010);
  CHECK(block->address_text == "0x1010");
  CHECK(block->bytes.size() == 2);

  // Blocks that disagree on the requested address are not one reply.
  CHECK_FALSE(mi::decode_memory(results_of(
                  "^done,memory=[{begin=\"0x1000\",offset=\"0x0\",end=\"0x1002\",contents=\"0102\"},"
                  "{begin=\"0x1002\",offset=\"0x0\",end=\"0x1004\",contents=\"0304\"}]"
  ))
                  .has_value());
  CHECK_FALSE(mi::decode_memory(
                  results_of("^done,memory=[{begin=\"0x8\",offset=\"0x10\",end=\"0x9\",contents=\"00\"}]")
  )
                  .has_value());
}

TEST_CASE("decode_stop and classify_stop sort stops into categories") {
  auto hit = mi::decode_stop(results_of(
      "*stopped,reason=\"breakpoint-hit\",disp=\"keep\",bkptno=\"1\",frame={addr=\"0x1\",func=\"main\","
      "args=[],file=\"main.c\",fullname=\"/src/main.c\",line=\"12\"},thread-id=\"1\""
  ));
  CHECK(hit.reason == "breakpoint-hit");
  CHECK(hit.breakpoint_id == std::optional<std::string>("1"));
  CHECK(mi::classify_stop(hit) == mi::stop_category::paused);
  auto where = mi::location_of(hit);
  REQUIRE(where.has_value());
  CHECK(where->fullname == "/src/main.c");
  CHECK(where->line == 12);
  CHECK(where->function == "main");

  auto exited = mi::decode_stop(results_of("*stopped,reason=\"exited\",exit-code=\"011\""));
  CHECK(mi::classify_stop(exited) == mi::stop_category::exited);
  CHECK(exited.exit_code == std::optional<int>(9));
  CHECK_FALSE(mi::location_of(exited).has_value());

  auto normal = mi::decode_stop(results_of("*stopped,reason=\"exited-normally\""));
  CHECK(mi::classify_stop(normal) == mi::stop_category::exited);
  CHECK_FALSE(normal.exit_code.has_value());

  auto segv = mi::decode_stop(results_of(
      "*stopped,reason=\"signal-received\",signal-name=\"SIGSEGV\",signal-meaning=\"Segmentation fault\""
  ));
  CHECK(mi::classify_stop(segv) == mi::stop_category::fatal);
  CHECK(segv.signal_meaning == "Segmentation fault");

  auto sigint = mi::decode_stop(results_of("*stopped,reason=\"signal-received\",signal-name=\"SIGINT\""));
  CHECK(mi::classify_stop(sigint) == mi::stop_category::paused);

  auto killed = mi::decode_stop(results_of("*stopped,reason=\"exited-signalled\",signal-name=\"SIGKILL\""));
  CHECK(mi::classify_stop(killed) == mi::stop_category::fatal);

  auto step = mi::decode_stop(results_of("*stopped,reason=\"end-stepping-range\""));
  CHECK(mi::classify_stop(step) == mi::stop_category::paused);
}

TEST_CASE("decode_error_message falls back to a default") {
  CHECK(mi::decode_error_message(results_of("^error,msg=\"No symbol table is loaded.\"")) == "No symbol table is loaded.");
  CHECK(mi::decode_error_message(results_of("^error")) == "unknown debugger error");
}
