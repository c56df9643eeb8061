#include <doctest/doctest.h>

#include <cstddef>
#include <string>
#include <variant>

#include "gdbsession/gdbsession.hpp"
#include "gdbsession/mi/hex.hpp"
#include "gdbsession/mi/mi_codec.hpp"
#include "gdbsession/mi/mi_commands.hpp"

namespace mi = gdbsession::mi;

TEST_CASE("version is non-empty") { CHECK_FALSE(gdbsession::version().empty()); }

TEST_CASE("encode_command prefixes the token and leaves safe parameters bare") {
  auto line = mi::encode_command(7, mi::commands::break_insert("main.c:12"));
  CHECK(line == "7-break-insert main.c:12");

  CHECK(mi::encode_command(3, mi::commands::exec_run(true)) == "3-exec-run --start");
  CHECK(mi::encode_command(4, mi::commands::exec_run(false)) == "4-exec-run");
  CHECK(mi::encode_command(5, mi::commands::var_create("ptr->next")) == "5-var-create - * \"ptr->next\"");
  CHECK(mi::encode_command(6, mi::commands::data_read_memory_bytes("&buf", 16)) == "6-data-read-memory-bytes &buf 16");
}

TEST_CASE("encode_command keeps client text out of the option list") {
  CHECK(mi::encode_command(8, mi::commands::data_read_memory_bytes("-o", 16)) == "8-data-read-memory-bytes -- -o 16");
  CHECK(mi::encode_command(9, mi::commands::break_insert("-t")) == "9-break-insert -- -t");
  CHECK(mi::encode_command(10, mi::commands::data_read_memory_bytes("0x10", 4)) == "10-data-read-memory-bytes 0x10 4");
  // -var-create takes positional arguments only.
  CHECK(mi::encode_command(11, mi::commands::var_create("-x")) == "11-var-create - * -x");
}

TEST_CASE("quote_parameter escapes client text") {
  CHECK(mi::quote_parameter("") == "\"\"");
  CHECK(mi::quote_parameter("arr[2]") == "arr[2]");
  CHECK(mi::quote_parameter("a b") == "\"a b\"");
  CHECK(mi::quote_parameter("x\"; -gdb-exit") == "\"x\\\"; -gdb-exit\"");
  CHECK(mi::quote_parameter("line\nbreak") == "\"line\\nbreak\"");
  CHECK(mi::quote_parameter(std::string("a\x01", 2)) == "\"a\\001\"");
  CHECK(mi::quote_parameter("back\\slash") == "\"back\\\\slash\"");
}

TEST_CASE("parse_record decodes a done result with nested values") {
  auto rec = mi::parse_record(
      "12^done,stack=[frame={level=\"0\",addr=\"0x401136\",func=\"main\",file=\"main.c\",line=\"5\"}]"
  );
  auto* result = std::get_if<mi::result_record>(&rec);
  REQUIRE(result != nullptr);
  REQUIRE(result->token.has_value());
  CHECK(*result->token == 12);
  CHECK(result->cls == mi::result_class::done);

  auto* stack = mi::find_result(result->results, "stack");
  REQUIRE(stack != nullptr);
  REQUIRE(stack->is_list());
  REQUIRE(stack->items.size() == 1);
  CHECK(stack->items[0].name == "frame");
  CHECK(stack->items[0].value.string_of("func") == std::optional<std::string>("main"));
}

TEST_CASE("parse_record handles untokened async and error records") {
  auto stopped = mi::parse_record("*stopped,reason=\"breakpoint-hit\",bkptno=\"1\"");
  auto* async = std::get_if<mi::async_record>(&stopped);
  REQUIRE(async != nullptr);
  CHECK_FALSE(async->token.has_value());
  CHECK(async->kind == mi::async_kind::exec);
  CHECK(async->async_class == "stopped");
  CHECK(mi::find_string(async->results, "reason") == std::optional<std::string>("breakpoint-hit"));

  auto created = mi::parse_record("=breakpoint-created,bkpt={number=\"2\"}");
  auto* notify = std::get_if<mi::async_record>(&created);
  REQUIRE(notify != nullptr);
  CHECK(notify->kind == mi::async_kind::notify);
  CHECK(notify->async_class == "breakpoint-created");

  auto error = mi::parse_record("9^error,msg=\"No symbol \\\"x\\\" in current context.\"");
  auto* result = std::get_if<mi::result_record>(&error);
  REQUIRE(result != nullptr);
  CHECK(result->cls == mi::result_class::error);
  CHECK(mi::find_string(result->results, "msg") == std::optional<std::string>("No symbol \"x\" in current context."));
}

TEST_CASE("parse_record decodes stream records and the prompt") {
  auto console = mi::parse_record("~\"Hello\\n\"");
  auto* stream = std::get_if<mi::stream_record>(&console);
  REQUIRE(stream != nullptr);
  CHECK(stream->kind == mi::stream_kind::console);
  CHECK(stream->text == "Hello\n");

  auto log = mi::parse_record("&\"warning: \\033[1mbold\\033[m\"");
  stream = std::get_if<mi::stream_record>(&log);
  REQUIRE(stream != nullptr);
  CHECK(stream->kind == mi::stream_kind::log);
  CHECK(stream->text == "warning: \x1b[1mbold\x1b[m");

  CHECK(std::holds_alternative<mi::prompt_record>(mi::parse_record("(gdb) ")));
  CHECK(std::holds_alternative<mi::prompt_record>(mi::parse_record("(gdb)")));
}

TEST_CASE("parse_record keeps unparseable lines as raw console text") {
  for (const char* line : {"Hello world", "*** stack smashing detected ***", "^bogus", "12", "5~\"tokened stream\""}) {
    auto rec = mi::parse_record(line);
    auto* stream = std::get_if<mi::stream_record>(&rec);
    REQUIRE(stream != nullptr);
    CHECK(stream->kind == mi::stream_kind::console);
    CHECK(stream->text == line);
  }

  auto truncated = mi::parse_record("^done,value=\"unterminated");
  auto* stream = std::get_if<mi::stream_record>(&truncated);
  REQUIRE(stream != nullptr);
  CHECK(stream->text == "^done,value=\"unterminated");
}

TEST_CASE("parse_record accepts lists of bare values and empty containers") {
  auto rec = mi::parse_record("^done,names=[\"a\",\"b\"],empty=[],tuple={}");
  auto* result = std::get_if<mi::result_record>(&rec);
  REQUIRE(result != nullptr);
  auto* names = mi::find_result(result->results, "names");
  REQUIRE(names != nullptr);
  REQUIRE(names->items.size() == 2);
  CHECK(names->items[0].name.empty());
  CHECK(names->items[1].value.text == "b");
  CHECK(mi::find_result(result->results, "empty")->items.empty());
  CHECK(mi::find_result(result->results, "tuple")->is_tuple());
}

TEST_CASE("record_parser buffers partial lines across reads") {
  mi::record_parser parser;
  parser.append("1^do");
  CHECK_FALSE(parser.has_record());
  CHECK(parser.buffered() == 4);

  parser.append("ne\r\n\n(gdb) \n");
  REQUIRE(parser.has_record());
  auto first = parser.pop_record();
  auto* result = std::get_if<mi::result_record>(&first);
  REQUIRE(result != nullptr);
  CHECK(*result->token == 1);

  REQUIRE(parser.has_record());
  CHECK(std::holds_alternative<mi::prompt_record>(parser.pop_record()));
  CHECK_FALSE(parser.has_record());

  parser.append("~\"partial");
  parser.reset();
  CHECK(parser.buffered() == 0);
  CHECK_FALSE(parser.has_record());
}

TEST_CASE("hex helpers parse addresses and byte strings") {
  uint64_t value = 0;
  CHECK(mi::parse_hex_u64("0x7ffe1234", value));
  CHECK(value == 0x7ffe1234);
  CHECK(mi::parse_hex_u64("ff", value));
  CHECK(value == 0xff);
  CHECK_FALSE(mi::parse_hex_u64("0xzz", value));

  int number = 0;
  CHECK(mi::parse_dec_int("-42", number));
  CHECK(number == -42);
  CHECK_FALSE(mi::parse_dec_int("12abc", number));

  auto bytes = mi::decode_hex("00ff7A");
  REQUIRE(bytes.has_value());
  REQUIRE(bytes->size() == 3);
  CHECK(std::to_integer<int>((*bytes)[2]) == 0x7a);
  CHECK(mi::encode_hex(*bytes) == "00ff7a");
  CHECK_FALSE(mi::decode_hex("abc").has_value());
}
