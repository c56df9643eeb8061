#include <doctest/doctest.h>

#include <cstddef>
#include <string_view>
#include <variant>

#include "gdbsession/memory_reader.hpp"
#include "gdbsession/mi/mi_codec.hpp"

using gdbsession::memory_reader;

namespace {

gdbsession::mi::mi_results results_of(std::string_view line) {
  auto rec = gdbsession::mi::parse_record(line);
  if (auto* result = std::get_if<gdbsession::mi::result_record>(&rec)) {
    return result->results;
  }
  return {};
}

constexpr std::string_view k_reply = "^done,memory=[{begin=\"0x601040\",offset=\"0x0\",end=\"0x601044\",contents=\"deadbeef\"}]";

} // namespace

TEST_CASE("memory_reader validates address and count") {
  memory_reader reader(1024);
  CHECK(reader.validate("&buf", 16) == memory_reader::request_status::ok);
  CHECK(reader.validate("  ", 16) == memory_reader::request_status::empty_address);
  CHECK(reader.validate("", 16) == memory_reader::request_status::empty_address);
  CHECK(reader.validate("0x1000", 0) == memory_reader::request_status::invalid_count);
  CHECK(reader.validate("0x1000", -1) == memory_reader::request_status::invalid_count);
  CHECK(reader.validate("0x1000", 1024) == memory_reader::request_status::ok);
  CHECK(reader.validate("0x1000", 1025) == memory_reader::request_status::invalid_count);
}

TEST_CASE("memory_reader returns the block for the current request") {
  memory_reader reader;
  reader.expect(3, "&buf", 4);
  CHECK(reader.is_pending(3));

  gdbsession::memory_block block;
  REQUIRE(reader.on_result(3, results_of(k_reply), block) == memory_reader::reply_status::ok);
  CHECK(block.base_address == 0x601040);
  CHECK(block.address_text == "0x601040");
  REQUIRE(block.bytes.size() == 4);
  CHECK(std::to_integer<int>(block.bytes[0]) == 0xde);
  REQUIRE(reader.last().has_value());
  CHECK_FALSE(reader.is_pending(3));
}

TEST_CASE("memory_reader drops superseded replies") {
  memory_reader reader;
  reader.expect(1, "0x1000", 4);
  reader.expect(2, "0x2000", 4);

  gdbsession::memory_block block;
  CHECK(reader.on_result(1, results_of(k_reply), block) == memory_reader::reply_status::stale);
  CHECK(reader.on_result(2, results_of("^done,memory=[]"), block) == memory_reader::reply_status::malformed);
  CHECK(reader.on_result(9, results_of(k_reply), block) == memory_reader::reply_status::stale);

  reader.expect(4, "0x1000", 4);
  reader.expect(5, "0x1000", 4);
  CHECK_FALSE(reader.on_error(4));
  CHECK(reader.on_error(5));

  reader.expect(6, "0x1000", 4);
  reader.reset();
  CHECK_FALSE(reader.on_error(6));
  CHECK_FALSE(reader.last().has_value());
}
