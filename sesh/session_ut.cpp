#include "sesh/session.hpp"

#include <gmock/gmock.h>

#include <sstream>

/**
 * @test Verify that the state_value builders create the right kind of values.
 */
TEST(session, value_builders) {
  EXPECT_EQ(sesh::null_value().kind_case(), sesh::state_value::kNullValue);
  EXPECT_EQ(sesh::string_value("foo").string_value(), "foo");
  EXPECT_EQ(sesh::number_value(3.5).number_value(), 3.5);
  EXPECT_TRUE(sesh::bool_value(true).bool_value());
  EXPECT_FALSE(sesh::bool_value(false).bool_value());

  auto list = sesh::list_value({sesh::number_value(1), sesh::string_value("two"), sesh::null_value()});
  ASSERT_EQ(list.kind_case(), sesh::state_value::kListValue);
  ASSERT_EQ(list.list_value().values_size(), 3);
  EXPECT_EQ(list.list_value().values(0).number_value(), 1.0);
  EXPECT_EQ(list.list_value().values(1).string_value(), "two");
  EXPECT_EQ(list.list_value().values(2).kind_case(), sesh::state_value::kNullValue);

  auto nested = sesh::struct_value(sesh::make_state({{"a", sesh::bool_value(true)}}));
  ASSERT_EQ(nested.kind_case(), sesh::state_value::kStructValue);
  EXPECT_EQ(nested.struct_value().fields().size(), 1UL);
  EXPECT_TRUE(nested.struct_value().fields().at("a").bool_value());
}

/**
 * @test Verify that make_state() and state_string() work.
 */
TEST(session, make_state) {
  auto state = sesh::make_state({{"user_name", sesh::string_value("Alice")}, {"visits", sesh::number_value(3)}});
  EXPECT_EQ(state.fields().size(), 2UL);
  EXPECT_EQ(sesh::state_string(state, "user_name"), "Alice");
  EXPECT_EQ(sesh::state_string(state, "visits", "n/a"), "n/a");
  EXPECT_EQ(sesh::state_string(state, "missing"), "");
  EXPECT_EQ(sesh::state_string(state, "missing", "fallback"), "fallback");

  // ... later values for the same key win ...
  auto dup = sesh::make_state({{"k", sesh::string_value("a")}, {"k", sesh::string_value("b")}});
  EXPECT_EQ(dup.fields().size(), 1UL);
  EXPECT_EQ(sesh::state_string(dup, "k"), "b");
}

/**
 * @test Verify that make_user_state() omits the empty optional fields.
 */
TEST(session, make_user_state) {
  auto full = sesh::make_user_state("Alice", "alice@example.com", "prefers short answers");
  EXPECT_EQ(full.fields().size(), 3UL);
  EXPECT_EQ(sesh::state_string(full, "user_name"), "Alice");
  EXPECT_EQ(sesh::state_string(full, "user_email"), "alice@example.com");
  EXPECT_EQ(sesh::state_string(full, "user_preferences"), "prefers short answers");

  auto name_only = sesh::make_user_state("Bob");
  EXPECT_EQ(name_only.fields().size(), 1UL);
  EXPECT_EQ(name_only.fields().count("user_email"), 0UL);
  EXPECT_EQ(name_only.fields().count("user_preferences"), 0UL);

  auto no_email = sesh::make_user_state("Carol", "", "none");
  EXPECT_EQ(no_email.fields().size(), 2UL);
  EXPECT_EQ(sesh::state_string(no_email, "user_preferences"), "none");
}

/**
 * @test Verify that make_user_state() merges additional fields.
 */
TEST(session, make_user_state_extra) {
  auto state = sesh::make_user_state(
      "Alice", "alice@example.com", "",
      sesh::make_state({{"plan", sesh::string_value("premium")}, {"visits", sesh::number_value(3)},
                        {"user_email", sesh::string_value("alice@work.example.com")}}));
  EXPECT_EQ(state.fields().size(), 4UL);
  EXPECT_EQ(sesh::state_string(state, "user_name"), "Alice");
  EXPECT_EQ(sesh::state_string(state, "user_email"), "alice@work.example.com");
  EXPECT_EQ(sesh::state_string(state, "plan"), "premium");
  EXPECT_EQ(state.fields().at("visits").number_value(), 3.0);
  EXPECT_EQ(state.fields().count("user_preferences"), 0UL);

  auto plain = sesh::make_user_state("Bob", "", "", sesh::session_state());
  EXPECT_EQ(plain.fields().size(), 1UL);
}

/**
 * @test Verify that sessions can be streamed.
 */
TEST(session, streaming) {
  using namespace ::testing;
  sesh::session s("s-1", "agent", sesh::make_user_state("Alice"), std::chrono::system_clock::time_point());
  EXPECT_EQ(s.slot, sesh::session::no_slot);
  EXPECT_FALSE(s.stale);

  std::ostringstream os;
  os << s;
  EXPECT_THAT(os.str(), StartsWith("session{id=s-1, agent=agent, created=1970-01-01T00:00:00Z"));
  EXPECT_THAT(os.str(), HasSubstr("Alice"));
  EXPECT_THAT(os.str(), Not(HasSubstr("slot=")));
  EXPECT_THAT(os.str(), Not(HasSubstr("stale")));

  s.slot = 2;
  s.stale = true;
  os.str("");
  os << s;
  EXPECT_THAT(os.str(), HasSubstr(", slot=2, stale, state="));
}

/**
 * @test Verify the defaults in message_reply.
 */
TEST(session, message_reply) {
  sesh::message_reply reply;
  EXPECT_TRUE(reply.text.empty());
  EXPECT_FALSE(reply.has_state);
  EXPECT_EQ(reply.state.fields().size(), 0UL);
}
