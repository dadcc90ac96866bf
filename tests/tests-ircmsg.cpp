#include <ircmsg.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <string_view>
#include <sstream>
#include <string>

namespace {

TEST(Irc, CommandOnly) {
  std::string_view const input = "QUIT";
  ircmsg expect {{}, {}, "QUIT", {}};
  EXPECT_EQ(parse_irc_message(input), expect);
}

TEST(Irc, CommandTrailingSpace) {
  std::string_view const input = "QUIT ";
  ircmsg expect {{}, {}, "QUIT", {}};
  EXPECT_EQ(parse_irc_message(input), expect);
}

TEST(Irc, ExtraSpacesBetweenArgs) {
  std::string_view const input = "  JOIN   #chan   key ";
  ircmsg expect {{}, {}, "JOIN", {"#chan", "key"}};
  EXPECT_EQ(parse_irc_message(input), expect);
}

TEST(Irc, TrailingWithSpacesAndColons) {
  std::string_view const input = ":nick!user@host PRIVMSG #chan :hello: world :)  ok";
  ircmsg expect {{}, "nick!user@host", "PRIVMSG", {"#chan", "hello: world :)  ok"}};
  EXPECT_EQ(parse_irc_message(input), expect);
}

TEST(Irc, ColonInsideMiddleParam) {
  std::string_view const input = "MODE #chan +k a:b";
  ircmsg expect {{}, {}, "MODE", {"#chan", "+k", "a:b"}};
  EXPECT_EQ(parse_irc_message(input), expect);
}

TEST(Irc, EmptyTrailing) {
  std::string_view const input = ":srv TOPIC #chan :";
  ircmsg expect {{}, "srv", "TOPIC", {"#chan", ""}};
  EXPECT_EQ(parse_irc_message(input), expect);
}

TEST(Irc, ManyMiddleParams)
{
  std::string_view const input = ":srv 005 me CHANTYPES=# PREFIX=(ov)@+ NETWORK=x :are supported";
  ircmsg expect {{}, "srv", "005", {"me", "CHANTYPES=#", "PREFIX=(ov)@+", "NETWORK=x", "are supported"}};
  EXPECT_EQ(parse_irc_message(input), expect);
}

TEST(Irc, SourceWithoutCommand) {
  std::string_view const input = ":nick!user@host";
  EXPECT_THROW(parse_irc_message(input), irc_parse_error);
}

TEST(Irc, SourceSpaceWithoutCommand)
{
  std::string_view const input = ":nick ";
  try {
    parse_irc_message(input);
    FAIL() << "expected a parse error";
  } catch (irc_parse_error const& e) {
    EXPECT_EQ(e.code, irc_error_code::MISSING_COMMAND);
  }
}

TEST(Irc, EmptySource) {
  std::string_view const input = ": PING";
  ircmsg expect {{}, "", "PING", {}};
  EXPECT_EQ(parse_irc_message(input), expect);
}

TEST(Irc, TagWithValue) {
  std::string_view const input = "@time=2024-01-01T00:00:00.000Z :srv NOTICE * :hi";
  ircmsg expect {{{"time", "2024-01-01T00:00:00.000Z"}}, "srv", "NOTICE", {"*", "hi"}};
  EXPECT_EQ(parse_irc_message(input), expect);
}

TEST(Irc, TagWithoutValueIsAbsent) {
  std::string_view const input = "@draft/bot;account=alice :a PRIVMSG #c :x";
  ircmsg expect {{{"draft/bot", std::nullopt}, {"account", "alice"}}, "a", "PRIVMSG", {"#c", "x"}};
  EXPECT_EQ(parse_irc_message(input), expect);
}

TEST(Irc, TagWithEqualsIsEmpty) {
  std::string_view const input = "@a=;b PING";
  auto const msg = parse_irc_message(input);
  ASSERT_EQ(msg.tags.size(), 2u);
  ASSERT_TRUE(msg.tags[0].val.has_value());
  EXPECT_EQ(*msg.tags[0].val, "");
  EXPECT_FALSE(msg.tags[1].val.has_value());
}

TEST(Irc, TagEscapeSequences) {
  std::string_view const input = "@k=a\\:b\\sc\\\\d\\re\\nf PING";
  ircmsg expect {{{"k", "a;b c\\d\re\nf"}}, {}, "PING", {}};
  EXPECT_EQ(parse_irc_message(input), expect);
}

TEST(Irc, TagUnknownEscapeDropsBackslash) {
  std::string_view const input = "@k=\\q\\ PING";
  ircmsg expect {{{"k", "q"}}, {}, "PING", {}};
  EXPECT_EQ(parse_irc_message(input), expect);
}

TEST(Irc, ViewsPointIntoInput) {
  std::string const line = "@k=a\\sb :srv CMD arg :rest of it";
  auto const msg = parse_irc_message(line);
  EXPECT_EQ(line, "@k=a\\sb :srv CMD arg :rest of it");
  EXPECT_EQ(msg.source.data(), line.data() + 9);
  EXPECT_EQ(msg.args[1].data(), line.data() + 22);
  EXPECT_EQ(msg.tags[0].val, "a b");
}

TEST(Irc, TagKeysAreNotUnescaped) {
  std::string_view const input = "@k\\s=v PING";
  ircmsg expect {{{"k\\s", "v"}}, {}, "PING", {}};
  EXPECT_EQ(parse_irc_message(input), expect);
}

TEST(Irc, TagEmptyKey) {
  std::string_view const input = "@=v PING";
  try {
    parse_irc_message(input);
    FAIL() << "expected a parse error";
  } catch (irc_parse_error const& e) {
    EXPECT_EQ(e.code, irc_error_code::MISSING_TAG);
  }
}

TEST(Irc, TagDanglingSemicolon) {
  std::string_view const input = "@a=b; PING";
  EXPECT_THROW(parse_irc_message(input), irc_parse_error);
}

TEST(Irc, TagsWithoutCommand) {
  std::string_view const input = "@a=b";
  EXPECT_THROW(parse_irc_message(input), irc_parse_error);
}

TEST(Irc, EmptyLine) {
  std::string_view const input = "";
  EXPECT_THROW(parse_irc_message(input), irc_parse_error);
}

TEST(Irc, BlankLine) {
  std::string_view const input = "    ";
  EXPECT_THROW(parse_irc_message(input), irc_parse_error);
}

TEST(Irc, ErrorCodeStreaming) {
  std::ostringstream os;
  os << irc_error_code::MISSING_TAG << "/" << irc_error_code::MISSING_COMMAND;
  EXPECT_EQ(os.str(), "MISSING TAG/MISSING COMMAND");
}

TEST(IrcSource, Full) {
  ircsource expect {"nick", "user", "host.example"};
  EXPECT_EQ(split_irc_source("nick!user@host.example"), expect);
}

TEST(IrcSource, ServerName) {
  ircsource expect {"irc.example.net", "", ""};
  EXPECT_EQ(split_irc_source("irc.example.net"), expect);
}

TEST(IrcSource, NickAndHost) {
  ircsource expect {"nick", "", "host"};
  EXPECT_EQ(split_irc_source("nick@host"), expect);
}

TEST(IrcSource, NickAndUser) {
  ircsource expect {"nick", "user", ""};
  EXPECT_EQ(split_irc_source("nick!user"), expect);
}

TEST(IrcSource, EmptyParts) {
  ircsource expect {"", "", ""};
  EXPECT_EQ(split_irc_source("!@"), expect);
}

TEST(IrcSource, AtInUserIsSeparator) {
  ircsource expect {"n", "u", "h@x"};
  EXPECT_EQ(split_irc_source("n!u@h@x"), expect);
}

}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
