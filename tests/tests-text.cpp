#include <lark/linebuffer.hpp>
#include <lark/text.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstring>
#include <string>
#include <vector>

namespace {

using ::testing::ElementsAre;

/// Feed data into a line buffer in pieces of the given size and collect the lines
auto chunked_lines(std::string_view data, std::size_t const piece, std::size_t const initial = 8) -> std::vector<std::string>
{
  lark::LineBuffer buffer{initial};
  std::vector<std::string> lines;

  while (not data.empty()) {
    auto const space = buffer.prepare();
    auto const n = std::min({piece, space.size(), data.size()});
    std::memcpy(space.data(), data.data(), n);
    buffer.commit(n);
    data.remove_prefix(n);

    while (auto const line = buffer.next_line()) {
      lines.emplace_back(*line);
    }
  }
  return lines;
}

TEST(LineBuffer, SplitsOnNewline) {
  EXPECT_THAT(chunked_lines("PING :a\r\nPING :b\n", 64, 64), ElementsAre("PING :a", "PING :b"));
}

TEST(LineBuffer, ChunkingDoesNotChangeLines) {
  std::string const data =
    ":srv 001 Bot :Welcome to the network\r\n"
    ":a!b@c PRIVMSG #chan :a somewhat longer line that will need the buffer to grow\r\n"
    "\r\n"
    "PING :token\n";

  auto const expected = chunked_lines(data, data.size(), 4096);
  ASSERT_EQ(expected.size(), 4u);
  EXPECT_EQ(expected[2], "");

  for (std::size_t piece = 1; piece <= 17; ++piece) {
    EXPECT_EQ(chunked_lines(data, piece), expected) << "piece size " << piece;
  }
}

TEST(LineBuffer, KeepsPartialLine) {
  lark::LineBuffer buffer{16};
  auto const space = buffer.prepare();
  std::memcpy(space.data(), "PRIV", 4);
  buffer.commit(4);
  EXPECT_EQ(buffer.next_line(), std::nullopt);
  EXPECT_EQ(buffer.pending(), 4u);
}

TEST(LineBuffer, StripsOnlyOneCarriageReturn) {
  EXPECT_THAT(chunked_lines("a\r\r\n", 64, 64), ElementsAre("a\r"));
}

TEST(Utf8, Validation) {
  EXPECT_TRUE(lark::is_valid_utf8("plain ascii"));
  EXPECT_TRUE(lark::is_valid_utf8("caf\xC3\xA9 \xE2\x80\xA6 \xF0\x9F\x98\x80"));
  EXPECT_FALSE(lark::is_valid_utf8("\xC3"));
  EXPECT_FALSE(lark::is_valid_utf8("\xC0\xAF"));         // overlong
  EXPECT_FALSE(lark::is_valid_utf8("\xED\xA0\x80"));     // surrogate
  EXPECT_FALSE(lark::is_valid_utf8("\xF4\x90\x80\x80")); // above U+10FFFF
  EXPECT_FALSE(lark::is_valid_utf8("\xFF"));
}

TEST(Decode, Utf8PassesThrough) {
  EXPECT_EQ(lark::decode_line("caf\xC3\xA9"), "caf\xC3\xA9");
}

TEST(Decode, FallsBackToCp1252) {
  // 0x80 is the euro sign and 0xE9 is e-acute in Windows-1252
  EXPECT_EQ(lark::decode_line("\x80 caf\xE9"), "\xE2\x82\xAC caf\xC3\xA9");
}

TEST(Decode, FallsBackToLatin1) {
  // 0x81 is unassigned in Windows-1252
  EXPECT_EQ(lark::decode_line("\x81\xE9"), "\xC2\x81\xC3\xA9");
}

TEST(Frame, AppendsCrLf) {
  EXPECT_EQ(lark::frame_line("PING x"), "PING x\r\n");
}

TEST(Frame, StripsEmbeddedLineBreaks) {
  EXPECT_EQ(lark::frame_line("PRIVMSG #c :a\r\nQUIT"), "PRIVMSG #c :aQUIT\r\n");
}

TEST(Frame, TruncatesTo510Bytes) {
  auto const framed = lark::frame_line(std::string(600, 'x'));
  EXPECT_EQ(framed.size(), 512u);
  EXPECT_EQ(framed.substr(510), "\r\n");
}

TEST(Frame, TruncatesOnCharacterBoundary) {
  // 509 ASCII bytes followed by a two byte character straddling the limit
  auto const line = std::string(509, 'x') + "\xC3\xA9";
  auto const framed = lark::frame_line(line);
  EXPECT_EQ(framed, std::string(509, 'x') + "\r\n");
}

TEST(Split, ShortTextIsOneFragment) {
  EXPECT_THAT(lark::split_message("hello", 400, 3), ElementsAre("hello"));
}

TEST(Split, CutsAtLastSpace) {
  EXPECT_THAT(lark::split_message("aaa bbb ccc", 8, 3), ElementsAre("aaa bbb", "ccc"));
}

TEST(Split, HardCutWithoutSpace) {
  EXPECT_THAT(lark::split_message("abcdefghij", 4, 5), ElementsAre("abcd", "efgh", "ij"));
}

TEST(Split, HardCutRespectsCharacters) {
  EXPECT_THAT(lark::split_message("ab\xC3\xA9" "cd", 3, 5), ElementsAre("ab", "\xC3\xA9" "c", "d"));
}

TEST(Split, LastFragmentKeepsRemainder) {
  EXPECT_THAT(lark::split_message("one two three four", 4, 2), ElementsAre("one", "two three four"));
}

TEST(Split, ZeroLimitMeansOne) {
  EXPECT_THAT(lark::split_message("one two three", 4, 0), ElementsAre("one two three"));
}

}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
