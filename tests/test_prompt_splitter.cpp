#include <gtest/gtest.h>

#include "prompt_splitter.hpp"

using bridge::ChatMessage;
using bridge::SplitSystemPrompt;

namespace {

ChatMessage Msg(const std::string& role, const std::string& content) {
  ChatMessage m;
  m.role = role;
  m.content = content;
  return m;
}

}  // namespace

TEST(PromptSplitterTest, JoinsSystemMessagesInOrder) {
  auto split = SplitSystemPrompt({Msg("system", "You are a math tutor."), Msg("user", "2+2?"),
                                  Msg("system", "Answer briefly.")});
  EXPECT_EQ(split.system_content, "You are a math tutor.\n\nAnswer briefly.");
  ASSERT_EQ(split.remaining.size(), 1u);
  EXPECT_EQ(split.remaining[0].role, "user");
  EXPECT_EQ(split.remaining[0].content, "2+2?");
  EXPECT_EQ(split.key.size(), 64u);
}

TEST(PromptSplitterTest, KeepsNonSystemOrder) {
  auto split = SplitSystemPrompt({Msg("user", "a"), Msg("system", "s"), Msg("assistant", "b"), Msg("user", "c")});
  ASSERT_EQ(split.remaining.size(), 3u);
  EXPECT_EQ(split.remaining[0].content, "a");
  EXPECT_EQ(split.remaining[1].content, "b");
  EXPECT_EQ(split.remaining[2].content, "c");
}

TEST(PromptSplitterTest, NoSystemMessagesGivesNoSessionKey) {
  auto split = SplitSystemPrompt({Msg("user", "hello")});
  EXPECT_TRUE(split.system_content.empty());
  EXPECT_EQ(split.key, bridge::kNoSessionKey);
  ASSERT_EQ(split.remaining.size(), 1u);
}

TEST(PromptSplitterTest, EmptySystemContentGivesNoSessionKey) {
  auto split = SplitSystemPrompt({Msg("system", ""), Msg("user", "hello")});
  EXPECT_TRUE(split.key.empty());
  EXPECT_TRUE(split.system_content.empty());
}

TEST(PromptSplitterTest, KeyIsDeterministic) {
  auto a = SplitSystemPrompt({Msg("system", "You are a math tutor."), Msg("user", "2+2?")});
  auto b = SplitSystemPrompt({Msg("system", "You are a math tutor."), Msg("user", "3+3?"), Msg("assistant", "6")});
  EXPECT_EQ(a.key, b.key);
}

TEST(PromptSplitterTest, KeyIsSensitiveToEveryByte) {
  const auto base = bridge::SystemPromptKey("You are a math tutor.");
  EXPECT_NE(base, bridge::SystemPromptKey("You are a math tutor. "));
  EXPECT_NE(base, bridge::SystemPromptKey("you are a math tutor."));
  EXPECT_NE(base, bridge::SystemPromptKey("You are a math tutor"));
}

TEST(PromptSplitterTest, KeyIsLowercaseHexSha256) {
  EXPECT_EQ(bridge::SystemPromptKey("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
