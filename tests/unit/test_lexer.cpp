// test_lexer.cpp - Unit tests for the threaded Lexer front end
// Every catalog sequence is fed byte by byte through a live Lexer

#include <gtest/gtest.h>
#include "terminal/Lexer.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace VT100Lex::Terminal {
namespace Tests {

constexpr auto kTokenWait = 1s;

struct SequenceCase {
    const char* input;
    TokenValue expected;
    std::vector<int> params;
};

const std::vector<SequenceCase> kGrammar = {
    {"\x1b[H", TokenValue::CursorHome, {}},
    {"\x1b[;H", TokenValue::CursorHome, {}},
    {"\x1b[13;17H", TokenValue::CursorPos, {13, 17}},
    {"\x1b[f", TokenValue::HvHome, {}},
    {"\x1b[;f", TokenValue::HvHome, {}},
    {"\x1b[13;17f", TokenValue::HvPos, {13, 17}},
    {"\x1b[3A", TokenValue::CursorUp, {3}},
    {"\x1b[4B", TokenValue::CursorDn, {4}},
    {"\x1b[5C", TokenValue::CursorRt, {5}},
    {"\x1b[6D", TokenValue::CursorLf, {6}},
    {"\x1b[13;17r", TokenValue::SetWin, {13, 17}},

    {"\x1b[20h", TokenValue::SetNL, {}},
    {"\x1b[?1h", TokenValue::SetAppl, {}},
    {"\x1b[?3h", TokenValue::SetCol, {}},
    {"\x1b[?4h", TokenValue::SetSmooth, {}},
    {"\x1b[?5h", TokenValue::SetRevScrn, {}},
    {"\x1b[?6h", TokenValue::SetOrgRel, {}},
    {"\x1b[?7h", TokenValue::SetWrap, {}},
    {"\x1b[?8h", TokenValue::SetRep, {}},
    {"\x1b[?9h", TokenValue::SetInter, {}},

    {"\x1b[20l", TokenValue::SetLF, {}},
    {"\x1b[?1l", TokenValue::SetCursor, {}},
    {"\x1b[?2l", TokenValue::SetVT52, {}},
    {"\x1b[?3l", TokenValue::ResetCol, {}},
    {"\x1b[?4l", TokenValue::SetJump, {}},
    {"\x1b[?5l", TokenValue::SetNormScrn, {}},
    {"\x1b[?6l", TokenValue::SetOrgAbs, {}},
    {"\x1b[?7l", TokenValue::ResetWrap, {}},
    {"\x1b[?8l", TokenValue::ResetRep, {}},
    {"\x1b[?9l", TokenValue::ResetInter, {}},

    {"\x1b=", TokenValue::AltKeypad, {}},
    {"\x1b>", TokenValue::NumKeypad, {}},

    {"\x1b(A", TokenValue::SetUKG0, {}},
    {"\x1b)A", TokenValue::SetUKG1, {}},
    {"\x1b(B", TokenValue::SetUSG0, {}},
    {"\x1b)B", TokenValue::SetUSG1, {}},
    {"\x1b(0", TokenValue::SetSpecG0, {}},
    {"\x1b)0", TokenValue::SetSpecG1, {}},
    {"\x1b(1", TokenValue::SetAltG0, {}},
    {"\x1b)1", TokenValue::SetAltG1, {}},
    {"\x1b(2", TokenValue::SetAltSpecG0, {}},
    {"\x1b)2", TokenValue::SetAltSpecG1, {}},

    {"\x1bN", TokenValue::SetSS2, {}},
    {"\x1bO", TokenValue::SetSS3, {}},

    {"\x1b[m", TokenValue::ModesOff, {}},
    {"\x1b[0m", TokenValue::ModesOff, {}},
    {"\x1b[1m", TokenValue::Bold, {}},
    {"\x1b[2m", TokenValue::LowInt, {}},
    {"\x1b[4m", TokenValue::Underline, {}},
    {"\x1b[5m", TokenValue::Blink, {}},
    {"\x1b[7m", TokenValue::Reverse, {}},
    {"\x1b[8m", TokenValue::Invisible, {}},

    {"\x1b" "D", TokenValue::Index, {}},
    {"\x1bM", TokenValue::RevIndex, {}},
    {"\x1b" "E", TokenValue::NextLine, {}},
    {"\x1b" "7", TokenValue::SaveCursor, {}},
    {"\x1b" "8", TokenValue::RestoreCursor, {}},

    {"\x1bH", TokenValue::TabSet, {}},
    {"\x1b[g", TokenValue::TabClr, {}},
    {"\x1b[0g", TokenValue::TabClr, {}},
    {"\x1b[3g", TokenValue::TabClrAll, {}},

    {"\x1b#3", TokenValue::DhTop, {}},
    {"\x1b#4", TokenValue::DhBot, {}},
    {"\x1b#5", TokenValue::Swsh, {}},
    {"\x1b#6", TokenValue::Dwsh, {}},
    {"\x1b#8", TokenValue::Align, {}},

    {"\x1b[K", TokenValue::ClearEOL, {}},
    {"\x1b[0K", TokenValue::ClearEOL, {}},
    {"\x1b[1K", TokenValue::ClearBOL, {}},
    {"\x1b[2K", TokenValue::ClearLine, {}},

    {"\x1b[J", TokenValue::ClearEOS, {}},
    {"\x1b[0J", TokenValue::ClearEOS, {}},
    {"\x1b[1J", TokenValue::ClearBOS, {}},
    {"\x1b[2J", TokenValue::ClearScreen, {}},

    {"\x1b" "5n", TokenValue::DevStat, {}},
    {"\x1b" "6n", TokenValue::GetCursor, {}},

    {"\x1b[c", TokenValue::Ident, {}},
    {"\x1b[0c", TokenValue::Ident, {}},
    {"\x1b" "c", TokenValue::Reset, {}},

    {"\x1b[2;1y", TokenValue::TestPU, {}},
    {"\x1b[2;2y", TokenValue::TestLB, {}},
    {"\x1b[2;9y", TokenValue::TestPURep, {}},
    {"\x1b[2;10y", TokenValue::TestLBRep, {}},

    {"\x1b[0q", TokenValue::LedsOff, {}},
    {"\x1b[1q", TokenValue::Led1, {}},
    {"\x1b[2q", TokenValue::Led2, {}},
    {"\x1b[3q", TokenValue::Led3, {}},
    {"\x1b[4q", TokenValue::Led4, {}},
};

// ============================================================================
// Test Fixture
// ============================================================================

class LexerTest : public ::testing::Test {
protected:
    void SetUp() override {
        lexer = std::make_unique<Lexer>();
    }

    void TearDown() override {
        lexer.reset();
    }

    void FeedString(const std::string& str) {
        for (char c : str) {
            ASSERT_TRUE(lexer->Feed(static_cast<uint8_t>(c)));
        }
    }

    // Waits for one token with a deadline instead of NextToken()
    std::optional<Token> WaitToken(std::chrono::milliseconds timeout = kTokenWait) {
        return lexer->Output().PopFor(timeout);
    }

    std::unique_ptr<Lexer> lexer;
};

// ============================================================================
// Grammar Tests
// ============================================================================

TEST_F(LexerTest, EveryCatalogSequence) {
    std::set<TokenValue> covered;

    for (const auto& test : kGrammar) {
        SCOPED_TRACE(::testing::PrintToString(std::string(test.input)));

        // Fresh lexer per sequence
        Lexer local;
        std::string input(test.input);
        for (char c : input) {
            ASSERT_TRUE(local.Feed(static_cast<uint8_t>(c)));
        }

        auto token = local.Output().PopFor(kTokenWait);
        ASSERT_TRUE(token.has_value()) << "expected " << NameOf(test.expected) << ", got nothing";
        EXPECT_EQ(token->value, test.expected)
            << "expected " << NameOf(test.expected) << ", got " << NameOf(token->value);
        EXPECT_EQ(token->params, test.params);
        EXPECT_EQ(std::string(token->raw.begin(), token->raw.end()), input);

        // Nothing else comes out
        EXPECT_FALSE(local.Output().PopFor(10ms).has_value());

        covered.insert(test.expected);
        local.Shutdown();
    }

    // Every named token is reachable from some sequence
    EXPECT_EQ(covered.size(), kNamedTokenCount);
}

TEST_F(LexerTest, PlainCharacter) {
    FeedString("A");

    auto token = lexer->NextToken();
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->value, FromCharacter('A'));
    EXPECT_TRUE(token->params.empty());
}

TEST_F(LexerTest, PlainTextOneTokenPerByte) {
    const std::string text = "vt100 ok\r\n";
    FeedString(text);

    for (char c : text) {
        auto token = WaitToken();
        ASSERT_TRUE(token.has_value());
        EXPECT_EQ(token->value, FromCharacter(static_cast<uint8_t>(c)));
    }
    EXPECT_FALSE(WaitToken(20ms).has_value());
}

TEST_F(LexerTest, CursorPositionParams) {
    FeedString("\x1b[13;17H");

    auto token = WaitToken();
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->value, TokenValue::CursorPos);
    EXPECT_EQ(token->params, std::vector<int>({13, 17}));
}

TEST_F(LexerTest, WideCoordinatesDecode) {
    // Larger than the single-byte range the VT100 itself could address
    FeedString("\x1b[300;512H");

    auto token = WaitToken();
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->value, TokenValue::CursorPos);
    EXPECT_EQ(token->params, std::vector<int>({300, 512}));
}

TEST_F(LexerTest, CustomParamLimit) {
    LexerOptions options;
    options.maxParamValue = 132;
    Lexer narrow(options);

    std::string input = "\x1b[133C\x1b[132C";
    ASSERT_TRUE(narrow.Feed(input.c_str(), input.size()));

    auto token = narrow.Output().PopFor(kTokenWait);
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->value, TokenValue::CursorRt);
    EXPECT_EQ(token->params, std::vector<int>({132}));
}

// ============================================================================
// Discard Tests
// ============================================================================

TEST_F(LexerTest, UnknownTerminatorYieldsNothing) {
    FeedString("\x1b[99z");
    EXPECT_FALSE(WaitToken(50ms).has_value());

    // Machine is back in ground
    FeedString("\x1b[2J");
    auto token = WaitToken();
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->value, TokenValue::ClearScreen);
}

TEST_F(LexerTest, UnknownSequencesThenKnownSequence) {
    const char* unknown[] = {
        "\x1bZ", "\x1b(9", "\x1b)Z", "\x1b#1", "\x1b" "9x", "\x1b[?1049h",
        "\x1b[1;2;3H", "\x1b[5q", "\x1b[2;3y", "\x1b[38;5;1m",
    };

    for (const char* seq : unknown) {
        SCOPED_TRACE(::testing::PrintToString(std::string(seq)));
        FeedString(seq);
        EXPECT_FALSE(WaitToken(20ms).has_value());

        FeedString("\x1b[?7h");
        auto token = WaitToken();
        ASSERT_TRUE(token.has_value());
        EXPECT_EQ(token->value, TokenValue::SetWrap);
    }
}

// ============================================================================
// Ordering Tests
// ============================================================================

TEST_F(LexerTest, BackToBackSequencesKeepOrder) {
    FeedString("\x1b[1m\x1b[13;17H");

    auto first = WaitToken();
    auto second = WaitToken();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->value, TokenValue::Bold);
    EXPECT_EQ(second->value, TokenValue::CursorPos);
    EXPECT_FALSE(WaitToken(20ms).has_value());
}

TEST_F(LexerTest, MoreTokensThanQueueCapacity) {
    // Output holds 10 tokens; the reader drains while feeding continues
    std::string text(200, 'x');
    std::thread feeder([&]() {
        for (char c : text) {
            lexer->Feed(static_cast<uint8_t>(c));
        }
    });

    size_t received = 0;
    while (received < text.size()) {
        auto token = WaitToken();
        if (!token) {
            break;
        }
        EXPECT_EQ(token->value, FromCharacter('x'));
        ++received;
    }
    feeder.join();
    EXPECT_EQ(received, text.size());
}

TEST_F(LexerTest, ConcurrentFeedersKeepPerFeederOrder) {
    // Each feeder sends only bare characters so interleaving cannot form sequences
    constexpr int kPerFeeder = 500;
    std::thread lower([&]() {
        for (int i = 0; i < kPerFeeder; ++i) lexer->Feed(static_cast<uint8_t>('a' + i % 26));
    });
    std::thread upper([&]() {
        for (int i = 0; i < kPerFeeder; ++i) lexer->Feed(static_cast<uint8_t>('A' + i % 26));
    });

    int lowerIndex = 0;
    int upperIndex = 0;
    for (int n = 0; n < 2 * kPerFeeder; ++n) {
        auto token = WaitToken();
        if (!token) {
            ADD_FAILURE() << "timed out after " << n << " tokens";
            break;
        }
        char c = token->GetCharacter();
        if (c >= 'a' && c <= 'z') {
            EXPECT_EQ(c, 'a' + lowerIndex % 26);
            ++lowerIndex;
        } else {
            EXPECT_EQ(c, 'A' + upperIndex % 26);
            ++upperIndex;
        }
    }

    lower.join();
    upper.join();
    EXPECT_EQ(lowerIndex, kPerFeeder);
    EXPECT_EQ(upperIndex, kPerFeeder);
}

TEST_F(LexerTest, ConcurrentReadersReceiveEachTokenOnce) {
    constexpr int kTokens = 300;
    std::atomic<int> received{0};

    auto reader = [&]() {
        while (lexer->Output().PopFor(200ms)) {
            ++received;
        }
    };
    std::thread r1(reader);
    std::thread r2(reader);

    for (int i = 0; i < kTokens; ++i) {
        lexer->Feed('.');
    }

    r1.join();
    r2.join();
    EXPECT_EQ(received.load(), kTokens);
}

// ============================================================================
// Shutdown Tests
// ============================================================================

TEST_F(LexerTest, ShutdownIsIdempotent) {
    EXPECT_TRUE(lexer->IsRunning());
    lexer->Shutdown();
    EXPECT_FALSE(lexer->IsRunning());
    lexer->Shutdown();
    EXPECT_FALSE(lexer->IsRunning());
}

TEST_F(LexerTest, FeedAndNextTokenAfterShutdown) {
    lexer->Shutdown();
    EXPECT_FALSE(lexer->Feed('A'));
    EXPECT_FALSE(lexer->NextToken().has_value());
}

TEST_F(LexerTest, ShutdownWithFullQueues) {
    // Nobody reads: the worker blocks on a full output queue and the
    // feeder then blocks on a full input queue
    std::atomic<bool> feederDone{false};
    std::thread feeder([&]() {
        for (int i = 0; i < 100; ++i) {
            if (!lexer->Feed('z')) {
                break;
            }
        }
        feederDone = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(feederDone);

    auto start = std::chrono::steady_clock::now();
    lexer->Shutdown();
    feeder.join();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(feederDone);
    EXPECT_LT(elapsed, 2s);
}

TEST_F(LexerTest, ShutdownReleasesBlockedReader) {
    std::optional<Token> result = Token{};
    std::thread reader([&]() {
        result = lexer->NextToken();
    });

    std::this_thread::sleep_for(20ms);
    lexer->Shutdown();
    reader.join();

    EXPECT_FALSE(result.has_value());
}

TEST_F(LexerTest, ShutdownMidSequence) {
    FeedString("\x1b[13;");
    lexer->Shutdown();
    EXPECT_FALSE(lexer->IsRunning());
}

TEST_F(LexerTest, DestructorStopsWorker) {
    auto scoped = std::make_unique<Lexer>();
    scoped->Feed('q');
    scoped.reset();
    SUCCEED();
}

// ============================================================================
// Drain Tests
// ============================================================================

TEST_F(LexerTest, PendingInputReachesZeroOnlyAfterTokensAreQueued) {
    LexerOptions options;
    options.inputQueueCapacity = 64;
    options.outputQueueCapacity = 64;
    Lexer wide(options);

    // 40 characters plus two sequences
    std::string input = std::string(40, 'x') + "\x1b[2J\x1b[13;17H";
    ASSERT_TRUE(wide.Feed(input.c_str(), input.size()));

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (wide.PendingInput() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }

    ASSERT_EQ(wide.PendingInput(), 0u);
    EXPECT_EQ(wide.Output().Size(), 42u);
}

TEST_F(LexerTest, PendingInputCountsBlockedBytes) {
    // Nobody reads: output fills, then input, and the rest stays pending
    std::string input(30, 'p');
    std::thread feeder([&]() {
        lexer->Feed(input.c_str(), input.size());
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_GT(lexer->PendingInput(), 0u);

    size_t drained = 0;
    while (drained < input.size()) {
        if (!WaitToken()) {
            break;
        }
        ++drained;
    }
    feeder.join();
    EXPECT_EQ(drained, input.size());

    // The worker releases its count right after queueing the last token
    auto deadline = std::chrono::steady_clock::now() + 1s;
    while (lexer->PendingInput() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_EQ(lexer->PendingInput(), 0u);

    lexer->Shutdown();
    EXPECT_EQ(lexer->PendingInput(), 0u);
}

} // namespace Tests
} // namespace VT100Lex::Terminal
