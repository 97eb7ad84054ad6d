/**
 * @file test_terminal.cpp
 * @brief Tests for the terminal width lookup and Block width resolution.
 *
 * Validates:
 *  - Without a terminal, $COLUMNS is used, floored at 20
 *  - Unset or unparsable $COLUMNS falls back to 80
 *  - An unset Block width resolves to a usable width and draws with it
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include <optional>
#include <sstream>
#include <string>
#include <unistd.h>

#include "ignite/console/block.hpp"
#include "ignite/console/terminal.hpp"

using ignite::console::Block;
using ignite::console::BlockSpec;
using ignite::console::Variant;
using ignite::console::resolve_width;
using ignite::console::terminal_columns;

///
/// Helper: overrides (or clears) $COLUMNS and restores the previous value.
///
class ColumnsEnv {
public:
  explicit ColumnsEnv(const char* value) {
    if (const char* old = std::getenv("COLUMNS")) saved_ = old;
    if (value) ::setenv("COLUMNS", value, 1);
    else ::unsetenv("COLUMNS");
  }
  ~ColumnsEnv() {
    if (saved_) ::setenv("COLUMNS", saved_->c_str(), 1);
    else ::unsetenv("COLUMNS");
  }
  ColumnsEnv(const ColumnsEnv&) = delete;
  ColumnsEnv& operator=(const ColumnsEnv&) = delete;

private:
  std::optional<std::string> saved_;
};

///
/// Helper: a pipe end is never a terminal.
///
class Pipe {
public:
  Pipe() { ok_ = ::pipe(fds_) == 0; }
  ~Pipe() {
    if (!ok_) return;
    ::close(fds_[0]);
    ::close(fds_[1]);
  }
  bool ok() const { return ok_; }
  int write_end() const { return fds_[1]; }

private:
  int  fds_[2]{-1, -1};
  bool ok_{false};
};

// ------------------------------ terminal_columns ----------------------------

/**
 * @test No_Terminal_No_Columns_Is_80
 */
TEST(Terminal, No_Terminal_No_Columns_Is_80) {
  Pipe p;
  ASSERT_TRUE(p.ok());
  ColumnsEnv env(nullptr);
  EXPECT_EQ(terminal_columns(p.write_end()), 80);
  EXPECT_EQ(terminal_columns(-1), 80);
}

/**
 * @test Columns_Env_Is_Used
 */
TEST(Terminal, Columns_Env_Is_Used) {
  Pipe p;
  ASSERT_TRUE(p.ok());
  ColumnsEnv env("120");
  EXPECT_EQ(terminal_columns(p.write_end()), 120);
}

/**
 * @test Unparsable_Columns_Falls_Back
 */
TEST(Terminal, Unparsable_Columns_Falls_Back) {
  Pipe p;
  ASSERT_TRUE(p.ok());
  for (const char* bad : {"abc", "", "12x", " 90"}) {
    ColumnsEnv env(bad);
    EXPECT_EQ(terminal_columns(p.write_end()), 80) << '"' << bad << '"';
  }
}

/**
 * @test Narrow_Columns_Are_Floored
 */
TEST(Terminal, Narrow_Columns_Are_Floored) {
  Pipe p;
  ASSERT_TRUE(p.ok());
  {
    ColumnsEnv env("5");
    EXPECT_EQ(terminal_columns(p.write_end()), 20);
  }
  {
    ColumnsEnv env("-40");
    EXPECT_EQ(terminal_columns(p.write_end()), 20);
  }
}

// ------------------------------- resolve_width ------------------------------

/**
 * @test Unset_Width_Is_Usable
 */
TEST(Terminal, Unset_Width_Is_Usable) {
  for (const char* cols : {static_cast<const char*>(nullptr), "1", "abc", "300"}) {
    ColumnsEnv env(cols);
    EXPECT_GE(resolve_width(std::nullopt), 4);
    EXPECT_EQ(resolve_width(std::nullopt), terminal_columns());
  }
  EXPECT_EQ(resolve_width(2), 4);
  EXPECT_EQ(resolve_width(33), 33);
}

/**
 * @test Block_Without_Width_Draws_At_Terminal_Width
 */
TEST(Terminal, Block_Without_Width_Draws_At_Terminal_Width) {
  ColumnsEnv env(nullptr);
  std::ostringstream os;
  BlockSpec spec;
  spec.variant = Variant::Header;
  spec.out = &os;
  Block<> block(std::move(spec));

  const int expected = terminal_columns();
  EXPECT_EQ(block.width(), expected);
  block.render();

  const std::string border = "+" + std::string(static_cast<std::size_t>(expected - 2), '-') + "+";
  EXPECT_NE(os.str().find(border), std::string::npos);
}
