#pragma once
/**
 * @file block.hpp
 * @brief Bordered console Blocks that narrate a setup step and run its action.
 *
 * A Block prints a fixed sequence of styled lines around an action:
 *
 *   Header:  +----+ / text / +----+ / action
 *   Footer:  rewind / +----+ / text / +----+ / action
 *   Body:    text / |----| / action / rewind / | success | / |----|
 *
 * Body items may carry their own inline step; such an item prints dimmed, runs
 * the step, then prints a "success" label and a short separator.
 *
 * Blocks write straight to their stream with no locking: callers that render
 * from several threads must serialize externally. Exceptions thrown by an
 * action are not caught; whatever was printed before stays printed.
 */

#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "ignite/console/style.hpp"

namespace ignite::console {

/** @enum Variant
 *  @brief Border/print ordering of a Block.
 */
enum class Variant : std::uint8_t {
    Header = 0, ///< Top border, text, bottom border, then the action
    Body,       ///< Text, closing border, action, success line
    Footer      ///< Rewinds over the previous line before drawing like Header
};

/** @struct BodyItem
 *  @brief One element of a Block's text: plain text or text with an inline step.
 */
struct BodyItem {
    std::string           text; ///< Text to wrap and center
    std::function<void()> step; ///< Inline step; empty for plain text

    BodyItem(const char* t) : text(t) {}
    BodyItem(std::string t) : text(std::move(t)) {}
    template <class F>
    BodyItem(std::string t, F&& f) : text(std::move(t)), step(std::forward<F>(f)) {}

    bool has_step() const noexcept { return static_cast<bool>(step); }
};

using Lines = std::vector<BodyItem>;

/** @struct BlockSpec
 *  @brief Everything a Block needs except its action.
 */
struct BlockSpec {
    Lines                   lines;                    ///< Text items, may be empty
    Variant                 variant{Variant::Body};   ///< Print ordering
    std::optional<int>      width;                    ///< Columns; terminal width when unset
    std::optional<Emphasis> style;                    ///< Emphasis; default_emphasis(variant) when unset
    std::ostream*           out{nullptr};             ///< Destination; std::cout when null
};

/// Header and Footer are Bright, Body is Normal.
Emphasis default_emphasis(Variant v) noexcept;

/// Explicit width or terminal width, clamped to CONSOLE_MIN_WIDTH.
int resolve_width(std::optional<int> requested) noexcept;

std::string_view to_string(Variant v) noexcept;

/** @class Frame
 *  @brief Drawing primitives shared by every Block instantiation.
 */
class Frame {
public:
    Frame(int width, Emphasis style, std::ostream& out) noexcept;

    /// "+----+" in the block style.
    void border() const;
    /// "|----|" with styled vertical glyphs as edges.
    void closing_border() const;
    /// Wrapped, centered text items; runs inline steps as they are reached.
    void body(const Lines& lines) const;
    /// Rewind two lines, print the success line and the closing border again.
    void conclude() const;
    /// Emit @p rows "previous line" escapes followed by a line feed.
    void rewind(int rows) const;

    int width() const noexcept { return width_; }

private:
    std::string vline() const;
    std::string success() const;
    void emit(const std::string& line) const;
    void inline_item(const BodyItem& item) const;

    int           width_;
    Emphasis      style_;
    std::ostream* out_;
};

/** @class Block
 *  @brief Immutable description of one rendering pass returning the action's result.
 *  @tparam R Result type of the action (void by default).
 */
template <class R = void>
class Block {
public:
    using result_type = R;
    using Action      = std::function<R()>;

    /// Construct from a spec; an empty action is a no-op returning R{}.
    explicit Block(BlockSpec spec, Action action = Action{})
        : lines_(std::move(spec.lines)),
          variant_(spec.variant),
          width_(resolve_width(spec.width)),
          style_(spec.style.value_or(default_emphasis(spec.variant))),
          out_(spec.out ? spec.out : &std::cout),
          action_(std::move(action)) {}

    /**
     * @brief Draw the block and run its action exactly once.
     * @return The action's result.
     */
    R render() const;

    const Lines& lines()   const noexcept { return lines_; }
    Variant      variant() const noexcept { return variant_; }
    int          width()   const noexcept { return width_; }
    Emphasis     style()   const noexcept { return style_; }

private:
    R invoke() const {
        out_->flush();
        if constexpr (std::is_void_v<R>) {
            if (action_) action_();
        } else {
            if constexpr (std::is_default_constructible_v<R>) {
                if (!action_) return R{};
            }
            return action_();
        }
    }

    Lines         lines_;
    Variant       variant_;
    int           width_;
    Emphasis      style_;
    std::ostream* out_;
    Action        action_;
};

template <class R>
R Block<R>::render() const {
    const Frame frame(width_, style_, *out_);
    switch (variant_) {
        case Variant::Header:
            frame.border();
            frame.body(lines_);
            frame.border();
            return invoke();
        case Variant::Footer:
            frame.rewind(2);
            frame.border();
            frame.body(lines_);
            frame.border();
            return invoke();
        case Variant::Body:
            break;
    }

    frame.body(lines_);
    frame.closing_border();
    if constexpr (std::is_void_v<R>) {
        invoke();
        frame.conclude();
    } else {
        R result = invoke();
        frame.conclude();
        return result;
    }
}

/// Build a Block whose result type is deduced from @p action.
template <class F>
auto make_block(BlockSpec spec, F&& action) {
    using R = std::invoke_result_t<F&>;
    return Block<R>(std::move(spec), typename Block<R>::Action(std::forward<F>(action)));
}

} // namespace ignite::console
