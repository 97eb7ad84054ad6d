#pragma once
/**
 * @file block_decorator.hpp
 * @brief Wrap any callable so that every call is rendered inside a Block.
 *
 * @code
 *   auto add = block_decorator({"step"})([](int a, int b) { return a + b; });
 *   int five = add(2, 3);   // prints the block, returns 5
 * @endcode
 *
 * The wrapper takes the same arguments as the wrapped callable (perfectly
 * forwarded) and returns its result unchanged; exceptions pass through.
 */

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

#include "ignite/console/block.hpp"

namespace ignite::console {

/** @class BlockDecorator
 *  @brief Holds the Block text/variant/style and applies them to callables.
 */
class BlockDecorator {
public:
    explicit BlockDecorator(BlockSpec spec) : spec_(std::move(spec)) {}

    /// Return a callable equivalent to @p fn that renders a Block around each call.
    template <class F>
    auto operator()(F fn) const {
        return [spec = spec_, fn = std::move(fn)](auto&&... args) mutable -> decltype(auto) {
            using R = std::invoke_result_t<F&, decltype(args)...>;
            const Block<R> block(spec, [&]() -> R {
                return std::invoke(fn, std::forward<decltype(args)>(args)...);
            });
            return block.render();
        };
    }

    const BlockSpec& spec() const noexcept { return spec_; }

private:
    BlockSpec spec_;
};

/// Decorator factory; Body variant unless told otherwise.
inline BlockDecorator block_decorator(Lines lines,
                                      Variant variant = Variant::Body,
                                      std::optional<Emphasis> style = std::nullopt) {
    return BlockDecorator(BlockSpec{.lines = std::move(lines), .variant = variant, .style = style});
}

} // namespace ignite::console
