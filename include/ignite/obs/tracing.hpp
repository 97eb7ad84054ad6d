#pragma once
/**
 * @file tracing.hpp
 * @brief Minimal tracing facade: span records + counters.
 * @details Launcher steps and HTTP requests report spans through a Tracer that
 *          the caller injects. The bundled implementation writes spans to the
 *          spdlog logger; an exporter-backed Tracer can replace it without
 *          touching call sites.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ignite::obs {

    /** @struct Counters
     *  @brief Process-level counters for recorded spans.
     */
    struct Counters {
        uint64_t spans{0};   ///< Total spans recorded
        uint64_t errors{0};  ///< Spans that ended with an error status
    };

    /** @struct SpanRecord
     *  @brief Payload describing one finished span.
     */
    struct SpanRecord {
        std::string name;                                         ///< Operation name
        std::string service;                                      ///< Service resource label
        bool        ok{true};                                     ///< Status
        std::string error;                                        ///< Status description when !ok
        std::chrono::microseconds duration{0};                    ///< Wall time
        std::vector<std::pair<std::string, std::string>> attributes; ///< Key/value attributes
    };

    /** @class Tracer
     *  @brief Tracing sink interface.
     */
    class Tracer {
    public:
        virtual ~Tracer() = default;
        /// Record a single finished span.
        virtual void record(const SpanRecord& s) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
        /// Service name attached to every span.
        virtual const std::string& service() const noexcept = 0;
    };

    /// spdlog-backed Tracer for @p service.
    std::shared_ptr<Tracer> make_log_tracer(std::string service);

    /** @class ScopedSpan
     *  @brief Times a scope and records it on destruction (no-op with a null tracer).
     */
    class ScopedSpan {
    public:
        ScopedSpan(Tracer* tracer, std::string name);
        ~ScopedSpan();

        ScopedSpan(const ScopedSpan&)            = delete;
        ScopedSpan& operator=(const ScopedSpan&) = delete;

        void set_attribute(std::string key, std::string value);
        /// Mark the span as failed with @p description.
        void fail(std::string description);

    private:
        Tracer*                               tracer_;
        SpanRecord                            rec_;
        std::chrono::steady_clock::time_point start_;
    };

} // namespace ignite::obs
