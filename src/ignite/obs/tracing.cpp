/**
 * @file tracing.cpp
 * @brief Logger-backed Tracer and the ScopedSpan helper.
 */
#include "ignite/obs/tracing.hpp"
#include "ignite/obs/log.hpp"

#include <mutex>

namespace ignite::obs {

    class LogTracer : public Tracer {
    public:
        explicit LogTracer(std::string service) : service_(std::move(service)) {}

        void record(const SpanRecord& s) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                ctr_.spans++;
                if (!s.ok) ctr_.errors++;
            }
            std::string attrs;
            for (const auto& [k, v] : s.attributes) {
                if (!attrs.empty()) attrs += ' ';
                attrs += k + '=' + v;
            }
            if (s.ok) {
                logger()->debug("span service={} name=\"{}\" us={} {}",
                                service_, s.name, s.duration.count(), attrs);
            } else {
                logger()->warn("span service={} name=\"{}\" us={} error=\"{}\" {}",
                               service_, s.name, s.duration.count(), s.error, attrs);
            }
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
        const std::string& service() const noexcept override { return service_; }

    private:
        std::string service_;
        mutable std::mutex mu_;
        Counters ctr_;
    };

    std::shared_ptr<Tracer> make_log_tracer(std::string service) {
        return std::make_shared<LogTracer>(std::move(service));
    }

    ScopedSpan::ScopedSpan(Tracer* tracer, std::string name)
        : tracer_(tracer), start_(std::chrono::steady_clock::now()) {
        rec_.name = std::move(name);
        if (tracer_) rec_.service = tracer_->service();
    }

    ScopedSpan::~ScopedSpan() {
        if (!tracer_) return;
        rec_.duration = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_);
        tracer_->record(rec_);
    }

    void ScopedSpan::set_attribute(std::string key, std::string value) {
        rec_.attributes.emplace_back(std::move(key), std::move(value));
    }

    void ScopedSpan::fail(std::string description) {
        rec_.ok = false;
        rec_.error = std::move(description);
    }

} // namespace ignite::obs
