/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <vector>

namespace bastion::telemetry
{
    enum class metric_kind
    {
        counter,
        gauge,
        histogram
    };

    struct metric_descriptor
    {
        std::string name;
        std::string help;
        std::vector<std::string> label_names;
        // upper bounds for histograms, ignored for other kinds
        std::vector<double> buckets;
    };

    // the usual latency buckets, in seconds
    std::vector<double> default_buckets();

    class counter
    {
        std::atomic<std::uint64_t> value_{0};

    public:
        void inc(std::uint64_t n = 1) { value_.fetch_add(n, std::memory_order_relaxed); }
        std::uint64_t value() const { return value_.load(std::memory_order_relaxed); }
    };

    class gauge
    {
        std::atomic<std::int64_t> value_{0};

    public:
        void inc() { value_.fetch_add(1, std::memory_order_relaxed); }
        void dec() { value_.fetch_sub(1, std::memory_order_relaxed); }
        void set(std::int64_t v) { value_.store(v, std::memory_order_relaxed); }
        std::int64_t value() const { return value_.load(std::memory_order_relaxed); }
    };

    class histogram
    {
        std::vector<double> bounds_;
        std::unique_ptr<std::atomic<std::uint64_t>[]> buckets_; // one extra for +Inf
        std::atomic<std::uint64_t> count_{0};
        std::atomic<double> sum_{0.0};

    public:
        explicit histogram(std::vector<double> bounds);

        void observe(double value);

        std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
        double sum() const { return sum_.load(std::memory_order_relaxed); }
        const std::vector<double>& bounds() const { return bounds_; }
        // cumulative count of observations <= bounds()[i], i == bounds().size() is +Inf
        std::uint64_t cumulative_count(std::size_t i) const;
    };

    // A named metric with one series per distinct label value set.
    // Series are created on first use and live as long as the family.
    template<class Metric> class metric_family
    {
        metric_descriptor descriptor_;
        mutable std::shared_mutex series_mtx_;
        std::map<std::vector<std::string>, std::unique_ptr<Metric>> series_;

        std::unique_ptr<Metric> make_series() const
        {
            if constexpr (std::is_same_v<Metric, histogram>)
                return std::make_unique<histogram>(descriptor_.buckets);
            else
                return std::make_unique<Metric>();
        }

    public:
        explicit metric_family(metric_descriptor descriptor)
            : descriptor_(std::move(descriptor))
        {
        }

        const metric_descriptor& descriptor() const { return descriptor_; }

        // nullptr when the number of values does not match the label names
        Metric* with_labels(const std::vector<std::string>& values)
        {
            if (values.size() != descriptor_.label_names.size())
                return nullptr;
            {
                std::shared_lock lock(series_mtx_);
                auto it = series_.find(values);
                if (it != series_.end())
                    return it->second.get();
            }
            std::unique_lock lock(series_mtx_);
            auto [it, inserted] = series_.try_emplace(values);
            if (inserted)
                it->second = make_series();
            return it->second.get();
        }

        // lookup only, never creates a series
        const Metric* find(const std::vector<std::string>& values) const
        {
            std::shared_lock lock(series_mtx_);
            auto it = series_.find(values);
            return it == series_.end() ? nullptr : it->second.get();
        }

        std::size_t series_count() const
        {
            std::shared_lock lock(series_mtx_);
            return series_.size();
        }
    };

    using counter_family = metric_family<counter>;
    using gauge_family = metric_family<gauge>;
    using histogram_family = metric_family<histogram>;

    enum class registration_status
    {
        registered,
        // a family of the same name and shape exists, it is handed back for reuse
        already_registered,
        // a family of the same name exists with a different kind, labels or buckets
        conflict
    };

    template<class Family> struct registration_result
    {
        registration_status status = registration_status::conflict;
        std::shared_ptr<Family> family;
    };

    // Injected registration interface for the metrics this layer records.
    // Registration is idempotent: registering the same shape twice yields the same family.
    class i_metrics_registry
    {
    public:
        virtual ~i_metrics_registry() = default;

        virtual registration_result<counter_family> register_counter(const metric_descriptor& descriptor) = 0;
        virtual registration_result<gauge_family> register_gauge(const metric_descriptor& descriptor) = 0;
        virtual registration_result<histogram_family> register_histogram(const metric_descriptor& descriptor) = 0;
    };

    // the family to use after a registration attempt, nullptr only on conflict
    template<class Family> std::shared_ptr<Family> adopt(const registration_result<Family>& result)
    {
        if (result.status == registration_status::conflict)
            return nullptr;
        return result.family;
    }
}
