/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>

#include <bastion/telemetry/local_metrics_registry.h>

namespace bastion::telemetry
{
    std::vector<double> default_buckets()
    {
        return {.005, .01, .025, .05, .1, .25, .5, 1, 2.5, 5, 10};
    }

    histogram::histogram(std::vector<double> bounds)
        : bounds_(std::move(bounds))
    {
        if (bounds_.empty())
            bounds_ = default_buckets();
        std::sort(bounds_.begin(), bounds_.end());
        buckets_ = std::make_unique<std::atomic<std::uint64_t>[]>(bounds_.size() + 1);
    }

    void histogram::observe(double value)
    {
        auto it = std::lower_bound(bounds_.begin(), bounds_.end(), value);
        auto index = static_cast<std::size_t>(it - bounds_.begin());
        buckets_[index].fetch_add(1, std::memory_order_relaxed);
        sum_.fetch_add(value, std::memory_order_relaxed);
        count_.fetch_add(1, std::memory_order_relaxed);
    }

    std::uint64_t histogram::cumulative_count(std::size_t i) const
    {
        std::uint64_t total = 0;
        for (std::size_t b = 0; b <= std::min(i, bounds_.size()); ++b)
            total += buckets_[b].load(std::memory_order_relaxed);
        return total;
    }

    namespace
    {
        bool same_shape(metric_kind existing_kind,
            const metric_descriptor& existing,
            metric_kind kind,
            const metric_descriptor& requested)
        {
            if (existing_kind != kind || existing.label_names != requested.label_names)
                return false;
            if (kind != metric_kind::histogram)
                return true;
            auto requested_buckets = requested.buckets.empty() ? default_buckets() : requested.buckets;
            std::sort(requested_buckets.begin(), requested_buckets.end());
            return existing.buckets == requested_buckets;
        }
    }

    template<class Family>
    registration_result<Family> local_metrics_registry::register_family(
        metric_kind kind, const metric_descriptor& descriptor)
    {
        std::scoped_lock lock(mtx_);
        auto it = families_.find(descriptor.name);
        if (it != families_.end())
        {
            if (!same_shape(it->second.kind, it->second.descriptor, kind, descriptor))
                return {registration_status::conflict, nullptr};
            return {registration_status::already_registered, std::get<std::shared_ptr<Family>>(it->second.family)};
        }

        auto stored = descriptor;
        if (kind == metric_kind::histogram)
        {
            if (stored.buckets.empty())
                stored.buckets = default_buckets();
            std::sort(stored.buckets.begin(), stored.buckets.end());
        }
        auto family = std::make_shared<Family>(stored);
        families_.emplace(descriptor.name, entry{kind, std::move(stored), family});
        return {registration_status::registered, family};
    }

    template<class Family>
    std::shared_ptr<Family> local_metrics_registry::find_family(metric_kind kind, const std::string& name) const
    {
        std::scoped_lock lock(mtx_);
        auto it = families_.find(name);
        if (it == families_.end() || it->second.kind != kind)
            return nullptr;
        return std::get<std::shared_ptr<Family>>(it->second.family);
    }

    registration_result<counter_family> local_metrics_registry::register_counter(const metric_descriptor& descriptor)
    {
        return register_family<counter_family>(metric_kind::counter, descriptor);
    }

    registration_result<gauge_family> local_metrics_registry::register_gauge(const metric_descriptor& descriptor)
    {
        return register_family<gauge_family>(metric_kind::gauge, descriptor);
    }

    registration_result<histogram_family> local_metrics_registry::register_histogram(const metric_descriptor& descriptor)
    {
        return register_family<histogram_family>(metric_kind::histogram, descriptor);
    }

    std::shared_ptr<counter_family> local_metrics_registry::find_counter(const std::string& name) const
    {
        return find_family<counter_family>(metric_kind::counter, name);
    }

    std::shared_ptr<gauge_family> local_metrics_registry::find_gauge(const std::string& name) const
    {
        return find_family<gauge_family>(metric_kind::gauge, name);
    }

    std::shared_ptr<histogram_family> local_metrics_registry::find_histogram(const std::string& name) const
    {
        return find_family<histogram_family>(metric_kind::histogram, name);
    }
}
