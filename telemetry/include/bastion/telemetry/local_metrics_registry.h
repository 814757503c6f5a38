/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <map>
#include <mutex>
#include <variant>

#include <bastion/telemetry/i_metrics_registry.h>

namespace bastion::telemetry
{
    // In process registry, families are kept for the lifetime of the registry
    class local_metrics_registry : public i_metrics_registry
    {
        struct entry
        {
            metric_kind kind;
            metric_descriptor descriptor;
            std::variant<std::shared_ptr<counter_family>, std::shared_ptr<gauge_family>, std::shared_ptr<histogram_family>>
                family;
        };

        mutable std::mutex mtx_;
        std::map<std::string, entry> families_;

        template<class Family>
        registration_result<Family> register_family(metric_kind kind, const metric_descriptor& descriptor);

        template<class Family> std::shared_ptr<Family> find_family(metric_kind kind, const std::string& name) const;

    public:
        local_metrics_registry() = default;
        ~local_metrics_registry() override = default;

        registration_result<counter_family> register_counter(const metric_descriptor& descriptor) override;
        registration_result<gauge_family> register_gauge(const metric_descriptor& descriptor) override;
        registration_result<histogram_family> register_histogram(const metric_descriptor& descriptor) override;

        std::shared_ptr<counter_family> find_counter(const std::string& name) const;
        std::shared_ptr<gauge_family> find_gauge(const std::string& name) const;
        std::shared_ptr<histogram_family> find_histogram(const std::string& name) const;
    };
}
