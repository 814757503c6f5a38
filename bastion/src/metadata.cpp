/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <bastion/internal/metadata.h>

namespace bastion
{
    std::vector<std::string> metadata_values(const metadata_map& md, std::string_view key)
    {
        std::vector<std::string> values;
        auto [begin, end] = md.equal_range(std::string(key));
        for (auto it = begin; it != end; ++it)
            values.push_back(it->second);
        return values;
    }

    bool is_printable_metadata_value(std::string_view value)
    {
        for (char c : value)
        {
            auto byte = static_cast<unsigned char>(c);
            if (byte < 0x20 || byte > 0x7e)
                return false;
        }
        return true;
    }

    metadata_map to_metadata_map(const std::multimap<::grpc::string_ref, ::grpc::string_ref>& md)
    {
        metadata_map result;
        for (const auto& [key, value] : md)
            result.emplace(std::string(key.data(), key.size()), std::string(value.data(), value.size()));
        return result;
    }

    method_name split_method_name(std::string_view full_method)
    {
        if (!full_method.empty() && full_method.front() == '/')
            full_method.remove_prefix(1);
        auto slash = full_method.find('/');
        if (slash == std::string_view::npos)
            return {"unknown", "unknown"};
        return {std::string(full_method.substr(0, slash)), std::string(full_method.substr(slash + 1))};
    }
}
