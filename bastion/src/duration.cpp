/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <array>
#include <cstdint>
#include <limits>
#include <utility>

#include <bastion/internal/duration.h>

namespace bastion
{
    namespace
    {
        constexpr std::uint64_t nanos_per_second = 1'000'000'000ULL;

        std::uint64_t pow10(int precision)
        {
            std::uint64_t scale = 1;
            for (int i = 0; i < precision; ++i)
                scale *= 10;
            return scale;
        }

        // splits v into v / 10^precision and the decimal fraction, without trailing zeros
        std::pair<std::uint64_t, std::string> split_fraction(std::uint64_t v, int precision)
        {
            auto scale = pow10(precision);
            auto remainder = v % scale;
            if (remainder == 0)
                return {v / scale, std::string()};

            std::string digits(precision, '0');
            for (int i = precision - 1; i >= 0; --i)
            {
                digits[i] = static_cast<char>('0' + remainder % 10);
                remainder /= 10;
            }
            while (!digits.empty() && digits.back() == '0')
                digits.pop_back();
            return {v / scale, "." + digits};
        }

        struct unit_entry
        {
            std::string_view name;
            std::uint64_t nanos;
        };

        const std::array<unit_entry, 8>& unit_table()
        {
            static const std::array<unit_entry, 8> table = {{
                {"ns", 1ULL},
                {"us", 1'000ULL},
                {"\xc2\xb5s", 1'000ULL},
                {"\xce\xbcs", 1'000ULL},
                {"ms", 1'000'000ULL},
                {"s", nanos_per_second},
                {"m", 60ULL * nanos_per_second},
                {"h", 3600ULL * nanos_per_second},
            }};
            return table;
        }

        bool is_digit(char c)
        {
            return c >= '0' && c <= '9';
        }
    }

    std::string format_duration(std::chrono::nanoseconds d)
    {
        auto count = d.count();
        bool negative = count < 0;
        std::uint64_t u = negative ? std::uint64_t(0) - static_cast<std::uint64_t>(count) : static_cast<std::uint64_t>(count);
        if (u == 0)
            return "0s";

        std::string result;
        if (u < nanos_per_second)
        {
            int precision = 6;
            std::string unit = "ms";
            if (u < 1'000ULL)
            {
                precision = 0;
                unit = "ns";
            }
            else if (u < 1'000'000ULL)
            {
                precision = 3;
                unit = "us";
            }
            auto [whole, fraction] = split_fraction(u, precision);
            result = std::to_string(whole) + fraction + unit;
        }
        else
        {
            auto [seconds, fraction] = split_fraction(u, 9);
            result = std::to_string(seconds % 60) + fraction + "s";
            auto minutes = seconds / 60;
            if (minutes > 0)
            {
                result = std::to_string(minutes % 60) + "m" + result;
                auto hours = minutes / 60;
                if (hours > 0)
                    result = std::to_string(hours) + "h" + result;
            }
        }

        if (negative)
            result.insert(result.begin(), '-');
        return result;
    }

    bool parse_duration(std::string_view text, std::chrono::nanoseconds& out)
    {
        constexpr std::uint64_t limit = std::uint64_t(1) << 63;

        std::string_view s = text;
        bool negative = false;
        if (!s.empty() && (s.front() == '-' || s.front() == '+'))
        {
            negative = s.front() == '-';
            s.remove_prefix(1);
        }
        if (s == "0")
        {
            out = std::chrono::nanoseconds(0);
            return true;
        }
        if (s.empty())
            return false;

        std::uint64_t total = 0;
        while (!s.empty())
        {
            if (!(s.front() == '.' || is_digit(s.front())))
                return false;

            // integer part
            std::uint64_t whole = 0;
            std::size_t consumed = 0;
            while (consumed < s.size() && is_digit(s[consumed]))
            {
                if (whole > (limit - 1) / 10)
                    return false;
                whole = whole * 10 + static_cast<std::uint64_t>(s[consumed] - '0');
                if (whole > limit)
                    return false;
                ++consumed;
            }
            bool has_whole = consumed > 0;
            s.remove_prefix(consumed);

            // fractional part, digits beyond what fits are ignored
            std::uint64_t fraction = 0;
            double scale = 1.0;
            bool has_fraction = false;
            if (!s.empty() && s.front() == '.')
            {
                s.remove_prefix(1);
                consumed = 0;
                bool overflow = false;
                while (consumed < s.size() && is_digit(s[consumed]))
                {
                    if (!overflow)
                    {
                        if (fraction > (limit - 1) / 10)
                        {
                            overflow = true;
                        }
                        else
                        {
                            fraction = fraction * 10 + static_cast<std::uint64_t>(s[consumed] - '0');
                            scale *= 10;
                        }
                    }
                    ++consumed;
                }
                has_fraction = consumed > 0;
                s.remove_prefix(consumed);
            }
            if (!has_whole && !has_fraction)
                return false;

            // unit
            consumed = 0;
            while (consumed < s.size() && s[consumed] != '.' && !is_digit(s[consumed]))
                ++consumed;
            if (consumed == 0)
                return false;
            auto unit_name = s.substr(0, consumed);
            s.remove_prefix(consumed);

            std::uint64_t unit = 0;
            for (const auto& entry : unit_table())
            {
                if (entry.name == unit_name)
                {
                    unit = entry.nanos;
                    break;
                }
            }
            if (unit == 0)
                return false;

            if (whole > limit / unit)
                return false;
            whole *= unit;
            if (fraction > 0)
            {
                whole += static_cast<std::uint64_t>(static_cast<double>(fraction) * (static_cast<double>(unit) / scale));
                if (whole > limit)
                    return false;
            }
            total += whole;
            if (total > limit)
                return false;
        }

        if (negative)
        {
            out = std::chrono::nanoseconds(total == limit ? std::numeric_limits<std::int64_t>::min()
                                                          : -static_cast<std::int64_t>(total));
            return true;
        }
        if (total > limit - 1)
            return false;
        out = std::chrono::nanoseconds(static_cast<std::int64_t>(total));
        return true;
    }
}
