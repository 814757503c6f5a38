/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <charconv>
#include <memory>

#include <fmt/format.h>
#include <json/json.h>

#include <bastion/internal/duration.h>
#include <bastion/internal/error_codec.h>
#include <bastion/internal/logger.h>

namespace bastion
{
    namespace
    {
        // nesting deeper than this is refused in both directions
        constexpr int max_sub_error_depth = 16;

        bool encode_list(const std::vector<domain_error>& errors, int depth, Json::Value& out);

        bool encode_one(const domain_error& err, int depth, Json::Value& out)
        {
            out = Json::Value(Json::objectValue);
            out["Type"] = static_cast<int>(err.type);
            out["Detail"] = err.detail;
            if (err.sub_errors.empty())
            {
                out["SubErrors"] = Json::Value(Json::nullValue);
            }
            else if (!encode_list(err.sub_errors, depth + 1, out["SubErrors"]))
            {
                return false;
            }
            out["RetryAfter"] = static_cast<Json::Int64>(err.retry_after.count());

            Json::Value ident(Json::objectValue);
            ident["type"] = err.subject ? err.subject->type : std::string();
            ident["value"] = err.subject ? err.subject->value : std::string();
            out["Identifier"] = ident;
            return true;
        }

        bool encode_list(const std::vector<domain_error>& errors, int depth, Json::Value& out)
        {
            if (depth > max_sub_error_depth)
                return false;
            out = Json::Value(Json::arrayValue);
            for (const auto& err : errors)
            {
                Json::Value item;
                if (!encode_one(err, depth, item))
                    return false;
                out.append(item);
            }
            return true;
        }

        bool decode_list(const Json::Value& in, int depth, std::vector<domain_error>& out, std::string& error);

        bool decode_one(const Json::Value& in, int depth, domain_error& out, std::string& error)
        {
            if (!in.isObject())
            {
                error = "sub error is not an object";
                return false;
            }

            const auto& type = in["Type"];
            if (!type.isIntegral() || !error_type_from_int(type.asInt64(), out.type))
            {
                error = "sub error has an invalid Type";
                return false;
            }

            const auto& detail = in["Detail"];
            if (!detail.isNull() && !detail.isString())
            {
                error = "sub error Detail is not a string";
                return false;
            }
            out.detail = detail.isString() ? detail.asString() : std::string();

            const auto& nested = in["SubErrors"];
            if (!nested.isNull() && !decode_list(nested, depth + 1, out.sub_errors, error))
                return false;

            const auto& retry_after = in["RetryAfter"];
            if (!retry_after.isNull())
            {
                if (!retry_after.isIntegral())
                {
                    error = "sub error RetryAfter is not an integer";
                    return false;
                }
                out.retry_after = std::chrono::nanoseconds(retry_after.asInt64());
            }

            const auto& ident = in["Identifier"];
            if (!ident.isNull())
            {
                if (!ident.isObject() || !(ident["type"].isNull() || ident["type"].isString())
                    || !(ident["value"].isNull() || ident["value"].isString()))
                {
                    error = "sub error Identifier is malformed";
                    return false;
                }
                identifier subject{ident["type"].asString(), ident["value"].asString()};
                if (!subject.type.empty() || !subject.value.empty())
                    out.subject = std::move(subject);
            }
            return true;
        }

        bool decode_list(const Json::Value& in, int depth, std::vector<domain_error>& out, std::string& error)
        {
            if (depth > max_sub_error_depth)
            {
                error = "sub errors are nested too deeply";
                return false;
            }
            if (!in.isArray())
            {
                error = "sub errors are not an array";
                return false;
            }
            out.clear();
            out.reserve(in.size());
            for (const auto& item : in)
            {
                domain_error err;
                if (!decode_one(item, depth, err, error))
                    return false;
                out.push_back(std::move(err));
            }
            return true;
        }
    }

    bool encode_sub_errors(const std::vector<domain_error>& sub_errors, std::string& out)
    {
        Json::Value root;
        if (!encode_list(sub_errors, 1, root))
            return false;
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        builder["emitUTF8"] = false;
        auto text = Json::writeString(builder, root);

        // jsoncpp escapes control characters and non ASCII code points but passes
        // DEL through. It can only occur inside a string literal.
        out.clear();
        out.reserve(text.size());
        for (char c : text)
        {
            if (c == '\x7f')
                out += "\\u007f";
            else
                out += c;
        }
        return true;
    }

    bool decode_sub_errors(const std::string& text, std::vector<domain_error>& out, std::string& error)
    {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Json::Value root;
        std::string parse_errors;
        if (!reader->parse(text.data(), text.data() + text.size(), &root, &parse_errors))
        {
            error = parse_errors;
            return false;
        }
        return decode_list(root, 1, out, error);
    }

    call_status wrap_error(const call_status& status, metadata_map& trailers)
    {
        if (status.ok())
            return status;
        if (!status.is_domain_error())
            return call_status(::grpc::StatusCode::UNKNOWN, status.message());

        const auto& err = status.domain();
        metadata_map pairs;
        pairs.emplace(metadata_keys::error_type, std::to_string(static_cast<int>(err.type)));
        if (!err.sub_errors.empty())
        {
            std::string json_text;
            if (!encode_sub_errors(err.sub_errors, json_text))
            {
                BASTION_ERROR("unable to encode sub errors for \"{}\"", err.detail);
                return call_status(::grpc::StatusCode::INTERNAL, fmt::format("marshaling json: sub errors of \"{}\"", err.detail));
            }
            pairs.emplace(metadata_keys::sub_errors, std::move(json_text));
        }
        if (err.retry_after.count() != 0)
            pairs.emplace(metadata_keys::retry_after, format_duration(err.retry_after));

        for (const auto& [key, value] : pairs)
        {
            if (!is_printable_metadata_value(value))
            {
                BASTION_ERROR("refusing unprintable {} trailer for \"{}\"", key, err.detail);
                return call_status(::grpc::StatusCode::INTERNAL, fmt::format("unprintable {} trailer for \"{}\"", key, err.detail));
            }
        }

        trailers.insert(pairs.begin(), pairs.end());
        return call_status(::grpc::StatusCode::UNKNOWN, err.detail);
    }

    call_status unwrap_error(const call_status& status, const metadata_map& trailers)
    {
        if (status.ok() || status.is_domain_error())
            return status;

        auto types = metadata_values(trailers, metadata_keys::error_type);
        if (types.empty())
            return status;
        if (types.size() != 1)
        {
            return internal_error(
                fmt::format("multiple errortype metadata, wrapped error \"{}\"", status.message()));
        }

        std::int64_t code = 0;
        const auto& text = types.front();
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), code);
        if (ec != std::errc() || ptr != text.data() + text.size())
        {
            return internal_error(fmt::format(
                "failed to parse errortype metadata \"{}\", wrapped error \"{}\"", text, status.message()));
        }

        error_type type = error_type::internal_server;
        if (!error_type_from_int(code, type))
        {
            return internal_error(
                fmt::format("unrecognised errortype {}, wrapped error \"{}\"", code, status.message()));
        }

        domain_error err = make_domain_error(type, status.message());

        auto sub_errors = metadata_values(trailers, metadata_keys::sub_errors);
        if (!sub_errors.empty())
        {
            if (sub_errors.size() != 1)
            {
                return internal_error(
                    fmt::format("multiple suberrors metadata, wrapped error \"{}\"", status.message()));
            }
            std::string reason;
            if (!decode_sub_errors(sub_errors.front(), err.sub_errors, reason))
            {
                return internal_error(fmt::format(
                    "failed to unmarshal suberrors metadata ({}), wrapped error \"{}\"", reason, status.message()));
            }
        }

        auto retry_after = metadata_values(trailers, metadata_keys::retry_after);
        if (!retry_after.empty())
        {
            if (retry_after.size() != 1)
            {
                return internal_error(
                    fmt::format("multiple retryafter metadata, wrapped error \"{}\"", status.message()));
            }
            if (!parse_duration(retry_after.front(), err.retry_after))
            {
                return internal_error(fmt::format("failed to parse retryafter metadata \"{}\", wrapped error \"{}\"",
                    retry_after.front(),
                    status.message()));
            }
        }

        return err;
    }
}
