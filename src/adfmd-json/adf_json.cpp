#include "adf_json.hpp"

#include <adfmd/document.hpp>

#include <json/json.h>

#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace adfmd {

namespace {

[[nodiscard]] std::string compact_json(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;

    return Json::writeString(builder, value);
}

class json_reader
{
private:
    std::ostream& _err_stream;
    std::vector<std::size_t> _path;

    [[nodiscard]] bool fail(const std::string_view reason)
    {
        _err_stream << "((ADFMD ERROR))(";

        if (_path.empty())
        {
            _err_stream << '/';
        }

        for (const std::size_t index : _path)
        {
            _err_stream << "/content/" << index;
        }

        _err_stream << "): invalid ADF JSON: " << reason << "\n\n";
        return false;
    }

    [[nodiscard]] bool read_scalar(const Json::Value& value, attr_scalar& out)
    {
        switch (value.type())
        {
            case Json::stringValue: out = value.asString(); return true;
            case Json::booleanValue: out = value.asBool(); return true;
            case Json::intValue: out = value.asInt64(); return true;
            case Json::realValue: out = value.asDouble(); return true;

            case Json::uintValue:
            {
                if (value.isInt64())
                {
                    out = value.asInt64();
                }
                else
                {
                    out = value.asDouble();
                }

                return true;
            }

            case Json::nullValue:
            case Json::arrayValue:
            case Json::objectValue: return false;
        }

        return false;
    }

    [[nodiscard]] bool read_value(const std::string& name,
        const Json::Value& value, attr_value& out)
    {
        // Objects such as extension parameters travel as JSON text.
        if (value.isObject())
        {
            out = attr_json{._text = compact_json(value)};
            return true;
        }

        if (!value.isArray())
        {
            attr_scalar scalar;
            if (!read_scalar(value, scalar))
            {
                return fail(
                    "attribute '" + name + "' has an unsupported value");
            }

            out = std::visit([](auto&& x) -> attr_value { return x; },
                std::move(scalar));

            return true;
        }

        attr_list list;
        for (const Json::Value& element : value)
        {
            attr_scalar scalar;
            if (!read_scalar(element, scalar))
            {
                return fail("attribute '" + name +
                            "' holds a list element that is not a scalar");
            }

            list.push_back(std::move(scalar));
        }

        out = std::move(list);
        return true;
    }

    [[nodiscard]] bool read_attributes(
        const Json::Value& value, attributes& out)
    {
        if (!value.isObject())
        {
            return fail("'attrs' must be an object");
        }

        for (const std::string& name : value.getMemberNames())
        {
            const Json::Value& v = value[name];

            // ADF writes `null` for unset optional attributes.
            if (v.isNull())
            {
                continue;
            }

            attr_value decoded;
            if (!read_value(name, v, decoded))
            {
                return false;
            }

            out.set(name, std::move(decoded));
        }

        return true;
    }

    [[nodiscard]] bool read_marks(const Json::Value& value, node& out)
    {
        if (!value.isArray())
        {
            return fail("'marks' must be an array");
        }

        for (const Json::Value& m : value)
        {
            if (!m.isObject() || !m["type"].isString())
            {
                return fail("mark without a string 'type'");
            }

            mark decoded = make_mark(m["type"].asString());

            if (m.isMember("attrs") &&
                !read_attributes(m["attrs"], decoded._attrs))
            {
                return false;
            }

            out._marks.push_back(std::move(decoded));
        }

        return true;
    }

public:
    [[nodiscard]] explicit json_reader(std::ostream& err_stream)
        : _err_stream{err_stream}
    {}

    [[nodiscard]] bool read_node(const Json::Value& value, node& out)
    {
        if (!value.isObject())
        {
            return fail("expected an object");
        }

        const Json::Value& type = value["type"];
        if (!type.isString())
        {
            return fail("missing string 'type'");
        }

        out = make_node(type.asString());

        if (value.isMember("attrs") &&
            !read_attributes(value["attrs"], out._attrs))
        {
            return false;
        }

        if (out._kind == node_kind::doc && value.isMember("version"))
        {
            attr_value version;
            if (!read_value("version", value["version"], version))
            {
                return false;
            }

            out._attrs.set("version", std::move(version));
        }

        if (value.isMember("text"))
        {
            if (!value["text"].isString())
            {
                return fail("'text' must be a string");
            }

            out._text = value["text"].asString();
        }

        if (value.isMember("marks") && !read_marks(value["marks"], out))
        {
            return false;
        }

        if (!value.isMember("content"))
        {
            return true;
        }

        const Json::Value& content = value["content"];
        if (!content.isArray())
        {
            return fail("'content' must be an array");
        }

        out._content.resize(content.size());

        for (Json::ArrayIndex i = 0; i < content.size(); ++i)
        {
            _path.push_back(i);

            if (!read_node(content[i], out._content[i]))
            {
                return false;
            }

            _path.pop_back();
        }

        return true;
    }
};

[[nodiscard]] Json::Value scalar_to_json(const attr_scalar& value)
{
    return std::visit(
        [](const auto& x) -> Json::Value
        {
            using type = std::decay_t<decltype(x)>;

            if constexpr (std::is_same_v<type, std::int64_t>)
            {
                return Json::Value{static_cast<Json::Int64>(x)};
            }
            else
            {
                return Json::Value{x};
            }
        },
        value);
}

[[nodiscard]] Json::Value value_to_json(const attr_value& value)
{
    return std::visit(
        [](const auto& x) -> Json::Value
        {
            using type = std::decay_t<decltype(x)>;

            if constexpr (std::is_same_v<type, attr_list>)
            {
                Json::Value result{Json::arrayValue};
                for (const attr_scalar& element : x)
                {
                    result.append(scalar_to_json(element));
                }

                return result;
            }
            else if constexpr (std::is_same_v<type, attr_json>)
            {
                Json::CharReaderBuilder builder;
                const std::unique_ptr<Json::CharReader> reader{
                    builder.newCharReader()};

                Json::Value result;
                std::string errors;

                const char* const begin = x._text.data();
                if (!reader->parse(begin, begin + x._text.size(), &result,
                        &errors) ||
                    !result.isObject())
                {
                    // Hand-written text that is not an object stays a string.
                    return Json::Value{x._text};
                }

                return result;
            }
            else
            {
                return scalar_to_json(attr_scalar{x});
            }
        },
        value);
}

[[nodiscard]] Json::Value attributes_to_json(const attributes& attrs)
{
    Json::Value result{Json::objectValue};
    for (const auto& [name, value] : attrs)
    {
        result[name] = value_to_json(value);
    }

    return result;
}

} // namespace

bool node_from_json(
    const Json::Value& value, node& output, std::ostream& err_stream)
{
    return json_reader{err_stream}.read_node(value, output);
}

Json::Value node_to_json(const node& n)
{
    Json::Value result{Json::objectValue};
    result["type"] = std::string{type_name(n)};

    attributes attrs = n._attrs;

    if (n._kind == node_kind::doc)
    {
        if (const attr_value* version = attrs.find("version"))
        {
            result["version"] = value_to_json(*version);
            attrs.erase("version");
        }
    }

    if (!attrs.empty())
    {
        result["attrs"] = attributes_to_json(attrs);
    }

    if (n._kind == node_kind::text)
    {
        result["text"] = n._text;
    }

    if (!n._marks.empty())
    {
        Json::Value marks{Json::arrayValue};

        for (const mark& m : n._marks)
        {
            Json::Value encoded{Json::objectValue};
            encoded["type"] = std::string{type_name(m)};

            if (!m._attrs.empty())
            {
                encoded["attrs"] = attributes_to_json(m._attrs);
            }

            marks.append(std::move(encoded));
        }

        result["marks"] = std::move(marks);
    }

    const bool has_content_field =
        n._kind != node_kind::text &&
        (!is_leaf_kind(n._kind) || !n._content.empty());

    if (has_content_field)
    {
        Json::Value content{Json::arrayValue};
        for (const node& child : n._content)
        {
            content.append(node_to_json(child));
        }

        result["content"] = std::move(content);
    }

    return result;
}

bool read_adf_json(
    const std::string_view json, node& output, std::ostream& err_stream)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;

    const std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};

    Json::Value root;
    std::string errors;

    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors))
    {
        err_stream << "((ADFMD ERROR))(/): invalid ADF JSON: " << errors
                   << "\n\n";

        return false;
    }

    return node_from_json(root, output, err_stream);
}

std::string write_adf_json(const node& n)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";

    return Json::writeString(builder, node_to_json(n));
}

} // namespace adfmd
