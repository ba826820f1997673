#ifndef REFLECT_H
#define REFLECT_H

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace reflect
{

// Walks a parsed rapidjson value. The first type mismatch freezes the reader
// and records its location as a JSON pointer.
struct json_reader
{
    rapidjson::Value* m;
    std::vector<std::string> path_;
    std::string invalid_path_;
    bool ok_ = true;

    explicit json_reader(rapidjson::Value* value) : m(value) {}

    [[nodiscard]] bool ok() const { return ok_; }
    [[nodiscard]] bool is_null() const { return m->IsNull(); }
    [[nodiscard]] std::string path() const;
    void set_invalid();

    template <typename Fn>
    void each_element(Fn&& fn);
    template <typename Fn>
    void with_member(const char* name, Fn&& fn);
};

struct json_writer
{
    using writer_t = rapidjson::Writer<rapidjson::StringBuffer>;

    writer_t* m;

    explicit json_writer(writer_t* writer) : m(writer) {}

    void key(const char* name) const { m->Key(name); }
    void string(const std::string& s) const { m->String(s.data(), static_cast<rapidjson::SizeType>(s.size())); }
};

inline std::string escape_pointer_token(const std::string& token)
{
    std::string out;
    out.reserve(token.size());
    for (const char c : token)
    {
        if (c == '~')
        {
            out.append("~0");
        }
        else if (c == '/')
        {
            out.append("~1");
        }
        else
        {
            out.push_back(c);
        }
    }
    return out;
}

inline std::string json_reader::path() const
{
    if (!ok_ && !invalid_path_.empty())
    {
        return invalid_path_;
    }

    std::string out;
    for (const auto& token : path_)
    {
        out.push_back('/');
        out.append(escape_pointer_token(token));
    }
    return out.empty() ? "/" : out;
}

inline void json_reader::set_invalid()
{
    if (!ok_)
    {
        return;
    }
    invalid_path_ = path();
    ok_ = false;
}

template <typename Fn>
void json_reader::each_element(Fn&& fn)
{
    if (!ok_)
    {
        return;
    }
    if (!m->IsArray())
    {
        set_invalid();
        return;
    }
    auto* parent = m;
    path_.emplace_back();
    std::size_t index = 0;
    for (auto& element : parent->GetArray())
    {
        path_.back() = std::to_string(index++);
        m = &element;
        fn();
        if (!ok_)
        {
            break;
        }
    }
    m = parent;
    path_.pop_back();
}

template <typename Fn>
void json_reader::with_member(const char* name, Fn&& fn)
{
    if (!ok_)
    {
        return;
    }
    const auto it = m->FindMember(name);
    if (it == m->MemberEnd())
    {
        return;
    }
    auto* parent = m;
    path_.emplace_back(name);
    m = &it->value;
    fn();
    m = parent;
    path_.pop_back();
}

template <typename T>
constexpr bool is_json_integer_v = std::is_integral_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>;

template <typename T, std::enable_if_t<is_json_integer_v<T>, int> = 0>
void reflect(json_reader& vis, T& v)
{
    if constexpr (std::is_signed_v<T>)
    {
        if (!vis.m->IsInt64())
        {
            vis.set_invalid();
            return;
        }
        const auto value = vis.m->GetInt64();
        if (value < static_cast<std::int64_t>(std::numeric_limits<T>::min()) || value > static_cast<std::int64_t>(std::numeric_limits<T>::max()))
        {
            vis.set_invalid();
            return;
        }
        v = static_cast<T>(value);
    }
    else
    {
        if (!vis.m->IsUint64())
        {
            vis.set_invalid();
            return;
        }
        const auto value = vis.m->GetUint64();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
        {
            vis.set_invalid();
            return;
        }
        v = static_cast<T>(value);
    }
}

template <typename T, std::enable_if_t<is_json_integer_v<T>, int> = 0>
void reflect(json_writer& vis, T& v)
{
    if constexpr (std::is_signed_v<T>)
    {
        vis.m->Int64(static_cast<std::int64_t>(v));
    }
    else
    {
        vis.m->Uint64(static_cast<std::uint64_t>(v));
    }
}

inline void reflect(json_reader& vis, bool& v)
{
    if (!vis.m->IsBool())
    {
        vis.set_invalid();
        return;
    }
    v = vis.m->GetBool();
}
inline void reflect(json_writer& vis, bool& v) { vis.m->Bool(v); }

inline void reflect(json_reader& vis, double& v)
{
    if (!vis.m->IsNumber())
    {
        vis.set_invalid();
        return;
    }
    v = vis.m->GetDouble();
}
inline void reflect(json_writer& vis, double& v) { vis.m->Double(v); }

inline void reflect(json_reader& vis, std::string& v)
{
    if (!vis.m->IsString())
    {
        vis.set_invalid();
        return;
    }
    v.assign(vis.m->GetString(), vis.m->GetStringLength());
}
inline void reflect(json_writer& vis, std::string& v) { vis.string(v); }

template <typename T>
void reflect(json_reader& vis, std::optional<T>& v)
{
    if (vis.is_null())
    {
        v.reset();
        return;
    }
    v.emplace();
    reflect(vis, *v);
}
template <typename T>
void reflect(json_writer& vis, std::optional<T>& v)
{
    if (v.has_value())
    {
        reflect(vis, *v);
        return;
    }
    vis.m->Null();
}

template <typename T>
void reflect(json_reader& vis, std::vector<T>& v)
{
    vis.each_element(
        [&]()
        {
            v.emplace_back();
            reflect(vis, v.back());
        });
}
template <typename T>
void reflect(json_writer& vis, std::vector<T>& v)
{
    vis.m->StartArray();
    for (auto& item : v)
    {
        reflect(vis, item);
    }
    vis.m->EndArray();
}

inline void member_start(json_reader& vis)
{
    if (!vis.m->IsObject())
    {
        vis.set_invalid();
    }
}
inline void member_start(json_writer& vis) { vis.m->StartObject(); }

inline void member_end(json_reader&) {}
inline void member_end(json_writer& vis) { vis.m->EndObject(); }

// Absent members keep their defaults.
template <typename T>
void member(json_reader& vis, const char* name, T& v)
{
    vis.with_member(name, [&]() { reflect(vis, v); });
}
template <typename T>
void member(json_writer& vis, const char* name, T& v)
{
    vis.key(name);
    reflect(vis, v);
}
// Empty optionals are left out of the output.
template <typename T>
void member(json_writer& vis, const char* name, std::optional<T>& v)
{
    if (!v.has_value())
    {
        return;
    }
    vis.key(name);
    reflect(vis, *v);
}

#define REFLECT_MEMBER(name) member(vis, #name, v.name)

#define REFLECT_MEMBER_AS(name, key) member(vis, key, v.name)

#define REFLECT_STRUCT_BEGIN(type)  \
    template <typename Vis>         \
    void reflect(Vis& vis, type& v) \
    {                               \
        member_start(vis);

#define REFLECT_STRUCT_END() \
    member_end(vis);         \
    }

// Reads t from an already parsed value. On failure returns the path of the
// first member that did not match the expected type.
template <typename T>
[[nodiscard]] std::optional<std::string> deserialize_value(T& t, rapidjson::Value& value)
{
    json_reader reader{&value};
    reflect(reader, t);
    if (reader.ok())
    {
        return std::nullopt;
    }
    return reader.path();
}

template <typename T>
bool deserialize_struct(T& t, const std::string& msg)
{
    rapidjson::Document doc;
    if (doc.Parse(msg.data(), msg.size()).HasParseError())
    {
        return false;
    }
    return !deserialize_value(t, doc).has_value();
}

template <typename T>
std::string serialize_struct(const T& t)
{
    auto& mutable_t = const_cast<std::remove_const_t<T>&>(t);
    rapidjson::StringBuffer sb;
    json_writer::writer_t writer(sb);
    json_writer vis(&writer);
    reflect(vis, mutable_t);
    return sb.GetString();
}

}    // namespace reflect

#endif
