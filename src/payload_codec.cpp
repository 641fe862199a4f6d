#include "kvsession/payload_codec.hpp"
#include "kvsession/errors.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace kvsession
{

namespace
{

constexpr const char* kNullTag = "null";
constexpr const char* kBoolTag = "bool";
constexpr const char* kIntTag = "int";
constexpr const char* kFloatTag = "float";
constexpr const char* kStrTag = "str";
constexpr const char* kBytesTag = "bytes";

// True when the emitter would write the text back byte for byte. yaml-cpp
// replaces malformed sequences, surrogates and noncharacters with U+FFFD.
bool is_emittable_utf8(const std::string& text)
    {
    std::size_t i = 0;
    while (i < text.size())
        {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80)
            {
            ++i;
            continue;
            }

        std::size_t length = 0;
        std::uint32_t code_point = 0;
        std::uint32_t minimum = 0;
        if ((lead & 0xE0) == 0xC0)
            {
            length = 2;
            code_point = lead & 0x1F;
            minimum = 0x80;
            }
        else if ((lead & 0xF0) == 0xE0)
            {
            length = 3;
            code_point = lead & 0x0F;
            minimum = 0x800;
            }
        else if ((lead & 0xF8) == 0xF0)
            {
            length = 4;
            code_point = lead & 0x07;
            minimum = 0x10000;
            }
        else
            {
            return false;
            }

        if (i + length > text.size()) return false;
        for (std::size_t k = 1; k < length; ++k)
            {
            unsigned char trail = static_cast<unsigned char>(text[i + k]);
            if ((trail & 0xC0) != 0x80) return false;
            code_point = (code_point << 6) | (trail & 0x3F);
            }

        if (code_point < minimum || code_point > 0x10FFFF) return false;
        if (code_point >= 0xD800 && code_point <= 0xDFFF) return false;
        if ((code_point & 0xFFFE) == 0xFFFE) return false;
        if (code_point >= 0xFDD0 && code_point <= 0xFDEF) return false;
        i += length;
        }
    return true;
    }

std::string format_double(double value)
    {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return oss.str();
    }

struct ValueEmitter
    {
    YAML::Emitter& out;

    void operator()(std::nullptr_t) const
        {
        out << YAML::LocalTag(kNullTag) << YAML::DoubleQuoted << "";
        }

    void operator()(bool value) const
        {
        out << YAML::LocalTag(kBoolTag) << (value ? "true" : "false");
        }

    void operator()(std::int64_t value) const
        {
        out << YAML::LocalTag(kIntTag) << std::to_string(value);
        }

    void operator()(double value) const
        {
        out << YAML::LocalTag(kFloatTag) << format_double(value);
        }

    void operator()(const std::string& value) const
        {
        if (is_emittable_utf8(value))
            {
            out << YAML::LocalTag(kStrTag) << YAML::DoubleQuoted << value;
            return;
            }
        // Arbitrary bytes go out as base64
        out << YAML::LocalTag(kBytesTag) << YAML::DoubleQuoted
            << YAML::EncodeBase64(reinterpret_cast<const unsigned char*>(value.data()), value.size());
        }
    };

std::int64_t parse_int(const std::string& key, const std::string& text)
    {
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE)
        {
        throw PayloadError("invalid integer for session key '" + key + "': " + text);
        }
    return static_cast<std::int64_t>(value);
    }

double parse_double(const std::string& key, const std::string& text)
    {
    // Streams cannot read back what they write for inf/nan
    if (text == "inf") return std::numeric_limits<double>::infinity();
    if (text == "-inf") return -std::numeric_limits<double>::infinity();
    if (text == "nan" || text == "-nan") return std::numeric_limits<double>::quiet_NaN();

    std::istringstream iss(text);
    iss.imbue(std::locale::classic());

    double value = 0.0;
    iss >> value;
    if (text.empty() || iss.fail() || !iss.eof())
        {
        throw PayloadError("invalid float for session key '" + key + "': " + text);
        }
    return value;
    }

SessionValue decode_value(const std::string& key, const YAML::Node& node)
    {
    if (!node.IsScalar())
        {
        throw PayloadError("session key '" + key + "' does not hold a scalar");
        }

    const std::string& tag = node.Tag();
    const std::string& text = node.Scalar();

    if (tag == std::string("!") + kNullTag)
        {
        return make_session_value(nullptr);
        }
    if (tag == std::string("!") + kBoolTag)
        {
        if (text == "true") return make_session_value(true);
        if (text == "false") return make_session_value(false);
        throw PayloadError("invalid bool for session key '" + key + "': " + text);
        }
    if (tag == std::string("!") + kIntTag)
        {
        return make_session_value(parse_int(key, text));
        }
    if (tag == std::string("!") + kFloatTag)
        {
        return make_session_value(parse_double(key, text));
        }
    if (tag == std::string("!") + kStrTag)
        {
        return make_session_value(text);
        }
    if (tag == std::string("!") + kBytesTag)
        {
        std::vector<unsigned char> raw = YAML::DecodeBase64(text);
        if (raw.empty() && !text.empty())
            {
            throw PayloadError("invalid base64 for session key '" + key + "'");
            }
        return make_session_value(std::string(raw.begin(), raw.end()));
        }
    throw PayloadError("unsupported tag '" + tag + "' for session key '" + key + "'");
    }

} // namespace

std::string encode_payload(const Session::Data& data)
    {
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& [key, value] : data)
        {
        if (!is_emittable_utf8(key))
            {
            throw PayloadError("session key is not valid UTF-8");
            }
        out << YAML::Key << YAML::DoubleQuoted << key << YAML::Value;
        std::visit(ValueEmitter{ out }, value);
        }
    out << YAML::EndMap;

    if (!out.good())
        {
        throw PayloadError("failed to encode session payload: " + out.GetLastError());
        }
    return out.c_str();
    }

Session::Data decode_payload(const std::string& payload)
    {
    Session::Data data;

    YAML::Node root;
    try
        {
        root = YAML::Load(payload);
        }
        catch (const YAML::Exception& e)
            {
            throw PayloadError(std::string("malformed session payload: ") + e.what());
            }

    if (!root || root.IsNull())
        {
        return data;
        }
    if (!root.IsMap())
        {
        throw PayloadError("session payload is not a mapping");
        }

    for (const auto& entry : root)
        {
        if (!entry.first.IsScalar())
            {
            throw PayloadError("session payload has a non-scalar key");
            }
        std::string key = entry.first.Scalar();
        data[key] = decode_value(key, entry.second);
        }
    return data;
    }

} // namespace kvsession
