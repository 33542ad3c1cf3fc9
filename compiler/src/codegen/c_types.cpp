#include "codegen/c_types.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <string>

namespace a2c::codegen {

auto c_type(const types::TypePtr& type) -> std::string {
    if (!type) {
        return "void";
    }
    if (type->is<types::PrimitiveType>()) {
        switch (type->as<types::PrimitiveType>().kind) {
        case types::PrimitiveKind::I8:
            return "int8_t";
        case types::PrimitiveKind::I16:
            return "int16_t";
        case types::PrimitiveKind::I32:
            return "int";
        case types::PrimitiveKind::I64:
            return "int64_t";
        case types::PrimitiveKind::U8:
            return "uint8_t";
        case types::PrimitiveKind::U16:
            return "uint16_t";
        case types::PrimitiveKind::U32:
            return "unsigned int";
        case types::PrimitiveKind::U64:
            return "uint64_t";
        case types::PrimitiveKind::F32:
            return "float";
        case types::PrimitiveKind::F64:
            return "double";
        case types::PrimitiveKind::Bool:
            return "bool";
        case types::PrimitiveKind::Char:
            return "char";
        case types::PrimitiveKind::Str:
            return "char*";
        case types::PrimitiveKind::Unit:
            return "void";
        }
    }
    if (type->is<types::NamedType>()) {
        return "struct " + type->as<types::NamedType>().name;
    }
    if (type->is<types::PtrType>()) {
        return c_type(type->as<types::PtrType>().inner) + "*";
    }
    if (type->is<types::IndirectType>()) {
        return c_type(type->as<types::IndirectType>().inner) + "*";
    }
    if (type->is<types::ArrayType>()) {
        return c_type(type->as<types::ArrayType>().element);
    }
    return type->as<types::GenericType>().name;
}

auto c_declare(const types::TypePtr& type, const std::string& name) -> std::string {
    std::string dims;
    auto element = type;
    while (element && element->is<types::ArrayType>()) {
        const auto& array = element->as<types::ArrayType>();
        dims += "[" + std::to_string(array.size) + "]";
        element = array.element;
    }

    auto base = c_type(element);
    // `struct P*` declares as `struct P *p`
    if (!base.empty() && base.back() == '*') {
        auto stars = base.find_last_not_of('*') + 1;
        return base.substr(0, stars) + " " + base.substr(stars) + name + dims;
    }
    return base + " " + name + dims;
}

namespace {

void escape_char(std::ostringstream& out, char c, char quote) {
    switch (c) {
    case '\n':
        out << "\\n";
        break;
    case '\t':
        out << "\\t";
        break;
    case '\r':
        out << "\\r";
        break;
    case '\0':
        out << "\\0";
        break;
    case '\\':
        out << "\\\\";
        break;
    default:
        if (c == quote) {
            out << '\\' << c;
        } else if (std::isprint(static_cast<unsigned char>(c))) {
            out << c;
        } else {
            out << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
        }
    }
}

} // namespace

auto c_string_literal(const std::string& value) -> std::string {
    std::ostringstream out;
    out << '"';
    for (char c : value) {
        escape_char(out, c, '"');
    }
    out << '"';
    return out.str();
}

auto c_char_literal(char value) -> std::string {
    std::ostringstream out;
    out << '\'';
    escape_char(out, value, '\'');
    out << '\'';
    return out.str();
}

auto c_float_literal(double value) -> std::string {
    std::string text;
    // Shortest precision that reads back as the same value
    for (int precision = 6; precision <= 17; ++precision) {
        std::ostringstream out;
        out << std::setprecision(precision) << value;
        text = out.str();
        if (std::stod(text) == value)
            break;
    }
    if (text.find_first_of(".eEn") == std::string::npos) {
        text += ".0";
    }
    return text;
}

auto c_macro_name(const std::string& text) -> std::string {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) -> char {
        return std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_';
    });
    return result;
}

} // namespace a2c::codegen
