/// @file json_writer.cpp
/// @brief JSON escaping and the JsonObjectWriter used by audit NDJSON output.

#include "ctc/foundation/json_writer.hpp"

#include <cmath>
#include <cstdio>

namespace ctc::foundation {

// ---------------------------------------------------------------------------
// JSON string escaping (control chars, quotes, backslashes)
// ---------------------------------------------------------------------------
void appendJsonString(std::string& out, std::string_view value) {
    out += '"';
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    out += '"';
}

JsonObjectWriter::JsonObjectWriter() {
    out_.reserve(256);
    out_ += '{';
}

void JsonObjectWriter::key(std::string_view name) {
    if (!first_) {
        out_ += ',';
    }
    first_ = false;
    appendJsonString(out_, name);
    out_ += ':';
}

JsonObjectWriter& JsonObjectWriter::field(std::string_view name, std::string_view value) {
    key(name);
    appendJsonString(out_, value);
    return *this;
}

JsonObjectWriter& JsonObjectWriter::field(std::string_view name, const char* value) {
    return field(name, std::string_view(value != nullptr ? value : ""));
}

JsonObjectWriter& JsonObjectWriter::field(std::string_view name, int64_t value) {
    key(name);
    out_ += std::to_string(value);
    return *this;
}

JsonObjectWriter& JsonObjectWriter::field(std::string_view name, double value) {
    key(name);
    if (!std::isfinite(value)) {
        out_ += "null";
        return *this;
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.3f", value);
    out_ += buf;
    return *this;
}

JsonObjectWriter& JsonObjectWriter::field(std::string_view name, bool value) {
    key(name);
    out_ += value ? "true" : "false";
    return *this;
}

JsonObjectWriter& JsonObjectWriter::null(std::string_view name) {
    key(name);
    out_ += "null";
    return *this;
}

JsonObjectWriter& JsonObjectWriter::object(
    std::string_view name, const std::vector<std::pair<std::string, std::string>>& values) {
    key(name);
    out_ += '{';
    bool first = true;
    for (const auto& [k, v] : values) {
        if (!first) {
            out_ += ',';
        }
        first = false;
        appendJsonString(out_, k);
        out_ += ':';
        appendJsonString(out_, v);
    }
    out_ += '}';
    return *this;
}

std::string JsonObjectWriter::finish() {
    out_ += '}';
    return std::move(out_);
}

}  // namespace ctc::foundation