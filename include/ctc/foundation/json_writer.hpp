#pragma once

/// @file json_writer.hpp
/// @brief Single-line JSON object builder for NDJSON audit records.

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ctc::foundation {

/// Append @p value to @p out as a quoted, escaped JSON string.
void appendJsonString(std::string& out, std::string_view value);

/// Builds one flat-or-nested JSON object without intermediate allocation
/// of a document model. Keys are written in call order.
///
/// @code
///   JsonObjectWriter w;
///   w.field("serial", int64_t{4021});
///   w.field("actionType", "SwingStart");
///   w.object("details", {{"hit", "true"}});
///   std::string line = w.finish();   // {"serial":4021,...}
/// @endcode
class JsonObjectWriter {
public:
    JsonObjectWriter();

    JsonObjectWriter& field(std::string_view key, std::string_view value);
    JsonObjectWriter& field(std::string_view key, const char* value);
    JsonObjectWriter& field(std::string_view key, int64_t value);
    JsonObjectWriter& field(std::string_view key, int value) {
        return field(key, static_cast<int64_t>(value));
    }
    JsonObjectWriter& field(std::string_view key, double value);
    JsonObjectWriter& field(std::string_view key, bool value);
    JsonObjectWriter& null(std::string_view key);

    /// Nested object of string values.
    JsonObjectWriter& object(std::string_view key,
                             const std::vector<std::pair<std::string, std::string>>& values);

    /// Close the object and return it. The writer must not be reused.
    [[nodiscard]] std::string finish();

private:
    void key(std::string_view name);

    std::string out_;
    bool first_ = true;
};

}  // namespace ctc::foundation