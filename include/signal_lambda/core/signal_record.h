#pragma once
//
// SignalRecord - one trading recommendation as received from the signal pipeline
//
// The record is opaque to the sandbox: a mapping of field name to JSON value.
// It is immutable once constructed; transforms only ever produce new records.
//

#include <glaze/json/generic.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace signal_lambda {

using JsonValue = glz::generic;
using FieldMap = std::map<std::string, JsonValue, std::less<>>;

class SignalRecord {
public:
    SignalRecord() = default;
    explicit SignalRecord(FieldMap fields) : m_fields(std::move(fields)) {}

    // Throws std::invalid_argument when the value is not a JSON object
    static SignalRecord FromJson(const JsonValue& json);

    [[nodiscard]] JsonValue ToJson() const;

    [[nodiscard]] const FieldMap& GetFields() const { return m_fields; }
    [[nodiscard]] std::size_t Size() const { return m_fields.size(); }
    [[nodiscard]] bool Contains(std::string_view field) const { return m_fields.contains(field); }

    // nullptr when the field is absent
    [[nodiscard]] const JsonValue* Find(std::string_view field) const;

    // The ticker field when present and a string
    [[nodiscard]] std::optional<std::string> GetTicker() const;

    bool operator==(const SignalRecord& other) const;

private:
    FieldMap m_fields;
};

using SignalBatch = std::vector<SignalRecord>;

// Deep structural equality of two JSON values
bool JsonEquals(const JsonValue& lhs, const JsonValue& rhs);

// Parses a JSON array of objects into a batch; throws std::invalid_argument
SignalBatch ParseSignalBatch(const std::vector<JsonValue>& values);

std::vector<JsonValue> SignalBatchToJson(const SignalBatch& batch);

} // namespace signal_lambda
