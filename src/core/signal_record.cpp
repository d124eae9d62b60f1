#include <signal_lambda/core/signal_record.h>

#include <format>
#include <stdexcept>
#include <type_traits>

namespace signal_lambda {

SignalRecord SignalRecord::FromJson(const JsonValue& json) {
    const auto* object = std::get_if<JsonValue::object_t>(&json.data);
    if (!object) {
        throw std::invalid_argument("signal record must be a JSON object");
    }

    FieldMap fields;
    for (const auto& [key, value] : *object) {
        fields.emplace(key, value);
    }
    return SignalRecord{std::move(fields)};
}

JsonValue SignalRecord::ToJson() const {
    JsonValue json;
    JsonValue::object_t object;
    for (const auto& [key, value] : m_fields) {
        object.emplace(key, value);
    }
    json.data = std::move(object);
    return json;
}

const JsonValue* SignalRecord::Find(std::string_view field) const {
    auto it = m_fields.find(field);
    return it == m_fields.end() ? nullptr : &it->second;
}

std::optional<std::string> SignalRecord::GetTicker() const {
    const auto* ticker = Find("ticker");
    if (!ticker) {
        return std::nullopt;
    }
    if (const auto* str = std::get_if<std::string>(&ticker->data)) {
        return *str;
    }
    return std::nullopt;
}

bool SignalRecord::operator==(const SignalRecord& other) const {
    if (m_fields.size() != other.m_fields.size()) {
        return false;
    }
    auto lhs = m_fields.begin();
    auto rhs = other.m_fields.begin();
    for (; lhs != m_fields.end(); ++lhs, ++rhs) {
        if (lhs->first != rhs->first || !JsonEquals(lhs->second, rhs->second)) {
            return false;
        }
    }
    return true;
}

bool JsonEquals(const JsonValue& lhs, const JsonValue& rhs) {
    if (lhs.data.index() != rhs.data.index()) {
        return false;
    }

    return std::visit(
        [&rhs](const auto& left) -> bool {
            using T = std::decay_t<decltype(left)>;
            const auto& right = std::get<T>(rhs.data);
            if constexpr (std::is_same_v<T, JsonValue::array_t>) {
                if (left.size() != right.size()) {
                    return false;
                }
                for (std::size_t i = 0; i < left.size(); ++i) {
                    if (!JsonEquals(left[i], right[i])) {
                        return false;
                    }
                }
                return true;
            } else if constexpr (std::is_same_v<T, JsonValue::object_t>) {
                if (left.size() != right.size()) {
                    return false;
                }
                auto r = right.begin();
                for (auto l = left.begin(); l != left.end(); ++l, ++r) {
                    if (l->first != r->first || !JsonEquals(l->second, r->second)) {
                        return false;
                    }
                }
                return true;
            } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return true;
            } else {
                return left == right;
            }
        },
        lhs.data);
}

SignalBatch ParseSignalBatch(const std::vector<JsonValue>& values) {
    SignalBatch batch;
    batch.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        try {
            batch.push_back(SignalRecord::FromJson(values[i]));
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument(std::format("signals[{}]: {}", i, e.what()));
        }
    }
    return batch;
}

std::vector<JsonValue> SignalBatchToJson(const SignalBatch& batch) {
    std::vector<JsonValue> values;
    values.reserve(batch.size());
    for (const auto& record : batch) {
        values.push_back(record.ToJson());
    }
    return values;
}

} // namespace signal_lambda
