#include "builtins.h"
#include "script_error.h"
#include "string_format.h"
#include "value_ops.h"

#include <algorithm>
#include <cctype>
#include <format>

namespace signal_lambda::runtime {

namespace {

[[noreturn]] void ThrowNoAttribute(const Value& self, std::string_view name) {
    throw AttributeError(std::format("'{}' object has no attribute '{}'", self.TypeName(), name));
}

std::int64_t IndexOf(const std::vector<Value>& items, const Value& needle, std::string_view typeName) {
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (Equals(items[i], needle)) {
            return static_cast<std::int64_t>(i);
        }
    }
    throw ValueError(std::format("{}.index(x): x not in {}", typeName, typeName));
}

std::int64_t CountOf(const std::vector<Value>& items, const Value& needle) {
    return static_cast<std::int64_t>(
        std::ranges::count_if(items, [&needle](const Value& item) { return Equals(item, needle); }));
}

// ---------------------------------------------------------------------------
// dict
// ---------------------------------------------------------------------------

void UpdateDict(DictObject& dict, const Value& source, CallContext& ctx) {
    if (source.IsDict()) {
        const DictObject* other = source.AsDict();
        // Snapshot first: d.update(d) must not see its own writes
        auto entries = other->entries;
        for (auto& [key, value] : entries) {
            if (dict.Set(MakeDictKey(key), key, std::move(value))) {
                ctx.heap.Charge(1);
            }
        }
        return;
    }
    for (const auto& pair : Materialize(source, ctx.heap)) {
        if (!pair.IsSequenceObject() || pair.AsList()->items.size() != 2) {
            throw TypeError("cannot convert dictionary update sequence element to a (key, value) pair");
        }
        const auto& items = pair.AsList()->items;
        if (dict.Set(MakeDictKey(items[0]), items[0], items[1])) {
            ctx.heap.Charge(1);
        }
    }
}

Value CallDictMethod(DictObject& dict, std::string_view name, PositionalArgs& args, KeywordArgs& kwargs,
                     CallContext& ctx) {
    if (name == "update") {
        args::CheckCount("update", args, 0, 1);
        ctx.heap.GuardWrite(dict);
        if (!args.empty()) {
            UpdateDict(dict, args[0], ctx);
        }
        for (auto& [key, value] : kwargs) {
            if (dict.Set(DictKey{key}, ctx.heap.NewStr(key), value)) {
                ctx.heap.Charge(1);
            }
        }
        return Value::None();
    }

    args::CheckKeywords(name, kwargs, {});

    if (name == "get") {
        args::CheckCount("get", args, 1, 2);
        auto key = TryMakeDictKey(args[0]);
        const Value* found = key ? dict.Find(*key) : nullptr;
        if (found) {
            return *found;
        }
        return args.size() == 2 ? args[1] : Value::None();
    }
    if (name == "keys" || name == "values" || name == "items") {
        args::CheckCount(name, args, 0, 0);
        ctx.budget.Tick(1 + dict.Size() / 16);
        std::vector<Value> out;
        out.reserve(dict.Size());
        for (const auto& [key, value] : dict.entries) {
            if (name == "keys") {
                out.push_back(key);
            } else if (name == "values") {
                out.push_back(value);
            } else {
                out.push_back(Value::List(ctx.heap.NewTuple({key, value})));
            }
        }
        return Value::List(ctx.heap.NewList(std::move(out)));
    }
    if (name == "copy") {
        args::CheckCount("copy", args, 0, 0);
        DictObject* copy = ctx.heap.NewDict();
        ctx.heap.Charge(dict.Size());
        ctx.budget.Tick(1 + dict.Size() / 16);
        copy->entries = dict.entries;
        copy->index = dict.index;
        copy->origin = dict.origin;
        return Value::Dict(copy);
    }
    if (name == "pop") {
        args::CheckCount("pop", args, 1, 2);
        ctx.heap.GuardWrite(dict);
        DictKey key = MakeDictKey(args[0]);
        if (const Value* found = dict.Find(key)) {
            Value value = *found;
            dict.Erase(key);
            return value;
        }
        if (args.size() == 2) {
            return args[1];
        }
        throw KeyError(Repr(args[0]));
    }

    ThrowNoAttribute(Value::Dict(&dict), name);
}

// ---------------------------------------------------------------------------
// list / tuple
// ---------------------------------------------------------------------------

Value CallSequenceMethod(ListObject& list, const Value& self, std::string_view name, PositionalArgs& args,
                         KeywordArgs& kwargs, CallContext& ctx) {
    const std::string_view typeName = self.TypeName();

    if (name == "sort") {
        if (list.frozen) {
            ThrowNoAttribute(self, name);
        }
        args::CheckCount("sort", args, 0, 0);
        args::CheckKeywords("sort", kwargs, {"reverse"});
        std::optional<Value> reverse = args::TakeKeyword(kwargs, "reverse");
        ctx.heap.GuardWrite(list);
        std::vector<Value> items = list.items;
        SortValues(items, reverse && Truthy(*reverse), ctx.budget);
        list.items = std::move(items);
        return Value::None();
    }

    args::CheckKeywords(name, kwargs, {});

    if (name == "index") {
        args::CheckCount("index", args, 1, 1);
        ctx.budget.Tick(1 + list.items.size() / 16);
        return Value::Int(IndexOf(list.items, args[0], typeName));
    }
    if (name == "count") {
        args::CheckCount("count", args, 1, 1);
        ctx.budget.Tick(1 + list.items.size() / 16);
        return Value::Int(CountOf(list.items, args[0]));
    }

    if (list.frozen) {
        ThrowNoAttribute(self, name);
    }

    if (name == "copy") {
        args::CheckCount("copy", args, 0, 0);
        return Value::List(ctx.heap.NewList(list.items));
    }
    if (name == "append") {
        args::CheckCount("append", args, 1, 1);
        ctx.heap.GuardWrite(list);
        ctx.heap.Charge(1);
        list.items.push_back(args[0]);
        return Value::None();
    }
    if (name == "extend") {
        args::CheckCount("extend", args, 1, 1);
        ctx.heap.GuardWrite(list);
        std::vector<Value> items = Materialize(args[0], ctx.heap);
        ctx.heap.Charge(items.size());
        list.items.insert(list.items.end(), std::make_move_iterator(items.begin()),
                          std::make_move_iterator(items.end()));
        return Value::None();
    }
    if (name == "insert") {
        args::CheckCount("insert", args, 2, 2);
        ctx.heap.GuardWrite(list);
        const auto size = static_cast<std::int64_t>(list.items.size());
        std::int64_t index = args::RequireInt("insert", args[0]);
        if (index < 0) {
            index = std::max<std::int64_t>(0, index + size);
        }
        index = std::min(index, size);
        ctx.heap.Charge(1);
        list.items.insert(list.items.begin() + index, args[1]);
        return Value::None();
    }
    if (name == "pop") {
        args::CheckCount("pop", args, 0, 1);
        ctx.heap.GuardWrite(list);
        if (list.items.empty()) {
            throw IndexError("pop from empty list");
        }
        std::int64_t index = args.empty() ? -1 : args::RequireInt("pop", args[0]);
        std::int64_t resolved = index < 0 ? index + static_cast<std::int64_t>(list.items.size()) : index;
        if (resolved < 0 || resolved >= static_cast<std::int64_t>(list.items.size())) {
            throw IndexError("pop index out of range");
        }
        Value value = std::move(list.items[static_cast<std::size_t>(resolved)]);
        list.items.erase(list.items.begin() + resolved);
        return value;
    }
    if (name == "reverse") {
        args::CheckCount("reverse", args, 0, 0);
        ctx.heap.GuardWrite(list);
        std::ranges::reverse(list.items);
        return Value::None();
    }

    ThrowNoAttribute(self, name);
}

// ---------------------------------------------------------------------------
// str
// ---------------------------------------------------------------------------

std::string StripChars(const std::string& text, const std::optional<std::string>& chars, bool left, bool right) {
    auto strip = [&chars](char c) {
        return chars ? chars->find(c) != std::string::npos : std::isspace(static_cast<unsigned char>(c)) != 0;
    };
    std::size_t begin = 0;
    std::size_t end = text.size();
    if (left) {
        while (begin < end && strip(text[begin])) ++begin;
    }
    if (right) {
        while (end > begin && strip(text[end - 1])) --end;
    }
    return text.substr(begin, end - begin);
}

std::vector<std::string> SplitWhitespace(const std::string& text, std::int64_t maxSplit) {
    std::vector<std::string> parts;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        if (i == text.size()) break;
        if (maxSplit >= 0 && static_cast<std::int64_t>(parts.size()) == maxSplit) {
            std::size_t end = text.size();
            while (end > i && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
            parts.push_back(text.substr(i, end - i));
            break;
        }
        std::size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        parts.push_back(text.substr(start, i - start));
    }
    return parts;
}

std::vector<std::string> SplitOn(const std::string& text, const std::string& sep, std::int64_t maxSplit) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (maxSplit < 0 || static_cast<std::int64_t>(parts.size()) < maxSplit) {
        std::size_t pos = text.find(sep, start);
        if (pos == std::string::npos) break;
        parts.push_back(text.substr(start, pos - start));
        start = pos + sep.size();
    }
    parts.push_back(text.substr(start));
    return parts;
}

bool MatchesAffix(const std::string& text, const Value& affix, bool prefix, std::string_view function) {
    auto matches = [&](const std::string& candidate) {
        return prefix ? text.starts_with(candidate) : text.ends_with(candidate);
    };
    if (affix.IsTuple()) {
        return std::ranges::any_of(affix.AsList()->items, [&](const Value& item) {
            return matches(args::RequireStr(function, item));
        });
    }
    if (!affix.IsStr()) {
        throw TypeError(std::format("{} first arg must be str or a tuple of str, not {}", function, affix.TypeName()));
    }
    return matches(affix.AsStr());
}

Value StringList(std::vector<std::string> parts, CallContext& ctx) {
    std::vector<Value> values;
    values.reserve(parts.size());
    for (auto& part : parts) {
        values.push_back(ctx.heap.NewStr(std::move(part)));
    }
    return Value::List(ctx.heap.NewList(std::move(values)));
}

Value CallStringMethod(const std::string& text, std::string_view name, PositionalArgs& args, KeywordArgs& kwargs,
                       CallContext& ctx) {
    if (name == "format") {
        ctx.budget.Tick(1 + text.size() / 64);
        return ctx.heap.NewStr(FormatString(text, args, kwargs, ctx.budget.GetLimits().max_string_length));
    }
    if (name == "split") {
        args::CheckKeywords("split", kwargs, {"sep", "maxsplit"});
        std::optional<Value> sep = args::TakeKeyword(kwargs, "sep");
        std::optional<Value> maxSplitArg = args::TakeKeyword(kwargs, "maxsplit");
        args::CheckCount("split", args, 0, 2);
        if (!args.empty()) sep = args[0];
        if (args.size() == 2) maxSplitArg = args[1];

        std::int64_t maxSplit = maxSplitArg ? args::RequireInt("split", *maxSplitArg) : -1;
        ctx.budget.Tick(1 + text.size() / 16);
        if (!sep || sep->IsNone()) {
            return StringList(SplitWhitespace(text, maxSplit), ctx);
        }
        const std::string& separator = args::RequireStr("split", *sep);
        if (separator.empty()) {
            throw ValueError("empty separator");
        }
        return StringList(SplitOn(text, separator, maxSplit), ctx);
    }

    args::CheckKeywords(name, kwargs, {});

    if (name == "upper" || name == "lower") {
        args::CheckCount(name, args, 0, 0);
        std::string out = text;
        const bool upper = name == "upper";
        std::ranges::transform(out, out.begin(), [upper](unsigned char c) {
            return static_cast<char>(upper ? std::toupper(c) : std::tolower(c));
        });
        return ctx.heap.NewStr(std::move(out));
    }
    if (name == "strip" || name == "lstrip" || name == "rstrip") {
        args::CheckCount(name, args, 0, 1);
        std::optional<std::string> chars;
        if (!args.empty() && !args[0].IsNone()) {
            chars = args::RequireStr(name, args[0]);
        }
        return ctx.heap.NewStr(StripChars(text, chars, name != "rstrip", name != "lstrip"));
    }
    if (name == "startswith" || name == "endswith") {
        args::CheckCount(name, args, 1, 1);
        return Value::Bool(MatchesAffix(text, args[0], name == "startswith", name));
    }
    if (name == "replace") {
        args::CheckCount("replace", args, 2, 3);
        const std::string& from = args::RequireStr("replace", args[0]);
        const std::string& to = args::RequireStr("replace", args[1]);
        std::int64_t limit = args.size() == 3 ? args::RequireInt("replace", args[2]) : -1;

        std::string out;
        std::size_t start = 0;
        std::int64_t replaced = 0;
        if (from.empty()) {
            // Python inserts the replacement between every character
            for (std::size_t i = 0; i <= text.size(); ++i) {
                if (limit < 0 || replaced < limit) {
                    out += to;
                    ++replaced;
                }
                if (i < text.size()) out.push_back(text[i]);
                ctx.budget.CheckStringLength(out.size());
            }
            return ctx.heap.NewStr(std::move(out));
        }
        while (limit < 0 || replaced < limit) {
            std::size_t pos = text.find(from, start);
            if (pos == std::string::npos) break;
            out.append(text, start, pos - start);
            out += to;
            start = pos + from.size();
            ++replaced;
            ctx.budget.CheckStringLength(out.size());
        }
        out.append(text, start, std::string::npos);
        ctx.budget.CheckStringLength(out.size());
        return ctx.heap.NewStr(std::move(out));
    }
    if (name == "join") {
        args::CheckCount("join", args, 1, 1);
        std::vector<Value> items = Materialize(args[0], ctx.heap);
        std::string out;
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (!items[i].IsStr()) {
                throw TypeError(std::format("sequence item {}: expected str instance, {} found", i,
                                            items[i].TypeName()));
            }
            if (i > 0) out += text;
            out += items[i].AsStr();
            ctx.budget.CheckStringLength(out.size());
        }
        return ctx.heap.NewStr(std::move(out));
    }
    if (name == "find") {
        args::CheckCount("find", args, 1, 1);
        std::size_t pos = text.find(args::RequireStr("find", args[0]));
        return Value::Int(pos == std::string::npos ? -1 : static_cast<std::int64_t>(pos));
    }
    if (name == "count") {
        args::CheckCount("count", args, 1, 1);
        const std::string& needle = args::RequireStr("count", args[0]);
        if (needle.empty()) {
            return Value::Int(static_cast<std::int64_t>(text.size()) + 1);
        }
        std::int64_t count = 0;
        for (std::size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size())) {
            ++count;
        }
        return Value::Int(count);
    }

    ThrowNoAttribute(Value::Str(text), name);
}

} // namespace

Value CallMethod(const Value& self, std::string_view name, PositionalArgs& args, KeywordArgs& kwargs,
                 CallContext& ctx) {
    ctx.budget.Tick();

    if (self.IsDict()) {
        return CallDictMethod(*self.AsDict(), name, args, kwargs, ctx);
    }
    if (self.IsSequenceObject()) {
        return CallSequenceMethod(*self.AsList(), self, name, args, kwargs, ctx);
    }
    if (self.IsStr()) {
        return CallStringMethod(self.AsStr(), name, args, kwargs, ctx);
    }
    ThrowNoAttribute(self, name);
}

} // namespace signal_lambda::runtime
