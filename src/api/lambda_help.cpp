#include <signal_lambda/api/lambda_api.h>
#include <signal_lambda/core/constants.h>
#include "../compiler/lambda_grammar.h"

#include <glaze/glaze.hpp>
#include <map>
#include <stdexcept>
#include <vector>

namespace signal_lambda::api {

namespace {

struct HelpExample {
    std::string name;
    std::string mode;
    std::string code;
};

struct HelpLimits {
    std::size_t max_code_length{};
    std::int64_t timeout_ms{};
    std::uint64_t max_steps{};
    std::size_t max_container_elements{};
    std::size_t max_string_length{};
    std::size_t max_output_lines{};
    std::size_t max_output_line_chars{};
};

struct HelpDocument {
    std::string description;
    std::map<std::string, std::string> execution_modes;
    std::map<std::string, std::string> signal_fields;
    std::map<std::string, std::string> available_builtins;
    std::map<std::string, std::string> math_constants;
    std::map<std::string, std::string> math_functions;
    std::map<std::string, std::map<std::string, std::string>> methods;
    std::vector<std::string> forbidden_operations;
    std::vector<std::string> forbidden_names;
    std::vector<HelpExample> examples;
    std::vector<std::string> tips;
    HelpLimits limits;
};

std::map<std::string, std::string> ToMap(std::span<const grammar::NamedEntry> entries) {
    std::map<std::string, std::string> out;
    for (const auto& entry : entries) {
        out.emplace(entry.name, entry.description);
    }
    return out;
}

HelpDocument BuildHelpDocument() {
    HelpDocument doc;
    doc.description =
        "Signal lambdas transform trading signals with a restricted subset of Python. "
        "Code is validated before it runs and executes in a confined interpreter with no I/O.";

    doc.execution_modes = {
        {"per_record", "Code that references `signal` runs once per record. Assign the new record to `result` "
                       "or modify `signal` in place. The ticker is always preserved."},
        {"batch", "Code that references `signals` (or neither name) runs once over the whole list. Assign a "
                  "list of records to `result` or modify `signals` in place."},
    };

    doc.signal_fields = {
        {"ticker", "Stock ticker symbol (string)"},
        {"asset_name", "Full asset name (string)"},
        {"signal_type", "Signal type: 'strong_buy', 'buy', 'hold', 'sell', 'strong_sell'"},
        {"signal_strength", "Signal strength: 'very_strong', 'strong', 'moderate', 'weak'"},
        {"confidence_score", "Confidence score (float, 0.0-1.0)"},
        {"politician_activity_count", "Number of politicians trading this ticker"},
        {"buy_sell_ratio", "Ratio of buy to sell transactions"},
        {"total_transaction_volume", "Total transaction volume in dollars"},
        {"ml_enhanced", "Whether ML model was used (boolean)"},
        {"features", "Additional feature data (dict)"},
    };

    doc.available_builtins = ToMap(grammar::Builtins());
    doc.math_constants = ToMap(grammar::MathConstants());
    doc.math_functions = ToMap(grammar::MathFunctions());
    doc.methods = {
        {"dict", ToMap(grammar::DictMethods())},
        {"list", ToMap(grammar::ListMethods())},
        {"str", ToMap(grammar::StringMethods())},
    };

    doc.forbidden_operations = {
        "import statements",
        "function, class and lambda definitions",
        "while loops, try/except, with, raise, global/nonlocal",
        "eval, exec, compile and other reflection",
        "File I/O (open), network and process access",
        "Dunder names and any attribute starting with '_'",
        "set literals, f-strings, byte strings, bitwise operators",
    };
    for (auto name : grammar::DeniedNames()) {
        doc.forbidden_names.emplace_back(name);
    }

    doc.examples = {
        {"Boost high buy/sell ratio", "per_record",
         "if signal.get('buy_sell_ratio', 0) > 3.0:\n"
         "    signal['confidence_score'] = min(signal['confidence_score'] + 0.05, 0.99)\n"
         "result = signal"},
        {"Penalize low politician count", "per_record",
         "if signal.get('politician_activity_count', 0) < 3:\n"
         "    signal['confidence_score'] = signal['confidence_score'] * 0.9\n"
         "result = signal"},
        {"Convert weak sells to holds", "per_record",
         "if signal['signal_type'] == 'sell' and signal['confidence_score'] < 0.7:\n"
         "    signal['signal_type'] = 'hold'\n"
         "    signal['signal_strength'] = 'weak'\n"
         "result = signal"},
        {"Apply logarithmic confidence scaling", "per_record",
         "score = signal['confidence_score']\n"
         "scaled = 0.5 + (math.log(1 + score) / math.log(2)) * 0.5\n"
         "signal['confidence_score'] = min(scaled, 0.99)\n"
         "result = signal"},
        {"Keep confident signals and double their score", "batch",
         "result = []\n"
         "for s in signals:\n"
         "    if s['confidence_score'] > 0.5:\n"
         "        s['confidence_score'] = s['confidence_score'] * 2\n"
         "        result.append(s)"},
        {"Top three by confidence", "batch",
         "ranked = sorted([(s['confidence_score'], i) for i, s in enumerate(signals)], reverse=True)\n"
         "result = [signals[i] for _, i in ranked[:3]]"},
    };

    doc.tips = {
        "Always assign your final value to 'result' or modify 'signal' / 'signals' directly",
        "Use .get() for optional fields to avoid KeyError",
        "Confidence scores should stay between 0 and 1",
        "print() output is returned in the execution trace",
        "One failing record fails the whole batch; nothing is partially applied",
        "Keep logic simple - the step and time budget covers the whole batch",
    };

    doc.limits = HelpLimits{
        .max_code_length = constants::kMaxCodeLength,
        .timeout_ms = constants::kExecutionTimeout.count(),
        .max_steps = constants::kMaxSteps,
        .max_container_elements = constants::kMaxHeapElements,
        .max_string_length = constants::kMaxStringLength,
        .max_output_lines = constants::kMaxOutputLines,
        .max_output_line_chars = constants::kMaxOutputLineChars,
    };
    return doc;
}

} // namespace

std::string LambdaHelpJson() {
    static const std::string json = [] {
        auto written = glz::write_json(BuildHelpDocument());
        if (!written) {
            throw std::runtime_error("Failed to serialize lambda help: " + glz::format_error(written.error()));
        }
        return std::move(*written);
    }();
    return json;
}

} // namespace signal_lambda::api
