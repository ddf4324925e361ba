#include "command/command_result.h"

#include "errors.h"

namespace pyremote {

namespace {

constexpr const char* kNoResult = "None";

std::string text_of(const nlohmann::json& value) {
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_null())
        return kNoResult;
    return value.dump();
}

// Booleans as is, numbers when non-zero; strings and containers never count.
bool is_truthy(const nlohmann::json& value) {
    if (value.is_boolean())
        return value.get<bool>();
    if (value.is_number_integer())
        return value.get<long long>() != 0;
    if (value.is_number_float())
        return value.get<double>() != 0.0;
    return false;
}

} // namespace

CommandResult::CommandResult(const nlohmann::json& data)
    : result_(kNoResult) {
    if (!data.is_object())
        return;

    if (data.contains("success"))
        success_ = is_truthy(data.at("success"));

    if (data.contains("result"))
        result_ = text_of(data.at("result"));

    if (data.contains("output") && data.at("output").is_array()) {
        for (const auto& entry : data.at("output")) {
            if (!entry.is_object())
                continue;
            OutputEntry line;
            line.kind = entry.contains("type") ? text_of(entry.at("type")) : std::string();
            line.text = entry.contains("output") ? text_of(entry.at("output")) : std::string();
            output_.push_back(std::move(line));
        }
    }
}

CommandResult CommandResult::from_message(const Message& message) {
    CommandResult result(message.data);
    result.source_ = message.source;
    result.dest_ = message.dest;
    return result;
}

CommandResult CommandResult::timeout() {
    CommandResult result(nlohmann::json::object());
    result.timed_out_ = true;
    return result;
}

std::string CommandResult::output_str() const {
    std::string text;
    for (std::size_t i = 0; i < output_.size(); ++i) {
        if (i > 0)
            text += '\n';
        text += output_[i].kind + ": " + output_[i].text;
    }
    return text;
}

std::string CommandResult::to_string() const {
    return success_ ? output_str() : result_;
}

void CommandResult::raise_if_failed() const {
    if (success_)
        return;
    if (timed_out_)
        throw CommandError("No result received before the timeout");
    throw CommandError(result_);
}

} // namespace pyremote
