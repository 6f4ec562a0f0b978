#include "subcue/asr_result.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace subcue {

namespace {

int64_t parse_millis(const nlohmann::json &value, size_t index) {
    if (value.is_number_integer()) {
        auto ms = value.get<int64_t>();
        if (ms >= 0)
            return ms;
    } else if (value.is_number_float()) {
        auto ms = value.get<double>();
        if (std::isfinite(ms) && ms >= 0.0)
            return static_cast<int64_t>(ms);
    }
    throw AsrFormatError("timestamp #" + std::to_string(index) +
                         " has an invalid time value: " + value.dump());
}

TimestampSpan parse_span(const nlohmann::json &pair, size_t index) {
    if (!pair.is_array() || pair.size() != 2) {
        throw AsrFormatError("timestamp #" + std::to_string(index) +
                             " is not a [start, end] pair: " + pair.dump());
    }
    return {parse_millis(pair[0], index), parse_millis(pair[1], index)};
}

} // namespace

AsrResult parse_asr_result(const nlohmann::json &doc) {
    // Recognizers return one result per input in a batch list
    if (doc.is_array()) {
        if (doc.empty()) {
            throw AsrFormatError("ASR result list is empty");
        }
        return parse_asr_result(doc.front());
    }

    if (!doc.is_object()) {
        throw AsrFormatError("ASR result is not an object");
    }

    AsrResult result;

    // No text means nothing was recognized
    auto text_it = doc.find("text");
    if (text_it != doc.end() && !text_it->is_null()) {
        if (!text_it->is_string()) {
            throw AsrFormatError("ASR result \"text\" is not a string");
        }
        result.text = text_it->get<std::string>();
    }

    auto ts_it = doc.find("timestamp");
    if (ts_it == doc.end() || ts_it->is_null()) {
        return result;
    }
    if (!ts_it->is_array()) {
        throw AsrFormatError("ASR result \"timestamp\" is not a list");
    }

    result.timestamps.reserve(ts_it->size());
    for (size_t i = 0; i < ts_it->size(); ++i) {
        result.timestamps.push_back(parse_span((*ts_it)[i], i));
    }
    return result;
}

AsrResult parse_asr_json(const std::string &json_text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error &e) {
        throw AsrFormatError(std::string("Invalid ASR result JSON: ") +
                             e.what());
    }
    return parse_asr_result(doc);
}

AsrResult load_asr_result(const std::string &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open ASR result file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_asr_json(buffer.str());
}

} // namespace subcue
