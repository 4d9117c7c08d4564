#include "record_accumulator.hpp"
#include <core/utils.hpp>

using json = nlohmann::json;

// ── EventClassifier ───────────────────────────────────────────

EventClassifier::EventClassifier(const std::vector<std::string>& event_types)
    : types_(event_types.begin(), event_types.end()) {}

std::optional<json> EventClassifier::as_event(const std::string& text) const {
    json data = json::parse(text, nullptr, false);
    if (data.is_discarded() || !data.is_object()) return std::nullopt;

    auto it = data.find(EVENT_TYPE_FIELD);
    if (it == data.end() || !it->is_string()) return std::nullopt;
    if (types_.count(it->get<std::string>()) == 0) return std::nullopt;

    return data;
}

// ── RecordAccumulator ─────────────────────────────────────────

static bool opens_record(const std::string& line) {
    auto first = line.find_first_not_of(" \t");
    return first != std::string::npos && (line[first] == '{' || line[first] == '[');
}

static bool blank(const std::string& line) {
    return line.find_first_not_of(" \t") == std::string::npos;
}

static ClassifiedRecord response(std::vector<std::string> lines) {
    return ClassifiedRecord{ClassifiedRecord::Kind::Response, std::move(lines), json()};
}

RecordAccumulator::RecordAccumulator(EventClassifier classifier,
                                     size_t max_lines, size_t max_bytes)
    : classifier_(std::move(classifier)), max_lines_(max_lines), max_bytes_(max_bytes) {}

void RecordAccumulator::reset() {
    pending_.clear();
    pending_bytes_ = 0;
    depth_ = 0;
    in_string_ = false;
    escape_ = false;
}

bool RecordAccumulator::scan(const std::string& line) {
    for (char c : line) {
        if (in_string_) {
            if (escape_) {
                escape_ = false;
            } else if (c == '\\') {
                escape_ = true;
            } else if (c == '"') {
                in_string_ = false;
            }
            continue;
        }

        if (c == '"') {
            in_string_ = true;
        } else if (c == '{' || c == '[') {
            depth_++;
        } else if (c == '}' || c == ']') {
            if (--depth_ < 0) return false;
        }
    }
    return true;
}

ClassifiedRecord RecordAccumulator::settle() {
    auto payload = classifier_.as_event(join_lines(pending_));
    ClassifiedRecord rec = payload
        ? ClassifiedRecord{ClassifiedRecord::Kind::Event, std::move(pending_), std::move(*payload)}
        : response(std::move(pending_));
    reset();
    return rec;
}

std::vector<ClassifiedRecord> RecordAccumulator::feed(const std::string& line) {
    std::vector<ClassifiedRecord> out;

    if (pending_.empty()) {
        if (blank(line)) return out;
        if (!opens_record(line)) {
            out.push_back(response({line}));
            return out;
        }
    }

    pending_.push_back(line);
    pending_bytes_ += line.size() + 1;

    if (!scan(line)) {
        out.push_back(response(std::move(pending_)));
        reset();
        return out;
    }

    if (depth_ == 0 && !in_string_) {
        out.push_back(settle());
        return out;
    }

    if (pending_.size() >= max_lines_ || pending_bytes_ >= max_bytes_) {
        out.push_back(response(std::move(pending_)));
        reset();
    }
    return out;
}

std::vector<ClassifiedRecord> RecordAccumulator::flush() {
    std::vector<ClassifiedRecord> out;
    if (pending_.empty()) return out;
    out.push_back(response(std::move(pending_)));
    reset();
    return out;
}
