#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <core/constants.hpp>

// Decides whether one complete structured record is an asynchronous event.
// A record is an event when it parses as a JSON object whose
// "payload_typename" field names one of the configured event types.
class EventClassifier {
public:
    explicit EventClassifier(const std::vector<std::string>& event_types);

    // Parsed payload when text is a complete event record, nullopt otherwise.
    std::optional<nlohmann::json> as_event(const std::string& text) const;

private:
    std::set<std::string> types_;
};

struct ClassifiedRecord {
    enum class Kind { Event, Response };

    Kind kind;
    std::vector<std::string> lines;     // physical lines in emission order
    nlohmann::json payload;             // set for events only

    bool is_event() const { return kind == Kind::Event; }
};

// Groups physical output lines into logical records.
//
// A line starting with '{' or '[' opens a candidate record. Nesting depth is
// tracked across lines (quotes and escapes respected) and the candidate is
// classified only once it is balanced, so a pretty-printed event spread over
// several lines becomes a single event. Anything that cannot be settled
// within max_lines / max_bytes, or that unbalances below zero, is released as
// response content line by line rather than dropped.
class RecordAccumulator {
public:
    explicit RecordAccumulator(EventClassifier classifier,
                               size_t max_lines = RECORD_MAX_LINES,
                               size_t max_bytes = RECORD_MAX_BYTES);

    // Feed one physical line (no terminator). Returns the records it settles.
    std::vector<ClassifiedRecord> feed(const std::string& line);

    // Release an open candidate as response content.
    std::vector<ClassifiedRecord> flush();

    // True while a candidate record is waiting for more lines.
    bool open() const { return !pending_.empty(); }

private:
    EventClassifier classifier_;
    size_t max_lines_;
    size_t max_bytes_;

    std::vector<std::string> pending_;
    size_t pending_bytes_ = 0;
    int depth_ = 0;
    bool in_string_ = false;
    bool escape_ = false;

    // Returns false if the structure closed more than it opened.
    bool scan(const std::string& line);
    ClassifiedRecord settle();
    void reset();
};
