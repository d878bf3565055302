#pragma once
#include <string>
#include <vector>
#include <optional>
#include <functional>

// Sentinel for "field absent or invalid" (distinct from an empty field).
extern const char *const FIELD_NA;

// Minimum number of tab-delimited fields for a record to carry both codes.
constexpr size_t MIN_RECORD_FIELDS = 23;
constexpr size_t SUBJECT_FIELD = 6;
constexpr size_t LOCATION_FIELD = 21;

struct ExtractedFields {
    std::string location;
    std::string subject;
};

struct CompositeKey {
    std::string location;
    std::string subject;

    bool operator==(const CompositeKey &o) const {
        return location == o.location && subject == o.subject;
    }
    bool operator!=(const CompositeKey &o) const { return !(*this == o); }
};

struct CompositeKeyHash {
    size_t operator()(const CompositeKey &k) const noexcept {
        size_t h = std::hash<std::string>{}(k.location);
        return h ^ (std::hash<std::string>{}(k.subject) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

// split on runs of '\t'; a leading tab yields one empty field, trailing empties are dropped
std::vector<std::string> split_fields(const std::string &record);

// Never throws on malformed input: missing codes come back as FIELD_NA.
ExtractedFields extract_fields(const std::string &record);

// Location code only (field 21, truncated to one char when longer than two).
std::string extract_location(const std::string &record);

// std::nullopt when either code is NA, the location is not exactly two
// characters, or the location starts with '-'.
std::optional<CompositeKey> build_key(const ExtractedFields &fields);

std::optional<CompositeKey> composite_key_of(const std::string &record);

// "<location>_<subject>"
std::string key_token(const CompositeKey &key);

// splits on the first '_'; nullopt if there is none
std::optional<CompositeKey> parse_key_token(const std::string &token);
