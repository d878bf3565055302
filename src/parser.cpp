#include "parser.hpp"

const char *const FIELD_NA = "NA";

std::vector<std::string> split_fields(const std::string &record) {
    std::vector<std::string> fields;
    size_t i = 0;
    const size_t n = record.size();
    while (i <= n) {
        size_t tab = record.find('\t', i);
        if (tab == std::string::npos) {
            fields.emplace_back(record, i, n - i);
            break;
        }
        fields.emplace_back(record, i, tab - i);
        // collapse the whole run of tabs into one separator
        i = record.find_first_not_of('\t', tab);
        if (i == std::string::npos) break;
    }
    while (!fields.empty() && fields.back().empty()) fields.pop_back();
    return fields;
}

static std::string location_from_fields(const std::vector<std::string> &fields) {
    const std::string &raw = fields[LOCATION_FIELD];
    if (raw.size() > 2) return raw.substr(0, 1);
    return raw;
}

ExtractedFields extract_fields(const std::string &record) {
    ExtractedFields out{FIELD_NA, FIELD_NA};
    auto fields = split_fields(record);
    if (fields.size() < MIN_RECORD_FIELDS) return out;
    out.location = location_from_fields(fields);
    if (!fields[SUBJECT_FIELD].empty()) out.subject = fields[SUBJECT_FIELD];
    return out;
}

std::string extract_location(const std::string &record) {
    auto fields = split_fields(record);
    if (fields.size() < MIN_RECORD_FIELDS) return FIELD_NA;
    return location_from_fields(fields);
}

std::optional<CompositeKey> build_key(const ExtractedFields &f) {
    if (f.location == FIELD_NA || f.subject == FIELD_NA) return std::nullopt;
    if (f.location.size() != 2 || f.location[0] == '-') return std::nullopt;
    return CompositeKey{f.location, f.subject};
}

std::optional<CompositeKey> composite_key_of(const std::string &record) {
    return build_key(extract_fields(record));
}

std::string key_token(const CompositeKey &key) {
    std::string t;
    t.reserve(key.location.size() + 1 + key.subject.size());
    t.append(key.location).append(1, '_').append(key.subject);
    return t;
}

std::optional<CompositeKey> parse_key_token(const std::string &token) {
    size_t us = token.find('_');
    if (us == std::string::npos) return std::nullopt;
    return CompositeKey{token.substr(0, us), token.substr(us + 1)};
}
