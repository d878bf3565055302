// tests/test_parser.cpp
#include <iostream>
#include <string>
#include <optional>
#include "../src/parser.hpp"
#include "record_fixtures.hpp"

int main() {
    using namespace std;

    string line = "a\tb\tc\td\te\tf\tSUBJ1\t";
    for (int i = 0; i < 14; ++i) line += "x\t";
    line += "US\t...";

    ExtractedFields f = extract_fields(line);
    if (f.location != "US" || f.subject != "SUBJ1") {
        cerr << "extract_fields: expected US/SUBJ1 got " << f.location << "/" << f.subject << "\n";
        return 2;
    }
    optional<CompositeKey> k = build_key(f);
    if (!k || k->location != "US" || k->subject != "SUBJ1") {
        cerr << "build_key rejected a valid record\n";
        return 3;
    }
    if (key_token(*k) != "US_SUBJ1") {
        cerr << "key_token: got " << key_token(*k) << "\n";
        return 4;
    }

    // too few fields: both codes are the sentinel, nothing throws
    ExtractedFields bad = extract_fields(malformed_record());
    if (bad.location != "NA" || bad.subject != "NA" || build_key(bad)) {
        cerr << "malformed record should yield NA/NA and no key\n";
        return 5;
    }

    // exactly 22 fields is still short
    string short22 = make_record("US", "S");
    short22 = short22.substr(0, short22.rfind('\t'));
    if (split_fields(short22).size() != 22 || extract_fields(short22).location != "NA") {
        cerr << "22-field record should be treated as malformed\n";
        return 6;
    }

    // "USA" truncates to "U", which is not a two-letter code
    ExtractedFields usa = extract_fields(make_record("USA", "SUBJ1"));
    if (usa.location != "U" || build_key(usa)) {
        cerr << "USA should truncate to U and be rejected, got " << usa.location << "\n";
        return 7;
    }

    if (composite_key_of(make_record("-1", "SUBJ1"))) {
        cerr << "location starting with '-' must be rejected\n";
        return 8;
    }
    if (composite_key_of(make_record("NA", "SUBJ1"))) {
        cerr << "NA location must be rejected\n";
        return 9;
    }
    if (composite_key_of(make_record("US", "NA"))) {
        cerr << "NA subject must be rejected\n";
        return 10;
    }
    if (composite_key_of(make_record("U", "SUBJ1"))) {
        cerr << "one-letter location must be rejected\n";
        return 11;
    }

    // runs of tabs collapse; an empty subject therefore shortens the record
    auto runs = split_fields("a\t\t\tb\t");
    if (runs.size() != 2 || runs[0] != "a" || runs[1] != "b") {
        cerr << "split_fields should collapse tab runs and drop trailing empties\n";
        return 12;
    }
    auto lead = split_fields("\ta");
    if (lead.size() != 2 || !lead[0].empty()) {
        cerr << "split_fields should keep one empty leading field\n";
        return 13;
    }
    if (composite_key_of(make_record("US", ""))) {
        cerr << "empty subject must never produce a key\n";
        return 14;
    }
    if (composite_key_of(make_record("", "SUBJ1"))) {
        cerr << "empty location must never produce a key\n";
        return 15;
    }

    // same pair, same key
    if (composite_key_of(make_record("FR", "043")) != composite_key_of(make_record("FR", "043"))) {
        cerr << "key derivation is not deterministic\n";
        return 16;
    }

    auto rt = parse_key_token("FR_SUB_WITH_UNDERSCORE");
    if (!rt || rt->location != "FR" || rt->subject != "SUB_WITH_UNDERSCORE") {
        cerr << "parse_key_token should split on the first '_'\n";
        return 17;
    }
    if (parse_key_token("nounderscore")) {
        cerr << "parse_key_token should reject a token without '_'\n";
        return 18;
    }
    if (extract_location(make_record("GBR", "S")) != "G" || extract_location("x") != "NA") {
        cerr << "extract_location mismatch\n";
        return 19;
    }

    cout << "test_parser: OK\n";
    return 0;
}
