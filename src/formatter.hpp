#pragma once
#include "aggregator.hpp"
#include "grouped_aggregator.hpp"
#include <string>
#include <vector>

// "<location> <subject> <count>", one line per key
std::vector<std::string> format_per_key(const AggregationResult &result);

// "<location> <subject1> <count1> <subject2> <count2> ...", one line per location
std::vector<std::string> format_grouped(const GroupedResult &grouped);
