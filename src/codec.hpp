#pragma once
#include <string>
#include "events.hpp"

namespace mdv {

// Field-named JSON payloads stored as values in the time-series buckets.
// encode() fails on values JSON cannot carry (non-finite numbers, invalid UTF-8);
// decode() returns false for malformed payloads and leaves `out` unspecified.

Status encode(const Trade& t, std::string& out);
Status encode(const Depth& d, std::string& out);
Status encode(const FeatureRecord& f, std::string& out);
Status encode(const PriceRecord& p, std::string& out);

bool decode(const std::string& data, Trade& out);
bool decode(const std::string& data, Depth& out);
bool decode(const std::string& data, FeatureRecord& out);
bool decode(const std::string& data, PriceRecord& out);

} // namespace mdv
