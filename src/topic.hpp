#pragma once
#include <string>

// MQTT-style filter match on '/'-separated topics: '+' matches exactly one
// level, a trailing '#' matches the parent level and every suffix.
bool topic_matches(const std::string &pattern, const std::string &topic);

bool valid_topic_pattern(const std::string &pattern);
