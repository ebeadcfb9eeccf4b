#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "detection_engine.hpp"

// HH:MM:SS (hours keep counting past 24)
std::string format_uptime(Duration d);

// "Uptime: 00:01:05 | Deauth: 42 | Rate: 0.6 pkt/s | Alerts: 3 | ..."
std::string format_stats_line(const Stats &s);

std::string stats_json(const Stats &s,
                       const std::vector<std::pair<std::string,uint64_t>> &offenders);

std::string offenders_json(const std::vector<std::pair<std::string,uint64_t>> &offenders);
