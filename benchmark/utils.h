#pragma once

#include <eos/executor.h>
#include <eos/modes.h>

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

struct TimePoint {
  using timepoint_t = std::chrono::high_resolution_clock::time_point;
  using timeunit_t = std::chrono::duration<double, std::milli>;

  TimePoint();
  double operator-(const TimePoint& rhs) const;

  timepoint_t time;
};

// Snapshot of the time and of the accounted communication of a session.
class StatsPoint {
  TimePoint tpoint_;
  eos::ExecutionStats stats_;

 public:
  explicit StatsPoint(const eos::ExecutionStats& stats);
  nlohmann::json operator-(const StatsPoint& rhs) const;
};

nlohmann::json toJson(const eos::CommunicationComplexity& cc);
nlohmann::json toJson(const eos::ExecutionStats& stats);

bool saveJson(const nlohmann::json& data, const std::string& fpath);
int64_t peakVirtualMemory();
int64_t peakResidentSetSize();
void initNTL(size_t num_threads);
