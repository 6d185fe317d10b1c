#include "utils.h"

#include <NTL/BasicThreadPool.h>
#include <utils/helpers.h>

#include <fstream>
#include <iostream>
#include <limits>

TimePoint::TimePoint() : time(timepoint_t::clock::now()) {}

double TimePoint::operator-(const TimePoint& rhs) const {
  return std::chrono::duration_cast<timeunit_t>(time - rhs.time).count();
}

StatsPoint::StatsPoint(const eos::ExecutionStats& stats) : stats_(stats) {}

nlohmann::json StatsPoint::operator-(const StatsPoint& rhs) const {
  const auto& lhs = stats_;
  return {
      {"time", tpoint_ - rhs.tpoint_},
      {"rounds", lhs.communication_rounds - rhs.stats_.communication_rounds},
      {"communication", lhs.bytes_communicated - rhs.stats_.bytes_communicated},
      {"add_gates", lhs.num_add_gates - rhs.stats_.num_add_gates},
      {"mul_gates", lhs.num_mul_gates - rhs.stats_.num_mul_gates}};
}

nlohmann::json toJson(const eos::CommunicationComplexity& cc) {
  return {{"rounds", cc.rounds},
          {"bytes_per_round", cc.bytes_per_round},
          {"latency_ms", cc.latency_ms},
          {"total_bytes", cc.totalBytes()},
          {"total_latency_ms", cc.totalLatencyMs()}};
}

nlohmann::json toJson(const eos::ExecutionStats& stats) {
  return {{"add_gates", stats.num_add_gates},
          {"mul_gates", stats.num_mul_gates},
          {"rounds", stats.communication_rounds},
          {"communication", stats.bytes_communicated},
          {"time", stats.execution_time_ms}};
}

bool saveJson(const nlohmann::json& data, const std::string& fpath) {
  std::ofstream fout;
  fout.open(fpath, std::fstream::app);
  if (!fout.is_open()) {
    std::cerr << "Could not open save file at " << fpath << std::endl;
    return false;
  }

  fout << data;
  fout << std::endl;
  fout.close();

  std::cout << "Saved data in " << fpath << std::endl;

  return true;
}

void initNTL(size_t num_threads) {
  eos::utils::initField();
  NTL::SetNumThreads(num_threads);
}

#ifdef __linux__
int64_t getProcStatus(const std::string& key) {
  int64_t value = 0;

  const char* filename = "/proc/self/status";

  std::ifstream procfile(filename);
  std::string word;
  while (procfile.good()) {
    procfile >> word;
    if (word == key) {
      procfile >> value;
      break;
    }

    // Skip to end of line.
    procfile.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
  }

  if (procfile.fail()) {
    return -1;
  }

  return value;
}

int64_t peakVirtualMemory() { return getProcStatus("VmPeak:"); }

int64_t peakResidentSetSize() { return getProcStatus("VmHWM:"); }
#else
int64_t peakVirtualMemory() { return -1; }

int64_t peakResidentSetSize() { return -1; }
#endif
