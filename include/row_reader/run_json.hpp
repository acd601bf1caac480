#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rr {

struct RunJsonPayload {
  // Top-level KPIs
  std::uint64_t rows = 0;
  std::uint64_t bytes = 0;
  std::uint64_t width = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double rows_per_sec = 0.0;

  // Outcome: "ok", or the ErrorKind name that stopped the scan
  std::string status = "ok";
  std::string error;

  std::vector<std::string> columns;

  // Stages and errors
  std::vector<std::pair<std::string, double>> stage_times;
  std::unordered_map<std::string, std::uint64_t> errors_by_field;

  // Input metadata
  std::string filename;
  std::string content_type;
  std::string slug;
  std::uint64_t file_size = 0;
};

class RunJsonWriter {
public:
  // Serialize payload to a compact JSON object.
  static std::string to_json(const RunJsonPayload& p);
};

}
