#include <can/trace_export.hpp>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>

using nlohmann::json;

namespace vhil::can {

namespace {

std::string hex_bytes(const std::vector<uint8_t>& data, bool upper, const char* sep = "") {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  if (upper) oss << std::uppercase;
  for (std::size_t i = 0; i < data.size(); ++i) {
    if (i) oss << sep;
    oss << std::setw(2) << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string hex_id(const CanFrame& f) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), f.extended ? "%08X" : "%03X", static_cast<unsigned>(f.id));
  return buf;
}

std::string timestamp6(double ts) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.6f", ts);
  return buf;
}

const char* direction_name(Direction d) {
  return d == Direction::kTx ? "TX" : "RX";
}

} // namespace

core::Result<TraceFormat> ParseTraceFormat(std::string_view name) {
  if (name == "csv")     return TraceFormat::kCsv;
  if (name == "json")    return TraceFormat::kJson;
  if (name == "candump") return TraceFormat::kCandump;
  return core::ErrorCode(core::Errc::kInvalidArgument, "unknown trace format '" + std::string(name) + "'");
}

void WriteTrace(const std::vector<CanFrame>& frames, TraceFormat format,
                const std::string& channel, std::ostream& out) {
  switch (format) {
    case TraceFormat::kCsv: {
      out << "timestamp,channel,id,dlc,data,direction\n";
      for (const auto& f : frames) {
        out << timestamp6(f.timestamp) << ',' << channel << ',' << hex_id(f) << ','
            << static_cast<int>(f.dlc) << ',' << hex_bytes(f.data, true) << ','
            << direction_name(f.direction) << '\n';
      }
      break;
    }
    case TraceFormat::kJson: {
      json messages = json::array();
      for (const auto& f : frames) {
        messages.push_back({
          {"timestamp", f.timestamp},
          {"id", f.id},
          {"extended", f.extended},
          {"dlc", f.dlc},
          {"data", hex_bytes(f.data, false)},
          {"direction", direction_name(f.direction)},
        });
      }
      json doc{
        {"version", "1.0"},
        {"channel", channel},
        {"message_count", frames.size()},
        {"messages", std::move(messages)},
      };
      out << doc.dump(2) << '\n';
      break;
    }
    case TraceFormat::kCandump: {
      for (const auto& f : frames) {
        out << '(' << timestamp6(f.timestamp) << ") " << channel << ' '
            << hex_id(f) << '#' << hex_bytes(f.data, true) << '\n';
      }
      break;
    }
  }
}

core::Result<void> SaveTrace(const std::vector<CanFrame>& frames, TraceFormat format,
                             const std::string& channel, const std::string& path) {
  std::ofstream ofs(path, std::ios::trunc);
  if (!ofs) return core::ErrorCode(core::Errc::kIoError, "cannot open " + path);
  WriteTrace(frames, format, channel, ofs);
  ofs.flush();
  if (!ofs) return core::ErrorCode(core::Errc::kIoError, "write failed for " + path);
  return {};
}

} // namespace vhil::can
