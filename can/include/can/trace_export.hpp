#pragma once
#include <can/frame.hpp>
#include <vhil/core/result.hpp>

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace vhil::can {

enum class TraceFormat { kCsv, kJson, kCandump };

core::Result<TraceFormat> ParseTraceFormat(std::string_view name);

// CSV:     timestamp,channel,id,dlc,data,direction
// JSON:    {"version","channel","message_count","messages":[...]}
// candump: (1718000000.123456) virtual0 100#AA0BB0
void WriteTrace(const std::vector<CanFrame>& frames, TraceFormat format,
                const std::string& channel, std::ostream& out);

core::Result<void> SaveTrace(const std::vector<CanFrame>& frames, TraceFormat format,
                             const std::string& channel, const std::string& path);

} // namespace vhil::can
