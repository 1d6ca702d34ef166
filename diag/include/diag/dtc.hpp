#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vhil::diag {

// Stored trouble code, e.g. "P0171" with status 0x01
struct DtcRecord {
  std::string code;
  uint8_t status = 0x01;
  std::optional<std::string> snapshot;
};

// Domain letter in {P,C,B,U} followed by exactly four hex digits
bool IsValidDtcCode(std::string_view code);

// Upper-cases the hex digits so every code has the single spelling DecodeDtc yields
std::string NormalizeDtcCode(std::string_view code);

// 3-byte wire form: [domain byte][d1 d2][d3 d4]; domain bytes P=0x02 B=0x08 C=0x01 U=0x00
std::optional<std::array<uint8_t, 3>> EncodeDtc(std::string_view code);
std::optional<std::string> DecodeDtc(const std::array<uint8_t, 3>& raw);

} // namespace vhil::diag
