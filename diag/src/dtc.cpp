#include <diag/dtc.hpp>
#include <cctype>

namespace vhil::diag {

namespace {

struct DomainEntry { char letter; uint8_t byte; };

constexpr std::array<DomainEntry, 4> kDomains{{
  {'P', 0x02}, {'B', 0x08}, {'C', 0x01}, {'U', 0x00},
}};

int nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

bool IsValidDtcCode(std::string_view code) {
  if (code.size() != 5) return false;
  bool domain_ok = false;
  for (const auto& d : kDomains) domain_ok = domain_ok || d.letter == code[0];
  if (!domain_ok) return false;
  for (std::size_t i = 1; i < code.size(); ++i)
    if (nibble(code[i]) < 0) return false;
  return true;
}

std::string NormalizeDtcCode(std::string_view code) {
  std::string out(code);
  for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

std::optional<std::array<uint8_t, 3>> EncodeDtc(std::string_view code) {
  if (!IsValidDtcCode(code)) return std::nullopt;
  uint8_t domain = 0;
  for (const auto& d : kDomains) if (d.letter == code[0]) domain = d.byte;
  return std::array<uint8_t, 3>{
    domain,
    static_cast<uint8_t>((nibble(code[1]) << 4) | nibble(code[2])),
    static_cast<uint8_t>((nibble(code[3]) << 4) | nibble(code[4])),
  };
}

std::optional<std::string> DecodeDtc(const std::array<uint8_t, 3>& raw) {
  static const char* hex = "0123456789ABCDEF";
  for (const auto& d : kDomains) {
    if (d.byte != raw[0]) continue;
    std::string out;
    out.push_back(d.letter);
    out.push_back(hex[raw[1] >> 4]);
    out.push_back(hex[raw[1] & 0x0F]);
    out.push_back(hex[raw[2] >> 4]);
    out.push_back(hex[raw[2] & 0x0F]);
    return out;
  }
  return std::nullopt;
}

} // namespace vhil::diag
