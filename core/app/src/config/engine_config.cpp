#include "sigexec/config/engine_config.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace sigexec {

namespace {

std::string toUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  });
  return s;
}

}  // namespace

std::vector<std::string> EngineConfig::symbolWhitelist() const {
  std::vector<std::string> out;
  auto add = [&out](const std::string& symbol) {
    std::string upper = toUpper(symbol);
    if (!upper.empty() &&
        std::find(out.begin(), out.end(), upper) == out.end()) {
      out.push_back(std::move(upper));
    }
  };
  add(instrument);
  for (const auto& alias : symbol_aliases) {
    add(alias);
  }
  return out;
}

domain::InstrumentSpec EngineConfig::paperInstrument() const {
  domain::InstrumentSpec spec;
  spec.symbol = instrument;
  spec.point = paper.point;
  spec.digits = paper.digits;
  spec.volume_min = paper.volume_min;
  spec.volume_max = paper.volume_max;
  spec.volume_step = paper.volume_step;
  spec.contract_size = paper.contract_size;
  return spec;
}

}  // namespace sigexec
