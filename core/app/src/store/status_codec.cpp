#include "sigexec/store/status_codec.hpp"

#include <algorithm>
#include <cctype>

namespace sigexec {

namespace {

std::string normalize(const std::string& text) {
  auto begin = std::find_if_not(text.begin(), text.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c));
  });
  auto end = std::find_if_not(text.rbegin(), text.rend(), [](char c) {
               return std::isspace(static_cast<unsigned char>(c));
             }).base();

  std::string out;
  if (begin < end) {
    out.assign(begin, end);
  }
  std::transform(out.begin(), out.end(), out.begin(), [](char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  });
  return out;
}

}  // namespace

const char* statusToText(domain::SignalStatus status) {
  using S = domain::SignalStatus;
  switch (status) {
    case S::Process: return "PROCESS";
    case S::Modify:  return "MODIFY";
    case S::Done:    return "DONE";
    case S::Invalid: return "INVALID";
    case S::Error:   return "ERROR";
    case S::Expired: return "EXPIRED";
  }
  return "ERROR";
}

std::optional<domain::SignalStatus> parseStatus(const std::string& text) {
  using S = domain::SignalStatus;
  const std::string t = normalize(text);
  if (t == "PROCESS") return S::Process;
  if (t == "MODIFY")  return S::Modify;
  if (t == "DONE")    return S::Done;
  if (t == "INVALID") return S::Invalid;
  if (t == "ERROR")   return S::Error;
  if (t == "EXPIRED") return S::Expired;
  return std::nullopt;
}

std::optional<domain::Side> parseDirection(const std::string& text) {
  const std::string t = normalize(text);
  if (t == "BUY" || t == "LONG") {
    return domain::Side::Buy;
  }
  if (t == "SELL" || t == "SHORT") {
    return domain::Side::Sell;
  }
  return std::nullopt;
}

}  // namespace sigexec
