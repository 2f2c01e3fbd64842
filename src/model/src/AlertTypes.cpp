/**
 * @file AlertTypes.cpp
 * @brief Alert record helpers.
 */

#include "src/model/inc/AlertTypes.hpp"

namespace vigil {

namespace model {

const char* toString(Severity severity) noexcept {
  switch (severity) {
  case Severity::INFO:
    return "info";
  case Severity::WARNING:
    return "warning";
  case Severity::ERROR:
    return "error";
  case Severity::CRITICAL:
    return "critical";
  }
  return "unknown";
}

std::string AlertKey::toString() const {
  std::string out;
  out.reserve(hostname.size() + metric.size() + subResource.size() + 3);
  out += hostname;
  out.push_back('/');
  out += metric;
  if (!subResource.empty()) {
    out.push_back('[');
    out += subResource;
    out.push_back(']');
  }
  return out;
}

std::size_t AlertKeyHash::operator()(const AlertKey& key) const noexcept {
  const std::hash<std::string> H{};
  std::size_t seed = H(key.hostname);
  seed ^= H(key.metric) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
  seed ^= H(key.subResource) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
  return seed;
}

} // namespace model

} // namespace vigil
