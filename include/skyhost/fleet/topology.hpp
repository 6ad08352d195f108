#pragma once

#include "skyhost/common/result.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace skyhost::fleet {

struct ProcessState {
  bool running = false;
  std::string state;
  std::vector<std::string> ports;
  std::optional<std::string> image;
};

struct Topology {
  std::map<std::string, ProcessState> services;
  // Listing records discarded because they were not objects or lacked a name or state.
  std::uint64_t dropped_records = 0;
};

/// Read-only view of the live process state.
class ITopologySource {
public:
  virtual ~ITopologySource() = default;
  [[nodiscard]] virtual common::Result<Topology> query_topology() = 0;
};

/// Parses the line-oriented `ps --format json` output of the compose tool. Accepts one
/// object per line as well as a line holding a whole array of objects.
[[nodiscard]] Topology parse_topology_listing(const std::string &text);

/// Tag part of an image reference ("ghcr.io/x/pds:0.4" -> "0.4"), if any.
[[nodiscard]] std::optional<std::string> image_tag(const std::string &image);

} // namespace skyhost::fleet
