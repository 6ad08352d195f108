#include "skyhost/fleet/topology.hpp"

#include "skyhost/common/fs.hpp"
#include "skyhost/common/json_util.hpp"

namespace skyhost::fleet {

namespace {

std::optional<std::string> first_of(const common::JsonFlatMap &record,
                                    const std::vector<std::string> &keys) {
  for (const auto &key : keys) {
    const auto it = record.find(key);
    if (it != record.end() && !it->second.empty() && it->second != "null") {
      return it->second;
    }
  }
  return std::nullopt;
}

std::vector<std::string> publisher_ports(const std::string &publishers_json) {
  std::vector<std::string> ports;
  for (const auto &entry : common::json_split_top_level_objects(publishers_json)) {
    const auto publisher = common::json_parse_flat(entry);
    const auto published = publisher.find("PublishedPort");
    const auto target = publisher.find("TargetPort");
    if (published == publisher.end() || target == publisher.end()) {
      continue;
    }
    const std::string published_port = common::trim(published->second);
    if (published_port.empty() || published_port == "0") {
      continue;
    }
    ports.push_back(published_port + ":" + common::trim(target->second));
  }
  return ports;
}

std::vector<std::string> record_ports(const common::JsonFlatMap &record) {
  if (const auto it = record.find("ports"); it != record.end() && !it->second.empty() &&
                                            it->second.front() == '[') {
    return common::json_parse_string_array(it->second);
  }
  if (const auto it = record.find("Publishers"); it != record.end() && !it->second.empty() &&
                                                 it->second.front() == '[') {
    return publisher_ports(it->second);
  }
  if (const auto it = record.find("Ports"); it != record.end()) {
    std::vector<std::string> ports;
    std::string rest = it->second;
    while (!rest.empty()) {
      const auto sep = rest.find(", ");
      const std::string part = common::trim(rest.substr(0, sep));
      if (!part.empty()) {
        ports.push_back(part);
      }
      if (sep == std::string::npos) {
        break;
      }
      rest = rest.substr(sep + 2);
    }
    return ports;
  }
  return {};
}

bool add_record(Topology &topology, const std::string &object_text) {
  if (!common::json_is_object(object_text)) {
    return false;
  }
  const auto record = common::json_parse_flat(common::trim(object_text));
  const auto name = first_of(record, {"Service", "name", "Name"});
  const auto state = first_of(record, {"State", "state"});
  if (!name.has_value() || !state.has_value()) {
    return false;
  }

  ProcessState process{
      .running = *state == "running",
      .state = *state,
      .ports = record_ports(record),
      .image = first_of(record, {"Image", "image"}),
  };
  topology.services[*name] = std::move(process);
  return true;
}

} // namespace

Topology parse_topology_listing(const std::string &text) {
  Topology topology;
  for (const auto &raw_line : common::split_lines(text)) {
    const std::string line = common::trim(raw_line);
    if (line.empty()) {
      continue;
    }
    if (line.front() == '[') {
      const auto objects = common::json_is_valid(line)
                               ? common::json_split_top_level_objects(line)
                               : std::vector<std::string>{};
      // An empty listing is fine; anything else yielding no objects is one lost record.
      const bool empty_listing = common::trim(line.substr(1, line.size() - 1)) == "]";
      if (objects.empty() && !empty_listing) {
        ++topology.dropped_records;
        continue;
      }
      for (const auto &object : objects) {
        if (!add_record(topology, object)) {
          ++topology.dropped_records;
        }
      }
      continue;
    }
    if (!add_record(topology, line)) {
      ++topology.dropped_records;
    }
  }
  return topology;
}

std::optional<std::string> image_tag(const std::string &image) {
  const auto digest = image.find('@');
  const std::string reference = image.substr(0, digest);
  const auto colon = reference.rfind(':');
  const auto slash = reference.rfind('/');
  if (colon == std::string::npos || (slash != std::string::npos && colon < slash)) {
    return std::nullopt;
  }
  const std::string tag = reference.substr(colon + 1);
  if (tag.empty()) {
    return std::nullopt;
  }
  return tag;
}

} // namespace skyhost::fleet
