#include "transports/sse_events.hpp"

namespace mcpgw {
namespace {

static SseEvent ParseBlock(const std::string& block) {
  SseEvent ev;
  bool have_data = false;
  size_t start = 0;
  while (start <= block.size()) {
    size_t end = block.find('\n', start);
    if (end == std::string::npos) end = block.size();
    std::string line = block.substr(start, end - start);
    start = end + 1;
    if (line.empty() || line[0] == ':') continue;

    std::string field = line;
    std::string value;
    const auto colon = line.find(':');
    if (colon != std::string::npos) {
      field = line.substr(0, colon);
      value = line.substr(colon + 1);
      if (!value.empty() && value[0] == ' ') value.erase(0, 1);
    }
    if (field == "event") {
      ev.event = value;
    } else if (field == "data") {
      if (have_data) ev.data += "\n";
      ev.data += value;
      have_data = true;
    } else if (field == "id") {
      ev.id = value;
    }
  }
  if (ev.event.empty()) ev.event = "message";
  return ev;
}

}  // namespace

std::vector<SseEvent> SseEventParser::Feed(const char* data, size_t len) {
  for (size_t i = 0; i < len; i++) {
    if (data[i] != '\r') buf_.push_back(data[i]);
  }

  std::vector<SseEvent> out;
  size_t pos = 0;
  while ((pos = buf_.find("\n\n")) != std::string::npos) {
    std::string block = buf_.substr(0, pos);
    buf_.erase(0, pos + 2);
    if (block.find_first_not_of('\n') == std::string::npos) continue;
    auto ev = ParseBlock(block);
    // Comment-only blocks (keepalives) carry neither data nor a type.
    if (ev.data.empty() && ev.event == "message") continue;
    out.push_back(std::move(ev));
  }
  return out;
}

std::vector<SseEvent> ParseSseBody(const std::string& body) {
  SseEventParser parser;
  auto out = parser.Feed(body.data(), body.size());
  auto tail = parser.Feed("\n\n", 2);
  out.insert(out.end(), tail.begin(), tail.end());
  return out;
}

}  // namespace mcpgw
