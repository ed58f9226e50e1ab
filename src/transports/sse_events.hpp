#pragma once

#include <string>
#include <vector>

namespace mcpgw {

struct SseEvent {
  std::string event;
  std::string data;
  std::string id;
};

// Incremental text/event-stream decoder. Feed arbitrary chunks; complete events come back once their
// terminating blank line has arrived.
class SseEventParser {
 public:
  std::vector<SseEvent> Feed(const char* data, size_t len);
  size_t Buffered() const { return buf_.size(); }

 private:
  std::string buf_;
};

// Decodes a complete text/event-stream body in one pass.
std::vector<SseEvent> ParseSseBody(const std::string& body);

}  // namespace mcpgw
