#include "transports/transport.hpp"

#include "transports/http_transport.hpp"
#include "transports/sse_transport.hpp"
#include "transports/stdio_transport.hpp"

namespace mcpgw {

std::unique_ptr<ITransport> MakeTransport(TransportKind kind, const TransportTarget& target) {
  switch (kind) {
    case TransportKind::kStdio:
      return std::make_unique<StdioTransport>(target);
    case TransportKind::kHttp:
      return std::make_unique<HttpTransport>(target);
    case TransportKind::kSse:
      return std::make_unique<SseTransport>(target);
  }
  return nullptr;
}

}  // namespace mcpgw
