#include "splicerelay/io/endpoint.h"
#include <absl/strings/ascii.h>
#include <string>

namespace splicerelay::io {

EndpointKind ParseEndpointKind(const std::string& kind_str) noexcept {
  const std::string lower_kind = absl::AsciiStrToLower(kind_str);

  if (lower_kind == "pipe") {
    return EndpointKind::kPipe;
  } else if (lower_kind == "tcp") {
    return EndpointKind::kTcpSocket;
  } else if (lower_kind == "unix") {
    return EndpointKind::kUnixSocket;
  } else {
    return EndpointKind::kGeneric;
  }
}

std::string ToString(EndpointKind kind) {
  switch (kind) {
  case EndpointKind::kPipe:
    return "pipe";
  case EndpointKind::kTcpSocket:
    return "tcp";
  case EndpointKind::kUnixSocket:
    return "unix";
  default:
    return "generic";
  }
}

HandleLease::~HandleLease() {
  if (endpoint_) {
    endpoint_->ReturnHandles();
  }
}

HandleLease& HandleLease::operator=(HandleLease&& other) noexcept {
  if (this != &other) {
    if (endpoint_) {
      endpoint_->ReturnHandles();
    }
    endpoint_ = other.endpoint_;
    other.endpoint_ = nullptr;
  }
  return *this;
}

} // namespace splicerelay::io
