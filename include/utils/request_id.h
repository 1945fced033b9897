// request_id.h - request-id generator for access log correlation
#pragma once

#include <string>

namespace infergate {

// Random 16-hex-character request id.
std::string generate_request_id();

}  // namespace infergate
