#pragma once

#include <string>

#include "internal/util/cancel_token.hpp"
#include "internal/util/failure.hpp"

namespace millsync::remote {

struct Response {
  bool        success     = true;
  int         status_code = 200;
  std::string data;
  std::string message;
};

using RemoteResult = util::Outcome<Response>;

/*
  HTTP-shaped transport to the ERP server.

  A non-2xx answer is still an Ok RemoteResult with success=false; Fail is
  reserved for calls that produced no answer (network down, timeout,
  cancelled). Implementations must return promptly once `cancel` trips.
*/
class RemoteApi {
 public:
  virtual ~RemoteApi() = default;

  virtual RemoteResult Get(const std::string& path, const util::CancelToken& cancel) = 0;

  virtual RemoteResult Post(const std::string& path, const std::string& json_body, const util::CancelToken& cancel) = 0;

  virtual RemoteResult Put(const std::string& path, const std::string& json_body, const util::CancelToken& cancel) = 0;

  virtual RemoteResult Patch(const std::string& path, const std::string& json_body, const util::CancelToken& cancel) = 0;

  virtual RemoteResult Delete(const std::string& path, const util::CancelToken& cancel) = 0;
};

} // namespace millsync::remote
