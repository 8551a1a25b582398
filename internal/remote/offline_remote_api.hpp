#pragma once

#include "internal/remote/remote_api.hpp"

namespace millsync::remote {

// Transport for a device with no server configured: every call is a network failure.
class OfflineRemoteApi final : public RemoteApi {
 public:
  RemoteResult Get(const std::string& path, const util::CancelToken& cancel) override;
  RemoteResult Post(const std::string& path, const std::string& json_body, const util::CancelToken& cancel) override;
  RemoteResult Put(const std::string& path, const std::string& json_body, const util::CancelToken& cancel) override;
  RemoteResult Patch(const std::string& path, const std::string& json_body, const util::CancelToken& cancel) override;
  RemoteResult Delete(const std::string& path, const util::CancelToken& cancel) override;
};

} // namespace millsync::remote
