#include "offline_remote_api.hpp"

namespace millsync::remote {

namespace {

RemoteResult Unreachable(const std::string& path) {
  return RemoteResult::Fail(util::Failure::Network("no server configured: " + path));
}

} // namespace

RemoteResult OfflineRemoteApi::Get(const std::string& path, const util::CancelToken&) {
  return Unreachable(path);
}

RemoteResult OfflineRemoteApi::Post(const std::string& path, const std::string&, const util::CancelToken&) {
  return Unreachable(path);
}

RemoteResult OfflineRemoteApi::Put(const std::string& path, const std::string&, const util::CancelToken&) {
  return Unreachable(path);
}

RemoteResult OfflineRemoteApi::Patch(const std::string& path, const std::string&, const util::CancelToken&) {
  return Unreachable(path);
}

RemoteResult OfflineRemoteApi::Delete(const std::string& path, const util::CancelToken&) {
  return Unreachable(path);
}

} // namespace millsync::remote
