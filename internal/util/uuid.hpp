#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace millsync::util {

/*
  UUID helpers

  Mutation record ids are RFC4122 v4 UUIDs in canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Source of mutation record ids. Injected so tests get deterministic ids.
class IdGenerator {
 public:
  virtual ~IdGenerator() = default;

  virtual std::string Next() = 0;
};

class UuidGenerator final : public IdGenerator {
 public:
  std::string Next() override {
    return ToString(GenerateUUID());
  }
};

} // namespace millsync::util
