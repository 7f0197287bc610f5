#pragma once

#include <cstdint>
#include <string>

namespace apirest {

// Subject and key parameters used when a self-signed identity has to be generated.
struct CertProfile {
  uint32_t bits{4096};
  std::string commonName{"apirest"};
  std::string country{"US"};
  std::string locality;
  std::string organization{"apirest"};
  std::string organizationalUnit;

  bool operator==(const CertProfile&) const noexcept = default;
};

}  // namespace apirest
