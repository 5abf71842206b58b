#pragma once
/** @file  Response.hpp
 *  @brief Identity lines sent by serial boards: `MODEL:VERSION` and the
 *         `*IDN?` reply `VENDOR:BOARD:ASSET_TAG:VERSION`.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <vector>

namespace boardlink {
  namespace protocols {
    struct VersionResponse {
      std::string model;
      std::string version;

      /// nullopt unless the line holds a non-empty model, a ':' and a version.
      static std::optional<VersionResponse> fromWire(const std::string& line) {
        auto colon = line.rfind(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 >= line.size())
          return std::nullopt;
        return VersionResponse{ line.substr(0, colon), line.substr(colon + 1) };
      }
    };

    struct IdentityResponse {
      std::string vendor;
      std::string board;
      std::string assetTag;
      std::string softwareVersion;

      /// nullopt unless the line has exactly four ':' separated fields.
      static std::optional<IdentityResponse> fromWire(const std::string& line) {
        std::vector<std::string> parts;
        std::string::size_type start = 0;
        while (true) {
          auto colon = line.find(':', start);
          parts.push_back(line.substr(start, colon - start));
          if (colon == std::string::npos)
            break;
          start = colon + 1;
        }
        if (parts.size() != 4)
          return std::nullopt;
        return IdentityResponse{ parts[0], parts[1], parts[2], parts[3] };
      }
    };
  } // namespace protocols
} // namespace boardlink
