#pragma once
#include <stdexcept>
#include <string>
#include "detector_config.hpp"

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// Overrides fields of `base` from a JSON document. Unknown keys are
// ignored; a known key of the wrong type throws ConfigError.
//
// {
//   "context_window": 20,
//   "min_confidence": 0.5,
//   "max_workers": 4,
//   "mask_passwords": true,
//   "confidence": {"shape": 0.7, "label": 0.9, "id_card": 0.9, "credit_card": 0.85,
//                  "password": 0.6, "address_keyword": 0.5, "address_max": 0.9},
//   "address_min_chars": 4,
//   "labels": {"phone": ["tel", "手机"], ...}
// }
DetectorConfig parseDetectorConfig(const std::string& json, DetectorConfig base = DetectorConfig());
DetectorConfig loadDetectorConfig(const std::string& path, DetectorConfig base = DetectorConfig());
