#include "config_loader.hpp"
#include "logger.hpp"
#include "cJSON.h"
#include <fstream>
#include <iterator>
#include <memory>

namespace {

using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

double readNumber(const cJSON* obj, const char* key, double current) {
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (!item)
        return current;
    if (!cJSON_IsNumber(item))
        throw ConfigError(std::string("'") + key + "' must be a number");
    return item->valuedouble;
}

size_t readCount(const cJSON* obj, const char* key, size_t current) {
    double value = readNumber(obj, key, static_cast<double>(current));
    if (value < 0)
        throw ConfigError(std::string("'") + key + "' must not be negative");
    return static_cast<size_t>(value);
}

double readConfidence(const cJSON* obj, const char* key, double current) {
    double value = readNumber(obj, key, current);
    if (value < 0.0 || value > 1.0)
        throw ConfigError(std::string("'") + key + "' must be within [0, 1]");
    return value;
}

bool readBool(const cJSON* obj, const char* key, bool current) {
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (!item)
        return current;
    if (!cJSON_IsBool(item))
        throw ConfigError(std::string("'") + key + "' must be true or false");
    return cJSON_IsTrue(item);
}

std::vector<std::string> readStrings(const cJSON* array, const std::string& key) {
    if (!cJSON_IsArray(array))
        throw ConfigError("'labels." + key + "' must be an array of strings");
    std::vector<std::string> out;
    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, array) {
        if (!cJSON_IsString(item) || !item->valuestring)
            throw ConfigError("'labels." + key + "' must be an array of strings");
        out.emplace_back(item->valuestring);
    }
    return out;
}

}

DetectorConfig parseDetectorConfig(const std::string& json, DetectorConfig base) {
    JsonPtr root(cJSON_Parse(json.c_str()), cJSON_Delete);
    if (!root) {
        const char* where = cJSON_GetErrorPtr();
        throw ConfigError(std::string("invalid JSON") + (where ? std::string(" near: ") + std::string(where).substr(0, 20) : ""));
    }
    if (!cJSON_IsObject(root.get()))
        throw ConfigError("configuration must be a JSON object");

    const cJSON* obj = root.get();
    base.contextWindow = readCount(obj, "context_window", base.contextWindow);
    base.minConfidence = readConfidence(obj, "min_confidence", base.minConfidence);
    base.maxWorkers = readCount(obj, "max_workers", base.maxWorkers);
    base.maskPasswords = readBool(obj, "mask_passwords", base.maskPasswords);
    base.addressMinChars = readCount(obj, "address_min_chars", base.addressMinChars);

    const cJSON* confidence = cJSON_GetObjectItemCaseSensitive(obj, "confidence");
    if (confidence) {
        if (!cJSON_IsObject(confidence))
            throw ConfigError("'confidence' must be an object");
        base.shapeConfidence = readConfidence(confidence, "shape", base.shapeConfidence);
        base.labelConfidence = readConfidence(confidence, "label", base.labelConfidence);
        base.idCardConfidence = readConfidence(confidence, "id_card", base.idCardConfidence);
        base.creditCardConfidence = readConfidence(confidence, "credit_card", base.creditCardConfidence);
        base.passwordConfidence = readConfidence(confidence, "password", base.passwordConfidence);
        base.addressKeywordConfidence = readConfidence(confidence, "address_keyword", base.addressKeywordConfidence);
        base.addressMaxConfidence = readConfidence(confidence, "address_max", base.addressMaxConfidence);
    }

    const cJSON* labels = cJSON_GetObjectItemCaseSensitive(obj, "labels");
    if (labels) {
        if (!cJSON_IsObject(labels))
            throw ConfigError("'labels' must be an object");
        const cJSON* entry = nullptr;
        cJSON_ArrayForEach(entry, labels) {
            std::string key = entry->string ? entry->string : "";
            Category category;
            try {
                category = categoryFromTag(key);
            } catch (const UnknownCategory&) {
                throw ConfigError("'labels' has unknown category '" + key + "'");
            }
            base.labels[category] = readStrings(entry, key);
        }
    }

    if (base.shapeConfidence > base.labelConfidence)
        throw ConfigError("shape confidence must not exceed label confidence");
    if (base.maxWorkers == 0)
        base.maxWorkers = 1;
    return base;
}

DetectorConfig loadDetectorConfig(const std::string& path, DetectorConfig base) {
    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw ConfigError("cannot open configuration file " + path);
    std::string json((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
    Logger::debug("Loading configuration from " + path);
    try {
        return parseDetectorConfig(json, std::move(base));
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}
